#include "category_map.hpp"
#include "errors.hpp"

#include <algorithm>
#include <fmt/core.h>

CategoryMap::CategoryMap(std::vector<Entry> entries) : entries_(std::move(entries))
{
}

CategoryMap CategoryMap::comfyDefaults(const std::filesystem::path &modelsRoot)
{
    static const char *const kCategories[] = {
        "checkpoints",
        "loras",
        "vae",
        "controlnet",
        "ipadapter",
        "clip_vision",
        "text_encoders",
        "diffusion_models",
        "unet",
    };

    std::vector<Entry> entries;
    for (const char *key : kCategories)
    {
        entries.emplace_back(key, modelsRoot / key);
    }
    return CategoryMap(std::move(entries));
}

const CategoryMap::Entry *CategoryMap::find(const std::string &category) const
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry &entry) { return entry.first == category; });
    return it == entries_.end() ? nullptr : &*it;
}

bool CategoryMap::contains(const std::string &category) const
{
    return find(category) != nullptr;
}

std::vector<std::string> CategoryMap::keys() const
{
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto &entry : entries_)
    {
        result.push_back(entry.first);
    }
    return result;
}

const std::filesystem::path &CategoryMap::directory(const std::string &category) const
{
    const Entry *entry = find(category);
    if (!entry)
    {
        std::string valid;
        for (const auto &e : entries_)
        {
            if (!valid.empty())
            {
                valid += ", ";
            }
            valid += e.first;
        }
        throw UnknownCategoryError(
            fmt::format("Unknown category '{}' (must be one of: {})", category, valid));
    }
    return entry->second;
}

std::filesystem::path CategoryMap::resolve(const std::string &category) const
{
    const std::filesystem::path &dir = directory(category);

    // create_directories is a no-op when the directory is already there
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        throw FilesystemError(fmt::format("Failed to create directory {}: {}",
                                          dir.string(), ec.message()));
    }
    return dir;
}
