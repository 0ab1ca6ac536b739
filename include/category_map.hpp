#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

/**
 * Maps category keys (e.g. "checkpoints", "loras") to destination directories.
 * Keys are fixed at construction; directories are created lazily by resolve().
 */
class CategoryMap
{
public:
    using Entry = std::pair<std::string, std::filesystem::path>;

    CategoryMap() = default;
    explicit CategoryMap(std::vector<Entry> entries);

    /**
     * Standard ComfyUI model layout: one subdirectory of modelsRoot per category.
     *
     * @param modelsRoot Root directory (e.g. /workspace/ComfyUI/models)
     */
    static CategoryMap comfyDefaults(const std::filesystem::path &modelsRoot);

    /**
     * Return the directory for a category, creating it if needed.
     *
     * @throws UnknownCategoryError if the key is not in the map
     * @throws FilesystemError if the directory cannot be created
     */
    std::filesystem::path resolve(const std::string &category) const;

    /**
     * Lookup without touching the filesystem.
     * @throws UnknownCategoryError if the key is not in the map
     */
    const std::filesystem::path &directory(const std::string &category) const;

    bool contains(const std::string &category) const;

    // Keys in declaration order
    std::vector<std::string> keys() const;

    const std::vector<Entry> &entries() const { return entries_; }

private:
    const Entry *find(const std::string &category) const;

    std::vector<Entry> entries_;
};
