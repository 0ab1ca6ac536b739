#include "category_map.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <fmt/core.h>

int main()
{
    try
    {
        TestReport report("CategoryMap");
        TempDir tmp;

        CategoryMap categories = CategoryMap::comfyDefaults(tmp.path() / "models");

        auto keys = categories.keys();
        report.check(keys.size() == 9, "nine default categories");
        report.check(!keys.empty() && keys.front() == "checkpoints" && keys.back() == "unet",
                     "declaration order kept");
        report.check(categories.contains("loras") && !categories.contains("Loras"),
                     "keys are case-sensitive");

        // Lazy creation
        auto loras = tmp.path() / "models" / "loras";
        report.check(!std::filesystem::exists(loras), "directory not created up front");
        report.check(categories.directory("loras") == loras, "directory() does not create");
        report.check(!std::filesystem::exists(loras), "still absent after lookup");

        auto resolved = categories.resolve("loras");
        report.check(resolved == loras && std::filesystem::is_directory(loras), "resolve creates directory");
        report.check(categories.resolve("loras") == loras, "resolve is idempotent");

        report.check(throwsAs<UnknownCategoryError>([&] { categories.resolve("embeddings"); }),
                     "unknown category rejected");

        try
        {
            categories.resolve("embeddings");
        }
        catch (const UnknownCategoryError &e)
        {
            std::string message = e.what();
            report.check(message.find("embeddings") != std::string::npos &&
                             message.find("checkpoints") != std::string::npos,
                         "error names the key and the valid choices");
        }

        // A regular file where the directory should be
        CategoryMap blocked({{"vae", tmp.path() / "blocker"}});
        writeFile(tmp.path() / "blocker", "not a directory");
        report.check(throwsAs<FilesystemError>([&] { blocked.resolve("vae"); }),
                     "creation failure reported as FilesystemError");

        // Two maps with different roots don't interfere
        TempDir other;
        CategoryMap second({{"checkpoints", other.path() / "ckpt"}});
        report.check(second.resolve("checkpoints") == other.path() / "ckpt" &&
                         categories.directory("checkpoints") == tmp.path() / "models" / "checkpoints",
                     "independent instances");

        return report.finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
