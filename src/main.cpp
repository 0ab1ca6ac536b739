#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <vector>

#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header

#include "batch_runner.hpp"
#include "category_map.hpp"
#include "config.hpp"
#include "console_progress.hpp"
#include "errors.hpp"
#include "header_provider.hpp"
#include "http_client.hpp"
#include "transfer_engine.hpp"

namespace
{
std::atomic<bool> cancelRequested{false};

void onInterrupt(int)
{
    cancelRequested.store(true);
}

std::string readBatchInput(const std::string &source)
{
    if (source == "-")
    {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream file(source);
    if (!file)
    {
        throw std::runtime_error(fmt::format("Cannot open batch file: {}", source));
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

int runSetup(const FetchConfig &config, const CategoryMap &categories)
{
    fmt::print("Models root: {}\n", config.modelsRoot);
    fmt::print("CIVITAI_TOKEN set? {}\n", config.civitaiToken.empty() ? "no" : "yes");
    fmt::print("HF_TOKEN set?      {}\n", config.huggingFaceToken.empty() ? "no" : "yes");
    fmt::print("\nCategories:\n");
    for (const auto &[key, directory] : categories.entries())
    {
        fmt::print("  {:<16} -> {}\n", key, directory.string());
    }
    return 0;
}

int runSingle(const FetchConfig &config, TransferEngine &engine)
{
    TransferRequest request;
    request.url = config.url;
    request.category = config.category;
    request.filenameOverride = config.filename;
    request.overwrite = config.overwrite;

    fmt::print("({}) {}\n", request.category, request.url);

    ConsoleProgressSink sink;
    try
    {
        std::filesystem::path saved = engine.transfer(request, sink);
        fmt::print("✓ Saved: {}\n", saved.string());
        return 0;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Download failed: {}\n", e.what());
        return 1;
    }
}

int runBatch(const FetchConfig &config, TransferEngine &engine)
{
    std::string text = readBatchInput(config.batchFile);

    auto items = parseBatchLines(text, engine.categories());
    if (items.empty())
    {
        fmt::print(stderr, "No URLs found in batch input.\n");
        return 1;
    }

    auto delay = std::chrono::milliseconds(static_cast<long long>(config.retryDelaySeconds * 1000));
    BatchRunner runner(engine, RetryPolicy::fixed(config.retryCount + 1, delay));

    BatchResult result = runner.run(items, config.defaultCategory, config.overwrite,
                                    [] { return std::make_unique<ConsoleProgressSink>(); });

    printBatchSummary(result);
    return result.failed.empty() ? 0 : 1;
}
} // namespace

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("model_fetch v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - libcurl {}: HTTP/HTTPS support\n", curl_version_info(CURLVERSION_NOW)->version);
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            return 0;
        }
    }

    CLI::App app{"model_fetch v1.0 - Resumable model downloader"};
    app.require_subcommand(1);

    FetchConfig config;

    // Category keys are the same whatever the root is
    const std::vector<std::string> categoryKeys = CategoryMap::comfyDefaults("").keys();

    // ====================================================================
    // GLOBAL OPTIONS
    // ====================================================================

    app.add_option("--root", config.modelsRoot, "Models root directory (one subdirectory per category)")
        ->capture_default_str();

    app.add_option("--civitai-token", config.civitaiToken, "Bearer token for civitai.com")
        ->envname("CIVITAI_TOKEN");

    app.add_option("--hf-token", config.huggingFaceToken, "Bearer token for huggingface.co / hf.co")
        ->envname("HF_TOKEN");

    app.add_option("-t,--timeout", config.timeoutSeconds,
                   "Seconds allowed to connect, and to go without receiving data")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_option("-r,--retry-count", config.retryCount,
                   "Retries per batch item after the first attempt")
        ->check(CLI::Range(0, 10))
        ->capture_default_str();

    app.add_option("--retry-delay", config.retryDelaySeconds, "Seconds to wait between batch retries")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();

    app.add_flag("-v,--version", "Display version information");

    // ====================================================================
    // SUBCOMMANDS
    // ====================================================================

    auto *setup = app.add_subcommand("setup", "Show models root, category directories and token status");

    auto *get = app.add_subcommand("get", "Download a single URL");
    get->add_option("URL", config.url, "HTTP/HTTPS URL to download")
        ->required()
        ->check([](const std::string &url) -> std::string {
            // Custom validator: check if URL starts with http:// or https://
            if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0)
            {
                return ""; // Empty string = valid
            }
            return "URL must start with http:// or https://";
        });
    get->add_option("-c,--category", config.category, "Destination category")
        ->check(CLI::IsMember(categoryKeys))
        ->capture_default_str();
    get->add_option("-n,--name", config.filename, "Filename override");
    get->add_flag("--overwrite", config.overwrite, "Replace the file if it already exists");

    auto *batch = app.add_subcommand("batch", "Download every URL listed in FILE (one per line, optional category prefix)");
    batch->add_option("FILE", config.batchFile, "Batch file, or - for stdin")
        ->capture_default_str();
    batch->add_option("-d,--default-category", config.defaultCategory,
                      "Category for lines without a prefix")
        ->check(CLI::IsMember(categoryKeys))
        ->capture_default_str();
    batch->add_flag("--overwrite", config.overwrite, "Replace files that already exist");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    // ====================================================================
    // RUN
    // ====================================================================

    try
    {
        CategoryMap categories = CategoryMap::comfyDefaults(config.modelsRoot);

        if (setup->parsed())
        {
            return runSetup(config, categories);
        }

        HeaderProvider headerProvider(Credentials{config.civitaiToken, config.huggingFaceToken});

        // Create HTTP client (RAII ensures cleanup)
        HttpClient client;

        TransferOptions options;
        options.timeoutSeconds = config.timeoutSeconds;
        options.cancelFlag = &cancelRequested;

        // Ctrl+C stops between chunks and keeps the .part file for the next run
        std::signal(SIGINT, onInterrupt);

        TransferEngine engine(categories, headerProvider, client, options);

        if (get->parsed())
        {
            return runSingle(config, engine);
        }
        if (batch->parsed())
        {
            return runBatch(config, engine);
        }
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
