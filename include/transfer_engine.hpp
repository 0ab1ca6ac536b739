#pragma once

#include "category_map.hpp"
#include "header_provider.hpp"
#include "http_transport.hpp"
#include "progress.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

/**
 * One download: where it comes from and which category directory it lands in.
 */
struct TransferRequest
{
    std::string url;
    std::string category;
    std::optional<std::string> filenameOverride;
    bool overwrite = false;
};

struct TransferOptions
{
    long timeoutSeconds = 60;

    // Minimum gap between two "downloading" events
    std::chrono::milliseconds progressInterval{150};

    // Refuse to start when the category's filesystem can't hold the remaining bytes
    bool checkDiskSpace = true;

    // Checked between chunks and polled by the transport while it waits on the network;
    // raising it aborts with TransferCancelledError
    const std::atomic<bool> *cancelFlag = nullptr;
};

/**
 * Resumable download engine.
 *
 * Two-phase exchange per transfer:
 *   1. Probe: GET with auth headers, read only the response head to learn the
 *      filename and size, decide skip / overwrite / resume.
 *   2. Transfer: GET again (with "Range: bytes=N-" when a .part file exists),
 *      stream into <name>.part, then rename it to <name>.
 *
 * The destination file is never opened for writing; the final rename is the only
 * way it is created or replaced, so an interrupted transfer leaves only the .part file.
 */
class TransferEngine
{
public:
    static constexpr const char *PART_SUFFIX = ".part";

    /**
     * All collaborators must outlive the engine.
     */
    TransferEngine(const CategoryMap &categories,
                   const HeaderProvider &headerProvider,
                   HttpTransport &transport,
                   TransferOptions options = {});

    /**
     * Download one request into its category directory.
     *
     * @param request What to fetch and where
     * @param sink Receives skip/start/restart/downloading/done events
     * @return Path of the final file (the existing one when skipped)
     * @throws UnknownCategoryError if request.category is not in the map
     * @throws NetworkError on connection failure, timeout or non-2xx status
     * @throws FilesystemError on directory, open, write or rename failure
     * @throws TransferCancelledError if the cancellation flag was raised
     */
    std::filesystem::path transfer(const TransferRequest &request, ProgressSink &sink);

    /**
     * Generate the .part filename for a destination path.
     */
    static std::filesystem::path makePartPath(const std::filesystem::path &destination);

    const TransferOptions &options() const { return options_; }
    const CategoryMap &categories() const { return categories_; }

private:
    // Scoped to one transfer() call
    struct TransferState
    {
        std::string filename;
        std::filesystem::path destination;
        std::filesystem::path partPath;
        std::uint64_t existing = 0;             // bytes already in the .part file
        std::optional<std::uint64_t> total;     // from the probe's Content-Length
    };

    /**
     * Phase 1. Fills state; returns false when the existing destination is kept.
     */
    bool probe(const TransferRequest &request,
               const std::filesystem::path &directory,
               const HeaderMap &authHeaders,
               TransferState &state,
               ProgressSink &sink);

    /**
     * Phase 2. Streams the body into state.partPath.
     */
    void download(const TransferRequest &request,
                  const HeaderMap &authHeaders,
                  TransferState &state,
                  ProgressSink &sink);

    void finalize(TransferState &state, ProgressSink &sink);

    void ensureDiskSpace(const std::filesystem::path &directory, std::uint64_t requiredBytes) const;

    bool cancelled() const;

    const CategoryMap &categories_;
    const HeaderProvider &headerProvider_;
    HttpTransport &transport_;
    TransferOptions options_;
};
