#include "transfer_engine.hpp"
#include "errors.hpp"
#include "filename_resolver.hpp"
#include "format_utils.hpp"

#include <fstream>
#include <system_error>

#include <fmt/core.h>

namespace
{
ProgressEvent makeEvent(const std::string &filename, ProgressPhase phase,
                        std::uint64_t transferred, std::optional<std::uint64_t> total)
{
    ProgressEvent event;
    event.bytesTransferred = transferred;
    event.totalBytes = total;
    event.filename = filename;
    event.phase = phase;
    return event;
}

NetworkError httpError(const HttpResponseHead &head, const std::string &url)
{
    return NetworkError(fmt::format("HTTP error {}: {} ({})",
                                    head.status, httpStatusText(head.status), url),
                        head.status);
}
} // namespace

TransferEngine::TransferEngine(const CategoryMap &categories,
                               const HeaderProvider &headerProvider,
                               HttpTransport &transport,
                               TransferOptions options)
    : categories_(categories),
      headerProvider_(headerProvider),
      transport_(transport),
      options_(options)
{
}

std::filesystem::path TransferEngine::makePartPath(const std::filesystem::path &destination)
{
    std::filesystem::path partPath = destination;
    partPath += PART_SUFFIX;
    return partPath;
}

bool TransferEngine::cancelled() const
{
    return options_.cancelFlag && options_.cancelFlag->load();
}

std::filesystem::path TransferEngine::transfer(const TransferRequest &request, ProgressSink &sink)
{
    // Unknown categories fail before any network I/O
    std::filesystem::path directory = categories_.resolve(request.category);
    HeaderMap authHeaders = headerProvider_.resolve(request.url);

    TransferState state;
    if (!probe(request, directory, authHeaders, state, sink))
    {
        return state.destination;
    }

    if (cancelled())
    {
        throw TransferCancelledError(fmt::format("Cancelled before downloading {}", state.filename));
    }

    if (options_.checkDiskSpace && state.total && *state.total > state.existing)
    {
        ensureDiskSpace(directory, *state.total - state.existing);
    }

    download(request, authHeaders, state, sink);
    finalize(state, sink);
    return state.destination;
}

bool TransferEngine::probe(const TransferRequest &request,
                           const std::filesystem::path &directory,
                           const HeaderMap &authHeaders,
                           TransferState &state,
                           ProgressSink &sink)
{

    HttpRequest probeRequest;
    probeRequest.url = request.url;
    probeRequest.headers = authHeaders;
    probeRequest.timeoutSeconds = options_.timeoutSeconds;
    probeRequest.cancelFlag = options_.cancelFlag;

    // Only the head is needed; stop before the body
    HttpResponseHead head = transport_.get(
        probeRequest,
        [](const HttpResponseHead &) { return false; },
        [](const char *, std::size_t) { return false; });

    if (!head.isSuccess())
    {
        throw httpError(head, request.url);
    }

    state.filename = FilenameResolver::resolve(head.headers, request.url, request.filenameOverride);
    state.destination = directory / state.filename;
    state.partPath = makePartPath(state.destination);

    std::error_code ec;
    bool destinationExists = std::filesystem::exists(state.destination, ec);
    if (ec)
    {
        throw FilesystemError(fmt::format("Cannot inspect {}: {}",
                                          state.destination.string(), ec.message()));
    }

    if (destinationExists && !request.overwrite)
    {
        std::uint64_t size = std::filesystem::file_size(state.destination, ec);
        if (ec)
        {
            size = 0;
        }
        sink.onProgress(makeEvent(state.filename, ProgressPhase::Skip, size, size));
        return false;
    }

    if (destinationExists)
    {
        std::filesystem::remove(state.destination, ec);
        if (ec)
        {
            throw FilesystemError(fmt::format("Cannot remove {} for overwrite: {}",
                                              state.destination.string(), ec.message()));
        }
    }

    state.existing = 0;
    bool partExists = std::filesystem::exists(state.partPath, ec);
    if (ec)
    {
        throw FilesystemError(fmt::format("Cannot inspect {}: {}",
                                          state.partPath.string(), ec.message()));
    }
    if (partExists)
    {
        std::uint64_t partSize = std::filesystem::file_size(state.partPath, ec);
        if (ec)
        {
            throw FilesystemError(fmt::format("Cannot read size of {}: {}",
                                              state.partPath.string(), ec.message()));
        }
        state.existing = partSize;
    }

    // The probe always asks for the whole resource, so its Content-Length is the full size
    state.total = head.contentLength();
    return true;
}

void TransferEngine::download(const TransferRequest &request,
                              const HeaderMap &authHeaders,
                              TransferState &state,
                              ProgressSink &sink)
{
    HttpRequest getRequest;
    getRequest.url = request.url;
    getRequest.headers = authHeaders;
    getRequest.timeoutSeconds = options_.timeoutSeconds;
    getRequest.cancelFlag = options_.cancelFlag;
    if (state.existing > 0)
    {
        getRequest.headers["Range"] = fmt::format("bytes={}-", state.existing);
    }

    // Append when resuming, truncate otherwise
    std::ios::openmode fileMode = std::ios::binary | std::ios::out;
    fileMode |= state.existing > 0 ? std::ios::app : std::ios::trunc;

    std::ofstream outFile(state.partPath, fileMode);
    if (!outFile)
    {
        throw FilesystemError(fmt::format("Cannot open file for writing: {}", state.partPath.string()));
    }

    std::uint64_t wrote = state.existing;
    bool headAccepted = false;
    bool writeFailed = false;
    bool wasCancelled = false;
    bool pendingEvent = false;
    bool emittedAny = false;
    std::chrono::steady_clock::time_point lastEmit;

    auto onHead = [&](const HttpResponseHead &head) {
        if (!head.isSuccess())
        {
            return false;
        }

        // Asked for a range but got the whole body: server can't resume
        if (state.existing > 0 && head.status == 200)
        {
            outFile.close();
            outFile.open(state.partPath, std::ios::binary | std::ios::out | std::ios::trunc);
            if (!outFile)
            {
                writeFailed = true;
                return false;
            }
            state.existing = 0;
            wrote = 0;
            sink.onProgress(makeEvent(state.filename, ProgressPhase::Restart, 0, state.total));
        }

        headAccepted = true;
        sink.onProgress(makeEvent(state.filename, ProgressPhase::Start, wrote, state.total));
        return true;
    };

    auto onChunk = [&](const char *data, std::size_t size) {
        if (cancelled())
        {
            wasCancelled = true;
            return false;
        }
        if (size == 0)
        {
            return true;
        }

        outFile.write(data, static_cast<std::streamsize>(size));
        if (!outFile.good())
        {
            writeFailed = true;
            return false;
        }
        wrote += size;

        auto now = std::chrono::steady_clock::now();
        if (!emittedAny || now - lastEmit >= options_.progressInterval)
        {
            sink.onProgress(makeEvent(state.filename, ProgressPhase::Downloading, wrote, state.total));
            lastEmit = now;
            emittedAny = true;
            pendingEvent = false;
        }
        else
        {
            pendingEvent = true;
        }
        return true;
    };

    HttpResponseHead head = transport_.get(getRequest, onHead, onChunk);

    if (!head.isSuccess())
    {
        throw httpError(head, request.url);
    }
    if (wasCancelled)
    {
        throw TransferCancelledError(fmt::format("Cancelled while downloading {} ({} on disk)",
                                                 state.filename, formatBytes(wrote)));
    }
    if (writeFailed)
    {
        throw FilesystemError(fmt::format("Failed writing to {}", state.partPath.string()));
    }
    if (!headAccepted)
    {
        throw NetworkError(fmt::format("No response received from {}", request.url));
    }

    // Make the last byte count observable even if it was throttled
    if (pendingEvent)
    {
        sink.onProgress(makeEvent(state.filename, ProgressPhase::Downloading, wrote, state.total));
    }

    outFile.close();
    if (outFile.fail())
    {
        throw FilesystemError(fmt::format("Failed to flush {}", state.partPath.string()));
    }
}

void TransferEngine::finalize(TransferState &state, ProgressSink &sink)
{
    std::error_code ec;

    // Atomic within one directory; on failure the .part file stays for the next resume
    std::filesystem::rename(state.partPath, state.destination, ec);
    if (ec)
    {
        throw FilesystemError(fmt::format("Download succeeded but failed to rename {} to {}: {}",
                                          state.partPath.string(), state.destination.string(),
                                          ec.message()));
    }

    std::uint64_t finalSize = std::filesystem::file_size(state.destination, ec);
    if (ec)
    {
        throw FilesystemError(fmt::format("Cannot read size of {}: {}",
                                          state.destination.string(), ec.message()));
    }

    sink.onProgress(makeEvent(state.filename, ProgressPhase::Done, finalSize, finalSize));
}

void TransferEngine::ensureDiskSpace(const std::filesystem::path &directory,
                                     std::uint64_t requiredBytes) const
{
    std::error_code ec;
    auto spaceInfo = std::filesystem::space(directory, ec);
    if (ec)
    {
        // Some filesystems don't support space queries
        fmt::print(stderr, "Warning: Unable to check disk space in {}: {}\n",
                   directory.string(), ec.message());
        return;
    }

    // 10% buffer: some filesystems reserve space
    std::uint64_t requiredWithBuffer = requiredBytes + requiredBytes / 10;
    if (spaceInfo.available < requiredWithBuffer)
    {
        throw FilesystemError(fmt::format("Insufficient disk space in {}: need {} (+ 10% buffer) but only {} available",
                                          directory.string(), formatBytes(requiredBytes),
                                          formatBytes(spaceInfo.available)));
    }
}
