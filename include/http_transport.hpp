#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

/**
 * Case-insensitive ordering so "content-length" and "Content-Length" are the same key.
 */
struct CaseInsensitiveLess
{
    bool operator()(const std::string &a, const std::string &b) const
    {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

// Human-readable text for common HTTP status codes ("Not Found" for 404)
std::string httpStatusText(long code);

/**
 * Status line and headers of the final response (after redirects).
 */
struct HttpResponseHead
{
    long status = 0;
    HeaderMap headers;
    std::string effectiveUrl;

    bool isSuccess() const { return status >= 200 && status < 300; }

    /**
     * Parsed Content-Length, or nullopt if absent or malformed.
     */
    std::optional<std::uint64_t> contentLength() const;
};

struct HttpRequest
{
    std::string url;
    HeaderMap headers;
    long timeoutSeconds = 60; // connect timeout and max stall time

    // Polled while waiting on the network; raising it aborts with TransferCancelledError
    const std::atomic<bool> *cancelFlag = nullptr;
};

/**
 * Assembles the final response head from raw header lines, one call per line.
 *
 * libcurl hands every header block of a request to the same callback: proxy CONNECT
 * replies, 1xx interim responses and each redirect hop. A block is the final head only
 * when the status libcurl reports for the request matches the block's status line
 * and the response is neither informational nor a followed redirect.
 */
class ResponseHeadParser
{
public:
    /**
     * @param line One header line, trailing CRLF optional
     * @param reportedStatus Response code libcurl has recorded so far (0 before any)
     * @return true when this line completed the final head
     */
    bool feed(std::string line, long reportedStatus);

    bool complete() const { return complete_; }
    const HttpResponseHead &head() const { return head_; }

private:
    HttpResponseHead head_;
    long lineStatus_ = 0;
    bool complete_ = false;
};

/**
 * Minimal streaming GET abstraction used by the transfer engine.
 * HttpClient is the real implementation; tests substitute a fake.
 */
class HttpTransport
{
public:
    /**
     * Called once with the final response head.
     * Return false to stop without reading the body.
     */
    using HeadHandler = std::function<bool(const HttpResponseHead &)>;

    /**
     * Called for each body chunk in arrival order.
     * Return false to abort the transfer.
     */
    using ChunkHandler = std::function<bool(const char *data, std::size_t size)>;

    virtual ~HttpTransport() = default;

    /**
     * Issue a GET, following redirects.
     * Stopping from a handler is not an error; the returned head tells what was received.
     *
     * @return Head of the final response
     * @throws NetworkError on connection failure or timeout
     * @throws TransferCancelledError if request.cancelFlag was raised mid-request
     */
    virtual HttpResponseHead get(const HttpRequest &request,
                                 const HeadHandler &onHead,
                                 const ChunkHandler &onChunk) = 0;
};
