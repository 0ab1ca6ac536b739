#include "http_client.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace
{
// Custom deleter so the header list is freed on every exit path
struct SlistDeleter
{
    void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;
} // namespace

// State shared with the static libcurl callbacks for one get() call
struct HttpClient::RequestContext
{
    CURL *curl = nullptr;
    const HeadHandler *onHead = nullptr;
    const ChunkHandler *onChunk = nullptr;
    const std::atomic<bool> *cancelFlag = nullptr;

    ResponseHeadParser parser;
    HttpResponseHead head;
    bool headDelivered = false;
    bool stoppedByHandler = false;
    bool cancelled = false;

    long responseCode() const
    {
        long code = 0;
        if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code) != CURLE_OK)
        {
            return 0;
        }
        return code;
    }

    bool deliverHead(HttpResponseHead received)
    {
        headDelivered = true;
        head = std::move(received);

        char *effective = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective)
        {
            head.effectiveUrl = effective;
        }

        if (*onHead && !(*onHead)(head))
        {
            stoppedByHandler = true;
            return false;
        }
        return true;
    }
};

HttpClient::HttpClient(std::string userAgent)
    : curl_(curl_easy_init(), curl_easy_cleanup), userAgent_(std::move(userAgent))
{
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }
}

// unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *ctx = static_cast<RequestContext *>(userdata);

    if (ctx->headDelivered)
    {
        return totalSize;
    }

    if (ctx->parser.feed(std::string(buffer, totalSize), ctx->responseCode()) &&
        !ctx->deliverHead(ctx->parser.head()))
    {
        return 0; // handler asked to stop before the body
    }
    return totalSize;
}

size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    auto *ctx = static_cast<RequestContext *>(userdata);

    if (ctx->stoppedByHandler)
    {
        return 0;
    }

    // Body without a recognized head; trust libcurl's status for it
    if (!ctx->headDelivered)
    {
        HttpResponseHead head = ctx->parser.head();
        head.status = ctx->responseCode();
        if (!ctx->deliverHead(std::move(head)))
        {
            return 0;
        }
    }

    if (*ctx->onChunk && !(*ctx->onChunk)(ptr, totalSize))
    {
        ctx->stoppedByHandler = true;
        return 0; // libcurl aborts with CURLE_WRITE_ERROR
    }

    return totalSize;
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    // libcurl calls this about once a second even when no data flows
    auto *ctx = static_cast<RequestContext *>(clientp);
    if (ctx->cancelFlag && ctx->cancelFlag->load())
    {
        ctx->cancelled = true;
        return 1; // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

HttpResponseHead HttpClient::get(const HttpRequest &request,
                                 const HeadHandler &onHead,
                                 const ChunkHandler &onChunk)
{
    CURL *curl = curl_.get();

    // Drop options left over from the previous request but keep the connection cache
    curl_easy_reset(curl);

    RequestContext ctx;
    ctx.curl = curl;
    ctx.onHead = &onHead;
    ctx.onChunk = &onChunk;
    ctx.cancelFlag = request.cancelFlag;

    SlistPtr headerList;
    for (const auto &[name, value] : request.headers)
    {
        std::string line = fmt::format("{}: {}", name, value);
        curl_slist *appended = curl_slist_append(headerList.get(), line.c_str());
        if (!appended)
        {
            throw std::runtime_error("Failed to build request headers (out of memory)");
        }
        headerList.release();
        headerList.reset(appended);
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    if (headerList)
    {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.get());
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, CHUNK_SIZE);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);

    // Behind an HTTPS proxy the CONNECT reply would otherwise reach the header callback
    curl_easy_setopt(curl, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);

    // HTTPS settings
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Model hosts redirect to CDNs, sometimes more than once
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    // No overall timeout: multi-GB files legitimately take hours.
    // Instead bound the connect phase and abort if the stream stalls.
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, request.timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, request.timeoutSeconds);

    CURLcode res = curl_easy_perform(curl);

    if (res == CURLE_WRITE_ERROR && ctx.stoppedByHandler)
    {
        return ctx.head;
    }

    if (res == CURLE_ABORTED_BY_CALLBACK && ctx.cancelled)
    {
        throw TransferCancelledError(fmt::format("Cancelled during request to {}", request.url));
    }

    if (res != CURLE_OK)
    {
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        throw NetworkError(fmt::format("Request to {} failed: {}", request.url,
                                       curl_easy_strerror(res)),
                           httpCode);
    }

    // Empty body: the write callback never ran
    if (!ctx.headDelivered)
    {
        HttpResponseHead head = ctx.parser.head();
        head.status = ctx.responseCode();
        ctx.deliverHead(std::move(head));
    }

    return ctx.head;
}
