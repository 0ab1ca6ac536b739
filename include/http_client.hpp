#pragma once

#include "http_transport.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>

/**
 * HttpTransport backed by libcurl.
 * Uses RAII to manage the CURL handle; one handle is reused across requests
 * so keep-alive connections survive between the probe and the transfer.
 */
class HttpClient : public HttpTransport
{
public:
    explicit HttpClient(std::string userAgent = "ModelFetch/1.0");
    ~HttpClient() override;

    // CURL handles aren't copyable
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    HttpClient(HttpClient &&) noexcept = default;
    HttpClient &operator=(HttpClient &&) noexcept = default;

    HttpResponseHead get(const HttpRequest &request,
                         const HeadHandler &onHead,
                         const ChunkHandler &onChunk) override;

    // Receive buffer requested from libcurl (clamped by libcurl to its maximum)
    static constexpr long CHUNK_SIZE = 1024 * 1024;

private:
    struct RequestContext;

    /**
     * libcurl calls this once per header line, for every response in a redirect chain.
     * Delivers the head to the caller when the final response's header block ends.
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    /**
     * libcurl calls this with chunks of body data.
     * Returning anything other than size * nmemb aborts the transfer.
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * libcurl progress hook; polls the request's cancel flag even while the stream is stalled.
     *
     * @param clientp The RequestContext of the running get()
     * @return 0 to continue, non-zero to abort
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
    std::string userAgent_;
};
