#pragma once

#include "errors.hpp"
#include "http_transport.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>

/**
 * A resource served by FakeTransport.
 */
struct FakeResource
{
    long status = 200;
    HeaderMap headers; // extra response headers, e.g. Content-Disposition
    std::string body;
    bool honorRange = true;        // false: answer ranged requests with 200 + full body
    bool sendContentLength = true; // false: no Content-Length header
    bool emptyChunkFirst = false;  // deliver a zero-length chunk before the body
    std::optional<long> rangedStatus; // answer ranged requests with this status and no body
    bool stallBeforeBody = false;  // send the head, then no bytes until timeout or cancel
};

/**
 * In-memory HttpTransport: serves scripted resources and records every request.
 */
class FakeTransport : public HttpTransport
{
public:
    std::map<std::string, FakeResource> resources;
    std::vector<HttpRequest> requests;

    // The next N calls throw NetworkError before any response
    int failNextRequests = 0;

    // Body requests (ones whose head handler returns true) die after this many body bytes
    std::optional<std::size_t> failAfterBodyBytes;

    std::size_t chunkSize = 64 * 1024;

    // Runs when a request arrives, before the response is produced
    std::function<void(const HttpRequest &)> onRequest;

    HttpResponseHead get(const HttpRequest &request,
                         const HeadHandler &onHead,
                         const ChunkHandler &onChunk) override
    {
        requests.push_back(request);
        if (onRequest)
        {
            onRequest(request);
        }

        if (failNextRequests > 0)
        {
            --failNextRequests;
            throw NetworkError(fmt::format("Connection reset by peer ({})", request.url));
        }

        HttpResponseHead head;
        head.effectiveUrl = request.url;

        auto it = resources.find(request.url);
        if (it == resources.end())
        {
            head.status = 404;
            if (onHead)
            {
                onHead(head);
            }
            return head;
        }

        const FakeResource &resource = it->second;
        head.status = resource.status;
        head.headers = resource.headers;

        std::string body = resource.body;
        std::optional<std::size_t> rangeStart = parseRange(request.headers);
        if (rangeStart && resource.rangedStatus)
        {
            head.status = *resource.rangedStatus;
            body = httpStatusText(head.status);
        }
        else if (rangeStart && resource.honorRange && resource.status == 200)
        {
            std::size_t start = std::min(*rangeStart, resource.body.size());
            body = resource.body.substr(start);
            head.status = 206;
            head.headers["Content-Range"] = fmt::format("bytes {}-{}/{}", start,
                                                        resource.body.size() - 1,
                                                        resource.body.size());
        }
        if (resource.sendContentLength)
        {
            head.headers["Content-Length"] = std::to_string(body.size());
        }

        if (onHead && !onHead(head))
        {
            return head;
        }

        // Same outcome HttpClient gives: its progress hook polls the flag while nothing arrives
        if (resource.stallBeforeBody)
        {
            if (request.cancelFlag && request.cancelFlag->load())
            {
                throw TransferCancelledError(fmt::format("Cancelled during request to {}", request.url));
            }
            throw NetworkError(fmt::format("Request to {} failed: Timeout was reached", request.url));
        }

        if (resource.emptyChunkFirst && onChunk && !onChunk(body.data(), 0))
        {
            return head;
        }

        std::size_t sent = 0;
        while (sent < body.size())
        {
            std::size_t n = std::min(chunkSize, body.size() - sent);
            if (failAfterBodyBytes && sent + n > *failAfterBodyBytes)
            {
                n = *failAfterBodyBytes - sent;
                if (n > 0 && onChunk)
                {
                    onChunk(body.data() + sent, n);
                }
                failAfterBodyBytes.reset();
                throw NetworkError("Transferred a partial file");
            }
            if (onChunk && !onChunk(body.data() + sent, n))
            {
                return head;
            }
            sent += n;
        }

        return head;
    }

    std::size_t requestCount() const { return requests.size(); }

private:
    static std::optional<std::size_t> parseRange(const HeaderMap &headers)
    {
        auto it = headers.find("Range");
        if (it == headers.end() || it->second.rfind("bytes=", 0) != 0)
        {
            return std::nullopt;
        }
        return static_cast<std::size_t>(std::strtoull(it->second.c_str() + 6, nullptr, 10));
    }
};
