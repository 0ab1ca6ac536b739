#pragma once

#include "http_transport.hpp"

#include <string>

/**
 * Static bearer tokens, one per model host. Empty means "not configured".
 */
struct Credentials
{
    std::string civitaiToken;     // CIVITAI_TOKEN
    std::string huggingFaceToken; // HF_TOKEN
};

/**
 * Derives per-request authentication headers from the URL's host.
 * Missing credentials are not an error: the request simply goes out unauthenticated.
 */
class HeaderProvider
{
public:
    HeaderProvider() = default;
    explicit HeaderProvider(Credentials credentials);

    HeaderMap resolve(const std::string &url) const;

    /**
     * Host part of a URL, lowercased, without userinfo or port.
     * "https://user@Example.com:8443/x" -> "example.com"
     */
    static std::string hostOf(const std::string &url);

    const Credentials &credentials() const { return credentials_; }

private:
    Credentials credentials_;
};
