#include "header_provider.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace
{
std::string trimmed(const std::string &s)
{
    const char *ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
    {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool contains(const std::string &haystack, const char *needle)
{
    return haystack.find(needle) != std::string::npos;
}
} // namespace

HeaderProvider::HeaderProvider(Credentials credentials)
{
    // Tokens pasted from a browser often carry a trailing newline
    credentials_.civitaiToken = trimmed(credentials.civitaiToken);
    credentials_.huggingFaceToken = trimmed(credentials.huggingFaceToken);
}

HeaderMap HeaderProvider::resolve(const std::string &url) const
{
    HeaderMap headers;
    std::string host = hostOf(url);

    if (contains(host, "civitai.com") && !credentials_.civitaiToken.empty())
    {
        headers["Authorization"] = "Bearer " + credentials_.civitaiToken;
    }

    // Ignored by public endpoints, required for gated models
    if ((contains(host, "huggingface.co") || contains(host, "hf.co")) &&
        !credentials_.huggingFaceToken.empty())
    {
        headers["Authorization"] = "Bearer " + credentials_.huggingFaceToken;
    }

    return headers;
}

std::string HeaderProvider::hostOf(const std::string &url)
{
    std::string rest = url;

    auto scheme = rest.find("://");
    if (scheme != std::string::npos)
    {
        rest = rest.substr(scheme + 3);
    }

    rest = rest.substr(0, rest.find_first_of("/?#"));

    auto at = rest.rfind('@');
    if (at != std::string::npos)
    {
        rest = rest.substr(at + 1);
    }

    // Bracketed IPv6 literal keeps its colons
    if (!rest.empty() && rest.front() == '[')
    {
        auto close = rest.find(']');
        rest = close == std::string::npos ? rest : rest.substr(0, close + 1);
    }
    else
    {
        rest = rest.substr(0, rest.find(':'));
    }

    std::transform(rest.begin(), rest.end(), rest.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return rest;
}
