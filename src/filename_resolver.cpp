#include "filename_resolver.hpp"

#include <regex>

namespace
{
std::string trimChars(const std::string &s, const char *chars)
{
    auto begin = s.find_first_not_of(chars);
    if (begin == std::string::npos)
    {
        return "";
    }
    auto end = s.find_last_not_of(chars);
    return s.substr(begin, end - begin + 1);
}

std::string trimWhitespace(const std::string &s)
{
    return trimChars(s, " \t\r\n\f\v");
}

int hexValue(char ch)
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    return -1;
}
} // namespace

std::string FilenameResolver::resolve(const HeaderMap &responseHeaders,
                                      const std::string &url,
                                      const std::optional<std::string> &filenameOverride)
{
    if (filenameOverride && !filenameOverride->empty())
    {
        return sanitize(*filenameOverride);
    }

    auto cd = responseHeaders.find("Content-Disposition");
    if (cd != responseHeaders.end())
    {
        auto fromHeader = fromContentDisposition(cd->second);
        if (fromHeader && !fromHeader->empty())
        {
            return sanitize(*fromHeader);
        }
    }

    std::string fromPath = fromUrl(url);
    if (!fromPath.empty())
    {
        return sanitize(fromPath);
    }

    return FALLBACK_NAME;
}

std::optional<std::string> FilenameResolver::fromContentDisposition(const std::string &value)
{
    if (value.empty())
    {
        return std::nullopt;
    }

    static const std::regex extended(R"(filename\*\s*=\s*UTF-8''([^;]+))", std::regex::icase);
    static const std::regex quoted(R"re(filename\s*=\s*"([^"]+)")re", std::regex::icase);
    static const std::regex bare(R"(filename\s*=\s*([^;]+))", std::regex::icase);

    std::smatch match;
    std::string name;

    // RFC 5987: filename*=UTF-8''model%20v2.safetensors
    if (std::regex_search(value, match, extended))
    {
        name = percentDecode(trimChars(trimWhitespace(match[1].str()), "\""));
    }
    else if (std::regex_search(value, match, quoted))
    {
        name = match[1].str();
    }
    else if (std::regex_search(value, match, bare))
    {
        name = trimChars(trimWhitespace(match[1].str()), "\"");
    }
    else
    {
        return std::nullopt;
    }

    name = baseName(name);
    if (name.empty())
    {
        return std::nullopt;
    }
    return name;
}

std::string FilenameResolver::fromUrl(const std::string &url)
{
    std::string path = url.substr(0, url.find('?'));

    while (!path.empty() && path.back() == '/')
    {
        path.pop_back();
    }

    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string FilenameResolver::sanitize(const std::string &name)
{
    std::string result = name;
    for (char &ch : result)
    {
        if (ch == '/' || ch == '\\')
        {
            ch = '_';
        }
    }

    result = trimWhitespace(result);
    return result.empty() ? FALLBACK_NAME : result;
}

std::string FilenameResolver::percentDecode(const std::string &encoded)
{
    std::string decoded;
    decoded.reserve(encoded.size());

    for (size_t i = 0; i < encoded.size(); ++i)
    {
        if (encoded[i] == '%' && i + 2 < encoded.size())
        {
            int hi = hexValue(encoded[i + 1]);
            int lo = hexValue(encoded[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                decoded += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        decoded += encoded[i];
    }

    return decoded;
}

std::string FilenameResolver::baseName(const std::string &path)
{
    std::string trimmed = path;
    while (!trimmed.empty() && (trimmed.back() == '/' || trimmed.back() == '\\'))
    {
        trimmed.pop_back();
    }

    auto sep = trimmed.find_last_of("/\\");
    return sep == std::string::npos ? trimmed : trimmed.substr(sep + 1);
}
