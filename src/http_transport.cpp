#include "http_transport.hpp"

#include <cerrno>
#include <cstdlib>

namespace
{
std::string trim(const std::string &s)
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
} // namespace

std::optional<std::uint64_t> HttpResponseHead::contentLength() const
{
    auto it = headers.find("Content-Length");
    if (it == headers.end())
    {
        return std::nullopt;
    }

    const std::string &value = it->second;
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
    {
        return std::nullopt;
    }

    errno = 0;
    unsigned long long parsed = std::strtoull(value.c_str(), nullptr, 10);
    if (errno == ERANGE)
    {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(parsed);
}

bool ResponseHeadParser::feed(std::string line, long reportedStatus)
{
    // Trailers after the final head are not part of it
    if (complete_)
    {
        return false;
    }

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    {
        line.pop_back();
    }

    // Status line starts a new block: "HTTP/1.1 206 Partial Content" or "HTTP/2 200"
    if (line.rfind("HTTP/", 0) == 0)
    {
        head_.headers.clear();
        head_.status = 0;
        lineStatus_ = 0;

        auto space = line.find(' ');
        if (space != std::string::npos)
        {
            lineStatus_ = std::strtol(line.c_str() + space + 1, nullptr, 10);
        }
        return false;
    }

    if (!line.empty())
    {
        auto colon = line.find(':');
        if (colon != std::string::npos)
        {
            head_.headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }
        return false;
    }

    // Blank line ends a block. A proxy's CONNECT reply is not the response libcurl
    // records, so its status either is still 0 or belongs to the previous hop.
    if (reportedStatus == 0 || reportedStatus != lineStatus_)
    {
        head_.headers.clear();
        return false;
    }

    bool informational = reportedStatus >= 100 && reportedStatus < 200;
    bool redirect = reportedStatus >= 300 && reportedStatus < 400 && head_.headers.count("Location") > 0;
    if (informational || redirect)
    {
        return false;
    }

    head_.status = reportedStatus;
    complete_ = true;
    return true;
}

std::string httpStatusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 416:
        return "Range Not Satisfiable";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown Status";
    }
}
