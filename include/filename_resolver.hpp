#pragma once

#include "http_transport.hpp"

#include <optional>
#include <string>

/**
 * Decides the on-disk filename for a download.
 *
 * Priority (first non-empty wins):
 *   1. caller override
 *   2. Content-Disposition (filename*=UTF-8''..., then filename="...", then filename=...)
 *   3. last path segment of the URL
 *   4. "download.bin"
 * Every candidate goes through sanitize().
 */
class FilenameResolver
{
public:
    static constexpr const char *FALLBACK_NAME = "download.bin";

    static std::string resolve(const HeaderMap &responseHeaders,
                               const std::string &url,
                               const std::optional<std::string> &filenameOverride);

    /**
     * Extract a filename from a Content-Disposition header value.
     * Only the base name is kept.
     *
     * @return Filename, or nullopt if no filename parameter is present
     */
    static std::optional<std::string> fromContentDisposition(const std::string &value);

    /**
     * Last non-empty path segment, with query string and trailing slashes removed.
     * May return an empty string.
     */
    static std::string fromUrl(const std::string &url);

    /**
     * Path traversal guard: '/' and '\' become '_', surrounding whitespace is trimmed.
     * Idempotent. Empty input yields FALLBACK_NAME.
     */
    static std::string sanitize(const std::string &name);

    // "%20" -> " "; malformed escapes are kept as-is
    static std::string percentDecode(const std::string &encoded);

private:
    // Strip any directory prefix, using both separator styles
    static std::string baseName(const std::string &path);
};
