#include "header_provider.hpp"
#include "test_support.hpp"

#include <fmt/core.h>

int main()
{
    try
    {
        TestReport report("HeaderProvider");

        HeaderProvider provider(Credentials{"civ-secret\n", "  hf-secret "});

        auto civ = provider.resolve("https://civitai.com/api/download/models/128713");
        report.check(civ.count("Authorization") == 1 && civ["Authorization"] == "Bearer civ-secret",
                     "civitai token attached and trimmed");

        auto hf = provider.resolve("https://huggingface.co/org/repo/resolve/main/model.safetensors");
        report.check(hf["Authorization"] == "Bearer hf-secret", "huggingface.co token attached");

        auto shortHost = provider.resolve("https://hf.co/org/repo/resolve/main/x.bin");
        report.check(shortHost["Authorization"] == "Bearer hf-secret", "hf.co uses the same token");

        auto subdomain = provider.resolve("https://cdn-lfs.huggingface.co/repos/ab/cd/file");
        report.check(subdomain["Authorization"] == "Bearer hf-secret", "subdomain matches host pattern");

        auto other = provider.resolve("https://example.com/civitai.com/model.bin");
        report.check(other.empty(), "pattern in path does not count, only the host");

        auto upper = provider.resolve("https://CivitAI.com/api/download/models/1");
        report.check(upper["Authorization"] == "Bearer civ-secret", "host compared case-insensitively");

        HeaderProvider anonymous;
        report.check(anonymous.resolve("https://civitai.com/api/download/models/1").empty(),
                     "no credential, no header");
        report.check(anonymous.resolve("https://huggingface.co/x").empty(), "no HF credential, no header");

        HeaderProvider blank(Credentials{"   ", ""});
        report.check(blank.resolve("https://civitai.com/x").empty(), "whitespace-only token is not configured");

        report.check(HeaderProvider::hostOf("https://user:pw@Example.COM:8443/a?b") == "example.com",
                     "host strips userinfo, port and case");
        report.check(HeaderProvider::hostOf("http://[::1]:8080/x") == "[::1]", "IPv6 literal kept");
        report.check(HeaderProvider::hostOf("https://hf.co") == "hf.co", "host without path");

        return report.finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
