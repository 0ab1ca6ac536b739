#include "batch_runner.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <vector>

#include <fmt/core.h>

namespace
{
struct Fixture
{
    TempDir tmp;
    CategoryMap categories = CategoryMap::comfyDefaults(tmp.path() / "models");
    HeaderProvider headers;
    FakeTransport transport;
    TransferOptions options;
    std::vector<std::chrono::milliseconds> sleeps;

    Fixture() { options.checkDiskSpace = false; }

    // Fixed 2s policy, but sleeping only records the delay
    RetryPolicy policy(int attempts = 3)
    {
        RetryPolicy p = RetryPolicy::fixed(attempts, std::chrono::seconds(2));
        p.sleep = [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); };
        return p;
    }
};

ProgressSinkFactory nullSinks(int *created = nullptr)
{
    return [created] {
        if (created)
        {
            ++*created;
        }
        return std::make_unique<NullProgressSink>();
    };
}

void testParsing(TestReport &report)
{
    TempDir tmp;
    CategoryMap categories = CategoryMap::comfyDefaults(tmp.path());

    auto items = parseBatchLines("loras http://x\n# comment\nhttp://y\ncontrolnet   http://z", categories);
    report.check(items.size() == 3, "parse: three items");
    report.check(items.size() == 3 && items[0].categoryOverride == std::optional<std::string>("loras") &&
                     items[0].url == "http://x",
                 "parse: (loras, x)");
    report.check(items.size() == 3 && !items[1].categoryOverride && items[1].url == "http://y",
                 "parse: (default, y)");
    report.check(items.size() == 3 && items[2].categoryOverride == std::optional<std::string>("controlnet") &&
                     items[2].url == "http://z",
                 "parse: (controlnet, z) despite whitespace run");

    auto messy = parseBatchLines("\n   \n  # indented comment\r\n\tvae\thttps://a/v.pt  \r\n"
                                 "notacategory https://b/x\nhttps://c/y?x=1 \n",
                                 categories);
    report.check(messy.size() == 3, "parse: blank, whitespace and indented comment lines skipped");
    report.check(messy.size() == 3 && messy[0].categoryOverride == std::optional<std::string>("vae") &&
                     messy[0].url == "https://a/v.pt",
                 "parse: tab separator and CRLF handled");
    report.check(messy.size() == 3 && !messy[1].categoryOverride && messy[1].url == "notacategory https://b/x",
                 "parse: unknown first token keeps the whole line as URL");
    report.check(messy.size() == 3 && messy[2].url == "https://c/y?x=1", "parse: URL trimmed");

    report.check(parseBatchLines("", categories).empty(), "parse: empty input");
}

void testRetryThenSuccess(TestReport &report)
{
    Fixture fx;
    fx.transport.resources["http://h/a.bin"].body = makePayload(1000);
    fx.transport.failNextRequests = 2;

    TransferEngine engine(fx.categories, fx.headers, fx.transport, fx.options);
    BatchRunner runner(engine, fx.policy());
    runner.setQuiet(true);

    BatchResult result = runner.run("http://h/a.bin", "checkpoints", false, nullSinks());

    report.check(result.succeeded == 1 && result.failed.empty(), "retry: success on attempt 3 is a success");
    report.check(fx.sleeps.size() == 2, "retry: slept between attempts only");
    report.check(fx.sleeps.size() == 2 && fx.sleeps[0] == std::chrono::seconds(2) &&
                     fx.sleeps[1] == std::chrono::seconds(2),
                 "retry: fixed 2s delay");
    report.check(std::filesystem::exists(fx.tmp.path() / "models" / "checkpoints" / "a.bin"),
                 "retry: file saved");
}

void testExhaustedItemRecordedOnce(TestReport &report)
{
    Fixture fx;
    fx.transport.resources["http://h/good.bin"].body = "good";

    TransferEngine engine(fx.categories, fx.headers, fx.transport, fx.options);
    BatchRunner runner(engine, fx.policy());

    const std::string text = "http://h/missing.bin\nloras http://h/good.bin\nvae http://h/gone.bin\n";
    BatchResult result = runner.run(text, "checkpoints", false, nullSinks());

    report.check(result.succeeded == 1, "exhausted: later items still processed");
    report.check(result.failed.size() == 2, "exhausted: each failing item listed once");
    report.check(result.failed.size() == 2 && result.failed[0].url == "http://h/missing.bin" &&
                     result.failed[0].category == "checkpoints" &&
                     result.failed[1].url == "http://h/gone.bin" && result.failed[1].category == "vae",
                 "exhausted: failures in input order with their categories");
    report.check(!result.failed.empty() && result.failed[0].lastError.find("404") != std::string::npos,
                 "exhausted: last error message kept");

    // 3 probes per failing item, probe + transfer for the good one
    report.check(fx.transport.requestCount() == 3 + 2 + 3, "exhausted: three attempts per failing item");
    report.check(fx.sleeps.size() == 4, "exhausted: two sleeps per failing item");
    report.check(!result.cancelled, "exhausted: batch not cancelled");
}

void testLastErrorIsFromFinalAttempt(TestReport &report)
{
    Fixture fx;
    fx.transport.failNextRequests = 2; // attempts 1-2: connection reset, attempt 3: 404

    TransferEngine engine(fx.categories, fx.headers, fx.transport, fx.options);
    BatchRunner runner(engine, fx.policy());
    runner.setQuiet(true);

    BatchResult result = runner.run("http://h/nowhere.bin", "unet", false, nullSinks());
    report.check(result.failed.size() == 1 && result.failed[0].lastError.find("404") != std::string::npos &&
                     result.failed[0].lastError.find("reset") == std::string::npos,
                 "last error: message from the third attempt");
}

void testUnknownCategoryNotRetried(TestReport &report)
{
    Fixture fx;
    fx.transport.resources["http://h/x.bin"].body = "x";

    TransferEngine engine(fx.categories, fx.headers, fx.transport, fx.options);
    BatchRunner runner(engine, fx.policy());
    runner.setQuiet(true);

    BatchResult result = runner.run("http://h/x.bin", "embeddings", false, nullSinks());
    report.check(result.failed.size() == 1 && result.failed[0].category == "embeddings",
                 "unknown category: recorded as failure");
    report.check(fx.sleeps.empty() && fx.transport.requestCount() == 0,
                 "unknown category: single attempt, no network");
}

void testSinkPerItem(TestReport &report)
{
    Fixture fx;
    fx.transport.resources["http://h/1.bin"].body = "1";
    fx.transport.resources["http://h/2.bin"].body = "22";

    TransferEngine engine(fx.categories, fx.headers, fx.transport, fx.options);
    BatchRunner runner(engine, fx.policy());
    runner.setQuiet(true);

    int created = 0;
    BatchResult result = runner.run("http://h/1.bin\nhttp://h/2.bin\nhttp://h/3.bin", "vae", false,
                                    nullSinks(&created));
    report.check(created == 3, "sinks: one fresh sink per item, not per attempt");
    report.check(result.succeeded == 2 && result.failed.size() == 1, "sinks: counts add up");

    // A factory may hand back nothing; the runner still works
    BatchResult nullFactory = runner.run("http://h/1.bin", "vae", false, ProgressSinkFactory());
    report.check(nullFactory.succeeded == 1, "sinks: empty factory tolerated (existing file skipped)");
}

void testCancellationStopsBatch(TestReport &report)
{
    Fixture fx;
    std::atomic<bool> cancel{true};
    fx.options.cancelFlag = &cancel;
    fx.transport.resources["http://h/1.bin"].body = "1";
    fx.transport.resources["http://h/2.bin"].body = "2";

    TransferEngine engine(fx.categories, fx.headers, fx.transport, fx.options);
    BatchRunner runner(engine, fx.policy());
    runner.setQuiet(true);

    BatchResult result = runner.run("http://h/1.bin\nhttp://h/2.bin", "loras", false, nullSinks());
    report.check(result.cancelled, "cancel: result flagged");
    report.check(result.failed.size() == 1 && result.failed[0].url == "http://h/1.bin",
                 "cancel: only the interrupted item recorded");
    report.check(fx.sleeps.empty(), "cancel: not retried");
    report.check(fx.transport.requestCount() == 1, "cancel: remaining items not attempted");
}

void testPolicies(TestReport &report)
{
    RetryPolicy fixed = RetryPolicy::fixed();
    report.check(fixed.maxAttempts == 3 && fixed.backoff(1) == std::chrono::seconds(2) &&
                     fixed.backoff(2) == std::chrono::seconds(2),
                 "policy: default is 3 attempts, 2s apart");

    RetryPolicy exponential = RetryPolicy::exponential(4, std::chrono::milliseconds(1000));
    auto third = exponential.backoff(3);
    report.check(third >= std::chrono::milliseconds(3200) && third <= std::chrono::milliseconds(4800),
                 "policy: exponential doubles with +/-20% jitter");
}
} // namespace

int main()
{
    try
    {
        TestReport report("BatchRunner");

        testParsing(report);
        testRetryThenSuccess(report);
        testExhaustedItemRecordedOnce(report);
        testLastErrorIsFromFinalAttempt(report);
        testUnknownCategoryNotRetried(report);
        testSinkPerItem(report);
        testCancellationStopsBatch(report);
        testPolicies(report);

        return report.finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
