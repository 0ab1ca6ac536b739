#include "batch_runner.hpp"
#include "errors.hpp"

#include <memory>
#include <random>
#include <sstream>
#include <thread>
#include <utility>

#include <fmt/core.h>

namespace
{
std::string trim(const std::string &s)
{
    const char *ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
    {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

void sleepFor(std::chrono::milliseconds delay)
{
    std::this_thread::sleep_for(delay);
}
} // namespace

RetryPolicy RetryPolicy::fixed(int maxAttempts, std::chrono::milliseconds delay)
{
    RetryPolicy policy;
    policy.maxAttempts = maxAttempts;
    policy.backoff = [delay](int) { return delay; };
    policy.sleep = sleepFor;
    return policy;
}

RetryPolicy RetryPolicy::exponential(int maxAttempts, std::chrono::milliseconds initialDelay)
{
    RetryPolicy policy;
    policy.maxAttempts = maxAttempts;
    policy.backoff = [initialDelay](int failedAttempts) {
        long long baseDelayMs = initialDelay.count() * (1LL << (failedAttempts - 1));

        // Random jitter of +/-20% so parallel clients don't retry in lockstep
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(-20, 20);
        int jitterPercent = dis(gen);

        return std::chrono::milliseconds(baseDelayMs + (baseDelayMs * jitterPercent / 100));
    };
    policy.sleep = sleepFor;
    return policy;
}

std::vector<BatchItem> parseBatchLines(const std::string &text, const CategoryMap &categories)
{
    std::vector<BatchItem> items;
    std::istringstream input(text);
    std::string line;

    while (std::getline(input, line))
    {
        std::string s = trim(line);
        if (s.empty() || s.front() == '#')
        {
            continue;
        }

        // Split on the first run of whitespace
        auto split = s.find_first_of(" \t\f\v");
        if (split != std::string::npos)
        {
            std::string first = s.substr(0, split);
            if (categories.contains(first))
            {
                items.push_back(BatchItem{first, trim(s.substr(split + 1))});
                continue;
            }
        }

        items.push_back(BatchItem{std::nullopt, s});
    }

    return items;
}

BatchRunner::BatchRunner(TransferEngine &engine, RetryPolicy policy)
    : engine_(engine), policy_(std::move(policy))
{
    if (policy_.maxAttempts < 1)
    {
        policy_.maxAttempts = 1;
    }
}

BatchResult BatchRunner::run(const std::string &text,
                             const std::string &defaultCategory,
                             bool overwrite,
                             const ProgressSinkFactory &sinkFactory)
{
    return run(parseBatchLines(text, engine_.categories()), defaultCategory, overwrite, sinkFactory);
}

BatchResult BatchRunner::run(const std::vector<BatchItem> &items,
                             const std::string &defaultCategory,
                             bool overwrite,
                             const ProgressSinkFactory &sinkFactory)
{
    BatchResult result;
    const std::size_t count = items.size();

    for (std::size_t i = 0; i < count; ++i)
    {
        const BatchItem &item = items[i];

        TransferRequest request;
        request.url = item.url;
        request.category = item.categoryOverride.value_or(defaultCategory);
        request.overwrite = overwrite;

        if (!quiet_)
        {
            fmt::print("[{}/{}] ({}) {}\n", i + 1, count, request.category, request.url);
        }

        // Fresh sink per item
        std::unique_ptr<ProgressSink> sink;
        if (sinkFactory)
        {
            sink = sinkFactory();
        }
        if (!sink)
        {
            sink = std::make_unique<NullProgressSink>();
        }

        bool succeeded = false;
        std::string lastError;

        for (int attempt = 1; attempt <= policy_.maxAttempts; ++attempt)
        {
            try
            {
                std::filesystem::path saved = engine_.transfer(request, *sink);
                if (!quiet_)
                {
                    fmt::print("  Saved: {}\n", saved.string());
                }
                succeeded = true;
                break;
            }
            catch (const UnknownCategoryError &e)
            {
                // Permanent: retrying can't help
                lastError = e.what();
                if (!quiet_)
                {
                    fmt::print(stderr, "  FAILED: {}\n", lastError);
                }
                break;
            }
            catch (const TransferCancelledError &e)
            {
                lastError = e.what();
                result.cancelled = true;
                if (!quiet_)
                {
                    fmt::print(stderr, "  CANCELLED: {}\n", lastError);
                }
                break;
            }
            catch (const std::exception &e)
            {
                lastError = e.what();

                if (attempt < policy_.maxAttempts)
                {
                    auto delay = policy_.backoff ? policy_.backoff(attempt) : std::chrono::milliseconds(0);
                    if (!quiet_)
                    {
                        fmt::print(stderr,
                                   "  Attempt {}/{} failed: {}\n"
                                   "  Retrying in {:.1f} seconds...\n",
                                   attempt, policy_.maxAttempts, lastError,
                                   delay.count() / 1000.0);
                    }
                    if (policy_.sleep && delay.count() > 0)
                    {
                        policy_.sleep(delay);
                    }
                }
                else if (!quiet_)
                {
                    fmt::print(stderr, "  FAILED after {} attempts: {}\n", attempt, lastError);
                }
            }
        }

        if (succeeded)
        {
            ++result.succeeded;
        }
        else
        {
            result.failed.push_back(BatchFailure{request.category, request.url, lastError});
        }

        if (result.cancelled)
        {
            break;
        }
    }

    return result;
}

void printBatchSummary(const BatchResult &result)
{
    fmt::print("\nDone. {} succeeded, {} failed.\n", result.succeeded, result.failed.size());
    if (result.cancelled)
    {
        fmt::print("Batch was cancelled; remaining items were not attempted.\n");
    }
    for (const auto &failure : result.failed)
    {
        fmt::print("  ({}) {}\n    {}\n", failure.category, failure.url, failure.lastError);
    }
}
