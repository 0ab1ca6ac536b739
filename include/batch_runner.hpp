#pragma once

#include "category_map.hpp"
#include "progress.hpp"
#include "transfer_engine.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * One parsed batch line: "loras https://..." or just "https://...".
 */
struct BatchItem
{
    std::optional<std::string> categoryOverride;
    std::string url;
};

struct BatchFailure
{
    std::string category;
    std::string url;
    std::string lastError;
};

struct BatchResult
{
    std::size_t succeeded = 0;
    std::vector<BatchFailure> failed; // input order
    bool cancelled = false;           // remaining items were not attempted
};

/**
 * Bounded retry with a pluggable delay.
 * Tests swap sleep for a no-op so retries cost nothing.
 */
struct RetryPolicy
{
    int maxAttempts = 3;

    // Delay before attempt (failedAttempts + 1)
    std::function<std::chrono::milliseconds(int failedAttempts)> backoff;

    std::function<void(std::chrono::milliseconds)> sleep;

    /**
     * Same delay between every attempt (default: 3 attempts, 2 seconds apart).
     */
    static RetryPolicy fixed(int maxAttempts = 3,
                             std::chrono::milliseconds delay = std::chrono::seconds(2));

    /**
     * 1s, 2s, 4s... with +/-20% jitter to avoid hammering a recovering host.
     */
    static RetryPolicy exponential(int maxAttempts,
                                   std::chrono::milliseconds initialDelay = std::chrono::seconds(1));
};

/**
 * Parse batch text: one URL per line, optionally prefixed by a category key.
 * Blank lines and lines starting with '#' are skipped.
 */
std::vector<BatchItem> parseBatchLines(const std::string &text, const CategoryMap &categories);

/**
 * Drives the TransferEngine over a list of items, strictly in order, retrying
 * each one per the RetryPolicy. A failed item never stops the batch.
 */
class BatchRunner
{
public:
    BatchRunner(TransferEngine &engine, RetryPolicy policy = RetryPolicy::fixed());

    /**
     * Parse and run.
     *
     * @param text Batch input (see parseBatchLines)
     * @param defaultCategory Category for lines without a prefix
     * @param overwrite Passed through to every TransferRequest
     * @param sinkFactory Called once per item for a fresh ProgressSink
     */
    BatchResult run(const std::string &text,
                    const std::string &defaultCategory,
                    bool overwrite,
                    const ProgressSinkFactory &sinkFactory);

    BatchResult run(const std::vector<BatchItem> &items,
                    const std::string &defaultCategory,
                    bool overwrite,
                    const ProgressSinkFactory &sinkFactory);

    // Suppress per-item console output (library callers, tests)
    void setQuiet(bool quiet) { quiet_ = quiet; }

private:
    TransferEngine &engine_;
    RetryPolicy policy_;
    bool quiet_ = false;
};

/**
 * Print the end-of-batch report: counts, then every exhausted item with its last error.
 */
void printBatchSummary(const BatchResult &result);
