#pragma once

#include "progress.hpp"

#include <chrono>
#include <cstdint>
#include <string>

/**
 * Renders ProgressEvents on the terminal.
 *
 * On a TTY: a single in-place bar, redrawn at most every 200ms.
 * Otherwise (piped to a file or log): one line per second, or per 1% step.
 */
class ConsoleProgressSink : public ProgressSink
{
public:
    ConsoleProgressSink();

    // Force line-oriented output regardless of isatty(stdout)
    explicit ConsoleProgressSink(bool terminalOutput);

    void onProgress(const ProgressEvent &event) override;

private:
    void renderBar(const ProgressEvent &event, std::chrono::steady_clock::time_point now);
    void finishLine();

    bool isTerminalOutput_ = true;
    bool lineOpen_ = false;

    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point lastPrintedTime_;
    std::uint64_t startBytes_ = 0; // bytes already on disk when the stream started
    double lastPrintedPercentage_ = -1.0;

    static constexpr int BAR_WIDTH = 50;
};
