#include "console_progress.hpp"
#include "format_utils.hpp"

#include <cstdio>
#include <unistd.h>

#include <fmt/core.h>

ConsoleProgressSink::ConsoleProgressSink()
    : ConsoleProgressSink(::isatty(fileno(stdout)) != 0)
{
}

ConsoleProgressSink::ConsoleProgressSink(bool terminalOutput)
    : isTerminalOutput_(terminalOutput),
      startTime_(std::chrono::steady_clock::now()),
      lastPrintedTime_(startTime_)
{
}

void ConsoleProgressSink::onProgress(const ProgressEvent &event)
{
    auto now = std::chrono::steady_clock::now();

    switch (event.phase)
    {
    case ProgressPhase::Skip:
        fmt::print("{} already exists ({}), skipping.\n",
                   event.filename, formatBytes(event.bytesTransferred));
        return;

    case ProgressPhase::Restart:
        finishLine();
        fmt::print("Server doesn't support resume. Restarting {} from the beginning...\n",
                   event.filename);
        startBytes_ = 0;
        startTime_ = now;
        lastPrintedPercentage_ = -1.0;
        return;

    case ProgressPhase::Start:
        startBytes_ = event.bytesTransferred;
        startTime_ = now;
        lastPrintedTime_ = now;
        lastPrintedPercentage_ = -1.0;
        if (event.bytesTransferred > 0)
        {
            fmt::print("Found existing partial download of {} ({} already downloaded). Resuming...\n",
                       event.filename, formatBytes(event.bytesTransferred));
        }
        else if (event.totalBytes)
        {
            fmt::print("Downloading {} ({})\n", event.filename, formatBytes(*event.totalBytes));
        }
        else
        {
            fmt::print("Downloading {} (size unknown)\n", event.filename);
        }
        return;

    case ProgressPhase::Downloading:
    {
        auto sinceLastPrint = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  now - lastPrintedTime_)
                                  .count();

        // Update at most 5 times per second on a terminal, once per second otherwise
        if (sinceLastPrint < (isTerminalOutput_ ? 200 : 1000))
        {
            return;
        }

        // Avoid over-printing in non-terminal environments
        if (!isTerminalOutput_ && event.totalBytes && *event.totalBytes > 0)
        {
            double percentage = static_cast<double>(event.bytesTransferred) / *event.totalBytes * 100.0;
            if (lastPrintedPercentage_ >= 0.0 && percentage < lastPrintedPercentage_ + 1.0)
            {
                return;
            }
        }

        renderBar(event, now);
        return;
    }

    case ProgressPhase::Done:
        renderBar(event, now);
        finishLine();
        return;
    }
}

void ConsoleProgressSink::renderBar(const ProgressEvent &event,
                                    std::chrono::steady_clock::time_point now)
{
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();

    // Speed counts only this session's bytes, not what was already on disk
    std::uint64_t sessionBytes = event.bytesTransferred >= startBytes_
                                     ? event.bytesTransferred - startBytes_
                                     : event.bytesTransferred;
    double speed = (elapsed > 0) ? static_cast<double>(sessionBytes) / elapsed : 0.0;

    std::string speedStr;
    if (speed >= 1024 * 1024)
    {
        speedStr = fmt::format("{:.2f} MB/s", speed / (1024.0 * 1024.0));
    }
    else if (speed >= 1024)
    {
        speedStr = fmt::format("{:.2f} KB/s", speed / 1024.0);
    }
    else
    {
        speedStr = fmt::format("{:.0f} B/s", speed);
    }

    std::string line;
    if (!event.totalBytes || *event.totalBytes == 0)
    {
        // Unknown size: no bar, no ETA
        line = fmt::format("Downloaded: {} | {} | Elapsed: {}",
                           formatBytes(event.bytesTransferred), speedStr,
                           formatDuration(static_cast<long>(elapsed)));
    }
    else
    {
        std::uint64_t total = *event.totalBytes;
        double percentage = static_cast<double>(event.bytesTransferred) / total * 100.0;
        if (percentage > 100.0)
        {
            percentage = 100.0;
        }

        std::uint64_t remaining = total > event.bytesTransferred ? total - event.bytesTransferred : 0;
        long eta = (speed > 0) ? static_cast<long>(remaining / speed) : -1;

        int filled = static_cast<int>((percentage / 100.0) * BAR_WIDTH);
        std::string bar = "[";
        for (int i = 0; i < BAR_WIDTH; ++i)
        {
            if (i < filled)
            {
                bar += "=";
            }
            else if (i == filled)
            {
                bar += ">";
            }
            else
            {
                bar += " ";
            }
        }
        bar += "]";

        line = fmt::format("{} {:.1f}% | {} / {} | {} | ETA: {}",
                           bar, percentage,
                           formatBytes(event.bytesTransferred), formatBytes(total),
                           speedStr, formatDuration(eta));
        lastPrintedPercentage_ = percentage;
    }

    if (isTerminalOutput_)
    {
        fmt::print("\r{}\033[K", line);
        std::fflush(stdout);
        lineOpen_ = true;
    }
    else
    {
        fmt::print("{}\n", line);
    }
    lastPrintedTime_ = now;
}

void ConsoleProgressSink::finishLine()
{
    if (lineOpen_)
    {
        fmt::print("\n");
        lineOpen_ = false;
    }
}
