#include "format_utils.hpp"

#include <fmt/core.h>

std::string formatBytes(std::uint64_t bytes)
{
    // Model files run to tens of GB and free-space figures to TB
    static const char *const units[] = {"KB", "MB", "GB", "TB", "PB"};

    if (bytes < 1024)
    {
        return fmt::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0]))
    {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, units[unit]);
}

std::string formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }

    long days = seconds / 86400;
    long hours = (seconds % 86400) / 3600;
    long minutes = (seconds % 3600) / 60;
    long secs = seconds % 60;

    // Two most significant units are enough for an ETA
    if (days > 0)
    {
        return fmt::format("{}d {}h", days, hours);
    }
    if (hours > 0)
    {
        return fmt::format("{}h {}m", hours, minutes);
    }
    if (minutes > 0)
    {
        return fmt::format("{}m {}s", minutes, secs);
    }
    return fmt::format("{}s", secs);
}
