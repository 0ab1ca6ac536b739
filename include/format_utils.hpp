#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * Format bytes into human-readable string (e.g., "52.30 MB"), binary units up to PB.
 */
std::string formatBytes(std::uint64_t bytes);

/**
 * Format duration using its two most significant units ("2m 30s", "1d 4h").
 * Negative values yield "unknown".
 */
std::string formatDuration(long seconds);
