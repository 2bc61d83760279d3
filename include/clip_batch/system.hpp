/**
 * @file system.hpp
 * @brief System utilities: executable lookup, inventory and time helpers
 *
 * @details Provides:
 *
 *          - PATH lookup for the ffmpeg executable
 *
 *          - Input directory inventory
 *
 *          - Run timestamps and time formatting
 */

#ifndef CLIP_BATCH_SYSTEM_HPP
#define CLIP_BATCH_SYSTEM_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace clip_batch {

// **---- Executables ----**

/**
 * @brief Resolve an executable the way a shell would.
 *
 * @note Names containing a '/' are checked as given; bare names are searched
 *       in each PATH entry.
 *
 * @param name Executable name or path
 * @return Full path of the executable, or empty string if not found
 */
std::string find_executable(const std::string &name);

// **---- Inventory ----**

/**
 * @brief List the media files directly inside a directory.
 *
 * @note Non-recursive, so the run's export and temp subdirectories are
 *       never picked up. Extension match is case-insensitive.
 *
 * @param dir Directory to scan
 * @return Absolute paths sorted by filename
 */
std::vector<std::string> collect_media_files(const std::filesystem::path &dir);

// **---- Utilities ----**

/**
 * @brief Local time as YYYYmmdd_HHMMSS, used in run-scoped names.
 */
std::string make_run_timestamp();

/**
 * @brief Local time as YYYY-mm-dd HH:MM:SS, used in log lines.
 */
std::string make_log_timestamp();

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/// ASCII lower-case copy of s
std::string to_lower(std::string s);

} // namespace clip_batch

#endif // CLIP_BATCH_SYSTEM_HPP
