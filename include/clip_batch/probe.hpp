/**
 * @file probe.hpp
 * @brief Duration and frame-rate queries for a single media file
 *
 * @details Reads container metadata through libavformat, the demuxer the
 *          ffmpeg binary itself uses. Duration and frame rate are separate
 *          queries, each opening the file on its own, so one can fail while
 *          the other succeeds.
 *
 * @note None of these functions throw. An unreadable value is reported as
 *       UNKNOWN_VALUE.
 */

#ifndef CLIP_BATCH_PROBE_HPP
#define CLIP_BATCH_PROBE_HPP

#include <string>

#include "types.hpp"

namespace clip_batch {

/**
 * @brief Container duration in seconds, or UNKNOWN_VALUE.
 */
double probe_duration(const std::string &path);

/**
 * @brief Video frame rate rounded to 2 decimals, or UNKNOWN_VALUE.
 * @note Uses the stream's average rate and falls back to its base rate.
 */
double probe_frame_rate(const std::string &path);

/**
 * @brief Run both queries.
 */
ProbeResult probe(const std::string &path);

/**
 * @brief Convert a rational rate to a decimal rounded to 2 places.
 * @return UNKNOWN_VALUE if num or den is not positive
 */
double normalize_frame_rate(int num, int den);

} // namespace clip_batch

#endif // CLIP_BATCH_PROBE_HPP
