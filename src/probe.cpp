/**
 * @file probe.cpp
 * @brief libavformat based media probing
 */

#include "clip_batch/probe.hpp"

#include <cmath>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/log.h>
}

#include "clip_batch/logging.hpp"

namespace clip_batch {

namespace {

/**
 * @class MediaHandle
 * @brief Opened AVFormatContext with stream info, closed on destruction.
 */
class MediaHandle {
  AVFormatContext *fmt_ctx = nullptr;
  bool ready = false;

public:
  explicit MediaHandle(const std::string &path) {
    /// Probe failures are reported by the caller, keep libav quiet
    av_log_set_level(AV_LOG_QUIET);

    if (avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr) < 0) {
      fmt_ctx = nullptr;
      return;
    }
    if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
      return;
    }
    ready = true;
  }

  ~MediaHandle() {
    if (fmt_ctx)
      avformat_close_input(&fmt_ctx);
  }

  MediaHandle(const MediaHandle &) = delete;
  MediaHandle &operator=(const MediaHandle &) = delete;

  bool ok() const { return ready; }
  AVFormatContext *get() const { return fmt_ctx; }
};

} // anonymous namespace

double normalize_frame_rate(int num, int den) {
  if (num <= 0 || den <= 0)
    return UNKNOWN_VALUE;
  double fps = static_cast<double>(num) / static_cast<double>(den);
  return std::round(fps * 100.0) / 100.0;
}

double probe_duration(const std::string &path) {
  MediaHandle media(path);
  if (!media.ok())
    return UNKNOWN_VALUE;

  int64_t duration = media.get()->duration;
  if (duration == AV_NOPTS_VALUE || duration < 0)
    return UNKNOWN_VALUE;
  return duration / static_cast<double>(AV_TIME_BASE);
}

double probe_frame_rate(const std::string &path) {
  MediaHandle media(path);
  if (!media.ok())
    return UNKNOWN_VALUE;

  int idx = av_find_best_stream(media.get(), AVMEDIA_TYPE_VIDEO, -1, -1,
                                nullptr, 0);
  if (idx < 0)
    return UNKNOWN_VALUE;

  const AVStream *stream = media.get()->streams[idx];
  AVRational rate = stream->avg_frame_rate;
  if (rate.num <= 0 || rate.den <= 0)
    rate = stream->r_frame_rate;
  return normalize_frame_rate(rate.num, rate.den);
}

ProbeResult probe(const std::string &path) {
  TIMER_START(probe);
  ProbeResult result;
  result.duration_seconds = probe_duration(path);
  result.frame_rate = probe_frame_rate(path);
  TIMER_END(probe);
  return result;
}

} // namespace clip_batch
