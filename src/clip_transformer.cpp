/**
 * @file clip_transformer.cpp
 * @brief Per-clip ffmpeg pipeline implementation
 *
 * @details Each pass is one blocking ffmpeg invocation. A failing pass ends
 *          the clip: its stderr tail is kept in the outcome, the partial
 *          artifact is removed and the batch moves on.
 */

#include "clip_batch/clip_transformer.hpp"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

#include <fmt/core.h>

#include "clip_batch/logging.hpp"
#include "clip_batch/process.hpp"

namespace clip_batch {

namespace fs = std::filesystem;

// **---- Pure Helpers ----**

TrimWindow compute_trim_window(double duration_seconds) {
  TrimWindow window;
  if (duration_seconds > CLIP_LENGTH_SEC) {
    window.start_offset_seconds = (duration_seconds - CLIP_LENGTH_SEC) / 2.0;
    window.output_length_seconds = CLIP_LENGTH_SEC;
  } else {
    window.start_offset_seconds = 0.0;
    window.output_length_seconds = duration_seconds;
  }
  return window;
}

std::string escape_filter_value(const std::string &value) {
  std::string out;
  out.reserve(value.size() * 2);
  for (char c : value) {
    switch (c) {
    case '\\':
      out += "\\\\\\\\";
      break;
    case '\'':
      out += "\\\\\\'";
      break;
    case ':':
      out += "\\\\:";
      break;
    case ',':
    case ';':
    case '[':
    case ']':
      out += '\\';
      out += c;
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string resolve_font(const std::vector<std::string> &candidates) {
  for (const auto &candidate : candidates) {
    std::error_code ec;
    if (!candidate.empty() && fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return {};
}

// **---- ScopedTempFile ----**

ScopedTempFile::ScopedTempFile(const fs::path &dir, const std::string &prefix,
                               const std::string &suffix) {
  std::string tmpl = (dir / (prefix + "XXXXXX" + suffix)).string();
  int fd = mkstemps(tmpl.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(),
                            fmt::format("cannot create {}", tmpl));
  }
  close(fd);
  path_ = tmpl;
}

ScopedTempFile::~ScopedTempFile() {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    LOG_WARN("Could not remove temporary file {}: {}", path_, ec.message());
  }
}

// **---- ClipTransformer ----**

ClipTransformer::ClipTransformer(const RunConfig &cfg, std::string font_path)
    : cfg_(cfg), font_path_(std::move(font_path)) {}

std::string ClipTransformer::output_path_for(const ClipRecord &clip) const {
  std::string stem = fs::path(clip.path).stem().string();
  return (cfg_.temp_dir /
          fmt::format("{:03d}_{}{}", clip.index, stem, MEDIA_EXTENSION))
      .string();
}

std::vector<std::string>
ClipTransformer::build_detect_args(const ClipRecord &clip,
                                   const TrimWindow &window,
                                   const std::string &transforms_path) const {
  return {"-hide_banner",
          "-loglevel",
          "error",
          "-y",
          "-ss",
          fmt::format("{:.3f}", window.start_offset_seconds),
          "-t",
          fmt::format("{:.3f}", window.output_length_seconds),
          "-i",
          clip.path,
          "-vf",
          fmt::format("vidstabdetect=shakiness={}:accuracy={}:result={}",
                      cfg_.stab_shakiness, cfg_.stab_accuracy,
                      escape_filter_value(transforms_path)),
          "-an",
          "-f",
          "null",
          "-"};
}

std::string
ClipTransformer::build_video_filter(const ClipRecord &clip,
                                    const std::string &transforms_path) const {
  std::string chain;

  if (!transforms_path.empty()) {
    chain += fmt::format("vidstabtransform=input={}:smoothing={},",
                         escape_filter_value(transforms_path),
                         cfg_.stab_smoothing);
  }

  /// Fit inside the canvas, then letterbox/pillarbox to exact size
  chain += fmt::format(
      "scale={w}:{h}:force_original_aspect_ratio=decrease,"
      "pad={w}:{h}:(ow-iw)/2:(oh-ih)/2:color=black,setsar=1,",
      fmt::arg("w", cfg_.target_width), fmt::arg("h", cfg_.target_height));

  chain += fmt::format("fps={}/{},", REFERENCE_FPS_NUM, REFERENCE_FPS_DEN);

  /// Bottom-right, margin relative to the normalized canvas
  chain += fmt::format(
      "drawtext=fontfile={}:text={}:expansion=none:fontsize={}:"
      "fontcolor={}:borderw={}:bordercolor={}:"
      "x=w-tw-w*{}:y=h-th-h*{}",
      escape_filter_value(font_path_), escape_filter_value(clip.caption_text),
      cfg_.font_size, cfg_.font_color, cfg_.border_width, cfg_.border_color,
      cfg_.caption_margin, cfg_.caption_margin);

  return chain;
}

std::vector<std::string> ClipTransformer::build_encode_args(
    const ClipRecord &clip, const TrimWindow &window,
    const std::string &transforms_path, const std::string &output_path) const {
  return {"-hide_banner",
          "-loglevel",
          "error",
          "-y",
          "-ss",
          fmt::format("{:.3f}", window.start_offset_seconds),
          "-t",
          fmt::format("{:.3f}", window.output_length_seconds),
          "-i",
          clip.path,
          "-vf",
          build_video_filter(clip, transforms_path),
          "-an",
          "-c:v",
          "libx264",
          "-preset",
          cfg_.video_preset,
          "-crf",
          std::to_string(cfg_.video_crf),
          "-pix_fmt",
          "yuv420p",
          "-r",
          fmt::format("{}/{}", REFERENCE_FPS_NUM, REFERENCE_FPS_DEN),
          "-movflags",
          "+faststart",
          output_path};
}

bool ClipTransformer::run_stage(const char *stage,
                                const std::vector<std::string> &args,
                                TransformOutcome &outcome) const {
  ProcessResult result =
      run_process(cfg_.ffmpeg_bin, args, cfg_.diag_tail_lines);
  if (result.ok())
    return true;

  LOG_WARN("Failed: {}", describe_command(cfg_.ffmpeg_bin, args));
  outcome.success = false;
  outcome.failure_reason =
      result.launched
          ? fmt::format("{} failed with exit code {}", stage, result.exit_code)
          : fmt::format("{} could not start ffmpeg", stage);
  outcome.diagnostic_tail = result.diagnostic_tail;
  return false;
}

TransformOutcome ClipTransformer::transform(const ClipRecord &clip) const {
  TransformOutcome outcome;
  outcome.display_name = clip.display_name;

  const TrimWindow window = compute_trim_window(clip.duration_seconds);
  const std::string output_path = output_path_for(clip);

  LOG_INFO("Trim {:.2f}s from {:.2f}s, stabilization {}",
           window.output_length_seconds, window.start_offset_seconds,
           clip.skip_stabilization ? "off" : "on");

  bool ok = false;
  try {
    if (clip.skip_stabilization) {
      ok = run_stage("encode",
                     build_encode_args(clip, window, "", output_path),
                     outcome);
    } else {
      ScopedTempFile transforms(cfg_.temp_dir, "vidstab_", ".trf");
      ok = run_stage("stabilize-detect",
                     build_detect_args(clip, window, transforms.path()),
                     outcome) &&
           run_stage("stabilize-encode",
                     build_encode_args(clip, window, transforms.path(),
                                       output_path),
                     outcome);
    }
  } catch (const std::exception &e) {
    ok = false;
    outcome.failure_reason = fmt::format("unexpected error: {}", e.what());
  }

  if (!ok) {
    outcome.success = false;
    std::error_code ec;
    fs::remove(output_path, ec);
    return outcome;
  }

  outcome.success = true;
  outcome.output_path = output_path;
  return outcome;
}

} // namespace clip_batch
