/**
 * @file config.cpp
 * @brief RunConfig construction
 */

#include "clip_batch/config.hpp"

#include <unistd.h>

#include <fmt/core.h>

namespace clip_batch {

namespace fs = std::filesystem;

std::vector<std::string> default_font_candidates() {
  return {
      "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
      "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
      "/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf",
      "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
      "/usr/share/fonts/liberation-sans/LiberationSans-Bold.ttf",
      "/usr/share/fonts/truetype/freefont/FreeSansBold.ttf",
      "/Library/Fonts/Arial Bold.ttf",
      "/System/Library/Fonts/Supplemental/Arial Bold.ttf",
      "C:/Windows/Fonts/arialbd.ttf",
  };
}

std::string make_run_id(const std::string &timestamp, long pid) {
  return fmt::format("{}_{}", timestamp, pid);
}

RunConfig make_run_config(const fs::path &input_dir, bool auto_accept,
                          const std::string &timestamp) {
  RunConfig cfg;
  cfg.input_dir = fs::absolute(input_dir).lexically_normal();
  cfg.timestamp = timestamp;
  cfg.auto_accept = auto_accept;

  cfg.run_id = make_run_id(timestamp, static_cast<long>(getpid()));

  cfg.temp_dir =
      cfg.input_dir / fmt::format(".clip_batch_tmp_{}", cfg.run_id);
  cfg.export_dir = cfg.input_dir / fmt::format("Exports_{}", cfg.run_id);
  cfg.log_path =
      cfg.input_dir / fmt::format("clip_batch_{}.log", cfg.run_id);

  cfg.ffmpeg_bin = Config::ffmpeg_bin();
  cfg.target_width = Config::target_width();
  cfg.target_height = Config::target_height();
  cfg.clips_per_export = Config::clips_per_export();

  cfg.stab_shakiness = Config::stab_shakiness();
  cfg.stab_accuracy = Config::stab_accuracy();
  cfg.stab_smoothing = Config::stab_smoothing();

  cfg.font_size = Config::font_size();
  cfg.font_color = Config::font_color();
  cfg.border_color = Config::border_color();
  cfg.border_width = Config::border_width();
  cfg.caption_margin = Config::caption_margin();

  if (!Config::caption_font().empty()) {
    cfg.font_candidates.push_back(Config::caption_font());
  }
  for (auto &candidate : default_font_candidates()) {
    cfg.font_candidates.push_back(std::move(candidate));
  }

  cfg.video_crf = Config::video_crf();
  cfg.video_preset = Config::video_preset();
  cfg.diag_tail_lines = Config::diag_tail_lines();

  return cfg;
}

} // namespace clip_batch
