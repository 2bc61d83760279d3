/**
 * @file batch_processor.cpp
 * @brief Run orchestration implementation
 */

#include "clip_batch/batch_processor.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "clip_batch/clip_transformer.hpp"
#include "clip_batch/export_grouper.hpp"
#include "clip_batch/filename_classifier.hpp"
#include "clip_batch/logging.hpp"
#include "clip_batch/system.hpp"

namespace clip_batch {

namespace fs = std::filesystem;

namespace {

/**
 * @brief Creates the run's temp directory and removes it with its contents
 *        when the run leaves scope.
 */
class TempDirGuard {
public:
  explicit TempDirGuard(fs::path dir) : dir_(std::move(dir)) {
    fs::create_directories(dir_, ec_);
  }
  ~TempDirGuard() {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
      LOG_WARN("Could not remove temporary directory {}: {}", dir_.string(),
               ec.message());
    }
  }
  TempDirGuard(const TempDirGuard &) = delete;
  TempDirGuard &operator=(const TempDirGuard &) = delete;

  const std::error_code &error() const { return ec_; }

private:
  fs::path dir_;
  std::error_code ec_;
};

} // anonymous namespace

// **---- Free Helpers ----**

ClipRecord make_clip_record(const std::string &path, int index,
                            const ProbeResult &probed) {
  ClipRecord clip;
  clip.path = path;
  clip.display_name = fs::path(path).filename().string();
  clip.duration_seconds = probed.duration_seconds;
  clip.frame_rate = probed.frame_rate;
  clip.index = index;

  FilenameTraits traits = classify_filename(clip.display_name);
  clip.caption_text = std::move(traits.caption_text);
  clip.skip_stabilization = traits.skip_stabilization;
  return clip;
}

std::vector<std::string>
successful_artifacts(const std::vector<TransformOutcome> &outcomes) {
  std::vector<std::string> artifacts;
  for (const auto &outcome : outcomes) {
    if (outcome.success) {
      artifacts.push_back(outcome.output_path);
    }
  }
  return artifacts;
}

// **---- BatchProcessor ----**

BatchProcessor::BatchProcessor(const RunConfig &cfg, DecisionSource &decision,
                               ProbeFunction probe_fn)
    : cfg_(cfg), decision_(decision), probe_fn_(std::move(probe_fn)),
      reporter_(cfg.log_path) {}

RunStatus BatchProcessor::run() {
  auto run_start = std::chrono::high_resolution_clock::now();
  auto elapsed = [&run_start]() {
    return std::chrono::duration<double>(
               std::chrono::high_resolution_clock::now() - run_start)
        .count();
  };

  LOG_PHASE("================== CLIP BATCH ==================");
  LOG_INFO("Directory: {}", cfg_.input_dir.string());
  LOG_INFO("Run: {}", cfg_.run_id);

  // **----- TOOL CHECK -----**

  const std::string ffmpeg_path = find_executable(cfg_.ffmpeg_bin);
  if (ffmpeg_path.empty()) {
    reporter_.record_abort(
        RunStatus::AbortedEngineMissing,
        fmt::format("'{}' was not found. Install ffmpeg with libvidstab "
                    "support, or point FFMPEG_BIN at it.",
                    cfg_.ffmpeg_bin));
    return finish(elapsed());
  }
  LOG_INFO("ffmpeg: {}", ffmpeg_path);

  // **----- INVENTORY & PROBE -----**

  LOG_PHASE("Inventory...");
  const std::vector<std::string> files = collect_media_files(cfg_.input_dir);
  reporter_.counters().inventoried = static_cast<int>(files.size());
  if (files.empty()) {
    reporter_.record_abort(
        RunStatus::AbortedNoInput,
        fmt::format("No {} files in {}.", MEDIA_EXTENSION,
                    cfg_.input_dir.string()));
    return finish(elapsed());
  }
  LOG_INFO("Found {} file(s)", files.size());

  const std::vector<ClipRecord> clips = probe_inventory(files);

  // **----- CLASSIFICATION -----**

  LOG_PHASE("Classifying...");
  ClassificationResult result = analyze_clips(clips);
  LOG_INFO("{} too short, {} off {} fps, {} ready", result.to_delete.size(),
           result.non_standard_frame_rate.size(), REFERENCE_FPS,
           result.to_process.size());

  if (!resolve_frame_rates(result, decision_)) {
    reporter_.counters().excluded = static_cast<int>(result.excluded.size());
    for (const auto &clip : result.excluded) {
      LOG_WARN("Skipping {} ({:.2f} fps)", clip.display_name, clip.frame_rate);
    }
  }

  delete_undersized(result.to_delete);

  if (result.to_process.empty()) {
    reporter_.record_abort(RunStatus::AbortedNothingToProcess,
                           "No clips left to process after classification.");
    return finish(elapsed());
  }

  // **----- FONT -----**

  const std::string font = resolve_font(cfg_.font_candidates);
  if (font.empty()) {
    reporter_.record_abort(
        RunStatus::AbortedFontMissing,
        "No caption font found. Install DejaVu or Liberation fonts, or set "
        "CAPTION_FONT to a .ttf file.");
    return finish(elapsed());
  }
  LOG_INFO("Caption font: {}", font);

  {
    TempDirGuard temp_dir(cfg_.temp_dir);
    if (temp_dir.error()) {
      reporter_.record_failure(FailureKind::FilesystemFailure,
                               cfg_.temp_dir.string(),
                               "cannot create temporary directory",
                               temp_dir.error().message());
      return finish(elapsed());
    }

    // **----- TRANSFORM -----**

    ClipTransformer transformer(cfg_, font);
    const std::vector<TransformOutcome> outcomes =
        transform_all(result.to_process, transformer);

    // **----- EXPORT -----**

    const std::vector<ExportGroup> groups =
        group_artifacts(successful_artifacts(outcomes), cfg_.clips_per_export);
    export_all(groups);
  }

  return finish(elapsed());
}

std::vector<ClipRecord>
BatchProcessor::probe_inventory(const std::vector<std::string> &files) {
  std::vector<ClipRecord> clips;
  clips.reserve(files.size());

  int index = 0;
  for (const auto &file : files) {
    ++index;
    const ProbeResult probed = probe_fn_(file);
    ClipRecord clip = make_clip_record(file, index, probed);

    if (!probed.duration_known() || !probed.frame_rate_known()) {
      reporter_.counters().unreadable++;
      reporter_.record_failure(
          FailureKind::ProbeUnreadable, clip.display_name,
          fmt::format("could not read {}, skipping",
                      probed.duration_known() ? "frame rate" : "duration"));
      continue;
    }

    LOG_INFO("{}: {:.2f}s @ {:.2f} fps, caption \"{}\"{}", clip.display_name,
             clip.duration_seconds, clip.frame_rate, clip.caption_text,
             clip.skip_stabilization ? ", no stabilization" : "");
    clips.push_back(std::move(clip));
  }
  return clips;
}

void BatchProcessor::delete_undersized(const std::vector<ClipRecord> &clips) {
  for (const auto &clip : clips) {
    std::error_code ec;
    fs::remove(clip.path, ec);
    if (ec) {
      reporter_.record_failure(FailureKind::FilesystemFailure,
                               clip.display_name, "could not delete short clip",
                               ec.message());
      continue;
    }
    reporter_.counters().deleted++;
    LOG_WARN("Deleted {} ({:.2f}s < {}s)", clip.display_name,
             clip.duration_seconds, MIN_DURATION_SEC);
  }
}

std::vector<TransformOutcome>
BatchProcessor::transform_all(const std::vector<ClipRecord> &clips,
                              const ClipTransformer &transformer) {
  LOG_PHASE("Processing {} clip(s)...", clips.size());

  std::vector<TransformOutcome> outcomes;
  outcomes.reserve(clips.size());

  int n = 0;
  for (const auto &clip : clips) {
    LOG_PHASE("----------------------------------------");
    LOG_INFO("[{}/{}] {}", ++n, clips.size(), clip.display_name);

    TIMER_START(transform);
    TransformOutcome outcome = transformer.transform(clip);
    TIMER_END(transform);

    if (outcome.success) {
      reporter_.counters().processed++;
      LOG_SUCCESS("[{}/{}] Done: {}", n, clips.size(), clip.display_name);
    } else {
      reporter_.counters().failed++;
      reporter_.record_failure(FailureKind::TransformFailure,
                               clip.display_name, outcome.failure_reason,
                               outcome.diagnostic_tail);
    }
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

void BatchProcessor::export_all(const std::vector<ExportGroup> &groups) {
  if (groups.empty()) {
    LOG_WARN("No processed clips to export");
    return;
  }

  std::error_code ec;
  fs::create_directories(cfg_.export_dir, ec);
  if (ec) {
    reporter_.counters().exports_failed += static_cast<int>(groups.size());
    reporter_.record_failure(FailureKind::FilesystemFailure,
                             cfg_.export_dir.string(),
                             "cannot create export directory", ec.message());
    return;
  }

  LOG_PHASE("Exporting {} group(s) to {}...", groups.size(),
            cfg_.export_dir.string());

  for (size_t i = 0; i < groups.size(); ++i) {
    const std::string output = export_path_for(cfg_, static_cast<int>(i) + 1);
    const std::string name = fs::path(output).filename().string();

    TIMER_START(concat);
    ProcessResult result = concat_group(cfg_, groups[i], output);
    TIMER_END(concat);

    if (result.ok()) {
      reporter_.counters().exports_written++;
      LOG_SUCCESS("{} ({} clip(s))", name, groups[i].size());
    } else {
      reporter_.counters().exports_failed++;
      reporter_.record_failure(
          FailureKind::ConcatenationFailure, name,
          fmt::format("concat failed with exit code {}", result.exit_code),
          result.diagnostic_tail);
    }
  }
}

RunStatus BatchProcessor::finish(double wall_clock_sec) {
  reporter_.print_summary(wall_clock_sec);
  TimingCollector::print_summary();
  return reporter_.finish();
}

} // namespace clip_batch
