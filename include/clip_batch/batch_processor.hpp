/**
 * @file batch_processor.hpp
 * @brief End-to-end run over one directory of clips
 *
 * @details The BatchProcessor runs the stages strictly in sequence:
 *
 *          1. Check that ffmpeg is available
 *
 *          2. Inventory the .mp4 files and probe each one
 *
 *          3. Classify, then settle non-standard frame rates with a single
 *             decision
 *
 *          4. Delete clips shorter than MIN_DURATION_SEC
 *
 *          5. Resolve the caption font
 *
 *          6. Transform each accepted clip into a temporary artifact
 *
 *          7. Group the artifacts and concatenate each group into an export
 *
 *          8. Remove the temporary directory
 *
 * @note Only one ffmpeg process runs at a time. Per-clip and per-group
 *       failures are recorded and the run continues; the terminal
 *       conditions end the run early with an Aborted* status.
 */

#ifndef CLIP_BATCH_BATCH_PROCESSOR_HPP
#define CLIP_BATCH_BATCH_PROCESSOR_HPP

#include <functional>
#include <string>
#include <vector>

#include "clip_analyzer.hpp"
#include "config.hpp"
#include "probe.hpp"
#include "run_reporter.hpp"
#include "types.hpp"

namespace clip_batch {

class ClipTransformer;

/// Reads duration and frame rate of one file, see probe()
using ProbeFunction = std::function<ProbeResult(const std::string &)>;

/**
 * @brief Build the record of one inventoried file.
 * @param path Absolute file path
 * @param index Position in inventory order
 * @param probed Probe result for the file
 */
ClipRecord make_clip_record(const std::string &path, int index,
                            const ProbeResult &probed);

/**
 * @brief Output paths of the successful outcomes, in order.
 */
std::vector<std::string>
successful_artifacts(const std::vector<TransformOutcome> &outcomes);

/**
 * @class BatchProcessor
 * @brief Orchestrates one run.
 */
class BatchProcessor {
public:
  /**
   * @param cfg Run configuration, must outlive the processor
   * @param decision Source of the frame-rate decision
   * @param probe_fn Media probe, libavformat based probe() by default
   */
  BatchProcessor(const RunConfig &cfg, DecisionSource &decision,
                 ProbeFunction probe_fn = probe);

  /**
   * @brief Process the whole directory.
   * @return Terminal status; the summary has been printed
   */
  RunStatus run();

  const RunReporter &reporter() const { return reporter_; }

private:
  const RunConfig &cfg_;
  DecisionSource &decision_;
  ProbeFunction probe_fn_;
  RunReporter reporter_;

  /// Probe each file; unreadable files are recorded and left out
  std::vector<ClipRecord> probe_inventory(const std::vector<std::string> &files);

  /// Remove undersized clips from disk, one failure never blocks the rest
  void delete_undersized(const std::vector<ClipRecord> &clips);

  /// Transform clips one after another
  std::vector<TransformOutcome>
  transform_all(const std::vector<ClipRecord> &clips,
                const ClipTransformer &transformer);

  /// Concatenate each group into its numbered export
  void export_all(const std::vector<ExportGroup> &groups);

  RunStatus finish(double wall_clock_sec);
};

} // namespace clip_batch

#endif // CLIP_BATCH_BATCH_PROCESSOR_HPP
