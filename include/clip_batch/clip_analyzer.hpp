/**
 * @file clip_analyzer.hpp
 * @brief Duration and frame-rate policy over the probed inventory
 *
 * @details Two steps:
 *
 *          1. analyze() applies the hard duration rule and flags clips whose
 *             frame rate is off the 59.94 reference
 *
 *          2. resolve() asks a DecisionSource once for the whole flagged set
 *             and moves it to to_process (accept) or excluded (decline)
 *
 * @note Flagged clips are never deleted. Only clips under MIN_DURATION_SEC
 *       are removed from disk, and that happens in BatchProcessor.
 */

#ifndef CLIP_BATCH_CLIP_ANALYZER_HPP
#define CLIP_BATCH_CLIP_ANALYZER_HPP

#include <iosfwd>
#include <vector>

#include "types.hpp"

namespace clip_batch {

/**
 * @class DecisionSource
 * @brief Answers the one yes/no question of a run: convert the clips with
 *        a non-standard frame rate, or leave them out?
 */
class DecisionSource {
public:
  virtual ~DecisionSource() = default;

  /**
   * @brief Decide for all flagged clips at once.
   * @param clips Clips whose frame rate is off the reference, non-empty
   * @return true to convert and include them
   */
  virtual bool accept_non_standard(const std::vector<ClipRecord> &clips) = 0;
};

/// Answers yes without asking (--yes)
class AutoAcceptDecision : public DecisionSource {
public:
  bool accept_non_standard(const std::vector<ClipRecord> &clips) override;
};

/**
 * @class ConsolePromptDecision
 * @brief Lists the flagged clips and reads a y/n answer.
 * @note "y" or "yes" (any case) accepts; anything else, or EOF, declines.
 */
class ConsolePromptDecision : public DecisionSource {
public:
  ConsolePromptDecision(std::istream &in, std::ostream &out);

  bool accept_non_standard(const std::vector<ClipRecord> &clips) override;

private:
  std::istream &in_;
  std::ostream &out_;
};

/**
 * @brief true if a known frame rate is outside the reference tolerance.
 * @note Unknown rates (UNKNOWN_VALUE) are never flagged.
 */
bool is_non_standard_frame_rate(double fps);

/**
 * @brief Apply the duration and frame-rate rules.
 *
 * @param clips Probed clips with known durations, in inventory order
 * @return Result with to_delete and non_standard_frame_rate filled and
 *         to_process holding every clip that is neither; not yet resolved
 */
ClassificationResult analyze_clips(const std::vector<ClipRecord> &clips);

/**
 * @brief Settle the flagged clips with a single decision.
 *
 * @param result Output of analyze_clips(), updated in place
 * @param decision Consulted only when something is flagged
 * @return true if the flagged clips were accepted (or none were flagged)
 */
bool resolve_frame_rates(ClassificationResult &result,
                         DecisionSource &decision);

} // namespace clip_batch

#endif // CLIP_BATCH_CLIP_ANALYZER_HPP
