/**
 * @file clip_analyzer.cpp
 * @brief Clip classification and frame-rate gate
 */

#include "clip_batch/clip_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <istream>
#include <ostream>
#include <string>

#include <fmt/core.h>

#include "clip_batch/logging.hpp"
#include "clip_batch/system.hpp"

namespace clip_batch {

// **---- Decision Sources ----**

bool AutoAcceptDecision::accept_non_standard(
    const std::vector<ClipRecord> &clips) {
  LOG_INFO("Auto-accepting {} clip(s) for conversion to {} fps", clips.size(),
           REFERENCE_FPS);
  return true;
}

ConsolePromptDecision::ConsolePromptDecision(std::istream &in,
                                             std::ostream &out)
    : in_(in), out_(out) {}

bool ConsolePromptDecision::accept_non_standard(
    const std::vector<ClipRecord> &clips) {
  out_ << fmt::format("\n{} clip(s) are not {} fps:\n", clips.size(),
                      REFERENCE_FPS);
  for (const auto &clip : clips) {
    out_ << fmt::format("  - {} ({:.2f} fps)\n", clip.display_name,
                        clip.frame_rate);
  }
  out_ << fmt::format("Convert them to {} fps and include them? [y/N] ",
                      REFERENCE_FPS);
  out_.flush();

  std::string answer;
  if (!std::getline(in_, answer))
    return false;

  answer.erase(0, answer.find_first_not_of(" \t"));
  answer.erase(answer.find_last_not_of(" \t\r") + 1);
  answer = to_lower(answer);
  return answer == "y" || answer == "yes";
}

// **---- Rules ----**

bool is_non_standard_frame_rate(double fps) {
  if (fps <= 0.0)
    return false;
  return std::fabs(fps - REFERENCE_FPS) > FPS_TOLERANCE + FPS_EPSILON;
}

ClassificationResult analyze_clips(const std::vector<ClipRecord> &clips) {
  ClassificationResult result;

  for (const auto &clip : clips) {
    if (clip.duration_seconds < MIN_DURATION_SEC) {
      result.to_delete.push_back(clip);
      continue;
    }
    if (is_non_standard_frame_rate(clip.frame_rate)) {
      result.non_standard_frame_rate.push_back(clip);
      continue;
    }
    result.to_process.push_back(clip);
  }
  return result;
}

bool resolve_frame_rates(ClassificationResult &result,
                         DecisionSource &decision) {
  result.resolved = true;
  if (result.non_standard_frame_rate.empty())
    return true;

  bool accepted = decision.accept_non_standard(result.non_standard_frame_rate);
  if (accepted) {
    result.to_process.insert(result.to_process.end(),
                             result.non_standard_frame_rate.begin(),
                             result.non_standard_frame_rate.end());
    /// Restore inventory order so exports follow the folder listing
    std::stable_sort(result.to_process.begin(), result.to_process.end(),
                     [](const ClipRecord &a, const ClipRecord &b) {
                       return a.index < b.index;
                     });
  } else {
    result.excluded = result.non_standard_frame_rate;
  }
  return accepted;
}

} // namespace clip_batch
