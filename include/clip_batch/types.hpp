/**
 * @file types.hpp
 * @brief Core data types and constants for clip_batch
 *
 * @details Contains the records that flow between the pipeline stages:
 *          - Reference frame rate and classification thresholds
 *
 *          - ClipRecord for one inventoried file
 *
 *          - ClassificationResult for the delete/exclude/process split
 *
 *          - TrimWindow for the per-clip cut
 *
 *          - TransformOutcome and ExportGroup for the output side
 */

#ifndef CLIP_BATCH_TYPES_HPP
#define CLIP_BATCH_TYPES_HPP

#include <string>
#include <vector>

namespace clip_batch {

// **----- CONSTANTS -----**

/// Value carried by duration/frame rate when the probe could not read it
constexpr double UNKNOWN_VALUE = -1.0;

/**
 * @brief Canonical output frame rate (60000/1001).
 * @note REFERENCE_FPS is the rounded decimal that probe results are
 *       compared against; the rational form is what ffmpeg receives.
 */
constexpr double REFERENCE_FPS = 59.94;
constexpr int REFERENCE_FPS_NUM = 60000;
constexpr int REFERENCE_FPS_DEN = 1001;

/// Allowed distance from REFERENCE_FPS before a clip is non-standard
constexpr double FPS_TOLERANCE = 0.1;

/// Absorbs binary rounding of decimal rates (60.04 - 59.94 != 0.1 exactly)
constexpr double FPS_EPSILON = 1e-6;

/// Clips shorter than this are deleted
constexpr double MIN_DURATION_SEC = 5.0;

/// Length of every trimmed output clip (shorter clips are kept whole)
constexpr double CLIP_LENGTH_SEC = 10.0;

/// Default number of clips concatenated into one export
constexpr int DEFAULT_CLIPS_PER_EXPORT = 3;

/// The only container accepted as input and produced as output
constexpr const char *MEDIA_EXTENSION = ".mp4";

/// Case-insensitive filename token that disables stabilization
constexpr const char *NO_STABLE_MARKER = "nostable";

// **----- DATA STRUCTURES -----**

/**
 * @struct ProbeResult
 * @brief Duration and frame rate of one media file.
 * @note Each field is UNKNOWN_VALUE when its query failed.
 */
struct ProbeResult {
  double duration_seconds = UNKNOWN_VALUE;
  double frame_rate = UNKNOWN_VALUE;

  bool duration_known() const { return duration_seconds >= 0.0; }
  bool frame_rate_known() const { return frame_rate > 0.0; }
};

/**
 * @struct FilenameTraits
 * @brief Caption and stabilization flag derived from a filename.
 */
struct FilenameTraits {
  std::string caption_text;
  bool skip_stabilization = false;
};

/**
 * @struct ClipRecord
 * @brief One inventoried input file.
 * @note Created during inventory, enriched during classification, then
 *       only read by the transformer.
 */
struct ClipRecord {
  std::string path;                      //< Absolute input path
  std::string display_name;              //< Filename for logs
  double duration_seconds = UNKNOWN_VALUE; //< Probed duration
  double frame_rate = UNKNOWN_VALUE;     //< Probed fps, 2 decimals
  std::string caption_text;              //< Burned-in caption
  bool skip_stabilization = false;       //< Marker found in filename
  int index = 0;                         //< Position in inventory order
};

/**
 * @struct ClassificationResult
 * @brief Split of the probed clips.
 *
 * @attention After resolve_frame_rates() every clip is in exactly one of
 *            to_delete, excluded or to_process. non_standard_frame_rate
 *            keeps the pre-gate view and overlaps the other sets.
 */
struct ClassificationResult {
  std::vector<ClipRecord> to_delete;
  std::vector<ClipRecord> non_standard_frame_rate;
  std::vector<ClipRecord> excluded;
  std::vector<ClipRecord> to_process;
  bool resolved = false;
};

/**
 * @struct TrimWindow
 * @brief Portion of a clip that ends up in the output.
 */
struct TrimWindow {
  double start_offset_seconds = 0.0;
  double output_length_seconds = 0.0;
};

/**
 * @struct TransformOutcome
 * @brief Result of transforming one clip.
 */
struct TransformOutcome {
  std::string display_name;
  bool success = false;
  std::string output_path;     //< Set on success
  std::string failure_reason;  //< Set on failure
  std::string diagnostic_tail; //< Last stderr lines of the failing stage
};

/// Ordered run of artifact paths concatenated into one export
using ExportGroup = std::vector<std::string>;

} // namespace clip_batch

#endif // CLIP_BATCH_TYPES_HPP
