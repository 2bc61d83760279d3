/**
 * @file clip_transformer.hpp
 * @brief Per-clip trim, stabilize, caption and normalize
 *
 * @details Every accepted clip becomes one temporary artifact of identical
 *          format: trimmed to at most CLIP_LENGTH_SEC, scaled and padded to
 *          the target canvas, forced to 60000/1001 fps, captioned, silent.
 *
 *          Stabilized clips take two ffmpeg passes:
 *
 *          1. vidstabdetect over the trim window writes a transforms file
 *
 *          2. vidstabtransform + canvas + fps + drawtext in one encode
 *
 *          Clips whose filename carries the NoStable marker take only the
 *          second pass, without vidstabtransform.
 *
 * @attention The transforms file is a ScopedTempFile: it is removed when the
 *            clip is done, whether pass 2 succeeded, failed or threw.
 */

#ifndef CLIP_BATCH_CLIP_TRANSFORMER_HPP
#define CLIP_BATCH_CLIP_TRANSFORMER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace clip_batch {

/**
 * @brief Window of a clip that is kept.
 * @note Longer than CLIP_LENGTH_SEC: the centered CLIP_LENGTH_SEC seconds.
 *       Otherwise the whole clip, without padding.
 */
TrimWindow compute_trim_window(double duration_seconds);

/**
 * @brief Escape a value for use inside an ffmpeg filter option.
 *
 * @details The value passes two parsers: the filtergraph parser, then the
 *          filter's option parser. Escape table:
 *
 *          | char | emitted   | why                                 |
 *          |------|-----------|-------------------------------------|
 *          | \    | \\\\      | escape char of both parsers         |
 *          | '    | \\\'      | quote char of both parsers          |
 *          | :    | \\:       | option separator                    |
 *          | , ; [ ] | \c     | filtergraph separators              |
 *
 * @note drawtext is run with expansion=none, so '%' needs no escaping.
 */
std::string escape_filter_value(const std::string &value);

/**
 * @brief First candidate that exists as a regular file.
 * @return Font path, or empty string when none exists
 */
std::string resolve_font(const std::vector<std::string> &candidates);

/**
 * @class ScopedTempFile
 * @brief Uniquely named file that is removed on destruction.
 * @note Created with mkstemps, so two runs sharing a directory never
 *       collide. Throws std::system_error if the file cannot be created.
 */
class ScopedTempFile {
public:
  ScopedTempFile(const std::filesystem::path &dir, const std::string &prefix,
                 const std::string &suffix);
  ~ScopedTempFile();

  ScopedTempFile(const ScopedTempFile &) = delete;
  ScopedTempFile &operator=(const ScopedTempFile &) = delete;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/**
 * @class ClipTransformer
 * @brief Builds and runs the ffmpeg invocations for one clip at a time.
 */
class ClipTransformer {
public:
  /**
   * @param cfg Run configuration, must outlive the transformer
   * @param font_path Resolved caption font
   */
  ClipTransformer(const RunConfig &cfg, std::string font_path);

  /**
   * @brief Produce the temporary artifact for one clip.
   *
   * @return Outcome with output_path on success; on failure the reason and
   *         the stderr tail of the failing stage. Never throws.
   */
  TransformOutcome transform(const ClipRecord &clip) const;

  /// Artifact path: <temp_dir>/<NNN>_<stem>.mp4
  std::string output_path_for(const ClipRecord &clip) const;

  /// Arguments of the vidstabdetect pass
  std::vector<std::string>
  build_detect_args(const ClipRecord &clip, const TrimWindow &window,
                    const std::string &transforms_path) const;

  /**
   * @brief Arguments of the encode pass.
   * @param transforms_path vidstab transforms file, empty to skip
   *        stabilization
   */
  std::vector<std::string>
  build_encode_args(const ClipRecord &clip, const TrimWindow &window,
                    const std::string &transforms_path,
                    const std::string &output_path) const;

  /// The -vf chain of the encode pass
  std::string build_video_filter(const ClipRecord &clip,
                                 const std::string &transforms_path) const;

private:
  const RunConfig &cfg_;
  std::string font_path_;

  /**
   * @brief Run one ffmpeg pass.
   * @return true on exit status 0; otherwise fills outcome's failure fields
   */
  bool run_stage(const char *stage, const std::vector<std::string> &args,
                 TransformOutcome &outcome) const;
};

} // namespace clip_batch

#endif // CLIP_BATCH_CLIP_TRANSFORMER_HPP
