/**
 * @file export_grouper.hpp
 * @brief Grouping of processed clips into exports and lossless concat
 *
 * @details Processed artifacts are split into consecutive groups of
 *          clips_per_export, in order, without rebalancing: four clips
 *          with a group size of three give [3, 1]. Each group is joined by
 *          the ffmpeg concat demuxer with stream copy (no re-encode), which
 *          works because every artifact shares codec, canvas and rate.
 *
 * @note The concat list lives in an anonymous memory file (memfd_create)
 *       that ffmpeg reads through /proc/<pid>/fd/<n>. It disappears when
 *       its ConcatManifest is destroyed.
 */

#ifndef CLIP_BATCH_EXPORT_GROUPER_HPP
#define CLIP_BATCH_EXPORT_GROUPER_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "process.hpp"
#include "types.hpp"

namespace clip_batch {

/**
 * @brief Partition artifacts into consecutive groups.
 * @param artifacts Artifact paths in inventory order
 * @param group_size Maximum clips per group, values below 1 count as 1
 * @return Non-empty groups; only the last may be short
 */
std::vector<ExportGroup> group_artifacts(const std::vector<std::string> &artifacts,
                                         int group_size = DEFAULT_CLIPS_PER_EXPORT);

/**
 * @brief Concat demuxer list for a group.
 * @note Paths are made absolute and single quotes are escaped as '\''.
 */
std::string build_manifest(const ExportGroup &group);

/**
 * @brief Path of the n-th export (1-based): <export_dir>/Export_NNN.mp4
 */
std::string export_path_for(const RunConfig &cfg, int number);

/**
 * @class ConcatManifest
 * @brief Concat list held in a memfd, closed on destruction.
 */
class ConcatManifest {
public:
  explicit ConcatManifest(const std::string &content);
  ~ConcatManifest();

  ConcatManifest(const ConcatManifest &) = delete;
  ConcatManifest &operator=(const ConcatManifest &) = delete;

  /// false if the memory file could not be created or written
  bool ok() const { return fd_ >= 0; }

  /// Path ffmpeg can open while this object is alive
  std::string path() const;

private:
  int fd_ = -1;
};

/**
 * @brief Join one group into output_path with stream copy.
 * @return Process result of the ffmpeg invocation; a manifest failure is
 *         reported as a result that was never launched
 */
ProcessResult concat_group(const RunConfig &cfg, const ExportGroup &group,
                           const std::string &output_path);

} // namespace clip_batch

#endif // CLIP_BATCH_EXPORT_GROUPER_HPP
