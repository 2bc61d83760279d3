/**
 * @file filename_classifier.hpp
 * @brief Caption text and stabilization flag from clip filenames
 *
 * @details Filenames follow one of three shapes:
 *
 *          - `Place-Name_<suffix>.mp4`    caption is the part before '_'
 *
 *          - `Place-Name (<suffix>).mp4`  caption is the part before " ("
 *
 *          - `Place-Name.mp4`             caption is the whole stem
 *
 *          Dashes in the caption become spaces. A suffix containing
 *          "NoStable" (any case) turns stabilization off for that clip.
 *
 * @attention Users name their files by this convention; changing a rule
 *            changes the output of existing libraries.
 */

#ifndef CLIP_BATCH_FILENAME_CLASSIFIER_HPP
#define CLIP_BATCH_FILENAME_CLASSIFIER_HPP

#include <functional>
#include <string>
#include <vector>

#include "types.hpp"

namespace clip_batch {

/**
 * @struct CaptionRule
 * @brief One entry of the ordered caption rule list.
 */
struct CaptionRule {
  const char *name;
  std::function<bool(const std::string &)> matches;     //< Applies to stem?
  std::function<std::string(const std::string &)> extract; //< Raw caption
};

/**
 * @brief Caption rules in priority order; the first match wins.
 * @note The last rule matches every stem.
 */
const std::vector<CaptionRule> &caption_rules();

/**
 * @brief Filename parts that are searched for the NoStable marker.
 * @param stem Filename without extension
 * @return Text after the first '_' and text inside "(...)" after a space,
 *         whichever exist
 */
std::vector<std::string> marker_suffixes(const std::string &stem);

/**
 * @brief Derive caption and stabilization flag from a filename.
 * @param filename Filename or path; directories and extension are ignored
 */
FilenameTraits classify_filename(const std::string &filename);

} // namespace clip_batch

#endif // CLIP_BATCH_FILENAME_CLASSIFIER_HPP
