/**
 * @file filename_classifier.cpp
 * @brief Filename convention rules
 */

#include "clip_batch/filename_classifier.hpp"

#include <algorithm>
#include <filesystem>

#include "clip_batch/system.hpp"

namespace clip_batch {

namespace {

/// Position of " (" with at least one character before it
size_t paren_split(const std::string &stem) {
  size_t pos = stem.find(" (");
  return (pos == std::string::npos || pos == 0) ? std::string::npos : pos;
}

/// Position of the first '_' with at least one character before it
size_t underscore_split(const std::string &stem) {
  size_t pos = stem.find('_');
  return (pos == std::string::npos || pos == 0) ? std::string::npos : pos;
}

} // anonymous namespace

const std::vector<CaptionRule> &caption_rules() {
  static const std::vector<CaptionRule> rules = {
      {"underscore",
       [](const std::string &stem) {
         return underscore_split(stem) != std::string::npos;
       },
       [](const std::string &stem) {
         return stem.substr(0, underscore_split(stem));
       }},
      {"parenthesis",
       [](const std::string &stem) {
         return paren_split(stem) != std::string::npos;
       },
       [](const std::string &stem) {
         return stem.substr(0, paren_split(stem));
       }},
      {"whole-name", [](const std::string &) { return true; },
       [](const std::string &stem) { return stem; }},
  };
  return rules;
}

std::vector<std::string> marker_suffixes(const std::string &stem) {
  std::vector<std::string> suffixes;

  size_t underscore = stem.find('_');
  if (underscore != std::string::npos) {
    suffixes.push_back(stem.substr(underscore + 1));
  }

  size_t open = stem.find(" (");
  if (open != std::string::npos) {
    size_t start = open + 2;
    size_t close = stem.find(')', start);
    suffixes.push_back(close == std::string::npos
                           ? stem.substr(start)
                           : stem.substr(start, close - start));
  }
  return suffixes;
}

FilenameTraits classify_filename(const std::string &filename) {
  const std::string stem = std::filesystem::path(filename).stem().string();

  FilenameTraits traits;
  for (const auto &rule : caption_rules()) {
    if (rule.matches(stem)) {
      traits.caption_text = rule.extract(stem);
      break;
    }
  }
  std::replace(traits.caption_text.begin(), traits.caption_text.end(), '-',
               ' ');

  for (const auto &suffix : marker_suffixes(stem)) {
    if (to_lower(suffix).find(NO_STABLE_MARKER) != std::string::npos) {
      traits.skip_stabilization = true;
      break;
    }
  }
  return traits;
}

} // namespace clip_batch
