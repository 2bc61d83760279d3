/**
 * @file test_support.hpp
 * @brief Shared fixtures: scratch directories and a scripted ffmpeg stand-in
 */

#ifndef CLIP_BATCH_TEST_SUPPORT_HPP
#define CLIP_BATCH_TEST_SUPPORT_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "clip_batch/config.hpp"

namespace clip_batch {
namespace test {

namespace fs = std::filesystem;

/// Scratch directory removed at end of scope
class TempDir {
public:
  TempDir() {
    std::string tmpl =
        (fs::temp_directory_path() / "clip_batch_test_XXXXXX").string();
    if (!mkdtemp(tmpl.data())) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = tmpl;
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  fs::path operator/(const std::string &name) const { return path_ / name; }

private:
  fs::path path_;
};

inline void write_file(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary);
  out << content;
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

inline std::vector<std::string> read_lines(const fs::path &path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

inline int count_with_extension(const fs::path &dir, const std::string &ext) {
  int n = 0;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    if (entry.path().extension() == ext)
      ++n;
  }
  return n;
}

/**
 * @brief Write a shell script that stands in for ffmpeg.
 *
 * @details The script appends its arguments to <dir>/calls.log, copies any
 *          /proc concat list it is given to <dir>/manifests.log, creates its
 *          last argument (the output file) and exits 0. When fail_pattern
 *          is non-empty and occurs in the arguments, it prints two stderr
 *          lines and exits 1 instead.
 *
 * @return Path of the executable script
 */
inline fs::path write_fake_ffmpeg(const fs::path &dir,
                                  const std::string &fail_pattern = "") {
  fs::path script = dir / "fake_ffmpeg.sh";
  std::ostringstream body;
  body << "#!/bin/sh\n"
       << "printf '%s\\n' \"$*\" >> '" << (dir / "calls.log").string()
       << "'\n"
       << "prev=''\n"
       << "input=''\n"
       << "last=''\n"
       << "for a in \"$@\"; do\n"
       << "  if [ \"$prev\" = '-i' ]; then input=\"$a\"; fi\n"
       << "  prev=\"$a\"\n"
       << "  last=\"$a\"\n"
       << "done\n"
       << "case \"$input\" in /proc/*) cat \"$input\" >> '"
       << (dir / "manifests.log").string() << "';; esac\n";
  if (!fail_pattern.empty()) {
    body << "case \"$*\" in *" << fail_pattern << "*)\n"
         << "  echo 'Input #0, mov,mp4' >&2\n"
         << "  echo 'fatal: " << fail_pattern << " rejected' >&2\n"
         << "  exit 1;;\n"
         << "esac\n";
  }
  body << "if [ \"$last\" != '-' ]; then : > \"$last\"; fi\n"
       << "exit 0\n";

  write_file(script, body.str());
  fs::permissions(script, fs::perms::owner_all);
  return script;
}

/// Run configuration rooted at dir, using the given ffmpeg executable
inline RunConfig make_test_config(const fs::path &dir,
                                  const std::string &ffmpeg_bin) {
  RunConfig cfg;
  cfg.input_dir = dir;
  cfg.timestamp = "20260101_120000";
  cfg.run_id = "20260101_120000_4242";
  cfg.temp_dir = dir / ".clip_batch_tmp_20260101_120000_4242";
  cfg.export_dir = dir / "Exports_20260101_120000_4242";
  cfg.log_path = dir / "clip_batch_20260101_120000_4242.log";
  cfg.ffmpeg_bin = ffmpeg_bin;
  cfg.font_candidates = default_font_candidates();
  return cfg;
}

} // namespace test
} // namespace clip_batch

#endif // CLIP_BATCH_TEST_SUPPORT_HPP
