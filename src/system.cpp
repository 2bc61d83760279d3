/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - PATH lookup with access(2) for the ffmpeg executable
 *
 *          - Sorted inventory of input media files
 *
 *          - Time formatting utilities
 */

#include "clip_batch/system.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <system_error>

#include <unistd.h>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "clip_batch/logging.hpp"
#include "clip_batch/types.hpp"

namespace clip_batch {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

bool is_executable_file(const fs::path &p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::tm local_now() {
  std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  return fmt::localtime(now);
}

} // anonymous namespace

// **---- Executables ----**

std::string find_executable(const std::string &name) {
  if (name.empty())
    return {};

  if (name.find('/') != std::string::npos) {
    return is_executable_file(name) ? name : std::string{};
  }

  const char *path_env = std::getenv("PATH");
  if (!path_env)
    return {};

  std::string path_list = path_env;
  size_t pos = 0;
  while (pos <= path_list.size()) {
    size_t end = path_list.find(':', pos);
    if (end == std::string::npos)
      end = path_list.size();

    /// Empty PATH entry means the current directory
    std::string dir = path_list.substr(pos, end - pos);
    fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
    if (is_executable_file(candidate)) {
      return candidate.string();
    }

    pos = end + 1;
  }
  return {};
}

// **---- Inventory ----**

std::vector<std::string> collect_media_files(const fs::path &dir) {
  std::vector<std::string> files;

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    LOG_ERROR("Cannot read directory {}: {}", dir.string(), ec.message());
    return files;
  }

  for (const auto &entry : it) {
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec))
      continue;
    if (to_lower(entry.path().extension().string()) == MEDIA_EXTENSION) {
      files.push_back(fs::absolute(entry.path()).string());
    }
  }

  std::sort(files.begin(), files.end(),
            [](const std::string &a, const std::string &b) {
              return fs::path(a).filename() < fs::path(b).filename();
            });
  return files;
}

// **---- Utilities ----**

std::string make_run_timestamp() {
  return fmt::format("{:%Y%m%d_%H%M%S}", local_now());
}

std::string make_log_timestamp() {
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", local_now());
}

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace clip_batch
