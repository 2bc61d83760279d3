/**
 * @file export_grouper.cpp
 * @brief Export grouping and concat implementation
 */

#include "clip_batch/export_grouper.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>

#include <sys/syscall.h>
#include <unistd.h>

#include <fmt/core.h>

#include "clip_batch/logging.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace clip_batch {

namespace fs = std::filesystem;

std::vector<ExportGroup>
group_artifacts(const std::vector<std::string> &artifacts, int group_size) {
  const size_t size = static_cast<size_t>(std::max(1, group_size));

  std::vector<ExportGroup> groups;
  for (size_t i = 0; i < artifacts.size(); i += size) {
    size_t end = std::min(i + size, artifacts.size());
    groups.emplace_back(artifacts.begin() + i, artifacts.begin() + end);
  }
  return groups;
}

std::string build_manifest(const ExportGroup &group) {
  std::string content;
  content.reserve(256 * group.size());

  for (const auto &path : group) {
    std::string abs_path = fs::absolute(path).string();
    std::string quoted;
    for (char c : abs_path) {
      if (c == '\'') {
        quoted += "'\\''";
      } else {
        quoted += c;
      }
    }
    content += fmt::format("file '{}'\n", quoted);
  }
  return content;
}

std::string export_path_for(const RunConfig &cfg, int number) {
  return (cfg.export_dir / fmt::format("Export_{:03d}{}", number,
                                       MEDIA_EXTENSION))
      .string();
}

// **---- ConcatManifest ----**

ConcatManifest::ConcatManifest(const std::string &content) {
  int fd = static_cast<int>(
      syscall(SYS_memfd_create, "concat_list_mem", MFD_CLOEXEC));
  if (fd == -1) {
    LOG_ERROR("Failed to create memory file: {}", std::strerror(errno));
    return;
  }

  size_t written = 0;
  while (written < content.size()) {
    ssize_t n = write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("Failed to write to memory file: {}", std::strerror(errno));
      close(fd);
      return;
    }
    written += static_cast<size_t>(n);
  }
  fd_ = fd;
}

ConcatManifest::~ConcatManifest() {
  if (fd_ >= 0)
    close(fd_);
}

std::string ConcatManifest::path() const {
  return fmt::format("/proc/{}/fd/{}", getpid(), fd_);
}

// **---- Concat ----**

ProcessResult concat_group(const RunConfig &cfg, const ExportGroup &group,
                           const std::string &output_path) {
  ConcatManifest manifest(build_manifest(group));
  if (!manifest.ok()) {
    ProcessResult failed;
    failed.launched = false;
    failed.exit_code = -1;
    failed.diagnostic_tail = "could not create concat list";
    return failed;
  }

  std::vector<std::string> args = {"-hide_banner",
                                   "-loglevel",
                                   "error",
                                   "-y",
                                   "-f",
                                   "concat",
                                   "-safe",
                                   "0",
                                   "-protocol_whitelist",
                                   "file,pipe,fd",
                                   "-i",
                                   manifest.path(),
                                   "-c",
                                   "copy",
                                   "-fflags",
                                   "+genpts",
                                   "-avoid_negative_ts",
                                   "make_zero",
                                   "-movflags",
                                   "+faststart",
                                   output_path};

  ProcessResult result = run_process(cfg.ffmpeg_bin, args, cfg.diag_tail_lines);
  if (!result.ok()) {
    std::error_code ec;
    fs::remove(output_path, ec);
  }
  return result;
}

} // namespace clip_batch
