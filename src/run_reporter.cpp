/**
 * @file run_reporter.cpp
 * @brief Run log and summary implementation
 */

#include "clip_batch/run_reporter.hpp"

#include <cstdio>
#include <fstream>

#include <fmt/color.h>
#include <fmt/core.h>

#include "clip_batch/logging.hpp"
#include "clip_batch/system.hpp"

namespace clip_batch {

// **---- Status Helpers ----**

const char *to_string(RunStatus status) {
  switch (status) {
  case RunStatus::Completed:
    return "completed";
  case RunStatus::CompletedWithFailures:
    return "completed with failures";
  case RunStatus::NoExportsProduced:
    return "no exports produced";
  case RunStatus::AbortedEngineMissing:
    return "aborted: ffmpeg not found";
  case RunStatus::AbortedFontMissing:
    return "aborted: no caption font";
  case RunStatus::AbortedNoInput:
    return "aborted: no input files";
  case RunStatus::AbortedNothingToProcess:
    return "aborted: no clips to process";
  }
  return "unknown";
}

bool is_abort(RunStatus status) {
  switch (status) {
  case RunStatus::AbortedEngineMissing:
  case RunStatus::AbortedFontMissing:
  case RunStatus::AbortedNoInput:
  case RunStatus::AbortedNothingToProcess:
    return true;
  default:
    return false;
  }
}

int exit_code_for(RunStatus status) {
  return (status == RunStatus::Completed ||
          status == RunStatus::CompletedWithFailures)
             ? 0
             : 1;
}

const char *to_string(FailureKind kind) {
  switch (kind) {
  case FailureKind::EnvironmentMissing:
    return "EnvironmentMissing";
  case FailureKind::ProbeUnreadable:
    return "ProbeUnreadable";
  case FailureKind::TransformFailure:
    return "TransformFailure";
  case FailureKind::ConcatenationFailure:
    return "ConcatenationFailure";
  case FailureKind::FilesystemFailure:
    return "FilesystemFailure";
  }
  return "Unknown";
}

// **---- RunReporter ----**

RunReporter::RunReporter(std::filesystem::path log_path)
    : log_path_(std::move(log_path)) {}

std::string RunReporter::format_line(const FailureRecord &record) {
  std::string line =
      fmt::format("[{}] {}: {}: {}", record.timestamp, to_string(record.kind),
                  record.subject, record.message);
  if (!record.diagnostic.empty()) {
    std::string diag = record.diagnostic;
    for (size_t pos = diag.find('\n'); pos != std::string::npos;
         pos = diag.find('\n', pos)) {
      diag.replace(pos, 1, " | ");
    }
    line += fmt::format(" || {}", diag);
  }
  return line;
}

void RunReporter::append_to_log(const std::string &line) {
  std::ofstream out(log_path_, std::ios::app);
  if (!out) {
    if (!log_write_failed_) {
      LOG_WARN("Cannot write run log {}", log_path_.string());
      log_write_failed_ = true;
    }
    return;
  }
  out << line << '\n';
}

void RunReporter::record_failure(FailureKind kind, const std::string &subject,
                                 const std::string &message,
                                 const std::string &diagnostic) {
  FailureRecord record{make_log_timestamp(), kind, subject, message,
                       diagnostic};

  LOG_ERROR("{}: {}", subject, message);
  if (!diagnostic.empty()) {
    LOG_ERROR("{}", diagnostic);
  }

  append_to_log(format_line(record));
  failures_.push_back(std::move(record));
}

void RunReporter::record_abort(RunStatus status,
                               const std::string &remediation) {
  aborted_ = true;
  abort_status_ = status;
  LOG_ERROR("{}", to_string(status));
  LOG_WARN("{}", remediation);
  append_to_log(fmt::format("[{}] {}: {}", make_log_timestamp(),
                            to_string(status), remediation));
}

RunStatus RunReporter::finish() const {
  if (aborted_)
    return abort_status_;
  if (counters_.exports_written == 0)
    return RunStatus::NoExportsProduced;
  if (!failures_.empty())
    return RunStatus::CompletedWithFailures;
  return RunStatus::Completed;
}

void RunReporter::print_summary(double wall_clock_sec) const {
  const RunStatus status = finish();
  const auto status_color =
      status == RunStatus::Completed
          ? fmt::color::green
          : (status == RunStatus::CompletedWithFailures ? fmt::color::yellow
                                                        : fmt::color::red);

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "==================== RUN SUMMARY =====================\n");
  fmt::print("{:<25} {:>25}\n", "Files found:", counters_.inventoried);
  fmt::print("{:<25} {:>25}\n", "Unreadable:", counters_.unreadable);
  fmt::print("{:<25} {:>25}\n", "Deleted (too short):", counters_.deleted);
  fmt::print("{:<25} {:>25}\n", "Excluded (frame rate):", counters_.excluded);
  fmt::print("{:<25} {:>25}\n", "Clips processed:", counters_.processed);
  fmt::print("{:<25} {:>25}\n", "Clips failed:", counters_.failed);
  fmt::print("{:<25} {:>25}\n", "Exports written:", counters_.exports_written);
  fmt::print("{:<25} {:>25}\n", "Exports failed:", counters_.exports_failed);
  fmt::print("{:<25} {:>25}\n", "Elapsed:", format_time(wall_clock_sec));
  fmt::print(fg(status_color), "{:<25} {:>25}\n", "Status:",
             to_string(status));
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");

  if (!failures_.empty()) {
    fmt::print(fg(fmt::color::red), "\nFailures ({}), see {}:\n",
               failures_.size(), log_path_.string());
    for (const auto &f : failures_) {
      fmt::print(fg(fmt::color::red), "  - {} [{}] {}\n", f.subject,
                 to_string(f.kind), f.message);
    }
  }
  std::fflush(stdout);
}

} // namespace clip_batch
