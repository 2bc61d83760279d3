/**
 * @file run_reporter.hpp
 * @brief Failure log and terminal status of a run
 *
 * @details Every non-fatal failure is kept in memory and appended as one
 *          timestamped line to the run log file, together with the tail of
 *          the failing tool's stderr. The reporter also carries the run
 *          counters and decides the final RunStatus.
 */

#ifndef CLIP_BATCH_RUN_REPORTER_HPP
#define CLIP_BATCH_RUN_REPORTER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace clip_batch {

/**
 * @enum RunStatus
 * @brief How a run ended.
 */
enum class RunStatus {
  Completed,               //< Every clip and group succeeded
  CompletedWithFailures,   //< Some failures, at least one export written
  NoExportsProduced,       //< Ran to the end without writing any export
  AbortedEngineMissing,    //< ffmpeg not found
  AbortedFontMissing,      //< No caption font found
  AbortedNoInput,          //< No media files in the directory
  AbortedNothingToProcess, //< Nothing left after classification
};

const char *to_string(RunStatus status);

/// true for the Aborted* statuses
bool is_abort(RunStatus status);

/// Process exit code: 0 when at least the run completed, 1 otherwise
int exit_code_for(RunStatus status);

/**
 * @enum FailureKind
 * @brief Category of a recorded failure.
 */
enum class FailureKind {
  EnvironmentMissing,
  ProbeUnreadable,
  TransformFailure,
  ConcatenationFailure,
  FilesystemFailure,
};

const char *to_string(FailureKind kind);

/**
 * @struct FailureRecord
 * @brief One line of the run log.
 */
struct FailureRecord {
  std::string timestamp;
  FailureKind kind;
  std::string subject;    //< Clip or export name
  std::string message;
  std::string diagnostic; //< stderr tail, may be empty
};

/**
 * @struct RunCounters
 * @brief Totals shown in the final summary.
 */
struct RunCounters {
  int inventoried = 0;
  int unreadable = 0;
  int deleted = 0;
  int excluded = 0;
  int processed = 0;
  int failed = 0;
  int exports_written = 0;
  int exports_failed = 0;
};

/**
 * @class RunReporter
 * @brief Collects failures and counters of one run.
 */
class RunReporter {
public:
  /**
   * @param log_path Run log file; created on the first recorded failure
   */
  explicit RunReporter(std::filesystem::path log_path);

  /**
   * @brief Record a non-fatal failure.
   * @note Logged to the console with LOG_ERROR and appended to the log file.
   */
  void record_failure(FailureKind kind, const std::string &subject,
                      const std::string &message,
                      const std::string &diagnostic = "");

  /**
   * @brief Record a terminal condition; finish() will return status.
   * @param remediation What the user should do about it
   */
  void record_abort(RunStatus status, const std::string &remediation);

  /// Final status from the abort state, counters and failures
  RunStatus finish() const;

  /**
   * @brief Print the colored end-of-run table.
   * @param wall_clock_sec Elapsed run time in seconds
   */
  void print_summary(double wall_clock_sec) const;

  RunCounters &counters() { return counters_; }
  const RunCounters &counters() const { return counters_; }
  const std::vector<FailureRecord> &failures() const { return failures_; }
  const std::filesystem::path &log_path() const { return log_path_; }

  /// One log line, without trailing newline
  static std::string format_line(const FailureRecord &record);

private:
  std::filesystem::path log_path_;
  std::vector<FailureRecord> failures_;
  RunCounters counters_;
  bool aborted_ = false;
  RunStatus abort_status_ = RunStatus::Completed;
  bool log_write_failed_ = false;

  void append_to_log(const std::string &line);
};

} // namespace clip_batch

#endif // CLIP_BATCH_RUN_REPORTER_HPP
