/**
 * @file process.hpp
 * @brief Blocking execution of external tools (ffmpeg)
 *
 * @details Arguments are passed to the child as separate argv tokens, never
 *          through a shell, so filenames need no shell quoting. The child's
 *          stderr is captured and its last lines are kept for failure
 *          records.
 */

#ifndef CLIP_BATCH_PROCESS_HPP
#define CLIP_BATCH_PROCESS_HPP

#include <string>
#include <vector>

namespace clip_batch {

/**
 * @struct ProcessResult
 * @brief Exit status and diagnostic output of one invocation.
 */
struct ProcessResult {
  bool launched = false;       //< false if the executable could not start
  int exit_code = -1;          //< Exit status, 128+N when killed by signal N
  std::string diagnostic_tail; //< Last lines of stderr

  bool ok() const { return launched && exit_code == 0; }
};

/**
 * @brief Run a program and wait for it.
 *
 * @param program Executable name (PATH lookup) or path
 * @param args Arguments, not including argv[0]
 * @param tail_lines Number of trailing stderr lines to keep
 * @return Exit status and stderr tail; never throws on child failure
 */
ProcessResult run_process(const std::string &program,
                          const std::vector<std::string> &args,
                          int tail_lines = 10);

/**
 * @brief Keep the last n non-empty lines of a text block.
 */
std::string tail_lines(const std::string &text, int n);

/**
 * @brief Render a command for logging, quoting tokens with spaces.
 */
std::string describe_command(const std::string &program,
                             const std::vector<std::string> &args);

} // namespace clip_batch

#endif // CLIP_BATCH_PROCESS_HPP
