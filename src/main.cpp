/**
 * @file main.cpp
 * @brief Entry point for clip_batch
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Choice of the frame-rate decision source (--yes or prompt)
 *
 *          - Running the BatchProcessor over the target directory
 *
 * @note Tuning parameters come from environment variables, see config.hpp.
 */

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "clip_batch/batch_processor.hpp"
#include "clip_batch/clip_analyzer.hpp"
#include "clip_batch/config.hpp"
#include "clip_batch/logging.hpp"
#include "clip_batch/system.hpp"

using namespace clip_batch;

namespace {

void print_usage() {
  fmt::print("Usage: clip_batch [directory] [-y|--yes] [-h|--help]\n"
             "  directory   folder with .mp4 clips (default: current)\n"
             "  -y, --yes   convert non-59.94 fps clips without asking\n"
             "  -h, --help  show this help\n");
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  namespace fs = std::filesystem;
  std::string dir_arg = ".";
  bool dir_given = false;
  bool auto_accept = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-y" || arg == "--yes") {
      auto_accept = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      LOG_WARN("Unknown option: {}", arg);
      print_usage();
      return 1;
    } else if (!dir_given) {
      dir_arg = arg;
      dir_given = true;
    } else {
      LOG_WARN("Only one directory can be given");
      print_usage();
      return 1;
    }
  }

  std::error_code ec;
  if (!fs::is_directory(dir_arg, ec)) {
    LOG_ERROR("Not a directory: {}", dir_arg);
    return 1;
  }

  RunConfig cfg;
  try {
    cfg = make_run_config(dir_arg, auto_accept, make_run_timestamp());
  } catch (const std::exception &e) {
    /// std::stoi/std::stod on a malformed environment variable
    LOG_ERROR("Invalid configuration: {}", e.what());
    return 1;
  }

  std::unique_ptr<DecisionSource> decision;
  if (auto_accept) {
    decision = std::make_unique<AutoAcceptDecision>();
  } else {
    decision = std::make_unique<ConsolePromptDecision>(std::cin, std::cout);
  }

  BatchProcessor processor(cfg, *decision);
  return exit_code_for(processor.run());
}
