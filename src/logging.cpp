/**
 * @file logging.cpp
 * @brief Console output and timing table implementation
 */

#include "clip_batch/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace clip_batch {

void log_detail::emit(std::FILE *stream, const fmt::text_style &style,
                      const char *tag, const std::string &message) {
  fmt::print(stream, style, "{}{}\n", tag, message);
  std::fflush(stream);
}

// **----- TIMING COLLECTOR -----**

std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  for (auto &e : entries) {
    if (e.name == name) {
      e.calls++;
      e.microseconds += us;
      return;
    }
  }
  entries.push_back({name, 1, us});
}

const std::vector<TimingEntry> &TimingCollector::phases() { return entries; }

void TimingCollector::print_summary() {
  if (entries.empty())
    return;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<22} {:>6} {:>22}\n", "Phase", "Calls", "Time (us) [sec]");
  fmt::print("{:-<22} {:-<6} {:-<22}\n", "", "", "");

  for (const auto &e : entries) {
    fmt::print("{:<22} {:>6} {:>12} [{:.2f}s]\n", e.name, e.calls,
               e.microseconds, e.microseconds / 1000000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() { entries.clear(); }

} // namespace clip_batch
