/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          parameters loaded from environment variables, and the RunConfig
 *          value that a run is built from. Components never read Config
 *          directly; they receive a const RunConfig& so every run works
 *          from one fixed snapshot.
 */

#ifndef CLIP_BATCH_CONFIG_HPP
#define CLIP_BATCH_CONFIG_HPP

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace clip_batch {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable contents or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/// ffmpeg executable, looked up on PATH when not absolute
inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

// **---- CANVAS ----**

inline int target_width() {
  static int val = get_env_int("TARGET_WIDTH", 1920);
  return val;
}

inline int target_height() {
  static int val = get_env_int("TARGET_HEIGHT", 1080);
  return val;
}

/// Number of processed clips concatenated into one export
inline int clips_per_export() {
  static int val = get_env_int("CLIPS_PER_EXPORT", 3);
  return val;
}

// **---- STABILIZATION ----**

/**
 * @brief vidstabdetect shakiness (1-10)
 * @note Higher values treat more of the motion as shake.
 */
inline int stab_shakiness() {
  static int val = get_env_int("STAB_SHAKINESS", 5);
  return val;
}

/// vidstabdetect accuracy (1-15)
inline int stab_accuracy() {
  static int val = get_env_int("STAB_ACCURACY", 15);
  return val;
}

/// vidstabtransform smoothing window in frames
inline int stab_smoothing() {
  static int val = get_env_int("STAB_SMOOTHING", 10);
  return val;
}

// **---- CAPTION ----**

inline int font_size() {
  static int val = get_env_int("FONT_SIZE", 48);
  return val;
}

inline std::string font_color() {
  static std::string val = get_env_string("FONT_COLOR", "white");
  return val;
}

inline std::string border_color() {
  static std::string val = get_env_string("BORDER_COLOR", "black");
  return val;
}

inline int border_width() {
  static int val = get_env_int("BORDER_WIDTH", 3);
  return val;
}

/// Fraction of the frame kept free between the caption and each edge
inline double caption_margin() {
  static double val = get_env_double("CAPTION_MARGIN", 0.05);
  return val;
}

/**
 * @brief Font file tried before the built-in candidate list.
 * @note Empty when unset.
 */
inline std::string caption_font() {
  static std::string val = get_env_string("CAPTION_FONT", "");
  return val;
}

// **---- ENCODER ----**

inline int video_crf() {
  static int val = get_env_int("VIDEO_CRF", 18);
  return val;
}

inline std::string video_preset() {
  static std::string val = get_env_string("VIDEO_PRESET", "medium");
  return val;
}

/// Lines of ffmpeg stderr kept for each failure record
inline int diag_tail_lines() {
  static int val = get_env_int("DIAG_TAIL_LINES", 10);
  return val;
}

} // namespace Config

/**
 * @struct RunConfig
 * @brief Immutable settings and paths of one run.
 *
 * @note Built once by make_run_config() and passed by const reference to
 *       every component. Paths are run-scoped: they carry run_id, the start
 *       timestamp plus the process id, so two runs started in the same
 *       second in one directory get separate temp, export and log paths.
 */
struct RunConfig {
  std::filesystem::path input_dir;
  std::filesystem::path temp_dir;   //< Holds processed artifacts
  std::filesystem::path export_dir; //< Created once there is output
  std::filesystem::path log_path;   //< Failure log, created on first write
  std::string timestamp;
  std::string run_id;               //< <timestamp>_<pid>
  bool auto_accept = false;

  std::string ffmpeg_bin = "ffmpeg";
  int target_width = 1920;
  int target_height = 1080;
  int clips_per_export = 3;

  int stab_shakiness = 5;
  int stab_accuracy = 15;
  int stab_smoothing = 10;

  int font_size = 48;
  std::string font_color = "white";
  std::string border_color = "black";
  int border_width = 3;
  double caption_margin = 0.05;
  std::vector<std::string> font_candidates;

  int video_crf = 18;
  std::string video_preset = "medium";
  int diag_tail_lines = 10;
};

/**
 * @brief Font files tried in order when CAPTION_FONT is not set.
 */
std::vector<std::string> default_font_candidates();

/// Name component shared by every run-scoped path: <timestamp>_<pid>
std::string make_run_id(const std::string &timestamp, long pid);

/**
 * @brief Build the configuration of a run rooted at input_dir.
 *
 * @param input_dir Directory holding the clips
 * @param auto_accept Accept non-standard frame rates without asking
 * @param timestamp Run timestamp used in every run-scoped path
 * @return Snapshot of the environment configuration plus run paths
 */
RunConfig make_run_config(const std::filesystem::path &input_dir,
                          bool auto_accept, const std::string &timestamp);

} // namespace clip_batch

#endif // CLIP_BATCH_CONFIG_HPP
