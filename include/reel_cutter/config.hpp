/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Pure components never call these directly; they take limit
 *          structs whose from_config() factories read from here.
 */

#ifndef REEL_CUTTER_CONFIG_HPP
#define REEL_CUTTER_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace reel_cutter {
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
 */
inline std::string get_env_string(const char *name,
                                  const char *default_val = "") {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- MEDIA ENGINE ----**

/// ffmpeg binary used to execute filter graphs
inline const std::string &ffmpeg_path() {
  static std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/// Output frame rate for every rendered clip
inline int output_fps() {
  static int val = get_env_int("OUTPUT_FPS", 30);
  return val;
}

inline const std::string &video_bitrate() {
  static std::string val = get_env_string("VIDEO_BITRATE", "5M");
  return val;
}

inline const std::string &audio_bitrate() {
  static std::string val = get_env_string("AUDIO_BITRATE", "192k");
  return val;
}

/// Wall-clock ceiling for one ffmpeg invocation
inline int render_timeout_sec() {
  static int val = get_env_int("RENDER_TIMEOUT_SEC", 600);
  return val;
}

/// Root directory for per-job work areas
inline const std::string &temp_dir() {
  static std::string val = get_env_string("TEMP_DIR", "/tmp/reel-cutter");
  return val;
}

// **---- PLANNING LIMITS ----**

/**
 * @brief Minimum source duration for multi-clip discovery
 * @note Shorter sources always yield exactly one target.
 */
inline double multi_clip_min_duration_sec() {
  static double val = get_env_double("MULTI_CLIP_MIN_DURATION_SEC", 600.0);
  return val;
}

/// Cap for `universal` targets (independent clips, edits, single AI clip)
inline double max_clip_duration_sec() {
  static double val = get_env_double("MAX_CLIP_DURATION_SEC", 80.0);
  return val;
}

/// Cap for the first AI target in a multi-clip plan
inline double shorts_max_duration_sec() {
  static double val = get_env_double("SHORTS_MAX_DURATION_SEC", 70.0);
  return val;
}

/// Cap for the remaining AI targets in a multi-clip plan
inline double long_form_max_duration_sec() {
  static double val = get_env_double("LONG_FORM_MAX_DURATION_SEC", 160.0);
  return val;
}

inline int max_source_size_mb() {
  static int val = get_env_int("MAX_SOURCE_SIZE_MB", 2000);
  return val;
}

/// Ceiling on the analysis provider call
inline int analysis_timeout_sec() {
  static int val = get_env_int("ANALYSIS_TIMEOUT_SEC", 600);
  return val;
}

// **---- JOB STORE ----**

/// Retention of finished job records (3 days)
inline int job_ttl_sec() {
  static int val = get_env_int("JOB_TTL_SEC", 3 * 24 * 60 * 60);
  return val;
}

inline int sweep_interval_sec() {
  static int val = get_env_int("SWEEP_INTERVAL_SEC", 3600);
  return val;
}

/// Number of rendering worker threads
inline int worker_count() {
  static int val = get_env_int("WORKER_COUNT", 1);
  return val;
}

// **---- WEBHOOK ----**

inline int webhook_timeout_sec() {
  static int val = get_env_int("WEBHOOK_TIMEOUT_SEC", 30);
  return val;
}

/// Retries after the first attempt (3 -> delays 2s, 4s, 8s)
inline int webhook_max_retries() {
  static int val = get_env_int("WEBHOOK_MAX_RETRIES", 3);
  return val;
}

inline double webhook_retry_base_delay_sec() {
  static double val = get_env_double("WEBHOOK_RETRY_BASE_DELAY_SEC", 2.0);
  return val;
}

inline const std::string &curl_path() {
  static std::string val = get_env_string("CURL_PATH", "curl");
  return val;
}

// **---- CAPTIONS ----**

/// Word gap that starts a new caption cue
inline double caption_pause_sec() {
  static double val = get_env_double("CAPTION_PAUSE_SEC", 0.6);
  return val;
}

inline int caption_max_chars() {
  static int val = get_env_int("CAPTION_MAX_CHARS", 24);
  return val;
}

inline int caption_max_words() {
  static int val = get_env_int("CAPTION_MAX_WORDS", 4);
  return val;
}

inline double caption_max_duration_sec() {
  static double val = get_env_double("CAPTION_MAX_DURATION_SEC", 2.5);
  return val;
}

/// Fontconfig family for drawtext
inline const std::string &caption_font() {
  static std::string val = get_env_string("CAPTION_FONT", "Sans");
  return val;
}

// **---- FACE TRACKING ----**

inline double face_sample_fps() {
  static double val = get_env_double("FACE_SAMPLE_FPS", 4.0);
  return val;
}

/// EMA weight of a new sample (lower = smoother)
inline double face_smoothing() {
  static double val = get_env_double("FACE_SMOOTHING", 0.15);
  return val;
}

/// Minimum fraction of samples with a face before tracking is used
inline double face_min_detection_ratio() {
  static double val = get_env_double("FACE_MIN_DETECTION_RATIO", 0.3);
  return val;
}

// **---- COLLABORATORS ----**

inline const std::string &source_dir() {
  static std::string val = get_env_string("SOURCE_DIR", ".");
  return val;
}

inline const std::string &output_dir() {
  static std::string val = get_env_string("OUTPUT_DIR", "./output");
  return val;
}

inline const std::string &analysis_command() {
  static std::string val = get_env_string("ANALYSIS_COMMAND");
  return val;
}

inline const std::string &transcribe_command() {
  static std::string val = get_env_string("TRANSCRIBE_COMMAND");
  return val;
}

inline const std::string &transcribe_fallback_command() {
  static std::string val = get_env_string("TRANSCRIBE_FALLBACK_COMMAND");
  return val;
}

inline const std::string &face_detect_command() {
  static std::string val = get_env_string("FACE_DETECT_COMMAND");
  return val;
}

} // namespace Config
} // namespace reel_cutter

#endif // REEL_CUTTER_CONFIG_HPP
