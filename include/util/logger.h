#ifndef TACET_LOGGER_H_
#define TACET_LOGGER_H_

#include <string>

namespace TacetLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

/**
 * Process-wide logger. Lines go to stderr and, when a log file is set, are
 * appended to it as well:
 *
 *   2026-10-17T09:14:03.512Z [WARN ] [CustomPatterns] Skipping custom pattern ...
 *
 * Redaction components log counts, category names and pattern names only.
 * Document text never reaches the log.
 */
class Logger {
public:
  // Reset to the build default level (DEBUG in debug builds, INFO
  // otherwise) and stderr only
  static void Init();

  // |log_file_path| may be empty. A file that cannot be opened is reported
  // once on stderr and logging continues to stderr only.
  static void Init(Level level, const std::string& log_file_path);

  static void SetLevel(Level level);
  static Level GetLevel();
  static bool IsEnabled(Level level);

  static void Log(Level level, const std::string& component, const std::string& message);

  // Parse "debug" / "info" / "warn" / "error" (case-insensitive).
  // Returns false and leaves |level| untouched on unknown names.
  static bool ParseLevel(const std::string& name, Level* level);
  static const char* LevelName(Level level);

  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

private:
  static Level current_level_;
  static std::string GetTimestamp();
};

} // namespace TacetLogger

// The message expression is only evaluated when the level is enabled.
// LOG_DEBUG compiles away entirely outside debug builds.
#define TACET_LOG_AT(level, component, msg)                                \
  do {                                                                     \
    if (TacetLogger::Logger::IsEnabled(level)) {                           \
      TacetLogger::Logger::Log(level, component, msg);                     \
    }                                                                      \
  } while (0)

#ifdef TACET_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) TACET_LOG_AT(TacetLogger::DEBUG, component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) TACET_LOG_AT(TacetLogger::INFO, component, msg)
#define LOG_WARN(component, msg) TACET_LOG_AT(TacetLogger::WARN, component, msg)
#define LOG_ERROR(component, msg) TACET_LOG_AT(TacetLogger::ERROR, component, msg)

#endif  // TACET_LOGGER_H_
