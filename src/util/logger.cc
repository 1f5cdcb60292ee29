#include "util/logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <unistd.h>  // for write(), close()
#include <fcntl.h>   // for open()

namespace TacetLogger {

namespace {

#ifdef TACET_DEBUG_BUILD
constexpr Level kDefaultLevel = DEBUG;
#else
constexpr Level kDefaultLevel = INFO;
#endif

std::mutex log_mutex;
std::string log_file_path_global;

// Fixed-width so columns line up
const char* PaddedLevelName(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
  }
  return "?????";
}

}  // namespace

Level Logger::current_level_ = kDefaultLevel;

void Logger::Init() {
  std::lock_guard<std::mutex> lock(log_mutex);
  current_level_ = kDefaultLevel;
  log_file_path_global.clear();
}

void Logger::Init(Level level, const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  current_level_ = level;
  log_file_path_global.clear();
  if (log_file_path.empty()) {
    return;
  }

  // Open once up front so a bad path is reported at startup, not dropped per line
  int fd = open(log_file_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    std::cerr << "[Logger] ERROR: Failed to open log file: " << log_file_path << std::endl;
    return;
  }
  close(fd);
  log_file_path_global = log_file_path;
}

void Logger::SetLevel(Level level) {
  std::lock_guard<std::mutex> lock(log_mutex);
  current_level_ = level;
}

Level Logger::GetLevel() {
  std::lock_guard<std::mutex> lock(log_mutex);
  return current_level_;
}

bool Logger::IsEnabled(Level level) {
  return level >= GetLevel();
}

bool Logger::ParseLevel(const std::string& name, Level* level) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug") { *level = DEBUG; return true; }
  if (lower == "info")  { *level = INFO;  return true; }
  if (lower == "warn" || lower == "warning") { *level = WARN; return true; }
  if (lower == "error") { *level = ERROR; return true; }
  return false;
}

const char* Logger::LevelName(Level level) {
  switch (level) {
    case DEBUG: return "debug";
    case INFO:  return "info";
    case WARN:  return "warn";
    case ERROR: return "error";
  }
  return "unknown";
}

// UTC with milliseconds, the same clock as the audit processing_timestamp
std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt{};
  gmtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
  return oss.str();
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  std::string log_line = GetTimestamp() + " [" + PaddedLevelName(level) + "] " +
                         "[" + component + "] " + message + "\n";

  std::lock_guard<std::mutex> lock(log_mutex);
  if (level < current_level_) {
    return;
  }

  std::cerr << log_line;

  // Open fresh per line with O_APPEND so concurrent processes interleave whole lines
  if (!log_file_path_global.empty()) {
    int fd = open(log_file_path_global.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd >= 0) {
      ssize_t bytes_written = write(fd, log_line.c_str(), log_line.length());
      (void)bytes_written;  // logging must never fail the caller
      close(fd);
    }
  }
}

void Logger::Debug(const std::string& component, const std::string& message) {
  Log(DEBUG, component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
  Log(INFO, component, message);
}

void Logger::Warn(const std::string& component, const std::string& message) {
  Log(WARN, component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
  Log(ERROR, component, message);
}

} // namespace TacetLogger
