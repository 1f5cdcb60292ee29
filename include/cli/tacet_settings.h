#ifndef TACET_SETTINGS_H_
#define TACET_SETTINGS_H_

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "redaction/tacet_redaction_engine.h"
#include "util/logger.h"

namespace Tacet {

/**
 * Settings - process configuration of the command-line front end
 *
 * Sources, lowest priority first:
 *   1. built-in defaults
 *   2. JSON config file (--config)
 *   3. environment: TACET_LOG_LEVEL, TACET_LOG_FILE, TACET_MIN_TEXT_LENGTH,
 *      TACET_MAX_TEXT_LENGTH, TACET_CONTEXT_WINDOW
 *   4. command-line flags
 *
 * Config file keys:
 *   {"min_text_length": 10, "max_text_length": 20000, "context_window": 3,
 *    "log_level": "info", "log_file": "/var/log/tacet.log", "threads": 4}
 */
struct Settings {
  EngineOptions engine;
  TacetLogger::Level log_level = TacetLogger::INFO;
  std::string log_file;
  size_t threads = 0;   // 0 = one per hardware thread

  // Environment lookup, replaceable in tests
  using EnvLookup = std::function<const char*(const char* name)>;

  bool LoadFile(const std::string& path, std::string* error);
  bool ApplyJson(const nlohmann::json& j, std::string* error);
  bool ApplyEnvironment(std::string* error);
  bool ApplyEnvironment(const EnvLookup& lookup, std::string* error);

  // Cross-field checks (min <= max, non-zero limits)
  bool Validate(std::string* error) const;

  // Strict non-negative integer parsing ("12" ok, "12x", "-1", "" rejected)
  static bool ParseSize(const std::string& value, size_t* out);
};

}  // namespace Tacet

#endif  // TACET_SETTINGS_H_
