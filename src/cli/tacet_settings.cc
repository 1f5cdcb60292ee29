#include "cli/tacet_settings.h"
#include "util/tacet_text_utils.h"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Tacet {

using json = nlohmann::json;

bool Settings::ParseSize(const std::string& value, size_t* out) {
  std::string trimmed = TacetText::Trim(value);
  if (trimmed.empty()) {
    return false;
  }
  for (char c : trimmed) {
    if (!TacetText::IsAsciiDigit(c)) {
      return false;
    }
  }
  errno = 0;
  unsigned long long parsed = std::strtoull(trimmed.c_str(), nullptr, 10);
  if (errno == ERANGE) {
    return false;
  }
  *out = static_cast<size_t>(parsed);
  return true;
}

bool Settings::LoadFile(const std::string& path, std::string* error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    *error = "Cannot open config file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  json j;
  try {
    j = json::parse(buffer.str());
  } catch (const json::parse_error& e) {
    *error = "Invalid config file " + path + ": " + e.what();
    return false;
  }

  if (!ApplyJson(j, error)) {
    *error = path + ": " + *error;
    return false;
  }
  LOG_DEBUG("Settings", "Loaded config file " + path);
  return true;
}

bool Settings::ApplyJson(const json& j, std::string* error) {
  if (!j.is_object()) {
    *error = "config must be a JSON object";
    return false;
  }

  struct SizeField {
    const char* key;
    size_t* target;
  };
  const SizeField size_fields[] = {
    {"min_text_length", &engine.min_text_length},
    {"max_text_length", &engine.max_text_length},
    {"context_window", &engine.context_window_tokens},
    {"threads", &threads},
  };

  for (const auto& field : size_fields) {
    if (!j.contains(field.key)) {
      continue;
    }
    const json& value = j[field.key];
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<long long>() >= 0)) {
      *error = std::string("'") + field.key + "' must be a non-negative integer";
      return false;
    }
    *field.target = value.get<size_t>();
  }

  if (j.contains("log_level")) {
    if (!j["log_level"].is_string() ||
        !TacetLogger::Logger::ParseLevel(j["log_level"].get<std::string>(), &log_level)) {
      *error = "'log_level' must be one of debug, info, warn, error";
      return false;
    }
  }

  if (j.contains("log_file")) {
    if (!j["log_file"].is_string()) {
      *error = "'log_file' must be a string";
      return false;
    }
    log_file = j["log_file"].get<std::string>();
  }

  return true;
}

bool Settings::ApplyEnvironment(std::string* error) {
  return ApplyEnvironment([](const char* name) { return std::getenv(name); }, error);
}

bool Settings::ApplyEnvironment(const EnvLookup& lookup, std::string* error) {
  if (const char* level = lookup("TACET_LOG_LEVEL")) {
    if (!TacetLogger::Logger::ParseLevel(level, &log_level)) {
      *error = std::string("TACET_LOG_LEVEL: unknown level '") + level + "'";
      return false;
    }
  }

  if (const char* file = lookup("TACET_LOG_FILE")) {
    log_file = file;
  }

  struct SizeVar {
    const char* name;
    size_t* target;
  };
  const SizeVar size_vars[] = {
    {"TACET_MIN_TEXT_LENGTH", &engine.min_text_length},
    {"TACET_MAX_TEXT_LENGTH", &engine.max_text_length},
    {"TACET_CONTEXT_WINDOW", &engine.context_window_tokens},
  };

  for (const auto& var : size_vars) {
    const char* value = lookup(var.name);
    if (!value) {
      continue;
    }
    if (!ParseSize(value, var.target)) {
      *error = std::string(var.name) + ": expected a non-negative integer, got '" + value + "'";
      return false;
    }
  }

  return true;
}

bool Settings::Validate(std::string* error) const {
  if (engine.min_text_length == 0) {
    *error = "min_text_length must be at least 1";
    return false;
  }
  if (engine.max_text_length < engine.min_text_length) {
    *error = "max_text_length (" + std::to_string(engine.max_text_length) +
             ") is below min_text_length (" + std::to_string(engine.min_text_length) + ")";
    return false;
  }
  return true;
}

}  // namespace Tacet
