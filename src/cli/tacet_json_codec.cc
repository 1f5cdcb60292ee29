#include "cli/tacet_json_codec.h"
#include "util/logger.h"

namespace Tacet {

bool JsonCodec::DecodeStringList(const json& value, const char* field,
                                 std::vector<std::string>* out, std::string* error) {
  if (!value.is_array()) {
    *error = std::string("'") + field + "' must be an array of strings";
    return false;
  }
  out->clear();
  for (const auto& item : value) {
    if (!item.is_string()) {
      *error = std::string("'") + field + "' must contain only strings";
      return false;
    }
    out->push_back(item.get<std::string>());
  }
  return true;
}

bool JsonCodec::DecodeOptions(const json& options, RedactionConfig* config, std::string* error) {
  if (options.contains("mode") && !options["mode"].is_null()) {
    if (!options["mode"].is_string()) {
      *error = "'mode' must be a string";
      return false;
    }
    config->mode = options["mode"].get<std::string>();
  }

  if (options.contains("categories") && !options["categories"].is_null()) {
    if (!DecodeStringList(options["categories"], "categories", &config->categories, error)) {
      return false;
    }
  }

  if (options.contains("preserve_audio_terms") && !options["preserve_audio_terms"].is_null()) {
    if (!options["preserve_audio_terms"].is_boolean()) {
      *error = "'preserve_audio_terms' must be a boolean";
      return false;
    }
    config->preserve_domain_terms = options["preserve_audio_terms"].get<bool>();
  }

  if (options.contains("custom_patterns") && !options["custom_patterns"].is_null()) {
    const json& patterns = options["custom_patterns"];
    if (!patterns.is_array()) {
      *error = "'custom_patterns' must be an array of objects";
      return false;
    }
    config->custom_patterns.clear();
    for (const auto& entry : patterns) {
      if (!entry.is_object()) {
        *error = "'custom_patterns' entries must be objects";
        return false;
      }
      // Entries without a pattern are dropped
      if (!entry.contains("pattern") || entry["pattern"].is_null()) {
        continue;
      }

      CustomPatternSpec definition;
      for (const char* key : {"name", "pattern", "replacement"}) {
        if (!entry.contains(key) || entry[key].is_null()) {
          continue;
        }
        if (!entry[key].is_string()) {
          *error = std::string("custom pattern '") + key + "' must be a string";
          return false;
        }
      }
      if (entry.contains("name") && entry["name"].is_string()) {
        definition.name = entry["name"].get<std::string>();
      }
      definition.pattern = entry["pattern"].get<std::string>();
      if (entry.contains("replacement") && entry["replacement"].is_string()) {
        definition.replacement = entry["replacement"].get<std::string>();
      }
      config->custom_patterns.push_back(definition);
    }
  }

  if (options.contains("whitelist") && !options["whitelist"].is_null()) {
    if (!DecodeStringList(options["whitelist"], "whitelist", &config->whitelist, error)) {
      return false;
    }
  }

  return true;
}

bool JsonCodec::DecodeRequest(const json& j, RedactionRequest* request, std::string* error) {
  if (!j.is_object()) {
    *error = "Request must be a JSON object";
    return false;
  }

  if (j.contains("text") && !j["text"].is_null()) {
    if (!j["text"].is_string()) {
      *error = "'text' must be a string";
      return false;
    }
    request->text = j["text"].get<std::string>();
  }

  if (j.contains("config") && !j["config"].is_null()) {
    if (!j["config"].is_object()) {
      *error = "'config' must be an object";
      return false;
    }
    return DecodeOptions(j["config"], &request->config, error);
  }

  return DecodeOptions(j, &request->config, error);
}

bool JsonCodec::ParseRequest(const std::string& document, RedactionRequest* request,
                             std::string* error) {
  json j;
  try {
    j = json::parse(document);
  } catch (const json::parse_error& e) {
    *error = std::string("Invalid JSON: ") + e.what();
    LOG_DEBUG("JsonCodec", *error);
    return false;
  }
  return DecodeRequest(j, request, error);
}

json JsonCodec::EncodeMetadata(const RedactionMetadata& metadata) {
  json instances = json::array();
  for (const auto& instance : metadata.detected_instances) {
    instances.push_back({
      {"category", instance.category},
      {"matched_text", instance.matched_text},
      {"position", instance.position},
      {"replacement", instance.replacement}
    });
  }

  json rejected = json::array();
  for (const auto& pattern : metadata.rejected_custom_patterns) {
    rejected.push_back({{"name", pattern.name}, {"reason", pattern.reason}});
  }

  json counts = json::object();
  for (const auto& entry : metadata.counts_by_category) {
    counts[entry.first] = entry.second;
  }

  return {
    {"redaction_mode", RedactionModeName(metadata.mode)},
    {"categories_processed", metadata.categories_processed},
    {"preserve_audio_terms", metadata.preserve_domain_terms},
    {"custom_patterns_count", metadata.custom_pattern_count},
    {"whitelist_size", metadata.whitelist_size},
    {"redaction_counts", counts},
    {"total_instances_redacted", metadata.total_redacted},
    {"detected_pii_instances", instances},
    {"original_length", metadata.original_length},
    {"redacted_length", metadata.redacted_length},
    {"processing_timestamp", metadata.timestamp},
    {"rejected_custom_patterns", rejected}
  };
}

json JsonCodec::EncodeResult(const RedactionResult& result) {
  return {
    {"success", true},
    {"redacted_text", result.redacted_text},
    {"metadata", EncodeMetadata(result.metadata)}
  };
}

json JsonCodec::EncodeFailure(RedactionStatus status, const std::string& message) {
  return {
    {"success", false},
    {"error", {
      {"kind", RedactionStatusToKind(status)},
      {"code", RedactionStatusToCode(status)},
      {"message", message.empty() ? RedactionStatusToMessage(status) : message}
    }}
  };
}

json JsonCodec::EncodeOutcome(const RedactionOutcome& outcome) {
  if (outcome.success) {
    return EncodeResult(outcome.result);
  }
  return EncodeFailure(outcome.status, outcome.message);
}

}  // namespace Tacet
