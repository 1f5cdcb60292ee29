#ifndef TACET_JSON_CODEC_H_
#define TACET_JSON_CODEC_H_

#include <string>

#include <nlohmann/json.hpp>

#include "redaction/tacet_redaction_config.h"
#include "redaction/tacet_redaction_result.h"

namespace Tacet {

using json = nlohmann::json;

/**
 * A decoded redaction request
 */
struct RedactionRequest {
  std::string text;
  RedactionConfig config;
};

/**
 * JsonCodec - JSON wire format of the command-line front end
 *
 * Request (options may also be nested under "config"):
 *   {"text": "...", "mode": "mask", "categories": ["names", "emails"],
 *    "preserve_audio_terms": true,
 *    "custom_patterns": [{"name": "id", "pattern": "...", "replacement": "[ID]"}],
 *    "whitelist": ["Smith Recording Studio"]}
 *
 * Success:  {"success": true, "redacted_text": "...", "metadata": {...}}
 * Failure:  {"success": false, "error": {"kind": "validation_error",
 *                                        "code": "invalid_mode", "message": "..."}}
 */
class JsonCodec {
 public:
  /**
   * Decode a parsed request. Missing options keep their defaults; custom
   * pattern entries without "pattern" are dropped.
   *
   * @return false (with |error| set) when a field has the wrong JSON type
   */
  static bool DecodeRequest(const json& j, RedactionRequest* request, std::string* error);

  /**
   * Parse and decode one request document
   */
  static bool ParseRequest(const std::string& document, RedactionRequest* request,
                           std::string* error);

  static json EncodeOutcome(const RedactionOutcome& outcome);
  static json EncodeResult(const RedactionResult& result);
  static json EncodeMetadata(const RedactionMetadata& metadata);
  static json EncodeFailure(RedactionStatus status, const std::string& message);

 private:
  static bool DecodeOptions(const json& options, RedactionConfig* config, std::string* error);
  static bool DecodeStringList(const json& value, const char* field,
                               std::vector<std::string>* out, std::string* error);
};

}  // namespace Tacet

#endif  // TACET_JSON_CODEC_H_
