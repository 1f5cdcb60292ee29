#ifndef TACET_REDACTION_RESULT_H_
#define TACET_REDACTION_RESULT_H_

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "redaction/tacet_category.h"
#include "redaction/tacet_custom_patterns.h"

namespace Tacet {

// Redaction status codes. Everything except OK is a validation failure
// raised before any text is produced.
enum class RedactionStatus {
  OK,                 // Redaction completed

  // Validation errors
  EMPTY_TEXT,         // Text is empty or whitespace only
  TEXT_TOO_SHORT,     // Fewer characters than the configured minimum
  TEXT_TOO_LONG,      // More characters than the configured maximum
  INVALID_MODE,       // Mode is not replace / mask / hash / remove
  UNKNOWN_CATEGORY,   // A category name is not recognized
  MALFORMED_CONFIG    // Request fields have the wrong shape or type
};

// Convert RedactionStatus to string code
inline const char* RedactionStatusToCode(RedactionStatus status) {
  switch (status) {
    case RedactionStatus::OK: return "ok";
    case RedactionStatus::EMPTY_TEXT: return "empty_text";
    case RedactionStatus::TEXT_TOO_SHORT: return "text_too_short";
    case RedactionStatus::TEXT_TOO_LONG: return "text_too_long";
    case RedactionStatus::INVALID_MODE: return "invalid_mode";
    case RedactionStatus::UNKNOWN_CATEGORY: return "unknown_category";
    case RedactionStatus::MALFORMED_CONFIG: return "malformed_config";
  }
  return "unknown";
}

// Human-readable message for RedactionStatus
inline const char* RedactionStatusToMessage(RedactionStatus status) {
  switch (status) {
    case RedactionStatus::OK: return "Redaction completed successfully";
    case RedactionStatus::EMPTY_TEXT: return "Text must not be empty";
    case RedactionStatus::TEXT_TOO_SHORT: return "Text is too short";
    case RedactionStatus::TEXT_TOO_LONG: return "Text is too long";
    case RedactionStatus::INVALID_MODE: return "Unsupported redaction mode";
    case RedactionStatus::UNKNOWN_CATEGORY: return "Unknown PII category";
    case RedactionStatus::MALFORMED_CONFIG: return "Malformed redaction config";
  }
  return "Unknown error";
}

// Error kind reported alongside the code
inline const char* RedactionStatusToKind(RedactionStatus status) {
  return status == RedactionStatus::OK ? "ok" : "validation_error";
}

// One redacted span, positioned against the original text
struct DetectedInstance {
  std::string category;       // "names", ..., or "custom:<name>"
  std::string matched_text;
  size_t position = 0;        // character offset in the original text
  std::string replacement;
};

struct RedactionMetadata {
  RedactionMode mode = RedactionMode::REPLACE;
  std::vector<std::string> categories_processed;
  bool preserve_domain_terms = true;
  size_t custom_pattern_count = 0;
  size_t whitelist_size = 0;
  std::map<std::string, size_t> counts_by_category;
  size_t total_redacted = 0;
  std::vector<DetectedInstance> detected_instances;
  size_t original_length = 0;   // characters
  size_t redacted_length = 0;   // characters
  std::string timestamp;        // ISO-8601, UTC
  std::vector<RejectedPattern> rejected_custom_patterns;
};

struct RedactionResult {
  std::string redacted_text;
  RedactionMetadata metadata;
};

// Outcome of one engine call: a full result, or a typed failure with no text
struct RedactionOutcome {
  bool success;
  RedactionStatus status;
  std::string message;
  RedactionResult result;     // only meaningful when success is true

  RedactionOutcome() : success(false), status(RedactionStatus::MALFORMED_CONFIG) {}

  static RedactionOutcome Success(RedactionResult result) {
    RedactionOutcome r;
    r.success = true;
    r.status = RedactionStatus::OK;
    r.message = RedactionStatusToMessage(RedactionStatus::OK);
    r.result = std::move(result);
    return r;
  }

  static RedactionOutcome Failure(RedactionStatus status, const std::string& msg = "") {
    RedactionOutcome r;
    r.success = false;
    r.status = status;
    r.message = msg.empty() ? RedactionStatusToMessage(status) : msg;
    return r;
  }
};

}  // namespace Tacet

#endif  // TACET_REDACTION_RESULT_H_
