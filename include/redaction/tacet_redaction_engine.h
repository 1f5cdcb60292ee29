#ifndef TACET_REDACTION_ENGINE_H_
#define TACET_REDACTION_ENGINE_H_

#include <string>
#include <vector>

#include "redaction/tacet_category.h"
#include "redaction/tacet_domain_vocabulary.h"
#include "redaction/tacet_redaction_config.h"
#include "redaction/tacet_redaction_result.h"

namespace Tacet {

/**
 * Process-level limits of the engine (see Settings for where they come from)
 */
struct EngineOptions {
  size_t min_text_length = 10;        // characters
  size_t max_text_length = 20000;     // characters
  size_t context_window_tokens = kDefaultContextWindowTokens;
};

/**
 * RedactionEngine - validates a request and drives the redaction pipeline
 *
 *   Validating -> Matching -> Filtering -> Transforming -> Done
 *
 * Failed is reachable from Validating only: a call either returns a full
 * result or a typed failure before any text is produced.
 *
 * The engine is immutable after construction and Redact() keeps all state
 * on the stack, so one instance can serve any number of threads.
 *
 * Usage:
 *   Tacet::RedactionEngine engine;
 *   Tacet::RedactionConfig config;
 *   config.mode = "mask";
 *   Tacet::RedactionOutcome outcome = engine.Redact(text, config);
 *   if (outcome.success) {
 *     std::cout << outcome.result.redacted_text;
 *   }
 */
class RedactionEngine {
 public:
  RedactionEngine();
  explicit RedactionEngine(const EngineOptions& options);

  RedactionOutcome Redact(const std::string& text, const RedactionConfig& config) const;

  const EngineOptions& options() const { return options_; }

 private:
  // Normalized form of the caller's mode and categories
  struct ValidatedRequest {
    RedactionMode mode = RedactionMode::REPLACE;
    std::vector<BuiltinCategory> categories;
  };

  RedactionOutcome Validate(const std::string& text, const RedactionConfig& config,
                            ValidatedRequest* request) const;

  EngineOptions options_;
};

}  // namespace Tacet

#endif  // TACET_REDACTION_ENGINE_H_
