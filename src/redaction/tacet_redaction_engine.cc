#include "redaction/tacet_redaction_engine.h"
#include "redaction/tacet_audit.h"
#include "redaction/tacet_category_matcher.h"
#include "redaction/tacet_conflict_resolver.h"
#include "redaction/tacet_custom_patterns.h"
#include "redaction/tacet_transformer.h"
#include "util/logger.h"
#include "util/tacet_text_utils.h"
#include <algorithm>

namespace Tacet {

RedactionEngine::RedactionEngine() : options_() {
  // Build the shared vocabulary before the first call is served
  DomainVocabulary::BuiltIn();
}

RedactionEngine::RedactionEngine(const EngineOptions& options) : options_(options) {
  DomainVocabulary::BuiltIn();
}

RedactionOutcome RedactionEngine::Validate(const std::string& text,
                                           const RedactionConfig& config,
                                           ValidatedRequest* request) const {
  if (TacetText::Trim(text).empty()) {
    return RedactionOutcome::Failure(RedactionStatus::EMPTY_TEXT);
  }

  size_t length = TacetText::Utf8CharCount(text);
  if (length < options_.min_text_length) {
    return RedactionOutcome::Failure(
      RedactionStatus::TEXT_TOO_SHORT,
      "Text is too short: " + std::to_string(length) + " characters, minimum is " +
      std::to_string(options_.min_text_length));
  }
  if (length > options_.max_text_length) {
    return RedactionOutcome::Failure(
      RedactionStatus::TEXT_TOO_LONG,
      "Text is too long: " + std::to_string(length) + " characters, maximum is " +
      std::to_string(options_.max_text_length));
  }

  if (!ParseRedactionMode(config.mode, &request->mode)) {
    return RedactionOutcome::Failure(
      RedactionStatus::INVALID_MODE,
      "Unsupported redaction mode: '" + config.mode +
      "' (expected replace, mask, hash or remove)");
  }

  request->categories.clear();
  for (const auto& name : config.categories) {
    BuiltinCategory category;
    if (!ParseBuiltinCategory(name, &category)) {
      return RedactionOutcome::Failure(
        RedactionStatus::UNKNOWN_CATEGORY,
        "Unknown PII category: '" + name +
        "' (expected names, emails, phones, addresses or financial)");
    }
    if (std::find(request->categories.begin(), request->categories.end(), category) ==
        request->categories.end()) {
      request->categories.push_back(category);
    }
  }

  return RedactionOutcome::Success(RedactionResult());
}

RedactionOutcome RedactionEngine::Redact(const std::string& text,
                                         const RedactionConfig& config) const {
  // Validating
  ValidatedRequest request;
  RedactionOutcome validation = Validate(text, config, &request);
  if (!validation.success) {
    LOG_WARN("RedactionEngine", std::string("Rejected request: ") +
             RedactionStatusToCode(validation.status));
    return validation;
  }

  // Matching
  std::vector<Span> candidates = CategoryMatcher::FindCandidates(text, request.categories);
  CompiledPatternSet patterns = CustomPatternCompiler::Compile(config.custom_patterns);
  std::vector<Span> custom = CustomPatternCompiler::FindMatches(text, patterns);
  candidates.insert(candidates.end(),
                    std::make_move_iterator(custom.begin()),
                    std::make_move_iterator(custom.end()));

  // Filtering
  const DomainVocabulary* vocabulary =
    config.preserve_domain_terms ? &DomainVocabulary::BuiltIn() : nullptr;
  ProtectionFilter filter(text, vocabulary, config.whitelist, options_.context_window_tokens);
  std::vector<Span> spans = ConflictResolver::Resolve(std::move(candidates), filter);

  // Transforming
  std::vector<std::string> replacements = Transformer::RenderAll(spans, request.mode, patterns);
  RedactionResult result;
  result.redacted_text = Transformer::Apply(text, spans, replacements, request.mode);

  AuditContext context;
  context.mode = request.mode;
  context.categories = request.categories;
  context.preserve_domain_terms = config.preserve_domain_terms;
  context.whitelist_size = config.whitelist.size();
  result.metadata = AuditAssembler::Assemble(text, result.redacted_text, spans,
                                             replacements, patterns, context);

  LOG_DEBUG("RedactionEngine", std::string("mode=") + RedactionModeName(request.mode) +
            " categories=" + std::to_string(request.categories.size()) +
            " custom=" + std::to_string(patterns.accepted.size()) +
            " redacted=" + std::to_string(result.metadata.total_redacted) +
            " length=" + std::to_string(result.metadata.original_length) + "->" +
            std::to_string(result.metadata.redacted_length));

  return RedactionOutcome::Success(std::move(result));
}

}  // namespace Tacet
