#include "redaction/tacet_audit.h"
#include "util/tacet_text_utils.h"
#include <ctime>

namespace Tacet {

RedactionMetadata AuditAssembler::Assemble(const std::string& original_text,
                                           const std::string& redacted_text,
                                           const std::vector<Span>& spans,
                                           const std::vector<std::string>& replacements,
                                           const CompiledPatternSet& patterns,
                                           const AuditContext& context) {
  RedactionMetadata metadata;
  metadata.mode = context.mode;
  metadata.preserve_domain_terms = context.preserve_domain_terms;
  metadata.whitelist_size = context.whitelist_size;
  metadata.custom_pattern_count = patterns.accepted.size();
  metadata.rejected_custom_patterns = patterns.rejected;

  for (BuiltinCategory category : context.categories) {
    metadata.categories_processed.push_back(BuiltinCategoryName(category));
    metadata.counts_by_category[BuiltinCategoryName(category)] = 0;
  }
  for (const auto& pattern : patterns.accepted) {
    metadata.counts_by_category[Category::Custom(pattern.name).Key()] = 0;
  }

  // Spans are sorted, so character positions can be accumulated in one pass
  size_t byte_cursor = 0;
  size_t char_cursor = 0;

  for (size_t i = 0; i < spans.size(); ++i) {
    const Span& span = spans[i];
    char_cursor += TacetText::Utf8CharCount(original_text.substr(byte_cursor, span.start - byte_cursor));
    byte_cursor = span.start;

    DetectedInstance instance;
    instance.category = span.category.Key();
    instance.matched_text = span.matched_text;
    instance.position = char_cursor;
    instance.replacement = i < replacements.size() ? replacements[i] : std::string();

    metadata.counts_by_category[instance.category]++;
    metadata.detected_instances.push_back(std::move(instance));
  }

  metadata.total_redacted = metadata.detected_instances.size();
  metadata.original_length = TacetText::Utf8CharCount(original_text);
  metadata.redacted_length = TacetText::Utf8CharCount(redacted_text);
  metadata.timestamp = CurrentTimestamp();
  return metadata;
}

std::string AuditAssembler::CurrentTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm utc;
  gmtime_r(&now, &utc);

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

}  // namespace Tacet
