#ifndef TACET_AUDIT_H_
#define TACET_AUDIT_H_

#include <string>
#include <vector>

#include "redaction/tacet_category.h"
#include "redaction/tacet_custom_patterns.h"
#include "redaction/tacet_redaction_result.h"

namespace Tacet {

/**
 * Call-level facts the audit trail records next to the spans
 */
struct AuditContext {
  RedactionMode mode = RedactionMode::REPLACE;
  std::vector<BuiltinCategory> categories;   // normalized, deduplicated
  bool preserve_domain_terms = true;
  size_t whitelist_size = 0;
};

/**
 * AuditAssembler - builds the metadata of one redaction call
 *
 * Every requested category and every accepted custom pattern gets a count
 * entry, zero included, so that
 *   sum(counts_by_category) == total_redacted == detected_instances.size()
 */
class AuditAssembler {
 public:
  static RedactionMetadata Assemble(const std::string& original_text,
                                    const std::string& redacted_text,
                                    const std::vector<Span>& spans,
                                    const std::vector<std::string>& replacements,
                                    const CompiledPatternSet& patterns,
                                    const AuditContext& context);

  // Current time as "YYYY-MM-DDTHH:MM:SSZ"
  static std::string CurrentTimestamp();
};

}  // namespace Tacet

#endif  // TACET_AUDIT_H_
