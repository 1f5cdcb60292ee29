#ifndef TACET_TRANSFORMER_H_
#define TACET_TRANSFORMER_H_

#include <string>
#include <vector>

#include "redaction/tacet_category.h"
#include "redaction/tacet_custom_patterns.h"

namespace Tacet {

/**
 * Transformer - renders replacements and rewrites text
 *
 * Mode semantics:
 * - replace: fixed token per built-in category ([NAME], [EMAIL], ...),
 *            custom patterns use their declared replacement
 * - mask:    shape-preserving partial reveal, per category
 * - hash:    8 lowercase hex chars from SHA-256 of the matched text
 * - remove:  empty replacement; whitespace meeting at the junction is
 *            collapsed to one space (one newline if the run had a newline)
 *
 * Spans passed to Apply() must be sorted and non-overlapping (the
 * ConflictResolver output). The mode is already validated by the engine.
 */
class Transformer {
 public:
  /**
   * Render the replacement of every span, in span order
   */
  static std::vector<std::string> RenderAll(const std::vector<Span>& spans,
                                            RedactionMode mode,
                                            const CompiledPatternSet& patterns);

  static std::string Render(const Span& span, RedactionMode mode,
                            const CompiledPatternSet& patterns);

  /**
   * Splice |replacements| into |text| right to left
   */
  static std::string Apply(const std::string& text,
                           const std::vector<Span>& spans,
                           const std::vector<std::string>& replacements,
                           RedactionMode mode);

  // Mask renderers
  // "John Smith" -> "J*** S****"
  static std::string MaskName(const std::string& matched_text);
  // "john.smith@email.com" -> "jo********@email.com"
  static std::string MaskEmail(const std::string& matched_text);
  // "555-123-4567" -> "***-***-4567"
  static std::string MaskPhone(const std::string& matched_text);
  // Every non-whitespace character -> "*"
  static std::string MaskAll(const std::string& matched_text);

  /**
   * Leading 4 bytes of SHA-256(matched_text) as 8 lowercase hex chars
   */
  static std::string HashDigest(const std::string& matched_text);

 private:
  // Collapse the whitespace run around |pos| in |text| after a removal.
  // |left_bound| keeps the collapse from reaching into an earlier span.
  static void CollapseJunction(std::string* text, size_t pos, size_t left_bound);
};

}  // namespace Tacet

#endif  // TACET_TRANSFORMER_H_
