#ifndef TACET_DOMAIN_VOCABULARY_H_
#define TACET_DOMAIN_VOCABULARY_H_

#include <string>
#include <vector>

#include "redaction/tacet_category.h"

namespace Tacet {

// Default number of whitespace-delimited tokens examined on each side of a
// candidate when looking for a protected phrase around it
constexpr size_t kDefaultContextWindowTokens = 3;

/**
 * DomainVocabulary - built-in protected audio terms
 *
 * Equipment, brand and studio names that look like names or numbers to the
 * category rules ("Neumann U87", "Pro Tools", "SSL console", "1176").
 * Stored lowercase and sorted; built once on first use and never modified,
 * so concurrent readers need no locking.
 */
class DomainVocabulary {
 public:
  static const DomainVocabulary& BuiltIn();

  const std::vector<std::string>& Terms() const { return terms_; }
  size_t Size() const { return terms_.size(); }

  // Exact, case-insensitive lookup
  bool Contains(const std::string& term) const;

 private:
  DomainVocabulary();

  std::vector<std::string> terms_;
};

/**
 * ProtectionFilter - decides whether a candidate span must be kept verbatim
 *
 * A candidate is protected when its text (case-insensitive)
 * 1. equals or is contained in a protected term, or
 * 2. is overlapped by an occurrence of a protected term found within the
 *    surrounding window of |context_window_tokens| tokens on each side
 *    ("Smith" inside "Smith Recording Studio").
 *
 * Built-in terms only count at token boundaries; whitelist entries count
 * anywhere. Pass a null vocabulary to disable built-in protection.
 */
class ProtectionFilter {
 public:
  ProtectionFilter(const std::string& text,
                   const DomainVocabulary* vocabulary,
                   const std::vector<std::string>& whitelist,
                   size_t context_window_tokens = kDefaultContextWindowTokens);

  bool IsProtected(const Span& candidate) const;

  // Whether any protection source is active at all
  bool Empty() const;

 private:
  // Byte range of the candidate widened by the token window
  void ContextWindow(const Span& candidate, size_t* begin, size_t* end) const;

  bool OverlappedByTerm(const std::string& term, bool token_bounded,
                        const Span& candidate, size_t begin, size_t end) const;

  bool IsTermBoundaryBefore(size_t pos) const;
  bool IsTermBoundaryAfter(size_t pos) const;

  const std::string& text_;
  std::string lower_text_;
  const DomainVocabulary* vocabulary_;
  std::vector<std::string> whitelist_;   // lowercase, no empty entries
  size_t context_window_tokens_;
};

}  // namespace Tacet

#endif  // TACET_DOMAIN_VOCABULARY_H_
