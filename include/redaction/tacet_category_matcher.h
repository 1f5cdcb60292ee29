#ifndef TACET_CATEGORY_MATCHER_H_
#define TACET_CATEGORY_MATCHER_H_

#include <functional>
#include <regex>
#include <string>
#include <vector>

#include "redaction/tacet_category.h"

namespace Tacet {

/**
 * CategoryMatcher - finds raw redaction candidates per built-in category
 *
 * Every category has an independent detection rule:
 * - names:     2+ capitalized tokens, optional honorific, middle initials
 *              and generational/degree suffix
 * - emails:    local@domain with domain-shape validation
 * - phones:    10 national digits with -, ., space or (area) separators and
 *              an optional country-code prefix
 * - addresses: house number + street name + street type, optional unit,
 *              city, state and ZIP
 * - financial: grouped card numbers, Luhn-valid contiguous card numbers and
 *              8-17 digit account/routing numbers
 *
 * Within one category, matches never overlap: the leftmost match wins and
 * among equal starts the longest one wins. All methods are stateless and
 * safe to call from any number of threads.
 *
 * Usage:
 *   std::vector<Span> spans = CategoryMatcher::FindCandidates(
 *       text, {BuiltinCategory::NAMES, BuiltinCategory::EMAILS});
 */
class CategoryMatcher {
 public:
  /**
   * Run the detection rule of every requested category
   *
   * @param text Input text
   * @param categories Categories to detect (duplicates are ignored)
   * @return Candidates sorted by start offset; spans of different
   *         categories may overlap
   */
  static std::vector<Span> FindCandidates(const std::string& text,
                                          const std::vector<BuiltinCategory>& categories);

  // Per-category rules (also referenced from the category rule table)
  static std::vector<Span> MatchNames(const std::string& text);
  static std::vector<Span> MatchEmails(const std::string& text);
  static std::vector<Span> MatchPhones(const std::string& text);
  static std::vector<Span> MatchAddresses(const std::string& text);
  static std::vector<Span> MatchFinancial(const std::string& text);

  /**
   * Validate local-part and domain shape of an email candidate
   */
  static bool IsValidEmail(const std::string& email);

  /**
   * Luhn checksum over a digits-only string of 13-19 digits
   */
  static bool IsValidCreditCard(const std::string& digits);

  /**
   * Capitalized words that never count as name tokens
   * ("Contact", "Studio", "Street", "Monday", ...)
   */
  static bool IsNameStopWord(const std::string& word);

  /**
   * Drop self-overlapping spans, keeping leftmost then longest
   */
  static std::vector<Span> SelectLeftmostLongest(std::vector<Span> spans);

 private:
  using AcceptFn = std::function<bool(const std::string& text, size_t start, size_t end)>;

  /**
   * Collect all matches of a regex. A match rejected by |accept| does not
   * consume its text: scanning resumes one byte after the rejected start.
   */
  static void ScanRegex(const std::string& text, const std::regex& pattern,
                        BuiltinCategory category, const AcceptFn& accept,
                        std::vector<Span>* spans);

  /**
   * True when [start, end) is not glued to a longer digit structure
   * (adjacent alphanumerics, or "-"/"." that continue into more digits)
   */
  static bool HasNumericBoundary(const std::string& text, size_t start, size_t end);

  static Span MakeSpan(const std::string& text, size_t start, size_t end,
                       BuiltinCategory category);
};

}  // namespace Tacet

#endif  // TACET_CATEGORY_MATCHER_H_
