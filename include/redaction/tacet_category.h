#ifndef TACET_CATEGORY_H_
#define TACET_CATEGORY_H_

#include <cstddef>
#include <string>
#include <vector>

namespace Tacet {

/**
 * Built-in PII categories. Declaration order is also the tie-break order
 * when two built-in detectors claim exactly the same span.
 */
enum class BuiltinCategory {
  NAMES,
  EMAILS,
  PHONES,
  ADDRESSES,
  FINANCIAL
};

/**
 * Supported rewrite strategies
 */
enum class RedactionMode {
  REPLACE,
  MASK,
  HASH,
  REMOVE
};

/**
 * Category tag: one of the built-ins, or a caller-supplied custom pattern
 * identified by its declared name.
 */
struct Category {
  bool is_custom = false;
  BuiltinCategory builtin = BuiltinCategory::NAMES;
  std::string custom_name;

  static Category Builtin(BuiltinCategory category);
  static Category Custom(const std::string& name);

  // Metadata key: "names", "emails", ... or "custom:<name>"
  std::string Key() const;

  bool operator==(const Category& other) const;
  bool operator!=(const Category& other) const { return !(*this == other); }
  bool operator<(const Category& other) const;
};

/**
 * A redaction candidate: half-open byte range [start, end) into the
 * original text.
 */
struct Span {
  size_t start = 0;
  size_t end = 0;
  Category category;
  std::string matched_text;
  std::string source;       // built-in category name or custom pattern name
  int pattern_index = -1;   // declaration index for custom patterns

  size_t Length() const { return end - start; }
  bool Overlaps(const Span& other) const {
    return start < other.end && other.start < end;
  }
};

/**
 * Per-category behaviour as data: one detection rule plus the fixed
 * replace token and the mask renderer. Hash and remove are uniform
 * across categories and live in the transformer.
 */
struct CategoryRule {
  BuiltinCategory category;
  const char* name;
  const char* replace_token;
  std::vector<Span> (*match)(const std::string& text);
  std::string (*mask)(const std::string& matched_text);
};

/**
 * Look up the rule table entry for a built-in category
 */
const CategoryRule& GetCategoryRule(BuiltinCategory category);

/**
 * All built-in categories in tie-break order
 */
const std::vector<BuiltinCategory>& AllBuiltinCategories();

const char* BuiltinCategoryName(BuiltinCategory category);

/**
 * Parse a category name (case-insensitive). Accepts the plural names
 * ("names", "emails", "phones", "addresses", "financial") and the singular
 * aliases ("name", "email", "phone", "address").
 */
bool ParseBuiltinCategory(const std::string& name, BuiltinCategory* category);

const char* RedactionModeName(RedactionMode mode);

/**
 * Parse "replace" / "mask" / "hash" / "remove" (case-insensitive)
 */
bool ParseRedactionMode(const std::string& name, RedactionMode* mode);

}  // namespace Tacet

#endif  // TACET_CATEGORY_H_
