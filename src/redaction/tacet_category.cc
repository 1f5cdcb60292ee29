#include "redaction/tacet_category.h"
#include "redaction/tacet_category_matcher.h"
#include "redaction/tacet_transformer.h"
#include "util/tacet_text_utils.h"

namespace Tacet {

namespace {

const CategoryRule kCategoryRules[] = {
  {BuiltinCategory::NAMES, "names", "[NAME]",
   &CategoryMatcher::MatchNames, &Transformer::MaskName},
  {BuiltinCategory::EMAILS, "emails", "[EMAIL]",
   &CategoryMatcher::MatchEmails, &Transformer::MaskEmail},
  {BuiltinCategory::PHONES, "phones", "[PHONE]",
   &CategoryMatcher::MatchPhones, &Transformer::MaskPhone},
  {BuiltinCategory::ADDRESSES, "addresses", "[ADDRESS]",
   &CategoryMatcher::MatchAddresses, &Transformer::MaskAll},
  {BuiltinCategory::FINANCIAL, "financial", "[FINANCIAL]",
   &CategoryMatcher::MatchFinancial, &Transformer::MaskPhone},
};

}  // namespace

Category Category::Builtin(BuiltinCategory category) {
  Category c;
  c.is_custom = false;
  c.builtin = category;
  return c;
}

Category Category::Custom(const std::string& name) {
  Category c;
  c.is_custom = true;
  c.custom_name = name;
  return c;
}

std::string Category::Key() const {
  if (is_custom) {
    return "custom:" + custom_name;
  }
  return BuiltinCategoryName(builtin);
}

bool Category::operator==(const Category& other) const {
  if (is_custom != other.is_custom) {
    return false;
  }
  return is_custom ? custom_name == other.custom_name : builtin == other.builtin;
}

bool Category::operator<(const Category& other) const {
  // Built-ins sort before custom patterns
  if (is_custom != other.is_custom) {
    return !is_custom;
  }
  if (is_custom) {
    return custom_name < other.custom_name;
  }
  return static_cast<int>(builtin) < static_cast<int>(other.builtin);
}

const CategoryRule& GetCategoryRule(BuiltinCategory category) {
  return kCategoryRules[static_cast<int>(category)];
}

const std::vector<BuiltinCategory>& AllBuiltinCategories() {
  static const std::vector<BuiltinCategory> all = {
    BuiltinCategory::NAMES,
    BuiltinCategory::EMAILS,
    BuiltinCategory::PHONES,
    BuiltinCategory::ADDRESSES,
    BuiltinCategory::FINANCIAL
  };
  return all;
}

const char* BuiltinCategoryName(BuiltinCategory category) {
  return GetCategoryRule(category).name;
}

bool ParseBuiltinCategory(const std::string& name, BuiltinCategory* category) {
  std::string lower = TacetText::ToLowerAscii(TacetText::Trim(name));
  if (lower == "names" || lower == "name") {
    *category = BuiltinCategory::NAMES;
  } else if (lower == "emails" || lower == "email") {
    *category = BuiltinCategory::EMAILS;
  } else if (lower == "phones" || lower == "phone") {
    *category = BuiltinCategory::PHONES;
  } else if (lower == "addresses" || lower == "address") {
    *category = BuiltinCategory::ADDRESSES;
  } else if (lower == "financial") {
    *category = BuiltinCategory::FINANCIAL;
  } else {
    return false;
  }
  return true;
}

const char* RedactionModeName(RedactionMode mode) {
  switch (mode) {
    case RedactionMode::REPLACE: return "replace";
    case RedactionMode::MASK: return "mask";
    case RedactionMode::HASH: return "hash";
    case RedactionMode::REMOVE: return "remove";
  }
  return "replace";
}

bool ParseRedactionMode(const std::string& name, RedactionMode* mode) {
  std::string lower = TacetText::ToLowerAscii(TacetText::Trim(name));
  if (lower == "replace") {
    *mode = RedactionMode::REPLACE;
  } else if (lower == "mask") {
    *mode = RedactionMode::MASK;
  } else if (lower == "hash") {
    *mode = RedactionMode::HASH;
  } else if (lower == "remove") {
    *mode = RedactionMode::REMOVE;
  } else {
    return false;
  }
  return true;
}

}  // namespace Tacet
