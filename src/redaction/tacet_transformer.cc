#include "redaction/tacet_transformer.h"
#include "util/tacet_text_utils.h"
#include <openssl/sha.h>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace Tacet {

using TacetText::IsAsciiDigit;
using TacetText::IsAsciiSpace;
using TacetText::Utf8SequenceLength;

std::vector<std::string> Transformer::RenderAll(const std::vector<Span>& spans,
                                                RedactionMode mode,
                                                const CompiledPatternSet& patterns) {
  std::vector<std::string> replacements;
  replacements.reserve(spans.size());
  for (const auto& span : spans) {
    replacements.push_back(Render(span, mode, patterns));
  }
  return replacements;
}

std::string Transformer::Render(const Span& span, RedactionMode mode,
                                const CompiledPatternSet& patterns) {
  if (mode == RedactionMode::REMOVE) {
    return "";
  }
  if (mode == RedactionMode::HASH) {
    return HashDigest(span.matched_text);
  }

  if (span.category.is_custom) {
    if (mode == RedactionMode::MASK) {
      return MaskAll(span.matched_text);
    }
    const CompiledPattern* pattern = patterns.Find(span.pattern_index);
    return pattern ? pattern->replacement : std::string(kDefaultCustomReplacement);
  }

  const CategoryRule& rule = GetCategoryRule(span.category.builtin);
  if (mode == RedactionMode::MASK) {
    return rule.mask(span.matched_text);
  }
  return rule.replace_token;
}

std::string Transformer::Apply(const std::string& text,
                               const std::vector<Span>& spans,
                               const std::vector<std::string>& replacements,
                               RedactionMode mode) {
  std::string result = text;

  // Right to left: text left of the current span still has original offsets
  for (size_t i = spans.size(); i-- > 0;) {
    const Span& span = spans[i];
    result.replace(span.start, span.Length(), replacements[i]);

    if (mode == RedactionMode::REMOVE) {
      size_t left_bound = i > 0 ? spans[i - 1].end : 0;
      CollapseJunction(&result, span.start, left_bound);
    }
  }

  return result;
}

void Transformer::CollapseJunction(std::string* text, size_t pos, size_t left_bound) {
  size_t left = pos;
  while (left > left_bound && IsAsciiSpace((*text)[left - 1])) {
    --left;
  }
  size_t right = pos;
  while (right < text->size() && IsAsciiSpace((*text)[right])) {
    ++right;
  }
  if (left == right) {
    return;
  }

  // Removal at either end of the text: drop the dangling whitespace
  if (left == 0 || right == text->size()) {
    text->erase(left, right - left);
    return;
  }

  if (right - left == 1) {
    return;
  }

  bool has_newline = text->find('\n', left) < right;
  text->replace(left, right - left, has_newline ? "\n" : " ");
}

std::string Transformer::MaskName(const std::string& matched_text) {
  std::string masked;
  masked.reserve(matched_text.size());
  bool token_start = true;

  for (size_t i = 0; i < matched_text.size();) {
    if (IsAsciiSpace(matched_text[i])) {
      masked += matched_text[i];
      token_start = true;
      ++i;
      continue;
    }
    size_t len = Utf8SequenceLength(matched_text, i);
    if (token_start) {
      masked.append(matched_text, i, len);
      token_start = false;
    } else {
      masked += '*';
    }
    i += len;
  }

  return masked;
}

std::string Transformer::MaskEmail(const std::string& matched_text) {
  size_t at = matched_text.find('@');
  if (at == std::string::npos || at == 0) {
    return MaskAll(matched_text);
  }

  // Reveal up to 2 characters, and never the whole local part
  size_t local_chars = TacetText::Utf8CharCount(matched_text, at);
  size_t keep = std::min<size_t>(2, local_chars - 1);

  std::string masked;
  size_t kept = 0;
  for (size_t i = 0; i < at;) {
    size_t len = Utf8SequenceLength(matched_text, i);
    if (kept < keep) {
      masked.append(matched_text, i, len);
      ++kept;
    } else {
      masked += '*';
    }
    i += len;
  }
  masked.append(matched_text, at, std::string::npos);
  return masked;
}

std::string Transformer::MaskPhone(const std::string& matched_text) {
  size_t digit_count = 0;
  for (char c : matched_text) {
    if (IsAsciiDigit(c)) ++digit_count;
  }
  size_t hidden = digit_count > 4 ? digit_count - 4 : 0;

  std::string masked = matched_text;
  size_t seen = 0;
  for (char& c : masked) {
    if (!IsAsciiDigit(c)) {
      continue;
    }
    if (seen < hidden) {
      c = '*';
    }
    ++seen;
  }
  return masked;
}

std::string Transformer::MaskAll(const std::string& matched_text) {
  std::string masked;
  masked.reserve(matched_text.size());
  for (size_t i = 0; i < matched_text.size();) {
    if (IsAsciiSpace(matched_text[i])) {
      masked += matched_text[i];
      ++i;
      continue;
    }
    masked += '*';
    i += Utf8SequenceLength(matched_text, i);
  }
  return masked;
}

std::string Transformer::HashDigest(const std::string& matched_text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  ::SHA256(reinterpret_cast<const unsigned char*>(matched_text.data()),
           matched_text.size(), digest);

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (int i = 0; i < 4; ++i) {
    oss << std::setw(2) << static_cast<int>(digest[i]);
  }
  return oss.str();
}

}  // namespace Tacet
