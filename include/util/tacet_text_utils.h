#ifndef TACET_TEXT_UTILS_H_
#define TACET_TEXT_UTILS_H_

#include <cstddef>
#include <string>

namespace TacetText {

// ASCII-only case folding. Multi-byte UTF-8 sequences pass through untouched,
// so byte offsets are identical between a string and its folded copy.
std::string ToLowerAscii(const std::string& text);

bool IsAsciiSpace(char c);
bool IsAsciiDigit(char c);
bool IsAsciiAlpha(char c);
bool IsAsciiAlnum(char c);
bool IsAsciiUpper(char c);
bool IsAsciiLower(char c);

// True for whitespace or nothing (string edges)
bool IsSpaceOrEdge(const std::string& text, size_t pos);

// Number of UTF-8 code points in text[0, byte_offset)
size_t Utf8CharCount(const std::string& text, size_t byte_offset);
inline size_t Utf8CharCount(const std::string& text) {
  return Utf8CharCount(text, text.size());
}

// Byte length of the code point starting at text[pos] (1 for invalid lead bytes)
size_t Utf8SequenceLength(const std::string& text, size_t pos);

// Strip leading/trailing ASCII whitespace
std::string Trim(const std::string& text);

}  // namespace TacetText

#endif  // TACET_TEXT_UTILS_H_
