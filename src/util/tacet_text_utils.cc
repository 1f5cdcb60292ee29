#include "util/tacet_text_utils.h"

namespace TacetText {

std::string ToLowerAscii(const std::string& text) {
  std::string result = text;
  for (char& c : result) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return result;
}

bool IsAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsAsciiDigit(char c) { return c >= '0' && c <= '9'; }
bool IsAsciiUpper(char c) { return c >= 'A' && c <= 'Z'; }
bool IsAsciiLower(char c) { return c >= 'a' && c <= 'z'; }
bool IsAsciiAlpha(char c) { return IsAsciiUpper(c) || IsAsciiLower(c); }
bool IsAsciiAlnum(char c) { return IsAsciiAlpha(c) || IsAsciiDigit(c); }

bool IsSpaceOrEdge(const std::string& text, size_t pos) {
  return pos >= text.size() || IsAsciiSpace(text[pos]);
}

size_t Utf8CharCount(const std::string& text, size_t byte_offset) {
  if (byte_offset > text.size()) {
    byte_offset = text.size();
  }
  size_t count = 0;
  for (size_t i = 0; i < byte_offset; ++i) {
    // Continuation bytes are 10xxxxxx
    if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

size_t Utf8SequenceLength(const std::string& text, size_t pos) {
  unsigned char lead = static_cast<unsigned char>(text[pos]);
  size_t len = 1;
  if ((lead & 0xE0) == 0xC0) len = 2;
  else if ((lead & 0xF0) == 0xE0) len = 3;
  else if ((lead & 0xF8) == 0xF0) len = 4;
  if (pos + len > text.size()) {
    return 1;
  }
  return len;
}

std::string Trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && IsAsciiSpace(text[begin])) ++begin;
  while (end > begin && IsAsciiSpace(text[end - 1])) --end;
  return text.substr(begin, end - begin);
}

}  // namespace TacetText
