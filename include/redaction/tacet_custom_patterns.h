#ifndef TACET_CUSTOM_PATTERNS_H_
#define TACET_CUSTOM_PATTERNS_H_

#include <regex>
#include <string>
#include <vector>

#include "redaction/tacet_category.h"

namespace Tacet {

// Replacement used when a custom pattern declares none
extern const char kDefaultCustomReplacement[];

// Largest slice of text a custom pattern is run over in one search.
// libstdc++'s std::regex recurses once per repetition and overflows the
// stack on long subjects instead of throwing error_stack.
constexpr size_t kCustomMatchWindow = 2048;

// Bytes shared by consecutive windows; matches up to this long are found
// exactly as in a single pass over the whole text
constexpr size_t kCustomMatchOverlap = 256;

/**
 * One slice of the text searched by the custom patterns. Matches that
 * start at or after |owned_end| belong to the next window.
 */
struct MatchWindow {
  size_t begin = 0;
  size_t end = 0;
  size_t owned_end = 0;
};

/**
 * Caller-supplied pattern entry, as decoded from the request
 */
struct CustomPatternSpec {
  std::string name;
  std::string pattern;
  std::string replacement;
};

/**
 * A custom pattern that passed validation
 */
struct CompiledPattern {
  std::string name;
  std::string pattern;
  std::string replacement;   // never empty after compilation
  int index = 0;             // declaration order among accepted patterns
  std::regex regex;
};

/**
 * An entry skipped by the compiler, with the reason it was skipped
 */
struct RejectedPattern {
  std::string name;
  std::string reason;
};

struct CompiledPatternSet {
  std::vector<CompiledPattern> accepted;
  std::vector<RejectedPattern> rejected;

  bool empty() const { return accepted.empty(); }

  // Accepted pattern with the given declaration index, or nullptr
  const CompiledPattern* Find(int index) const;
};

/**
 * CustomPatternCompiler - validates and compiles caller patterns
 *
 * A bad entry never fails the call: it is recorded in |rejected| and a
 * warning is logged (pattern name only, never the input text).
 */
class CustomPatternCompiler {
 public:
  static CompiledPatternSet Compile(const std::vector<CustomPatternSpec>& definitions);

  /**
   * All non-empty matches of every accepted pattern. Matches of one
   * pattern do not overlap each other; different patterns may overlap.
   * Text longer than kCustomMatchWindow is searched window by window.
   */
  static std::vector<Span> FindMatches(const std::string& text,
                                       const CompiledPatternSet& patterns);

  /**
   * Consecutive windows of at most kCustomMatchWindow bytes covering
   * |text|, each overlapping the next by kCustomMatchOverlap bytes.
   * Boundaries never split a UTF-8 sequence.
   */
  static std::vector<MatchWindow> SplitMatchWindows(const std::string& text);
};

}  // namespace Tacet

#endif  // TACET_CUSTOM_PATTERNS_H_
