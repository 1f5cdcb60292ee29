#include "redaction/tacet_custom_patterns.h"
#include "util/logger.h"
#include <algorithm>
#include <iterator>
#include <set>

namespace Tacet {

const char kDefaultCustomReplacement[] = "[REDACTED]";

const CompiledPattern* CompiledPatternSet::Find(int index) const {
  if (index < 0 || static_cast<size_t>(index) >= accepted.size()) {
    return nullptr;
  }
  return &accepted[static_cast<size_t>(index)];
}

CompiledPatternSet CustomPatternCompiler::Compile(
    const std::vector<CustomPatternSpec>& definitions) {
  CompiledPatternSet result;
  std::set<std::string> seen_names;

  for (const auto& definition : definitions) {
    if (definition.name.empty()) {
      result.rejected.push_back({definition.name, "empty name"});
      LOG_WARN("CustomPatterns", "Skipping custom pattern with empty name");
      continue;
    }
    if (definition.pattern.empty()) {
      result.rejected.push_back({definition.name, "empty pattern"});
      LOG_WARN("CustomPatterns", "Skipping custom pattern '" + definition.name + "': empty pattern");
      continue;
    }
    // Counts are keyed by name, so a second entry with the same name
    // would silently merge into the first
    if (seen_names.count(definition.name)) {
      result.rejected.push_back({definition.name, "duplicate name"});
      LOG_WARN("CustomPatterns", "Skipping custom pattern '" + definition.name + "': duplicate name");
      continue;
    }

    CompiledPattern compiled;
    try {
      compiled.regex = std::regex(definition.pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      result.rejected.push_back({definition.name, std::string("invalid pattern: ") + e.what()});
      LOG_WARN("CustomPatterns", "Skipping custom pattern '" + definition.name +
               "': invalid pattern (" + e.what() + ")");
      continue;
    }

    compiled.name = definition.name;
    compiled.pattern = definition.pattern;
    compiled.replacement = definition.replacement.empty() ? kDefaultCustomReplacement
                                                    : definition.replacement;
    compiled.index = static_cast<int>(result.accepted.size());
    seen_names.insert(definition.name);
    result.accepted.push_back(std::move(compiled));
  }

  LOG_DEBUG("CustomPatterns", "Compiled " + std::to_string(result.accepted.size()) +
            " pattern(s), rejected " + std::to_string(result.rejected.size()));
  return result;
}

std::vector<MatchWindow> CustomPatternCompiler::SplitMatchWindows(const std::string& text) {
  std::vector<MatchWindow> windows;
  auto char_boundary = [&text](size_t pos, size_t floor) {
    while (pos > floor && pos < text.size() &&
           (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
      --pos;
    }
    return pos;
  };

  size_t begin = 0;
  while (begin < text.size()) {
    MatchWindow window;
    window.begin = begin;
    if (text.size() - begin <= kCustomMatchWindow) {
      window.end = text.size();
      window.owned_end = text.size();
    } else {
      window.end = char_boundary(begin + kCustomMatchWindow, begin + 1);
      window.owned_end = char_boundary(window.end - kCustomMatchOverlap, begin + 1);
    }
    windows.push_back(window);
    begin = window.owned_end;
  }

  return windows;
}

std::vector<Span> CustomPatternCompiler::FindMatches(const std::string& text,
                                                     const CompiledPatternSet& patterns) {
  std::vector<Span> spans;
  if (patterns.empty()) {
    return spans;
  }
  const std::vector<MatchWindow> windows = SplitMatchWindows(text);

  for (const auto& pattern : patterns.accepted) {
    std::vector<Span> found;
    size_t last_end = 0;
    try {
      for (const auto& window : windows) {
        // Resume where the previous window's last match ended, like a
        // single pass would
        size_t search_begin = std::max(window.begin, last_end);
        if (search_begin >= window.end) {
          continue;
        }

        // Anchors and \b treat the text outside the window as present
        std::regex_constants::match_flag_type flags = std::regex_constants::match_default;
        if (search_begin > 0) {
          flags |= std::regex_constants::match_prev_avail;
        }
        if (window.end < text.size()) {
          flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
        }

        auto begin = std::sregex_iterator(text.cbegin() + search_begin,
                                          text.cbegin() + window.end, pattern.regex, flags);
        auto end = std::sregex_iterator();

        for (auto it = begin; it != end; ++it) {
          const std::smatch& match = *it;
          size_t start = search_begin + static_cast<size_t>(match.position(0));
          if (start >= window.owned_end) {
            break;
          }
          if (match.length(0) == 0) {
            continue;
          }

          Span span;
          span.start = start;
          span.end = start + static_cast<size_t>(match.length(0));
          span.category = Category::Custom(pattern.name);
          span.matched_text = match.str(0);
          span.source = pattern.name;
          span.pattern_index = pattern.index;
          last_end = span.end;
          found.push_back(std::move(span));
        }
      }
    } catch (const std::regex_error& e) {
      // error_complexity on this input: the pattern contributes no matches
      LOG_WARN("CustomPatterns", "Custom pattern '" + pattern.name +
               "' aborted while matching (" + e.what() + ")");
      continue;
    }

    spans.insert(spans.end(),
                 std::make_move_iterator(found.begin()),
                 std::make_move_iterator(found.end()));
  }

  LOG_DEBUG("CustomPatterns", std::to_string(spans.size()) + " custom match(es) in " +
            std::to_string(windows.size()) + " window(s)");
  return spans;
}

}  // namespace Tacet
