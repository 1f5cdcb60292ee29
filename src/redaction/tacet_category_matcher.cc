#include "redaction/tacet_category_matcher.h"
#include "util/logger.h"
#include "util/tacet_text_utils.h"
#include <algorithm>
#include <set>

namespace Tacet {

namespace {

using TacetText::IsAsciiAlnum;
using TacetText::IsAsciiAlpha;
using TacetText::IsAsciiDigit;
using TacetText::IsAsciiLower;
using TacetText::IsAsciiUpper;

// Upper bound on capitalized tokens in one name; keeps runs of Title Case
// headings from turning into a single giant span
constexpr int kMaxNameTokens = 4;

// RFC 5321 limits; also bound the slice the email regex sees
constexpr size_t kMaxEmailLocalLength = 64;
constexpr size_t kMaxEmailLength = 254;

enum class NameTokenType {
  CAPITALIZED,
  INITIAL,
  HONORIFIC,
  SUFFIX,
  OTHER
};

struct NameToken {
  size_t start;
  size_t end;
  NameTokenType type;
};

const std::set<std::string>& Honorifics() {
  static const std::set<std::string> honorifics = {
    "mr", "mrs", "ms", "miss", "mx", "dr", "prof"
  };
  return honorifics;
}

const std::set<std::string>& NameSuffixes() {
  static const std::set<std::string> suffixes = {
    "jr", "sr", "ii", "iii", "iv", "phd", "md", "esq"
  };
  return suffixes;
}

const std::set<std::string>& NameStopWords() {
  // Lowercase. Words that are routinely capitalized in session notes
  // (sentence openers, labels, places, gear categories) but are not names.
  static const std::set<std::string> stop_words = {
    // articles, conjunctions, prepositions, pronouns
    "a", "an", "the", "and", "or", "but", "nor", "so", "yet", "for",
    "with", "without", "at", "in", "on", "of", "to", "from", "by", "via",
    "about", "after", "before", "during", "into", "over", "under", "per",
    "i", "we", "he", "she", "they", "it", "you", "our", "my", "his", "her",
    "their", "this", "that", "these", "those", "all", "some", "each",
    "no", "not", "yes", "please", "thanks", "thank", "hello", "hi", "dear",
    "regards", "best", "cheers", "also", "then", "next", "first", "last",
    "final", "new", "old", "good", "great",
    // labels and roles
    "contact", "contacts", "client", "clients", "customer", "producer",
    "producers", "engineer", "engineers", "assistant", "artist", "artists",
    "band", "manager", "mixer", "mastering", "tracking", "session",
    "sessions", "project", "projects", "notes", "note", "summary",
    "email", "e-mail", "phone", "mobile", "cell", "fax", "tel", "emergency",
    "address", "location", "locations", "payment", "invoice", "credit",
    "card", "bank", "account", "routing", "rate", "rental", "total",
    "date", "time", "equipment", "gear", "setup", "signal", "chain",
    "used", "using", "recorded", "recording", "mixed", "mastered",
    "tracked", "applied", "captured", "delivered", "called", "call",
    "sent", "met", "spoke", "talked", "booked",
    // audio generics
    "studio", "studios", "room", "booth", "hall", "stage", "audio",
    "sound", "music", "record", "records", "productions", "production",
    "entertainment", "media", "label", "album", "single", "track",
    "tracks", "song", "songs", "mix", "mixes", "master", "masters",
    "vocal", "vocals", "lead", "backing", "guitar", "guitars", "bass",
    "drums", "drum", "piano", "keys", "synth", "strings", "horns",
    "microphone", "microphones", "mic", "mics", "preamp", "preamps",
    "console", "desk", "compressor", "limiter", "reverb", "delay",
    "plugin", "plugins", "monitor", "monitors", "interface", "main",
    // street types and address words
    "street", "st", "avenue", "ave", "road", "rd", "boulevard", "blvd",
    "lane", "ln", "drive", "court", "ct", "way", "place", "pl", "terrace",
    "parkway", "pkwy", "circle", "highway", "hwy", "suite", "apt", "unit",
    "north", "south", "east", "west",
    // calendar
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday",
    "sunday", "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december",
    "today", "tomorrow", "yesterday",
    // organizations
    "inc", "llc", "ltd", "corp", "company", "group", "team"
  };
  return stop_words;
}

bool GapIsBlank(const std::string& text, size_t from, size_t to) {
  if (from >= to) {
    return false;
  }
  for (size_t i = from; i < to; ++i) {
    if (text[i] != ' ' && text[i] != '\t') {
      return false;
    }
  }
  return true;
}

// ", " or " " between the last name token and a suffix
bool GapIsSuffixSeparator(const std::string& text, size_t from, size_t to) {
  if (from < to && text[from] == ',') {
    ++from;
  }
  return GapIsBlank(text, from, to);
}

std::vector<NameToken> TokenizeForNames(const std::string& text) {
  std::vector<NameToken> tokens;
  const size_t n = text.size();
  size_t i = 0;

  while (i < n) {
    if (!IsAsciiAlpha(text[i])) {
      ++i;
      continue;
    }

    size_t j = i + 1;
    while (j < n) {
      if (IsAsciiAlpha(text[j])) {
        ++j;
      } else if ((text[j] == '\'' || text[j] == '-') && j + 1 < n && IsAsciiAlpha(text[j + 1])) {
        j += 2;
      } else {
        break;
      }
    }

    NameToken token{i, j, NameTokenType::OTHER};
    std::string word = text.substr(i, j - i);
    std::string lower = TacetText::ToLowerAscii(word);
    bool glued_before = i > 0 && (IsAsciiDigit(text[i - 1]) ||
                                  static_cast<unsigned char>(text[i - 1]) >= 0x80);
    bool glued_after = j < n && (IsAsciiDigit(text[j]) ||
                                 static_cast<unsigned char>(text[j]) >= 0x80);
    bool dot_follows = j < n && text[j] == '.';

    if (glued_before || glued_after || !IsAsciiUpper(word[0])) {
      token.type = NameTokenType::OTHER;
    } else if (Honorifics().count(lower)) {
      token.type = NameTokenType::HONORIFIC;
      token.end = dot_follows ? j + 1 : j;
    } else if (NameSuffixes().count(lower)) {
      token.type = NameTokenType::SUFFIX;
      token.end = dot_follows ? j + 1 : j;
    } else if (word.size() == 1 && dot_follows) {
      token.type = NameTokenType::INITIAL;
      token.end = j + 1;
    } else if (word.size() >= 2 && IsAsciiLower(word[1]) &&
               !CategoryMatcher::IsNameStopWord(word)) {
      token.type = NameTokenType::CAPITALIZED;
    }

    tokens.push_back(token);
    i = j;
  }

  return tokens;
}

bool IsEmailLocalChar(char c) {
  return IsAsciiAlnum(c) || c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
}

// Emails: the regex finds the shape, IsValidEmail checks the details
const std::regex& EmailPattern() {
  static const std::regex pattern(
    R"([A-Za-z0-9._%+\-]+@[A-Za-z0-9\-]+(?:\.[A-Za-z0-9\-]+)*\.[A-Za-z]{2,})"
  );
  return pattern;
}

// Phones: optional country code, (555) or 555 area code, 3 + 4 digits.
// Matches: (555) 123-4567, 555-123-4567, 555.123.4567, 1-800-555-0123,
// +1 555 123 4567, 5551234567
const std::regex& PhonePattern() {
  static const std::regex pattern(
    R"((?:\+?\d{1,3}[\-. ]?)?(?:\(\d{3}\)[\-. ]?|\d{3}[\-. ]?)\d{3}[\-. ]?\d{4})"
  );
  return pattern;
}

// Street addresses: number + 1-3 street name tokens + street type, then
// optional unit, city, 2-letter state and ZIP / ZIP+4
const std::regex& AddressPattern() {
  static const std::regex pattern(
    R"(\b\d{1,6}[ \t]+(?:(?:[A-Z][a-z]+|\d+(?:st|nd|rd|th))[ \t]+){1,3})"
    R"((?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Dr|Court|Ct|)"
    R"(Way|Place|Pl|Terrace|Ter|Parkway|Pkwy|Circle|Cir|Highway|Hwy)\b)"
    R"((?:,?[ \t]+(?:Apt|Apartment|Suite|Ste|Unit)\.?[ \t]*#?[A-Za-z0-9\-]+|,?[ \t]*#[A-Za-z0-9\-]+)?)"
    R"((?:,[ \t]*[A-Z][a-z]+(?:[ \t]+[A-Z][a-z]+){0,2})?)"
    R"((?:,[ \t]*[A-Z]{2}\b)?)"
    R"((?:[ \t]+\d{5}(?:-\d{4})?\b)?)"
  );
  return pattern;
}

// Card numbers in 4-4-4-x groups or Amex 4-6-5 grouping
const std::regex& GroupedCardPattern() {
  static const std::regex pattern(
    R"(\d{4}[ \-]\d{4}[ \-]\d{4}[ \-]\d{1,7}|\d{4}[ \-]\d{6}[ \-]\d{5})"
  );
  return pattern;
}

const std::regex& DigitRunPattern() {
  static const std::regex pattern(R"(\d{8,19})");
  return pattern;
}

}  // namespace

bool CategoryMatcher::IsNameStopWord(const std::string& word) {
  return NameStopWords().count(TacetText::ToLowerAscii(word)) > 0;
}

Span CategoryMatcher::MakeSpan(const std::string& text, size_t start, size_t end,
                               BuiltinCategory category) {
  Span span;
  span.start = start;
  span.end = end;
  span.category = Category::Builtin(category);
  span.matched_text = text.substr(start, end - start);
  span.source = BuiltinCategoryName(category);
  return span;
}

std::vector<Span> CategoryMatcher::SelectLeftmostLongest(std::vector<Span> spans) {
  std::stable_sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.Length() > b.Length();
  });

  std::vector<Span> selected;
  selected.reserve(spans.size());
  for (auto& span : spans) {
    if (!selected.empty() && span.Overlaps(selected.back())) {
      continue;
    }
    selected.push_back(std::move(span));
  }
  return selected;
}

void CategoryMatcher::ScanRegex(const std::string& text, const std::regex& pattern,
                                BuiltinCategory category, const AcceptFn& accept,
                                std::vector<Span>* spans) {
  size_t pos = 0;
  std::smatch match;

  while (pos < text.size()) {
    auto flags = pos > 0 ? std::regex_constants::match_prev_avail
                         : std::regex_constants::match_default;
    if (!std::regex_search(text.cbegin() + pos, text.cend(), match, pattern, flags)) {
      break;
    }

    size_t start = pos + static_cast<size_t>(match.position(0));
    size_t end = start + static_cast<size_t>(match.length(0));

    if (end > start && accept(text, start, end)) {
      spans->push_back(MakeSpan(text, start, end, category));
      pos = end;
    } else {
      pos = start + 1;
    }
  }
}

bool CategoryMatcher::HasNumericBoundary(const std::string& text, size_t start, size_t end) {
  if (start > 0) {
    char before = text[start - 1];
    if (IsAsciiAlnum(before) || before == '+' || before == '_') {
      return false;
    }
    if ((before == '-' || before == '.' || before == '/') && start > 1 &&
        IsAsciiDigit(text[start - 2])) {
      return false;
    }
  }
  if (end < text.size()) {
    char after = text[end];
    if (IsAsciiAlnum(after) || after == '_') {
      return false;
    }
    if ((after == '-' || after == '.' || after == '/') && end + 1 < text.size() &&
        IsAsciiDigit(text[end + 1])) {
      return false;
    }
  }
  return true;
}

std::vector<Span> CategoryMatcher::MatchNames(const std::string& text) {
  std::vector<Span> spans;
  std::vector<NameToken> tokens = TokenizeForNames(text);

  struct Run {
    bool active = false;
    size_t start = 0;
    size_t end = 0;            // end of the last token taken into the run
    size_t last_cap_end = 0;   // end of the last capitalized token
    size_t suffix_end = 0;
    int capitalized = 0;
  } run;

  auto finalize = [&]() {
    if (run.active && run.capitalized >= 2) {
      size_t end = run.suffix_end > 0 ? run.suffix_end : run.last_cap_end;
      spans.push_back(MakeSpan(text, run.start, end, BuiltinCategory::NAMES));
    }
    run = Run();
  };

  auto begin_with = [&](const NameToken& token) {
    if (token.type == NameTokenType::HONORIFIC) {
      run.active = true;
      run.start = token.start;
      run.end = token.end;
    } else if (token.type == NameTokenType::CAPITALIZED) {
      run.active = true;
      run.start = token.start;
      run.end = token.end;
      run.last_cap_end = token.end;
      run.capitalized = 1;
    }
  };

  for (const auto& token : tokens) {
    if (!run.active) {
      begin_with(token);
      continue;
    }

    bool blank_gap = GapIsBlank(text, run.end, token.start);

    if (token.type == NameTokenType::SUFFIX && run.capitalized >= 2 &&
        run.end == run.last_cap_end &&
        GapIsSuffixSeparator(text, run.last_cap_end, token.start)) {
      run.suffix_end = token.end;
      finalize();
      continue;
    }

    if (blank_gap && token.type == NameTokenType::CAPITALIZED &&
        run.capitalized < kMaxNameTokens) {
      run.capitalized++;
      run.end = token.end;
      run.last_cap_end = token.end;
      continue;
    }

    if (blank_gap && token.type == NameTokenType::INITIAL && run.capitalized >= 1) {
      run.end = token.end;
      continue;
    }

    finalize();
    begin_with(token);
  }
  finalize();

  return spans;
}

bool CategoryMatcher::IsValidEmail(const std::string& email) {
  size_t at = email.find('@');
  if (at == std::string::npos || at == 0 || at + 1 >= email.size()) {
    return false;
  }
  if (email.find('@', at + 1) != std::string::npos) {
    return false;
  }

  std::string local = email.substr(0, at);
  std::string domain = email.substr(at + 1);

  if (local.size() > kMaxEmailLocalLength || email.size() > kMaxEmailLength) {
    return false;
  }
  if (local.front() == '.' || local.back() == '.' || local.find("..") != std::string::npos) {
    return false;
  }

  // Domain: dot-separated labels, no empty label, no leading/trailing hyphen,
  // alphabetic TLD of 2+ letters
  std::vector<std::string> labels;
  size_t begin = 0;
  while (true) {
    size_t dot = domain.find('.', begin);
    labels.push_back(domain.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin));
    if (dot == std::string::npos) {
      break;
    }
    begin = dot + 1;
  }
  if (labels.size() < 2) {
    return false;
  }
  for (const auto& label : labels) {
    if (label.empty() || label.size() > 63 || label.front() == '-' || label.back() == '-') {
      return false;
    }
  }
  const std::string& tld = labels.back();
  if (tld.size() < 2) {
    return false;
  }
  for (char c : tld) {
    if (!IsAsciiAlpha(c)) {
      return false;
    }
  }
  return true;
}

std::vector<Span> CategoryMatcher::MatchEmails(const std::string& text) {
  std::vector<Span> spans;
  size_t scan_from = 0;   // end of the last accepted address

  // Every address contains an '@', so the regex only runs on the slice
  // around one: at most 64 local characters before it and an address-length
  // window after it. Long runs without an '@' are never scanned.
  for (size_t at = text.find('@'); at != std::string::npos; at = text.find('@', at + 1)) {
    if (at < scan_from) {
      continue;
    }

    size_t run_start = at;
    while (run_start > scan_from && IsEmailLocalChar(text[run_start - 1])) {
      --run_start;
    }
    if (run_start == at) {
      continue;
    }
    size_t first = std::max(run_start, at - std::min(at, kMaxEmailLocalLength));
    size_t limit = std::min(text.size(), at + 1 + kMaxEmailLength);

    std::regex_constants::match_flag_type flags = std::regex_constants::match_continuous;
    if (first > 0) {
      flags |= std::regex_constants::match_prev_avail;
    }
    std::smatch match;
    if (!std::regex_search(text.cbegin() + first, text.cbegin() + limit, match,
                           EmailPattern(), flags)) {
      continue;
    }

    // The domain part does not depend on where the local part starts
    size_t end = first + static_cast<size_t>(match.length(0));
    if (end < text.size() && (IsAsciiAlnum(text[end]) || text[end] == '-' || text[end] == '_')) {
      continue;
    }

    // Leftmost start whose local part is valid, e.g. past a ".." or a
    // leading dot
    for (size_t start = first; start < at; ++start) {
      if (IsValidEmail(text.substr(start, end - start))) {
        spans.push_back(MakeSpan(text, start, end, BuiltinCategory::EMAILS));
        scan_from = end;
        break;
      }
    }
  }

  return spans;
}

std::vector<Span> CategoryMatcher::MatchPhones(const std::string& text) {
  std::vector<Span> spans;
  ScanRegex(text, PhonePattern(), BuiltinCategory::PHONES,
            [](const std::string& t, size_t start, size_t end) {
              // A country code is only taken with a "+" or a separator after it,
              // otherwise 11+ contiguous digits would pass as a phone
              size_t digits = 0;
              for (size_t i = start; i < end; ++i) {
                if (IsAsciiDigit(t[i])) ++digits;
              }
              if (digits > 10 && t[start] != '+') {
                size_t first_sep = start;
                while (first_sep < end && IsAsciiDigit(t[first_sep])) ++first_sep;
                if (first_sep - start > 3 || first_sep == end) {
                  return false;
                }
              }
              return HasNumericBoundary(t, start, end);
            },
            &spans);
  return SelectLeftmostLongest(std::move(spans));
}

std::vector<Span> CategoryMatcher::MatchAddresses(const std::string& text) {
  std::vector<Span> spans;
  ScanRegex(text, AddressPattern(), BuiltinCategory::ADDRESSES,
            [](const std::string& t, size_t start, size_t) {
              return start == 0 || !IsAsciiDigit(t[start - 1]);
            },
            &spans);
  return spans;
}

bool CategoryMatcher::IsValidCreditCard(const std::string& digits) {
  if (digits.length() < 13 || digits.length() > 19) {
    return false;
  }

  int sum = 0;
  bool alternate = false;

  for (size_t i = digits.length(); i-- > 0;) {
    int digit = digits[i] - '0';
    if (digit < 0 || digit > 9) {
      return false;
    }

    if (alternate) {
      digit *= 2;
      if (digit > 9) {
        digit = (digit % 10) + 1;
      }
    }

    sum += digit;
    alternate = !alternate;
  }

  return (sum % 10 == 0);
}

std::vector<Span> CategoryMatcher::MatchFinancial(const std::string& text) {
  std::vector<Span> spans;

  ScanRegex(text, GroupedCardPattern(), BuiltinCategory::FINANCIAL,
            [](const std::string& t, size_t start, size_t end) {
              size_t digits = 0;
              for (size_t i = start; i < end; ++i) {
                if (IsAsciiDigit(t[i])) ++digits;
              }
              return digits >= 13 && digits <= 19 && HasNumericBoundary(t, start, end);
            },
            &spans);

  // Contiguous runs: 13-19 digits are cards when Luhn-valid, 8-17 digits
  // are account / routing numbers
  ScanRegex(text, DigitRunPattern(), BuiltinCategory::FINANCIAL,
            [](const std::string& t, size_t start, size_t end) {
              if (start > 0 && IsAsciiDigit(t[start - 1])) {
                return false;
              }
              if (!HasNumericBoundary(t, start, end)) {
                return false;
              }
              std::string digits = t.substr(start, end - start);
              if (IsValidCreditCard(digits)) {
                return true;
              }
              return digits.size() <= 17;
            },
            &spans);

  return SelectLeftmostLongest(std::move(spans));
}

std::vector<Span> CategoryMatcher::FindCandidates(const std::string& text,
                                                  const std::vector<BuiltinCategory>& categories) {
  std::vector<Span> candidates;
  std::set<BuiltinCategory> seen;

  for (BuiltinCategory category : categories) {
    if (!seen.insert(category).second) {
      continue;
    }
    const CategoryRule& rule = GetCategoryRule(category);
    std::vector<Span> found = SelectLeftmostLongest(rule.match(text));
    LOG_DEBUG("CategoryMatcher", std::string(rule.name) + ": " +
              std::to_string(found.size()) + " candidate(s)");
    candidates.insert(candidates.end(),
                      std::make_move_iterator(found.begin()),
                      std::make_move_iterator(found.end()));
  }

  std::stable_sort(candidates.begin(), candidates.end(), [](const Span& a, const Span& b) {
    return a.start < b.start;
  });
  return candidates;
}

}  // namespace Tacet
