#include "redaction/tacet_domain_vocabulary.h"
#include "util/tacet_text_utils.h"
#include <algorithm>
#include <cstring>

namespace Tacet {

namespace {

using TacetText::IsAsciiSpace;

// Audio equipment, software, brand and studio names. Generic studio words
// ("mix", "session") are deliberately absent: they would veto emails such as
// someone@studio.com without protecting anything that looks like PII.
const char* const kBuiltInTerms[] = {
  // microphones
  "Neumann", "Neumann U87", "Neumann U47", "Neumann U67", "Neumann TLM 103",
  "Neumann KM 184", "U87", "U47", "U67", "TLM 103", "KM 184",
  "Shure SM57", "Shure SM58", "Shure SM7B", "SM57", "SM58", "SM7B",
  "AKG", "AKG C414", "AKG C12", "C414", "C12",
  "Sennheiser MD 421", "Sennheiser MD421", "MD 421", "MD421",
  "Royer R-121", "R-121", "Coles 4038", "Electro-Voice RE20", "RE20",
  "Telefunken ELA M 251", "ELA M 251", "Rode NT1",
  "Audio-Technica", "Beyerdynamic M160", "M160",
  // consoles, preamps, outboard
  "SSL", "SSL console", "SSL 4000", "SSL 4000 G", "SSL 9000", "SSL G Series",
  "Solid State Logic", "Neve 1073", "Neve 1081", "Neve 88RS",
  "Neve console", "1073", "1081", "API 312", "API 512", "API 550",
  "API 2500", "API console", "312", "512", "2500", "Trident A-Range",
  "Avalon VT-737", "VT-737", "Manley Massive Passive",
  "Massive Passive", "Pultec EQP-1A", "EQP-1A",
  "Teletronix LA-2A", "LA-2A", "LA-3A", "Urei 1176", "UREI 1176", "1176",
  "Fairchild 660", "Fairchild 670", "dbx", "dbx 160", "dbx 165",
  "Empirical Labs", "Empirical Labs Distressor", "Tube-Tech",
  "Tube-Tech CL 1B", "CL 1B", "Chandler TG1", "Great River",
  "Lexicon 480L", "480L", "Eventide H3000", "H3000",
  "Bricasti M7", "EMT 140", "EMT 250", "Roland Space Echo",
  "Space Echo", "Studer A800", "Studer A827", "Ampex ATR-102",
  "ATR-102", "Otari MTR-90", "MTR-90",
  // interfaces, converters, monitors
  "Universal Audio", "Apollo Twin", "Apollo x8",
  "Focusrite Scarlett", "Antelope Orion",
  "Apogee Symphony", "RME", "RME Fireface",
  "Prism Sound", "Genelec 8040", "Genelec 8050", "8040",
  "8050", "Yamaha NS10", "Yamaha NS-10", "NS10", "NS-10", "Adam Audio",
  "Adam A7X", "A7X", "KRK",
  // software and plugins
  "Pro Tools", "Pro Tools HD", "Pro Tools Ultimate", "Avid Pro Tools",
  "Logic Pro", "Logic Pro X", "Ableton Live",
  "Studio One", "FL Studio",
  "Waves CLA-2A", "CLA-2A", "FabFilter", "FabFilter Pro-Q",
  "Pro-Q", "ValhallaRoom", "iZotope", "iZotope Ozone",
  "Auto-Tune", "Native Instruments",
  "Slate Digital", "Plugin Alliance",
  "UAD",
  // instruments and amps
  "Fender Stratocaster", "Stratocaster", "Telecaster",
  "Gibson Les Paul", "Les Paul", "Vox AC30", "AC30",
  "Mesa Boogie", "Ampeg", "Ampeg SVT", "Hammond B3",
  "Fender Rhodes", "Steinway D",
  "Prophet-5", "Roland TR-808", "TR-808",
  "TR-909", "MPC", "Akai MPC",
  // studios
  "Abbey Road", "Abbey Road Studios", "Sunset Sound", "Electric Lady",
  "Electric Lady Studios", "Capitol Studios", "Ocean Way", "Blackbird Studio",
  "Power Station", "Avatar Studios", "Hit Factory",
  "Record Plant", "Sound City", "Muscle Shoals", "FAME Studios", "Sun Studio",
  "RAK Studios", "Air Studios", "AIR Lyndhurst", "Real World Studios",
  "Olympic Studios", "Hansa Studios", "Criteria Studios",
  "Village Studios", "The Village", "EastWest Studios", "Henson Studios",
  "Conway Recording", "Conway Studios", "United Recording",
  "Westlake Studios", "Electric Ladyland"
};

}  // namespace

DomainVocabulary::DomainVocabulary() {
  terms_.reserve(sizeof(kBuiltInTerms) / sizeof(kBuiltInTerms[0]));
  for (const char* term : kBuiltInTerms) {
    terms_.push_back(TacetText::ToLowerAscii(term));
  }
  std::sort(terms_.begin(), terms_.end());
  terms_.erase(std::unique(terms_.begin(), terms_.end()), terms_.end());
}

const DomainVocabulary& DomainVocabulary::BuiltIn() {
  static const DomainVocabulary vocabulary;
  return vocabulary;
}

bool DomainVocabulary::Contains(const std::string& term) const {
  return std::binary_search(terms_.begin(), terms_.end(), TacetText::ToLowerAscii(term));
}

ProtectionFilter::ProtectionFilter(const std::string& text,
                                   const DomainVocabulary* vocabulary,
                                   const std::vector<std::string>& whitelist,
                                   size_t context_window_tokens)
    : text_(text),
      lower_text_(TacetText::ToLowerAscii(text)),
      vocabulary_(vocabulary),
      context_window_tokens_(context_window_tokens) {
  for (const auto& entry : whitelist) {
    std::string lower = TacetText::ToLowerAscii(TacetText::Trim(entry));
    if (!lower.empty()) {
      whitelist_.push_back(lower);
    }
  }
}

bool ProtectionFilter::Empty() const {
  return vocabulary_ == nullptr && whitelist_.empty();
}

bool ProtectionFilter::IsProtected(const Span& candidate) const {
  if (Empty()) {
    return false;
  }

  std::string lower_candidate = TacetText::ToLowerAscii(candidate.matched_text);

  // Rule 1: candidate equals or is contained in a protected term
  for (const auto& term : whitelist_) {
    if (term.find(lower_candidate) != std::string::npos) {
      return true;
    }
  }
  if (vocabulary_) {
    for (const auto& term : vocabulary_->Terms()) {
      if (term.find(lower_candidate) != std::string::npos) {
        return true;
      }
    }
  }

  // Rule 2: a protected phrase around the candidate overlaps it
  size_t begin = 0;
  size_t end = 0;
  ContextWindow(candidate, &begin, &end);

  for (const auto& term : whitelist_) {
    if (OverlappedByTerm(term, false, candidate, begin, end)) {
      return true;
    }
  }
  if (vocabulary_) {
    for (const auto& term : vocabulary_->Terms()) {
      if (OverlappedByTerm(term, true, candidate, begin, end)) {
        return true;
      }
    }
  }

  return false;
}

void ProtectionFilter::ContextWindow(const Span& candidate, size_t* begin, size_t* end) const {
  size_t b = candidate.start;
  // Back to the start of the candidate's own token, then N tokens more
  while (b > 0 && !IsAsciiSpace(text_[b - 1])) --b;
  for (size_t i = 0; i < context_window_tokens_ && b > 0; ++i) {
    while (b > 0 && IsAsciiSpace(text_[b - 1])) --b;
    while (b > 0 && !IsAsciiSpace(text_[b - 1])) --b;
  }

  size_t e = candidate.end;
  while (e < text_.size() && !IsAsciiSpace(text_[e])) ++e;
  for (size_t i = 0; i < context_window_tokens_ && e < text_.size(); ++i) {
    while (e < text_.size() && IsAsciiSpace(text_[e])) ++e;
    while (e < text_.size() && !IsAsciiSpace(text_[e])) ++e;
  }

  *begin = b;
  *end = e;
}

bool ProtectionFilter::OverlappedByTerm(const std::string& term, bool token_bounded,
                                        const Span& candidate, size_t begin, size_t end) const {
  if (term.empty() || term.size() > end - begin) {
    return false;
  }

  // Only the window is searched, never the rest of the text
  auto window_end = lower_text_.cbegin() + end;
  auto it = std::search(lower_text_.cbegin() + begin, window_end, term.cbegin(), term.cend());
  while (it != window_end) {
    size_t pos = static_cast<size_t>(it - lower_text_.cbegin());
    size_t term_end = pos + term.size();
    bool overlaps = pos < candidate.end && candidate.start < term_end;
    if (overlaps &&
        (!token_bounded || (IsTermBoundaryBefore(pos) && IsTermBoundaryAfter(term_end)))) {
      return true;
    }
    it = std::search(it + 1, window_end, term.cbegin(), term.cend());
  }
  return false;
}

bool ProtectionFilter::IsTermBoundaryBefore(size_t pos) const {
  if (pos == 0) {
    return true;
  }
  char c = text_[pos - 1];
  return IsAsciiSpace(c) || std::strchr(",;:!?()[]\"'", c) != nullptr;
}

bool ProtectionFilter::IsTermBoundaryAfter(size_t pos) const {
  if (pos >= text_.size()) {
    return true;
  }
  char c = text_[pos];
  if (c == '.') {
    // Sentence end, not a domain or version continuation
    return TacetText::IsSpaceOrEdge(text_, pos + 1);
  }
  return IsAsciiSpace(c) || std::strchr(",;:!?()[]\"'", c) != nullptr;
}

}  // namespace Tacet
