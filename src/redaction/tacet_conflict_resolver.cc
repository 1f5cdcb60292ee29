#include "redaction/tacet_conflict_resolver.h"
#include "util/logger.h"
#include <algorithm>

namespace Tacet {

bool ConflictResolver::Precedes(const Span& a, const Span& b) {
  if (a.start != b.start) {
    return a.start < b.start;
  }
  if (a.Length() != b.Length()) {
    return a.Length() > b.Length();
  }
  if (a.category.is_custom != b.category.is_custom) {
    return !a.category.is_custom;
  }
  if (!a.category.is_custom) {
    return static_cast<int>(a.category.builtin) < static_cast<int>(b.category.builtin);
  }
  return a.pattern_index < b.pattern_index;
}

std::vector<Span> ConflictResolver::Resolve(std::vector<Span> candidates,
                                            const ProtectionFilter& filter) {
  auto protected_begin =
    std::remove_if(candidates.begin(), candidates.end(),
                   [&filter](const Span& span) { return filter.IsProtected(span); });
  LOG_DEBUG("ConflictResolver", std::to_string(candidates.end() - protected_begin) +
            " candidate(s) protected");
  candidates.erase(protected_begin, candidates.end());

  std::sort(candidates.begin(), candidates.end(), &ConflictResolver::Precedes);

  std::vector<Span> resolved;
  resolved.reserve(candidates.size());
  for (auto& span : candidates) {
    if (!resolved.empty() && span.Overlaps(resolved.back())) {
      continue;
    }
    resolved.push_back(std::move(span));
  }

  LOG_DEBUG("ConflictResolver", std::to_string(resolved.size()) + " of " +
            std::to_string(candidates.size()) + " unprotected candidate(s) kept");
  return resolved;
}

}  // namespace Tacet
