#ifndef TACET_CONFLICT_RESOLVER_H_
#define TACET_CONFLICT_RESOLVER_H_

#include <vector>

#include "redaction/tacet_category.h"
#include "redaction/tacet_domain_vocabulary.h"

namespace Tacet {

/**
 * ConflictResolver - turns all candidates into the final span list
 *
 * 1. drop candidates the protection filter vetoes
 * 2. order by start ascending, longer first, then by precedence
 * 3. sweep left to right, keeping a span only if it does not overlap
 *    the last kept one
 *
 * Precedence on identical ranges: built-in categories beat custom patterns,
 * built-ins follow the BuiltinCategory order, custom patterns follow their
 * declaration order.
 */
class ConflictResolver {
 public:
  static std::vector<Span> Resolve(std::vector<Span> candidates,
                                   const ProtectionFilter& filter);

  /**
   * Strict ordering used by the sweep (true if |a| is kept over |b| when
   * both start at the same offset)
   */
  static bool Precedes(const Span& a, const Span& b);
};

}  // namespace Tacet

#endif  // TACET_CONFLICT_RESOLVER_H_
