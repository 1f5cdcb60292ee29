#ifndef TACET_REDACTION_CONFIG_H_
#define TACET_REDACTION_CONFIG_H_

#include <string>
#include <vector>

#include "redaction/tacet_custom_patterns.h"

namespace Tacet {

/**
 * Per-call redaction options, as supplied by the caller.
 *
 * Mode and category names stay raw strings here; the engine validates and
 * normalizes them (case-insensitive, singular aliases accepted).
 */
struct RedactionConfig {
  std::string mode = "replace";
  std::vector<std::string> categories = {"names", "emails", "phones", "addresses", "financial"};
  bool preserve_domain_terms = true;
  std::vector<CustomPatternSpec> custom_patterns;
  std::vector<std::string> whitelist;
};

}  // namespace Tacet

#endif  // TACET_REDACTION_CONFIG_H_
