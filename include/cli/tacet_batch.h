#ifndef TACET_BATCH_H_
#define TACET_BATCH_H_

#include <iosfwd>
#include <string>
#include <vector>

#include "cli/tacet_json_codec.h"
#include "redaction/tacet_redaction_engine.h"
#include "util/tacet_thread_pool.h"

namespace Tacet {

struct BatchResult {
  bool success = false;
  std::string output;   // one serialized JSON line
};

/**
 * BatchProcessor - runs JSON-lines redaction requests on a worker pool
 *
 * Each non-blank input line is one request document; each produces exactly
 * one output line (result or failure), in input order. A malformed line
 * yields a malformed_config failure and does not affect its neighbours.
 */
class BatchProcessor {
 public:
  BatchProcessor(const RedactionEngine& engine, size_t threads);

  /**
   * Decode, redact and encode one request document
   */
  static json ProcessDocument(const RedactionEngine& engine, const std::string& document);

  // One result per non-blank input line, in input order
  std::vector<BatchResult> ProcessLines(const std::vector<std::string>& lines);

  /**
   * Read all of |in|, write one output line per request to |out|
   *
   * @return Number of requests that failed
   */
  size_t ProcessStream(std::istream& in, std::ostream& out);

  // Compact single-line JSON; invalid UTF-8 is replaced rather than thrown on
  static std::string Serialize(const json& j);

 private:
  const RedactionEngine& engine_;
  ThreadPool pool_;
};

}  // namespace Tacet

#endif  // TACET_BATCH_H_
