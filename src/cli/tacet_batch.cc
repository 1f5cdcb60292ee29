#include "cli/tacet_batch.h"
#include "util/logger.h"
#include "util/tacet_text_utils.h"
#include <future>
#include <istream>
#include <ostream>

namespace Tacet {

BatchProcessor::BatchProcessor(const RedactionEngine& engine, size_t threads)
    : engine_(engine), pool_(threads) {
}

json BatchProcessor::ProcessDocument(const RedactionEngine& engine, const std::string& document) {
  RedactionRequest request;
  std::string error;
  if (!JsonCodec::ParseRequest(document, &request, &error)) {
    return JsonCodec::EncodeFailure(RedactionStatus::MALFORMED_CONFIG, error);
  }
  return JsonCodec::EncodeOutcome(engine.Redact(request.text, request.config));
}

std::string BatchProcessor::Serialize(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::vector<BatchResult> BatchProcessor::ProcessLines(const std::vector<std::string>& lines) {
  std::vector<std::future<BatchResult>> pending;
  pending.reserve(lines.size());

  for (const auto& line : lines) {
    if (TacetText::Trim(line).empty()) {
      continue;
    }
    const RedactionEngine& engine = engine_;
    pending.push_back(pool_.Submit([&engine, line]() {
      json response = ProcessDocument(engine, line);
      BatchResult result;
      result.success = response.value("success", false);
      result.output = Serialize(response);
      return result;
    }));
  }

  std::vector<BatchResult> output;
  output.reserve(pending.size());
  for (auto& future : pending) {
    output.push_back(future.get());
  }
  return output;
}

size_t BatchProcessor::ProcessStream(std::istream& in, std::ostream& out) {
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }

  std::vector<BatchResult> results = ProcessLines(lines);

  size_t failures = 0;
  for (const auto& result : results) {
    if (!result.success) {
      ++failures;
    }
    out << result.output << '\n';
  }
  out.flush();

  LOG_INFO("Batch", "Processed " + std::to_string(results.size()) + " request(s), " +
           std::to_string(failures) + " failed");
  return failures;
}

}  // namespace Tacet
