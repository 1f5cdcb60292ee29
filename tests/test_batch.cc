#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "cli/tacet_batch.h"

using Tacet::BatchProcessor;
using Tacet::BatchResult;
using Tacet::RedactionEngine;
using Tacet::json;

namespace {

class BatchProcessorTest : public ::testing::Test {
 protected:
  RedactionEngine engine_;
};

TEST_F(BatchProcessorTest, ProcessDocument) {
  json response = BatchProcessor::ProcessDocument(
    engine_, R"({"text": "Call John Smith at 555-123-4567 today.", "mode": "mask"})");
  EXPECT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["redacted_text"], "Call J*** S**** at ***-***-4567 today.");
}

TEST_F(BatchProcessorTest, ProcessDocumentReportsMalformedInput) {
  json garbage = BatchProcessor::ProcessDocument(engine_, "this is not json");
  EXPECT_FALSE(garbage["success"].get<bool>());
  EXPECT_EQ(garbage["error"]["code"], "malformed_config");
  EXPECT_EQ(garbage["error"]["kind"], "validation_error");

  json wrong_type = BatchProcessor::ProcessDocument(engine_, R"({"text": "notes", "mode": 7})");
  EXPECT_EQ(wrong_type["error"]["code"], "malformed_config");

  json missing_text = BatchProcessor::ProcessDocument(engine_, R"({"mode": "replace"})");
  EXPECT_EQ(missing_text["error"]["code"], "empty_text");
}

TEST_F(BatchProcessorTest, ProcessLinesKeepsInputOrder) {
  BatchProcessor batch(engine_, 4);

  std::vector<std::string> lines;
  for (int i = 0; i < 40; ++i) {
    lines.push_back(R"({"text": "Take )" + std::to_string(i) +
                    R"( approved by John Smith.", "categories": ["names"]})");
  }
  lines.insert(lines.begin() + 10, "   ");

  std::vector<BatchResult> results = batch.ProcessLines(lines);
  ASSERT_EQ(results.size(), 40u);
  for (int i = 0; i < 40; ++i) {
    EXPECT_TRUE(results[i].success);
    json parsed = json::parse(results[i].output);
    EXPECT_EQ(parsed["redacted_text"],
              "Take " + std::to_string(i) + " approved by [NAME].");
  }
}

TEST_F(BatchProcessorTest, ProcessStream) {
  BatchProcessor batch(engine_, 2);

  std::istringstream in(
    R"({"text": "Contact John Smith at john.smith@email.com today."})" "\n"
    "\n"
    R"({"text": "short"})" "\n"
    "{broken\n"
    R"({"text": "Mail sarah@studio.com about the mix.", "mode": "remove"})" "\n");
  std::ostringstream out;

  size_t failures = batch.ProcessStream(in, out);
  EXPECT_EQ(failures, 2u);

  std::vector<std::string> lines;
  std::istringstream produced(out.str());
  for (std::string line; std::getline(produced, line);) {
    lines.push_back(line);
  }
  ASSERT_EQ(lines.size(), 4u);

  EXPECT_EQ(json::parse(lines[0])["redacted_text"], "Contact [NAME] at [EMAIL] today.");
  EXPECT_EQ(json::parse(lines[1])["error"]["code"], "text_too_short");
  EXPECT_EQ(json::parse(lines[2])["error"]["code"], "malformed_config");
  EXPECT_EQ(json::parse(lines[3])["redacted_text"], "Mail about the mix.");
}

TEST(BatchSerializeTest, OneLineAndInvalidUtf8IsReplaced) {
  json j = {{"text", std::string("bad \xFF byte")}, {"lines", "a\nb"}};
  std::string serialized = BatchProcessor::Serialize(j);
  EXPECT_EQ(serialized.find('\n'), std::string::npos);
  EXPECT_NE(serialized.find("\\n"), std::string::npos);
  EXPECT_NE(serialized.find("\xEF\xBF\xBD"), std::string::npos);
}

}  // namespace
