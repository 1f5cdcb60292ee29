#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <map>
#include <string>

#include "cli/tacet_settings.h"

using Tacet::Settings;
using json = nlohmann::json;

namespace {

Settings::EnvLookup FakeEnvironment(const std::map<std::string, std::string>& vars) {
  return [vars](const char* name) -> const char* {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : it->second.c_str();
  };
}

TEST(SettingsTest, Defaults) {
  Settings settings;
  EXPECT_EQ(settings.engine.min_text_length, 10u);
  EXPECT_EQ(settings.engine.max_text_length, 20000u);
  EXPECT_EQ(settings.engine.context_window_tokens, 3u);
  EXPECT_EQ(settings.log_level, TacetLogger::INFO);
  EXPECT_TRUE(settings.log_file.empty());
  EXPECT_EQ(settings.threads, 0u);

  std::string error;
  EXPECT_TRUE(settings.Validate(&error)) << error;
}

TEST(SettingsTest, ApplyJson) {
  Settings settings;
  std::string error;
  ASSERT_TRUE(settings.ApplyJson(json::parse(R"({
    "min_text_length": 12,
    "max_text_length": 5000,
    "context_window": 5,
    "threads": 4,
    "log_level": "WARN",
    "log_file": "/tmp/tacet.log"
  })"), &error)) << error;

  EXPECT_EQ(settings.engine.min_text_length, 12u);
  EXPECT_EQ(settings.engine.max_text_length, 5000u);
  EXPECT_EQ(settings.engine.context_window_tokens, 5u);
  EXPECT_EQ(settings.threads, 4u);
  EXPECT_EQ(settings.log_level, TacetLogger::WARN);
  EXPECT_EQ(settings.log_file, "/tmp/tacet.log");
}

TEST(SettingsTest, ApplyJsonRejectsBadValues) {
  const char* const documents[] = {
    R"([1, 2])",
    R"({"min_text_length": -1})",
    R"({"max_text_length": "big"})",
    R"({"context_window": 2.5})",
    R"({"log_level": "loud"})",
    R"({"log_level": 1})",
    R"({"log_file": false})",
  };
  for (const char* document : documents) {
    Settings settings;
    std::string error;
    EXPECT_FALSE(settings.ApplyJson(json::parse(document), &error)) << document;
    EXPECT_FALSE(error.empty()) << document;
  }
}

TEST(SettingsTest, ApplyEnvironment) {
  Settings settings;
  std::string error;
  ASSERT_TRUE(settings.ApplyEnvironment(FakeEnvironment({
    {"TACET_LOG_LEVEL", "debug"},
    {"TACET_LOG_FILE", "/var/log/tacet.log"},
    {"TACET_MIN_TEXT_LENGTH", "1"},
    {"TACET_MAX_TEXT_LENGTH", " 100 "},
    {"TACET_CONTEXT_WINDOW", "0"},
  }), &error)) << error;

  EXPECT_EQ(settings.log_level, TacetLogger::DEBUG);
  EXPECT_EQ(settings.log_file, "/var/log/tacet.log");
  EXPECT_EQ(settings.engine.min_text_length, 1u);
  EXPECT_EQ(settings.engine.max_text_length, 100u);
  EXPECT_EQ(settings.engine.context_window_tokens, 0u);
}

TEST(SettingsTest, ApplyEnvironmentLeavesUnsetValuesAlone) {
  Settings settings;
  settings.engine.max_text_length = 777;
  std::string error;
  ASSERT_TRUE(settings.ApplyEnvironment(FakeEnvironment({}), &error)) << error;
  EXPECT_EQ(settings.engine.max_text_length, 777u);
  EXPECT_EQ(settings.log_level, TacetLogger::INFO);
}

TEST(SettingsTest, ApplyEnvironmentRejectsBadValues) {
  Settings settings;
  std::string error;
  EXPECT_FALSE(settings.ApplyEnvironment(FakeEnvironment({{"TACET_MIN_TEXT_LENGTH", "ten"}}),
                                         &error));
  EXPECT_NE(error.find("TACET_MIN_TEXT_LENGTH"), std::string::npos);

  error.clear();
  EXPECT_FALSE(settings.ApplyEnvironment(FakeEnvironment({{"TACET_LOG_LEVEL", "chatty"}}),
                                         &error));
  EXPECT_NE(error.find("TACET_LOG_LEVEL"), std::string::npos);
}

TEST(SettingsTest, Validate) {
  std::string error;

  Settings zero_min;
  zero_min.engine.min_text_length = 0;
  EXPECT_FALSE(zero_min.Validate(&error));

  Settings inverted;
  inverted.engine.min_text_length = 50;
  inverted.engine.max_text_length = 40;
  EXPECT_FALSE(inverted.Validate(&error));
  EXPECT_NE(error.find("max_text_length"), std::string::npos);

  Settings equal;
  equal.engine.min_text_length = 40;
  equal.engine.max_text_length = 40;
  EXPECT_TRUE(equal.Validate(&error));
}

TEST(SettingsTest, ParseSize) {
  size_t value = 0;
  EXPECT_TRUE(Settings::ParseSize("12", &value));
  EXPECT_EQ(value, 12u);
  EXPECT_TRUE(Settings::ParseSize(" 0 ", &value));
  EXPECT_EQ(value, 0u);

  value = 99;
  EXPECT_FALSE(Settings::ParseSize("", &value));
  EXPECT_FALSE(Settings::ParseSize("12x", &value));
  EXPECT_FALSE(Settings::ParseSize("-1", &value));
  EXPECT_FALSE(Settings::ParseSize("+5", &value));
  EXPECT_FALSE(Settings::ParseSize("99999999999999999999999", &value));
  EXPECT_EQ(value, 99u);
}

TEST(SettingsTest, LoadFile) {
  std::string path = ::testing::TempDir() + "tacet_settings_test.json";
  {
    std::ofstream file(path);
    file << R"({"max_text_length": 300, "log_level": "error"})";
  }

  Settings settings;
  std::string error;
  ASSERT_TRUE(settings.LoadFile(path, &error)) << error;
  EXPECT_EQ(settings.engine.max_text_length, 300u);
  EXPECT_EQ(settings.log_level, TacetLogger::ERROR);
  std::remove(path.c_str());
}

TEST(SettingsTest, LoadFileErrors) {
  Settings settings;
  std::string error;
  EXPECT_FALSE(settings.LoadFile("/nonexistent/tacet.json", &error));
  EXPECT_NE(error.find("/nonexistent/tacet.json"), std::string::npos);

  std::string path = ::testing::TempDir() + "tacet_settings_broken.json";
  {
    std::ofstream file(path);
    file << "{ not json";
  }
  error.clear();
  EXPECT_FALSE(settings.LoadFile(path, &error));
  EXPECT_FALSE(error.empty());
  std::remove(path.c_str());
}

}  // namespace
