/**
 * @file test_log_processor.cpp
 * @brief Unit tests for the JSON line processor.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * @details
 * Covers full and partial masking, skip rules, log level normalization,
 * malformed input and preservation of field order and value types.
 */

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include "log_backup/log_processor.h"

using namespace log_backup;
using ordered_json = nlohmann::ordered_json;

// ==================== Helpers ====================

namespace {

ProcessingConfig sampleConfig() {
  ProcessingConfig config;
  config.full_mask = {"password", "token"};
  config.partial_mask["card"] = MaskRule{2, 2};
  config.partial_mask["email"] = MaskRule{3, 0};
  config.skip_if_contains = {"healthcheck"};
  config.skip_fields = {"debugInfo"};
  config.log_level_field = "level";
  config.log_level_map = {{"warn", "Warning"}, {"err", "Error"}, {"info", "Information"}};
  return config;
}

}  // namespace

// ==================== Partial Mask Tests ====================

TEST(PartialMaskTest, KeepsStartAndEnd) {
  EXPECT_EQ(JsonLogProcessor::applyPartialMask("1234567890", MaskRule{2, 2}), "12******90");
}

TEST(PartialMaskTest, ShortValueUnchanged) {
  EXPECT_EQ(JsonLogProcessor::applyPartialMask("ab", MaskRule{2, 2}), "ab");
  EXPECT_EQ(JsonLogProcessor::applyPartialMask("abcd", MaskRule{2, 2}), "abcd");
}

TEST(PartialMaskTest, OverlappingRuleUnchanged) {
  EXPECT_EQ(JsonLogProcessor::applyPartialMask("abc", MaskRule{2, 2}), "abc");
}

TEST(PartialMaskTest, EmptyValue) {
  EXPECT_EQ(JsonLogProcessor::applyPartialMask("", MaskRule{1, 1}), "");
}

TEST(PartialMaskTest, NoVisibleEnd) {
  EXPECT_EQ(JsonLogProcessor::applyPartialMask("secret", MaskRule{1, 0}), "s*****");
}

TEST(PartialMaskTest, NoVisibleCharacters) {
  EXPECT_EQ(JsonLogProcessor::applyPartialMask("secret", MaskRule{0, 0}), "******");
}

TEST(PartialMaskTest, CountsUtf8CodePoints) {
  // "żółw" has 4 code points encoded in 7 bytes.
  EXPECT_EQ(JsonLogProcessor::applyPartialMask("\xC5\xBC\xC3\xB3\xC5\x82w", MaskRule{1, 1}),
            "\xC5\xBC**w");
}

// ==================== Full Mask Tests ====================

TEST(JsonLogProcessorTest, FullMaskReplacesString) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"user":"bob","password":"hunter2"})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"user":"bob","password":"********"})");
}

TEST(JsonLogProcessorTest, FullMaskReplacesAnyType) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"token":{"id":7,"scopes":["a"]},"password":12345})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"token":"********","password":"********"})");
}

TEST(JsonLogProcessorTest, FullMaskIsCaseInsensitive) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"PassWord":"x"})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"PassWord":"********"})");
}

// ==================== Partial Mask Field Tests ====================

TEST(JsonLogProcessorTest, PartialMaskField) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"card":"4111111111111111"})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"card":"41************11"})");
}

TEST(JsonLogProcessorTest, PartialMaskNumberBecomesString) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"card":1234567890})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"card":"12******90"})");
}

TEST(JsonLogProcessorTest, FullMaskWinsOverPartialMask) {
  ProcessingConfig config;
  config.full_mask = {"card"};
  config.partial_mask["card"] = MaskRule{2, 2};
  JsonLogProcessor processor(config);

  LineResult result = processor.process(R"({"card":"1234567890"})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"card":"********"})");
}

// ==================== Skip Rule Tests ====================

TEST(JsonLogProcessorTest, SkipIfContainsDropsRecord) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"msg":"ping","healthcheck":true})");
  EXPECT_EQ(result.status, LineStatus::SKIPPED);
  EXPECT_TRUE(result.output.empty());
}

TEST(JsonLogProcessorTest, SkipIfContainsMatchesNullValue) {
  JsonLogProcessor processor(sampleConfig());
  EXPECT_EQ(processor.process(R"({"healthcheck":null})").status, LineStatus::SKIPPED);
}

TEST(JsonLogProcessorTest, SkipIfContainsIsCaseSensitive) {
  JsonLogProcessor processor(sampleConfig());
  EXPECT_EQ(processor.process(R"({"HealthCheck":1})").status, LineStatus::EMITTED);
}

TEST(JsonLogProcessorTest, SkipFieldsRemoved) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"a":1,"debugInfo":{"x":1},"b":2})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"a":1,"b":2})");
}

TEST(JsonLogProcessorTest, AllFieldsSkippedGivesEmptyObject) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"debugInfo":"x"})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, "{}");
}

// ==================== Log Level Tests ====================

TEST(JsonLogProcessorTest, LevelMapped) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"level":"warn","msg":"disk"})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"level":"Warning","msg":"disk"})");
}

TEST(JsonLogProcessorTest, LevelLookupIsCaseInsensitive) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"LEVEL":"ERR"})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"LEVEL":"Error"})");
}

TEST(JsonLogProcessorTest, UnmappedLevelKeepsValueAndType) {
  JsonLogProcessor processor(sampleConfig());

  LineResult text = processor.process(R"({"level":"trace"})");
  ASSERT_TRUE(text.emitted());
  EXPECT_EQ(text.output, R"({"level":"trace"})");

  LineResult number = processor.process(R"({"level":3})");
  ASSERT_TRUE(number.emitted());
  EXPECT_EQ(number.output, R"({"level":3})");
}

TEST(JsonLogProcessorTest, NoLevelFieldConfigured) {
  ProcessingConfig config;
  config.log_level_map = {{"warn", "Warning"}};
  JsonLogProcessor processor(config);

  LineResult result = processor.process(R"({"level":"warn"})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"level":"warn"})");
}

// ==================== Malformed Input Tests ====================

TEST(JsonLogProcessorTest, InvalidJsonIsMalformed) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process("this is not json");
  EXPECT_EQ(result.status, LineStatus::MALFORMED);
  EXPECT_TRUE(result.output.empty());
}

TEST(JsonLogProcessorTest, TruncatedJsonIsMalformed) {
  JsonLogProcessor processor(sampleConfig());
  EXPECT_EQ(processor.process(R"({"a":1)").status, LineStatus::MALFORMED);
}

TEST(JsonLogProcessorTest, NonObjectIsMalformed) {
  JsonLogProcessor processor(sampleConfig());
  EXPECT_EQ(processor.process("[1,2,3]").status, LineStatus::MALFORMED);
  EXPECT_EQ(processor.process("42").status, LineStatus::MALFORMED);
  EXPECT_EQ(processor.process(R"("text")").status, LineStatus::MALFORMED);
}

TEST(JsonLogProcessorTest, MalformedLineIsLoggedWithoutContent) {
  auto logger = std::make_shared<Logger>(Severity::DEBUG);
  logger->setConsoleOutput(false);
  std::vector<std::string> messages;
  logger->addCallback([&messages](Severity, const std::string&, const std::string& message) {
    messages.push_back(message);
  });

  JsonLogProcessor processor(sampleConfig(), logger);
  processor.process("password=hunter2");

  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].find("hunter2"), std::string::npos);
}

// ==================== Preservation Tests ====================

TEST(JsonLogProcessorTest, PreservesOrderAndTypes) {
  ProcessingConfig config;
  JsonLogProcessor processor(config);

  const std::string line = R"({"z":1,"a":"x","m":true,"n":null,"f":1.5,"o":{"k":[1,2]}})";
  LineResult result = processor.process(line);
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, line);
}

TEST(JsonLogProcessorTest, OutputIsSingleLine) {
  ProcessingConfig config;
  JsonLogProcessor processor(config);

  LineResult result = processor.process(R"({ "a" : 1 ,   "b" : [ 1 , 2 ] })");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"a":1,"b":[1,2]})");
  EXPECT_EQ(result.output.find('\n'), std::string::npos);
}

TEST(JsonLogProcessorTest, RulesApplyToTopLevelOnly) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(R"({"user":{"password":"x"}})");
  ASSERT_TRUE(result.emitted());
  EXPECT_EQ(result.output, R"({"user":{"password":"x"}})");
}

TEST(JsonLogProcessorTest, CombinedRules) {
  JsonLogProcessor processor(sampleConfig());
  LineResult result = processor.process(
      R"({"ts":"2026-01-01T00:00:00Z","level":"info","email":"alice@example.com","password":"p","debugInfo":1})");
  ASSERT_TRUE(result.emitted());

  ordered_json parsed = ordered_json::parse(result.output);
  ASSERT_EQ(parsed.size(), 4u);
  EXPECT_EQ(parsed["ts"], "2026-01-01T00:00:00Z");
  EXPECT_EQ(parsed["level"], "Information");
  EXPECT_EQ(parsed["email"], "ali**************");
  EXPECT_EQ(parsed["password"], kRedactionToken);
  EXPECT_FALSE(parsed.contains("debugInfo"));
}

TEST(LineStatusTest, ToString) {
  EXPECT_EQ(lineStatusToString(LineStatus::EMITTED), "EMITTED");
  EXPECT_EQ(lineStatusToString(LineStatus::SKIPPED), "SKIPPED");
  EXPECT_EQ(lineStatusToString(LineStatus::MALFORMED), "MALFORMED");
  EXPECT_EQ(lineStatusToString(LineStatus::FAILED), "FAILED");
}
