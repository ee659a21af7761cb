/**
 * @file log_processor.cpp
 * @brief Implementation of the JSON log record sanitizer.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 */

#include "log_backup/log_processor.h"

#include <algorithm>
#include <cctype>
#include <vector>

#include <nlohmann/json.hpp>

namespace log_backup {

using json = nlohmann::ordered_json;

namespace {

const char* kComponent = "processor";

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

// Text used for masking and level lookup: string content, or the compact JSON
// text of any other value.
std::string valueText(const json& value) {
  if (value.is_string()) return value.get<std::string>();
  return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Byte offsets of every UTF-8 code point start in value.
std::vector<size_t> codePointOffsets(const std::string& value) {
  std::vector<size_t> offsets;
  offsets.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    auto c = static_cast<unsigned char>(value[i]);
    if ((c & 0xC0) != 0x80) offsets.push_back(i);
  }
  return offsets;
}

}  // namespace

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
  return std::lexicographical_compare(
      a.begin(), a.end(), b.begin(), b.end(),
      [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

JsonLogProcessor::JsonLogProcessor(ProcessingConfig config, std::shared_ptr<Logger> logger)
    : config_(std::move(config)), logger_(std::move(logger)) {}

LineResult JsonLogProcessor::process(const std::string& raw_line) const {
  try {
    const json root = json::parse(raw_line);
    if (!root.is_object()) {
      if (logger_) {
        logger_->warning(kComponent, "Skipping log line that is not a JSON object (" +
                                         std::to_string(raw_line.size()) + " bytes)");
      }
      return LineResult::drop(LineStatus::MALFORMED);
    }

    for (const auto& field : config_.skip_if_contains) {
      if (root.contains(field)) return LineResult::drop(LineStatus::SKIPPED);
    }

    json output = json::object();
    for (auto it = root.begin(); it != root.end(); ++it) {
      const std::string& name = it.key();

      if (config_.skip_fields.count(name)) continue;

      if (config_.full_mask.count(name)) {
        output[name] = kRedactionToken;
        continue;
      }

      auto rule = config_.partial_mask.find(name);
      if (rule != config_.partial_mask.end()) {
        output[name] = applyPartialMask(valueText(it.value()), rule->second);
        continue;
      }

      if (config_.log_level_field && equalsIgnoreCase(name, *config_.log_level_field)) {
        auto mapped = config_.log_level_map.find(valueText(it.value()));
        if (mapped != config_.log_level_map.end()) {
          output[name] = mapped->second;
        } else {
          output[name] = it.value();
        }
        continue;
      }

      output[name] = it.value();
    }

    return LineResult::emit(output.dump(-1, ' ', false, json::error_handler_t::replace));
  } catch (const json::parse_error& e) {
    if (logger_) {
      logger_->warning(kComponent, "Skipping invalid JSON log line (" +
                                       std::to_string(raw_line.size()) + " bytes): " + e.what());
    }
    return LineResult::drop(LineStatus::MALFORMED);
  } catch (const std::exception& e) {
    if (logger_) {
      logger_->error(kComponent, "Unexpected error while processing log line: " + std::string(e.what()));
    }
    return LineResult::drop(LineStatus::FAILED);
  }
}

std::string JsonLogProcessor::applyPartialMask(const std::string& value, const MaskRule& rule) {
  if (value.empty()) return value;

  const std::vector<size_t> offsets = codePointOffsets(value);
  const long length = static_cast<long>(offsets.size());

  const long start = std::min<long>(std::max(rule.visible_start, 0), length);
  const long end = std::min<long>(std::max(rule.visible_end, 0), length - start);
  const long masked = length - start - end;
  if (masked <= 0) return value;

  const size_t head_bytes = offsets[start];
  const size_t tail_offset = end > 0 ? offsets[length - end] : value.size();

  std::string result;
  result.reserve(head_bytes + static_cast<size_t>(masked) + (value.size() - tail_offset));
  result.append(value, 0, head_bytes);
  result.append(static_cast<size_t>(masked), kMaskChar);
  result.append(value, tail_offset, std::string::npos);
  return result;
}

}  // namespace log_backup
