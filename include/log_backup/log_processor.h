/**
 * @file log_processor.h
 * @brief Line-level sanitizing of JSON log records.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * A processor turns one raw log line into either a sanitized line or a drop
 * decision. The JSON implementation masks sensitive fields, removes unwanted
 * fields, drops unwanted records and normalizes the log-level field while
 * keeping the original field order and value types.
 */

#ifndef LOG_BACKUP_LOG_PROCESSOR_H
#define LOG_BACKUP_LOG_PROCESSOR_H

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "log_backup/diagnostics.h"

namespace log_backup {

/// Replacement written for fully masked fields.
inline constexpr const char* kRedactionToken = "********";

/// Character used for the hidden part of partially masked fields.
inline constexpr char kMaskChar = '*';

/**
 * @struct MaskRule
 * @brief Partial masking policy for one field.
 *
 * With visible_start = 2 and visible_end = 2, "1234567890" becomes
 * "12******90".
 */
struct MaskRule {
  int visible_start = 0;  ///< Characters kept at the beginning
  int visible_end = 0;    ///< Characters kept at the end
};

/**
 * @struct CaseInsensitiveLess
 * @brief ASCII case-insensitive ordering for field-name keyed containers.
 */
struct CaseInsensitiveLess {
  bool operator()(const std::string& a, const std::string& b) const;
};

/**
 * @struct ProcessingConfig
 * @brief Rule sets consumed by JsonLogProcessor.
 */
struct ProcessingConfig {
  std::set<std::string, CaseInsensitiveLess>           full_mask;         ///< Fields replaced by kRedactionToken
  std::map<std::string, MaskRule, CaseInsensitiveLess> partial_mask;      ///< Fields partially masked
  std::set<std::string>                                skip_if_contains;  ///< Presence drops the record
  std::set<std::string>                                skip_fields;       ///< Fields removed from output
  std::optional<std::string>                           log_level_field;   ///< Field holding the log level
  std::map<std::string, std::string, CaseInsensitiveLess> log_level_map;  ///< Level normalization table
};

/**
 * @enum LineStatus
 * @brief Outcome of processing one line.
 */
enum class LineStatus {
  EMITTED,    ///< Sanitized output available
  SKIPPED,    ///< Dropped by a skip-if-contains rule
  MALFORMED,  ///< Not a JSON object
  FAILED      ///< Unexpected error while transforming
};

/**
 * @brief Convert line status to string representation.
 * @param status The line status.
 * @return String representation of the status.
 */
inline std::string lineStatusToString(LineStatus status) {
  switch (status) {
    case LineStatus::EMITTED: return "EMITTED";
    case LineStatus::SKIPPED: return "SKIPPED";
    case LineStatus::MALFORMED: return "MALFORMED";
    case LineStatus::FAILED: return "FAILED";
    default: return "UNKNOWN";
  }
}

/**
 * @struct LineResult
 * @brief Typed result of LogProcessor::process.
 */
struct LineResult {
  LineStatus  status = LineStatus::FAILED;  ///< What happened to the line
  std::string output;                       ///< Sanitized line, set only when EMITTED

  bool emitted() const { return status == LineStatus::EMITTED; }

  static LineResult emit(std::string line) { return {LineStatus::EMITTED, std::move(line)}; }
  static LineResult drop(LineStatus status) { return {status, std::string()}; }
};

/**
 * @class LogProcessor
 * @brief Interface for single-line transformers.
 */
class LogProcessor {
public:
  virtual ~LogProcessor() = default;

  /**
   * @brief Transforms one raw, non-blank line.
   * @param raw_line The line without its terminator.
   * @return The typed outcome; only EMITTED results carry output.
   */
  virtual LineResult process(const std::string& raw_line) const = 0;
};

/**
 * @class JsonLogProcessor
 * @brief Sanitizes JSON object records.
 *
 * Processing order per record:
 * 1. parse; anything but a JSON object is MALFORMED;
 * 2. any skip_if_contains field present: SKIPPED;
 * 3. per field in original order: remove skip_fields, else full mask,
 *    else partial mask, else normalize the log-level field, else keep as is;
 * 4. serialize compactly in the original order.
 *
 * process() never throws: unexpected errors are logged and reported as FAILED.
 */
class JsonLogProcessor : public LogProcessor {
public:
  /**
   * @brief Constructs a processor.
   * @param config Rule sets to apply.
   * @param logger Diagnostics sink; may be null.
   */
  explicit JsonLogProcessor(ProcessingConfig config, std::shared_ptr<Logger> logger = nullptr);

  LineResult process(const std::string& raw_line) const override;

  /**
   * @brief Gets the active rule sets.
   * @return The processing configuration.
   */
  const ProcessingConfig& config() const { return config_; }

  /**
   * @brief Applies a partial mask to a value.
   *
   * Keeps the first min(visible_start, length) and the last
   * min(visible_end, length - start) UTF-8 characters and replaces the rest
   * with one kMaskChar per hidden character. Values too short to hide
   * anything are returned unchanged.
   *
   * @param value The text to mask.
   * @param rule The masking rule.
   * @return The masked text.
   */
  static std::string applyPartialMask(const std::string& value, const MaskRule& rule);

private:
  ProcessingConfig        config_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace log_backup

#endif  // LOG_BACKUP_LOG_PROCESSOR_H
