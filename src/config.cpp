/**
 * @file config.cpp
 * @brief JSON configuration loading and service wiring.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 */

#include "log_backup/config.h"

#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace log_backup {

using json = nlohmann::json;

namespace {

// Returns the object member `key` of `parent`, or null when absent.
const json* section(const json& parent, const char* key) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) return nullptr;
  if (!it->is_object()) {
    throw ConfigError(std::string("'") + key + "' must be an object");
  }
  return &*it;
}

void readString(const json& parent, const char* key, std::string& target) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) return;
  if (!it->is_string()) {
    throw ConfigError(std::string("'") + key + "' must be a string");
  }
  target = it->get<std::string>();
}

// Non-negative integer member; absent keeps the default.
bool readCount(const json& parent, const char* key, int64_t& target) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) return false;
  if (!it->is_number_integer()) {
    throw ConfigError(std::string("'") + key + "' must be an integer");
  }
  target = it->get<int64_t>();
  if (target < 0) {
    throw ConfigError(std::string("'") + key + "' must not be negative");
  }
  return true;
}

template <typename Set>
void readNames(const json& parent, const char* key, Set& target) {
  auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) return;
  if (!it->is_array()) {
    throw ConfigError(std::string("'") + key + "' must be an array of field names");
  }
  for (const auto& name : *it) {
    if (!name.is_string()) {
      throw ConfigError(std::string("'") + key + "' must contain only strings");
    }
    target.insert(name.get<std::string>());
  }
}

void parseProcessing(const json& processing, ProcessingConfig& config) {
  if (const json* masking = section(processing, "MaskingRules")) {
    readNames(*masking, "Full", config.full_mask);

    if (const json* partial = section(*masking, "Partial")) {
      for (auto it = partial->begin(); it != partial->end(); ++it) {
        if (!it->is_object()) {
          throw ConfigError("partial mask rule '" + it.key() + "' must be an object");
        }
        int64_t start = 0;
        int64_t end = 0;
        readCount(*it, "VisibleStart", start);
        readCount(*it, "VisibleEnd", end);
        if (start > std::numeric_limits<int>::max() || end > std::numeric_limits<int>::max()) {
          throw ConfigError("partial mask rule '" + it.key() + "' has a visible length above " +
                            std::to_string(std::numeric_limits<int>::max()));
        }
        config.partial_mask[it.key()] = MaskRule{static_cast<int>(start), static_cast<int>(end)};
      }
    }
  }

  readNames(processing, "SkipIfContains", config.skip_if_contains);
  readNames(processing, "SkipFields", config.skip_fields);

  if (const json* level = section(processing, "LogLevelNormalization")) {
    std::string field;
    readString(*level, "FieldName", field);
    if (!field.empty()) config.log_level_field = field;

    if (const json* mappings = section(*level, "Mappings")) {
      for (auto it = mappings->begin(); it != mappings->end(); ++it) {
        if (!it->is_string()) {
          throw ConfigError("log level mapping '" + it.key() + "' must be a string");
        }
        config.log_level_map[it.key()] = it->get<std::string>();
      }
    }
  }
}

}  // namespace

BackupConfig parseConfig(const std::string& text) {
  BackupConfig config;
  json document;
  try {
    document = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("invalid JSON: ") + e.what());
  }
  if (!document.is_object()) {
    throw ConfigError("configuration must be a JSON object");
  }

  try {
    if (const json* paths = section(document, "Paths")) {
      readString(*paths, "Input", config.input_directory);
      readString(*paths, "Output", config.output_directory);
      readString(*paths, "State", config.state_file);
    }

    if (const json* worker = section(document, "Worker")) {
      int64_t value = 0;
      if (readCount(*worker, "IntervalSeconds", value)) config.interval = std::chrono::seconds(value);
      if (readCount(*worker, "MaxParallelFiles", value)) config.runner.max_parallel_files = static_cast<size_t>(value);
      if (readCount(*worker, "CheckpointBatchLines", value)) {
        config.runner.checkpoint_batch_lines = static_cast<size_t>(value);
      }
    }

    if (const json* output = section(document, "Output")) {
      std::string compression;
      readString(*output, "Compression", compression);
      auto type = compressionFromString(compression);
      if (!type) throw ConfigError("unknown compression '" + compression + "'");
      config.compression = *type;
    }

    if (const json* logging = section(document, "Logging")) {
      std::string severity;
      readString(*logging, "MinSeverity", severity);
      if (!severity.empty()) {
        auto level = severityFromString(severity);
        if (!level) throw ConfigError("unknown severity '" + severity + "'");
        config.log_severity = *level;
      }
      readString(*logging, "File", config.log_file);
    }

    if (const json* processing = section(document, "Processing")) {
      parseProcessing(*processing, config.processing);
    }
  } catch (const json::exception& e) {
    throw ConfigError(e.what());
  }

  return config;
}

BackupConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open config file " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  try {
    return parseConfig(buffer.str());
  } catch (const ConfigError& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

void validateConfig(const BackupConfig& config) {
  if (config.input_directory.empty()) throw ConfigError("input directory (Paths.Input) is required");
  if (config.output_directory.empty()) throw ConfigError("output directory (Paths.Output) is required");
  if (config.state_file.empty()) throw ConfigError("state file (Paths.State) is required");
  if (config.interval.count() < 1) throw ConfigError("Worker.IntervalSeconds must be at least 1");
  if (config.runner.max_parallel_files < 1) throw ConfigError("Worker.MaxParallelFiles must be at least 1");
}

std::shared_ptr<BackupRunner> buildRunner(const BackupConfig& config, std::shared_ptr<Logger> logger) {
  auto source = std::make_shared<FileLogSource>(config.input_directory, logger);
  auto sink = std::make_shared<FileLogSink>(config.output_directory, config.compression, logger);
  auto checkpoints = std::make_shared<CheckpointStore>(config.state_file, logger);
  auto processor = std::make_shared<JsonLogProcessor>(config.processing, logger);
  return std::make_shared<BackupRunner>(source, sink, checkpoints, processor, config.runner, logger);
}

}  // namespace log_backup
