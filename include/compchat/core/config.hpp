// include/compchat/core/config.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

// Units policy:
// - Durations in nanoseconds (int64) internally, seconds in YAML
// - Sizes of rendered text in characters

// -----------------------------
// Dataset source
// -----------------------------
struct DatasetConfig {
  std::string type = "table_dir";  // table_dir
  std::string path = "data/comparisons";

  // LRU cache in front of the source. 0 disables it.
  std::size_t cache_entries = 32;
  DurationNs cache_ttl_ns = seconds_to_ns(300.0);
};

// -----------------------------
// Reasoning backend
// -----------------------------
struct BackendConfig {
  std::string type = "scripted";  // scripted
  std::string model = "gpt-3.5-turbo";
  bool streaming = true;

  // Name of the environment variable holding the key. The key itself never
  // lives in a config file.
  std::string api_key_env = "OPENAI_API_KEY";
  std::string api_key;  // filled by load_config from api_key_env

  // scripted backend: transcript book
  std::string script_path = "data/scripts/default.yaml";
};

// -----------------------------
// Model profiles
// -----------------------------
struct ModelsConfig {
  // Chat models take longer inputs than completion models.
  std::vector<std::string> chat_models = {
      "gpt-4",
      "gpt-3.5-turbo",
      "gpt-3.5-turbo-16k",
      "gpt-3.5-turbo-0613",
      "gpt-3.5-turbo-16k-0613",
      "gpt-4-32k",
  };

  // How much table text may be embedded verbatim in a prompt.
  std::size_t completion_context_chars = 6000;
  std::size_t chat_context_chars = 24000;
};

// -----------------------------
// Agent variants
// -----------------------------
struct TabularVariantConfig {
  // Rows embedded when the full table does not fit the context budget.
  std::size_t head_rows = 5;
  int max_iterations = 15;
  DurationNs max_execution_time_ns = 0;  // 0 = unbounded
};

struct StructuredVariantConfig {
  std::size_t max_value_length_completion = 4000;
  std::size_t max_value_length_chat = 13000;
  int max_iterations = 15;

  // Structured reasoning is the variant prone to runaway tool loops.
  DurationNs max_execution_time_ns = seconds_to_ns(1.0);
};

struct VariantsConfig {
  TabularVariantConfig tabular;
  StructuredVariantConfig structured;
};

// -----------------------------
// Push transport
// -----------------------------
struct TransportConfig {
  std::size_t channel_capacity = 64;
  // How long a full channel may back off the producer before the push fails.
  int send_timeout_ms = 250;
};

// -----------------------------
// Output (journal)
// -----------------------------
struct OutputConfig {
  // Where to write the query journal. Empty disables it.
  std::string journal_dir = "out";
  std::size_t keep_journals = 50;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  DatasetConfig dataset;
  BackendConfig backend;
  ModelsConfig models;
  VariantsConfig variants;
  TransportConfig transport;
  OutputConfig output;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.dataset.type != "table_dir") {
    return Status::invalid_argument("dataset.type must be 'table_dir'");
  }
  if (cfg.dataset.path.empty()) {
    return Status::invalid_argument("dataset.path must not be empty");
  }
  if (cfg.dataset.cache_ttl_ns < 0) {
    return Status::invalid_argument("dataset.cache_ttl_s must be >= 0");
  }
  if (cfg.backend.type != "scripted") {
    return Status::invalid_argument("backend.type must be 'scripted'");
  }
  if (cfg.backend.model.empty()) {
    return Status::invalid_argument("backend.model must not be empty");
  }
  if (cfg.backend.type == "scripted" && cfg.backend.script_path.empty()) {
    return Status::invalid_argument("backend.script_path must not be empty for scripted backend");
  }
  if (cfg.models.completion_context_chars == 0 || cfg.models.chat_context_chars == 0) {
    return Status::invalid_argument("models.*_context_chars must be > 0");
  }
  if (cfg.variants.tabular.head_rows == 0) {
    return Status::invalid_argument("variants.tabular.head_rows must be > 0");
  }
  if (cfg.variants.tabular.max_iterations <= 0 || cfg.variants.structured.max_iterations <= 0) {
    return Status::invalid_argument("variants.*.max_iterations must be > 0");
  }
  if (cfg.variants.tabular.max_execution_time_ns < 0 ||
      cfg.variants.structured.max_execution_time_ns < 0) {
    return Status::invalid_argument("variants.*.max_execution_time_s must be >= 0");
  }
  if (cfg.variants.structured.max_value_length_completion == 0 ||
      cfg.variants.structured.max_value_length_chat == 0) {
    return Status::invalid_argument("variants.structured.max_value_length_* must be > 0");
  }
  if (cfg.transport.channel_capacity == 0) {
    return Status::invalid_argument("transport.channel_capacity must be > 0");
  }
  if (cfg.transport.send_timeout_ms < 0) {
    return Status::invalid_argument("transport.send_timeout_ms must be >= 0");
  }
  return Status::ok_status();
}

}  // namespace compchat
