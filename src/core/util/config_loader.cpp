// src/core/util/config_loader.cpp
#include "compchat/core/util/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace compchat {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static void maybe_set_seconds(const YAML::Node& n, const char* key, DurationNs& out) {
  if (!n || !n[key]) return;
  out = seconds_to_ns(n[key].as<double>());
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 8) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static std::string resolve_against(const fs::path& dir, const std::string& p) {
  if (p.empty() || fs::path(p).is_absolute()) return p;
  return (dir / p).lexically_normal().string();
}

static void apply(const YAML::Node& y, Config& cfg) {
  // --- dataset
  if (is_map(y["dataset"])) {
    const auto d = y["dataset"];
    maybe_set(d, "type", cfg.dataset.type);
    maybe_set(d, "path", cfg.dataset.path);
    maybe_set(d, "cache_entries", cfg.dataset.cache_entries);
    maybe_set_seconds(d, "cache_ttl_s", cfg.dataset.cache_ttl_ns);
  }

  // --- backend
  if (is_map(y["backend"])) {
    const auto b = y["backend"];
    maybe_set(b, "type", cfg.backend.type);
    maybe_set(b, "model", cfg.backend.model);
    maybe_set(b, "streaming", cfg.backend.streaming);
    maybe_set(b, "api_key_env", cfg.backend.api_key_env);
    maybe_set(b, "script_path", cfg.backend.script_path);
  }

  // --- models
  if (is_map(y["models"])) {
    const auto m = y["models"];
    if (m["chat_models"]) cfg.models.chat_models = m["chat_models"].as<std::vector<std::string>>();
    maybe_set(m, "completion_context_chars", cfg.models.completion_context_chars);
    maybe_set(m, "chat_context_chars", cfg.models.chat_context_chars);
  }

  // --- variants
  if (is_map(y["variants"])) {
    const auto v = y["variants"];
    if (is_map(v["tabular"])) {
      const auto t = v["tabular"];
      maybe_set(t, "head_rows", cfg.variants.tabular.head_rows);
      maybe_set(t, "max_iterations", cfg.variants.tabular.max_iterations);
      maybe_set_seconds(t, "max_execution_time_s", cfg.variants.tabular.max_execution_time_ns);
    }
    if (is_map(v["structured"])) {
      const auto s = v["structured"];
      maybe_set(s, "max_value_length_completion", cfg.variants.structured.max_value_length_completion);
      maybe_set(s, "max_value_length_chat", cfg.variants.structured.max_value_length_chat);
      maybe_set(s, "max_iterations", cfg.variants.structured.max_iterations);
      maybe_set_seconds(s, "max_execution_time_s", cfg.variants.structured.max_execution_time_ns);
    }
  }

  // --- transport
  if (is_map(y["transport"])) {
    const auto t = y["transport"];
    maybe_set(t, "channel_capacity", cfg.transport.channel_capacity);
    maybe_set(t, "send_timeout_ms", cfg.transport.send_timeout_ms);
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "journal_dir", cfg.output.journal_dir);
    maybe_set(o, "keep_journals", cfg.output.keep_journals);
  }
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  auto yaml_r = load_with_includes(path, 0);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  const YAML::Node y = yaml_r.take_value();

  Config cfg;  // defaults
  try {
    apply(y, cfg);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("bad value in " + path_str + ": " + e.what()));
  }

  const fs::path dir = path.parent_path();
  cfg.dataset.path = resolve_against(dir, cfg.dataset.path);
  cfg.backend.script_path = resolve_against(dir, cfg.backend.script_path);
  cfg.output.journal_dir = resolve_against(dir, cfg.output.journal_dir);

  if (!cfg.backend.api_key_env.empty()) {
    if (const char* key = std::getenv(cfg.backend.api_key_env.c_str())) cfg.backend.api_key = key;
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

}  // namespace compchat
