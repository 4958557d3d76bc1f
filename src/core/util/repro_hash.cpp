// File: src/core/util/repro_hash.cpp
#include "compchat/core/util/repro_hash.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace compchat {
namespace {

// FNV-1a 64-bit. Not cryptographic. Exactly what we want for fast, stable fingerprints.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_string_list(Fnv1a64& h, const std::vector<std::string>& v) {
  h.add_u64(static_cast<std::uint64_t>(v.size()));
  for (const auto& s : v) h.add_string(s);
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  // Dataset.
  h.add_string(cfg.dataset.type);
  h.add_string(cfg.dataset.path);
  h.add_u64(static_cast<std::uint64_t>(cfg.dataset.cache_entries));
  h.add_i64(cfg.dataset.cache_ttl_ns);

  // Backend. The key is a secret and must not shape the fingerprint.
  h.add_string(cfg.backend.type);
  h.add_string(cfg.backend.model);
  h.add_bool(cfg.backend.streaming);
  h.add_string(cfg.backend.api_key_env);
  h.add_string(cfg.backend.script_path);

  // Models.
  add_string_list(h, cfg.models.chat_models);
  h.add_u64(static_cast<std::uint64_t>(cfg.models.completion_context_chars));
  h.add_u64(static_cast<std::uint64_t>(cfg.models.chat_context_chars));

  // Variants.
  h.add_u64(static_cast<std::uint64_t>(cfg.variants.tabular.head_rows));
  h.add_i32(cfg.variants.tabular.max_iterations);
  h.add_i64(cfg.variants.tabular.max_execution_time_ns);

  h.add_u64(static_cast<std::uint64_t>(cfg.variants.structured.max_value_length_completion));
  h.add_u64(static_cast<std::uint64_t>(cfg.variants.structured.max_value_length_chat));
  h.add_i32(cfg.variants.structured.max_iterations);
  h.add_i64(cfg.variants.structured.max_execution_time_ns);

  // Transport.
  h.add_u64(static_cast<std::uint64_t>(cfg.transport.channel_capacity));
  h.add_i32(cfg.transport.send_timeout_ms);

  // Output.
  h.add_string(cfg.output.journal_dir);
  h.add_u64(static_cast<std::uint64_t>(cfg.output.keep_journals));

  return to_hex(h.h);
}

}  // namespace compchat
