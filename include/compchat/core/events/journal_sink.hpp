// File: include/compchat/core/events/journal_sink.hpp
#pragma once

#include <cstddef>
#include <string>

#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

// Query journal: the lifecycle log of every query a process runs.
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  std::string config_path;
  std::string journal_dir;
  std::string config_hash;

  // Older per-run journals beyond this count are pruned on open (0 keeps all).
  std::size_t keep_last = 50;

  TimestampNs start_time_ns;       // run-relative, always 0
  TimestampNs wall_start_time_ns;  // epoch
};

struct JournalRecord {
  std::string type;  // e.g. "state", "push_abandoned", "query_failed"
  QueryId query_id;

  TimestampNs t_ns;       // since run start (steady clock)
  TimestampNs t_wall_ns;  // epoch

  std::string state;    // optional, set on "state" records
  std::string message;  // optional human-readable detail
};

// Implementations must accept emit() from several threads.
class JournalSink {
 public:
  virtual ~JournalSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const JournalRecord& r) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace compchat
