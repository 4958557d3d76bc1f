// File: include/compchat/core/events/jsonl_journal_sink.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "compchat/core/events/journal_sink.hpp"
#include "compchat/core/status.hpp"

namespace compchat {

// JSONL journal.
// Writes every record line to:
//   1) a unique per-run file: journal_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: journal_latest.jsonl (truncated each run)
class JsonlJournalSink final : public JournalSink {
 public:
  JsonlJournalSink() = default;
  ~JsonlJournalSink() override;

  const std::string& path() const { return path_; }
  const std::string& latest_path() const { return latest_path_; }

  Status open(const RunInfo& run) override;
  Status emit(const JournalRecord& r) override;
  Status flush() override;
  void close() override;

 private:
  Status write_json_(const nlohmann::json& j);
  Status write_line_(const std::string& line);
  Status flush_locked_();
  void close_locked_();

  static void prune_journal_dir(const std::string& dir, std::size_t keep_last);

  std::mutex mu_;
  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;
};

}  // namespace compchat
