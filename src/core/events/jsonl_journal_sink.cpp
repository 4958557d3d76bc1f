// File: src/core/events/jsonl_journal_sink.cpp
#include "compchat/core/events/jsonl_journal_sink.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace compchat {
namespace {

double ns_to_s(std::int64_t ns) { return static_cast<double>(ns) * 1e-9; }

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::int64_t parse_journal_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "journal_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == "journal_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid =
      name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid)) return -1;

  try {
    return std::stoll(mid);
  } catch (const std::out_of_range&) {
    return -1;
  }
}

}  // namespace

JsonlJournalSink::~JsonlJournalSink() { close(); }

void JsonlJournalSink::prune_journal_dir(const std::string& dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::string name = it.path().filename().string();
    const std::int64_t k = parse_journal_epoch_ns_from_name(name);
    if (k < 0) continue;

    files.push_back(Entry{k, it.path()});
  }

  if (files.size() <= keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status JsonlJournalSink::open(const RunInfo& run) {
  std::lock_guard<std::mutex> lk(mu_);
  close_locked_();

  std::error_code ec;
  std::filesystem::create_directories(run.journal_dir, ec);
  if (ec) {
    return Status::io_error("failed creating journal_dir '" + run.journal_dir + "': " + ec.message());
  }

  // The new file is not there yet, so keep one slot free for it.
  if (run.keep_last > 0) prune_journal_dir(run.journal_dir, run.keep_last - 1);

  const std::int64_t wall0 = run.wall_start_time_ns.ns;
  const std::int64_t t0 = run.start_time_ns.ns;

  path_ = join_path(run.journal_dir, "journal_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.journal_dir, "journal_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  nlohmann::json j;
  j["type"] = "run_started";
  j["t_ns"] = t0;
  j["t_s"] = ns_to_s(t0);
  j["t_wall_ns"] = wall0;
  j["t_wall_s"] = ns_to_s(wall0);
  j["config_path"] = run.config_path;
  j["config_hash"] = run.config_hash;

  COMPCHAT_RETURN_IF_ERROR(write_json_(j));
  return flush_locked_();
}

Status JsonlJournalSink::emit(const JournalRecord& r) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!open_) return Status::invalid_argument("JsonlJournalSink::emit called while not open");

  nlohmann::json j;
  j["type"] = r.type;
  j["query_id"] = r.query_id;
  j["t_ns"] = r.t_ns.ns;
  j["t_s"] = ns_to_s(r.t_ns.ns);
  j["t_wall_ns"] = r.t_wall_ns.ns;
  j["t_wall_s"] = ns_to_s(r.t_wall_ns.ns);

  if (!r.state.empty()) j["state"] = r.state;
  if (!r.message.empty()) j["message"] = r.message;

  return write_json_(j);
}

Status JsonlJournalSink::write_json_(const nlohmann::json& j) {
  // Record text comes from callers (dataset ids, questions) and may not be UTF-8.
  std::string line;
  try {
    line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception& e) {
    return Status::io_error(std::string("failed encoding journal record: ") + e.what());
  }
  return write_line_(line);
}

Status JsonlJournalSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlJournalSink::flush() {
  std::lock_guard<std::mutex> lk(mu_);
  return flush_locked_();
}

Status JsonlJournalSink::flush_locked_() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlJournalSink::close() {
  std::lock_guard<std::mutex> lk(mu_);
  close_locked_();
}

void JsonlJournalSink::close_locked_() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace compchat
