// File: include/compchat/adapters/scripted/scripted_backend.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "compchat/core/io/reasoning_backend.hpp"

namespace YAML {
class Node;
}

namespace compchat {

// One scripted backend step.
struct ScriptStep {
  enum class Kind {
    kThought,  // emit text as a thought
    kTool,     // run a navigation tool, emit the observation as a thought
    kAnswer,   // final answer
    kUnknown,  // backend gives up (no answer)
    kFail,     // backend error
  };

  Kind kind = Kind::kThought;
  std::string text;  // thought/answer/fail text
  std::string tool;  // list_keys | get_value | cell
  std::string arg;   // tool argument: document path, or "row/column" for cell
};

// Steps played back for queries that contain `match` (case-insensitive).
// An empty match only applies as the default script.
struct Script {
  std::string match;
  std::optional<StrategyTag> tag;  // restrict to one variant
  std::vector<ScriptStep> steps;
  int step_delay_ms = 0;
  bool loop = false;  // replay steps forever (never answers on its own)
};

// Transcript book for the scripted backend:
//
//   default:
//     steps:
//       - answer: "Sorry!, I do not know."
//   scripts:
//     - match: "how many"
//       tag: TABULAR
//       step_delay_ms: 0
//       steps:
//         - thought: "Counting the compared items"
//         - tool: cell
//           arg: "method/P1"
//         - answer: "3"
class ScriptBook {
 public:
  static Result<ScriptBook> load_file(const std::string& path);
  static Result<ScriptBook> parse(const YAML::Node& root);

  // First script whose match occurs in `query` and whose tag fits; else the
  // default script.
  [[nodiscard]] const Script& select(const std::string& query, StrategyTag tag) const;

  [[nodiscard]] const Script& fallback() const noexcept { return fallback_; }
  [[nodiscard]] const std::vector<Script>& scripts() const noexcept { return scripts_; }

  void set_fallback(Script s) { fallback_ = std::move(s); }
  void add(Script s) { scripts_.push_back(std::move(s)); }

 private:
  Script fallback_;
  std::vector<Script> scripts_;
};

// Deterministic backend that replays a script from a ScriptBook. Stands in
// for a hosted model: tool steps really navigate the table or document the
// session hands over.
class ScriptedBackend final : public IReasoningBackend {
 public:
  ScriptedBackend(std::shared_ptr<const ScriptBook> book, BackendOptions options);

  Status begin(const ReasoningContext& ctx) override;
  Result<ReasoningStep> step() override;

  std::string name() const override { return "scripted(" + options_.model + ")"; }

  [[nodiscard]] std::size_t steps_played() const noexcept { return played_; }

 private:
  Result<ReasoningStep> run_tool(const ScriptStep& s) const;

  std::shared_ptr<const ScriptBook> book_;
  BackendOptions options_;

  ReasoningContext ctx_;
  const Script* script_ = nullptr;
  std::size_t next_ = 0;
  std::size_t played_ = 0;
};

class ScriptedBackendFactory final : public IReasoningBackendFactory {
 public:
  explicit ScriptedBackendFactory(std::shared_ptr<const ScriptBook> book);

  Result<std::unique_ptr<IReasoningBackend>> create(const BackendOptions& options) override;

  [[nodiscard]] std::size_t created() const noexcept { return created_.load(); }

 private:
  std::shared_ptr<const ScriptBook> book_;
  std::atomic<std::size_t> created_{0};
};

}  // namespace compchat
