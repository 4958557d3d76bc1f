// File: src/adapters/scripted/scripted_backend.cpp
#include "compchat/adapters/scripted/scripted_backend.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace compchat {
namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

Result<ScriptStep> parse_step(const YAML::Node& n) {
  if (!n.IsMap()) return Result<ScriptStep>::err(Status::parse_error("script step must be a map"));

  ScriptStep s;
  if (n["thought"]) {
    s.kind = ScriptStep::Kind::kThought;
    s.text = n["thought"].as<std::string>();
  } else if (n["tool"]) {
    s.kind = ScriptStep::Kind::kTool;
    s.tool = n["tool"].as<std::string>();
    if (s.tool != "list_keys" && s.tool != "get_value" && s.tool != "cell") {
      return Result<ScriptStep>::err(Status::parse_error("unknown tool '" + s.tool + "'"));
    }
    s.arg = n["arg"] ? n["arg"].as<std::string>() : std::string();
  } else if (n["answer"]) {
    s.kind = ScriptStep::Kind::kAnswer;
    s.text = n["answer"].as<std::string>();
  } else if (n["unknown"]) {
    s.kind = ScriptStep::Kind::kUnknown;
  } else if (n["fail"]) {
    s.kind = ScriptStep::Kind::kFail;
    s.text = n["fail"].as<std::string>();
  } else {
    return Result<ScriptStep>::err(
        Status::parse_error("script step needs one of thought|tool|answer|unknown|fail"));
  }
  return Result<ScriptStep>::ok(std::move(s));
}

Result<Script> parse_script(const YAML::Node& n) {
  if (!n.IsMap()) return Result<Script>::err(Status::parse_error("script must be a map"));

  Script sc;
  if (n["match"]) sc.match = n["match"].as<std::string>();
  if (n["tag"]) {
    auto tag_r = parse_strategy_tag(n["tag"].as<std::string>());
    if (!tag_r.ok()) return Result<Script>::err(Status::parse_error(tag_r.status().message()));
    sc.tag = tag_r.value();
  }
  if (n["step_delay_ms"]) sc.step_delay_ms = n["step_delay_ms"].as<int>();
  if (n["loop"]) sc.loop = n["loop"].as<bool>();

  const YAML::Node steps = n["steps"];
  if (!steps || !steps.IsSequence() || steps.size() == 0) {
    return Result<Script>::err(Status::parse_error("script needs a non-empty 'steps' sequence"));
  }
  for (std::size_t i = 0; i < steps.size(); ++i) {
    auto step_r = parse_step(steps[i]);
    if (!step_r.ok()) {
      return Result<Script>::err(
          Status::parse_error("step " + std::to_string(i) + ": " + step_r.status().message()));
    }
    sc.steps.push_back(step_r.take_value());
  }
  if (sc.step_delay_ms < 0) return Result<Script>::err(Status::parse_error("step_delay_ms must be >= 0"));
  return Result<Script>::ok(std::move(sc));
}

std::string join_keys(const std::vector<std::string>& keys) {
  std::string out = "[";
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i) out += ", ";
    out += keys[i];
  }
  out += "]";
  return out;
}

}  // namespace

// -----------------------------
// ScriptBook
// -----------------------------
Result<ScriptBook> ScriptBook::parse(const YAML::Node& root) {
  if (!root.IsMap()) return Result<ScriptBook>::err(Status::parse_error("script book must be a map"));

  try {
    ScriptBook book;

    if (root["default"]) {
      auto fb = parse_script(root["default"]);
      if (!fb.ok()) {
        return Result<ScriptBook>::err(Status::parse_error("default: " + fb.status().message()));
      }
      book.fallback_ = fb.take_value();
    } else {
      book.fallback_.steps.push_back(ScriptStep{ScriptStep::Kind::kUnknown, "", "", ""});
    }

    if (root["scripts"]) {
      const YAML::Node scripts = root["scripts"];
      if (!scripts.IsSequence()) return Result<ScriptBook>::err(Status::parse_error("'scripts' must be a sequence"));
      for (std::size_t i = 0; i < scripts.size(); ++i) {
        auto sc = parse_script(scripts[i]);
        if (!sc.ok()) {
          return Result<ScriptBook>::err(
              Status::parse_error("scripts[" + std::to_string(i) + "]: " + sc.status().message()));
        }
        if (sc->match.empty()) {
          return Result<ScriptBook>::err(
              Status::parse_error("scripts[" + std::to_string(i) + "]: 'match' must not be empty"));
        }
        book.scripts_.push_back(sc.take_value());
      }
    }
    return Result<ScriptBook>::ok(std::move(book));
  } catch (const YAML::Exception& e) {
    return Result<ScriptBook>::err(Status::parse_error(std::string("bad script book: ") + e.what()));
  }
}

Result<ScriptBook> ScriptBook::load_file(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    return Result<ScriptBook>::err(Status::not_found("cannot open script book: " + path));
  } catch (const YAML::Exception& e) {
    return Result<ScriptBook>::err(Status::parse_error("YAML parse error in " + path + ": " + e.what()));
  }
  return parse(root);
}

const Script& ScriptBook::select(const std::string& query, StrategyTag tag) const {
  const std::string q = lower(query);
  for (const auto& sc : scripts_) {
    if (sc.tag && *sc.tag != tag) continue;
    if (q.find(lower(sc.match)) != std::string::npos) return sc;
  }
  return fallback_;
}

// -----------------------------
// ScriptedBackend
// -----------------------------
ScriptedBackend::ScriptedBackend(std::shared_ptr<const ScriptBook> book, BackendOptions options)
    : book_(std::move(book)), options_(std::move(options)) {}

Status ScriptedBackend::begin(const ReasoningContext& ctx) {
  if (script_ != nullptr) return Status::invalid_argument("scripted backend already started");
  ctx_ = ctx;
  script_ = &book_->select(ctx.query, ctx.tag);
  next_ = 0;
  return Status::ok_status();
}

Result<ReasoningStep> ScriptedBackend::step() {
  if (script_ == nullptr) return Result<ReasoningStep>::err(Status::invalid_argument("step() before begin()"));

  if (next_ >= script_->steps.size()) {
    if (!script_->loop) {
      return Result<ReasoningStep>::err(Status::reasoning_failure("script ended without an answer"));
    }
    next_ = 0;
  }
  if (script_->step_delay_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(script_->step_delay_ms));
  }

  const ScriptStep& s = script_->steps[next_++];
  ++played_;

  switch (s.kind) {
    case ScriptStep::Kind::kThought:
      return Result<ReasoningStep>::ok(ReasoningStep{ReasoningStep::Kind::kThought, s.text});
    case ScriptStep::Kind::kTool:
      return run_tool(s);
    case ScriptStep::Kind::kAnswer:
      return Result<ReasoningStep>::ok(ReasoningStep{ReasoningStep::Kind::kAnswer, s.text});
    case ScriptStep::Kind::kUnknown:
      return Result<ReasoningStep>::ok(ReasoningStep{ReasoningStep::Kind::kNoAnswer, ""});
    case ScriptStep::Kind::kFail:
      return Result<ReasoningStep>::err(Status::io_error("backend error: " + s.text));
  }
  return Result<ReasoningStep>::err(Status::internal("unknown script step"));
}

// Tool errors come back as observations, as a hosted agent would see them.
Result<ReasoningStep> ScriptedBackend::run_tool(const ScriptStep& s) const {
  std::string obs;

  if (s.tool == "cell") {
    if (ctx_.table == nullptr) {
      return Result<ReasoningStep>::err(Status::invalid_argument("cell tool needs a table"));
    }
    const auto slash = s.arg.find('/');
    if (slash == std::string::npos) {
      obs = "error: cell argument must be 'row/column'";
    } else {
      auto cell_r = ctx_.table->find(s.arg.substr(0, slash), s.arg.substr(slash + 1));
      obs = cell_r.ok() ? cell_r->joined() : "error: " + cell_r.status().message();
    }
  } else {
    if (ctx_.document == nullptr) {
      return Result<ReasoningStep>::err(
          Status::invalid_argument(s.tool + " tool needs a structured document"));
    }
    if (s.tool == "list_keys") {
      auto keys_r = ctx_.document->list_keys(s.arg);
      obs = keys_r.ok() ? join_keys(keys_r.value()) : "error: " + keys_r.status().message();
    } else {
      auto value_r = ctx_.document->get_value(s.arg);
      obs = value_r.ok() ? value_r.value() : "error: " + value_r.status().message();
    }
  }

  return Result<ReasoningStep>::ok(
      ReasoningStep{ReasoningStep::Kind::kThought, s.tool + "(" + s.arg + ") -> " + obs});
}

// -----------------------------
// ScriptedBackendFactory
// -----------------------------
ScriptedBackendFactory::ScriptedBackendFactory(std::shared_ptr<const ScriptBook> book)
    : book_(std::move(book)) {}

Result<std::unique_ptr<IReasoningBackend>> ScriptedBackendFactory::create(const BackendOptions& options) {
  if (!book_) {
    return Result<std::unique_ptr<IReasoningBackend>>::err(Status::internal("no script book loaded"));
  }
  if (options.model.empty()) {
    return Result<std::unique_ptr<IReasoningBackend>>::err(Status::invalid_argument("backend model must not be empty"));
  }
  ++created_;
  return Result<std::unique_ptr<IReasoningBackend>>::ok(std::make_unique<ScriptedBackend>(book_, options));
}

}  // namespace compchat
