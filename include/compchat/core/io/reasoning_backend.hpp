// File: include/compchat/core/io/reasoning_backend.hpp
#pragma once

#include <memory>
#include <string>

#include "compchat/core/data/comparison_table.hpp"
#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

// Construction parameters for one backend instance (one per session).
struct BackendOptions {
  std::string model;
  bool streaming = true;
  std::string api_key;
};

// What a session hands the backend before the first step. Pointers refer to
// data owned by the session and stay valid until the session is destroyed.
struct ReasoningContext {
  StrategyTag tag = StrategyTag::kTabular;

  // Full prompt: instruction wrapper + user query.
  std::string prompt;
  // The user query alone, for backends that route on it.
  std::string query;

  // TABULAR: table rendering embedded in the prompt context.
  std::string table_text;

  const ComparisonTable* table = nullptr;
  // STRUCTURED only.
  const DocumentView* document = nullptr;
};

struct ReasoningStep {
  enum class Kind {
    kThought,   // intermediate step description
    kAnswer,    // final answer
    kNoAnswer,  // backend cannot determine an answer
  };

  Kind kind = Kind::kThought;
  std::string text;
};

// Opaque reasoning engine. Only ReasoningSession talks to it.
class IReasoningBackend {
 public:
  virtual ~IReasoningBackend() = default;

  virtual Status begin(const ReasoningContext& ctx) = 0;

  // One backend step. Errors (transport, malformed output) come back as a
  // non-OK status; the session turns them into reasoning_failure.
  virtual Result<ReasoningStep> step() = 0;

  virtual std::string name() const = 0;
};

class IReasoningBackendFactory {
 public:
  virtual ~IReasoningBackendFactory() = default;

  // In-memory construction only; must not contact the backend.
  virtual Result<std::unique_ptr<IReasoningBackend>> create(const BackendOptions& options) = 0;
};

}  // namespace compchat
