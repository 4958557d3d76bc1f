// File: include/compchat/core/model/variant_selector.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "compchat/core/config.hpp"
#include "compchat/core/data/comparison_table.hpp"
#include "compchat/core/events/event_sink.hpp"
#include "compchat/core/io/reasoning_backend.hpp"
#include "compchat/core/model/model_profile.hpp"
#include "compchat/core/model/reasoning_session.hpp"
#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

// Builds a configured ReasoningSession for a strategy tag.
// In-memory construction only; the backend is created but never contacted.
class AgentVariantSelector {
 public:
  AgentVariantSelector(VariantsConfig variants,
                       ModelProfile profile,
                       BackendOptions backend_options,
                       IReasoningBackendFactory& factory);

  // unsupported_variant(...) for any tag outside the closed set, checked
  // before anything else happens.
  Result<std::unique_ptr<ReasoningSession>> build(ComparisonTable table,
                                                  StrategyTag tag,
                                                  std::shared_ptr<EventSink> sink) const;

  // Table text a TABULAR session embeds for a table of this shape.
  std::string tabular_context(const ComparisonTable& table) const;

  std::size_t structured_max_value_length() const noexcept;

  const ModelProfile& profile() const noexcept { return profile_; }
  const VariantsConfig& variants() const noexcept { return variants_; }

 private:
  Result<std::unique_ptr<IReasoningBackend>> make_backend() const;

  VariantsConfig variants_;
  ModelProfile profile_;
  BackendOptions backend_options_;
  IReasoningBackendFactory& factory_;
};

}  // namespace compchat
