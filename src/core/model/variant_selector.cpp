// File: src/core/model/variant_selector.cpp
#include "compchat/core/model/variant_selector.hpp"

#include <algorithm>
#include <utility>

namespace compchat {

AgentVariantSelector::AgentVariantSelector(VariantsConfig variants,
                                           ModelProfile profile,
                                           BackendOptions backend_options,
                                           IReasoningBackendFactory& factory)
    : variants_(std::move(variants)),
      profile_(std::move(profile)),
      backend_options_(std::move(backend_options)),
      factory_(factory) {
  backend_options_.model = profile_.model;
}

std::size_t AgentVariantSelector::structured_max_value_length() const noexcept {
  return profile_.chat ? variants_.structured.max_value_length_chat
                       : variants_.structured.max_value_length_completion;
}

std::string AgentVariantSelector::tabular_context(const ComparisonTable& table) const {
  const TableShape shape = table.shape();
  if (shape.rendered_chars <= profile_.context_chars) return table.to_markdown();

  // Too big to embed whole: show the head, the backend still reads the full table.
  const std::size_t n = std::min(variants_.tabular.head_rows, shape.rows);
  return table.to_markdown(n) + "\n(first " + std::to_string(n) + " of " +
         std::to_string(shape.rows) + " rows shown)\n";
}

Result<std::unique_ptr<IReasoningBackend>> AgentVariantSelector::make_backend() const {
  auto backend_r = factory_.create(backend_options_);
  if (!backend_r.ok()) return backend_r;
  if (!backend_r.value()) {
    return Result<std::unique_ptr<IReasoningBackend>>::err(
        Status::internal("backend factory returned no backend for model '" + profile_.model + "'"));
  }
  return backend_r;
}

Result<std::unique_ptr<ReasoningSession>> AgentVariantSelector::build(
    ComparisonTable table, StrategyTag tag, std::shared_ptr<EventSink> sink) const {
  using R = Result<std::unique_ptr<ReasoningSession>>;

  if (!is_supported(tag)) {
    return R::err(Status::unsupported_variant(
        "unknown strategy tag value " + std::to_string(static_cast<int>(tag))));
  }
  if (!sink) return R::err(Status::invalid_argument("AgentVariantSelector::build: sink is null"));

  switch (tag) {
    case StrategyTag::kTabular: {
      std::string text = tabular_context(table);
      auto backend_r = make_backend();
      if (!backend_r.ok()) return R::err(backend_r.status());

      SessionBudget budget;
      budget.max_iterations = variants_.tabular.max_iterations;
      budget.max_execution_time_ns = variants_.tabular.max_execution_time_ns;

      return R::ok(std::make_unique<ReasoningSession>(tag, budget, backend_r.take_value(),
                                                      std::move(table), std::move(text),
                                                      nullptr, std::move(sink)));
    }

    case StrategyTag::kStructured: {
      // Transposed into {item: {property: value}}.
      auto document =
          std::make_unique<DocumentView>(table.to_document(), structured_max_value_length());
      auto backend_r = make_backend();
      if (!backend_r.ok()) return R::err(backend_r.status());

      SessionBudget budget;
      budget.max_iterations = variants_.structured.max_iterations;
      budget.max_execution_time_ns = variants_.structured.max_execution_time_ns;

      return R::ok(std::make_unique<ReasoningSession>(tag, budget, backend_r.take_value(),
                                                      std::move(table), std::string(),
                                                      std::move(document), std::move(sink)));
    }
  }

  return R::err(Status::unsupported_variant("unhandled strategy tag"));
}

}  // namespace compchat
