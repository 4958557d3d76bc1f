// File: tests/test_variant_selector.cpp
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "compchat/core/model/model_profile.hpp"
#include "compchat/core/model/variant_selector.hpp"
#include "test_doubles.hpp"

using namespace compchat;
using namespace compchat::test;

namespace {

AgentVariantSelector make_selector(FakeBackendFactory& factory,
                                   const std::string& model = "gpt-3.5-turbo",
                                   VariantsConfig variants = {},
                                   ModelsConfig models = {}) {
  BackendOptions opts;
  opts.model = model;
  return AgentVariantSelector(variants, resolve_model_profile(model, models), opts, factory);
}

}  // namespace

TEST(ModelProfileTest, ChatModelsGetTheLargerContext) {
  ModelsConfig m;
  const ModelProfile chat = resolve_model_profile("gpt-4", m);
  EXPECT_TRUE(chat.chat);
  EXPECT_EQ(chat.context_chars, m.chat_context_chars);

  const ModelProfile completion = resolve_model_profile("text-davinci-003", m);
  EXPECT_FALSE(completion.chat);
  EXPECT_EQ(completion.context_chars, m.completion_context_chars);
}

TEST(VariantSelectorTest, TabularSessionEmbedsTable) {
  FakeBackendFactory factory;
  VariantsConfig v;
  v.tabular.max_iterations = 7;
  const auto selector = make_selector(factory, "gpt-4", v);

  auto r = selector.build(small_table(), StrategyTag::kTabular, std::make_shared<NullSink>());
  ASSERT_TRUE(r.ok()) << to_string(r.status());
  const auto& session = *r.value();

  EXPECT_EQ(session.tag(), StrategyTag::kTabular);
  EXPECT_EQ(session.table_text(), small_table().to_markdown());
  EXPECT_EQ(session.document(), nullptr);
  EXPECT_EQ(session.budget().max_iterations, 7);
  EXPECT_EQ(session.budget().max_execution_time_ns, 0);

  // Construction only: the backend exists but was never contacted.
  EXPECT_EQ(factory.counters().created.load(), 1);
  EXPECT_EQ(factory.counters().begins.load(), 0);
  EXPECT_EQ(factory.counters().steps.load(), 0);
  EXPECT_EQ(factory.last_options().model, "gpt-4");
}

TEST(VariantSelectorTest, StructuredSessionGetsDocumentAndTimeBudget) {
  FakeBackendFactory factory;
  const auto selector = make_selector(factory, "gpt-4");

  auto r = selector.build(small_table(), StrategyTag::kStructured, std::make_shared<NullSink>());
  ASSERT_TRUE(r.ok()) << to_string(r.status());
  const auto& session = *r.value();

  ASSERT_NE(session.document(), nullptr);
  EXPECT_EQ(session.document()->document(), small_table().to_document());
  EXPECT_EQ(session.document()->max_value_length(), 13000u);
  EXPECT_TRUE(session.table_text().empty());
  EXPECT_EQ(session.budget().max_execution_time_ns, seconds_to_ns(1.0));
  EXPECT_EQ(session.budget().max_iterations, 15);
}

TEST(VariantSelectorTest, CompletionModelsGetShorterValues) {
  FakeBackendFactory factory;
  const auto selector = make_selector(factory, "text-davinci-003");
  EXPECT_EQ(selector.structured_max_value_length(), 4000u);
  EXPECT_FALSE(selector.profile().chat);
}

TEST(VariantSelectorTest, UnsupportedTagFailsBeforeBackendCreation) {
  FakeBackendFactory factory;
  const auto selector = make_selector(factory);

  auto r = selector.build(small_table(), static_cast<StrategyTag>(9), std::make_shared<NullSink>());
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kUnsupportedVariant);
  EXPECT_EQ(factory.calls(), 0);
}

TEST(VariantSelectorTest, OversizedTableIsCutToHeadRows) {
  FakeBackendFactory factory;
  ModelsConfig models;
  models.completion_context_chars = 200;
  VariantsConfig v;
  v.tabular.head_rows = 3;
  const auto selector = make_selector(factory, "text-davinci-003", v, models);

  const ComparisonTable big = grid_table(20, 4);
  ASSERT_GT(big.shape().rendered_chars, 200u);

  const std::string text = selector.tabular_context(big);
  EXPECT_EQ(text.rfind(big.to_markdown(3), 0), 0u);
  EXPECT_NE(text.find("(first 3 of 20 rows shown)"), std::string::npos);
  EXPECT_EQ(text.find("| r3 |"), std::string::npos);
}

TEST(VariantSelectorTest, SmallTableIsEmbeddedWhole) {
  FakeBackendFactory factory;
  const auto selector = make_selector(factory);
  const ComparisonTable t = grid_table(8, 2);
  EXPECT_EQ(selector.tabular_context(t), t.to_markdown());
}
