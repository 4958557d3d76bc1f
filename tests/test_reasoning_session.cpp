// File: tests/test_reasoning_session.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "compchat/core/events/pull_sink.hpp"
#include "compchat/core/model/prompt.hpp"
#include "compchat/core/model/reasoning_session.hpp"
#include "test_doubles.hpp"

using namespace compchat;
using namespace compchat::test;

namespace {

struct Rig {
  std::shared_ptr<BackendCounters> counters = std::make_shared<BackendCounters>();
  std::shared_ptr<PullSink> sink = std::make_shared<PullSink>();
  std::unique_ptr<ReasoningSession> session;

  Rig(BackendScript script, SessionBudget budget = {}, StrategyTag tag = StrategyTag::kTabular) {
    session = std::make_unique<ReasoningSession>(
        tag, budget, std::make_unique<FakeBackend>(std::move(script), counters), small_table(),
        small_table().to_markdown(), nullptr, sink);
  }
};

std::vector<Event> drain(PullSink& sink) {
  std::vector<Event> out;
  Event e;
  while (sink.next(&e).ok()) out.push_back(e);
  return out;
}

}  // namespace

TEST(ReasoningSessionTest, BlockingReturnsTrimmedAnswer) {
  Rig rig({{thought("look at P1"), answer("  3 papers \n")}});
  auto r = rig.session->run_blocking(Prompt::wrap("How many?"));
  ASSERT_TRUE(r.ok()) << to_string(r.status());
  EXPECT_EQ(*r, "3 papers");
  EXPECT_EQ(rig.session->steps_taken(), 2);
}

TEST(ReasoningSessionTest, BlockingNeverExposesThoughts) {
  Rig rig({{thought("t1"), thought("t2"), answer("a")}});
  auto r = rig.session->run_blocking(Prompt::wrap("q"));
  ASSERT_TRUE(r.ok());
  // The bound sink is bypassed entirely in blocking runs.
  EXPECT_EQ(rig.sink->pending(), 0u);
}

TEST(ReasoningSessionTest, BackendSeesWrappedPromptAndTable) {
  Rig rig({{answer("a")}});
  ASSERT_TRUE(rig.session->run_blocking(Prompt::wrap("Which method?")).ok());

  std::lock_guard<std::mutex> lk(rig.counters->mu);
  const ReasoningContext& ctx = rig.counters->last_ctx;
  EXPECT_EQ(ctx.query, "Which method?");
  EXPECT_EQ(ctx.prompt, instruction_template() + "Which method?");
  EXPECT_EQ(ctx.table_text, small_table().to_markdown());
  ASSERT_NE(ctx.table, nullptr);
  EXPECT_EQ(ctx.table->cols(), 3u);
}

TEST(ReasoningSessionTest, NoAnswerBecomesApology) {
  Rig rig({{thought("cell is unknown"), no_answer()}});
  auto r = rig.session->run_blocking(Prompt::wrap("q"));
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(*r, kUnknownAnswer);
}

TEST(ReasoningSessionTest, StreamingDeliversThoughtsInOrderThenAnswer) {
  Rig rig({{thought("t1"), thought("t2"), thought("t3"), answer("done")}});
  auto h = rig.session->run_streaming(Prompt::wrap("q"));
  ASSERT_TRUE(h.ok());

  const auto events = drain(*rig.sink);
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events[0].text, "t1");
  EXPECT_EQ(events[1].text, "t2");
  EXPECT_EQ(events[2].text, "t3");
  EXPECT_TRUE(events[3].is_answer());
  EXPECT_EQ(events[3].text, "done");

  auto r = h->await();
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(*r, "done");
}

TEST(ReasoningSessionTest, BackendErrorBecomesReasoningFailure) {
  Rig rig({{thought("t1"), step_error(Status::io_error("HTTP 502"))}});
  auto h = rig.session->run_streaming(Prompt::wrap("q"));
  ASSERT_TRUE(h.ok());

  const auto events = drain(*rig.sink);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_FALSE(events[0].is_answer());

  auto r = h->await();
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kReasoningFailure);
  EXPECT_NE(r.status().message().find("HTTP 502"), std::string::npos);
}

TEST(ReasoningSessionTest, BackendThrowIsContained) {
  BackendScript s;
  s.throw_on_step = true;
  Rig rig(s);
  auto h = rig.session->run_streaming(Prompt::wrap("q"));
  ASSERT_TRUE(h.ok());

  auto r = h->await();
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kReasoningFailure);
  EXPECT_TRUE(drain(*rig.sink).empty());
}

TEST(ReasoningSessionTest, LoopingBackendHitsTimeBudget) {
  BackendScript s;
  s.steps = {thought("still thinking")};
  s.loop = true;
  s.step_delay = std::chrono::milliseconds(5);

  SessionBudget budget;
  budget.max_iterations = 100000;
  budget.max_execution_time_ns = seconds_to_ns(0.05);
  Rig rig(s, budget, StrategyTag::kStructured);

  const auto t0 = std::chrono::steady_clock::now();
  auto r = rig.session->run_blocking(Prompt::wrap("q"));
  const auto elapsed = std::chrono::steady_clock::now() - t0;

  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kExecutionTimeout);
  EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(ReasoningSessionTest, IterationCapIsExecutionTimeout) {
  BackendScript s;
  s.steps = {thought("again")};
  s.loop = true;

  SessionBudget budget;
  budget.max_iterations = 4;
  Rig rig(s, budget);

  auto r = rig.session->run_blocking(Prompt::wrap("q"));
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), Status::Code::kExecutionTimeout);
  EXPECT_EQ(rig.counters->steps.load(), 4);
}

TEST(ReasoningSessionTest, AnswerOnLastAllowedStepIsAccepted) {
  SessionBudget budget;
  budget.max_iterations = 2;
  Rig rig({{thought("t"), answer("ok")}}, budget);
  auto r = rig.session->run_blocking(Prompt::wrap("q"));
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(*r, "ok");
}

TEST(ReasoningSessionTest, TimeoutAfterThoughtsStreamsPrefixWithoutAnswer) {
  BackendScript s;
  s.steps = {thought("t")};
  s.loop = true;
  SessionBudget budget;
  budget.max_iterations = 3;
  Rig rig(s, budget);

  auto h = rig.session->run_streaming(Prompt::wrap("q"));
  ASSERT_TRUE(h.ok());
  const auto events = drain(*rig.sink);
  EXPECT_EQ(events.size(), 3u);
  for (const auto& e : events) EXPECT_FALSE(e.is_answer());
  EXPECT_EQ(h->await().status().code(), Status::Code::kExecutionTimeout);
}

TEST(ReasoningSessionTest, SessionRunsOnlyOnce) {
  Rig rig({{answer("a")}});
  ASSERT_TRUE(rig.session->run_blocking(Prompt::wrap("q")).ok());
  EXPECT_EQ(rig.session->run_blocking(Prompt::wrap("q")).status().code(), Status::Code::kInvalidArgument);
  EXPECT_EQ(rig.session->run_streaming(Prompt::wrap("q")).status().code(), Status::Code::kInvalidArgument);
  EXPECT_EQ(rig.counters->begins.load(), 1);
}

TEST(SessionHandleTest, SecondAwaitIsRejected) {
  Rig rig({{answer("a")}});
  auto h = rig.session->run_streaming(Prompt::wrap("q"));
  ASSERT_TRUE(h.ok());
  EXPECT_TRUE(h->await().ok());
  EXPECT_FALSE(h->valid());
  EXPECT_EQ(h->await().status().code(), Status::Code::kInvalidArgument);
}
