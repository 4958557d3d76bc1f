// File: tests/test_event_sinks.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <nlohmann/json.hpp>

#include "compchat/core/events/event_sink.hpp"
#include "compchat/core/events/pull_sink.hpp"
#include "compchat/core/events/push_sink.hpp"
#include "test_doubles.hpp"

using namespace compchat;
using namespace compchat::test;

// ============================================================================
// NullSink
// ============================================================================

TEST(NullSinkTest, DiscardsThoughtsAndTerminatesOnAnswer) {
  NullSink s;
  EXPECT_TRUE(s.emit(Event::thought("a")).ok());
  EXPECT_TRUE(s.emit(Event::thought("b")).ok());
  EXPECT_FALSE(s.answer_delivered());
  EXPECT_TRUE(s.emit(Event::answer("c")).ok());
  EXPECT_TRUE(s.answer_delivered());
  EXPECT_EQ(s.discarded(), 2u);
  EXPECT_EQ(s.emit(Event::thought("late")).code(), Status::Code::kInvalidArgument);
}

// ============================================================================
// PullSink
// ============================================================================

TEST(PullSinkTest, ThoughtsThenAnswerThenEof) {
  PullSink s;
  ASSERT_TRUE(s.emit(Event::thought("t1")).ok());
  ASSERT_TRUE(s.emit(Event::thought("t2")).ok());
  ASSERT_TRUE(s.emit(Event::answer("a")).ok());
  EXPECT_EQ(s.emit(Event::thought("after")).code(), Status::Code::kInvalidArgument);

  Event e;
  ASSERT_TRUE(s.next(&e).ok());
  EXPECT_EQ(e.text, "t1");
  ASSERT_TRUE(s.next(&e).ok());
  EXPECT_EQ(e.text, "t2");
  EXPECT_FALSE(s.answer_delivered());
  ASSERT_TRUE(s.next(&e).ok());
  EXPECT_TRUE(e.is_answer());
  EXPECT_TRUE(s.answer_delivered());

  EXPECT_TRUE(s.next(&e).is_eof());
  EXPECT_TRUE(s.next(&e).is_eof());
}

TEST(PullSinkTest, FailEndsSequenceAfterQueuedThoughts) {
  PullSink s;
  ASSERT_TRUE(s.emit(Event::thought("t1")).ok());
  s.fail(Status::reasoning_failure("boom"));
  EXPECT_EQ(s.emit(Event::answer("late")).code(), Status::Code::kInvalidArgument);

  Event e;
  ASSERT_TRUE(s.next(&e).ok());
  EXPECT_EQ(e.text, "t1");
  EXPECT_TRUE(s.next(&e).is_eof());
  EXPECT_FALSE(s.answer_delivered());
}

TEST(PullSinkTest, ConsumerBlocksUntilProducerEmits) {
  PullSink s;
  std::thread producer([&s] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    (void)s.emit(Event::answer("late answer"));
  });

  Event e;
  const Status st = s.next(&e);
  producer.join();
  ASSERT_TRUE(st.ok());
  EXPECT_EQ(e.text, "late answer");
}

TEST(PullSinkTest, NextForTimesOut) {
  PullSink s;
  Event e;
  EXPECT_TRUE(s.next_for(&e, std::chrono::milliseconds(5)).is_timeout());
}

TEST(PullSinkTest, DetachDropsQueuedAndLaterEvents) {
  PullSink s;
  ASSERT_TRUE(s.emit(Event::thought("t1")).ok());
  s.detach();
  EXPECT_TRUE(s.detached());
  EXPECT_EQ(s.pending(), 0u);
  EXPECT_TRUE(s.emit(Event::thought("t2")).ok());
  EXPECT_EQ(s.pending(), 0u);
}

// ============================================================================
// PushSink
// ============================================================================

TEST(PushSinkTest, SendsEachEventAsFrame) {
  FakeChannelRegistry reg;
  auto ch = reg.add("chan-1");
  PushSink s(reg, "chan-1");

  ASSERT_TRUE(s.emit(Event::thought("t1")).ok());
  ASSERT_TRUE(s.emit(Event::answer("a")).ok());

  const auto frames = ch->frames();
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(nlohmann::json::parse(frames[0])["kind"], "thought");
  EXPECT_EQ(nlohmann::json::parse(frames[1])["text"], "a");
  EXPECT_EQ(s.frames_sent(), 2u);
  EXPECT_EQ(reg.lookups(), 1);
  EXPECT_TRUE(s.answer_delivered());
  EXPECT_FALSE(s.abandoned());
}

TEST(PushSinkTest, MissingChannelAbandonsWithChannelClosed) {
  FakeChannelRegistry reg;
  PushSink s(reg, "nope");

  const Status st = s.emit(Event::thought("t1"));
  EXPECT_EQ(st.code(), Status::Code::kChannelClosed);
  EXPECT_TRUE(s.abandoned());

  // No retry: later pushes fail the same way without another lookup.
  EXPECT_EQ(s.emit(Event::answer("a")).code(), Status::Code::kChannelClosed);
  EXPECT_EQ(reg.lookups(), 1);
  EXPECT_TRUE(s.answer_delivered());
  EXPECT_EQ(s.frames_sent(), 0u);
}

TEST(PushSinkTest, ChannelClosingMidStreamStopsFurtherSends) {
  FakeChannelRegistry reg;
  auto ch = reg.add("chan-1");
  ch->close_after(1);
  PushSink s(reg, "chan-1");

  EXPECT_TRUE(s.emit(Event::thought("t1")).ok());
  EXPECT_EQ(s.emit(Event::thought("t2")).code(), Status::Code::kChannelClosed);
  EXPECT_EQ(s.emit(Event::thought("t3")).code(), Status::Code::kChannelClosed);
  EXPECT_EQ(ch->attempts(), 2);
  EXPECT_EQ(s.frames_sent(), 1u);
}
