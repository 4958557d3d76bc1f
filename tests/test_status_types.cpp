// File: tests/test_status_types.cpp
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "compchat/core/model/prompt.hpp"
#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

using namespace compchat;

TEST(StatusTest, DefaultIsOk) {
  Status s;
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(s.code(), Status::Code::kOk);
}

TEST(StatusTest, ToStringCarriesCodeName) {
  EXPECT_EQ(to_string(Status::dataset_unavailable("cmp-9")), "DATASET_UNAVAILABLE: cmp-9");
  EXPECT_STREQ(status_code_name(Status::Code::kExecutionTimeout), "EXECUTION_TIMEOUT");
  EXPECT_STREQ(status_code_name(Status::Code::kChannelClosed), "CHANNEL_CLOSED");
}

TEST(StatusTest, EofAndTimeoutAreDistinct) {
  EXPECT_TRUE(Status::eof().is_eof());
  EXPECT_FALSE(Status::eof().is_timeout());
  EXPECT_TRUE(Status::timeout().is_timeout());
  EXPECT_FALSE(Status::timeout().is_eof());
  EXPECT_FALSE(Status::out_of_range("index 4").is_eof());
}

TEST(StatusTest, ResultHoldsValueOrStatus) {
  auto ok = Result<int>::ok(7);
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(*ok, 7);

  auto bad = Result<int>::err(Status::not_found("x"));
  EXPECT_FALSE(bad.ok());
  EXPECT_EQ(bad.value_if_ok(), nullptr);
  EXPECT_EQ(bad.status().code(), Status::Code::kNotFound);
}

static Status returns_early(bool fail, int* reached) {
  COMPCHAT_RETURN_IF_ERROR(fail ? Status::io_error("disk") : Status::ok_status());
  *reached = 1;
  return Status::ok_status();
}

TEST(StatusTest, ReturnIfErrorMacro) {
  int reached = 0;
  EXPECT_EQ(returns_early(true, &reached).code(), Status::Code::kIoError);
  EXPECT_EQ(reached, 0);
  EXPECT_TRUE(returns_early(false, &reached).ok());
  EXPECT_EQ(reached, 1);
}

// ============================================================================
// Selectors
// ============================================================================

TEST(StrategyTagTest, ParsesClosedSet) {
  auto t = parse_strategy_tag("TABULAR");
  ASSERT_TRUE(t.ok());
  EXPECT_EQ(*t, StrategyTag::kTabular);

  auto s = parse_strategy_tag("STRUCTURED");
  ASSERT_TRUE(s.ok());
  EXPECT_EQ(*s, StrategyTag::kStructured);

  EXPECT_STREQ(strategy_tag_name(StrategyTag::kStructured), "STRUCTURED");
}

TEST(StrategyTagTest, AnythingElseIsUnsupportedVariant) {
  for (const char* bad : {"", "tabular", "GRAPH", "TABULAR "}) {
    auto r = parse_strategy_tag(bad);
    EXPECT_FALSE(r.ok()) << bad;
    EXPECT_EQ(r.status().code(), Status::Code::kUnsupportedVariant) << bad;
  }
  EXPECT_FALSE(is_supported(static_cast<StrategyTag>(42)));
}

TEST(DeliveryModeTest, CaseInsensitive) {
  EXPECT_EQ(*parse_delivery_mode("PULL"), DeliveryMode::kPull);
  EXPECT_EQ(*parse_delivery_mode("push"), DeliveryMode::kPush);
  EXPECT_EQ(*parse_delivery_mode("None"), DeliveryMode::kNone);
  EXPECT_EQ(parse_delivery_mode("stream").status().code(), Status::Code::kInvalidArgument);
}

TEST(EventTest, FrameIsKindAndText) {
  const auto j = nlohmann::json::parse(to_frame(Event::thought("looking at \"P1\"")));
  EXPECT_EQ(j["kind"], "thought");
  EXPECT_EQ(j["text"], "looking at \"P1\"");

  const auto a = nlohmann::json::parse(to_frame(Event::answer("3")));
  EXPECT_EQ(a["kind"], "answer");
  EXPECT_EQ(a.size(), 2u);
}

TEST(EventTest, FrameReplacesInvalidUtf8) {
  // A truncated two-byte sequence followed by a stray byte.
  const std::string frame = to_frame(Event::thought("caf\xc3 \xff"));
  const auto j = nlohmann::json::parse(frame);
  EXPECT_EQ(j["text"], "caf\xef\xbf\xbd \xef\xbf\xbd");

  const auto ok = nlohmann::json::parse(to_frame(Event::answer("\xc3\xa9t\xc3\xa9")));
  EXPECT_EQ(ok["text"], "\xc3\xa9t\xc3\xa9");
}

// ============================================================================
// Prompt
// ============================================================================

TEST(PromptTest, WrapsQueryOnceAtTheEnd) {
  const Prompt p = Prompt::wrap("How many papers use method X?");
  EXPECT_EQ(p.query(), "How many papers use method X?");
  EXPECT_EQ(p.text(), instruction_template() + "How many papers use method X?");
  EXPECT_EQ(p.text().find(instruction_template()), 0u);
  EXPECT_EQ(p.text().find(instruction_template(), 1), std::string::npos);
}
