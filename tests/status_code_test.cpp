#include "gemframe/protocol/status_code.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <format>
#include <string>

namespace gemframe::test {
namespace {

using protocol::ByteCursor;
using protocol::parse_status;

TEST(StatusCodeTest, ParsesTwoDigits) {
  ByteCursor cursor(bytes("10"));
  auto r = parse_status(cursor);
  ASSERT_TRUE(is_complete(r));
  EXPECT_EQ(r->value(), 10);
  EXPECT_EQ(cursor.pos(), 2U);
}

TEST(StatusCodeTest, EveryTwoDigitStringParsesToItsValue) {
  for (int code = 0; code <= 99; ++code) {
    const auto text = std::format("{:02}", code);
    ByteCursor cursor(bytes(text));
    auto r = parse_status(cursor);
    ASSERT_TRUE(is_complete(r)) << text;
    EXPECT_EQ(r->value(), code) << text;
  }
}

TEST(StatusCodeTest, SingleDigitIsPartial) {
  ByteCursor cursor(bytes("1"));
  EXPECT_TRUE(is_partial(parse_status(cursor)));
}

TEST(StatusCodeTest, EmptyIsPartial) {
  ByteCursor cursor(bytes(""));
  EXPECT_TRUE(is_partial(parse_status(cursor)));
}

TEST(StatusCodeTest, NonDigitInFirstPositionFails) {
  ByteCursor cursor(bytes("a0"));
  EXPECT_TRUE(is_error(parse_status(cursor), Error::Status));
}

TEST(StatusCodeTest, NonDigitInSecondPositionFails) {
  ByteCursor cursor(bytes("2x"));
  EXPECT_TRUE(is_error(parse_status(cursor), Error::Status));
}

TEST(StatusCodeTest, NonDigitAloneFailsWithoutWaiting) {
  ByteCursor cursor(bytes(" "));
  EXPECT_TRUE(is_error(parse_status(cursor), Error::Status));
}

TEST(StatusCodeTest, BytesAdjacentToDigitRangeFail) {
  for (const char *text : {"/0", ":0", "0/", "0:"}) {
    ByteCursor cursor(bytes(text));
    EXPECT_TRUE(is_error(parse_status(cursor), Error::Status)) << text;
  }
}

TEST(StatusCategoryTest, FirstDigitSelectsCategory) {
  EXPECT_EQ(status_category(10), StatusCategory::Input);
  EXPECT_EQ(status_category(20), StatusCategory::Success);
  EXPECT_EQ(status_category(31), StatusCategory::Redirect);
  EXPECT_EQ(status_category(44), StatusCategory::TemporaryFailure);
  EXPECT_EQ(status_category(51), StatusCategory::PermanentFailure);
  EXPECT_EQ(status_category(62), StatusCategory::ClientCertificate);
  EXPECT_EQ(status_category(5), StatusCategory::Unknown);
  EXPECT_EQ(status_category(99), StatusCategory::Unknown);
}

TEST(StatusCategoryTest, NamesRoundTrip) {
  EXPECT_EQ(to_string_view(StatusCategory::TemporaryFailure),
            "temporary_failure");
  EXPECT_EQ(to_string_view(StatusCategory::Success), "success");
  EXPECT_EQ(parse<StatusCategory>("client_certificate"),
            StatusCategory::ClientCertificate);
  EXPECT_EQ(parse<StatusCategory>("bogus"), StatusCategory::Unknown);
}

} // namespace
} // namespace gemframe::test
