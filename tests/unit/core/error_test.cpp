#include <gtest/gtest.h>
#include <rangeio/core/logging.h>
#include <rangeio/core/types.h>

using namespace rangeio;

TEST(ErrorTest, DescribeIncludesCauseChain) {
    Error inner{ErrorCode::NetworkError, "connection reset"};
    auto outer = wrapError(ErrorCode::RetriesExhausted, "request failed after 5 attempts", inner);

    EXPECT_EQ(outer.describe(), "request failed after 5 attempts: connection reset");
    EXPECT_EQ(rootCause(outer).code, ErrorCode::NetworkError);
    EXPECT_EQ(&rootCause(inner), &inner);
}

TEST(ErrorTest, EmptyMessageFallsBackToCodeName) {
    Error e{ErrorCode::Timeout, ""};
    EXPECT_EQ(e.describe(), errorToString(ErrorCode::Timeout));
}

TEST(ErrorTest, ResponseErrorFormat) {
    ResponseError r;
    r.code = "SlowDown";
    r.message = "Please reduce your request rate.";
    EXPECT_EQ(r.describe(), "[SlowDown]: Please reduce your request rate.");
}

TEST(ExpectedTest, HoldsValueOrError) {
    Expected<int> ok = 7;
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value(), 7);

    Expected<int> bad = Error{ErrorCode::InvalidArgument, "nope"};
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);

    Expected<void> done;
    EXPECT_TRUE(done.ok());
}

TEST(LoggingTest, ParseLevel) {
    EXPECT_EQ(logging::parseLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(logging::parseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(logging::parseLevel("err"), spdlog::level::err);
    EXPECT_EQ(logging::parseLevel("off"), spdlog::level::off);
    EXPECT_FALSE(logging::parseLevel("verbose").has_value());
}

TEST(LoggingTest, OrNullNeverReturnsEmpty) {
    auto logger = logging::orNull(nullptr);
    ASSERT_TRUE(logger);
    EXPECT_EQ(logger, logging::nullLogger());

    auto console = logging::makeConsoleLogger("rangeio-test", spdlog::level::info);
    EXPECT_EQ(logging::orNull(console), console);
    EXPECT_EQ(console->level(), spdlog::level::info);
}
