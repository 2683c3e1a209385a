#include <gtest/gtest.h>
#include <rangeio/stream/retry.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "../../common/fake_transport.h"
#include "../../common/test_helpers.h"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

using namespace rangeio;
using namespace rangeio::stream;
using rangeio::test::FakeTransport;
using std::chrono::milliseconds;

namespace {

struct ExecutorFixture : ::testing::Test {
    std::shared_ptr<FakeTransport> transport =
        std::make_shared<FakeTransport>(test::make_object(256));
    test::RecordingSleeper sleeper;

    RequestExecutor makeExecutor(int attempts = 0) {
        ExecutorOptions o;
        o.attempts = attempts;
        o.sleeper = sleeper;
        return RequestExecutor(transport, o);
    }

    RequestTemplate request{"GET", "http://objects.test/key", {}, std::nullopt};
};

} // namespace

TEST(BackoffPolicyTest, GrowsExponentiallyUpToCap) {
    BackoffPolicy p;
    EXPECT_EQ(p.delay(0), milliseconds(600));
    EXPECT_EQ(p.delay(1), milliseconds(1200));
    EXPECT_EQ(p.delay(2), milliseconds(2400));
    EXPECT_EQ(p.delay(6), milliseconds(38400));
    EXPECT_EQ(p.delay(7), milliseconds(60000));
    EXPECT_EQ(p.delay(500), milliseconds(60000));
}

TEST(BackoffPolicyTest, ZeroInitialDisablesPauses) {
    BackoffPolicy p;
    p.initial = milliseconds(0);
    EXPECT_EQ(p.delay(3), milliseconds(0));
    EXPECT_EQ(BackoffPolicy{}.delay(-1), milliseconds(0));
}

TEST_F(ExecutorFixture, ZeroAttemptsSelectsDefault) {
    auto exec = makeExecutor(0);
    EXPECT_EQ(exec.attempts(), kDefaultAttempts);
}

TEST_F(ExecutorFixture, RetriesTransientFailuresWithBackoff) {
    transport->faults = {test::sendError(), test::errorStatus(503)};
    auto exec = makeExecutor(3);

    auto resp = exec.execute(request);
    ASSERT_TRUE(resp.ok()) << resp.error().describe();
    EXPECT_EQ(resp.value().statusCode, 200);
    EXPECT_EQ(transport->requests.size(), 3u);

    ASSERT_EQ(sleeper.delays->size(), 2u);
    EXPECT_EQ((*sleeper.delays)[0], milliseconds(1200));
    EXPECT_EQ((*sleeper.delays)[1], milliseconds(2400));
    // The failed 503 body was released
    EXPECT_EQ(transport->stats->closed, 1);
}

TEST_F(ExecutorFixture, ExhaustionKeepsLastCause) {
    const std::string xml = "<?xml version=\"1.0\"?><Error><Code>NoSuchKey</Code>"
                            "<Message>The specified key does not exist.</Message>"
                            "<RequestId>REQ1</RequestId></Error>";
    transport->faults = {test::sendError(), test::errorStatus(404, xml)};
    auto exec = makeExecutor(2);

    auto resp = exec.execute(request);
    ASSERT_FALSE(resp.ok());
    EXPECT_EQ(resp.error().code, ErrorCode::RetriesExhausted);
    EXPECT_EQ(resp.error().message, "request failed after 2 attempts");

    const Error& root = rootCause(resp.error());
    EXPECT_EQ(root.code, ErrorCode::ServerError);
    ASSERT_TRUE(root.response.has_value());
    EXPECT_EQ(root.response->statusCode, 404);
    EXPECT_EQ(root.response->code, "NoSuchKey");
    EXPECT_EQ(root.response->requestId, "REQ1");
    EXPECT_NE(resp.error().describe().find("[NoSuchKey]: The specified key does not exist."),
              std::string::npos);
    EXPECT_EQ(sleeper.delays->size(), 1u);
}

TEST_F(ExecutorFixture, InvalidArgumentIsNotRetried) {
    transport->faults = {test::sendError(ErrorCode::InvalidArgument)};
    auto exec = makeExecutor(5);

    auto resp = exec.execute(request);
    ASSERT_FALSE(resp.ok());
    EXPECT_EQ(resp.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(transport->requests.size(), 1u);
    EXPECT_TRUE(sleeper.delays->empty());
}

TEST_F(ExecutorFixture, RangeHeaderIsPerRequest) {
    request.headers.set("Range", "bytes=9-");
    auto exec = makeExecutor();

    ASSERT_TRUE(exec.execute(request, 16).ok());
    ASSERT_TRUE(exec.execute(request).ok());

    auto ranges = transport->ranges();
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0], "bytes=16-");
    EXPECT_FALSE(ranges[1].has_value());
    // The template itself is never modified
    EXPECT_EQ(request.headers.get("Range"), "bytes=9-");
}

TEST_F(ExecutorFixture, MissingContentRangeIsFatal) {
    transport->faults = {test::fault(test::FaultKind::NoContentRange)};
    auto exec = makeExecutor(5);

    auto resp = exec.execute(request, 10);
    ASSERT_FALSE(resp.ok());
    EXPECT_EQ(resp.error().code, ErrorCode::ProtocolViolation);
    EXPECT_EQ(resp.error().message, "missing Content-Range header in response");
    EXPECT_EQ(transport->requests.size(), 1u);
    EXPECT_EQ(transport->stats->closed, 1);
}

TEST_F(ExecutorFixture, MismatchedRangeStartIsFatal) {
    transport->faults = {test::fault(test::FaultKind::ShiftedRange)};
    auto exec = makeExecutor(5);

    auto resp = exec.execute(request, 10);
    ASSERT_FALSE(resp.ok());
    EXPECT_EQ(resp.error().code, ErrorCode::ProtocolViolation);
    EXPECT_EQ(transport->requests.size(), 1u);
}

TEST_F(ExecutorFixture, CachesResolvedUrlFromUnrangedCall) {
    transport->effectiveUrl = "http://mirror.test/key";
    auto exec = makeExecutor();

    ASSERT_TRUE(exec.execute(request, 4).ok());
    EXPECT_FALSE(request.resolvedUrl.has_value());

    ASSERT_TRUE(exec.execute(request).ok());
    ASSERT_TRUE(request.resolvedUrl.has_value());
    EXPECT_EQ(*request.resolvedUrl, "http://mirror.test/key");
    EXPECT_EQ(request.target(), "http://mirror.test/key");

    ASSERT_TRUE(exec.execute(request, 4).ok());
    EXPECT_EQ(transport->requests.back().url, "http://mirror.test/key");
}

TEST_F(ExecutorFixture, LogsEachFailedAttempt) {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto logger = std::make_shared<spdlog::logger>("executor-test", sink);
    logger->set_pattern("%v");

    transport->faults = {test::sendError()};
    ExecutorOptions o;
    o.sleeper = sleeper;
    RequestExecutor exec(transport, o, logger);

    ASSERT_TRUE(exec.execute(request).ok());
    logger->flush();
    EXPECT_NE(captured.str().find("http attempt 0: simulated transport failure"),
              std::string::npos);
}
