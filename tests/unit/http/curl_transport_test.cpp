#include <gtest/gtest.h>
#include <rangeio/http/http_client.hpp>
#include <rangeio/stream/resumable_stream.hpp>
#include <rangeio/stream/retry.hpp>

#include "../../common/loopback_http_server.h"
#include "../../common/test_helpers.h"

#include <memory>
#include <string>

using namespace rangeio;
using namespace rangeio::http;
using rangeio::test::LoopbackHttpServer;
using rangeio::test::ServerReply;
using rangeio::test::ServerRequest;

namespace {

constexpr std::size_t kObjectSize = 64 * 1024;

// Serves a fixed object under several behaviours selected by path
class ObjectServer {
public:
    ObjectServer()
        : object(test::make_object(kObjectSize)), etag("\"" + test::md5_hex(object) + "\""),
          server([this](const ServerRequest& req) { return route(req); }) {}

    std::string object;
    std::string etag;
    LoopbackHttpServer server;

private:
    ServerReply serveObject(const ServerRequest& req, std::optional<std::size_t> cut) const {
        ServerReply r;
        const std::size_t start = req.rangeStart().value_or(0);
        r.body = object.substr(start);
        r.headers.emplace_back("ETag", etag);
        r.headers.emplace_back("Content-Type", "application/octet-stream");
        if (req.rangeStart()) {
            r.status = 206;
            r.reason = "Partial Content";
            r.headers.emplace_back("Content-Range", "bytes " + std::to_string(start) + "-" +
                                                        std::to_string(object.size() - 1) + "/" +
                                                        std::to_string(object.size()));
        }
        r.cutAfter = cut;
        return r;
    }

    ServerReply route(const ServerRequest& req) const {
        if (req.target == "/object")
            return serveObject(req, std::nullopt);
        if (req.target == "/broken")
            return serveObject(req, object.size() / 4);
        if (req.target == "/redirect" || req.target == "/loop") {
            ServerReply r;
            r.status = 302;
            r.reason = "Found";
            r.headers.emplace_back("Location", req.target == "/loop" ? "/loop" : "/object");
            return r;
        }
        if (req.target == "/error") {
            ServerReply r;
            r.status = 404;
            r.reason = "Not Found";
            r.headers.emplace_back("Content-Type", "application/xml");
            r.body = "<?xml version=\"1.0\" encoding=\"UTF-8\"?><Error><Code>NoSuchKey</Code>"
                     "<Message>The specified key does not exist.</Message>"
                     "<Resource>/error</Resource><RequestId>R-1</RequestId></Error>";
            return r;
        }
        if (req.target == "/chunked") {
            ServerReply r;
            r.headers.emplace_back("Transfer-Encoding", "chunked");
            r.rawBody = true;
            r.body = "5\r\nhello\r\n0\r\n\r\n";
            return r;
        }
        ServerReply r;
        r.status = 404;
        r.reason = "Not Found";
        return r;
    }
};

ClientConfig testConfig() {
    ClientConfig c;
    c.connectTimeout = std::chrono::milliseconds(2000);
    c.idleTimeout = std::chrono::milliseconds(5000);
    return c;
}

std::string drain(IBodyStream& body, Error* failure = nullptr) {
    std::string out;
    std::string buf(8192, '\0');
    for (;;) {
        auto n = body.read(test::as_writable(buf));
        if (!n.ok()) {
            if (failure)
                *failure = n.error();
            break;
        }
        if (n.value() == 0)
            break;
        out.append(buf.data(), n.value());
    }
    return out;
}

} // namespace

TEST(CurlTransportTest, FetchesWholeObject) {
    ObjectServer s;
    auto transport = makeCurlTransport(testConfig());

    HttpRequest req;
    req.url = s.server.url("/object");
    req.headers.set("X-Client", "rangeio-test");
    auto resp = transport->send(req);
    ASSERT_TRUE(resp.ok()) << resp.error().describe();

    auto& r = resp.value();
    EXPECT_EQ(r.statusCode, 200);
    EXPECT_EQ(r.reason, "OK");
    ASSERT_TRUE(r.contentLength.has_value());
    EXPECT_EQ(*r.contentLength, static_cast<std::int64_t>(kObjectSize));
    EXPECT_EQ(r.headers.get("etag"), s.etag);
    EXPECT_FALSE(r.contentRange.has_value());
    EXPECT_EQ(drain(*r.body), s.object);
    r.body->close();

    auto seen = s.server.requests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].header("x-client"), "rangeio-test");
    EXPECT_FALSE(seen[0].header("range").has_value());
}

TEST(CurlTransportTest, RangedRequestReportsContentRange) {
    ObjectServer s;
    auto transport = makeCurlTransport(testConfig());

    HttpRequest req;
    req.url = s.server.url("/object");
    req.headers.set("Range", "bytes=1000-");
    auto resp = transport->send(req);
    ASSERT_TRUE(resp.ok()) << resp.error().describe();

    auto& r = resp.value();
    EXPECT_EQ(r.statusCode, 206);
    ASSERT_TRUE(r.contentRange.has_value());
    EXPECT_EQ(r.contentRange->first, 1000);
    EXPECT_EQ(r.contentRange->total, static_cast<std::int64_t>(kObjectSize));
    EXPECT_EQ(*r.contentLength, static_cast<std::int64_t>(kObjectSize - 1000));
    EXPECT_EQ(drain(*r.body), s.object.substr(1000));
}

TEST(CurlTransportTest, FollowsRedirectThroughPolicy) {
    ObjectServer s;
    auto transport = makeCurlTransport(testConfig());

    HttpRequest req;
    req.url = s.server.url("/redirect");
    req.headers.set("Authorization", "Bearer t");
    auto resp = transport->send(req);
    ASSERT_TRUE(resp.ok()) << resp.error().describe();

    auto& r = resp.value();
    EXPECT_EQ(r.statusCode, 200);
    EXPECT_EQ(r.effectiveUrl, s.server.url("/object"));
    EXPECT_EQ(drain(*r.body), s.object);

    auto seen = s.server.requests();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1].target, "/object");
    EXPECT_EQ(seen[1].header("authorization"), "Bearer t");
}

TEST(CurlTransportTest, RedirectResponseReturnedWhenDisabled) {
    ObjectServer s;
    auto config = testConfig();
    config.redirects.follow = false;
    auto transport = makeCurlTransport(config);

    HttpRequest req;
    req.url = s.server.url("/redirect");
    auto resp = transport->send(req);
    ASSERT_TRUE(resp.ok()) << resp.error().describe();
    EXPECT_EQ(resp.value().statusCode, 302);
    EXPECT_EQ(s.server.requests().size(), 1u);
}

TEST(CurlTransportTest, RedirectLoopStopsAtLimit) {
    ObjectServer s;
    auto config = testConfig();
    config.redirects.maxRedirects = 3;
    auto transport = makeCurlTransport(config);

    HttpRequest req;
    req.url = s.server.url("/loop");
    auto resp = transport->send(req);
    ASSERT_FALSE(resp.ok());
    EXPECT_EQ(resp.error().code, ErrorCode::PolicyViolation);
    EXPECT_EQ(s.server.requests().size(), 4u);
}

TEST(CurlTransportTest, XmlErrorBodyIsParsed) {
    ObjectServer s;
    auto transport = makeCurlTransport(testConfig());

    HttpRequest req;
    req.url = s.server.url("/error");
    auto resp = transport->send(req);
    ASSERT_TRUE(resp.ok()) << resp.error().describe();
    EXPECT_EQ(resp.value().statusCode, 404);

    auto v = stream::validateResponse(resp.value());
    ASSERT_FALSE(v.ok());
    ASSERT_TRUE(v.error().response.has_value());
    EXPECT_EQ(v.error().response->code, "NoSuchKey");
    EXPECT_EQ(v.error().response->requestId, "R-1");
    EXPECT_EQ(v.error().message, "[NoSuchKey]: The specified key does not exist.");
}

TEST(CurlTransportTest, ChunkedResponseHasNoLength) {
    ObjectServer s;
    auto transport = makeCurlTransport(testConfig());

    HttpRequest req;
    req.url = s.server.url("/chunked");
    auto resp = transport->send(req);
    ASSERT_TRUE(resp.ok()) << resp.error().describe();
    EXPECT_FALSE(resp.value().contentLength.has_value());

    auto v = stream::validateResponse(resp.value());
    ASSERT_FALSE(v.ok());
    EXPECT_EQ(v.error().code, ErrorCode::MissingContentLength);
}

TEST(CurlTransportTest, TruncatedBodyIsAnError) {
    ObjectServer s;
    auto transport = makeCurlTransport(testConfig());

    HttpRequest req;
    req.url = s.server.url("/broken");
    auto resp = transport->send(req);
    ASSERT_TRUE(resp.ok()) << resp.error().describe();

    Error failure;
    auto got = drain(*resp.value().body, &failure);
    EXPECT_EQ(got, s.object.substr(0, kObjectSize / 4));
    EXPECT_EQ(failure.code, ErrorCode::NetworkError);
}

TEST(CurlTransportTest, ConnectionRefusedIsNetworkError) {
    std::string url;
    {
        ObjectServer s;
        url = s.server.url("/object");
    }
    auto transport = makeCurlTransport(testConfig());
    HttpRequest req;
    req.url = url;
    auto resp = transport->send(req);
    ASSERT_FALSE(resp.ok());
    EXPECT_EQ(resp.error().code, ErrorCode::NetworkError);
}

TEST(CurlTransportTest, MalformedUrlIsInvalidArgument) {
    auto transport = makeCurlTransport(testConfig());
    HttpRequest req;
    req.url = "http://";
    auto resp = transport->send(req);
    ASSERT_FALSE(resp.ok());
    EXPECT_EQ(resp.error().code, ErrorCode::InvalidArgument);
}

TEST(CurlTransportTest, StreamSurvivesServerDisconnects) {
    ObjectServer s;
    stream::OpenOptions options;
    options.transport = makeCurlTransport(testConfig());
    options.sleeper = [](std::chrono::milliseconds) {};

    auto opened = stream::ResumableStream::open(s.server.url("/broken"), options);
    ASSERT_TRUE(opened.ok()) << opened.error().describe();
    auto& st = opened.value();
    ASSERT_TRUE(st->etag().has_value());

    std::string out;
    auto copied = st->copyTo([&out](ByteSpan chunk) -> Expected<void> {
        out.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
        return {};
    });
    ASSERT_TRUE(copied.ok()) << copied.error().describe();
    EXPECT_EQ(copied.value(), kObjectSize);
    EXPECT_EQ(out, s.object);
    EXPECT_TRUE(st->verify().ok());

    auto seen = s.server.requests();
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[1].header("range"), "bytes=16384-");
    EXPECT_EQ(seen[3].header("range"), "bytes=49152-");
}
