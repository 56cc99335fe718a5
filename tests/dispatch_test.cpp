#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "kg/internal/dispatch.hpp"
#include "kg/internal/http_parser.hpp"
#include "memory_stream.hpp"

namespace {

class CannedUpstream : public kg::UpstreamClient {
public:
    bool send(const kg::OutboundRequest& req, kg::HttpResponse& out,
              kg::UpstreamFailure& err) override {
        targets.push_back(req.target);
        bodies.push_back(req.body);
        if (fail.kind != kg::TransportError::None) {
            err = fail;
            return false;
        }
        out = reply;
        return true;
    }

    std::vector<std::string> targets;
    std::vector<std::string> bodies;
    kg::HttpResponse reply;
    kg::UpstreamFailure fail;
};

class DispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.credentials = {"key-one", "key-two"};
        cfg.target_url  = "https://api.example.com/v1";
        cfg.ceiling     = 1;
        cfg.max_body    = 64;
        upstream.reply.status_code = 200;
        upstream.reply.status_text = "OK";
        upstream.reply.headers = {{"Content-Type", "text/plain"}, {"Transfer-Encoding", "chunked"}};
        upstream.reply.body = "pong";
    }

    kg::ForwardingGateway& gateway() {
        if (!gw) {
            sel = std::make_unique<kg::KeySelector>(cfg.credentials);
            rl  = std::make_unique<kg::RateLimiter>(cfg.credentials, cfg.ceiling);
            gw  = std::make_unique<kg::ForwardingGateway>(cfg, *sel, *rl, upstream);
        }
        return *gw;
    }

    kg::HttpResponse dispatch(const std::string& method, const std::string& path) {
        kg::HttpRequest r;
        r.method = method;
        r.path = path;
        r.httpver = "HTTP/1.1";
        return kg::internal::dispatch_request(cfg, "127.0.0.1", r, gateway());
    }

    std::string serve(const std::string& wire) {
        MemoryStream s(wire, 11);
        kg::internal::serve_stream(s, cfg, "127.0.0.1", gateway());
        return s.out;
    }

    kg::GatewayConfig cfg;
    CannedUpstream upstream;
    std::unique_ptr<kg::KeySelector> sel;
    std::unique_ptr<kg::RateLimiter> rl;
    std::unique_ptr<kg::ForwardingGateway> gw;
};

std::size_t count_of(const std::string& hay, const std::string& needle) {
    std::size_t n = 0;
    for (std::size_t p = hay.find(needle); p != std::string::npos; p = hay.find(needle, p + 1)) ++n;
    return n;
}

} // namespace

TEST_F(DispatchTest, HealthAnswersLocally)
{
    // /health never consumes quota or calls the upstream.
    for (int i = 0; i < 5; ++i) {
        auto r = dispatch("GET", "/health");
        EXPECT_EQ(r.status_code, 200);
        EXPECT_EQ(r.body, R"({"status":"OK"})");
    }
    EXPECT_TRUE(upstream.targets.empty());
    EXPECT_EQ(rl->count("key-one"), 0);
}

TEST_F(DispatchTest, UnknownPathIs404)
{
    // Paths outside the route prefix are not forwarded, including look-alike prefixes.
    EXPECT_EQ(dispatch("GET", "/other").status_code, 404);
    EXPECT_EQ(dispatch("GET", "/proxyx/models").status_code, 404);
    EXPECT_TRUE(upstream.targets.empty());
}

TEST_F(DispatchTest, ForwardsUnderPrefix)
{
    // The prefix is removed and the rest appended to the target's base path.
    auto r = dispatch("GET", "/proxy/models");
    EXPECT_EQ(r.status_code, 200);
    EXPECT_EQ(r.body, "pong");
    ASSERT_EQ(upstream.targets.size(), 1u);
    EXPECT_EQ(upstream.targets[0], "/v1/models");
}

TEST_F(DispatchTest, TrailingSlashPrefixMatchesToo)
{
    // A configured prefix ending in '/' routes the same paths.
    cfg.route_prefix = "/proxy/";
    EXPECT_EQ(dispatch("GET", "/proxy/models").status_code, 200);
    EXPECT_EQ(upstream.targets.at(0), "/v1/models");
}

TEST_F(DispatchTest, AllKeysLimitedGives429WithRetryAfter)
{
    // Once both keys are spent the caller gets 429 and a Retry-After header.
    EXPECT_EQ(dispatch("GET", "/proxy/a").status_code, 200);
    EXPECT_EQ(dispatch("GET", "/proxy/a").status_code, 200);
    auto r = dispatch("GET", "/proxy/a");
    EXPECT_EQ(r.status_code, 429);
    EXPECT_EQ(r.body, R"({"status":"ERROR","reason":"ALL_KEYS_RATE_LIMITED"})");
    const std::string ra = kg::internal::hdr_ci(r.headers, "Retry-After");
    ASSERT_FALSE(ra.empty());
    EXPECT_GE(std::stoi(ra), 59);
    EXPECT_LE(std::stoi(ra), 60);
    EXPECT_EQ(upstream.targets.size(), 2u);
}

TEST_F(DispatchTest, TransportFailuresMapTo502And504)
{
    // Connect/protocol failures are 502, timeouts 504; details are JSON-escaped.
    upstream.fail.kind = kg::TransportError::Connect;
    upstream.fail.detail = "refused \"now\"";
    auto r = dispatch("GET", "/proxy/a");
    EXPECT_EQ(r.status_code, 502);
    EXPECT_EQ(r.body, R"({"status":"ERROR","reason":"UPSTREAM_CONNECT","detail":"refused \"now\""})");

    upstream.fail.kind = kg::TransportError::Timeout;
    upstream.fail.detail = "upstream read timed out";
    r = dispatch("GET", "/proxy/a");
    EXPECT_EQ(r.status_code, 504);
    EXPECT_NE(r.body.find("UPSTREAM_TIMEOUT"), std::string::npos);
}

TEST_F(DispatchTest, RedactedErrorsOmitReason)
{
    // With redaction on, error bodies carry only the status.
    cfg.redact_errors = true;
    upstream.fail.kind = kg::TransportError::Protocol;
    upstream.fail.detail = "malformed upstream response";
    auto r = dispatch("GET", "/proxy/a");
    EXPECT_EQ(r.status_code, 502);
    EXPECT_EQ(r.body, R"({"status":"ERROR"})");
}

TEST_F(DispatchTest, ServesKeepAliveRequestsOnOneConnection)
{
    // Two requests on one connection get two responses with regenerated framing.
    const std::string out = serve(
        "GET /proxy/a HTTP/1.1\r\nHost: gw\r\n\r\n"
        "POST /proxy/b HTTP/1.1\r\nHost: gw\r\nContent-Length: 5\r\nConnection: close\r\n\r\nhello");
    EXPECT_EQ(count_of(out, "HTTP/1.1 200 OK\r\n"), 2u);
    EXPECT_EQ(count_of(out, "Content-Length: 4\r\n"), 2u);
    EXPECT_EQ(count_of(out, "Transfer-Encoding"), 0u);
    EXPECT_NE(out.find("Connection: keep-alive\r\n"), std::string::npos);
    EXPECT_NE(out.find("Connection: close\r\n"), std::string::npos);
    ASSERT_EQ(upstream.bodies.size(), 2u);
    EXPECT_EQ(upstream.bodies[1], "hello");
}

TEST_F(DispatchTest, DecodesChunkedRequestBody)
{
    // A chunked inbound body is forwarded de-chunked.
    serve("POST /proxy/c HTTP/1.1\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
          "3\r\nabc\r\n2\r\nde\r\n0\r\n\r\n");
    ASSERT_EQ(upstream.bodies.size(), 1u);
    EXPECT_EQ(upstream.bodies[0], "abcde");
}

TEST_F(DispatchTest, OversizedBodyIs413)
{
    // A declared length above max_body is refused before reading it.
    const std::string out = serve("POST /proxy/a HTTP/1.1\r\nContent-Length: 65\r\n\r\n");
    EXPECT_EQ(out.compare(0, 30, "HTTP/1.1 413 Payload Too Large"), 0);
    EXPECT_NE(out.find("Connection: close"), std::string::npos);
    EXPECT_TRUE(upstream.targets.empty());
}

TEST_F(DispatchTest, OversizedHeadIs431)
{
    // A header block that never terminates within the head limit is refused.
    const std::string wire = "GET /proxy/a HTTP/1.1\r\nX-Filler: " + std::string(70000, 'a');
    const std::string out = serve(wire);
    EXPECT_EQ(out.compare(0, 13, "HTTP/1.1 431 "), 0);
    EXPECT_TRUE(upstream.targets.empty());
}

TEST_F(DispatchTest, ExpectContinueGetsInterimResponse)
{
    // The interim 100 precedes the final response when the client asks for it.
    const std::string out = serve("POST /proxy/a HTTP/1.1\r\nExpect: 100-continue\r\n"
                                  "Content-Length: 2\r\nConnection: close\r\n\r\nhi");
    EXPECT_EQ(out.compare(0, 25, "HTTP/1.1 100 Continue\r\n\r\n"), 0);
    EXPECT_NE(out.find("HTTP/1.1 200 OK"), std::string::npos);
    ASSERT_EQ(upstream.bodies.size(), 1u);
    EXPECT_EQ(upstream.bodies[0], "hi");
}

TEST_F(DispatchTest, MalformedRequestIs400)
{
    // Garbage on the wire is answered with 400 and the connection closed.
    const std::string out = serve("NOT A REQUEST\r\n\r\n");
    EXPECT_EQ(out.compare(0, 24, "HTTP/1.1 400 Bad Request"), 0);
    EXPECT_TRUE(upstream.targets.empty());
}

TEST_F(DispatchTest, ConflictingFramingIs400)
{
    // Content-Length together with Transfer-Encoding is rejected.
    const std::string out = serve("POST /proxy/a HTTP/1.1\r\nContent-Length: 3\r\n"
                                  "Transfer-Encoding: chunked\r\n\r\n0\r\n\r\n");
    EXPECT_EQ(out.compare(0, 24, "HTTP/1.1 400 Bad Request"), 0);
    EXPECT_TRUE(upstream.targets.empty());
}

TEST_F(DispatchTest, HeadResponseHasNoBody)
{
    // HEAD keeps the Content-Length of the GET representation but sends no bytes.
    const std::string out = serve("HEAD /health HTTP/1.1\r\nConnection: close\r\n\r\n");
    EXPECT_NE(out.find("Content-Length: 15\r\n"), std::string::npos);
    EXPECT_EQ(out.substr(out.size() - 4), "\r\n\r\n");
}

TEST_F(DispatchTest, RelayedHeadKeepsUpstreamContentLength)
{
    // The upstream's HEAD Content-Length reaches the caller, with no body bytes.
    upstream.reply.headers = {{"Content-Type", "application/octet-stream"},
                              {"Content-Length", "1234"}};
    upstream.reply.body.clear();
    const std::string out = serve("HEAD /proxy/file HTTP/1.1\r\nConnection: close\r\n\r\n");
    ASSERT_EQ(upstream.targets.size(), 1u);
    EXPECT_EQ(out.compare(0, 15, "HTTP/1.1 200 OK"), 0);
    EXPECT_NE(out.find("Content-Length: 1234\r\n"), std::string::npos);
    EXPECT_EQ(out.find("Content-Length: 0\r\n"), std::string::npos);
    EXPECT_EQ(out.substr(out.size() - 4), "\r\n\r\n");
}

TEST_F(DispatchTest, Http10ClosesByDefault)
{
    // An HTTP/1.0 request without keep-alive ends the connection after one response.
    const std::string out = serve("GET /health HTTP/1.0\r\n\r\nGET /health HTTP/1.0\r\n\r\n");
    EXPECT_EQ(count_of(out, "HTTP/1.1 200 OK"), 1u);
    EXPECT_NE(out.find("Connection: close"), std::string::npos);
}

TEST_F(DispatchTest, KeepAliveLimitClosesConnection)
{
    // After ka_max requests the connection is closed even if the client wants more.
    cfg.ka_max = 2;
    const std::string out = serve("GET /health HTTP/1.1\r\n\r\n"
                                  "GET /health HTTP/1.1\r\n\r\n"
                                  "GET /health HTTP/1.1\r\n\r\n");
    EXPECT_EQ(count_of(out, "HTTP/1.1 200 OK"), 2u);
    EXPECT_EQ(count_of(out, "Connection: close"), 1u);
}
