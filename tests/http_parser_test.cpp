#include <gtest/gtest.h>
#include <string>

#include "kg/internal/http_parser.hpp"
#include "kg/internal/http_io.hpp"
#include "memory_stream.hpp"

using kg::internal::BodyFraming;
using kg::internal::ReadStatus;

TEST(HttpParserTest, ParsesRequestHead)
{
    // Request line, query split and headers in arrival order.
    kg::HttpRequest r;
    ASSERT_TRUE(kg::internal::parse_request_head(
        "POST /proxy/chat?alt=sse HTTP/1.1\r\nHost: gw\r\nX-A: 1\r\nx-a:  2 ", r));
    EXPECT_EQ(r.method, "POST");
    EXPECT_EQ(r.path, "/proxy/chat");
    EXPECT_EQ(r.query, "alt=sse");
    EXPECT_EQ(r.httpver, "HTTP/1.1");
    ASSERT_EQ(r.headers.size(), 3u);
    EXPECT_EQ(r.headers[2].first, "x-a");
    EXPECT_EQ(r.headers[2].second, "2");
    EXPECT_EQ(kg::internal::hdr_ci(r, "X-A"), "1");
}

TEST(HttpParserTest, RejectsMalformedRequests)
{
    // Bad versions, absolute targets, folded or nameless headers are refused.
    kg::HttpRequest r;
    EXPECT_FALSE(kg::internal::parse_request_head("GET / HTTP/2.0", r));
    EXPECT_FALSE(kg::internal::parse_request_head("GET http://x/ HTTP/1.1", r));
    EXPECT_FALSE(kg::internal::parse_request_head("GET / HTTP/1.1 extra", r));
    EXPECT_FALSE(kg::internal::parse_request_head("GET / HTTP/1.1\r\nA: 1\r\n folded", r));
    EXPECT_FALSE(kg::internal::parse_request_head("GET / HTTP/1.1\r\n: v", r));
    EXPECT_FALSE(kg::internal::parse_request_head("GET / HTTP/1.1\r\nBad Name: v", r));
    EXPECT_FALSE(kg::internal::parse_request_head("G(T / HTTP/1.1", r));
}

TEST(HttpParserTest, ParsesStatusLineWithReason)
{
    // Multi-word reason phrases are kept verbatim.
    kg::HttpResponse r;
    ASSERT_TRUE(kg::internal::parse_response_head(
        "HTTP/1.1 429 Too Many Requests\r\nRetry-After: 3", r));
    EXPECT_EQ(r.status_code, 429);
    EXPECT_EQ(r.status_text, "Too Many Requests");
    EXPECT_EQ(kg::internal::hdr_ci(r.headers, "retry-after"), "3");
    EXPECT_FALSE(kg::internal::parse_response_head("FTP/1.0 200 OK", r));
}

TEST(HttpParserTest, ConnectionTokenMatching)
{
    // Token lists are matched case-insensitively, element by element.
    EXPECT_TRUE(kg::internal::has_token_ci("keep-alive, Close", "close"));
    EXPECT_FALSE(kg::internal::has_token_ci("closed", "close"));
    EXPECT_FALSE(kg::internal::has_token_ci("", "close"));
}

TEST(HttpParserTest, HopByHopSet)
{
    // Connection-level names match case-insensitively; end-to-end headers do not.
    EXPECT_TRUE(kg::internal::is_hop_by_hop("keep-alive"));
    EXPECT_TRUE(kg::internal::is_hop_by_hop("PROXY-CONNECTION"));
    EXPECT_TRUE(kg::internal::is_hop_by_hop("content-length"));
    EXPECT_FALSE(kg::internal::is_hop_by_hop("Authorization"));
    EXPECT_FALSE(kg::internal::is_hop_by_hop("Content-Type"));
}

TEST(HttpParserTest, SetHeaderReplacesAllCaseVariants)
{
    // Setting a header leaves exactly one instance with the new value.
    kg::HeaderList h{{"authorization", "a"}, {"X", "1"}, {"AUTHORIZATION", "b"}};
    kg::internal::set_header_ci(h, "Authorization", "Bearer k");
    ASSERT_EQ(h.size(), 2u);
    EXPECT_EQ(h[0].first, "X");
    EXPECT_EQ(h[1].second, "Bearer k");
}

TEST(HttpParserTest, QueryParamReplaceAndEncode)
{
    // Existing parameters survive byte for byte; the injected one is encoded.
    EXPECT_EQ(kg::internal::set_query_param("", "key", "a b"), "key=a%20b");
    EXPECT_EQ(kg::internal::set_query_param("x=1&key=old&y=%2F", "key", "new"), "x=1&y=%2F&key=new");
    EXPECT_EQ(kg::internal::set_query_param("&&x=1&", "key", "v"), "x=1&key=v");
}

TEST(HttpIoTest, RequestFramingRules)
{
    // Length, chunked and bodiless framing; TE together with CL is refused.
    BodyFraming f;
    std::size_t n = 0;
    EXPECT_EQ(kg::internal::request_framing({}, f, n), ReadStatus::Ok);
    EXPECT_EQ(f, BodyFraming::None);
    EXPECT_EQ(kg::internal::request_framing({{"Content-Length", "12"}}, f, n), ReadStatus::Ok);
    EXPECT_EQ(f, BodyFraming::Length);
    EXPECT_EQ(n, 12u);
    EXPECT_EQ(kg::internal::request_framing({{"Transfer-Encoding", "gzip, chunked"}}, f, n), ReadStatus::Ok);
    EXPECT_EQ(f, BodyFraming::Chunked);
    EXPECT_EQ(kg::internal::request_framing({{"Transfer-Encoding", "chunked"}, {"Content-Length", "3"}}, f, n),
              ReadStatus::Malformed);
    EXPECT_EQ(kg::internal::request_framing({{"Content-Length", "-1"}}, f, n), ReadStatus::Malformed);
    EXPECT_EQ(kg::internal::request_framing({{"Content-Length", "3"}, {"Content-Length", "4"}}, f, n),
              ReadStatus::Malformed);
}

TEST(HttpIoTest, ResponseFramingRules)
{
    // HEAD, 204 and 304 carry no body; no length means read until close.
    BodyFraming f;
    std::size_t n = 0;
    kg::HeaderList cl{{"Content-Length", "5"}};
    EXPECT_EQ(kg::internal::response_framing("HEAD", 200, cl, f, n), ReadStatus::Ok);
    EXPECT_EQ(f, BodyFraming::None);
    EXPECT_EQ(kg::internal::response_framing("GET", 204, {}, f, n), ReadStatus::Ok);
    EXPECT_EQ(f, BodyFraming::None);
    EXPECT_EQ(kg::internal::response_framing("GET", 304, cl, f, n), ReadStatus::Ok);
    EXPECT_EQ(f, BodyFraming::None);
    EXPECT_EQ(kg::internal::response_framing("GET", 200, {}, f, n), ReadStatus::Ok);
    EXPECT_EQ(f, BodyFraming::UntilClose);
    EXPECT_EQ(kg::internal::response_framing("GET", 200, cl, f, n), ReadStatus::Ok);
    EXPECT_EQ(f, BodyFraming::Length);
    EXPECT_EQ(n, 5u);
}

TEST(HttpIoTest, DecodesChunkedBodyAcrossSmallReads)
{
    // Chunk extensions and trailers are dropped; bytes after the message stay buffered.
    MemoryStream s("4;ext=1\r\nWiki\r\n5\r\npedia\r\nE\r\n in\r\n\r\nchunks.\r\n0\r\nX-T: 1\r\n\r\nNEXT", 3);
    kg::internal::StreamReader reader(s);
    std::string body;
    ASSERT_EQ(reader.read_body(BodyFraming::Chunked, 0, 1024, body), ReadStatus::Ok);
    EXPECT_EQ(body, "Wikipedia in\r\n\r\nchunks.");

    std::string rest;
    EXPECT_EQ(reader.read_to_close(rest, 1024), ReadStatus::Ok);
    EXPECT_EQ(rest, "NEXT");
}

TEST(HttpIoTest, ChunkedErrors)
{
    // Bad sizes, missing CRLF after data and oversize bodies are detected.
    {
        MemoryStream s("zz\r\nabc\r\n0\r\n\r\n");
        kg::internal::StreamReader r(s);
        std::string b;
        EXPECT_EQ(r.read_chunked(b, 1024), ReadStatus::Malformed);
    }
    {
        MemoryStream s("3\r\nabcX\r\n0\r\n\r\n");
        kg::internal::StreamReader r(s);
        std::string b;
        EXPECT_EQ(r.read_chunked(b, 1024), ReadStatus::Malformed);
    }
    {
        MemoryStream s("10\r\n0123456789abcdef\r\n0\r\n\r\n");
        kg::internal::StreamReader r(s);
        std::string b;
        EXPECT_EQ(r.read_chunked(b, 8), ReadStatus::TooLarge);
    }
    {
        MemoryStream s("5\r\nab");
        kg::internal::StreamReader r(s);
        std::string b;
        EXPECT_EQ(r.read_chunked(b, 1024), ReadStatus::Malformed);
    }
}

TEST(HttpIoTest, ReadHeadSkipsLeadingBlankLinesAndKeepsPipelinedBytes)
{
    // Two pipelined requests come out one head at a time.
    MemoryStream s("\r\nGET /a HTTP/1.1\r\nA: 1\r\n\r\nGET /b HTTP/1.1\r\n\r\n", 5);
    kg::internal::StreamReader reader(s);
    std::string head;
    ASSERT_EQ(reader.read_head(head, 1024), ReadStatus::Ok);
    EXPECT_EQ(head, "GET /a HTTP/1.1\r\nA: 1");
    ASSERT_EQ(reader.read_head(head, 1024), ReadStatus::Ok);
    EXPECT_EQ(head, "GET /b HTTP/1.1");
    EXPECT_EQ(reader.read_head(head, 1024), ReadStatus::Closed);
}

TEST(HttpIoTest, ReadHeadLimit)
{
    // Oversized header blocks are reported instead of buffered without bound.
    MemoryStream s("GET / HTTP/1.1\r\nX: " + std::string(200, 'a') + "\r\n\r\n", 64);
    kg::internal::StreamReader reader(s);
    std::string head;
    EXPECT_EQ(reader.read_head(head, 100), ReadStatus::TooLarge);
}

TEST(HttpIoTest, WriteResponseRegeneratesFraming)
{
    // Stale framing headers from the upstream are replaced with a fresh Content-Length.
    kg::HttpResponse r;
    r.status_code = 201;
    r.status_text = "Created";
    r.headers = {{"X-Test", "1"}, {"Transfer-Encoding", "chunked"}, {"Connection", "close"}};
    r.body = "hello";

    MemoryStream s("");
    ASSERT_TRUE(kg::internal::write_response(s, r, true, "Keep-Alive: timeout=5\r\n", false));
    EXPECT_EQ(s.out,
              "HTTP/1.1 201 Created\r\n"
              "X-Test: 1\r\n"
              "Keep-Alive: timeout=5\r\n"
              "Content-Length: 5\r\n"
              "Connection: keep-alive\r\n"
              "\r\n"
              "hello");
}

TEST(HttpIoTest, WriteRequestAddsContentLength)
{
    // POST always carries a length; a bodiless GET does not.
    MemoryStream s("");
    ASSERT_TRUE(kg::internal::write_request(s, "POST", "/v1/x", {{"Host", "h"}}, ""));
    EXPECT_EQ(s.out, "POST /v1/x HTTP/1.1\r\nHost: h\r\nContent-Length: 0\r\n\r\n");

    MemoryStream g("");
    ASSERT_TRUE(kg::internal::write_request(g, "GET", "/", {}, ""));
    EXPECT_EQ(g.out, "GET / HTTP/1.1\r\n\r\n");
}
