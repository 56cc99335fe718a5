/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>
#include "kg/types.hpp"
#include "kg/http_response.hpp"

namespace kg::internal {

// Byte stream shared by plain sockets and TLS sessions, on both the
// listener side and the upstream side.
class Stream {
public:
    virtual ~Stream() = default;

    // >0 bytes read, 0 orderly close, <0 error (check timed_out()).
    virtual long read_some(char* d, std::size_t len) = 0;
    virtual bool write_all(const char* d, std::size_t len) = 0;

    // True if the last failed operation hit the socket deadline.
    virtual bool timed_out() const = 0;
};

enum class ReadStatus { Ok, Closed, Timeout, Error, TooLarge, Malformed };

enum class BodyFraming { None, Length, Chunked, UntilClose };

// Buffered reader. Bytes past the current message stay buffered for the
// next one (keep-alive / pipelining).
class StreamReader {
public:
    explicit StreamReader(Stream& s) : _s(s) {}

    // Header block without the terminating CRLFCRLF. Leading blank lines are skipped.
    ReadStatus read_head(std::string& head, std::size_t max_head);

    ReadStatus read_exact(std::size_t n, std::string& out);
    ReadStatus read_line(std::string& line, std::size_t max_line); // CRLF stripped
    ReadStatus read_to_close(std::string& out, std::size_t max_total);
    ReadStatus read_chunked(std::string& out, std::size_t max_body);

    ReadStatus read_body(BodyFraming framing, std::size_t length,
                         std::size_t max_body, std::string& out);

    // Bytes received so far on this reader (for stale-connection detection).
    std::size_t total_received() const { return _received; }

private:
    Stream&     _s;
    std::string _buf;
    std::size_t _off = 0;
    std::size_t _received = 0;

    ReadStatus fill();
    std::size_t available() const { return _buf.size() - _off; }
    void compact();
};

// Decide how a request body is framed. Malformed if Content-Length is bad or
// conflicts with Transfer-Encoding.
ReadStatus request_framing(const kg::HeaderList& headers, BodyFraming& framing,
                           std::size_t& length);

// Same for a response to `method` with `status_code`.
ReadStatus response_framing(const std::string& method, int status_code,
                            const kg::HeaderList& headers, BodyFraming& framing,
                            std::size_t& length);

// Serialise and send a response. Framing headers in `r.headers` are dropped
// and regenerated; `extra` lines (already "Name: value\r\n") are appended.
// With `head_only` and an empty body, an upstream Content-Length is kept as is.
bool write_response(Stream& s, const kg::HttpResponse& r, bool keep_alive,
                    const std::string& extra, bool head_only);

// Serialise and send a request with a Content-Length body.
bool write_request(Stream& s, const std::string& method, const std::string& target,
                   const kg::HeaderList& headers, const std::string& body);

} // namespace kg::internal
