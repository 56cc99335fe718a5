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
#include "kg/types.hpp"

namespace kg {

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // "/proxy/v1/models"
    std::string query;    // "a=1&b=2" (raw, not decoded)
    std::string httpver;  // "HTTP/1.1"
    HeaderList  headers;
    std::string body;     // de-chunked
};

} // namespace kg
