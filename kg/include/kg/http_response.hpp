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

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    HeaderList  headers;
    std::string body;        // de-chunked
};

inline bool operator==(const HttpResponse& a, const HttpResponse& b) {
    return a.status_code == b.status_code && a.status_text == b.status_text &&
           a.headers == b.headers && a.body == b.body;
}

} // namespace kg
