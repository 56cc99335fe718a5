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
#include <vector>
#include <mutex>
#include <cstddef>
#include <cstdint>

namespace kg {

// Round-robin rotation over the configured credentials.
// Each next() call takes exactly one rotation slot; concurrent callers
// never share or skip a slot.
class KeySelector {
public:
    // `keys` must outlive the selector. Throws ConfigError if empty.
    explicit KeySelector(const std::vector<std::string>& keys);

    // Credential at the cursor, then cursor <- (cursor + 1) mod N.
    const std::string& next();

    std::size_t size() const { return _keys.size(); }

    // Total number of slots handed out since construction.
    std::uint64_t slots_issued() const;

    KeySelector(const KeySelector&) = delete;
    KeySelector& operator=(const KeySelector&) = delete;

private:
    const std::vector<std::string>& _keys;
    mutable std::mutex _mtx;
    std::size_t   _cursor = 0;
    std::uint64_t _issued = 0;
};

} // namespace kg
