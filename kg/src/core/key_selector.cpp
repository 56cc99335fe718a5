/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/key_selector.hpp"
#include "kg/gateway_config.hpp"

namespace kg {

KeySelector::KeySelector(const std::vector<std::string>& keys)
    : _keys(keys)
{
    if (_keys.empty()) {
        throw ConfigError("KeySelector: credential list is empty");
    }
}

const std::string& KeySelector::next() {
    std::lock_guard<std::mutex> lk(_mtx);
    const std::size_t slot = _cursor;
    _cursor = (_cursor + 1) % _keys.size();
    ++_issued;
    return _keys[slot];
}

std::uint64_t KeySelector::slots_issued() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _issued;
}

} // namespace kg
