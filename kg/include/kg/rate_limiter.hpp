/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#pragma once
#include <unordered_map>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <mutex>

namespace kg {

// Fixed-window request counter per credential.
//
// Each configured credential owns a (window_start, count) pair guarded by its
// own mutex. The map itself is filled in the constructor and never mutated
// afterwards, so lookups are lock-free and different credentials never
// contend. A window resets lazily on the first call at or after
// window_start + window; up to 2*ceiling requests can therefore land within
// one window length straddling a boundary.
class RateLimiter {
public:
    using clock     = std::chrono::steady_clock;
    using TimeSource = std::function<clock::time_point()>;

    // Throws ConfigError if ceiling or window are not positive.
    RateLimiter(const std::vector<std::string>& keys, int ceiling,
                std::chrono::seconds window = std::chrono::seconds(60),
                TimeSource now = {});

    // Consume one unit of `key`'s quota if available.
    // Unknown keys are rejected.
    bool try_admit(const std::string& key);

    // Requests counted in `key`'s current window (0 if elapsed or unknown).
    int count(const std::string& key) const;

    // Shortest wait until any credential's window resets, rounded up to
    // whole seconds; zero if some credential already has quota.
    std::chrono::seconds retry_after() const;

    int ceiling() const { return _ceiling; }
    std::chrono::seconds window() const { return _window; }

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

private:
    struct Window {
        mutable std::mutex mtx;
        clock::time_point  start{};
        int                count = 0;
    };

    const int            _ceiling;
    const std::chrono::seconds _window;
    TimeSource           _now;
    std::unordered_map<std::string, std::unique_ptr<Window>> _windows;
};

} // namespace kg
