/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/rate_limiter.hpp"
#include "kg/gateway_config.hpp"
#include "kg/log.hpp"
#include <algorithm>

namespace kg {

RateLimiter::RateLimiter(const std::vector<std::string>& keys, int ceiling,
                         std::chrono::seconds window, TimeSource now)
    : _ceiling(ceiling), _window(window), _now(std::move(now))
{
    if (_ceiling <= 0) throw ConfigError("RateLimiter: ceiling must be > 0");
    if (_window.count() <= 0) throw ConfigError("RateLimiter: window must be > 0");
    if (!_now) _now = [] { return clock::now(); };

    const auto t0 = _now();
    for (const auto& k : keys) {
        auto& w = _windows[k];
        if (!w) {
            w = std::make_unique<Window>();
            w->start = t0;
        }
    }
}

bool RateLimiter::try_admit(const std::string& key) {
    auto it = _windows.find(key);
    if (it == _windows.end()) {
        kg::log_line("[WARN] rate limiter asked about unconfigured key " + key_fingerprint(key));
        return false;
    }
    Window& w = *it->second;
    const auto now = _now();

    std::lock_guard<std::mutex> lk(w.mtx);
    if (now - w.start >= _window) {
        w.start = now;
        w.count = 0;
    }
    if (w.count < _ceiling) {
        ++w.count;
        return true;
    }
    return false;
}

int RateLimiter::count(const std::string& key) const {
    auto it = _windows.find(key);
    if (it == _windows.end()) return 0;
    const Window& w = *it->second;
    const auto now = _now();

    std::lock_guard<std::mutex> lk(w.mtx);
    if (now - w.start >= _window) return 0;
    return w.count;
}

std::chrono::seconds RateLimiter::retry_after() const {
    using namespace std::chrono;
    const auto now = _now();
    auto best = clock::duration::max();
    for (const auto& kv : _windows) {
        const Window& w = *kv.second;
        std::lock_guard<std::mutex> lk(w.mtx);
        const auto elapsed = now - w.start;
        if (elapsed >= _window || w.count < _ceiling) return seconds(0);
        best = std::min<clock::duration>(best, _window - elapsed);
    }
    if (best == clock::duration::max()) return seconds(0);
    auto s = duration_cast<seconds>(best);
    if (s < best) s += seconds(1);
    return s;
}

} // namespace kg
