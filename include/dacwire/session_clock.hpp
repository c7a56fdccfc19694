#pragma once
/**
 * @file session_clock.hpp
 * @brief Keepalive timer: says when the next KeepAlive is due.
 *
 * The controller drops its GPIO enable line when it sees no traffic for a while, so every
 * loop calls due(now) and sends a KeepAlive when it returns true, then calls reset(now).
 * Time is a caller-supplied millisecond counter (uint32_t, wrap-safe subtraction), which
 * keeps the clock testable without sleeping.
 *
 * The first call to due() starts the window when start() was not called explicitly, so a
 * fresh session waits one full interval before its first keepalive. An interval of 0
 * disables the clock.
 */

#include <stdint.h>

namespace dacwire {

class SessionClock {
public:
    explicit SessionClock(uint32_t interval_ms = 5000) : interval_ms_(interval_ms) {}

    void start(uint32_t now_ms) {
        last_ms_ = now_ms;
        started_ = true;
    }

    /// true once `now - last >= interval`. The first call on an unstarted clock starts the
    /// window at @p now_ms and returns false; later calls do not change state.
    bool due(uint32_t now_ms) {
        if (interval_ms_ == 0) return false;
        if (!started_) { start(now_ms); return false; }
        return static_cast<uint32_t>(now_ms - last_ms_) >= interval_ms_;
    }

    /// Call after a keepalive went out.
    void reset(uint32_t now_ms) { start(now_ms); }

    uint32_t interval_ms() const { return interval_ms_; }
    void set_interval_ms(uint32_t ms) { interval_ms_ = ms; }

    /// Milliseconds until due: 0 when due or disabled, the full interval before the first due().
    uint32_t remaining_ms(uint32_t now_ms) const {
        if (interval_ms_ == 0 || !started_) return interval_ms_;
        uint32_t elapsed = now_ms - last_ms_;
        return elapsed >= interval_ms_ ? 0 : interval_ms_ - elapsed;
    }

private:
    uint32_t interval_ms_;
    uint32_t last_ms_{0};
    bool     started_{false};
};

} // namespace dacwire
