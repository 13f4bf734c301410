#pragma once

// Minimal millis()-based ticker: constructor, interval(), start(), stop(), update().
// The callback runs from update(), on the caller's thread.

#include <stdint.h>
#include <chrono>
#include <functional>

inline uint32_t monotonicMillis() {
    using namespace std::chrono;
    return (uint32_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

class Ticker {
public:
    using callback_t = std::function<void()>;
    using clock_t = std::function<uint32_t()>;

    Ticker(callback_t cb = nullptr, uint32_t interval = 0, clock_t clock = monotonicMillis)
        : cb_(cb), interval_(interval), running_(false), last_ms_(0), clock_(clock) {}

    void attach(callback_t cb) { cb_ = cb; }
    void interval(uint32_t ms) { interval_ = ms; }
    uint32_t interval() const { return interval_; }
    // Fires on the first update() after start().
    void start() { running_ = true; fire_now_ = true; last_ms_ = clock_(); }
    void stop() { running_ = false; }
    bool running() const { return running_; }
    void update() {
        if (!running_ || !cb_) return;
        uint32_t now = clock_();
        if (fire_now_ || (uint32_t)(now - last_ms_) >= interval_) {
            fire_now_ = false;
            last_ms_ = now;
            cb_();
        }
    }

private:
    callback_t cb_;
    uint32_t interval_;
    bool running_;
    bool fire_now_ = false;
    uint32_t last_ms_;
    clock_t clock_;
};
