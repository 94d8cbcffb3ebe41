#pragma once
#include <algorithm>
#include <chrono>

// Doubling delay between retries, capped at max_delay.
class ExpBackoff
{
public:
    using ms = std::chrono::milliseconds;

    ExpBackoff(ms initial, ms max_delay)
        : initial_(initial), max_(std::max(initial, max_delay)), cur_(initial) {}

    // Returns the delay to wait now and advances to the next one.
    ms next()
    {
        ms d = cur_;
        cur_ = std::min(max_, cur_ * 2);
        return d;
    }

    void reset() { cur_ = initial_; }

private:
    ms initial_;
    ms max_;
    ms cur_;
};
