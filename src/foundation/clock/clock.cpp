/// @file clock.cpp
/// @brief SystemClock and FrameDelta implementation.

#include "arc/foundation/clock.hpp"

#include <algorithm>
#include <cmath>

namespace arc::foundation {

WallTime SystemClock::Now() const {
    return std::chrono::time_point_cast<Milliseconds>(std::chrono::steady_clock::now());
}

FrameDelta::FrameDelta(float seconds, float maxSeconds) {
    if (!std::isfinite(seconds)) {
        seconds = 0.0f;
    }
    seconds_ = std::clamp(seconds, 0.0f, std::max(maxSeconds, 0.0f));
}

} // namespace arc::foundation
