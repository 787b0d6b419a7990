#pragma once

/// @file clock.hpp
/// @brief Wall-clock and frame-delta time domains.
///
/// Invincibility windows, cooldowns and break durations are measured in
/// wall-clock milliseconds read from an IClock. Stability regeneration is
/// integrated over FrameDelta seconds. The two domains are never mixed.

#include <chrono>
#include <cstdint>

namespace arc::foundation {

using Milliseconds = std::chrono::milliseconds;

/// Wall-clock instant with millisecond resolution.
using WallTime = std::chrono::time_point<std::chrono::steady_clock, Milliseconds>;

/// Convert a WallTime to raw milliseconds since the clock's epoch.
[[nodiscard]] constexpr int64_t toMillis(WallTime t) noexcept {
    return t.time_since_epoch().count();
}

[[nodiscard]] constexpr WallTime fromMillis(int64_t ms) noexcept {
    return WallTime(Milliseconds(ms));
}

/// Source of wall-clock time. Injected so expiry logic is testable.
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual WallTime Now() const = 0;
};

/// IClock backed by std::chrono::steady_clock.
class SystemClock final : public IClock {
public:
    [[nodiscard]] WallTime Now() const override;
};

/// Manually advanced clock for deterministic tests and replays.
class ManualClock final : public IClock {
public:
    explicit ManualClock(WallTime start = WallTime{}) : now_(start) {}

    [[nodiscard]] WallTime Now() const override { return now_; }

    void Advance(Milliseconds delta) { now_ += delta; }

    void Set(WallTime t) { now_ = t; }

private:
    WallTime now_;
};

/// Seconds elapsed since the previous frame, clamped to a ceiling so a
/// stalled frame cannot integrate a huge step.
class FrameDelta {
public:
    /// Default ceiling: 100 ms.
    static constexpr float kDefaultMax = 0.1f;

    constexpr FrameDelta() = default;

    /// Negative input clamps to zero, input above @p maxSeconds to the cap.
    explicit FrameDelta(float seconds, float maxSeconds = kDefaultMax);

    [[nodiscard]] constexpr float Seconds() const noexcept { return seconds_; }

private:
    float seconds_ = 0.0f;
};

} // namespace arc::foundation
