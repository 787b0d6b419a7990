/// @file stability_manager.cpp
/// @brief StabilityManager implementation.

#include "arc/game/stability_manager.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "arc/ecs/query.hpp"
#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::LogCategory;
using foundation::Milliseconds;
using foundation::WallTime;

namespace {

struct StabilityRow {
    float max;
    float regenRate;
};

constexpr StabilityRow rowFor(StabilityKind kind) {
    switch (kind) {
        case StabilityKind::Grunt:  return {100.0f, 10.0f};
        case StabilityKind::Boss:   return {500.0f, 20.0f};
        case StabilityKind::Player: return {200.0f, 15.0f};
    }
    return {100.0f, 10.0f};
}

} // namespace

StabilityManager::StabilityManager(ecs::ComponentStorage<Stability>& stability,
                                   ecs::ComponentStorage<BreakState>& breaks,
                                   const foundation::IClock& clock,
                                   Milliseconds regenGrace)
    : stability_(stability), breaks_(breaks), clock_(clock), regenGrace_(regenGrace) {}

// ── Pure rules ──────────────────────────────────────────────────────────

Stability StabilityManager::Initialize(StabilityKind kind) {
    const auto row = rowFor(kind);
    Stability state;
    state.current = row.max;
    state.max = row.max;
    state.regenRate = row.regenRate;
    state.kind = kind;
    return state;
}

StabilityHit StabilityManager::ReduceStability(const Stability& state, float damage,
                                               WallTime now) {
    StabilityHit hit;
    hit.stability = state;
    hit.stability.current = std::max(0.0f, state.current - std::max(0.0f, damage));
    hit.stability.lastHitTime = now;
    hit.breakTriggered = state.current > 0.0f && hit.stability.current == 0.0f;
    return hit;
}

Stability StabilityManager::RegenerateStability(const Stability& state,
                                                foundation::FrameDelta dt,
                                                WallTime now, Milliseconds grace) {
    if (state.lastHitTime && now - *state.lastHitTime < grace) {
        return state;
    }
    Stability next = state;
    next.current = std::min(state.max, state.current + state.regenRate * dt.Seconds());
    return next;
}

bool StabilityManager::IsBroken(const BreakState* state, WallTime now) noexcept {
    return state != nullptr && state->isBroken && now < state->endsAt;
}

float StabilityManager::BreakProgress(const BreakState* state, Milliseconds duration,
                                      WallTime now) noexcept {
    if (!IsBroken(state, now) || duration.count() <= 0) {
        return 0.0f;
    }
    const auto remaining = state->endsAt - now;
    return std::min(1.0f, static_cast<float>(remaining.count()) /
                              static_cast<float>(duration.count()));
}

// ── Entity operations ───────────────────────────────────────────────────

void StabilityManager::ApplyBreakState(ecs::Entity entity, Milliseconds duration) {
    auto& state = breaks_.GetOrAdd(entity);
    state.isBroken = true;
    state.endsAt = clock_.Now() + duration;
    ARC_LOG_DEBUG(LogCategory::Combat, "entity " + std::to_string(entity.id()) + " broken");
}

bool StabilityManager::IsBroken(ecs::Entity entity) const {
    return IsBroken(breaks_.TryGet(entity), clock_.Now());
}

bool StabilityManager::UpdateBreakState(ecs::Entity entity) {
    const auto* state = breaks_.TryGet(entity);
    if (state == nullptr) {
        return false;
    }
    if (IsBroken(state, clock_.Now())) {
        return true;
    }

    const bool wasBroken = state->isBroken;
    breaks_.Remove(entity);
    auto* gauge = stability_.TryGet(entity);
    if (wasBroken && gauge != nullptr) {
        gauge->current = gauge->max;
        ARC_LOG_DEBUG(LogCategory::Combat,
                      "entity " + std::to_string(entity.id()) + " recovered from break");
    }
    return false;
}

bool StabilityManager::ProcessHit(ecs::Entity entity, float damage, Milliseconds breakDuration) {
    auto* gauge = stability_.TryGet(entity);
    if (gauge == nullptr) {
        return false;
    }

    auto hit = ReduceStability(*gauge, damage, clock_.Now());
    *gauge = hit.stability;
    if (hit.breakTriggered) {
        ApplyBreakState(entity, breakDuration);
    }
    return hit.breakTriggered;
}

void StabilityManager::Tick(foundation::FrameDelta dt) {
    const auto now = clock_.Now();

    // Collect lapsed breaks first; UpdateBreakState removes components.
    std::vector<ecs::Entity> lapsed;
    ecs::Query<BreakState> broken(breaks_);
    broken.ForEach([&](ecs::Entity e, BreakState& state) {
        if (!IsBroken(&state, now)) {
            lapsed.push_back(e);
        }
    });
    for (auto e : lapsed) {
        UpdateBreakState(e);
    }

    ecs::Query<Stability> gauges(stability_);
    gauges.ForEach([&](ecs::Entity e, Stability& gauge) {
        if (IsBroken(breaks_.TryGet(e), now)) {
            return;
        }
        gauge = RegenerateStability(gauge, dt, now, regenGrace_);
    });
}

}  // namespace arc::game
