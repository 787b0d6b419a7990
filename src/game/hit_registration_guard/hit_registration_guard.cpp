/// @file hit_registration_guard.cpp
/// @brief HitRegistrationGuard implementation.

#include "arc/game/hit_registration_guard.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "arc/ecs/query.hpp"
#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::LogCategory;

HitRegistrationGuard::HitRegistrationGuard(ecs::ComponentStorage<Health>& health,
                                           ecs::ComponentStorage<Invincibility>& invincibility,
                                           const foundation::IClock& clock)
    : health_(health), invincibility_(invincibility), clock_(clock) {}

bool HitRegistrationGuard::RegisterHit(ecs::Entity attacker, ecs::Entity target,
                                       int32_t damage, foundation::Milliseconds window) {
    const auto now = clock_.Now();
    if (IsInvincible(invincibility_.TryGet(target), now)) {
        return false;
    }

    auto* hp = health_.TryGet(target);
    if (hp == nullptr || damage <= 0) {
        return false;
    }

    hp->value = std::max(0, hp->value - damage);

    auto& shield = invincibility_.GetOrAdd(target);
    shield.isInvincible = true;
    shield.endsAt = now + window;

    ARC_LOG_DEBUG(LogCategory::Combat,
                  "hit " + std::to_string(attacker.id()) + " -> " +
                  std::to_string(target.id()) + " for " + std::to_string(damage));
    return true;
}

bool HitRegistrationGuard::IsInvincible(const Invincibility* state,
                                        foundation::WallTime now) noexcept {
    return state != nullptr && state->isInvincible && now < state->endsAt;
}

bool HitRegistrationGuard::IsInvincible(ecs::Entity target) const {
    return IsInvincible(invincibility_.TryGet(target), clock_.Now());
}

std::size_t HitRegistrationGuard::ExpireWindows() {
    const auto now = clock_.Now();

    std::vector<ecs::Entity> lapsed;
    ecs::Query<Invincibility> shielded(invincibility_);
    shielded.ForEach([&](ecs::Entity e, Invincibility& state) {
        if (!IsInvincible(&state, now)) {
            lapsed.push_back(e);
        }
    });

    for (auto e : lapsed) {
        invincibility_.Remove(e);
    }
    return lapsed.size();
}

}  // namespace arc::game
