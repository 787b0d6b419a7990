#pragma once

/// @file hit_registration_guard.hpp
/// @brief Damage application gated by post-hit invulnerability windows.

#include <cstdint>

#include "arc/ecs/component_storage.hpp"
#include "arc/ecs/entity.hpp"
#include "arc/foundation/clock.hpp"
#include "arc/game/rpg_components.hpp"

namespace arc::game {

/// Applies contact damage at most once per invulnerability window.
///
/// However many contact events arrive for a target while its window is
/// open, only the first lands. Windows are checked lazily against the
/// wall clock; ExpireWindows() merely tidies lapsed components.
class HitRegistrationGuard {
public:
    static constexpr foundation::Milliseconds kDefaultWindow{500};

    HitRegistrationGuard(ecs::ComponentStorage<Health>& health,
                         ecs::ComponentStorage<Invincibility>& invincibility,
                         const foundation::IClock& clock);

    /// Land @p damage on @p target unless it is invulnerable.
    ///
    /// On success health drops (floored at 0) and a fresh window of
    /// @p window opens. A target without Health, or a damage that is not
    /// positive, is rejected without a state change and opens no window.
    /// @return true when the hit landed.
    bool RegisterHit(ecs::Entity attacker, ecs::Entity target, int32_t damage,
                     foundation::Milliseconds window = kDefaultWindow);

    [[nodiscard]] static bool IsInvincible(const Invincibility* state,
                                           foundation::WallTime now) noexcept;

    [[nodiscard]] bool IsInvincible(ecs::Entity target) const;

    /// Drop lapsed Invincibility components. Returns how many were dropped.
    std::size_t ExpireWindows();

private:
    ecs::ComponentStorage<Health>& health_;
    ecs::ComponentStorage<Invincibility>& invincibility_;
    const foundation::IClock& clock_;
};

}  // namespace arc::game
