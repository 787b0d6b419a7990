#pragma once

/// @file ability_cooldown_manager.hpp
/// @brief Ability availability under cooldowns and effect application.

#include <cstdint>

#include "arc/ecs/component_storage.hpp"
#include "arc/ecs/entity.hpp"
#include "arc/foundation/clock.hpp"
#include "arc/foundation/game_result.hpp"
#include "arc/game/ability_database.hpp"
#include "arc/game/rpg_components.hpp"

namespace arc::game {

/// What an executed ability did.
struct AbilityEffect {
    EffectType type = EffectType::Utility;
    int32_t value = 0;
    ecs::Entity target;
};

/// Executes abilities and tracks their cooldowns.
///
/// Cooldowns are `{abilityId, endsAt}` entries polled against the wall
/// clock. Execute() does not start a cooldown; the caller records one
/// with ApplyCooldown() once the execution succeeded.
///
/// Resource cost is not enforced. CanAfford() is the hook for it and
/// currently accepts every ability; no cost is deducted anywhere.
class AbilityCooldownManager {
public:
    AbilityCooldownManager(ecs::ComponentStorage<Health>& health,
                           ecs::ComponentStorage<CharacterStats>& stats,
                           ecs::ComponentStorage<AbilityCooldowns>& cooldowns,
                           const foundation::IClock& clock);

    [[nodiscard]] static bool IsOnCooldown(const CooldownEntry* entry,
                                           foundation::WallTime now) noexcept;

    /// Time until @p entry lapses; zero when it already has.
    [[nodiscard]] static foundation::Milliseconds Remaining(const CooldownEntry* entry,
                                                            foundation::WallTime now) noexcept;

    [[nodiscard]] bool IsOnCooldown(const AbilityCooldowns& cooldowns,
                                    std::string_view abilityId) const;

    [[nodiscard]] foundation::Milliseconds Remaining(const AbilityCooldowns& cooldowns,
                                                     std::string_view abilityId) const;

    /// Always true. Extension point for energy or mana costs.
    [[nodiscard]] bool CanAfford(ecs::Entity caster, const Ability& ability) const;

    /// Apply @p ability from @p caster to @p target.
    ///
    /// - damage: target health drops by effectValue, floored at 0.
    /// - heal: target health rises by effectValue, capped at structure.
    /// - buff, debuff, utility: reported as applied; no status effect
    ///   is tracked.
    ///
    /// @return The applied effect, AbilityOnCooldown (context carries the
    ///         remaining Milliseconds) or AbilityInvalidTarget.
    foundation::GameResult<AbilityEffect> Execute(ecs::Entity caster, ecs::Entity target,
                                                  const Ability& ability,
                                                  const AbilityCooldowns& cooldowns);

    /// Start or refresh the cooldown for @p ability.
    void ApplyCooldown(AbilityCooldowns& cooldowns, const Ability& ability) const;

    /// Execute against the caster's own cooldown list, recording the
    /// cooldown on success. The caster gets an empty list if it has none.
    foundation::GameResult<AbilityEffect> Use(ecs::Entity caster, ecs::Entity target,
                                              const Ability& ability);

    /// Drop lapsed entries. Returns how many were dropped.
    std::size_t PruneExpired(AbilityCooldowns& cooldowns) const;

private:
    ecs::ComponentStorage<Health>& health_;
    ecs::ComponentStorage<CharacterStats>& stats_;
    ecs::ComponentStorage<AbilityCooldowns>& cooldowns_;
    const foundation::IClock& clock_;
};

}  // namespace arc::game
