#pragma once

/// @file combat_resolver.hpp
/// @brief Pure attack resolution: damage, crits and related helpers.
///
/// Damage pipeline:
/// @code
///   attackPower    = 10 + 0.5 * drivingStat
///   statMultiplier = drivingStat / 10
///   defense        = defender.structure / 2
///   damage         = floor(max(0, (attackPower * statMultiplier - defense / 2)
///                                  * damageMultiplier + flatBonus))
///   isCritical     = rng() < min(attacker.ignition * 0.01, 0.5)
///   damage        *= isCritical ? 2 : 1
///   damage        *= (defenderBroken && !isCritical) ? 2 : 1
/// @endcode
/// Missing stats count as 10. Nothing here mutates entity state.

#include <cstdint>
#include <optional>

#include "arc/game/combat_types.hpp"
#include "arc/game/rpg_components.hpp"

namespace arc::game {

struct AttackOutcome {
    int32_t damage = 0;
    bool isCritical = false;
};

/// Situational adjustments to a single attack.
struct DamageModifiers {
    float damageMultiplier = 1.0f;
    int32_t flatBonus = 0;
    std::optional<float> critChanceOverride;  ///< Replaces the ignition-derived chance.
    bool defenderBroken = false;              ///< Doubles a non-critical hit.
};

class CombatResolver {
public:
    /// Crit damage multiplier.
    static constexpr float kCritMultiplier = 2.0f;

    /// Upper bound on ignition-derived crit chance.
    static constexpr float kMaxCritChance = 0.5f;

    /// Resolve one attack. Null stats stand for "no stats attribute".
    [[nodiscard]] static AttackOutcome Resolve(const CharacterStats* attacker,
                                               const CharacterStats* defender,
                                               AttackType type,
                                               const RandomSource& rng,
                                               const DamageModifiers& modifiers = {});

    /// Damage before the crit roll.
    [[nodiscard]] static int32_t BaseDamage(const CharacterStats* attacker,
                                            const CharacterStats* defender,
                                            AttackType type,
                                            const DamageModifiers& modifiers = {});

    /// ignition for melee, logic for ranged and tech.
    [[nodiscard]] static int32_t DrivingStat(const CharacterStats* attacker,
                                             AttackType type) noexcept;

    [[nodiscard]] static float CritChance(const CharacterStats* attacker) noexcept;

    /// Average damage per second over 1000 seeded swings at a
    /// 10/10/10/10 training dummy.
    [[nodiscard]] static float EffectiveDps(const CharacterStats& attacker, AttackType type,
                                            float attacksPerSecond);

    /// @p health + @p amount, capped at @p maxHealth. Health already above
    /// the cap is left where it is; negative amounts heal nothing.
    [[nodiscard]] static int32_t ApplyHealing(int32_t health, int32_t amount,
                                              int32_t maxHealth) noexcept;

    [[nodiscard]] static bool IsAlive(const Health* health) noexcept;
};

}  // namespace arc::game
