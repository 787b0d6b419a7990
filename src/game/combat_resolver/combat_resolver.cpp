/// @file combat_resolver.cpp
/// @brief CombatResolver implementation.

#include "arc/game/combat_resolver.hpp"

#include <algorithm>
#include <cmath>

namespace arc::game {

namespace {

constexpr float kBaseAttack = 10.0f;
constexpr int kDpsSamples = 1000;

/// 31-bit LCG so DPS estimates are stable across runs and platforms.
class SeededSequence {
public:
    explicit SeededSequence(uint32_t seed) : state_(seed) {}

    float operator()() {
        state_ = (state_ * 1103515245u + 12345u) & 0x7fffffffu;
        return static_cast<float>(state_) / static_cast<float>(0x7fffffff);
    }

private:
    uint32_t state_;
};

int32_t statOr(const CharacterStats* stats, int32_t CharacterStats::*field) noexcept {
    return stats != nullptr ? stats->*field : kDefaultStatValue;
}

} // namespace

int32_t CombatResolver::DrivingStat(const CharacterStats* attacker, AttackType type) noexcept {
    return type == AttackType::Melee ? statOr(attacker, &CharacterStats::ignition)
                                     : statOr(attacker, &CharacterStats::logic);
}

float CombatResolver::CritChance(const CharacterStats* attacker) noexcept {
    const auto ignition = static_cast<float>(statOr(attacker, &CharacterStats::ignition));
    return std::min(ignition * 0.01f, kMaxCritChance);
}

int32_t CombatResolver::BaseDamage(const CharacterStats* attacker,
                                   const CharacterStats* defender,
                                   AttackType type,
                                   const DamageModifiers& modifiers) {
    const auto driving = static_cast<double>(DrivingStat(attacker, type));
    const double attackPower = kBaseAttack + 0.5 * driving;
    const double statMultiplier = driving / 10.0;
    const double defense = statOr(defender, &CharacterStats::structure) / 2.0;

    double raw = attackPower * statMultiplier - defense / 2.0;
    raw = raw * modifiers.damageMultiplier + modifiers.flatBonus;

    return static_cast<int32_t>(std::floor(std::max(0.0, raw)));
}

AttackOutcome CombatResolver::Resolve(const CharacterStats* attacker,
                                      const CharacterStats* defender,
                                      AttackType type,
                                      const RandomSource& rng,
                                      const DamageModifiers& modifiers) {
    AttackOutcome out;
    out.damage = BaseDamage(attacker, defender, type, modifiers);

    const float chance = modifiers.critChanceOverride.value_or(CritChance(attacker));
    out.isCritical = rng() < chance;

    if (out.isCritical) {
        out.damage = static_cast<int32_t>(std::floor(out.damage * kCritMultiplier));
    } else if (modifiers.defenderBroken) {
        out.damage *= 2;
    }
    return out;
}

float CombatResolver::EffectiveDps(const CharacterStats& attacker, AttackType type,
                                   float attacksPerSecond) {
    const CharacterStats dummy{};
    SeededSequence sequence(12345);
    const RandomSource rng = [&sequence]() { return sequence(); };

    int64_t total = 0;
    for (int i = 0; i < kDpsSamples; ++i) {
        total += Resolve(&attacker, &dummy, type, rng).damage;
    }
    const float average = static_cast<float>(total) / static_cast<float>(kDpsSamples);
    return average * std::max(0.0f, attacksPerSecond);
}

int32_t CombatResolver::ApplyHealing(int32_t health, int32_t amount, int32_t maxHealth) noexcept {
    const int64_t raised = static_cast<int64_t>(health) + std::max(0, amount);
    return static_cast<int32_t>(std::clamp<int64_t>(raised, 0, std::max(health, maxHealth)));
}

bool CombatResolver::IsAlive(const Health* health) noexcept {
    return health != nullptr && health->value > 0;
}

}  // namespace arc::game
