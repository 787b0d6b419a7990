/// @file ability_cooldown_manager.cpp
/// @brief AbilityCooldownManager implementation.

#include "arc/game/ability_cooldown_manager.hpp"

#include <algorithm>
#include <string>

#include "arc/foundation/game_logger.hpp"
#include "arc/game/combat_resolver.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::Milliseconds;
using foundation::WallTime;

AbilityCooldownManager::AbilityCooldownManager(ecs::ComponentStorage<Health>& health,
                                               ecs::ComponentStorage<CharacterStats>& stats,
                                               ecs::ComponentStorage<AbilityCooldowns>& cooldowns,
                                               const foundation::IClock& clock)
    : health_(health), stats_(stats), cooldowns_(cooldowns), clock_(clock) {}

bool AbilityCooldownManager::IsOnCooldown(const CooldownEntry* entry, WallTime now) noexcept {
    return entry != nullptr && now < entry->endsAt;
}

Milliseconds AbilityCooldownManager::Remaining(const CooldownEntry* entry, WallTime now) noexcept {
    if (!IsOnCooldown(entry, now)) {
        return Milliseconds(0);
    }
    return entry->endsAt - now;
}

bool AbilityCooldownManager::IsOnCooldown(const AbilityCooldowns& cooldowns,
                                          std::string_view abilityId) const {
    return IsOnCooldown(cooldowns.Find(abilityId), clock_.Now());
}

Milliseconds AbilityCooldownManager::Remaining(const AbilityCooldowns& cooldowns,
                                               std::string_view abilityId) const {
    return Remaining(cooldowns.Find(abilityId), clock_.Now());
}

bool AbilityCooldownManager::CanAfford(ecs::Entity /*caster*/, const Ability& /*ability*/) const {
    return true;
}

GameResult<AbilityEffect> AbilityCooldownManager::Execute(ecs::Entity caster, ecs::Entity target,
                                                          const Ability& ability,
                                                          const AbilityCooldowns& cooldowns) {
    const auto remaining = Remaining(cooldowns, ability.id);
    if (remaining.count() > 0) {
        return GameResult<AbilityEffect>::err(
            GameError(ErrorCode::AbilityOnCooldown,
                      "ability " + ability.id + " is on cooldown", remaining));
    }

    if (!CanAfford(caster, ability)) {
        return GameResult<AbilityEffect>::err(
            GameError(ErrorCode::InsufficientResource, "cannot afford ability " + ability.id));
    }

    AbilityEffect effect{ability.effectType, ability.effectValue, target};

    switch (ability.effectType) {
        case EffectType::Damage: {
            auto* hp = health_.TryGet(target);
            if (hp == nullptr) {
                break;
            }
            hp->value = std::max(0, hp->value - std::max(0, ability.effectValue));
            return GameResult<AbilityEffect>::ok(effect);
        }
        case EffectType::Heal: {
            auto* hp = health_.TryGet(target);
            const auto* stats = stats_.TryGet(target);
            if (hp == nullptr || stats == nullptr) {
                break;
            }
            hp->value = CombatResolver::ApplyHealing(hp->value, ability.effectValue,
                                                     stats->structure);
            return GameResult<AbilityEffect>::ok(effect);
        }
        case EffectType::Buff:
        case EffectType::Debuff:
        case EffectType::Utility:
            return GameResult<AbilityEffect>::ok(effect);
    }

    return GameResult<AbilityEffect>::err(
        GameError(ErrorCode::AbilityInvalidTarget,
                  "invalid target " + std::to_string(target.id()) + " for ability " + ability.id));
}

void AbilityCooldownManager::ApplyCooldown(AbilityCooldowns& cooldowns,
                                           const Ability& ability) const {
    const auto endsAt = clock_.Now() + ability.cooldown;
    if (auto* entry = cooldowns.Find(ability.id)) {
        entry->endsAt = endsAt;
        return;
    }
    cooldowns.entries.push_back(CooldownEntry{ability.id, endsAt});
}

GameResult<AbilityEffect> AbilityCooldownManager::Use(ecs::Entity caster, ecs::Entity target,
                                                      const Ability& ability) {
    auto& cooldowns = cooldowns_.GetOrAdd(caster);
    auto result = Execute(caster, target, ability, cooldowns);
    if (result) {
        ApplyCooldown(cooldowns, ability);
    } else {
        ARC_LOG_DEBUG(LogCategory::Ability, std::string(result.error().message()));
    }
    return result;
}

std::size_t AbilityCooldownManager::PruneExpired(AbilityCooldowns& cooldowns) const {
    const auto now = clock_.Now();
    return std::erase_if(cooldowns.entries,
                         [now](const CooldownEntry& e) {
                             return !AbilityCooldownManager::IsOnCooldown(&e, now);
                         });
}

}  // namespace arc::game
