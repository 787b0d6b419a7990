#pragma once

/// @file combat_types.hpp
/// @brief Enumerations, constants and name tables shared by the rules modules.

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace arc::game {

/// Stat value assumed when an entity carries no CharacterStats.
constexpr int32_t kDefaultStatValue = 10;

/// Injected uniform source in [0, 1). Deterministic in tests.
using RandomSource = std::function<float()>;

/// Attack channel. Melee is driven by ignition, ranged and tech by logic.
enum class AttackType : uint8_t {
    Melee,
    Ranged,
    Tech
};

/// Row of the stability table an entity was initialised from.
enum class StabilityKind : uint8_t {
    Grunt,
    Boss,
    Player
};

enum class EffectType : uint8_t {
    Damage,
    Buff,
    Debuff,
    Heal,
    Utility
};

/// Factions tracked by reputation. Append new factions before kFactionCount.
enum class Faction : uint8_t {
    Kurenai,
    Azure
};

constexpr std::size_t kFactionCount = 2;

constexpr std::array<Faction, kFactionCount> kAllFactions = {
    Faction::Kurenai, Faction::Azure
};

/// Qualitative standing, ordered from worst to best.
enum class ReputationLevel : uint8_t {
    Hated,
    Hostile,
    Unfriendly,
    Neutral,
    Friendly,
    Honored,
    Revered
};

/// Stat build archetype used for allocation recommendations.
enum class Role : uint8_t {
    Tank,
    MeleeDps,
    RangedDps,
    Balanced
};

/// Pickup effect carried by a collectible.
enum class CollectibleKind : uint8_t {
    DataShard,  ///< Score, announced as "DATA ACQUIRED".
    RepairKit,  ///< Heals, capped at structure.
    XpCache     ///< Experience award.
};

constexpr std::string_view attackTypeName(AttackType type) {
    switch (type) {
        case AttackType::Melee:  return "melee";
        case AttackType::Ranged: return "ranged";
        case AttackType::Tech:   return "tech";
    }
    return "unknown";
}

constexpr std::string_view effectTypeName(EffectType type) {
    switch (type) {
        case EffectType::Damage:  return "damage";
        case EffectType::Buff:    return "buff";
        case EffectType::Debuff:  return "debuff";
        case EffectType::Heal:    return "heal";
        case EffectType::Utility: return "utility";
    }
    return "unknown";
}

constexpr std::string_view factionName(Faction faction) {
    switch (faction) {
        case Faction::Kurenai: return "Kurenai";
        case Faction::Azure:   return "Azure";
    }
    return "Unknown";
}

constexpr std::string_view reputationLevelName(ReputationLevel level) {
    switch (level) {
        case ReputationLevel::Hated:      return "Hated";
        case ReputationLevel::Hostile:    return "Hostile";
        case ReputationLevel::Unfriendly: return "Unfriendly";
        case ReputationLevel::Neutral:    return "Neutral";
        case ReputationLevel::Friendly:   return "Friendly";
        case ReputationLevel::Honored:    return "Honored";
        case ReputationLevel::Revered:    return "Revered";
    }
    return "Unknown";
}

constexpr std::string_view roleName(Role role) {
    switch (role) {
        case Role::Tank:      return "tank";
        case Role::MeleeDps:  return "melee_dps";
        case Role::RangedDps: return "ranged_dps";
        case Role::Balanced:  return "balanced";
    }
    return "unknown";
}

constexpr std::optional<AttackType> parseAttackType(std::string_view name) {
    if (name == "melee") {
        return AttackType::Melee;
    }
    if (name == "ranged") {
        return AttackType::Ranged;
    }
    if (name == "tech") {
        return AttackType::Tech;
    }
    return std::nullopt;
}

constexpr std::optional<EffectType> parseEffectType(std::string_view name) {
    if (name == "damage") {
        return EffectType::Damage;
    }
    if (name == "buff") {
        return EffectType::Buff;
    }
    if (name == "debuff") {
        return EffectType::Debuff;
    }
    if (name == "heal") {
        return EffectType::Heal;
    }
    if (name == "utility") {
        return EffectType::Utility;
    }
    return std::nullopt;
}

}  // namespace arc::game
