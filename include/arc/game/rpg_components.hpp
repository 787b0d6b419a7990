#pragma once

/// @file rpg_components.hpp
/// @brief Entity schema: the attributes a combat-capable entity may carry.
///
/// Each struct is stored in its own ComponentStorage. An entity without a
/// given component is simply outside the rules that read it.

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "arc/foundation/clock.hpp"
#include "arc/game/combat_types.hpp"

namespace arc::game {

using foundation::WallTime;

// ── Vital state ─────────────────────────────────────────────────────────

/// Hit points. Never negative after a rules mutation.
struct Health {
    int32_t value = 0;
};

/// The four character stats. `structure` doubles as the health ceiling,
/// `ignition` drives melee and crit, `logic` drives ranged and tech.
struct CharacterStats {
    int32_t structure = kDefaultStatValue;
    int32_t ignition = kDefaultStatValue;
    int32_t logic = kDefaultStatValue;
    int32_t flow = kDefaultStatValue;

    [[nodiscard]] int32_t Total() const noexcept {
        return structure + ignition + logic + flow;
    }

    bool operator==(const CharacterStats&) const = default;
};

/// Level, experience and unspent stat points.
struct LevelProgress {
    int32_t current = 1;
    int32_t xp = 0;
    int32_t nextLevelXp = 100;
    int32_t statPoints = 0;
};

// ── Stagger ─────────────────────────────────────────────────────────────

/// Stagger gauge. 0 <= current <= max.
struct Stability {
    float current = 0.0f;
    float max = 0.0f;
    float regenRate = 0.0f;                ///< Points per second.
    std::optional<WallTime> lastHitTime;   ///< Unset until first hit.
    StabilityKind kind = StabilityKind::Grunt;
};

/// Broken window; lapses lazily once `endsAt` has passed.
struct BreakState {
    bool isBroken = false;
    WallTime endsAt{};
};

/// Post-hit invulnerability window.
struct Invincibility {
    bool isInvincible = false;
    WallTime endsAt{};
};

// ── Standing ────────────────────────────────────────────────────────────

/// Faction standing, each value in [0, 100].
struct Reputation {
    static constexpr int32_t kMin = 0;
    static constexpr int32_t kMax = 100;
    static constexpr int32_t kNeutral = 50;

    std::map<Faction, int32_t> standings;

    /// Every known faction at the neutral value.
    static Reputation Neutral() {
        Reputation rep;
        for (auto faction : kAllFactions) {
            rep.standings[faction] = kNeutral;
        }
        return rep;
    }

    /// Standing toward @p faction; neutral when untracked.
    [[nodiscard]] int32_t ValueOf(Faction faction) const {
        auto it = standings.find(faction);
        return it != standings.end() ? it->second : kNeutral;
    }
};

/// A single signed adjustment to one faction.
struct ReputationChange {
    Faction faction = Faction::Kurenai;
    int32_t amount = 0;
    std::string reason;
};

// ── Abilities ───────────────────────────────────────────────────────────

struct CooldownEntry {
    std::string abilityId;
    WallTime endsAt{};
};

/// Active cooldowns, at most one entry per ability id.
struct AbilityCooldowns {
    std::vector<CooldownEntry> entries;

    [[nodiscard]] const CooldownEntry* Find(std::string_view abilityId) const {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&](const CooldownEntry& e) { return e.abilityId == abilityId; });
        return it != entries.end() ? &*it : nullptr;
    }

    [[nodiscard]] CooldownEntry* Find(std::string_view abilityId) {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&](const CooldownEntry& e) { return e.abilityId == abilityId; });
        return it != entries.end() ? &*it : nullptr;
    }
};

// ── Groups ──────────────────────────────────────────────────────────────

struct PlayerTag {};
struct AllyTag {};
struct EnemyTag {};
struct ObstacleTag {};

struct Collectible {
    CollectibleKind kind = CollectibleKind::DataShard;
    int32_t amount = 0;
};

/// Whether the player is mid-swing; decides who strikes on contact.
struct CombatStance {
    bool attacking = false;
    AttackType attackType = AttackType::Melee;
};

/// Per-enemy override of the kill bounty.
struct KillReward {
    int32_t score = 0;
    int32_t xp = 0;
    std::optional<ReputationChange> reputation;
};

}  // namespace arc::game
