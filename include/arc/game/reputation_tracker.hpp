#pragma once

/// @file reputation_tracker.hpp
/// @brief Faction standing, qualitative levels and the gates derived from them.
///
/// Thresholds (inclusive upper bounds):
/// | Value   | Level      | Aggression | Extra dialogue        |
/// |---------|------------|------------|-----------------------|
/// | 0..10   | Hated      | 2.0        | Threaten              |
/// | 11..25  | Hostile    | 2.0        | Threaten              |
/// | 26..40  | Unfriendly | 1.5        |                       |
/// | 41..60  | Neutral    | 1.0        |                       |
/// | 61..75  | Friendly   | 0.75       | Ask for Help, Trade   |
/// | 76..90  | Honored    | 0.5        | Ask for Help, Trade   |
/// | 91..100 | Revered    | 0.5        | Ask for Help, Trade   |

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "arc/ecs/component_storage.hpp"
#include "arc/ecs/entity.hpp"
#include "arc/game/rpg_components.hpp"

namespace arc::game {

/// Minimum standing per faction required to unlock something.
using ReputationRequirements = std::map<Faction, int32_t>;

/// Common reputation deltas.
namespace reputation_delta {
constexpr int32_t kDefeatEnemy = -5;
constexpr int32_t kDefeatBoss = -15;
constexpr int32_t kCompleteQuest = 10;
constexpr int32_t kHelpCivilian = 5;
constexpr int32_t kBetrayFaction = -25;
constexpr int32_t kSpareEnemy = 3;
constexpr int32_t kDestroyProperty = -10;
} // namespace reputation_delta

class ReputationTracker {
public:
    /// Add `change.amount` to the faction, clamped to [0, 100].
    static void ApplyChange(Reputation& rep, const ReputationChange& change);

    /// Apply @p change to @p entity, giving it neutral standing first if
    /// it has none.
    static void ApplyToEntity(ecs::ComponentStorage<Reputation>& storage, ecs::Entity entity,
                              const ReputationChange& change);

    [[nodiscard]] static ReputationLevel LevelOf(int32_t value) noexcept;

    [[nodiscard]] static float AggressionMultiplier(const Reputation& rep, Faction faction);

    /// "Talk", "Leave", plus level-gated options.
    [[nodiscard]] static std::vector<std::string> DialogueOptions(const Reputation& rep,
                                                                  Faction faction);

    /// True iff every listed faction meets its minimum.
    [[nodiscard]] static bool IsQuestUnlocked(const Reputation& rep,
                                              const ReputationRequirements& requirements);

    /// Factions whose standing is at least @p threshold.
    [[nodiscard]] static std::vector<Faction> FactionsAtOrAbove(const Reputation& rep,
                                                                int32_t threshold);

    /// Display strings such as "Neutral (50)", keyed by faction.
    [[nodiscard]] static std::map<Faction, std::string> Summary(const Reputation& rep);

    /// Case-sensitive faction name lookup; unknown names log a warning.
    [[nodiscard]] static std::optional<Faction> ParseFaction(std::string_view name);
};

}  // namespace arc::game
