#pragma once

/// @file stat_allocation_validator.hpp
/// @brief Spending, recommending and refunding stat points.

#include <cstdint>
#include <optional>
#include <string_view>

#include "arc/ecs/component_storage.hpp"
#include "arc/ecs/entity.hpp"
#include "arc/foundation/game_result.hpp"
#include "arc/game/rpg_components.hpp"

namespace arc::game {

/// Points to add to each stat.
struct StatAllocation {
    int32_t structure = 0;
    int32_t ignition = 0;
    int32_t logic = 0;
    int32_t flow = 0;

    [[nodiscard]] int64_t Total() const noexcept {
        return static_cast<int64_t>(structure) + ignition + logic + flow;
    }

    bool operator==(const StatAllocation&) const = default;
};

/// Result of a successful Apply().
struct AllocationOutcome {
    CharacterStats stats;
    int32_t remainingPoints = 0;
};

class StatAllocationValidator {
public:
    StatAllocationValidator(ecs::ComponentStorage<CharacterStats>& stats,
                            ecs::ComponentStorage<LevelProgress>& levels);

    /// Reject negative fields or a total above @p availablePoints.
    [[nodiscard]] static foundation::GameResult<void> Validate(const StatAllocation& allocation,
                                                               int32_t availablePoints);

    /// Spend @p allocation from the entity's unspent points.
    ///
    /// Re-validates against `LevelProgress::statPoints`. Stats only grow;
    /// the points deducted always equal the allocation total.
    /// @return New stats and remaining points, or InvalidAllocation /
    ///         MissingComponent.
    foundation::GameResult<AllocationOutcome> Apply(ecs::Entity entity,
                                                    const StatAllocation& allocation);

    /// Split @p points by role weights, flooring each share and handing
    /// the remainder to the role's primary stat.
    [[nodiscard]] static StatAllocation Recommend(Role role, int32_t points);

    /// Restore stats to @p baseStats and refund the difference as points.
    /// Stats already below base refund nothing for that field.
    /// @return Points refunded, or MissingComponent.
    foundation::GameResult<int32_t> Reset(ecs::Entity entity, const CharacterStats& baseStats);

    /// "tank", "melee_dps", "ranged_dps" or "balanced"; unknown names log
    /// a warning and yield nullopt.
    [[nodiscard]] static std::optional<Role> ParseRole(std::string_view name);

private:
    ecs::ComponentStorage<CharacterStats>& stats_;
    ecs::ComponentStorage<LevelProgress>& levels_;
};

}  // namespace arc::game
