#pragma once

/// @file progression_engine.hpp
/// @brief Experience curve, level-ups and stat-point grants.

#include <cstdint>
#include <vector>

#include "arc/ecs/component_storage.hpp"
#include "arc/ecs/entity.hpp"
#include "arc/game/rpg_components.hpp"

namespace arc::game {

/// Limits applied by the level-up sweep.
struct ProgressionRules {
    int32_t maxLevel = 30;
    int32_t statPointsPerLevel = 3;
    int32_t levelUpGuard = 100;  ///< Max level-ups processed per entity per sweep.
};

/// Emitted once per entity whose level rose during a sweep.
struct LevelUpEvent {
    ecs::Entity entity;
    int32_t oldLevel = 0;
    int32_t newLevel = 0;
};

/// Grants experience and turns it into levels.
///
/// XP awards only accumulate; levels are resolved by ProcessLevelUps(),
/// which the frame driver calls once per frame. Corrupt progression is
/// repaired in place and logged rather than reported as an error.
class ProgressionEngine {
public:
    ProgressionEngine(ecs::ComponentStorage<LevelProgress>& levels,
                      ecs::ComponentStorage<CharacterStats>& stats,
                      ecs::ComponentStorage<Health>& health,
                      ProgressionRules rules = {});

    /// XP needed to advance from @p level: floor(100 * level^1.5).
    [[nodiscard]] static int32_t XpRequired(int32_t level) noexcept;

    /// Add floor(@p amount * @p bonusMultiplier) XP to @p entity.
    /// Negative awards and entities without LevelProgress are ignored.
    /// @return XP actually added.
    int32_t AwardXp(ecs::Entity entity, int32_t amount, float bonusMultiplier = 1.0f);

    /// Resolve pending level-ups on every entity with LevelProgress and
    /// CharacterStats. Each level grants stat points and a full heal to
    /// `structure`.
    std::vector<LevelUpEvent> ProcessLevelUps();

    [[nodiscard]] const ProgressionRules& Rules() const noexcept { return rules_; }

private:
    /// Repair a corrupt record. Returns true if anything was changed.
    bool repair(ecs::Entity entity, LevelProgress& level) const;

    ecs::ComponentStorage<LevelProgress>& levels_;
    ecs::ComponentStorage<CharacterStats>& stats_;
    ecs::ComponentStorage<Health>& health_;
    ProgressionRules rules_;
};

}  // namespace arc::game
