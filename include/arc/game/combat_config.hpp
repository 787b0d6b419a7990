#pragma once

/// @file combat_config.hpp
/// @brief Balance constants for the rules core, loadable from YAML.

#include <cstdint>

#include "arc/foundation/clock.hpp"
#include "arc/foundation/config_manager.hpp"

namespace arc::game {

/// Tuning values. Defaults are the shipped balance.
///
/// YAML keys:
/// | Key                                | Field                |
/// |------------------------------------|----------------------|
/// | combat.invincibility_ms            | invincibilityWindow  |
/// | combat.break_duration_ms           | breakDuration        |
/// | combat.regen_grace_ms              | regenGrace           |
/// | combat.obstacle_damage             | obstacleDamage       |
/// | combat.kill_score                  | killScore            |
/// | combat.kill_xp                     | killXp               |
/// | progression.max_level              | maxLevel             |
/// | progression.stat_points_per_level  | statPointsPerLevel   |
/// | progression.level_up_guard         | levelUpGuard         |
/// | frame.max_delta_seconds            | maxFrameDelta        |
struct CombatConfig {
    foundation::Milliseconds invincibilityWindow{500};
    foundation::Milliseconds breakDuration{5000};
    foundation::Milliseconds regenGrace{1000};

    int32_t obstacleDamage = 10;
    int32_t killScore = 100;
    int32_t killXp = 20;

    int32_t maxLevel = 30;
    int32_t statPointsPerLevel = 3;
    int32_t levelUpGuard = 100;

    float maxFrameDelta = 0.1f;

    /// Read overrides from @p config. Missing keys keep their default;
    /// out-of-range values are logged and ignored.
    static CombatConfig FromConfig(const foundation::ConfigManager& config);
};

}  // namespace arc::game
