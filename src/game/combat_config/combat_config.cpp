/// @file combat_config.cpp
/// @brief CombatConfig loading from ConfigManager.

#include "arc/game/combat_config.hpp"

#include <string>
#include <string_view>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::LogCategory;

namespace {

/// Overwrite @p target with the value at @p key when it is at least @p min.
template <typename T>
void readAtLeast(const foundation::ConfigManager& config, std::string_view key,
                 T min, T& target) {
    if (!config.hasKey(key)) {
        return;
    }
    auto value = config.get<T>(key);
    if (!value) {
        ARC_LOG_WARN(LogCategory::Config, std::string(value.error().message()));
        return;
    }
    if (value.value() < min) {
        ARC_LOG_WARN(LogCategory::Config,
                     "ignoring out-of-range value for " + std::string(key));
        return;
    }
    target = value.value();
}

void readMillis(const foundation::ConfigManager& config, std::string_view key,
                foundation::Milliseconds& target) {
    auto count = static_cast<int64_t>(target.count());
    readAtLeast<int64_t>(config, key, 0, count);
    target = foundation::Milliseconds(count);
}

} // namespace

CombatConfig CombatConfig::FromConfig(const foundation::ConfigManager& config) {
    CombatConfig out;

    readMillis(config, "combat.invincibility_ms", out.invincibilityWindow);
    readMillis(config, "combat.break_duration_ms", out.breakDuration);
    readMillis(config, "combat.regen_grace_ms", out.regenGrace);

    readAtLeast<int32_t>(config, "combat.obstacle_damage", 0, out.obstacleDamage);
    readAtLeast<int32_t>(config, "combat.kill_score", 0, out.killScore);
    readAtLeast<int32_t>(config, "combat.kill_xp", 0, out.killXp);

    readAtLeast<int32_t>(config, "progression.max_level", 1, out.maxLevel);
    readAtLeast<int32_t>(config, "progression.stat_points_per_level", 0,
                         out.statPointsPerLevel);
    readAtLeast<int32_t>(config, "progression.level_up_guard", 1, out.levelUpGuard);

    readAtLeast<float>(config, "frame.max_delta_seconds", 0.0f, out.maxFrameDelta);

    return out;
}

} // namespace arc::game
