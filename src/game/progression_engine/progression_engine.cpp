/// @file progression_engine.cpp
/// @brief ProgressionEngine implementation.

#include "arc/game/progression_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "arc/ecs/query.hpp"
#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

ProgressionEngine::ProgressionEngine(ecs::ComponentStorage<LevelProgress>& levels,
                                     ecs::ComponentStorage<CharacterStats>& stats,
                                     ecs::ComponentStorage<Health>& health,
                                     ProgressionRules rules)
    : levels_(levels), stats_(stats), health_(health), rules_(rules) {}

int32_t ProgressionEngine::XpRequired(int32_t level) noexcept {
    const double clamped = std::max(1, level);
    return static_cast<int32_t>(std::floor(100.0 * std::pow(clamped, 1.5)));
}

int32_t ProgressionEngine::AwardXp(ecs::Entity entity, int32_t amount, float bonusMultiplier) {
    auto* level = levels_.TryGet(entity);
    if (level == nullptr) {
        return 0;
    }
    if (amount < 0 || bonusMultiplier < 0.0f) {
        ARC_LOG_WARN(LogCategory::Progression,
                     "ignoring negative xp award for entity " + std::to_string(entity.id()));
        return 0;
    }

    const double scaled = std::floor(static_cast<double>(amount) * bonusMultiplier);
    const double headroom =
        static_cast<double>(std::numeric_limits<int32_t>::max()) - std::max(0, level->xp);
    const auto gained = static_cast<int32_t>(std::min(scaled, headroom));

    level->xp = std::max(0, level->xp) + gained;
    return gained;
}

bool ProgressionEngine::repair(ecs::Entity entity, LevelProgress& level) const {
    LogContext ctx;
    ctx.entityId = entity.id();

    if (level.current < 1) {
        ctx.extra["level"] = std::to_string(level.current);
        level.current = 1;
    }
    if (level.xp < 0) {
        ctx.extra["xp"] = std::to_string(level.xp);
        level.xp = 0;
    }
    if (level.nextLevelXp <= 0) {
        ctx.extra["next_level_xp"] = std::to_string(level.nextLevelXp);
        level.nextLevelXp = XpRequired(level.current);
    }
    if (level.statPoints < 0) {
        ctx.extra["stat_points"] = std::to_string(level.statPoints);
        level.statPoints = 0;
    }

    if (ctx.extra.empty()) {
        return false;
    }
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Warning, LogCategory::Progression, "corrupt level state reset", ctx);
    return true;
}

std::vector<LevelUpEvent> ProgressionEngine::ProcessLevelUps() {
    std::vector<LevelUpEvent> events;

    ecs::Query<LevelProgress, CharacterStats> levelled(levels_, stats_);
    levelled.ForEach([&](ecs::Entity e, LevelProgress& level, CharacterStats& stats) {
        repair(e, level);

        const int32_t oldLevel = level.current;
        int32_t iterations = 0;

        while (level.current < rules_.maxLevel && level.xp >= level.nextLevelXp) {
            if (iterations >= rules_.levelUpGuard) {
                ARC_LOG_WARN(LogCategory::Progression,
                             "level-up guard hit for entity " + std::to_string(e.id()));
                break;
            }
            ++iterations;

            level.xp -= level.nextLevelXp;
            ++level.current;
            level.nextLevelXp = XpRequired(level.current);
            level.statPoints += rules_.statPointsPerLevel;
        }

        if (level.current >= rules_.maxLevel && level.xp >= level.nextLevelXp) {
            level.xp = level.nextLevelXp - 1;
        }

        if (level.current > oldLevel) {
            if (auto* hp = health_.TryGet(e)) {
                hp->value = std::max(0, stats.structure);
            }
            ARC_LOG_INFO(LogCategory::Progression,
                         "entity " + std::to_string(e.id()) + " reached level " +
                         std::to_string(level.current));
            events.push_back(LevelUpEvent{e, oldLevel, level.current});
        }
    });

    return events;
}

}  // namespace arc::game
