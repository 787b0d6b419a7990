/// @file combat_world.cpp
/// @brief CombatWorld storage wiring and spawn helpers.

#include "arc/game/combat_world.hpp"

#include "arc/game/stability_manager.hpp"

namespace arc::game {

CombatWorld::CombatWorld() {
    entities.RegisterStorage(&health);
    entities.RegisterStorage(&stats);
    entities.RegisterStorage(&levels);
    entities.RegisterStorage(&stability);
    entities.RegisterStorage(&breaks);
    entities.RegisterStorage(&invincibility);
    entities.RegisterStorage(&reputation);
    entities.RegisterStorage(&cooldowns);

    entities.RegisterStorage(&players);
    entities.RegisterStorage(&allies);
    entities.RegisterStorage(&enemies);
    entities.RegisterStorage(&obstacles);
    entities.RegisterStorage(&collectibles);

    entities.RegisterStorage(&stances);
    entities.RegisterStorage(&rewards);
}

ecs::Entity CombatWorld::SpawnPlayer(const CharacterStats& playerStats,
                                     const LevelProgress& level) {
    const auto e = entities.Create();
    players.Add(e);
    stats.Add(e, playerStats);
    health.Add(e, playerStats.structure);
    levels.Add(e, level);
    stability.Add(e, StabilityManager::Initialize(StabilityKind::Player));
    reputation.Add(e, Reputation::Neutral());
    cooldowns.Add(e);
    stances.Add(e);
    return e;
}

ecs::Entity CombatWorld::SpawnAlly(const CharacterStats& allyStats, int32_t hp) {
    const auto e = entities.Create();
    allies.Add(e);
    stats.Add(e, allyStats);
    health.Add(e, hp);
    return e;
}

ecs::Entity CombatWorld::SpawnEnemy(const CharacterStats& enemyStats, int32_t hp,
                                    StabilityKind kind) {
    const auto e = entities.Create();
    enemies.Add(e);
    stats.Add(e, enemyStats);
    health.Add(e, hp);
    stability.Add(e, StabilityManager::Initialize(kind));
    return e;
}

ecs::Entity CombatWorld::SpawnObstacle() {
    const auto e = entities.Create();
    obstacles.Add(e);
    return e;
}

ecs::Entity CombatWorld::SpawnCollectible(CollectibleKind kind, int32_t amount) {
    const auto e = entities.Create();
    collectibles.Add(e, kind, amount);
    return e;
}

std::optional<ecs::Entity> CombatWorld::Player() const {
    for (std::size_t i = 0; i < players.Size(); ++i) {
        const auto e = players.EntityAt(i);
        if (entities.IsAlive(e)) {
            return e;
        }
    }
    return std::nullopt;
}

}  // namespace arc::game
