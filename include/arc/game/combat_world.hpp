#pragma once

/// @file combat_world.hpp
/// @brief Entity arena plus one storage per schema attribute.

#include <optional>

#include "arc/ecs/component_storage.hpp"
#include "arc/ecs/entity_manager.hpp"
#include "arc/game/rpg_components.hpp"

namespace arc::game {

/// Owns every entity and component of an encounter.
///
/// Rules modules receive references to the storages they read, so the
/// world must outlive them. The Spawn helpers exist for the frame driver
/// and for tests; the rules themselves never create entities.
class CombatWorld {
public:
    CombatWorld();

    CombatWorld(const CombatWorld&) = delete;
    CombatWorld& operator=(const CombatWorld&) = delete;
    CombatWorld(CombatWorld&&) = delete;
    CombatWorld& operator=(CombatWorld&&) = delete;

    // ── Spawning ─────────────────────────────────────────────────────────

    /// Player with full health, a neutral standing and a player-row gauge.
    ecs::Entity SpawnPlayer(const CharacterStats& stats, const LevelProgress& level = {});

    ecs::Entity SpawnAlly(const CharacterStats& stats, int32_t health);

    ecs::Entity SpawnEnemy(const CharacterStats& stats, int32_t health,
                           StabilityKind kind = StabilityKind::Grunt);

    ecs::Entity SpawnObstacle();

    ecs::Entity SpawnCollectible(CollectibleKind kind, int32_t amount);

    // ── Removal ──────────────────────────────────────────────────────────

    /// Queue @p entity for removal at the next Flush().
    void Remove(ecs::Entity entity) { entities.DestroyDeferred(entity); }

    /// Apply queued removals; returns how many entities were removed.
    std::size_t Flush() { return entities.FlushDeferred(); }

    [[nodiscard]] bool IsAlive(ecs::Entity entity) const noexcept {
        return entities.IsAlive(entity);
    }

    /// The first live player, if any.
    [[nodiscard]] std::optional<ecs::Entity> Player() const;

    // ── Storage ──────────────────────────────────────────────────────────

    ecs::EntityManager entities;

    ecs::ComponentStorage<Health> health;
    ecs::ComponentStorage<CharacterStats> stats;
    ecs::ComponentStorage<LevelProgress> levels;
    ecs::ComponentStorage<Stability> stability;
    ecs::ComponentStorage<BreakState> breaks;
    ecs::ComponentStorage<Invincibility> invincibility;
    ecs::ComponentStorage<Reputation> reputation;
    ecs::ComponentStorage<AbilityCooldowns> cooldowns;

    ecs::ComponentStorage<PlayerTag> players;
    ecs::ComponentStorage<AllyTag> allies;
    ecs::ComponentStorage<EnemyTag> enemies;
    ecs::ComponentStorage<ObstacleTag> obstacles;
    ecs::ComponentStorage<Collectible> collectibles;

    ecs::ComponentStorage<CombatStance> stances;
    ecs::ComponentStorage<KillReward> rewards;
};

}  // namespace arc::game
