#pragma once

/// @file combat_orchestrator.hpp
/// @brief Per-frame driver that turns detected contacts into rule calls.
///
/// Frame order:
///   0. Clamp the frame delta, expire invulnerability, tick stagger.
///   1. Ally vs enemy contacts.
///   2. Player vs enemy contacts (player strikes when attacking, else
///      the enemy strikes the player).
///   3. Player vs obstacle contacts.
///   4. Player vs collectible contacts.
///   5. Level-up sweep.
///   6. Flush removals queued by phases 1-4.
/// Player death raises gameOver, skips the remaining contact phases and
/// latches the encounter until ResetEncounter() or ResumeStage().

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "arc/ecs/entity.hpp"
#include "arc/ecs/system.hpp"
#include "arc/foundation/clock.hpp"
#include "arc/foundation/game_result.hpp"
#include "arc/game/combat_config.hpp"
#include "arc/game/combat_events.hpp"
#include "arc/game/combat_resolver.hpp"
#include "arc/game/combat_world.hpp"
#include "arc/game/hit_registration_guard.hpp"
#include "arc/game/progression_engine.hpp"
#include "arc/game/stability_manager.hpp"

namespace arc::game {

/// Two entities an external proximity check found touching this frame.
struct Contact {
    ecs::Entity first;
    ecs::Entity second;
};

/// A line of dialogue, optionally gated on faction standing.
struct DialogueEntry {
    std::string speaker;
    std::string text;
    std::optional<Faction> faction;
    int32_t minReputation = 0;
};

class CombatOrchestrator final : public ecs::ISystem {
public:
    CombatOrchestrator(CombatWorld& world, const foundation::IClock& clock,
                       CombatConfig config = {}, RandomSource rng = {});

    /// Run one frame over the contacts registered since the last frame.
    void Execute(float deltaTime) override;

    [[nodiscard]] std::string_view GetName() const override { return "CombatOrchestrator"; }

    // ── Contacts ─────────────────────────────────────────────────────────

    void AddContact(ecs::Entity first, ecs::Entity second);

    /// Replace this frame's contact list.
    void SetContacts(std::vector<Contact> contacts);

    // ── Dialogue ─────────────────────────────────────────────────────────

    void RegisterDialogue(std::string id, DialogueEntry entry);

    /// Raise dialogueShown for @p id if the player's standing allows it.
    /// @return UnknownDialogue or DialogueLocked on refusal.
    foundation::GameResult<void> ShowDialogue(std::string_view id);

    // ── Encounter state ──────────────────────────────────────────────────

    /// Record the stage handed over by a save loader and reopen the encounter.
    void ResumeStage(std::string stageId);

    [[nodiscard]] const std::string& CurrentStage() const noexcept { return stageId_; }

    /// Clear the game-over latch and any pending contacts.
    void ResetEncounter();

    [[nodiscard]] bool IsEncounterOver() const noexcept { return encounterOver_; }

    /// Running total of score deltas raised so far.
    [[nodiscard]] int64_t Score() const noexcept { return score_; }

    [[nodiscard]] CombatEvents& Events() noexcept { return events_; }

    [[nodiscard]] StabilityManager& Stability() noexcept { return stability_; }
    [[nodiscard]] HitRegistrationGuard& Guard() noexcept { return guard_; }
    [[nodiscard]] ProgressionEngine& Progression() noexcept { return progression_; }
    [[nodiscard]] const CombatConfig& Config() const noexcept { return config_; }

    /// std::mt19937-backed source seeded with @p seed.
    [[nodiscard]] static RandomSource MakeRandomSource(uint32_t seed);

private:
    /// Contacts sorted into the per-phase groups.
    struct ContactBuckets {
        std::vector<Contact> allyEnemy;    ///< first = ally, second = enemy
        std::vector<Contact> playerEnemy;  ///< first = player, second = enemy
        std::vector<Contact> playerObstacle;
        std::vector<Contact> playerCollectible;
    };

    [[nodiscard]] ContactBuckets classify(const std::vector<Contact>& contacts) const;

    /// @return false when the contact can no longer apply this frame.
    [[nodiscard]] bool usable(ecs::Entity entity) const;

    /// @p attacker strikes @p enemy. Returns true when the enemy died.
    bool strikeEnemy(ecs::Entity attacker, ecs::Entity enemy, AttackType type,
                     ColorTag hitColor);

    void resolveAllyContacts(const std::vector<Contact>& contacts);

    /// @return false when the player died.
    bool resolvePlayerEnemyContacts(const std::vector<Contact>& contacts);

    /// @return false when the player died.
    bool resolveObstacleContacts(const std::vector<Contact>& contacts);

    void resolveCollectibleContacts(const std::vector<Contact>& contacts);

    void grantKillReward(ecs::Entity player, ecs::Entity enemy);

    void awardXp(ecs::Entity player, int32_t amount);

    void raiseScore(int32_t delta);

    void endEncounter();

    CombatWorld& world_;
    const foundation::IClock& clock_;
    CombatConfig config_;
    RandomSource rng_;

    StabilityManager stability_;
    HitRegistrationGuard guard_;
    ProgressionEngine progression_;
    CombatEvents events_;

    std::vector<Contact> contacts_;
    std::unordered_map<std::string, DialogueEntry> dialogue_;
    std::string stageId_;
    int64_t score_ = 0;
    bool encounterOver_ = false;
};

}  // namespace arc::game
