#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "arc/ecs/entity.hpp"
#include "arc/foundation/clock.hpp"
#include "arc/foundation/error_code.hpp"
#include "arc/game/combat_orchestrator.hpp"
#include "arc/game/combat_world.hpp"
#include "arc/game/reputation_tracker.hpp"
#include "mock_logger.hpp"

using namespace arc::ecs;
using namespace arc::game;
using arc::foundation::ErrorCode;
using arc::foundation::fromMillis;
using arc::foundation::ManualClock;
using arc::foundation::Milliseconds;
using arc::test::log_level;
using arc::test::ScopedMockLogger;

namespace {

using TextEvent = std::pair<std::string, ColorTag>;

constexpr CharacterStats kPlayerStats{60, 20, 10, 10};
constexpr CharacterStats kGruntStats{50, 10, 10, 10};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Fixture: one player, a manual clock and a roll that never crits
// ═══════════════════════════════════════════════════════════════════════════

class CombatOrchestratorTest : public ::testing::Test {
protected:
    CombatOrchestratorTest()
        : clock_(fromMillis(10000)),
          orch_(world_, clock_, CombatConfig{}, [] { return 0.99f; }) {
        player_ = world_.SpawnPlayer(kPlayerStats);

        auto& events = orch_.Events();
        events.combatText.connect(
            [this](const std::string& text, ColorTag color) { texts_.emplace_back(text, color); });
        events.scoreUpdate.connect([this](int32_t delta) { scores_.push_back(delta); });
        events.cameraShake.connect([this] { ++shakes_; });
        events.gameOver.connect([this] { ++gameOvers_; });
        events.dialogueShown.connect([this](const std::string& speaker, const std::string& text) {
            dialogue_.emplace_back(speaker, text);
        });
    }

    void setAttacking(bool attacking) { world_.stances.Get(player_).attacking = attacking; }

    void frame() { orch_.Execute(0.016f); }

    ScopedMockLogger log_;
    ManualClock clock_;
    CombatWorld world_;
    CombatOrchestrator orch_;
    Entity player_;

    std::vector<TextEvent> texts_;
    std::vector<int32_t> scores_;
    int shakes_ = 0;
    int gameOvers_ = 0;
    std::vector<std::pair<std::string, std::string>> dialogue_;
};

TEST_F(CombatOrchestratorTest, IsNamedSystem) {
    EXPECT_EQ(orch_.GetName(), "CombatOrchestrator");
}

// ═══════════════════════════════════════════════════════════════════════════
// Player vs enemy
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatOrchestratorTest, AttackingPlayerKillsEnemyForDefaultReward) {
    Entity enemy = world_.SpawnEnemy(kGruntStats, 20);
    setAttacking(true);

    orch_.AddContact(player_, enemy);
    frame();

    EXPECT_FALSE(world_.IsAlive(enemy));
    EXPECT_EQ(orch_.Score(), 100);
    EXPECT_EQ(scores_, std::vector<int32_t>{100});
    EXPECT_EQ(world_.levels.Get(player_).xp, 20);
    EXPECT_EQ(shakes_, 1);
    ASSERT_EQ(texts_.size(), 2u);
    EXPECT_EQ(texts_[0], (TextEvent{"27", ColorTag::Red}));
    EXPECT_EQ(texts_[1], (TextEvent{"+20 XP", ColorTag::Green}));
}

TEST_F(CombatOrchestratorTest, KillRewardOverridesDefaultsAndShiftsStanding) {
    Entity boss = world_.SpawnEnemy(kGruntStats, 20, StabilityKind::Boss);
    world_.rewards.Add(boss, 500, 250,
                       ReputationChange{Faction::Azure, reputation_delta::kDefeatBoss, "boss"});
    setAttacking(true);

    orch_.AddContact(player_, boss);
    frame();

    EXPECT_EQ(orch_.Score(), 500);
    EXPECT_EQ(world_.reputation.Get(player_).ValueOf(Faction::Azure), 35);
    EXPECT_EQ(world_.reputation.Get(player_).ValueOf(Faction::Kurenai), 50);
}

TEST_F(CombatOrchestratorTest, SurvivingEnemyLosesStability) {
    Entity enemy = world_.SpawnEnemy(kGruntStats, 200);
    setAttacking(true);

    orch_.AddContact(player_, enemy);
    frame();

    EXPECT_TRUE(world_.IsAlive(enemy));
    EXPECT_EQ(world_.health.Get(enemy).value, 173);
    EXPECT_FLOAT_EQ(world_.stability.Get(enemy).current, 73.0f);
    EXPECT_EQ(orch_.Score(), 0);
}

TEST_F(CombatOrchestratorTest, BrokenEnemyTakesDoubleDamage) {
    Entity enemy = world_.SpawnEnemy(kGruntStats, 200);
    orch_.Stability().ApplyBreakState(enemy);
    setAttacking(true);

    orch_.AddContact(player_, enemy);
    frame();

    EXPECT_EQ(world_.health.Get(enemy).value, 146);
}

TEST_F(CombatOrchestratorTest, EnemyWithoutHealthDiesToAnyHit) {
    Entity enemy = world_.entities.Create();
    world_.enemies.Add(enemy);
    setAttacking(true);

    orch_.AddContact(player_, enemy);
    frame();

    EXPECT_FALSE(world_.IsAlive(enemy));
    EXPECT_EQ(orch_.Score(), 100);
}

TEST_F(CombatOrchestratorTest, IdlePlayerIsStruckByEnemy) {
    Entity enemy = world_.SpawnEnemy({50, 20, 10, 10}, 100);

    orch_.AddContact(player_, enemy);
    frame();

    EXPECT_EQ(world_.health.Get(player_).value, 35);
    EXPECT_FLOAT_EQ(world_.stability.Get(player_).current, 175.0f);
    EXPECT_FALSE(world_.IsAlive(enemy));
    ASSERT_EQ(texts_.size(), 1u);
    EXPECT_EQ(texts_[0], (TextEvent{"-25", ColorTag::Red}));
    EXPECT_EQ(shakes_, 1);
}

TEST_F(CombatOrchestratorTest, HarmlessEnemyLeavesNoMark) {
    Entity drone = world_.SpawnEnemy({10, 0, 0, 10}, 100);

    orch_.AddContact(player_, drone);
    frame();

    EXPECT_EQ(world_.health.Get(player_).value, 60);
    EXPECT_TRUE(texts_.empty());
    EXPECT_EQ(shakes_, 0);
    EXPECT_FALSE(world_.invincibility.Has(player_));
    EXPECT_FALSE(world_.IsAlive(drone));
}

TEST_F(CombatOrchestratorTest, ContactOrderDoesNotMatter) {
    Entity enemy = world_.SpawnEnemy({50, 20, 10, 10}, 100);

    orch_.AddContact(enemy, player_);
    frame();

    EXPECT_EQ(world_.health.Get(player_).value, 35);
}

TEST_F(CombatOrchestratorTest, RepeatedContactsLandOncePerWindow) {
    Entity first = world_.SpawnEnemy({50, 20, 10, 10}, 100);
    Entity second = world_.SpawnEnemy({50, 20, 10, 10}, 100);

    orch_.AddContact(player_, first);
    orch_.AddContact(second, player_);
    frame();
    EXPECT_EQ(world_.health.Get(player_).value, 35);
    EXPECT_FALSE(world_.IsAlive(first));
    EXPECT_FALSE(world_.IsAlive(second));

    clock_.Advance(Milliseconds(499));
    orch_.AddContact(player_, world_.SpawnEnemy({50, 20, 10, 10}, 100));
    frame();
    EXPECT_EQ(world_.health.Get(player_).value, 35);

    clock_.Advance(Milliseconds(1));
    orch_.AddContact(player_, world_.SpawnEnemy({50, 20, 10, 10}, 100));
    frame();
    EXPECT_EQ(world_.health.Get(player_).value, 10);
}

TEST_F(CombatOrchestratorTest, ShieldedPlayerStillBreaksEnemy) {
    Entity first = world_.SpawnEnemy({50, 20, 10, 10}, 100);
    orch_.AddContact(player_, first);
    frame();
    ASSERT_EQ(world_.health.Get(player_).value, 35);
    texts_.clear();

    Entity second = world_.SpawnEnemy({50, 20, 10, 10}, 100);
    orch_.AddContact(player_, second);
    frame();

    EXPECT_EQ(world_.health.Get(player_).value, 35);
    EXPECT_FALSE(world_.IsAlive(second));
    EXPECT_TRUE(texts_.empty());

    clock_.Advance(Milliseconds(1000));
    frame();
    EXPECT_EQ(world_.health.Get(player_).value, 35);
}

TEST_F(CombatOrchestratorTest, ContactsAreConsumedEachFrame) {
    Entity enemy = world_.SpawnEnemy(kGruntStats, 200);
    setAttacking(true);

    orch_.AddContact(player_, enemy);
    frame();
    clock_.Advance(Milliseconds(1000));
    frame();

    EXPECT_EQ(world_.health.Get(enemy).value, 173);
}

TEST_F(CombatOrchestratorTest, SetContactsReplacesPending) {
    Entity enemy = world_.SpawnEnemy({50, 20, 10, 10}, 100);
    Entity obstacle = world_.SpawnObstacle();

    orch_.AddContact(player_, enemy);
    orch_.SetContacts({Contact{player_, obstacle}});
    frame();

    EXPECT_EQ(world_.health.Get(player_).value, 50);
}

// ═══════════════════════════════════════════════════════════════════════════
// Game over
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatOrchestratorTest, PlayerDeathEndsEncounterAndSkipsLaterPhases) {
    Entity brute = world_.SpawnEnemy({50, 30, 10, 10}, 100);
    Entity shard = world_.SpawnCollectible(CollectibleKind::DataShard, 25);

    orch_.AddContact(player_, brute);
    orch_.AddContact(player_, shard);
    frame();

    EXPECT_EQ(world_.health.Get(player_).value, 0);
    EXPECT_TRUE(orch_.IsEncounterOver());
    EXPECT_EQ(gameOvers_, 1);
    EXPECT_TRUE(world_.IsAlive(shard));
    EXPECT_EQ(orch_.Score(), 0);
    EXPECT_EQ(log_->count(log_level::info, "player defeated"), 1u);
}

TEST_F(CombatOrchestratorTest, FramesAreIgnoredAfterGameOver) {
    Entity brute = world_.SpawnEnemy({50, 30, 10, 10}, 100);
    orch_.AddContact(player_, brute);
    frame();
    ASSERT_TRUE(orch_.IsEncounterOver());
    const auto textCount = texts_.size();

    Entity shard = world_.SpawnCollectible(CollectibleKind::DataShard, 25);
    orch_.AddContact(player_, shard);
    frame();

    EXPECT_EQ(texts_.size(), textCount);
    EXPECT_TRUE(world_.IsAlive(shard));
    EXPECT_EQ(gameOvers_, 1);
}

TEST_F(CombatOrchestratorTest, ResetEncounterReopensFrames) {
    Entity brute = world_.SpawnEnemy({50, 30, 10, 10}, 100);
    orch_.AddContact(player_, brute);
    frame();
    ASSERT_TRUE(orch_.IsEncounterOver());

    world_.health.Get(player_).value = 60;
    orch_.ResetEncounter();
    EXPECT_FALSE(orch_.IsEncounterOver());

    Entity shard = world_.SpawnCollectible(CollectibleKind::DataShard, 25);
    orch_.AddContact(player_, shard);
    frame();
    EXPECT_EQ(orch_.Score(), 25);
}

TEST_F(CombatOrchestratorTest, ResetEncounterDropsPendingContacts) {
    Entity obstacle = world_.SpawnObstacle();
    orch_.AddContact(player_, obstacle);
    orch_.ResetEncounter();
    frame();

    EXPECT_EQ(world_.health.Get(player_).value, 60);
    EXPECT_TRUE(world_.IsAlive(obstacle));
}

// ═══════════════════════════════════════════════════════════════════════════
// Obstacles
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatOrchestratorTest, ObstacleHitsPlayerAndIsRemoved) {
    Entity obstacle = world_.SpawnObstacle();

    orch_.AddContact(player_, obstacle);
    frame();

    EXPECT_EQ(world_.health.Get(player_).value, 50);
    EXPECT_FALSE(world_.IsAlive(obstacle));
    ASSERT_EQ(texts_.size(), 1u);
    EXPECT_EQ(texts_[0], (TextEvent{"HIT -10", ColorTag::Orange}));
    EXPECT_EQ(shakes_, 1);
}

TEST_F(CombatOrchestratorTest, BlockedObstacleIsStillRemoved) {
    Entity first = world_.SpawnObstacle();
    Entity second = world_.SpawnObstacle();

    orch_.AddContact(player_, first);
    orch_.AddContact(player_, second);
    frame();

    EXPECT_EQ(world_.health.Get(player_).value, 50);
    EXPECT_FALSE(world_.IsAlive(first));
    EXPECT_FALSE(world_.IsAlive(second));
    ASSERT_EQ(texts_.size(), 1u);

    clock_.Advance(Milliseconds(500));
    orch_.AddContact(player_, second);
    frame();
    EXPECT_EQ(world_.health.Get(player_).value, 50);
}

TEST_F(CombatOrchestratorTest, LethalObstacleEndsEncounter) {
    world_.health.Get(player_).value = 5;
    Entity obstacle = world_.SpawnObstacle();

    orch_.AddContact(player_, obstacle);
    frame();

    EXPECT_TRUE(orch_.IsEncounterOver());
    EXPECT_EQ(gameOvers_, 1);
    EXPECT_EQ(world_.health.Get(player_).value, 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Collectibles and level-ups
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatOrchestratorTest, DataShardRaisesScore) {
    Entity shard = world_.SpawnCollectible(CollectibleKind::DataShard, 25);

    orch_.AddContact(player_, shard);
    frame();

    EXPECT_EQ(orch_.Score(), 25);
    EXPECT_EQ(scores_, std::vector<int32_t>{25});
    EXPECT_FALSE(world_.IsAlive(shard));
    ASSERT_EQ(texts_.size(), 1u);
    EXPECT_EQ(texts_[0], (TextEvent{"DATA ACQUIRED", ColorTag::Green}));
}

TEST_F(CombatOrchestratorTest, RepairKitHealsUpToStructure) {
    world_.health.Get(player_).value = 30;
    Entity kit = world_.SpawnCollectible(CollectibleKind::RepairKit, 40);

    orch_.AddContact(player_, kit);
    frame();

    EXPECT_EQ(world_.health.Get(player_).value, 60);
    EXPECT_FALSE(world_.IsAlive(kit));
    ASSERT_EQ(texts_.size(), 1u);
    EXPECT_EQ(texts_[0], (TextEvent{"+30 HP", ColorTag::Green}));
}

TEST_F(CombatOrchestratorTest, XpCacheLevelsUpSameFrame) {
    world_.health.Get(player_).value = 12;
    Entity cache = world_.SpawnCollectible(CollectibleKind::XpCache, 150);

    orch_.AddContact(player_, cache);
    frame();

    const auto& level = world_.levels.Get(player_);
    EXPECT_EQ(level.current, 2);
    EXPECT_EQ(level.xp, 50);
    EXPECT_EQ(level.nextLevelXp, 282);
    EXPECT_EQ(level.statPoints, 3);
    EXPECT_EQ(world_.health.Get(player_).value, 60);

    ASSERT_EQ(texts_.size(), 2u);
    EXPECT_EQ(texts_[0], (TextEvent{"+150 XP", ColorTag::Green}));
    EXPECT_EQ(texts_[1], (TextEvent{"LEVEL UP 2", ColorTag::Yellow}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Allies
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatOrchestratorTest, AllyKillGrantsNoScore) {
    Entity ally = world_.SpawnAlly({10, 20, 10, 10}, 50);
    Entity enemy = world_.SpawnEnemy(kGruntStats, 20);

    orch_.AddContact(enemy, ally);
    frame();

    EXPECT_FALSE(world_.IsAlive(enemy));
    EXPECT_EQ(orch_.Score(), 0);
    EXPECT_TRUE(scores_.empty());
    ASSERT_EQ(texts_.size(), 1u);
    EXPECT_EQ(texts_[0], (TextEvent{"27", ColorTag::Cyan}));
}

TEST_F(CombatOrchestratorTest, EnemyKilledByAllyIsNotStruckAgain) {
    Entity ally = world_.SpawnAlly({10, 20, 10, 10}, 50);
    Entity enemy = world_.SpawnEnemy(kGruntStats, 20);
    setAttacking(true);

    orch_.AddContact(player_, enemy);
    orch_.AddContact(ally, enemy);
    frame();

    EXPECT_FALSE(world_.IsAlive(enemy));
    EXPECT_EQ(orch_.Score(), 0);
    EXPECT_EQ(world_.levels.Get(player_).xp, 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Frame timing
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatOrchestratorTest, StalledFrameIsClampedForRegeneration) {
    Entity enemy = world_.SpawnEnemy(kGruntStats, 100);
    world_.stability.Get(enemy).current = 50.0f;

    orch_.Execute(5.0f);

    EXPECT_NEAR(world_.stability.Get(enemy).current, 51.0f, 1e-4f);
}

TEST_F(CombatOrchestratorTest, SeededRandomSourceIsReproducible) {
    auto a = CombatOrchestrator::MakeRandomSource(1337);
    auto b = CombatOrchestrator::MakeRandomSource(1337);
    for (int i = 0; i < 16; ++i) {
        const float value = a();
        EXPECT_FLOAT_EQ(value, b());
        EXPECT_GE(value, 0.0f);
        EXPECT_LE(value, 1.0f);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Dialogue and stage state
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatOrchestratorTest, UngatedDialogueIsShown) {
    orch_.RegisterDialogue("intro", DialogueEntry{"Kai", "Stay sharp.", std::nullopt, 0});

    ASSERT_TRUE(orch_.ShowDialogue("intro").hasValue());
    ASSERT_EQ(dialogue_.size(), 1u);
    EXPECT_EQ(dialogue_[0].first, "Kai");
    EXPECT_EQ(dialogue_[0].second, "Stay sharp.");
}

TEST_F(CombatOrchestratorTest, UnknownDialogueIsRejected) {
    auto result = orch_.ShowDialogue("missing");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownDialogue);
    EXPECT_TRUE(log_->contains("unknown dialogue: missing"));
    EXPECT_TRUE(dialogue_.empty());
}

TEST_F(CombatOrchestratorTest, DialogueGatedOnStanding) {
    orch_.RegisterDialogue("azure_truce",
                           DialogueEntry{"Vera", "Truce, for now.", Faction::Azure, 40});

    EXPECT_TRUE(orch_.ShowDialogue("azure_truce").hasValue());

    world_.reputation.Get(player_).standings[Faction::Azure] = 30;
    auto locked = orch_.ShowDialogue("azure_truce");
    ASSERT_TRUE(locked.hasError());
    EXPECT_EQ(locked.error().code(), ErrorCode::DialogueLocked);
    EXPECT_EQ(dialogue_.size(), 1u);
}

TEST_F(CombatOrchestratorTest, ResumeStageRecordsIdAndReopens) {
    Entity brute = world_.SpawnEnemy({50, 30, 10, 10}, 100);
    orch_.AddContact(player_, brute);
    frame();
    ASSERT_TRUE(orch_.IsEncounterOver());

    orch_.ResumeStage("stage_02_data_spire");

    EXPECT_EQ(orch_.CurrentStage(), "stage_02_data_spire");
    EXPECT_FALSE(orch_.IsEncounterOver());
    EXPECT_TRUE(log_->contains("resuming stage"));
    EXPECT_TRUE(log_->contains("stage=stage_02_data_spire"));
}
