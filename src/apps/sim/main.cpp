/// @file main.cpp
/// @brief Headless encounter driver.
///
/// Loads balance constants and ability kits, then plays a scripted
/// encounter through the combat core on a manual clock and prints the
/// outcome. Useful for eyeballing balance changes without a renderer.

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include "arc/foundation/clock.hpp"
#include "arc/foundation/config_manager.hpp"
#include "arc/foundation/game_logger.hpp"
#include "arc/game/ability_cooldown_manager.hpp"
#include "arc/game/ability_database.hpp"
#include "arc/game/combat_config.hpp"
#include "arc/game/combat_orchestrator.hpp"
#include "arc/game/combat_world.hpp"
#include "arc/game/reputation_tracker.hpp"
#include "arc/game/stat_allocation_validator.hpp"

namespace {

using arc::foundation::LogCategory;

struct SimArgs {
    std::string configPath = "config/arc_sim.yaml";
    std::string abilitiesPath = "config/abilities.yaml";
    std::string role = "melee_dps";
};

SimArgs parseArgs(int argc, char* argv[]) {
    SimArgs args;
    for (int i = 1; i + 1 < argc; i += 2) {
        const std::string_view flag(argv[i]);
        if (flag == "--config") {
            args.configPath = argv[i + 1];
        } else if (flag == "--abilities") {
            args.abilitiesPath = argv[i + 1];
        } else if (flag == "--role") {
            args.role = argv[i + 1];
        } else {
            std::cerr << "Ignoring unknown flag " << flag << "\n";
        }
    }
    return args;
}

/// Spawned cast of the scripted encounter.
struct Encounter {
    arc::ecs::Entity player;
    arc::ecs::Entity ally;
    arc::ecs::Entity grunt;
    arc::ecs::Entity boss;
    arc::ecs::Entity barrier;
    arc::ecs::Entity shard;
    arc::ecs::Entity repairKit;
};

Encounter spawnEncounter(arc::game::CombatWorld& world) {
    using namespace arc::game;

    Encounter enc;
    enc.player = world.SpawnPlayer(CharacterStats{120, 20, 12, 10});

    enc.ally = world.SpawnAlly(CharacterStats{80, 14, 10, 10}, 80);

    enc.grunt = world.SpawnEnemy(CharacterStats{30, 10, 10, 10}, 40);
    world.rewards.Add(enc.grunt, 50, 20,
                      ReputationChange{Faction::Azure, reputation_delta::kDefeatEnemy,
                                       "defeated azure patrol"});

    enc.boss = world.SpawnEnemy(CharacterStats{60, 18, 10, 10}, 400, StabilityKind::Boss);
    world.rewards.Add(enc.boss, 500, 250,
                      ReputationChange{Faction::Azure, reputation_delta::kDefeatBoss,
                                       "defeated azure captain"});

    enc.barrier = world.SpawnObstacle();
    enc.shard = world.SpawnCollectible(CollectibleKind::DataShard, 25);
    enc.repairKit = world.SpawnCollectible(CollectibleKind::RepairKit, 40);
    return enc;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace arc::game;

    const auto args = parseArgs(argc, argv);

    arc::foundation::ConfigManager config;
    auto loadResult = config.load(args.configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    arc::foundation::ConfigManager abilityConfig;
    auto abilityLoad = abilityConfig.load(args.abilitiesPath);
    if (!abilityLoad) {
        std::cerr << "Failed to load abilities: " << abilityLoad.error().message() << "\n";
        return EXIT_FAILURE;
    }

    AbilityDatabase abilities;
    auto loaded = abilities.Load(abilityConfig);
    if (!loaded) {
        std::cerr << "Failed to read abilities: " << loaded.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const auto role = StatAllocationValidator::ParseRole(args.role);
    if (!role) {
        std::cerr << "Unknown role " << args.role << "\n";
        return EXIT_FAILURE;
    }

    const auto combatConfig = CombatConfig::FromConfig(config);
    const auto seed = config.getOr<uint32_t>("sim.seed", 1337);
    const auto frames = config.getOr<int32_t>("sim.frames", 120);
    const auto frameSeconds = config.getOr<float>("sim.frame_seconds", 0.016f);

    arc::foundation::ManualClock clock;
    CombatWorld world;
    CombatOrchestrator orchestrator(world, clock, combatConfig,
                                    CombatOrchestrator::MakeRandomSource(seed));
    AbilityCooldownManager abilityRunner(world.health, world.stats, world.cooldowns, clock);
    StatAllocationValidator allocator(world.stats, world.levels);

    orchestrator.ResumeStage(config.getOr<std::string>("sim.stage", "stage_01"));
    orchestrator.RegisterDialogue(
        "azure_truce", DialogueEntry{"Captain Sora", "Lower your blade. We can talk.",
                                     Faction::Azure, 40});

    orchestrator.Events().combatText.connect([](const std::string& text, ColorTag color) {
        std::cout << "  [" << colorHex(color) << "] " << text << "\n";
    });
    orchestrator.Events().gameOver.connect([] { std::cout << "  GAME OVER\n"; });
    orchestrator.Events().dialogueShown.connect(
        [](const std::string& speaker, const std::string& text) {
            std::cout << "  " << speaker << ": " << text << "\n";
        });

    const auto enc = spawnEncounter(world);
    const auto frameStep = arc::foundation::Milliseconds(
        static_cast<int64_t>(frameSeconds * 1000.0f));

    for (int32_t frame = 0; frame < frames && !orchestrator.IsEncounterOver(); ++frame) {
        clock.Advance(frameStep);

        auto& stance = world.stances.Get(enc.player);
        stance.attacking = (frame % 40) < 20;

        orchestrator.AddContact(enc.ally, enc.grunt);
        orchestrator.AddContact(enc.player, enc.grunt);
        orchestrator.AddContact(enc.boss, enc.player);
        if (frame == 30) {
            orchestrator.AddContact(enc.player, enc.barrier);
        }
        if (frame == 45) {
            orchestrator.AddContact(enc.shard, enc.player);
            orchestrator.AddContact(enc.player, enc.repairKit);
        }

        if (frame % 25 == 0 && world.IsAlive(enc.boss)) {
            auto strike = abilities.Find("kai", "flame_strike");
            if (strike) {
                auto used = abilityRunner.Use(enc.player, enc.boss, strike.value());
                if (used) {
                    std::cout << "  kai uses " << strike.value().name << "\n";
                }
            }
        }

        orchestrator.Execute(frameSeconds);
    }

    if (auto player = world.Player()) {
        const auto& level = world.levels.Get(*player);
        const auto plan = StatAllocationValidator::Recommend(*role, level.statPoints);
        auto spent = allocator.Apply(*player, plan);
        if (!spent) {
            ARC_LOG_WARN(LogCategory::Progression, std::string(spent.error().message()));
        }

        const auto& stats = world.stats.Get(*player);
        std::cout << "Level " << level.current << " (" << level.xp << "/" << level.nextLevelXp
                  << " xp), stats " << stats.structure << "/" << stats.ignition << "/"
                  << stats.logic << "/" << stats.flow << "\n";

        for (const auto& [faction, summary] :
             ReputationTracker::Summary(world.reputation.Get(*player))) {
            std::cout << "  " << factionName(faction) << ": " << summary << "\n";
        }

        auto dialogue = orchestrator.ShowDialogue("azure_truce");
        if (!dialogue) {
            std::cout << "  (" << dialogue.error().message() << ")\n";
        }
    }

    std::cout << "Final score " << orchestrator.Score()
              << (orchestrator.IsEncounterOver() ? " (defeated)" : "") << "\n";

    auto flushed = arc::foundation::GameLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
