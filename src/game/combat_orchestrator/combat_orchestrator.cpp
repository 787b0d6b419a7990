/// @file combat_orchestrator.cpp
/// @brief CombatOrchestrator frame phases.

#include "arc/game/combat_orchestrator.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <utility>

#include "arc/foundation/game_logger.hpp"
#include "arc/game/reputation_tracker.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::FrameDelta;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

ProgressionRules progressionRules(const CombatConfig& config) {
    ProgressionRules rules;
    rules.maxLevel = config.maxLevel;
    rules.statPointsPerLevel = config.statPointsPerLevel;
    rules.levelUpGuard = config.levelUpGuard;
    return rules;
}

std::string damageText(const AttackOutcome& outcome) {
    if (outcome.isCritical) {
        return "CRIT " + std::to_string(outcome.damage) + "!";
    }
    return std::to_string(outcome.damage);
}

} // namespace

CombatOrchestrator::CombatOrchestrator(CombatWorld& world, const foundation::IClock& clock,
                                       CombatConfig config, RandomSource rng)
    : world_(world),
      clock_(clock),
      config_(config),
      rng_(rng ? std::move(rng) : MakeRandomSource(std::random_device{}())),
      stability_(world.stability, world.breaks, clock, config.regenGrace),
      guard_(world.health, world.invincibility, clock),
      progression_(world.levels, world.stats, world.health, progressionRules(config)) {}

RandomSource CombatOrchestrator::MakeRandomSource(uint32_t seed) {
    return [engine = std::mt19937(seed),
            dist = std::uniform_real_distribution<float>(0.0f, 1.0f)]() mutable {
        return dist(engine);
    };
}

// ── Contacts ────────────────────────────────────────────────────────────────

void CombatOrchestrator::AddContact(ecs::Entity first, ecs::Entity second) {
    contacts_.push_back(Contact{first, second});
}

void CombatOrchestrator::SetContacts(std::vector<Contact> contacts) {
    contacts_ = std::move(contacts);
}

CombatOrchestrator::ContactBuckets
CombatOrchestrator::classify(const std::vector<Contact>& contacts) const {
    ContactBuckets buckets;

    for (const auto& contact : contacts) {
        for (const auto& [a, b] : {std::pair{contact.first, contact.second},
                                   std::pair{contact.second, contact.first}}) {
            if (!world_.IsAlive(a) || !world_.IsAlive(b)) {
                break;
            }
            if (world_.allies.Has(a) && world_.enemies.Has(b)) {
                buckets.allyEnemy.push_back(Contact{a, b});
                break;
            }
            if (!world_.players.Has(a)) {
                continue;
            }
            if (world_.enemies.Has(b)) {
                buckets.playerEnemy.push_back(Contact{a, b});
                break;
            }
            if (world_.obstacles.Has(b)) {
                buckets.playerObstacle.push_back(Contact{a, b});
                break;
            }
            if (world_.collectibles.Has(b)) {
                buckets.playerCollectible.push_back(Contact{a, b});
                break;
            }
        }
    }
    return buckets;
}

bool CombatOrchestrator::usable(ecs::Entity entity) const {
    return world_.IsAlive(entity) && !world_.entities.IsPendingDestroy(entity);
}

// ── Frame ───────────────────────────────────────────────────────────────────

void CombatOrchestrator::Execute(float deltaTime) {
    auto contacts = std::exchange(contacts_, {});
    if (encounterOver_) {
        return;
    }

    const FrameDelta dt(deltaTime, config_.maxFrameDelta);
    guard_.ExpireWindows();
    stability_.Tick(dt);

    const auto buckets = classify(contacts);

    resolveAllyContacts(buckets.allyEnemy);

    const bool playerStanding = resolvePlayerEnemyContacts(buckets.playerEnemy) &&
                                resolveObstacleContacts(buckets.playerObstacle);
    if (playerStanding) {
        resolveCollectibleContacts(buckets.playerCollectible);

        for (const auto& event : progression_.ProcessLevelUps()) {
            events_.combatText.emit("LEVEL UP " + std::to_string(event.newLevel),
                                    ColorTag::Yellow);
        }
    }

    const auto removed = world_.Flush();
    if (removed > 0) {
        ARC_LOG_DEBUG(LogCategory::Combat, "removed " + std::to_string(removed) + " entities");
    }
}

bool CombatOrchestrator::strikeEnemy(ecs::Entity attacker, ecs::Entity enemy, AttackType type,
                                     ColorTag hitColor) {
    DamageModifiers mods;
    mods.defenderBroken = stability_.IsBroken(enemy);

    const auto outcome = CombatResolver::Resolve(world_.stats.TryGet(attacker),
                                                 world_.stats.TryGet(enemy), type, rng_, mods);

    if (!guard_.RegisterHit(attacker, enemy, outcome.damage, config_.invincibilityWindow)) {
        return false;
    }

    stability_.ProcessHit(enemy, static_cast<float>(outcome.damage), config_.breakDuration);

    events_.combatText.emit(damageText(outcome),
                            outcome.isCritical ? ColorTag::Yellow : hitColor);
    events_.cameraShake.emit();

    return !CombatResolver::IsAlive(world_.health.TryGet(enemy));
}

void CombatOrchestrator::resolveAllyContacts(const std::vector<Contact>& contacts) {
    for (const auto& [ally, enemy] : contacts) {
        if (!usable(ally) || !usable(enemy)) {
            continue;
        }
        if (!world_.health.Has(enemy)) {
            world_.health.Add(enemy, 1);
        }
        if (strikeEnemy(ally, enemy, AttackType::Melee, ColorTag::Cyan)) {
            world_.Remove(enemy);
        }
    }
}

bool CombatOrchestrator::resolvePlayerEnemyContacts(const std::vector<Contact>& contacts) {
    for (const auto& [player, enemy] : contacts) {
        if (!usable(player) || !usable(enemy)) {
            continue;
        }

        const auto* stance = world_.stances.TryGet(player);
        if (stance != nullptr && stance->attacking) {
            if (!world_.health.Has(enemy)) {
                world_.health.Add(enemy, 1);
            }
            if (strikeEnemy(player, enemy, stance->attackType, ColorTag::Red)) {
                grantKillReward(player, enemy);
                world_.Remove(enemy);
            }
            continue;
        }

        if (!world_.health.Has(player) || !world_.stats.Has(player)) {
            continue;
        }

        DamageModifiers mods;
        mods.defenderBroken = stability_.IsBroken(player);
        const auto outcome = CombatResolver::Resolve(world_.stats.TryGet(enemy),
                                                     world_.stats.TryGet(player),
                                                     AttackType::Melee, rng_, mods);

        if (guard_.RegisterHit(enemy, player, outcome.damage, config_.invincibilityWindow)) {
            stability_.ProcessHit(player, static_cast<float>(outcome.damage),
                                  config_.breakDuration);

            events_.combatText.emit("-" + std::to_string(outcome.damage), ColorTag::Red);
            events_.cameraShake.emit();

            if (!CombatResolver::IsAlive(world_.health.TryGet(player))) {
                endEncounter();
                return false;
            }
        }
        // The enemy breaks on the collision whether or not the player was shielded.
        world_.Remove(enemy);
    }
    return true;
}

bool CombatOrchestrator::resolveObstacleContacts(const std::vector<Contact>& contacts) {
    for (const auto& [player, obstacle] : contacts) {
        if (!usable(player) || !usable(obstacle)) {
            continue;
        }
        if (guard_.RegisterHit(obstacle, player, config_.obstacleDamage,
                               config_.invincibilityWindow)) {
            events_.combatText.emit("HIT -" + std::to_string(config_.obstacleDamage),
                                    ColorTag::Orange);
            events_.cameraShake.emit();

            if (!CombatResolver::IsAlive(world_.health.TryGet(player))) {
                endEncounter();
                return false;
            }
        }
        world_.Remove(obstacle);
    }
    return true;
}

void CombatOrchestrator::resolveCollectibleContacts(const std::vector<Contact>& contacts) {
    for (const auto& [player, item] : contacts) {
        if (!usable(player) || !usable(item)) {
            continue;
        }
        const auto pickup = world_.collectibles.Get(item);

        switch (pickup.kind) {
            case CollectibleKind::DataShard:
                if (pickup.amount > 0) {
                    raiseScore(pickup.amount);
                }
                events_.combatText.emit("DATA ACQUIRED", ColorTag::Green);
                break;
            case CollectibleKind::RepairKit: {
                auto* hp = world_.health.TryGet(player);
                const auto* stats = world_.stats.TryGet(player);
                if (hp != nullptr && stats != nullptr) {
                    const auto before = hp->value;
                    hp->value = CombatResolver::ApplyHealing(hp->value, pickup.amount,
                                                             stats->structure);
                    events_.combatText.emit("+" + std::to_string(hp->value - before) + " HP",
                                            ColorTag::Green);
                }
                break;
            }
            case CollectibleKind::XpCache:
                awardXp(player, pickup.amount);
                break;
        }

        world_.Remove(item);
    }
}

void CombatOrchestrator::grantKillReward(ecs::Entity player, ecs::Entity enemy) {
    const auto* reward = world_.rewards.TryGet(enemy);
    const int32_t score = reward != nullptr ? reward->score : config_.killScore;
    const int32_t xp = reward != nullptr ? reward->xp : config_.killXp;

    if (score != 0) {
        raiseScore(score);
    }
    awardXp(player, xp);

    if (reward != nullptr && reward->reputation) {
        ReputationTracker::ApplyToEntity(world_.reputation, player, *reward->reputation);

        LogContext ctx;
        ctx.entityId = player.id();
        ctx.extra["faction"] = std::string(factionName(reward->reputation->faction));
        ctx.extra["amount"] = std::to_string(reward->reputation->amount);
        if (!reward->reputation->reason.empty()) {
            ctx.extra["reason"] = reward->reputation->reason;
        }
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Reputation, "standing changed", ctx);
    }
}

void CombatOrchestrator::awardXp(ecs::Entity player, int32_t amount) {
    const auto gained = progression_.AwardXp(player, amount);
    if (gained > 0) {
        events_.combatText.emit("+" + std::to_string(gained) + " XP", ColorTag::Green);
    }
}

void CombatOrchestrator::raiseScore(int32_t delta) {
    score_ += delta;
    events_.scoreUpdate.emit(delta);
}

void CombatOrchestrator::endEncounter() {
    encounterOver_ = true;

    LogContext ctx;
    if (!stageId_.empty()) {
        ctx.stageId = stageId_;
    }
    ctx.extra["score"] = std::to_string(score_);
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Combat, "player defeated", ctx);

    events_.gameOver.emit();
}

// ── Dialogue ────────────────────────────────────────────────────────────────

void CombatOrchestrator::RegisterDialogue(std::string id, DialogueEntry entry) {
    dialogue_.insert_or_assign(std::move(id), std::move(entry));
}

GameResult<void> CombatOrchestrator::ShowDialogue(std::string_view id) {
    auto it = dialogue_.find(std::string(id));
    if (it == dialogue_.end()) {
        ARC_LOG_WARN(LogCategory::Reputation, "unknown dialogue: " + std::string(id));
        return GameResult<void>::err(
            GameError(ErrorCode::UnknownDialogue, "unknown dialogue " + std::string(id)));
    }

    const auto& entry = it->second;
    if (entry.faction) {
        const auto player = world_.Player();
        const auto* rep = player ? world_.reputation.TryGet(*player) : nullptr;
        const int32_t standing =
            rep != nullptr ? rep->ValueOf(*entry.faction) : Reputation::kNeutral;
        if (standing < entry.minReputation) {
            return GameResult<void>::err(GameError(
                ErrorCode::DialogueLocked,
                "dialogue " + it->first + " needs " + std::to_string(entry.minReputation) +
                    " with " + std::string(factionName(*entry.faction))));
        }
    }

    events_.dialogueShown.emit(entry.speaker, entry.text);
    return GameResult<void>::ok();
}

// ── Encounter state ─────────────────────────────────────────────────────────

void CombatOrchestrator::ResumeStage(std::string stageId) {
    stageId_ = std::move(stageId);
    ResetEncounter();

    LogContext ctx;
    ctx.stageId = stageId_;
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Core, "resuming stage", ctx);
}

void CombatOrchestrator::ResetEncounter() {
    encounterOver_ = false;
    contacts_.clear();
}

}  // namespace arc::game
