/// @file reputation_tracker.cpp
/// @brief ReputationTracker implementation.

#include "arc/game/reputation_tracker.hpp"

#include <algorithm>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::LogCategory;

void ReputationTracker::ApplyChange(Reputation& rep, const ReputationChange& change) {
    const int64_t raised = static_cast<int64_t>(rep.ValueOf(change.faction)) + change.amount;
    rep.standings[change.faction] = static_cast<int32_t>(
        std::clamp<int64_t>(raised, Reputation::kMin, Reputation::kMax));

    if (!change.reason.empty()) {
        ARC_LOG_DEBUG(LogCategory::Reputation,
                      std::string(factionName(change.faction)) + " " +
                      std::to_string(change.amount) + ": " + change.reason);
    }
}

void ReputationTracker::ApplyToEntity(ecs::ComponentStorage<Reputation>& storage,
                                      ecs::Entity entity, const ReputationChange& change) {
    auto* rep = storage.TryGet(entity);
    if (rep == nullptr) {
        rep = &storage.Add(entity, Reputation::Neutral());
    }
    ApplyChange(*rep, change);
}

ReputationLevel ReputationTracker::LevelOf(int32_t value) noexcept {
    if (value <= 10) {
        return ReputationLevel::Hated;
    }
    if (value <= 25) {
        return ReputationLevel::Hostile;
    }
    if (value <= 40) {
        return ReputationLevel::Unfriendly;
    }
    if (value <= 60) {
        return ReputationLevel::Neutral;
    }
    if (value <= 75) {
        return ReputationLevel::Friendly;
    }
    if (value <= 90) {
        return ReputationLevel::Honored;
    }
    return ReputationLevel::Revered;
}

float ReputationTracker::AggressionMultiplier(const Reputation& rep, Faction faction) {
    switch (LevelOf(rep.ValueOf(faction))) {
        case ReputationLevel::Hated:
        case ReputationLevel::Hostile:
            return 2.0f;
        case ReputationLevel::Unfriendly:
            return 1.5f;
        case ReputationLevel::Neutral:
            return 1.0f;
        case ReputationLevel::Friendly:
            return 0.75f;
        case ReputationLevel::Honored:
        case ReputationLevel::Revered:
            return 0.5f;
    }
    return 1.0f;
}

std::vector<std::string> ReputationTracker::DialogueOptions(const Reputation& rep,
                                                            Faction faction) {
    std::vector<std::string> options{"Talk", "Leave"};

    const auto level = LevelOf(rep.ValueOf(faction));
    if (level <= ReputationLevel::Hostile) {
        options.emplace_back("Threaten");
    } else if (level >= ReputationLevel::Friendly) {
        options.emplace_back("Ask for Help");
        options.emplace_back("Trade");
    }
    return options;
}

bool ReputationTracker::IsQuestUnlocked(const Reputation& rep,
                                        const ReputationRequirements& requirements) {
    return std::all_of(requirements.begin(), requirements.end(), [&](const auto& req) {
        return rep.ValueOf(req.first) >= req.second;
    });
}

std::vector<Faction> ReputationTracker::FactionsAtOrAbove(const Reputation& rep,
                                                          int32_t threshold) {
    std::vector<Faction> out;
    for (auto faction : kAllFactions) {
        if (rep.ValueOf(faction) >= threshold) {
            out.push_back(faction);
        }
    }
    return out;
}

std::map<Faction, std::string> ReputationTracker::Summary(const Reputation& rep) {
    std::map<Faction, std::string> out;
    for (auto faction : kAllFactions) {
        const auto value = rep.ValueOf(faction);
        out[faction] = std::string(reputationLevelName(LevelOf(value))) + " (" +
                       std::to_string(value) + ")";
    }
    return out;
}

std::optional<Faction> ReputationTracker::ParseFaction(std::string_view name) {
    for (auto faction : kAllFactions) {
        if (factionName(faction) == name) {
            return faction;
        }
    }
    ARC_LOG_WARN(LogCategory::Reputation, "unknown faction: " + std::string(name));
    return std::nullopt;
}

}  // namespace arc::game
