/// @file stat_allocation_validator.cpp
/// @brief StatAllocationValidator implementation.

#include "arc/game/stat_allocation_validator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// structure, ignition, logic, flow
using Weights = std::array<double, 4>;

struct RoleProfile {
    Weights weights;
    int32_t StatAllocation::*primary;
};

RoleProfile profileFor(Role role) {
    switch (role) {
        case Role::Tank:
            return {{0.5, 0.2, 0.1, 0.2}, &StatAllocation::structure};
        case Role::MeleeDps:
            return {{0.2, 0.5, 0.1, 0.2}, &StatAllocation::ignition};
        case Role::RangedDps:
            return {{0.2, 0.1, 0.5, 0.2}, &StatAllocation::logic};
        case Role::Balanced:
            break;
    }
    return {{0.25, 0.25, 0.25, 0.25}, &StatAllocation::structure};
}

GameError missing(ecs::Entity entity, std::string_view what) {
    return GameError(ErrorCode::MissingComponent,
                     "entity " + std::to_string(entity.id()) + " has no " + std::string(what));
}

} // namespace

StatAllocationValidator::StatAllocationValidator(ecs::ComponentStorage<CharacterStats>& stats,
                                                 ecs::ComponentStorage<LevelProgress>& levels)
    : stats_(stats), levels_(levels) {}

GameResult<void> StatAllocationValidator::Validate(const StatAllocation& allocation,
                                                   int32_t availablePoints) {
    if (allocation.structure < 0 || allocation.ignition < 0 || allocation.logic < 0 ||
        allocation.flow < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidAllocation, "cannot allocate negative stat points"));
    }
    if (allocation.Total() > availablePoints) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidAllocation,
            "allocation exceeds available points (" + std::to_string(allocation.Total()) +
                " > " + std::to_string(availablePoints) + ")"));
    }
    return GameResult<void>::ok();
}

GameResult<AllocationOutcome> StatAllocationValidator::Apply(ecs::Entity entity,
                                                             const StatAllocation& allocation) {
    auto* stats = stats_.TryGet(entity);
    if (stats == nullptr) {
        return GameResult<AllocationOutcome>::err(missing(entity, "stats"));
    }
    auto* level = levels_.TryGet(entity);
    if (level == nullptr) {
        return GameResult<AllocationOutcome>::err(missing(entity, "level"));
    }

    auto valid = Validate(allocation, level->statPoints);
    if (!valid) {
        return GameResult<AllocationOutcome>::err(valid.error());
    }

    stats->structure += allocation.structure;
    stats->ignition += allocation.ignition;
    stats->logic += allocation.logic;
    stats->flow += allocation.flow;
    level->statPoints -= static_cast<int32_t>(allocation.Total());

    return GameResult<AllocationOutcome>::ok(AllocationOutcome{*stats, level->statPoints});
}

StatAllocation StatAllocationValidator::Recommend(Role role, int32_t points) {
    StatAllocation out;
    if (points <= 0) {
        return out;
    }

    const auto profile = profileFor(role);
    const double total = points;
    out.structure = static_cast<int32_t>(std::floor(total * profile.weights[0]));
    out.ignition = static_cast<int32_t>(std::floor(total * profile.weights[1]));
    out.logic = static_cast<int32_t>(std::floor(total * profile.weights[2]));
    out.flow = static_cast<int32_t>(std::floor(total * profile.weights[3]));

    out.*profile.primary += points - static_cast<int32_t>(out.Total());
    return out;
}

GameResult<int32_t> StatAllocationValidator::Reset(ecs::Entity entity,
                                                   const CharacterStats& baseStats) {
    auto* stats = stats_.TryGet(entity);
    if (stats == nullptr) {
        return GameResult<int32_t>::err(missing(entity, "stats"));
    }
    auto* level = levels_.TryGet(entity);
    if (level == nullptr) {
        return GameResult<int32_t>::err(missing(entity, "level"));
    }

    const int32_t refund = std::max(0, stats->structure - baseStats.structure) +
                           std::max(0, stats->ignition - baseStats.ignition) +
                           std::max(0, stats->logic - baseStats.logic) +
                           std::max(0, stats->flow - baseStats.flow);

    *stats = baseStats;
    level->statPoints += refund;
    return GameResult<int32_t>::ok(refund);
}

std::optional<Role> StatAllocationValidator::ParseRole(std::string_view name) {
    for (auto role : {Role::Tank, Role::MeleeDps, Role::RangedDps, Role::Balanced}) {
        if (roleName(role) == name) {
            return role;
        }
    }
    ARC_LOG_WARN(LogCategory::Progression, "unknown role: " + std::string(name));
    return std::nullopt;
}

}  // namespace arc::game
