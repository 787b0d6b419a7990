/// @file ability_database.cpp
/// @brief AbilityDatabase YAML loading and lookup.

#include "arc/game/ability_database.hpp"

#include <algorithm>
#include <optional>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

std::optional<Ability> parseAbility(const YAML::Node& node, const std::string& characterId) {
    try {
        if (!node.IsMap() || !node["id"]) {
            ARC_LOG_WARN(LogCategory::Ability, "ability without id under " + characterId);
            return std::nullopt;
        }

        Ability ability;
        ability.id = node["id"].as<std::string>();
        ability.name = node["name"] ? node["name"].as<std::string>() : ability.id;
        ability.description = node["description"] ? node["description"].as<std::string>() : "";
        ability.cost = node["cost"] ? node["cost"].as<int32_t>() : 0;
        ability.cooldown = foundation::Milliseconds(
            node["cooldown"] ? std::max<int64_t>(0, node["cooldown"].as<int64_t>()) : 0);
        ability.effectValue = node["effect_value"] ? node["effect_value"].as<int32_t>() : 0;

        const auto typeName =
            node["effect_type"] ? node["effect_type"].as<std::string>() : std::string("utility");
        auto type = parseEffectType(typeName);
        if (!type) {
            ARC_LOG_WARN(LogCategory::Ability,
                         "ability " + ability.id + " has unknown effect type " + typeName);
            return std::nullopt;
        }
        ability.effectType = *type;
        return ability;
    } catch (const YAML::Exception& e) {
        ARC_LOG_WARN(LogCategory::Ability,
                     "malformed ability under " + characterId + ": " + e.what());
        return std::nullopt;
    }
}

} // namespace

GameResult<std::size_t> AbilityDatabase::Load(const foundation::ConfigManager& config) {
    static constexpr std::string_view kPrefix = "abilities.";

    const auto keys = config.keysWithPrefix(kPrefix);
    if (keys.empty()) {
        return GameResult<std::size_t>::err(
            GameError(ErrorCode::ConfigKeyNotFound, "config has no abilities section"));
    }

    std::size_t loaded = 0;
    for (const auto& key : keys) {
        auto list = config.getNode(key);
        if (list) {
            loaded += loadCharacter(key.substr(kPrefix.size()), list.value());
        }
    }

    ARC_LOG_INFO(LogCategory::Ability, "loaded " + std::to_string(loaded) + " abilities");
    return GameResult<std::size_t>::ok(loaded);
}

std::size_t AbilityDatabase::LoadNode(const YAML::Node& abilities) {
    if (!abilities.IsMap()) {
        ARC_LOG_WARN(LogCategory::Ability, "abilities section is not a map");
        return 0;
    }

    std::size_t loaded = 0;
    for (auto it = abilities.begin(); it != abilities.end(); ++it) {
        loaded += loadCharacter(it->first.as<std::string>(), it->second);
    }
    return loaded;
}

std::size_t AbilityDatabase::loadCharacter(const std::string& characterId,
                                           const YAML::Node& list) {
    if (!list.IsSequence()) {
        ARC_LOG_WARN(LogCategory::Ability, "ability list for " + characterId + " is not a list");
        return 0;
    }

    std::size_t loaded = 0;
    for (const auto& entry : list) {
        if (auto ability = parseAbility(entry, characterId)) {
            Add(characterId, std::move(*ability));
            ++loaded;
        }
    }
    return loaded;
}

void AbilityDatabase::Add(std::string_view characterId, Ability ability) {
    auto& kit = table_[std::string(characterId)];
    auto it = std::find_if(kit.begin(), kit.end(),
                           [&](const Ability& a) { return a.id == ability.id; });
    if (it != kit.end()) {
        *it = std::move(ability);
    } else {
        kit.push_back(std::move(ability));
    }
}

const std::vector<Ability>& AbilityDatabase::AbilitiesFor(std::string_view characterId) const {
    static const std::vector<Ability> kEmpty;

    auto it = table_.find(std::string(characterId));
    if (it == table_.end()) {
        ARC_LOG_WARN(LogCategory::Ability, "unknown character: " + std::string(characterId));
        return kEmpty;
    }
    return it->second;
}

GameResult<Ability> AbilityDatabase::Find(std::string_view characterId,
                                          std::string_view abilityId) const {
    const auto& kit = AbilitiesFor(characterId);
    auto it = std::find_if(kit.begin(), kit.end(),
                           [&](const Ability& a) { return a.id == abilityId; });
    if (it == kit.end()) {
        ARC_LOG_WARN(LogCategory::Ability, "unknown ability: " + std::string(abilityId));
        return GameResult<Ability>::err(
            GameError(ErrorCode::UnknownAbility,
                      "unknown ability " + std::string(abilityId) + " for " +
                          std::string(characterId)));
    }
    return GameResult<Ability>::ok(*it);
}

}  // namespace arc::game
