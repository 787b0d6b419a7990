#pragma once

/// @file ability_database.hpp
/// @brief Ability records and the per-character ability table.

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "arc/foundation/clock.hpp"
#include "arc/foundation/config_manager.hpp"
#include "arc/foundation/game_result.hpp"
#include "arc/game/combat_types.hpp"

namespace arc::game {

struct Ability {
    std::string id;
    std::string name;
    std::string description;
    int32_t cost = 0;
    foundation::Milliseconds cooldown{0};
    EffectType effectType = EffectType::Utility;
    int32_t effectValue = 0;
};

/// Static lookup from character id to its abilities.
///
/// Content is data, not code. Expected YAML shape:
/// @code
///   abilities:
///     kai:
///       - id: flame_strike
///         name: Flame Strike
///         description: A blazing melee combo.
///         cost: 10
///         cooldown: 3000
///         effect_type: damage
///         effect_value: 25
/// @endcode
/// Malformed records are skipped with a warning so one bad entry does
/// not discard a character's whole kit.
class AbilityDatabase {
public:
    AbilityDatabase() = default;

    /// Load every `abilities.<characterId>` list from @p config.
    /// @return Number of abilities loaded, or ConfigKeyNotFound when the
    ///         config has no abilities section.
    foundation::GameResult<std::size_t> Load(const foundation::ConfigManager& config);

    /// Load from an `abilities` map node (character id -> list).
    std::size_t LoadNode(const YAML::Node& abilities);

    /// Register @p ability for @p characterId, replacing an ability with
    /// the same id.
    void Add(std::string_view characterId, Ability ability);

    /// Abilities for @p characterId; unknown characters log a warning and
    /// get an empty list.
    [[nodiscard]] const std::vector<Ability>& AbilitiesFor(std::string_view characterId) const;

    /// @return The ability, or UnknownAbility.
    [[nodiscard]] foundation::GameResult<Ability> Find(std::string_view characterId,
                                                       std::string_view abilityId) const;

    [[nodiscard]] std::size_t CharacterCount() const noexcept { return table_.size(); }

private:
    std::size_t loadCharacter(const std::string& characterId, const YAML::Node& list);

    std::unordered_map<std::string, std::vector<Ability>> table_;
};

}  // namespace arc::game
