#pragma once

/// @file combat_events.hpp
/// @brief Outward notifications raised by the orchestrator.
///
/// Presentation code subscribes to these; the rules never touch UI,
/// camera or audio directly.

#include <cstdint>
#include <string>
#include <string_view>

#include "arc/foundation/signal.hpp"

namespace arc::game {

/// Floating-text colour.
enum class ColorTag : uint8_t {
    Cyan,    ///< Ally hit.
    Yellow,  ///< Critical hit, level up.
    Red,     ///< Player hit, damage to the player.
    Green,   ///< XP and pickups.
    Orange   ///< Obstacle collision.
};

constexpr std::string_view colorHex(ColorTag tag) {
    switch (tag) {
        case ColorTag::Cyan:   return "#0ff";
        case ColorTag::Yellow: return "#ff0";
        case ColorTag::Red:    return "#f00";
        case ColorTag::Green:  return "#0f0";
        case ColorTag::Orange: return "#fa0";
    }
    return "#fff";
}

struct CombatEvents {
    foundation::Signal<const std::string&, ColorTag> combatText;
    foundation::Signal<int32_t> scoreUpdate;  ///< Score delta.
    foundation::Signal<> cameraShake;
    foundation::Signal<> gameOver;
    foundation::Signal<const std::string&, const std::string&> dialogueShown;  ///< Speaker, text.
};

}  // namespace arc::game
