#pragma once

/// @file entity.hpp
/// @brief Stable arena handle for combat participants.
///
/// A handle packs a 24-bit slot index with an 8-bit generation. When a
/// slot is recycled its generation advances, so a handle kept across a
/// removal (a queued contact, a dialogue speaker) no longer resolves.

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>

namespace arc::ecs {

struct Entity {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kIdBits = 24;
    static constexpr uint32_t kIdMask = (1u << kIdBits) - 1;
    static constexpr uint32_t kVersionShift = kIdBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    /// Highest usable slot; kIdMask itself belongs to the invalid sentinel.
    static constexpr uint32_t kMaxId = kIdMask - 1;

    constexpr Entity() = default;

    constexpr Entity(uint32_t id, uint8_t version)
        : raw((static_cast<uint32_t>(version) << kVersionShift) | (id & kIdMask)) {}

    /// Slot index.
    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw & kIdMask; }

    /// Slot generation.
    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(raw >> kVersionShift);
    }

    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity handle must stay register sized");

} // namespace arc::ecs

template <>
struct std::hash<arc::ecs::Entity> {
    std::size_t operator()(const arc::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
