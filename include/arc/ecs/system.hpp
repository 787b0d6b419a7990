#pragma once

/// @file system.hpp
/// @brief Per-frame system interface driven by an external frame loop.

#include <cstdint>
#include <string_view>

namespace arc::ecs {

/// Order within a frame. Systems in an earlier stage run first.
enum class SystemStage : uint8_t {
    PreUpdate,
    Update,
    PostUpdate
};

/// A unit of per-frame logic.
///
/// The frame driver calls Execute() once per rendered frame with the
/// elapsed time in seconds. Execute() runs to completion; nothing in a
/// system spans frames except lazily polled timestamps.
class ISystem {
public:
    virtual ~ISystem() = default;

    virtual void Execute(float deltaTime) = 0;

    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

} // namespace arc::ecs
