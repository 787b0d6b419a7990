#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat and progression core.

#include <cstdint>
#include <string_view>

namespace arc::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    NotImplemented = 0x0005,

    // ECS (0x0300 - 0x03FF)
    EntityNotFound = 0x0300,
    ComponentNotFound = 0x0301,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0802,

    // Combat (0x0900 - 0x09FF)
    AbilityOnCooldown = 0x0900,
    AbilityInvalidTarget = 0x0901,
    InsufficientResource = 0x0902,

    // Progression (0x0A00 - 0x0AFF)
    InvalidAllocation = 0x0A00,
    MissingComponent = 0x0A01,

    // Content (0x0B00 - 0x0BFF)
    UnknownAbility = 0x0B00,
    UnknownFaction = 0x0B01,
    UnknownDialogue = 0x0B02,
    UnknownRole = 0x0B03,
    DialogueLocked = 0x0B04,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0300: return "ECS";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Combat";
        case 0x0A00: return "Progression";
        case 0x0B00: return "Content";
        default: return "Unknown";
    }
}

} // namespace arc::foundation
