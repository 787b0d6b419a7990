#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system logging for the rules core.
///
/// Category-based filtering, structured context, and per-category runtime
/// level control. Self-correcting rules (corrupt progression, loop guards,
/// unknown content ids) report through this logger instead of failing.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "arc/foundation/game_result.hpp"

namespace arc::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per rules subsystem.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Frame driver, orchestration
    ECS         = 1, ///< Entity store
    Combat      = 2, ///< Damage, stability, hit registration
    Progression = 3, ///< XP, levels, stat points
    Reputation  = 4, ///< Faction standing, dialogue gating
    Ability     = 5, ///< Ability database and cooldowns
    Config      = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "Combat", "Progression", "Reputation", "Ability", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = player.id();
///   ctx.extra["next_level_xp"] = "0";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Progression,
///                         "corrupt level state reset", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entityId;
    std::optional<std::string> stageId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger facade over kcenon's GlobalLoggerRegistry.
///
/// Each category resolves to a named logger ("arc.<Category>") and falls
/// back to the registry's default logger. PIMPL keeps kcenon headers out
/// of the public API.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | ECS         | Info          |
/// | Combat      | Debug         |
/// | Progression | Info          |
/// | Reputation  | Info          |
/// | Ability     | Info          |
/// | Config      | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message; no-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with key=value context appended.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GameResult<void> flush();

    /// Process-wide instance used by the ARC_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace arc::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// ARC_MIN_LOG_LEVEL may be defined before including this header to strip
/// calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef ARC_MIN_LOG_LEVEL
    #define ARC_MIN_LOG_LEVEL 0
#endif

#define ARC_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= ARC_MIN_LOG_LEVEL &&                      \
            ::arc::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::arc::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define ARC_LOG_DEBUG(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Debug, (cat), (msg))

#define ARC_LOG_INFO(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Info, (cat), (msg))

#define ARC_LOG_WARN(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Warning, (cat), (msg))

#define ARC_LOG_ERROR(cat, msg) \
    ARC_LOG(::arc::foundation::LogLevel::Error, (cat), (msg))
