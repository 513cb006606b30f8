#pragma once

/// @file engine_logger.hpp
/// @brief EngineLogger over the kcenon common_system logger interfaces for structured engine logging.
///
/// Provides category-based filtering, structured logging with tournament
/// context, and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tourney/foundation/engine_result.hpp"
#include "tourney/foundation/types.hpp"

namespace tourney::foundation {

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

/// Engine log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Facade and dispatch
    Seeding     = 1, ///< Seeder strategies
    Validation  = 2, ///< Constraint validation
    Bracket     = 3, ///< Bracket and pairing generation
    Progression = 4, ///< Result consumption and advancement
    Standings   = 5, ///< Standings and tie-breaks
    Config      = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Seeding", "Validation", "Bracket", "Progression", "Standings", "Config"
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

/// Parse a level name as written in configuration files ("debug", "WARNING").
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a category name ("bracket", "Standings").
std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.tournamentId = TournamentId(7);
///   ctx.matchId = MatchId(12);
///   ctx.extra["round"] = "3";
///   logger.logWithContext(LogLevel::Info, LogCategory::Progression,
///                         "Round generated", ctx);
/// @endcode
struct LogContext {
    std::optional<TournamentId> tournamentId;
    std::optional<MatchId> matchId;
    std::optional<TeamId> teamId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Seeding     | Info          |
/// | Validation  | Info          |
/// | Bracket     | Info          |
/// | Progression | Info          |
/// | Standings   | Warning       |
/// | Config      | Info          |
class EngineLogger {
public:
    EngineLogger();
    ~EngineLogger();

    // Non-copyable, movable.
    EngineLogger(const EngineLogger&) = delete;
    EngineLogger& operator=(const EngineLogger&) = delete;
    EngineLogger(EngineLogger&&) noexcept;
    EngineLogger& operator=(EngineLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    EngineResult<void> flush();

    /// Process-wide logger used by the TOURNEY_LOG macros.
    static EngineLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tourney::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// TOURNEY_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef TOURNEY_MIN_LOG_LEVEL
    #define TOURNEY_MIN_LOG_LEVEL 0
#endif

#define TOURNEY_LOG(level, cat, msg)                                                   \
    do {                                                                               \
        _Pragma("GCC diagnostic push")                                                 \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                            \
        if (static_cast<int>(level) >= TOURNEY_MIN_LOG_LEVEL &&                        \
            ::tourney::foundation::EngineLogger::instance().isEnabled((level), (cat)))  \
        {                                                                              \
            ::tourney::foundation::EngineLogger::instance().log((level), (cat), (msg)); \
        }                                                                              \
        _Pragma("GCC diagnostic pop")                                                  \
    } while (0)

#define TOURNEY_LOG_DEBUG(cat, msg) \
    TOURNEY_LOG(::tourney::foundation::LogLevel::Debug, (cat), (msg))

#define TOURNEY_LOG_INFO(cat, msg) \
    TOURNEY_LOG(::tourney::foundation::LogLevel::Info, (cat), (msg))

#define TOURNEY_LOG_WARN(cat, msg) \
    TOURNEY_LOG(::tourney::foundation::LogLevel::Warning, (cat), (msg))

#define TOURNEY_LOG_ERROR(cat, msg) \
    TOURNEY_LOG(::tourney::foundation::LogLevel::Error, (cat), (msg))
