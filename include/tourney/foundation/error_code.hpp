#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the tournament engine.

#include <cstdint>
#include <string_view>

namespace tourney::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100). Callers rely on the
/// range to pick a remediation: Validation errors go back to whoever
/// submitted the team list, Bracket errors mean the persisted match state
/// needs to be reconciled.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Validation (0x0100 - 0x01FF)
    ValidationFailed = 0x0100,
    UnsupportedFormat = 0x0101,

    // Bracket integrity (0x0200 - 0x02FF)
    BracketError = 0x0200,
    MatchNotFound = 0x0201,
    MatchNotCompleted = 0x0202,
    MissingBracketReference = 0x0203,
    ReferenceAlreadyResolved = 0x0204,
    InvalidMatchResult = 0x0205,

    // Seeding (0x0300 - 0x03FF)
    SeedingFailed = 0x0300,
    EmptyTeamList = 0x0301,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Validation";
        case 0x0200: return "Bracket";
        case 0x0300: return "Seeding";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// True for codes that signal corrupted bracket state rather than bad input.
constexpr bool isIntegrityError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0200;
}

} // namespace tourney::foundation
