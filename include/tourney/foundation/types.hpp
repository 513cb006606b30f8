#pragma once

/// @file types.hpp
/// @brief Strong identifier types shared across the engine.

#include <cstdint>
#include <functional>

namespace tourney::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidentally passing a MatchId where a TeamId is expected
/// while keeping the same underlying representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct TournamentIdTag {};
struct TeamIdTag {};
struct MatchIdTag {};
struct PlayerIdTag {};

using TournamentId = StrongId<TournamentIdTag>;
using TeamId = StrongId<TeamIdTag>;
using MatchId = StrongId<MatchIdTag>;
using PlayerId = StrongId<PlayerIdTag>;

} // namespace tourney::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<tourney::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const tourney::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
