#pragma once

/// @file errors.hpp
/// Move rejection codes reported at the engine boundary.

#include <cstdint>
#include <string>
#include <string_view>

namespace evochess {

enum class MoveError : std::uint8_t {
    None,
    InvalidSquare,
    EmptySource,
    WrongSide,
    TargetsKing,
    FriendlyTarget,
    IllegalMove,
    LeavesKingInCheck,
    CustomRuleViolation,
    GameOver,
    InvalidNotation,
    DashPending,
    InternalDesync,
    InvalidPosition,
};

[[nodiscard]] std::string_view to_string(MoveError e) noexcept;

/// A rejected operation: code plus a human-readable reason.
struct MoveFailure {
    MoveError code = MoveError::None;
    std::string reason;
};

}  // namespace evochess
