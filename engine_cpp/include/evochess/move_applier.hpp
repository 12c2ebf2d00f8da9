#pragma once

/// @file move_applier.hpp
/// Commit a chosen move to the position and migrate the evolution overlay.
///
/// Oracle-expressible moves go through Position::make_move. Ability moves the
/// oracle cannot express are replayed on a copy of the board and the position
/// is rebuilt from explicit fields, then validated. Either way the work is
/// done on copies and only swapped in when every step succeeded.

#include <evochess/enhanced_movegen.hpp>
#include <evochess/errors.hpp>
#include <evochess/evolution.hpp>
#include <evochess/position.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace evochess {

/// What a committed move did.
struct AppliedMove {
    Move move;
    std::string san;
    std::string ability_id;
    bool synthetic = false;
    Piece mover = kNoPiece;
    Piece captured = kNoPiece;
    Square captured_on = kNoSquare;  ///< differs from move.to_sq for en passant

    [[nodiscard]] bool is_capture() const noexcept { return !captured.empty(); }
};

struct ApplyResult {
    std::optional<AppliedMove> applied;
    MoveFailure failure;

    [[nodiscard]] explicit operator bool() const noexcept { return applied.has_value(); }
};

/// Abilities that only make sense on a pawn and are dropped on promotion.
[[nodiscard]] bool is_pawn_only_ability(std::string_view id) noexcept;

/// Apply `chosen` (an entry from the enhanced generator) to `pos` and `overlay`.
/// On failure neither argument is touched. `promotion` overrides the promotion
/// piece of a pawn landing on the last rank (queen when None).
[[nodiscard]] ApplyResult apply_move(Position& pos, EvolutionMap& overlay,
                                     const EnhancedMove& chosen,
                                     PieceType promotion = PieceType::None);

}  // namespace evochess
