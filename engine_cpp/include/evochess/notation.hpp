#pragma once

/// @file notation.hpp
/// Standard algebraic notation for oracle moves and ability-derived moves.

#include <evochess/position.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace evochess::notation {

/// SAN for a legal oracle move in `pos` (e.g. "e4", "Nbd7", "exd5", "e8=Q+", "O-O").
/// The check/mate suffix is computed by playing the move and taking it back.
[[nodiscard]] std::string to_san(Position& pos, Move m);

/// SAN for an ability-derived move the oracle cannot express: piece letter,
/// pawn source file on capture, 'x', destination, promotion suffix. No suffix
/// for check; callers append it once the reconstructed position is known.
[[nodiscard]] std::string synthetic_san(const Board& board, Square from, Square to,
                                        PieceType promotion = PieceType::None);

/// "+" or "#" depending on the side to move's situation in `pos`, else "".
[[nodiscard]] std::string check_suffix(Position& pos);

/// Resolve SAN text against the legal moves of `pos`. Annotation characters
/// (+ # ! ?) are ignored. Returns nullopt when nothing or more than one move matches.
[[nodiscard]] std::optional<Move> parse_san(Position& pos, std::string_view text);

}  // namespace evochess::notation
