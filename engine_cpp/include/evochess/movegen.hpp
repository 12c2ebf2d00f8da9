#pragma once

/// @file movegen.hpp
/// Legal and pseudo-legal move generation for the rules oracle, plus perft.

#include <evochess/position.hpp>

#include <cstdint>

namespace evochess::movegen {

/// Generate all pseudo-legal moves for the current side to move.
[[nodiscard]] MoveList pseudo_legal(const Position& pos);

/// Generate all strictly legal moves (uses internal make/unmake).
[[nodiscard]] MoveList legal(Position& pos);

/// Legal moves of the piece on `from` (empty when it is not the side to move's piece).
[[nodiscard]] MoveList legal_from(Position& pos, Square from);

/// Whether the side to move has at least one legal move.
[[nodiscard]] bool has_legal_move(Position& pos);

/// Count leaf nodes at `depth` plies (perft for validation).
[[nodiscard]] std::uint64_t perft(Position& pos, int depth);

}  // namespace evochess::movegen
