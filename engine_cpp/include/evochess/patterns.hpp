#pragma once

/// @file patterns.hpp
/// Per-ability destination geometry for evolved pieces.
///
/// Every function here is a pure function of the board and the acting piece.
/// None of them look at cooldowns, the activity predicate or king safety; the
/// enhanced generator applies those filters to the candidate sets returned here.

#include <evochess/board.hpp>
#include <evochess/evolution.hpp>

#include <string_view>

namespace evochess::patterns {

/// Everything a pattern may read.
struct PatternContext {
    const Board& board;
    Square from;
    Piece piece;
    const PieceEvolutionState* state = nullptr;  ///< null when the piece is not evolved
};

// ── Pawn ────────────────────────────────────────────────────────────────────

/// Two squares forward from any rank with both squares empty.
[[nodiscard]] Bitboard pawn_march(const Board& board, Square from, Color us) noexcept;

/// Forward-diagonal steps onto empty squares plus a forward step onto an enemy piece.
[[nodiscard]] Bitboard pawn_breakthrough(const Board& board, Square from, Color us) noexcept;

/// Forward-diagonal steps onto empty squares, never onto the promotion rank.
[[nodiscard]] Bitboard pawn_diagonal(const Board& board, Square from, Color us) noexcept;

// ── Pieces ──────────────────────────────────────────────────────────────────

/// Ray squares at distance 2..5 ignoring blockers (rook/bishop/queen), doubled
/// L-shapes for knights, nothing for pawns and kings.
[[nodiscard]] Bitboard extended_range(PieceType pt, Square from) noexcept;

/// Base L-shapes plus the longer (3,1) (3,2) (4,1) families.
[[nodiscard]] Bitboard knight_dash(Square from) noexcept;

/// The piece's own ray directions to the board edge, through pieces.
[[nodiscard]] Bitboard lines_through(PieceType pt, Square from) noexcept;

/// Every empty square; a pawn never lands on its own back rank.
[[nodiscard]] Bitboard teleport(const Board& board, Piece piece) noexcept;

/// Pseudo-legal destinations by ordinary piece geometry (no castling, no en
/// passant, no king safety). Own pieces are excluded; enemy pieces are included.
[[nodiscard]] Bitboard base_destinations(const Board& board, Square from) noexcept;

/// Up to `limit` adjacent squares (ascending index) that are empty or hold an
/// enemy piece other than the king.
[[nodiscard]] Bitboard one_step_bonus(const Board& board, Square from, Color us,
                                      int limit = 2) noexcept;

// ── Dispatch ────────────────────────────────────────────────────────────────

/// Whether `ability_id` contributes destinations at all.
[[nodiscard]] bool has_geometry(std::string_view ability_id) noexcept;

/// Candidate destinations the ability grants the piece in `ctx`. State-gated
/// patterns (rook-entrench, bishop-consecrate, phase-through) yield nothing
/// until the state flag is set.
[[nodiscard]] Bitboard destinations(std::string_view ability_id, const PatternContext& ctx) noexcept;

}  // namespace evochess::patterns
