#pragma once

/// @file stationary.hpp
/// Per-square "turns stationary" counters for stationary-trigger abilities.

#include <evochess/board.hpp>

#include <array>

namespace evochess {

/// Counts, per occupied square, how many of its own side's turns the piece
/// there has sat through without moving. A piece gains one per full round.
class StationaryTracker {
   public:
    using Counters = std::array<int, 64>;

    StationaryTracker() noexcept { counters_.fill(0); }

    /// Start counting afresh.
    void reset() noexcept { counters_.fill(0); }

    /// Record a move by `mover` from `from` to `to` on the board that results.
    /// The moved piece restarts at 0, other pieces of `mover` gain one, and
    /// counters on empty squares are cleared.
    void record_move(const Board& after, Color mover, Square from, Square to) noexcept;

    /// Record a move whose rook also moved (castling).
    void record_castle(const Board& after, Color mover, Square king_from, Square king_to,
                       Square rook_from, Square rook_to) noexcept;

    [[nodiscard]] int turns(Square sq) const noexcept {
        return sq < kNoSquare ? counters_[sq] : 0;
    }
    void set_turns(Square sq, int turns) noexcept {
        if (sq < kNoSquare) counters_[sq] = turns;
    }
    [[nodiscard]] const Counters& counters() const noexcept { return counters_; }

   private:
    void advance(const Board& after, Color mover, Bitboard moved) noexcept;

    Counters counters_{};
};

}  // namespace evochess
