/// @file stationary.cpp

#include <evochess/stationary.hpp>

#include <initializer_list>

namespace evochess {

void StationaryTracker::record_move(const Board& after, Color mover, Square from,
                                    Square to) noexcept {
    if (from >= kNoSquare || to >= kNoSquare) return;
    counters_[to] = 0;
    counters_[from] = 0;
    advance(after, mover, square_bb(to));
}

void StationaryTracker::record_castle(const Board& after, Color mover, Square king_from,
                                      Square king_to, Square rook_from, Square rook_to) noexcept {
    for (Square sq : {king_from, king_to, rook_from, rook_to}) {
        if (sq < kNoSquare) counters_[sq] = 0;
    }
    advance(after, mover, square_bb(king_to) | square_bb(rook_to));
}

void StationaryTracker::advance(const Board& after, Color mover, Bitboard moved) noexcept {
    for (int s = 0; s < 64; ++s) {
        auto sq = static_cast<Square>(s);
        if (after.is_empty(sq)) {
            counters_[sq] = 0;
        } else if (after.piece_at(sq).color == mover && !test_bit(moved, sq)) {
            ++counters_[sq];
        }
    }
}

}  // namespace evochess
