/// @file board.cpp
/// Board implementation: initial position factory and the pure move transform.

#include <evochess/board.hpp>

namespace evochess {

Board Board::initial() noexcept {
    Board b;

    constexpr PieceType kBackRank[] = {
        PieceType::Rook, PieceType::Knight, PieceType::Bishop, PieceType::Queen,
        PieceType::King, PieceType::Bishop, PieceType::Knight, PieceType::Rook,
    };

    for (int f = 0; f < 8; ++f) {
        b.put_piece(make_square(f, 1), {Color::White, PieceType::Pawn});
        b.put_piece(make_square(f, 6), {Color::Black, PieceType::Pawn});
        b.put_piece(make_square(f, 0), {Color::White, kBackRank[f]});
        b.put_piece(make_square(f, 7), {Color::Black, kBackRank[f]});
    }

    return b;
}

Board apply_move_to_board(const Board& board, Square from, Square to,
                          PieceType promotion) noexcept {
    Board out = board;
    Piece mover = out.piece_at(from);
    if (mover.empty() || from == to) return out;

    out.remove_piece(from);
    out.remove_piece(to);
    if (promotion != PieceType::None) mover.type = promotion;
    out.put_piece(to, mover);
    return out;
}

}  // namespace evochess
