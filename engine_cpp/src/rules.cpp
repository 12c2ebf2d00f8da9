/// @file rules.cpp
/// Game-status queries.

#include <evochess/movegen.hpp>
#include <evochess/rules.hpp>

namespace evochess::rules {

bool is_checkmate(Position& pos) {
    return pos.is_in_check() && !movegen::has_legal_move(pos);
}

bool is_stalemate(Position& pos) {
    return !pos.is_in_check() && !movegen::has_legal_move(pos);
}

bool is_insufficient_material(const Position& pos) noexcept {
    const Board& board = pos.board();
    const int total_pieces = board.count();

    if (total_pieces == 2)
        return true;

    if (total_pieces == 3) {
        for (Color c : {Color::White, Color::Black}) {
            if (board.pieces(c, PieceType::Knight) || board.pieces(c, PieceType::Bishop))
                return true;
        }
        return false;
    }

    if (total_pieces == 4) {
        Bitboard wb = board.pieces(Color::White, PieceType::Bishop);
        Bitboard bb = board.pieces(Color::Black, PieceType::Bishop);
        if (wb && bb) {
            bool w_light = (wb & kLightSquares) != 0;
            bool b_light = (bb & kLightSquares) != 0;
            return w_light == b_light;
        }
    }
    return false;
}

bool is_draw(const Position& pos) {
    if (pos.halfmove_clock() >= 100)
        return true;
    if (pos.repetition_count() >= 3)
        return true;
    return is_insufficient_material(pos);
}

bool is_game_over(Position& pos) {
    return !movegen::has_legal_move(pos) || is_draw(pos);
}

}  // namespace evochess::rules
