/// @file elegance.cpp
/// Elegance scoring implementation.

#include <evochess/elegance.hpp>

#include <evochess/rules.hpp>

#include <algorithm>
#include <cmath>
#include <span>

namespace evochess::elegance {

namespace {

std::span<const Offset> slider_dirs(PieceType pt) noexcept {
    switch (pt) {
        case PieceType::Bishop:
            return kBishopDirs;
        case PieceType::Rook:
            return kRookDirs;
        case PieceType::Queen:
            return kQueenDirs;
        default:
            return {};
    }
}

Bitboard attacks_from(const Board& board, Square sq) noexcept {
    const Piece p = board.piece_at(sq);
    const Bitboard occ = board.occupied_all();
    switch (p.type) {
        case PieceType::Pawn:
            return pawn_attacks(p.color, sq);
        case PieceType::Knight:
            return knight_attacks(sq);
        case PieceType::Bishop:
            return bishop_attacks(sq, occ);
        case PieceType::Rook:
            return rook_attacks(sq, occ);
        case PieceType::Queen:
            return queen_attacks(sq, occ);
        case PieceType::King:
            return king_attacks(sq);
        case PieceType::None:
            break;
    }
    return kEmptyBB;
}

Bitboard heavy_pieces(const Board& board, Color c) noexcept {
    return board.pieces(c, PieceType::Queen) | board.pieces(c, PieceType::Rook) |
           board.pieces(c, PieceType::King);
}

/// First occupied square along `dir` from `sq`, or kNoSquare.
Square first_blocker(const Board& board, Square sq, Offset dir) noexcept {
    Bitboard hit = ray(sq, dir, board.occupied_all()) & board.occupied_all();
    return hit ? lsb(hit) : kNoSquare;
}

/// Squares strictly between a slider on `s` and `target`, when they share one of its lines.
Bitboard between(Square s, Square target, std::span<const Offset> dirs) noexcept {
    for (Offset d : dirs) {
        Bitboard r = ray(s, d, square_bb(target));
        if (test_bit(r, target)) return r & ~square_bb(target);
    }
    return kEmptyBB;
}

void detect_line_tactics(const Board& board, Square to, Factors& f) {
    const Piece mover = board.piece_at(to);
    const Color them = opposite(mover.color);
    for (Offset d : slider_dirs(mover.type)) {
        Square first = first_blocker(board, to, d);
        if (first == kNoSquare || board.piece_at(first).color != them) continue;
        Square second = first_blocker(board, first, d);
        if (second == kNoSquare || board.piece_at(second).color != them) continue;

        const PieceType front = board.piece_at(first).type;
        const PieceType back = board.piece_at(second).type;
        if (back == PieceType::King && front != PieceType::King) {
            f.pin = true;
        } else if (piece_value(front) > piece_value(back)) {
            f.skewer = true;
        }
    }
}

bool detect_discovered(const Board& before, const Board& after, Square from, Square to,
                       Color us) {
    const Bitboard targets = heavy_pieces(after, opposite(us));
    Bitboard sliders = after.pieces(us, PieceType::Bishop) | after.pieces(us, PieceType::Rook) |
                       after.pieces(us, PieceType::Queen);
    clear_bit(sliders, to);
    while (sliders) {
        Square s = pop_lsb(sliders);
        Bitboard fresh = attacks_from(after, s) & targets & ~attacks_from(before, s);
        while (fresh) {
            Square t = pop_lsb(fresh);
            if (test_bit(between(s, t, slider_dirs(after.piece_at(s).type)), from)) return true;
        }
    }
    return false;
}

}  // namespace

Factors analyze(const Position& before, const Position& after, Square from, Square to,
                int history_length) {
    Factors f;
    const Board& bb = before.board();
    const Board& ab = after.board();
    const Piece mover = bb.piece_at(from);
    if (mover.empty() || ab.piece_at(to).empty()) return f;

    const Color us = mover.color;
    const Color them = opposite(us);

    Piece captured = bb.piece_at(to);
    if (captured.empty() && mover.type == PieceType::Pawn && to == before.en_passant())
        captured = Piece{them, PieceType::Pawn};

    f.sacrifice = !captured.empty() && piece_value(mover.type) > piece_value(captured.type);
    f.fork = popcount(attacks_from(ab, to) & heavy_pieces(ab, them)) >= 2;
    detect_line_tactics(ab, to, f);
    f.discovered_attack = detect_discovered(bb, ab, from, to, us);

    const Square king = ab.king_square(them);
    if (king != kNoSquare) {
        f.double_check = popcount(after.attackers_of(king, us)) >= 2;

        Position scratch = after;
        f.checkmate = after.side_to_move() == them && rules::is_checkmate(scratch);
        if (f.checkmate) {
            f.smothered_mate = ab.piece_at(to).type == PieceType::Knight &&
                               (king_attacks(king) & ~ab.occupied(them)) == kEmptyBB;
            f.back_rank_mate = rank_of(king) == back_rank(them);
        }
    }

    const double captured_value = captured.empty() ? 0.0 : piece_value(captured.type);
    f.efficiency =
        std::min(1.0, std::max(0.0, 1.0 - history_length / 100.0) + captured_value / 10.0);

    double complexity = 0.0;
    if (f.fork) complexity += 0.3;
    if (f.pin) complexity += 0.2;
    if (f.skewer) complexity += 0.2;
    if (f.discovered_attack) complexity += 0.4;
    if (f.sacrifice) complexity += 0.5;
    f.complexity = std::min(1.0, complexity);
    return f;
}

int score(const Factors& f) noexcept {
    double s = 0.0;
    if (f.checkmate) {
        if (f.back_rank_mate) {
            s += 25.0;
        } else if (f.smothered_mate) {
            s += 50.0 * 2.0;
        } else {
            s += 20.0;
        }
    }
    if (f.sacrifice) s += 15;
    if (f.fork) s += 10;
    if (f.pin) s += 8;
    if (f.skewer) s += 8;
    if (f.discovered_attack) s += 12;
    if (f.double_check) s += 20;
    if (f.smothered_mate) s += 50;
    if (f.back_rank_mate) s += 25;

    s *= 1.0 + f.efficiency;
    s *= 1.0 + f.complexity;
    return static_cast<int>(std::lround(s));
}

int score(const Position& before, const Position& after, Square from, Square to,
          int history_length) {
    return score(analyze(before, after, from, to, history_length));
}

}  // namespace evochess::elegance
