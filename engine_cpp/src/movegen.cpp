/// @file movegen.cpp
/// Move generation implementation using bitboard techniques.

#include <evochess/movegen.hpp>

#include <initializer_list>

namespace evochess::movegen {

namespace {

// ── Helpers ─────────────────────────────────────────────────────────────────

constexpr PieceType kPromotions[] = {PieceType::Queen, PieceType::Rook, PieceType::Bishop,
                                     PieceType::Knight};

/// Push every target in `targets`, reconstructing the origin from a fixed square delta.
void push_pawn_targets(MoveList& ml, Bitboard targets, int delta, Bitboard promo_rank,
                       MoveFlag flag = MoveFlag::Normal) {
    while (targets) {
        Square to = pop_lsb(targets);
        auto from = static_cast<Square>(to - delta);
        if (square_bb(to) & promo_rank) {
            for (PieceType pt : kPromotions) ml.push({from, to, MoveFlag::Promotion, pt});
        } else {
            ml.push({from, to, flag});
        }
    }
}

// ── Pawn move generation ────────────────────────────────────────────────────

void gen_pawn_moves(const Position& pos, Bitboard pawns, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Color them = opposite(us);
    const Board& board = pos.board();
    const Bitboard empty = ~board.occupied_all();
    const Bitboard enemy = board.occupied(them);
    const bool white = us == Color::White;
    const Bitboard promo_rank = white ? kRank8 : kRank1;
    const int up = white ? 8 : -8;

    Bitboard single = (white ? shift_north(pawns) : shift_south(pawns)) & empty;
    push_pawn_targets(ml, single, up, promo_rank);

    // A double push passes through the third rank (sixth for black).
    Bitboard mid_rank = white ? kRank3 : kRank6;
    Bitboard dbl =
        (white ? shift_north(single & mid_rank) : shift_south(single & mid_rank)) & empty;
    push_pawn_targets(ml, dbl, 2 * up, promo_rank, MoveFlag::DoublePawn);

    Bitboard cap_w = (white ? shift_nw(pawns) : shift_sw(pawns)) & enemy;
    push_pawn_targets(ml, cap_w, white ? 7 : -9, promo_rank);

    Bitboard cap_e = (white ? shift_ne(pawns) : shift_se(pawns)) & enemy;
    push_pawn_targets(ml, cap_e, white ? 9 : -7, promo_rank);

    if (pos.en_passant() != kNoSquare) {
        Square ep = pos.en_passant();
        Bitboard ep_attackers = pawn_attacks(them, ep) & pawns;
        while (ep_attackers) {
            ml.push({pop_lsb(ep_attackers), ep, MoveFlag::EnPassant});
        }
    }
}

// ── Piece (non-pawn) move generation ────────────────────────────────────────

Bitboard piece_attacks(PieceType pt, Square from, Bitboard occ) {
    switch (pt) {
        case PieceType::Knight:
            return knight_attacks(from);
        case PieceType::Bishop:
            return bishop_attacks(from, occ);
        case PieceType::Rook:
            return rook_attacks(from, occ);
        case PieceType::Queen:
            return queen_attacks(from, occ);
        case PieceType::King:
            return king_attacks(from);
        default:
            return kEmptyBB;
    }
}

void gen_piece_moves(const Position& pos, Bitboard from_mask, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Board& board = pos.board();
    const Bitboard friendly = board.occupied(us);
    const Bitboard occ = board.occupied_all();

    for (PieceType pt : {PieceType::Knight, PieceType::Bishop, PieceType::Rook,
                         PieceType::Queen, PieceType::King}) {
        Bitboard pieces = board.pieces(us, pt) & from_mask;
        while (pieces) {
            Square from = pop_lsb(pieces);
            Bitboard targets = piece_attacks(pt, from, occ) & ~friendly;
            while (targets) {
                ml.push({from, pop_lsb(targets)});
            }
        }
    }
}

// ── Castling generation ─────────────────────────────────────────────────────

void gen_castling(const Position& pos, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Color them = opposite(us);
    const Board& board = pos.board();
    const Square king_sq = board.king_square(us);
    const int rank = back_rank(us);

    if (king_sq != make_square(4, rank) || pos.is_square_attacked(king_sq, them))
        return;

    auto clear_and_safe = [&](std::initializer_list<int> empty_files,
                              std::initializer_list<int> safe_files) {
        for (int f : empty_files) {
            if (!board.is_empty(make_square(f, rank))) return false;
        }
        for (int f : safe_files) {
            if (pos.is_square_attacked(make_square(f, rank), them)) return false;
        }
        return true;
    };

    CastlingRights ks = (us == Color::White) ? kWhiteKingside : kBlackKingside;
    if ((pos.castling() & ks) && clear_and_safe({5, 6}, {5, 6})) {
        ml.push({king_sq, make_square(6, rank), MoveFlag::CastleKingside});
    }

    CastlingRights qs = (us == Color::White) ? kWhiteQueenside : kBlackQueenside;
    if ((pos.castling() & qs) && clear_and_safe({1, 2, 3}, {2, 3})) {
        ml.push({king_sq, make_square(2, rank), MoveFlag::CastleQueenside});
    }
}

MoveList pseudo_legal_masked(const Position& pos, Bitboard from_mask) {
    MoveList ml;
    const Board& board = pos.board();
    const Color us = pos.side_to_move();
    gen_pawn_moves(pos, board.pieces(us, PieceType::Pawn) & from_mask, ml);
    gen_piece_moves(pos, from_mask, ml);
    if (board.pieces(us, PieceType::King) & from_mask) {
        gen_castling(pos, ml);
    }
    return ml;
}

MoveList filter_legal(Position& pos, const MoveList& pseudo) {
    MoveList result;
    const Color us = pos.side_to_move();
    for (const Move& m : pseudo) {
        pos.make_move(m);
        if (!pos.is_in_check(us)) {
            result.push(m);
        }
        pos.unmake_move(m);
    }
    return result;
}

}  // anonymous namespace

// ── Public API ──────────────────────────────────────────────────────────────

MoveList pseudo_legal(const Position& pos) {
    return pseudo_legal_masked(pos, kFullBB);
}

MoveList legal(Position& pos) {
    return filter_legal(pos, pseudo_legal(pos));
}

MoveList legal_from(Position& pos, Square from) {
    if (from >= kNoSquare) return {};
    Piece p = pos.board().piece_at(from);
    if (p.empty() || p.color != pos.side_to_move()) return {};
    return filter_legal(pos, pseudo_legal_masked(pos, square_bb(from)));
}

bool has_legal_move(Position& pos) {
    return !legal(pos).empty();
}

std::uint64_t perft(Position& pos, int depth) {
    if (depth == 0)
        return 1;

    MoveList moves = legal(pos);
    if (depth == 1)
        return static_cast<std::uint64_t>(moves.size());

    std::uint64_t nodes = 0;
    for (const Move& m : moves) {
        pos.make_move(m);
        nodes += perft(pos, depth - 1);
        pos.unmake_move(m);
    }
    return nodes;
}

}  // namespace evochess::movegen
