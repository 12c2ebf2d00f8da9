/// @file patterns.cpp
/// Ability geometry implementation.

#include <evochess/patterns.hpp>

#include <cstddef>
#include <initializer_list>

namespace evochess::patterns {

namespace {

constexpr Offset kDashOffsets[] = {
    {1, 2},  {2, 1},  {2, -1},  {1, -2},  {-1, -2}, {-2, -1}, {-2, 1},  {-1, 2},
    {3, 1},  {3, -1}, {-3, 1},  {-3, -1}, {1, 3},   {1, -3},  {-1, 3},  {-1, -3},
    {3, 2},  {3, -2}, {-3, 2},  {-3, -2}, {2, 3},   {2, -3},  {-2, 3},  {-2, -3},
    {4, 1},  {4, -1}, {-4, 1},  {-4, -1}, {1, 4},   {1, -4},  {-1, 4},  {-1, -4},
};

constexpr Offset kDoubledKnightOffsets[] = {{2, 4},  {4, 2},  {4, -2}, {2, -4},
                                            {-2, -4}, {-4, -2}, {-4, 2}, {-2, 4}};

inline constexpr detail::LeaperTable kDashData = detail::compute_leaper(kDashOffsets, 32);
inline constexpr detail::LeaperTable kDoubledKnightData =
    detail::compute_leaper(kDoubledKnightOffsets, 8);

/// Ray squares between `min_steps` and `max_steps` inclusive, ignoring blockers.
template <std::size_t N>
Bitboard ring_rays(Square from, const Offset (&dirs)[N], int min_steps, int max_steps) noexcept {
    Bitboard out = kEmptyBB;
    for (Offset d : dirs) {
        out |= ray(from, d, kEmptyBB, max_steps) & ~ray(from, d, kEmptyBB, min_steps - 1);
    }
    return out;
}

template <std::size_t N>
Bitboard open_rays(Square from, const Offset (&dirs)[N]) noexcept {
    Bitboard out = kEmptyBB;
    for (Offset d : dirs) out |= ray(from, d);
    return out;
}

Square forward(Square from, Color us, int df, int steps = 1) noexcept {
    return offset_square(from, df, forward_step(us) * steps);
}

bool holds_enemy(const Board& board, Square sq, Color us) noexcept {
    Piece p = board.piece_at(sq);
    return !p.empty() && p.color != us;
}

}  // namespace

// ── Pawn ────────────────────────────────────────────────────────────────────

Bitboard pawn_march(const Board& board, Square from, Color us) noexcept {
    Square one = forward(from, us, 0);
    Square two = forward(from, us, 0, 2);
    if (one == kNoSquare || two == kNoSquare) return kEmptyBB;
    if (!board.is_empty(one) || !board.is_empty(two)) return kEmptyBB;
    return square_bb(two);
}

Bitboard pawn_breakthrough(const Board& board, Square from, Color us) noexcept {
    Bitboard out = kEmptyBB;
    for (int df : {-1, 1}) {
        Square diag = forward(from, us, df);
        if (diag != kNoSquare && board.is_empty(diag)) set_bit(out, diag);
    }
    Square ahead = forward(from, us, 0);
    if (ahead != kNoSquare && holds_enemy(board, ahead, us)) set_bit(out, ahead);
    return out;
}

Bitboard pawn_diagonal(const Board& board, Square from, Color us) noexcept {
    Bitboard out = kEmptyBB;
    for (int df : {-1, 1}) {
        Square diag = forward(from, us, df);
        if (diag == kNoSquare || rank_of(diag) == promotion_rank(us)) continue;
        if (board.is_empty(diag)) set_bit(out, diag);
    }
    return out;
}

// ── Pieces ──────────────────────────────────────────────────────────────────

Bitboard extended_range(PieceType pt, Square from) noexcept {
    switch (pt) {
        case PieceType::Rook:
            return ring_rays(from, kRookDirs, 2, 5);
        case PieceType::Bishop:
            return ring_rays(from, kBishopDirs, 2, 5);
        case PieceType::Queen:
            return ring_rays(from, kQueenDirs, 2, 5);
        case PieceType::Knight:
            return kDoubledKnightData.table[from];
        default:
            return kEmptyBB;
    }
}

Bitboard knight_dash(Square from) noexcept {
    return kDashData.table[from];
}

Bitboard lines_through(PieceType pt, Square from) noexcept {
    switch (pt) {
        case PieceType::Rook:
            return open_rays(from, kRookDirs);
        case PieceType::Bishop:
            return open_rays(from, kBishopDirs);
        case PieceType::Queen:
            return open_rays(from, kQueenDirs);
        default:
            return kEmptyBB;
    }
}

Bitboard teleport(const Board& board, Piece piece) noexcept {
    Bitboard out = ~board.occupied_all();
    if (piece.type == PieceType::Pawn) out &= ~rank_bb(back_rank(piece.color));
    return out;
}

Bitboard base_destinations(const Board& board, Square from) noexcept {
    const Piece p = board.piece_at(from);
    if (p.empty()) return kEmptyBB;
    const Bitboard occ = board.occupied_all();
    const Bitboard own = board.occupied(p.color);

    switch (p.type) {
        case PieceType::Pawn: {
            Bitboard out = pawn_attacks(p.color, from) & board.occupied(opposite(p.color));
            Square one = forward(from, p.color, 0);
            if (one != kNoSquare && board.is_empty(one)) {
                set_bit(out, one);
                if (rank_of(from) == back_rank(p.color) + forward_step(p.color))
                    out |= pawn_march(board, from, p.color);
            }
            return out;
        }
        case PieceType::Knight:
            return knight_attacks(from) & ~own;
        case PieceType::Bishop:
            return bishop_attacks(from, occ) & ~own;
        case PieceType::Rook:
            return rook_attacks(from, occ) & ~own;
        case PieceType::Queen:
            return queen_attacks(from, occ) & ~own;
        case PieceType::King:
            return king_attacks(from) & ~own;
        case PieceType::None:
            break;
    }
    return kEmptyBB;
}

Bitboard one_step_bonus(const Board& board, Square from, Color us, int limit) noexcept {
    Bitboard candidates = king_attacks(from);
    Bitboard out = kEmptyBB;
    while (candidates && popcount(out) < limit) {
        Square sq = pop_lsb(candidates);
        Piece p = board.piece_at(sq);
        if (p.empty() || (p.color != us && p.type != PieceType::King)) set_bit(out, sq);
    }
    return out;
}

// ── Dispatch ────────────────────────────────────────────────────────────────

bool has_geometry(std::string_view id) noexcept {
    constexpr std::string_view kGeometric[] = {
        "enhanced-march", "pawn-advance",      "breakthrough",      "diagonal-move",
        "extended-range", "knight-dash",       "knight-leap",       "rook-entrench",
        "bishop-consecrate", "queen-dominance", "teleport",          "phase-through",
        "zone-control",   "battlefield-command", "divine-authority",
    };
    for (std::string_view g : kGeometric) {
        if (g == id) return true;
    }
    return false;
}

Bitboard destinations(std::string_view id, const PatternContext& ctx) noexcept {
    const PieceType pt = ctx.piece.type;
    const Color us = ctx.piece.color;
    const bool pawn = pt == PieceType::Pawn;

    if (id == "enhanced-march" || id == "pawn-advance")
        return pawn ? pawn_march(ctx.board, ctx.from, us) : kEmptyBB;
    if (id == "breakthrough")
        return pawn ? pawn_breakthrough(ctx.board, ctx.from, us) : kEmptyBB;
    if (id == "diagonal-move")
        return pawn ? pawn_diagonal(ctx.board, ctx.from, us) : kEmptyBB;
    if (id == "extended-range" || id == "zone-control" || id == "battlefield-command" ||
        id == "divine-authority")
        return extended_range(pt, ctx.from);
    if (id == "knight-dash" || id == "knight-leap")
        return pt == PieceType::Knight ? knight_dash(ctx.from) : kEmptyBB;
    if (id == "rook-entrench") {
        bool active = pt == PieceType::Rook && ctx.state && ctx.state->is_entrenched;
        return active ? lines_through(PieceType::Rook, ctx.from) : kEmptyBB;
    }
    if (id == "bishop-consecrate") {
        bool active = pt == PieceType::Bishop && ctx.state && ctx.state->is_consecrated_source;
        return active ? lines_through(PieceType::Bishop, ctx.from) : kEmptyBB;
    }
    if (id == "queen-dominance")
        return pt == PieceType::Queen ? lines_through(PieceType::Queen, ctx.from) : kEmptyBB;
    if (id == "teleport") return teleport(ctx.board, ctx.piece);
    if (id == "phase-through") {
        bool active = ctx.state && ctx.state->can_move_through;
        return active ? lines_through(pt, ctx.from) : kEmptyBB;
    }
    return kEmptyBB;
}

}  // namespace evochess::patterns
