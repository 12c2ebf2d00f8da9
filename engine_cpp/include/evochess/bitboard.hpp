#pragma once

/// @file bitboard.hpp
/// Bitboard type, square-set helpers, and attack generation.
///
/// A Bitboard doubles as the set-of-squares type used by the evolution layer
/// (territory, cached destinations, candidate sets).

#include <evochess/types.hpp>

#include <bit>
#include <cstdint>
#include <vector>

namespace evochess {

using Bitboard = std::uint64_t;

inline constexpr Bitboard kEmptyBB = 0ULL;
inline constexpr Bitboard kFullBB = ~0ULL;

// ── Bit manipulation ────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard square_bb(Square sq) noexcept {
    return 1ULL << sq;
}

[[nodiscard]] constexpr int popcount(Bitboard b) noexcept {
    return std::popcount(b);
}

[[nodiscard]] constexpr Square lsb(Bitboard b) noexcept {
    return static_cast<Square>(std::countr_zero(b));
}

/// Pop (return and clear) the least significant bit.
[[nodiscard]] constexpr Square pop_lsb(Bitboard& b) noexcept {
    Square sq = lsb(b);
    b &= b - 1;
    return sq;
}

[[nodiscard]] constexpr bool test_bit(Bitboard b, Square sq) noexcept {
    return (b >> sq) & 1;
}

constexpr void set_bit(Bitboard& b, Square sq) noexcept {
    b |= square_bb(sq);
}

constexpr void clear_bit(Bitboard& b, Square sq) noexcept {
    b &= ~square_bb(sq);
}

/// Squares of a bitboard in ascending index order.
[[nodiscard]] inline std::vector<Square> squares_of(Bitboard b) {
    std::vector<Square> out;
    out.reserve(static_cast<std::size_t>(popcount(b)));
    while (b) out.push_back(pop_lsb(b));
    return out;
}

// ── Rank / File masks ───────────────────────────────────────────────────────

// clang-format off
inline constexpr Bitboard kFileA = 0x0101010101010101ULL;
inline constexpr Bitboard kFileB = kFileA << 1;
inline constexpr Bitboard kFileG = kFileA << 6;
inline constexpr Bitboard kFileH = kFileA << 7;

inline constexpr Bitboard kRank1 = 0x00000000000000FFULL;
inline constexpr Bitboard kRank3 = kRank1 << 16;
inline constexpr Bitboard kRank6 = kRank1 << 40;
inline constexpr Bitboard kRank8 = kRank1 << 56;

inline constexpr Bitboard kLightSquares = 0x55AA55AA55AA55AAULL;
// clang-format on

[[nodiscard]] constexpr Bitboard file_bb(int f) noexcept {
    return kFileA << f;
}
[[nodiscard]] constexpr Bitboard rank_bb(int r) noexcept {
    return kRank1 << (r * 8);
}

// ── Shift helpers ───────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard shift_north(Bitboard b) noexcept {
    return b << 8;
}
[[nodiscard]] constexpr Bitboard shift_south(Bitboard b) noexcept {
    return b >> 8;
}
[[nodiscard]] constexpr Bitboard shift_east(Bitboard b) noexcept {
    return (b << 1) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_west(Bitboard b) noexcept {
    return (b >> 1) & ~kFileH;
}
[[nodiscard]] constexpr Bitboard shift_ne(Bitboard b) noexcept {
    return (b << 9) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_nw(Bitboard b) noexcept {
    return (b << 7) & ~kFileH;
}
[[nodiscard]] constexpr Bitboard shift_se(Bitboard b) noexcept {
    return (b >> 7) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_sw(Bitboard b) noexcept {
    return (b >> 9) & ~kFileH;
}

// ── Offsets and rays ────────────────────────────────────────────────────────

struct Offset {
    int df;
    int dr;
};

inline constexpr Offset kRookDirs[] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
inline constexpr Offset kBishopDirs[] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
inline constexpr Offset kQueenDirs[] = {{1, 0},  {-1, 0}, {0, 1},  {0, -1},
                                        {1, 1}, {1, -1}, {-1, 1}, {-1, -1}};

/// Square reached by an offset, or kNoSquare when it leaves the board.
[[nodiscard]] constexpr Square offset_square(Square sq, int df, int dr) noexcept {
    int f = file_of(sq) + df;
    int r = rank_of(sq) + dr;
    return on_board(f, r) ? make_square(f, r) : kNoSquare;
}

/// Walk a ray from `sq` (exclusive) for at most `max_steps` squares.
/// When `occupancy` is non-empty the ray stops on (and includes) the first blocker.
[[nodiscard]] constexpr Bitboard ray(Square sq, Offset dir, Bitboard occupancy = kEmptyBB,
                                     int max_steps = 7) noexcept {
    Bitboard out = kEmptyBB;
    int f = file_of(sq) + dir.df;
    int r = rank_of(sq) + dir.dr;
    for (int step = 0; step < max_steps && on_board(f, r); ++step) {
        Square s = make_square(f, r);
        set_bit(out, s);
        if (test_bit(occupancy, s)) break;
        f += dir.df;
        r += dir.dr;
    }
    return out;
}

/// All squares within Chebyshev distance `radius` of `sq`, excluding `sq`.
[[nodiscard]] constexpr Bitboard radius_bb(Square sq, int radius) noexcept {
    Bitboard out = kEmptyBB;
    for (int s = 0; s < 64; ++s) {
        auto other = static_cast<Square>(s);
        if (other != sq && chebyshev_distance(sq, other) <= radius) set_bit(out, other);
    }
    return out;
}

// ── Pre-computed attack tables for non-sliding pieces ───────────────────────

namespace detail {

struct LeaperTable {
    Bitboard table[64]{};
};

constexpr LeaperTable compute_leaper(const Offset* offsets, int n) noexcept {
    LeaperTable t{};
    for (int sq = 0; sq < 64; ++sq) {
        for (int i = 0; i < n; ++i) {
            Square to = offset_square(static_cast<Square>(sq), offsets[i].df, offsets[i].dr);
            if (to != kNoSquare) set_bit(t.table[sq], to);
        }
    }
    return t;
}

inline constexpr Offset kKnightOffsets[] = {{1, 2},  {2, 1},  {2, -1}, {1, -2},
                                            {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};

inline constexpr LeaperTable kKnightAttacksData = compute_leaper(kKnightOffsets, 8);
inline constexpr LeaperTable kKingAttacksData = compute_leaper(kQueenDirs, 8);

constexpr auto compute_pawn_attacks() noexcept {
    struct Result {
        Bitboard table[2][64]{};
    };
    Result r{};
    for (int sq = 0; sq < 64; ++sq) {
        Bitboard bb = square_bb(static_cast<Square>(sq));
        r.table[0][sq] = shift_ne(bb) | shift_nw(bb);
        r.table[1][sq] = shift_se(bb) | shift_sw(bb);
    }
    return r;
}

inline constexpr auto kPawnAttacksData = compute_pawn_attacks();

}  // namespace detail

[[nodiscard]] constexpr Bitboard knight_attacks(Square sq) noexcept {
    return detail::kKnightAttacksData.table[sq];
}

[[nodiscard]] constexpr Bitboard king_attacks(Square sq) noexcept {
    return detail::kKingAttacksData.table[sq];
}

[[nodiscard]] constexpr Bitboard pawn_attacks(Color c, Square sq) noexcept {
    return detail::kPawnAttacksData.table[color_index(c)][sq];
}

// ── Sliding attacks ─────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard bishop_attacks(Square sq, Bitboard occupancy) noexcept {
    Bitboard out = kEmptyBB;
    for (Offset d : kBishopDirs) out |= ray(sq, d, occupancy);
    return out;
}

[[nodiscard]] constexpr Bitboard rook_attacks(Square sq, Bitboard occupancy) noexcept {
    Bitboard out = kEmptyBB;
    for (Offset d : kRookDirs) out |= ray(sq, d, occupancy);
    return out;
}

[[nodiscard]] constexpr Bitboard queen_attacks(Square sq, Bitboard occupancy) noexcept {
    return bishop_attacks(sq, occupancy) | rook_attacks(sq, occupancy);
}

}  // namespace evochess
