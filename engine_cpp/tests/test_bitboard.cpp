/// @file test_bitboard.cpp
/// Tests for bitboard.hpp: bit ops, shifts, rays, attack tables.

#include <evochess/bitboard.hpp>

#include <gtest/gtest.h>

#include <vector>

namespace evochess {

// ── Basic bit operations ────────────────────────────────────────────────────

TEST(Bitboard, SquareBB) {
    EXPECT_EQ(square_bb(A1), 1ULL);
    EXPECT_EQ(square_bb(H8), 1ULL << 63);
    EXPECT_EQ(square_bb(E4), 1ULL << 28);
}

TEST(Bitboard, Popcount) {
    EXPECT_EQ(popcount(kEmptyBB), 0);
    EXPECT_EQ(popcount(kFullBB), 64);
    EXPECT_EQ(popcount(square_bb(E4)), 1);
    EXPECT_EQ(popcount(kRank1), 8);
    EXPECT_EQ(popcount(kFileA), 8);
}

TEST(Bitboard, PopLsb) {
    Bitboard bb = square_bb(A1) | square_bb(C3) | square_bb(H8);
    EXPECT_EQ(pop_lsb(bb), A1);
    EXPECT_EQ(popcount(bb), 2);
    EXPECT_EQ(pop_lsb(bb), C3);
    EXPECT_EQ(pop_lsb(bb), H8);
    EXPECT_EQ(bb, kEmptyBB);
}

TEST(Bitboard, TestSetClearBit) {
    Bitboard bb = kEmptyBB;
    EXPECT_FALSE(test_bit(bb, E4));
    set_bit(bb, E4);
    EXPECT_TRUE(test_bit(bb, E4));
    clear_bit(bb, E4);
    EXPECT_FALSE(test_bit(bb, E4));
}

TEST(Bitboard, SquaresOfIsAscending) {
    std::vector<Square> squares = squares_of(square_bb(H8) | square_bb(A1) | square_bb(E4));
    ASSERT_EQ(squares.size(), 3u);
    EXPECT_EQ(squares[0], A1);
    EXPECT_EQ(squares[1], E4);
    EXPECT_EQ(squares[2], H8);
    EXPECT_TRUE(squares_of(kEmptyBB).empty());
}

// ── Rank / File masks ───────────────────────────────────────────────────────

TEST(Bitboard, FileMasks) {
    EXPECT_TRUE(test_bit(kFileA, A1));
    EXPECT_TRUE(test_bit(kFileA, A8));
    EXPECT_FALSE(test_bit(kFileA, B1));
    EXPECT_EQ(file_bb(0), kFileA);
    EXPECT_EQ(file_bb(7), kFileH);
}

TEST(Bitboard, RankMasks) {
    EXPECT_TRUE(test_bit(kRank1, H1));
    EXPECT_FALSE(test_bit(kRank1, A2));
    EXPECT_EQ(rank_bb(0), kRank1);
    EXPECT_EQ(rank_bb(7), kRank8);
}

// ── Shift operations ────────────────────────────────────────────────────────

TEST(Bitboard, ShiftNorthSouth) {
    Bitboard e4 = square_bb(E4);
    EXPECT_EQ(shift_north(e4), square_bb(E5));
    EXPECT_EQ(shift_south(e4), square_bb(E3));
    EXPECT_EQ(shift_north(square_bb(E8)), kEmptyBB);
    EXPECT_EQ(shift_south(square_bb(E1)), kEmptyBB);
}

TEST(Bitboard, ShiftEdgeCases) {
    // No wrap-around between the a- and h-files.
    EXPECT_EQ(shift_west(square_bb(A4)), kEmptyBB);
    EXPECT_EQ(shift_nw(square_bb(A4)), kEmptyBB);
    EXPECT_EQ(shift_sw(square_bb(A4)), kEmptyBB);
    EXPECT_EQ(shift_east(square_bb(H4)), kEmptyBB);
    EXPECT_EQ(shift_ne(square_bb(H4)), kEmptyBB);
    EXPECT_EQ(shift_se(square_bb(H4)), kEmptyBB);
}

// ── Rays and radii ──────────────────────────────────────────────────────────

TEST(Bitboard, OffsetSquare) {
    EXPECT_EQ(offset_square(E4, 1, 2), F6);
    EXPECT_EQ(offset_square(H4, 1, 0), kNoSquare);
    EXPECT_EQ(offset_square(A1, 0, -1), kNoSquare);
}

TEST(Bitboard, RayStopsOnBlocker) {
    Bitboard r = ray(A1, {0, 1}, square_bb(A4));
    EXPECT_EQ(r, square_bb(A2) | square_bb(A3) | square_bb(A4));
}

TEST(Bitboard, RayRespectsMaxSteps) {
    Bitboard r = ray(D4, {1, 1}, kEmptyBB, 2);
    EXPECT_EQ(r, square_bb(E5) | square_bb(F6));
}

TEST(Bitboard, RadiusExcludesCentre) {
    Bitboard r1 = radius_bb(E4, 1);
    EXPECT_EQ(r1, king_attacks(E4));
    EXPECT_EQ(popcount(radius_bb(E4, 2)), 24);
    EXPECT_EQ(popcount(radius_bb(A1, 2)), 8);
    EXPECT_FALSE(test_bit(radius_bb(E4, 3), E4));
}

// ── Leaper tables ───────────────────────────────────────────────────────────

TEST(Bitboard, KnightAttacksCenter) {
    Bitboard attacks = knight_attacks(E4);
    EXPECT_EQ(popcount(attacks), 8);
    EXPECT_TRUE(test_bit(attacks, D6));
    EXPECT_TRUE(test_bit(attacks, F6));
    EXPECT_TRUE(test_bit(attacks, C5));
    EXPECT_TRUE(test_bit(attacks, G3));
}

TEST(Bitboard, KnightAttacksCorner) {
    Bitboard attacks = knight_attacks(A1);
    EXPECT_EQ(attacks, square_bb(B3) | square_bb(C2));
}

TEST(Bitboard, KingAttacksCorner) {
    Bitboard attacks = king_attacks(A1);
    EXPECT_EQ(attacks, square_bb(A2) | square_bb(B1) | square_bb(B2));
}

TEST(Bitboard, PawnAttacks) {
    EXPECT_EQ(pawn_attacks(Color::White, E4), square_bb(D5) | square_bb(F5));
    EXPECT_EQ(pawn_attacks(Color::Black, E4), square_bb(D3) | square_bb(F3));
    EXPECT_EQ(pawn_attacks(Color::White, A2), square_bb(B3));
    EXPECT_EQ(pawn_attacks(Color::Black, H7), square_bb(G6));
}

// ── Sliders ─────────────────────────────────────────────────────────────────

TEST(Bitboard, BishopE4EmptyBoard) {
    Bitboard attacks = bishop_attacks(E4, kEmptyBB);
    EXPECT_EQ(popcount(attacks), 13);
    EXPECT_TRUE(test_bit(attacks, A8));
    EXPECT_TRUE(test_bit(attacks, H7));
    EXPECT_TRUE(test_bit(attacks, B1));
    EXPECT_TRUE(test_bit(attacks, H1));
}

TEST(Bitboard, BishopBlockedByPiece) {
    Bitboard attacks = bishop_attacks(E4, square_bb(F5));
    EXPECT_TRUE(test_bit(attacks, F5));
    EXPECT_FALSE(test_bit(attacks, G6));
}

TEST(Bitboard, RookBlockedByPiece) {
    Bitboard attacks = rook_attacks(E4, square_bb(E6) | square_bb(C4));
    EXPECT_TRUE(test_bit(attacks, E6));
    EXPECT_FALSE(test_bit(attacks, E7));
    EXPECT_TRUE(test_bit(attacks, C4));
    EXPECT_FALSE(test_bit(attacks, B4));
    EXPECT_TRUE(test_bit(attacks, H4));
}

TEST(Bitboard, QueenCounts) {
    EXPECT_EQ(popcount(queen_attacks(E4, kEmptyBB)), 27);
    EXPECT_EQ(popcount(queen_attacks(A1, kEmptyBB)), 21);
}

TEST(Bitboard, SlidersNeverIncludeOwnSquare) {
    for (int sq = 0; sq < 64; ++sq) {
        auto s = static_cast<Square>(sq);
        EXPECT_FALSE(test_bit(queen_attacks(s, kEmptyBB), s));
    }
}

}  // namespace evochess
