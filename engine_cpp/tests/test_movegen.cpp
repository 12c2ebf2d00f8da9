/// @file test_movegen.cpp
/// Unit tests for oracle move generation.

#include <evochess/movegen.hpp>
#include <evochess/position.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace evochess;

// Helper: check that a specific UCI move is present among legal moves.
static bool has_move(Position& pos, const std::string& uci_str) {
    MoveList ml = movegen::legal(pos);
    for (const Move& m : ml) {
        if (m.uci() == uci_str) return true;
    }
    return false;
}

static int moves_from(Position& pos, Square from) {
    return movegen::legal_from(pos, from).size();
}

// ── Starting position ───────────────────────────────────────────────────────

TEST(MoveGen, StartingPosHas20LegalMoves) {
    auto pos = Position::initial();
    EXPECT_EQ(movegen::legal(pos).size(), 20);
    EXPECT_EQ(movegen::pseudo_legal(pos).size(), 20);
}

TEST(MoveGen, LegalLeavesPositionUnchanged) {
    auto pos = Position::initial();
    const std::string before = pos.to_fen();
    (void)movegen::legal(pos);
    EXPECT_EQ(pos.to_fen(), before);
}

// ── Pawn moves ──────────────────────────────────────────────────────────────

TEST(MoveGen, PawnPushes) {
    auto pos = Position::initial();
    EXPECT_TRUE(has_move(pos, "e2e3"));
    EXPECT_TRUE(has_move(pos, "e2e4"));
    EXPECT_FALSE(has_move(pos, "e2e5"));
}

TEST(MoveGen, DoublePushCarriesFlag) {
    auto pos = Position::initial();
    auto m = movegen::legal(pos).find(E2, E4);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->flag, MoveFlag::DoublePawn);
}

TEST(MoveGen, PawnCapture) {
    auto pos = Position::from_fen("rnbqkbnr/ppp1pppp/8/3p4/4P3/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 2");
    EXPECT_TRUE(has_move(pos, "e4d5"));
}

TEST(MoveGen, EnPassant) {
    auto pos =
        Position::from_fen("rnbqkbnr/ppp1pppp/8/3pP3/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3");
    auto m = movegen::legal(pos).find(E5, D6);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->flag, MoveFlag::EnPassant);
}

TEST(MoveGen, EnPassantBlack) {
    auto pos =
        Position::from_fen("rnbqkbnr/ppp1pppp/8/8/3pP3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 2");
    EXPECT_TRUE(has_move(pos, "d4e3"));
}

// ── Promotion ───────────────────────────────────────────────────────────────

TEST(MoveGen, PawnPromotion) {
    auto pos = Position::from_fen("8/P7/8/8/8/8/6k1/4K3 w - - 0 1");
    EXPECT_TRUE(has_move(pos, "a7a8q"));
    EXPECT_TRUE(has_move(pos, "a7a8r"));
    EXPECT_TRUE(has_move(pos, "a7a8b"));
    EXPECT_TRUE(has_move(pos, "a7a8n"));
    EXPECT_FALSE(has_move(pos, "a7a8"));
}

TEST(MoveGen, BlackPawnPromotionCapture) {
    auto pos = Position::from_fen("4k3/8/8/8/8/8/p7/1R2K3 b - - 0 1");
    EXPECT_TRUE(has_move(pos, "a2b1q"));
    EXPECT_TRUE(has_move(pos, "a2a1n"));
}

// ── Castling ────────────────────────────────────────────────────────────────

TEST(MoveGen, CastlingBothSides) {
    auto pos = Position::from_fen("r3k2r/pppppppp/8/8/8/8/PPPPPPPP/R3K2R w KQkq - 0 1");
    EXPECT_TRUE(has_move(pos, "e1g1"));
    EXPECT_TRUE(has_move(pos, "e1c1"));
}

TEST(MoveGen, CastlingBlockedByPiece) {
    auto pos = Position::initial();
    EXPECT_FALSE(has_move(pos, "e1g1"));
    EXPECT_FALSE(has_move(pos, "e1c1"));
}

TEST(MoveGen, CastlingBlockedByCheck) {
    // Black rook on h1 gives check to the white king on e1.
    auto pos = Position::from_fen("4k3/8/8/8/8/8/8/R3K2r w Q - 0 1");
    EXPECT_TRUE(pos.is_in_check());
    EXPECT_FALSE(has_move(pos, "e1c1"));
}

TEST(MoveGen, CastlingThroughAttack) {
    // Rook on f2 covers f1.
    auto pos = Position::from_fen("4k3/8/8/8/8/8/5r2/R3K2R w KQ - 0 1");
    EXPECT_FALSE(has_move(pos, "e1g1"));
    EXPECT_TRUE(has_move(pos, "e1c1"));
}

// ── Mate and stalemate ──────────────────────────────────────────────────────

TEST(MoveGen, Stalemate) {
    auto pos = Position::from_fen("k7/2Q5/1K6/8/8/8/8/8 b - - 0 1");
    EXPECT_EQ(movegen::legal(pos).size(), 0);
    EXPECT_FALSE(movegen::has_legal_move(pos));
    EXPECT_FALSE(pos.is_in_check());
}

TEST(MoveGen, Checkmate) {
    auto pos =
        Position::from_fen("r1bqkb1r/pppp1Qpp/2n2n2/4p3/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 0 4");
    EXPECT_FALSE(movegen::has_legal_move(pos));
    EXPECT_TRUE(pos.is_in_check());
}

// ── Per-square generation ───────────────────────────────────────────────────

TEST(MoveGen, LegalFromSliders) {
    auto bishop = Position::from_fen("4k3/8/8/8/4B3/8/8/4K3 w - - 0 1");
    EXPECT_EQ(moves_from(bishop, E4), 13);

    auto rook = Position::from_fen("4k3/8/8/8/8/8/8/R3K3 w Q - 0 1");
    EXPECT_EQ(moves_from(rook, A1), 10);

    auto queen = Position::from_fen("4k3/8/8/8/3Q4/8/8/4K3 w - - 0 1");
    EXPECT_EQ(moves_from(queen, D4), 27);
}

TEST(MoveGen, LegalFromEmptyOrEnemySquare) {
    auto pos = Position::initial();
    EXPECT_EQ(moves_from(pos, E4), 0);
    EXPECT_EQ(moves_from(pos, E7), 0);
    EXPECT_EQ(moves_from(pos, G1), 2);
}

TEST(MoveGen, PinnedPieceCantMove) {
    // Knight on e2 is pinned by the rook on e8.
    auto pos = Position::from_fen("4r1k1/8/8/8/8/8/4N3/4K3 w - - 0 1");
    EXPECT_EQ(moves_from(pos, E2), 0);
    EXPECT_TRUE(movegen::pseudo_legal(pos).contains_path(E2, C3));
}

TEST(MoveGen, KingCannotStepIntoCheck) {
    auto pos = Position::from_fen("4k3/8/8/8/8/8/3r4/4K3 w - - 0 1");
    EXPECT_TRUE(has_move(pos, "e1d2"));
    EXPECT_FALSE(has_move(pos, "e1e2"));
    EXPECT_FALSE(has_move(pos, "e1d1"));
}
