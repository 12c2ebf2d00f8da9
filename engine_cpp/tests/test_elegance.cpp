/// @file test_elegance.cpp
/// Tests for elegance.hpp: tactical motif detection and scoring.

#include <evochess/elegance.hpp>

#include <gtest/gtest.h>

using namespace evochess;

namespace {

struct Played {
    Position before;
    Position after;
};

Played play(const char* fen, Square from, Square to) {
    Position before = Position::from_fen(fen);
    Position after = before;
    after.make_move({from, to});
    return {before, after};
}

}  // namespace

// ── Scoring ─────────────────────────────────────────────────────────────────

TEST(Elegance, ScoreOfNothingIsZero) {
    EXPECT_EQ(elegance::score(elegance::Factors{}), 0);
}

TEST(Elegance, CheckmatePatternWeights) {
    elegance::Factors plain;
    plain.checkmate = true;
    EXPECT_EQ(elegance::score(plain), 20);

    elegance::Factors back_rank = plain;
    back_rank.back_rank_mate = true;
    EXPECT_EQ(elegance::score(back_rank), 50);

    elegance::Factors smothered = plain;
    smothered.smothered_mate = true;
    EXPECT_EQ(elegance::score(smothered), 150);
}

TEST(Elegance, MultipliersCompound) {
    elegance::Factors f;
    f.fork = true;
    f.efficiency = 0.5;
    f.complexity = 0.2;
    EXPECT_EQ(elegance::score(f), 18);
}

// ── Motifs ──────────────────────────────────────────────────────────────────

TEST(Elegance, QuietMoveHasNoMotifs) {
    auto p = play(kStartingFen.data(), E2, E4);
    auto f = elegance::analyze(p.before, p.after, E2, E4, 0);
    EXPECT_FALSE(f.checkmate || f.fork || f.pin || f.skewer || f.sacrifice);
    EXPECT_DOUBLE_EQ(f.efficiency, 1.0);
    EXPECT_DOUBLE_EQ(f.complexity, 0.0);
}

TEST(Elegance, KnightFork) {
    auto p = play("r3k3/8/8/1N6/8/8/8/4K3 w - - 0 1", B5, C7);
    auto f = elegance::analyze(p.before, p.after, B5, C7, 10);
    EXPECT_TRUE(f.fork);
    EXPECT_FALSE(f.checkmate);
    EXPECT_DOUBLE_EQ(f.efficiency, 0.9);
    EXPECT_DOUBLE_EQ(f.complexity, 0.3);
}

TEST(Elegance, AbsolutePin) {
    auto p = play("4k3/3n4/8/8/8/3B4/8/4K3 w - - 0 1", D3, B5);
    auto f = elegance::analyze(p.before, p.after, D3, B5, 4);
    EXPECT_TRUE(f.pin);
    EXPECT_FALSE(f.skewer);
}

TEST(Elegance, DiscoveredAttack) {
    auto p = play("4k3/6r1/8/8/3N4/8/1B6/4K3 w - - 0 1", D4, F5);
    auto f = elegance::analyze(p.before, p.after, D4, F5, 4);
    EXPECT_TRUE(f.discovered_attack);
    EXPECT_FALSE(f.fork);
}

TEST(Elegance, SmotheredMateOnBackRank) {
    auto p = play("6rk/6pp/8/6N1/8/8/8/6K1 w - - 0 1", G5, F7);
    auto f = elegance::analyze(p.before, p.after, G5, F7, 0);
    EXPECT_TRUE(f.checkmate);
    EXPECT_TRUE(f.smothered_mate);
    EXPECT_TRUE(f.back_rank_mate);
    EXPECT_FALSE(f.double_check);
    // Back-rank weighting wins: (25 + 50 + 25) x 2.
    EXPECT_EQ(elegance::score(p.before, p.after, G5, F7, 0), 200);
}

TEST(Elegance, QueenTakesPawnCountsAsSacrifice) {
    auto p = play("r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4", H5, F7);
    auto f = elegance::analyze(p.before, p.after, H5, F7, 6);
    EXPECT_TRUE(f.checkmate);
    EXPECT_TRUE(f.back_rank_mate);
    EXPECT_FALSE(f.smothered_mate);
    EXPECT_TRUE(f.sacrifice);
    EXPECT_DOUBLE_EQ(f.efficiency, 1.0);
}

TEST(Elegance, EmptySourceYieldsDefaults) {
    auto pos = Position::initial();
    auto f = elegance::analyze(pos, pos, E4, E5, 0);
    EXPECT_FALSE(f.checkmate);
    EXPECT_DOUBLE_EQ(f.efficiency, 0.0);
}
