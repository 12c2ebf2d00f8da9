/// @file test_move.cpp
/// Tests for move.hpp: Move creation, UCI serialization, MoveList.

#include <evochess/move.hpp>

#include <gtest/gtest.h>

#include <string>

namespace evochess {

// ── Move UCI ────────────────────────────────────────────────────────────────

TEST(Move, UciNormal) {
    Move m{E2, E4, MoveFlag::Normal, PieceType::None};
    EXPECT_EQ(m.uci(), "e2e4");
}

TEST(Move, UciPromotion) {
    Move m{E7, E8, MoveFlag::Promotion, PieceType::Queen};
    EXPECT_EQ(m.uci(), "e7e8q");

    Move mk{A7, A8, MoveFlag::Promotion, PieceType::Knight};
    EXPECT_EQ(mk.uci(), "a7a8n");
}

TEST(Move, FromUciNormal) {
    auto m = Move::from_uci("e2e4");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->from_sq, E2);
    EXPECT_EQ(m->to_sq, E4);
    EXPECT_EQ(m->flag, MoveFlag::Normal);
    EXPECT_EQ(m->promotion, PieceType::None);
}

TEST(Move, FromUciPromotion) {
    auto m = Move::from_uci("e7e8q");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->flag, MoveFlag::Promotion);
    EXPECT_EQ(m->promotion, PieceType::Queen);
}

TEST(Move, FromUciInvalid) {
    EXPECT_FALSE(Move::from_uci("xy").has_value());
    EXPECT_FALSE(Move::from_uci("").has_value());
    EXPECT_FALSE(Move::from_uci("e2e9").has_value());
    EXPECT_FALSE(Move::from_uci("e7e8k").has_value());
    EXPECT_FALSE(Move::from_uci("Nf3").has_value());
    EXPECT_FALSE(Move::from_uci("exd5").has_value());
}

TEST(Move, UciRoundTrip) {
    std::string uci_strs[] = {"e2e4", "d7d5", "g1f3", "a7a8q", "b2b1n"};
    for (const auto& s : uci_strs) {
        auto m = Move::from_uci(s);
        ASSERT_TRUE(m.has_value()) << s;
        EXPECT_EQ(m->uci(), s) << "Round-trip failed for " << s;
    }
}

TEST(Move, SamePathIgnoresFlag) {
    Move m{E1, G1, MoveFlag::CastleKingside, PieceType::None};
    EXPECT_TRUE(m.same_path(E1, G1));
    EXPECT_FALSE(m.same_path(E1, G1, PieceType::Queen));
    EXPECT_FALSE(m.same_path(E1, F1));
}

TEST(Move, Equality) {
    Move a{E2, E4, MoveFlag::Normal, PieceType::None};
    Move b{E2, E4, MoveFlag::Normal, PieceType::None};
    Move c{D2, D4, MoveFlag::Normal, PieceType::None};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

// ── MoveList ────────────────────────────────────────────────────────────────

TEST(MoveList, PushAndSize) {
    MoveList ml;
    EXPECT_TRUE(ml.empty());
    ml.push({E2, E4});
    ml.push({D2, D4});
    EXPECT_EQ(ml.size(), 2);
    EXPECT_EQ(ml[1].from_sq, D2);
}

TEST(MoveList, RangeFor) {
    MoveList ml;
    ml.push({E2, E4});
    ml.push({D2, D4});
    ml.push({G1, F3});

    int count = 0;
    for ([[maybe_unused]] const auto& m : ml) {
        ++count;
    }
    EXPECT_EQ(count, 3);
}

TEST(MoveList, Clear) {
    MoveList ml;
    ml.push({E2, E4});
    ml.clear();
    EXPECT_TRUE(ml.empty());
}

TEST(MoveList, FindByPath) {
    MoveList ml;
    ml.push({E7, E8, MoveFlag::Promotion, PieceType::Rook});
    ml.push({E7, E8, MoveFlag::Promotion, PieceType::Queen});
    ml.push({G1, F3});

    auto q = ml.find(E7, E8, PieceType::Queen);
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->promotion, PieceType::Queen);
    EXPECT_TRUE(ml.find(G1, F3).has_value());
    EXPECT_FALSE(ml.find(G1, H3).has_value());
}

TEST(MoveList, ContainsPathAnyPromotion) {
    MoveList ml;
    ml.push({E7, E8, MoveFlag::Promotion, PieceType::Knight});
    EXPECT_TRUE(ml.contains_path(E7, E8));
    EXPECT_FALSE(ml.contains_path(E7, D8));
}

}  // namespace evochess
