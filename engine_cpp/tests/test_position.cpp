/// @file test_position.cpp
/// Tests for position.hpp: FEN, make/unmake, validation, attacks, repetition.

#include <evochess/position.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace evochess;

namespace {

constexpr const char* kCastleFen = "r3k2r/pppppppp/8/8/8/8/PPPPPPPP/R3K2R w KQkq - 0 1";

}  // namespace

// ── FEN parsing ─────────────────────────────────────────────────────────────

TEST(Position, StartingFen) {
    Position pos = Position::initial();
    EXPECT_EQ(pos.to_fen(), kStartingFen);
}

TEST(Position, FenRoundTrip) {
    std::string fen = "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";
    EXPECT_EQ(Position::from_fen(fen).to_fen(), fen);
}

TEST(Position, FenWithEP) {
    std::string fen = "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1";
    Position pos = Position::from_fen(fen);
    EXPECT_EQ(pos.to_fen(), fen);
    EXPECT_EQ(pos.en_passant(), E3);
    EXPECT_EQ(pos.side_to_move(), Color::Black);
}

TEST(Position, FenMinimalFields) {
    Position pos = Position::from_fen("8/8/8/8/8/8/8/4K2k w - -");
    EXPECT_EQ(pos.castling(), kCastlingNone);
    EXPECT_EQ(pos.en_passant(), kNoSquare);
    EXPECT_EQ(pos.halfmove_clock(), 0);
    EXPECT_EQ(pos.fullmove_number(), 1);
}

TEST(Position, FenInvalidThrows) {
    EXPECT_THROW((void)Position::from_fen(""), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("not a fen"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8 w KQkq -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8/8/8/8/8/4K2k x - -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8/8/8/8/8/4K2k w - e5"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8/8/8/8/8/4K2k w - - -1 1"),
                 std::invalid_argument);
}

// ── Validation ──────────────────────────────────────────────────────────────

TEST(Position, MissingKingIsRejected) {
    EXPECT_THROW((void)Position::from_fen("8/8/8/8/8/8/8/4K3 w - - 0 1"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("k7/8/8/8/8/8/8/3KK3 w - - 0 1"),
                 std::invalid_argument);
}

TEST(Position, PawnOnBackRankIsRejected) {
    EXPECT_THROW((void)Position::from_fen("P3k3/8/8/8/8/8/8/4K3 w - - 0 1"),
                 std::invalid_argument);
}

TEST(Position, SideNotToMoveInCheckIsRejected) {
    // Black king attacked by the rook while white is to move.
    EXPECT_THROW((void)Position::from_fen("4k3/8/8/8/8/8/8/4RK2 w - - 0 1"),
                 std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("4k3/8/8/8/8/8/8/4R1K1 w - - 0 1"),
                 std::invalid_argument);
}

TEST(Position, ConstructorDropsImpossibleCastling) {
    Board b;
    b.put_piece(E1, {Color::White, PieceType::King});
    b.put_piece(H1, {Color::White, PieceType::Rook});
    b.put_piece(E8, {Color::Black, PieceType::King});
    Position pos(b, Color::White, kCastlingAll, kNoSquare, 0, 1);
    EXPECT_EQ(pos.castling(), kWhiteKingside);
}

// ── Make / Unmake ───────────────────────────────────────────────────────────

TEST(Position, MakeUnmakeNormalPawnMove) {
    Position pos = Position::initial();
    std::string original_fen = pos.to_fen();

    Move m{E2, E3, MoveFlag::Normal, PieceType::None};
    pos.make_move(m);

    EXPECT_EQ(pos.board().piece_at(E2), kNoPiece);
    EXPECT_EQ(pos.board().piece_at(E3), (Piece{Color::White, PieceType::Pawn}));
    EXPECT_EQ(pos.side_to_move(), Color::Black);
    EXPECT_EQ(pos.halfmove_clock(), 0);

    pos.unmake_move(m);
    EXPECT_EQ(pos.to_fen(), original_fen);
}

TEST(Position, DoublePawnPushSetsEP) {
    Position pos = Position::initial();
    pos.make_move({E2, E4, MoveFlag::DoublePawn, PieceType::None});
    EXPECT_EQ(pos.en_passant(), E3);
}

TEST(Position, EnPassantCapture) {
    Position pos = Position::from_fen("8/8/8/3pP3/8/8/8/4K2k w - d6 0 1");
    std::string original_fen = pos.to_fen();
    Move m{E5, D6, MoveFlag::EnPassant, PieceType::None};

    pos.make_move(m);
    EXPECT_EQ(pos.board().piece_at(D5), kNoPiece);
    EXPECT_EQ(pos.board().piece_at(D6), (Piece{Color::White, PieceType::Pawn}));

    pos.unmake_move(m);
    EXPECT_EQ(pos.to_fen(), original_fen);
}

TEST(Position, CastleKingside) {
    Position pos = Position::from_fen(kCastleFen);
    std::string original_fen = pos.to_fen();

    Move m{E1, G1, MoveFlag::CastleKingside, PieceType::None};
    pos.make_move(m);

    EXPECT_EQ(pos.board().piece_at(G1), (Piece{Color::White, PieceType::King}));
    EXPECT_EQ(pos.board().piece_at(F1), (Piece{Color::White, PieceType::Rook}));
    EXPECT_EQ(pos.castling() & kWhiteBoth, kCastlingNone);
    EXPECT_EQ(pos.castling() & kBlackBoth, kBlackBoth);

    pos.unmake_move(m);
    EXPECT_EQ(pos.to_fen(), original_fen);
}

TEST(Position, CastleQueenside) {
    Position pos = Position::from_fen(kCastleFen);
    pos.make_move({E1, C1, MoveFlag::CastleQueenside, PieceType::None});
    EXPECT_EQ(pos.board().piece_at(C1), (Piece{Color::White, PieceType::King}));
    EXPECT_EQ(pos.board().piece_at(D1), (Piece{Color::White, PieceType::Rook}));
    EXPECT_TRUE(pos.board().is_empty(A1));
}

TEST(Position, RookMoveRemovesOneRight) {
    Position pos = Position::from_fen(kCastleFen);
    pos.make_move({H1, G1, MoveFlag::Normal, PieceType::None});
    EXPECT_EQ(pos.castling() & kWhiteKingside, kCastlingNone);
    EXPECT_EQ(pos.castling() & kWhiteQueenside, kWhiteQueenside);
}

TEST(Position, PromotionToKnight) {
    Position pos = Position::from_fen("8/4P3/8/8/8/8/8/4K2k w - - 0 1");
    Move m{E7, E8, MoveFlag::Promotion, PieceType::Knight};
    pos.make_move(m);
    EXPECT_EQ(pos.board().piece_at(E8), (Piece{Color::White, PieceType::Knight}));

    pos.unmake_move(m);
    EXPECT_EQ(pos.board().piece_at(E7), (Piece{Color::White, PieceType::Pawn}));
}

TEST(Position, ClocksAdvance) {
    Position pos = Position::initial();
    pos.make_move({G1, F3, MoveFlag::Normal, PieceType::None});
    EXPECT_EQ(pos.halfmove_clock(), 1);
    EXPECT_EQ(pos.fullmove_number(), 1);
    pos.make_move({G8, F6, MoveFlag::Normal, PieceType::None});
    EXPECT_EQ(pos.halfmove_clock(), 2);
    EXPECT_EQ(pos.fullmove_number(), 2);
}

// ── Attacks ─────────────────────────────────────────────────────────────────

TEST(Position, IsInCheckScholar) {
    Position pos =
        Position::from_fen("rnbqkb1r/pppp1Qpp/5n2/4p3/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 0 4");
    EXPECT_TRUE(pos.is_in_check());
    EXPECT_TRUE(pos.is_in_check(Color::Black));
    EXPECT_FALSE(pos.is_in_check(Color::White));
}

TEST(Position, AttackersOf) {
    Position pos = Position::from_fen("4k3/8/8/3n4/8/4P3/8/R3K3 w - - 0 1");
    Bitboard white = pos.attackers_of(D4, Color::White);
    EXPECT_EQ(white, square_bb(E3));
    Bitboard black = pos.attackers_of(E3, Color::Black);
    EXPECT_EQ(black, square_bb(D5));
    EXPECT_TRUE(pos.is_square_attacked(A8, Color::White));
    EXPECT_FALSE(pos.is_square_attacked(H8, Color::White));
}

TEST(Position, MissingKingIsNeverInCheck) {
    Position pos;
    EXPECT_FALSE(pos.is_in_check(Color::White));
    EXPECT_FALSE(pos.is_in_check(Color::Black));
}

// ── Repetition ──────────────────────────────────────────────────────────────

TEST(Position, RepetitionCount) {
    Position pos = Position::initial();
    EXPECT_EQ(pos.repetition_count(), 1);

    const Move shuffle[] = {{G1, F3}, {G8, F6}, {F3, G1}, {F6, G8}};
    for (int round = 0; round < 2; ++round) {
        for (const Move& m : shuffle) pos.make_move(m);
    }
    EXPECT_EQ(pos.repetition_count(), 3);
}

TEST(Position, InheritHistoryCarriesKeys) {
    Position earlier = Position::initial();
    Position later = Position::from_fen(earlier.to_fen());
    later.inherit_history(earlier);
    EXPECT_EQ(later.repetition_count(), 2);
}
