#pragma once

/// @file position.hpp
/// Complete chess position: board + side-to-move + castling + en passant + clocks.
///
/// This is the rules oracle's state. make_move / unmake_move keep an internal
/// history stack; positions reconstructed by hand (ability moves the oracle
/// cannot express) are built through the field constructor and validate().

#include <evochess/board.hpp>
#include <evochess/move.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace evochess {

// ── Constants ───────────────────────────────────────────────────────────────

inline constexpr std::string_view kStartingFen =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

// ── Undo info ───────────────────────────────────────────────────────────────

/// Snapshot saved before each move so we can undo it.
struct UndoInfo {
    CastlingRights castling;
    Square en_passant;
    int halfmove_clock;
    Piece captured;  ///< kNoPiece if no capture
};

/// The fields that decide repetition (board, side, castling, en passant).
struct RepetitionKey {
    Board board;
    Color side;
    CastlingRights castling;
    Square en_passant;

    [[nodiscard]] bool operator==(const RepetitionKey&) const noexcept = default;
};

// ── Castling rights update table ────────────────────────────────────────────
/// For each square, the castling rights to PRESERVE when that square is
/// involved as from or to in a move: `castling &= kCastleMask[from] & kCastleMask[to]`

namespace detail {

constexpr CastlingRights castling_mask_for(int sq) noexcept {
    constexpr auto all = static_cast<int>(kCastlingAll);
    switch (sq) {
        case A1:
            return static_cast<CastlingRights>(all & ~kWhiteQueenside);
        case H1:
            return static_cast<CastlingRights>(all & ~kWhiteKingside);
        case E1:
            return static_cast<CastlingRights>(all & ~kWhiteBoth);
        case A8:
            return static_cast<CastlingRights>(all & ~kBlackQueenside);
        case H8:
            return static_cast<CastlingRights>(all & ~kBlackKingside);
        case E8:
            return static_cast<CastlingRights>(all & ~kBlackBoth);
        default:
            return kCastlingAll;
    }
}

constexpr auto make_castling_masks() noexcept {
    std::array<CastlingRights, 64> masks{};
    for (int i = 0; i < 64; ++i) {
        masks[i] = castling_mask_for(i);
    }
    return masks;
}

inline constexpr auto kCastleMask = make_castling_masks();

}  // namespace detail

// ── Position ────────────────────────────────────────────────────────────────

class Position {
   public:
    /// Construct from explicit fields. No validation; call validate() when the
    /// fields come from untrusted or hand-built input.
    Position(Board board, Color side, CastlingRights castling, Square ep, int halfmove,
             int fullmove);

    /// Default: empty board, white to move, no castling, no EP.
    Position();

    // ── Factory ─────────────────────────────────────────────────────────

    [[nodiscard]] static Position initial();

    /// Parse and validate a FEN string. Throws std::invalid_argument on bad input.
    [[nodiscard]] static Position from_fen(std::string_view fen);

    // ── Serialization ───────────────────────────────────────────────────

    [[nodiscard]] std::string to_fen() const;

    // ── Move operations ─────────────────────────────────────────────────

    /// Apply a move, pushing undo state onto the history stack.
    void make_move(Move m);

    /// Undo the last make_move.
    void unmake_move(Move m);

    // ── Accessors ───────────────────────────────────────────────────────

    [[nodiscard]] const Board& board() const noexcept { return board_; }
    [[nodiscard]] Color side_to_move() const noexcept { return side_to_move_; }
    [[nodiscard]] CastlingRights castling() const noexcept { return castling_; }
    [[nodiscard]] Square en_passant() const noexcept { return en_passant_; }
    [[nodiscard]] int halfmove_clock() const noexcept { return halfmove_clock_; }
    [[nodiscard]] int fullmove_number() const noexcept { return fullmove_number_; }

    // ── Attack queries ──────────────────────────────────────────────────

    /// Is `sq` attacked by any piece of color `by`?
    [[nodiscard]] bool is_square_attacked(Square sq, Color by) const noexcept;

    /// Bitboard of `by` pieces attacking `sq`.
    [[nodiscard]] Bitboard attackers_of(Square sq, Color by) const noexcept;

    /// Is the side-to-move's king in check?
    [[nodiscard]] bool is_in_check() const noexcept;

    /// Is the specified color's king in check? False when that king is absent.
    [[nodiscard]] bool is_in_check(Color c) const noexcept;

    // ── Validation ──────────────────────────────────────────────────────

    /// Throws std::invalid_argument unless each side has exactly one king, no
    /// pawn stands on a back rank and the side not to move is not in check.
    void validate() const;

    // ── Repetition ──────────────────────────────────────────────────────

    /// How many times the current position has occurred (including current).
    [[nodiscard]] int repetition_count() const;

    /// Carry the repetition history of `earlier` into this position, as if this
    /// position had been reached by a move from it.
    void inherit_history(const Position& earlier);

   private:
    [[nodiscard]] RepetitionKey key() const noexcept {
        return {board_, side_to_move_, castling_, en_passant_};
    }

    Board board_;
    Color side_to_move_ = Color::White;
    CastlingRights castling_ = kCastlingNone;
    Square en_passant_ = kNoSquare;
    int halfmove_clock_ = 0;
    int fullmove_number_ = 1;
    std::vector<UndoInfo> history_;
    std::vector<RepetitionKey> key_history_;  ///< All keys since load (for repetition)
};

}  // namespace evochess
