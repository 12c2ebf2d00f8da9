#pragma once

/// @file board.hpp
/// Bitboard-based chess board with mailbox redundancy.

#include <evochess/bitboard.hpp>
#include <evochess/piece.hpp>
#include <evochess/types.hpp>

namespace evochess {

/// Bitboard-based board representation.
///
/// Maintains 12 piece bitboards (2 colors × 6 piece types),
/// aggregate occupancy bitboards, and a 64-element mailbox
/// for O(1) piece-at-square lookups. The mailbox is the
/// array-of-optional-piece view used for manual reconstruction.
class Board {
public:
    Board() noexcept { clear(); }

    // ── Piece placement ─────────────────────────────────────────────────

    /// Place a piece on the board. Square must be empty.
    void put_piece(Square sq, Piece p) noexcept {
        int ci = color_index(p.color);
        int pi = piece_index(p.type);
        set_bit(pieces_[ci][pi], sq);
        set_bit(occupied_[ci], sq);
        set_bit(occupied_all_, sq);
        mailbox_[sq] = p;
    }

    /// Remove whatever stands on `sq` (no-op on an empty square).
    void remove_piece(Square sq) noexcept {
        Piece p = mailbox_[sq];
        if (p.empty()) return;
        int ci = color_index(p.color);
        int pi = piece_index(p.type);
        clear_bit(pieces_[ci][pi], sq);
        clear_bit(occupied_[ci], sq);
        clear_bit(occupied_all_, sq);
        mailbox_[sq] = kNoPiece;
    }

    /// Move a piece from one square to another. `from` must be occupied, `to` must be empty.
    void move_piece(Square from, Square to) noexcept {
        Piece p = mailbox_[from];
        remove_piece(from);
        put_piece(to, p);
    }

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] Piece piece_at(Square sq) const noexcept { return mailbox_[sq]; }

    [[nodiscard]] bool is_empty(Square sq) const noexcept { return mailbox_[sq].empty(); }

    [[nodiscard]] Bitboard pieces(Color c, PieceType pt) const noexcept {
        return pieces_[color_index(c)][piece_index(pt)];
    }

    [[nodiscard]] Bitboard occupied(Color c) const noexcept {
        return occupied_[color_index(c)];
    }

    [[nodiscard]] Bitboard occupied_all() const noexcept { return occupied_all_; }

    /// Square of the king for a given color (kNoSquare if absent).
    [[nodiscard]] Square king_square(Color c) const noexcept {
        Bitboard k = pieces(c, PieceType::King);
        return k ? lsb(k) : kNoSquare;
    }

    [[nodiscard]] int count(Color c) const noexcept { return popcount(occupied(c)); }
    [[nodiscard]] int count() const noexcept { return popcount(occupied_all_); }

    // ── Bulk operations ─────────────────────────────────────────────────

    void clear() noexcept {
        for (auto& color_pieces : pieces_) {
            for (auto& bb : color_pieces) {
                bb = kEmptyBB;
            }
        }
        occupied_[0] = kEmptyBB;
        occupied_[1] = kEmptyBB;
        occupied_all_ = kEmptyBB;
        for (auto& sq : mailbox_) {
            sq = kNoPiece;
        }
    }

    [[nodiscard]] bool operator==(const Board& other) const noexcept {
        for (int sq = 0; sq < 64; ++sq) {
            if (mailbox_[sq] != other.mailbox_[sq]) return false;
        }
        return true;
    }

    // ── Factory ─────────────────────────────────────────────────────────

    /// Standard starting position.
    [[nodiscard]] static Board initial() noexcept;

private:
    Bitboard pieces_[2][6]{};   // [color_index][piece_index]
    Bitboard occupied_[2]{};    // [color_index]
    Bitboard occupied_all_{};
    Piece mailbox_[64]{};
};

/// Pure board transform: lift the piece on `from`, drop any piece on `to`, place the
/// mover (or its promoted form) on `to`. The input board is not modified.
/// A `promotion` of None keeps the mover's type.
[[nodiscard]] Board apply_move_to_board(const Board& board, Square from, Square to,
                                        PieceType promotion = PieceType::None) noexcept;

}  // namespace evochess
