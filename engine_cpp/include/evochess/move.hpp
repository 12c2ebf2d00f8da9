#pragma once

/// @file move.hpp
/// Oracle move representation and MoveList container.

#include <evochess/types.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace evochess {

/// A chess move as the rules oracle understands it.
struct Move {
    Square from_sq = 0;
    Square to_sq = 0;
    MoveFlag flag = MoveFlag::Normal;
    PieceType promotion = PieceType::None;

    [[nodiscard]] constexpr bool operator==(const Move&) const noexcept = default;

    /// Same endpoints and promotion piece, flag ignored.
    [[nodiscard]] constexpr bool same_path(Square from, Square to,
                                           PieceType promo = PieceType::None) const noexcept {
        return from_sq == from && to_sq == to && promotion == promo;
    }

    /// UCI long-algebraic notation, e.g. "e2e4", "e7e8q".
    [[nodiscard]] inline std::string uci() const {
        std::string s = square_name(from_sq) + square_name(to_sq);
        if (promotion != PieceType::None) s += piece_type_char(promotion);
        return s;
    }

    /// Parse a UCI move string (4 or 5 chars). Returns nullopt on failure.
    [[nodiscard]] static inline std::optional<Move> from_uci(std::string_view text) {
        if (text.size() != 4 && text.size() != 5)
            return std::nullopt;
        Square from = parse_square(text.substr(0, 2));
        Square to = parse_square(text.substr(2, 2));
        if (from == kNoSquare || to == kNoSquare)
            return std::nullopt;

        Move m{from, to, MoveFlag::Normal, PieceType::None};
        if (text.size() == 5) {
            PieceType pt = piece_type_from_char(text[4]);
            if (pt == PieceType::None || pt == PieceType::Pawn || pt == PieceType::King)
                return std::nullopt;
            m.flag = MoveFlag::Promotion;
            m.promotion = pt;
        }
        return m;
    }
};

// ── MoveList ────────────────────────────────────────────────────────────────

/// Fixed-capacity list of moves (max theoretical legal moves in chess ≈ 218).
class MoveList {
   public:
    static constexpr int kMaxMoves = 256;

    constexpr void push(Move m) noexcept { moves_[count_++] = m; }
    [[nodiscard]] constexpr int size() const noexcept { return count_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return count_ == 0; }
    constexpr void clear() noexcept { count_ = 0; }

    [[nodiscard]] constexpr Move& operator[](int i) noexcept { return moves_[i]; }
    [[nodiscard]] constexpr const Move& operator[](int i) const noexcept { return moves_[i]; }

    [[nodiscard]] constexpr Move* begin() noexcept { return moves_.data(); }
    [[nodiscard]] constexpr Move* end() noexcept { return moves_.data() + count_; }
    [[nodiscard]] constexpr const Move* begin() const noexcept { return moves_.data(); }
    [[nodiscard]] constexpr const Move* end() const noexcept { return moves_.data() + count_; }

    /// First move matching from/to/promotion, if any.
    [[nodiscard]] std::optional<Move> find(Square from, Square to,
                                           PieceType promo = PieceType::None) const noexcept {
        for (const Move& m : *this) {
            if (m.same_path(from, to, promo)) return m;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains_path(Square from, Square to) const noexcept {
        for (const Move& m : *this) {
            if (m.from_sq == from && m.to_sq == to) return true;
        }
        return false;
    }

   private:
    std::array<Move, kMaxMoves> moves_{};
    int count_ = 0;
};

}  // namespace evochess
