#pragma once

/// @file piece.hpp
/// Piece value object (color + type).

#include <evochess/types.hpp>

namespace evochess {

/// An immutable piece on the board (color + type).
struct Piece {
    Color color;
    PieceType type;

    [[nodiscard]] constexpr bool operator==(const Piece&) const noexcept = default;

    [[nodiscard]] constexpr bool empty() const noexcept { return type == PieceType::None; }

    /// FEN character ('P'..'K' for white, lowercase for black).
    [[nodiscard]] constexpr char fen_char() const noexcept {
        char c = piece_type_char(type);
        return color == Color::White && c != ' ' ? static_cast<char>(c - 'a' + 'A') : c;
    }

    /// Parse a FEN piece character. Returns Piece with PieceType::None on failure.
    [[nodiscard]] static constexpr Piece from_fen_char(char ch) noexcept {
        PieceType pt = piece_type_from_char(ch);
        if (pt == PieceType::None) return {Color::White, PieceType::None};
        return {(ch >= 'A' && ch <= 'Z') ? Color::White : Color::Black, pt};
    }
};

/// Sentinel value for "no piece".
inline constexpr Piece kNoPiece{Color::White, PieceType::None};

/// Material value used by ability effects and elegance scoring (P1 N3 B3 R5 Q9 K0).
[[nodiscard]] constexpr int piece_value(PieceType pt) noexcept {
    constexpr int kValues[] = {0, 1, 3, 3, 5, 9, 0};
    return kValues[static_cast<int>(pt)];
}

}  // namespace evochess
