#pragma once

/// @file types.hpp
/// Square, color and piece-type vocabulary shared by the rules core and the
/// evolution layer.

#include <cstdint>
#include <string>
#include <string_view>

namespace evochess {

// ── Square ──────────────────────────────────────────────────────────────────
// Little-Endian Rank-File: a1=0, b1=1, ..., h1=7, a2=8, ..., h8=63
using Square = std::uint8_t;

inline constexpr Square kNoSquare = 64;

[[nodiscard]] constexpr int file_of(Square sq) noexcept {
    return sq & 7;
}
[[nodiscard]] constexpr int rank_of(Square sq) noexcept {
    return sq >> 3;
}
[[nodiscard]] constexpr Square make_square(int file, int rank) noexcept {
    return static_cast<Square>(rank * 8 + file);
}
[[nodiscard]] constexpr bool on_board(int file, int rank) noexcept {
    return file >= 0 && file < 8 && rank >= 0 && rank < 8;
}

/// King-move distance between two squares (used for aura radii).
[[nodiscard]] constexpr int chebyshev_distance(Square a, Square b) noexcept {
    int df = file_of(a) - file_of(b);
    int dr = rank_of(a) - rank_of(b);
    if (df < 0) df = -df;
    if (dr < 0) dr = -dr;
    return df > dr ? df : dr;
}

[[nodiscard]] inline std::string square_name(Square sq) {
    if (sq >= kNoSquare) return "-";
    return {static_cast<char>('a' + file_of(sq)), static_cast<char>('1' + rank_of(sq))};
}

/// Parse algebraic text ("e4"). Returns kNoSquare on failure.
[[nodiscard]] inline Square parse_square(std::string_view name) {
    if (name.size() != 2)
        return kNoSquare;
    int f = name[0] - 'a';
    int r = name[1] - '1';
    if (!on_board(f, r))
        return kNoSquare;
    return make_square(f, r);
}

// clang-format off
enum SquareConstants : Square {
    A1, B1, C1, D1, E1, F1, G1, H1,
    A2, B2, C2, D2, E2, F2, G2, H2,
    A3, B3, C3, D3, E3, F3, G3, H3,
    A4, B4, C4, D4, E4, F4, G4, H4,
    A5, B5, C5, D5, E5, F5, G5, H5,
    A6, B6, C6, D6, E6, F6, G6, H6,
    A7, B7, C7, D7, E7, F7, G7, H7,
    A8, B8, C8, D8, E8, F8, G8, H8,
};
// clang-format on

// ── Color ───────────────────────────────────────────────────────────────────
enum class Color : std::uint8_t { White = 0, Black = 1 };

[[nodiscard]] constexpr Color opposite(Color c) noexcept {
    return static_cast<Color>(static_cast<int>(c) ^ 1);
}
[[nodiscard]] constexpr int color_index(Color c) noexcept {
    return static_cast<int>(c);
}
/// +1 for white (towards rank 8), -1 for black.
[[nodiscard]] constexpr int forward_step(Color c) noexcept {
    return c == Color::White ? 1 : -1;
}
[[nodiscard]] constexpr int back_rank(Color c) noexcept {
    return c == Color::White ? 0 : 7;
}
[[nodiscard]] constexpr int promotion_rank(Color c) noexcept {
    return c == Color::White ? 7 : 0;
}

// ── PieceType ───────────────────────────────────────────────────────────────
enum class PieceType : std::uint8_t {
    None = 0,
    Pawn = 1,
    Knight = 2,
    Bishop = 3,
    Rook = 4,
    Queen = 5,
    King = 6,
};

inline constexpr int kNumPieceTypes = 6;

[[nodiscard]] constexpr int piece_index(PieceType pt) noexcept {
    return static_cast<int>(pt) - 1;  // Pawn=0 .. King=5
}

/// Lowercase letter for a piece type ('p','n','b','r','q','k'; ' ' for None).
[[nodiscard]] constexpr char piece_type_char(PieceType pt) noexcept {
    constexpr char kChars[] = {' ', 'p', 'n', 'b', 'r', 'q', 'k'};
    return kChars[static_cast<int>(pt)];
}

/// Case-insensitive inverse of piece_type_char. Returns None on failure.
[[nodiscard]] constexpr PieceType piece_type_from_char(char ch) noexcept {
    switch (ch) {
            // clang-format off
        case 'p': case 'P': return PieceType::Pawn;
        case 'n': case 'N': return PieceType::Knight;
        case 'b': case 'B': return PieceType::Bishop;
        case 'r': case 'R': return PieceType::Rook;
        case 'q': case 'Q': return PieceType::Queen;
        case 'k': case 'K': return PieceType::King;
        default:            return PieceType::None;
            // clang-format on
    }
}

// ── MoveFlag ────────────────────────────────────────────────────────────────
enum class MoveFlag : std::uint8_t {
    Normal = 0,
    DoublePawn = 1,
    EnPassant = 2,
    CastleKingside = 3,
    CastleQueenside = 4,
    Promotion = 5,
};

// ── CastlingRights ──────────────────────────────────────────────────────────
enum CastlingRights : std::uint8_t {
    kCastlingNone = 0,
    kWhiteKingside = 1,
    kWhiteQueenside = 2,
    kBlackKingside = 4,
    kBlackQueenside = 8,
    kWhiteBoth = kWhiteKingside | kWhiteQueenside,
    kBlackBoth = kBlackKingside | kBlackQueenside,
    kCastlingAll = kWhiteBoth | kBlackBoth,
};

[[nodiscard]] constexpr CastlingRights operator|(CastlingRights a, CastlingRights b) noexcept {
    return static_cast<CastlingRights>(static_cast<int>(a) | static_cast<int>(b));
}
[[nodiscard]] constexpr CastlingRights operator&(CastlingRights a, CastlingRights b) noexcept {
    return static_cast<CastlingRights>(static_cast<int>(a) & static_cast<int>(b));
}
constexpr CastlingRights& operator|=(CastlingRights& a, CastlingRights b) noexcept {
    a = a | b;
    return a;
}
constexpr CastlingRights& operator&=(CastlingRights& a, CastlingRights b) noexcept {
    a = a & b;
    return a;
}

}  // namespace evochess
