/// @file notation.cpp
/// SAN generation and resolution.

#include <evochess/movegen.hpp>
#include <evochess/notation.hpp>

#include <cctype>

namespace evochess::notation {

namespace {

char upper_letter(PieceType pt) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(piece_type_char(pt))));
}

bool is_capture(const Position& pos, Move m) {
    return m.flag == MoveFlag::EnPassant || !pos.board().is_empty(m.to_sq);
}

/// Disambiguation prefix for a non-pawn move: file if that's unique among rivals,
/// else rank, else both.
std::string disambiguation(const Position& pos, const MoveList& legal, Move m) {
    const PieceType pt = pos.board().piece_at(m.from_sq).type;
    bool rivals = false;
    bool same_file = false;
    bool same_rank = false;
    for (const Move& alt : legal) {
        if (alt.from_sq == m.from_sq || alt.to_sq != m.to_sq) continue;
        if (pos.board().piece_at(alt.from_sq).type != pt) continue;
        rivals = true;
        if (file_of(alt.from_sq) == file_of(m.from_sq)) same_file = true;
        if (rank_of(alt.from_sq) == rank_of(m.from_sq)) same_rank = true;
    }
    if (!rivals) return {};
    const std::string name = square_name(m.from_sq);
    if (!same_file) return name.substr(0, 1);
    if (!same_rank) return name.substr(1, 1);
    return name;
}

}  // namespace

std::string check_suffix(Position& pos) {
    if (!pos.is_in_check()) return {};
    return movegen::has_legal_move(pos) ? "+" : "#";
}

std::string to_san(Position& pos, Move m) {
    const Piece mover = pos.board().piece_at(m.from_sq);
    std::string san;

    if (m.flag == MoveFlag::CastleKingside) {
        san = "O-O";
    } else if (m.flag == MoveFlag::CastleQueenside) {
        san = "O-O-O";
    } else if (mover.type == PieceType::Pawn) {
        if (is_capture(pos, m)) {
            san += square_name(m.from_sq)[0];
            san += 'x';
        }
        san += square_name(m.to_sq);
        if (m.promotion != PieceType::None) {
            san += '=';
            san += upper_letter(m.promotion);
        }
    } else {
        MoveList legal = movegen::legal(pos);
        san += upper_letter(mover.type);
        san += disambiguation(pos, legal, m);
        if (is_capture(pos, m)) san += 'x';
        san += square_name(m.to_sq);
    }

    pos.make_move(m);
    san += check_suffix(pos);
    pos.unmake_move(m);
    return san;
}

std::string synthetic_san(const Board& board, Square from, Square to, PieceType promotion) {
    const Piece mover = board.piece_at(from);
    if (mover.empty()) return square_name(from) + "-" + square_name(to);

    const bool capture = !board.is_empty(to);
    std::string san;
    if (mover.type == PieceType::Pawn) {
        if (capture) {
            san += square_name(from)[0];
            san += 'x';
        }
        san += square_name(to);
        if (promotion != PieceType::None) {
            san += '=';
            san += upper_letter(promotion);
        }
        return san;
    }
    san += upper_letter(mover.type);
    if (capture) san += 'x';
    san += square_name(to);
    return san;
}

std::optional<Move> parse_san(Position& pos, std::string_view text) {
    std::string san;
    for (char ch : text) {
        if (ch == '+' || ch == '#' || ch == '!' || ch == '?' || ch == 'x' || ch == '=' ||
            ch == ' ')
            continue;
        san += ch;
    }
    if (san.empty()) return std::nullopt;

    MoveList legal = movegen::legal(pos);

    if (san == "O-O" || san == "0-0" || san == "O-O-O" || san == "0-0-0") {
        MoveFlag want = san.size() == 3 ? MoveFlag::CastleKingside : MoveFlag::CastleQueenside;
        for (const Move& m : legal) {
            if (m.flag == want) return m;
        }
        return std::nullopt;
    }

    PieceType piece = PieceType::Pawn;
    if (std::isupper(static_cast<unsigned char>(san.front())) && san.front() != 'O') {
        piece = piece_type_from_char(san.front());
        if (piece == PieceType::None || piece == PieceType::Pawn) return std::nullopt;
        san.erase(0, 1);
    }

    PieceType promotion = PieceType::None;
    if (piece == PieceType::Pawn && !san.empty() &&
        std::isalpha(static_cast<unsigned char>(san.back())) &&
        std::isupper(static_cast<unsigned char>(san.back()))) {
        promotion = piece_type_from_char(san.back());
        if (promotion == PieceType::None || promotion == PieceType::Pawn ||
            promotion == PieceType::King)
            return std::nullopt;
        san.pop_back();
    }

    if (san.size() < 2) return std::nullopt;
    const Square to = parse_square(std::string_view(san).substr(san.size() - 2));
    if (to == kNoSquare) return std::nullopt;
    const std::string hint = san.substr(0, san.size() - 2);
    if (hint.size() > 2) return std::nullopt;

    std::optional<Move> found;
    for (const Move& m : legal) {
        if (m.to_sq != to || m.promotion != promotion) continue;
        if (pos.board().piece_at(m.from_sq).type != piece) continue;
        bool ok = true;
        for (char h : hint) {
            if (h >= 'a' && h <= 'h') {
                ok = ok && file_of(m.from_sq) == h - 'a';
            } else if (h >= '1' && h <= '8') {
                ok = ok && rank_of(m.from_sq) == h - '1';
            } else {
                ok = false;
            }
        }
        if (!ok) continue;
        if (found) return std::nullopt;
        found = m;
    }
    return found;
}

}  // namespace evochess::notation
