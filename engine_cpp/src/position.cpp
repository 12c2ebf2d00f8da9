/// @file position.cpp
/// Position implementation: constructors, FEN, make/unmake, attacks, validation.

#include <evochess/position.hpp>

#include <charconv>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace evochess {

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

auto split_spaces(std::string_view sv) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t i = 0;
    while (i < sv.size()) {
        while (i < sv.size() && sv[i] == ' ') ++i;
        if (i >= sv.size()) break;
        std::size_t start = i;
        while (i < sv.size() && sv[i] != ' ') ++i;
        parts.push_back(sv.substr(start, i - start));
    }
    return parts;
}

int parse_int(std::string_view sv, int min_val) {
    int val = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), val);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::invalid_argument("Invalid integer in FEN: " + std::string(sv));
    }
    if (val < min_val) {
        throw std::invalid_argument("Integer out of range in FEN: " + std::string(sv));
    }
    return val;
}

Board parse_placement(std::string_view placement) {
    Board board;
    int rank = 7;
    int file = 0;

    for (char ch : placement) {
        if (ch == '/') {
            if (file != 8 || rank == 0) {
                throw std::invalid_argument("Invalid FEN placement: " + std::string(placement));
            }
            --rank;
            file = 0;
        } else if (ch >= '1' && ch <= '8') {
            file += ch - '0';
            if (file > 8) {
                throw std::invalid_argument("Invalid FEN rank width: " + std::string(placement));
            }
        } else {
            Piece p = Piece::from_fen_char(ch);
            if (p.empty()) {
                throw std::invalid_argument(std::string("Invalid FEN piece char: ") + ch);
            }
            if (file >= 8) {
                throw std::invalid_argument("Invalid FEN rank width: " + std::string(placement));
            }
            board.put_piece(make_square(file, rank), p);
            ++file;
        }
    }
    if (rank != 0 || file != 8) {
        throw std::invalid_argument("Invalid FEN placement: " + std::string(placement));
    }
    return board;
}

CastlingRights parse_castling(std::string_view field) {
    CastlingRights castling = kCastlingNone;
    if (field == "-") return castling;
    for (char ch : field) {
        switch (ch) {
            case 'K':
                castling |= kWhiteKingside;
                break;
            case 'Q':
                castling |= kWhiteQueenside;
                break;
            case 'k':
                castling |= kBlackKingside;
                break;
            case 'q':
                castling |= kBlackQueenside;
                break;
            default:
                throw std::invalid_argument(std::string("Invalid castling char in FEN: ") + ch);
        }
    }
    return castling;
}

/// Drop castling rights whose king or rook is no longer on its home square.
CastlingRights sanitize_castling(const Board& b, CastlingRights cr) {
    auto home = [&](Square sq, Color c, PieceType pt) { return b.piece_at(sq) == Piece{c, pt}; };
    if (!home(E1, Color::White, PieceType::King)) cr &= kBlackBoth;
    if (!home(E8, Color::Black, PieceType::King)) cr &= kWhiteBoth;
    if (!home(H1, Color::White, PieceType::Rook)) cr &= detail::kCastleMask[H1];
    if (!home(A1, Color::White, PieceType::Rook)) cr &= detail::kCastleMask[A1];
    if (!home(H8, Color::Black, PieceType::Rook)) cr &= detail::kCastleMask[H8];
    if (!home(A8, Color::Black, PieceType::Rook)) cr &= detail::kCastleMask[A8];
    return cr;
}

}  // namespace

// ── Constructors ────────────────────────────────────────────────────────────

Position::Position(Board board, Color side, CastlingRights castling, Square ep, int halfmove,
                   int fullmove)
    : board_(board),
      side_to_move_(side),
      castling_(sanitize_castling(board, castling)),
      en_passant_(ep),
      halfmove_clock_(halfmove),
      fullmove_number_(fullmove) {
    key_history_.push_back(key());
}

Position::Position() : Position(Board{}, Color::White, kCastlingNone, kNoSquare, 0, 1) {}

// ── Factory ─────────────────────────────────────────────────────────────────

Position Position::initial() {
    return from_fen(kStartingFen);
}

Position Position::from_fen(std::string_view fen) {
    auto parts = split_spaces(fen);
    if (parts.size() < 4 || parts.size() > 6) {
        throw std::invalid_argument("Invalid FEN (need 4-6 fields): " + std::string(fen));
    }

    Board board = parse_placement(parts[0]);

    Color side = Color::White;
    if (parts[1] == "w") {
        side = Color::White;
    } else if (parts[1] == "b") {
        side = Color::Black;
    } else {
        throw std::invalid_argument("Invalid FEN side-to-move: " + std::string(parts[1]));
    }

    CastlingRights castling = parse_castling(parts[2]);

    Square ep = kNoSquare;
    if (parts[3] != "-") {
        ep = parse_square(parts[3]);
        if (ep == kNoSquare || (rank_of(ep) != 2 && rank_of(ep) != 5)) {
            throw std::invalid_argument("Invalid FEN en-passant square: " +
                                        std::string(parts[3]));
        }
    }

    int halfmove = (parts.size() > 4) ? parse_int(parts[4], 0) : 0;
    int fullmove = (parts.size() > 5) ? parse_int(parts[5], 1) : 1;

    Position pos(board, side, castling, ep, halfmove, fullmove);
    pos.validate();
    return pos;
}

// ── Serialization ───────────────────────────────────────────────────────────

std::string Position::to_fen() const {
    std::string fen;
    fen.reserve(80);

    for (int rank = 7; rank >= 0; --rank) {
        if (rank < 7) fen += '/';
        int empty = 0;
        for (int file = 0; file < 8; ++file) {
            Piece p = board_.piece_at(make_square(file, rank));
            if (p.empty()) {
                ++empty;
                continue;
            }
            if (empty > 0) {
                fen += static_cast<char>('0' + empty);
                empty = 0;
            }
            fen += p.fen_char();
        }
        if (empty > 0) fen += static_cast<char>('0' + empty);
    }

    fen += side_to_move_ == Color::White ? " w " : " b ";

    if (castling_ == kCastlingNone) {
        fen += '-';
    } else {
        if (castling_ & kWhiteKingside) fen += 'K';
        if (castling_ & kWhiteQueenside) fen += 'Q';
        if (castling_ & kBlackKingside) fen += 'k';
        if (castling_ & kBlackQueenside) fen += 'q';
    }

    fen += ' ';
    fen += en_passant_ == kNoSquare ? std::string("-") : square_name(en_passant_);
    fen += ' ' + std::to_string(halfmove_clock_) + ' ' + std::to_string(fullmove_number_);
    return fen;
}

// ── Move operations ─────────────────────────────────────────────────────────

void Position::make_move(Move m) {
    Piece piece = board_.piece_at(m.from_sq);

    Square capture_sq = m.to_sq;
    if (m.flag == MoveFlag::EnPassant) {
        capture_sq = make_square(file_of(m.to_sq), rank_of(m.from_sq));
    }
    Piece captured = board_.piece_at(capture_sq);

    history_.push_back({castling_, en_passant_, halfmove_clock_, captured});

    board_.remove_piece(m.from_sq);
    board_.remove_piece(capture_sq);

    Piece placed = piece;
    if (m.flag == MoveFlag::Promotion && m.promotion != PieceType::None) {
        placed.type = m.promotion;
    }
    board_.put_piece(m.to_sq, placed);

    // Slide the rook for castling
    if (m.flag == MoveFlag::CastleKingside || m.flag == MoveFlag::CastleQueenside) {
        int r = rank_of(m.from_sq);
        bool king_side = m.flag == MoveFlag::CastleKingside;
        board_.move_piece(make_square(king_side ? 7 : 0, r), make_square(king_side ? 5 : 3, r));
    }

    en_passant_ = kNoSquare;
    if (m.flag == MoveFlag::DoublePawn) {
        en_passant_ =
            make_square(file_of(m.from_sq), (rank_of(m.from_sq) + rank_of(m.to_sq)) / 2);
    }

    castling_ &= detail::kCastleMask[m.from_sq] & detail::kCastleMask[m.to_sq];

    if (piece.type == PieceType::Pawn || !captured.empty()) {
        halfmove_clock_ = 0;
    } else {
        ++halfmove_clock_;
    }
    if (side_to_move_ == Color::Black) {
        ++fullmove_number_;
    }
    side_to_move_ = opposite(side_to_move_);

    key_history_.push_back(key());
}

void Position::unmake_move(Move m) {
    key_history_.pop_back();

    UndoInfo undo = history_.back();
    history_.pop_back();

    side_to_move_ = opposite(side_to_move_);
    if (side_to_move_ == Color::Black) {
        --fullmove_number_;
    }

    Piece placed = board_.piece_at(m.to_sq);
    Piece original = placed;
    if (m.flag == MoveFlag::Promotion) {
        original.type = PieceType::Pawn;
    }

    board_.remove_piece(m.to_sq);
    board_.put_piece(m.from_sq, original);

    if (!undo.captured.empty()) {
        Square capture_sq = m.flag == MoveFlag::EnPassant
                                ? make_square(file_of(m.to_sq), rank_of(m.from_sq))
                                : m.to_sq;
        board_.put_piece(capture_sq, undo.captured);
    }

    if (m.flag == MoveFlag::CastleKingside || m.flag == MoveFlag::CastleQueenside) {
        int r = rank_of(m.from_sq);
        bool king_side = m.flag == MoveFlag::CastleKingside;
        board_.move_piece(make_square(king_side ? 5 : 3, r), make_square(king_side ? 7 : 0, r));
    }

    castling_ = undo.castling;
    en_passant_ = undo.en_passant;
    halfmove_clock_ = undo.halfmove_clock;
}

// ── Attack queries ──────────────────────────────────────────────────────────

Bitboard Position::attackers_of(Square sq, Color by) const noexcept {
    const Bitboard occ = board_.occupied_all();
    const Bitboard diag =
        board_.pieces(by, PieceType::Bishop) | board_.pieces(by, PieceType::Queen);
    const Bitboard straight =
        board_.pieces(by, PieceType::Rook) | board_.pieces(by, PieceType::Queen);

    // A `by` pawn attacks `sq` iff it sits where an opposite-colored pawn on `sq` would attack.
    return (pawn_attacks(opposite(by), sq) & board_.pieces(by, PieceType::Pawn)) |
           (knight_attacks(sq) & board_.pieces(by, PieceType::Knight)) |
           (king_attacks(sq) & board_.pieces(by, PieceType::King)) |
           (bishop_attacks(sq, occ) & diag) | (rook_attacks(sq, occ) & straight);
}

bool Position::is_square_attacked(Square sq, Color by) const noexcept {
    return attackers_of(sq, by) != kEmptyBB;
}

bool Position::is_in_check() const noexcept {
    return is_in_check(side_to_move_);
}

bool Position::is_in_check(Color c) const noexcept {
    Square k = board_.king_square(c);
    return k != kNoSquare && is_square_attacked(k, opposite(c));
}

// ── Validation ──────────────────────────────────────────────────────────────

void Position::validate() const {
    for (Color c : {Color::White, Color::Black}) {
        if (popcount(board_.pieces(c, PieceType::King)) != 1) {
            throw std::invalid_argument("Position must have exactly one king per side");
        }
        if (board_.pieces(c, PieceType::Pawn) & (kRank1 | kRank8)) {
            throw std::invalid_argument("Pawn on a back rank");
        }
    }
    if (is_in_check(opposite(side_to_move_))) {
        throw std::invalid_argument("Side not to move is in check");
    }
}

// ── Repetition ──────────────────────────────────────────────────────────────

int Position::repetition_count() const {
    const RepetitionKey current = key();
    int count = 0;
    for (const auto& k : key_history_) {
        if (k == current) ++count;
    }
    return count;
}

void Position::inherit_history(const Position& earlier) {
    std::vector<RepetitionKey> keys = earlier.key_history_;
    keys.push_back(key());
    key_history_ = std::move(keys);
}

}  // namespace evochess
