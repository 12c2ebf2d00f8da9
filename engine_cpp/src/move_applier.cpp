/// @file move_applier.cpp
/// Move application and overlay migration.

#include <evochess/move_applier.hpp>

#include <evochess/log.hpp>
#include <evochess/movegen.hpp>
#include <evochess/notation.hpp>

#include <stdexcept>
#include <utility>
#include <vector>

namespace evochess {

namespace {

ApplyResult fail(MoveError code, std::string reason) {
    ApplyResult r;
    r.failure = {code, std::move(reason)};
    return r;
}

bool is_promotion_piece(PieceType pt) noexcept {
    return pt == PieceType::Knight || pt == PieceType::Bishop || pt == PieceType::Rook ||
           pt == PieceType::Queen;
}

/// The rook's path for a castling move, keyed on the king's from-square rank.
std::pair<Square, Square> castling_rook_path(const Move& m) noexcept {
    const int rank = rank_of(m.from_sq);
    if (m.flag == MoveFlag::CastleKingside) return {make_square(7, rank), make_square(5, rank)};
    return {make_square(0, rank), make_square(3, rank)};
}

void drop_pawn_only_abilities(PieceEvolutionState& state) {
    std::erase_if(state.abilities,
                  [](const AbilityInstance& a) { return is_pawn_only_ability(a.id); });
}

}  // namespace

bool is_pawn_only_ability(std::string_view id) noexcept {
    return id == "enhanced-march" || id == "breakthrough" || id == "diagonal-move" ||
           id == "pawn-advance";
}

ApplyResult apply_move(Position& pos, EvolutionMap& overlay, const EnhancedMove& chosen,
                       PieceType promotion) {
    const Move& m = chosen.move;
    if (m.from_sq >= kNoSquare || m.to_sq >= kNoSquare || m.from_sq == m.to_sq)
        return fail(MoveError::InvalidSquare, "move " + m.uci() + " has no valid squares");

    const Board& board = pos.board();
    const Piece mover = board.piece_at(m.from_sq);
    const Piece target = board.piece_at(m.to_sq);

    // Checked before anything else is looked at or copied.
    if (target.type == PieceType::King)
        return fail(MoveError::TargetsKing, "cannot capture the king on " + square_name(m.to_sq));

    if (mover.empty()) {
        log::logger()->error("MoveApplier: no piece on {} for {}", square_name(m.from_sq),
                             m.uci());
        return fail(MoveError::InternalDesync, "no piece on " + square_name(m.from_sq));
    }
    if (mover.color != pos.side_to_move())
        return fail(MoveError::WrongSide, square_name(m.from_sq) + " is not the side to move");
    if (!target.empty() && target.color == mover.color)
        return fail(MoveError::FriendlyTarget, square_name(m.to_sq) + " holds a friendly piece");

    PieceType promo = PieceType::None;
    if (mover.type == PieceType::Pawn && rank_of(m.to_sq) == promotion_rank(mover.color)) {
        promo = promotion != PieceType::None   ? promotion
                : m.promotion != PieceType::None ? m.promotion
                                                 : PieceType::Queen;
        if (!is_promotion_piece(promo))
            return fail(MoveError::IllegalMove, "invalid promotion piece");
    }

    Position next = pos;
    EvolutionMap next_overlay = overlay;
    AppliedMove applied;
    applied.mover = mover;
    applied.ability_id = chosen.ability_id;
    applied.synthetic = chosen.synthetic;

    try {
        if (!chosen.synthetic) {
            Position scratch = pos;
            const MoveList legal = movegen::legal_from(scratch, m.from_sq);
            const auto played = legal.find(m.from_sq, m.to_sq, promo);
            if (!played) return fail(MoveError::IllegalMove, m.uci() + " is not legal here");

            applied.move = *played;
            applied.captured_on = m.to_sq;
            if (played->flag == MoveFlag::EnPassant)
                applied.captured_on = make_square(file_of(m.to_sq), rank_of(m.from_sq));
            applied.captured = board.piece_at(applied.captured_on);

            applied.san = notation::to_san(next, *played);
            next.make_move(*played);

            if (applied.is_capture()) next_overlay.erase(applied.captured_on);
            next_overlay.relocate(m.from_sq, m.to_sq, promo);
            if (played->flag == MoveFlag::CastleKingside ||
                played->flag == MoveFlag::CastleQueenside) {
                auto [rook_from, rook_to] = castling_rook_path(*played);
                next_overlay.relocate(rook_from, rook_to);
            }
        } else {
            applied.move = {m.from_sq, m.to_sq,
                            promo == PieceType::None ? MoveFlag::Normal : MoveFlag::Promotion,
                            promo};
            applied.captured = target;
            applied.captured_on = m.to_sq;

            const Color us = mover.color;
            Board after = apply_move_to_board(board, m.from_sq, m.to_sq, promo);
            CastlingRights castling = pos.castling() & detail::kCastleMask[m.from_sq] &
                                      detail::kCastleMask[m.to_sq];
            int halfmove = (mover.type == PieceType::Pawn || applied.is_capture())
                               ? 0
                               : pos.halfmove_clock() + 1;
            int fullmove = pos.fullmove_number() + (us == Color::Black ? 1 : 0);

            next = Position(std::move(after), opposite(us), castling, kNoSquare, halfmove,
                            fullmove);
            if (next.is_in_check(us))
                return fail(MoveError::LeavesKingInCheck, m.uci() + " leaves the king in check");
            next.validate();
            next.inherit_history(pos);

            applied.san = notation::synthetic_san(board, m.from_sq, m.to_sq, promo) +
                          notation::check_suffix(next);
            next_overlay.relocate(m.from_sq, m.to_sq, promo);
        }
    } catch (const std::invalid_argument& e) {
        log::logger()->warn("MoveApplier: rejected {}: {}", m.uci(), e.what());
        return fail(MoveError::InvalidPosition, e.what());
    }

    if (promo != PieceType::None) {
        if (PieceEvolutionState* state = next_overlay.get(m.to_sq))
            drop_pawn_only_abilities(*state);
    }

    // A relocated cached set was computed for the old square.
    if (PieceEvolutionState* state = next_overlay.get(m.to_sq))
        state->cached_modified_moves = kEmptyBB;

    pos = std::move(next);
    overlay = std::move(next_overlay);
    log::logger()->debug("MoveApplier: {} ({}){}", applied.san, applied.move.uci(),
                         applied.synthetic ? " synthetic" : "");

    ApplyResult result;
    result.applied = std::move(applied);
    return result;
}

}  // namespace evochess
