/// @file enhanced_movegen.cpp
/// Enhanced move generation.

#include <evochess/enhanced_movegen.hpp>

#include <evochess/log.hpp>
#include <evochess/movegen.hpp>
#include <evochess/patterns.hpp>

#include <algorithm>

namespace evochess {

namespace {

/// Sets a flag for the lifetime of the outermost generation pass.
class InFlightGuard {
   public:
    explicit InFlightGuard(bool& flag) noexcept : flag_(flag) { flag_ = true; }
    ~InFlightGuard() { flag_ = false; }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

   private:
    bool& flag_;
};

Bitboard both_kings(const Board& board) noexcept {
    return board.pieces(Color::White, PieceType::King) |
           board.pieces(Color::Black, PieceType::King);
}

/// Tag an existing oracle move to `to`, or append a synthetic one if the
/// destination keeps the king safe.
void add_destination(EnhancedMoveList& out, const Board& board, Square from, Square to,
                     std::string_view tag) {
    bool found = false;
    for (EnhancedMove& em : out) {
        if (em.move.from_sq != from || em.move.to_sq != to) continue;
        found = true;
        if (em.ability_id.empty()) em.ability_id = std::string(tag);
    }
    if (found) return;

    const Piece mover = board.piece_at(from);
    PieceType promo = PieceType::None;
    if (mover.type == PieceType::Pawn && rank_of(to) == promotion_rank(mover.color))
        promo = PieceType::Queen;
    if (!keeps_king_safe(board, from, to, promo)) return;

    Move m{from, to, promo == PieceType::None ? MoveFlag::Normal : MoveFlag::Promotion, promo};
    out.push_back({m, std::string(tag), true});
}

}  // namespace

bool keeps_king_safe(const Board& board, Square from, Square to, PieceType promotion) noexcept {
    const Piece mover = board.piece_at(from);
    if (mover.empty()) return false;
    Position scratch(apply_move_to_board(board, from, to, promotion), mover.color, kCastlingNone,
                   kNoSquare, 0, 1);
    return !scratch.is_in_check(mover.color);
}

EnhancedMoveList EnhancedMoveGenerator::generate(const Position& pos, const GeneratorContext& ctx,
                                                 std::optional<Square> square) {
    const bool reentered = in_flight_;
    std::optional<InFlightGuard> guard;
    if (reentered) {
        log::logger()->debug("EnhancedMoveGenerator: re-entered, using attached abilities only");
    } else {
        guard.emplace(in_flight_);
    }
    const bool consult_predicate = !reentered;

    if (square) {
        if (*square >= kNoSquare) return {};
        return for_square(pos, ctx, *square, consult_predicate);
    }

    EnhancedMoveList all;
    Bitboard ours = pos.board().occupied(pos.side_to_move());
    while (ours) {
        EnhancedMoveList part = for_square(pos, ctx, pop_lsb(ours), consult_predicate);
        all.insert(all.end(), part.begin(), part.end());
    }
    return all;
}

EnhancedMoveList EnhancedMoveGenerator::for_square(const Position& pos,
                                                   const GeneratorContext& ctx, Square from,
                                                   bool consult_predicate) const {
    const Board& board = pos.board();
    const Piece piece = board.piece_at(from);
    if (piece.empty() || piece.color != pos.side_to_move()) return {};

    const Bitboard kings = both_kings(board);
    Position scratch = pos;
    EnhancedMoveList out;
    for (const Move& m : movegen::legal_from(scratch, from)) {
        if (test_bit(kings, m.to_sq)) continue;
        out.push_back({m, {}, false});
    }

    const PieceEvolutionState* state = ctx.overlay.get(from);
    if (!state) return out;

    const Bitboard blocked = board.occupied(piece.color) | kings;

    if (state->is_move_restricted) {
        EnhancedMoveList restricted;
        for (Square to : squares_of(state->cached_modified_moves & ~blocked)) {
            auto base = std::find_if(out.begin(), out.end(), [&](const EnhancedMove& em) {
                return em.move.to_sq == to;
            });
            if (base != out.end()) {
                for (const EnhancedMove& em : out) {
                    if (em.move.to_sq == to) restricted.push_back(em);
                }
            } else {
                add_destination(restricted, board, from, to, kCachedMoveTag);
            }
        }
        return restricted;
    }
    if (state->abilities.empty() && state->cached_modified_moves == kEmptyBB) return out;

    lifecycle::TriggerContext trigger = ctx.trigger;
    trigger.from = from;
    const PieceUpgrades& upgrades = ctx.upgrades.get(piece.type);
    const patterns::PatternContext pattern_ctx{board, from, piece, state};

    for (const AbilityInstance& ability : state->abilities) {
        if (consult_predicate && !ctx.activity.is_ability_active(ability.id, piece.type, upgrades))
            continue;
        if (!lifecycle::can_trigger(ability, trigger)) continue;
        Bitboard candidates = patterns::destinations(ability.id, pattern_ctx) & ~blocked;
        for (Square to : squares_of(candidates)) {
            add_destination(out, board, from, to, ability.id);
        }
    }

    for (Square to : squares_of(state->cached_modified_moves & ~blocked)) {
        add_destination(out, board, from, to, kCachedMoveTag);
    }
    return out;
}

}  // namespace evochess
