/// @file effects.cpp
/// Ability effect handlers.

#include <evochess/effects.hpp>

#include <evochess/log.hpp>
#include <evochess/movegen.hpp>
#include <evochess/patterns.hpp>

#include <algorithm>
#include <utility>

namespace evochess {

namespace {

AbilityResult make_result(const AbilityInstance& a, std::string effect, std::string description,
                          double magnitude = 1.0, bool success = true) {
    AbilityResult r;
    r.ability_id = a.id;
    r.effect = std::move(effect);
    r.success = success;
    r.description = std::move(description);
    r.magnitude = magnitude;
    return r;
}

Bitboard both_kings(const Board& board) noexcept {
    return board.pieces(Color::White, PieceType::King) |
           board.pieces(Color::Black, PieceType::King);
}

/// The `n` lowest squares of `b`.
Bitboard take_lowest(Bitboard b, int n) noexcept {
    Bitboard out = kEmptyBB;
    while (b && n-- > 0) set_bit(out, pop_lsb(b));
    return out;
}

/// Evolved pieces of `side` within `radius` of `sq`.
Bitboard evolved_within(const EffectContext& ctx, const EvolutionMap& overlay, Color side,
                        int radius) noexcept {
    return radius_bb(ctx.square, radius) & ctx.board.occupied(side) & overlay.squares();
}

Bitboard allies_within(const EffectContext& ctx, const EvolutionMap& overlay, int radius) noexcept {
    return evolved_within(ctx, overlay, ctx.piece.color, radius);
}

Bitboard enemies_within(const EffectContext& ctx, const EvolutionMap& overlay, int radius) noexcept {
    return evolved_within(ctx, overlay, opposite(ctx.piece.color), radius);
}

template <typename Fn>
void for_each_state(EvolutionMap& overlay, Bitboard squares, Fn&& fn) {
    while (squares) {
        Square sq = pop_lsb(squares);
        if (PieceEvolutionState* s = overlay.get(sq)) fn(sq, *s);
    }
}

// ── Special handler builders ────────────────────────────────────────────────

using Handler = EffectExecutor::Handler;

/// Multiply one of the actor's own multipliers.
Handler self_multiplier(double Multipliers::*field, double factor, std::string effect) {
    return [field, factor, effect](const AbilityInstance& a, const EffectContext& ctx,
                                   EvolutionMap& overlay) {
        PieceEvolutionState& self = *overlay.get(ctx.square);
        self.bonus.*field *= factor;
        return make_result(a, effect, a.id + " on " + square_name(ctx.square), factor);
    };
}

/// Multiply a multiplier of every evolved ally within `radius`.
Handler ally_aura(double Multipliers::*field, double factor, int radius) {
    return [field, factor, radius](const AbilityInstance& a, const EffectContext& ctx,
                                   EvolutionMap& overlay) {
        Bitboard allies = allies_within(ctx, overlay, radius);
        for_each_state(overlay, allies, [&](Square, PieceEvolutionState& s) {
            s.bonus.*field *= factor;
        });
        AbilityResult r = make_result(
            a, "aura", std::to_string(popcount(allies)) + " allies within " +
                           std::to_string(radius) + " of " + square_name(ctx.square),
            factor);
        r.affected = allies;
        return r;
    };
}

/// Claim territory around the actor and raise its authority.
Handler territory(int radius, double authority) {
    return [radius, authority](const AbilityInstance& a, const EffectContext& ctx,
                               EvolutionMap& overlay) {
        PieceEvolutionState& self = *overlay.get(ctx.square);
        self.territory_control |= radius_bb(ctx.square, radius);
        self.bonus.authority_bonus *= authority;
        AbilityResult r = make_result(a, "territory",
                                      "controls radius " + std::to_string(radius) + " around " +
                                          square_name(ctx.square),
                                      authority);
        r.affected = radius_bb(ctx.square, radius);
        return r;
    };
}

/// Movement-only specials whose effect is the destinations they grant.
Handler no_stat_change(std::string effect) {
    return [effect](const AbilityInstance& a, const EffectContext& ctx, EvolutionMap&) {
        return make_result(a, effect, a.id + " from " + square_name(ctx.square));
    };
}

void restrict_piece(const Board& board, Square sq, PieceEvolutionState& s) {
    s.is_move_restricted = true;
    s.cached_modified_moves = restricted_destinations(board, sq);
}

AbilityResult rook_entrench(const AbilityInstance& a, const EffectContext& ctx,
                            EvolutionMap& overlay) {
    PieceEvolutionState& self = *overlay.get(ctx.square);
    self.is_entrenched = true;
    self.bonus.defensive_bonus = 2.5;
    self.territory_control =
        (rank_bb(rank_of(ctx.square)) | file_bb(file_of(ctx.square))) & ~square_bb(ctx.square);
    Bitboard lines = patterns::lines_through(PieceType::Rook, ctx.square);
    self.cached_modified_moves |= lines;
    AbilityResult r = make_result(a, "entrench", "rook entrenched on " + square_name(ctx.square),
                                  2.5);
    r.granted = lines;
    return r;
}

AbilityResult bishop_consecrate(const AbilityInstance& a, const EffectContext& ctx,
                                EvolutionMap& overlay) {
    PieceEvolutionState& self = *overlay.get(ctx.square);
    self.is_consecrated_source = true;
    self.consecration_radius = 2;
    self.bonus.ally_bonus *= 1.3;

    Bitboard allies = allies_within(ctx, overlay, 2);
    for_each_state(overlay, allies, [&](Square sq, PieceEvolutionState& s) {
        s.bonus.consecration_bonus *= 1.3;
        s.is_receiving_consecration = true;
        s.cached_modified_moves |= patterns::one_step_bonus(ctx.board, sq, ctx.piece.color);
    });
    AbilityResult r = make_result(
        a, "consecrate",
        "consecrated " + std::to_string(popcount(allies)) + " allies from " +
            square_name(ctx.square),
        1.3);
    r.affected = allies;
    r.granted = patterns::lines_through(PieceType::Bishop, ctx.square);
    return r;
}

AbilityResult queen_dominance(const AbilityInstance& a, const EffectContext& ctx,
                              EvolutionMap& overlay) {
    PieceEvolutionState& self = *overlay.get(ctx.square);
    self.bonus.authority_bonus *= 1.4;
    self.dominance_radius = 3;
    Bitboard lines = patterns::lines_through(PieceType::Queen, ctx.square);
    self.cached_modified_moves |= lines;

    Bitboard enemies = enemies_within(ctx, overlay, 3);
    for_each_state(overlay, enemies, [&](Square sq, PieceEvolutionState& s) {
        s.bonus.dominance_penalty *= 0.6;
        s.is_dominated = true;
        restrict_piece(ctx.board, sq, s);
    });
    AbilityResult r = make_result(
        a, "dominance",
        "dominates " + std::to_string(popcount(enemies)) + " enemies around " +
            square_name(ctx.square),
        1.4);
    r.affected = enemies;
    r.granted = lines;
    return r;
}

AbilityResult royal_decree(const AbilityInstance& a, const EffectContext& ctx,
                           EvolutionMap& overlay) {
    Bitboard allies = allies_within(ctx, overlay, 2);
    for_each_state(overlay, allies, [&](Square sq, PieceEvolutionState& s) {
        s.bonus.ally_bonus *= 1.2;
        s.cached_modified_moves |= patterns::one_step_bonus(ctx.board, sq, ctx.piece.color);
    });
    Bitboard enemies = enemies_within(ctx, overlay, 2);
    for_each_state(overlay, enemies, [&](Square sq, PieceEvolutionState& s) {
        restrict_piece(ctx.board, sq, s);
    });
    AbilityResult r = make_result(a, "decree",
                                  "commands " + std::to_string(popcount(allies)) +
                                      " allies, restricts " + std::to_string(popcount(enemies)) +
                                      " enemies",
                                  1.2);
    r.affected = allies | enemies;
    return r;
}

AbilityResult last_stand(const AbilityInstance& a, const EffectContext& ctx,
                         EvolutionMap& overlay) {
    const double ratio = ctx.board.count(ctx.piece.color) / 16.0;
    if (ratio > ctx.last_stand_threshold) {
        return make_result(a, "last_stand", "not outnumbered enough", 1.0, false);
    }
    overlay.get(ctx.square)->bonus.defensive_bonus *= 2.0;
    return make_result(a, "last_stand", "last stand on " + square_name(ctx.square), 2.0);
}

AbilityResult knight_dash(const AbilityInstance& a, const EffectContext& ctx,
                          EvolutionMap& overlay) {
    PieceEvolutionState& self = *overlay.get(ctx.square);
    Bitboard dests = knight_attacks(ctx.square) & ~ctx.board.occupied(ctx.piece.color) &
                     ~both_kings(ctx.board);
    self.cached_modified_moves = dests;
    AbilityResult r = make_result(a, "dash", "knight dash from " + square_name(ctx.square));
    r.granted = dests;
    return r;
}

AbilityResult breakthrough(const AbilityInstance& a, const EffectContext& ctx,
                           EvolutionMap& overlay) {
    PieceEvolutionState& self = *overlay.get(ctx.square);
    self.can_move_through = true;
    self.bonus.breakthrough_bonus *= 1.5;
    return make_result(a, "breakthrough", "breakthrough on " + square_name(ctx.square), 1.5);
}

AbilityResult phase_through(const AbilityInstance& a, const EffectContext& ctx,
                            EvolutionMap& overlay) {
    overlay.get(ctx.square)->can_move_through = true;
    return make_result(a, "phase", "moves through pieces from " + square_name(ctx.square));
}

}  // namespace

// ── Destination sets ────────────────────────────────────────────────────────

Bitboard restricted_destinations(const Board& board, Square sq) {
    const Piece p = board.piece_at(sq);
    if (p.empty()) return kEmptyBB;

    // Legal moves of the restricted side, whoever is to move on `board`.
    Position side_view(board, p.color, kCastlingNone, kNoSquare, 0, 1);
    Bitboard dests = kEmptyBB;
    for (const Move& m : movegen::legal_from(side_view, sq)) set_bit(dests, m.to_sq);
    dests &= ~both_kings(board);
    const int n = popcount(dests);
    if (n == 0) return kEmptyBB;

    const int keep = std::max(1, n / 2);
    const Bitboard quiet = dests & ~board.occupied_all();
    const Bitboard captures = dests & board.occupied_all();

    Bitboard out = take_lowest(quiet, keep * 4 / 5) | take_lowest(captures, (keep + 4) / 5);
    out = take_lowest(out, keep);
    if (popcount(out) < keep) out |= take_lowest(quiet & ~out, keep - popcount(out));
    if (popcount(out) < keep) out |= take_lowest(captures & ~out, keep - popcount(out));
    return out;
}

Bitboard standing_destinations(const Board& board, Square sq,
                               const PieceEvolutionState& state) noexcept {
    const Piece p = board.piece_at(sq);
    if (p.empty()) return kEmptyBB;

    Bitboard out = kEmptyBB;
    if (state.is_entrenched) out |= patterns::lines_through(PieceType::Rook, sq);
    if (state.is_consecrated_source) out |= patterns::lines_through(PieceType::Bishop, sq);
    if (state.dominance_radius > 0 && p.type == PieceType::Queen)
        out |= patterns::lines_through(PieceType::Queen, sq);
    if (state.is_receiving_consecration) out |= patterns::one_step_bonus(board, sq, p.color);
    if (p.type == PieceType::Knight && state.has_ability("knight-dash"))
        out |= knight_attacks(sq);
    return out & ~board.occupied(p.color) & ~both_kings(board);
}

void refresh_cached_moves(const Board& board, EvolutionMap& overlay) {
    const Bitboard kings = both_kings(board);
    for (Square sq : squares_of(overlay.squares())) {
        PieceEvolutionState* state = overlay.get(sq);
        const Piece p = board.piece_at(sq);
        if (p.empty()) continue;
        if (state->is_move_restricted) {
            state->cached_modified_moves = restricted_destinations(board, sq);
            continue;
        }
        Bitboard still_valid = state->cached_modified_moves & ~board.occupied(p.color) & ~kings;
        state->cached_modified_moves = still_valid | standing_destinations(board, sq, *state);
    }
}

bool is_valid_ability_target(const AbilityInstance& ability, const Board& board, Square from,
                             Square to) noexcept {
    if (from >= kNoSquare || to >= kNoSquare) return false;
    const Piece mover = board.piece_at(from);
    const Piece target = board.piece_at(to);
    if (mover.empty()) return false;

    if (ability.category == AbilityCategory::Capture &&
        (target.empty() || target.color == mover.color))
        return false;
    if (ability.category == AbilityCategory::Movement && !target.empty() &&
        target.color == mover.color)
        return false;

    if (ability.id == "knight-dash") return mover.type == PieceType::Knight;
    if (ability.id == "rook-entrench") return mover.type == PieceType::Rook;
    if (ability.id == "bishop-consecrate") return mover.type == PieceType::Bishop;
    if (ability.id == "queen-dominance") return mover.type == PieceType::Queen;
    return true;
}

// ── EffectExecutor ──────────────────────────────────────────────────────────

EffectExecutor::EffectExecutor() {
    using M = Multipliers;
    special_.emplace("knight-dash", knight_dash);
    special_.emplace("rook-entrench", rook_entrench);
    special_.emplace("bishop-consecrate", bishop_consecrate);
    special_.emplace("queen-dominance", queen_dominance);
    special_.emplace("royal-decree", royal_decree);
    special_.emplace("last-stand", last_stand);
    special_.emplace("breakthrough", breakthrough);
    special_.emplace("phase-through", phase_through);
    special_.emplace("teleport", no_stat_change("teleport"));
    special_.emplace("knight-leap", no_stat_change("leap"));

    special_.emplace("zone-control", territory(2, 1.5));
    special_.emplace("battlefield-command", territory(4, 2.0));
    special_.emplace("divine-authority", territory(5, 3.0));

    special_.emplace("protective-aura", ally_aura(&M::defensive_bonus, 1.3, 1));
    special_.emplace("heal-allies", ally_aura(&M::ally_bonus, 1.2, 2));
    special_.emplace("time-ward", ally_aura(&M::defensive_bonus, 1.4, 4));
    special_.emplace("command-aura", ally_aura(&M::ally_bonus, 1.5, 3));

    special_.emplace("immobilize-resist", self_multiplier(&M::defensive_bonus, 1.5, "defense"));
    special_.emplace("resilient-stance", self_multiplier(&M::defensive_bonus, 2.0, "defense"));
    special_.emplace("stealth-mode", self_multiplier(&M::defensive_bonus, 1.8, "defense"));
    special_.emplace("imperial-guard", self_multiplier(&M::defensive_bonus, 2.5, "defense"));
    special_.emplace("divine-protection", self_multiplier(&M::defensive_bonus, 10.0, "defense"));
    special_.emplace("berserker-rage", self_multiplier(&M::capture_bonus, 2.0, "capture_bonus"));
    special_.emplace("backstab", self_multiplier(&M::capture_bonus, 1.8, "capture_bonus"));
    special_.emplace("predict-moves", self_multiplier(&M::ally_bonus, 1.3, "insight"));
    special_.emplace("enhanced-vision", self_multiplier(&M::ally_bonus, 1.2, "insight"));
    special_.emplace("divine-intervention", self_multiplier(&M::ally_bonus, 3.0, "blessing"));

    special_.emplace("area-strike", [](const AbilityInstance& a, const EffectContext& ctx,
                                       EvolutionMap& overlay) {
        Bitboard enemies = enemies_within(ctx, overlay, 1);
        for_each_state(overlay, enemies, [](Square, PieceEvolutionState& s) {
            s.bonus.dominance_penalty *= 0.7;
        });
        AbilityResult r = make_result(a, "area_strike",
                                      "weakens " + std::to_string(popcount(enemies)) +
                                          " adjacent enemies",
                                      0.7);
        r.affected = enemies;
        return r;
    });
}

bool EffectExecutor::has_special_handler(std::string_view id) const {
    return special_.find(id) != special_.end();
}

AbilityResult EffectExecutor::execute(const AbilityInstance& ability, const EffectContext& ctx,
                                      EvolutionMap& overlay) const {
    PieceEvolutionState* self = overlay.get(ctx.square);
    if (!self) {
        log::logger()->error("EffectExecutor: no evolution entry on {} for {}",
                             square_name(ctx.square), ability.id);
        return make_result(ability, "none", "no evolved piece on " + square_name(ctx.square),
                           1.0, false);
    }

    switch (ability.category) {
        case AbilityCategory::Capture:
            return execute_capture(ability, ctx, *self);
        case AbilityCategory::Passive:
            return execute_passive(ability, *self);
        case AbilityCategory::Movement:
            return execute_movement(ability, ctx, *self);
        case AbilityCategory::Special:
            break;
    }

    auto it = special_.find(ability.id);
    if (it == special_.end()) {
        return make_result(ability, "none", "no handler for " + ability.id, 1.0, false);
    }
    AbilityResult r = it->second(ability, ctx, overlay);
    log::logger()->debug("EffectExecutor: {} -> {} ({})", ability.id, r.effect, r.description);
    return r;
}

AbilityResult EffectExecutor::execute_capture(const AbilityInstance& ability,
                                              const EffectContext& ctx,
                                              PieceEvolutionState& self) const {
    if (ctx.captured.empty())
        return make_result(ability, "capture_bonus", "no capture", 1.0, false);

    double factor = 1.0;
    if (ability.id == "enhanced-capture") {
        factor = 1.5;
    } else if (ability.id == "giant-slayer") {
        factor = 1.0 + piece_value(ctx.captured.type) / 10.0;
    } else if (ability.id == "first-strike") {
        factor = ctx.first_capture ? 2.0 : 1.2;
    } else if (ability.id == "chain-capture") {
        factor = ctx.previous_move_captured ? 1.8 : 1.0;
    }
    self.bonus.capture_bonus *= factor;
    return make_result(ability, "capture_bonus",
                       "captured " + std::string(1, ctx.captured.fen_char()) + " on " +
                           square_name(ctx.square),
                       factor);
}

AbilityResult EffectExecutor::execute_passive(const AbilityInstance& ability,
                                              PieceEvolutionState& self) const {
    double factor = 1.0;
    if (ability.id == "fortress-defense") {
        factor = 1.2;
        self.bonus.defensive_bonus *= factor;
    }
    return make_result(ability, "passive", ability.id, factor);
}

AbilityResult EffectExecutor::execute_movement(const AbilityInstance& ability,
                                               const EffectContext& ctx,
                                               PieceEvolutionState& self) const {
    const patterns::PatternContext pattern_ctx{ctx.board, ctx.square, ctx.piece, &self};
    Bitboard dests = patterns::destinations(ability.id, pattern_ctx) &
                     ~ctx.board.occupied(ctx.piece.color) & ~both_kings(ctx.board);
    // Reported only. The generator offers these again while the ability's gates stay open.
    AbilityResult r = make_result(ability, "extra_moves",
                                  std::to_string(popcount(dests)) + " destinations from " +
                                      square_name(ctx.square));
    r.granted = dests;
    return r;
}

}  // namespace evochess
