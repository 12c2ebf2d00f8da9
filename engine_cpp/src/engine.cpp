/// @file engine.cpp
/// EvolutionEngine implementation.

#include <evochess/engine.hpp>

#include <evochess/elegance.hpp>
#include <evochess/log.hpp>
#include <evochess/move_applier.hpp>
#include <evochess/movegen.hpp>
#include <evochess/notation.hpp>
#include <evochess/patterns.hpp>
#include <evochess/rules.hpp>

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace evochess {

namespace {

constexpr std::string_view kKnightDash = "knight-dash";
constexpr std::string_view kRookEntrench = "rook-entrench";
constexpr std::string_view kBishopConsecrate = "bishop-consecrate";

/// Fired by StationaryTracker thresholds, never by moving.
bool is_stationary_ability(std::string_view id) noexcept {
    return id == kRookEntrench || id == kBishopConsecrate;
}

/// Abilities that fire only when the played move came from them.
bool fires_on_use(const AbilityInstance& a) noexcept {
    return a.category == AbilityCategory::Movement || patterns::has_geometry(a.id);
}

}  // namespace

EvolutionEngine::EvolutionEngine(EngineConfig config)
    : config_(std::move(config)), activity_(std::make_shared<AttachedActivityProvider>()) {
    if (!config_.clock) config_.clock = steady_seconds;
    log::set_level(config_.log_level);
    reset();
}

// ── Position ────────────────────────────────────────────────────────────────

void EvolutionEngine::begin_game(Position pos) {
    position_ = std::move(pos);
    history_.clear();
    pending_dash_.reset();
    dash_resume_.reset();
    tracker_.reset();
}

void EvolutionEngine::reset() {
    overlay_.clear();
    ply_ = 0;
    start_time_ = config_.clock();
    try {
        begin_game(Position::from_fen(config_.starting_fen));
    } catch (const std::invalid_argument& e) {
        log::logger()->error("EvolutionEngine: bad starting FEN '{}': {}", config_.starting_fen,
                             e.what());
        begin_game(Position::initial());
    }
    log::logger()->info("EvolutionEngine: new game {}", position_.to_fen());
}

bool EvolutionEngine::load_from_fen(std::string_view fen) {
    Position next;
    try {
        next = Position::from_fen(fen);
    } catch (const std::invalid_argument& e) {
        log::logger()->warn("EvolutionEngine: rejected FEN '{}': {}", fen, e.what());
        return false;
    }

    EvolutionMap kept;
    for (Square sq : squares_of(overlay_.squares())) {
        const PieceEvolutionState* state = overlay_.get(sq);
        const Piece p = next.board().piece_at(sq);
        if (!p.empty() && p.type == state->piece_type) kept.set(sq, *state);
    }
    overlay_ = std::move(kept);
    begin_game(std::move(next));
    if (config_.refresh_cached_moves) refresh_cached_moves(position_.board(), overlay_);
    log::logger()->info("EvolutionEngine: loaded {} ({} evolved pieces kept)", fen,
                        overlay_.size());
    return true;
}

// ── Moves ───────────────────────────────────────────────────────────────────

MoveResult EvolutionEngine::reject(MoveError code, std::string reason) const {
    log::logger()->warn("EvolutionEngine: move rejected ({}): {}", to_string(code), reason);
    MoveResult r;
    r.error = code;
    r.reason = std::move(reason);
    r.fen = position_.to_fen();
    return r;
}

MoveResult EvolutionEngine::make_move(std::string_view from, std::string_view to,
                                      const MoveOptions& options) {
    Square f = parse_square(from);
    Square t = parse_square(to);
    if (f == kNoSquare || t == kNoSquare)
        return reject(MoveError::InvalidSquare,
                      "cannot parse squares '" + std::string(from) + "' '" + std::string(to) + "'");
    return make_move(f, t, options);
}

MoveResult EvolutionEngine::make_move_from_notation(std::string_view text) {
    if (auto uci = Move::from_uci(text)) {
        MoveOptions options;
        options.promotion = uci->promotion;
        return make_move(uci->from_sq, uci->to_sq, options);
    }
    Position scratch = position_;
    if (auto m = notation::parse_san(scratch, text)) {
        MoveOptions options;
        options.promotion = m->promotion;
        return make_move(m->from_sq, m->to_sq, options);
    }
    return reject(MoveError::InvalidNotation, "cannot read '" + std::string(text) + "'");
}

MoveResult EvolutionEngine::make_move(Square from, Square to, const MoveOptions& options) {
    Position saved_position = position_;
    EvolutionMap saved_overlay = overlay_;
    std::vector<HistoryEntry> saved_history = history_;
    StationaryTracker saved_tracker = tracker_;
    const int saved_ply = ply_;
    const std::optional<Square> saved_dash = pending_dash_;
    std::optional<Position> saved_resume = dash_resume_;

    try {
        return play(from, to, options);
    } catch (const std::exception& e) {
        position_ = std::move(saved_position);
        overlay_ = std::move(saved_overlay);
        history_ = std::move(saved_history);
        tracker_ = saved_tracker;
        ply_ = saved_ply;
        pending_dash_ = saved_dash;
        dash_resume_ = std::move(saved_resume);
        log::logger()->error("EvolutionEngine: move {}{} rolled back: {}", square_name(from),
                             square_name(to), e.what());
        return reject(MoveError::InternalDesync, e.what());
    }
}

MoveResult EvolutionEngine::play(Square from, Square to, const MoveOptions& options) {
    if (from >= kNoSquare || to >= kNoSquare)
        return reject(MoveError::InvalidSquare, "square out of range");
    if (!pending_dash_ && game_over()) return reject(MoveError::GameOver, "the game has ended");

    const Board& board = position_.board();
    const Piece mover = board.piece_at(from);
    const Piece target = board.piece_at(to);
    if (mover.empty()) return reject(MoveError::EmptySource, "no piece on " + square_name(from));
    if (mover.color != position_.side_to_move())
        return reject(MoveError::WrongSide, square_name(from) + " belongs to the other side");
    if (target.type == PieceType::King)
        return reject(MoveError::TargetsKing, "cannot capture the king on " + square_name(to));
    if (pending_dash_ && from != *pending_dash_)
        return reject(MoveError::DashPending,
                      "the knight on " + square_name(*pending_dash_) + " must move or skip");
    if (!target.empty() && target.color == mover.color)
        return reject(MoveError::FriendlyTarget, square_name(to) + " holds a friendly piece");

    const EnhancedMoveList moves = legal_moves(from);
    const EnhancedMove* found = choose(moves, to, options.promotion);
    if (!found) return diagnose_missing(from, to);
    const EnhancedMove chosen = *found;

    if (!rules_.empty()) {
        const GameState state = game_state();
        for (const CustomRule& rule : rules_) {
            bool accepted = true;
            try {
                accepted = !rule.validator || rule.validator(chosen, state);
            } catch (const std::exception& e) {
                log::logger()->warn("EvolutionEngine: custom rule '{}' threw: {}", rule.id,
                                    e.what());
                accepted = false;
            }
            if (!accepted)
                return reject(MoveError::CustomRuleViolation, "rejected by rule '" + rule.id + "'");
        }
    }

    const Position before = position_;
    const bool continuation = pending_dash_.has_value();
    const int ply_before = ply_;

    ApplyResult applied = apply_move(position_, overlay_, chosen, options.promotion);
    if (!applied) return reject(applied.failure.code, applied.failure.reason);
    const AppliedMove& am = *applied.applied;

    if (continuation) {
        pending_dash_.reset();
        dash_resume_.reset();
    } else {
        ++ply_;
    }

    clear_restrictions(mover.color);
    if (config_.refresh_cached_moves) refresh_cached_moves(position_.board(), overlay_);

    MoveResult result;
    result.success = true;
    result.move = am.move;
    result.san = am.san;
    result.ability_id = am.ability_id;
    result.synthetic = am.synthetic;
    result.capture = am.is_capture();
    result.abilities =
        trigger_move_abilities(chosen, before.board(), from, to, am.captured, ply_before);

    if (config_.track_stationary) {
        if (am.move.flag == MoveFlag::CastleKingside || am.move.flag == MoveFlag::CastleQueenside) {
            const int rank = rank_of(from);
            const bool kingside = am.move.flag == MoveFlag::CastleKingside;
            tracker_.record_castle(position_.board(), mover.color, from, to,
                                   make_square(kingside ? 7 : 0, rank),
                                   make_square(kingside ? 5 : 3, rank));
        } else {
            tracker_.record_move(position_.board(), mover.color, from, to);
        }
        auto fired = check_stationary_triggers();
        result.abilities.insert(result.abilities.end(), fired.begin(), fired.end());
    }

    result.elegance_score = elegance::score(before, position_, from, to,
                                            static_cast<int>(history_.size()));

    HistoryEntry entry;
    entry.move = am.move;
    entry.san = am.san;
    entry.mover = am.mover;
    entry.captured = am.captured;
    entry.ability_id = am.ability_id;
    entry.elegance_score = result.elegance_score;
    entry.dash_continuation = continuation;
    history_.push_back(std::move(entry));

    if (!continuation && options.grant_dash && chosen.ability_id == kKnightDash &&
        mover.type == PieceType::Knight) {
        result.dash_pending = enter_dash(to);
    }

    result.fen = position_.to_fen();
    log::logger()->debug("EvolutionEngine: played {} [{}] elegance {}", result.san,
                         result.ability_id, result.elegance_score);
    return result;
}

const EnhancedMove* EvolutionEngine::choose(const EnhancedMoveList& moves, Square to,
                                            PieceType promotion) const {
    const EnhancedMove* first = nullptr;
    const PieceType wanted = promotion == PieceType::None ? PieceType::Queen : promotion;
    for (const EnhancedMove& em : moves) {
        if (em.move.to_sq != to) continue;
        if (!first) first = &em;
        if (em.move.promotion == PieceType::None || em.move.promotion == wanted) return &em;
    }
    return first;
}

MoveResult EvolutionEngine::diagnose_missing(Square from, Square to) const {
    // A restricted piece can lose moves the oracle still allows.
    Position scratch = position_;
    if (!movegen::legal_from(scratch, from).contains_path(from, to) &&
        movegen::pseudo_legal(position_).contains_path(from, to))
        return reject(MoveError::LeavesKingInCheck,
                      square_name(from) + square_name(to) + " leaves the king in check");
    return reject(MoveError::IllegalMove,
                  square_name(from) + square_name(to) + " is not a legal move");
}

EnhancedMoveList EvolutionEngine::legal_moves(std::optional<Square> square) {
    std::optional<Square> target = square;
    if (pending_dash_) {
        if (square && *square != *pending_dash_) return {};
        target = pending_dash_;
    }
    const GeneratorContext ctx{overlay_, upgrades_, *activity_, trigger_context()};
    return generator_.generate(position_, ctx, target);
}

bool EvolutionEngine::is_enhanced_move_legal(Square from, Square to) {
    if (from >= kNoSquare || to >= kNoSquare) return false;
    const EnhancedMoveList moves = legal_moves(from);
    return std::any_of(moves.begin(), moves.end(), [&](const EnhancedMove& em) {
        return em.move.to_sq == to && em.enhanced() && em.synthetic;
    });
}

std::optional<int> EvolutionEngine::calculate_elegance_score(Square from, Square to,
                                                             PieceType promotion) {
    if (from >= kNoSquare || to >= kNoSquare) return std::nullopt;
    const EnhancedMoveList moves = legal_moves(from);
    const EnhancedMove* chosen = choose(moves, to, promotion);
    if (!chosen) return std::nullopt;

    Position after = position_;
    EvolutionMap scratch = overlay_;
    if (!apply_move(after, scratch, *chosen, promotion)) return std::nullopt;
    return elegance::score(position_, after, from, to, static_cast<int>(history_.size()));
}

// ── Knight dash ─────────────────────────────────────────────────────────────

bool EvolutionEngine::enter_dash(Square knight_sq) {
    const Color us = opposite(position_.side_to_move());
    if (position_.is_in_check()) {
        log::logger()->debug("EvolutionEngine: no dash after a checking move");
        return false;
    }
    const int fullmove = position_.fullmove_number() - (us == Color::Black ? 1 : 0);
    try {
        Position dash(position_.board(), us, position_.castling(), kNoSquare,
                      position_.halfmove_clock(), fullmove);
        dash.validate();
        dash.inherit_history(position_);
        dash_resume_ = position_;
        position_ = std::move(dash);
    } catch (const std::invalid_argument& e) {
        log::logger()->warn("EvolutionEngine: dash refused: {}", e.what());
        return false;
    }

    pending_dash_ = knight_sq;
    if (legal_moves(knight_sq).empty()) {
        skip_dash();
        return false;
    }
    log::logger()->debug("EvolutionEngine: knight on {} may dash", square_name(knight_sq));
    return true;
}

bool EvolutionEngine::skip_dash() {
    if (!pending_dash_ || !dash_resume_) return false;
    position_ = std::move(*dash_resume_);
    dash_resume_.reset();
    pending_dash_.reset();
    return true;
}

// ── Ability triggers ────────────────────────────────────────────────────────

lifecycle::TriggerContext EvolutionEngine::trigger_context(Square from) const {
    lifecycle::TriggerContext ctx;
    const double now = config_.clock();
    ctx.current_ply = ply_;
    ctx.now_seconds = now;
    ctx.elapsed_seconds = now - start_time_;
    ctx.move_count = ply_;
    ctx.piece_count = position_.board().count();
    ctx.from = from;
    return ctx;
}

std::vector<AbilityResult> EvolutionEngine::trigger_move_abilities(const EnhancedMove& chosen,
                                                                   const Board& before,
                                                                   Square from, Square to,
                                                                   Piece captured,
                                                                   int ply_before) {
    std::vector<AbilityResult> out;
    PieceEvolutionState* state = overlay_.get(to);
    if (!state) return out;

    const Piece piece = position_.board().piece_at(to);
    lifecycle::TriggerContext ctx = trigger_context(from);
    ctx.current_ply = ply_before;
    ctx.move_count = ply_before;

    const bool first_capture =
        std::none_of(history_.begin(), history_.end(), [&](const HistoryEntry& h) {
            return h.mover.color == piece.color && !h.captured.empty();
        });
    const bool previous_captured = !history_.empty() && !history_.back().captured.empty();
    const EffectContext effect_ctx{position_.board(), to, piece, captured, first_capture,
                                   previous_captured,
                                   upgrades_.get(PieceType::King).last_stand_threshold};
    const PieceUpgrades& upgrades = upgrades_.get(piece.type);

    for (std::size_t i = 0; i < state->abilities.size(); ++i) {
        AbilityInstance& ability = state->abilities[i];
        if (is_stationary_ability(ability.id)) continue;
        if (fires_on_use(ability) && ability.id != chosen.ability_id) continue;
        if (ability.category == AbilityCategory::Capture && captured.empty()) continue;
        if (!activity_->is_ability_active(ability.id, piece.type, upgrades)) continue;
        if (!lifecycle::can_trigger(ability, ctx)) continue;
        if (!is_valid_ability_target(ability, before, from, to)) continue;

        AbilityResult r = executor_.execute(ability, effect_ctx, overlay_);
        if (r.success) lifecycle::stamp(ability, ctx);
        out.push_back(std::move(r));
    }
    return out;
}

void EvolutionEngine::clear_restrictions(Color side) {
    for (Square sq : squares_of(overlay_.squares() & position_.board().occupied(side))) {
        PieceEvolutionState* state = overlay_.get(sq);
        if (!state->is_move_restricted && !state->is_dominated) continue;
        state->is_move_restricted = false;
        state->is_dominated = false;
        state->cached_modified_moves = kEmptyBB;
    }
}

int EvolutionEngine::stationary_threshold(PieceType pt) const noexcept {
    const PieceUpgrades baseline{};
    const PieceUpgrades& u = upgrades_.get(pt);
    int threshold = config_.stationary_threshold;
    if (pt == PieceType::Rook && u.entrench_threshold != baseline.entrench_threshold)
        threshold = u.entrench_threshold;
    if (pt == PieceType::Bishop && u.consecration_turns != baseline.consecration_turns)
        threshold = u.consecration_turns;
    return std::max(1, threshold);
}

std::vector<AbilityResult> EvolutionEngine::check_stationary_triggers() {
    return check_stationary_triggers(tracker_.counters());
}

std::vector<AbilityResult> EvolutionEngine::check_stationary_triggers(
    const StationaryTracker::Counters& counters) {
    std::vector<AbilityResult> out;
    const Board& board = position_.board();

    for (Square sq : squares_of(overlay_.squares())) {
        PieceEvolutionState* state = overlay_.get(sq);
        const Piece p = board.piece_at(sq);
        std::string_view id;
        bool already = false;
        if (p.type == PieceType::Rook) {
            id = kRookEntrench;
            already = state->is_entrenched;
        } else if (p.type == PieceType::Bishop) {
            id = kBishopConsecrate;
            already = state->is_consecrated_source;
        } else {
            continue;
        }
        if (already || counters[sq] < stationary_threshold(p.type)) continue;

        AbilityInstance* ability = state->find_ability(id);
        if (!ability) continue;
        if (!activity_->is_ability_active(id, p.type, upgrades_.get(p.type))) continue;
        const lifecycle::TriggerContext ctx = trigger_context(sq);
        if (!lifecycle::can_trigger(*ability, ctx)) continue;

        const EffectContext effect_ctx{board, sq, p};
        AbilityResult r = executor_.execute(*ability, effect_ctx, overlay_);
        if (r.success) {
            lifecycle::stamp(*ability, ctx);
            log::logger()->info("EvolutionEngine: {} fired on {} after {} turns", id,
                                square_name(sq), counters[sq]);
        }
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<AbilityCooldown> EvolutionEngine::ability_cooldowns(Square sq) const {
    std::vector<AbilityCooldown> out;
    const PieceEvolutionState* state = overlay_.get(sq);
    if (!state) return out;
    const lifecycle::TriggerContext ctx = trigger_context(sq);
    for (const AbilityInstance& a : state->abilities) {
        out.push_back({a.id, lifecycle::cooldown_info(a, ctx)});
    }
    return out;
}

void EvolutionEngine::reset_ability_cooldowns(std::optional<Square> sq) {
    Bitboard targets = overlay_.squares();
    if (sq) targets &= *sq < kNoSquare ? square_bb(*sq) : kEmptyBB;
    for (Square s : squares_of(targets)) {
        for (AbilityInstance& a : overlay_.get(s)->abilities) lifecycle::reset_cooldown(a);
    }
}

std::vector<BoardSynergy> EvolutionEngine::calculate_board_synergies() const {
    struct Tally {
        int count = 0;
        int levels = 0;
    };
    Tally tally[kNumPieceTypes]{};
    for (Square sq : squares_of(overlay_.squares())) {
        const PieceEvolutionState* state = overlay_.get(sq);
        int idx = piece_index(state->piece_type);
        if (idx < 0) continue;
        ++tally[idx].count;
        tally[idx].levels += state->evolution_level;
    }
    auto average = [&](std::initializer_list<PieceType> types) {
        int count = 0;
        int levels = 0;
        for (PieceType pt : types) {
            count += tally[piece_index(pt)].count;
            levels += tally[piece_index(pt)].levels;
        }
        return count == 0 ? 0.0 : static_cast<double>(levels) / count;
    };
    auto count_of = [&](PieceType pt) { return tally[piece_index(pt)].count; };

    std::vector<BoardSynergy> out;
    if (count_of(PieceType::King) > 0 && count_of(PieceType::Queen) > 0 &&
        average({PieceType::King, PieceType::Queen}) >= 5.0) {
        out.push_back({"Royal Guard", 1.25, "King and Queen provide defensive bonuses"});
    }
    if (count_of(PieceType::Knight) >= 2 && average({PieceType::Knight}) >= 3.0) {
        out.push_back({"Cavalry Charge", 1.5, "Multiple knights provide movement bonuses"});
    }
    if (count_of(PieceType::Rook) >= 2 && average({PieceType::Rook}) >= 4.0) {
        out.push_back({"Fortress Wall", 1.4, "Rooks provide defensive formation bonuses"});
    }
    return out;
}

// ── Evolution overlay ───────────────────────────────────────────────────────

bool EvolutionEngine::apply_evolution_effects(Square sq, const EvolutionUpdate& update) {
    PieceEvolutionState* state = overlay_.get(sq);
    if (!state) return false;
    state->evolution_level = std::max(1, update.evolution_level);
    state->abilities.clear();
    for (const AbilityInstance& a : update.abilities) state->add_ability(a);
    if (update.attack) state->bonus.capture_bonus = *update.attack;
    if (update.defense) state->bonus.defensive_bonus = *update.defense;
    if (update.breakthrough) state->bonus.breakthrough_bonus = *update.breakthrough;
    if (update.ally) state->bonus.ally_bonus = *update.ally;
    if (update.authority) state->bonus.authority_bonus = *update.authority;
    return true;
}

bool EvolutionEngine::set_piece_evolution(Square sq, PieceEvolutionState state) {
    if (sq >= kNoSquare || position_.board().is_empty(sq)) {
        log::logger()->warn("EvolutionEngine: no piece to evolve on {}", square_name(sq));
        return false;
    }
    state.piece_type = position_.board().piece_at(sq).type;
    overlay_.set(sq, std::move(state));
    if (config_.refresh_cached_moves) refresh_cached_moves(position_.board(), overlay_);
    return true;
}

bool EvolutionEngine::remove_piece_evolution(Square sq) {
    if (!overlay_.contains(sq)) return false;
    overlay_.erase(sq);
    if (config_.refresh_cached_moves) refresh_cached_moves(position_.board(), overlay_);
    return true;
}

void EvolutionEngine::sync_piece_evolutions_with_board() {
    const Board& board = position_.board();
    EvolutionMap rebuilt;
    for (Square sq : squares_of(board.occupied_all())) {
        const PieceType pt = board.piece_at(sq).type;
        const PieceUpgrades& u = upgrades_.get(pt);
        std::vector<AbilityInstance> abilities = abilities_from_upgrades(pt, u);
        if (auto it = registered_.find(pt); it != registered_.end())
            abilities.insert(abilities.end(), it->second.begin(), it->second.end());
        rebuilt.set(sq, make_evolution_state(pt, evolution_level(pt, u), std::move(abilities)));
    }
    overlay_ = std::move(rebuilt);
    if (config_.refresh_cached_moves) refresh_cached_moves(board, overlay_);
    log::logger()->info("EvolutionEngine: synced {} evolved pieces", overlay_.size());
}

void EvolutionEngine::register_ability(PieceType pt, AbilityInstance ability) {
    registered_[pt].push_back(std::move(ability));
}

void EvolutionEngine::set_activity_provider(std::shared_ptr<const ActivityProvider> provider) {
    activity_ = provider ? std::move(provider) : std::make_shared<AttachedActivityProvider>();
}

// ── Custom rules ────────────────────────────────────────────────────────────

void EvolutionEngine::add_custom_rule(CustomRule rule) {
    remove_custom_rule(rule.id);
    rules_.push_back(std::move(rule));
    std::stable_sort(rules_.begin(), rules_.end(), [](const CustomRule& a, const CustomRule& b) {
        return a.priority > b.priority;
    });
}

bool EvolutionEngine::remove_custom_rule(std::string_view id) {
    return std::erase_if(rules_, [&](const CustomRule& r) { return r.id == id; }) > 0;
}

// ── Game state ──────────────────────────────────────────────────────────────

bool EvolutionEngine::game_over() const {
    Position scratch = position_;
    return rules::is_game_over(scratch);
}

GameState EvolutionEngine::game_state() const {
    GameState gs;
    Position scratch = position_;
    gs.fen = scratch.to_fen();
    gs.side_to_move = scratch.side_to_move();
    gs.in_check = scratch.is_in_check();
    gs.checkmate = rules::is_checkmate(scratch);
    gs.stalemate = rules::is_stalemate(scratch);
    gs.draw = rules::is_draw(scratch);
    gs.game_over = gs.checkmate || gs.stalemate || gs.draw;
    for (const HistoryEntry& h : history_) gs.move_history.push_back(h.san);
    if (!history_.empty()) gs.last_elegance_score = history_.back().elegance_score;
    gs.pending_dash = pending_dash_;
    return gs;
}

}  // namespace evochess
