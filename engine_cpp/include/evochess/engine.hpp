#pragma once

/// @file engine.hpp
/// High-level engine facade: rules oracle + evolution overlay + abilities.
///
/// Every public call returns a result or a bool; nothing throws across this
/// surface and a failed call leaves the game exactly as it was.

#include <evochess/activity.hpp>
#include <evochess/config.hpp>
#include <evochess/effects.hpp>
#include <evochess/enhanced_movegen.hpp>
#include <evochess/errors.hpp>
#include <evochess/evolution.hpp>
#include <evochess/lifecycle.hpp>
#include <evochess/position.hpp>
#include <evochess/stationary.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evochess {

// ── Move requests and results ───────────────────────────────────────────────

struct MoveOptions {
    PieceType promotion = PieceType::None;  ///< queen when a pawn promotes and this is None
    bool grant_dash = false;  ///< pre-decided outcome of the knight's dash roll
};

struct MoveResult {
    bool success = false;
    MoveError error = MoveError::None;
    std::string reason;

    Move move;
    std::string san;
    std::string ability_id;  ///< tag of the enhanced move that was played, if any
    bool synthetic = false;
    bool capture = false;
    bool dash_pending = false;  ///< the knight may move again this turn
    int elegance_score = 0;
    std::vector<AbilityResult> abilities;  ///< abilities triggered by this move
    std::string fen;
};

/// One played move as kept in the game history.
struct HistoryEntry {
    Move move;
    std::string san;
    Piece mover = kNoPiece;
    Piece captured = kNoPiece;
    std::string ability_id;
    int elegance_score = 0;
    bool dash_continuation = false;
};

struct GameState {
    std::string fen;
    Color side_to_move = Color::White;
    bool in_check = false;
    bool checkmate = false;
    bool stalemate = false;
    bool draw = false;
    bool game_over = false;
    std::vector<std::string> move_history;
    std::optional<int> last_elegance_score;
    std::optional<Square> pending_dash;
};

/// Extra validation run before any move is committed. Highest priority first.
struct CustomRule {
    std::string id;
    int priority = 0;
    std::function<bool(const EnhancedMove&, const GameState&)> validator;
};

/// Replacement level/abilities and optional multiplier overrides.
struct EvolutionUpdate {
    int evolution_level = 1;
    std::vector<AbilityInstance> abilities;
    std::optional<double> attack;       ///< capture_bonus
    std::optional<double> defense;      ///< defensive_bonus
    std::optional<double> breakthrough; ///< breakthrough_bonus
    std::optional<double> ally;         ///< ally_bonus
    std::optional<double> authority;    ///< authority_bonus
};

struct AbilityCooldown {
    std::string ability_id;
    lifecycle::CooldownInfo info;
};

struct BoardSynergy {
    std::string name;
    double bonus = 1.0;
    std::string description;
};

// ── EvolutionEngine ─────────────────────────────────────────────────────────

class EvolutionEngine {
   public:
    explicit EvolutionEngine(EngineConfig config = {});

    // ── Position ────────────────────────────────────────────────────────

    /// Load a FEN. On failure returns false and keeps the previous game.
    /// Overlay entries survive when the same piece type stands on their square.
    bool load_from_fen(std::string_view fen);

    /// New game from the configured starting FEN: no evolutions, ply 0.
    void reset();

    [[nodiscard]] std::string current_fen() const { return position_.to_fen(); }
    [[nodiscard]] const Position& position() const noexcept { return position_; }
    [[nodiscard]] int current_ply() const noexcept { return ply_; }
    [[nodiscard]] const std::vector<HistoryEntry>& history() const noexcept { return history_; }

    // ── Moves ───────────────────────────────────────────────────────────

    MoveResult make_move(Square from, Square to, const MoveOptions& options = {});
    MoveResult make_move(std::string_view from, std::string_view to,
                         const MoveOptions& options = {});

    /// SAN ("Nf3", "exd5", "e8=Q+") or UCI ("e2e4", "e7e8q").
    MoveResult make_move_from_notation(std::string_view text);

    /// Enhanced moves of the piece on `square`, or of the whole side to move.
    [[nodiscard]] EnhancedMoveList legal_moves(std::optional<Square> square = std::nullopt);

    /// True when from→to is offered only because of an ability.
    [[nodiscard]] bool is_enhanced_move_legal(Square from, Square to);

    /// Elegance of a move from the current position without playing it.
    [[nodiscard]] std::optional<int> calculate_elegance_score(Square from, Square to,
                                                              PieceType promotion = PieceType::None);

    // ── Knight dash ─────────────────────────────────────────────────────

    [[nodiscard]] std::optional<Square> pending_dash() const noexcept { return pending_dash_; }

    /// Give up the pending second knight move. False when none is pending.
    bool skip_dash();

    // ── Evolution overlay ───────────────────────────────────────────────

    [[nodiscard]] const PieceEvolutionState* piece_evolution(Square sq) const noexcept {
        return overlay_.get(sq);
    }
    [[nodiscard]] const EvolutionMap& evolutions() const noexcept { return overlay_; }

    /// Replace level and abilities of an existing entry. False when there is none.
    bool apply_evolution_effects(Square sq, const EvolutionUpdate& update);

    /// Refuses empty squares.
    bool set_piece_evolution(Square sq, PieceEvolutionState state);
    bool remove_piece_evolution(Square sq);

    /// Rebuild the overlay from the board and the upgrade table.
    void sync_piece_evolutions_with_board();

    // ── Upgrades and activity ───────────────────────────────────────────

    void set_upgrades(PieceType pt, const PieceUpgrades& upgrades) { upgrades_.set(pt, upgrades); }
    [[nodiscard]] const UpgradeTable& upgrades() const noexcept { return upgrades_; }

    /// Abilities every piece of `pt` receives on sync, besides upgrade-derived ones.
    void register_ability(PieceType pt, AbilityInstance ability);

    void set_activity_provider(std::shared_ptr<const ActivityProvider> provider);

    // ── Abilities ───────────────────────────────────────────────────────

    [[nodiscard]] std::vector<AbilityCooldown> ability_cooldowns(Square sq) const;

    /// Clear trigger stamps on one square, or everywhere.
    void reset_ability_cooldowns(std::optional<Square> sq = std::nullopt);

    /// Fire stationary abilities whose counter on `counters` reached its threshold.
    std::vector<AbilityResult> check_stationary_triggers(const StationaryTracker::Counters& counters);

    /// Same, against the engine's own tracker.
    std::vector<AbilityResult> check_stationary_triggers();

    [[nodiscard]] StationaryTracker& stationary_tracker() noexcept { return tracker_; }

    [[nodiscard]] std::vector<BoardSynergy> calculate_board_synergies() const;

    // ── Custom rules ────────────────────────────────────────────────────

    void add_custom_rule(CustomRule rule);
    bool remove_custom_rule(std::string_view id);

    // ── Game state ──────────────────────────────────────────────────────

    [[nodiscard]] GameState game_state() const;

   private:
    MoveResult play(Square from, Square to, const MoveOptions& options);
    [[nodiscard]] lifecycle::TriggerContext trigger_context(Square from = kNoSquare) const;
    [[nodiscard]] MoveResult reject(MoveError code, std::string reason) const;
    [[nodiscard]] MoveResult diagnose_missing(Square from, Square to) const;
    [[nodiscard]] const EnhancedMove* choose(const EnhancedMoveList& moves, Square to,
                                             PieceType promotion) const;
    [[nodiscard]] bool game_over() const;
    [[nodiscard]] int stationary_threshold(PieceType pt) const noexcept;

    std::vector<AbilityResult> trigger_move_abilities(const EnhancedMove& chosen,
                                                      const Board& before, Square from, Square to,
                                                      Piece captured, int ply_before);
    void clear_restrictions(Color side);
    bool enter_dash(Square knight_sq);
    void begin_game(Position pos);

    EngineConfig config_;
    Position position_;
    EvolutionMap overlay_;
    UpgradeTable upgrades_;
    std::map<PieceType, std::vector<AbilityInstance>> registered_;
    std::shared_ptr<const ActivityProvider> activity_;
    EnhancedMoveGenerator generator_;
    EffectExecutor executor_;
    StationaryTracker tracker_;
    std::vector<CustomRule> rules_;
    std::vector<HistoryEntry> history_;

    int ply_ = 0;
    double start_time_ = 0.0;
    std::optional<Square> pending_dash_;
    std::optional<Position> dash_resume_;  ///< position to restore when the dash is skipped
};

}  // namespace evochess
