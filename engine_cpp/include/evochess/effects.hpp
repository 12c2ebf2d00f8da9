#pragma once

/// @file effects.hpp
/// Ability effect execution and the standing destination sets effects leave behind.

#include <evochess/ability.hpp>
#include <evochess/board.hpp>
#include <evochess/evolution.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace evochess {

/// Facts about the move that triggered an ability, taken after it was applied.
struct EffectContext {
    const Board& board;       ///< position after the move
    Square square = kNoSquare;  ///< the acting piece's square
    Piece piece = kNoPiece;
    Piece captured = kNoPiece;  ///< kNoPiece when the move captured nothing
    bool first_capture = true;            ///< mover had no earlier capture this game
    bool previous_move_captured = false;  ///< the move before this one was a capture
    double last_stand_threshold = 0.2;
};

/// Destinations a restricted piece keeps: max(1, n/2) of its legal
/// destinations, 80% from quiet moves then 20% from captures (ascending
/// square order), topped up from what is left. Never empty while the piece
/// has a legal move.
[[nodiscard]] Bitboard restricted_destinations(const Board& board, Square sq);

/// The cached destinations implied by a piece's effect flags on `sq`.
[[nodiscard]] Bitboard standing_destinations(const Board& board, Square sq,
                                             const PieceEvolutionState& state) noexcept;

/// Recompute every entry's cached destinations against `board`: restricted
/// pieces get a fresh restricted set, everything else keeps the cached squares
/// that are still reachable targets plus its standing set.
void refresh_cached_moves(const Board& board, EvolutionMap& overlay);

/// Capture abilities need an enemy on `to`; movement abilities cannot land on
/// a friendly piece; type-bound specials need their piece type.
[[nodiscard]] bool is_valid_ability_target(const AbilityInstance& ability, const Board& board,
                                           Square from, Square to) noexcept;

/// Dispatches triggered abilities to their effect handlers.
class EffectExecutor {
   public:
    using Handler =
        std::function<AbilityResult(const AbilityInstance&, const EffectContext&, EvolutionMap&)>;

    EffectExecutor();

    /// Run `ability` for the piece in `ctx`. The acting piece must have an
    /// overlay entry on ctx.square; otherwise the result reports failure.
    [[nodiscard]] AbilityResult execute(const AbilityInstance& ability, const EffectContext& ctx,
                                        EvolutionMap& overlay) const;

    [[nodiscard]] bool has_special_handler(std::string_view id) const;

   private:
    [[nodiscard]] AbilityResult execute_capture(const AbilityInstance& ability,
                                                const EffectContext& ctx,
                                                PieceEvolutionState& self) const;
    [[nodiscard]] AbilityResult execute_passive(const AbilityInstance& ability,
                                                PieceEvolutionState& self) const;
    [[nodiscard]] AbilityResult execute_movement(const AbilityInstance& ability,
                                                 const EffectContext& ctx,
                                                 PieceEvolutionState& self) const;

    std::map<std::string, Handler, std::less<>> special_;
};

}  // namespace evochess
