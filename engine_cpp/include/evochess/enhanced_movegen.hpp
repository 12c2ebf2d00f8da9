#pragma once

/// @file enhanced_movegen.hpp
/// Oracle-legal moves merged with ability-derived destinations.
///
/// For one square the generator returns the oracle's legal moves minus any
/// king-capturing destination, then every destination an active, usable
/// ability grants (friendly and king squares dropped, own king kept safe),
/// then the piece's standing cached destinations. A move-restricted piece is
/// offered its cached destinations only.

#include <evochess/activity.hpp>
#include <evochess/evolution.hpp>
#include <evochess/lifecycle.hpp>
#include <evochess/position.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evochess {

/// Tag carried by destinations that come from a piece's cached set rather
/// than from an ability computed on demand.
inline constexpr std::string_view kCachedMoveTag = "cached-move";

struct EnhancedMove {
    Move move;
    std::string ability_id;  ///< empty for a plain oracle move
    bool synthetic = false;  ///< true when the oracle alone cannot play it

    [[nodiscard]] bool enhanced() const noexcept { return !ability_id.empty(); }
    [[nodiscard]] std::string uci() const { return move.uci(); }
    [[nodiscard]] bool operator==(const EnhancedMove&) const = default;
};

using EnhancedMoveList = std::vector<EnhancedMove>;

/// Engine-owned data a generation pass reads.
struct GeneratorContext {
    const EvolutionMap& overlay;
    const UpgradeTable& upgrades;
    const ActivityProvider& activity;
    lifecycle::TriggerContext trigger;
};

/// Whether the mover's own king is safe after lifting `from` onto `to`.
[[nodiscard]] bool keeps_king_safe(const Board& board, Square from, Square to,
                                   PieceType promotion = PieceType::None) noexcept;

class EnhancedMoveGenerator {
   public:
    /// Moves of the piece on `square`, or of every piece of the side to move.
    /// Re-entering while a pass is in flight skips the activity predicate and
    /// treats attached abilities as active.
    [[nodiscard]] EnhancedMoveList generate(const Position& pos, const GeneratorContext& ctx,
                                            std::optional<Square> square = std::nullopt);

    [[nodiscard]] bool in_flight() const noexcept { return in_flight_; }

   private:
    [[nodiscard]] EnhancedMoveList for_square(const Position& pos, const GeneratorContext& ctx,
                                              Square from, bool consult_predicate) const;

    bool in_flight_ = false;
};

}  // namespace evochess
