#pragma once

/// @file ability.hpp
/// Ability records, trigger conditions, and the known-ability catalogue.

#include <evochess/bitboard.hpp>
#include <evochess/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evochess {

// ── Category ────────────────────────────────────────────────────────────────

enum class AbilityCategory : std::uint8_t { Movement, Capture, Special, Passive };

[[nodiscard]] std::string_view to_string(AbilityCategory c) noexcept;
[[nodiscard]] std::optional<AbilityCategory> parse_category(std::string_view text) noexcept;

// ── Conditions ──────────────────────────────────────────────────────────────

enum class ConditionKind : std::uint8_t { MoveCount, PieceCount, BoardPosition, TimeElapsed };

enum class Comparator : std::uint8_t { Greater, Less, Equal, GreaterEqual, LessEqual };

enum class BoardRegion : std::uint8_t { Center, Edge, BackRank };

/// One declared trigger condition. Numeric kinds compare `threshold` with
/// `comparator`; BoardPosition tests whether the move's source lies in `region`.
struct Condition {
    ConditionKind kind = ConditionKind::MoveCount;
    Comparator comparator = Comparator::GreaterEqual;
    double threshold = 0.0;
    BoardRegion region = BoardRegion::Center;

    [[nodiscard]] bool operator==(const Condition&) const noexcept = default;
};

[[nodiscard]] std::optional<Comparator> parse_comparator(std::string_view text) noexcept;
[[nodiscard]] std::optional<BoardRegion> parse_region(std::string_view text) noexcept;
[[nodiscard]] bool in_region(Square sq, BoardRegion region) noexcept;

// ── AbilityInstance ─────────────────────────────────────────────────────────

/// A named, gated capability attached to one evolved piece.
///
/// Optional fields are "not set" rather than zero: an ability without
/// cooldown_seconds has no wall-clock gate, one without max_uses is uncapped.
struct AbilityInstance {
    std::string id;
    std::string name;
    std::string description;
    AbilityCategory category = AbilityCategory::Special;

    std::optional<double> cooldown_seconds;
    std::optional<double> last_used_at;
    std::optional<int> move_cooldown_plies;
    std::optional<int> last_used_at_ply;
    std::optional<int> max_uses;
    int uses_so_far = 0;

    std::vector<Condition> conditions;

    [[nodiscard]] bool operator==(const AbilityInstance&) const = default;

    [[nodiscard]] bool exhausted() const noexcept {
        return max_uses.has_value() && uses_so_far >= *max_uses;
    }
};

/// Build an ability from its id, taking the category from the catalogue
/// (Special when the id is unknown). Name defaults to the id.
[[nodiscard]] AbilityInstance make_ability(std::string_view id);

/// Category the catalogue assigns to `id`, if it is a known ability.
[[nodiscard]] std::optional<AbilityCategory> catalogue_category(std::string_view id) noexcept;

/// All ability ids the engine knows how to execute.
[[nodiscard]] const std::vector<std::string_view>& known_ability_ids();

// ── AbilityResult ───────────────────────────────────────────────────────────

/// Outcome of one executed ability.
struct AbilityResult {
    std::string ability_id;
    std::string effect;  ///< short effect tag, e.g. "capture_bonus", "aura"
    bool success = false;
    std::string description;
    double magnitude = 1.0;          ///< multiplier applied (1.0 when none)
    Bitboard affected = kEmptyBB;    ///< squares whose state changed besides the actor
    Bitboard granted = kEmptyBB;     ///< destinations the ability opened up
};

}  // namespace evochess
