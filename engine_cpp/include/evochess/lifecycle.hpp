#pragma once

/// @file lifecycle.hpp
/// Ability lifecycle: cooldown/usage gates, condition evaluation, stamping.
///
/// State machine per ability: Idle → Usable (both cooldown gates open, uses
/// left, conditions hold) → Triggered (stamp) → Idle.

#include <evochess/ability.hpp>
#include <evochess/types.hpp>

#include <optional>

namespace evochess::lifecycle {

/// The two time bases plus the game facts conditions are evaluated against.
struct TriggerContext {
    int current_ply = 0;           ///< half-moves played since load
    double now_seconds = 0.0;      ///< wall clock
    double elapsed_seconds = 0.0;  ///< since game start
    int move_count = 0;            ///< moves in history
    int piece_count = 0;           ///< pieces on the board
    Square from = kNoSquare;       ///< source square of the move being judged
};

enum class AbilityState : std::uint8_t { Idle, Usable };

[[nodiscard]] bool compare(double actual, Comparator cmp, double expected) noexcept;

/// Wall-clock gate: open when no cooldown is set, the ability never fired,
/// or `now - last_used_at >= cooldown_seconds`.
[[nodiscard]] bool wall_clock_ready(const AbilityInstance& a, double now_seconds) noexcept;

/// Ply gate: open when no ply cooldown is set, the ability never fired, or
/// `current_ply - last_used_at_ply >= move_cooldown_plies`.
[[nodiscard]] bool ply_ready(const AbilityInstance& a, int current_ply) noexcept;

/// Both cooldown gates open and uses left. Conditions are not consulted.
[[nodiscard]] bool gates_open(const AbilityInstance& a, const TriggerContext& ctx) noexcept;

[[nodiscard]] bool evaluate_condition(const Condition& c, const TriggerContext& ctx) noexcept;

/// Gates plus every declared condition.
[[nodiscard]] bool can_trigger(const AbilityInstance& a, const TriggerContext& ctx) noexcept;

[[nodiscard]] AbilityState state_of(const AbilityInstance& a, const TriggerContext& ctx) noexcept;

/// Record one trigger: uses_so_far += 1, last_used_at = now, last_used_at_ply = ply.
void stamp(AbilityInstance& a, const TriggerContext& ctx) noexcept;

/// Forget previous triggers (cooldowns open, usage count kept).
void reset_cooldown(AbilityInstance& a) noexcept;

/// Remaining and total cooldown for display.
struct CooldownInfo {
    double remaining_seconds = 0.0;
    double total_seconds = 0.0;
    int remaining_plies = 0;
    int total_plies = 0;
    std::optional<int> uses_left;
};

[[nodiscard]] CooldownInfo cooldown_info(const AbilityInstance& a,
                                         const TriggerContext& ctx) noexcept;

}  // namespace evochess::lifecycle
