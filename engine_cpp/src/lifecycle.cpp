/// @file lifecycle.cpp
/// Ability lifecycle implementation.

#include <evochess/lifecycle.hpp>

#include <algorithm>

namespace evochess::lifecycle {

bool compare(double actual, Comparator cmp, double expected) noexcept {
    switch (cmp) {
        case Comparator::Greater:
            return actual > expected;
        case Comparator::Less:
            return actual < expected;
        case Comparator::Equal:
            return actual == expected;
        case Comparator::GreaterEqual:
            return actual >= expected;
        case Comparator::LessEqual:
            return actual <= expected;
    }
    return false;
}

bool wall_clock_ready(const AbilityInstance& a, double now_seconds) noexcept {
    if (!a.cooldown_seconds || !a.last_used_at) return true;
    return now_seconds - *a.last_used_at >= *a.cooldown_seconds;
}

bool ply_ready(const AbilityInstance& a, int current_ply) noexcept {
    if (!a.move_cooldown_plies || !a.last_used_at_ply) return true;
    return current_ply - *a.last_used_at_ply >= *a.move_cooldown_plies;
}

bool gates_open(const AbilityInstance& a, const TriggerContext& ctx) noexcept {
    return !a.exhausted() && wall_clock_ready(a, ctx.now_seconds) &&
           ply_ready(a, ctx.current_ply);
}

bool evaluate_condition(const Condition& c, const TriggerContext& ctx) noexcept {
    switch (c.kind) {
        case ConditionKind::MoveCount:
            return compare(ctx.move_count, c.comparator, c.threshold);
        case ConditionKind::PieceCount:
            return compare(ctx.piece_count, c.comparator, c.threshold);
        case ConditionKind::BoardPosition:
            return ctx.from != kNoSquare && in_region(ctx.from, c.region);
        case ConditionKind::TimeElapsed:
            return compare(ctx.elapsed_seconds, c.comparator, c.threshold);
    }
    return false;
}

bool can_trigger(const AbilityInstance& a, const TriggerContext& ctx) noexcept {
    if (!gates_open(a, ctx)) return false;
    return std::all_of(a.conditions.begin(), a.conditions.end(),
                       [&](const Condition& c) { return evaluate_condition(c, ctx); });
}

AbilityState state_of(const AbilityInstance& a, const TriggerContext& ctx) noexcept {
    return can_trigger(a, ctx) ? AbilityState::Usable : AbilityState::Idle;
}

void stamp(AbilityInstance& a, const TriggerContext& ctx) noexcept {
    ++a.uses_so_far;
    a.last_used_at = ctx.now_seconds;
    a.last_used_at_ply = ctx.current_ply;
}

void reset_cooldown(AbilityInstance& a) noexcept {
    a.last_used_at.reset();
    a.last_used_at_ply.reset();
}

CooldownInfo cooldown_info(const AbilityInstance& a, const TriggerContext& ctx) noexcept {
    CooldownInfo info;
    if (a.cooldown_seconds) {
        info.total_seconds = *a.cooldown_seconds;
        if (a.last_used_at) {
            info.remaining_seconds =
                std::max(0.0, *a.cooldown_seconds - (ctx.now_seconds - *a.last_used_at));
        }
    }
    if (a.move_cooldown_plies) {
        info.total_plies = *a.move_cooldown_plies;
        if (a.last_used_at_ply) {
            info.remaining_plies =
                std::max(0, *a.move_cooldown_plies - (ctx.current_ply - *a.last_used_at_ply));
        }
    }
    if (a.max_uses) info.uses_left = std::max(0, *a.max_uses - a.uses_so_far);
    return info;
}

}  // namespace evochess::lifecycle
