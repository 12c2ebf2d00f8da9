/// @file activity.cpp
/// Upgrade-derived abilities, evolution levels, and activity providers.

#include <evochess/activity.hpp>

#include <algorithm>
#include <cmath>

namespace evochess {

namespace {

/// Number of whole `step`s in `value`, tolerant of binary rounding (0.15-0.1 = 0.04999…).
int whole_steps(double value, double step) noexcept {
    return static_cast<int>(std::floor(value / step + 1e-9));
}

AbilityInstance derived(std::string_view id, std::string_view description) {
    AbilityInstance a = make_ability(id);
    a.description = std::string(description);
    return a;
}

}  // namespace

std::vector<AbilityInstance> abilities_from_upgrades(PieceType pt, const PieceUpgrades& u) {
    std::vector<AbilityInstance> out;
    switch (pt) {
        case PieceType::Pawn:
            if (u.march_speed > 1)
                out.push_back(derived("enhanced-march", "Advance two squares from any rank"));
            if (u.resilience > 0)
                out.push_back(derived("breakthrough", "Sidestep diagonally or push into enemies"));
            break;
        case PieceType::Knight:
            if (u.dash_chance > 0.1) {
                AbilityInstance a = derived("knight-dash", "Extended leaps and a second move");
                a.cooldown_seconds = static_cast<double>(u.dash_cooldown);
                out.push_back(std::move(a));
            }
            break;
        case PieceType::Bishop:
            if (u.snipe_range > 1)
                out.push_back(derived("extended-range", "Reach further along diagonals"));
            if (u.consecration_turns < 3)
                out.push_back(derived("bishop-consecrate", "Bless nearby allies when stationary"));
            break;
        case PieceType::Rook:
            if (u.entrench_threshold < 3)
                out.push_back(derived("rook-entrench", "Fortify after standing still"));
            if (u.entrench_power > 1)
                out.push_back(derived("fortress-defense", "Passive defensive bonus"));
            break;
        case PieceType::Queen:
            if (u.dominance_aura_range > 2)
                out.push_back(derived("queen-dominance", "Restrict enemies within the aura"));
            if (u.mana_regen_bonus > 0.0)
                out.push_back(derived("mana-regeneration", "Passive regeneration"));
            break;
        case PieceType::King:
            if (u.royal_decree_uses > 0) {
                AbilityInstance a = derived("royal-decree", "Command allies, restrict enemies");
                a.max_uses = u.royal_decree_uses;
                out.push_back(std::move(a));
            }
            if (u.last_stand_threshold > 0.2)
                out.push_back(derived("last-stand", "Defensive surge when outnumbered"));
            break;
        case PieceType::None:
            break;
    }
    return out;
}

int evolution_level(PieceType pt, const PieceUpgrades& u) noexcept {
    int level = 1;
    switch (pt) {
        case PieceType::Pawn:
            level += std::max(0, u.march_speed - 1) + u.resilience;
            break;
        case PieceType::Knight:
            level += whole_steps(u.dash_chance - 0.1, 0.05) + std::max(0, 5 - u.dash_cooldown);
            break;
        case PieceType::Bishop:
            level += std::max(0, u.snipe_range - 1) + std::max(0, 3 - u.consecration_turns);
            break;
        case PieceType::Rook:
            level += std::max(0, 3 - u.entrench_threshold) + std::max(0, u.entrench_power - 1);
            break;
        case PieceType::Queen:
            level += std::max(0, u.dominance_aura_range - 2) + whole_steps(u.mana_regen_bonus, 0.1);
            break;
        case PieceType::King:
            level += u.royal_decree_uses + whole_steps(u.last_stand_threshold - 0.2, 0.05);
            break;
        case PieceType::None:
            break;
    }
    return std::max(1, level);
}

// ── UpgradeActivityProvider ─────────────────────────────────────────────────

void UpgradeActivityProvider::unlock(PieceType pt, std::string_view ability_id) {
    unlocked_.emplace(pt, std::string(ability_id));
}

void UpgradeActivityProvider::lock(PieceType pt, std::string_view ability_id) {
    unlocked_.erase({pt, std::string(ability_id)});
}

bool UpgradeActivityProvider::is_ability_active(std::string_view ability_id, PieceType pt,
                                                const PieceUpgrades& upgrades) const {
    if (unlocked_.count({pt, std::string(ability_id)}) > 0) return true;
    const auto derived_abilities = abilities_from_upgrades(pt, upgrades);
    return std::any_of(derived_abilities.begin(), derived_abilities.end(),
                       [&](const AbilityInstance& a) { return a.id == ability_id; });
}

}  // namespace evochess
