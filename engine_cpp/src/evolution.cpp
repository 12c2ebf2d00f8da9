/// @file evolution.cpp
/// Evolution overlay implementation.

#include <evochess/evolution.hpp>

#include <utility>

namespace evochess {

// ── PieceEvolutionState ─────────────────────────────────────────────────────

AbilityInstance* PieceEvolutionState::find_ability(std::string_view id) noexcept {
    for (auto& a : abilities) {
        if (a.id == id) return &a;
    }
    return nullptr;
}

const AbilityInstance* PieceEvolutionState::find_ability(std::string_view id) const noexcept {
    for (const auto& a : abilities) {
        if (a.id == id) return &a;
    }
    return nullptr;
}

bool PieceEvolutionState::add_ability(AbilityInstance ability) {
    if (has_ability(ability.id)) return false;
    abilities.push_back(std::move(ability));
    return true;
}

void PieceEvolutionState::reset_effects() noexcept {
    bonus = Multipliers{};
    is_entrenched = false;
    is_consecrated_source = false;
    is_receiving_consecration = false;
    is_dominated = false;
    is_move_restricted = false;
    can_move_through = false;
    consecration_radius = 0;
    dominance_radius = 0;
    territory_control = kEmptyBB;
    cached_modified_moves = kEmptyBB;
}

PieceEvolutionState make_evolution_state(PieceType pt, int level,
                                         std::vector<AbilityInstance> abilities) {
    PieceEvolutionState s;
    s.piece_type = pt;
    s.evolution_level = level < 1 ? 1 : level;
    for (auto& a : abilities) s.add_ability(std::move(a));
    return s;
}

// ── EvolutionMap ────────────────────────────────────────────────────────────

const PieceEvolutionState* EvolutionMap::get(Square sq) const noexcept {
    if (sq >= kNoSquare || !entries_[sq]) return nullptr;
    return &*entries_[sq];
}

PieceEvolutionState* EvolutionMap::get(Square sq) noexcept {
    if (sq >= kNoSquare || !entries_[sq]) return nullptr;
    return &*entries_[sq];
}

void EvolutionMap::set(Square sq, PieceEvolutionState state) {
    if (sq >= kNoSquare) return;
    entries_[sq] = std::move(state);
    set_bit(occupied_, sq);
}

void EvolutionMap::erase(Square sq) noexcept {
    if (sq >= kNoSquare) return;
    entries_[sq].reset();
    clear_bit(occupied_, sq);
}

void EvolutionMap::clear() noexcept {
    for (auto& e : entries_) e.reset();
    occupied_ = kEmptyBB;
}

void EvolutionMap::relocate(Square from, Square to, PieceType promotion) {
    if (from == to || from >= kNoSquare || to >= kNoSquare) return;
    erase(to);
    if (!entries_[from]) return;

    PieceEvolutionState moved = std::move(*entries_[from]);
    erase(from);
    if (promotion != PieceType::None) moved.piece_type = promotion;
    set(to, std::move(moved));
}

}  // namespace evochess
