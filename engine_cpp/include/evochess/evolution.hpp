#pragma once

/// @file evolution.hpp
/// Per-piece evolution state and the square-keyed overlay that carries it.

#include <evochess/ability.hpp>
#include <evochess/bitboard.hpp>
#include <evochess/types.hpp>

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace evochess {

/// Stat multipliers an evolved piece accumulates. All start at 1.0 and compound.
struct Multipliers {
    double capture_bonus = 1.0;
    double defensive_bonus = 1.0;
    double consecration_bonus = 1.0;
    double breakthrough_bonus = 1.0;
    double ally_bonus = 1.0;
    double authority_bonus = 1.0;
    double dominance_penalty = 1.0;

    [[nodiscard]] bool operator==(const Multipliers&) const noexcept = default;
};

/// Evolution data owned by one piece (keyed by its current square in EvolutionMap).
struct PieceEvolutionState {
    PieceType piece_type = PieceType::None;
    int evolution_level = 1;
    std::vector<AbilityInstance> abilities;
    Multipliers bonus;

    bool is_entrenched = false;
    bool is_consecrated_source = false;
    bool is_receiving_consecration = false;
    bool is_dominated = false;
    bool is_move_restricted = false;
    bool can_move_through = false;

    int consecration_radius = 0;
    int dominance_radius = 0;

    Bitboard territory_control = kEmptyBB;
    Bitboard cached_modified_moves = kEmptyBB;

    [[nodiscard]] bool operator==(const PieceEvolutionState&) const = default;

    [[nodiscard]] AbilityInstance* find_ability(std::string_view id) noexcept;
    [[nodiscard]] const AbilityInstance* find_ability(std::string_view id) const noexcept;
    [[nodiscard]] bool has_ability(std::string_view id) const noexcept {
        return find_ability(id) != nullptr;
    }

    /// Add `ability` unless one with the same id is already attached.
    bool add_ability(AbilityInstance ability);

    /// Clear every flag, multiplier and cached set; abilities and level stay.
    void reset_effects() noexcept;
};

/// A fresh state for a piece type with the given level and abilities.
[[nodiscard]] PieceEvolutionState make_evolution_state(PieceType pt, int level = 1,
                                                       std::vector<AbilityInstance> abilities = {});

/// Square → PieceEvolutionState, at most one entry per square.
///
/// The map does not know about the board; callers keep the invariant that
/// an entry only exists on an occupied square by migrating entries with
/// every accepted move (relocate) and dropping entries of captured pieces.
class EvolutionMap {
   public:
    [[nodiscard]] const PieceEvolutionState* get(Square sq) const noexcept;
    [[nodiscard]] PieceEvolutionState* get(Square sq) noexcept;
    [[nodiscard]] bool contains(Square sq) const noexcept { return get(sq) != nullptr; }

    void set(Square sq, PieceEvolutionState state);
    void erase(Square sq) noexcept;
    void clear() noexcept;

    /// Move the entry on `from` to `to`, discarding any stale entry on `to` first.
    /// With a promotion the entry's piece_type becomes the promoted type.
    void relocate(Square from, Square to, PieceType promotion = PieceType::None);

    /// Bitboard of all squares holding an entry.
    [[nodiscard]] Bitboard squares() const noexcept { return occupied_; }
    [[nodiscard]] int size() const noexcept { return popcount(occupied_); }
    [[nodiscard]] bool empty() const noexcept { return occupied_ == kEmptyBB; }

    [[nodiscard]] bool operator==(const EvolutionMap&) const = default;

   private:
    std::array<std::optional<PieceEvolutionState>, 64> entries_{};
    Bitboard occupied_ = kEmptyBB;
};

}  // namespace evochess
