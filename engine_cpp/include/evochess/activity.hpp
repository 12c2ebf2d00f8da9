#pragma once

/// @file activity.hpp
/// Upgrade state and the injected "is this ability active" predicate.

#include <evochess/ability.hpp>
#include <evochess/types.hpp>

#include <array>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace evochess {

// ── Upgrades ────────────────────────────────────────────────────────────────

/// Funded upgrade values for one piece type. Fields that do not apply to the
/// type are ignored; defaults are the un-upgraded baseline.
struct PieceUpgrades {
    // pawn
    int march_speed = 1;
    int resilience = 0;
    // knight
    double dash_chance = 0.1;
    int dash_cooldown = 5;
    // bishop
    int snipe_range = 1;
    int consecration_turns = 3;
    // rook
    int entrench_threshold = 3;
    int entrench_power = 1;
    // queen
    int dominance_aura_range = 2;
    double mana_regen_bonus = 0.0;
    // king
    int royal_decree_uses = 0;
    double last_stand_threshold = 0.2;

    [[nodiscard]] bool operator==(const PieceUpgrades&) const noexcept = default;
};

/// Upgrades indexed by piece_index (Pawn=0 .. King=5).
class UpgradeTable {
   public:
    [[nodiscard]] const PieceUpgrades& get(PieceType pt) const noexcept {
        return table_[slot(pt)];
    }
    void set(PieceType pt, const PieceUpgrades& u) noexcept { table_[slot(pt)] = u; }

   private:
    [[nodiscard]] static std::size_t slot(PieceType pt) noexcept {
        int i = piece_index(pt);
        return static_cast<std::size_t>(i < 0 ? 0 : i);
    }
    std::array<PieceUpgrades, kNumPieceTypes> table_{};
};

/// Abilities the upgrades of `pt` unlock.
[[nodiscard]] std::vector<AbilityInstance> abilities_from_upgrades(PieceType pt,
                                                                   const PieceUpgrades& u);

/// Evolution level implied by the upgrades of `pt` (never below 1).
[[nodiscard]] int evolution_level(PieceType pt, const PieceUpgrades& u) noexcept;

// ── Activity predicate ──────────────────────────────────────────────────────

/// Read-only "has the player unlocked/funded this" query.
/// Implementations must be side-effect-free and must not call back into the engine.
class ActivityProvider {
   public:
    virtual ~ActivityProvider() = default;

    [[nodiscard]] virtual bool is_ability_active(std::string_view ability_id, PieceType pt,
                                                 const PieceUpgrades& upgrades) const = 0;
};

/// Every ability attached to a piece is active.
class AttachedActivityProvider final : public ActivityProvider {
   public:
    [[nodiscard]] bool is_ability_active(std::string_view, PieceType,
                                         const PieceUpgrades&) const override {
        return true;
    }
};

/// Active when the upgrades derive the ability or it was unlocked explicitly
/// for the piece type.
class UpgradeActivityProvider final : public ActivityProvider {
   public:
    void unlock(PieceType pt, std::string_view ability_id);
    void lock(PieceType pt, std::string_view ability_id);

    [[nodiscard]] bool is_ability_active(std::string_view ability_id, PieceType pt,
                                         const PieceUpgrades& upgrades) const override;

   private:
    std::set<std::pair<PieceType, std::string>> unlocked_;
};

/// Wraps any callable with the predicate's signature.
class CallbackActivityProvider final : public ActivityProvider {
   public:
    using Callback = std::function<bool(std::string_view, PieceType, const PieceUpgrades&)>;

    explicit CallbackActivityProvider(Callback cb) : cb_(std::move(cb)) {}

    [[nodiscard]] bool is_ability_active(std::string_view ability_id, PieceType pt,
                                         const PieceUpgrades& upgrades) const override {
        return cb_ && cb_(ability_id, pt, upgrades);
    }

   private:
    Callback cb_;
};

}  // namespace evochess
