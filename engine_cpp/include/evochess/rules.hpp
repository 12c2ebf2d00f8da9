#pragma once

/// @file rules.hpp
/// Game-status queries on top of the rules oracle: mate, stalemate, draws.

#include <evochess/position.hpp>

namespace evochess::rules {

[[nodiscard]] bool is_checkmate(Position& pos);

[[nodiscard]] bool is_stalemate(Position& pos);

/// K v K, K+minor v K, and K+B v K+B with bishops on the same square color.
[[nodiscard]] bool is_insufficient_material(const Position& pos) noexcept;

/// 50-move rule, threefold repetition, or insufficient material.
[[nodiscard]] bool is_draw(const Position& pos);

[[nodiscard]] bool is_game_over(Position& pos);

}  // namespace evochess::rules
