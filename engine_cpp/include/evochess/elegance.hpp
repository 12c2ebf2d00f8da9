#pragma once

/// @file elegance.hpp
/// Tactical-quality rating of a played move.

#include <evochess/position.hpp>

namespace evochess::elegance {

/// Tactical motifs found in one move.
struct Factors {
    bool checkmate = false;
    bool sacrifice = false;
    bool fork = false;
    bool pin = false;
    bool skewer = false;
    bool discovered_attack = false;
    bool double_check = false;
    bool smothered_mate = false;
    bool back_rank_mate = false;
    double efficiency = 0.0;
    double complexity = 0.0;
};

/// Analyse the move from..to that turned `before` into `after`.
/// `history_length` is the number of moves played before this one.
[[nodiscard]] Factors analyze(const Position& before, const Position& after, Square from,
                              Square to, int history_length);

/// Score computed from factors:
///   checkmate pattern (back rank 25, else smothered 100, otherwise 20)
///   + sacrifice 15, fork 10, pin 8, skewer 8, discovered 12, double check 20,
///     smothered mate 50, back-rank mate 25
///   then × (1 + efficiency) × (1 + complexity), rounded.
[[nodiscard]] int score(const Factors& f) noexcept;

[[nodiscard]] int score(const Position& before, const Position& after, Square from, Square to,
                        int history_length);

}  // namespace evochess::elegance
