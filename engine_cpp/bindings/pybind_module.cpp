/// @file pybind_module.cpp
/// pybind11 bindings for the evolution engine.
///
/// Exposes `_evochess_engine` Python module with an `Engine` class.
/// Communication uses FEN strings (positions), square names ("e4") and
/// UCI strings (moves) so Python never sees C++ types.

#include <evochess/engine.hpp>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace py = pybind11;

namespace {

evochess::PieceType promotion_from(const std::string& text) {
    return text.empty() ? evochess::PieceType::None : evochess::piece_type_from_char(text[0]);
}

std::string square_or_empty(std::optional<evochess::Square> sq) {
    return sq ? evochess::square_name(*sq) : std::string();
}

py::dict to_dict(const evochess::MoveResult& r) {
    py::list abilities;
    for (const auto& a : r.abilities) {
        abilities.append(py::make_tuple(a.ability_id, a.effect, a.success, a.magnitude));
    }
    py::dict d;
    d["success"] = r.success;
    d["error"] = std::string(evochess::to_string(r.error));
    d["reason"] = r.reason;
    d["uci"] = r.success ? r.move.uci() : std::string();
    d["san"] = r.san;
    d["ability_id"] = r.ability_id;
    d["synthetic"] = r.synthetic;
    d["capture"] = r.capture;
    d["dash_pending"] = r.dash_pending;
    d["elegance_score"] = r.elegance_score;
    d["abilities"] = abilities;
    d["fen"] = r.fen;
    return d;
}

}  // namespace

PYBIND11_MODULE(_evochess_engine, m) {
    m.doc() = "Evolution-augmented chess rules engine (pybind11)";

    // ── Engine class ────────────────────────────────────────────────────
    py::class_<evochess::EvolutionEngine>(m, "Engine")
        .def(py::init([](const std::string& fen) {
                 evochess::EngineConfig config;
                 if (!fen.empty()) config.starting_fen = fen;
                 return evochess::EvolutionEngine(config);
             }),
             py::arg("fen") = "", "Create an engine, optionally from a starting FEN.")

        .def("load_fen", &evochess::EvolutionEngine::load_from_fen, py::arg("fen"),
             "Load a FEN. Returns False and keeps the game when the FEN is invalid.")
        .def("reset", &evochess::EvolutionEngine::reset)
        .def("fen", &evochess::EvolutionEngine::current_fen)
        .def("ply", &evochess::EvolutionEngine::current_ply)

        .def(
            "make_move",
            [](evochess::EvolutionEngine& self, const std::string& from, const std::string& to,
               const std::string& promotion, bool grant_dash) {
                evochess::MoveOptions options;
                options.promotion = promotion_from(promotion);
                options.grant_dash = grant_dash;
                return to_dict(self.make_move(from, to, options));
            },
            py::arg("from_sq"), py::arg("to_sq"), py::arg("promotion") = "",
            py::arg("grant_dash") = false,
            R"doc(Play *from_sq* -> *to_sq* ("e2", "e4").

Returns a dict with ``success``, ``error``, ``reason``, ``uci``, ``san``,
``ability_id``, ``synthetic``, ``capture``, ``dash_pending``,
``elegance_score``, ``abilities`` and ``fen``.)doc")

        .def(
            "make_move_from_notation",
            [](evochess::EvolutionEngine& self, const std::string& text) {
                return to_dict(self.make_move_from_notation(text));
            },
            py::arg("text"), "Play a SAN or UCI move.")

        .def(
            "legal_moves",
            [](evochess::EvolutionEngine& self, const std::string& square) {
                std::optional<evochess::Square> sq;
                if (!square.empty()) {
                    sq = evochess::parse_square(square);
                    if (*sq == evochess::kNoSquare) return std::vector<py::tuple>{};
                }
                std::vector<py::tuple> out;
                for (const auto& em : self.legal_moves(sq)) {
                    out.push_back(py::make_tuple(em.uci(), em.ability_id, em.synthetic));
                }
                return out;
            },
            py::arg("square") = "",
            "List ``(uci, ability_id, synthetic)`` for one square or the side to move.")

        .def(
            "is_enhanced_move_legal",
            [](evochess::EvolutionEngine& self, const std::string& from, const std::string& to) {
                return self.is_enhanced_move_legal(evochess::parse_square(from),
                                                   evochess::parse_square(to));
            },
            py::arg("from_sq"), py::arg("to_sq"))

        .def(
            "elegance_score",
            [](evochess::EvolutionEngine& self, const std::string& from, const std::string& to) {
                return self.calculate_elegance_score(evochess::parse_square(from),
                                                     evochess::parse_square(to));
            },
            py::arg("from_sq"), py::arg("to_sq"),
            "Score a move without playing it. None when the move is not available.")

        .def("pending_dash",
             [](const evochess::EvolutionEngine& self) {
                 return square_or_empty(self.pending_dash());
             })
        .def("skip_dash", &evochess::EvolutionEngine::skip_dash)

        .def(
            "set_evolution",
            [](evochess::EvolutionEngine& self, const std::string& square, int level,
               const std::vector<std::string>& ability_ids) {
                std::vector<evochess::AbilityInstance> abilities;
                for (const auto& id : ability_ids) abilities.push_back(evochess::make_ability(id));
                return self.set_piece_evolution(
                    evochess::parse_square(square),
                    evochess::make_evolution_state(evochess::PieceType::None, level,
                                                   std::move(abilities)));
            },
            py::arg("square"), py::arg("level") = 1,
            py::arg("abilities") = std::vector<std::string>{},
            "Attach an evolution to the piece on *square*. False on an empty square.")

        .def(
            "remove_evolution",
            [](evochess::EvolutionEngine& self, const std::string& square) {
                return self.remove_piece_evolution(evochess::parse_square(square));
            },
            py::arg("square"))

        .def("sync_evolutions", &evochess::EvolutionEngine::sync_piece_evolutions_with_board)

        .def(
            "game_state",
            [](const evochess::EvolutionEngine& self) {
                const evochess::GameState gs = self.game_state();
                py::dict d;
                d["fen"] = gs.fen;
                d["side_to_move"] = gs.side_to_move == evochess::Color::White ? "w" : "b";
                d["in_check"] = gs.in_check;
                d["checkmate"] = gs.checkmate;
                d["stalemate"] = gs.stalemate;
                d["draw"] = gs.draw;
                d["game_over"] = gs.game_over;
                d["move_history"] = gs.move_history;
                d["last_elegance_score"] = gs.last_elegance_score;
                d["pending_dash"] = square_or_empty(gs.pending_dash);
                return d;
            })

        .def("synergies", [](const evochess::EvolutionEngine& self) {
            std::vector<std::tuple<std::string, double>> out;
            for (const auto& s : self.calculate_board_synergies()) out.emplace_back(s.name, s.bonus);
            return out;
        });
}
