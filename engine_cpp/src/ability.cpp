/// @file ability.cpp
/// Ability catalogue and condition vocabulary.

#include <evochess/ability.hpp>

namespace evochess {

namespace {

struct CatalogueEntry {
    std::string_view id;
    AbilityCategory category;
};

// clang-format off
constexpr CatalogueEntry kCatalogue[] = {
    {"enhanced-march",      AbilityCategory::Movement},
    {"diagonal-move",       AbilityCategory::Movement},
    {"extended-range",      AbilityCategory::Movement},
    {"pawn-advance",        AbilityCategory::Movement},
    {"knight-dash",         AbilityCategory::Special},
    {"knight-leap",         AbilityCategory::Special},
    {"rook-entrench",       AbilityCategory::Special},
    {"bishop-consecrate",   AbilityCategory::Special},
    {"queen-dominance",     AbilityCategory::Special},
    {"teleport",            AbilityCategory::Special},
    {"breakthrough",        AbilityCategory::Special},
    {"phase-through",       AbilityCategory::Special},
    {"zone-control",        AbilityCategory::Special},
    {"protective-aura",     AbilityCategory::Special},
    {"immobilize-resist",   AbilityCategory::Special},
    {"berserker-rage",      AbilityCategory::Special},
    {"backstab",            AbilityCategory::Special},
    {"heal-allies",         AbilityCategory::Special},
    {"time-ward",           AbilityCategory::Special},
    {"command-aura",        AbilityCategory::Special},
    {"predict-moves",       AbilityCategory::Special},
    {"enhanced-vision",     AbilityCategory::Special},
    {"area-strike",         AbilityCategory::Special},
    {"resilient-stance",    AbilityCategory::Special},
    {"battlefield-command", AbilityCategory::Special},
    {"stealth-mode",        AbilityCategory::Special},
    {"divine-intervention", AbilityCategory::Special},
    {"divine-authority",    AbilityCategory::Special},
    {"imperial-guard",      AbilityCategory::Special},
    {"divine-protection",   AbilityCategory::Special},
    {"royal-decree",        AbilityCategory::Special},
    {"last-stand",          AbilityCategory::Special},
    {"enhanced-capture",    AbilityCategory::Capture},
    {"giant-slayer",        AbilityCategory::Capture},
    {"first-strike",        AbilityCategory::Capture},
    {"chain-capture",       AbilityCategory::Capture},
    {"fortress-defense",    AbilityCategory::Passive},
    {"mana-regeneration",   AbilityCategory::Passive},
};
// clang-format on

}  // namespace

std::string_view to_string(AbilityCategory c) noexcept {
    switch (c) {
        case AbilityCategory::Movement:
            return "movement";
        case AbilityCategory::Capture:
            return "capture";
        case AbilityCategory::Special:
            return "special";
        case AbilityCategory::Passive:
            return "passive";
    }
    return "special";
}

std::optional<AbilityCategory> parse_category(std::string_view text) noexcept {
    if (text == "movement") return AbilityCategory::Movement;
    if (text == "capture") return AbilityCategory::Capture;
    if (text == "special") return AbilityCategory::Special;
    if (text == "passive") return AbilityCategory::Passive;
    return std::nullopt;
}

std::optional<Comparator> parse_comparator(std::string_view text) noexcept {
    if (text == ">") return Comparator::Greater;
    if (text == "<") return Comparator::Less;
    if (text == "=" || text == "==") return Comparator::Equal;
    if (text == ">=") return Comparator::GreaterEqual;
    if (text == "<=") return Comparator::LessEqual;
    return std::nullopt;
}

std::optional<BoardRegion> parse_region(std::string_view text) noexcept {
    if (text == "center") return BoardRegion::Center;
    if (text == "edge") return BoardRegion::Edge;
    if (text == "back_rank") return BoardRegion::BackRank;
    return std::nullopt;
}

bool in_region(Square sq, BoardRegion region) noexcept {
    const int f = file_of(sq);
    const int r = rank_of(sq);
    switch (region) {
        case BoardRegion::Center:
            return f >= 3 && f <= 4 && r >= 3 && r <= 4;
        case BoardRegion::Edge:
            return f == 0 || f == 7 || r == 0 || r == 7;
        case BoardRegion::BackRank:
            return r == 0 || r == 7;
    }
    return false;
}

std::optional<AbilityCategory> catalogue_category(std::string_view id) noexcept {
    for (const auto& entry : kCatalogue) {
        if (entry.id == id) return entry.category;
    }
    return std::nullopt;
}

const std::vector<std::string_view>& known_ability_ids() {
    static const std::vector<std::string_view> ids = [] {
        std::vector<std::string_view> out;
        for (const auto& entry : kCatalogue) out.push_back(entry.id);
        return out;
    }();
    return ids;
}

AbilityInstance make_ability(std::string_view id) {
    AbilityInstance a;
    a.id = std::string(id);
    a.name = a.id;
    a.category = catalogue_category(id).value_or(AbilityCategory::Special);
    return a;
}

}  // namespace evochess
