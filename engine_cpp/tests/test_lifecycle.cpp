/// @file test_lifecycle.cpp
/// Tests for ability.hpp and lifecycle.hpp: catalogue, gates, conditions, stamping.

#include <evochess/ability.hpp>
#include <evochess/lifecycle.hpp>

#include <gtest/gtest.h>

using namespace evochess;
using lifecycle::TriggerContext;

namespace {

TriggerContext at(int ply, double now = 0.0) {
    TriggerContext ctx;
    ctx.current_ply = ply;
    ctx.move_count = ply;
    ctx.now_seconds = now;
    ctx.elapsed_seconds = now;
    ctx.piece_count = 32;
    return ctx;
}

}  // namespace

// ── Catalogue ───────────────────────────────────────────────────────────────

TEST(Ability, CatalogueCategories) {
    EXPECT_EQ(make_ability("enhanced-march").category, AbilityCategory::Movement);
    EXPECT_EQ(make_ability("giant-slayer").category, AbilityCategory::Capture);
    EXPECT_EQ(make_ability("fortress-defense").category, AbilityCategory::Passive);
    EXPECT_EQ(make_ability("royal-decree").category, AbilityCategory::Special);
    EXPECT_EQ(make_ability("something-new").category, AbilityCategory::Special);
    EXPECT_FALSE(catalogue_category("something-new").has_value());
    EXPECT_EQ(make_ability("teleport").name, "teleport");
}

TEST(Ability, KnownIdsIncludeEveryCategory) {
    const auto& ids = known_ability_ids();
    EXPECT_GE(ids.size(), 30u);
    for (std::string_view id : ids) EXPECT_TRUE(catalogue_category(id).has_value()) << id;
}

TEST(Ability, ParseVocabulary) {
    EXPECT_EQ(parse_category("capture"), AbilityCategory::Capture);
    EXPECT_FALSE(parse_category("Capture").has_value());
    EXPECT_EQ(parse_comparator(">="), Comparator::GreaterEqual);
    EXPECT_EQ(parse_comparator("=="), Comparator::Equal);
    EXPECT_FALSE(parse_comparator("!=").has_value());
    EXPECT_EQ(parse_region("back_rank"), BoardRegion::BackRank);
    EXPECT_EQ(to_string(AbilityCategory::Passive), "passive");
}

TEST(Ability, Regions) {
    EXPECT_TRUE(in_region(D4, BoardRegion::Center));
    EXPECT_TRUE(in_region(E5, BoardRegion::Center));
    EXPECT_FALSE(in_region(C4, BoardRegion::Center));
    EXPECT_TRUE(in_region(A4, BoardRegion::Edge));
    EXPECT_TRUE(in_region(H8, BoardRegion::Edge));
    EXPECT_TRUE(in_region(C8, BoardRegion::BackRank));
    EXPECT_FALSE(in_region(A4, BoardRegion::BackRank));
}

// ── Gates ───────────────────────────────────────────────────────────────────

TEST(Lifecycle, UngatedAbilityIsAlwaysUsable) {
    AbilityInstance a = make_ability("teleport");
    EXPECT_TRUE(lifecycle::can_trigger(a, at(0)));
    EXPECT_EQ(lifecycle::state_of(a, at(0)), lifecycle::AbilityState::Usable);
}

TEST(Lifecycle, PlyCooldown) {
    AbilityInstance a = make_ability("teleport");
    a.move_cooldown_plies = 3;
    lifecycle::stamp(a, at(4));

    EXPECT_FALSE(lifecycle::ply_ready(a, 5));
    EXPECT_FALSE(lifecycle::ply_ready(a, 6));
    EXPECT_TRUE(lifecycle::ply_ready(a, 7));
    EXPECT_FALSE(lifecycle::can_trigger(a, at(6)));
    EXPECT_TRUE(lifecycle::can_trigger(a, at(7)));
}

TEST(Lifecycle, WallClockCooldown) {
    AbilityInstance a = make_ability("knight-dash");
    a.cooldown_seconds = 5.0;
    lifecycle::stamp(a, at(0, 100.0));

    EXPECT_FALSE(lifecycle::wall_clock_ready(a, 104.9));
    EXPECT_TRUE(lifecycle::wall_clock_ready(a, 105.0));
}

TEST(Lifecycle, BothGatesMustBeOpen) {
    AbilityInstance a = make_ability("teleport");
    a.cooldown_seconds = 10.0;
    a.move_cooldown_plies = 2;
    lifecycle::stamp(a, at(0, 0.0));

    EXPECT_FALSE(lifecycle::gates_open(a, at(5, 1.0)));
    EXPECT_FALSE(lifecycle::gates_open(a, at(1, 20.0)));
    EXPECT_TRUE(lifecycle::gates_open(a, at(2, 10.0)));
}

TEST(Lifecycle, MaxUsesExhausts) {
    AbilityInstance a = make_ability("royal-decree");
    a.max_uses = 2;
    lifecycle::stamp(a, at(0));
    EXPECT_TRUE(lifecycle::can_trigger(a, at(1)));
    lifecycle::stamp(a, at(1));
    EXPECT_TRUE(a.exhausted());
    EXPECT_FALSE(lifecycle::can_trigger(a, at(50, 1000.0)));
}

TEST(Lifecycle, StampRecordsBothTimeBases) {
    AbilityInstance a = make_ability("teleport");
    lifecycle::stamp(a, at(9, 42.5));
    EXPECT_EQ(a.uses_so_far, 1);
    EXPECT_EQ(a.last_used_at_ply, 9);
    EXPECT_DOUBLE_EQ(*a.last_used_at, 42.5);
}

TEST(Lifecycle, ResetCooldownKeepsUsage) {
    AbilityInstance a = make_ability("teleport");
    a.move_cooldown_plies = 10;
    a.max_uses = 3;
    lifecycle::stamp(a, at(1));
    lifecycle::reset_cooldown(a);

    EXPECT_FALSE(a.last_used_at.has_value());
    EXPECT_FALSE(a.last_used_at_ply.has_value());
    EXPECT_EQ(a.uses_so_far, 1);
    EXPECT_TRUE(lifecycle::can_trigger(a, at(2)));
}

// ── Conditions ──────────────────────────────────────────────────────────────

TEST(Lifecycle, Comparators) {
    EXPECT_TRUE(lifecycle::compare(3, Comparator::Greater, 2));
    EXPECT_FALSE(lifecycle::compare(2, Comparator::Greater, 2));
    EXPECT_TRUE(lifecycle::compare(2, Comparator::GreaterEqual, 2));
    EXPECT_TRUE(lifecycle::compare(1, Comparator::Less, 2));
    EXPECT_TRUE(lifecycle::compare(2, Comparator::LessEqual, 2));
    EXPECT_TRUE(lifecycle::compare(2, Comparator::Equal, 2));
}

TEST(Lifecycle, MoveCountCondition) {
    AbilityInstance a = make_ability("berserker-rage");
    a.conditions.push_back({ConditionKind::MoveCount, Comparator::GreaterEqual, 10.0});
    EXPECT_FALSE(lifecycle::can_trigger(a, at(9)));
    EXPECT_TRUE(lifecycle::can_trigger(a, at(10)));
}

TEST(Lifecycle, PieceCountAndTimeConditions) {
    AbilityInstance a = make_ability("last-stand");
    a.conditions.push_back({ConditionKind::PieceCount, Comparator::Less, 10.0});
    a.conditions.push_back({ConditionKind::TimeElapsed, Comparator::Greater, 60.0});

    TriggerContext ctx = at(40, 61.0);
    ctx.piece_count = 8;
    EXPECT_TRUE(lifecycle::can_trigger(a, ctx));
    ctx.piece_count = 12;
    EXPECT_FALSE(lifecycle::can_trigger(a, ctx));
    ctx.piece_count = 8;
    ctx.elapsed_seconds = 30.0;
    EXPECT_FALSE(lifecycle::can_trigger(a, ctx));
}

TEST(Lifecycle, BoardPositionUsesMoveSource) {
    AbilityInstance a = make_ability("command-aura");
    Condition c;
    c.kind = ConditionKind::BoardPosition;
    c.region = BoardRegion::Center;
    a.conditions.push_back(c);

    TriggerContext ctx = at(0);
    EXPECT_FALSE(lifecycle::can_trigger(a, ctx));
    ctx.from = E4;
    EXPECT_TRUE(lifecycle::can_trigger(a, ctx));
    ctx.from = A1;
    EXPECT_FALSE(lifecycle::can_trigger(a, ctx));
}

// ── Cooldown info ───────────────────────────────────────────────────────────

TEST(Lifecycle, CooldownInfo) {
    AbilityInstance a = make_ability("knight-dash");
    a.cooldown_seconds = 5.0;
    a.move_cooldown_plies = 4;
    a.max_uses = 3;

    auto fresh = lifecycle::cooldown_info(a, at(0));
    EXPECT_DOUBLE_EQ(fresh.remaining_seconds, 0.0);
    EXPECT_EQ(fresh.remaining_plies, 0);
    EXPECT_EQ(fresh.uses_left, 3);

    lifecycle::stamp(a, at(2, 10.0));
    auto info = lifecycle::cooldown_info(a, at(3, 12.0));
    EXPECT_DOUBLE_EQ(info.remaining_seconds, 3.0);
    EXPECT_DOUBLE_EQ(info.total_seconds, 5.0);
    EXPECT_EQ(info.remaining_plies, 3);
    EXPECT_EQ(info.total_plies, 4);
    EXPECT_EQ(info.uses_left, 2);

    auto later = lifecycle::cooldown_info(a, at(20, 100.0));
    EXPECT_DOUBLE_EQ(later.remaining_seconds, 0.0);
    EXPECT_EQ(later.remaining_plies, 0);
}

TEST(Lifecycle, CooldownInfoWithoutGates) {
    auto info = lifecycle::cooldown_info(make_ability("teleport"), at(5));
    EXPECT_FALSE(info.uses_left.has_value());
    EXPECT_DOUBLE_EQ(info.total_seconds, 0.0);
}
