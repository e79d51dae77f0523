#include "table_state.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <set>
#include <string>
#include <vector>

using namespace pool;

static_assert(has_to_string_free_function<ball_id>);
static_assert(has_to_string_free_function<vec2>);
static_assert(!has_to_string_free_function<fmt::string_view>);
static_assert(!has_to_string_free_function<std::string>);

TEST(table_state, rack_has_every_ball_once)
{
    const auto balls = generate_rack();
    ASSERT_EQ(balls.size(), num_balls);

    auto ids = std::set<int>{};
    for (const auto& b : balls) {
        ids.insert(number_of(b.id));
        EXPECT_TRUE(b.in_play);
        EXPECT_EQ(b.vel, vec2(0.0, 0.0));
    }
    EXPECT_EQ(ids.size(), num_balls);
    EXPECT_EQ(*ids.begin(), 0);
    EXPECT_EQ(*ids.rbegin(), 15);
}

TEST(table_state, rack_layout)
{
    const auto& t = default_table;
    auto state = create_initial_table_state();

    const auto* cue = find_ball(state, ball_id::cue);
    ASSERT_NE(cue, nullptr);
    EXPECT_DOUBLE_EQ(cue->pos.x, t.head_string_x);
    EXPECT_DOUBLE_EQ(cue->pos.y, t.height / 2.0);

    const auto* apex = find_ball(state, make_ball_id(1));
    ASSERT_NE(apex, nullptr);
    EXPECT_EQ(apex->pos, t.foot_spot);

    // 8-ball sits in the middle of the third row
    const auto* eight = find_ball(state, ball_id::eight);
    ASSERT_NE(eight, nullptr);
    EXPECT_NEAR(eight->pos.y, t.foot_spot.y, 1e-12);
    EXPECT_GT(eight->pos.x, apex->pos.x);

    // back corners hold one of each group
    const auto* left_corner = find_ball(state, make_ball_id(6));
    const auto* right_corner = find_ball(state, make_ball_id(15));
    ASSERT_NE(left_corner, nullptr);
    ASSERT_NE(right_corner, nullptr);
    EXPECT_NE(group_of(left_corner->id), group_of(right_corner->id));
    EXPECT_NEAR(left_corner->pos.x, right_corner->pos.x, 1e-12);
}

TEST(table_state, racked_balls_do_not_overlap)
{
    const auto balls = generate_rack();
    for (std::size_t i = 0; i != balls.size(); ++i) {
        for (std::size_t j = i + 1; j != balls.size(); ++j) {
            EXPECT_GE(glm::distance(balls[i].pos, balls[j].pos), 2.0 * default_table.ball_radius)
                << to_string(balls[i].id) << " and " << to_string(balls[j].id);
        }
    }
}

TEST(table_state, initial_state)
{
    const auto state = create_initial_table_state();
    EXPECT_EQ(state.phase, game_phase::awaiting_break);
    EXPECT_EQ(state.turn, seat::one);
    EXPECT_TRUE(state.open_table);
    EXPECT_TRUE(state.pocketed.empty());
    EXPECT_FALSE(state.groups.seat_one);
    EXPECT_FALSE(state.groups.seat_two);
    EXPECT_FALSE(state.ball_in_hand);
    EXPECT_FALSE(state.winner);
    EXPECT_FALSE(state.last_shot_summary);
}

TEST(table_state, groups_by_number)
{
    EXPECT_EQ(group_of(make_ball_id(1)), ball_group::solids);
    EXPECT_EQ(group_of(make_ball_id(7)), ball_group::solids);
    EXPECT_EQ(group_of(make_ball_id(9)), ball_group::stripes);
    EXPECT_EQ(group_of(make_ball_id(15)), ball_group::stripes);
    EXPECT_FALSE(group_of(ball_id::eight));
    EXPECT_FALSE(group_of(ball_id::cue));
}

TEST(table_state, opponents)
{
    EXPECT_EQ(opponent(seat::one), seat::two);
    EXPECT_EQ(opponent(seat::two), seat::one);
    EXPECT_EQ(opposite(ball_group::solids), ball_group::stripes);
    EXPECT_EQ(opposite(ball_group::stripes), ball_group::solids);
}

TEST(table_state, remaining_and_cleared)
{
    auto state = create_initial_table_state();
    EXPECT_EQ(remaining_balls(state, ball_group::solids).size(), 7u);
    EXPECT_FALSE(is_group_cleared(state, ball_group::solids));

    for (auto& b : state.balls) {
        if (group_of(b.id) == ball_group::solids) b.in_play = false;
    }
    EXPECT_TRUE(remaining_balls(state, ball_group::solids).empty());
    EXPECT_TRUE(is_group_cleared(state, ball_group::solids));
    EXPECT_EQ(remaining_balls(state, ball_group::stripes).size(), 7u);
}

TEST(table_state, group_lookup_by_seat)
{
    auto state = create_initial_table_state();
    state.groups = group_assignments{ .seat_one=ball_group::stripes, .seat_two=ball_group::solids };
    EXPECT_EQ(group_for(state, seat::one), ball_group::stripes);
    EXPECT_EQ(group_for(state, seat::two), ball_group::solids);
}

TEST(table_state, names)
{
    EXPECT_EQ(to_string(ball_id::cue), "cue");
    EXPECT_EQ(to_string(ball_id::eight), "8");
    EXPECT_EQ(to_string(make_ball_id(13)), "13");
    EXPECT_EQ(to_string(foul_type::early_eight_pocket), "EARLY_8_POCKET");
    EXPECT_EQ(to_string(game_phase::ball_in_hand), "BALL_IN_HAND");
    EXPECT_EQ(fmt::format("{}", vec2{1.0, 0.5}), "(1.0000, 0.5000)");
}

TEST(table_state, layout_errors)
{
    auto state = create_initial_table_state();
    EXPECT_FALSE(layout_error(state));

    auto twice = state;
    twice.balls.push_back(ball{ .id=make_ball_id(3), .pos={1.0, 0.5} });
    EXPECT_EQ(layout_error(twice), "ball 3 appears twice");

    auto no_cue = state;
    std::erase_if(no_cue.balls, [](const ball& b) { return b.id == ball_id::cue; });
    EXPECT_EQ(layout_error(no_cue), "layout has no cue ball");

    auto unknown = state;
    unknown.balls.push_back(ball{ .id=make_ball_id(20), .pos={1.0, 0.5} });
    EXPECT_EQ(layout_error(unknown), "ball id 20 out of range");
}

TEST(table_state, formats_through_fmt)
{
    EXPECT_EQ(fmt::format("{}", ball_id::cue), "cue");
    EXPECT_EQ(fmt::format("{}", make_ball_id(11)), "11");
    EXPECT_EQ(fmt::format("{}", foul_type::no_rail), "NO_RAIL");
    EXPECT_EQ(fmt::format("{}", vec2{1.0, 0.5}), "(1.0000, 0.5000)");
}
