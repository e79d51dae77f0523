#include "table_state.hpp"

#include <algorithm>
#include <array>
#include <bitset>
#include <cmath>
#include <numbers>

namespace pool {

auto to_string(ball_id id) -> std::string
{
    if (id == ball_id::cue) return "cue";
    return std::to_string(number_of(id));
}

auto to_string(ball_group group) -> std::string
{
    switch (group) {
        case ball_group::solids: return "SOLIDS";
        case ball_group::stripes: return "STRIPES";
    }
    return "UNKNOWN";
}

auto to_string(seat s) -> std::string
{
    return s == seat::one ? "seat 1" : "seat 2";
}

auto to_string(game_phase phase) -> std::string
{
    switch (phase) {
        case game_phase::awaiting_break: return "AWAITING_BREAK";
        case game_phase::aiming: return "AIMING";
        case game_phase::ball_in_hand: return "BALL_IN_HAND";
        case game_phase::finished: return "FINISHED";
    }
    return "UNKNOWN";
}

auto to_string(foul_type foul) -> std::string
{
    switch (foul) {
        case foul_type::scratch: return "SCRATCH";
        case foul_type::no_contact: return "NO_CONTACT";
        case foul_type::no_rail: return "NO_RAIL";
        case foul_type::wrong_ball_first: return "WRONG_BALL_FIRST";
        case foul_type::early_eight_pocket: return "EARLY_8_POCKET";
    }
    return "UNKNOWN";
}

auto group_of(ball_id id) -> std::optional<ball_group>
{
    const auto number = number_of(id);
    if (number >= 1 && number <= 7) return ball_group::solids;
    if (number >= 9 && number <= 15) return ball_group::stripes;
    return {};
}

auto opponent(seat s) -> seat
{
    return s == seat::one ? seat::two : seat::one;
}

auto opposite(ball_group group) -> ball_group
{
    return group == ball_group::solids ? ball_group::stripes : ball_group::solids;
}

auto group_for(const table_state& state, seat s) -> std::optional<ball_group>
{
    return s == seat::one ? state.groups.seat_one : state.groups.seat_two;
}

auto remaining_balls(const table_state& state, ball_group group) -> std::vector<ball_id>
{
    auto remaining = std::vector<ball_id>{};
    for (const auto& b : state.balls) {
        if (b.in_play && group_of(b.id) == group) {
            remaining.push_back(b.id);
        }
    }
    return remaining;
}

auto is_group_cleared(const table_state& state, ball_group group) -> bool
{
    return remaining_balls(state, group).empty();
}

auto find_ball(table_state& state, ball_id id) -> ball*
{
    const auto it = std::ranges::find(state.balls, id, &ball::id);
    return it != state.balls.end() ? &*it : nullptr;
}

auto find_ball(const table_state& state, ball_id id) -> const ball*
{
    const auto it = std::ranges::find(state.balls, id, &ball::id);
    return it != state.balls.end() ? &*it : nullptr;
}

auto layout_error(const table_state& state) -> std::optional<std::string>
{
    auto seen = std::bitset<num_balls>{};
    for (const auto& b : state.balls) {
        const auto number = static_cast<std::size_t>(number_of(b.id));
        if (number >= num_balls) return fmt::format("ball id {} out of range", number);
        if (seen.test(number)) return fmt::format("ball {} appears twice", to_string(b.id));
        seen.set(number);
    }
    if (!seen.test(0)) return "layout has no cue ball";
    return {};
}

auto generate_rack(const table_config& table) -> std::vector<ball>
{
    // diamond with the 8-ball in the middle of the third row and a solid and
    // a stripe in the back corners
    static constexpr auto rack_order = std::array{
        1,
        9, 2,
        3, 8, 10,
        11, 4, 5, 12,
        6, 13, 14, 7, 15,
    };

    // a hair of space so racked balls never start overlapping
    static constexpr auto gap = 1e-4;

    const auto r = table.ball_radius;
    const auto row_spacing = (2.0 * r + gap) * std::cos(std::numbers::pi / 6.0);
    const auto col_spacing = 2.0 * r + gap;

    auto balls = std::vector<ball>{};
    balls.reserve(num_balls);
    balls.push_back(ball{ .id=ball_id::cue, .pos={table.head_string_x, table.height / 2.0} });

    auto index = std::size_t{0};
    for (int row = 0; row != 5; ++row) {
        const auto balls_in_row = row + 1;
        const auto x = table.foot_spot.x + row * row_spacing;
        const auto start_y = table.foot_spot.y - (balls_in_row - 1) * col_spacing / 2.0;
        for (int col = 0; col != balls_in_row; ++col) {
            const auto id = make_ball_id(rack_order[index++]);
            balls.push_back(ball{ .id=id, .pos={x, start_y + col * col_spacing} });
        }
    }

    return balls;
}

auto create_initial_table_state(const table_config& table) -> table_state
{
    return table_state{
        .balls = generate_rack(table),
        .pocketed = {},
        .groups = {},
        .open_table = true,
        .turn = seat::one,
        .phase = game_phase::awaiting_break,
        .ball_in_hand = false,
        .ball_in_hand_anywhere = false,
        .winner = {},
        .last_shot_summary = {},
    };
}

}
