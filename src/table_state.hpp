#pragma once
#include "utility.hpp"
#include "table.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pool {

// The cue ball is 0, object balls use their printed number.
enum class ball_id : u8
{
    cue = 0,
    eight = 8,
};

inline constexpr auto num_balls = std::size_t{16};

constexpr auto make_ball_id(int number) -> ball_id { return static_cast<ball_id>(number); }
constexpr auto number_of(ball_id id) -> int { return static_cast<int>(id); }

enum class ball_group
{
    solids,
    stripes,
};

enum class seat : u8
{
    one = 1,
    two = 2,
};

enum class game_phase
{
    awaiting_break,
    aiming,
    ball_in_hand,
    finished,
};

enum class foul_type
{
    scratch,
    no_contact,
    no_rail,
    wrong_ball_first,
    early_eight_pocket,
};

struct ball
{
    ball_id id;
    vec2    pos;
    vec2    vel  = {0.0, 0.0};
    vec2    spin = {0.0, 0.0}; // x is side spin, y is follow (+) / draw (-)
    bool    in_play = true;
};

struct group_assignments
{
    std::optional<ball_group> seat_one;
    std::optional<ball_group> seat_two;
};

struct shot_params
{
    f64 angle;        // radians, 0 points along +x
    f64 power;        // 0..1
    f64 spin_x = 0.0; // -1..1 side spin
    f64 spin_y = 0.0; // -1..1 top (+) / back (-) spin
    std::optional<std::size_t> called_pocket;
};

struct shot_summary
{
    std::optional<ball_id>     first_contact;
    std::vector<ball_id>       pocketed_balls;
    bool                       scratch = false;
    bool                       rail_after_contact = false;
    std::optional<foul_type>   foul;
    std::optional<std::string> foul_reason;
    bool                       turn_changed = false;
    bool                       game_over = false;
    std::optional<seat>        winner;
    std::map<ball_id, std::size_t> pocket_indices;
};

struct table_state
{
    std::vector<ball>           balls;
    std::vector<ball_id>        pocketed;
    group_assignments           groups;
    bool                        open_table = true;
    seat                        turn = seat::one;
    game_phase                  phase = game_phase::awaiting_break;
    bool                        ball_in_hand = false;
    bool                        ball_in_hand_anywhere = false;
    std::optional<seat>         winner;
    std::optional<shot_summary> last_shot_summary;
};

auto to_string(ball_id id) -> std::string;
auto to_string(ball_group group) -> std::string;
auto to_string(seat s) -> std::string;
auto to_string(game_phase phase) -> std::string;
auto to_string(foul_type foul) -> std::string;

// Solids are 1-7 and stripes 9-15, the cue ball and 8-ball belong to neither.
auto group_of(ball_id id) -> std::optional<ball_group>;
auto opponent(seat s) -> seat;
auto opposite(ball_group group) -> ball_group;

auto group_for(const table_state& state, seat s) -> std::optional<ball_group>;
auto remaining_balls(const table_state& state, ball_group group) -> std::vector<ball_id>;
auto is_group_cleared(const table_state& state, ball_group group) -> bool;

auto find_ball(table_state& state, ball_id id) -> ball*;
auto find_ball(const table_state& state, ball_id id) -> const ball*;

// Describes the first broken structural invariant of a layout (one cue ball,
// each object ball at most once, ids in range), or nothing if it is sound.
auto layout_error(const table_state& state) -> std::optional<std::string>;

auto generate_rack(const table_config& table = default_table) -> std::vector<ball>;
auto create_initial_table_state(const table_config& table = default_table) -> table_state;

}
