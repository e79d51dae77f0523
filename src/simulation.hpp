#pragma once
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "utility.hpp"
#include "table.hpp"
#include "table_state.hpp"
#include "collision.hpp"

namespace pool {

struct ball_ball_event
{
    ball_id a;
    ball_id b;
    f64     speed; // approach speed along the line of centres
    vec2    pos;   // contact point
};

struct ball_cushion_event
{
    ball_id ball;
    cushion side;
    f64     speed; // speed into the cushion
    vec2    pos;
};

struct ball_pocket_event
{
    ball_id     ball;
    std::size_t pocket;
    f64         speed;
    vec2        pos;
};

using keyframe_event = std::variant<ball_ball_event, ball_cushion_event, ball_pocket_event>;

struct ball_snapshot
{
    ball_id id;
    vec2    pos;
    bool    in_play;
};

struct keyframe
{
    f64                         time; // ms from the start of the shot
    std::vector<ball_snapshot>  balls;
    std::vector<keyframe_event> events;
};

struct simulation_result
{
    table_state           final_state;
    std::vector<keyframe> keyframes;
    shot_summary          summary;
    u32                   frames = 0;
    bool                  settled = false;
};

enum class shot_error_code
{
    cue_ball_not_in_play,
    invalid_parameters,
    invalid_layout,
};

struct shot_error
{
    shot_error_code code;
    std::string     message;
};

// Per-shot ball state. The rolling and contact flags only live for the
// duration of one simulation and never reach the table_state.
struct sim_ball
{
    ball_id id;
    vec2    pos;
    vec2    vel  = {0.0, 0.0};
    vec2    spin = {0.0, 0.0};
    bool    in_play = true;
    bool    has_hit_cue_contact = false; // first ball touched, until the cue spin is transferred to it
    bool    is_rolling = false;
};

class simulation
{
    table_config   d_table;
    physics_config d_physics;

    std::vector<sim_ball>       d_balls; // sorted by id, cue ball first
    std::vector<keyframe_event> d_pending_events;

    std::optional<ball_id>         d_first_contact;
    std::vector<ball_id>           d_pocketed;
    std::map<ball_id, std::size_t> d_pocket_indices;
    bool                           d_scratch = false;
    bool                           d_rail_after_contact = false;

    auto integrate() -> void;
    auto resolve_ball_collisions() -> void;
    auto fix_positions() -> void;
    auto apply_cue_spin(sim_ball& cue, sim_ball& struck, vec2 cue_vel_before) -> void;
    auto handle_pockets() -> void;
    auto capture(sim_ball& b, std::size_t pocket) -> void;
    auto resolve_cushions() -> void;

public:
    simulation(const table_state& state, const table_config& table, const physics_config& physics);

    // Sets the cue ball moving. Returns false if there is no cue ball in play.
    auto strike(const shot_params& params) -> bool;

    // Advances one fixed time step.
    auto step() -> void;

    auto is_at_rest() const -> bool;

    // Positions of every ball plus any events since the last snapshot.
    auto snapshot(f64 time_ms) -> keyframe;

    auto balls() const -> const std::vector<sim_ball>& { return d_balls; }
    auto get(ball_id id) -> sim_ball&;
    auto get(ball_id id) const -> const sim_ball&;

    auto first_contact() const -> std::optional<ball_id> { return d_first_contact; }
    auto pocketed() const -> const std::vector<ball_id>& { return d_pocketed; }
    auto pocket_indices() const -> const std::map<ball_id, std::size_t>& { return d_pocket_indices; }
    auto scratch() const -> bool { return d_scratch; }
    auto rail_after_contact() const -> bool { return d_rail_after_contact; }
};

// Initial cue ball speed for a normalized power.
auto shot_speed(f64 power, const physics_config& physics = default_physics) -> f64;

// Runs a shot until every ball settles (or the frame cap is hit) and derives
// the shot summary from what happened.
auto simulate_shot(
    const table_state& state,
    const shot_params& params,
    const table_config& table = default_table,
    const physics_config& physics = default_physics
)
    -> std::expected<simulation_result, shot_error>;

}
