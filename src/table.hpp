#pragma once
#include "utility.hpp"

#include <array>
#include <cstddef>

namespace pool {

// Dimensions of a 9ft table in metres. The origin is the top left outer corner
// of the table, x runs along the long side and y along the short side.
struct table_config
{
    f64 width          = 2.54;
    f64 height         = 1.27;
    f64 cushion        = 0.05;
    f64 ball_radius    = 0.028575; // 2.25" ball
    f64 head_string_x  = 0.635;
    vec2 foot_spot     = {1.905, 0.635};

    std::array<vec2, 6> pockets = {
        vec2{0.05,        0.05},
        vec2{2.54 / 2.0,  0.04},
        vec2{2.54 - 0.05, 0.05},
        vec2{0.05,        1.27 - 0.05},
        vec2{2.54 / 2.0,  1.27 - 0.04},
        vec2{2.54 - 0.05, 1.27 - 0.05},
    };

    auto left() const -> f64 { return cushion; }
    auto right() const -> f64 { return width - cushion; }
    auto top() const -> f64 { return cushion; }
    auto bottom() const -> f64 { return height - cushion; }
};

struct physics_config
{
    // simulation
    f64 time_step         = 1.0 / 240.0;
    f64 keyframe_interval = 0.033; // seconds
    u32 max_frames        = 30000;
    u32 settle_frames     = 10;

    // restitution
    f64 cushion_restitution = 0.8;
    f64 ball_restitution    = 0.95;

    // sliding -> rolling friction
    f64 sliding_friction         = 0.2;
    f64 rolling_friction         = 0.015;
    f64 gravity                  = 9.81;
    f64 rolling_transition_speed = 0.5;

    f64 min_velocity = 0.008;

    // power^power_exponent * power_to_velocity = initial cue ball speed
    f64 power_to_velocity = 8.0;
    f64 power_exponent    = 1.3;

    // pocket gravity well
    f64 pocket_mouth_radius       = 0.072;
    f64 pocket_commit_radius      = 0.046;
    f64 pocket_capture_band       = 0.012;
    f64 pocket_pull_strength      = 14.0;
    f64 pocket_tangential_damping = 21.0; // 1/s at the pocket centre

    // spin
    f64 spin_decay            = 0.995; // per frame
    f64 throw_strength        = 0.05;
    f64 follow_draw_strength  = 0.5;
    f64 cushion_spin_strength = 0.15;

    f64 min_rail_speed        = 0.05;
    f64 separation_epsilon    = 0.001;
    u32 max_separation_passes = 256;
};

inline constexpr auto default_table = table_config{};
inline constexpr auto default_physics = physics_config{};

}
