#include "simulation.hpp"
#include "rules.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pool {
namespace {

auto perpendicular(vec2 v) -> vec2
{
    return {-v.y, v.x};
}

auto is_valid(const shot_params& params) -> bool
{
    return std::isfinite(params.angle)
        && std::isfinite(params.power) && params.power >= 0.0 && params.power <= 1.0
        && std::isfinite(params.spin_x) && std::abs(params.spin_x) <= 1.0
        && std::isfinite(params.spin_y) && std::abs(params.spin_y) <= 1.0;
}

auto nearest_pocket(vec2 pos, const table_config& table) -> std::size_t
{
    auto best = std::numeric_limits<f64>::infinity();
    auto index = std::size_t{0};
    for (std::size_t i = 0; i != table.pockets.size(); ++i) {
        const auto d = length_sq(table.pockets[i] - pos);
        if (d < best) {
            best = d;
            index = i;
        }
    }
    return index;
}

auto build_final_state(const table_state& original, const simulation& sim) -> table_state
{
    auto final_state = original;
    for (auto& b : final_state.balls) {
        const auto& s = sim.get(b.id);
        b.pos = s.pos;
        b.in_play = s.in_play;
        b.vel = {0.0, 0.0};
        b.spin = {0.0, 0.0};
    }
    final_state.pocketed.insert(final_state.pocketed.end(), sim.pocketed().begin(), sim.pocketed().end());
    return final_state;
}

}

simulation::simulation(const table_state& state, const table_config& table, const physics_config& physics)
    : d_table{table}
    , d_physics{physics}
{
    const auto error = layout_error(state);
    assert_that(!error, error.value_or(""));
    d_balls.reserve(state.balls.size());
    for (const auto& b : state.balls) {
        d_balls.push_back(sim_ball{ .id=b.id, .pos=b.pos, .in_play=b.in_play });
    }
    std::ranges::sort(d_balls, {}, &sim_ball::id);
}

auto simulation::get(ball_id id) -> sim_ball&
{
    const auto it = std::ranges::find(d_balls, id, &sim_ball::id);
    assert_that(it != d_balls.end(), fmt::format("no ball {}", to_string(id)));
    return *it;
}

auto simulation::get(ball_id id) const -> const sim_ball&
{
    const auto it = std::ranges::find(d_balls, id, &sim_ball::id);
    assert_that(it != d_balls.end(), fmt::format("no ball {}", to_string(id)));
    return *it;
}

auto simulation::strike(const shot_params& params) -> bool
{
    const auto it = std::ranges::find(d_balls, ball_id::cue, &sim_ball::id);
    if (it == d_balls.end() || !it->in_play) return false;

    const auto speed = shot_speed(params.power, d_physics);
    it->vel = vec2{std::cos(params.angle), std::sin(params.angle)} * speed;
    it->spin = {params.spin_x, params.spin_y};
    return true;
}

auto simulation::is_at_rest() const -> bool
{
    const auto min_sq = d_physics.min_velocity * d_physics.min_velocity;
    return std::ranges::all_of(d_balls, [&](const sim_ball& b) {
        return !b.in_play || length_sq(b.vel) < min_sq;
    });
}

auto simulation::snapshot(f64 time_ms) -> keyframe
{
    auto frame = keyframe{ .time=time_ms, .balls={}, .events=std::move(d_pending_events) };
    d_pending_events.clear();
    frame.balls.reserve(d_balls.size());
    for (const auto& b : d_balls) {
        frame.balls.push_back(ball_snapshot{ .id=b.id, .pos=b.pos, .in_play=b.in_play });
    }
    return frame;
}

auto simulation::step() -> void
{
    integrate();
    resolve_ball_collisions();

    // pockets first, a pocket mouth is a gap in the cushion
    handle_pockets();
    resolve_cushions();

    // a cushion clamp can push a ball back into its neighbour
    fix_positions();
}

auto simulation::integrate() -> void
{
    const auto dt = d_physics.time_step;
    const auto min_sq = d_physics.min_velocity * d_physics.min_velocity;

    for (auto& b : d_balls) {
        if (!b.in_play) continue;

        b.pos += b.vel * dt;

        if (!b.is_rolling && glm::length(b.vel) < d_physics.rolling_transition_speed) {
            b.is_rolling = true;
        }
        const auto mu = b.is_rolling ? d_physics.rolling_friction : d_physics.sliding_friction;
        b.vel = reduce_length(b.vel, mu * d_physics.gravity * dt);
        b.spin *= d_physics.spin_decay;

        if (length_sq(b.vel) < min_sq) {
            b.vel = {0.0, 0.0};
        }
    }
}

auto simulation::resolve_ball_collisions() -> void
{
    const auto r = d_table.ball_radius;

    for (std::size_t i = 0; i < d_balls.size(); ++i) {
        for (std::size_t j = i + 1; j < d_balls.size(); ++j) {
            auto& a = d_balls[i];
            auto& b = d_balls[j];
            if (!a.in_play || !b.in_play) continue;

            const auto info = collide(circle{a.pos, r}, circle{b.pos, r});
            if (!info) continue;

            // balls are sorted so the cue ball can only ever be a
            const auto cue_pair = a.id == ball_id::cue;
            if (cue_pair && !d_first_contact) {
                d_first_contact = b.id;
                b.has_hit_cue_contact = true;
                spdlog::trace("first contact: cue -> {}", to_string(b.id));
            }

            const auto cue_vel_before = a.vel;
            if (const auto speed = resolve_impulse(info->normal, a.vel, b.vel, d_physics.ball_restitution)) {
                a.is_rolling = false;
                b.is_rolling = false;
                const auto contact = a.pos + info->normal * r;
                d_pending_events.push_back(ball_ball_event{ .a=a.id, .b=b.id, .speed=*speed, .pos=contact });
                spdlog::trace("{} hit {} at {:.3f} m/s", to_string(a.id), to_string(b.id), *speed);

                if (cue_pair && b.has_hit_cue_contact) {
                    apply_cue_spin(a, b, cue_vel_before);
                    b.has_hit_cue_contact = false;
                }
            }

            separate(a.pos, b.pos, *info, d_physics.separation_epsilon);
        }
    }

    fix_positions();
}

// Pushing one pair apart can shove a ball into a neighbour, so relax the
// layout until no pair overlaps, without touching velocities.
auto simulation::fix_positions() -> void
{
    const auto r = d_table.ball_radius;

    for (u32 pass = 0; pass != d_physics.max_separation_passes; ++pass) {
        auto moved = false;
        for (std::size_t i = 0; i < d_balls.size(); ++i) {
            for (std::size_t j = i + 1; j < d_balls.size(); ++j) {
                auto& a = d_balls[i];
                auto& b = d_balls[j];
                if (!a.in_play || !b.in_play) continue;
                if (const auto info = collide(circle{a.pos, r}, circle{b.pos, r})) {
                    separate(a.pos, b.pos, *info, d_physics.separation_epsilon);
                    moved = true;
                }
            }
        }
        if (!moved) return;
    }
    spdlog::warn("overlaps remain after {} separation passes", d_physics.max_separation_passes);
}

auto simulation::apply_cue_spin(sim_ball& cue, sim_ball& struck, vec2 cue_vel_before) -> void
{
    // throw: side spin pushes the struck ball off its line
    const auto struck_speed = glm::length(struck.vel);
    if (const auto dir = safe_normalize(struck.vel)) {
        struck.vel += perpendicular(*dir) * (cue.spin.x * d_physics.throw_strength * struck_speed);
    }

    // follow (+) carries the cue ball on through, draw (-) pulls it back
    const auto cue_speed = glm::length(cue_vel_before);
    if (const auto dir = safe_normalize(cue_vel_before)) {
        cue.vel += *dir * (cue.spin.y * d_physics.follow_draw_strength * cue_speed);
    }
}

auto simulation::handle_pockets() -> void
{
    const auto dt = d_physics.time_step;
    const auto min_sq = d_physics.min_velocity * d_physics.min_velocity;

    for (auto& b : d_balls) {
        if (!b.in_play) continue;

        // can only have left the cloth through a pocket mouth
        if (!is_in_region(b.pos, {0.0, 0.0}, d_table.width, d_table.height)) {
            capture(b, nearest_pocket(b.pos, d_table));
            continue;
        }

        for (std::size_t i = 0; i != d_table.pockets.size(); ++i) {
            const auto to_pocket = d_table.pockets[i] - b.pos;
            const auto dist = glm::length(to_pocket);
            const auto dir = safe_normalize(to_pocket);
            const auto inward = dir ? glm::dot(b.vel, *dir) : 0.0;

            if (dist < d_physics.pocket_commit_radius ||
                (dist < d_physics.pocket_commit_radius + d_physics.pocket_capture_band && inward > 0.0)) {
                capture(b, i);
                break;
            }

            // resting balls near a jaw stay put
            if (dist < d_physics.pocket_mouth_radius && dir && length_sq(b.vel) >= min_sq) {
                const auto falloff = 1.0 - dist / d_physics.pocket_mouth_radius;
                b.vel += *dir * (d_physics.pocket_pull_strength * falloff * dt);

                const auto tangential = b.vel - *dir * glm::dot(b.vel, *dir);
                const auto keep = std::exp(-d_physics.pocket_tangential_damping * falloff * dt);
                b.vel -= tangential * (1.0 - keep);
            }
        }
    }
}

auto simulation::capture(sim_ball& b, std::size_t pocket) -> void
{
    const auto speed = glm::length(b.vel);
    d_pending_events.push_back(ball_pocket_event{ .ball=b.id, .pocket=pocket, .speed=speed, .pos=b.pos });
    spdlog::trace("{} pocketed in {} at {:.3f} m/s", to_string(b.id), pocket, speed);

    b.in_play = false;
    b.vel = {0.0, 0.0};
    b.spin = {0.0, 0.0};
    d_pocketed.push_back(b.id);
    d_pocket_indices[b.id] = pocket;
    if (b.id == ball_id::cue) {
        d_scratch = true;
    }
}

auto simulation::resolve_cushions() -> void
{
    const auto r = d_table.ball_radius;

    for (auto& b : d_balls) {
        if (!b.in_play) continue;

        for (const auto side : cushions) {
            if (in_pocket_mouth(b.pos, d_table, side, d_physics.pocket_mouth_radius)) continue;

            const auto depth = cushion_penetration(circle{b.pos, r}, d_table, side);
            if (!depth) continue;

            const auto n = cushion_normal(side);
            b.pos += n * *depth;

            const auto impact = -glm::dot(b.vel, n);
            if (impact <= 0.0) continue; // already heading back onto the cloth

            b.vel += n * (impact * (1.0 + d_physics.cushion_restitution));
            b.vel += perpendicular(n) * (b.spin.x * d_physics.cushion_spin_strength * impact);
            b.is_rolling = false;

            d_pending_events.push_back(ball_cushion_event{ .ball=b.id, .side=side, .speed=impact, .pos=b.pos });
            if (d_first_contact && impact > d_physics.min_rail_speed) {
                d_rail_after_contact = true;
            }
        }
    }
}

auto shot_speed(f64 power, const physics_config& physics) -> f64
{
    return std::pow(power, physics.power_exponent) * physics.power_to_velocity;
}

auto simulate_shot(
    const table_state& state,
    const shot_params& params,
    const table_config& table,
    const physics_config& physics
)
    -> std::expected<simulation_result, shot_error>
{
    if (!is_valid(params)) {
        return std::unexpected(shot_error{shot_error_code::invalid_parameters, "Shot parameters out of range"});
    }

    if (!find_ball(state, ball_id::cue)) {
        return std::unexpected(shot_error{shot_error_code::cue_ball_not_in_play, "Table has no cue ball"});
    }

    if (auto error = layout_error(state)) {
        return std::unexpected(shot_error{shot_error_code::invalid_layout, std::move(*error)});
    }

    auto sim = simulation{state, table, physics};
    if (!sim.strike(params)) {
        return std::unexpected(shot_error{shot_error_code::cue_ball_not_in_play, "Cue ball not in play"});
    }

    spdlog::debug("shot: angle={:.3f} power={:.2f} spin=({:.2f}, {:.2f})",
                  params.angle, params.power, params.spin_x, params.spin_y);

    const auto dt = physics.time_step;
    auto keyframes = std::vector<keyframe>{};
    keyframes.push_back(sim.snapshot(0.0));

    auto time = 0.0;
    auto last_keyframe = 0.0;
    auto settled_frames = u32{0};
    auto settled = false;
    auto frame = u32{0};

    for (; frame < physics.max_frames; ++frame) {
        time = frame * dt;

        if (sim.is_at_rest()) {
            if (++settled_frames >= physics.settle_frames) {
                settled = true;
                break;
            }
        } else {
            settled_frames = 0;
        }

        if (time - last_keyframe >= physics.keyframe_interval) {
            keyframes.push_back(sim.snapshot(time * 1000.0));
            last_keyframe = time;
        }

        sim.step();
    }

    if (!settled) {
        spdlog::warn("shot hit the frame cap of {} without settling", physics.max_frames);
    }

    // always finish on the resting layout, carrying any unflushed events
    time = frame * dt;
    keyframes.push_back(sim.snapshot(time * 1000.0));

    auto final_state = build_final_state(state, sim);
    const auto facts = shot_facts{
        .first_contact = sim.first_contact(),
        .pocketed = sim.pocketed(),
        .pocket_indices = sim.pocket_indices(),
        .scratch = sim.scratch(),
        .rail_after_contact = sim.rail_after_contact(),
    };
    auto summary = derive_summary(state, final_state, facts);

    spdlog::debug("shot settled after {} frames, {} keyframes, {} pocketed",
                  frame, keyframes.size(), summary.pocketed_balls.size());

    return simulation_result{
        .final_state = std::move(final_state),
        .keyframes = std::move(keyframes),
        .summary = std::move(summary),
        .frames = frame,
        .settled = settled,
    };
}

}
