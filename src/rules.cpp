#include "rules.hpp"

#include <algorithm>
#include <iterator>

namespace pool {
namespace {

auto contains(const std::vector<ball_id>& ids, ball_id id) -> bool
{
    return std::ranges::find(ids, id) != ids.end();
}

auto pocketed_object_ball(const std::vector<ball_id>& ids) -> bool
{
    return std::ranges::any_of(ids, [](ball_id id) { return id != ball_id::cue; });
}

auto turn_changes(const shot_summary& summary) -> bool
{
    return summary.foul.has_value() || !pocketed_object_ball(summary.pocketed_balls);
}

auto wrong_ball_first(const table_state& before, ball_id first) -> std::optional<foul_verdict>
{
    if (before.open_table) return {};
    const auto group = group_for(before, before.turn);
    if (!group) return {};

    if (first == ball_id::eight) {
        if (is_group_cleared(before, *group)) return {};
        return foul_verdict{
            foul_type::wrong_ball_first,
            fmt::format("Hit the 8-ball first before clearing {}", to_string(*group))
        };
    }

    const auto hit = group_of(first);
    if (!hit || *hit == *group) return {};
    return foul_verdict{
        foul_type::wrong_ball_first,
        fmt::format("Hit {} ball first when assigned {}", to_string(*hit), to_string(*group))
    };
}

auto is_spot_free(const table_state& state, vec2 pos, ball_id ignore, f64 radius) -> bool
{
    return std::ranges::none_of(state.balls, [&](const ball& b) {
        return b.in_play && b.id != ignore && glm::distance(b.pos, pos) < 2.0 * radius;
    });
}

// Foot spot if it is free, otherwise the closest free point on the long
// axis, preferring the foot rail side.
auto respot_position(const table_state& state, ball_id id, const table_config& table) -> vec2
{
    const auto r = table.ball_radius;
    const auto step = r / 4.0;
    const auto spot = table.foot_spot;

    for (auto x = spot.x; x <= table.right() - r; x += step) {
        if (is_spot_free(state, {x, spot.y}, id, r)) return {x, spot.y};
    }
    for (auto x = spot.x - step; x >= table.left() + r; x -= step) {
        if (is_spot_free(state, {x, spot.y}, id, r)) return {x, spot.y};
    }
    return spot;
}

// 8-ball on the break: a loss if the cue ball went down too, otherwise the
// 8 is spotted and the shot is judged as if it never dropped.
auto handle_break(table_state& next, shot_summary& summary, const table_config& table) -> void
{
    if (!summary.first_contact) {
        summary.foul = foul_type::no_contact;
        summary.foul_reason = "Illegal break - no ball contacted";
        summary.turn_changed = true;
    }

    next.phase = game_phase::aiming;

    if (!contains(summary.pocketed_balls, ball_id::eight)) return;

    if (summary.scratch) {
        summary.game_over = true;
        summary.winner = opponent(next.turn);
        spdlog::info("8-ball and cue ball pocketed on the break, {} loses", to_string(next.turn));
        return;
    }

    if (auto* eight = find_ball(next, ball_id::eight)) {
        eight->pos = respot_position(next, ball_id::eight, table);
        eight->vel = {0.0, 0.0};
        eight->in_play = true;
        spdlog::info("8-ball pocketed on the break, respotted at {}", eight->pos);
    }

    if (const auto it = std::find(next.pocketed.rbegin(), next.pocketed.rend(), ball_id::eight);
        it != next.pocketed.rend()) {
        next.pocketed.erase(std::next(it).base());
    }
    std::erase(summary.pocketed_balls, ball_id::eight);
    summary.pocket_indices.erase(ball_id::eight);

    summary.game_over = false;
    summary.winner.reset();
    if (summary.foul == foul_type::early_eight_pocket) {
        summary.foul.reset();
        summary.foul_reason.reset();
    }
    summary.turn_changed = turn_changes(summary);
}

auto assign_groups(table_state& next, const shot_summary& summary, seat shooter) -> void
{
    auto solids = 0;
    auto stripes = 0;
    auto first = std::optional<ball_group>{};
    for (const auto id : summary.pocketed_balls) {
        const auto group = group_of(id);
        if (!group) continue;
        if (!first) first = group;
        (*group == ball_group::solids ? solids : stripes)++;
    }
    if (!first) return;

    // both groups in one shot goes to whichever was listed first
    const auto assigned = (solids > 0 && stripes > 0) ? *first
                        : (solids > 0 ? ball_group::solids : ball_group::stripes);

    if (shooter == seat::one) {
        next.groups = group_assignments{ .seat_one=assigned, .seat_two=opposite(assigned) };
    } else {
        next.groups = group_assignments{ .seat_one=opposite(assigned), .seat_two=assigned };
    }
    next.open_table = false;
    spdlog::info("{} assigned {}", to_string(shooter), to_string(assigned));
}

}

auto classify_foul(const table_state& before, const table_state& after, const shot_facts& facts)
    -> std::optional<foul_verdict>
{
    auto verdict = std::optional<foul_verdict>{};

    if (facts.scratch) {
        verdict = foul_verdict{foul_type::scratch, "Cue ball was pocketed"};
    }
    else if (!facts.first_contact) {
        verdict = foul_verdict{foul_type::no_contact, "Cue ball did not hit any ball"};
    }
    else if (!facts.rail_after_contact && facts.pocketed.empty()) {
        verdict = foul_verdict{foul_type::no_rail, "No ball hit a rail after contact"};
    }
    else {
        verdict = wrong_ball_first(before, *facts.first_contact);
    }

    // only a shooter with an assigned group can pot the 8 early
    if (contains(facts.pocketed, ball_id::eight)) {
        const auto group = group_for(before, before.turn);
        if (!before.open_table && group && !is_group_cleared(after, *group)) {
            verdict = foul_verdict{foul_type::early_eight_pocket, "Pocketed 8-ball before clearing group"};
        }
    }

    return verdict;
}

auto derive_summary(const table_state& before, const table_state& after, const shot_facts& facts)
    -> shot_summary
{
    auto summary = shot_summary{
        .first_contact = facts.first_contact,
        .pocketed_balls = facts.pocketed,
        .scratch = facts.scratch,
        .rail_after_contact = facts.rail_after_contact,
        .pocket_indices = facts.pocket_indices,
    };

    if (const auto verdict = classify_foul(before, after, facts)) {
        summary.foul = verdict->type;
        summary.foul_reason = verdict->reason;
    }
    summary.turn_changed = turn_changes(summary);

    if (contains(facts.pocketed, ball_id::eight)) {
        summary.game_over = true;
        const auto lost = summary.foul == foul_type::early_eight_pocket || facts.scratch;
        summary.winner = lost ? opponent(before.turn) : before.turn;
    }

    return summary;
}

auto apply_rules(const table_state& state, shot_summary summary, const table_config& table) -> table_state
{
    auto next = state;
    const auto shooter = state.turn;
    const auto breaking = state.phase == game_phase::awaiting_break;

    if (breaking) {
        handle_break(next, summary, table);
    }

    if (next.open_table && !summary.foul && !summary.game_over) {
        assign_groups(next, summary, shooter);
    }

    if (summary.turn_changed && !summary.game_over) {
        next.turn = opponent(shooter);
    }

    if (summary.game_over) {
        next.phase = game_phase::finished;
        next.winner = summary.winner;
        next.ball_in_hand = false;
        next.ball_in_hand_anywhere = false;
        spdlog::info("game over, {} wins", summary.winner ? to_string(*summary.winner) : "nobody");
    }
    else if (summary.foul) {
        next.ball_in_hand = true;
        next.ball_in_hand_anywhere = summary.scratch || breaking;
        next.phase = game_phase::ball_in_hand;

        // the cue ball comes back out of the pocket, waiting to be placed
        if (summary.scratch) {
            if (auto* cue = find_ball(next, ball_id::cue)) {
                cue->in_play = true;
            }
        }
        spdlog::info("foul {} ({}), ball in hand for {}",
                     to_string(*summary.foul), summary.foul_reason.value_or(""), to_string(next.turn));
    }
    else {
        next.ball_in_hand = false;
        next.ball_in_hand_anywhere = false;
        next.phase = game_phase::aiming;
    }

    next.last_shot_summary = std::move(summary);
    return next;
}

auto validate_ball_placement(const table_state& state, vec2 pos, const table_config& table)
    -> std::expected<void, placement_error>
{
    static constexpr auto clearance = 0.001;
    const auto r = table.ball_radius;

    if (!state.ball_in_hand) {
        return std::unexpected(placement_error{placement_error_code::not_ball_in_hand, "Ball is not in hand"});
    }

    if (pos.x - r < table.left() || pos.x + r > table.right() ||
        pos.y - r < table.top() || pos.y + r > table.bottom()) {
        return std::unexpected(placement_error{placement_error_code::outside_playable_area, "Position outside playable area"});
    }

    if (!state.ball_in_hand_anywhere && pos.x > table.head_string_x) {
        return std::unexpected(placement_error{placement_error_code::outside_kitchen, "Must place behind head string"});
    }

    for (const auto& b : state.balls) {
        if (!b.in_play || b.id == ball_id::cue) continue;
        if (glm::distance(b.pos, pos) < 2.0 * r + clearance) {
            return std::unexpected(placement_error{
                placement_error_code::overlaps_ball,
                fmt::format("Overlaps with ball {}", to_string(b.id))
            });
        }
    }

    return {};
}

auto place_cue_ball(const table_state& state, vec2 pos, const table_config& table)
    -> std::expected<table_state, placement_error>
{
    if (auto valid = validate_ball_placement(state, pos, table); !valid) {
        return std::unexpected(std::move(valid).error());
    }

    auto next = state;
    if (auto* cue = find_ball(next, ball_id::cue)) {
        cue->pos = pos;
        cue->vel = {0.0, 0.0};
        cue->spin = {0.0, 0.0};
        cue->in_play = true;
    }
    next.ball_in_hand = false;
    next.ball_in_hand_anywhere = false;
    next.phase = game_phase::aiming;
    return next;
}

auto can_shoot_eight_ball(const table_state& state, seat s) -> bool
{
    const auto group = group_for(state, s);
    return !state.open_table && group && is_group_cleared(state, *group);
}

}
