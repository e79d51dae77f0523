#pragma once
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "utility.hpp"
#include "table.hpp"
#include "table_state.hpp"

namespace pool {

// What physically happened during a shot, as recorded by the simulator.
struct shot_facts
{
    std::optional<ball_id>         first_contact;
    std::vector<ball_id>           pocketed; // in the order they dropped
    std::map<ball_id, std::size_t> pocket_indices;
    bool                           scratch = false;
    bool                           rail_after_contact = false;
};

struct foul_verdict
{
    foul_type   type;
    std::string reason;
};

enum class placement_error_code
{
    not_ball_in_hand,
    outside_playable_area,
    outside_kitchen,
    overlaps_ball,
};

struct placement_error
{
    placement_error_code code;
    std::string          message;
};

// First matching foul in priority order: scratch, no contact, no rail, wrong
// ball first. Pocketing the 8-ball before the shooter's group is cleared
// overrides all of them. before is the table as the shot started, after is
// the layout once the balls settled.
auto classify_foul(const table_state& before, const table_state& after, const shot_facts& facts)
    -> std::optional<foul_verdict>;

auto derive_summary(const table_state& before, const table_state& after, const shot_facts& facts)
    -> shot_summary;

// Produces the next table state from the settled layout of a shot and its
// summary. The summary stored on the returned state reflects any break
// adjustments.
auto apply_rules(const table_state& state, shot_summary summary, const table_config& table = default_table)
    -> table_state;

auto validate_ball_placement(const table_state& state, vec2 pos, const table_config& table = default_table)
    -> std::expected<void, placement_error>;

// The ball-in-hand action: puts the cue ball down and returns to aiming.
auto place_cue_ball(const table_state& state, vec2 pos, const table_config& table = default_table)
    -> std::expected<table_state, placement_error>;

auto can_shoot_eight_ball(const table_state& state, seat s) -> bool;

}
