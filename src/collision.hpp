#pragma once
#include "utility.hpp"
#include "table.hpp"

#include <array>
#include <optional>

namespace pool {

struct circle
{
    vec2 centre;
    f64  radius;
};

struct collision_info
{
    vec2 normal;      // from A to B
    f64  penetration; // overlap depth
};

enum class cushion
{
    left,
    right,
    top,
    bottom,
};

inline constexpr auto cushions = std::array{cushion::left, cushion::right, cushion::top, cushion::bottom};

// Returns the contact between two overlapping circles. Coincident centres have
// no usable normal and report no contact.
auto collide(circle a, circle b) -> std::optional<collision_info>;

// Equal-mass impulse along the contact normal. Each ball receives the
// approach speed scaled by restitution. Returns the approach speed, or
// nothing if the balls are already separating.
auto resolve_impulse(vec2 normal, vec2& vel_a, vec2& vel_b, f64 restitution) -> std::optional<f64>;

// Pushes both circles apart by half the penetration plus epsilon each.
auto separate(vec2& pos_a, vec2& pos_b, const collision_info& info, f64 epsilon) -> void;

// Inward facing normal of the cushion, pointing back onto the cloth.
auto cushion_normal(cushion side) -> vec2;

// How far the circle reaches past the cushion line, if at all.
auto cushion_penetration(circle c, const table_config& table, cushion side) -> std::optional<f64>;

// True if the circle centre sits in the gap a pocket cuts into this cushion.
auto in_pocket_mouth(vec2 pos, const table_config& table, cushion side, f64 mouth_radius) -> bool;

}
