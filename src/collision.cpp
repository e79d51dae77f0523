#include "collision.hpp"

#include <cmath>

namespace pool {

auto collide(circle a, circle b) -> std::optional<collision_info>
{
    const auto delta = b.centre - a.centre;
    const auto dist = glm::length(delta);
    const auto r = a.radius + b.radius;
    if (dist >= r) return {};
    return safe_normalize(delta).transform([&](vec2 n) {
        return collision_info{ .normal=n, .penetration=r - dist };
    });
}

auto resolve_impulse(vec2 normal, vec2& vel_a, vec2& vel_b, f64 restitution) -> std::optional<f64>
{
    const auto approach = glm::dot(vel_a - vel_b, normal);
    if (approach < 0.0) return {}; // moving apart
    const auto impulse = approach * restitution;
    vel_a -= normal * impulse;
    vel_b += normal * impulse;
    return approach;
}

auto separate(vec2& pos_a, vec2& pos_b, const collision_info& info, f64 epsilon) -> void
{
    if (info.penetration <= 0.0) return;
    const auto correction = info.normal * (info.penetration / 2.0 + epsilon);
    pos_a -= correction;
    pos_b += correction;
}

auto cushion_normal(cushion side) -> vec2
{
    switch (side) {
        case cushion::left: return {1.0, 0.0};
        case cushion::right: return {-1.0, 0.0};
        case cushion::top: return {0.0, 1.0};
        case cushion::bottom: return {0.0, -1.0};
    }
    return {0.0, 0.0};
}

auto cushion_penetration(circle c, const table_config& table, cushion side) -> std::optional<f64>
{
    auto depth = 0.0;
    switch (side) {
        case cushion::left: depth = table.left() - (c.centre.x - c.radius); break;
        case cushion::right: depth = (c.centre.x + c.radius) - table.right(); break;
        case cushion::top: depth = table.top() - (c.centre.y - c.radius); break;
        case cushion::bottom: depth = (c.centre.y + c.radius) - table.bottom(); break;
    }
    if (depth <= 0.0) return {};
    return depth;
}

auto in_pocket_mouth(vec2 pos, const table_config& table, cushion side, f64 mouth_radius) -> bool
{
    // a pocket cuts into a cushion if its centre sits on (or near) the cushion line
    const auto vertical = side == cushion::left || side == cushion::right;
    const auto line = [&] {
        switch (side) {
            case cushion::left: return table.left();
            case cushion::right: return table.right();
            case cushion::top: return table.top();
            case cushion::bottom: return table.bottom();
        }
        return 0.0;
    }();

    for (const auto& pocket : table.pockets) {
        const auto across = vertical ? pocket.x : pocket.y;
        const auto along_pocket = vertical ? pocket.y : pocket.x;
        const auto along_ball = vertical ? pos.y : pos.x;
        if (std::abs(across - line) <= mouth_radius && std::abs(along_ball - along_pocket) < mouth_radius) {
            return true;
        }
    }
    return false;
}

}
