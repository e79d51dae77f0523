#include "collision.hpp"

#include <gtest/gtest.h>

using namespace pool;

namespace {

constexpr auto r = default_table.ball_radius;

auto kinetic(vec2 a, vec2 b) -> double
{
    return length_sq(a) + length_sq(b);
}

}

TEST(collision, overlapping_circles_report_normal_and_depth)
{
    const auto info = collide(circle{{0.0, 0.0}, r}, circle{{0.05, 0.0}, r});
    ASSERT_TRUE(info);
    EXPECT_NEAR(info->normal.x, 1.0, 1e-12);
    EXPECT_NEAR(info->normal.y, 0.0, 1e-12);
    EXPECT_NEAR(info->penetration, 2.0 * r - 0.05, 1e-12);
}

TEST(collision, separated_and_touching_circles_do_not_collide)
{
    EXPECT_FALSE(collide(circle{{0.0, 0.0}, r}, circle{{0.2, 0.0}, r}));
    EXPECT_FALSE(collide(circle{{0.0, 0.0}, r}, circle{{2.0 * r, 0.0}, r}));
}

TEST(collision, coincident_circles_have_no_normal)
{
    EXPECT_FALSE(collide(circle{{1.0, 1.0}, r}, circle{{1.0, 1.0}, r}));
}

TEST(collision, head_on_impulse_transfers_momentum)
{
    auto va = vec2{2.0, 0.0};
    auto vb = vec2{0.0, 0.0};
    const auto speed = resolve_impulse({1.0, 0.0}, va, vb, 0.95);

    ASSERT_TRUE(speed);
    EXPECT_DOUBLE_EQ(*speed, 2.0);
    EXPECT_NEAR(va.x, 0.1, 1e-12);
    EXPECT_NEAR(vb.x, 1.9, 1e-12);
}

TEST(collision, separating_balls_are_left_alone)
{
    auto va = vec2{-1.0, 0.0};
    auto vb = vec2{1.0, 0.0};
    EXPECT_FALSE(resolve_impulse({1.0, 0.0}, va, vb, 0.95));
    EXPECT_EQ(va, vec2(-1.0, 0.0));
    EXPECT_EQ(vb, vec2(1.0, 0.0));
}

TEST(collision, oblique_impulse_never_adds_energy)
{
    const auto normal = glm::normalize(vec2{1.0, 1.0});
    auto va = vec2{1.5, 0.4};
    auto vb = vec2{-0.2, 0.3};
    const auto before = kinetic(va, vb);

    ASSERT_TRUE(resolve_impulse(normal, va, vb, 0.95));
    EXPECT_LE(kinetic(va, vb), before);

    // equal masses conserve momentum
    EXPECT_NEAR(va.x + vb.x, 1.3, 1e-12);
    EXPECT_NEAR(va.y + vb.y, 0.7, 1e-12);
}

TEST(collision, separate_leaves_a_gap)
{
    auto a = vec2{1.0, 0.5};
    auto b = vec2{1.03, 0.52};
    const auto info = collide(circle{a, r}, circle{b, r});
    ASSERT_TRUE(info);

    separate(a, b, *info, 0.001);
    EXPECT_GE(glm::distance(a, b), 2.0 * r);
}

TEST(collision, cushion_penetration_per_side)
{
    const auto& t = default_table;

    const auto left = cushion_penetration(circle{{t.left() + r - 0.01, 0.6}, r}, t, cushion::left);
    ASSERT_TRUE(left);
    EXPECT_NEAR(*left, 0.01, 1e-12);

    const auto bottom = cushion_penetration(circle{{1.0, t.bottom() - r + 0.004}, r}, t, cushion::bottom);
    ASSERT_TRUE(bottom);
    EXPECT_NEAR(*bottom, 0.004, 1e-12);

    EXPECT_FALSE(cushion_penetration(circle{{1.27, 0.635}, r}, t, cushion::left));
    EXPECT_FALSE(cushion_penetration(circle{{1.27, 0.635}, r}, t, cushion::top));
}

TEST(collision, cushion_normals_point_onto_the_cloth)
{
    EXPECT_EQ(cushion_normal(cushion::left), vec2(1.0, 0.0));
    EXPECT_EQ(cushion_normal(cushion::right), vec2(-1.0, 0.0));
    EXPECT_EQ(cushion_normal(cushion::top), vec2(0.0, 1.0));
    EXPECT_EQ(cushion_normal(cushion::bottom), vec2(0.0, -1.0));
}

TEST(collision, pocket_mouths_cut_the_right_cushions)
{
    const auto& t = default_table;
    const auto mouth = default_physics.pocket_mouth_radius;

    // corner pocket opens both the left and top cushions
    EXPECT_TRUE(in_pocket_mouth({0.06, 0.08}, t, cushion::left, mouth));
    EXPECT_TRUE(in_pocket_mouth({0.08, 0.06}, t, cushion::top, mouth));

    // side pocket only opens the long cushion
    EXPECT_TRUE(in_pocket_mouth({1.30, 0.08}, t, cushion::top, mouth));
    EXPECT_FALSE(in_pocket_mouth({0.06, 0.635}, t, cushion::left, mouth));

    EXPECT_FALSE(in_pocket_mouth({1.0, 0.08}, t, cushion::top, mouth));
    EXPECT_FALSE(in_pocket_mouth({0.06, 0.3}, t, cushion::left, mouth));
}
