#include "utility.hpp"
#include "table.hpp"
#include "table_state.hpp"
#include "simulation.hpp"
#include "rules.hpp"

#include <charconv>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace pool;

auto parse_double(std::string_view text) -> std::optional<double>
{
    auto value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return {};
    return value;
}

// usage: pool_shot [angle power [spin_x spin_y]]
auto parse_shot(std::span<char*> args) -> std::optional<shot_params>
{
    // straight break into the head ball of the rack
    auto params = shot_params{ .angle=0.0, .power=1.0 };
    if (args.empty()) return params;
    if (args.size() != 2 && args.size() != 4) return {};

    auto values = std::vector<double>{};
    for (const auto* arg : args) {
        const auto value = parse_double(arg);
        if (!value) return {};
        values.push_back(*value);
    }

    params.angle = values[0];
    params.power = values[1];
    if (values.size() == 4) {
        params.spin_x = values[2];
        params.spin_y = values[3];
    }
    return params;
}

auto log_events(const std::vector<keyframe>& keyframes) -> void
{
    for (const auto& frame : keyframes) {
        for (const auto& event : frame.events) {
            std::visit(overloaded{
                [&](const ball_ball_event& e) {
                    spdlog::debug("{:8.1f}ms  {} hits {} at {:.2f} m/s", frame.time, e.a, e.b, e.speed);
                },
                [&](const ball_cushion_event& e) {
                    spdlog::debug("{:8.1f}ms  {} off the cushion at {:.2f} m/s", frame.time, e.ball, e.speed);
                },
                [&](const ball_pocket_event& e) {
                    spdlog::debug("{:8.1f}ms  {} into pocket {} at {:.2f} m/s", frame.time, e.ball, e.pocket, e.speed);
                }
            }, event);
        }
    }
}

auto log_state(const table_state& state) -> void
{
    spdlog::info("phase {} | turn {} | open table {} | ball in hand {}{}",
                 to_string(state.phase), to_string(state.turn), state.open_table,
                 state.ball_in_hand, state.ball_in_hand_anywhere ? " (anywhere)" : "");
    if (state.groups.seat_one) {
        spdlog::info("seat 1 {} | seat 2 {}", to_string(*state.groups.seat_one), to_string(*state.groups.seat_two));
    }
    if (state.winner) {
        spdlog::info("winner {}", to_string(*state.winner));
    }
    for (const auto& b : state.balls) {
        if (b.in_play) {
            spdlog::debug("  ball {:>3} at {}", to_string(b.id), b.pos);
        }
    }
}

auto main(int argc, char** argv) -> int
{
    spdlog::set_level(spdlog::level::debug);

    const auto params = parse_shot(std::span{argv, static_cast<std::size_t>(argc)}.subspan(1));
    if (!params) {
        spdlog::error("usage: pool_shot [angle power [spin_x spin_y]]");
        return 1;
    }

    const auto state = create_initial_table_state();
    const auto result = simulate_shot(state, *params);
    if (!result) {
        spdlog::error("shot rejected: {}", result.error().message);
        return 1;
    }

    const auto& summary = result->summary;
    auto pocketed = std::string{};
    for (const auto id : summary.pocketed_balls) {
        pocketed += to_string(id) + " ";
    }
    spdlog::info("first contact: {}", summary.first_contact ? to_string(*summary.first_contact) : "none");
    spdlog::info("pocketed: {}", pocketed.empty() ? "none" : pocketed);
    spdlog::info("{} frames, {} keyframes", result->frames, result->keyframes.size());
    log_events(result->keyframes);

    const auto next = apply_rules(result->final_state, summary);
    if (next.last_shot_summary && next.last_shot_summary->foul) {
        spdlog::info("foul: {}", *next.last_shot_summary->foul_reason);
    }
    log_state(next);
    return 0;
}
