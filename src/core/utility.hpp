#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <concepts>

#include <glm/glm.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace pool {

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

// All table-space quantities are doubles, positions in metres.
using vec2 = glm::dvec2;

inline auto assert_that(
    bool condition,
    std::string_view message = {},
    std::source_location loc = std::source_location::current()
)
    -> void
{
    if (!condition) {
        spdlog::critical("FAILED ASSERTION: ({}:{}) {}", loc.file_name(), loc.line(), message);
        std::terminate();
    }
}

template <typename... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

inline auto length_sq(vec2 v) -> double
{
    return glm::dot(v, v);
}

// Normalizing anything shorter than this is treated as undefined and the
// caller skips whatever effect needed the direction.
static constexpr auto normalize_epsilon = 1e-12;

inline auto safe_normalize(vec2 v) -> std::optional<vec2>
{
    const auto len = glm::length(v);
    if (len < normalize_epsilon) return {};
    return v / len;
}

// Scales v toward zero so that its length drops by amount, never flipping it.
inline auto reduce_length(vec2 v, double amount) -> vec2
{
    const auto len = glm::length(v);
    if (len < normalize_epsilon) return {0.0, 0.0};
    return v * (std::max(0.0, len - amount) / len);
}

inline auto is_in_region(vec2 pos, vec2 top_left, f64 width, f64 height) -> bool
{
    return top_left.x <= pos.x && pos.x <= top_left.x + width
        && top_left.y <= pos.y && pos.y <= top_left.y + height;
}

inline auto to_string(vec2 v) -> std::string
{
    return fmt::format("({:.4f}, {:.4f})", v.x, v.y);
}

// Only this project's enums and vec2. An unqualified call would otherwise also
// find fmt::to_string and claim types fmt already formats.
template <typename T>
concept has_to_string_free_function = (std::is_enum_v<T> || std::same_as<T, vec2>) && requires(T obj)
{
    { to_string(obj) } -> std::convertible_to<std::string>;
};

}

template <pool::has_to_string_free_function T>
struct fmt::formatter<T> : fmt::formatter<std::string>
{
    auto format(const T& obj, auto& ctx) const {
        using pool::to_string;
        return fmt::formatter<std::string>::format(to_string(obj), ctx);
    }
};
