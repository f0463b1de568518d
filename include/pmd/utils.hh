#ifndef PMD_UTILS_HH
#define PMD_UTILS_HH

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <bit>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace pmd {
using namespace std::literals;

namespace rgs = std::ranges;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using usz = size_t;

using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
using isz = ptrdiff_t;

using f32 = float;
using f64 = double;

#define PMD_CAT_(X, Y) X##Y
#define PMD_CAT(X, Y)  PMD_CAT_(X, Y)

// clang-format off
#define PMD_ASSERT(cond, ...) (cond ? void(0) :                \
    ::pmd::detail::AssertFail(                                 \
        fmt::format(                                           \
            "Assertion failed: \"" #cond "\" in {} at line {}" \
            __VA_OPT__(".\nMessage: {}"), __FILE__, __LINE__   \
            __VA_OPT__(, fmt::format(__VA_ARGS__))             \
        )                                                      \
    )                                                          \
)
// clang-format on

#define PMD_UNREACHABLE() PMD_ASSERT(false, "Unreachable")

template <typename>
concept always_false = false;

/// Helper to cast an enum to its underlying type.
template <typename t>
requires std::is_enum_v<t>
constexpr std::underlying_type_t<t> operator+(t e) {
    return static_cast<std::underlying_type_t<t>>(e);
}
} // namespace pmd

/// Internal stuff.
namespace pmd::detail {
[[noreturn]] void AssertFail(std::string&& msg);

/// Hash for string maps.
struct StringHash {
    using is_transparent = void;

    [[nodiscard]] usz operator()(std::string_view txt) const { return std::hash<std::string_view>{}(txt); }
    [[nodiscard]] usz operator()(const std::string& txt) const { return std::hash<std::string>{}(txt); }

    template <typename Type>
    requires requires (const Type& t) {
        { t.size() } -> std::convertible_to<usz>;
        { t.data() } -> std::convertible_to<const char*>;
    }
    [[nodiscard]] usz operator()(const Type& txt) const {
        return std::hash<std::string_view>{}(std::string_view{txt.data(), txt.size()});
    }
};

/// Enum that has a StringifyEnum() function.
template <typename T>
concept FormattableEnum = requires (T t) {
    requires std::is_enum_v<T>;
    { StringifyEnum(t) } -> std::convertible_to<std::string_view>;
};
} // namespace pmd::detail

namespace pmd {
/// Map with heterogeneous lookup.
///
/// Use this whenever you need a \c std::unordered_map from strings
/// to some other type; it allows looking up a value with anything
/// that supports \c data() and \c size() accessors (most notably a
/// \c std::string_view) without creating a copy of the key first.
template <typename Type>
using StringMap = std::unordered_map<std::string, Type, detail::StringHash, std::equal_to<>>;
} // namespace pmd

/// More rarely used functions go here so as to not pollute the pmd namespace too much.
namespace pmd::utils {
/// ANSI Terminal colours.
enum struct Colour {
    Reset = 0,
    Bold = 1,
    Red = 31,
    Green = 32,
    Yellow = 33,
    Magenta = 35,
};

/// RAII helper to toggle colours when printing.
///
/// Example:
/// \code{.cpp}
///     using enum Colour;
///     Colours C{true};
///     out += fmt::format("{}foo{}", C(Green), C(Reset));
/// \endcode
struct Colours {
    bool use_colours{};
    constexpr Colours(bool should_use_colours) : use_colours{should_use_colours} {}
    constexpr auto operator()(Colour c) const -> std::string_view {
        if (not use_colours) return "";
        switch (c) {
            case Colour::Reset: return "\033[m";
            case Colour::Bold: return "\033[1m";
            case Colour::Red: return "\033[31m";
            case Colour::Green: return "\033[32m";
            case Colour::Yellow: return "\033[33m";
            case Colour::Magenta: return "\033[35m";
        }
        PMD_UNREACHABLE();
    }
};

/// Replace every character of `str` that appears in `chars` with `with`.
void ReplaceAny(std::string& str, std::string_view chars, char with);

/// Encode bytes as base64 (RFC 4648, with padding).
auto Base64Encode(std::span<const u8> bytes) -> std::string;

/// Decode base64 text; returns nothing if the text is malformed.
auto Base64Decode(std::string_view text) -> std::optional<std::vector<u8>>;
} // namespace pmd::utils

template <pmd::detail::FormattableEnum T>
struct fmt::formatter<T> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(T t, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", StringifyEnum(t));
    }
};

#endif // PMD_UTILS_HH
