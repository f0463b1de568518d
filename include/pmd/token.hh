#ifndef PMD_TOKEN_HH
#define PMD_TOKEN_HH

#include <pmd/utils.hh>
#include <pmd/utils/result.hh>

#include <compare>
#include <string>
#include <string_view>
#include <variant>

namespace pmd {
/// Identifies a type, field or method within one metadata container.
///
/// A token is either a dense index (insertion order) or a name. All
/// named tokens order before all indexed tokens.
class Token {
    std::variant<i32, std::string> data;

    explicit Token(std::string name) : data(std::move(name)) {}

public:
    /// Characters that may not appear in a token name.
    static constexpr std::string_view InvalidNameChars = "(),@'";

    /// Create an indexed token.
    Token(i32 index = 0) : data(index) {}

    /// Create a named token.
    ///
    /// Fails if the name is empty or contains one of \c InvalidNameChars.
    static auto Named(std::string name) -> Result<Token>;

    /// Check if this is a named token.
    [[nodiscard]] bool is_named() const { return std::holds_alternative<std::string>(data); }

    /// Get the index. Only valid for indexed tokens.
    [[nodiscard]] auto index() const -> i32 {
        PMD_ASSERT(not is_named(), "Token is named");
        return std::get<i32>(data);
    }

    /// Get the name. Only valid for named tokens.
    [[nodiscard]] auto name() const -> const std::string& {
        PMD_ASSERT(is_named(), "Token is not named");
        return std::get<std::string>(data);
    }

    /// Either the name or the decimal index.
    [[nodiscard]] auto string() const -> std::string;

    [[nodiscard]] bool operator==(const Token&) const = default;
    [[nodiscard]] auto operator<=>(const Token& other) const -> std::strong_ordering;
};
} // namespace pmd

template <>
struct std::hash<pmd::Token> {
    auto operator()(const pmd::Token& t) const noexcept -> size_t {
        if (t.is_named()) return std::hash<std::string>{}(t.name());
        return std::hash<pmd::i32>{}(t.index());
    }
};

template <>
struct fmt::formatter<pmd::Token> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const pmd::Token& t, FormatContext& ctx) const {
        return formatter<std::string_view>::format(t.string(), ctx);
    }
};

#endif // PMD_TOKEN_HH
