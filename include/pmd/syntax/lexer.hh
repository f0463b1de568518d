#ifndef PMD_SYNTAX_LEXER_HH
#define PMD_SYNTAX_LEXER_HH

#include <pmd/diags.hh>
#include <pmd/utils.hh>

#include <string>
#include <string_view>
#include <utility>

namespace pmd::syntax {
namespace detail {
/// Byte cursor over an in-memory source.
///
/// Only `next()` may advance the cursor.
class CharacterRange {
    const char* curr;
    const char* end;
    const char* begin;

public:
    explicit CharacterRange(std::string_view s)
        : curr(s.data()),
          end(s.data() + s.size()),
          begin(s.data()) {}

    /// Offset of the character last returned by `next()`.
    [[nodiscard]]
    auto current_offset() const -> usz {
        return usz(curr - begin) - 1;
    }

    /// Whether the whole source has been consumed.
    [[nodiscard]]
    bool exhausted() const { return curr >= end; }

    /// Get the next byte, or 0 at the end of the source.
    [[nodiscard]]
    auto next() -> u32 {
        if (curr >= end) {
            // Keep the offset pointing one past the last character.
            if (curr == end) ++curr;
            return 0;
        }
        return u32(u8(*curr++));
    }
};
} // namespace detail

template <typename TKind>
requires std::is_enum_v<TKind>
struct Token {
    TKind kind = TKind::Invalid;
    usz offset{};
    std::string text{};
    i64 integer_value{};
};

/// Base for the hand-written parsers of this library. All input
/// comes from memory, so positions are plain byte offsets.
template <typename TToken>
struct Lexer {
    detail::CharacterRange chars;
    TToken tok{};
    u32 lastc = ' ';

    explicit Lexer(std::string_view source)
        : chars(detail::CharacterRange(source)) {}

    [[nodiscard]]
    auto CurrentOffset() const -> usz { return chars.current_offset(); }

    void NextChar() {
        lastc = chars.next();
    }

    /// True once every character has been read.
    [[nodiscard]]
    bool AtEnd() const { return lastc == 0 and chars.exhausted(); }

    template <typename... Args>
    auto Error(fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag::Error(
            ErrorId::InvalidData,
            "{} (at offset {})",
            fmt::format(fmt, std::forward<Args>(args)...),
            CurrentOffset()
        );
    }

    static auto IsSpace(u32 c) -> bool {
        return c == ' ' or c == '\t' or c == '\n'
            or c == '\r' or c == '\f' or c == '\v';
    }
    static auto IsAlpha(u32 c) -> bool {
        return (c >= 'a' and c <= 'z')
            or (c >= 'A' and c <= 'Z');
    }
    static auto IsDigit(u32 c) -> bool {
        return c >= '0' and c <= '9';
    }
    static auto IsHexDigit(u32 c) -> bool {
        return (c >= '0' and c <= '9')
            or (c >= 'a' and c <= 'f')
            or (c >= 'A' and c <= 'F');
    }
};
} // namespace pmd::syntax

#endif // PMD_SYNTAX_LEXER_HH
