#include <pmd/token.hh>

auto pmd::Token::Named(std::string name) -> Result<Token> {
    if (name.empty()) return Diag::Error(ErrorId::InvalidArgument, "Token name cannot be empty");
    if (auto pos = name.find_first_of(InvalidNameChars); pos != std::string::npos) {
        return Diag::Error(
            ErrorId::InvalidArgument,
            "Token name '{}' contains invalid character '{}'",
            name,
            name[pos]
        );
    }

    return Token{std::move(name)};
}

auto pmd::Token::string() const -> std::string {
    if (is_named()) return name();
    return fmt::format("{}", index());
}

auto pmd::Token::operator<=>(const Token& other) const -> std::strong_ordering {
    if (is_named()) {
        if (not other.is_named()) return std::strong_ordering::less;
        return name() <=> other.name();
    }

    if (other.is_named()) return std::strong_ordering::greater;
    return index() <=> other.index();
}
