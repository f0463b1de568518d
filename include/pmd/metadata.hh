#ifndef PMD_METADATA_HH
#define PMD_METADATA_HH

#include <pmd/entities.hh>
#include <pmd/token.hh>
#include <pmd/utils.hh>
#include <pmd/utils/result.hh>

#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pmd {
/// Options of a metadata container. These are bit flags.
enum struct Options : u32 {
    None = 0,

    /// Use type and member names as tokens instead of indices.
    UseNamedToken = 1,

    /// Record the full name of assemblies, not just the short name.
    UseAssemblyFullName = 2,

    /// Include method bodies.
    IncludeMethodBodies = 4,

    /// Include custom attributes.
    IncludeCustomAttributes = 8,

    All = UseNamedToken | UseAssemblyFullName | IncludeMethodBodies | IncludeCustomAttributes,
};

constexpr auto operator|(Options a, Options b) -> Options { return Options(+a | +b); }
constexpr auto operator&(Options a, Options b) -> Options { return Options(+a & +b); }
constexpr bool HasFlag(Options set, Options flag) { return (set & flag) != Options::None; }

constexpr Options DefaultOptions = Options::UseAssemblyFullName | Options::IncludeMethodBodies | Options::IncludeCustomAttributes;

/// How much of an entity has been materialised.
enum struct Level {
    Reference,
    Definition,
    DefinitionWithChildren,
};

constexpr auto StringifyEnum(Level l) -> std::string_view {
    switch (l) {
        case Level::Reference: return "Reference";
        case Level::Definition: return "Definition";
        case Level::DefinitionWithChildren: return "DefinitionWithChildren";
    }
    return "<invalid>";
}

/// Map from tokens to entities that remembers insertion order.
///
/// Entries can be replaced but never removed. How keys are looked up
/// and which keys may be added depends on the token flavour, which is
/// what the two implementations below provide.
template <typename T>
class TokenMap {
public:
    using Entry = std::pair<Token, T>;

protected:
    std::vector<Entry> entries;

    /// Find the position of an existing key.
    [[nodiscard]] virtual auto find(const Token& key) const -> std::optional<usz> = 0;

    /// Check whether a key that is not in the map may be added.
    [[nodiscard]] virtual auto validate_new_key(const Token& key) const -> Result<void> = 0;

    /// Called after a new entry has been appended at \c pos.
    virtual void appended(const Token& key, usz pos) = 0;

public:
    TokenMap() = default;
    TokenMap(const TokenMap&) = delete;
    TokenMap& operator=(const TokenMap&) = delete;
    virtual ~TokenMap() = default;

    [[nodiscard]] auto count() const -> usz { return entries.size(); }
    [[nodiscard]] bool contains(const Token& key) const { return find(key).has_value(); }

    /// Get the entity for a token.
    [[nodiscard]] auto get(const Token& key) -> Result<T*> {
        auto pos = find(key);
        if (not pos) return Diag::Error(ErrorId::InvalidArgument, "No entity for token '{}'", key);
        return &entries[*pos].second;
    }

    [[nodiscard]] auto get(const Token& key) const -> Result<const T*> {
        auto pos = find(key);
        if (not pos) return Diag::Error(ErrorId::InvalidArgument, "No entity for token '{}'", key);
        return &entries[*pos].second;
    }

    /// Add a new entry. Fails if the key exists or cannot be added.
    auto add(Token key, T value) -> Result<void> {
        if (contains(key)) return Diag::Error(ErrorId::InvalidArgument, "Token '{}' already exists", key);
        PMD_TRY_VOID(validate_new_key(key));
        entries.emplace_back(std::move(key), std::move(value));
        appended(entries.back().first, entries.size() - 1);
        return {};
    }

    /// Add an entry, or replace the entity of an existing one.
    auto set(Token key, T value) -> Result<void> {
        if (auto pos = find(key)) {
            entries[*pos].second = std::move(value);
            return {};
        }
        return add(std::move(key), std::move(value));
    }

    [[nodiscard]] auto begin() const { return entries.cbegin(); }
    [[nodiscard]] auto end() const { return entries.cend(); }
};

/// Token map keyed by dense indices. Keys must be added in order.
template <typename T>
class IndexedTokenMap final : public TokenMap<T> {
    using TokenMap<T>::entries;

    auto find(const Token& key) const -> std::optional<usz> override {
        if (key.is_named() or key.index() < 0 or usz(key.index()) >= entries.size()) return std::nullopt;
        return usz(key.index());
    }

    auto validate_new_key(const Token& key) const -> Result<void> override {
        if (key.is_named()) return Diag::Error(ErrorId::InvalidArgument, "Token '{}' is named, expected an index", key);
        if (usz(key.index()) != entries.size() or key.index() < 0) {
            return Diag::Error(
                ErrorId::InvalidArgument,
                "Token {} is out of range; the next index is {}",
                key.index(),
                entries.size()
            );
        }
        return {};
    }

    void appended(const Token&, usz) override {}
};

/// Token map keyed by names.
template <typename T>
class NamedTokenMap final : public TokenMap<T> {
    using TokenMap<T>::entries;
    StringMap<usz> index;

    auto find(const Token& key) const -> std::optional<usz> override {
        if (not key.is_named()) return std::nullopt;
        auto it = index.find(key.name());
        if (it == index.end()) return std::nullopt;
        return it->second;
    }

    auto validate_new_key(const Token& key) const -> Result<void> override {
        if (not key.is_named()) return Diag::Error(ErrorId::InvalidArgument, "Token '{}' is an index, expected a name", key);
        return {};
    }

    void appended(const Token& key, usz pos) override { index.emplace(key.name(), pos); }
};

/// Container of portable metadata.
///
/// This owns every type, field and method. Entities refer to each
/// other only through tokens. Whether tokens are indices or names is
/// fixed when the container is created.
class Metadata {
    Options _options;
    std::unique_ptr<TokenMap<Type>> _types;
    std::unique_ptr<TokenMap<Field>> _fields;
    std::unique_ptr<TokenMap<Method>> _methods;

public:
    explicit Metadata(Options options = DefaultOptions);

    Metadata(Metadata&&) noexcept = default;
    Metadata& operator=(Metadata&&) noexcept = default;

    [[nodiscard]] auto options() const -> Options { return _options; }
    [[nodiscard]] bool has(Options flag) const { return HasFlag(_options, flag); }
    [[nodiscard]] bool use_named_tokens() const { return has(Options::UseNamedToken); }

    [[nodiscard]] auto types() -> TokenMap<Type>& { return *_types; }
    [[nodiscard]] auto fields() -> TokenMap<Field>& { return *_fields; }
    [[nodiscard]] auto methods() -> TokenMap<Method>& { return *_methods; }
    [[nodiscard]] auto types() const -> const TokenMap<Type>& { return *_types; }
    [[nodiscard]] auto fields() const -> const TokenMap<Field>& { return *_fields; }
    [[nodiscard]] auto methods() const -> const TokenMap<Method>& { return *_methods; }
};
} // namespace pmd

#endif // PMD_METADATA_HH
