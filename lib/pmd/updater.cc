#include <pmd/updater.hh>

#include <limits>

pmd::Updater::Updater(Metadata& metadata_) : metadata(metadata_) {
    auto Seed = [](auto& tokens, const auto& store) {
        for (const auto& [token, entity] : store) {
            auto level = entity.is_definition() ? Level::Definition : Level::Reference;
            tokens.insert_or_assign(entity.reference(), TokenWithLevel{token, level});
        }
    };

    Seed(type_tokens, metadata.types());
    Seed(field_tokens, metadata.fields());
    Seed(method_tokens, metadata.methods());
}

template <typename TEntity, typename TMap>
auto pmd::Updater::Update(
    TEntity entity,
    Level level,
    TMap& tokens,
    TokenMap<TEntity>& store,
    auto&& make_name
) -> Result<Updated> {
    if (level != Level::Reference and not entity.is_definition()) {
        return Diag::Error(
            ErrorId::InvalidArgument,
            "Cannot register the reference '{}' at {} level",
            entity.name(),
            level
        );
    }

    auto key = entity.reference();
    if (auto it = tokens.find(key); it != tokens.end()) {
        auto& entry = it->second;
        auto old_level = entry.level;
        if (level > entry.level) {
            PMD_TRY_VOID(store.set(entry.token, std::move(entity)));
            entry.level = level;
        }
        return Updated{entry.token, old_level};
    }

    Token token{i32(store.count())};
    if (metadata.use_named_tokens()) {
        PMD_TRY(name, make_name(entity.identity()));
        token = std::move(name);
    }

    PMD_TRY_VOID(store.add(token, std::move(entity)));
    tokens.emplace(std::move(key), TokenWithLevel{token, level});
    return Updated{std::move(token), level};
}

auto pmd::Updater::UniqueName(std::string base, const auto& store) -> Result<Token> {
    utils::ReplaceAny(base, Token::InvalidNameChars, '_');
    PMD_TRY(name, Token::Named(base));
    if (not store.contains(name)) return name;

    for (i32 n = 2; n < std::numeric_limits<i32>::max(); n++) {
        PMD_TRY(candidate, Token::Named(fmt::format("{}_{}", base, n)));
        if (not store.contains(candidate)) return candidate;
    }

    return Diag::Error(ErrorId::InvalidOperation, "Ran out of unique names for '{}'", base);
}

auto pmd::Updater::MemberName(
    const ComplexType& declaring_type,
    const std::string& name,
    const auto& store
) -> Result<Token> {
    if (declaring_type.is_token())
        return UniqueName(fmt::format("{}::{}", declaring_type.token(), name), store);

    auto scope = GetScopeType(declaring_type);
    if (not scope) {
        return Diag::Error(
            ErrorId::InvalidArgument,
            "Cannot derive a name for '{}': declaring type has no scope type",
            name
        );
    }

    return UniqueName(fmt::format("{}<?>::{}", *scope, name), store);
}

auto pmd::Updater::update(Type type, Level level) -> Result<Updated> {
    return Update(std::move(type), level, type_tokens, metadata.types(), [&](const TypeRef& t) {
        return UniqueName(t.name, metadata.types());
    });
}

auto pmd::Updater::update(Field field, Level level) -> Result<Updated> {
    if (level == Level::DefinitionWithChildren)
        return Diag::Error(ErrorId::InvalidArgument, "Fields have no children; use Definition level");

    return Update(std::move(field), level, field_tokens, metadata.fields(), [&](const FieldRef& f) {
        return MemberName(f.type, f.name, metadata.fields());
    });
}

auto pmd::Updater::update(Method method, Level level) -> Result<Updated> {
    if (level == Level::DefinitionWithChildren)
        return Diag::Error(ErrorId::InvalidArgument, "Methods have no children; use Definition level");

    return Update(std::move(method), level, method_tokens, metadata.methods(), [&](const MethodRef& m) {
        return MemberName(m.type, m.name, metadata.methods());
    });
}
