#include <pmd/facade.hh>

#include <optional>

namespace pmd {
namespace {
template <typename TRef, typename TDef>
auto Split(const TokenMap<Entity<TRef, TDef>>& source, bool named) -> EntityFacade<TRef, TDef> {
    EntityFacade<TRef, TDef> out{};
    bool last_is_def = false;
    i32 i = 0;
    for (const auto& [token, entity] : source) {
        bool add_order;
        bool added;
        if (auto def = entity.as_definition()) {
            added = out.definitions.add(token.string(), *def);
            add_order = not last_is_def;
            last_is_def = true;
        } else {
            added = out.references.add(token.string(), entity.identity());
            add_order = last_is_def;
            last_is_def = false;
        }

        PMD_ASSERT(added, "Duplicate token '{}' in metadata container", token);
        if (add_order and named) out.orders.push_back(i);
        i++;
    }
    return out;
}

template <typename TRef, typename TDef>
auto Join(
    const EntityFacade<TRef, TDef>& source,
    TokenMap<Entity<TRef, TDef>>& dest,
    bool named,
    std::string_view section
) -> Result<void> {
    auto count = source.references.size() + source.definitions.size();

    if (not named) {
        for (usz i = 0; i < count; i++) {
            auto key = fmt::format("{}", i);
            std::optional<Entity<TRef, TDef>> value{};
            if (auto ref = source.references.find(key)) value.emplace(*ref);
            else if (auto def = source.definitions.find(key)) value.emplace(*def);
            else return Diag::Error(ErrorId::InvalidData, "{}: no entity for index {}", section, i);

            PMD_TRY_VOID(dest.add(i32(i), std::move(*value)));
        }
        return {};
    }

    usz next_order = 0, next_ref = 0, next_def = 0;
    bool last_is_def = false;
    for (usz i = 0; i < count; i++) {
        if (next_order < source.orders.size() and usz(source.orders[next_order]) == i) {
            last_is_def = not last_is_def;
            next_order++;
        }

        const std::string* key{};
        std::optional<Entity<TRef, TDef>> value{};
        if (last_is_def) {
            if (next_def >= source.definitions.size())
                return Diag::Error(ErrorId::InvalidData, "{}: orders ask for more definitions than there are", section);
            const auto& [k, v] = source.definitions[next_def++];
            key = &k;
            value.emplace(v);
        } else {
            if (next_ref >= source.references.size())
                return Diag::Error(ErrorId::InvalidData, "{}: orders ask for more references than there are", section);
            const auto& [k, v] = source.references[next_ref++];
            key = &k;
            value.emplace(v);
        }

        auto token = Token::Named(*key);
        if (token.is_diag()) {
            token.diag().suppress();
            return Diag::Error(ErrorId::InvalidData, "{}: '{}' is not a valid token name", section, *key);
        }

        PMD_TRY_VOID(dest.add(std::move(*token), std::move(*value)));
    }

    if (next_order != source.orders.size())
        return Diag::Error(ErrorId::InvalidData, "{}: unused order entries", section);
    return {};
}
} // namespace
} // namespace pmd

auto pmd::Facade::FromMetadata(const Metadata& metadata) -> Facade {
    Facade f{};
    f.options = metadata.options();
    f.types = Split(metadata.types(), metadata.use_named_tokens());
    f.fields = Split(metadata.fields(), metadata.use_named_tokens());
    f.methods = Split(metadata.methods(), metadata.use_named_tokens());
    return f;
}

auto pmd::Facade::to_metadata() const -> Result<Metadata> {
    Metadata metadata{options};
    bool named = metadata.use_named_tokens();
    PMD_TRY_VOID(Join(types, metadata.types(), named, "Types"));
    PMD_TRY_VOID(Join(fields, metadata.fields(), named, "Fields"));
    PMD_TRY_VOID(Join(methods, metadata.methods(), named, "Methods"));
    return metadata;
}
