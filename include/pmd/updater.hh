#ifndef PMD_UPDATER_HH
#define PMD_UPDATER_HH

#include <pmd/comparer.hh>
#include <pmd/entities.hh>
#include <pmd/metadata.hh>
#include <pmd/utils/result.hh>

#include <unordered_map>

namespace pmd {
/// Assigns tokens to entities and tracks how far each one has been
/// materialised.
///
/// Entities are identified structurally (see \c EqualityComparer::Reference()),
/// so registering the same entity twice yields the same token. Each call
/// can raise the level of an entity, in which case the stored value is
/// replaced; it can never lower it.
class Updater {
public:
    struct Updated {
        /// The token of the entity.
        Token token;

        /// The level stored before this call, or the requested
        /// level if the entity was not known yet.
        Level old_level;
    };

private:
    struct TokenWithLevel {
        Token token;
        Level level;
    };

    Metadata& metadata;
    std::unordered_map<TypeRef, TokenWithLevel, ReferenceHash, ReferenceEqual> type_tokens;
    std::unordered_map<FieldRef, TokenWithLevel, ReferenceHash, ReferenceEqual> field_tokens;
    std::unordered_map<MethodRef, TokenWithLevel, ReferenceHash, ReferenceEqual> method_tokens;

public:
    /// Attach to a container. Entities already in it are known from the start.
    explicit Updater(Metadata& metadata);

    Updater(const Updater&) = delete;
    Updater& operator=(const Updater&) = delete;

    auto update(Type type, Level level) -> Result<Updated>;
    auto update(Field field, Level level) -> Result<Updated>;
    auto update(Method method, Level level) -> Result<Updated>;

private:
    template <typename TEntity, typename TMap>
    auto Update(TEntity entity, Level level, TMap& tokens, TokenMap<TEntity>& store, auto&& make_name) -> Result<Updated>;

    auto UniqueName(std::string base, const auto& store) -> Result<Token>;
    auto MemberName(const ComplexType& declaring_type, const std::string& name, const auto& store) -> Result<Token>;
};
} // namespace pmd

#endif // PMD_UPDATER_HH
