#ifndef PMD_FACADE_HH
#define PMD_FACADE_HH

#include <pmd/entities.hh>
#include <pmd/metadata.hh>
#include <pmd/utils.hh>
#include <pmd/utils/result.hh>

#include <string>
#include <utility>
#include <vector>

namespace pmd {
/// String-keyed map that iterates in insertion order.
template <typename T>
class OrderedMap {
    std::vector<std::pair<std::string, T>> entries;
    StringMap<usz> index;

public:
    /// Add an entry. Returns false if the key already exists.
    bool add(std::string key, T value) {
        if (index.contains(key)) return false;
        index.emplace(key, entries.size());
        entries.emplace_back(std::move(key), std::move(value));
        return true;
    }

    /// Find an entry, or null.
    [[nodiscard]] auto find(std::string_view key) const -> const T* {
        auto it = index.find(key);
        if (it == index.end()) return nullptr;
        return &entries[it->second].second;
    }

    [[nodiscard]] auto size() const -> usz { return entries.size(); }
    [[nodiscard]] bool empty() const { return entries.empty(); }
    [[nodiscard]] auto operator[](usz i) const -> const std::pair<std::string, T>& { return entries[i]; }
    [[nodiscard]] auto begin() const { return entries.cbegin(); }
    [[nodiscard]] auto end() const { return entries.cend(); }
};

/// One section of a facade: references and definitions of one
/// entity kind, split apart.
///
/// In named-token mode, \c orders records where the original sequence
/// switched between references and definitions so it can be rebuilt.
/// The first boundary starts a run of definitions.
template <typename TRef, typename TDef>
struct EntityFacade {
    OrderedMap<TRef> references{};
    OrderedMap<TDef> definitions{};
    std::vector<i32> orders{};
};

/// Serialisation-friendly view of a metadata container.
///
/// Every entity is keyed by the string form of its token, and
/// references and definitions are kept apart so each map holds values
/// of a single shape.
class Facade {
public:
    Options options = Options::None;
    EntityFacade<TypeRef, TypeDef> types{};
    EntityFacade<FieldRef, FieldDef> fields{};
    EntityFacade<MethodRef, MethodDef> methods{};

    /// Build a facade from a container.
    static auto FromMetadata(const Metadata& metadata) -> Facade;

    /// Rebuild the container.
    ///
    /// Entities end up in the same order with the same tokens as in the
    /// container this was created from.
    [[nodiscard]] auto to_metadata() const -> Result<Metadata>;
};
} // namespace pmd

#endif // PMD_FACADE_HH
