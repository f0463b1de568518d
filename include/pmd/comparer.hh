#ifndef PMD_COMPARER_HH
#define PMD_COMPARER_HH

#include <pmd/complex_type.hh>
#include <pmd/entities.hh>
#include <pmd/utils.hh>

namespace pmd {
/// Structural equality for portable metadata.
///
/// There are two comparers. The reference comparer only looks at the
/// identity of an entity (what a reference to it would contain) and
/// treats missing lists as empty; the updater uses it to deduplicate.
/// The full comparer also requires both sides to be of the same shape
/// and compares every piece of definition data.
class EqualityComparer {
    bool only_reference;
    bool null_equals_empty;

    constexpr EqualityComparer(bool only_reference_, bool null_equals_empty_)
        : only_reference(only_reference_), null_equals_empty(null_equals_empty_) {}

public:
    static auto Reference() -> const EqualityComparer&;
    static auto Full() -> const EqualityComparer&;

    bool equals(const TypeRef& a, const TypeRef& b) const;
    bool equals(const FieldRef& a, const FieldRef& b) const;
    bool equals(const MethodRef& a, const MethodRef& b) const;
    bool equals(const ComplexType& a, const ComplexType& b) const;

    bool equals(const Type& a, const Type& b) const;
    bool equals(const Field& a, const Field& b) const;
    bool equals(const Method& a, const Method& b) const;

    /// Hashes only depend on the identity, so they agree with both comparers.
    auto hash(const TypeRef& t) const -> usz;
    auto hash(const FieldRef& f) const -> usz;
    auto hash(const MethodRef& m) const -> usz;
    auto hash(const ComplexType& t) const -> usz;

private:
    template <typename T, typename Eq>
    bool ListEquals(const std::optional<std::vector<T>>& a, const std::optional<std::vector<T>>& b, Eq eq) const;

    bool Equals(const TypeDef& a, const TypeDef& b) const;
    bool Equals(const FieldDef& a, const FieldDef& b) const;
    bool Equals(const MethodDef& a, const MethodDef& b) const;
    bool Equals(const MethodBody& a, const MethodBody& b) const;
    bool Equals(const Instruction& a, const Instruction& b) const;
    bool Equals(const std::optional<std::vector<CustomAttribute>>& a, const std::optional<std::vector<CustomAttribute>>& b) const;
    bool Equals(const GenericParameterList& a, const GenericParameterList& b) const;
};

/// Hash functor for keying containers by entity identity.
struct ReferenceHash {
    template <typename T>
    auto operator()(const T& t) const -> usz { return EqualityComparer::Reference().hash(t); }
};

/// Equality functor for keying containers by entity identity.
struct ReferenceEqual {
    template <typename T>
    bool operator()(const T& a, const T& b) const { return EqualityComparer::Reference().equals(a, b); }
};
} // namespace pmd

#endif // PMD_COMPARER_HH
