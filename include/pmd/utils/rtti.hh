#ifndef PMD_RTTI_HH
#define PMD_RTTI_HH

#include <pmd/utils.hh>

namespace pmd::detail {
template <typename Type>
concept ClassPointer = std::is_pointer_v<std::remove_reference_t<Type>>
                   and std::is_class_v<std::remove_pointer_t<std::remove_reference_t<Type>>>;

/// Return const To if From is const.
template <typename From, typename To>
using merge_const = std::conditional_t<std::is_const_v<From>, std::add_const_t<To>, To>;

/// Casting between model nodes, based on the \c classof() hooks.
template <bool checked, typename Target, typename Value>
auto cast_impl(Value&& value) {
    static_assert(
        std::is_same_v<std::remove_cvref_t<Target>, std::remove_const_t<Target>>,
        "Target type of cast may at most be const-qualified"
    );
    static_assert(std::is_class_v<Target>, "Target type of cast must be a class type");
    static_assert(
        std::is_pointer_v<std::remove_cvref_t<Value>>,
        "Argument of cast must be a pointer to a class type"
    );

    using ClassType = std::remove_pointer_t<std::remove_reference_t<Value>>;
    using ResultType = merge_const<ClassType, Target>*;

    // Upcasts never need a runtime check.
    if constexpr (std::is_same_v<ClassType, Target> or std::is_base_of_v<Target, ClassType>)
        return static_cast<ResultType>(value);

    // Downcasts ask the target class.
    else if constexpr (std::is_base_of_v<ClassType, Target>) {
        PMD_ASSERT(value, "Cannot perform dynamic cast from null");
        if (Target::classof(value))
            return static_cast<ResultType>(value);

        if constexpr (checked)
            PMD_ASSERT(false, "Unexpected dynamic type");

        return static_cast<ResultType>(nullptr);
    }

    else {
        static_assert(always_false<Target>, "Cannot cast between unrelated types");
    }
}
} // namespace pmd::detail

namespace pmd {
/// Cast a node to \c Target, or return null if its dynamic type
/// is not a \c Target.
template <typename Target, detail::ClassPointer Object>
auto cast(Object&& value) { return detail::cast_impl<false, Target>(value); }

/// Like \c cast(), but the dynamic type must match.
template <typename Target, detail::ClassPointer Object>
auto as(Object&& value) { return detail::cast_impl<true, Target>(value); }

/// Check if the dynamic type of a node is one of \c Types.
template <typename... Types, detail::ClassPointer Object>
bool is(Object&& value) { return (bool(detail::cast_impl<false, Types>(value)) or ...); }
} // namespace pmd

#endif // PMD_RTTI_HH
