#ifndef PMD_RESULT_HH
#define PMD_RESULT_HH

#include <pmd/diags.hh>
#include <pmd/utils.hh>
#include <type_traits>
#include <variant>

namespace pmd {
/// Result type that can hold either a value or a diagnostic.
///
/// If the result contains a diagnostic, the diagnostic is
/// issued in the destructor, as it usually would be.
template <typename Type>
requires (not std::is_reference_v<Type>)
class [[nodiscard]] Result {
    using ValueType = std::conditional_t<std::is_void_v<Type>, std::monostate, Type>;
    std::variant<ValueType, Diag> data;

public:
    Result()
    requires std::is_default_constructible_v<ValueType>
        : data(ValueType{}) {}

    /// Pointer results are never null.
    Result(std::nullptr_t) = delete;

    /// Create a result that holds a value.
    Result(ValueType value)
    requires (not std::is_void_v<Type>)
        : data(std::move(value)) {}

    /// Create a result that holds a diagnostic.
    Result(Diag diag) : data(std::move(diag)) {}

    /// Create a result from another result.
    template <typename T>
    requires (not std::is_void_v<Type> and not std::is_same_v<T, Type> and std::convertible_to<T, ValueType>)
    Result(Result<T>&& other) {
        if (other.is_diag()) data = std::move(other.diag());
        else data = ValueType(std::move(other.value()));
    }

    /// Get the diagnostic.
    ///
    /// This returns a && to simplify the `return res.diag()` pattern.
    [[nodiscard]] auto diag() -> Diag&& { return std::move(std::get<Diag>(data)); }

    /// Check if the result holds a diagnostic.
    [[nodiscard]] bool is_diag() const { return std::holds_alternative<Diag>(data); }

    /// Check if the result holds a value.
    [[nodiscard]] bool is_value() const { return std::holds_alternative<ValueType>(data); }

    /// Get the value.
    [[nodiscard]] auto value() -> ValueType&
    requires (not std::is_void_v<Type>)
    { return std::get<ValueType>(data); }

    /// Check if this has a value.
    explicit operator bool() const { return is_value(); }

    /// Access the underlying value.
    [[nodiscard]] auto operator*() -> ValueType& { return std::get<ValueType>(data); }

    /// Access the underlying value.
    [[nodiscard]] auto operator->() -> ValueType*
    requires (not std::is_pointer_v<ValueType>)
    { return &std::get<ValueType>(data); }

    /// Access the underlying pointer.
    [[nodiscard]] auto operator->() -> ValueType
    requires std::is_pointer_v<ValueType>
    { return std::get<ValueType>(data); }
};
} // namespace pmd

/// Propagate the diagnostic of a failed result out of the enclosing
/// function, otherwise bind its value to `var`.
#define PMD_TRY(var, expr)                              \
    auto PMD_CAT(_pmd_res_, __LINE__) = (expr);         \
    if (PMD_CAT(_pmd_res_, __LINE__).is_diag())         \
        return PMD_CAT(_pmd_res_, __LINE__).diag();     \
    auto var = std::move(*PMD_CAT(_pmd_res_, __LINE__))

/// Same as \c PMD_TRY, for results without a value.
#define PMD_TRY_VOID(expr)                              \
    do {                                                \
        auto _pmd_res = (expr);                         \
        if (_pmd_res.is_diag()) return _pmd_res.diag(); \
    } while (0)

#endif // PMD_RESULT_HH
