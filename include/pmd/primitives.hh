#ifndef PMD_PRIMITIVES_HH
#define PMD_PRIMITIVES_HH

#include <pmd/complex_type.hh>
#include <pmd/utils.hh>
#include <pmd/utils/result.hh>

#include <optional>
#include <string>
#include <variant>

namespace pmd {
/// A constant value attached to a field or parameter.
///
/// \c type is the element type code the value was declared with;
/// it is kept separately because a null reference constant has
/// the Class element type but no value.
struct Constant {
    using Value = std::variant<
        std::monostate,
        bool,
        char16_t,
        i8,
        u8,
        i16,
        u16,
        i32,
        u32,
        i64,
        u64,
        f32,
        f64,
        std::string>;

    u8 type{};
    Value value{};

    bool operator==(const Constant&) const = default;
};

/// Pack a primitive value into a 64-bit slot.
///
/// Returns nothing for values that are not primitives (strings and
/// the empty value). Floats are widened to double; a NaN whose payload
/// does not survive the widening raises a warning.
auto ToSlot(const Constant::Value& value) -> std::optional<i64>;

/// Unpack a slot produced by \c ToSlot().
///
/// \c element_type selects the primitive type; anything that is not
/// a primitive element type is an error.
auto FromSlot(i64 slot, u8 element_type) -> Result<Constant::Value>;

/// Get the element type code of a primitive value, if any.
auto ElementTypeOf(const Constant::Value& value) -> std::optional<ElementType>;
} // namespace pmd

#endif // PMD_PRIMITIVES_HH
