#include <pmd/primitives.hh>

#include <bit>
#include <cmath>

namespace pmd {
namespace {
auto WidenFloat(f32 value) -> i64 {
    auto wide = f64(value);
    if (std::isnan(value) and std::bit_cast<u32>(f32(wide)) != std::bit_cast<u32>(value))
        Diag::Warning("Widening NaN 0x{:08X} to double loses its payload", std::bit_cast<u32>(value));
    return std::bit_cast<i64>(wide);
}

auto NarrowDouble(i64 slot) -> f32 {
    auto wide = std::bit_cast<f64>(slot);
    auto narrow = f32(wide);
    if (std::isnan(wide) and std::bit_cast<i64>(f64(narrow)) != slot)
        Diag::Warning("Narrowing NaN 0x{:016X} to float loses its payload", u64(slot));
    return narrow;
}
} // namespace
} // namespace pmd

auto pmd::ToSlot(const Constant::Value& value) -> std::optional<i64> {
    return std::visit(
        [](const auto& v) -> std::optional<i64> {
            using T = std::remove_cvref_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate> or std::is_same_v<T, std::string>) return std::nullopt;
            else if constexpr (std::is_same_v<T, bool>) return v ? 1 : 0;
            else if constexpr (std::is_same_v<T, u64>) return std::bit_cast<i64>(v);
            else if constexpr (std::is_same_v<T, f32>) return WidenFloat(v);
            else if constexpr (std::is_same_v<T, f64>) return std::bit_cast<i64>(v);
            else return i64(v);
        },
        value
    );
}

auto pmd::FromSlot(i64 slot, u8 element_type) -> Result<Constant::Value> {
    switch (ElementType(element_type)) {
        case ElementType::Boolean: return Constant::Value{slot != 0};
        case ElementType::Char: return Constant::Value{char16_t(slot)};
        case ElementType::I1: return Constant::Value{i8(slot)};
        case ElementType::U1: return Constant::Value{u8(slot)};
        case ElementType::I2: return Constant::Value{i16(slot)};
        case ElementType::U2: return Constant::Value{u16(slot)};
        case ElementType::I4: return Constant::Value{i32(slot)};
        case ElementType::U4: return Constant::Value{u32(slot)};
        case ElementType::I8: return Constant::Value{slot};
        case ElementType::U8: return Constant::Value{std::bit_cast<u64>(slot)};
        case ElementType::R4: return Constant::Value{NarrowDouble(slot)};
        case ElementType::R8: return Constant::Value{std::bit_cast<f64>(slot)};
        default:
            return Diag::Error(
                ErrorId::InvalidData,
                "Element type 0x{:02X} has no primitive slot representation",
                element_type
            );
    }
}

auto pmd::ElementTypeOf(const Constant::Value& value) -> std::optional<ElementType> {
    return std::visit(
        [](const auto& v) -> std::optional<ElementType> {
            using T = std::remove_cvref_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) return std::nullopt;
            else if constexpr (std::is_same_v<T, bool>) return ElementType::Boolean;
            else if constexpr (std::is_same_v<T, char16_t>) return ElementType::Char;
            else if constexpr (std::is_same_v<T, i8>) return ElementType::I1;
            else if constexpr (std::is_same_v<T, u8>) return ElementType::U1;
            else if constexpr (std::is_same_v<T, i16>) return ElementType::I2;
            else if constexpr (std::is_same_v<T, u16>) return ElementType::U2;
            else if constexpr (std::is_same_v<T, i32>) return ElementType::I4;
            else if constexpr (std::is_same_v<T, u32>) return ElementType::U4;
            else if constexpr (std::is_same_v<T, i64>) return ElementType::I8;
            else if constexpr (std::is_same_v<T, u64>) return ElementType::U8;
            else if constexpr (std::is_same_v<T, f32>) return ElementType::R4;
            else if constexpr (std::is_same_v<T, f64>) return ElementType::R8;
            else return ElementType::String;
        },
        value
    );
}
