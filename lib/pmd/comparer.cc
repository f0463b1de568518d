#include <pmd/comparer.hh>

#include <bit>
#include <functional>

namespace pmd {
namespace {
constexpr usz HashMultiplier = usz(-1521134295);

auto Combine(usz hash, usz value) -> usz {
    return hash * HashMultiplier + value;
}

auto HashString(std::string_view s) -> usz {
    return std::hash<std::string_view>{}(s);
}

template <typename T, typename Eq>
bool VectorEquals(const std::vector<T>& a, const std::vector<T>& b, Eq eq) {
    if (a.size() != b.size()) return false;
    for (usz i = 0; i < a.size(); i++)
        if (not eq(a[i], b[i]))
            return false;
    return true;
}

template <typename T>
bool OptionalEquals(const std::optional<T>& a, const std::optional<T>& b, auto eq) {
    if (not a or not b) return not a and not b;
    return eq(*a, *b);
}

bool FloatBitsEqual(f64 a, f64 b) { return std::bit_cast<u64>(a) == std::bit_cast<u64>(b); }

/// Compare constant values. Floats compare by bit pattern so NaNs
/// round-trip as equal.
bool ValueEquals(const Constant::Value& a, const Constant::Value& b) {
    if (a.index() != b.index()) return false;
    if (auto f = std::get_if<f32>(&a)) return std::bit_cast<u32>(*f) == std::bit_cast<u32>(std::get<f32>(b));
    if (auto d = std::get_if<f64>(&a)) return FloatBitsEqual(*d, std::get<f64>(b));
    return a == b;
}

bool ConstantEquals(const std::optional<Constant>& a, const std::optional<Constant>& b) {
    return OptionalEquals(a, b, [](const Constant& x, const Constant& y) {
        return x.type == y.type and ValueEquals(x.value, y.value);
    });
}

bool LayoutEquals(const std::optional<ClassLayout>& a, const std::optional<ClassLayout>& b) {
    return OptionalEquals(a, b, [](const ClassLayout& x, const ClassLayout& y) {
        return x.packing_size == y.packing_size and x.class_size == y.class_size;
    });
}

bool ImplMapEquals(const std::optional<ImplMap>& a, const std::optional<ImplMap>& b) {
    return OptionalEquals(a, b, [](const ImplMap& x, const ImplMap& y) {
        return x.name == y.name and x.module == y.module and x.attributes == y.attributes;
    });
}

bool HandlerEquals(const ExceptionHandler& a, const ExceptionHandler& b) {
    return a.try_start == b.try_start
       and a.try_end == b.try_end
       and a.filter_start == b.filter_start
       and a.handler_start == b.handler_start
       and a.handler_end == b.handler_end
       and a.handler_type == b.handler_type
       and a.catch_type == b.catch_type;
}
} // namespace
} // namespace pmd

auto pmd::EqualityComparer::Reference() -> const EqualityComparer& {
    static constexpr EqualityComparer comparer{true, true};
    return comparer;
}

auto pmd::EqualityComparer::Full() -> const EqualityComparer& {
    static constexpr EqualityComparer comparer{false, false};
    return comparer;
}

template <typename T, typename Eq>
bool pmd::EqualityComparer::ListEquals(
    const std::optional<std::vector<T>>& a,
    const std::optional<std::vector<T>>& b,
    Eq eq
) const {
    if (not a or not b) {
        if (not a and not b) return true;
        if (not null_equals_empty) return false;
        return a ? a->empty() : b->empty();
    }

    return VectorEquals(*a, *b, eq);
}

/// ===========================================================================
///  Identity
/// ===========================================================================
bool pmd::EqualityComparer::equals(const TypeRef& a, const TypeRef& b) const {
    return a.name == b.name
       and a.ns == b.ns
       and a.assembly == b.assembly
       and ListEquals(a.enclosing_names, b.enclosing_names, std::equal_to<>{});
}

bool pmd::EqualityComparer::equals(const FieldRef& a, const FieldRef& b) const {
    return a.name == b.name and equals(a.type, b.type) and equals(a.signature, b.signature);
}

bool pmd::EqualityComparer::equals(const MethodRef& a, const MethodRef& b) const {
    return a.name == b.name and equals(a.type, b.type) and equals(a.signature, b.signature);
}

bool pmd::EqualityComparer::equals(const ComplexType& a, const ComplexType& b) const {
    return a == b;
}

auto pmd::EqualityComparer::hash(const TypeRef& t) const -> usz {
    usz h = HashString(t.name);
    h = Combine(h, HashString(t.ns));
    h = Combine(h, t.assembly ? HashString(*t.assembly) : 0);

    usz names = 0;
    if (t.enclosing_names)
        for (const auto& n : *t.enclosing_names)
            names = Combine(names, HashString(n));
    return Combine(h, names);
}

auto pmd::EqualityComparer::hash(const FieldRef& f) const -> usz {
    return Combine(Combine(HashString(f.name), hash(f.type)), hash(f.signature));
}

auto pmd::EqualityComparer::hash(const MethodRef& m) const -> usz {
    return Combine(Combine(HashString(m.name), hash(m.type)), hash(m.signature));
}

auto pmd::EqualityComparer::hash(const ComplexType& t) const -> usz {
    usz h = usz(+t.kind());
    h = Combine(h, std::hash<Token>{}(t.token()));
    h = Combine(h, t.type());
    for (const auto& arg : t.arguments()) h = Combine(h, hash(arg));
    return h;
}

/// ===========================================================================
///  Entities
/// ===========================================================================
bool pmd::EqualityComparer::equals(const Type& a, const Type& b) const {
    if (not only_reference and a.is_definition() != b.is_definition()) return false;
    if (not equals(a.identity(), b.identity())) return false;
    if (only_reference or not a.is_definition()) return true;
    return Equals(a.definition(), b.definition());
}

bool pmd::EqualityComparer::equals(const Field& a, const Field& b) const {
    if (not only_reference and a.is_definition() != b.is_definition()) return false;
    if (not equals(a.identity(), b.identity())) return false;
    if (only_reference or not a.is_definition()) return true;
    return Equals(a.definition(), b.definition());
}

bool pmd::EqualityComparer::equals(const Method& a, const Method& b) const {
    if (not only_reference and a.is_definition() != b.is_definition()) return false;
    if (not equals(a.identity(), b.identity())) return false;
    if (only_reference or not a.is_definition()) return true;
    return Equals(a.definition(), b.definition());
}

/// ===========================================================================
///  Definitions
/// ===========================================================================
bool pmd::EqualityComparer::Equals(const TypeDef& a, const TypeDef& b) const {
    auto complex = [this](const ComplexType& x, const ComplexType& y) { return equals(x, y); };
    auto property = [&](const Property& x, const Property& y) {
        return x.name == y.name
           and equals(x.signature, y.signature)
           and x.attributes == y.attributes
           and x.get_method == y.get_method
           and x.set_method == y.set_method
           and Equals(x.custom_attributes, y.custom_attributes);
    };
    auto event = [&](const Event& x, const Event& y) {
        return x.name == y.name
           and equals(x.type, y.type)
           and x.attributes == y.attributes
           and x.add_method == y.add_method
           and x.remove_method == y.remove_method
           and x.invoke_method == y.invoke_method
           and Equals(x.custom_attributes, y.custom_attributes);
    };

    return a.attributes == b.attributes
       and OptionalEquals(a.base_type, b.base_type, complex)
       and Equals(a.custom_attributes, b.custom_attributes)
       and Equals(a.generic_parameters, b.generic_parameters)
       and ListEquals(a.interfaces, b.interfaces, complex)
       and LayoutEquals(a.class_layout, b.class_layout)
       and ListEquals(a.nested_types, b.nested_types, std::equal_to<>{})
       and ListEquals(a.fields, b.fields, std::equal_to<>{})
       and ListEquals(a.methods, b.methods, std::equal_to<>{})
       and ListEquals(a.properties, b.properties, property)
       and ListEquals(a.events, b.events, event);
}

bool pmd::EqualityComparer::Equals(const FieldDef& a, const FieldDef& b) const {
    return a.attributes == b.attributes
       and ListEquals(a.initial_value, b.initial_value, std::equal_to<>{})
       and Equals(a.custom_attributes, b.custom_attributes)
       and ConstantEquals(a.constant, b.constant);
}

bool pmd::EqualityComparer::Equals(const MethodDef& a, const MethodDef& b) const {
    auto param = [&](const Parameter& x, const Parameter& y) {
        return x.name == y.name
           and x.sequence == y.sequence
           and x.attributes == y.attributes
           and Equals(x.custom_attributes, y.custom_attributes)
           and ConstantEquals(x.constant, y.constant);
    };

    return a.attributes == b.attributes
       and a.impl_attributes == b.impl_attributes
       and VectorEquals(a.parameters, b.parameters, param)
       and OptionalEquals(a.body, b.body, [this](const MethodBody& x, const MethodBody& y) { return Equals(x, y); })
       and Equals(a.custom_attributes, b.custom_attributes)
       and Equals(a.generic_parameters, b.generic_parameters)
       and ListEquals(a.overrides, b.overrides, std::equal_to<>{})
       and ImplMapEquals(a.impl_map, b.impl_map);
}

bool pmd::EqualityComparer::Equals(const MethodBody& a, const MethodBody& b) const {
    return a.max_stack == b.max_stack
       and a.init_locals == b.init_locals
       and VectorEquals(a.instructions, b.instructions, [this](const Instruction& x, const Instruction& y) { return Equals(x, y); })
       and VectorEquals(a.exception_handlers, b.exception_handlers, HandlerEquals)
       and VectorEquals(a.variables, b.variables, [this](const ComplexType& x, const ComplexType& y) { return equals(x, y); });
}

bool pmd::EqualityComparer::Equals(const Instruction& a, const Instruction& b) const {
    if (a.opcode != b.opcode or a.operand.index() != b.operand.index()) return false;
    if (auto f = std::get_if<f32>(&a.operand)) return std::bit_cast<u32>(*f) == std::bit_cast<u32>(std::get<f32>(b.operand));
    if (auto d = std::get_if<f64>(&a.operand)) return FloatBitsEqual(*d, std::get<f64>(b.operand));
    return a.operand == b.operand;
}

bool pmd::EqualityComparer::Equals(
    const std::optional<std::vector<CustomAttribute>>& a,
    const std::optional<std::vector<CustomAttribute>>& b
) const {
    return ListEquals(a, b, [](const CustomAttribute& x, const CustomAttribute& y) {
        return x.constructor == y.constructor and x.raw_data == y.raw_data;
    });
}

bool pmd::EqualityComparer::Equals(const GenericParameterList& a, const GenericParameterList& b) const {
    return ListEquals(a, b, [this](const GenericParameter& x, const GenericParameter& y) {
        return x.name == y.name
           and x.attributes == y.attributes
           and x.number == y.number
           and ListEquals(x.constraints, y.constraints, [this](const ComplexType& p, const ComplexType& q) {
                   return equals(p, q);
               });
    });
}
