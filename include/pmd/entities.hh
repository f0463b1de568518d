#ifndef PMD_ENTITIES_HH
#define PMD_ENTITIES_HH

#include <pmd/complex_type.hh>
#include <pmd/primitives.hh>
#include <pmd/token.hh>
#include <pmd/utils.hh>

#include <concepts>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pmd {
struct CustomAttribute {
    /// The attribute constructor (a method token).
    Token constructor{};

    /// The raw attribute blob.
    std::vector<u8> raw_data{};
};

using CustomAttributeList = std::optional<std::vector<CustomAttribute>>;

struct GenericParameter {
    std::string name{};
    i32 attributes{};
    i32 number{};
    std::optional<std::vector<ComplexType>> constraints{};
};

using GenericParameterList = std::optional<std::vector<GenericParameter>>;

struct ClassLayout {
    i32 packing_size{};
    i32 class_size{};
};

struct Property {
    std::string name{};

    /// A Property calling-convention signature.
    ComplexType signature{};
    i32 attributes{};
    std::optional<Token> get_method{};
    std::optional<Token> set_method{};
    CustomAttributeList custom_attributes{};
};

struct Event {
    std::string name{};
    ComplexType type{};
    i32 attributes{};
    std::optional<Token> add_method{};
    std::optional<Token> remove_method{};
    std::optional<Token> invoke_method{};
    CustomAttributeList custom_attributes{};
};

/// Reference to a type, by name.
struct TypeRef {
    std::string name{};
    std::string ns{};

    /// Defining assembly, or none if it lives in the same module.
    std::optional<std::string> assembly{};

    /// Names of the enclosing types, innermost first.
    std::optional<std::vector<std::string>> enclosing_names{};
};

struct TypeDef : TypeRef {
    i32 attributes{};
    std::optional<ComplexType> base_type{};
    std::optional<std::vector<ComplexType>> interfaces{};
    std::optional<ClassLayout> class_layout{};
    GenericParameterList generic_parameters{};
    CustomAttributeList custom_attributes{};

    /// Children. These are only filled in at DefinitionWithChildren level.
    std::optional<std::vector<Token>> nested_types{};
    std::optional<std::vector<Token>> fields{};
    std::optional<std::vector<Token>> methods{};
    std::optional<std::vector<Property>> properties{};
    std::optional<std::vector<Event>> events{};
};

struct FieldRef {
    std::string name{};

    /// The declaring type.
    ComplexType type{};

    /// A Field calling-convention signature.
    ComplexType signature{};
};

struct FieldDef : FieldRef {
    i32 attributes{};
    std::optional<std::vector<u8>> initial_value{};
    std::optional<Constant> constant{};
    CustomAttributeList custom_attributes{};
};

struct Parameter {
    std::string name{};
    i32 sequence{};
    i32 attributes{};
    std::optional<Constant> constant{};
    CustomAttributeList custom_attributes{};
};

/// A CIL instruction with its operand flattened.
///
/// Branch targets are instruction indices, switch targets a list of
/// them. Local and argument operands are indices too.
struct Instruction {
    using Operand = std::variant<
        std::monostate,
        i32,
        i64,
        f32,
        f64,
        std::string,
        std::vector<i32>,
        ComplexType>;

    std::string opcode{};
    Operand operand{};
};

struct ExceptionHandler {
    static constexpr i32 None = -1;

    i32 try_start = None;
    i32 try_end = None;
    i32 filter_start = None;
    i32 handler_start = None;
    i32 handler_end = None;
    std::optional<ComplexType> catch_type{};
    i32 handler_type{};
};

struct MethodBody {
    std::vector<Instruction> instructions{};
    std::vector<ExceptionHandler> exception_handlers{};
    std::vector<ComplexType> variables{};
    i32 max_stack{};
    bool init_locals{};
};

/// P/Invoke information.
struct ImplMap {
    std::string name{};
    std::string module{};
    i32 attributes{};
};

struct MethodRef {
    std::string name{};

    /// The declaring type.
    ComplexType type{};

    /// A method calling-convention signature.
    ComplexType signature{};
};

struct MethodDef : MethodRef {
    i32 attributes{};
    i32 impl_attributes{};
    std::vector<Parameter> parameters{};
    std::optional<MethodBody> body{};
    std::optional<std::vector<Token>> overrides{};
    std::optional<ImplMap> impl_map{};
    GenericParameterList generic_parameters{};
    CustomAttributeList custom_attributes{};
};

/// An entity that is either a reference or a definition.
///
/// The reference part is the identity of the entity; a definition
/// extends it. Upgrading a reference replaces the whole value.
template <typename TRef, typename TDef>
requires std::derived_from<TDef, TRef>
class Entity {
    std::variant<TRef, TDef> data;

public:
    using Reference = TRef;
    using Definition = TDef;

    Entity(TRef ref) : data(std::move(ref)) {}
    Entity(TDef def) : data(std::move(def)) {}

    /// Check if this is a definition.
    [[nodiscard]] bool is_definition() const { return std::holds_alternative<TDef>(data); }

    /// Get the identity of this entity.
    [[nodiscard]] auto identity() const -> const TRef& {
        return std::visit([](const auto& e) -> const TRef& { return e; }, data);
    }

    /// Get the definition, asserting that this is one.
    [[nodiscard]] auto definition() const -> const TDef& {
        PMD_ASSERT(is_definition(), "Entity '{}' is not a definition", identity().name);
        return std::get<TDef>(data);
    }

    [[nodiscard]] auto definition() -> TDef& {
        PMD_ASSERT(is_definition(), "Entity '{}' is not a definition", identity().name);
        return std::get<TDef>(data);
    }

    /// Get the definition, or null if this is a reference.
    [[nodiscard]] auto as_definition() const -> const TDef* { return std::get_if<TDef>(&data); }

    /// Strip the definition data.
    [[nodiscard]] auto reference() const -> TRef { return identity(); }

    [[nodiscard]] auto name() const -> const std::string& { return identity().name; }
};

using Type = Entity<TypeRef, TypeDef>;
using Field = Entity<FieldRef, FieldDef>;
using Method = Entity<MethodRef, MethodDef>;
} // namespace pmd

#endif // PMD_ENTITIES_HH
