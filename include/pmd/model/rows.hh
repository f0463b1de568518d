#ifndef PMD_MODEL_ROWS_HH
#define PMD_MODEL_ROWS_HH

#include <pmd/model/node.hh>
#include <pmd/model/signatures.hh>
#include <pmd/primitives.hh>
#include <pmd/utils.hh>

#include <optional>
#include <string>
#include <vector>

namespace pmd::model {
/// A custom attribute: the constructor and the encoded blob.
struct CustomAttribute {
    /// A \c MethodDef or a \c MemberRef.
    Row* constructor{};
    std::vector<u8> blob{};
};

struct GenericParam {
    std::string name{};
    u16 attributes{};
    u16 number{};
    std::vector<TypeDefOrRef*> constraints{};
};

struct ClassLayout {
    u16 packing_size{};
    u32 class_size{};
};

struct ParamDef {
    std::string name{};
    u16 sequence{};
    u16 attributes{};
    std::optional<Constant> constant{};
    std::vector<CustomAttribute> custom_attributes{};
};

/// P/Invoke information of a method.
struct ImplMap {
    ModuleRef* module{};
    std::string name{};
    u16 attributes{};
};

struct PropertyDef {
    std::string name{};
    PropertySig* signature{};
    u16 attributes{};
    MethodDef* get_method{};
    MethodDef* set_method{};
    std::vector<CustomAttribute> custom_attributes{};
};

struct EventDef {
    std::string name{};
    TypeDefOrRef* type{};
    u16 attributes{};
    MethodDef* add_method{};
    MethodDef* remove_method{};
    MethodDef* invoke_method{};
    std::vector<CustomAttribute> custom_attributes{};
};

/// Base class of everything that has a metadata token.
class Row : public Node {
public:
    enum struct Kind {
        AssemblyRef,
        ModuleRef,
        TypeDef,
        TypeRef,
        TypeSpec,
        FieldDef,
        MethodDef,
        MemberRef,
        MethodSpec,
    };

private:
    const Kind _kind;

protected:
    explicit Row(Kind kind) : _kind(kind) {}

public:
    [[nodiscard]] auto kind() const -> Kind { return _kind; }
};

/// A referenced assembly.
class AssemblyRef : public Row {
    std::string _name;
    std::string _version;
    std::string _culture;
    std::string _public_key_token;

public:
    explicit AssemblyRef(
        std::string name,
        std::string version = "0.0.0.0",
        std::string culture = "neutral",
        std::string public_key_token = "null"
    ) : Row(Kind::AssemblyRef),
        _name(std::move(name)),
        _version(std::move(version)),
        _culture(std::move(culture)),
        _public_key_token(std::move(public_key_token)) {}

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto version() const -> const std::string& { return _version; }
    [[nodiscard]] auto culture() const -> const std::string& { return _culture; }
    [[nodiscard]] auto public_key_token() const -> const std::string& { return _public_key_token; }

    /// Get the display name.
    [[nodiscard]] auto full_name() const -> std::string;

    /// RTTI.
    static bool classof(const Row* r) { return r->kind() == Kind::AssemblyRef; }
};

/// A reference to another module of this assembly.
class ModuleRef : public Row {
    std::string _name;

public:
    explicit ModuleRef(std::string name) : Row(Kind::ModuleRef), _name(std::move(name)) {}

    [[nodiscard]] auto name() const -> const std::string& { return _name; }

    /// RTTI.
    static bool classof(const Row* r) { return r->kind() == Kind::ModuleRef; }
};

/// A \c TypeDef, \c TypeRef or \c TypeSpec.
class TypeDefOrRef : public Row {
protected:
    using Row::Row;

public:
    /// RTTI.
    static bool classof(const Row* r) {
        return r->kind() == Kind::TypeDef or r->kind() == Kind::TypeRef or r->kind() == Kind::TypeSpec;
    }
};

/// A type defined in a module.
class TypeDef : public TypeDefOrRef {
    Module* _module;
    std::string _namespace;
    std::string _name;
    TypeDef* _declaring_type{};

public:
    u32 attributes{};
    TypeDefOrRef* base_type{};
    std::vector<TypeDefOrRef*> interfaces{};
    std::optional<ClassLayout> class_layout{};
    std::vector<GenericParam> generic_params{};
    std::vector<CustomAttribute> custom_attributes{};

    std::vector<TypeDef*> nested_types{};
    std::vector<FieldDef*> fields{};
    std::vector<MethodDef*> methods{};
    std::vector<PropertyDef> properties{};
    std::vector<EventDef> events{};

    TypeDef(Module* mod, std::string ns, std::string name)
        : TypeDefOrRef(Kind::TypeDef), _module(mod), _namespace(std::move(ns)), _name(std::move(name)) {}

    /// Get the module this type is defined in.
    [[nodiscard]] auto module() const -> Module* { return _module; }

    [[nodiscard]] auto ns() const -> const std::string& { return _namespace; }
    [[nodiscard]] auto name() const -> const std::string& { return _name; }

    /// Get the enclosing type, or null if this is not a nested type.
    [[nodiscard]] auto declaring_type() const -> TypeDef* { return _declaring_type; }

    /// Add a nested type. Nested types have no namespace of their own.
    void add_nested_type(TypeDef* type);

    /// Add a field or method and make this its declaring type.
    void add_field(FieldDef* field);
    void add_method(MethodDef* method);

    /// Find a field or method by name and signature.
    [[nodiscard]] auto find_field(std::string_view name, const FieldSig* sig) const -> FieldDef*;
    [[nodiscard]] auto find_method(std::string_view name, const MethodSig* sig) const -> MethodDef*;

    /// Get the name including the namespace and the enclosing types.
    [[nodiscard]] auto full_name() const -> std::string;

    /// RTTI.
    static bool classof(const Row* r) { return r->kind() == Kind::TypeDef; }
};

/// A type defined elsewhere.
class TypeRef : public TypeDefOrRef {
    std::string _namespace;
    std::string _name;

    /// An \c AssemblyRef, an enclosing \c TypeRef, or a \c ModuleRef.
    Row* _scope;

public:
    TypeRef(std::string ns, std::string name, Row* scope)
        : TypeDefOrRef(Kind::TypeRef), _namespace(std::move(ns)), _name(std::move(name)), _scope(scope) {
        PMD_ASSERT(scope, "TypeRef '{}' needs a resolution scope", _name);
    }

    [[nodiscard]] auto ns() const -> const std::string& { return _namespace; }
    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto scope() const -> Row* { return _scope; }

    /// Get the enclosing type, or null if this is not a nested type.
    [[nodiscard]] auto declaring_type() const -> TypeRef*;

    /// Get the assembly that defines this type, following enclosing
    /// types. Null if the outermost scope is not an assembly.
    [[nodiscard]] auto definition_assembly() const -> AssemblyRef*;

    /// RTTI.
    static bool classof(const Row* r) { return r->kind() == Kind::TypeRef; }
};

/// A type given by a signature.
class TypeSpec : public TypeDefOrRef {
    TypeSig* _signature;

public:
    explicit TypeSpec(TypeSig* signature) : TypeDefOrRef(Kind::TypeSpec), _signature(signature) {}

    [[nodiscard]] auto signature() const -> TypeSig* { return _signature; }

    /// RTTI.
    static bool classof(const Row* r) { return r->kind() == Kind::TypeSpec; }
};

class FieldDef : public Row {
    friend TypeDef;

    std::string _name;
    FieldSig* _signature;
    TypeDef* _declaring_type{};

public:
    u16 attributes{};
    std::optional<std::vector<u8>> initial_value{};
    std::optional<Constant> constant{};
    std::vector<CustomAttribute> custom_attributes{};

    FieldDef(std::string name, FieldSig* signature, u16 attributes_ = 0)
        : Row(Kind::FieldDef), _name(std::move(name)), _signature(signature), attributes(attributes_) {}

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto signature() const -> FieldSig* { return _signature; }
    [[nodiscard]] auto declaring_type() const -> TypeDef* { return _declaring_type; }

    /// RTTI.
    static bool classof(const Row* r) { return r->kind() == Kind::FieldDef; }
};

class MethodDef : public Row {
    friend TypeDef;

    std::string _name;
    MethodSig* _signature;
    TypeDef* _declaring_type{};

public:
    u16 attributes{};
    u16 impl_attributes{};
    std::vector<ParamDef> params{};
    CilBody* body{};

    /// The methods this one implements (\c MethodDef or \c MemberRef).
    std::vector<Row*> overrides{};
    std::optional<ImplMap> impl_map{};
    std::vector<GenericParam> generic_params{};
    std::vector<CustomAttribute> custom_attributes{};

    MethodDef(std::string name, MethodSig* signature, u16 attributes_ = 0)
        : Row(Kind::MethodDef), _name(std::move(name)), _signature(signature), attributes(attributes_) {}

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto signature() const -> MethodSig* { return _signature; }
    [[nodiscard]] auto declaring_type() const -> TypeDef* { return _declaring_type; }

    /// RTTI.
    static bool classof(const Row* r) { return r->kind() == Kind::MethodDef; }
};

/// A reference to a field or method.
class MemberRef : public Row {
    std::string _name;
    CallingConventionSig* _signature;

    /// A \c TypeDefOrRef, a \c ModuleRef (global members of another
    /// module) or a \c MethodDef (vararg call sites).
    Row* _parent;

public:
    MemberRef(std::string name, CallingConventionSig* signature, Row* parent)
        : Row(Kind::MemberRef), _name(std::move(name)), _signature(signature), _parent(parent) {}

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto signature() const -> CallingConventionSig* { return _signature; }
    [[nodiscard]] auto parent() const -> Row* { return _parent; }

    [[nodiscard]] bool is_field_ref() const;
    [[nodiscard]] bool is_method_ref() const;

    /// RTTI.
    static bool classof(const Row* r) { return r->kind() == Kind::MemberRef; }
};

/// An instantiation of a generic method.
class MethodSpec : public Row {
    /// A \c MethodDef or a \c MemberRef.
    Row* _method;
    GenericInstMethodSig* _instantiation;

public:
    MethodSpec(Row* method, GenericInstMethodSig* instantiation)
        : Row(Kind::MethodSpec), _method(method), _instantiation(instantiation) {}

    [[nodiscard]] auto method() const -> Row* { return _method; }
    [[nodiscard]] auto instantiation() const -> GenericInstMethodSig* { return _instantiation; }

    /// RTTI.
    static bool classof(const Row* r) { return r->kind() == Kind::MethodSpec; }
};

constexpr auto StringifyEnum(Row::Kind k) -> std::string_view {
    switch (k) {
        case Row::Kind::AssemblyRef: return "AssemblyRef";
        case Row::Kind::ModuleRef: return "ModuleRef";
        case Row::Kind::TypeDef: return "TypeDef";
        case Row::Kind::TypeRef: return "TypeRef";
        case Row::Kind::TypeSpec: return "TypeSpec";
        case Row::Kind::FieldDef: return "FieldDef";
        case Row::Kind::MethodDef: return "MethodDef";
        case Row::Kind::MemberRef: return "MemberRef";
        case Row::Kind::MethodSpec: return "MethodSpec";
    }
    return "<invalid>";
}
} // namespace pmd::model

#endif // PMD_MODEL_ROWS_HH
