#ifndef PMD_MODEL_MODULE_HH
#define PMD_MODEL_MODULE_HH

#include <pmd/model/cil.hh>
#include <pmd/model/node.hh>
#include <pmd/model/rows.hh>
#include <pmd/model/signatures.hh>
#include <pmd/utils.hh>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace pmd::model {
/// An editable in-memory .NET module.
///
/// The module owns every node allocated on it. Rows created through
/// the \c create_*() functions are also registered in the tables of
/// the module; nodes created with placement new directly are merely
/// owned.
class Module {
    friend Node;

    std::string _name;

    /// All nodes owned by this module.
    std::vector<Node*> nodes;

    std::vector<TypeDef*> _types;
    std::vector<AssemblyRef*> _assembly_refs;
    std::vector<ModuleRef*> _module_refs;
    std::vector<TypeRef*> _type_refs;
    std::vector<MemberRef*> _member_refs;

    /// Leaf signatures, created on demand.
    std::array<LeafSig*, 0x100> leaves{};

public:
    /// The name of the type that holds global fields and methods.
    static constexpr std::string_view GlobalTypeName = "<Module>";

    /// Create a module. This also creates its global type.
    explicit Module(std::string name);
    ~Module();

    Module(const Module&) = delete;
    Module(Module&&) = delete;
    auto operator=(const Module&) -> Module& = delete;
    auto operator=(Module&&) -> Module& = delete;

    [[nodiscard]] auto name() const -> const std::string& { return _name; }

    /// Top-level types, starting with the global type.
    [[nodiscard]] auto types() const -> const std::vector<TypeDef*>& { return _types; }
    [[nodiscard]] auto global_type() const -> TypeDef* { return _types.front(); }

    [[nodiscard]] auto assembly_refs() const -> const std::vector<AssemblyRef*>& { return _assembly_refs; }
    [[nodiscard]] auto module_refs() const -> const std::vector<ModuleRef*>& { return _module_refs; }
    [[nodiscard]] auto type_refs() const -> const std::vector<TypeRef*>& { return _type_refs; }
    [[nodiscard]] auto member_refs() const -> const std::vector<MemberRef*>& { return _member_refs; }

    /// Get the signature of a primitive type, \c Object, \c String,
    /// \c TypedByRef or the Sentinel marker.
    [[nodiscard]] auto leaf(ElementType et) -> LeafSig*;

    /// Create a top-level type, or a nested type if \c declaring_type is set.
    auto create_type(std::string ns, std::string name, TypeDef* declaring_type = nullptr) -> TypeDef*;

    auto create_field(TypeDef* declaring_type, std::string name, FieldSig* signature, u16 attributes = 0) -> FieldDef*;
    auto create_method(TypeDef* declaring_type, std::string name, MethodSig* signature, u16 attributes = 0) -> MethodDef*;

    auto create_assembly_ref(std::string name) -> AssemblyRef*;

    /// Create an assembly reference from a display name such as
    /// \c "mscorlib, Version=4.0.0.0, Culture=neutral, PublicKeyToken=b77a5c561934e089".
    ///
    /// Attributes that are missing keep their defaults; unknown
    /// attributes are ignored.
    auto create_assembly_ref_from_full_name(std::string_view full_name) -> AssemblyRef*;

    auto create_module_ref(std::string name) -> ModuleRef*;
    auto create_type_ref(std::string ns, std::string name, Row* scope) -> TypeRef*;
    auto create_member_ref(std::string name, CallingConventionSig* signature, Row* parent) -> MemberRef*;

    /// Find a top-level type by namespace and name.
    [[nodiscard]] auto find_type(std::string_view ns, std::string_view name) const -> TypeDef*;

    /// Visit every type defined in this module, nested types after
    /// their enclosing type.
    template <typename Callable>
    void for_each_type(Callable&& cb) const {
        std::vector<TypeDef*> stack{_types.rbegin(), _types.rend()};
        while (not stack.empty()) {
            auto t = stack.back();
            stack.pop_back();
            cb(t);
            stack.insert(stack.end(), t->nested_types.rbegin(), t->nested_types.rend());
        }
    }
};
} // namespace pmd::model

#endif // PMD_MODEL_MODULE_HH
