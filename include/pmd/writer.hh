#ifndef PMD_WRITER_HH
#define PMD_WRITER_HH

#include <pmd/comparer.hh>
#include <pmd/complex_type.hh>
#include <pmd/entities.hh>
#include <pmd/metadata.hh>
#include <pmd/model/module.hh>
#include <pmd/utils.hh>
#include <pmd/utils/result.hh>

#include <functional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pmd {
/// Writes entities of a metadata container into a live module.
///
/// Types that are defined in the module (those without an assembly)
/// are looked up by name and created if they do not exist yet; types
/// of other assemblies become type references. Fields and methods are
/// looked up on their declaring type by name and signature, or become
/// member references if the declaring type is not a definition.
///
/// The writer remembers how far each entity has been written, so
/// adding the same entity again, at the same or a lower level, is a
/// no-op that returns the same row.
class MetadataWriter {
public:
    /// Called with the name of an assembly the first time it is needed.
    /// Return null to fall back to the assembly references of the module.
    using AssemblyResolver = std::function<model::AssemblyRef*(std::string_view name)>;

    /// Called before a type is looked up. Return null to look it up as
    /// usual. \c assembly is null for types defined in the module, in
    /// which case the result must be a \c TypeDef.
    using TypeResolver = std::function<model::TypeDefOrRef*(model::AssemblyRef* assembly, const TypeRef& type)>;

private:
    template <typename T>
    struct EntityWithLevel {
        T* entity;
        Level level;
    };

    model::Module& module;
    const Metadata& metadata;

    std::unordered_map<TypeRef, EntityWithLevel<model::TypeDefOrRef>, ReferenceHash, ReferenceEqual> types;
    std::unordered_map<FieldRef, EntityWithLevel<model::Row>, ReferenceHash, ReferenceEqual> fields;
    std::unordered_map<MethodRef, EntityWithLevel<model::Row>, ReferenceHash, ReferenceEqual> methods;
    StringMap<model::AssemblyRef*> assemblies;

public:
    AssemblyResolver assembly_resolving;
    TypeResolver type_resolving;

    MetadataWriter(model::Module& module, const Metadata& metadata);

    MetadataWriter(const MetadataWriter&) = delete;
    auto operator=(const MetadataWriter&) -> MetadataWriter& = delete;

    [[nodiscard]] auto target() const -> model::Module& { return module; }

    /// Write a type.
    ///
    /// At \c Level::Reference, this only resolves the type. Higher
    /// levels require \c type to be a definition of a type in this
    /// module.
    auto add_type(const Type& type, Level level) -> Result<model::TypeDefOrRef*>;
    auto add_field(const Field& field, Level level) -> Result<model::Row*>;
    auto add_method(const Method& method, Level level) -> Result<model::Row*>;

    /// Write the entity stored under a token of the container.
    auto add_type(const Token& token, Level level) -> Result<model::TypeDefOrRef*>;
    auto add_field(const Token& token, Level level) -> Result<model::Row*>;
    auto add_method(const Token& token, Level level) -> Result<model::Row*>;

    auto add_types(std::span<const Token> tokens, Level level) -> Result<std::vector<model::TypeDefOrRef*>>;
    auto add_fields(std::span<const Token> tokens, Level level) -> Result<std::vector<model::Row*>>;
    auto add_methods(std::span<const Token> tokens, Level level) -> Result<std::vector<model::Row*>>;

private:
    auto ResolveAssembly(const std::string& name) -> Result<model::AssemblyRef*>;
    auto ResolveModuleRef(const std::string& name) -> model::ModuleRef*;
    auto ResolveType(const TypeRef& type) -> Result<model::TypeDefOrRef*>;
    auto ResolveField(const FieldRef& field) -> Result<model::Row*>;
    auto ResolveMethod(const MethodRef& method) -> Result<model::Row*>;

    auto DefineType(model::TypeDef* td, const TypeDef& def) -> Result<void>;
    auto DefineChildren(model::TypeDef* td, const TypeDef& def, Level level) -> Result<void>;
    auto DefineField(model::FieldDef* fd, const FieldDef& def) -> Result<void>;
    auto DefineMethod(model::MethodDef* md, const MethodDef& def) -> Result<void>;

    auto GetType(const ComplexType& type) -> Result<model::TypeDefOrRef*>;
    auto GetMethodDef(const Token& token) -> Result<model::MethodDef*>;

    auto GetCustomAttributes(const CustomAttributeList& attributes) -> Result<std::vector<model::CustomAttribute>>;
    auto GetGenericParams(const GenericParameterList& params) -> Result<std::vector<model::GenericParam>>;

    auto GetMethodBody(const MethodBody& body) -> Result<model::CilBody*>;
    auto GetInlineToken(const ComplexType& operand) -> Result<model::Instruction::Operand>;

    auto GetTypeSig(const ComplexType& sig) -> Result<model::TypeSig*>;
    auto GetCallingConventionSig(const ComplexType& sig) -> Result<model::CallingConventionSig*>;
};
} // namespace pmd

#endif // PMD_WRITER_HH
