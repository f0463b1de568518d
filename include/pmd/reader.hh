#ifndef PMD_READER_HH
#define PMD_READER_HH

#include <pmd/complex_type.hh>
#include <pmd/entities.hh>
#include <pmd/metadata.hh>
#include <pmd/model/module.hh>
#include <pmd/updater.hh>
#include <pmd/utils/result.hh>

#include <span>
#include <vector>

namespace pmd {
/// Reads entities of a live module into a metadata container.
///
/// Every entity is registered through an \c Updater, so adding the
/// same entity twice, or adding something that an earlier call has
/// already pulled in as a dependency, returns the same token.
///
/// Types go through three phases: the reference is registered first,
/// so that anything the definition refers to, including the type itself,
/// can obtain a token; then the definition; and last the children
/// (nested types, fields, methods, properties and events).
class MetadataReader {
    model::Module& module;
    Metadata _metadata;
    Updater updater;

public:
    explicit MetadataReader(model::Module& module, Options options = DefaultOptions);

    MetadataReader(const MetadataReader&) = delete;
    auto operator=(const MetadataReader&) -> MetadataReader& = delete;

    /// Get the module this reads from.
    [[nodiscard]] auto source() const -> model::Module& { return module; }

    /// Get the container this writes to.
    [[nodiscard]] auto metadata() const -> const Metadata& { return _metadata; }

    /// Move the container out. The reader must not be used afterwards.
    [[nodiscard]] auto release() -> Metadata { return std::move(_metadata); }

    auto add_type(model::TypeDef* type, Level level) -> Result<Token>;
    auto add_type(model::TypeSpec* type) -> Result<ComplexType>;

    /// Fields and methods have no children; \c level may be at most
    /// \c Level::Definition.
    auto add_field(model::FieldDef* field, Level level) -> Result<Token>;
    auto add_method(model::MethodDef* method, Level level) -> Result<Token>;

    auto add_types(std::span<model::TypeDef* const> types, Level level) -> Result<std::vector<Token>>;
    auto add_fields(std::span<model::FieldDef* const> fields, Level level) -> Result<std::vector<Token>>;
    auto add_methods(std::span<model::MethodDef* const> methods, Level level) -> Result<std::vector<Token>>;

private:
    [[nodiscard]] bool Has(Options flag) const { return HasFlag(_metadata.options(), flag); }

    auto Identity(model::TypeDef* type) -> TypeRef;
    auto AddTypeRef(model::TypeRef* type) -> Result<Token>;
    auto AddType(model::TypeDefOrRef* type, bool allow_type_spec = true) -> Result<ComplexType>;
    auto AddFieldRef(model::MemberRef* field) -> Result<Token>;
    auto AddField(model::Row* field) -> Result<Token>;
    auto AddMethodRef(model::MemberRef* method) -> Result<Token>;
    auto AddMethod(model::Row* method) -> Result<Token>;

    auto AddCustomAttributes(const std::vector<model::CustomAttribute>& attributes) -> Result<CustomAttributeList>;
    auto AddGenericParameters(const std::vector<model::GenericParam>& params) -> Result<GenericParameterList>;
    auto AddInterfaces(const std::vector<model::TypeDefOrRef*>& interfaces) -> Result<std::optional<std::vector<ComplexType>>>;
    auto AddParameters(const std::vector<model::ParamDef>& params) -> Result<std::vector<Parameter>>;
    auto AddOverrides(const std::vector<model::Row*>& overrides) -> Result<std::optional<std::vector<Token>>>;
    auto AddProperties(const std::vector<model::PropertyDef>& properties) -> Result<std::vector<Property>>;
    auto AddEvents(const std::vector<model::EventDef>& events) -> Result<std::vector<Event>>;
    auto AddOptionalMethod(model::MethodDef* method) -> Result<std::optional<Token>>;

    auto AddMethodBody(const model::CilBody& body) -> Result<MethodBody>;
    auto AddInlineToken(const model::Instruction::Operand& operand) -> Result<ComplexType>;

    auto AddTypeSig(const model::TypeSig* sig) -> Result<ComplexType>;
    auto AddCallingConventionSig(const model::CallingConventionSig* sig) -> Result<ComplexType>;
};
} // namespace pmd

#endif // PMD_READER_HH
