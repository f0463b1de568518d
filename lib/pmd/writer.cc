#include <pmd/utils/rtti.hh>
#include <pmd/writer.hh>

#include <algorithm>

namespace pmd {
namespace {
/// Attributes of fields and methods the writer has to create.
constexpr u16 FieldAttributesAssembly = 0x0003;
constexpr u16 MethodAttributesAssembly = 0x0003;

auto CheckLevel(Level level, Level max) -> Result<void> {
    if (+level < +Level::Reference or +level > +max)
        return Diag::Error(ErrorId::InvalidArgument, "Level must be between Reference and {}, got {}", max, +level);
    return {};
}

auto NotInModule(std::string_view what, std::string_view name, const model::Module& mod) -> Diag {
    return Diag::Error(ErrorId::InvalidOperation, "{} '{}' is not defined in module '{}'", what, name, mod.name());
}

auto DefinitionOfReference(std::string_view what, std::string_view name, Level level) -> Diag {
    return Diag::Error(
        ErrorId::InvalidOperation,
        "{} '{}' is only a reference and cannot be written at level {}",
        what,
        name,
        level
    );
}

/// Put the entries of \c order first, keeping the rest in place.
template <typename T>
void Reorder(std::vector<T*>& current, const std::vector<T*>& order) {
    std::vector<T*> result{order};
    for (auto e : current)
        if (rgs::find(order, e) == order.end())
            result.push_back(e);
    current = std::move(result);
}

/// Checked access to the arguments of a signature node.
class Args {
    const ComplexType& node;
    std::string_view what;

public:
    Args(const ComplexType& node_, std::string_view what_) : node(node_), what(what_) {}

    [[nodiscard]] auto size() const -> usz { return node.arguments().size(); }

    auto count(usz n) const -> Result<void> {
        if (size() != n) return Diag::Error(ErrorId::InvalidData, "'{}' takes {} arguments, got {}", what, n, size());
        return {};
    }

    auto at(usz i) const -> Result<const ComplexType*> {
        if (i >= size()) return Diag::Error(ErrorId::InvalidData, "'{}' is missing argument {}", what, i);
        return &node.arguments()[i];
    }

    auto integer(usz i) const -> Result<i32> {
        PMD_TRY(a, at(i));
        if (not a->is_int32()) return Diag::Error(ErrorId::InvalidData, "Argument {} of '{}' must be an integer", i, what);
        return a->int32();
    }

    auto unsigned_integer(usz i) const -> Result<u32> {
        PMD_TRY(value, integer(i));
        if (value < 0) return Diag::Error(ErrorId::InvalidData, "Argument {} of '{}' must not be negative", i, what);
        return u32(value);
    }
};
} // namespace
} // namespace pmd

pmd::MetadataWriter::MetadataWriter(model::Module& module_, const Metadata& metadata_)
    : module(module_), metadata(metadata_) {}

/// ===========================================================================
///  Public entry points
/// ===========================================================================
auto pmd::MetadataWriter::add_type(const Type& type, Level level) -> Result<model::TypeDefOrRef*> {
    PMD_TRY_VOID(CheckLevel(level, Level::DefinitionWithChildren));
    const auto& identity = type.identity();

    /// Reference.
    auto it = types.find(identity);
    if (it == types.end()) {
        PMD_TRY(resolved, ResolveType(identity));
        it = types.emplace(identity, EntityWithLevel<model::TypeDefOrRef>{resolved, Level::Reference}).first;
    }

    auto& slot = it->second;
    if (level <= slot.level) return slot.entity;
    if (not type.is_definition()) return DefinitionOfReference("Type", identity.name, level);

    auto td = cast<model::TypeDef>(slot.entity);
    if (not td) return NotInModule("Type", identity.name, module);

    /// Definition.
    const auto& def = type.definition();
    if (slot.level < Level::Definition) {
        PMD_TRY_VOID(DefineType(td, def));
        slot.level = Level::Definition;
    }

    /// Children.
    if (level == Level::DefinitionWithChildren) {
        PMD_TRY_VOID(DefineChildren(td, def, level));
        slot.level = Level::DefinitionWithChildren;
    }

    return slot.entity;
}

auto pmd::MetadataWriter::add_field(const Field& field, Level level) -> Result<model::Row*> {
    PMD_TRY_VOID(CheckLevel(level, Level::Definition));
    const auto& identity = field.identity();

    auto it = fields.find(identity);
    if (it == fields.end()) {
        PMD_TRY(resolved, ResolveField(identity));
        it = fields.emplace(identity, EntityWithLevel<model::Row>{resolved, Level::Reference}).first;
    }

    auto& slot = it->second;
    if (level <= slot.level) return slot.entity;
    if (not field.is_definition()) return DefinitionOfReference("Field", identity.name, level);

    auto fd = cast<model::FieldDef>(slot.entity);
    if (not fd) return NotInModule("Field", identity.name, module);

    PMD_TRY_VOID(DefineField(fd, field.definition()));
    slot.level = Level::Definition;
    return slot.entity;
}

auto pmd::MetadataWriter::add_method(const Method& method, Level level) -> Result<model::Row*> {
    PMD_TRY_VOID(CheckLevel(level, Level::Definition));
    const auto& identity = method.identity();

    auto it = methods.find(identity);
    if (it == methods.end()) {
        PMD_TRY(resolved, ResolveMethod(identity));
        it = methods.emplace(identity, EntityWithLevel<model::Row>{resolved, Level::Reference}).first;
    }

    auto& slot = it->second;
    if (level <= slot.level) return slot.entity;
    if (not method.is_definition()) return DefinitionOfReference("Method", identity.name, level);

    auto md = cast<model::MethodDef>(slot.entity);
    if (not md) return NotInModule("Method", identity.name, module);

    PMD_TRY_VOID(DefineMethod(md, method.definition()));
    slot.level = Level::Definition;
    return slot.entity;
}

auto pmd::MetadataWriter::add_type(const Token& token, Level level) -> Result<model::TypeDefOrRef*> {
    PMD_TRY(type, metadata.types().get(token));
    return add_type(*type, level);
}

auto pmd::MetadataWriter::add_field(const Token& token, Level level) -> Result<model::Row*> {
    PMD_TRY(field, metadata.fields().get(token));
    return add_field(*field, level);
}

auto pmd::MetadataWriter::add_method(const Token& token, Level level) -> Result<model::Row*> {
    PMD_TRY(method, metadata.methods().get(token));
    return add_method(*method, level);
}

auto pmd::MetadataWriter::add_types(std::span<const Token> tokens, Level level) -> Result<std::vector<model::TypeDefOrRef*>> {
    std::vector<model::TypeDefOrRef*> rows{};
    rows.reserve(tokens.size());
    for (const auto& token : tokens) {
        PMD_TRY(row, add_type(token, level));
        rows.push_back(row);
    }
    return rows;
}

auto pmd::MetadataWriter::add_fields(std::span<const Token> tokens, Level level) -> Result<std::vector<model::Row*>> {
    std::vector<model::Row*> rows{};
    rows.reserve(tokens.size());
    for (const auto& token : tokens) {
        PMD_TRY(row, add_field(token, level));
        rows.push_back(row);
    }
    return rows;
}

auto pmd::MetadataWriter::add_methods(std::span<const Token> tokens, Level level) -> Result<std::vector<model::Row*>> {
    std::vector<model::Row*> rows{};
    rows.reserve(tokens.size());
    for (const auto& token : tokens) {
        PMD_TRY(row, add_method(token, level));
        rows.push_back(row);
    }
    return rows;
}

/// ===========================================================================
///  Resolution
/// ===========================================================================
auto pmd::MetadataWriter::ResolveAssembly(const std::string& name) -> Result<model::AssemblyRef*> {
    if (name.empty()) return Diag::Error(ErrorId::InvalidData, "Assembly name must not be empty");
    if (auto it = assemblies.find(name); it != assemblies.end()) return it->second;

    model::AssemblyRef* assembly{};
    if (assembly_resolving) assembly = assembly_resolving(name);

    if (not assembly) {
        const auto& refs = module.assembly_refs();
        auto it = rgs::find_if(refs, [&](model::AssemblyRef* a) { return a->full_name() == name or a->name() == name; });
        if (it != refs.end()) assembly = *it;
    }

    if (not assembly) assembly = module.create_assembly_ref_from_full_name(name);
    assemblies.emplace(name, assembly);
    return assembly;
}

auto pmd::MetadataWriter::ResolveModuleRef(const std::string& name) -> model::ModuleRef* {
    const auto& refs = module.module_refs();
    auto it = rgs::find_if(refs, [&](model::ModuleRef* m) { return m->name() == name; });
    if (it != refs.end()) return *it;
    return module.create_module_ref(name);
}

auto pmd::MetadataWriter::ResolveType(const TypeRef& type) -> Result<model::TypeDefOrRef*> {
    bool nested = type.enclosing_names and not type.enclosing_names->empty();
    if (not type.assembly and not nested and type.ns.empty() and type.name == model::Module::GlobalTypeName)
        return module.global_type();

    model::AssemblyRef* assembly{};
    if (type.assembly) {
        PMD_TRY(resolved, ResolveAssembly(*type.assembly));
        assembly = resolved;
    }

    if (type_resolving) {
        if (auto resolved = type_resolving(assembly, type)) {
            if (not assembly and not is<model::TypeDef>(resolved)) {
                return Diag::Error(
                    ErrorId::InvalidOperation,
                    "Type '{}' has no assembly, but was resolved to a {}",
                    type.name,
                    resolved->kind()
                );
            }
            return resolved;
        }
    }

    /// Nested types are looked up in their enclosing type.
    if (nested) {
        TypeRef outer{};
        outer.name = type.enclosing_names->front();
        outer.ns = type.ns;
        outer.assembly = type.assembly;
        if (type.enclosing_names->size() > 1)
            outer.enclosing_names.emplace(type.enclosing_names->begin() + 1, type.enclosing_names->end());

        PMD_TRY(declaring, add_type(Type{std::move(outer)}, Level::Reference));
        if (auto td = cast<model::TypeDef>(declaring)) {
            auto it = rgs::find_if(td->nested_types, [&](model::TypeDef* t) { return t->name() == type.name; });
            if (it != td->nested_types.end()) return *it;
            return module.create_type("", type.name, td);
        }

        if (auto tr = cast<model::TypeRef>(declaring)) {
            const auto& refs = module.type_refs();
            auto it = rgs::find_if(refs, [&](model::TypeRef* t) {
                return t->scope() == tr and t->name() == type.name and t->ns().empty();
            });
            if (it != refs.end()) return *it;
            return module.create_type_ref("", type.name, tr);
        }

        return Diag::Error(ErrorId::InvalidData, "Enclosing type of '{}' is not a named type", type.name);
    }

    if (assembly) {
        const auto& refs = module.type_refs();
        auto it = rgs::find_if(refs, [&](model::TypeRef* t) {
            return t->scope() == assembly and t->name() == type.name and t->ns() == type.ns;
        });
        if (it != refs.end()) return *it;
        return module.create_type_ref(type.ns, type.name, assembly);
    }

    if (auto td = module.find_type(type.ns, type.name)) return td;
    return module.create_type(type.ns, type.name);
}

auto pmd::MetadataWriter::ResolveField(const FieldRef& field) -> Result<model::Row*> {
    PMD_TRY(parent, GetType(field.type));
    PMD_TRY(signature, GetCallingConventionSig(field.signature));
    auto sig = cast<model::FieldSig>(signature);
    if (not sig) return Diag::Error(ErrorId::InvalidData, "Signature of field '{}' is not a field signature", field.name);

    if (auto td = cast<model::TypeDef>(parent)) {
        if (auto existing = td->find_field(field.name, sig)) return existing;
        return module.create_field(td, field.name, sig, FieldAttributesAssembly);
    }

    return module.create_member_ref(field.name, sig, parent);
}

auto pmd::MetadataWriter::ResolveMethod(const MethodRef& method) -> Result<model::Row*> {
    PMD_TRY(parent, GetType(method.type));
    PMD_TRY(signature, GetCallingConventionSig(method.signature));
    auto sig = cast<model::MethodSig>(signature);
    if (not sig) return Diag::Error(ErrorId::InvalidData, "Signature of method '{}' is not a method signature", method.name);

    if (auto td = cast<model::TypeDef>(parent)) {
        if (auto existing = td->find_method(method.name, sig)) return existing;
        return module.create_method(td, method.name, sig, MethodAttributesAssembly);
    }

    return module.create_member_ref(method.name, sig, parent);
}

/// ===========================================================================
///  Definitions
/// ===========================================================================
auto pmd::MetadataWriter::DefineType(model::TypeDef* td, const TypeDef& def) -> Result<void> {
    td->attributes = u32(def.attributes);

    td->base_type = nullptr;
    if (def.base_type) {
        PMD_TRY(base_type, GetType(*def.base_type));
        td->base_type = base_type;
    }

    std::vector<model::TypeDefOrRef*> interfaces{};
    if (def.interfaces) {
        for (const auto& i : *def.interfaces) {
            PMD_TRY(type, GetType(i));
            interfaces.push_back(type);
        }
    }

    PMD_TRY(generic_params, GetGenericParams(def.generic_parameters));
    PMD_TRY(custom_attributes, GetCustomAttributes(def.custom_attributes));
    td->interfaces = std::move(interfaces);
    td->generic_params = std::move(generic_params);
    td->custom_attributes = std::move(custom_attributes);

    td->class_layout.reset();
    if (def.class_layout) {
        td->class_layout = model::ClassLayout{
            u16(def.class_layout->packing_size),
            u32(def.class_layout->class_size),
        };
    }

    return {};
}

auto pmd::MetadataWriter::DefineChildren(model::TypeDef* td, const TypeDef& def, Level level) -> Result<void> {
    if (def.nested_types) {
        PMD_TRY(rows, add_types(*def.nested_types, level));
        std::vector<model::TypeDef*> nested{};
        for (auto row : rows) {
            auto t = cast<model::TypeDef>(row);
            if (not t or t->declaring_type() != td)
                return Diag::Error(ErrorId::InvalidData, "Type '{}' lists a nested type it does not enclose", td->full_name());
            nested.push_back(t);
        }
        Reorder(td->nested_types, nested);
    }

    if (def.fields) {
        PMD_TRY(rows, add_fields(*def.fields, Level::Definition));
        std::vector<model::FieldDef*> list{};
        for (auto row : rows) {
            auto f = cast<model::FieldDef>(row);
            if (not f or f->declaring_type() != td)
                return Diag::Error(ErrorId::InvalidData, "Type '{}' lists a field it does not declare", td->full_name());
            list.push_back(f);
        }
        Reorder(td->fields, list);
    }

    if (def.methods) {
        PMD_TRY(rows, add_methods(*def.methods, Level::Definition));
        std::vector<model::MethodDef*> list{};
        for (auto row : rows) {
            auto m = cast<model::MethodDef>(row);
            if (not m or m->declaring_type() != td)
                return Diag::Error(ErrorId::InvalidData, "Type '{}' lists a method it does not declare", td->full_name());
            list.push_back(m);
        }
        Reorder(td->methods, list);
    }

    if (def.properties) {
        std::vector<model::PropertyDef> properties{};
        for (const auto& p : *def.properties) {
            PMD_TRY(signature, GetCallingConventionSig(p.signature));
            auto sig = cast<model::PropertySig>(signature);
            if (not sig) return Diag::Error(ErrorId::InvalidData, "Signature of property '{}' is not a property signature", p.name);

            model::PropertyDef property{};
            property.name = p.name;
            property.signature = sig;
            property.attributes = u16(p.attributes);
            if (p.get_method) {
                PMD_TRY(get, GetMethodDef(*p.get_method));
                property.get_method = get;
            }
            if (p.set_method) {
                PMD_TRY(set, GetMethodDef(*p.set_method));
                property.set_method = set;
            }

            PMD_TRY(custom_attributes, GetCustomAttributes(p.custom_attributes));
            property.custom_attributes = std::move(custom_attributes);
            properties.push_back(std::move(property));
        }
        td->properties = std::move(properties);
    }

    if (def.events) {
        std::vector<model::EventDef> events{};
        for (const auto& e : *def.events) {
            PMD_TRY(type, GetType(e.type));

            model::EventDef event{};
            event.name = e.name;
            event.type = type;
            event.attributes = u16(e.attributes);
            if (e.add_method) {
                PMD_TRY(add, GetMethodDef(*e.add_method));
                event.add_method = add;
            }
            if (e.remove_method) {
                PMD_TRY(remove, GetMethodDef(*e.remove_method));
                event.remove_method = remove;
            }
            if (e.invoke_method) {
                PMD_TRY(invoke, GetMethodDef(*e.invoke_method));
                event.invoke_method = invoke;
            }

            PMD_TRY(custom_attributes, GetCustomAttributes(e.custom_attributes));
            event.custom_attributes = std::move(custom_attributes);
            events.push_back(std::move(event));
        }
        td->events = std::move(events);
    }

    return {};
}

auto pmd::MetadataWriter::DefineField(model::FieldDef* fd, const FieldDef& def) -> Result<void> {
    PMD_TRY(custom_attributes, GetCustomAttributes(def.custom_attributes));
    fd->attributes = u16(def.attributes);
    fd->initial_value = def.initial_value;
    fd->constant = def.constant;
    fd->custom_attributes = std::move(custom_attributes);
    return {};
}

auto pmd::MetadataWriter::DefineMethod(model::MethodDef* md, const MethodDef& def) -> Result<void> {
    md->attributes = u16(def.attributes);
    md->impl_attributes = u16(def.impl_attributes);

    std::vector<model::ParamDef> params{};
    params.reserve(def.parameters.size());
    for (const auto& p : def.parameters) {
        PMD_TRY(custom_attributes, GetCustomAttributes(p.custom_attributes));
        params.push_back(model::ParamDef{
            p.name,
            u16(p.sequence),
            u16(p.attributes),
            p.constant,
            std::move(custom_attributes),
        });
    }
    md->params = std::move(params);

    /// A container without bodies leaves existing ones alone.
    if (def.body) {
        PMD_TRY(body, GetMethodBody(*def.body));
        md->body = body;
    }

    std::vector<model::Row*> overrides{};
    if (def.overrides) {
        for (const auto& o : *def.overrides) {
            PMD_TRY(method, add_method(o, Level::Reference));
            overrides.push_back(method);
        }
    }
    md->overrides = std::move(overrides);

    PMD_TRY(generic_params, GetGenericParams(def.generic_parameters));
    PMD_TRY(custom_attributes, GetCustomAttributes(def.custom_attributes));
    md->generic_params = std::move(generic_params);
    md->custom_attributes = std::move(custom_attributes);

    md->impl_map.reset();
    if (def.impl_map) {
        md->impl_map = model::ImplMap{
            ResolveModuleRef(def.impl_map->module),
            def.impl_map->name,
            u16(def.impl_map->attributes),
        };
    }

    return {};
}

/// ===========================================================================
///  Definition parts
/// ===========================================================================
auto pmd::MetadataWriter::GetType(const ComplexType& type) -> Result<model::TypeDefOrRef*> {
    if (type.is_token()) return add_type(type.token(), Level::Reference);

    if (type.is_type_sig()) {
        PMD_TRY(sig, GetTypeSig(type));
        model::TypeDefOrRef* spec = new (module) model::TypeSpec{sig};
        return spec;
    }

    return Diag::Error(ErrorId::InvalidData, "Expected a type, got a {}", type.kind());
}

auto pmd::MetadataWriter::GetMethodDef(const Token& token) -> Result<model::MethodDef*> {
    PMD_TRY(row, add_method(token, Level::Reference));
    auto md = cast<model::MethodDef>(row);
    if (not md) return Diag::Error(ErrorId::InvalidData, "Method '{}' is not defined in this module", token);
    return md;
}

auto pmd::MetadataWriter::GetCustomAttributes(const CustomAttributeList& attributes)
    -> Result<std::vector<model::CustomAttribute>> {
    std::vector<model::CustomAttribute> list{};
    if (not attributes) return list;

    list.reserve(attributes->size());
    for (const auto& ca : *attributes) {
        PMD_TRY(ctor, add_method(ca.constructor, Level::Reference));
        list.push_back(model::CustomAttribute{ctor, ca.raw_data});
    }
    return list;
}

auto pmd::MetadataWriter::GetGenericParams(const GenericParameterList& params) -> Result<std::vector<model::GenericParam>> {
    std::vector<model::GenericParam> list{};
    if (not params) return list;

    list.reserve(params->size());
    for (const auto& gp : *params) {
        model::GenericParam p{gp.name, u16(gp.attributes), u16(gp.number), {}};
        if (gp.constraints) {
            for (const auto& c : *gp.constraints) {
                PMD_TRY(type, GetType(c));
                p.constraints.push_back(type);
            }
        }
        list.push_back(std::move(p));
    }
    return list;
}

/// ===========================================================================
///  Method bodies
/// ===========================================================================
auto pmd::MetadataWriter::GetMethodBody(const MethodBody& body) -> Result<model::CilBody*> {
    using model::OperandType;

    if (body.max_stack < 0 or body.max_stack > 0xFFFF)
        return Diag::Error(ErrorId::InvalidData, "Max stack {} is out of range", body.max_stack);

    auto cil = new (module) model::CilBody{};
    cil->max_stack = u16(body.max_stack);
    cil->init_locals = body.init_locals;

    for (usz i = 0; i < body.variables.size(); i++) {
        PMD_TRY(type, GetTypeSig(body.variables[i]));
        cil->locals.push_back(new (module) model::Local{type, u32(i)});
    }

    /// Create all instructions first so branches can point forward.
    for (const auto& instr : body.instructions) {
        auto op = model::FindOpCode(instr.opcode);
        if (not op) return Diag::Error(ErrorId::InvalidData, "Unknown opcode '{}'", instr.opcode);
        cil->instructions.push_back(new (module) model::Instruction{op});
    }

    auto Target = [&](i32 index) -> Result<model::Instruction*> {
        if (index < 0 or usz(index) >= cil->instructions.size())
            return Diag::Error(ErrorId::InvalidData, "Instruction index {} is out of range", index);
        return cil->instructions[usz(index)];
    };

    for (usz i = 0; i < body.instructions.size(); i++) {
        const auto& operand = body.instructions[i].operand;
        auto instr = cil->instructions[i];
        auto op = instr->opcode();
        auto Mismatch = [&] {
            return Diag::Error(
                ErrorId::InvalidData,
                "Operand of '{}' does not match its operand type {}",
                op->name,
                op->operand_type
            );
        };

        switch (op->operand_type) {
            case OperandType::InlineBrTarget:
            case OperandType::ShortInlineBrTarget: {
                auto index = std::get_if<i32>(&operand);
                if (not index) return Mismatch();
                PMD_TRY(target, Target(*index));
                instr->operand = target;
            } break;

            case OperandType::InlineSwitch: {
                auto indices = std::get_if<std::vector<i32>>(&operand);
                if (not indices) return Mismatch();
                std::vector<model::Instruction*> targets{};
                targets.reserve(indices->size());
                for (auto index : *indices) {
                    PMD_TRY(target, Target(index));
                    targets.push_back(target);
                }
                instr->operand = std::move(targets);
            } break;

            case OperandType::InlineField:
            case OperandType::InlineMethod:
            case OperandType::InlineSig:
            case OperandType::InlineTok:
            case OperandType::InlineType: {
                auto token = std::get_if<ComplexType>(&operand);
                if (not token) return Mismatch();
                PMD_TRY(resolved, GetInlineToken(*token));
                instr->operand = std::move(resolved);
            } break;

            case OperandType::InlineVar:
            case OperandType::ShortInlineVar: {
                auto index = std::get_if<i32>(&operand);
                if (not index) return Mismatch();
                if (*index < 0) return Diag::Error(ErrorId::InvalidData, "Variable index {} of '{}' is negative", *index, op->name);
                if (op->takes_argument()) {
                    instr->operand = model::Argument{u32(*index)};
                } else {
                    if (usz(*index) >= cil->locals.size())
                        return Diag::Error(ErrorId::InvalidData, "Local {} of '{}' is out of range", *index, op->name);
                    instr->operand = cil->locals[usz(*index)];
                }
            } break;

            case OperandType::InlineI:
            case OperandType::ShortInlineI:
                if (not std::holds_alternative<i32>(operand)) return Mismatch();
                instr->operand = std::get<i32>(operand);
                break;

            case OperandType::InlineI8:
                if (not std::holds_alternative<i64>(operand)) return Mismatch();
                instr->operand = std::get<i64>(operand);
                break;

            case OperandType::ShortInlineR:
                if (not std::holds_alternative<f32>(operand)) return Mismatch();
                instr->operand = std::get<f32>(operand);
                break;

            case OperandType::InlineR:
                if (not std::holds_alternative<f64>(operand)) return Mismatch();
                instr->operand = std::get<f64>(operand);
                break;

            case OperandType::InlineString:
                if (not std::holds_alternative<std::string>(operand)) return Mismatch();
                instr->operand = std::get<std::string>(operand);
                break;

            case OperandType::InlineNone:
                if (not std::holds_alternative<std::monostate>(operand)) return Mismatch();
                break;

            case OperandType::InlinePhi:
                return Diag::Error(ErrorId::Unsupported, "Opcode '{}' is not supported", op->name);
        }
    }

    /// Handler boundaries may be absent; a missing try start or
    /// handler start is not.
    auto SetTarget = [&](model::Instruction*& slot, i32 index, bool optional) -> Result<void> {
        if (optional and index == ExceptionHandler::None) {
            slot = nullptr;
            return {};
        }
        PMD_TRY(target, Target(index));
        slot = target;
        return {};
    };

    for (const auto& eh : body.exception_handlers) {
        model::ExceptionHandler handler{};
        PMD_TRY_VOID(SetTarget(handler.try_start, eh.try_start, false));
        PMD_TRY_VOID(SetTarget(handler.try_end, eh.try_end, true));
        PMD_TRY_VOID(SetTarget(handler.filter_start, eh.filter_start, true));
        PMD_TRY_VOID(SetTarget(handler.handler_start, eh.handler_start, false));
        PMD_TRY_VOID(SetTarget(handler.handler_end, eh.handler_end, true));

        switch (eh.handler_type) {
            case +model::ExceptionHandlerType::Catch:
            case +model::ExceptionHandlerType::Filter:
            case +model::ExceptionHandlerType::Finally:
            case +model::ExceptionHandlerType::Fault:
                handler.handler_type = model::ExceptionHandlerType(eh.handler_type);
                break;

            default:
                return Diag::Error(ErrorId::InvalidData, "Unknown exception handler type {}", eh.handler_type);
        }

        if (eh.catch_type) {
            PMD_TRY(catch_type, GetType(*eh.catch_type));
            handler.catch_type = catch_type;
        }

        cil->exception_handlers.push_back(handler);
    }

    return cil;
}

auto pmd::MetadataWriter::GetInlineToken(const ComplexType& operand) -> Result<model::Instruction::Operand> {
    using K = ComplexType::Kind;
    using Operand = model::Instruction::Operand;

    if (operand.kind() == K::CallingConventionSig) {
        PMD_TRY(sig, GetCallingConventionSig(operand));
        if (not is<model::MethodSig, model::LocalSig>(sig))
            return Diag::Error(ErrorId::InvalidData, "Stand-alone signature must be a method or local signature");
        return Operand{sig};
    }

    Args args{operand, StringifyEnum(operand.kind())};
    switch (operand.kind()) {
        case K::InlineType: {
            PMD_TRY_VOID(args.count(1));
            PMD_TRY(type, GetType(operand.arg(0)));
            return Operand{static_cast<model::Row*>(type)};
        }

        case K::InlineField: {
            PMD_TRY_VOID(args.count(1));
            const auto& field = operand.arg(0);
            if (not field.is_token()) return Diag::Error(ErrorId::InvalidData, "Field operand must be a token");
            PMD_TRY(row, add_field(field.token(), Level::Reference));
            return Operand{row};
        }

        case K::InlineMethod: {
            PMD_TRY_VOID(args.count(1));
            const auto& method = operand.arg(0);
            if (method.is_token()) {
                PMD_TRY(row, add_method(method.token(), Level::Reference));
                return Operand{row};
            }

            /// Generic method instantiation.
            Args spec{method, "MethodSpec"};
            if (method.kind() != K::MethodSpec or spec.size() != 2 or not method.arg(0).is_token())
                return Diag::Error(ErrorId::InvalidData, "Method operand must be a token or a method instantiation");

            PMD_TRY(row, add_method(method.arg(0).token(), Level::Reference));
            PMD_TRY(instantiation, GetCallingConventionSig(method.arg(1)));
            auto sig = cast<model::GenericInstMethodSig>(instantiation);
            if (not sig) return Diag::Error(ErrorId::InvalidData, "Method instantiation must be a GenericInstCC signature");

            model::Row* ms = new (module) model::MethodSpec{row, sig};
            return Operand{ms};
        }

        default:
            return Diag::Error(ErrorId::InvalidData, "A {} is not a token operand", operand.kind());
    }
}

/// ===========================================================================
///  Signatures
/// ===========================================================================
auto pmd::MetadataWriter::GetTypeSig(const ComplexType& sig) -> Result<model::TypeSig*> {
    if (not sig.is_type_sig()) return Diag::Error(ErrorId::InvalidData, "Expected a type signature, got a {}", sig.kind());

    auto et = sig.element_type();
    auto name = StringifyEnum(et);
    if (name.empty()) return Diag::Error(ErrorId::InvalidData, "Unknown element type {:#x}", sig.type());

    Args args{sig, name};
    if (model::LeafSig::IsLeaf(et)) {
        PMD_TRY_VOID(args.count(0));
        return module.leaf(et);
    }

    if (model::WrapperSig::IsWrapper(et)) {
        PMD_TRY_VOID(args.count(1));
        PMD_TRY(next, GetTypeSig(sig.arg(0)));
        return new (module) model::WrapperSig{et, next};
    }

    switch (et) {
        case ElementType::FnPtr: {
            PMD_TRY_VOID(args.count(1));
            PMD_TRY(cc, GetCallingConventionSig(sig.arg(0)));
            auto method = cast<model::MethodSig>(cc);
            if (not method) return Diag::Error(ErrorId::InvalidData, "Function pointer must have a method signature");
            return new (module) model::FnPtrSig{method};
        }

        /// Class and ValueType name a type; a type spec is not allowed here.
        case ElementType::Class:
        case ElementType::ValueType: {
            PMD_TRY_VOID(args.count(1));
            if (not sig.arg(0).is_token())
                return Diag::Error(ErrorId::InvalidData, "Argument of '{}' must be a type token", name);
            PMD_TRY(type, GetType(sig.arg(0)));
            return new (module) model::ClassOrValueTypeSig{et, type};
        }

        case ElementType::Var:
        case ElementType::MVar: {
            PMD_TRY_VOID(args.count(1));
            PMD_TRY(number, args.unsigned_integer(0));
            return new (module) model::GenericSig{et, number};
        }

        /// Array(next, rank, numSizes, sizes..., numLowerBounds, lowerBounds...)
        case ElementType::Array: {
            PMD_TRY(next_arg, args.at(0));
            PMD_TRY(next, GetTypeSig(*next_arg));
            PMD_TRY(rank, args.unsigned_integer(1));
            PMD_TRY(num_sizes, args.unsigned_integer(2));

            std::vector<u32> sizes{};
            for (usz k = 0; k < num_sizes; k++) {
                PMD_TRY(size, args.unsigned_integer(3 + k));
                sizes.push_back(size);
            }

            usz pos = 3 + usz(num_sizes);
            PMD_TRY(num_lower_bounds, args.unsigned_integer(pos));
            std::vector<i32> lower_bounds{};
            for (usz k = 0; k < num_lower_bounds; k++) {
                PMD_TRY(lower_bound, args.integer(pos + 1 + k));
                lower_bounds.push_back(lower_bound);
            }

            PMD_TRY_VOID(args.count(pos + 1 + usz(num_lower_bounds)));
            return new (module) model::ArraySig{next, rank, std::move(sizes), std::move(lower_bounds)};
        }

        /// GenericInst(type, numArgs, args...)
        case ElementType::GenericInst: {
            PMD_TRY(type_arg, args.at(0));
            PMD_TRY(generic_type, GetTypeSig(*type_arg));
            PMD_TRY(count, args.unsigned_integer(1));
            PMD_TRY_VOID(args.count(2 + usz(count)));

            std::vector<model::TypeSig*> arguments{};
            arguments.reserve(count);
            for (usz k = 0; k < count; k++) {
                PMD_TRY(arg, GetTypeSig(sig.arg(2 + k)));
                arguments.push_back(arg);
            }
            return new (module) model::GenericInstSig{generic_type, std::move(arguments)};
        }

        case ElementType::ValueArray: {
            PMD_TRY_VOID(args.count(2));
            PMD_TRY(next, GetTypeSig(sig.arg(0)));
            PMD_TRY(size, args.unsigned_integer(1));
            return new (module) model::ValueArraySig{next, size};
        }

        /// CMod*(modifier, next)
        case ElementType::CModReqd:
        case ElementType::CModOpt: {
            PMD_TRY_VOID(args.count(2));
            PMD_TRY(modifier, GetType(sig.arg(0)));
            PMD_TRY(next, GetTypeSig(sig.arg(1)));
            return new (module) model::ModifierSig{et, modifier, next};
        }

        case ElementType::Module: {
            PMD_TRY_VOID(args.count(2));
            PMD_TRY(index, args.unsigned_integer(0));
            PMD_TRY(next, GetTypeSig(sig.arg(1)));
            return new (module) model::ModuleSig{index, next};
        }

        default:
            return Diag::Error(ErrorId::InvalidData, "Element type '{}' cannot appear here", name);
    }
}

auto pmd::MetadataWriter::GetCallingConventionSig(const ComplexType& sig) -> Result<model::CallingConventionSig*> {
    if (not sig.is_calling_convention_sig())
        return Diag::Error(ErrorId::InvalidData, "Expected a calling convention signature, got a {}", sig.kind());

    auto cc = sig.calling_convention();
    auto name = StringifyEnum(cc);
    if (name.empty()) return Diag::Error(ErrorId::InvalidData, "Unknown calling convention {:#x}", sig.type());

    Args args{sig, name};
    PMD_TRY(raw_flags, args.integer(0));
    if (raw_flags & ~i32(0xFF) or raw_flags & CallingConventionFlags::Mask)
        return Diag::Error(ErrorId::InvalidData, "Invalid calling convention flags {:#x}", raw_flags);

    auto flags = u8(raw_flags);
    auto raw = u8(+cc | flags);

    /// cc(flags, [numGenericParams], numParams, ret, params..., [Sentinel, params...])
    if (IsMethodLike(cc)) {
        usz i = 1;
        u32 generic_param_count = 0;
        if (flags & CallingConventionFlags::Generic) {
            PMD_TRY(gpc, args.unsigned_integer(i++));
            generic_param_count = gpc;
        }

        PMD_TRY(count, args.unsigned_integer(i++));
        PMD_TRY(ret_arg, args.at(i++));
        PMD_TRY(ret, GetTypeSig(*ret_arg));

        std::vector<model::TypeSig*> params{};
        std::vector<model::TypeSig*> params_after_sentinel{};
        bool sentinel = false;
        for (; i < args.size(); i++) {
            const auto& arg = sig.arg(i);
            if (arg.is(ElementType::Sentinel)) {
                if (sentinel) return Diag::Error(ErrorId::InvalidData, "Signature has more than one Sentinel");
                sentinel = true;
                continue;
            }

            PMD_TRY(param, GetTypeSig(arg));
            (sentinel ? params_after_sentinel : params).push_back(param);
        }

        if (params.size() + params_after_sentinel.size() != count) {
            return Diag::Error(
                ErrorId::InvalidData,
                "Signature declares {} parameters but has {}",
                count,
                params.size() + params_after_sentinel.size()
            );
        }

        if (cc == CallingConvention::Property) {
            return new (module) model::PropertySig{
                flags,
                ret,
                std::move(params),
                std::move(params_after_sentinel),
                generic_param_count,
            };
        }

        return new (module) model::MethodSig{
            raw,
            ret,
            std::move(params),
            std::move(params_after_sentinel),
            generic_param_count,
        };
    }

    /// Field, LocalSig and GenericInstCC signatures carry no flags.
    if (flags != 0) return Diag::Error(ErrorId::InvalidData, "'{}' signature cannot have flags {:#x}", name, flags);

    switch (cc) {
        /// Field(flags, type)
        case CallingConvention::Field: {
            PMD_TRY_VOID(args.count(2));
            PMD_TRY(type, GetTypeSig(sig.arg(1)));
            return new (module) model::FieldSig{type};
        }

        /// LocalSig(flags, count, locals...) and GenericInstCC(flags, count, args...)
        case CallingConvention::LocalSig:
        case CallingConvention::GenericInstCC: {
            PMD_TRY(count, args.unsigned_integer(1));
            PMD_TRY_VOID(args.count(2 + usz(count)));

            std::vector<model::TypeSig*> types{};
            types.reserve(count);
            for (usz k = 0; k < count; k++) {
                PMD_TRY(type, GetTypeSig(sig.arg(2 + k)));
                types.push_back(type);
            }

            if (cc == CallingConvention::LocalSig) return new (module) model::LocalSig{std::move(types)};
            return new (module) model::GenericInstMethodSig{std::move(types)};
        }

        default:
            return Diag::Error(ErrorId::InvalidData, "Calling convention '{}' cannot appear here", name);
    }
}
