#include <pmd/reader.hh>
#include <pmd/utils/rtti.hh>

#include <unordered_map>

namespace pmd {
namespace {
auto CheckLevel(Level level, Level max) -> Result<void> {
    if (+level < +Level::Reference or +level > +max)
        return Diag::Error(ErrorId::InvalidArgument, "Level must be between Reference and {}, got {}", max, +level);
    return {};
}

template <typename T>
auto Null(std::string_view what) -> Result<T> {
    return Diag::Error(ErrorId::InvalidArgument, "{} must not be null", what);
}

auto Int32(usz value) -> ComplexType {
    return ComplexType::CreateInt32(i32(value));
}
} // namespace
} // namespace pmd

pmd::MetadataReader::MetadataReader(model::Module& module_, Options options)
    : module(module_), _metadata(options), updater(_metadata) {}

/// ===========================================================================
///  Public entry points
/// ===========================================================================
auto pmd::MetadataReader::add_type(model::TypeDef* type, Level level) -> Result<Token> {
    if (not type) return Null<Token>("Type");
    PMD_TRY_VOID(CheckLevel(level, Level::DefinitionWithChildren));
    if (type->module() != &module) {
        return Diag::Error(
            ErrorId::InvalidArgument,
            "Type '{}' is not defined in module '{}'",
            type->full_name(),
            module.name()
        );
    }

    /// Reference.
    auto identity = Identity(type);
    PMD_TRY(ref, updater.update(Type{identity}, Level::Reference));
    if (level <= ref.old_level) return ref.token;

    /// Definition.
    if (ref.old_level < Level::Definition) {
        TypeDef def{};
        static_cast<TypeRef&>(def) = identity;
        def.attributes = i32(type->attributes);
        if (type->base_type) {
            PMD_TRY(base_type, AddType(type->base_type));
            def.base_type = std::move(base_type);
        }

        PMD_TRY(interfaces, AddInterfaces(type->interfaces));
        PMD_TRY(generic_parameters, AddGenericParameters(type->generic_params));
        PMD_TRY(custom_attributes, AddCustomAttributes(type->custom_attributes));
        def.interfaces = std::move(interfaces);
        def.generic_parameters = std::move(generic_parameters);
        def.custom_attributes = std::move(custom_attributes);
        if (type->class_layout) {
            def.class_layout = ClassLayout{
                i32(type->class_layout->packing_size),
                i32(type->class_layout->class_size),
            };
        }

        PMD_TRY(upd, updater.update(Type{std::move(def)}, Level::Definition));
        PMD_ASSERT(upd.token == ref.token, "Definition of '{}' got a different token", type->full_name());
    }
    if (level <= Level::Definition) return ref.token;

    /// Children.
    if (ref.old_level < Level::DefinitionWithChildren) {
        PMD_TRY(nested_types, add_types(type->nested_types, level));
        PMD_TRY(fields, add_fields(type->fields, Level::Definition));
        PMD_TRY(methods, add_methods(type->methods, Level::Definition));
        PMD_TRY(properties, AddProperties(type->properties));
        PMD_TRY(events, AddEvents(type->events));

        PMD_TRY(stored, _metadata.types().get(ref.token));
        auto def = stored->definition();
        def.nested_types = std::move(nested_types);
        def.fields = std::move(fields);
        def.methods = std::move(methods);
        def.properties = std::move(properties);
        def.events = std::move(events);

        PMD_TRY(upd, updater.update(Type{std::move(def)}, Level::DefinitionWithChildren));
        PMD_ASSERT(upd.token == ref.token, "Children of '{}' got a different token", type->full_name());
    }

    return ref.token;
}

auto pmd::MetadataReader::add_type(model::TypeSpec* type) -> Result<ComplexType> {
    if (not type) return Null<ComplexType>("Type");
    return AddTypeSig(type->signature());
}

auto pmd::MetadataReader::add_field(model::FieldDef* field, Level level) -> Result<Token> {
    if (not field) return Null<Token>("Field");
    PMD_TRY_VOID(CheckLevel(level, Level::Definition));
    if (not field->declaring_type() or field->declaring_type()->module() != &module)
        return Diag::Error(ErrorId::InvalidArgument, "Field '{}' is not defined in module '{}'", field->name(), module.name());

    /// Reference.
    PMD_TRY(type, AddType(field->declaring_type()));
    PMD_TRY(signature, AddCallingConventionSig(field->signature()));
    FieldRef identity{field->name(), std::move(type), std::move(signature)};
    PMD_TRY(ref, updater.update(Field{identity}, Level::Reference));
    if (level <= ref.old_level) return ref.token;

    /// Definition.
    FieldDef def{};
    static_cast<FieldRef&>(def) = std::move(identity);
    PMD_TRY(custom_attributes, AddCustomAttributes(field->custom_attributes));
    def.attributes = i32(field->attributes);
    def.initial_value = field->initial_value;
    def.constant = field->constant;
    def.custom_attributes = std::move(custom_attributes);

    PMD_TRY(upd, updater.update(Field{std::move(def)}, Level::Definition));
    PMD_ASSERT(upd.token == ref.token, "Definition of field '{}' got a different token", field->name());
    return ref.token;
}

auto pmd::MetadataReader::add_method(model::MethodDef* method, Level level) -> Result<Token> {
    if (not method) return Null<Token>("Method");
    PMD_TRY_VOID(CheckLevel(level, Level::Definition));
    if (not method->declaring_type() or method->declaring_type()->module() != &module)
        return Diag::Error(ErrorId::InvalidArgument, "Method '{}' is not defined in module '{}'", method->name(), module.name());

    /// Reference.
    PMD_TRY(type, AddType(method->declaring_type()));
    PMD_TRY(signature, AddCallingConventionSig(method->signature()));
    MethodRef identity{method->name(), std::move(type), std::move(signature)};
    PMD_TRY(ref, updater.update(Method{identity}, Level::Reference));
    if (level <= ref.old_level) return ref.token;

    /// Definition.
    MethodDef def{};
    static_cast<MethodRef&>(def) = std::move(identity);
    PMD_TRY(parameters, AddParameters(method->params));
    PMD_TRY(overrides, AddOverrides(method->overrides));
    PMD_TRY(generic_parameters, AddGenericParameters(method->generic_params));
    PMD_TRY(custom_attributes, AddCustomAttributes(method->custom_attributes));
    def.attributes = i32(method->attributes);
    def.impl_attributes = i32(method->impl_attributes);
    def.parameters = std::move(parameters);
    def.overrides = std::move(overrides);
    def.generic_parameters = std::move(generic_parameters);
    def.custom_attributes = std::move(custom_attributes);

    if (Has(Options::IncludeMethodBodies) and method->body) {
        PMD_TRY(body, AddMethodBody(*method->body));
        def.body = std::move(body);
    }

    if (method->impl_map) {
        if (not method->impl_map->module)
            return Diag::Error(ErrorId::InvalidArgument, "P/Invoke map of '{}' has no module", method->name());
        def.impl_map = ImplMap{
            method->impl_map->name,
            method->impl_map->module->name(),
            i32(method->impl_map->attributes),
        };
    }

    PMD_TRY(upd, updater.update(Method{std::move(def)}, Level::Definition));
    PMD_ASSERT(upd.token == ref.token, "Definition of method '{}' got a different token", method->name());
    return ref.token;
}

auto pmd::MetadataReader::add_types(std::span<model::TypeDef* const> types, Level level) -> Result<std::vector<Token>> {
    std::vector<Token> tokens{};
    tokens.reserve(types.size());
    for (auto t : types) {
        PMD_TRY(token, add_type(t, level));
        tokens.push_back(std::move(token));
    }
    return tokens;
}

auto pmd::MetadataReader::add_fields(std::span<model::FieldDef* const> fields, Level level) -> Result<std::vector<Token>> {
    std::vector<Token> tokens{};
    tokens.reserve(fields.size());
    for (auto f : fields) {
        PMD_TRY(token, add_field(f, level));
        tokens.push_back(std::move(token));
    }
    return tokens;
}

auto pmd::MetadataReader::add_methods(std::span<model::MethodDef* const> methods, Level level) -> Result<std::vector<Token>> {
    std::vector<Token> tokens{};
    tokens.reserve(methods.size());
    for (auto m : methods) {
        PMD_TRY(token, add_method(m, level));
        tokens.push_back(std::move(token));
    }
    return tokens;
}

/// ===========================================================================
///  References
/// ===========================================================================
auto pmd::MetadataReader::Identity(model::TypeDef* type) -> TypeRef {
    TypeRef identity{};
    identity.name = type->name();

    auto outermost = type;
    if (type->declaring_type()) {
        identity.enclosing_names.emplace();
        while (outermost->declaring_type()) {
            outermost = outermost->declaring_type();
            identity.enclosing_names->push_back(outermost->name());
        }
    }

    identity.ns = outermost->ns();
    return identity;
}

auto pmd::MetadataReader::AddTypeRef(model::TypeRef* type) -> Result<Token> {
    auto assembly = type->definition_assembly();
    if (not assembly) {
        return Diag::Error(
            ErrorId::Unsupported,
            "Type reference '{}' points into another module; only assembly scopes are supported",
            type->name()
        );
    }

    TypeRef identity{};
    identity.name = type->name();
    identity.assembly = Has(Options::UseAssemblyFullName) ? assembly->full_name() : assembly->name();

    auto outermost = type;
    if (type->declaring_type()) {
        identity.enclosing_names.emplace();
        while (auto enclosing = outermost->declaring_type()) {
            outermost = enclosing;
            identity.enclosing_names->push_back(outermost->name());
        }
    }

    identity.ns = outermost->ns();
    PMD_TRY(upd, updater.update(Type{std::move(identity)}, Level::Reference));
    return upd.token;
}

auto pmd::MetadataReader::AddType(model::TypeDefOrRef* type, bool allow_type_spec) -> Result<ComplexType> {
    if (not type) return Null<ComplexType>("Type");

    if (auto td = cast<model::TypeDef>(type)) {
        PMD_TRY(token, add_type(td, Level::Reference));
        return ComplexType::CreateToken(std::move(token));
    }

    if (auto tr = cast<model::TypeRef>(type)) {
        PMD_TRY(token, AddTypeRef(tr));
        return ComplexType::CreateToken(std::move(token));
    }

    if (not allow_type_spec)
        return Diag::Error(ErrorId::Unsupported, "A type specification cannot be used here");
    return add_type(as<model::TypeSpec>(type));
}

auto pmd::MetadataReader::AddFieldRef(model::MemberRef* field) -> Result<Token> {
    if (not field->is_field_ref())
        return Diag::Error(ErrorId::InvalidArgument, "Member reference '{}' is not a field reference", field->name());
    if (is<model::ModuleRef>(field->parent()))
        return Diag::Error(ErrorId::Unsupported, "Field '{}' is a global of another module", field->name());

    auto parent = cast<model::TypeDefOrRef>(field->parent());
    if (not parent)
        return Diag::Error(ErrorId::InvalidArgument, "Field reference '{}' has no declaring type", field->name());

    PMD_TRY(type, AddType(parent));
    PMD_TRY(signature, AddCallingConventionSig(field->signature()));
    PMD_TRY(upd, updater.update(Field{FieldRef{field->name(), std::move(type), std::move(signature)}}, Level::Reference));
    return upd.token;
}

auto pmd::MetadataReader::AddField(model::Row* field) -> Result<Token> {
    if (not field) return Null<Token>("Field");
    if (auto fd = cast<model::FieldDef>(field)) return add_field(fd, Level::Reference);
    if (auto mr = cast<model::MemberRef>(field)) return AddFieldRef(mr);
    return Diag::Error(ErrorId::InvalidArgument, "A {} is not a field", field->kind());
}

auto pmd::MetadataReader::AddMethodRef(model::MemberRef* method) -> Result<Token> {
    if (not method->is_method_ref())
        return Diag::Error(ErrorId::InvalidArgument, "Member reference '{}' is not a method reference", method->name());
    if (is<model::MethodDef>(method->parent()))
        return Diag::Error(ErrorId::Unsupported, "Vararg call site references to '{}' are not supported", method->name());
    if (is<model::ModuleRef>(method->parent()))
        return Diag::Error(ErrorId::Unsupported, "Method '{}' is a global of another module", method->name());

    auto parent = cast<model::TypeDefOrRef>(method->parent());
    if (not parent)
        return Diag::Error(ErrorId::InvalidArgument, "Method reference '{}' has no declaring type", method->name());

    PMD_TRY(type, AddType(parent));
    PMD_TRY(signature, AddCallingConventionSig(method->signature()));
    PMD_TRY(upd, updater.update(Method{MethodRef{method->name(), std::move(type), std::move(signature)}}, Level::Reference));
    return upd.token;
}

auto pmd::MetadataReader::AddMethod(model::Row* method) -> Result<Token> {
    if (not method) return Null<Token>("Method");
    if (auto md = cast<model::MethodDef>(method)) return add_method(md, Level::Reference);
    if (auto mr = cast<model::MemberRef>(method)) return AddMethodRef(mr);
    return Diag::Error(ErrorId::InvalidArgument, "A {} is not a method", method->kind());
}

/// ===========================================================================
///  Definition parts
/// ===========================================================================
auto pmd::MetadataReader::AddCustomAttributes(const std::vector<model::CustomAttribute>& attributes) -> Result<CustomAttributeList> {
    if (not Has(Options::IncludeCustomAttributes) or attributes.empty()) return CustomAttributeList{};

    std::vector<CustomAttribute> list{};
    list.reserve(attributes.size());
    for (const auto& ca : attributes) {
        PMD_TRY(ctor, AddMethod(ca.constructor));
        list.push_back(CustomAttribute{std::move(ctor), ca.blob});
    }
    return CustomAttributeList{std::move(list)};
}

auto pmd::MetadataReader::AddGenericParameters(const std::vector<model::GenericParam>& params) -> Result<GenericParameterList> {
    if (params.empty()) return GenericParameterList{};

    std::vector<GenericParameter> list{};
    list.reserve(params.size());
    for (const auto& gp : params) {
        GenericParameter p{gp.name, i32(gp.attributes), i32(gp.number), std::nullopt};
        if (not gp.constraints.empty()) {
            p.constraints.emplace();
            for (auto c : gp.constraints) {
                PMD_TRY(type, AddType(c));
                p.constraints->push_back(std::move(type));
            }
        }
        list.push_back(std::move(p));
    }
    return GenericParameterList{std::move(list)};
}

auto pmd::MetadataReader::AddInterfaces(const std::vector<model::TypeDefOrRef*>& interfaces)
    -> Result<std::optional<std::vector<ComplexType>>> {
    if (interfaces.empty()) return std::optional<std::vector<ComplexType>>{};

    std::vector<ComplexType> list{};
    list.reserve(interfaces.size());
    for (auto i : interfaces) {
        PMD_TRY(type, AddType(i));
        list.push_back(std::move(type));
    }
    return std::optional<std::vector<ComplexType>>{std::move(list)};
}

auto pmd::MetadataReader::AddParameters(const std::vector<model::ParamDef>& params) -> Result<std::vector<Parameter>> {
    std::vector<Parameter> list{};
    list.reserve(params.size());
    for (const auto& p : params) {
        PMD_TRY(custom_attributes, AddCustomAttributes(p.custom_attributes));
        list.push_back(Parameter{
            p.name,
            i32(p.sequence),
            i32(p.attributes),
            p.constant,
            std::move(custom_attributes),
        });
    }
    return list;
}

auto pmd::MetadataReader::AddOverrides(const std::vector<model::Row*>& overrides) -> Result<std::optional<std::vector<Token>>> {
    if (overrides.empty()) return std::optional<std::vector<Token>>{};

    std::vector<Token> list{};
    list.reserve(overrides.size());
    for (auto o : overrides) {
        PMD_TRY(token, AddMethod(o));
        list.push_back(std::move(token));
    }
    return std::optional<std::vector<Token>>{std::move(list)};
}

auto pmd::MetadataReader::AddOptionalMethod(model::MethodDef* method) -> Result<std::optional<Token>> {
    if (not method) return std::optional<Token>{};
    PMD_TRY(token, add_method(method, Level::Reference));
    return std::optional<Token>{std::move(token)};
}

auto pmd::MetadataReader::AddProperties(const std::vector<model::PropertyDef>& properties) -> Result<std::vector<Property>> {
    std::vector<Property> list{};
    list.reserve(properties.size());
    for (const auto& p : properties) {
        PMD_TRY(signature, AddCallingConventionSig(p.signature));
        PMD_TRY(get, AddOptionalMethod(p.get_method));
        PMD_TRY(set, AddOptionalMethod(p.set_method));
        PMD_TRY(custom_attributes, AddCustomAttributes(p.custom_attributes));
        list.push_back(Property{
            p.name,
            std::move(signature),
            i32(p.attributes),
            std::move(get),
            std::move(set),
            std::move(custom_attributes),
        });
    }
    return list;
}

auto pmd::MetadataReader::AddEvents(const std::vector<model::EventDef>& events) -> Result<std::vector<Event>> {
    std::vector<Event> list{};
    list.reserve(events.size());
    for (const auto& e : events) {
        PMD_TRY(type, AddType(e.type));
        PMD_TRY(add, AddOptionalMethod(e.add_method));
        PMD_TRY(remove, AddOptionalMethod(e.remove_method));
        PMD_TRY(invoke, AddOptionalMethod(e.invoke_method));
        PMD_TRY(custom_attributes, AddCustomAttributes(e.custom_attributes));
        list.push_back(Event{
            e.name,
            std::move(type),
            i32(e.attributes),
            std::move(add),
            std::move(remove),
            std::move(invoke),
            std::move(custom_attributes),
        });
    }
    return list;
}

/// ===========================================================================
///  Method bodies
/// ===========================================================================
auto pmd::MetadataReader::AddMethodBody(const model::CilBody& body) -> Result<MethodBody> {
    using model::OperandType;

    std::unordered_map<const model::Instruction*, i32> indices{};
    for (usz i = 0; i < body.instructions.size(); i++) indices.emplace(body.instructions[i], i32(i));

    auto Index = [&](const model::Instruction* target) -> Result<i32> {
        auto it = indices.find(target);
        if (it == indices.end()) return Diag::Error(ErrorId::InvalidArgument, "Branch target is not part of the method body");
        return it->second;
    };

    auto OptionalIndex = [&](const model::Instruction* target) -> Result<i32> {
        if (not target) return ExceptionHandler::None;
        return Index(target);
    };

    MethodBody out{};
    out.max_stack = body.max_stack;
    out.init_locals = body.init_locals;
    out.instructions.reserve(body.instructions.size());

    for (auto instr : body.instructions) {
        auto op = instr->opcode();
        auto Mismatch = [&]() -> Diag {
            return Diag::Error(
                ErrorId::InvalidArgument,
                "Operand of '{}' does not match its operand type {}",
                op->name,
                op->operand_type
            );
        };

        Instruction flat{std::string{op->name}, {}};
        const auto& operand = instr->operand;
        switch (op->operand_type) {
            case OperandType::InlineBrTarget:
            case OperandType::ShortInlineBrTarget: {
                auto target = std::get_if<model::Instruction*>(&operand);
                if (not target) return Mismatch();
                PMD_TRY(index, Index(*target));
                flat.operand = index;
            } break;

            case OperandType::InlineSwitch: {
                auto targets = std::get_if<std::vector<model::Instruction*>>(&operand);
                if (not targets) return Mismatch();
                std::vector<i32> flat_targets{};
                flat_targets.reserve(targets->size());
                for (auto t : *targets) {
                    PMD_TRY(index, Index(t));
                    flat_targets.push_back(index);
                }
                flat.operand = std::move(flat_targets);
            } break;

            case OperandType::InlineField:
            case OperandType::InlineMethod:
            case OperandType::InlineSig:
            case OperandType::InlineTok:
            case OperandType::InlineType: {
                PMD_TRY(token, AddInlineToken(operand));
                flat.operand = std::move(token);
            } break;

            case OperandType::InlineVar:
            case OperandType::ShortInlineVar:
                if (auto local = std::get_if<model::Local*>(&operand); local and *local) flat.operand = i32((*local)->index());
                else if (auto arg = std::get_if<model::Argument>(&operand)) flat.operand = i32(arg->index);
                else return Mismatch();
                break;

            case OperandType::InlineI:
            case OperandType::ShortInlineI:
                if (not std::holds_alternative<i32>(operand)) return Mismatch();
                flat.operand = std::get<i32>(operand);
                break;

            case OperandType::InlineI8:
                if (not std::holds_alternative<i64>(operand)) return Mismatch();
                flat.operand = std::get<i64>(operand);
                break;

            case OperandType::ShortInlineR:
                if (not std::holds_alternative<f32>(operand)) return Mismatch();
                flat.operand = std::get<f32>(operand);
                break;

            case OperandType::InlineR:
                if (not std::holds_alternative<f64>(operand)) return Mismatch();
                flat.operand = std::get<f64>(operand);
                break;

            case OperandType::InlineString:
                if (not std::holds_alternative<std::string>(operand)) return Mismatch();
                flat.operand = std::get<std::string>(operand);
                break;

            case OperandType::InlineNone:
                if (not std::holds_alternative<std::monostate>(operand)) return Mismatch();
                break;

            case OperandType::InlinePhi:
                return Diag::Error(ErrorId::Unsupported, "Opcode '{}' is not supported", op->name);
        }

        out.instructions.push_back(std::move(flat));
    }

    out.exception_handlers.reserve(body.exception_handlers.size());
    for (const auto& eh : body.exception_handlers) {
        ExceptionHandler flat{};
        PMD_TRY(try_start, Index(eh.try_start));
        PMD_TRY(try_end, OptionalIndex(eh.try_end));
        PMD_TRY(filter_start, OptionalIndex(eh.filter_start));
        PMD_TRY(handler_start, Index(eh.handler_start));
        PMD_TRY(handler_end, OptionalIndex(eh.handler_end));
        flat.try_start = try_start;
        flat.try_end = try_end;
        flat.filter_start = filter_start;
        flat.handler_start = handler_start;
        flat.handler_end = handler_end;
        flat.handler_type = i32(+eh.handler_type);
        if (eh.catch_type) {
            PMD_TRY(catch_type, AddType(eh.catch_type));
            flat.catch_type = std::move(catch_type);
        }
        out.exception_handlers.push_back(std::move(flat));
    }

    out.variables.reserve(body.locals.size());
    for (auto local : body.locals) {
        PMD_TRY(type, AddTypeSig(local->type()));
        out.variables.push_back(std::move(type));
    }

    return out;
}

auto pmd::MetadataReader::AddInlineToken(const model::Instruction::Operand& operand) -> Result<ComplexType> {
    if (auto sig = std::get_if<model::CallingConventionSig*>(&operand); sig and *sig) {
        if (not is<model::MethodSig, model::LocalSig>(*sig))
            return Diag::Error(ErrorId::InvalidArgument, "Stand-alone signature must be a method or local signature");
        return AddCallingConventionSig(*sig);
    }

    auto row_ptr = std::get_if<model::Row*>(&operand);
    if (not row_ptr or not *row_ptr)
        return Diag::Error(ErrorId::InvalidArgument, "Token operand must be a metadata row or a signature");

    auto row = *row_ptr;
    auto Inline = [](ComplexType::Kind kind, ComplexType inner) { return ComplexType::CreateInlineTokenOperand(kind, std::move(inner)); };
    auto FromToken = [&](ComplexType::Kind kind, Result<Token> token) -> Result<ComplexType> {
        if (token.is_diag()) return token.diag();
        return Inline(kind, ComplexType::CreateToken(std::move(*token)));
    };

    using K = ComplexType::Kind;
    using RK = model::Row::Kind;
    switch (row->kind()) {
        case RK::TypeDef:
        case RK::TypeRef:
        case RK::TypeSpec: {
            PMD_TRY(type, AddType(as<model::TypeDefOrRef>(row)));
            return Inline(K::InlineType, std::move(type));
        }

        case RK::FieldDef:
            return FromToken(K::InlineField, AddField(row));

        case RK::MethodDef:
            return FromToken(K::InlineMethod, AddMethod(row));

        case RK::MemberRef: {
            auto mr = as<model::MemberRef>(row);
            if (mr->is_field_ref()) return FromToken(K::InlineField, AddFieldRef(mr));
            return FromToken(K::InlineMethod, AddMethodRef(mr));
        }

        case RK::MethodSpec: {
            auto ms = as<model::MethodSpec>(row);
            PMD_TRY(method, AddMethod(ms->method()));
            PMD_TRY(instantiation, AddCallingConventionSig(ms->instantiation()));
            return Inline(
                K::InlineMethod,
                ComplexType::CreateMethodSpec(ComplexType::CreateToken(std::move(method)), std::move(instantiation))
            );
        }

        case RK::AssemblyRef:
        case RK::ModuleRef:
            break;
    }

    return Diag::Error(ErrorId::Unsupported, "A {} cannot be an instruction operand", row->kind());
}

/// ===========================================================================
///  Signatures
/// ===========================================================================
auto pmd::MetadataReader::AddTypeSig(const model::TypeSig* sig) -> Result<ComplexType> {
    if (not sig) return Null<ComplexType>("Type signature");

    auto et = sig->element_type();
    if (is<model::LeafSig>(sig)) return ComplexType::CreateTypeSig(et);

    /// et(next)
    if (auto w = cast<model::WrapperSig>(sig)) {
        PMD_TRY(next, AddTypeSig(w->next()));
        return ComplexType::CreateTypeSig(et, {std::move(next)});
    }

    if (auto f = cast<model::FnPtrSig>(sig)) {
        PMD_TRY(method, AddCallingConventionSig(f->signature()));
        return ComplexType::CreateTypeSig(et, {std::move(method)});
    }

    /// et(type); this must name a type, not a type spec.
    if (auto c = cast<model::ClassOrValueTypeSig>(sig)) {
        PMD_TRY(type, AddType(c->type(), false));
        return ComplexType::CreateTypeSig(et, {std::move(type)});
    }

    /// et(index)
    if (auto g = cast<model::GenericSig>(sig))
        return ComplexType::CreateTypeSig(et, {ComplexType::CreateInt32(i32(g->number()))});

    /// et(next, rank, numSizes, sizes..., numLowerBounds, lowerBounds...)
    if (auto a = cast<model::ArraySig>(sig)) {
        PMD_TRY(next, AddTypeSig(a->next()));
        std::vector<ComplexType> args{};
        args.reserve(4 + a->sizes().size() + a->lower_bounds().size());
        args.push_back(std::move(next));
        args.push_back(ComplexType::CreateInt32(i32(a->rank())));
        args.push_back(Int32(a->sizes().size()));
        for (auto size : a->sizes()) args.push_back(ComplexType::CreateInt32(i32(size)));
        args.push_back(Int32(a->lower_bounds().size()));
        for (auto lo : a->lower_bounds()) args.push_back(ComplexType::CreateInt32(lo));
        return ComplexType::CreateTypeSig(et, std::move(args));
    }

    /// et(next, numArgs, args...)
    if (auto inst = cast<model::GenericInstSig>(sig)) {
        PMD_TRY(generic_type, AddTypeSig(inst->generic_type()));
        std::vector<ComplexType> args{};
        args.reserve(2 + inst->arguments().size());
        args.push_back(std::move(generic_type));
        args.push_back(Int32(inst->arguments().size()));
        for (auto arg : inst->arguments()) {
            PMD_TRY(type, AddTypeSig(arg));
            args.push_back(std::move(type));
        }
        return ComplexType::CreateTypeSig(et, std::move(args));
    }

    /// et(next, size)
    if (auto va = cast<model::ValueArraySig>(sig)) {
        PMD_TRY(next, AddTypeSig(va->next()));
        return ComplexType::CreateTypeSig(et, {std::move(next), ComplexType::CreateInt32(i32(va->size()))});
    }

    /// et(modifier, next)
    if (auto m = cast<model::ModifierSig>(sig)) {
        PMD_TRY(modifier, AddType(m->modifier()));
        PMD_TRY(next, AddTypeSig(m->next()));
        return ComplexType::CreateTypeSig(et, {std::move(modifier), std::move(next)});
    }

    /// et(index, next)
    if (auto m = cast<model::ModuleSig>(sig)) {
        PMD_TRY(next, AddTypeSig(m->next()));
        return ComplexType::CreateTypeSig(et, {ComplexType::CreateInt32(i32(m->index())), std::move(next)});
    }

    PMD_UNREACHABLE();
}

auto pmd::MetadataReader::AddCallingConventionSig(const model::CallingConventionSig* sig) -> Result<ComplexType> {
    if (not sig) return Null<ComplexType>("Signature");

    auto cc = sig->calling_convention();
    std::vector<ComplexType> args{ComplexType::CreateInt32(sig->flags())};

    /// cc([numGenericParams], numParams, ret, params..., [Sentinel, params...])
    if (auto m = cast<model::MethodBaseSig>(sig)) {
        if (m->generic()) args.push_back(ComplexType::CreateInt32(i32(m->generic_param_count())));
        args.push_back(Int32(m->params().size() + m->params_after_sentinel().size()));

        PMD_TRY(ret, AddTypeSig(m->ret()));
        args.push_back(std::move(ret));
        for (auto p : m->params()) {
            PMD_TRY(param, AddTypeSig(p));
            args.push_back(std::move(param));
        }

        if (not m->params_after_sentinel().empty()) {
            args.push_back(ComplexType::CreateTypeSig(ElementType::Sentinel));
            for (auto p : m->params_after_sentinel()) {
                PMD_TRY(param, AddTypeSig(p));
                args.push_back(std::move(param));
            }
        }

        return ComplexType::CreateCallingConventionSig(cc, std::move(args));
    }

    /// cc(fieldType)
    if (auto f = cast<model::FieldSig>(sig)) {
        PMD_TRY(type, AddTypeSig(f->type()));
        args.push_back(std::move(type));
        return ComplexType::CreateCallingConventionSig(cc, std::move(args));
    }

    /// cc(numLocals, locals...)
    if (auto l = cast<model::LocalSig>(sig)) {
        args.push_back(Int32(l->locals().size()));
        for (auto local : l->locals()) {
            PMD_TRY(type, AddTypeSig(local));
            args.push_back(std::move(type));
        }
        return ComplexType::CreateCallingConventionSig(cc, std::move(args));
    }

    /// cc(numArgs, args...)
    if (auto g = cast<model::GenericInstMethodSig>(sig)) {
        args.push_back(Int32(g->arguments().size()));
        for (auto arg : g->arguments()) {
            PMD_TRY(type, AddTypeSig(arg));
            args.push_back(std::move(type));
        }
        return ComplexType::CreateCallingConventionSig(cc, std::move(args));
    }

    return Diag::Error(ErrorId::InvalidArgument, "Unknown calling convention {:#x}", +cc);
}
