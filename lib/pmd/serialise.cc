#include <pmd/primitives.hh>
#include <pmd/serialise.hh>

#include <limits>

namespace pmd::serialise {
namespace {
/// ===========================================================================
///  Writing
/// ===========================================================================
class Writer {
    JsonOptions options;

public:
    /// The first complex type that could not be written.
    Diag error{};
    bool failed = false;

    explicit Writer(JsonOptions options_) : options(options_) {}

    template <typename T, typename F>
    auto List(const std::vector<T>& list, F write_one) -> json::Array {
        json::Array a{};
        for (const auto& e : list) a.add(write_one(e));
        return a;
    }

    template <typename T, typename F>
    void AddList(json::Object& o, std::string key, const std::optional<std::vector<T>>& list, F write_one) {
        if (list) o.add(std::move(key), List(*list, write_one));
    }

    auto Token(const pmd::Token& t) -> json::Value {
        if (options.compact) {
            if (t.is_named()) return t.name();
            return t.index();
        }

        json::Object o{};
        if (t.is_named()) o.add("Name", t.name());
        else o.add("Index", t.index());
        return o;
    }

    auto Complex(const ComplexType& t) -> json::Value {
        if (options.compact) {
            auto text = t.format();
            if (text.is_diag()) {
                if (failed) text.diag().suppress();
                else error = std::move(text.diag());
                failed = true;
                return nullptr;
            }
            return std::move(*text);
        }

        json::Object o{};
        o.add("Kind", i32(+t.kind()));
        if (t.is_token() or t.is_int32()) o.add("Token", Token(t.token()));
        if (t.is_type_sig() or t.is_calling_convention_sig()) o.add("Type", i32(t.type()));
        if (t.has_arguments()) o.add("Arguments", List(t.arguments(), [&](const ComplexType& c) { return Complex(c); }));
        return o;
    }

    auto Tokens() {
        return [this](const pmd::Token& t) { return Token(t); };
    }

    auto Complexes() {
        return [this](const ComplexType& t) { return Complex(t); };
    }

    static auto Bytes(const std::vector<u8>& bytes) -> json::Value {
        return utils::Base64Encode(bytes);
    }

    static auto Constant(const pmd::Constant& c) -> json::Object {
        json::Object o{};
        o.add("Type", i32(c.type));
        if (auto s = std::get_if<std::string>(&c.value)) o.add("String", *s);
        else if (auto slot = ToSlot(c.value)) o.add("Value", *slot);
        return o;
    }

    auto CustomAttributes() {
        return [this](const CustomAttribute& ca) -> json::Value {
            json::Object o{};
            o.add("Constructor", Token(ca.constructor));
            o.add("RawData", Bytes(ca.raw_data));
            return o;
        };
    }

    auto GenericParameters() {
        return [this](const GenericParameter& gp) -> json::Value {
            json::Object o{};
            o.add("Name", gp.name);
            o.add("Attributes", gp.attributes);
            o.add("Number", gp.number);
            AddList(o, "Constraints", gp.constraints, Complexes());
            return o;
        };
    }

    void Identity(json::Object& o, const TypeRef& t) {
        o.add("Name", t.name);
        o.add("Namespace", t.ns);
        if (t.assembly) o.add("Assembly", *t.assembly);
        AddList(o, "EnclosingNames", t.enclosing_names, [](const std::string& s) { return json::Value{s}; });
    }

    template <typename TMemberRef>
    void Identity(json::Object& o, const TMemberRef& m) {
        o.add("Name", m.name);
        o.add("Type", Complex(m.type));
        o.add("Signature", Complex(m.signature));
    }

    template <typename TRef>
    auto Reference(const TRef& r) -> json::Value {
        json::Object o{};
        Identity(o, r);
        return o;
    }

    auto Definition(const TypeDef& t) -> json::Value {
        json::Object o{};
        Identity(o, static_cast<const TypeRef&>(t));
        o.add("Attributes", t.attributes);
        if (t.base_type) o.add("BaseType", Complex(*t.base_type));
        AddList(o, "Interfaces", t.interfaces, Complexes());
        if (t.class_layout) {
            json::Object layout{};
            layout.add("PackingSize", t.class_layout->packing_size);
            layout.add("ClassSize", t.class_layout->class_size);
            o.add("ClassLayout", std::move(layout));
        }
        AddList(o, "GenericParameters", t.generic_parameters, GenericParameters());
        AddList(o, "CustomAttributes", t.custom_attributes, CustomAttributes());
        AddList(o, "NestedTypes", t.nested_types, Tokens());
        AddList(o, "Fields", t.fields, Tokens());
        AddList(o, "Methods", t.methods, Tokens());

        AddList(o, "Properties", t.properties, [this](const Property& p) -> json::Value {
            json::Object po{};
            po.add("Name", p.name);
            po.add("Signature", Complex(p.signature));
            po.add("Attributes", p.attributes);
            if (p.get_method) po.add("GetMethod", Token(*p.get_method));
            if (p.set_method) po.add("SetMethod", Token(*p.set_method));
            AddList(po, "CustomAttributes", p.custom_attributes, CustomAttributes());
            return po;
        });

        AddList(o, "Events", t.events, [this](const Event& e) -> json::Value {
            json::Object eo{};
            eo.add("Name", e.name);
            eo.add("Type", Complex(e.type));
            eo.add("Attributes", e.attributes);
            if (e.add_method) eo.add("AddMethod", Token(*e.add_method));
            if (e.remove_method) eo.add("RemoveMethod", Token(*e.remove_method));
            if (e.invoke_method) eo.add("InvokeMethod", Token(*e.invoke_method));
            AddList(eo, "CustomAttributes", e.custom_attributes, CustomAttributes());
            return eo;
        });

        return o;
    }

    auto Definition(const FieldDef& f) -> json::Value {
        json::Object o{};
        Identity(o, f);
        o.add("Attributes", f.attributes);
        if (f.initial_value) o.add("InitialValue", Bytes(*f.initial_value));
        if (f.constant) o.add("Constant", Constant(*f.constant));
        AddList(o, "CustomAttributes", f.custom_attributes, CustomAttributes());
        return o;
    }

    auto Operand(const Instruction::Operand& operand) -> json::Object {
        json::Object o{};
        std::visit(
            [&](const auto& v) {
                using T = std::remove_cvref_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) PMD_UNREACHABLE();
                else if constexpr (std::is_same_v<T, i32>) o.add("Int32", v);
                else if constexpr (std::is_same_v<T, i64>) o.add("Int64", v);
                else if constexpr (std::is_same_v<T, f32>) o.add("Single", *ToSlot(v));
                else if constexpr (std::is_same_v<T, f64>) o.add("Double", *ToSlot(v));
                else if constexpr (std::is_same_v<T, std::string>) o.add("String", v);
                else if constexpr (std::is_same_v<T, std::vector<i32>>) o.add("Switch", List(v, [](i32 i) { return json::Value{i}; }));
                else if constexpr (std::is_same_v<T, ComplexType>) o.add("Type", Complex(v));
                else static_assert(always_false<T>, "Unhandled operand type");
            },
            operand
        );
        return o;
    }

    auto Body(const MethodBody& b) -> json::Value {
        json::Object o{};
        o.add("Instructions", List(b.instructions, [this](const Instruction& i) -> json::Value {
            json::Object io{};
            io.add("OpCode", i.opcode);
            if (not std::holds_alternative<std::monostate>(i.operand)) io.add("Operand", Operand(i.operand));
            return io;
        }));

        o.add("ExceptionHandlers", List(b.exception_handlers, [this](const ExceptionHandler& eh) -> json::Value {
            json::Object eo{};
            eo.add("TryStart", eh.try_start);
            eo.add("TryEnd", eh.try_end);
            eo.add("FilterStart", eh.filter_start);
            eo.add("HandlerStart", eh.handler_start);
            eo.add("HandlerEnd", eh.handler_end);
            if (eh.catch_type) eo.add("CatchType", Complex(*eh.catch_type));
            eo.add("HandlerType", eh.handler_type);
            return eo;
        }));

        o.add("Variables", List(b.variables, Complexes()));
        o.add("MaxStack", b.max_stack);
        o.add("InitLocals", b.init_locals);
        return o;
    }

    auto Definition(const MethodDef& m) -> json::Value {
        json::Object o{};
        Identity(o, m);
        o.add("Attributes", m.attributes);
        o.add("ImplAttributes", m.impl_attributes);
        o.add("Parameters", List(m.parameters, [this](const Parameter& p) -> json::Value {
            json::Object po{};
            po.add("Name", p.name);
            po.add("Sequence", p.sequence);
            po.add("Attributes", p.attributes);
            if (p.constant) po.add("Constant", Constant(*p.constant));
            AddList(po, "CustomAttributes", p.custom_attributes, CustomAttributes());
            return po;
        }));

        if (m.body) o.add("Body", Body(*m.body));
        AddList(o, "Overrides", m.overrides, Tokens());
        if (m.impl_map) {
            json::Object im{};
            im.add("Name", m.impl_map->name);
            im.add("Module", m.impl_map->module);
            im.add("Attributes", m.impl_map->attributes);
            o.add("ImplMap", std::move(im));
        }
        AddList(o, "GenericParameters", m.generic_parameters, GenericParameters());
        AddList(o, "CustomAttributes", m.custom_attributes, CustomAttributes());
        return o;
    }

    template <typename TRef, typename TDef>
    auto Section(const EntityFacade<TRef, TDef>& section) -> json::Value {
        json::Object refs{};
        for (const auto& [key, ref] : section.references) refs.add(key, Reference(ref));

        json::Object defs{};
        for (const auto& [key, def] : section.definitions) defs.add(key, Definition(def));

        json::Object o{};
        o.add("References", std::move(refs));
        o.add("Definitions", std::move(defs));
        o.add("Orders", List(section.orders, [](i32 i) { return json::Value{i}; }));
        return o;
    }
};

/// ===========================================================================
///  Reading
/// ===========================================================================
auto Mismatch(std::string_view what, std::string_view expected, const json::Value& v) -> Diag {
    return Diag::Error(ErrorId::InvalidData, "'{}' must be {}, got {}", what, expected, v.type_name());
}

auto AsObject(const json::Value& v, std::string_view what) -> Result<const json::Object*> {
    if (auto o = v.as_object()) return o;
    return Mismatch(what, "an object", v);
}

auto AsArray(const json::Value& v, std::string_view what) -> Result<const json::Array*> {
    if (auto a = v.as_array()) return a;
    return Mismatch(what, "an array", v);
}

auto AsString(const json::Value& v, std::string_view what) -> Result<std::string> {
    if (auto s = v.as_string()) return *s;
    return Mismatch(what, "a string", v);
}

auto AsBool(const json::Value& v, std::string_view what) -> Result<bool> {
    if (auto b = v.as_bool()) return *b;
    return Mismatch(what, "a boolean", v);
}

auto AsInt(const json::Value& v, std::string_view what, i64 min, i64 max) -> Result<i64> {
    auto i = v.as_int();
    if (not i) return Mismatch(what, "an integer", v);
    if (*i < min or *i > max) return Diag::Error(ErrorId::InvalidData, "'{}' is out of range: {}", what, *i);
    return *i;
}

auto AsInt32(const json::Value& v, std::string_view what) -> Result<i32> {
    PMD_TRY(i, AsInt(v, what, std::numeric_limits<i32>::min(), std::numeric_limits<i32>::max()));
    return i32(i);
}

/// Get a member that may be absent. JSON null counts as absent.
auto Optional(const json::Object& o, std::string_view key) -> const json::Value* {
    auto v = o.find(key);
    if (not v or v->is_null()) return nullptr;
    return v;
}

auto Required(const json::Object& o, std::string_view key) -> Result<const json::Value*> {
    if (auto v = Optional(o, key)) return v;
    return Diag::Error(ErrorId::InvalidData, "Missing member '{}'", key);
}

auto RequiredString(const json::Object& o, std::string_view key) -> Result<std::string> {
    PMD_TRY(v, Required(o, key));
    return AsString(*v, key);
}

auto RequiredInt32(const json::Object& o, std::string_view key) -> Result<i32> {
    PMD_TRY(v, Required(o, key));
    return AsInt32(*v, key);
}

template <typename T, typename F>
auto ReadList(const json::Value& v, std::string_view what, F read_one) -> Result<std::vector<T>> {
    PMD_TRY(a, AsArray(v, what));
    std::vector<T> out{};
    out.reserve(a->elements.size());
    for (const auto& e : a->elements) {
        PMD_TRY(item, read_one(e));
        out.push_back(std::move(item));
    }
    return out;
}

template <typename T, typename F>
auto ReadOptionalList(const json::Object& o, std::string_view key, F read_one) -> Result<std::optional<std::vector<T>>> {
    auto v = Optional(o, key);
    if (not v) return std::optional<std::vector<T>>{};
    PMD_TRY(list, ReadList<T>(*v, key, read_one));
    return std::optional<std::vector<T>>{std::move(list)};
}

auto ReadBytes(const json::Value& v, std::string_view what) -> Result<std::vector<u8>> {
    PMD_TRY(s, AsString(v, what));
    auto bytes = utils::Base64Decode(s);
    if (not bytes) return Diag::Error(ErrorId::InvalidData, "'{}' is not valid base64", what);
    return std::move(*bytes);
}

auto ReadToken(const json::Value& v, bool allow_negative = false) -> Result<Token> {
    auto Named = [](const std::string& name) -> Result<Token> {
        auto t = Token::Named(name);
        if (t.is_value()) return t;
        t.diag().suppress();
        return Diag::Error(ErrorId::InvalidData, "'{}' is not a valid token name", name);
    };

    auto Index = [&](const json::Value& i) -> Result<Token> {
        i64 min = allow_negative ? std::numeric_limits<i32>::min() : 0;
        PMD_TRY(index, AsInt(i, "Index", min, std::numeric_limits<i32>::max()));
        return Token{i32(index)};
    };

    if (v.as_int()) return Index(v);
    if (auto s = v.as_string()) return Named(*s);

    auto o = v.as_object();
    if (not o) return Mismatch("Token", "an integer, a string or an object", v);
    if (auto i = Optional(*o, "Index")) return Index(*i);
    PMD_TRY(name, RequiredString(*o, "Name"));
    return Named(name);
}

/// Signatures must have the same shape as their text form.
auto Checked(ComplexType sig) -> Result<ComplexType> {
    auto text = sig.format();
    if (text.is_diag()) return text.diag();
    return sig;
}

auto ReadComplexType(const json::Value& v) -> Result<ComplexType> {
    if (auto s = v.as_string()) {
        if (s->empty()) return Diag::Error(ErrorId::InvalidData, "Complex type text cannot be empty");
        return ComplexType::Parse(*s);
    }

    PMD_TRY(o, AsObject(v, "ComplexType"));
    PMD_TRY(kind_value, Required(*o, "Kind"));
    PMD_TRY(kind_int, AsInt(*kind_value, "Kind", 0, +ComplexType::Kind::InlineMethod));
    auto kind = ComplexType::Kind(kind_int);

    std::vector<ComplexType> args{};
    if (auto a = Optional(*o, "Arguments")) {
        PMD_TRY(list, ReadList<ComplexType>(*a, "Arguments", ReadComplexType));
        args = std::move(list);
    }

    auto Code = [&]() -> Result<u8> {
        PMD_TRY(type_value, Required(*o, "Type"));
        PMD_TRY(code, AsInt(*type_value, "Type", 0, 0xFF));
        return u8(code);
    };

    using K = ComplexType::Kind;
    switch (kind) {
        case K::Token: {
            PMD_TRY(tv, Required(*o, "Token"));
            PMD_TRY(token, ReadToken(*tv));
            return ComplexType::CreateToken(std::move(token));
        }

        case K::Int32: {
            PMD_TRY(tv, Required(*o, "Token"));
            PMD_TRY(token, ReadToken(*tv, true));
            if (token.is_named()) return Diag::Error(ErrorId::InvalidData, "Int32 literal must hold an index");
            return ComplexType::CreateInt32(token.index());
        }

        case K::TypeSig: {
            PMD_TRY(code, Code());
            return Checked(ComplexType::CreateTypeSig(code, std::move(args)));
        }

        case K::CallingConventionSig: {
            PMD_TRY(code, Code());
            return Checked(ComplexType::CreateCallingConventionSig(code, std::move(args)));
        }

        case K::MethodSpec:
            if (args.size() != 2) return Diag::Error(ErrorId::InvalidData, "MethodSpec takes 2 arguments, got {}", args.size());
            return ComplexType::CreateMethodSpec(std::move(args[0]), std::move(args[1]));

        case K::InlineType:
        case K::InlineField:
        case K::InlineMethod:
            if (args.size() != 1) return Diag::Error(ErrorId::InvalidData, "{} takes 1 argument, got {}", kind, args.size());
            return ComplexType::CreateInlineTokenOperand(kind, std::move(args[0]));
    }

    PMD_UNREACHABLE();
}

auto ReadConstant(const json::Value& v) -> Result<Constant> {
    PMD_TRY(o, AsObject(v, "Constant"));
    PMD_TRY(type, RequiredInt32(*o, "Type"));
    if (type < 0 or type > 0xFF) return Diag::Error(ErrorId::InvalidData, "Constant type out of range: {}", type);

    Constant c{u8(type), {}};
    if (auto s = Optional(*o, "String")) {
        PMD_TRY(str, AsString(*s, "String"));
        c.value = std::move(str);
    } else if (auto slot = Optional(*o, "Value")) {
        PMD_TRY(bits, AsInt(*slot, "Value", std::numeric_limits<i64>::min(), std::numeric_limits<i64>::max()));
        PMD_TRY(value, FromSlot(bits, c.type));
        c.value = std::move(value);
    }
    return c;
}

auto ReadCustomAttribute(const json::Value& v) -> Result<CustomAttribute> {
    PMD_TRY(o, AsObject(v, "CustomAttribute"));
    PMD_TRY(ctor, Required(*o, "Constructor"));
    PMD_TRY(token, ReadToken(*ctor));
    PMD_TRY(raw, Required(*o, "RawData"));
    PMD_TRY(bytes, ReadBytes(*raw, "RawData"));
    return CustomAttribute{std::move(token), std::move(bytes)};
}

auto ReadCustomAttributes(const json::Object& o) -> Result<CustomAttributeList> {
    return ReadOptionalList<CustomAttribute>(o, "CustomAttributes", ReadCustomAttribute);
}

auto ReadGenericParameter(const json::Value& v) -> Result<GenericParameter> {
    PMD_TRY(o, AsObject(v, "GenericParameter"));
    GenericParameter gp{};
    PMD_TRY(name, RequiredString(*o, "Name"));
    PMD_TRY(attributes, RequiredInt32(*o, "Attributes"));
    PMD_TRY(number, RequiredInt32(*o, "Number"));
    PMD_TRY(constraints, ReadOptionalList<ComplexType>(*o, "Constraints", ReadComplexType));
    gp.name = std::move(name);
    gp.attributes = attributes;
    gp.number = number;
    gp.constraints = std::move(constraints);
    return gp;
}

auto ReadOptionalToken(const json::Object& o, std::string_view key) -> Result<std::optional<Token>> {
    auto v = Optional(o, key);
    if (not v) return std::optional<Token>{};
    PMD_TRY(token, ReadToken(*v));
    return std::optional<Token>{std::move(token)};
}

auto ReadOptionalComplexType(const json::Object& o, std::string_view key) -> Result<std::optional<ComplexType>> {
    auto v = Optional(o, key);
    if (not v) return std::optional<ComplexType>{};
    PMD_TRY(type, ReadComplexType(*v));
    return std::optional<ComplexType>{std::move(type)};
}

auto ReadRequiredComplexType(const json::Object& o, std::string_view key) -> Result<ComplexType> {
    PMD_TRY(v, Required(o, key));
    return ReadComplexType(*v);
}

auto ReadTypeIdentity(const json::Object& o, TypeRef& t) -> Result<void> {
    PMD_TRY(name, RequiredString(o, "Name"));
    PMD_TRY(ns, RequiredString(o, "Namespace"));
    t.name = std::move(name);
    t.ns = std::move(ns);

    if (auto a = Optional(o, "Assembly")) {
        PMD_TRY(assembly, AsString(*a, "Assembly"));
        t.assembly = std::move(assembly);
    }

    PMD_TRY(names, ReadOptionalList<std::string>(o, "EnclosingNames", [](const json::Value& n) {
        return AsString(n, "EnclosingNames");
    }));
    t.enclosing_names = std::move(names);
    return {};
}

template <typename TMemberRef>
auto ReadMemberIdentity(const json::Object& o, TMemberRef& m) -> Result<void> {
    PMD_TRY(name, RequiredString(o, "Name"));
    PMD_TRY(type, ReadRequiredComplexType(o, "Type"));
    PMD_TRY(signature, ReadRequiredComplexType(o, "Signature"));
    m.name = std::move(name);
    m.type = std::move(type);
    m.signature = std::move(signature);
    return {};
}

auto ReadTypeRef(const json::Value& v) -> Result<TypeRef> {
    PMD_TRY(o, AsObject(v, "Type"));
    TypeRef t{};
    PMD_TRY_VOID(ReadTypeIdentity(*o, t));
    return t;
}

auto ReadProperty(const json::Value& v) -> Result<Property> {
    PMD_TRY(o, AsObject(v, "Property"));
    PMD_TRY(name, RequiredString(*o, "Name"));
    PMD_TRY(signature, ReadRequiredComplexType(*o, "Signature"));
    PMD_TRY(attributes, RequiredInt32(*o, "Attributes"));
    PMD_TRY(get, ReadOptionalToken(*o, "GetMethod"));
    PMD_TRY(set, ReadOptionalToken(*o, "SetMethod"));
    PMD_TRY(cas, ReadCustomAttributes(*o));
    return Property{std::move(name), std::move(signature), attributes, std::move(get), std::move(set), std::move(cas)};
}

auto ReadEvent(const json::Value& v) -> Result<Event> {
    PMD_TRY(o, AsObject(v, "Event"));
    PMD_TRY(name, RequiredString(*o, "Name"));
    PMD_TRY(type, ReadRequiredComplexType(*o, "Type"));
    PMD_TRY(attributes, RequiredInt32(*o, "Attributes"));
    PMD_TRY(add, ReadOptionalToken(*o, "AddMethod"));
    PMD_TRY(remove, ReadOptionalToken(*o, "RemoveMethod"));
    PMD_TRY(invoke, ReadOptionalToken(*o, "InvokeMethod"));
    PMD_TRY(cas, ReadCustomAttributes(*o));
    return Event{
        std::move(name),
        std::move(type),
        attributes,
        std::move(add),
        std::move(remove),
        std::move(invoke),
        std::move(cas),
    };
}

auto ReadTypeDef(const json::Value& v) -> Result<TypeDef> {
    PMD_TRY(o, AsObject(v, "Type"));
    TypeDef t{};
    PMD_TRY_VOID(ReadTypeIdentity(*o, t));
    PMD_TRY(attributes, RequiredInt32(*o, "Attributes"));
    PMD_TRY(base_type, ReadOptionalComplexType(*o, "BaseType"));
    PMD_TRY(interfaces, ReadOptionalList<ComplexType>(*o, "Interfaces", ReadComplexType));
    PMD_TRY(generic_parameters, ReadOptionalList<GenericParameter>(*o, "GenericParameters", ReadGenericParameter));
    PMD_TRY(custom_attributes, ReadCustomAttributes(*o));
    PMD_TRY(nested_types, ReadOptionalList<Token>(*o, "NestedTypes", [](const json::Value& e) { return ReadToken(e); }));
    PMD_TRY(fields, ReadOptionalList<Token>(*o, "Fields", [](const json::Value& e) { return ReadToken(e); }));
    PMD_TRY(methods, ReadOptionalList<Token>(*o, "Methods", [](const json::Value& e) { return ReadToken(e); }));
    PMD_TRY(properties, ReadOptionalList<Property>(*o, "Properties", ReadProperty));
    PMD_TRY(events, ReadOptionalList<Event>(*o, "Events", ReadEvent));

    if (auto layout = Optional(*o, "ClassLayout")) {
        PMD_TRY(lo, AsObject(*layout, "ClassLayout"));
        PMD_TRY(packing_size, RequiredInt32(*lo, "PackingSize"));
        PMD_TRY(class_size, RequiredInt32(*lo, "ClassSize"));
        t.class_layout = ClassLayout{packing_size, class_size};
    }

    t.attributes = attributes;
    t.base_type = std::move(base_type);
    t.interfaces = std::move(interfaces);
    t.generic_parameters = std::move(generic_parameters);
    t.custom_attributes = std::move(custom_attributes);
    t.nested_types = std::move(nested_types);
    t.fields = std::move(fields);
    t.methods = std::move(methods);
    t.properties = std::move(properties);
    t.events = std::move(events);
    return t;
}

auto ReadFieldRef(const json::Value& v) -> Result<FieldRef> {
    PMD_TRY(o, AsObject(v, "Field"));
    FieldRef f{};
    PMD_TRY_VOID(ReadMemberIdentity(*o, f));
    return f;
}

auto ReadFieldDef(const json::Value& v) -> Result<FieldDef> {
    PMD_TRY(o, AsObject(v, "Field"));
    FieldDef f{};
    PMD_TRY_VOID(ReadMemberIdentity(*o, f));
    PMD_TRY(attributes, RequiredInt32(*o, "Attributes"));
    PMD_TRY(custom_attributes, ReadCustomAttributes(*o));
    f.attributes = attributes;
    f.custom_attributes = std::move(custom_attributes);

    if (auto iv = Optional(*o, "InitialValue")) {
        PMD_TRY(bytes, ReadBytes(*iv, "InitialValue"));
        f.initial_value = std::move(bytes);
    }

    if (auto c = Optional(*o, "Constant")) {
        PMD_TRY(constant, ReadConstant(*c));
        f.constant = std::move(constant);
    }

    return f;
}

auto ReadParameter(const json::Value& v) -> Result<Parameter> {
    PMD_TRY(o, AsObject(v, "Parameter"));
    Parameter p{};
    PMD_TRY(name, RequiredString(*o, "Name"));
    PMD_TRY(sequence, RequiredInt32(*o, "Sequence"));
    PMD_TRY(attributes, RequiredInt32(*o, "Attributes"));
    PMD_TRY(custom_attributes, ReadCustomAttributes(*o));
    p.name = std::move(name);
    p.sequence = sequence;
    p.attributes = attributes;
    p.custom_attributes = std::move(custom_attributes);

    if (auto c = Optional(*o, "Constant")) {
        PMD_TRY(constant, ReadConstant(*c));
        p.constant = std::move(constant);
    }

    return p;
}

auto ReadOperand(const json::Value& v) -> Result<Instruction::Operand> {
    PMD_TRY(o, AsObject(v, "Operand"));
    if (o->members.size() != 1) return Diag::Error(ErrorId::InvalidData, "Operand must have exactly one member");

    const auto& [tag, value] = o->members.front();
    constexpr auto i64_min = std::numeric_limits<i64>::min();
    constexpr auto i64_max = std::numeric_limits<i64>::max();

    if (tag == "Int32") {
        PMD_TRY(i, AsInt32(value, tag));
        return Instruction::Operand{i};
    }

    if (tag == "Int64") {
        PMD_TRY(i, AsInt(value, tag, i64_min, i64_max));
        return Instruction::Operand{i};
    }

    if (tag == "Single" or tag == "Double") {
        PMD_TRY(bits, AsInt(value, tag, i64_min, i64_max));
        PMD_TRY(f, FromSlot(bits, tag == "Single" ? +ElementType::R4 : +ElementType::R8));
        if (auto single = std::get_if<f32>(&f)) return Instruction::Operand{*single};
        return Instruction::Operand{std::get<f64>(f)};
    }

    if (tag == "String") {
        PMD_TRY(s, AsString(value, tag));
        return Instruction::Operand{std::move(s)};
    }

    if (tag == "Switch") {
        PMD_TRY(targets, ReadList<i32>(value, tag, [&](const json::Value& e) { return AsInt32(e, tag); }));
        return Instruction::Operand{std::move(targets)};
    }

    if (tag == "Type") {
        PMD_TRY(type, ReadComplexType(value));
        return Instruction::Operand{std::move(type)};
    }

    return Diag::Error(ErrorId::InvalidData, "Unknown operand kind '{}'", tag);
}

auto ReadInstruction(const json::Value& v) -> Result<Instruction> {
    PMD_TRY(o, AsObject(v, "Instruction"));
    Instruction i{};
    PMD_TRY(opcode, RequiredString(*o, "OpCode"));
    i.opcode = std::move(opcode);
    if (auto operand = Optional(*o, "Operand")) {
        PMD_TRY(op, ReadOperand(*operand));
        i.operand = std::move(op);
    }
    return i;
}

auto ReadExceptionHandler(const json::Value& v) -> Result<ExceptionHandler> {
    PMD_TRY(o, AsObject(v, "ExceptionHandler"));
    ExceptionHandler eh{};
    PMD_TRY(try_start, RequiredInt32(*o, "TryStart"));
    PMD_TRY(try_end, RequiredInt32(*o, "TryEnd"));
    PMD_TRY(filter_start, RequiredInt32(*o, "FilterStart"));
    PMD_TRY(handler_start, RequiredInt32(*o, "HandlerStart"));
    PMD_TRY(handler_end, RequiredInt32(*o, "HandlerEnd"));
    PMD_TRY(catch_type, ReadOptionalComplexType(*o, "CatchType"));
    PMD_TRY(handler_type, RequiredInt32(*o, "HandlerType"));
    eh.try_start = try_start;
    eh.try_end = try_end;
    eh.filter_start = filter_start;
    eh.handler_start = handler_start;
    eh.handler_end = handler_end;
    eh.catch_type = std::move(catch_type);
    eh.handler_type = handler_type;
    return eh;
}

auto ReadBody(const json::Value& v) -> Result<MethodBody> {
    PMD_TRY(o, AsObject(v, "Body"));
    MethodBody b{};
    PMD_TRY(iv, Required(*o, "Instructions"));
    PMD_TRY(instructions, ReadList<Instruction>(*iv, "Instructions", ReadInstruction));
    PMD_TRY(ev, Required(*o, "ExceptionHandlers"));
    PMD_TRY(handlers, ReadList<ExceptionHandler>(*ev, "ExceptionHandlers", ReadExceptionHandler));
    PMD_TRY(vv, Required(*o, "Variables"));
    PMD_TRY(variables, ReadList<ComplexType>(*vv, "Variables", ReadComplexType));
    PMD_TRY(max_stack, RequiredInt32(*o, "MaxStack"));
    PMD_TRY(il, Required(*o, "InitLocals"));
    PMD_TRY(init_locals, AsBool(*il, "InitLocals"));
    b.instructions = std::move(instructions);
    b.exception_handlers = std::move(handlers);
    b.variables = std::move(variables);
    b.max_stack = max_stack;
    b.init_locals = init_locals;
    return b;
}

auto ReadMethodRef(const json::Value& v) -> Result<MethodRef> {
    PMD_TRY(o, AsObject(v, "Method"));
    MethodRef m{};
    PMD_TRY_VOID(ReadMemberIdentity(*o, m));
    return m;
}

auto ReadMethodDef(const json::Value& v) -> Result<MethodDef> {
    PMD_TRY(o, AsObject(v, "Method"));
    MethodDef m{};
    PMD_TRY_VOID(ReadMemberIdentity(*o, m));
    PMD_TRY(attributes, RequiredInt32(*o, "Attributes"));
    PMD_TRY(impl_attributes, RequiredInt32(*o, "ImplAttributes"));
    PMD_TRY(pv, Required(*o, "Parameters"));
    PMD_TRY(parameters, ReadList<Parameter>(*pv, "Parameters", ReadParameter));
    PMD_TRY(overrides, ReadOptionalList<Token>(*o, "Overrides", [](const json::Value& e) { return ReadToken(e); }));
    PMD_TRY(generic_parameters, ReadOptionalList<GenericParameter>(*o, "GenericParameters", ReadGenericParameter));
    PMD_TRY(custom_attributes, ReadCustomAttributes(*o));
    m.attributes = attributes;
    m.impl_attributes = impl_attributes;
    m.parameters = std::move(parameters);
    m.overrides = std::move(overrides);
    m.generic_parameters = std::move(generic_parameters);
    m.custom_attributes = std::move(custom_attributes);

    if (auto bv = Optional(*o, "Body")) {
        PMD_TRY(body, ReadBody(*bv));
        m.body = std::move(body);
    }

    if (auto iv = Optional(*o, "ImplMap")) {
        PMD_TRY(io, AsObject(*iv, "ImplMap"));
        PMD_TRY(name, RequiredString(*io, "Name"));
        PMD_TRY(module, RequiredString(*io, "Module"));
        PMD_TRY(im_attributes, RequiredInt32(*io, "Attributes"));
        m.impl_map = ImplMap{std::move(name), std::move(module), im_attributes};
    }

    return m;
}

template <typename TRef, typename TDef>
auto ReadSection(
    const json::Object& root,
    std::string_view key,
    auto read_ref,
    auto read_def
) -> Result<EntityFacade<TRef, TDef>> {
    EntityFacade<TRef, TDef> section{};
    PMD_TRY(v, Required(root, key));
    PMD_TRY(o, AsObject(*v, key));

    if (auto refs = Optional(*o, "References")) {
        PMD_TRY(ro, AsObject(*refs, "References"));
        for (const auto& m : ro->members) {
            PMD_TRY(ref, read_ref(m.value));
            if (not section.references.add(m.key, std::move(ref)))
                return Diag::Error(ErrorId::InvalidData, "{}: duplicate reference '{}'", key, m.key);
        }
    }

    if (auto defs = Optional(*o, "Definitions")) {
        PMD_TRY(dobj, AsObject(*defs, "Definitions"));
        for (const auto& m : dobj->members) {
            PMD_TRY(def, read_def(m.value));
            if (not section.definitions.add(m.key, std::move(def)))
                return Diag::Error(ErrorId::InvalidData, "{}: duplicate definition '{}'", key, m.key);
        }
    }

    if (auto orders = Optional(*o, "Orders")) {
        PMD_TRY(list, ReadList<i32>(*orders, "Orders", [](const json::Value& e) { return AsInt32(e, "Orders"); }));
        section.orders = std::move(list);
    }

    return section;
}
} // namespace
} // namespace pmd::serialise

auto pmd::serialise::ToJsonValue(const Facade& facade, JsonOptions options) -> Result<json::Value> {
    Writer w{options};
    json::Object root{};
    root.add("Options", i64(+facade.options));
    root.add("Types", w.Section(facade.types));
    root.add("Fields", w.Section(facade.fields));
    root.add("Methods", w.Section(facade.methods));
    if (w.failed) return std::move(w.error);
    return json::Value{std::move(root)};
}

auto pmd::serialise::FromJsonValue(const json::Value& value) -> Result<Facade> {
    PMD_TRY(root, AsObject(value, "document"));
    PMD_TRY(ov, Required(*root, "Options"));
    PMD_TRY(options, AsInt(*ov, "Options", 0, +Options::All));

    PMD_TRY(types, (ReadSection<TypeRef, TypeDef>(*root, "Types", ReadTypeRef, ReadTypeDef)));
    PMD_TRY(fields, (ReadSection<FieldRef, FieldDef>(*root, "Fields", ReadFieldRef, ReadFieldDef)));
    PMD_TRY(methods, (ReadSection<MethodRef, MethodDef>(*root, "Methods", ReadMethodRef, ReadMethodDef)));

    Facade f{};
    f.options = Options(options);
    f.types = std::move(types);
    f.fields = std::move(fields);
    f.methods = std::move(methods);
    return f;
}

auto pmd::serialise::ToJson(const Metadata& metadata, JsonOptions options) -> Result<std::string> {
    PMD_TRY(value, ToJsonValue(Facade::FromMetadata(metadata), options));
    return value.emit(options.pretty);
}

auto pmd::serialise::FromJson(std::string_view text) -> Result<Metadata> {
    PMD_TRY(value, json::Parse(text));
    PMD_TRY(facade, FromJsonValue(value));
    return facade.to_metadata();
}
