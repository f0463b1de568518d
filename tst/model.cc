#include <pmd/model/module.hh>
#include <pmd/reader.hh>
#include <pmd/serialise.hh>
#include <pmd/updater.hh>
#include <pmd/utils/rtti.hh>
#include <pmd/writer.hh>

#include <pmdtest/pmdtest.hh>

using namespace pmd;
using pmdtest::Test;

namespace {
constexpr std::string_view Mscorlib = "mscorlib, Version=4.0.0.0, Culture=neutral, PublicKeyToken=b77a5c561934e089";

/// Rows of the sample module that tests want to poke at.
struct Sample {
    model::TypeRef* object{};
    model::TypeRef* console{};
    model::TypeDef* program{};
    model::TypeDef* inner{};
    model::FieldDef* count{};
    model::MethodDef* get_count{};
    model::MethodDef* main{};
    model::MethodDef* shapes{};
};

auto Build(model::Module& mod) -> Sample {
    Sample s{};
    auto mscorlib = mod.create_assembly_ref_from_full_name(Mscorlib);
    auto i4 = mod.leaf(ElementType::I4);
    auto string = mod.leaf(ElementType::String);
    auto void_ = mod.leaf(ElementType::Void);

    s.object = mod.create_type_ref("System", "Object", mscorlib);
    s.console = mod.create_type_ref("System", "Console", mscorlib);
    auto serializable = mod.create_type_ref("System", "SerializableAttribute", mscorlib);

    auto writeline = mod.create_member_ref("WriteLine", new (mod) model::MethodSig{+CallingConvention::Default, void_, {string}}, s.console);
    auto ctor_sig = new (mod) model::MethodSig{u8(+CallingConvention::Default | CallingConventionFlags::HasThis), void_};
    auto ctor = mod.create_member_ref(".ctor", ctor_sig, serializable);

    s.program = mod.create_type("App", "Program");
    s.program->attributes = 0x0010'2001;
    s.program->base_type = s.object;
    s.program->custom_attributes.push_back({ctor, {0x01, 0x00, 0x00, 0x00}});

    s.inner = mod.create_type("", "Inner", s.program);
    s.inner->attributes = 0x0010'0002;
    s.inner->base_type = s.object;

    s.count = mod.create_field(s.program, "count", new (mod) model::FieldSig{i4}, 0x0001);
    s.count->constant = Constant{+ElementType::I4, i32(42)};

    /// int get_Count() => count;
    auto getter_sig = new (mod) model::MethodSig{u8(+CallingConvention::Default | CallingConventionFlags::HasThis), i4};
    s.get_count = mod.create_method(s.program, "get_Count", getter_sig, 0x0886);
    auto getter = new (mod) model::CilBody{};
    getter->instructions.push_back(new (mod) model::Instruction{model::FindOpCode("ldarg.0")});
    getter->instructions.push_back(new (mod) model::Instruction{model::FindOpCode("ldfld"), static_cast<model::Row*>(s.count)});
    getter->instructions.push_back(new (mod) model::Instruction{model::FindOpCode("ret")});
    s.get_count->body = getter;

    s.program->properties.push_back({
        .name = "Count",
        .signature = new (mod) model::PropertySig{CallingConventionFlags::HasThis, i4},
        .get_method = s.get_count,
    });

    /// static void Main(string[] args), with a try/finally.
    auto args = new (mod) model::WrapperSig{ElementType::SZArray, string};
    s.main = mod.create_method(s.program, "Main", new (mod) model::MethodSig{+CallingConvention::Default, void_, {args}}, 0x0096);
    s.main->params.push_back({.name = "args", .sequence = 1});

    auto body = new (mod) model::CilBody{};
    auto local = new (mod) model::Local{i4, 0};
    body->locals.push_back(local);
    auto I = [&](std::string_view name, model::Instruction::Operand operand = {}) {
        auto op = model::FindOpCode(name);
        PMD_ASSERT(op, "Unknown opcode '{}'", name);
        auto i = new (mod) model::Instruction{op, std::move(operand)};
        body->instructions.push_back(i);
        return i;
    };

    auto try_start = I("ldstr", std::string{"Hello"});
    I("call", static_cast<model::Row*>(writeline));
    I("ldc.i4.s", i32(5));
    I("stloc.s", local);
    auto leave = I("leave.s");
    auto handler = I("nop");
    I("endfinally");
    auto ret = I("ret");
    leave->operand = ret;

    body->exception_handlers.push_back({
        .try_start = try_start,
        .try_end = handler,
        .handler_start = handler,
        .handler_end = ret,
        .handler_type = model::ExceptionHandlerType::Finally,
    });
    s.main->body = body;

    /// static T Shapes<T>(int*, ref string, method int *(int), double[4,], I2 fixed[16],
    ///                    int modreq(IsVolatile), Inner in module 1, List<T>)
    auto r8 = mod.leaf(ElementType::R8);
    auto t_param = new (mod) model::GenericSig{ElementType::MVar, 0};
    auto is_volatile = mod.create_type_ref("System.Runtime.CompilerServices", "IsVolatile", mscorlib);
    auto list = mod.create_type_ref("System.Collections.Generic", "List`1", mscorlib);
    auto callback = new (mod) model::MethodSig{+CallingConvention::Default, i4, {i4}};
    auto shapes_sig = new (mod) model::MethodSig{
        u8(+CallingConvention::Default | CallingConventionFlags::Generic),
        t_param,
        {
            new (mod) model::WrapperSig{ElementType::Ptr, i4},
            new (mod) model::WrapperSig{ElementType::ByRef, string},
            new (mod) model::FnPtrSig{callback},
            new (mod) model::ArraySig{r8, 2, {4}, {0, -1}},
            new (mod) model::ValueArraySig{mod.leaf(ElementType::I2), 16},
            new (mod) model::ModifierSig{ElementType::CModReqd, is_volatile, i4},
            new (mod) model::ModuleSig{1, new (mod) model::ClassOrValueTypeSig{ElementType::ValueType, s.inner}},
            new (mod) model::GenericInstSig{new (mod) model::ClassOrValueTypeSig{ElementType::Class, list}, {t_param}},
        },
        {},
        1,
    };
    s.shapes = mod.create_method(s.program, "Shapes", shapes_sig, 0x0096);
    s.shapes->generic_params.push_back({.name = "T", .number = 0});

    /// Calls itself as Shapes<int> and through a function pointer.
    auto shapes_body = new (mod) model::CilBody{};
    auto pinned = new (mod) model::Local{new (mod) model::WrapperSig{ElementType::Pinned, new (mod) model::WrapperSig{ElementType::ByRef, mod.leaf(ElementType::U1)}}, 0};
    shapes_body->locals.push_back(pinned);
    auto instantiation = new (mod) model::GenericInstMethodSig{{i4}};
    auto J = [&](std::string_view name, model::Instruction::Operand operand = {}) {
        auto op = model::FindOpCode(name);
        PMD_ASSERT(op, "Unknown opcode '{}'", name);
        shapes_body->instructions.push_back(new (mod) model::Instruction{op, std::move(operand)});
    };

    J("ldarg.s", model::Argument{0});
    J("ldloca.s", pinned);
    J("ldtoken", static_cast<model::Row*>(s.inner));
    J("call", static_cast<model::Row*>(new (mod) model::MethodSpec{s.shapes, instantiation}));
    J("ldnull");
    J("calli", static_cast<model::CallingConventionSig*>(callback));
    J("ret");
    s.shapes->body = shapes_body;
    return s;
}

void ModuleBasics(Test& t) {
    model::Module mod{"Sample.dll"};
    auto s = Build(mod);

    t.check(mod.types().size() == 2, "expected the global type and Program, got {} types", mod.types().size());
    t.check(mod.global_type()->name() == model::Module::GlobalTypeName, "first type is '{}'", mod.global_type()->name());
    t.check(mod.find_type("App", "Program") == s.program, "Program not found");
    t.check(mod.find_type("", "Inner") == nullptr, "nested types are not top-level");
    t.check(s.inner->full_name() == "App.Program/Inner", "nested name is '{}'", s.inner->full_name());
    t.check(s.count->declaring_type() == s.program, "field has no declaring type");

    auto asm_ref = mod.assembly_refs().front();
    t.check(asm_ref->name() == "mscorlib" and asm_ref->version() == "4.0.0.0", "assembly parsed as '{}'", asm_ref->full_name());
    t.check(asm_ref->full_name() == Mscorlib, "display name is '{}'", asm_ref->full_name());

    auto defaults = mod.create_assembly_ref_from_full_name("Lib");
    t.check(defaults->full_name() == "Lib, Version=0.0.0.0, Culture=neutral, PublicKeyToken=null", "defaults: '{}'", defaults->full_name());

    t.check(mod.leaf(ElementType::I4) == mod.leaf(ElementType::I4), "leaf signatures are not shared");
    auto sig = new (mod) model::FieldSig{mod.leaf(ElementType::I4)};
    t.check(s.program->find_field("count", sig) == s.count, "field lookup by signature failed");
    t.check(s.program->find_field("count", new (mod) model::FieldSig{mod.leaf(ElementType::I8)}) == nullptr, "field found with the wrong signature");

    t.check(model::FindOpCode("ldarg.s")->takes_argument(), "ldarg.s takes an argument");
    t.check(not model::FindOpCode("ldloc.s")->takes_argument(), "ldloc.s takes a local");
    t.check(model::FindOpCode("bogus") == nullptr, "found a bogus opcode");
}

void ReadModule(Test& t) {
    model::Module mod{"Sample.dll"};
    auto s = Build(mod);

    MetadataReader reader{mod};
    auto program = reader.add_type(s.program, Level::DefinitionWithChildren);
    if (not t.value(program)) return;

    const auto& md = reader.metadata();
    auto entity = md.types().get(*program);
    if (not t.value(entity)) return;
    const auto& def = (*entity)->definition();
    t.check(def.ns == "App" and def.name == "Program", "read as {}.{}", def.ns, def.name);
    t.check(def.base_type and def.base_type->is_token(), "base type is not a token");
    t.check(def.custom_attributes and def.custom_attributes->size() == 1, "custom attribute missing");
    t.check(def.nested_types and def.nested_types->size() == 1, "nested type missing");
    t.check(def.fields and def.fields->size() == 1, "field missing");
    t.check(def.methods and def.methods->size() == 3, "methods missing");
    t.check(def.properties and def.properties->size() == 1 and (*def.properties)[0].get_method, "property getter missing");

    if (def.base_type and def.base_type->is_token()) {
        auto base = md.types().get(def.base_type->token());
        if (t.value(base)) t.check((*base)->identity().assembly == std::string{Mscorlib}, "assembly is not the full name");
    }

    /// Reading again returns the same token and adds nothing.
    auto before = md.types().count();
    auto again = reader.add_type(s.program, Level::Definition);
    if (t.value(again)) t.check(*again == *program, "token changed from {} to {}", *program, *again);
    t.check(md.types().count() == before, "reading again added types");

    auto main = reader.add_method(s.main, Level::Definition);
    if (not t.value(main)) return;
    auto method = md.methods().get(*main);
    if (not t.value(method)) return;
    const auto& body = (*method)->definition().body;
    if (not t.check(body.has_value(), "Main has no body")) return;

    t.check(body->instructions.size() == 8, "expected 8 instructions, got {}", body->instructions.size());
    if (body->instructions.size() == 8) {
        t.check(body->instructions[1].operand.index() != 0, "call has no operand");
        t.check(std::get<i32>(body->instructions[3].operand) == 0, "stloc.s does not store to local 0");
        t.check(std::get<i32>(body->instructions[4].operand) == 7, "leave.s does not branch to instruction 7");
    }
    t.check(body->variables.size() == 1, "expected one local");
    if (t.check(body->exception_handlers.size() == 1, "exception handler missing")) {
        const auto& eh = body->exception_handlers[0];
        t.check(eh.try_start == 0 and eh.try_end == 5 and eh.handler_start == 5 and eh.handler_end == 7, "handler offsets are wrong");
        t.check(eh.handler_type == +model::ExceptionHandlerType::Finally, "handler is not a finally");
    }
}

void SignatureShapes(Test& t) {
    model::Module mod{"Sample.dll"};
    auto s = Build(mod);

    MetadataReader reader{mod};
    auto shapes = reader.add_method(s.shapes, Level::Definition);
    if (not t.value(shapes)) return;
    auto method = reader.metadata().methods().get(*shapes);
    if (not t.value(method)) return;
    const auto& def = (*method)->definition();

    /// flags, generic count, parameter count, return type and 8 parameters.
    const auto& sig = def.signature;
    if (not t.check(sig.is_calling_convention_sig() and sig.arguments().size() == 12, "signature is {}", sig)) return;
    t.check(sig.arg(0).int32() == CallingConventionFlags::Generic and sig.arg(1).int32() == 1, "generic arity lost in {}", sig);
    t.check(sig.arg(3) == ComplexType::CreateTypeSig(ElementType::MVar, {ComplexType::CreateInt32(0)}), "return type is {}", sig.arg(3));

    auto Text = [&](const ComplexType& c) -> std::string {
        auto text = c.format();
        if (not t.value(text)) return "";
        return std::move(*text);
    };

    t.check(Text(sig.arg(4)) == "Ptr(I4)", "Ptr is {}", sig.arg(4));
    t.check(Text(sig.arg(5)) == "ByRef(String)", "ByRef is {}", sig.arg(5));
    t.check(Text(sig.arg(6)) == "FnPtr(Default(Int32(0),Int32(1),I4,I4))", "FnPtr is {}", sig.arg(6));
    t.check(Text(sig.arg(7)) == "Array(R8,Int32(2),Int32(1),Int32(4),Int32(2),Int32(0),Int32(-1))", "Array is {}", sig.arg(7));
    t.check(Text(sig.arg(8)) == "ValueArray(I2,Int32(16))", "ValueArray is {}", sig.arg(8));
    t.check(sig.arg(9).is(ElementType::CModReqd) and sig.arg(9).arg(0).is_token(), "CModReqd is {}", sig.arg(9));
    t.check(sig.arg(10).is(ElementType::Module) and sig.arg(10).arg(0).int32() == 1, "Module is {}", sig.arg(10));
    t.check(sig.arg(11).is(ElementType::GenericInst) and sig.arg(11).arguments().size() == 3, "GenericInst is {}", sig.arg(11));

    /// The whole tree survives its text form.
    auto text = Text(sig);
    auto parsed = ComplexType::Parse(text);
    if (t.value(parsed)) t.check(*parsed == sig, "'{}' changed after reparsing", text);

    if (not t.check(def.body.has_value(), "Shapes has no body")) return;
    const auto& body = *def.body;
    t.check(body.variables.size() == 1 and Text(body.variables[0]) == "Pinned(ByRef(U1))", "pinned local lost");
    if (not t.check(body.instructions.size() == 7, "expected 7 instructions, got {}", body.instructions.size())) return;

    t.check(std::get<i32>(body.instructions[0].operand) == 0, "ldarg.s does not load argument 0");
    auto Operand = [&](usz i) -> const ComplexType* { return std::get_if<ComplexType>(&body.instructions[i].operand); };
    auto token = Operand(2);
    t.check(token and token->kind() == ComplexType::Kind::InlineType, "ldtoken operand is not a type");
    auto spec = Operand(3);
    if (t.check(spec and spec->kind() == ComplexType::Kind::InlineMethod, "call operand is not a method")) {
        const auto& inner = spec->arg(0);
        t.check(inner.kind() == ComplexType::Kind::MethodSpec and inner.arg(0).token() == *shapes, "call is not Shapes<int>");
        t.check(Text(inner.arg(1)) == "GenericInstCC(Int32(0),Int32(1),I4)", "instantiation is {}", inner.arg(1));
    }
    auto standalone = Operand(5);
    t.check(standalone and Text(*standalone) == "Default(Int32(0),Int32(1),I4,I4)", "calli signature lost");
}

void OptionsAffectReading(Test& t) {
    model::Module mod{"Sample.dll"};
    auto s = Build(mod);

    MetadataReader reader{mod, Options::UseNamedToken};
    auto program = reader.add_type(s.program, Level::DefinitionWithChildren);
    if (not t.value(program)) return;
    t.check(program->is_named() and program->name() == "Program", "named token is '{}'", *program);

    const auto& md = reader.metadata();
    auto entity = md.types().get(*program);
    if (not t.value(entity)) return;
    const auto& def = (*entity)->definition();
    t.check(not def.custom_attributes.has_value(), "custom attributes were read");

    auto base = md.types().get(def.base_type->token());
    if (t.value(base)) t.check((*base)->identity().assembly == "mscorlib", "assembly is '{}'", (*base)->identity().assembly.value_or(""));

    auto main_name = Token::Named("Program::Main");
    if (not t.value(main_name)) return;
    auto main = md.methods().get(*main_name);
    if (t.value(main)) t.check(not (*main)->definition().body.has_value(), "method body was read");
}

void ReaderErrors(Test& t) {
    model::Module mod{"Sample.dll"};
    auto s = Build(mod);
    model::Module other{"Other.dll"};
    auto stranger = other.create_type("Other", "Stranger");

    MetadataReader reader{mod};
    t.error(reader.add_type(nullptr, Level::Reference), ErrorId::InvalidArgument);
    t.error(reader.add_type(stranger, Level::Reference), ErrorId::InvalidArgument);
    t.error(reader.add_type(s.program, Level(7)), ErrorId::InvalidArgument);
    t.error(reader.add_field(s.count, Level::DefinitionWithChildren), ErrorId::InvalidArgument);
    t.error(reader.add_method(nullptr, Level::Definition), ErrorId::InvalidArgument);

    /// Types of other modules of the same assembly.
    auto module_ref = mod.create_module_ref("Other.dll");
    auto foreign = mod.create_type("App", "Foreign");
    foreign->base_type = mod.create_type_ref("Other", "Base", module_ref);
    t.error(reader.add_type(foreign, Level::Definition), ErrorId::Unsupported);

    /// Vararg call sites.
    auto void_ = mod.leaf(ElementType::Void);
    auto varargs = mod.create_method(s.program, "Log", new (mod) model::MethodSig{+CallingConvention::VarArg, void_}, 0x0016);
    auto call_site = mod.create_member_ref(
        "Log",
        new (mod) model::MethodSig{+CallingConvention::VarArg, void_, {}, {mod.leaf(ElementType::I4)}},
        varargs
    );
    auto caller = mod.create_method(s.program, "CallLog", new (mod) model::MethodSig{+CallingConvention::Default, void_}, 0x0016);
    auto body = new (mod) model::CilBody{};
    body->instructions.push_back(new (mod) model::Instruction{model::FindOpCode("ldc.i4.0")});
    body->instructions.push_back(new (mod) model::Instruction{model::FindOpCode("call"), static_cast<model::Row*>(call_site)});
    body->instructions.push_back(new (mod) model::Instruction{model::FindOpCode("ret")});
    caller->body = body;
    t.error(reader.add_method(caller, Level::Definition), ErrorId::Unsupported);
}

void RoundTrip(Test& t) {
    model::Module first{"First.dll"};
    Build(first);

    MetadataReader reader{first};
    auto tokens = reader.add_types(first.types(), Level::DefinitionWithChildren);
    if (not t.value(tokens)) return;
    auto md = reader.release();

    auto text = serialise::ToJson(md, {.compact = true});
    if (not t.value(text)) return;
    auto back = serialise::FromJson(*text);
    if (not t.value(back)) return;

    model::Module second{"Second.dll"};
    MetadataWriter writer{second, *back};
    auto rows = writer.add_types(*tokens, Level::DefinitionWithChildren);
    if (not t.value(rows)) return;

    std::vector<model::TypeDef*> types{};
    for (auto row : *rows) {
        auto td = cast<model::TypeDef>(row);
        if (not t.check(td != nullptr, "wrote a {} instead of a type definition", row->kind())) return;
        types.push_back(td);
    }

    t.check(types.front() == second.global_type(), "global type was not reused");
    t.check(second.types().size() == 2, "expected 2 top-level types, got {}", second.types().size());
    t.check(second.assembly_refs().size() == 1, "expected 1 assembly reference, got {}", second.assembly_refs().size());

    auto program = second.find_type("App", "Program");
    if (t.check(program != nullptr, "Program was not written")) {
        t.check(program->nested_types.size() == 1, "nested type missing");
        t.check(program->methods.size() == 3 and program->methods[1]->name() == "Main", "methods are out of order");
        t.check(program->methods.size() == 3 and program->methods[1]->body != nullptr, "Main has no body");
        t.check(program->properties.size() == 1 and program->properties[0].get_method == program->methods[0], "getter was not linked");
    }

    MetadataReader again{second};
    auto tokens_again = again.add_types(types, Level::DefinitionWithChildren);
    if (not t.value(tokens_again)) return;
    t.check(*tokens == *tokens_again, "top-level types got different tokens");
    pmdtest::SameMetadata(t, md, again.metadata());
}

auto ReferenceTo(std::string ns, std::string name, std::optional<std::string> assembly) -> Type {
    TypeRef ref{};
    ref.ns = std::move(ns);
    ref.name = std::move(name);
    ref.assembly = std::move(assembly);
    return Type{std::move(ref)};
}

auto DefinitionOf(std::string ns, std::string name, std::optional<std::string> assembly = std::nullopt) -> Type {
    TypeDef def{};
    def.ns = std::move(ns);
    def.name = std::move(name);
    def.assembly = std::move(assembly);
    def.attributes = 0x0010'0001;
    return Type{std::move(def)};
}

void WriterIdempotence(Test& t) {
    Metadata md{};
    model::Module mod{"Out.dll"};
    MetadataWriter writer{mod, md};

    auto a = writer.add_type(DefinitionOf("App", "Widget"), Level::Definition);
    auto b = writer.add_type(DefinitionOf("App", "Widget"), Level::Definition);
    if (not t.value(a) or not t.value(b)) return;
    t.check(*a == *b, "second write returned a different row");
    t.check(mod.types().size() == 2, "expected the global type and Widget, got {} types", mod.types().size());

    auto td = cast<model::TypeDef>(*a);
    if (t.check(td != nullptr, "Widget is not a type definition")) t.check(td->attributes == 0x0010'0001, "attributes not written");

    auto ref = writer.add_type(ReferenceTo("System", "Object", "mscorlib"), Level::Reference);
    auto ref2 = writer.add_type(ReferenceTo("System", "Object", "mscorlib"), Level::Reference);
    if (t.value(ref) and t.value(ref2)) t.check(*ref == *ref2 and is<model::TypeRef>(*ref), "type reference was not reused");
    t.check(mod.type_refs().size() == 1 and mod.assembly_refs().size() == 1, "references were duplicated");

    auto global = writer.add_type(ReferenceTo("", "<Module>", std::nullopt), Level::Reference);
    if (t.value(global)) t.check(*global == mod.global_type(), "<Module> is not the global type");
}

void WriterErrors(Test& t) {
    Metadata md{};
    model::Module mod{"Out.dll"};
    MetadataWriter writer{mod, md};

    t.error(writer.add_type(ReferenceTo("App", "Widget", std::nullopt), Level::Definition), ErrorId::InvalidOperation);
    t.error(writer.add_type(DefinitionOf("System", "Object", "mscorlib"), Level::Definition), ErrorId::InvalidOperation);
    t.error(writer.add_type(DefinitionOf("App", "Widget"), Level(3)), ErrorId::InvalidArgument);
    t.error(writer.add_type(Token{0}, Level::Reference), ErrorId::InvalidArgument);

    /// A body with an opcode that does not exist.
    MethodDef bad{};
    bad.name = "Bad";
    bad.type = ComplexType::CreateToken(Token{0});
    bad.signature = ComplexType::CreateCallingConventionSig(
        CallingConvention::Default,
        {ComplexType::CreateInt32(0), ComplexType::CreateInt32(0), ComplexType::CreateTypeSig(ElementType::Void)}
    );
    bad.body = MethodBody{};
    bad.body->instructions.push_back({"frobnicate", {}});

    Metadata with_type{};
    auto added = with_type.types().add(0, DefinitionOf("App", "Widget"));
    if (not t.value(added)) return;
    model::Module mod2{"Out2.dll"};
    MetadataWriter writer2{mod2, with_type};
    t.error(writer2.add_method(Method{bad}, Level::Definition), ErrorId::InvalidData);

    /// Field signatures have no flags to carry.
    FieldDef flagged{};
    flagged.name = "flagged";
    flagged.type = ComplexType::CreateToken(Token{0});
    flagged.signature = ComplexType::CreateCallingConventionSig(
        CallingConvention::Field,
        {ComplexType::CreateInt32(CallingConventionFlags::HasThis), ComplexType::CreateTypeSig(ElementType::I4)}
    );

    model::Module mod3{"Out3.dll"};
    MetadataWriter writer3{mod3, with_type};
    t.error(writer3.add_field(Field{flagged}, Level::Definition), ErrorId::InvalidData);

    flagged.signature = ComplexType::CreateCallingConventionSig(
        CallingConvention::Field,
        {ComplexType::CreateInt32(0), ComplexType::CreateTypeSig(ElementType::I4)}
    );
    auto field = writer3.add_field(Field{flagged}, Level::Definition);
    if (t.value(field)) {
        auto fd = cast<model::FieldDef>(*field);
        t.check(fd and fd->signature()->flags() == 0, "field signature has flags");
    }
}

void ResolutionHooks(Test& t) {
    Metadata md{};
    model::Module mod{"Out.dll"};
    auto preset = mod.create_assembly_ref("System.Runtime");
    auto widget = mod.create_type("Vendor", "Widget");

    MetadataWriter writer{mod, md};
    int assembly_calls = 0;
    writer.assembly_resolving = [&](std::string_view name) -> model::AssemblyRef* {
        assembly_calls++;
        return name == "netstandard" ? preset : nullptr;
    };
    writer.type_resolving = [&](model::AssemblyRef* assembly, const TypeRef& type) -> model::TypeDefOrRef* {
        if (not assembly and type.name == "Gadget") return widget;
        if (not assembly and type.name == "Broken") return mod.create_type_ref("X", "Broken", preset);
        return nullptr;
    };

    auto object = writer.add_type(ReferenceTo("System", "Object", "netstandard"), Level::Reference);
    if (t.value(object)) {
        auto tr = cast<model::TypeRef>(*object);
        t.check(tr and tr->scope() == preset, "assembly hook was not used");
    }

    auto string = writer.add_type(ReferenceTo("System", "String", "netstandard"), Level::Reference);
    if (t.value(string)) t.check(assembly_calls == 1, "assembly hook called {} times", assembly_calls);

    auto gadget = writer.add_type(ReferenceTo("App", "Gadget", std::nullopt), Level::Reference);
    if (t.value(gadget)) t.check(*gadget == widget, "type hook was not used");

    t.error(writer.add_type(ReferenceTo("App", "Broken", std::nullopt), Level::Reference), ErrorId::InvalidOperation);
}
} // namespace

int main() {
    pmdtest::TestContext ctx{};
    ctx.run("Module basics", ModuleBasics);
    ctx.run("Read module", ReadModule);
    ctx.run("Signature shapes", SignatureShapes);
    ctx.run("Options affect reading", OptionsAffectReading);
    ctx.run("Reader errors", ReaderErrors);
    ctx.run("Module round trip", RoundTrip);
    ctx.run("Writer idempotence", WriterIdempotence);
    ctx.run("Writer errors", WriterErrors);
    ctx.run("Resolution hooks", ResolutionHooks);
    return ctx.finish();
}
