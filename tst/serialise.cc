#include <pmd/json.hh>
#include <pmd/serialise.hh>
#include <pmd/updater.hh>

#include <pmdtest/pmdtest.hh>

#include <bit>

using namespace pmd;
using pmdtest::Test;

namespace {
void ParseJson(Test& t) {
    auto doc = json::Parse(R"({"a": [1, -2, true, null], "b": "x\"\u00e9\ud83d\ude00", "c": {}})");
    if (not t.value(doc)) return;

    auto root = doc->as_object();
    if (not t.check(root != nullptr, "expected an object, got {}", doc->type_name())) return;

    auto a = root->find("a");
    t.check(a and a->as_array() and a->as_array()->elements.size() == 4, "wrong array");
    if (a and a->as_array() and a->as_array()->elements.size() == 4) {
        const auto& e = a->as_array()->elements;
        t.check(e[0].as_int() and *e[0].as_int() == 1, "element 0");
        t.check(e[1].as_int() and *e[1].as_int() == -2, "element 1");
        t.check(e[2].as_bool() and *e[2].as_bool(), "element 2");
        t.check(e[3].is_null(), "element 3");
    }

    auto b = root->find("b");
    t.check(b and b->as_string() and *b->as_string() == "x\"\xC3\xA9\xF0\x9F\x98\x80", "escapes were not decoded");
    t.check(root->find("c") and root->find("c")->as_object(), "empty object");
    t.check(root->find("d") == nullptr, "found a member that does not exist");
}

void EmitJson(Test& t) {
    json::Object o{};
    o.add("s", "a\nb");
    o.add("i", i64(-9'000'000'000));
    json::Array a{};
    a.add(true);
    a.add(nullptr);
    o.add("a", std::move(a));
    json::Value v{std::move(o)};

    auto compact = v.emit();
    t.check(compact == R"({"s":"a\nb","i":-9000000000,"a":[true,null]})", "compact output: {}", compact);

    auto pretty = v.emit(true);
    auto reparsed = json::Parse(pretty);
    if (t.value(reparsed)) t.check(reparsed->emit() == compact, "pretty output does not reparse to the same value");
}

void BadJson(Test& t) {
    t.error(json::Parse(""), ErrorId::InvalidData);
    t.error(json::Parse("1.5"), ErrorId::InvalidData);
    t.error(json::Parse("[1,]"), ErrorId::InvalidData);
    t.error(json::Parse(R"({"a":1,"a":2})"), ErrorId::InvalidData);
    t.error(json::Parse(R"("\ud800")"), ErrorId::InvalidData);
    t.error(json::Parse("[] []"), ErrorId::InvalidData);
    t.error(json::Parse(std::string(1000, '[')), ErrorId::InvalidData);
}

auto Sample(Options options) -> Metadata {
    Metadata md{options};
    Updater updater{md};
    auto Must = [](auto res) {
        if (res.is_diag()) Diag::ICE("Failed to build sample metadata: {}", res.diag().text());
        return *res;
    };

    TypeRef object{};
    object.name = "Object";
    object.ns = "System";
    object.assembly = "System.Runtime, Version=8.0.0.0, Culture=neutral, PublicKeyToken=b03f5f7f11d50a3a";
    auto object_token = Must(updater.update(Type{object}, Level::Reference)).token;

    TypeDef program{};
    program.name = "Program";
    program.ns = "App";
    program.attributes = 0x00100000;
    program.base_type = ComplexType::CreateTypeSig(ElementType::Class, {ComplexType::CreateToken(object_token)});
    program.generic_parameters = std::vector<GenericParameter>{{"T", 0, 0, std::vector<ComplexType>{}}};
    program.fields = std::vector<Token>{};
    program.methods = std::vector<Token>{};
    auto program_token = Must(updater.update(Type{TypeRef(program)}, Level::Reference)).token;

    FieldDef nan{};
    nan.name = "Nan";
    nan.type = ComplexType::CreateToken(program_token);
    nan.signature = ComplexType::CreateCallingConventionSig(CallingConvention::Field, {ComplexType::CreateInt32(0), ComplexType::CreateTypeSig(ElementType::R4)});
    nan.attributes = 0x8056;
    nan.constant = Constant{+ElementType::R4, std::bit_cast<f32>(u32(0x7FC0'1234))};
    auto nan_token = Must(updater.update(Field{nan}, Level::Definition)).token;

    MethodDef main{};
    main.name = "Main";
    main.type = ComplexType::CreateToken(program_token);
    main.signature = ComplexType::CreateCallingConventionSig(
        CallingConvention::Default,
        {ComplexType::CreateInt32(0), ComplexType::CreateInt32(1), ComplexType::CreateTypeSig(ElementType::Void), ComplexType::CreateTypeSig(ElementType::String)}
    );
    main.attributes = 0x0096;
    main.parameters.push_back(Parameter{"args", 1, 0, std::nullopt, std::nullopt});
    main.custom_attributes = std::vector<CustomAttribute>{};

    MethodBody body{};
    body.max_stack = 8;
    body.init_locals = true;
    body.variables.push_back(ComplexType::CreateTypeSig(ElementType::R8));
    body.instructions.push_back({"ldc.r8", std::bit_cast<f64>(u64(0x7FF8'0000'0000'1234))});
    body.instructions.push_back({"stloc.0", {}});
    body.instructions.push_back({"ldstr", std::string{"hello \"world\""}});
    body.instructions.push_back({"pop", {}});
    body.instructions.push_back({"ldc.i8", i64(-1)});
    body.instructions.push_back({"switch", std::vector<i32>{0, 7}});
    body.instructions.push_back({"ldsfld", *ComplexType::CreateInlineTokenOperand(ComplexType::Kind::InlineField, ComplexType::CreateToken(nan_token))});
    body.instructions.push_back({"ret", {}});
    ExceptionHandler eh{};
    eh.try_start = 0;
    eh.try_end = 2;
    eh.handler_start = 2;
    eh.handler_end = 4;
    eh.catch_type = ComplexType::CreateToken(object_token);
    body.exception_handlers.push_back(eh);
    main.body = std::move(body);
    auto main_token = Must(updater.update(Method{main}, Level::Definition)).token;

    program.fields->push_back(nan_token);
    program.methods->push_back(main_token);
    Must(updater.update(Type{program}, Level::DefinitionWithChildren));
    return md;
}

void RoundTrip(Test& t) {
    for (auto named : {false, true}) {
        auto options = Options::All;
        if (not named) options = Options::UseAssemblyFullName | Options::IncludeMethodBodies | Options::IncludeCustomAttributes;

        for (auto compact : {false, true}) {
            auto md = Sample(options);
            auto text = serialise::ToJson(md, {.compact = compact, .pretty = not compact});
            if (not t.value(text)) continue;

            auto back = serialise::FromJson(*text);
            if (not t.value(back)) continue;
            if (not pmdtest::SameMetadata(t, md, *back))
                fmt::print("While round-tripping {} {} JSON\n", named ? "named" : "indexed", compact ? "compact" : "structured");
        }
    }
}

void NanFidelity(Test& t) {
    auto md = Sample(DefaultOptions);
    auto text = serialise::ToJson(md);
    if (not t.value(text)) return;
    auto back = serialise::FromJson(*text);
    if (not t.value(back)) return;

    auto field = back->fields().get(0);
    if (t.value(field)) {
        const auto& c = (*field)->definition().constant;
        auto bits = c ? std::bit_cast<u32>(std::get<f32>(c->value)) : 0;
        t.check(bits == 0x7FC0'1234, "float constant changed to {:#x}", bits);
    }

    auto method = back->methods().get(0);
    if (t.value(method)) {
        const auto& op = (*method)->definition().body->instructions[0].operand;
        auto bits = std::bit_cast<u64>(std::get<f64>(op));
        t.check(bits == 0x7FF8'0000'0000'1234, "double operand changed to {:#x}", bits);
    }
}

void CompactEncoding(Test& t) {
    auto md = Sample(DefaultOptions);
    auto text = serialise::ToJson(md, {.compact = true});
    if (not t.value(text)) return;

    /// Complex types are strings in compact mode.
    t.check(text->find(R"x("Class(0)")x") != std::string::npos, "compact text has no signature string: {}", *text);

    auto structured = serialise::ToJson(md);
    if (t.value(structured)) t.check(structured->find(R"x("Class(0)")x") == std::string::npos, "structured text has a signature string");
}

void BadDocuments(Test& t) {
    t.error(serialise::FromJson("[]"), ErrorId::InvalidData);
    t.error(serialise::FromJson(R"({"Options": 0})"), ErrorId::InvalidData);
    t.error(serialise::FromJson(R"({"Options": 99, "Types": {}, "Fields": {}, "Methods": {}})"), ErrorId::InvalidData);

    /// Every section must be present, even when empty.
    t.error(serialise::FromJson(R"({"Options": 0, "Types": {}, "Fields": {}})"), ErrorId::InvalidData);
    t.error(serialise::FromJson(R"({"Options": 0, "Fields": {}, "Methods": {}})"), ErrorId::InvalidData);
    auto empty = serialise::FromJson(R"({"Options": 0, "Types": {}, "Fields": {}, "Methods": {}})");
    if (t.value(empty)) t.check(empty->types().count() == 0, "empty document has types");

    auto md = Sample(DefaultOptions);
    auto text = serialise::ToJson(md, {.compact = true});
    if (not t.value(text)) return;

    /// A signature that does not parse.
    auto broken = *text;
    auto pos = broken.find(R"x("Class(0)")x");
    if (not t.check(pos != std::string::npos, "no signature to break")) return;
    broken.replace(pos, 10, R"x("Class(0")x");
    t.error(serialise::FromJson(broken), ErrorId::InvalidData);

    /// Structured signatures are held to the same shapes.
    auto structured = serialise::ToJson(md);
    if (not t.value(structured)) return;
    constexpr std::string_view r4 = R"({"Kind":1,"Type":12})";
    pos = structured->find(r4);
    if (not t.check(pos != std::string::npos, "no R4 signature in {}", *structured)) return;
    auto pointer = *structured;
    pointer.replace(pos, r4.size(), R"({"Kind":1,"Type":15})");
    t.error(serialise::FromJson(pointer), ErrorId::InvalidData);
}
} // namespace

int main() {
    pmdtest::TestContext ctx{};
    ctx.run("Parse JSON", ParseJson);
    ctx.run("Emit JSON", EmitJson);
    ctx.run("Malformed JSON", BadJson);
    ctx.run("Metadata round trip", RoundTrip);
    ctx.run("NaN fidelity", NanFidelity);
    ctx.run("Compact encoding", CompactEncoding);
    ctx.run("Malformed documents", BadDocuments);
    return ctx.finish();
}
