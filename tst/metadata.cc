#include <pmd/comparer.hh>
#include <pmd/facade.hh>
#include <pmd/metadata.hh>
#include <pmd/updater.hh>

#include <pmdtest/pmdtest.hh>

#include <bit>

using namespace pmd;
using pmdtest::Test;

namespace {
auto MakeTypeRef(std::string ns, std::string name, std::optional<std::string> assembly = std::nullopt) -> TypeRef {
    TypeRef t{};
    t.name = std::move(name);
    t.ns = std::move(ns);
    t.assembly = std::move(assembly);
    return t;
}

auto MakeTypeDef(std::string ns, std::string name) -> TypeDef {
    TypeDef t{};
    t.name = std::move(name);
    t.ns = std::move(ns);
    t.attributes = 0x00100001;
    t.base_type = ComplexType::CreateTypeSig(ElementType::Object);
    return t;
}

auto WriteLine(Token declaring_type, ElementType param) -> MethodRef {
    MethodRef m{};
    m.name = "WriteLine";
    m.type = ComplexType::CreateToken(std::move(declaring_type));
    m.signature = ComplexType::CreateCallingConventionSig(
        CallingConvention::Default,
        {
            ComplexType::CreateInt32(0),
            ComplexType::CreateInt32(1),
            ComplexType::CreateTypeSig(ElementType::Void),
            ComplexType::CreateTypeSig(param),
        }
    );
    return m;
}

void IndexedTokenMaps(Test& t) {
    Metadata md{};
    t.check(not md.use_named_tokens(), "default options should use indexed tokens");

    auto& types = md.types();
    auto added = types.add(0, Type{MakeTypeRef("System", "Object", "mscorlib")});
    t.value(added);
    t.check(types.count() == 1, "expected 1 type, got {}", types.count());

    t.error(types.add(0, Type{MakeTypeRef("System", "String")}), ErrorId::InvalidArgument);
    t.error(types.add(5, Type{MakeTypeRef("System", "String")}), ErrorId::InvalidArgument);
    t.error(types.add(*Token::Named("String"), Type{MakeTypeRef("System", "String")}), ErrorId::InvalidArgument);
    t.error(types.get(1), ErrorId::InvalidArgument);

    auto res = types.get(0);
    if (t.value(res)) t.check((*res)->name() == "Object", "wrong entity under token 0");

    /// Replacing keeps the position.
    auto set = types.set(0, Type{MakeTypeDef("System", "Object")});
    t.value(set);
    if (auto again = types.get(0); t.value(again)) t.check((*again)->is_definition(), "entry was not replaced");
}

void NamedTokenMaps(Test& t) {
    Metadata md{Options::UseNamedToken};
    auto& fields = md.fields();

    FieldRef f{};
    f.name = "x";
    auto a = Token::Named("A::x");
    auto b = Token::Named("A::y");
    if (not t.value(a) or not t.value(b)) return;

    auto add_a = fields.add(*a, Field{f});
    t.value(add_a);
    f.name = "y";
    auto add_b = fields.add(*b, Field{f});
    t.value(add_b);

    t.error(fields.add(*a, Field{f}), ErrorId::InvalidArgument);
    t.error(fields.add(7, Field{f}), ErrorId::InvalidArgument);
    t.check(fields.contains(*b) and not fields.contains(0), "lookup by name");

    /// Iteration is in insertion order.
    std::vector<std::string> order{};
    for (const auto& [token, field] : fields) order.push_back(token.name());
    t.check(order == std::vector<std::string>{"A::x", "A::y"}, "fields are not in insertion order");
}

/// A reference that is later defined with children keeps its token.
void UpgradeReference(Test& t) {
    Metadata md{};
    Updater updater{md};

    auto ref = updater.update(Type{MakeTypeRef("Bar", "Foo")}, Level::Reference);
    if (not t.value(ref)) return;
    t.check(ref->token == Token{0}, "expected token 0, got {}", ref->token);
    t.check(ref->old_level == Level::Reference, "a new entity reports the requested level");

    auto def = MakeTypeDef("Bar", "Foo");
    def.fields = std::vector<Token>{};
    def.methods = std::vector<Token>{};
    auto up = updater.update(Type{def}, Level::DefinitionWithChildren);
    if (not t.value(up)) return;
    t.check(up->token == Token{0}, "token changed to {}", up->token);
    t.check(up->old_level == Level::Reference, "expected old level Reference, got {}", up->old_level);
    t.check(md.types().count() == 1, "upgrade added an entity");

    auto stored = md.types().get(0);
    if (t.value(stored)) t.check(EqualityComparer::Full().equals(**stored, Type{def}), "stored value is not the definition");

    /// Registering again at a lower level changes nothing.
    auto again = updater.update(Type{MakeTypeRef("Bar", "Foo")}, Level::Reference);
    if (t.value(again)) {
        t.check(again->old_level == Level::DefinitionWithChildren, "level was lowered to {}", again->old_level);
        if (auto s = md.types().get(0); t.value(s)) t.check((*s)->is_definition(), "definition was replaced by a reference");
    }
}

void NamedMemberTokens(Test& t) {
    Metadata md{Options::UseNamedToken};
    Updater updater{md};

    auto a = updater.update(Type{MakeTypeRef("", "TypeA")}, Level::Reference);
    auto b = updater.update(Type{MakeTypeRef("", "TypeB")}, Level::Reference);
    if (not t.value(a) or not t.value(b)) return;

    auto m1 = updater.update(Method{WriteLine(a->token, ElementType::String)}, Level::Reference);
    auto m2 = updater.update(Method{WriteLine(b->token, ElementType::String)}, Level::Reference);
    auto m3 = updater.update(Method{WriteLine(a->token, ElementType::I4)}, Level::Reference);
    if (not t.value(m1) or not t.value(m2) or not t.value(m3)) return;

    t.check(m1->token.string() == "TypeA::WriteLine", "got {}", m1->token);
    t.check(m2->token.string() == "TypeB::WriteLine", "got {}", m2->token);
    t.check(m3->token.string() == "TypeA::WriteLine_2", "got {}", m3->token);

    /// Same identity, same token.
    auto dup = updater.update(Method{WriteLine(a->token, ElementType::I4)}, Level::Reference);
    if (t.value(dup)) t.check(dup->token == m3->token, "duplicate got a new token {}", dup->token);
    t.check(md.methods().count() == 3, "expected 3 methods, got {}", md.methods().count());
}

void NamedTypeTokens(Test& t) {
    Metadata md{Options::UseNamedToken};
    Updater updater{md};

    auto x = updater.update(Type{MakeTypeRef("A", "List`1")}, Level::Reference);
    auto y = updater.update(Type{MakeTypeRef("B", "List`1")}, Level::Reference);
    auto z = updater.update(Type{MakeTypeRef("C", "Odd(Name)")}, Level::Reference);
    if (not t.value(x) or not t.value(y) or not t.value(z)) return;

    t.check(x->token.string() == "List`1", "got {}", x->token);
    t.check(y->token.string() == "List`1_2", "got {}", y->token);
    t.check(z->token.string() == "Odd_Name_", "got {}", z->token);
}

void GenericDeclaringType(Test& t) {
    Metadata md{Options::UseNamedToken};
    Updater updater{md};

    auto list = updater.update(Type{MakeTypeRef("System.Collections.Generic", "List`1", "mscorlib")}, Level::Reference);
    if (not t.value(list)) return;

    FieldRef f{};
    f.name = "_items";
    f.type = ComplexType::CreateTypeSig(
        ElementType::GenericInst,
        {
            ComplexType::CreateTypeSig(ElementType::Class, {ComplexType::CreateToken(list->token)}),
            ComplexType::CreateInt32(1),
            ComplexType::CreateTypeSig(ElementType::I4),
        }
    );
    f.signature = ComplexType::CreateCallingConventionSig(CallingConvention::Field, {ComplexType::CreateInt32(0), ComplexType::CreateTypeSig(ElementType::I4)});

    auto res = updater.update(Field{f}, Level::Reference);
    if (t.value(res)) t.check(res->token.string() == "List`1<?>::_items", "got {}", res->token);

    f.type = ComplexType::CreateTypeSig(ElementType::I4);
    t.error(updater.update(Field{f}, Level::Reference), ErrorId::InvalidArgument);
}

void InvalidLevels(Test& t) {
    Metadata md{};
    Updater updater{md};

    t.error(updater.update(Type{MakeTypeRef("", "T")}, Level::Definition), ErrorId::InvalidArgument);

    FieldDef f{};
    f.name = "f";
    t.error(updater.update(Field{f}, Level::DefinitionWithChildren), ErrorId::InvalidArgument);

    MethodDef m{};
    m.name = "m";
    t.error(updater.update(Method{m}, Level::DefinitionWithChildren), ErrorId::InvalidArgument);
    t.check(md.fields().count() == 0 and md.methods().count() == 0, "failed updates added entities");
}

void SeededUpdater(Test& t) {
    Metadata md{};
    auto add = md.types().add(0, Type{MakeTypeDef("N", "Known")});
    if (not t.value(add)) return;

    Updater updater{md};
    auto res = updater.update(Type{MakeTypeRef("N", "Known")}, Level::Reference);
    if (not t.value(res)) return;
    t.check(res->token == Token{0}, "existing entity got a new token {}", res->token);
    t.check(res->old_level == Level::Definition, "expected Definition, got {}", res->old_level);
}

void Comparers(Test& t) {
    auto ref = MakeTypeRef("N", "T");
    auto def = MakeTypeDef("N", "T");
    const auto& reference = EqualityComparer::Reference();
    const auto& full = EqualityComparer::Full();

    t.check(reference.equals(Type{ref}, Type{def}), "reference comparer should ignore definition data");
    t.check(not full.equals(Type{ref}, Type{def}), "full comparer should tell a reference from a definition");
    t.check(reference.hash(ref) == reference.hash(TypeRef(def)), "hash depends on definition data");

    /// Absent and empty lists.
    auto a = ref;
    auto b = ref;
    b.enclosing_names = std::vector<std::string>{};
    t.check(reference.equals(a, b), "reference comparer should treat an absent list as empty");
    t.check(not full.equals(a, b), "full comparer should tell an absent list from an empty one");

    auto d1 = def;
    auto d2 = def;
    d2.attributes = 0;
    t.check(reference.equals(Type{d1}, Type{d2}) and not full.equals(Type{d1}, Type{d2}), "attributes comparison");

    auto other = MakeTypeRef("N", "T", "mscorlib");
    t.check(not reference.equals(ref, other), "assembly is part of the identity");

    /// Floats compare by bits, so a NaN equals itself.
    Instruction i1{"ldc.r8", std::bit_cast<f64>(u64(0x7FF8'0000'0000'1234))};
    Instruction i2 = i1;
    MethodDef m1{};
    m1.name = "M";
    m1.body = MethodBody{};
    m1.body->instructions.push_back(i1);
    auto m2 = m1;
    m2.body->instructions[0] = i2;
    t.check(full.equals(Method{m1}, Method{m2}), "NaN operands should compare equal");

    m2.body->instructions[0].operand = std::bit_cast<f64>(u64(0x7FF8'0000'0000'0001));
    t.check(not full.equals(Method{m1}, Method{m2}), "different NaN payloads should differ");
}

auto SampleMetadata(Options options) -> Metadata {
    Metadata md{options};
    Updater updater{md};

    auto object = updater.update(Type{MakeTypeRef("System", "Object", "mscorlib")}, Level::Reference);
    auto def = MakeTypeDef("App", "Program");
    def.fields = std::vector<Token>{};
    auto program = updater.update(Type{def}, Level::DefinitionWithChildren);
    auto console = updater.update(Type{MakeTypeRef("System", "Console", "mscorlib")}, Level::Reference);
    if (object.is_diag() or program.is_diag() or console.is_diag()) Diag::ICE("Failed to build sample metadata");

    auto m = updater.update(Method{WriteLine(console->token, ElementType::String)}, Level::Reference);
    if (m.is_diag()) Diag::ICE("Failed to build sample metadata");
    return md;
}

void FacadeRoundTrip(Test& t) {
    for (auto options : {DefaultOptions, DefaultOptions | Options::UseNamedToken}) {
        auto md = SampleMetadata(options);
        auto facade = Facade::FromMetadata(md);

        t.check(facade.options == options, "options were not carried over");
        t.check(facade.types.references.size() == 2 and facade.types.definitions.size() == 1, "types were not split");

        /// Reference, definition, reference: two switches.
        if (HasFlag(options, Options::UseNamedToken))
            t.check(facade.types.orders == std::vector<i32>{1, 2}, "wrong orders");
        else
            t.check(facade.types.orders.empty(), "indexed facades have no orders");

        auto back = facade.to_metadata();
        if (t.value(back)) pmdtest::SameMetadata(t, md, *back);
    }
}

void FacadeBadOrders(Test& t) {
    auto md = SampleMetadata(DefaultOptions | Options::UseNamedToken);
    auto facade = Facade::FromMetadata(md);
    facade.types.orders = {0};
    t.error(facade.to_metadata(), ErrorId::InvalidData);

    auto indexed = Facade::FromMetadata(SampleMetadata(DefaultOptions));
    indexed.methods.references = {};
    indexed.methods.definitions.add("1", MethodDef{});
    t.error(indexed.to_metadata(), ErrorId::InvalidData);
}
} // namespace

int main() {
    pmdtest::TestContext ctx{};
    ctx.run("Indexed token maps", IndexedTokenMaps);
    ctx.run("Named token maps", NamedTokenMaps);
    ctx.run("Upgrade a reference", UpgradeReference);
    ctx.run("Named member tokens", NamedMemberTokens);
    ctx.run("Named type tokens", NamedTypeTokens);
    ctx.run("Generic declaring type", GenericDeclaringType);
    ctx.run("Invalid levels", InvalidLevels);
    ctx.run("Seeded updater", SeededUpdater);
    ctx.run("Comparers", Comparers);
    ctx.run("Facade round trip", FacadeRoundTrip);
    ctx.run("Facade with bad orders", FacadeBadOrders);
    return ctx.finish();
}
