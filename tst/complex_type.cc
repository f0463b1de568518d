#include <pmd/complex_type.hh>
#include <pmd/primitives.hh>
#include <pmd/token.hh>

#include <pmdtest/pmdtest.hh>

#include <bit>
#include <cmath>
#include <string_view>

using pmd::ComplexType;
using pmd::ElementType;
using pmd::ErrorId;
using pmd::Token;
using pmdtest::Test;

namespace {
void Tokens(Test& t) {
    auto named = Token::Named("Foo");
    if (not t.value(named)) return;
    t.check(named->is_named() and named->name() == "Foo", "named token lost its name");
    t.check(Token{3}.string() == "3", "index token prints as '{}'", Token{3}.string());

    t.error(Token::Named(""), ErrorId::InvalidArgument);
    for (auto bad : {"a(b", "a)b", "a,b", "a@b", "a'b"}) t.error(Token::Named(bad), ErrorId::InvalidArgument);

    /// Named tokens order before all indexed tokens.
    t.check(*named < Token{0}, "named token should order before an index");
    t.check(Token{1} < Token{2}, "indices should order numerically");
}

void Int32Literal(Test& t) {
    auto res = ComplexType::Parse("Int32(42)");
    if (not t.value(res)) return;
    t.check(res->is_int32() and res->int32() == 42, "expected Int32 42, got {}", *res);
    t.check(res->string() == "Int32(42)", "formats as '{}'", res->string());

    auto negative = ComplexType::Parse("Int32(-7)");
    if (t.value(negative)) t.check(negative->int32() == -7, "expected -7, got {}", *negative);

    t.error(ComplexType::Parse("Int32(2147483648)"), ErrorId::InvalidData);
    t.error(ComplexType::Parse("Int32()"), ErrorId::InvalidData);
}

void SzArrayOfString(Test& t) {
    auto res = ComplexType::Parse("SZArray(String)");
    if (not t.value(res)) return;
    t.check(res->is(ElementType::SZArray), "expected an SZArray, got {}", *res);
    t.check(res->arguments().size() == 1 and res->arg(0).is(ElementType::String), "expected a String element");
    t.check(*res == ComplexType::CreateTypeSig(ElementType::SZArray, {ComplexType::CreateTypeSig(ElementType::String)}), "tree differs");
    t.check(res->string() == "SZArray(String)", "formats as '{}'", res->string());
}

void MethodSignature(Test& t) {
    auto res = ComplexType::Parse("Default(Int32(0),Int32(1),Void,String)");
    if (not t.value(res)) return;
    t.check(res->is_calling_convention_sig(), "expected a calling convention signature");
    t.check(res->calling_convention() == pmd::CallingConvention::Default, "wrong calling convention");
    t.check(res->arguments().size() == 4, "expected 4 arguments, got {}", res->arguments().size());
    t.check(res->arg(2).is(ElementType::Void) and res->arg(3).is(ElementType::String), "wrong return or parameter type");
    t.check(res->string() == "Default(Int32(0),Int32(1),Void,String)", "formats as '{}'", res->string());

    /// Declared count and actual parameters disagree.
    t.error(ComplexType::Parse("Default(Int32(0),Int32(2),Void,String)"), ErrorId::InvalidData);
    t.error(ComplexType::Parse("Default(Int32(0),Int32(0),Void,String)"), ErrorId::InvalidData);
}

void Sentinel(Test& t) {
    auto text = "VarArg(Int32(0),Int32(2),Void,I4,Sentinel,String)";
    auto res = ComplexType::Parse(text);
    if (not t.value(res)) return;

    /// The marker is part of the tree but not of the count.
    t.check(res->arguments().size() == 6, "expected 6 arguments, got {}", res->arguments().size());
    t.check(res->arg(4).is(ElementType::Sentinel), "expected the Sentinel at position 4");
    t.check(res->string() == text, "formats as '{}'", res->string());

    t.error(ComplexType::Parse("VarArg(Int32(0),Int32(2),Void,I4,Sentinel,Sentinel,String)"), ErrorId::InvalidData);
}

void NamedAndIndexedTokens(Test& t) {
    auto named = ComplexType::Parse("Class('System.Object')");
    if (t.value(named)) {
        t.check(named->arg(0).is_token() and named->arg(0).token().name() == "System.Object", "wrong token in {}", *named);
        t.check(named->string() == "Class('System.Object')", "formats as '{}'", named->string());
    }

    auto indexed = ComplexType::Parse("GenericInst(Class(5),Int32(2),I4,ValueType(7))");
    if (t.value(indexed)) {
        t.check(indexed->arg(0).arg(0).token() == Token{5}, "wrong generic type in {}", *indexed);
        t.check(indexed->arg(3).arg(0).token() == Token{7}, "wrong argument in {}", *indexed);
    }

    t.error(ComplexType::Parse("-1"), ErrorId::InvalidData);
    t.error(ComplexType::Parse("Class('a,b')"), ErrorId::InvalidData);
    t.error(ComplexType::Parse("Class('unterminated)"), ErrorId::InvalidData);
}

void Malformed(Test& t) {
    t.error(ComplexType::Parse(""), ErrorId::InvalidArgument);
    t.error(ComplexType::Parse("Foo"), ErrorId::InvalidData);
    t.error(ComplexType::Parse("SZArray(String"), ErrorId::InvalidData);
    t.error(ComplexType::Parse("SZArray(String,String)"), ErrorId::InvalidData);
    t.error(ComplexType::Parse("I4 I4"), ErrorId::InvalidData);
    t.error(ComplexType::Parse("Var(String)"), ErrorId::InvalidData);
    t.error(ComplexType::Parse("Array(I4,Int32(2),Int32(1))"), ErrorId::InvalidData);
    t.error(ComplexType::Parse("MethodSpec(1)"), ErrorId::InvalidData);

    /// Unknown codes cannot be formatted.
    t.error(ComplexType::CreateTypeSig(pmd::u8(0x99)).format(), ErrorId::InvalidData);
    t.error(ComplexType::CreateInlineTokenOperand(ComplexType::Kind::Token, ComplexType{}), ErrorId::InvalidArgument);
}

/// Trees built by hand are checked again when formatted.
void MalformedTrees(Test& t) {
    using pmd::CallingConvention;
    auto I4 = ComplexType::CreateTypeSig(ElementType::I4);
    auto Int = [](pmd::i32 v) { return ComplexType::CreateInt32(v); };

    t.error(ComplexType::CreateTypeSig(ElementType::Ptr).format(), ErrorId::InvalidData);
    t.error(ComplexType::CreateTypeSig(ElementType::I4, {Int(1)}).format(), ErrorId::InvalidData);
    t.error(ComplexType::CreateTypeSig(ElementType::Var, {I4}).format(), ErrorId::InvalidData);
    t.error(ComplexType::CreateTypeSig(ElementType::SZArray, {I4, I4}).format(), ErrorId::InvalidData);
    t.error(ComplexType::CreateTypeSig(ElementType::Array, {I4, Int(1), Int(2), Int(4)}).format(), ErrorId::InvalidData);
    t.error(ComplexType::CreateCallingConventionSig(CallingConvention::Default, {Int(0), Int(1), I4}).format(), ErrorId::InvalidData);
    t.error(ComplexType::CreateCallingConventionSig(CallingConvention::Field, {I4}).format(), ErrorId::InvalidData);
    t.error(ComplexType::CreateCallingConventionSig(CallingConvention::LocalSig, {Int(0), Int(-1)}).format(), ErrorId::InvalidData);

    /// The error surfaces from deep inside the tree.
    auto nested = ComplexType::CreateTypeSig(ElementType::SZArray, {ComplexType::CreateTypeSig(ElementType::ByRef)});
    t.error(nested.format(), ErrorId::InvalidData);

    /// Int32 literals may be negative. Token indices may not.
    auto literal = ComplexType::CreateTypeSig(ElementType::Var, {Int(-1)});
    auto literal_text = literal.format();
    if (t.value(literal_text)) t.check(literal.string() == "Var(Int32(-1))", "formats as '{}'", literal.string());
}

/// Every shape formats back to the text it was parsed from.
void ShapeTable(Test& t) {
    static constexpr std::string_view shapes[] {
        "Ptr(I4)",
        "ByRef(String)",
        "Pinned(ByRef(U1))",
        "SZArray(Object)",
        "ValueType(4)",
        "Class('System.Object')",
        "Var(Int32(0))",
        "MVar(Int32(1))",
        "FnPtr(Default(Int32(0),Int32(1),Void,I4))",
        "Array(R8,Int32(2),Int32(1),Int32(4),Int32(2),Int32(0),Int32(-1))",
        "Array(I4,Int32(1),Int32(0),Int32(0))",
        "GenericInst(Class(5),Int32(2),I4,MVar(Int32(0)))",
        "ValueArray(I2,Int32(16))",
        "CModReqd(3,I4)",
        "CModOpt('IsConst',Ptr(Char))",
        "Module(Int32(1),ValueType(2))",
        "Default(Int32(0),Int32(0),Void)",
        "Default(Int32(16),Int32(2),Int32(1),MVar(Int32(0)),MVar(Int32(1)))",
        "Default(Int32(32),Int32(2),Boolean,I4,U8)",
        "C(Int32(0),Int32(1),I,U)",
        "StdCall(Int32(0),Int32(0),Void)",
        "ThisCall(Int32(0),Int32(0),Void)",
        "FastCall(Int32(0),Int32(0),Void)",
        "Unmanaged(Int32(0),Int32(0),Void)",
        "NativeVarArg(Int32(0),Int32(1),Void,Sentinel,I4)",
        "VarArg(Int32(0),Int32(2),Void,I4,Sentinel,R8)",
        "Property(Int32(32),Int32(1),String,I4)",
        "Field(Int32(0),TypedByRef)",
        "LocalSig(Int32(0),Int32(3),I4,Pinned(ByRef(U1)),Class(2))",
        "LocalSig(Int32(0),Int32(0))",
        "GenericInstCC(Int32(0),Int32(2),String,Var(Int32(0)))",
        "MethodSpec(3,GenericInstCC(Int32(0),Int32(1),R4))",
        "InlineType(SZArray(Class(1)))",
        "InlineField('Program::count')",
        "InlineMethod(7)",
    };

    for (auto text : shapes) {
        auto res = ComplexType::Parse(text);
        if (not t.value(res)) continue;
        auto out = res->format();
        if (not t.value(out)) continue;
        t.check(*out == text, "'{}' formats as '{}'", text, *out);

        auto again = ComplexType::Parse(*out);
        if (t.value(again)) t.check(*again == *res, "'{}' changed after reparsing", text);
    }
}

void ArrayShape(Test& t) {
    auto text = "Array(R8,Int32(2),Int32(1),Int32(4),Int32(2),Int32(0),Int32(-1))";
    auto res = ComplexType::Parse(text);
    if (not t.value(res)) return;
    t.check(res->arguments().size() == 7, "expected 7 arguments, got {}", res->arguments().size());
    t.check(res->string() == text, "formats as '{}'", res->string());
}

void InlineOperands(Test& t) {
    auto spec = ComplexType::Parse("InlineMethod(MethodSpec(3,GenericInstCC(Int32(0),Int32(1),I4)))");
    if (not t.value(spec)) return;
    t.check(spec->kind() == ComplexType::Kind::InlineMethod, "expected InlineMethod");
    t.check(spec->arg(0).kind() == ComplexType::Kind::MethodSpec, "expected a MethodSpec operand");
    t.check(spec->arg(0).arg(0).token() == Token{3}, "wrong method token");

    t.error(ComplexType::Parse("InlineType(1,2)"), ErrorId::InvalidData);
}

void ScopeType(Test& t) {
    auto Scope = [&](std::string_view text) -> std::optional<Token> {
        auto res = ComplexType::Parse(text);
        if (not t.value(res)) return std::nullopt;
        return pmd::GetScopeType(*res);
    };

    t.check(Scope("SZArray(Class(3))") == Token{3}, "SZArray scope");
    t.check(Scope("GenericInst(Class(5),Int32(1),I4)") == Token{5}, "GenericInst scope");
    t.check(Scope("CModOpt(2,ByRef(ValueType(9)))") == Token{9}, "CModOpt scope");
    t.check(not Scope("I4").has_value(), "I4 has no scope type");
    t.check(not Scope("Var(Int32(0))").has_value(), "Var has no scope type");
}

void PrimitiveSlots(Test& t) {
    auto RoundTrip = [&](pmd::Constant::Value value, ElementType et) {
        auto slot = pmd::ToSlot(value);
        if (not t.check(slot.has_value(), "value has no slot")) return;
        auto back = pmd::FromSlot(*slot, +et);
        if (t.value(back)) t.check(*back == value, "{} did not survive its slot", et);
    };

    RoundTrip(true, ElementType::Boolean);
    RoundTrip(char16_t(u'x'), ElementType::Char);
    RoundTrip(pmd::i8(-3), ElementType::I1);
    RoundTrip(pmd::u16(0xFFFE), ElementType::U2);
    RoundTrip(pmd::i32(-1), ElementType::I4);
    RoundTrip(pmd::u64(0xFFFF'FFFF'FFFF'FFFFull), ElementType::U8);
    RoundTrip(pmd::f64(1.5), ElementType::R8);

    t.check(not pmd::ToSlot(std::string{"str"}).has_value(), "strings have no slot");
    t.check(not pmd::ToSlot(std::monostate{}).has_value(), "null has no slot");
    t.error(pmd::FromSlot(0, +ElementType::String), ErrorId::InvalidData);
}

void NanBits(Test& t) {
    auto d = std::bit_cast<pmd::f64>(pmd::u64(0x7FF8'0000'0000'1234));
    auto d_slot = pmd::ToSlot(d);
    t.check(d_slot and pmd::u64(*d_slot) == 0x7FF8'0000'0000'1234, "double NaN payload changed in its slot");
    if (d_slot) {
        auto back = pmd::FromSlot(*d_slot, +ElementType::R8);
        if (t.value(back)) t.check(std::bit_cast<pmd::u64>(std::get<pmd::f64>(*back)) == 0x7FF8'0000'0000'1234, "double NaN payload lost");
    }

    /// Quiet float NaNs keep their payload through the double slot.
    auto f = std::bit_cast<pmd::f32>(pmd::u32(0x7FC0'1234));
    auto f_slot = pmd::ToSlot(f);
    if (not t.check(f_slot.has_value(), "float has no slot")) return;
    auto back = pmd::FromSlot(*f_slot, +ElementType::R4);
    if (t.value(back)) {
        auto bits = std::bit_cast<pmd::u32>(std::get<pmd::f32>(*back));
        t.check(bits == 0x7FC0'1234, "float NaN payload changed to {:#x}", bits);
    }
}
} // namespace

int main() {
    pmdtest::TestContext ctx{};
    ctx.run("Tokens", Tokens);
    ctx.run("Int32 literal", Int32Literal);
    ctx.run("SZArray of String", SzArrayOfString);
    ctx.run("Method signature", MethodSignature);
    ctx.run("Vararg Sentinel", Sentinel);
    ctx.run("Named and indexed tokens", NamedAndIndexedTokens);
    ctx.run("Malformed text", Malformed);
    ctx.run("Malformed trees", MalformedTrees);
    ctx.run("Shape table", ShapeTable);
    ctx.run("Array shape", ArrayShape);
    ctx.run("Inline operands", InlineOperands);
    ctx.run("Scope type", ScopeType);
    ctx.run("Primitive slots", PrimitiveSlots);
    ctx.run("NaN bits", NanBits);
    return ctx.finish();
}
