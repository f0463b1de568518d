#include <pmd/complex_type.hh>
#include <pmd/syntax/lexer.hh>

#include <array>
#include <charconv>
#include <iterator>
#include <limits>
#include <utility>

namespace pmd {
namespace {
struct ElementTypeName {
    ElementType type;
    std::string_view name;
};

struct CallingConventionName {
    CallingConvention cc;
    std::string_view name;
};

constexpr std::array element_type_names{
    ElementTypeName{ElementType::End, "End"},
    ElementTypeName{ElementType::Void, "Void"},
    ElementTypeName{ElementType::Boolean, "Boolean"},
    ElementTypeName{ElementType::Char, "Char"},
    ElementTypeName{ElementType::I1, "I1"},
    ElementTypeName{ElementType::U1, "U1"},
    ElementTypeName{ElementType::I2, "I2"},
    ElementTypeName{ElementType::U2, "U2"},
    ElementTypeName{ElementType::I4, "I4"},
    ElementTypeName{ElementType::U4, "U4"},
    ElementTypeName{ElementType::I8, "I8"},
    ElementTypeName{ElementType::U8, "U8"},
    ElementTypeName{ElementType::R4, "R4"},
    ElementTypeName{ElementType::R8, "R8"},
    ElementTypeName{ElementType::String, "String"},
    ElementTypeName{ElementType::Ptr, "Ptr"},
    ElementTypeName{ElementType::ByRef, "ByRef"},
    ElementTypeName{ElementType::ValueType, "ValueType"},
    ElementTypeName{ElementType::Class, "Class"},
    ElementTypeName{ElementType::Var, "Var"},
    ElementTypeName{ElementType::Array, "Array"},
    ElementTypeName{ElementType::GenericInst, "GenericInst"},
    ElementTypeName{ElementType::TypedByRef, "TypedByRef"},
    ElementTypeName{ElementType::ValueArray, "ValueArray"},
    ElementTypeName{ElementType::I, "I"},
    ElementTypeName{ElementType::U, "U"},
    ElementTypeName{ElementType::R, "R"},
    ElementTypeName{ElementType::FnPtr, "FnPtr"},
    ElementTypeName{ElementType::Object, "Object"},
    ElementTypeName{ElementType::SZArray, "SZArray"},
    ElementTypeName{ElementType::MVar, "MVar"},
    ElementTypeName{ElementType::CModReqd, "CModReqd"},
    ElementTypeName{ElementType::CModOpt, "CModOpt"},
    ElementTypeName{ElementType::Module, "Module"},
    ElementTypeName{ElementType::Sentinel, "Sentinel"},
    ElementTypeName{ElementType::Pinned, "Pinned"},
};

constexpr std::array calling_convention_names{
    CallingConventionName{CallingConvention::Default, "Default"},
    CallingConventionName{CallingConvention::C, "C"},
    CallingConventionName{CallingConvention::StdCall, "StdCall"},
    CallingConventionName{CallingConvention::ThisCall, "ThisCall"},
    CallingConventionName{CallingConvention::FastCall, "FastCall"},
    CallingConventionName{CallingConvention::VarArg, "VarArg"},
    CallingConventionName{CallingConvention::Field, "Field"},
    CallingConventionName{CallingConvention::LocalSig, "LocalSig"},
    CallingConventionName{CallingConvention::Property, "Property"},
    CallingConventionName{CallingConvention::Unmanaged, "Unmanaged"},
    CallingConventionName{CallingConvention::GenericInstCC, "GenericInstCC"},
    CallingConventionName{CallingConvention::NativeVarArg, "NativeVarArg"},
};

/// Names of the kinds that are neither tokens nor signatures.
auto ParseSpecialKind(std::string_view name) -> std::optional<ComplexType::Kind> {
    using K = ComplexType::Kind;
    for (auto k : {K::Int32, K::MethodSpec, K::InlineType, K::InlineField, K::InlineMethod})
        if (StringifyEnum(k) == name)
            return k;
    return std::nullopt;
}

bool IsLeaf(ElementType et) {
    switch (et) {
        case ElementType::End:
        case ElementType::Void:
        case ElementType::Boolean:
        case ElementType::Char:
        case ElementType::I1:
        case ElementType::U1:
        case ElementType::I2:
        case ElementType::U2:
        case ElementType::I4:
        case ElementType::U4:
        case ElementType::I8:
        case ElementType::U8:
        case ElementType::R4:
        case ElementType::R8:
        case ElementType::String:
        case ElementType::TypedByRef:
        case ElementType::I:
        case ElementType::U:
        case ElementType::R:
        case ElementType::Object:
        case ElementType::Sentinel:
            return true;
        default:
            return false;
    }
}

/// Lexemes of the compact text form.
enum struct Tk {
    Invalid,
    LParen,
    RParen,
    Comma,
    Word,
    Name,
    Integer,
    EndOfFile,
};

constexpr auto StringifyEnum(Tk k) -> std::string_view {
    switch (k) {
        case Tk::Invalid: return "invalid token";
        case Tk::LParen: return "'('";
        case Tk::RParen: return "')'";
        case Tk::Comma: return "','";
        case Tk::Word: return "identifier";
        case Tk::Name: return "token name";
        case Tk::Integer: return "integer";
        case Tk::EndOfFile: return "end of input";
    }
    return "<invalid>";
}

/// Walks the argument list of a signature and checks its shape.
///
/// \c where is appended to every error message.
class ShapeReader {
    std::string_view name;
    std::string_view where;
    const std::vector<ComplexType>& args;
    usz pos = 0;

    template <typename... Args>
    auto Error(fmt::format_string<Args...> fmt, Args&&... fmt_args) const -> Diag {
        return Diag::Error(
            ErrorId::InvalidData,
            "{}{}",
            fmt::format(fmt, std::forward<Args>(fmt_args)...),
            where
        );
    }

public:
    ShapeReader(std::string_view name, std::string_view where, const std::vector<ComplexType>& args)
        : name(name), where(where), args(args) {}

    auto Type() -> Result<const ComplexType*> {
        if (pos >= args.size()) return Error("Too few arguments for '{}'", name);
        return &args[pos++];
    }

    auto Int() -> Result<i32> {
        PMD_TRY(t, Type());
        if (not t->is_int32()) return Error("Argument {} of '{}' must be an Int32", pos, name);
        return t->int32();
    }

    auto Count() -> Result<i32> {
        PMD_TRY(n, Int());
        if (n < 0) return Error("Argument {} of '{}' must not be negative", pos, name);
        return n;
    }

    auto Counted() -> Result<void> {
        PMD_TRY(n, Count());
        for (i32 i = 0; i < n; i++) PMD_TRY_VOID(Type());
        return {};
    }

    auto CountedInts() -> Result<void> {
        PMD_TRY(n, Count());
        for (i32 i = 0; i < n; i++) PMD_TRY_VOID(Int());
        return {};
    }

    auto Finish() -> Result<void> {
        if (pos != args.size()) return Error("Too many arguments for '{}'", name);
        return {};
    }

    auto Duplicate(std::string_view what) const -> Diag {
        return Error("Duplicate {} in '{}'", what, name);
    }
};

auto CheckElementTypeArgs(
    ElementType et,
    const std::vector<ComplexType>& args,
    std::string_view where
) -> Result<void> {
    ShapeReader r{StringifyEnum(et), where, args};
    switch (et) {
        case ElementType::Ptr:
        case ElementType::ByRef:
        case ElementType::FnPtr:
        case ElementType::SZArray:
        case ElementType::Pinned:
        case ElementType::ValueType:
        case ElementType::Class:
            PMD_TRY_VOID(r.Type());
            break;

        case ElementType::Var:
        case ElementType::MVar:
            PMD_TRY_VOID(r.Int());
            break;

        /// Array(next, rank, numSizes, sizes..., numLoBounds, loBounds...)
        case ElementType::Array:
            PMD_TRY_VOID(r.Type());
            PMD_TRY_VOID(r.Int());
            PMD_TRY_VOID(r.CountedInts());
            PMD_TRY_VOID(r.CountedInts());
            break;

        case ElementType::GenericInst:
            PMD_TRY_VOID(r.Type());
            PMD_TRY_VOID(r.Counted());
            break;

        case ElementType::ValueArray:
            PMD_TRY_VOID(r.Type());
            PMD_TRY_VOID(r.Int());
            break;

        case ElementType::CModReqd:
        case ElementType::CModOpt:
            PMD_TRY_VOID(r.Type());
            PMD_TRY_VOID(r.Type());
            break;

        case ElementType::Module:
            PMD_TRY_VOID(r.Int());
            PMD_TRY_VOID(r.Type());
            break;

        default:
            PMD_UNREACHABLE();
    }

    return r.Finish();
}

auto CheckCallingConventionArgs(
    CallingConvention cc,
    const std::vector<ComplexType>& args,
    std::string_view where
) -> Result<void> {
    ShapeReader r{StringifyEnum(cc), where, args};
    PMD_TRY(flags, r.Int());

    switch (cc) {
        case CallingConvention::Field:
            PMD_TRY_VOID(r.Type());
            break;

        case CallingConvention::LocalSig:
        case CallingConvention::GenericInstCC:
            PMD_TRY_VOID(r.Counted());
            break;

        /// cc(flags, [numGenericParams], numParams, ret, params...)
        ///
        /// The vararg Sentinel marker sits among the parameters
        /// but is not part of the count.
        default: {
            if (flags & CallingConventionFlags::Generic) PMD_TRY_VOID(r.Count());
            PMD_TRY(count, r.Count());
            PMD_TRY_VOID(r.Type());

            bool sentinel = false;
            for (i32 i = 0; i < count;) {
                PMD_TRY(param, r.Type());
                if (param->is(ElementType::Sentinel)) {
                    if (sentinel) return r.Duplicate("Sentinel");
                    sentinel = true;
                    continue;
                }
                i++;
            }
        } break;
    }

    return r.Finish();
}

class ComplexTypeParser : syntax::Lexer<syntax::Token<Tk>> {
public:
    explicit ComplexTypeParser(std::string_view text) : Lexer(text) {
        NextChar();
        NextToken();
    }

    auto ParseRoot() -> Result<ComplexType> {
        PMD_TRY(type, ParseType());
        if (not At(Tk::EndOfFile)) return Unexpected("end of input");
        return type;
    }

private:
    bool At(Tk k) const { return tok.kind == k; }

    bool Consume(Tk k) {
        if (not At(k)) return false;
        NextToken();
        return true;
    }

    /// Report the current token as unexpected.
    auto Unexpected(std::string_view expected) -> Diag {
        if (At(Tk::Invalid)) return Diag::Error(ErrorId::InvalidData, "{} (at offset {})", tok.text, tok.offset);
        return Diag::Error(
            ErrorId::InvalidData,
            "Expected {}, got {} (at offset {})",
            expected,
            StringifyEnum(tok.kind),
            tok.offset
        );
    }

    void NextToken();
    void LexName();
    void LexNumber();

    auto ParseType() -> Result<ComplexType>;
    auto ParseArgs() -> Result<std::vector<ComplexType>>;
    auto ParseInt32Literal() -> Result<ComplexType>;

    auto Where() const -> std::string { return fmt::format(" (at offset {})", CurrentOffset()); }
};

void ComplexTypeParser::NextToken() {
    tok.text.clear();
    tok.integer_value = 0;
    tok.offset = CurrentOffset();

    switch (lastc) {
        case 0:
            tok.kind = chars.exhausted() ? Tk::EndOfFile : Tk::Invalid;
            if (tok.kind == Tk::Invalid) tok.text = "Unexpected NUL character";
            return;

        case '(':
            tok.kind = Tk::LParen;
            NextChar();
            return;

        case ')':
            tok.kind = Tk::RParen;
            NextChar();
            return;

        case ',':
            tok.kind = Tk::Comma;
            NextChar();
            return;

        case '\'':
            LexName();
            return;

        case '-':
            LexNumber();
            return;

        default:
            if (IsDigit(lastc)) {
                LexNumber();
                return;
            }

            if (IsAlpha(lastc)) {
                tok.kind = Tk::Word;
                while (IsAlpha(lastc) or IsDigit(lastc)) {
                    tok.text += char(lastc);
                    NextChar();
                }
                return;
            }

            tok.kind = Tk::Invalid;
            tok.text = fmt::format("Unexpected character '{}'", char(lastc));
            return;
    }
}

void ComplexTypeParser::LexName() {
    NextChar();
    while (lastc != '\'') {
        if (lastc == 0 and chars.exhausted()) {
            tok.kind = Tk::Invalid;
            tok.text = "Unterminated token name";
            return;
        }
        tok.text += char(lastc);
        NextChar();
    }

    NextChar();
    tok.kind = Tk::Name;
}

void ComplexTypeParser::LexNumber() {
    std::string digits{};
    if (lastc == '-') {
        digits += '-';
        NextChar();
    }

    while (IsDigit(lastc)) {
        digits += char(lastc);
        NextChar();
    }

    i64 value{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (
        ec != std::errc{} or
        ptr != digits.data() + digits.size() or
        value < std::numeric_limits<i32>::min() or
        value > std::numeric_limits<i32>::max()
    ) {
        tok.kind = Tk::Invalid;
        tok.text = fmt::format("Invalid 32-bit integer '{}'", digits);
        return;
    }

    tok.kind = Tk::Integer;
    tok.text = std::move(digits);
    tok.integer_value = value;
}

/// <type> ::= <token> | <word> [ <args> ]
auto ComplexTypeParser::ParseType() -> Result<ComplexType> {
    if (At(Tk::Integer)) {
        if (tok.integer_value < 0) return Unexpected("a non-negative token index");
        auto index = i32(tok.integer_value);
        NextToken();
        return ComplexType::CreateToken(index);
    }

    if (At(Tk::Name)) {
        auto token = Token::Named(tok.text);
        if (token.is_diag()) {
            token.diag().suppress();
            return Diag::Error(ErrorId::InvalidData, "Invalid token name '{}' (at offset {})", tok.text, tok.offset);
        }
        NextToken();
        return ComplexType::CreateToken(std::move(*token));
    }

    if (not At(Tk::Word)) return Unexpected("a complex type");
    auto word = std::move(tok.text);
    auto word_offset = tok.offset;
    NextToken();

    if (auto et = ParseElementType(word)) {
        if (IsLeaf(*et)) return ComplexType::CreateTypeSig(*et);
        PMD_TRY(args, ParseArgs());
        PMD_TRY_VOID(CheckElementTypeArgs(*et, args, Where()));
        return ComplexType::CreateTypeSig(*et, std::move(args));
    }

    if (auto cc = ParseCallingConvention(word)) {
        PMD_TRY(args, ParseArgs());
        PMD_TRY_VOID(CheckCallingConventionArgs(*cc, args, Where()));
        return ComplexType::CreateCallingConventionSig(*cc, std::move(args));
    }

    auto special = ParseSpecialKind(word);
    if (not special) {
        return Diag::Error(
            ErrorId::InvalidData,
            "Invalid complex type beginning '{}' (at offset {})",
            word,
            word_offset
        );
    }

    if (*special == ComplexType::Kind::Int32) return ParseInt32Literal();

    PMD_TRY(args, ParseArgs());
    if (*special == ComplexType::Kind::MethodSpec) {
        if (args.size() != 2) return Error("'MethodSpec' takes 2 arguments, got {}", args.size());
        return ComplexType::CreateMethodSpec(std::move(args[0]), std::move(args[1]));
    }

    if (args.size() != 1) return Error("'{}' takes 1 argument, got {}", word, args.size());
    return ComplexType::CreateInlineTokenOperand(*special, std::move(args[0]));
}

/// <args> ::= "(" <type> { "," <type> } ")"
auto ComplexTypeParser::ParseArgs() -> Result<std::vector<ComplexType>> {
    if (not Consume(Tk::LParen)) return Unexpected("'('");

    std::vector<ComplexType> args{};
    do {
        PMD_TRY(arg, ParseType());
        args.push_back(std::move(arg));
    } while (Consume(Tk::Comma));

    if (not Consume(Tk::RParen)) return Unexpected("',' or ')'");
    return args;
}

/// <int32> ::= "Int32" "(" INTEGER ")"
auto ComplexTypeParser::ParseInt32Literal() -> Result<ComplexType> {
    if (not Consume(Tk::LParen)) return Unexpected("'('");
    if (not At(Tk::Integer)) return Unexpected("integer");
    auto value = i32(tok.integer_value);
    NextToken();
    if (not Consume(Tk::RParen)) return Unexpected("')'");
    return ComplexType::CreateInt32(value);
}

auto Write(const ComplexType& type, std::string& out) -> Result<void>;

auto WriteArgs(const std::vector<ComplexType>& args, std::string& out) -> Result<void> {
    if (args.empty()) return {};
    out += '(';
    bool first = true;
    for (const auto& arg : args) {
        if (not first) out += ',';
        first = false;
        PMD_TRY_VOID(Write(arg, out));
    }
    out += ')';
    return {};
}

auto Write(const ComplexType& type, std::string& out) -> Result<void> {
    using K = ComplexType::Kind;
    switch (type.kind()) {
        case K::Token:
            if (type.token().is_named()) {
                fmt::format_to(std::back_inserter(out), "'{}'", type.token().name());
                return {};
            }

            if (type.token().index() < 0) return Diag::Error(ErrorId::InvalidData, "Negative token index {}", type.token().index());
            fmt::format_to(std::back_inserter(out), "{}", type.token().index());
            return {};

        case K::TypeSig: {
            auto name = StringifyEnum(type.element_type());
            if (name.empty()) return Diag::Error(ErrorId::InvalidData, "Invalid element type: {}", type.type());
            if (IsLeaf(type.element_type())) {
                if (type.has_arguments()) return Diag::Error(ErrorId::InvalidData, "'{}' takes no arguments", name);
            } else {
                PMD_TRY_VOID(CheckElementTypeArgs(type.element_type(), type.arguments(), ""));
            }
            out += name;
            return WriteArgs(type.arguments(), out);
        }

        case K::CallingConventionSig: {
            auto name = StringifyEnum(type.calling_convention());
            if (name.empty()) return Diag::Error(ErrorId::InvalidData, "Invalid calling convention: {}", type.type());
            PMD_TRY_VOID(CheckCallingConventionArgs(type.calling_convention(), type.arguments(), ""));
            out += name;
            return WriteArgs(type.arguments(), out);
        }

        case K::Int32:
            fmt::format_to(std::back_inserter(out), "Int32({})", type.int32());
            return {};

        case K::MethodSpec:
        case K::InlineType:
        case K::InlineField:
        case K::InlineMethod: {
            usz arity = type.kind() == K::MethodSpec ? 2 : 1;
            if (type.arguments().size() != arity) {
                return Diag::Error(
                    ErrorId::InvalidData,
                    "'{}' takes {} argument{}, got {}",
                    StringifyEnum(type.kind()),
                    arity,
                    arity == 1 ? "" : "s",
                    type.arguments().size()
                );
            }
            out += StringifyEnum(type.kind());
            return WriteArgs(type.arguments(), out);
        }
    }

    return Diag::Error(ErrorId::InvalidData, "Invalid complex type kind: {}", +type.kind());
}
} // namespace
} // namespace pmd

auto pmd::StringifyEnum(ElementType et) -> std::string_view {
    for (const auto& e : element_type_names)
        if (e.type == et)
            return e.name;
    return "";
}

auto pmd::StringifyEnum(CallingConvention cc) -> std::string_view {
    for (const auto& c : calling_convention_names)
        if (c.cc == cc)
            return c.name;
    return "";
}

auto pmd::ParseElementType(std::string_view name) -> std::optional<ElementType> {
    for (const auto& e : element_type_names)
        if (e.name == name)
            return e.type;
    return std::nullopt;
}

auto pmd::ParseCallingConvention(std::string_view name) -> std::optional<CallingConvention> {
    for (const auto& c : calling_convention_names)
        if (c.name == name)
            return c.cc;
    return std::nullopt;
}

bool pmd::IsMethodLike(CallingConvention cc) {
    switch (cc) {
        case CallingConvention::Default:
        case CallingConvention::C:
        case CallingConvention::StdCall:
        case CallingConvention::ThisCall:
        case CallingConvention::FastCall:
        case CallingConvention::VarArg:
        case CallingConvention::Property:
        case CallingConvention::Unmanaged:
        case CallingConvention::NativeVarArg:
            return true;
        default:
            return false;
    }
}

auto pmd::ComplexType::CreateToken(pmd::Token token) -> ComplexType {
    PMD_ASSERT(token.is_named() or token.index() >= 0, "Negative token index {}", token.index());
    return ComplexType{Kind::Token, std::move(token), 0, {}};
}

auto pmd::ComplexType::CreateTypeSig(u8 element_type, std::vector<ComplexType> arguments) -> ComplexType {
    return ComplexType{Kind::TypeSig, {}, element_type, std::move(arguments)};
}

auto pmd::ComplexType::CreateTypeSig(ElementType element_type, std::vector<ComplexType> arguments) -> ComplexType {
    return CreateTypeSig(+element_type, std::move(arguments));
}

auto pmd::ComplexType::CreateCallingConventionSig(u8 calling_convention, std::vector<ComplexType> arguments) -> ComplexType {
    return ComplexType{Kind::CallingConventionSig, {}, calling_convention, std::move(arguments)};
}

auto pmd::ComplexType::CreateCallingConventionSig(
    CallingConvention calling_convention,
    std::vector<ComplexType> arguments
) -> ComplexType {
    return CreateCallingConventionSig(+calling_convention, std::move(arguments));
}

auto pmd::ComplexType::CreateInt32(i32 value) -> ComplexType {
    return ComplexType{Kind::Int32, value, 0, {}};
}

auto pmd::ComplexType::CreateMethodSpec(ComplexType method, ComplexType instantiation) -> ComplexType {
    std::vector<ComplexType> args{};
    args.reserve(2);
    args.push_back(std::move(method));
    args.push_back(std::move(instantiation));
    return ComplexType{Kind::MethodSpec, {}, 0, std::move(args)};
}

auto pmd::ComplexType::CreateInlineTokenOperand(Kind kind, ComplexType operand) -> Result<ComplexType> {
    if (kind != Kind::InlineType and kind != Kind::InlineField and kind != Kind::InlineMethod) {
        return Diag::Error(
            ErrorId::InvalidArgument,
            "'{}' is not an inline token operand kind",
            StringifyEnum(kind)
        );
    }

    std::vector<ComplexType> args{};
    args.push_back(std::move(operand));
    return ComplexType{kind, {}, 0, std::move(args)};
}

auto pmd::ComplexType::Parse(std::string_view text) -> Result<ComplexType> {
    if (text.empty()) return Diag::Error(ErrorId::InvalidArgument, "Complex type text cannot be empty");
    ComplexTypeParser p{text};
    return p.ParseRoot();
}

auto pmd::ComplexType::format() const -> Result<std::string> {
    std::string out{};
    PMD_TRY_VOID(Write(*this, out));
    return out;
}

auto pmd::ComplexType::string() const -> std::string {
    auto res = format();
    if (res.is_diag()) Diag::ICE("Cannot format complex type: {}", res.diag().text());
    return std::move(*res);
}

auto pmd::GetScopeType(const ComplexType& type) -> std::optional<Token> {
    if (not type.is_type_sig() or not type.has_arguments()) return std::nullopt;

    switch (type.element_type()) {
        case ElementType::Ptr:
        case ElementType::ByRef:
        case ElementType::Array:
        case ElementType::GenericInst:
        case ElementType::ValueArray:
        case ElementType::SZArray:
        case ElementType::Pinned:
            return GetScopeType(type.arg(0));

        case ElementType::ValueType:
        case ElementType::Class:
            if (type.arg(0).is_token()) return type.arg(0).token();
            return std::nullopt;

        case ElementType::CModReqd:
        case ElementType::CModOpt:
            if (type.arguments().size() < 2) return std::nullopt;
            return GetScopeType(type.arg(1));

        default:
            return std::nullopt;
    }
}
