#include <pmd/json.hh>
#include <pmd/syntax/lexer.hh>

#include <charconv>
#include <iterator>
#include <optional>

pmd::json::Value::Value(Array a) : data(std::move(a)) {}
pmd::json::Value::Value(Object o) : data(std::move(o)) {}

void pmd::json::Array::add(Value value) {
    elements.push_back(std::move(value));
}

void pmd::json::Object::add(std::string key, Value value) {
    members.push_back(Member{std::move(key), std::move(value)});
}

auto pmd::json::Object::find(std::string_view key) const -> const Value* {
    for (const auto& m : members)
        if (m.key == key)
            return &m.value;
    return nullptr;
}

/// ===========================================================================
///  Emitter
/// ===========================================================================
namespace pmd::json {
namespace {
void Newline(std::string& out, isz indent) {
    if (indent < 0) return;
    out += '\n';
    out.append(usz(indent) * 2, ' ');
}

auto Deeper(isz indent) -> isz { return indent < 0 ? indent : indent + 1; }

void EmitString(std::string& out, std::string_view s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                // JSON does not allow unescaped control characters.
                if (u8(c) < 0x20) fmt::format_to(std::back_inserter(out), "\\u{:04x}", u32(u8(c)));
                else out += c;
        }
    }
    out += '"';
}
} // namespace
} // namespace pmd::json

void pmd::json::Array::emit(std::string& out, isz indent) const {
    if (elements.empty()) {
        out += "[]";
        return;
    }

    out += '[';
    bool first = true;
    for (const auto& e : elements) {
        if (not first) out += ',';
        first = false;
        Newline(out, Deeper(indent));
        e.emit(out, Deeper(indent));
    }
    Newline(out, indent);
    out += ']';
}

void pmd::json::Object::emit(std::string& out, isz indent) const {
    if (members.empty()) {
        out += "{}";
        return;
    }

    out += '{';
    bool first = true;
    for (const auto& m : members) {
        if (not first) out += ',';
        first = false;
        Newline(out, Deeper(indent));
        EmitString(out, m.key);
        out += indent < 0 ? ":" : ": ";
        m.value.emit(out, Deeper(indent));
    }
    Newline(out, indent);
    out += '}';
}

void pmd::json::Value::emit(std::string& out, isz indent) const {
    if (is_null()) out += "null";
    else if (auto b = as_bool()) out += *b ? "true" : "false";
    else if (auto i = as_int()) fmt::format_to(std::back_inserter(out), "{}", *i);
    else if (auto s = as_string()) EmitString(out, *s);
    else if (auto a = as_array()) a->emit(out, indent);
    else if (auto o = as_object()) o->emit(out, indent);
    else PMD_UNREACHABLE();
}

auto pmd::json::Value::emit(bool pretty) const -> std::string {
    std::string out{};
    emit(out, pretty ? 0 : -1);
    return out;
}

auto pmd::json::Value::type_name() const -> std::string_view {
    if (is_null()) return "null";
    if (as_bool()) return "boolean";
    if (as_int()) return "integer";
    if (as_string()) return "string";
    if (as_array()) return "array";
    return "object";
}

/// ===========================================================================
///  Parser
/// ===========================================================================
namespace pmd::json {
namespace {
enum struct Tk {
    Invalid,
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Colon,
    Comma,
    String,
    Integer,
    True,
    False,
    Null,
    EndOfFile,
};

constexpr auto StringifyEnum(Tk k) -> std::string_view {
    switch (k) {
        case Tk::Invalid: return "invalid token";
        case Tk::LBrace: return "'{'";
        case Tk::RBrace: return "'}'";
        case Tk::LBracket: return "'['";
        case Tk::RBracket: return "']'";
        case Tk::Colon: return "':'";
        case Tk::Comma: return "','";
        case Tk::String: return "string";
        case Tk::Integer: return "integer";
        case Tk::True: return "true";
        case Tk::False: return "false";
        case Tk::Null: return "null";
        case Tk::EndOfFile: return "end of input";
    }
    return "<invalid>";
}

constexpr usz MaxNestingDepth = 512;

class JsonParser : syntax::Lexer<syntax::Token<Tk>> {
    usz depth = 0;

public:
    explicit JsonParser(std::string_view text) : Lexer(text) {
        NextChar();
        NextToken();
    }

    auto ParseDocument() -> Result<Value> {
        PMD_TRY(value, ParseValue());
        if (not At(Tk::EndOfFile)) return Unexpected("end of input");
        return value;
    }

private:
    bool At(Tk k) const { return tok.kind == k; }

    bool Consume(Tk k) {
        if (not At(k)) return false;
        NextToken();
        return true;
    }

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

    void Fail(std::string message) {
        tok.kind = Tk::Invalid;
        tok.text = std::move(message);
    }

    void NextToken();
    void LexString();
    void LexNumber();
    auto LexHexQuad() -> std::optional<u32>;
    void AppendUtf8(u32 cp);

    auto ParseValue() -> Result<Value>;
    auto ParseArray() -> Result<Value>;
    auto ParseObject() -> Result<Value>;
};

void JsonParser::NextToken() {
    while (IsSpace(lastc)) NextChar();

    tok.text.clear();
    tok.integer_value = 0;
    tok.offset = CurrentOffset();

    switch (lastc) {
        case 0:
            if (chars.exhausted()) tok.kind = Tk::EndOfFile;
            else Fail("Unexpected NUL character");
            return;

        case '{': tok.kind = Tk::LBrace; NextChar(); return;
        case '}': tok.kind = Tk::RBrace; NextChar(); return;
        case '[': tok.kind = Tk::LBracket; NextChar(); return;
        case ']': tok.kind = Tk::RBracket; NextChar(); return;
        case ':': tok.kind = Tk::Colon; NextChar(); return;
        case ',': tok.kind = Tk::Comma; NextChar(); return;
        case '"': LexString(); return;
        case '-': LexNumber(); return;

        default:
            if (IsDigit(lastc)) {
                LexNumber();
                return;
            }

            if (IsAlpha(lastc)) {
                std::string word{};
                while (IsAlpha(lastc)) {
                    word += char(lastc);
                    NextChar();
                }

                if (word == "true") tok.kind = Tk::True;
                else if (word == "false") tok.kind = Tk::False;
                else if (word == "null") tok.kind = Tk::Null;
                else Fail(fmt::format("Unknown literal '{}'", word));
                return;
            }

            Fail(fmt::format("Unexpected character '{}'", char(lastc)));
            return;
    }
}

auto JsonParser::LexHexQuad() -> std::optional<u32> {
    u32 value = 0;
    for (int i = 0; i < 4; i++) {
        NextChar();
        if (not IsHexDigit(lastc)) return std::nullopt;
        u32 digit = IsDigit(lastc) ? lastc - '0' : (lastc | 0x20) - 'a' + 10;
        value = value << 4 | digit;
    }
    return value;
}

void JsonParser::AppendUtf8(u32 cp) {
    auto& s = tok.text;
    if (cp < 0x80) {
        s += char(cp);
    } else if (cp < 0x800) {
        s += char(0xC0 | (cp >> 6));
        s += char(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        s += char(0xE0 | (cp >> 12));
        s += char(0x80 | ((cp >> 6) & 0x3F));
        s += char(0x80 | (cp & 0x3F));
    } else {
        s += char(0xF0 | (cp >> 18));
        s += char(0x80 | ((cp >> 12) & 0x3F));
        s += char(0x80 | ((cp >> 6) & 0x3F));
        s += char(0x80 | (cp & 0x3F));
    }
}

void JsonParser::LexString() {
    tok.kind = Tk::String;

    // Yeet the opening quote.
    NextChar();
    while (lastc != '"') {
        if (lastc == 0 and chars.exhausted()) return Fail("Unterminated string");
        if (lastc < 0x20) return Fail("Unescaped control character in string");

        if (lastc != '\\') {
            tok.text += char(lastc);
            NextChar();
            continue;
        }

        NextChar();
        switch (lastc) {
            case '"': tok.text += '"'; break;
            case '\\': tok.text += '\\'; break;
            case '/': tok.text += '/'; break;
            case 'b': tok.text += '\b'; break;
            case 'f': tok.text += '\f'; break;
            case 'n': tok.text += '\n'; break;
            case 'r': tok.text += '\r'; break;
            case 't': tok.text += '\t'; break;
            case 'u': {
                auto cp = LexHexQuad();
                if (not cp) return Fail("Invalid \\u escape");

                // Surrogate pair.
                if (*cp >= 0xD800 and *cp <= 0xDBFF) {
                    NextChar();
                    if (lastc != '\\') return Fail("Unpaired surrogate in \\u escape");
                    NextChar();
                    if (lastc != 'u') return Fail("Unpaired surrogate in \\u escape");
                    auto low = LexHexQuad();
                    if (not low or *low < 0xDC00 or *low > 0xDFFF) return Fail("Unpaired surrogate in \\u escape");
                    *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                } else if (*cp >= 0xDC00 and *cp <= 0xDFFF) {
                    return Fail("Unpaired surrogate in \\u escape");
                }

                AppendUtf8(*cp);
            } break;
            default: return Fail(fmt::format("Invalid escape sequence '\\{}'", char(lastc)));
        }
        NextChar();
    }

    // Yeet the closing quote.
    NextChar();
}

void JsonParser::LexNumber() {
    std::string digits{};
    if (lastc == '-') {
        digits += '-';
        NextChar();
    }

    while (IsDigit(lastc)) {
        digits += char(lastc);
        NextChar();
    }

    if (lastc == '.' or lastc == 'e' or lastc == 'E')
        return Fail("Only integral numbers are supported");

    i64 value{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} or ptr != digits.data() + digits.size())
        return Fail(fmt::format("Invalid integer '{}'", digits));

    tok.kind = Tk::Integer;
    tok.integer_value = value;
}

auto JsonParser::ParseValue() -> Result<Value> {
    switch (tok.kind) {
        case Tk::LBrace: return ParseObject();
        case Tk::LBracket: return ParseArray();
        case Tk::True: NextToken(); return Value{true};
        case Tk::False: NextToken(); return Value{false};
        case Tk::Null: NextToken(); return Value{nullptr};

        case Tk::Integer: {
            auto i = tok.integer_value;
            NextToken();
            return Value{i};
        }

        case Tk::String: {
            auto s = std::move(tok.text);
            NextToken();
            return Value{std::move(s)};
        }

        default:
            return Unexpected("a value");
    }
}

/// <array> ::= "[" [ <value> { "," <value> } ] "]"
auto JsonParser::ParseArray() -> Result<Value> {
    if (++depth > MaxNestingDepth) return Error("Nesting too deep");
    NextToken();

    Array array{};
    if (not Consume(Tk::RBracket)) {
        do {
            PMD_TRY(v, ParseValue());
            array.add(std::move(v));
        } while (Consume(Tk::Comma));
        if (not Consume(Tk::RBracket)) return Unexpected("',' or ']'");
    }

    depth--;
    return Value{std::move(array)};
}

/// <object> ::= "{" [ <member> { "," <member> } ] "}"
/// <member> ::= STRING ":" <value>
auto JsonParser::ParseObject() -> Result<Value> {
    if (++depth > MaxNestingDepth) return Error("Nesting too deep");
    NextToken();

    Object object{};
    if (not Consume(Tk::RBrace)) {
        do {
            if (not At(Tk::String)) return Unexpected("member name");
            auto key = std::move(tok.text);
            NextToken();
            if (object.find(key)) return Error("Duplicate member '{}'", key);
            if (not Consume(Tk::Colon)) return Unexpected("':'");
            PMD_TRY(v, ParseValue());
            object.add(std::move(key), std::move(v));
        } while (Consume(Tk::Comma));
        if (not Consume(Tk::RBrace)) return Unexpected("',' or '}'");
    }

    depth--;
    return Value{std::move(object)};
}
} // namespace
} // namespace pmd::json

auto pmd::json::Parse(std::string_view text) -> Result<Value> {
    JsonParser p{text};
    return p.ParseDocument();
}
