#ifndef PMD_COMPLEX_TYPE_HH
#define PMD_COMPLEX_TYPE_HH

#include <pmd/token.hh>
#include <pmd/utils.hh>
#include <pmd/utils/result.hh>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pmd {
/// ECMA-335 element type codes, as they appear in signature blobs.
enum struct ElementType : u8 {
    End = 0x00,
    Void = 0x01,
    Boolean = 0x02,
    Char = 0x03,
    I1 = 0x04,
    U1 = 0x05,
    I2 = 0x06,
    U2 = 0x07,
    I4 = 0x08,
    U4 = 0x09,
    I8 = 0x0A,
    U8 = 0x0B,
    R4 = 0x0C,
    R8 = 0x0D,
    String = 0x0E,
    Ptr = 0x0F,
    ByRef = 0x10,
    ValueType = 0x11,
    Class = 0x12,
    Var = 0x13,
    Array = 0x14,
    GenericInst = 0x15,
    TypedByRef = 0x16,
    ValueArray = 0x17,
    I = 0x18,
    U = 0x19,
    R = 0x1A,
    FnPtr = 0x1B,
    Object = 0x1C,
    SZArray = 0x1D,
    MVar = 0x1E,
    CModReqd = 0x1F,
    CModOpt = 0x20,
    Module = 0x3F,
    Sentinel = 0x41,
    Pinned = 0x45,
};

/// Calling convention codes (the low nibble of a signature's first byte).
enum struct CallingConvention : u8 {
    Default = 0x0,
    C = 0x1,
    StdCall = 0x2,
    ThisCall = 0x3,
    FastCall = 0x4,
    VarArg = 0x5,
    Field = 0x6,
    LocalSig = 0x7,
    Property = 0x8,
    Unmanaged = 0x9,
    GenericInstCC = 0xA,
    NativeVarArg = 0xB,
};

/// Bits of a signature's first byte above the calling convention.
namespace CallingConventionFlags {
constexpr u8 Mask = 0x0F;
constexpr u8 Generic = 0x10;
constexpr u8 HasThis = 0x20;
constexpr u8 ExplicitThis = 0x40;
} // namespace CallingConventionFlags

/// Name of an element type, or empty if the code is unknown.
auto StringifyEnum(ElementType et) -> std::string_view;

/// Name of a calling convention, or empty if the code is unknown.
auto StringifyEnum(CallingConvention cc) -> std::string_view;

/// Look up an element type by name.
auto ParseElementType(std::string_view name) -> std::optional<ElementType>;

/// Look up a calling convention by name.
auto ParseCallingConvention(std::string_view name) -> std::optional<CallingConvention>;

/// Check if a calling convention has the method-like argument shape.
bool IsMethodLike(CallingConvention cc);

/// A node of the portable signature tree.
///
/// This represents type signatures, calling-convention signatures,
/// token references, integer literals used as signature arguments,
/// instantiated generic methods and the token operands of CIL
/// instructions. It is a plain value: copying it copies the whole
/// tree, and token leaves only name an entity of the container.
///
/// An empty argument list means "no arguments"; there is no
/// distinction between absent and empty lists.
class ComplexType {
public:
    enum struct Kind : u8 {
        Token,
        TypeSig,
        CallingConventionSig,
        Int32,
        MethodSpec,
        InlineType,
        InlineField,
        InlineMethod,
    };

private:
    Kind _kind = Kind::Token;
    pmd::Token _token{};
    u8 _type{};
    std::vector<ComplexType> _arguments{};

    ComplexType(Kind kind, pmd::Token token, u8 type, std::vector<ComplexType> arguments)
        : _kind(kind),
          _token(std::move(token)),
          _type(type),
          _arguments(std::move(arguments)) {}

public:
    /// Default is the token 0.
    ComplexType() = default;

    /// Indexed tokens must not be negative.
    static auto CreateToken(pmd::Token token) -> ComplexType;
    static auto CreateTypeSig(u8 element_type, std::vector<ComplexType> arguments = {}) -> ComplexType;
    static auto CreateTypeSig(ElementType element_type, std::vector<ComplexType> arguments = {}) -> ComplexType;
    static auto CreateCallingConventionSig(u8 calling_convention, std::vector<ComplexType> arguments) -> ComplexType;
    static auto CreateCallingConventionSig(CallingConvention calling_convention, std::vector<ComplexType> arguments) -> ComplexType;
    static auto CreateInt32(i32 value) -> ComplexType;
    static auto CreateMethodSpec(ComplexType method, ComplexType instantiation) -> ComplexType;

    /// Wrap the token operand of an instruction.
    ///
    /// \c kind must be one of InlineType, InlineField or InlineMethod.
    static auto CreateInlineTokenOperand(Kind kind, ComplexType operand) -> Result<ComplexType>;

    /// Parse the compact text form.
    static auto Parse(std::string_view text) -> Result<ComplexType>;

    /// Produce the compact text form.
    ///
    /// Fails if a node carries an unknown element type or calling
    /// convention code, or if its arguments do not fit its shape.
    [[nodiscard]] auto format() const -> Result<std::string>;

    /// Like \c format(), but for trees known to be well-formed.
    [[nodiscard]] auto string() const -> std::string;

    [[nodiscard]] auto kind() const -> Kind { return _kind; }

    /// The referenced token. Only meaningful for the Token kind.
    [[nodiscard]] auto token() const -> const pmd::Token& { return _token; }

    /// The raw element type or calling convention code.
    [[nodiscard]] auto type() const -> u8 { return _type; }

    [[nodiscard]] auto element_type() const -> ElementType { return ElementType(_type); }
    [[nodiscard]] auto calling_convention() const -> CallingConvention { return CallingConvention(_type); }

    [[nodiscard]] auto arguments() const -> const std::vector<ComplexType>& { return _arguments; }
    [[nodiscard]] bool has_arguments() const { return not _arguments.empty(); }

    /// Get an argument, asserting it exists.
    [[nodiscard]] auto arg(usz i) const -> const ComplexType& {
        PMD_ASSERT(i < _arguments.size(), "Argument index {} out of range", i);
        return _arguments[i];
    }

    /// The integer of an Int32 literal.
    [[nodiscard]] auto int32() const -> i32 {
        PMD_ASSERT(_kind == Kind::Int32, "ComplexType is not an Int32 literal");
        return _token.index();
    }

    [[nodiscard]] bool is_token() const { return _kind == Kind::Token; }
    [[nodiscard]] bool is_type_sig() const { return _kind == Kind::TypeSig; }
    [[nodiscard]] bool is_calling_convention_sig() const { return _kind == Kind::CallingConventionSig; }
    [[nodiscard]] bool is_int32() const { return _kind == Kind::Int32; }

    /// Check if this is the TypeSig \c et.
    [[nodiscard]] bool is(ElementType et) const { return is_type_sig() and _type == +et; }

    [[nodiscard]] bool operator==(const ComplexType&) const = default;
};

/// Find the token at the root of a type signature.
///
/// Walks through pointers, arrays, generic instantiations and custom
/// modifiers down to the class or value type they are built on.
auto GetScopeType(const ComplexType& type) -> std::optional<Token>;

constexpr auto StringifyEnum(ComplexType::Kind k) -> std::string_view {
    switch (k) {
        case ComplexType::Kind::Token: return "Token";
        case ComplexType::Kind::TypeSig: return "TypeSig";
        case ComplexType::Kind::CallingConventionSig: return "CallingConventionSig";
        case ComplexType::Kind::Int32: return "Int32";
        case ComplexType::Kind::MethodSpec: return "MethodSpec";
        case ComplexType::Kind::InlineType: return "InlineType";
        case ComplexType::Kind::InlineField: return "InlineField";
        case ComplexType::Kind::InlineMethod: return "InlineMethod";
    }
    return "<invalid>";
}
} // namespace pmd

template <>
struct fmt::formatter<pmd::ComplexType> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const pmd::ComplexType& t, FormatContext& ctx) const {
        auto text = t.format();
        if (text.is_diag()) {
            text.diag().suppress();
            return formatter<std::string_view>::format("<malformed>", ctx);
        }
        return formatter<std::string_view>::format(*text, ctx);
    }
};

#endif // PMD_COMPLEX_TYPE_HH
