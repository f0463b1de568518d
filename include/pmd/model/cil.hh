#ifndef PMD_MODEL_CIL_HH
#define PMD_MODEL_CIL_HH

#include <pmd/model/node.hh>
#include <pmd/utils.hh>

#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pmd::model {
/// What kind of operand an opcode takes.
enum struct OperandType : u8 {
    InlineBrTarget,
    InlineField,
    InlineI,
    InlineI8,
    InlineMethod,
    InlineNone,
    InlinePhi,
    InlineR,
    InlineSig,
    InlineString,
    InlineSwitch,
    InlineTok,
    InlineType,
    InlineVar,
    ShortInlineBrTarget,
    ShortInlineI,
    ShortInlineR,
    ShortInlineVar,
};

auto StringifyEnum(OperandType t) -> std::string_view;

struct OpCode {
    /// The ECMA-335 mnemonic, e.g. \c "ldc.i4.s".
    std::string_view name;

    /// One byte opcodes are below 0x100, two byte opcodes
    /// are 0xFE00 and up.
    u16 value;

    OperandType operand_type;

    /// Check if the operand of this opcode is an argument index
    /// rather than a local.
    [[nodiscard]] bool takes_argument() const;
};

/// Get all known opcodes.
auto OpCodes() -> std::span<const OpCode>;

/// Look up an opcode by name. Returns null if there is none.
auto FindOpCode(std::string_view name) -> const OpCode*;

/// A method argument, by index. The index includes the hidden \c this.
struct Argument {
    u32 index{};

    bool operator==(const Argument&) const = default;
};

class Local : public Node {
    TypeSig* _type;
    u32 _index;

public:
    Local(TypeSig* type, u32 index) : _type(type), _index(index) {}

    [[nodiscard]] auto type() const -> TypeSig* { return _type; }
    [[nodiscard]] auto index() const -> u32 { return _index; }
};

class Instruction : public Node {
public:
    /// \c Row covers type, field and method tokens; stand-alone
    /// signatures are \c CallingConventionSig.
    using Operand = std::variant<
        std::monostate,
        i32,
        i64,
        f32,
        f64,
        std::string,
        Instruction*,
        std::vector<Instruction*>,
        Local*,
        Argument,
        Row*,
        CallingConventionSig*>;

private:
    const OpCode* _opcode;

public:
    Operand operand;

    Instruction(const OpCode* opcode, Operand operand_ = {}) : _opcode(opcode), operand(std::move(operand_)) {
        PMD_ASSERT(opcode, "Instruction without an opcode");
    }

    [[nodiscard]] auto opcode() const -> const OpCode* { return _opcode; }
};

enum struct ExceptionHandlerType : u8 {
    Catch = 0,
    Filter = 1,
    Finally = 2,
    Fault = 4,
};

struct ExceptionHandler {
    Instruction* try_start{};
    Instruction* try_end{};
    Instruction* filter_start{};
    Instruction* handler_start{};
    Instruction* handler_end{};
    TypeDefOrRef* catch_type{};
    ExceptionHandlerType handler_type{};
};

class CilBody : public Node {
public:
    std::vector<Instruction*> instructions{};
    std::vector<ExceptionHandler> exception_handlers{};
    std::vector<Local*> locals{};
    u16 max_stack = 8;
    bool init_locals = true;
};
} // namespace pmd::model

#endif // PMD_MODEL_CIL_HH
