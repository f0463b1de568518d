#ifndef PMD_MODEL_SIGNATURES_HH
#define PMD_MODEL_SIGNATURES_HH

#include <pmd/complex_type.hh>
#include <pmd/model/node.hh>
#include <pmd/utils.hh>

#include <vector>

namespace pmd::model {
/// Base class of all type signatures.
class TypeSig : public Node {
    const ElementType _element_type;

protected:
    explicit TypeSig(ElementType et) : _element_type(et) {}

public:
    [[nodiscard]] auto element_type() const -> ElementType { return _element_type; }
};

/// Primitive types, the core library's \c Object and \c String,
/// and the vararg Sentinel marker.
class LeafSig : public TypeSig {
public:
    explicit LeafSig(ElementType et) : TypeSig(et) {
        PMD_ASSERT(IsLeaf(et), "'{}' is not a leaf element type", StringifyEnum(et));
    }

    static bool IsLeaf(ElementType et);

    /// RTTI.
    static bool classof(const TypeSig* t) { return IsLeaf(t->element_type()); }
};

/// Ptr, ByRef, SZArray and Pinned.
class WrapperSig : public TypeSig {
    TypeSig* _next;

public:
    WrapperSig(ElementType et, TypeSig* next) : TypeSig(et), _next(next) {
        PMD_ASSERT(IsWrapper(et), "'{}' is not a wrapper element type", StringifyEnum(et));
    }

    [[nodiscard]] auto next() const -> TypeSig* { return _next; }

    static bool IsWrapper(ElementType et) {
        return et == ElementType::Ptr or et == ElementType::ByRef
            or et == ElementType::SZArray or et == ElementType::Pinned;
    }

    /// RTTI.
    static bool classof(const TypeSig* t) { return IsWrapper(t->element_type()); }
};

/// A function pointer.
class FnPtrSig : public TypeSig {
    MethodSig* _signature;

public:
    explicit FnPtrSig(MethodSig* signature) : TypeSig(ElementType::FnPtr), _signature(signature) {}

    [[nodiscard]] auto signature() const -> MethodSig* { return _signature; }

    /// RTTI.
    static bool classof(const TypeSig* t) { return t->element_type() == ElementType::FnPtr; }
};

/// Class and ValueType.
class ClassOrValueTypeSig : public TypeSig {
    TypeDefOrRef* _type;

public:
    ClassOrValueTypeSig(ElementType et, TypeDefOrRef* type) : TypeSig(et), _type(type) {
        PMD_ASSERT(et == ElementType::Class or et == ElementType::ValueType);
    }

    [[nodiscard]] auto type() const -> TypeDefOrRef* { return _type; }

    /// RTTI.
    static bool classof(const TypeSig* t) {
        return t->element_type() == ElementType::Class or t->element_type() == ElementType::ValueType;
    }
};

/// Var and MVar.
class GenericSig : public TypeSig {
    u32 _number;

public:
    GenericSig(ElementType et, u32 number) : TypeSig(et), _number(number) {
        PMD_ASSERT(et == ElementType::Var or et == ElementType::MVar);
    }

    [[nodiscard]] auto number() const -> u32 { return _number; }

    /// RTTI.
    static bool classof(const TypeSig* t) {
        return t->element_type() == ElementType::Var or t->element_type() == ElementType::MVar;
    }
};

/// A multi-dimensional array.
class ArraySig : public TypeSig {
    TypeSig* _next;
    u32 _rank;
    std::vector<u32> _sizes;
    std::vector<i32> _lower_bounds;

public:
    ArraySig(TypeSig* next, u32 rank, std::vector<u32> sizes = {}, std::vector<i32> lower_bounds = {})
        : TypeSig(ElementType::Array),
          _next(next),
          _rank(rank),
          _sizes(std::move(sizes)),
          _lower_bounds(std::move(lower_bounds)) {}

    [[nodiscard]] auto next() const -> TypeSig* { return _next; }
    [[nodiscard]] auto rank() const -> u32 { return _rank; }
    [[nodiscard]] auto sizes() const -> const std::vector<u32>& { return _sizes; }
    [[nodiscard]] auto lower_bounds() const -> const std::vector<i32>& { return _lower_bounds; }

    /// RTTI.
    static bool classof(const TypeSig* t) { return t->element_type() == ElementType::Array; }
};

/// A generic type instantiation.
class GenericInstSig : public TypeSig {
    TypeSig* _generic_type;
    std::vector<TypeSig*> _arguments;

public:
    GenericInstSig(TypeSig* generic_type, std::vector<TypeSig*> arguments)
        : TypeSig(ElementType::GenericInst),
          _generic_type(generic_type),
          _arguments(std::move(arguments)) {}

    /// The instantiated type. This is a \c ClassOrValueTypeSig in
    /// well-formed signatures.
    [[nodiscard]] auto generic_type() const -> TypeSig* { return _generic_type; }
    [[nodiscard]] auto arguments() const -> const std::vector<TypeSig*>& { return _arguments; }

    /// RTTI.
    static bool classof(const TypeSig* t) { return t->element_type() == ElementType::GenericInst; }
};

class ValueArraySig : public TypeSig {
    TypeSig* _next;
    u32 _size;

public:
    ValueArraySig(TypeSig* next, u32 size) : TypeSig(ElementType::ValueArray), _next(next), _size(size) {}

    [[nodiscard]] auto next() const -> TypeSig* { return _next; }
    [[nodiscard]] auto size() const -> u32 { return _size; }

    /// RTTI.
    static bool classof(const TypeSig* t) { return t->element_type() == ElementType::ValueArray; }
};

/// CModReqd and CModOpt.
class ModifierSig : public TypeSig {
    TypeDefOrRef* _modifier;
    TypeSig* _next;

public:
    ModifierSig(ElementType et, TypeDefOrRef* modifier, TypeSig* next)
        : TypeSig(et), _modifier(modifier), _next(next) {
        PMD_ASSERT(et == ElementType::CModReqd or et == ElementType::CModOpt);
    }

    [[nodiscard]] auto modifier() const -> TypeDefOrRef* { return _modifier; }
    [[nodiscard]] auto next() const -> TypeSig* { return _next; }

    /// RTTI.
    static bool classof(const TypeSig* t) {
        return t->element_type() == ElementType::CModReqd or t->element_type() == ElementType::CModOpt;
    }
};

class ModuleSig : public TypeSig {
    u32 _index;
    TypeSig* _next;

public:
    ModuleSig(u32 index, TypeSig* next) : TypeSig(ElementType::Module), _index(index), _next(next) {}

    [[nodiscard]] auto index() const -> u32 { return _index; }
    [[nodiscard]] auto next() const -> TypeSig* { return _next; }

    /// RTTI.
    static bool classof(const TypeSig* t) { return t->element_type() == ElementType::Module; }
};

/// Base class of method, property, field, local and generic
/// instantiation signatures.
class CallingConventionSig : public Node {
    /// Calling convention and flags, as stored in the first byte.
    u8 _raw;

protected:
    explicit CallingConventionSig(u8 raw) : _raw(raw) {}

public:
    [[nodiscard]] auto calling_convention() const -> CallingConvention {
        return CallingConvention(_raw & CallingConventionFlags::Mask);
    }

    /// The bits above the calling convention.
    [[nodiscard]] auto flags() const -> u8 { return _raw & u8(~CallingConventionFlags::Mask); }
    [[nodiscard]] auto raw() const -> u8 { return _raw; }

    [[nodiscard]] bool generic() const { return _raw & CallingConventionFlags::Generic; }
    [[nodiscard]] bool has_this() const { return _raw & CallingConventionFlags::HasThis; }
};

/// Method and property signatures.
///
/// Parameters of a vararg call site that follow the Sentinel are
/// kept apart from the fixed ones.
class MethodBaseSig : public CallingConventionSig {
    u32 _generic_param_count{};
    TypeSig* _ret;
    std::vector<TypeSig*> _params;
    std::vector<TypeSig*> _params_after_sentinel;

protected:
    MethodBaseSig(
        u8 raw,
        TypeSig* ret,
        std::vector<TypeSig*> params,
        std::vector<TypeSig*> params_after_sentinel,
        u32 generic_param_count
    ) : CallingConventionSig(raw),
        _generic_param_count(generic_param_count),
        _ret(ret),
        _params(std::move(params)),
        _params_after_sentinel(std::move(params_after_sentinel)) {}

public:
    [[nodiscard]] auto generic_param_count() const -> u32 { return _generic_param_count; }
    [[nodiscard]] auto ret() const -> TypeSig* { return _ret; }
    [[nodiscard]] auto params() const -> const std::vector<TypeSig*>& { return _params; }
    [[nodiscard]] auto params_after_sentinel() const -> const std::vector<TypeSig*>& { return _params_after_sentinel; }

    /// RTTI.
    static bool classof(const CallingConventionSig* s) { return IsMethodLike(s->calling_convention()); }
};

class MethodSig : public MethodBaseSig {
public:
    MethodSig(
        u8 raw,
        TypeSig* ret,
        std::vector<TypeSig*> params = {},
        std::vector<TypeSig*> params_after_sentinel = {},
        u32 generic_param_count = 0
    ) : MethodBaseSig(raw, ret, std::move(params), std::move(params_after_sentinel), generic_param_count) {
        PMD_ASSERT(classof(this), "'{}' is not a method calling convention", StringifyEnum(calling_convention()));
    }

    /// RTTI.
    static bool classof(const CallingConventionSig* s) {
        return IsMethodLike(s->calling_convention()) and s->calling_convention() != CallingConvention::Property;
    }
};

class PropertySig : public MethodBaseSig {
public:
    PropertySig(
        u8 flags,
        TypeSig* ret,
        std::vector<TypeSig*> params = {},
        std::vector<TypeSig*> params_after_sentinel = {},
        u32 generic_param_count = 0
    ) : MethodBaseSig(
            u8(+CallingConvention::Property | flags),
            ret,
            std::move(params),
            std::move(params_after_sentinel),
            generic_param_count
        ) {}

    /// RTTI.
    static bool classof(const CallingConventionSig* s) { return s->calling_convention() == CallingConvention::Property; }
};

class FieldSig : public CallingConventionSig {
    TypeSig* _type;

public:
    explicit FieldSig(TypeSig* type) : CallingConventionSig(+CallingConvention::Field), _type(type) {}

    [[nodiscard]] auto type() const -> TypeSig* { return _type; }

    /// RTTI.
    static bool classof(const CallingConventionSig* s) { return s->calling_convention() == CallingConvention::Field; }
};

class LocalSig : public CallingConventionSig {
    std::vector<TypeSig*> _locals;

public:
    explicit LocalSig(std::vector<TypeSig*> locals)
        : CallingConventionSig(+CallingConvention::LocalSig), _locals(std::move(locals)) {}

    [[nodiscard]] auto locals() const -> const std::vector<TypeSig*>& { return _locals; }

    /// RTTI.
    static bool classof(const CallingConventionSig* s) { return s->calling_convention() == CallingConvention::LocalSig; }
};

/// The type arguments of a generic method instantiation.
class GenericInstMethodSig : public CallingConventionSig {
    std::vector<TypeSig*> _arguments;

public:
    explicit GenericInstMethodSig(std::vector<TypeSig*> arguments)
        : CallingConventionSig(+CallingConvention::GenericInstCC), _arguments(std::move(arguments)) {}

    [[nodiscard]] auto arguments() const -> const std::vector<TypeSig*>& { return _arguments; }

    /// RTTI.
    static bool classof(const CallingConventionSig* s) { return s->calling_convention() == CallingConvention::GenericInstCC; }
};

/// Structural equality of signatures.
///
/// Named types compare by identity, except type specs, which compare
/// by their signature.
bool SigEquals(const TypeSig* a, const TypeSig* b);
bool SigEquals(const CallingConventionSig* a, const CallingConventionSig* b);
} // namespace pmd::model

#endif // PMD_MODEL_SIGNATURES_HH
