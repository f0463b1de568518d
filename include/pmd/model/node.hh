#ifndef PMD_MODEL_NODE_HH
#define PMD_MODEL_NODE_HH

#include <pmd/utils.hh>

namespace pmd::model {
class Module;

class Row;
class AssemblyRef;
class ModuleRef;
class TypeDefOrRef;
class TypeDef;
class TypeRef;
class TypeSpec;
class FieldDef;
class MethodDef;
class MemberRef;
class MethodSpec;

class TypeSig;
class CallingConventionSig;
class MethodBaseSig;
class MethodSig;
class PropertySig;
class FieldSig;
class LocalSig;
class GenericInstMethodSig;

class CilBody;
class Instruction;
class Local;

/// Base class of everything a module owns.
///
/// Nodes are allocated with placement new on a module, which
/// deletes them when it goes away:
///
/// \code{.cpp}
///     auto t = new (mod) TypeDef{&mod, "System", "Object"};
/// \endcode
class Node {
public:
    virtual ~Node() = default;

    /// Disallow creating nodes without a module reference.
    void* operator new(size_t) = delete;
    void* operator new(size_t sz, Module& mod);
};
} // namespace pmd::model

#endif // PMD_MODEL_NODE_HH
