#include <pmd/model/rows.hh>
#include <pmd/model/signatures.hh>
#include <pmd/utils/rtti.hh>

#include <algorithm>

bool pmd::model::LeafSig::IsLeaf(ElementType et) {
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

namespace pmd::model {
namespace {
bool ListEquals(const std::vector<TypeSig*>& a, const std::vector<TypeSig*>& b) {
    return rgs::equal(a, b, [](const TypeSig* x, const TypeSig* y) { return SigEquals(x, y); });
}

bool TypeEquals(const TypeDefOrRef* a, const TypeDefOrRef* b) {
    if (a == b) return true;
    if (not a or not b) return false;
    auto sa = cast<TypeSpec>(a);
    auto sb = cast<TypeSpec>(b);
    return sa and sb and SigEquals(sa->signature(), sb->signature());
}
} // namespace
} // namespace pmd::model

bool pmd::model::SigEquals(const TypeSig* a, const TypeSig* b) {
    if (a == b) return true;
    if (not a or not b) return false;
    if (a->element_type() != b->element_type()) return false;

    if (is<LeafSig>(a)) return true;

    if (auto w = cast<WrapperSig>(a))
        return SigEquals(w->next(), as<WrapperSig>(b)->next());

    if (auto f = cast<FnPtrSig>(a))
        return SigEquals(f->signature(), as<FnPtrSig>(b)->signature());

    if (auto c = cast<ClassOrValueTypeSig>(a))
        return TypeEquals(c->type(), as<ClassOrValueTypeSig>(b)->type());

    if (auto g = cast<GenericSig>(a))
        return g->number() == as<GenericSig>(b)->number();

    if (auto arr = cast<ArraySig>(a)) {
        auto other = as<ArraySig>(b);
        return arr->rank() == other->rank()
           and arr->sizes() == other->sizes()
           and arr->lower_bounds() == other->lower_bounds()
           and SigEquals(arr->next(), other->next());
    }

    if (auto inst = cast<GenericInstSig>(a)) {
        auto other = as<GenericInstSig>(b);
        return SigEquals(inst->generic_type(), other->generic_type())
           and ListEquals(inst->arguments(), other->arguments());
    }

    if (auto va = cast<ValueArraySig>(a)) {
        auto other = as<ValueArraySig>(b);
        return va->size() == other->size() and SigEquals(va->next(), other->next());
    }

    if (auto mod = cast<ModifierSig>(a)) {
        auto other = as<ModifierSig>(b);
        return TypeEquals(mod->modifier(), other->modifier()) and SigEquals(mod->next(), other->next());
    }

    if (auto m = cast<ModuleSig>(a)) {
        auto other = as<ModuleSig>(b);
        return m->index() == other->index() and SigEquals(m->next(), other->next());
    }

    PMD_UNREACHABLE();
}

bool pmd::model::SigEquals(const CallingConventionSig* a, const CallingConventionSig* b) {
    if (a == b) return true;
    if (not a or not b) return false;
    if (a->raw() != b->raw()) return false;

    if (auto m = cast<MethodBaseSig>(a)) {
        auto other = as<MethodBaseSig>(b);
        return m->generic_param_count() == other->generic_param_count()
           and SigEquals(m->ret(), other->ret())
           and ListEquals(m->params(), other->params())
           and ListEquals(m->params_after_sentinel(), other->params_after_sentinel());
    }

    if (auto f = cast<FieldSig>(a))
        return SigEquals(f->type(), as<FieldSig>(b)->type());

    if (auto l = cast<LocalSig>(a))
        return ListEquals(l->locals(), as<LocalSig>(b)->locals());

    if (auto g = cast<GenericInstMethodSig>(a))
        return ListEquals(g->arguments(), as<GenericInstMethodSig>(b)->arguments());

    PMD_UNREACHABLE();
}
