#include <pmd/model/rows.hh>
#include <pmd/utils/rtti.hh>

#include <algorithm>

auto pmd::model::AssemblyRef::full_name() const -> std::string {
    return fmt::format(
        "{}, Version={}, Culture={}, PublicKeyToken={}",
        _name,
        _version,
        _culture,
        _public_key_token
    );
}

void pmd::model::TypeDef::add_nested_type(TypeDef* type) {
    PMD_ASSERT(not type->_declaring_type, "Type '{}' is already nested", type->full_name());
    type->_declaring_type = this;
    nested_types.push_back(type);
}

void pmd::model::TypeDef::add_field(FieldDef* field) {
    PMD_ASSERT(not field->_declaring_type, "Field '{}' already has a declaring type", field->name());
    field->_declaring_type = this;
    fields.push_back(field);
}

void pmd::model::TypeDef::add_method(MethodDef* method) {
    PMD_ASSERT(not method->_declaring_type, "Method '{}' already has a declaring type", method->name());
    method->_declaring_type = this;
    methods.push_back(method);
}

auto pmd::model::TypeDef::find_field(std::string_view name, const FieldSig* sig) const -> FieldDef* {
    auto it = rgs::find_if(fields, [&](FieldDef* f) {
        return f->name() == name and SigEquals(f->signature(), sig);
    });
    return it == fields.end() ? nullptr : *it;
}

auto pmd::model::TypeDef::find_method(std::string_view name, const MethodSig* sig) const -> MethodDef* {
    auto it = rgs::find_if(methods, [&](MethodDef* m) {
        return m->name() == name and SigEquals(m->signature(), sig);
    });
    return it == methods.end() ? nullptr : *it;
}

auto pmd::model::TypeDef::full_name() const -> std::string {
    if (_declaring_type) return fmt::format("{}/{}", _declaring_type->full_name(), _name);
    if (_namespace.empty()) return _name;
    return fmt::format("{}.{}", _namespace, _name);
}

auto pmd::model::TypeRef::declaring_type() const -> TypeRef* {
    return cast<TypeRef>(_scope);
}

auto pmd::model::TypeRef::definition_assembly() const -> AssemblyRef* {
    const TypeRef* t = this;
    while (auto enclosing = t->declaring_type()) t = enclosing;
    return cast<AssemblyRef>(t->scope());
}

bool pmd::model::MemberRef::is_field_ref() const {
    return is<FieldSig>(_signature);
}

bool pmd::model::MemberRef::is_method_ref() const {
    return is<MethodBaseSig>(_signature);
}
