#include <pmd/model/module.hh>
#include <pmd/utils/rtti.hh>

#include <algorithm>

void* pmd::model::Node::operator new(size_t sz, Module& mod) {
    auto ptr = ::operator new(sz);
    mod.nodes.push_back(static_cast<Node*>(ptr));
    return ptr;
}

pmd::model::Module::Module(std::string name) : _name(std::move(name)) {
    create_type("", std::string{GlobalTypeName});
}

pmd::model::Module::~Module() {
    for (auto* node : nodes) delete node;
}

auto pmd::model::Module::leaf(ElementType et) -> LeafSig* {
    auto& l = leaves[+et];
    if (not l) l = new (*this) LeafSig{et};
    return l;
}

auto pmd::model::Module::create_type(std::string ns, std::string name, TypeDef* declaring_type) -> TypeDef* {
    auto t = new (*this) TypeDef{this, std::move(ns), std::move(name)};
    if (declaring_type) declaring_type->add_nested_type(t);
    else _types.push_back(t);
    return t;
}

auto pmd::model::Module::create_field(
    TypeDef* declaring_type,
    std::string name,
    FieldSig* signature,
    u16 attributes
) -> FieldDef* {
    auto f = new (*this) FieldDef{std::move(name), signature, attributes};
    declaring_type->add_field(f);
    return f;
}

auto pmd::model::Module::create_method(
    TypeDef* declaring_type,
    std::string name,
    MethodSig* signature,
    u16 attributes
) -> MethodDef* {
    auto m = new (*this) MethodDef{std::move(name), signature, attributes};
    declaring_type->add_method(m);
    return m;
}

auto pmd::model::Module::create_assembly_ref(std::string name) -> AssemblyRef* {
    auto a = new (*this) AssemblyRef{std::move(name)};
    _assembly_refs.push_back(a);
    return a;
}

auto pmd::model::Module::create_assembly_ref_from_full_name(std::string_view full_name) -> AssemblyRef* {
    auto Trim = [](std::string_view s) {
        while (not s.empty() and s.front() == ' ') s.remove_prefix(1);
        while (not s.empty() and s.back() == ' ') s.remove_suffix(1);
        return s;
    };

    std::string name{};
    std::string version = "0.0.0.0";
    std::string culture = "neutral";
    std::string public_key_token = "null";

    bool first = true;
    while (not full_name.empty()) {
        auto comma = full_name.find(',');
        auto part = Trim(full_name.substr(0, comma));
        full_name = comma == std::string_view::npos ? std::string_view{} : full_name.substr(comma + 1);

        if (first) {
            name = std::string{part};
            first = false;
            continue;
        }

        auto eq = part.find('=');
        if (eq == std::string_view::npos) continue;
        auto key = Trim(part.substr(0, eq));
        auto value = std::string{Trim(part.substr(eq + 1))};
        if (key == "Version") version = std::move(value);
        else if (key == "Culture") culture = std::move(value);
        else if (key == "PublicKeyToken") public_key_token = std::move(value);
    }

    auto a = new (*this) AssemblyRef{
        std::move(name),
        std::move(version),
        std::move(culture),
        std::move(public_key_token),
    };
    _assembly_refs.push_back(a);
    return a;
}

auto pmd::model::Module::create_module_ref(std::string name) -> ModuleRef* {
    auto m = new (*this) ModuleRef{std::move(name)};
    _module_refs.push_back(m);
    return m;
}

auto pmd::model::Module::create_type_ref(std::string ns, std::string name, Row* scope) -> TypeRef* {
    auto t = new (*this) TypeRef{std::move(ns), std::move(name), scope};
    _type_refs.push_back(t);
    return t;
}

auto pmd::model::Module::create_member_ref(std::string name, CallingConventionSig* signature, Row* parent) -> MemberRef* {
    auto m = new (*this) MemberRef{std::move(name), signature, parent};
    _member_refs.push_back(m);
    return m;
}

auto pmd::model::Module::find_type(std::string_view ns, std::string_view name) const -> TypeDef* {
    auto it = rgs::find_if(_types, [&](TypeDef* t) { return t->ns() == ns and t->name() == name; });
    return it == _types.end() ? nullptr : *it;
}
