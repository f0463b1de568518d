#include <pmd/metadata.hh>

namespace pmd {
namespace {
template <typename T>
auto MakeTokenMap(bool named) -> std::unique_ptr<TokenMap<T>> {
    if (named) return std::make_unique<NamedTokenMap<T>>();
    return std::make_unique<IndexedTokenMap<T>>();
}
} // namespace
} // namespace pmd

pmd::Metadata::Metadata(Options options)
    : _options(options),
      _types(MakeTokenMap<Type>(HasFlag(options, Options::UseNamedToken))),
      _fields(MakeTokenMap<Field>(HasFlag(options, Options::UseNamedToken))),
      _methods(MakeTokenMap<Method>(HasFlag(options, Options::UseNamedToken))) {}
