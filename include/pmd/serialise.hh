#ifndef PMD_SERIALISE_HH
#define PMD_SERIALISE_HH

#include <pmd/facade.hh>
#include <pmd/json.hh>
#include <pmd/metadata.hh>
#include <pmd/utils/result.hh>

#include <string>
#include <string_view>

namespace pmd::serialise {
/// How to write metadata as JSON.
struct JsonOptions {
    /// Write complex types in their compact text form and tokens as
    /// bare numbers or strings, instead of as JSON objects.
    bool compact = false;

    /// Put every member and element on its own line.
    bool pretty = false;
};

/// Convert a facade to a JSON document.
///
/// This only fails in compact mode, if a complex type cannot be
/// formatted.
auto ToJsonValue(const Facade& facade, JsonOptions options = {}) -> Result<json::Value>;

/// Convert a JSON document back to a facade. Both encodings of complex
/// types and tokens are accepted, and may even be mixed.
auto FromJsonValue(const json::Value& value) -> Result<Facade>;

/// Serialise a container to JSON text.
auto ToJson(const Metadata& metadata, JsonOptions options = {}) -> Result<std::string>;

/// Deserialise a container from JSON text.
auto FromJson(std::string_view text) -> Result<Metadata>;
} // namespace pmd::serialise

#endif // PMD_SERIALISE_HH
