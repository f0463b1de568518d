#ifndef PMD_JSON_HH
#define PMD_JSON_HH

#include <pmd/utils.hh>
#include <pmd/utils/result.hh>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pmd::json {
struct Value;  // forward declaration
struct Member; // forward declaration

struct Array {
    std::vector<Value> elements;

    void add(Value value);
    void emit(std::string& out, isz indent) const;
};

struct Object {
    std::vector<Member> members;

    void add(std::string key, Value value);

    /// Get the value of a member, or null if there is none.
    [[nodiscard]] auto find(std::string_view key) const -> const Value*;

    void emit(std::string& out, isz indent) const;
};

/// A JSON value. Numbers are always integers.
struct Value {
    std::variant<std::nullptr_t, bool, i64, std::string, Array, Object> data{nullptr};

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data(b) {}
    Value(i32 i) : data(i64(i)) {}
    Value(i64 i) : data(i) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(const char* s) : data(std::string{s}) {}
    Value(Array a);
    Value(Object o);

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(data); }

    /// Typed access. These return null if the value has a different type.
    [[nodiscard]] auto as_bool() const -> const bool* { return std::get_if<bool>(&data); }
    [[nodiscard]] auto as_int() const -> const i64* { return std::get_if<i64>(&data); }
    [[nodiscard]] auto as_string() const -> const std::string* { return std::get_if<std::string>(&data); }
    [[nodiscard]] auto as_array() const -> const Array* { return std::get_if<Array>(&data); }
    [[nodiscard]] auto as_object() const -> const Object* { return std::get_if<Object>(&data); }

    /// Name of the type of this value, for diagnostics.
    [[nodiscard]] auto type_name() const -> std::string_view;

    /// Serialise this value.
    ///
    /// \param pretty Put every member and element on its own line.
    [[nodiscard]] auto emit(bool pretty = false) const -> std::string;

    void emit(std::string& out, isz indent) const;
};

struct Member {
    std::string key{};
    Value value{};
};

/// Parse a JSON document.
auto Parse(std::string_view text) -> Result<Value>;
} // namespace pmd::json

#endif // PMD_JSON_HH
