#ifndef PMDTEST_PMDTEST_HH
#define PMDTEST_PMDTEST_HH

#include <pmd/comparer.hh>
#include <pmd/diags.hh>
#include <pmd/error_ids.hh>
#include <pmd/metadata.hh>
#include <pmd/utils.hh>
#include <pmd/utils/result.hh>

#include <fmt/format.h>

#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace pmdtest {
inline constexpr pmd::utils::Colours C{true};

struct TestNameAndResult {
    std::string name{};
    bool passed{true};
};

/// A single test case. Expectations that do not hold are printed
/// right away and mark the test as failed; the test keeps running.
class Test {
    std::string_view _name;
    bool _passed{true};

public:
    explicit Test(std::string_view name) : _name(name) {}

    [[nodiscard]]
    auto name() const -> std::string_view { return _name; }
    [[nodiscard]]
    auto passed() const -> bool { return _passed; }

    template <typename... Args>
    auto check(bool condition, fmt::format_string<Args...> fmt, Args&&... args) -> bool {
        if (not condition) {
            _passed = false;
            fmt::print("\nMISMATCH in {}: {}\n", _name, fmt::format(fmt, std::forward<Args>(args)...));
        }
        return condition;
    }

    /// Expect a result to hold a value. The diagnostic is printed
    /// if it does not.
    template <typename T>
    auto value(pmd::Result<T>& res) -> bool {
        if (not res.is_diag()) return true;
        _passed = false;
        fmt::print("\nUNEXPECTED ERROR in {}:\n", _name);
        res.diag().print();
        return false;
    }

    /// Expect a result to hold an error with the given id. The
    /// diagnostic is consumed.
    template <typename T>
    auto error(pmd::Result<T>& res, pmd::ErrorId id) -> bool {
        if (not res.is_diag()) return check(false, "expected a {} error, got a value", id);
        auto diag = res.diag();
        auto got = diag.error_id();
        diag.suppress();
        return check(got == id, "expected a {} error, got {}", id, got);
    }

    template <typename T>
    auto error(pmd::Result<T>&& res, pmd::ErrorId id) -> bool { return error(res, id); }
};

/// Compare two containers entity by entity: same tokens in the same
/// order, and equal under the full comparer.
inline auto SameMetadata(Test& t, const pmd::Metadata& a, const pmd::Metadata& b) -> bool {
    bool same = t.check(a.options() == b.options(), "options differ");
    auto Section = [&](std::string_view what, const auto& x, const auto& y) {
        if (not t.check(x.count() == y.count(), "{}: {} entities vs {}", what, x.count(), y.count())) {
            same = false;
            return;
        }

        auto it = y.begin();
        for (const auto& [token, entity] : x) {
            const auto& [other_token, other] = *it++;
            if (not t.check(token == other_token, "{}: token {} vs {}", what, token, other_token)) same = false;
            else if (not t.check(pmd::EqualityComparer::Full().equals(entity, other), "{}: '{}' differs", what, entity.name())) same = false;
        }
    };

    Section("types", a.types(), b.types());
    Section("fields", a.fields(), b.fields());
    Section("methods", a.methods(), b.methods());
    return same;
}

class TestContext {
    std::vector<TestNameAndResult> results{};

public:
    [[nodiscard]]
    auto count() const -> size_t { return results.size(); }
    [[nodiscard]]
    auto count_failed() const -> size_t {
        return size_t(pmd::rgs::count_if(results, [](const auto& r) { return not r.passed; }));
    }
    [[nodiscard]]
    auto count_passed() const -> size_t { return count() - count_failed(); }

    void record_test(std::string name, bool passed) {
        results.push_back({std::move(name), passed});
        const auto& result = results.back();
        fmt::print(
            "  {}{}{} {}: {}\n",
            result.passed ? C(pmd::utils::Colour::Green) : C(pmd::utils::Colour::Red),
            result.passed ? 'O' : 'X',
            C(pmd::utils::Colour::Reset),
            result.name,
            result.passed ? "PASSED" : "FAILED"
        );
    }

    /// Run a test case.
    template <typename Callable>
    void run(std::string_view name, Callable&& cb) {
        Test t{name};
        std::invoke(std::forward<Callable>(cb), t);
        record_test(std::string{name}, t.passed());
    }

    /// Print the summary and return the exit code of the test binary.
    [[nodiscard]]
    auto finish() const -> int {
        std::string out{};
        fmt::format_to(
            std::back_inserter(out),
            "  {}PASSED:  {}/{}{}\n",
            C(pmd::utils::Colour::Green),
            count_passed(),
            count(),
            C(pmd::utils::Colour::Reset)
        );
        if (count_failed()) {
            fmt::format_to(
                std::back_inserter(out),
                "  {}FAILED:  {}{}\n",
                C(pmd::utils::Colour::Red),
                count_failed(),
                C(pmd::utils::Colour::Reset)
            );
        }
        fmt::print("{}", out);
        return count_failed() ? 1 : 0;
    }
};
} // namespace pmdtest

#endif // PMDTEST_PMDTEST_HH
