#include <pmd/detail/defer.hh>
#include <pmd/diags.hh>
#include <pmd/utils/platform.hh>

#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

/// ===========================================================================
///  Diagnostics.
/// ===========================================================================
using Kind = pmd::Diag::Kind;

namespace {
/// Get the colour of a diagnostic.
constexpr auto Colour(Kind kind) -> pmd::utils::Colour {
    switch (kind) {
        using enum pmd::utils::Colour;
        case Kind::ICError: return Magenta;
        case Kind::Warning: return Yellow;
        case Kind::Note: return Green;

        case Kind::FError:
        case Kind::Error:
            return Red;

        default:
            return Reset;
    }
}

/// Get the name of a diagnostic.
constexpr auto Name(Kind kind) -> std::string_view {
    switch (kind) {
        case Kind::ICError: return "Internal Error";
        case Kind::FError: return "Fatal Error";
        case Kind::Error: return "Error";
        case Kind::Warning: return "Warning";
        case Kind::Note: return "Note";
        default: return "Diagnostic";
    }
}
} // namespace

// Exit due to assertion failure.
[[noreturn]]
void pmd::detail::AssertFail(std::string&& msg) {
    Diag::ICE("{}", std::move(msg));
}

void pmd::Diag::HandleFatalErrors() {
    if (kind == Kind::ICError) {
        pmd::platform::PrintBacktrace();
        std::exit(ICE_EXIT_CODE);
    }

    if (kind == Kind::FError)
        std::exit(FATAL_EXIT_CODE);
}

auto pmd::Diag::ShouldUseColour() const -> bool {
    return pmd::platform::StderrIsTerminal();
}

pmd::Diag::~Diag() { print(); }

void pmd::Diag::print() {
    using enum utils::Colour;

    // If this diagnostic is suppressed, do nothing.
    if (kind == Kind::None) return;

    // Don’t print the same diagnostic twice.
    defer { kind = Kind::None; };

    for (auto& [diag, print_before] : attached)
        if (print_before)
            diag.print();

    defer {
        for (auto& [diag, print_before] : attached)
            if (not print_before)
                diag.print();
        attached.clear();
    };

    utils::Colours C(ShouldUseColour());
    fmt::print(stderr, "{}{}{}", C(Bold), C(Colour(kind)), Name(kind));
    if (id != ErrorId::INVALID) fmt::print(stderr, " [{}]", id);
    fmt::print(stderr, ":{} {}\n", C(Reset), message);

    HandleFatalErrors();
}

void pmd::Diag::print_attached() {
    for (auto& [diag, print_before] : attached)
        if (print_before)
            diag.print();

    for (auto& [diag, print_before] : attached)
        if (not print_before)
            diag.print();

    attached.clear();
}
