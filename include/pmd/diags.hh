#ifndef PMD_DIAGS_HH
#define PMD_DIAGS_HH

#include <pmd/error_ids.hh>
#include <pmd/utils.hh>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace pmd {

/// A diagnostic. The diagnostic is issued when the destructor is called.
///
/// Every failure of the library travels as a \c Diag inside a \c Result;
/// callers that handle the failure themselves call \c suppress().
struct Diag {
    /// Diagnostic severity.
    enum struct Kind {
        None,    ///< Not an error. Do not emit this diagnostic.
        Note,    ///< Informational note.
        Warning, ///< Warning, but no hard error.
        Error,   ///< Hard error. The operation that raised it did not complete.
        FError,  ///< Fatal error, but NOT a library bug.
        ICError, ///< Internal error (bug in the library).
    };

private:
    Kind kind;
    ErrorId id{ErrorId::INVALID};
    std::string message{};

    /// Attached diagnostics.
    std::vector<std::pair<Diag, bool>> attached;

    /// Handle fatal error codes.
    void HandleFatalErrors();

    /// Determine whether we should use colours at all.
    [[nodiscard]]
    auto ShouldUseColour() const -> bool;

public:
    static constexpr u8 ICE_EXIT_CODE = 17;
    static constexpr u8 FATAL_EXIT_CODE = 18;

    Diag(Diag&& other) noexcept
        : kind(other.kind),
          id(other.id),
          message(std::move(other.message)),
          attached(std::move(other.attached)) {
        other.kind = Kind::None;
    }

    auto operator=(Diag&& other) noexcept -> Diag& {
        if (this == &other) return *this;
        kind = other.kind;
        id = other.id;
        message = std::move(other.message);
        attached = std::move(other.attached);
        other.kind = Kind::None;
        return *this;
    }

    /// Create an empty diagnostic.
    explicit Diag() : kind(Kind::None){};

    /// Disallow copying.
    Diag(const Diag&) = delete;
    auto operator=(const Diag&) -> Diag& = delete;

    /// The destructor prints the diagnostic, if it hasn’t been moved from.
    ~Diag();

    /// Issue a diagnostic.
    Diag(Kind kind_, ErrorId id_, std::string message_)
        : kind(kind_), id(id_), message(std::move(message_)) {}

    /// Issue a diagnostic with a format string and arguments.
    template <typename... Args>
    Diag(Kind kind_, ErrorId id_, fmt::format_string<Args...> fmt, Args&&... args)
        : Diag{kind_, id_, fmt::format(fmt, std::forward<Args>(args)...)} {}

    /// Attach another diagnostic to this one.
    ///
    /// \param print_before If true, the diagnostic will be printed
    ///     before this one. Otherwise, it will be printed after this
    ///     one.
    void attach(Diag&& diag, bool print_before = false) {
        attached.emplace_back(std::move(diag), print_before);
    }

    /// Severity of this diagnostic; \c None once printed or suppressed.
    [[nodiscard]] auto severity() const -> Kind { return kind; }

    /// The error category.
    [[nodiscard]] auto error_id() const -> ErrorId { return id; }

    /// The message text, without the severity prefix.
    [[nodiscard]] auto text() const -> const std::string& { return message; }

    /// Print this diagnostic now. This resets the diagnostic.
    void print();

    /// Print all attached diagnostics now.
    void print_attached();

    /// Suppress this and all attached diagnostics (it will not be printed).
    void suppress(bool issue_attached_diagnostics = false) {
        if (issue_attached_diagnostics) print_attached();
        kind = Kind::None;
    }

    /// Emit a note.
    template <typename... Args>
    static auto Note(fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag{Kind::Note, ErrorId::INVALID, fmt::format(fmt, std::forward<Args>(args)...)};
    }

    /// Emit a warning.
    template <typename... Args>
    static auto Warning(fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag{Kind::Warning, ErrorId::INVALID, fmt::format(fmt, std::forward<Args>(args)...)};
    }

    /// Emit an error.
    template <typename... Args>
    static auto Error(ErrorId id, fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag{Kind::Error, id, fmt::format(fmt, std::forward<Args>(args)...)};
    }

    /// Raise an internal error and exit.
    template <typename... Args>
    [[noreturn]]
    static void ICE(fmt::format_string<Args...> fmt, Args&&... args) {
        // The nested scope matters: the destructor prints the diagnostic,
        // and an ICE exits after printing.
        { Diag _{Kind::ICError, ErrorId::INVALID, fmt::format(fmt, std::forward<Args>(args)...)}; }
        fmt::print(stderr, "\n¡¡BIG PROBLEM!! ICE didn't exit...\n");
        std::terminate();
    }

    /// Raise a fatal error and exit.
    template <typename... Args>
    [[noreturn]]
    static void Fatal(fmt::format_string<Args...> fmt, Args&&... args) {
        { Diag _{Kind::FError, ErrorId::INVALID, fmt::format(fmt, std::forward<Args>(args)...)}; }
        std::terminate();
    }
};

} // namespace pmd

#endif // PMD_DIAGS_HH
