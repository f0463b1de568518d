#ifndef PMD_PLATFORM_HH
#define PMD_PLATFORM_HH

/// Prefer *not* to include any system headers
/// (e.g. unistd.h, windows.h, ...) here to keep
/// the APIs below platform-agnostic.

namespace pmd::platform {
/// Print a stack trace to stderr.
void PrintBacktrace();

/// Check whether stderr is a terminal.
bool StderrIsTerminal();
} // namespace pmd::platform

#endif // PMD_PLATFORM_HH
