#include <pmd/utils.hh>
#include <pmd/utils/platform.hh>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#ifdef _WIN32
#    define NOMINMAX
#    include <io.h>
#    include <Windows.h>
#    define isatty _isatty
#    define fileno _fileno
#endif

#ifdef __linux__
#    include <execinfo.h>
#    include <unistd.h>
#endif

void pmd::platform::PrintBacktrace() {
#ifdef __linux__
    static constexpr int size = 64;
    void* trace[size]{};
    int n = backtrace(trace, size);

    // Skip PrintBacktrace() itself.
    static constexpr int skip = 1;

    char** symbols = backtrace_symbols(trace, n);
    if (not symbols) {
        fmt::print(stderr, "Could not symbolise backtrace: backtrace_symbols() returned NULL\n");
        for (int i = skip; i < n; ++i)
            fmt::print(stderr, "{}: {}\n", i - skip, trace[i]);
        return;
    }

    std::vector<std::string> lines;
    lines.reserve(usz(n));
    for (int i = skip; i < n; ++i)
        lines.emplace_back(symbols[i]);
    std::free(symbols);

    for (usz i = 0; i < lines.size(); ++i)
        fmt::print(stderr, "{}: {}\n", i, lines[i]);
#endif
}

bool pmd::platform::StderrIsTerminal() {
    return isatty(fileno(stderr));
}
