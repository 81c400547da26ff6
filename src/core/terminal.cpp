#include <pbi_scan/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace pbi_scan {

namespace {

bool IsTty(std::FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

} // anonymous namespace

bool IsStderrTty() {
    return IsTty(stderr);
}

bool IsStdoutTty() {
    return IsTty(stdout);
}

bool IsStdinTty() {
    return IsTty(stdin);
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace pbi_scan
