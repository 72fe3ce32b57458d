#pragma once

#include <sys/ioctl.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string_view>

namespace d8::util {

inline int term_width() {
    if (!isatty(STDOUT_FILENO)) return 100;
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
    const char* c = std::getenv("COLUMNS");
    if (c) { int n = std::atoi(c); if (n > 0) return n; }
    return 100;
}

// "y" -> true, "n" -> false, timeout -> true. A non-TTY input or a read error answers false
// without waiting. Prompts go to `out` so stdout stays clean for data.
bool askYesNoWithTimeout(std::string_view prompt, std::chrono::milliseconds timeout,
                         int inFd = STDIN_FILENO, std::FILE* out = stderr, bool requireTty = true);

}
