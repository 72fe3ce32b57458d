#include "util/cmdLineHelpers.hpp"

#include <poll.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <string>

namespace d8::util {

namespace {

std::string normalizedAnswer(std::string line) {
    const auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    line.erase(line.begin(), std::ranges::find_if(line, notSpace));
    line.erase(std::ranges::find_if(line.rbegin(), line.rend(), notSpace).base(), line.end());
    std::ranges::transform(line, line.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return line;
}

}

bool askYesNoWithTimeout(const std::string_view prompt, const std::chrono::milliseconds timeout,
                         const int inFd, std::FILE* out, const bool requireTty) {
    if (requireTty && !isatty(inFd)) return false;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string buf;

    std::fprintf(out, "%.*s: ", static_cast<int>(prompt.size()), prompt.data());
    std::fflush(out);

    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            std::fputs("\n", out);
            return true;
        }

        pollfd pfd{inFd, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::fputs("Error reading input, chosen default value: no.\n", out);
            return false;
        }
        if (rc == 0) continue;

        char chunk[256];
        const ssize_t n = ::read(inFd, chunk, sizeof(chunk));
        if (n <= 0) {
            std::fputs("Error reading input, chosen default value: no.\n", out);
            return false;
        }
        buf.append(chunk, static_cast<size_t>(n));

        for (auto nl = buf.find('\n'); nl != std::string::npos; nl = buf.find('\n')) {
            const auto answer = normalizedAnswer(buf.substr(0, nl));
            buf.erase(0, nl + 1);
            if (answer == "y") return true;
            if (answer == "n") return false;
            std::fputs("Invalid input. Please press 'y' or 'n'.\n", out);
            std::fprintf(out, "%.*s: ", static_cast<int>(prompt.size()), prompt.data());
            std::fflush(out);
        }
    }
}

}
