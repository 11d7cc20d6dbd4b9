// Add some utilities for CLI.
#pragma once

#include <cstdio>
#ifdef _WIN32
#include <io.h>
#else
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace bamchop {

namespace utils {

inline bool is_fd_tty(FILE* fd) {
#ifdef _WIN32
    return _isatty(_fileno(fd));
#else
    return isatty(fileno(fd));
#endif
}

#ifdef _WIN32
inline bool is_fd_pipe(FILE*) { return false; }
#else
inline bool is_fd_pipe(FILE* fd) {
    struct stat buffer;
    if (fstat(fileno(fd), &buffer) != 0) {
        return false;
    }
    return S_ISFIFO(buffer.st_mode);
}
#endif

}  // namespace utils

}  // namespace bamchop
