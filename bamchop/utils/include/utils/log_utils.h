#pragma once
#include <spdlog/spdlog.h>

namespace bamchop::utils {

// Initialises the default logger to point to stderr.
void InitLogging();

enum class VerboseLogLevel : int {
    none = 0,
    debug = 1,
    trace = 2,
};

void SetVerboseLogging(VerboseLogLevel level);

/// Per-record messages go through here so that they compile away unless
/// per-record tracing is enabled at build time.
#if ENABLE_PER_READ_TRACE
template <typename... Args>
void trace_log(spdlog::format_string_t<Args...> fmt_str, Args &&...args) {
    spdlog::trace(fmt_str, std::forward<Args>(args)...);
}

#else  // Per-read trace logging is disabled.
template <typename... Args>
void trace_log(fmt::format_string<Args...>, Args &&...) {}
#endif

}  // namespace bamchop::utils
