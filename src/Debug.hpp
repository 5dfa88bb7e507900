// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_DEBUG_HPP__
#define __DPS150_DEBUG_HPP__

// -----------------------------------------------------------------------------------------------

#ifdef DPS150_DEBUG

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace dps150 {
typedef void (*DebugLoggerFunc)(const char*, ...);
inline std::atomic<DebugLoggerFunc> debugLoggerFunc{ nullptr };
inline void debugLoggerStderr(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);
}
inline DebugLoggerFunc debugLoggerSet(DebugLoggerFunc func = nullptr) {
    return debugLoggerFunc.exchange(func);
}
}    // namespace dps150

#define DPS150_DEBUG_START(...) dps150::debugLoggerSet(dps150::debugLoggerStderr)
#define DPS150_DEBUG_END(...) dps150::debugLoggerSet()
#define DPS150_DEBUG_PRINTF(...) \
    do { \
        if (const dps150::DebugLoggerFunc _dps150_logger = dps150::debugLoggerFunc.load()) _dps150_logger(__VA_ARGS__); \
    } while (0)

#else

#define DPS150_DEBUG_START(...) do {} while (0)
#define DPS150_DEBUG_END(...) do {} while (0)
#define DPS150_DEBUG_PRINTF(...) do {} while (0)

#endif

// -----------------------------------------------------------------------------------------------

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
