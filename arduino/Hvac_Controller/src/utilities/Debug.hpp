#ifndef __DEBUG_HPP__
#define __DEBUG_HPP__

// -----------------------------------------------------------------------------------------------

#include <cstdarg>

#ifdef DEBUG
    typedef void (*__DebugLoggerFunc) (const char *, ...);
    inline __DebugLoggerFunc __debugLoggerFunc = nullptr;
    inline __DebugLoggerFunc __debugLoggerSet (__DebugLoggerFunc func = nullptr) {
        __DebugLoggerFunc prev = __debugLoggerFunc;
        __debugLoggerFunc = func;
        return prev;
    }
    #define DEBUG_PRINTF(...) do { if (__debugLoggerFunc) __debugLoggerFunc (__VA_ARGS__); } while (0)
    #define DEBUG_ONLY(...) __VA_ARGS__
#else
    #define DEBUG_PRINTF(...) do {} while (0)
    #define DEBUG_ONLY(...)
#endif

// -----------------------------------------------------------------------------------------------

#endif
