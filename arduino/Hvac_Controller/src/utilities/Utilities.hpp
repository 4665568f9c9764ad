// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <cstdint>
#include <cstddef>
#include <string>

typedef unsigned long interval_t;
typedef unsigned long counter_t;

// -----------------------------------------------------------------------------------------------

inline std::string BytesToHexString (const uint8_t bytes [], const size_t size, const char *separator = "") {
    static const char hex_chars [] = "0123456789abcdef";
    std::string result;
    result.reserve (size * 3);
    for (size_t i = 0; i < size; i++) {
        if (i > 0)
            result += separator;
        result += hex_chars [(bytes [i] >> 4) & 0x0F];
        result += hex_chars [bytes [i] & 0x0F];
    }
    return result;
}

// -----------------------------------------------------------------------------------------------

#include <type_traits>
#include <exception>
#include <utility>

template <typename F>
void exception_catcher (F &&f) {
    static_assert (std::is_invocable_v<F>, "F must be an invocable type");
    try {
        std::forward<F> (f) ();
    } catch (const std::exception &e) {
        DEBUG_PRINTF ("exception: %s\n", e.what ());
    } catch (...) {
        DEBUG_PRINTF ("exception: unknown\n");
    }
}

// -----------------------------------------------------------------------------------------------

#include <mutex>
#include <queue>

// bounded, push refuses once full rather than growing
template <typename T>
class QueueSimpleConcurrentSafe {
    mutable std::mutex _mutex;
    std::queue<T> _queue;
    const size_t _limit;

public:
    explicit QueueSimpleConcurrentSafe (const size_t limit) :
        _limit (limit) { }
    bool push (const T &t) {
        std::lock_guard<std::mutex> guard (_mutex);
        if (_queue.size () >= _limit)
            return false;
        _queue.push (t);
        return true;
    }
    bool pull (T &t) {
        std::lock_guard<std::mutex> guard (_mutex);
        if (_queue.empty ())
            return false;
        t = std::move (_queue.front ());
        _queue.pop ();
        return true;
    }
    size_t size () const {
        std::lock_guard<std::mutex> guard (_mutex);
        return _queue.size ();
    }
};

// -----------------------------------------------------------------------------------------------

#include <atomic>

class Counter {
    std::atomic<counter_t> _count { 0 };

public:
    inline Counter &operator++ (int) {
        _count++;
        return *this;
    }
    inline operator counter_t () const {
        return _count.load ();
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <ctime>

inline std::string getTimeString (time_t timet = 0) {
    struct tm timeinfo;
    char timeString [sizeof ("yyyy-mm-ddThh:mm:ssZ") + 1] = { '\0' };
    if (timet == 0)
        time (&timet);
    if (gmtime_r (&timet, &timeinfo) != nullptr)
        strftime (timeString, sizeof (timeString), "%Y-%m-%dT%H:%M:%SZ", &timeinfo);
    return timeString;
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
