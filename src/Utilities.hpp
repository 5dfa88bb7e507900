// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_UTILITIES_HPP__
#define __DPS150_UTILITIES_HPP__

#include "Errors.hpp"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <deque>
#include <mutex>
#include <string>
#include <type_traits>

namespace dps150 {

typedef unsigned long counter_t;

// -----------------------------------------------------------------------------------------------

inline std::string BytesToHexString(const uint8_t bytes[], const size_t size, const char separator = ' ') {
    static const char hex_chars[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(size * 3);
    for (size_t i = 0; i < size; i++) {
        if (i > 0 && separator != '\0')
            result += separator;
        result += hex_chars[(bytes[i] >> 4) & 0x0F];
        result += hex_chars[bytes[i] & 0x0F];
    }
    return result;
}

// -----------------------------------------------------------------------------------------------

inline std::string getTimeString(time_t timet = 0) {
    struct tm timeinfo;
    char timeString[sizeof("yyyy-mm-ddThh:mm:ssZ") + 1] = { '\0' };
    if (timet == 0)
        time(&timet);
    if (gmtime_r(&timet, &timeinfo) != nullptr)
        strftime(timeString, sizeof(timeString), "%Y-%m-%dT%H:%M:%SZ", &timeinfo);
    return timeString;
}

// -----------------------------------------------------------------------------------------------

template<typename T>
class Singleton {
    static_assert(std::is_class_v<T>, "T must be a class type");
    inline static T* _instance = nullptr;

public:
    inline static T* instance() {
        return _instance;
    }
    explicit Singleton(T* t) {
        if (_instance != nullptr)
            throw Error("duplicate Singleton initializer");
        _instance = t;
    }
    virtual ~Singleton() {
        _instance = nullptr;
    }
};

// -----------------------------------------------------------------------------------------------

// push on a full queue drops the oldest entry
template<typename T>
class QueueBoundedConcurrentSafe {
    mutable std::mutex _mutex;
    std::deque<T> _queue;
    const size_t _depth;
    counter_t _dropped = 0;

public:
    explicit QueueBoundedConcurrentSafe(const size_t depth)
        : _depth(depth > 0 ? depth : 1) {}
    bool push(const T& t) {
        std::lock_guard<std::mutex> guard(_mutex);
        bool dropped = false;
        if (_queue.size() >= _depth) {
            _queue.pop_front();
            _dropped++;
            dropped = true;
        }
        _queue.push_back(t);
        return !dropped;
    }
    bool pull(T& t) {
        std::lock_guard<std::mutex> guard(_mutex);
        if (!_queue.empty()) {
            t = std::move(_queue.front());
            _queue.pop_front();
            return true;
        }
        return false;
    }
    void drain() {
        std::lock_guard<std::mutex> guard(_mutex);
        _queue.clear();
    }
    size_t size() const {
        std::lock_guard<std::mutex> guard(_mutex);
        return _queue.size();
    }
    counter_t dropped() const {
        std::lock_guard<std::mutex> guard(_mutex);
        return _dropped;
    }
};

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
