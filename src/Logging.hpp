// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_LOGGING_HPP__
#define __DPS150_LOGGING_HPP__

#include "Debug.hpp"
#include "Errors.hpp"
#include "Utilities.hpp"

#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

#ifndef DEFAULT_DEBUG_LOGGING_BUFFER
#define DEFAULT_DEBUG_LOGGING_BUFFER 512
#endif

namespace dps150 {

// -----------------------------------------------------------------------------------------------

class LoggingManager : private Singleton<LoggingManager> {
public:
    struct Config {
        bool enableStderr = true;
        std::string filePath;
    };

#ifdef DPS150_DEBUG
private:
    const Config config;

    bool _enableStderr = false;
    std::unique_ptr<FILE, int (*)(FILE*)> _file{ nullptr, &fclose };
    DebugLoggerFunc _debugLoggerPrevious = nullptr;

public:
    explicit LoggingManager(const Config& cfg)
        : Singleton<LoggingManager>(this),
          config(cfg) {
        init();
    }
    ~LoggingManager() {
        term();
    }

protected:
    void init() {
        if (!config.filePath.empty()) {
            _file.reset(fopen(config.filePath.c_str(), "a"));
            if (!_file)
                throw Error("logging file '" + config.filePath + "' could not be opened");
        }
        _enableStderr = config.enableStderr;
        _debugLoggerPrevious = debugLoggerSet(debugLoggerManaged);
        DPS150_DEBUG_PRINTF("LoggingManager::init: logging directed to%s%s%s\n", _enableStderr ? " stderr" : "", _file ? " file " : "", _file ? config.filePath.c_str() : "");
    }
    void term() {    // not entirely thread safe
        {
            std::lock_guard<std::mutex> guard(_bufferMutex);
            flush();
        }
        debugLoggerSet(_debugLoggerPrevious);
        _debugLoggerPrevious = nullptr;
        _enableStderr = false;
        _file.reset();
    }

private:
    static inline std::mutex _bufferMutex;
    static constexpr int _bufferLength = DEFAULT_DEBUG_LOGGING_BUFFER;
    static inline char _bufferContent[_bufferLength];
    static inline int _bufferOffset = 0;

    // called with _bufferMutex held
    void flush() {
        while (_bufferOffset > 0 && _bufferContent[_bufferOffset - 1] == '\n')
            _bufferContent[--_bufferOffset] = '\0';
        _bufferContent[_bufferOffset] = '\0';
        _bufferOffset = 0;
        if (_bufferContent[0] == '\0')
            return;
        if (_enableStderr)
            fprintf(stderr, "%s\n", _bufferContent);
        if (_file) {
            fprintf(_file.get(), "%s %s\n", getTimeString().c_str(), _bufferContent);
            fflush(_file.get());
        }
        _bufferContent[0] = '\0';
    }

    static void debugLoggerManaged(const char* format, ...) {

        auto logging = Singleton<LoggingManager>::instance();
        if (!logging)
            return;

        std::lock_guard<std::mutex> guard(_bufferMutex);

        va_list args;
        va_start(args, format);
        const int printed = vsnprintf(_bufferContent + _bufferOffset, static_cast<size_t>(_bufferLength - _bufferOffset), format, args);
        va_end(args);
        if (printed < 0)
            return;

        _bufferOffset = (printed >= (_bufferLength - _bufferOffset)) ? (_bufferLength - 1) : (_bufferOffset + printed);
        if (_bufferOffset == (_bufferLength - 1) || (_bufferOffset > 0 && _bufferContent[_bufferOffset - 1] == '\n'))
            logging->flush();
    }
#else
public:
    explicit LoggingManager(const Config&)
        : Singleton<LoggingManager>(this) {}
#endif
};

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
