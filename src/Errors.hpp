// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#ifndef __DPS150_ERRORS_HPP__
#define __DPS150_ERRORS_HPP__

#include <stdexcept>
#include <string>

namespace dps150 {

// -----------------------------------------------------------------------------------------------

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what)
        : std::runtime_error(what) {}
};

// open/write/read failure, or a command issued to a session that is not streaming
class TransportError : public Error {
public:
    explicit TransportError(const std::string& what)
        : Error(what) {}
};

// connect or initialize failed, session rolled back to Disconnected
class ConnectError : public TransportError {
public:
    explicit ConnectError(const std::string& what)
        : TransportError(what) {}
};

// argument outside protocol range, rejected before any I/O
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what)
        : Error(what) {}
};

class EncodingError : public ValidationError {
public:
    explicit EncodingError(const std::string& what)
        : ValidationError(what) {}
};

// -----------------------------------------------------------------------------------------------

}    // namespace dps150

#endif

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
