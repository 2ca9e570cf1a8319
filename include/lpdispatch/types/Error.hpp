#pragma once
#include <stdexcept>
#include <string>

namespace lpdispatch::types {

class DispatchException : public std::runtime_error {
public:
    explicit DispatchException(const std::string& msg)
        : std::runtime_error(msg) {}
};

class ScratchIoException : public DispatchException {
public:
    explicit ScratchIoException(const std::string& msg)
        : DispatchException("Scratch storage error: " + msg) {}
};

class ConfigException : public DispatchException {
public:
    explicit ConfigException(const std::string& msg)
        : DispatchException("Configuration error: " + msg) {}
};

}
