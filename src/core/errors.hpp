#pragma once

#include <stdexcept>
#include <string>

namespace sandforge {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Source could not be parsed; never reaches the sandbox.
class SyntaxError : public Error {
public:
    SyntaxError(const std::string& message, int line, int column)
        : Error(message + " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")")
        , detail_(message)
        , line_(line)
        , column_(column) {}

    const std::string& Detail() const { return detail_; }
    int Line() const { return line_; }
    int Column() const { return column_; }

private:
    std::string detail_;
    int line_ = 0;
    int column_ = 0;
};

class SecurityViolation : public Error {
public:
    using Error::Error;
};

class ExecutionTimeout : public Error {
public:
    using Error::Error;
};

class ExecutionMemoryExceeded : public Error {
public:
    using Error::Error;
};

class ExecutionRuntimeError : public Error {
public:
    using Error::Error;
};

// The code generator could not produce a candidate; the run cannot progress.
class GeneratorUnavailable : public Error {
public:
    using Error::Error;
};

// The result cache failed; callers bypass it instead of failing the run.
class CacheUnavailable : public Error {
public:
    using Error::Error;
};

class Cancelled : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

}  // namespace sandforge
