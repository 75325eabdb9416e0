#pragma once

#include <stdexcept>
#include <string>

namespace crosstrade {

// Root of every failure the engine raises on purpose.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what) : std::runtime_error(what) {}
};

// Not enough bars for the requested indicator periods or backtest range.
class InsufficientDataError : public EngineError {
public:
    explicit InsufficientDataError(const std::string& what) : EngineError(what) {}
};

// Malformed date range or non-increasing timestamps.
class InvalidRangeError : public EngineError {
public:
    explicit InvalidRangeError(const std::string& what) : EngineError(what) {}
};

class InvalidConfigError : public EngineError {
public:
    explicit InvalidConfigError(const std::string& what) : EngineError(what) {}
};

// Raised by execution adapters; the engine surfaces it and never retries.
class ExecutionError : public EngineError {
public:
    explicit ExecutionError(const std::string& what) : EngineError(what) {}
};

class DataUnavailableError : public EngineError {
public:
    explicit DataUnavailableError(const std::string& what) : EngineError(what) {}
};

class CancelledError : public EngineError {
public:
    explicit CancelledError(const std::string& what) : EngineError(what) {}
};

} // namespace crosstrade
