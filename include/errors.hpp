#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace credpool {

// Root of every failure raised by the pool, the store and the generator.
class PoolError : public std::runtime_error {
public:
    explicit PoolError(const std::string& what) : std::runtime_error(what) {}
};

// The store had no allocatable row. Handled internally by an emergency refill.
class PoolExhausted : public PoolError {
public:
    explicit PoolExhausted(const std::string& what) : PoolError(what) {}
};

// Even a direct generator batch could not produce a usable credential.
class RefillFailed : public PoolExhausted {
public:
    explicit RefillFailed(const std::string& what) : PoolExhausted(what) {}
};

class GeneratorError : public PoolError {
public:
    GeneratorError(const std::string& what, std::string stderr_output)
        : PoolError(what), stderr_output_(std::move(stderr_output)) {}

    // Tail of the generator's error stream at the time of failure.
    const std::string& stderr_output() const { return stderr_output_; }

private:
    std::string stderr_output_;
};

// Broken pipe, unexpected stream closure, timeout or unparsable response.
class GeneratorIPCError : public GeneratorError {
public:
    explicit GeneratorIPCError(const std::string& what, std::string stderr_output = "")
        : GeneratorError(what, std::move(stderr_output)) {}
};

// The process could not be spawned or never announced readiness.
class GeneratorStartupError : public GeneratorError {
public:
    explicit GeneratorStartupError(const std::string& what, std::string stderr_output = "")
        : GeneratorError(what, std::move(stderr_output)) {}
};

// Any failure of the persistent store. Store state is left unchanged.
class StoreError : public PoolError {
public:
    explicit StoreError(const std::string& what) : PoolError(what) {}
};

}
