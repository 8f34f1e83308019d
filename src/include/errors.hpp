#pragma once
#include <stdexcept>
#include <string>

namespace courier {

// SQLite open/prepare/step failure.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// Raised from inside a task body; the executor marks the task failed.
class ExecutionFailure : public std::runtime_error {
public:
    explicit ExecutionFailure(const std::string& what) : std::runtime_error(what) {}
};

// Background poll ceiling exceeded.
class TaskTimeout : public ExecutionFailure {
public:
    explicit TaskTimeout(const std::string& what) : ExecutionFailure(what) {}
};

} // namespace courier
