#pragma once

#include <stdexcept>
#include <string>

namespace WorkflowEngine {

/**
 * @class StoreError
 * @brief A cache or relational store could not serve a request
 *
 * Not recovered locally: aborts the current evaluate or commit call and
 * leaves the retry decision to the caller.
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace WorkflowEngine
