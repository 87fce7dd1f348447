// =================================================================
// include/Maestro/Errors.hpp
// =================================================================
// Exception types raised by the orchestration core.

#pragma once

#include <stdexcept>
#include <string>

namespace Maestro {

/**
 * @brief Base class for every failure raised by the orchestration core
 *
 * All failures are scoped to a single task or allocation attempt.
 */
class OrchestrationError : public std::runtime_error {
public:
    explicit OrchestrationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A model cannot fit in the configured memory ceiling
 */
class InsufficientMemoryError : public OrchestrationError {
public:
    explicit InsufficientMemoryError(const std::string& message)
        : OrchestrationError(message) {}
};

/**
 * @brief The resource pool cannot satisfy a route even after shrinking it
 */
class AllocationInfeasibleError : public OrchestrationError {
public:
    explicit AllocationInfeasibleError(const std::string& message)
        : OrchestrationError(message) {}
};

/**
 * @brief Malformed task requirements; never retried internally
 */
class ValidationError : public OrchestrationError {
public:
    explicit ValidationError(const std::string& message)
        : OrchestrationError(message) {}
};

/**
 * @brief Wraps failures of the model backend and missing/unsuitable models
 */
class ModelOrchestratorError : public OrchestrationError {
public:
    explicit ModelOrchestratorError(const std::string& message)
        : OrchestrationError(message) {}
};

/**
 * @brief Configuration file could not be read or holds invalid values
 */
class ConfigError : public OrchestrationError {
public:
    explicit ConfigError(const std::string& message)
        : OrchestrationError(message) {}
};

} // namespace Maestro
