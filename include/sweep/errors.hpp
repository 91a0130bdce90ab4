#pragma once

#include <stdexcept>
#include <string>

namespace sweep {

/**
 * @brief Base class of every error raised by the sweep core.
 */
class SweepError: public std::runtime_error {
   public:
    explicit SweepError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Malformed sweep declaration (unknown or duplicate labels, empty
 *        candidate sets, unsupported operators, bad config documents).
 *
 * Raised while the sweep is being configured, before anything is generated
 * or evaluated.
 */
class ConfigurationError: public SweepError {
   public:
    explicit ConfigurationError(const std::string& what)
        : SweepError("configuration error: " + what) {}
};

/**
 * @brief Evaluation of a single combination failed.
 *
 * Evaluators throw this (or any std::exception); the scheduler records it
 * as a failed row and carries on with the remaining combinations.
 */
class EvaluationError: public SweepError {
   public:
    explicit EvaluationError(const std::string& what)
        : SweepError(what) {}
};

/**
 * @brief Loading or saving a result set failed.
 */
class PersistenceError: public SweepError {
   public:
    explicit PersistenceError(const std::string& what)
        : SweepError("persistence error: " + what) {}
};

}  // namespace sweep
