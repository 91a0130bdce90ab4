#pragma once

#include <nlohmann/json.hpp>

#include "sweep/combination.hpp"

namespace sweep {

/**
 * @brief Scores one combination (typically by running a backtest).
 *
 * The scheduler treats the returned document as opaque and only associates
 * it with the combination that produced it. Failures are reported by
 * throwing (EvaluationError or any std::exception).
 */
struct IEvaluator {
    virtual ~IEvaluator() = default;

    /**
     * @brief Evaluate one combination.
     * @throws EvaluationError (or any std::exception) on failure.
     */
    [[nodiscard]] virtual nlohmann::json evaluate(const Combination& combination) = 0;

    /**
     * @brief Whether evaluate() may run concurrently on several workers.
     *        Non-reentrant evaluators are always dispatched sequentially.
     */
    [[nodiscard]] virtual bool reentrant() const {
        return true;
    }
};

}  // namespace sweep
