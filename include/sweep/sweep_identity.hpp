#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "sweep/combination_generator.hpp"
#include "sweep/constraint_set.hpp"
#include "sweep/parameter_space.hpp"

namespace sweep {

/**
 * @brief Deterministic key of a sweep.
 *
 * Covers the strategy name, the evaluator key, every distribution (label,
 * target, values), every constraint and the sampling parameters. Two sweeps
 * with the same identity produce the same result set. Execution settings
 * (worker count, timeout) are not part of it.
 */
struct SweepIdentity {
    std::string    strategy;
    nlohmann::json key;     // canonical document
    std::string    digest;  // 16 hex digits, FNV-1a 64 of key.dump()

    /**
     * @brief File-system friendly name, "<strategy>-<digest>".
     */
    [[nodiscard]] std::string stem() const;
};

[[nodiscard]] SweepIdentity makeIdentity(const std::string& strategy, const nlohmann::json& evaluatorKey,
                                         const ParameterSpace& space, const ConstraintSet& constraints,
                                         const SamplingOptions& sampling);

/**
 * @brief 64-bit FNV-1a of the input, as 16 lowercase hex digits.
 */
[[nodiscard]] std::string fnv1aHex(const std::string& data);

inline bool operator==(const SweepIdentity& a, const SweepIdentity& b) {
    return a.digest == b.digest && a.key == b.key;
}

}  // namespace sweep
