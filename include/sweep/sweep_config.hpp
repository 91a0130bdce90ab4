#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sweep/binding_target.hpp"
#include "sweep/combination_generator.hpp"
#include "sweep/param_value.hpp"
#include "sweep/sweep_scheduler.hpp"

namespace sweep {

struct DistributionSpec {
    std::string             label;
    BindingTarget           target = BindingTarget::None;
    std::vector<ParamValue> values;
};

struct ConstraintSpec {
    std::string label;
    std::string left;
    std::string right;
    std::string op;
};

/**
 * @brief Declarative description of one sweep.
 */
struct SweepConfig {
    std::string strategy = "ma_crossover";

    /**
     * @brief Everything besides the parameters that changes evaluator output
     *        (data source, backtest settings). Part of the sweep identity.
     */
    nlohmann::json evaluatorKey = nlohmann::json::object();

    std::vector<DistributionSpec> distributions;
    std::vector<ConstraintSpec>   constraints;
    SamplingOptions               sampling;
    SchedulerOptions              execution;
};

/**
 * @brief Build a SweepConfig from a parsed document.
 *
 * Reads "strategy", "distributions", "constraints", "sampling" and
 * "execution"; "data" and "backtest" are copied into evaluatorKey.
 * A missing "execution.workers" resolves to defaultWorkerCount().
 *
 * @throws ConfigurationError for missing or mistyped fields.
 */
[[nodiscard]] SweepConfig parseSweepConfig(const nlohmann::json& doc);

/**
 * @brief Read and parse a JSON config file.
 * @throws ConfigurationError if the file cannot be opened or parsed.
 */
[[nodiscard]] nlohmann::json readConfigFile(const std::string& path);

}  // namespace sweep
