#pragma once

#include <string>

namespace sweep {

/**
 * @brief Where in the strategy a distribution's value is bound.
 *
 * Resolved from its config name once, when the sweep is declared. The core
 * carries it through untouched; evaluators switch on it.
 */
enum class BindingTarget
{
    None,         // not bound to the strategy (bookkeeping / tests)
    FastWindow,   // fast moving average length
    SlowWindow,   // slow moving average length
    AverageKind,  // "sma" or "ema"
};

[[nodiscard]] std::string toString(BindingTarget target);

/**
 * @brief Parse a config name ("none", "fast_window", "slow_window", "average_kind").
 * @throws ConfigurationError for unknown names.
 */
[[nodiscard]] BindingTarget bindingTargetFromString(const std::string& name);

}  // namespace sweep
