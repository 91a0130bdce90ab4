#pragma once

#include <cstddef>
#include <string>

#include "stock_info.hpp"
#include "sweep/binding_target.hpp"
#include "sweep/param_value.hpp"

enum class Signal
{
    BUY,
    SELL,
    HOLD,
};

/**
 * @brief Abstract interface for investment strategies.
 *
 * A strategy is configured through bind() (one call per swept parameter),
 * checked with validate(), then driven by the backtest engine: init() once,
 * evaluate() for each index past the warmup period. Each backtest run uses
 * its own strategy instance.
 */
struct IStrategy {
    virtual ~IStrategy() = default;

    /**
     * @brief Strategy display name, including its parameters.
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Set one parameter.
     * @throws sweep::EvaluationError if the target is unsupported or the value invalid.
     */
    virtual void bind(sweep::BindingTarget target, const sweep::ParamValue& value) = 0;

    /**
     * @brief Check the parameter set as a whole.
     * @throws sweep::EvaluationError if the parameters are inconsistent.
     */
    virtual void validate() const = 0;

    /**
     * @brief Initialize strategy with stock data (e.g., precompute indicators).
     * @param data Historical stock data.
     */
    virtual void init(const StockInfo& data) = 0;

    /**
     * @brief Minimum number of data points required before the strategy
     *        can produce meaningful signals.
     */
    [[nodiscard]] virtual std::size_t warmupPeriod() const = 0;

    /**
     * @brief Evaluate the strategy at a given time index.
     * @param data  Historical stock data.
     * @param index Current time step index (0-based).
     * @return BUY, SELL or HOLD
     */
    [[nodiscard]] virtual Signal evaluate(const StockInfo& data, std::size_t index) = 0;
};
