#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "backtest/backtest_engine.hpp"
#include "stock_info.hpp"
#include "strategy/istrategy.hpp"
#include "sweep/evaluator.hpp"
#include "sweep/parameter_space.hpp"

/**
 * @brief Scores a combination by backtesting a freshly built strategy.
 *
 * Binding targets are captured from the ParameterSpace at construction, so
 * an evaluation only walks the combination's entries in declaration order.
 * Each evaluation owns its strategy and account, which makes the evaluator
 * safe to share between workers.
 *
 * Output fields: total_return_pct, win_rate, max_drawdown_pct, sharpe_ratio,
 * score, trades, final_capital, strategy.
 */
class StrategyEvaluator: public sweep::IEvaluator {
   public:
    /**
     * @param strategy Strategy name ("ma_crossover").
     * @param space    Declared distributions of the sweep.
     * @param data     Price history shared by all evaluations.
     * @param settings Backtest settings.
     * @throws sweep::ConfigurationError if the strategy is unknown or data is null.
     */
    StrategyEvaluator(const std::string& strategy, const sweep::ParameterSpace& space,
                      std::shared_ptr<const StockInfo> data, BacktestSettings settings = {});

    [[nodiscard]] nlohmann::json evaluate(const sweep::Combination& combination) override;

    /**
     * @brief Instantiate a strategy with default parameters.
     * @return nullptr for unknown names.
     */
    [[nodiscard]] static std::unique_ptr<IStrategy> makeStrategy(const std::string& name);

    [[nodiscard]] static nlohmann::json toJson(const BacktestResult& result);

   private:
    std::string                                               strategy_;
    std::vector<std::pair<std::string, sweep::BindingTarget>> bindings_;
    std::shared_ptr<const StockInfo>                          data_;
    BacktestEngine                                            engine_;
};
