#include "backtest/strategy_evaluator.hpp"

#include "ma_crossover.hpp"
#include "sweep/errors.hpp"

StrategyEvaluator::StrategyEvaluator(const std::string& strategy, const sweep::ParameterSpace& space,
                                     std::shared_ptr<const StockInfo> data, BacktestSettings settings)
    : strategy_(strategy)
    , data_(std::move(data))
    , engine_(settings) {
    if (!makeStrategy(strategy_)) {
        throw sweep::ConfigurationError("unknown strategy '" + strategy_ + "'");
    }
    if (!data_) {
        throw sweep::ConfigurationError("no price data for strategy '" + strategy_ + "'");
    }

    bindings_.reserve(space.size());
    for (const auto& dist : space.distributions()) {
        bindings_.emplace_back(dist.label, dist.target);
    }
}

std::unique_ptr<IStrategy> StrategyEvaluator::makeStrategy(const std::string& name) {
    if (name == "ma_crossover") {
        return std::make_unique<MaCrossover>();
    }
    return nullptr;
}

nlohmann::json StrategyEvaluator::toJson(const BacktestResult& result) {
    return {
        {"strategy", result.strategyName},
        {"total_return_pct", result.totalReturnPct},
        {"win_rate", result.winRate},
        {"max_drawdown_pct", result.maxDrawdownPct},
        {"sharpe_ratio", result.sharpeRatio},
        {"score", result.score},
        {"trades", result.trades.size()},
        {"final_capital", result.finalCapital},
    };
}

nlohmann::json StrategyEvaluator::evaluate(const sweep::Combination& combination) {
    const auto& entries = combination.entries();
    if (entries.size() != bindings_.size()) {
        throw sweep::EvaluationError("combination " + combination.toString() + " does not match the sweep");
    }

    auto strategy = makeStrategy(strategy_);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].first != bindings_[i].first) {
            throw sweep::EvaluationError("unexpected parameter '" + entries[i].first + "'");
        }
        strategy->bind(bindings_[i].second, entries[i].second);
    }
    strategy->validate();

    if (data_->size() <= strategy->warmupPeriod()) {
        throw sweep::EvaluationError("not enough data: " + std::to_string(data_->size()) + " bars for warmup of "
                                     + std::to_string(strategy->warmupPeriod()));
    }

    return toJson(engine_.run(*strategy, *data_));
}
