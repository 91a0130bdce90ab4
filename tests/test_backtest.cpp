#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "backtest/backtest_engine.hpp"
#include "backtest/strategy_evaluator.hpp"
#include "fixtures.hpp"
#include "indicator.hpp"
#include "ma_crossover.hpp"
#include "sweep/errors.hpp"
#include "sweep/sweep.hpp"

namespace {

using testing_support::syntheticPrices;

// Flat at 100 for 30 bars, then rising by 1 per bar: one golden cross, no death cross.
StockInfo flatThenRising(std::size_t bars = 60) {
    StockInfo data;
    data.ticker = "UP";
    for (std::size_t i = 0; i < bars; ++i) {
        const double price = i < 30 ? 100.0 : 100.0 + static_cast<double>(i - 29);
        data.timestamps.push_back(static_cast<int64_t>(i) * 86400);
        data.open.push_back(price);
        data.high.push_back(price);
        data.low.push_back(price);
        data.close.push_back(price);
        data.volume.push_back(0);
    }
    return data;
}

sweep::Combination combo(long long fast, long long slow, const std::string& kind) {
    return sweep::Combination(std::vector<sweep::Combination::Entry>{{"fast", fast}, {"slow", slow}, {"kind", kind}});
}

sweep::ParameterSpace maSpace() {
    sweep::ParameterSpace space;
    space.declare("fast", sweep::BindingTarget::FastWindow, {5LL, 10LL});
    space.declare("slow", sweep::BindingTarget::SlowWindow, {20LL, 40LL});
    space.declare("kind", sweep::BindingTarget::AverageKind, {std::string("sma"), std::string("ema")});
    return space;
}

TEST(IndicatorTest, SimpleMovingAverage) {
    const auto values = indicator::sma({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
    ASSERT_EQ(values.size(), 3U);
    EXPECT_DOUBLE_EQ(values[0], 2.0);
    EXPECT_DOUBLE_EQ(values[2], 4.0);
    EXPECT_TRUE(indicator::sma({1.0, 2.0}, 3).empty());
    EXPECT_TRUE(indicator::sma({1.0, 2.0}, 0).empty());
}

TEST(IndicatorTest, ExponentialMovingAverageSeedsWithSimple) {
    const auto values = indicator::ema({1.0, 2.0, 3.0, 4.0}, 3);
    ASSERT_EQ(values.size(), 2U);
    EXPECT_DOUBLE_EQ(values[0], 2.0);
    EXPECT_DOUBLE_EQ(values[1], 0.5 * 4.0 + 0.5 * 2.0);
}

TEST(MaCrossoverTest, BindsParameters) {
    MaCrossover strategy;
    strategy.bind(sweep::BindingTarget::FastWindow, 7LL);
    strategy.bind(sweep::BindingTarget::SlowWindow, 30.0);
    strategy.bind(sweep::BindingTarget::AverageKind, std::string("ema"));
    strategy.bind(sweep::BindingTarget::None, std::string("ignored"));

    EXPECT_EQ(strategy.fastWindow(), 7U);
    EXPECT_EQ(strategy.slowWindow(), 30U);
    EXPECT_EQ(strategy.kind(), AverageKind::Exponential);
    EXPECT_EQ(strategy.warmupPeriod(), 30U);
    EXPECT_EQ(strategy.name(), "EMA Crossover (7/30)");
    EXPECT_NO_THROW(strategy.validate());
}

TEST(MaCrossoverTest, RejectsInvalidParameters) {
    MaCrossover strategy;
    EXPECT_THROW(strategy.bind(sweep::BindingTarget::FastWindow, 2.5), sweep::EvaluationError);
    EXPECT_THROW(strategy.bind(sweep::BindingTarget::FastWindow, 0LL), sweep::EvaluationError);
    EXPECT_THROW(strategy.bind(sweep::BindingTarget::SlowWindow, std::string("long")), sweep::EvaluationError);
    EXPECT_THROW(strategy.bind(sweep::BindingTarget::AverageKind, std::string("wma")), sweep::EvaluationError);

    MaCrossover inverted(50, 20);
    EXPECT_THROW(inverted.validate(), sweep::EvaluationError);
    MaCrossover equal(20, 20);
    EXPECT_THROW(equal.validate(), sweep::EvaluationError);
}

TEST(MaCrossoverTest, DetectsGoldenCross) {
    const auto  data = flatThenRising();
    MaCrossover strategy(3, 10);
    strategy.init(data);

    EXPECT_EQ(strategy.evaluate(data, 29), Signal::HOLD);
    EXPECT_EQ(strategy.evaluate(data, 30), Signal::BUY);
    EXPECT_EQ(strategy.evaluate(data, 31), Signal::HOLD);
    EXPECT_EQ(strategy.evaluate(data, 5), Signal::HOLD);
}

TEST(BacktestEngineTest, SingleTradeOnRisingPrices) {
    const auto           data = flatThenRising();
    MaCrossover          strategy(3, 10);
    const BacktestEngine engine;

    const auto result = engine.run(strategy, data);

    ASSERT_EQ(result.trades.size(), 1U);
    EXPECT_EQ(result.trades[0].buyIndex, 30U);
    EXPECT_EQ(result.trades[0].sellIndex, data.size() - 1);
    EXPECT_DOUBLE_EQ(result.winRate, 1.0);
    EXPECT_GT(result.totalReturnPct, 0.0);
    EXPECT_DOUBLE_EQ(result.maxDrawdownPct, 0.0);
    EXPECT_DOUBLE_EQ(result.finalCapital, 10000.0 * data.close.back() / data.close[30]);
    EXPECT_GE(result.score, 0.0);
    EXPECT_LE(result.score, 100.0);
}

TEST(BacktestEngineTest, CommissionReducesCapital) {
    const auto  data = flatThenRising();
    MaCrossover a(3, 10);
    MaCrossover b(3, 10);

    const auto noFee   = BacktestEngine().run(a, data);
    const auto withFee = BacktestEngine(BacktestSettings{10000.0, 0.01}).run(b, data);

    EXPECT_LT(withFee.finalCapital, noFee.finalCapital);
    EXPECT_NEAR(withFee.finalCapital, noFee.finalCapital * 0.99 * 0.99, 1e-6);
}

TEST(BacktestEngineTest, RepeatedRunsDoNotShareState) {
    const auto           data = syntheticPrices();
    MaCrossover          strategy(5, 20);
    const BacktestEngine engine(BacktestSettings{2500.0, 0.0});

    const auto first  = engine.run(strategy, *data);
    const auto second = engine.run(strategy, *data);

    EXPECT_GT(first.trades.size(), 1U);
    EXPECT_DOUBLE_EQ(first.initialCapital, 2500.0);
    EXPECT_DOUBLE_EQ(first.finalCapital, second.finalCapital);
    EXPECT_EQ(first.trades.size(), second.trades.size());
    EXPECT_LE(first.maxDrawdownPct, 0.0);
}

TEST(BacktestEngineTest, EmptyDataKeepsCapital) {
    MaCrossover strategy(3, 10);
    const auto  result = BacktestEngine().run(strategy, StockInfo{});
    EXPECT_TRUE(result.trades.empty());
    EXPECT_DOUBLE_EQ(result.finalCapital, 10000.0);
}

TEST(StrategyEvaluatorTest, ScoresCombination) {
    StrategyEvaluator evaluator("ma_crossover", maSpace(), syntheticPrices());

    const auto out = evaluator.evaluate(combo(5, 20, "ema"));

    EXPECT_EQ(out["strategy"], "EMA Crossover (5/20)");
    for (const char* key : {"total_return_pct", "win_rate", "max_drawdown_pct", "sharpe_ratio", "score",
                            "trades", "final_capital"}) {
        EXPECT_TRUE(out.contains(key)) << key;
    }
    EXPECT_GT(out["trades"].get<int>(), 0);
    EXPECT_EQ(out, evaluator.evaluate(combo(5, 20, "ema")));
    EXPECT_NE(out, evaluator.evaluate(combo(5, 20, "sma")));
}

TEST(StrategyEvaluatorTest, RejectsUnknownStrategyAndMissingData) {
    EXPECT_THROW(StrategyEvaluator("rsi", maSpace(), syntheticPrices()), sweep::ConfigurationError);
    EXPECT_THROW(StrategyEvaluator("ma_crossover", maSpace(), nullptr), sweep::ConfigurationError);
    EXPECT_TRUE(StrategyEvaluator::makeStrategy("unknown") == nullptr);
    EXPECT_TRUE(StrategyEvaluator::makeStrategy("ma_crossover") != nullptr);
}

TEST(StrategyEvaluatorTest, InvalidCombinationsRaiseEvaluationError) {
    StrategyEvaluator evaluator("ma_crossover", maSpace(), syntheticPrices(100));

    EXPECT_THROW((void)evaluator.evaluate(combo(40, 20, "sma")), sweep::EvaluationError);
    EXPECT_THROW((void)evaluator.evaluate(combo(5, 200, "sma")), sweep::EvaluationError);
    EXPECT_THROW((void)evaluator.evaluate(combo(5, 20, "wma")), sweep::EvaluationError);

    const sweep::Combination partial(std::vector<sweep::Combination::Entry>{{"fast", 5LL}});
    EXPECT_THROW((void)evaluator.evaluate(partial), sweep::EvaluationError);
}

TEST(StrategyEvaluatorTest, SweepOverSyntheticPrices) {
    sweep::SweepConfig cfg;
    cfg.distributions = {
        {"fast", sweep::BindingTarget::FastWindow, sweep::integerRange(5, 30, 5)},
        {"slow", sweep::BindingTarget::SlowWindow, sweep::integerRange(20, 60, 10)},
        {"kind", sweep::BindingTarget::AverageKind, {std::string("sma"), std::string("ema")}},
    };
    cfg.constraints = {{"fast_below_slow", "fast", "slow", "<"}};

    cfg.execution.workers = 4;
    const sweep::Sweep parallel(cfg);
    cfg.execution.workers = 1;
    const sweep::Sweep sequential(cfg);

    const auto        prices = syntheticPrices();
    StrategyEvaluator evaluator(cfg.strategy, parallel.space(), prices);

    const auto a = parallel.run(evaluator);
    const auto b = sequential.run(evaluator);

    EXPECT_EQ(a.results.status(), sweep::SweepStatus::Complete);
    EXPECT_EQ(a.results.failureCount(), 0U);
    EXPECT_EQ(a.results.size(), parallel.combinations().size());
    EXPECT_EQ(a.results, b.results);
}

}  // namespace
