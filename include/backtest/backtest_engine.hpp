#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "strategy/istrategy.hpp"

struct Trade {
    std::size_t buyIndex  = 0;
    std::size_t sellIndex = 0;
    double      buyPrice  = 0.0;
    double      sellPrice = 0.0;
    double      returnPct = 0.0;  // (sellPrice - buyPrice) / buyPrice * 100
};

struct BacktestSettings {
    double initialCapital = 10000.0;
    double commissionPct  = 0.0;  // fraction of traded notional, e.g. 0.001 = 0.1%
};

struct BacktestResult {
    std::string ticker;
    std::string strategyName;

    double initialCapital = 0.0;
    double finalCapital   = 0.0;

    /* ----- Score Components ----- */
    double totalReturnPct = 0.0;  // Total return percentage
    double winRate        = 0.0;  // Winning trades / Total trades (0~1)
    double maxDrawdownPct = 0.0;  // Maximum drawdown percentage (negative)
    double sharpeRatio    = 0.0;  // Annualized Sharpe ratio

    /* ----- Composite Score (0~100) ----- */
    double score = 0.0;

    /* ----- Trade History ----- */
    std::vector<Trade> trades;
};

/**
 * @brief Cash and position of one backtest run.
 *
 * Created fresh by every BacktestEngine::run() call; nothing is shared
 * between runs, so concurrent runs on one engine do not interfere.
 */
struct Account {
    double      cash     = 0.0;
    double      shares   = 0.0;
    bool        inPos    = false;
    double      buyPrice = 0.0;
    std::size_t buyIdx   = 0;

    [[nodiscard]] double equity(double price) const {
        return inPos ? shares * price : cash;
    }
};

/**
 * @brief Backtesting engine that simulates a strategy over historical data.
 *
 * All-in / all-out: a BUY invests all cash, a SELL liquidates the whole
 * position, and an open position is closed at the last price.
 */
class BacktestEngine {
   public:
    explicit BacktestEngine(BacktestSettings settings = {});

    /**
     * @brief Run the backtest.
     * @param strategy The investment strategy to evaluate (initialized here).
     * @param data     Historical stock data.
     * @return BacktestResult with all performance metrics and trade list.
     */
    [[nodiscard]] BacktestResult run(IStrategy& strategy, const StockInfo& data) const;

    [[nodiscard]] const BacktestSettings& settings() const {
        return settings_;
    }

    /**
     * @brief Compute composite score from individual metrics.
     *
     * Weights: TotalReturn(30%), WinRate(25%), Sharpe(25%), MDD(20%)
     */
    [[nodiscard]] static double computeScore(double totalReturnPct, double winRate, double maxDrawdownPct,
                                             double sharpeRatio);

   private:
    BacktestSettings settings_;

    void closePosition(Account& account, BacktestResult& result, std::size_t index, double price) const;
};
