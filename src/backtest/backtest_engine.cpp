#include "backtest/backtest_engine.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

BacktestEngine::BacktestEngine(BacktestSettings settings)
    : settings_(settings) {}

void BacktestEngine::closePosition(Account& account, BacktestResult& result, std::size_t index,
                                   double price) const {
    account.cash = account.shares * price * (1.0 - settings_.commissionPct);

    Trade trade;
    trade.buyIndex  = account.buyIdx;
    trade.sellIndex = index;
    trade.buyPrice  = account.buyPrice;
    trade.sellPrice = price;
    trade.returnPct = (price - account.buyPrice) / account.buyPrice * 100.0;
    result.trades.push_back(trade);

    account.shares = 0.0;
    account.inPos  = false;
}

BacktestResult BacktestEngine::run(IStrategy& strategy, const StockInfo& data) const {
    BacktestResult result;
    result.ticker         = data.ticker;
    result.strategyName   = strategy.name();
    result.initialCapital = settings_.initialCapital;

    if (data.close.empty()) {
        result.finalCapital = settings_.initialCapital;
        return result;
    }

    strategy.init(data);

    const auto warmup = strategy.warmupPeriod();
    const auto n      = data.close.size();

    Account account;
    account.cash = settings_.initialCapital;

    // Equity curve for drawdown & sharpe calculation
    std::vector<double> equity;
    equity.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        const double price = data.close[i];
        equity.push_back(account.equity(price));

        if (i < warmup) {
            continue;
        }

        const auto signal = strategy.evaluate(data, i);

        if (signal == Signal::BUY && !account.inPos && price > 0.0) {
            account.shares   = account.cash * (1.0 - settings_.commissionPct) / price;
            account.buyPrice = price;
            account.buyIdx   = i;
            account.inPos    = true;
            account.cash     = 0.0;
        } else if (signal == Signal::SELL && account.inPos) {
            closePosition(account, result, i, price);
        }
    }

    if (account.inPos) {
        closePosition(account, result, n - 1, data.close.back());
    }

    result.finalCapital = account.cash;

    // --- Compute metrics ---

    // 1. Total Return
    result.totalReturnPct = (result.finalCapital - settings_.initialCapital) / settings_.initialCapital * 100.0;

    // 2. Win Rate
    if (!result.trades.empty()) {
        const auto wins =
            std::count_if(result.trades.begin(), result.trades.end(), [](const Trade& t) { return t.returnPct > 0.0; });
        result.winRate = static_cast<double>(wins) / static_cast<double>(result.trades.size());
    }

    // 3. Max Drawdown
    double peak  = equity[0];
    double maxDD = 0.0;
    for (const auto& eq : equity) {
        peak = std::max(peak, eq);
        if (peak > 0.0) {
            maxDD = std::min(maxDD, (eq - peak) / peak * 100.0);
        }
    }
    result.maxDrawdownPct = maxDD;

    // 4. Sharpe Ratio (annualized, assuming daily data, risk-free = 0)
    if (equity.size() > 1) {
        std::vector<double> dailyReturns;
        dailyReturns.reserve(equity.size() - 1);
        for (std::size_t i = 1; i < equity.size(); ++i) {
            if (equity[i - 1] > 0.0) {
                dailyReturns.push_back((equity[i] - equity[i - 1]) / equity[i - 1]);
            }
        }

        if (!dailyReturns.empty()) {
            const double mean = std::accumulate(dailyReturns.begin(), dailyReturns.end(), 0.0)
                              / static_cast<double>(dailyReturns.size());

            double variance = 0.0;
            for (const auto& r : dailyReturns) {
                variance += (r - mean) * (r - mean);
            }
            variance /= static_cast<double>(dailyReturns.size());

            const double stdDev = std::sqrt(variance);
            if (stdDev > 1e-12) {
                result.sharpeRatio = (mean / stdDev) * std::sqrt(252.0);
            }
        }
    }

    // 5. Composite Score
    result.score = computeScore(result.totalReturnPct, result.winRate, result.maxDrawdownPct, result.sharpeRatio);

    return result;
}

double BacktestEngine::computeScore(double totalReturnPct, double winRate, double maxDrawdownPct, double sharpeRatio) {
    // Each component is normalized to [0, 1], then weighted.

    // Total Return: clamp to [-50, 100]
    const double retNorm = std::clamp((totalReturnPct + 50.0) / 150.0, 0.0, 1.0);

    const double wrNorm = std::clamp(winRate, 0.0, 1.0);

    // Max Drawdown: 0% -> 1.0, -50% -> 0.0
    const double mddNorm = std::clamp(1.0 + (maxDrawdownPct / 50.0), 0.0, 1.0);

    // Sharpe Ratio: clamp to [-1, 3]
    const double sharpeNorm = std::clamp((sharpeRatio + 1.0) / 4.0, 0.0, 1.0);

    const double weighted = (retNorm * 0.30) + (wrNorm * 0.25) + (mddNorm * 0.20) + (sharpeNorm * 0.25);

    return std::clamp(weighted * 100.0, 0.0, 100.0);
}
