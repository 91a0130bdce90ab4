#pragma once

#include <cstddef>
#include <vector>

namespace indicator {

/**
 * @brief Compute Simple Moving Average (SMA).
 * @param prices  Input price series.
 * @param window  Window size for the moving average.
 * @return        SMA values. Size = prices.size() - window + 1.
 *                An empty vector is returned if prices.size() < window.
 */
[[nodiscard]] inline std::vector<double> sma(const std::vector<double>& prices, std::size_t window) {
    if (window == 0 || prices.size() < window) {
        return {};
    }

    std::vector<double> result;
    result.reserve(prices.size() - window + 1);

    double sum = 0.0;
    for (std::size_t i = 0; i < window; ++i) {
        sum += prices[i];
    }
    result.push_back(sum / static_cast<double>(window));

    for (std::size_t i = window; i < prices.size(); ++i) {
        sum += prices[i] - prices[i - window];
        result.push_back(sum / static_cast<double>(window));
    }

    return result;
}

/**
 * @brief Compute Exponential Moving Average (EMA).
 * @param prices  Input price series.
 * @param window  Span of the average; smoothing factor is 2 / (window + 1).
 * @return        EMA values, aligned like sma(): element 0 corresponds to
 *                prices[window - 1] and is seeded with the SMA of the first
 *                window prices. Empty if prices.size() < window.
 */
[[nodiscard]] inline std::vector<double> ema(const std::vector<double>& prices, std::size_t window) {
    if (window == 0 || prices.size() < window) {
        return {};
    }

    std::vector<double> result;
    result.reserve(prices.size() - window + 1);

    double seed = 0.0;
    for (std::size_t i = 0; i < window; ++i) {
        seed += prices[i];
    }
    double value = seed / static_cast<double>(window);
    result.push_back(value);

    const double alpha = 2.0 / (static_cast<double>(window) + 1.0);
    for (std::size_t i = window; i < prices.size(); ++i) {
        value = alpha * prices[i] + (1.0 - alpha) * value;
        result.push_back(value);
    }

    return result;
}

}  // namespace indicator
