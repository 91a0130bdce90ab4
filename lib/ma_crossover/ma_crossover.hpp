#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "strategy/istrategy.hpp"

enum class AverageKind
{
    Simple,       // "sma"
    Exponential,  // "ema"
};

/**
 * @brief Moving average crossover strategy.
 *
 * Generates BUY when the fast average crosses above the slow average
 * (golden cross) and SELL when it crosses below (death cross).
 *
 * Bindable parameters: FastWindow, SlowWindow (positive integers, fast <
 * slow) and AverageKind ("sma" or "ema").
 */
class MaCrossover: public IStrategy {
   public:
    /**
     * @param fastWindow Fast average window (default: 20 days).
     * @param slowWindow Slow average window (default: 50 days).
     * @param kind       Simple or exponential averages.
     */
    explicit MaCrossover(std::size_t fastWindow = 20, std::size_t slowWindow = 50,
                         AverageKind kind = AverageKind::Simple);

    [[nodiscard]] std::string name() const override;

    void bind(sweep::BindingTarget target, const sweep::ParamValue& value) override;

    void validate() const override;

    void init(const StockInfo& data) override;

    [[nodiscard]] std::size_t warmupPeriod() const override;

    [[nodiscard]] Signal evaluate(const StockInfo& data, std::size_t index) override;

    [[nodiscard]] std::size_t fastWindow() const {
        return fastWindow_;
    }

    [[nodiscard]] std::size_t slowWindow() const {
        return slowWindow_;
    }

    [[nodiscard]] AverageKind kind() const {
        return kind_;
    }

   private:
    std::size_t fastWindow_;
    std::size_t slowWindow_;
    AverageKind kind_;

    // fast_[i] belongs to data index (fastWindow_ - 1 + i),
    // slow_[i] to data index (slowWindow_ - 1 + i).
    std::vector<double> fast_;
    std::vector<double> slow_;

    [[nodiscard]] double fastAt(std::size_t index) const;
    [[nodiscard]] double slowAt(std::size_t index) const;
};
