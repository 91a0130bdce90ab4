#pragma once

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "stock_info.hpp"
#include "sweep/combination.hpp"
#include "sweep/errors.hpp"
#include "sweep/evaluator.hpp"
#include "sweep/sweep_config.hpp"

namespace testing_support {

/**
 * @brief Sums the numeric parameters and counts invocations.
 *        Combinations listed in failOn raise EvaluationError.
 */
class CountingEvaluator: public sweep::IEvaluator {
   public:
    explicit CountingEvaluator(std::set<std::string> failOn = {}, bool reentrant = true)
        : failOn_(std::move(failOn))
        , reentrant_(reentrant) {}

    nlohmann::json evaluate(const sweep::Combination& combination) override {
        calls_.fetch_add(1);
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        if (failOn_.count(combination.toString()) != 0) {
            throw sweep::EvaluationError("rejected " + combination.toString());
        }

        double sum = 0.0;
        for (const auto& entry : combination.entries()) {
            if (sweep::isNumeric(entry.second)) {
                sum += static_cast<double>(sweep::asInteger(entry.second));
            }
        }
        return {{"score", sum}, {"label", combination.toString()}};
    }

    bool reentrant() const override {
        return reentrant_;
    }

    void setDelay(std::chrono::milliseconds delay) {
        delay_ = delay;
    }

    int calls() const {
        return calls_.load();
    }

   private:
    std::set<std::string>     failOn_;
    bool                      reentrant_;
    std::chrono::milliseconds delay_{0};
    std::atomic<int>          calls_{0};
};

/**
 * @brief Unique scratch directory under the system temp path, removed on destruction.
 */
class TempDir {
   public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path()
              / ("ma_sweep_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const {
        return path_;
    }

    std::string str() const {
        return path_.string();
    }

   private:
    std::filesystem::path path_;
};

/**
 * @brief Slow sine wave on an upward drift: several crossovers for short windows.
 */
inline std::shared_ptr<StockInfo> syntheticPrices(std::size_t bars = 400) {
    auto data    = std::make_shared<StockInfo>();
    data->ticker = "SYN";
    for (std::size_t i = 0; i < bars; ++i) {
        const double t     = static_cast<double>(i);
        const double price = 100.0 + 0.05 * t + 10.0 * std::sin(t / 15.0);
        data->timestamps.push_back(1577836800 + static_cast<int64_t>(i) * 86400);
        data->open.push_back(price);
        data->high.push_back(price + 1.0);
        data->low.push_back(price - 1.0);
        data->close.push_back(price);
        data->volume.push_back(1000);
    }
    return data;
}

/**
 * @brief fast in {1,2,3}, slow in {2,3}, fast < slow.
 */
inline sweep::SweepConfig smallConfig() {
    sweep::SweepConfig cfg;
    cfg.strategy      = "counting";
    cfg.distributions = {
        {"fast", sweep::BindingTarget::FastWindow, {1LL, 2LL, 3LL}},
        {"slow", sweep::BindingTarget::SlowWindow, {2LL, 3LL}},
    };
    cfg.constraints       = {{"fast_below_slow", "fast", "slow", "<"}};
    cfg.execution.workers = 1;
    return cfg;
}

}  // namespace testing_support
