#include "ma_crossover.hpp"

#include <stdexcept>

#include "indicator.hpp"
#include "sweep/errors.hpp"

namespace {

std::size_t positiveWindow(const sweep::ParamValue& value, const char* what) {
    long long n = 0;
    try {
        n = sweep::asInteger(value);
    } catch (const std::invalid_argument& e) {
        throw sweep::EvaluationError(std::string(what) + ": " + e.what());
    }
    if (n <= 0) {
        throw sweep::EvaluationError(std::string(what) + " must be positive, got " + std::to_string(n));
    }
    return static_cast<std::size_t>(n);
}

}  // namespace

MaCrossover::MaCrossover(std::size_t fastWindow, std::size_t slowWindow, AverageKind kind)
    : fastWindow_(fastWindow)
    , slowWindow_(slowWindow)
    , kind_(kind) {}

std::string MaCrossover::name() const {
    const std::string tag = kind_ == AverageKind::Simple ? "SMA" : "EMA";
    return tag + " Crossover (" + std::to_string(fastWindow_) + "/" + std::to_string(slowWindow_) + ")";
}

void MaCrossover::bind(sweep::BindingTarget target, const sweep::ParamValue& value) {
    switch (target) {
        case sweep::BindingTarget::None:
            return;
        case sweep::BindingTarget::FastWindow:
            fastWindow_ = positiveWindow(value, "fast window");
            return;
        case sweep::BindingTarget::SlowWindow:
            slowWindow_ = positiveWindow(value, "slow window");
            return;
        case sweep::BindingTarget::AverageKind: {
            const auto text = sweep::toString(value);
            if (text == "sma") {
                kind_ = AverageKind::Simple;
            } else if (text == "ema") {
                kind_ = AverageKind::Exponential;
            } else {
                throw sweep::EvaluationError("unknown average kind '" + text + "'");
            }
            return;
        }
    }
    throw sweep::EvaluationError("MA crossover cannot bind " + sweep::toString(target));
}

void MaCrossover::validate() const {
    if (fastWindow_ == 0 || slowWindow_ == 0) {
        throw sweep::EvaluationError("moving average windows must be positive");
    }
    if (fastWindow_ >= slowWindow_) {
        throw sweep::EvaluationError("fast window " + std::to_string(fastWindow_)
                                     + " must be shorter than slow window " + std::to_string(slowWindow_));
    }
}

void MaCrossover::init(const StockInfo& data) {
    const auto& prices = data.close;

    if (kind_ == AverageKind::Simple) {
        fast_ = indicator::sma(prices, fastWindow_);
        slow_ = indicator::sma(prices, slowWindow_);
    } else {
        fast_ = indicator::ema(prices, fastWindow_);
        slow_ = indicator::ema(prices, slowWindow_);
    }
}

std::size_t MaCrossover::warmupPeriod() const {
    // Need the slow average at index - 1 for crossover detection.
    return slowWindow_;
}

double MaCrossover::fastAt(std::size_t index) const {
    return fast_[index + 1 - fastWindow_];
}

double MaCrossover::slowAt(std::size_t index) const {
    return slow_[index + 1 - slowWindow_];
}

Signal MaCrossover::evaluate(const StockInfo& /* data */, std::size_t index) {
    if (index < slowWindow_ || index < fastWindow_ || fast_.empty() || slow_.empty()) {
        return Signal::HOLD;
    }
    if (index + 1 - slowWindow_ >= slow_.size() || index + 1 - fastWindow_ >= fast_.size()) {
        return Signal::HOLD;
    }

    const double prevFast = fastAt(index - 1);
    const double prevSlow = slowAt(index - 1);
    const double currFast = fastAt(index);
    const double currSlow = slowAt(index);

    // Golden cross
    if (prevFast <= prevSlow && currFast > currSlow) {
        return Signal::BUY;
    }

    // Death cross
    if (prevFast >= prevSlow && currFast < currSlow) {
        return Signal::SELL;
    }

    return Signal::HOLD;
}
