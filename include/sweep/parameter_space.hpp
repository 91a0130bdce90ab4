#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sweep/binding_target.hpp"
#include "sweep/param_value.hpp"

namespace sweep {

/**
 * @brief One swept parameter: label, binding target and ordered candidates.
 */
struct ParameterDistribution {
    std::string             label;
    BindingTarget           target = BindingTarget::None;
    std::vector<ParamValue> values;
};

/**
 * @brief Distribution table of one sweep configuration.
 *
 * Declaration order is significant: it fixes the generation order and the
 * entry order of every Combination built from this space.
 */
class ParameterSpace {
   public:
    /**
     * @brief Register a distribution.
     *
     * Duplicate candidate values are collapsed, keeping the first occurrence.
     *
     * @throws ConfigurationError if the label is empty or already declared,
     *         if values is empty, or if values mix numbers and strings.
     */
    const ParameterDistribution& declare(const std::string& label, BindingTarget target,
                                         const std::vector<ParamValue>& values);

    /**
     * @brief Ordered candidate values of a declared distribution.
     * @throws ConfigurationError for unknown labels.
     */
    [[nodiscard]] const std::vector<ParamValue>& valuesOf(const std::string& label) const;

    [[nodiscard]] const ParameterDistribution& at(const std::string& label) const;

    /**
     * @brief Declaration position of a label.
     * @throws ConfigurationError for unknown labels.
     */
    [[nodiscard]] std::size_t indexOf(const std::string& label) const;

    [[nodiscard]] bool contains(const std::string& label) const;

    [[nodiscard]] std::size_t size() const {
        return distributions_.size();
    }

    [[nodiscard]] bool empty() const {
        return distributions_.empty();
    }

    [[nodiscard]] const std::vector<ParameterDistribution>& distributions() const {
        return distributions_;
    }

   private:
    std::vector<ParameterDistribution> distributions_;
};

// Largest candidate set integerRange() will expand.
constexpr std::size_t kMaxRangeValues = 1000000;

/**
 * @brief Inclusive integer range [start, stop] with the given step.
 * @throws ConfigurationError if step <= 0, stop < start, or the range has
 *         more than kMaxRangeValues members.
 */
[[nodiscard]] std::vector<ParamValue> integerRange(long long start, long long stop, long long step = 1);

}  // namespace sweep
