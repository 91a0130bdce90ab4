#include "sweep/parameter_space.hpp"

#include <algorithm>
#include <string>

#include "sweep/errors.hpp"

namespace sweep {

const ParameterDistribution& ParameterSpace::declare(const std::string& label, BindingTarget target,
                                                     const std::vector<ParamValue>& values) {
    if (label.empty()) {
        throw ConfigurationError("distribution label must not be empty");
    }
    if (contains(label)) {
        throw ConfigurationError("distribution '" + label + "' is declared twice");
    }
    if (values.empty()) {
        throw ConfigurationError("distribution '" + label + "' has no candidate values");
    }

    ParameterDistribution dist;
    dist.label  = label;
    dist.target = target;
    dist.values.reserve(values.size());

    for (const auto& v : values) {
        if (!comparable(v, values.front())) {
            throw ConfigurationError("distribution '" + label + "' mixes numeric and text values");
        }
        const bool seen = std::any_of(dist.values.begin(), dist.values.end(),
                                      [&v](const ParamValue& kept) { return compareValues(kept, v) == 0; });
        if (!seen) {
            dist.values.push_back(v);
        }
    }

    distributions_.push_back(std::move(dist));
    return distributions_.back();
}

const std::vector<ParamValue>& ParameterSpace::valuesOf(const std::string& label) const {
    return at(label).values;
}

const ParameterDistribution& ParameterSpace::at(const std::string& label) const {
    return distributions_[indexOf(label)];
}

std::size_t ParameterSpace::indexOf(const std::string& label) const {
    for (std::size_t i = 0; i < distributions_.size(); ++i) {
        if (distributions_[i].label == label) {
            return i;
        }
    }
    throw ConfigurationError("unknown distribution '" + label + "'");
}

bool ParameterSpace::contains(const std::string& label) const {
    return std::any_of(distributions_.begin(), distributions_.end(),
                       [&label](const ParameterDistribution& d) { return d.label == label; });
}

std::vector<ParamValue> integerRange(long long start, long long stop, long long step) {
    if (step <= 0) {
        throw ConfigurationError("range step must be positive");
    }
    if (stop < start) {
        throw ConfigurationError("range stop " + std::to_string(stop) + " is below start " + std::to_string(start));
    }

    // Unsigned arithmetic: stop - start may not fit in a long long.
    const auto first = static_cast<unsigned long long>(start);
    const auto width = static_cast<unsigned long long>(stop) - first;
    const auto steps = width / static_cast<unsigned long long>(step);
    if (steps >= kMaxRangeValues) {
        throw ConfigurationError("range " + std::to_string(start) + ".." + std::to_string(stop) + " step "
                                 + std::to_string(step) + " has more than " + std::to_string(kMaxRangeValues)
                                 + " values");
    }

    const auto count = static_cast<std::size_t>(steps) + 1;

    std::vector<ParamValue> values;
    values.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        values.emplace_back(static_cast<long long>(first + i * static_cast<unsigned long long>(step)));
    }
    return values;
}

}  // namespace sweep
