#include "sweep/combination_generator.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <random>

namespace sweep {

CombinationGenerator::CombinationGenerator(const ParameterSpace& space, const ConstraintSet& constraints)
    : space_(&space)
    , constraints_(&constraints) {}

std::size_t CombinationGenerator::fullProductSize() const {
    if (space_->empty()) {
        return 0;
    }

    constexpr auto maxSize = std::numeric_limits<std::size_t>::max();

    std::size_t total = 1;
    for (const auto& dist : space_->distributions()) {
        const auto n = dist.values.size();
        if (total > maxSize / n) {
            return maxSize;
        }
        total *= n;
    }
    return total;
}

std::vector<Combination> CombinationGenerator::generate() const {
    std::vector<Combination> out;

    const auto& dists = space_->distributions();
    const auto  depth = dists.size();
    if (depth == 0) {
        return out;
    }

    // Odometer over candidate indices; cursor[d] is the index bound at depth d.
    std::vector<std::size_t>       cursor(depth, 0);
    std::vector<const ParamValue*> bound(depth, nullptr);

    std::size_t d = 0;
    while (true) {
        if (cursor[d] == dists[d].values.size()) {
            // Exhausted this level: backtrack.
            if (d == 0) {
                break;
            }
            cursor[d] = 0;
            --d;
            ++cursor[d];
            continue;
        }

        bound[d] = &dists[d].values[cursor[d]];

        if (!constraints_->isSatisfiedPrefix(bound, d)) {
            ++cursor[d];
            continue;
        }

        if (d + 1 < depth) {
            ++d;
            continue;
        }

        std::vector<Combination::Entry> entries;
        entries.reserve(depth);
        for (std::size_t i = 0; i < depth; ++i) {
            entries.emplace_back(dists[i].label, *bound[i]);
        }
        out.emplace_back(std::move(entries));

        ++cursor[d];
    }

    return out;
}

std::vector<Combination> CombinationGenerator::generate(const SamplingOptions& sampling) const {
    return sample(generate(), sampling.count, sampling.seed);
}

std::vector<Combination> CombinationGenerator::sample(const std::vector<Combination>& combinations,
                                                      std::size_t count, std::uint64_t seed) {
    const auto m = combinations.size();
    if (count == 0 || count >= m) {
        return combinations;
    }

    std::vector<std::size_t> indices(m);
    std::iota(indices.begin(), indices.end(), std::size_t{0});

    // Partial Fisher-Yates. Raw engine output keeps the draw identical across
    // standard library implementations, unlike std::uniform_int_distribution.
    std::mt19937_64 rng(seed);
    for (std::size_t i = 0; i < count; ++i) {
        const auto j = i + static_cast<std::size_t>(rng() % static_cast<std::uint64_t>(m - i));
        std::swap(indices[i], indices[j]);
    }

    indices.resize(count);
    std::sort(indices.begin(), indices.end());

    std::vector<Combination> out;
    out.reserve(count);
    for (const auto idx : indices) {
        out.push_back(combinations[idx]);
    }
    return out;
}

}  // namespace sweep
