#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "sweep/combination.hpp"
#include "sweep/constraint_set.hpp"
#include "sweep/parameter_space.hpp"

namespace sweep {

constexpr std::uint64_t kDefaultSeed = 42;

struct SamplingOptions {
    std::size_t   count = 0;  // 0 = exhaustive
    std::uint64_t seed  = kDefaultSeed;
};

/**
 * @brief Materializes the constraint-filtered Cartesian product of a
 *        ParameterSpace, optionally sampled.
 *
 * Order is lexicographic over declaration order with the first-declared
 * distribution varying slowest, i.e. the order of nested for-loops written
 * in declaration order. Constraints are checked as soon as both of their
 * distributions are bound, so rejected subtrees are never expanded and
 * memory stays proportional to the surviving set.
 */
class CombinationGenerator {
   public:
    /**
     * @param space       Declared distributions (must outlive the generator).
     * @param constraints Constraints over the same space.
     */
    CombinationGenerator(const ParameterSpace& space, const ConstraintSet& constraints);

    /**
     * @brief Size of the unfiltered product (saturates at SIZE_MAX).
     */
    [[nodiscard]] std::size_t fullProductSize() const;

    /**
     * @brief All surviving combinations in generation order.
     *        An empty space yields no combinations.
     */
    [[nodiscard]] std::vector<Combination> generate() const;

    /**
     * @brief Surviving combinations, then sampled.
     */
    [[nodiscard]] std::vector<Combination> generate(const SamplingOptions& sampling) const;

    /**
     * @brief Uniform sample without replacement, kept in input order.
     *
     * count == 0 or count >= combinations.size() returns the input unchanged.
     * The same input and seed always give the same sample.
     */
    [[nodiscard]] static std::vector<Combination> sample(const std::vector<Combination>& combinations,
                                                         std::size_t count, std::uint64_t seed);

   private:
    const ParameterSpace* space_;
    const ConstraintSet*  constraints_;
};

}  // namespace sweep
