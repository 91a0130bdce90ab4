#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "sweep/combination.hpp"
#include "sweep/combination_generator.hpp"
#include "sweep/constraint_set.hpp"
#include "sweep/evaluator.hpp"
#include "sweep/parameter_space.hpp"
#include "sweep/result_set.hpp"
#include "sweep/result_store.hpp"
#include "sweep/sweep_config.hpp"
#include "sweep/sweep_identity.hpp"
#include "sweep/sweep_scheduler.hpp"

namespace sweep {

struct SweepReport {
    ResultSet   results;
    bool        fromCache    = false;  // loaded from the store, nothing evaluated
    std::size_t combinations = 0;      // surviving (sampled) combinations
};

/**
 * @brief One configured sweep: generation, filtering, sampling, evaluation
 *        and persistence.
 *
 * Every declaration is checked in the constructor, so a malformed config
 * fails before any combination is generated or evaluated.
 */
class Sweep {
   public:
    /**
     * @throws ConfigurationError for any malformed declaration.
     */
    explicit Sweep(const SweepConfig& config);

    Sweep(const Sweep& other) = delete;
    Sweep(Sweep&& other)      = delete;

    Sweep& operator=(const Sweep& other) = delete;
    Sweep& operator=(Sweep&& other) = delete;

    [[nodiscard]] const ParameterSpace& space() const {
        return space_;
    }

    [[nodiscard]] const ConstraintSet& constraints() const {
        return constraints_;
    }

    [[nodiscard]] const SweepIdentity& identity() const {
        return identity_;
    }

    [[nodiscard]] const SweepConfig& config() const {
        return config_;
    }

    /**
     * @brief Filtered and sampled combinations, in generation order.
     */
    [[nodiscard]] std::vector<Combination> combinations() const;

    void setProgressCallback(SweepScheduler::ProgressCallback cb) {
        progressCallback_ = std::move(cb);
    }

    /**
     * @brief The stored report for this sweep, if the store has one.
     *
     * Lets a caller skip building the evaluator (and loading its data) when
     * nothing needs evaluating.
     *
     * @throws PersistenceError if a stored entry cannot be read.
     */
    [[nodiscard]] std::optional<SweepReport> cached(IResultStore& store) const;

    /**
     * @brief Run the sweep.
     *
     * With a store, a stored result set for this identity is returned as is
     * and the evaluator is never called. Otherwise every combination is
     * evaluated and a Complete or Empty result set is saved; an Incomplete
     * (cancelled) one is not.
     *
     * @param evaluator Scoring function.
     * @param store     Optional result cache.
     * @param cancel    Optional cancellation token.
     * @throws PersistenceError if the store fails.
     */
    [[nodiscard]] SweepReport run(IEvaluator& evaluator, IResultStore* store = nullptr,
                                  const CancellationToken* cancel = nullptr) const;

   private:
    SweepConfig                      config_;
    ParameterSpace                   space_;
    ConstraintSet                    constraints_;
    SweepIdentity                    identity_;
    SweepScheduler::ProgressCallback progressCallback_;
};

}  // namespace sweep
