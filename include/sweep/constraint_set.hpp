#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sweep/combination.hpp"
#include "sweep/parameter_space.hpp"

namespace sweep {

enum class Relation
{
    Less,          // <
    LessEqual,     // <=
    Greater,       // >
    GreaterEqual,  // >=
    Equal,         // = or ==
};

/**
 * @brief Parse "<", "<=", ">", ">=", "=" or "==".
 * @throws ConfigurationError for anything else.
 */
[[nodiscard]] Relation relationFromString(const std::string& op);

[[nodiscard]] std::string toString(Relation relation);

/**
 * @brief Apply a relation to two comparable values.
 */
[[nodiscard]] bool holds(Relation relation, const ParamValue& left, const ParamValue& right);

/**
 * @brief left <relation> right, between two declared distributions.
 */
struct Constraint {
    std::string label;
    std::string left;
    std::string right;
    Relation    relation = Relation::Less;

    // Declaration positions of left / right in the owning ParameterSpace.
    std::size_t leftIndex  = 0;
    std::size_t rightIndex = 0;

    /**
     * @brief Look up both values in the combination and apply the relation.
     * @throws std::out_of_range if the combination lacks either label.
     */
    [[nodiscard]] bool evaluate(const Combination& combination) const;

    /**
     * @brief Position after which both sides are bound during expansion.
     */
    [[nodiscard]] std::size_t decidableAt() const {
        return leftIndex > rightIndex ? leftIndex : rightIndex;
    }
};

/**
 * @brief Conjunction of relational constraints over one ParameterSpace.
 *
 * The space must outlive the set. Distributions have to be declared before
 * any constraint that references them.
 */
class ConstraintSet {
   public:
    explicit ConstraintSet(const ParameterSpace& space);

    /**
     * @throws ConfigurationError if label is empty or already used, if either
     *         distribution is unknown, or if their values are not comparable.
     */
    const Constraint& declareConstraint(const std::string& label, const std::string& left,
                                        const std::string& right, Relation relation);

    /**
     * @overload Textual operator; an unsupported operator is a ConfigurationError.
     */
    const Constraint& declareConstraint(const std::string& label, const std::string& left,
                                        const std::string& right, const std::string& op);

    /**
     * @brief AND over all constraints; true when none are declared.
     */
    [[nodiscard]] bool isSatisfied(const Combination& combination) const;

    /**
     * @brief Check the constraints that become decidable once the value at
     *        position depth is bound.
     * @param values Values bound so far, indexed by declaration position
     *               (at least depth + 1 entries).
     */
    [[nodiscard]] bool isSatisfiedPrefix(const std::vector<const ParamValue*>& values, std::size_t depth) const;

    [[nodiscard]] const std::vector<Constraint>& constraints() const {
        return constraints_;
    }

    [[nodiscard]] bool empty() const {
        return constraints_.empty();
    }

    [[nodiscard]] std::size_t size() const {
        return constraints_.size();
    }

   private:
    const ParameterSpace*   space_;
    std::vector<Constraint> constraints_;
};

}  // namespace sweep
