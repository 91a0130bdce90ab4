#include "sweep/constraint_set.hpp"

#include <algorithm>

#include "sweep/errors.hpp"

namespace sweep {

Relation relationFromString(const std::string& op) {
    if (op == "<") {
        return Relation::Less;
    }
    if (op == "<=") {
        return Relation::LessEqual;
    }
    if (op == ">") {
        return Relation::Greater;
    }
    if (op == ">=") {
        return Relation::GreaterEqual;
    }
    if (op == "=" || op == "==") {
        return Relation::Equal;
    }
    throw ConfigurationError("unsupported constraint operator '" + op + "'");
}

std::string toString(Relation relation) {
    switch (relation) {
        case Relation::Less:
            return "<";
        case Relation::LessEqual:
            return "<=";
        case Relation::Greater:
            return ">";
        case Relation::GreaterEqual:
            return ">=";
        case Relation::Equal:
            return "=";
    }
    return "?";
}

bool holds(Relation relation, const ParamValue& left, const ParamValue& right) {
    const int c = compareValues(left, right);
    switch (relation) {
        case Relation::Less:
            return c < 0;
        case Relation::LessEqual:
            return c <= 0;
        case Relation::Greater:
            return c > 0;
        case Relation::GreaterEqual:
            return c >= 0;
        case Relation::Equal:
            return c == 0;
    }
    return false;
}

bool Constraint::evaluate(const Combination& combination) const {
    return holds(relation, combination.at(left), combination.at(right));
}

ConstraintSet::ConstraintSet(const ParameterSpace& space)
    : space_(&space) {}

const Constraint& ConstraintSet::declareConstraint(const std::string& label, const std::string& left,
                                                   const std::string& right, Relation relation) {
    if (label.empty()) {
        throw ConfigurationError("constraint label must not be empty");
    }
    const bool taken = std::any_of(constraints_.begin(), constraints_.end(),
                                   [&label](const Constraint& c) { return c.label == label; });
    if (taken) {
        throw ConfigurationError("constraint '" + label + "' is declared twice");
    }
    if (toString(relation) == "?") {
        throw ConfigurationError("constraint '" + label + "' has an unsupported operator");
    }
    if (!space_->contains(left)) {
        throw ConfigurationError("constraint '" + label + "' references unknown distribution '" + left + "'");
    }
    if (!space_->contains(right)) {
        throw ConfigurationError("constraint '" + label + "' references unknown distribution '" + right + "'");
    }

    const auto& lhs = space_->at(left);
    const auto& rhs = space_->at(right);
    if (!comparable(lhs.values.front(), rhs.values.front())) {
        throw ConfigurationError("constraint '" + label + "' compares numeric and text distributions");
    }

    Constraint c;
    c.label      = label;
    c.left       = left;
    c.right      = right;
    c.relation   = relation;
    c.leftIndex  = space_->indexOf(left);
    c.rightIndex = space_->indexOf(right);

    constraints_.push_back(std::move(c));
    return constraints_.back();
}

const Constraint& ConstraintSet::declareConstraint(const std::string& label, const std::string& left,
                                                   const std::string& right, const std::string& op) {
    return declareConstraint(label, left, right, relationFromString(op));
}

bool ConstraintSet::isSatisfied(const Combination& combination) const {
    return std::all_of(constraints_.begin(), constraints_.end(),
                       [&combination](const Constraint& c) { return c.evaluate(combination); });
}

bool ConstraintSet::isSatisfiedPrefix(const std::vector<const ParamValue*>& values, std::size_t depth) const {
    for (const auto& c : constraints_) {
        if (c.decidableAt() != depth) {
            continue;
        }
        if (!holds(c.relation, *values[c.leftIndex], *values[c.rightIndex])) {
            return false;
        }
    }
    return true;
}

}  // namespace sweep
