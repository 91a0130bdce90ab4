#pragma once

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace sweep {

/**
 * @brief One candidate value of a parameter.
 *
 * Integers and floating point values compare numerically against each
 * other, strings compare lexicographically. A number and a string are not
 * comparable.
 */
using ParamValue = std::variant<long long, double, std::string>;

[[nodiscard]] inline bool isNumeric(const ParamValue& value) {
    return !std::holds_alternative<std::string>(value);
}

/**
 * @brief True if both values belong to the same comparability class.
 */
[[nodiscard]] inline bool comparable(const ParamValue& a, const ParamValue& b) {
    return isNumeric(a) == isNumeric(b);
}

/**
 * @brief Three-way comparison by natural ordering.
 * @return Negative, zero or positive.
 * @throws std::invalid_argument if the values are not comparable.
 */
[[nodiscard]] int compareValues(const ParamValue& a, const ParamValue& b);

/**
 * @brief Render the value the way it appears in a config file (strings unquoted).
 */
[[nodiscard]] std::string toString(const ParamValue& value);

[[nodiscard]] nlohmann::json toJson(const ParamValue& value);

/**
 * @brief Parse a JSON scalar into a ParamValue.
 * @throws ConfigurationError for booleans, null, arrays and objects.
 */
[[nodiscard]] ParamValue paramValueFromJson(const nlohmann::json& value);

/**
 * @brief Integer view of a numeric value (floating values must be integral).
 * @throws std::invalid_argument for strings and non-integral numbers.
 */
[[nodiscard]] long long asInteger(const ParamValue& value);

}  // namespace sweep
