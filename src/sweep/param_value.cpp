#include "sweep/param_value.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "sweep/errors.hpp"

namespace sweep {

namespace {

double asDouble(const ParamValue& value) {
    if (const auto* i = std::get_if<long long>(&value)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(value);
}

}  // namespace

int compareValues(const ParamValue& a, const ParamValue& b) {
    if (!comparable(a, b)) {
        throw std::invalid_argument("cannot compare '" + toString(a) + "' with '" + toString(b) + "'");
    }

    if (!isNumeric(a)) {
        const auto& lhs = std::get<std::string>(a);
        const auto& rhs = std::get<std::string>(b);
        return lhs.compare(rhs) < 0 ? -1 : (lhs == rhs ? 0 : 1);
    }

    // Exact for two integers, numeric otherwise.
    if (std::holds_alternative<long long>(a) && std::holds_alternative<long long>(b)) {
        const auto lhs = std::get<long long>(a);
        const auto rhs = std::get<long long>(b);
        return lhs < rhs ? -1 : (lhs == rhs ? 0 : 1);
    }

    const double lhs = asDouble(a);
    const double rhs = asDouble(b);
    return lhs < rhs ? -1 : (lhs == rhs ? 0 : 1);
}

std::string toString(const ParamValue& value) {
    if (const auto* i = std::get_if<long long>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream os;
        os << *d;
        return os.str();
    }
    return std::get<std::string>(value);
}

nlohmann::json toJson(const ParamValue& value) {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

ParamValue paramValueFromJson(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_number_float()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    throw ConfigurationError("unsupported parameter value " + value.dump());
}

long long asInteger(const ParamValue& value) {
    if (const auto* i = std::get_if<long long>(&value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::floor(*d) != *d) {
            throw std::invalid_argument("value " + toString(value) + " is not an integer");
        }
        // [-2^63, 2^63) is exactly representable as double bounds.
        constexpr double lowest = static_cast<double>(std::numeric_limits<long long>::min());
        if (*d < lowest || *d >= -lowest) {
            throw std::invalid_argument("value " + toString(value) + " is out of integer range");
        }
        return static_cast<long long>(*d);
    }
    throw std::invalid_argument("value '" + toString(value) + "' is not numeric");
}

}  // namespace sweep
