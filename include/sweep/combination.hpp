#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "sweep/param_value.hpp"

namespace sweep {

/**
 * @brief One fully bound assignment of values to every distribution.
 *
 * Entries follow the declaration order of the ParameterSpace it was built
 * from. Equality and ordering are structural (labels, then values).
 */
class Combination {
   public:
    using Entry = std::pair<std::string, ParamValue>;

    Combination() = default;
    explicit Combination(std::vector<Entry> entries);

    /**
     * @brief Value bound to a label.
     * @throws std::out_of_range for unknown labels.
     */
    [[nodiscard]] const ParamValue& at(const std::string& label) const;

    [[nodiscard]] bool contains(const std::string& label) const;

    [[nodiscard]] const std::vector<Entry>& entries() const {
        return entries_;
    }

    [[nodiscard]] std::size_t size() const {
        return entries_.size();
    }

    /**
     * @brief e.g. "fast=10,slow=30,kind=ema"
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief [["fast", 10], ["slow", 30]]
     */
    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @throws ConfigurationError if the document is not a list of [label, value] pairs.
     */
    [[nodiscard]] static Combination fromJson(const nlohmann::json& doc);

    friend bool operator==(const Combination& a, const Combination& b);
    friend bool operator<(const Combination& a, const Combination& b);

   private:
    std::vector<Entry> entries_;
};

inline bool operator!=(const Combination& a, const Combination& b) {
    return !(a == b);
}

}  // namespace sweep
