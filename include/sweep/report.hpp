#pragma once

#include <string>

#include "sweep/result_set.hpp"

namespace sweep {

/**
 * @brief Write the raw result table as CSV.
 *
 * Columns: one per parameter, status, every scalar output field (sorted by
 * name), error.
 *
 * @return false if the file could not be written.
 */
[[nodiscard]] bool writeCsv(const std::string& path, const ResultSet& results);

}  // namespace sweep
