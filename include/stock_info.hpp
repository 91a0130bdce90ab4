#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Daily (or other interval) price history of one instrument.
 *
 * All series are index-aligned with timestamps.
 */
struct StockInfo {
    /**
     * @brief
     * @example "SPY", "AAPL", or the CSV file stem for local data
     */
    std::string ticker = "";

    /**
     * @brief
     * @example "USD", "KRW", etc.
     */
    std::string currency = "";

    /* HISTORICAL DATA */

    /**
     * @brief Unix seconds (UTC).
     * @example [1705641600, 1705728000, ...]
     */
    std::vector<int64_t> timestamps;

    std::vector<double>  open;
    std::vector<double>  high;
    std::vector<double>  low;
    std::vector<double>  close;
    std::vector<int64_t> volume;

    [[nodiscard]] std::size_t size() const {
        return close.size();
    }

    [[nodiscard]] bool empty() const {
        return close.empty();
    }
};
