#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace regimepairs {
namespace backtest {

class DataHistory {
public:
    // Load closing prices from a CSV file with a header row.
    // The price column is the first header containing "close" or "price",
    // otherwise the last column.
    static std::vector<Price> loadPriceCSV(const std::string& file_path);

    // Load closing prices from a JSON array of objects (close / c / price)
    // or a plain array of numbers
    static std::vector<Price> loadPriceJSON(const std::string& file_path);

    // Picks the loader by file extension (.json, anything else is CSV)
    static std::vector<Price> loadPrices(const std::string& file_path);

    // Truncate both series to the shorter length
    static PriceSeries align(const std::vector<Price>& a, const std::vector<Price>& b);
};

} // namespace backtest
} // namespace regimepairs
