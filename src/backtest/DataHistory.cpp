#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include "common/Logger.h"

namespace regimepairs {
namespace backtest {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::vector<std::string> splitRow(const std::string& line) {
    std::stringstream ss(line);
    std::string cell;
    std::vector<std::string> row;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    return row;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isUsablePrice(double value) {
    return std::isfinite(value) && value > 0.0;
}
}

std::vector<Price> DataHistory::loadPriceCSV(const std::string& file_path) {
    std::vector<Price> prices;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return prices;
    }

    std::string line;
    if (!std::getline(file, line)) {
        LOG_ERROR("CSV file is empty: {}", file_path);
        return prices;
    }

    const auto header = splitRow(line);
    if (header.empty()) {
        LOG_ERROR("CSV header missing: {}", file_path);
        return prices;
    }

    size_t column = header.size() - 1;
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string name = toLower(header[i]);
        if (name.find("close") != std::string::npos || name.find("price") != std::string::npos) {
            column = i;
            break;
        }
    }

    size_t skipped = 0;
    while (std::getline(file, line)) {
        if (trim(line).empty()) continue;

        const auto row = splitRow(line);
        if (row.size() <= column) {
            ++skipped;
            continue;
        }

        try {
            size_t consumed = 0;
            const double value = std::stod(row[column], &consumed);
            if (consumed != row[column].size() || !isUsablePrice(value)) {
                ++skipped;
                continue;
            }
            prices.push_back(value);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
            ++skipped;
        }
    }

    if (skipped > 0) {
        LOG_WARN("Skipped {} unusable rows in {}", skipped, file_path);
    }
    LOG_INFO("Loaded {} prices from {} (column '{}')", prices.size(), file_path, header[column]);
    return prices;
}

std::vector<Price> DataHistory::loadPriceJSON(const std::string& file_path) {
    std::vector<Price> prices;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return prices;
    }

    nlohmann::json j;
    try {
        file >> j;
        if (!j.is_array()) {
            LOG_ERROR("JSON price file must hold an array: {}", file_path);
            return prices;
        }

        for (const auto& item : j) {
            const nlohmann::json* value = nullptr;
            if (item.is_number()) {
                value = &item;
            } else if (item.is_object()) {
                if (item.contains("close")) value = &item["close"];
                else if (item.contains("c")) value = &item["c"];
                else if (item.contains("price")) value = &item["price"];
            }

            if (value == nullptr || !value->is_number()) {
                continue;
            }
            const double price = value->get<double>();
            if (isUsablePrice(price)) {
                prices.push_back(price);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        prices.clear();
    }

    LOG_INFO("Loaded {} prices from {}", prices.size(), file_path);
    return prices;
}

std::vector<Price> DataHistory::loadPrices(const std::string& file_path) {
    const std::string ext = toLower(std::filesystem::path(file_path).extension().string());
    if (ext == ".json") {
        return loadPriceJSON(file_path);
    }
    return loadPriceCSV(file_path);
}

PriceSeries DataHistory::align(const std::vector<Price>& a, const std::vector<Price>& b) {
    const size_t length = std::min(a.size(), b.size());
    if (a.size() != b.size()) {
        LOG_WARN("Price series lengths differ ({} vs {}); truncating to {}", a.size(), b.size(), length);
    }

    PriceSeries series;
    series.a.assign(a.begin(), a.begin() + static_cast<std::ptrdiff_t>(length));
    series.b.assign(b.begin(), b.begin() + static_cast<std::ptrdiff_t>(length));
    return series;
}

} // namespace backtest
} // namespace regimepairs
