#include "backtest/DataHistory.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

using namespace regimepairs;
using regimepairs::backtest::DataHistory;

namespace {
// 병렬 ctest 실행 시 충돌 방지: 프로세스별 고유 파일명
std::filesystem::path tempPath(const std::string& name) {
    static const std::string tag = std::to_string(std::random_device{}()) + "_" +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    const std::filesystem::path base(name);
    return std::filesystem::temp_directory_path() /
        (base.stem().string() + "_" + tag + base.extension().string());
}

std::string writeTemp(const std::string& name, const std::string& body) {
    const auto path = tempPath(name);
    std::ofstream out(path);
    out << body;
    return path.string();
}
}

int main() {
    {
        // "Close" column picked by header, unusable rows skipped
        const auto path = writeTemp("regime_pairs_a.csv",
            "Date,Open,Close,Volume\n"
            "2024-01-01,1,100.5,10\n"
            "2024-01-02,1,abc,10\n"
            "2024-01-03,1,-5,10\n"
            "\n"
            "2024-01-04,1,\"101.25\",10\n");
        const auto prices = DataHistory::loadPriceCSV(path);
        assert(prices.size() == 2);
        assert(prices[0] == 100.5);
        assert(prices[1] == 101.25);
        assert(DataHistory::loadPrices(path).size() == 2);
        std::filesystem::remove(path);
    }

    {
        const auto by_price = writeTemp("regime_pairs_b.csv", "date,PRICE,volume\nx,10,1\ny,11,2\n");
        const auto p1 = DataHistory::loadPriceCSV(by_price);
        assert(p1.size() == 2 && p1[0] == 10.0 && p1[1] == 11.0);
        std::filesystem::remove(by_price);

        // no close/price header: last column
        const auto last = writeTemp("regime_pairs_c.csv", "idx,value\n1,7.5\n2,8.5\n");
        const auto p2 = DataHistory::loadPriceCSV(last);
        assert(p2.size() == 2 && p2[0] == 7.5 && p2[1] == 8.5);
        std::filesystem::remove(last);
    }

    {
        const auto objects = writeTemp("regime_pairs_d.json",
            R"([{"close": 1.5}, {"c": 2.5}, {"price": 3.5}, {"volume": 9}, {"close": -1}])");
        const auto p1 = DataHistory::loadPriceJSON(objects);
        assert(p1.size() == 3);
        assert(p1[0] == 1.5 && p1[1] == 2.5 && p1[2] == 3.5);
        assert(DataHistory::loadPrices(objects).size() == 3);
        std::filesystem::remove(objects);

        const auto numbers = writeTemp("regime_pairs_e.json", "[10, 20.5, 30]");
        assert(DataHistory::loadPriceJSON(numbers).size() == 3);
        std::filesystem::remove(numbers);

        const auto broken = writeTemp("regime_pairs_f.json", "[1, 2,");
        assert(DataHistory::loadPriceJSON(broken).empty());
        std::filesystem::remove(broken);
    }

    {
        assert(DataHistory::loadPriceCSV("/nonexistent/regime_pairs.csv").empty());
        assert(DataHistory::loadPriceJSON("/nonexistent/regime_pairs.json").empty());
    }

    {
        const PriceSeries series = DataHistory::align({1.0, 2.0, 3.0}, {4.0, 5.0});
        assert(series.a.size() == 2 && series.b.size() == 2);
        assert(series.a[1] == 2.0 && series.b[1] == 5.0);
    }

    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
