#include "price_csv.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace data {

namespace {

    const char* const kHeader = "timestamp,open,high,low,close,volume";

    std::vector<std::string> splitFields(const std::string& line)
    {
        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ',')) {
            fields.push_back(core::utils::trim(field));
        }
        return fields;
    }

} // namespace

std::string formatPriceCsv(const core::TimeSeries<core::Candle>& candles)
{
    std::string out = std::string(kHeader) + "\n";
    for (const auto& c : candles) {
        // {} prints the shortest text that reads back to the same double
        out += fmt::format("{},{},{},{},{},{}\n", core::utils::timestampToString(c.timestamp),
                           c.open, c.high, c.low, c.close, c.volume);
    }
    return out;
}

core::TimeSeries<core::Candle> parsePriceCsv(const std::string& text)
{
    core::TimeSeries<core::Candle> candles;
    std::istringstream in(text);
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        line = core::utils::trim(line);
        if (line.empty()) continue;
        if (line_number == 1 && line.rfind("timestamp", 0) == 0) continue;

        auto fields = splitFields(line);
        if (fields.size() != 6) {
            throw core::DataLoadException(fmt::format("Price CSV line {}: expected 6 fields, got {}",
                                                      line_number, fields.size()));
        }
        try {
            core::Candle candle;
            candle.timestamp = core::utils::stringToTimestamp(fields[0]);
            candle.open = std::stod(fields[1]);
            candle.high = std::stod(fields[2]);
            candle.low = std::stod(fields[3]);
            candle.close = std::stod(fields[4]);
            candle.volume = std::stod(fields[5]);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            throw core::DataLoadException(fmt::format("Price CSV line {}: {}", line_number, e.what()));
        }
    }
    return candles;
}

void writePriceCsv(const std::string& path, const core::TimeSeries<core::Candle>& candles)
{
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw core::DataLoadException("Cannot open price file for writing: " + path);
    }
    file << formatPriceCsv(candles);
    if (!file) {
        throw core::DataLoadException("Failed writing price file: " + path);
    }
}

core::TimeSeries<core::Candle> readPriceCsv(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::DataLoadException("Cannot open price file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parsePriceCsv(buffer.str());
}

} // namespace data
