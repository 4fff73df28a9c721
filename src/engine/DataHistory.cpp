#include "engine/DataHistory.h"
#include "common/Logger.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

namespace corolla {
namespace engine {

namespace {
void assignSequence(std::vector<Candle>& candles) {
    long long seq = 0;
    for (auto& candle : candles) {
        candle.sequence_index = seq++;
    }
}

// 공백, BOM, 따옴표 제거
std::string cleanCell(std::string cell) {
    if (cell.size() >= 3 &&
        static_cast<unsigned char>(cell[0]) == 0xEF &&
        static_cast<unsigned char>(cell[1]) == 0xBB &&
        static_cast<unsigned char>(cell[2]) == 0xBF) {
        cell.erase(0, 3);
    }

    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    cell.erase(cell.begin(), std::find_if(cell.begin(), cell.end(), not_space));
    cell.erase(std::find_if(cell.rbegin(), cell.rend(), not_space).base(), cell.end());

    if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
        cell = cell.substr(1, cell.size() - 2);
    }
    return cell;
}

std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(cleanCell(cell));
    }
    return cells;
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// column index per field: timestamp, open, high, low, close, volume
struct CsvLayout {
    std::size_t timestamp = 0;
    std::size_t open = 1;
    std::size_t high = 2;
    std::size_t low = 3;
    std::size_t close = 4;
    std::size_t volume = 5;

    std::size_t width() const {
        return std::max({timestamp, open, high, low, close, volume}) + 1;
    }
};

bool looksNumeric(const std::string& cell) {
    return !cell.empty() &&
           (std::isdigit(static_cast<unsigned char>(cell[0])) || cell[0] == '-' || cell[0] == '.');
}

// Header row: map names (long or short) to indices; unknown names keep defaults.
CsvLayout readHeader(const std::vector<std::string>& header) {
    CsvLayout layout;
    const std::map<std::string, std::size_t CsvLayout::*> fields = {
        {"timestamp", &CsvLayout::timestamp}, {"time", &CsvLayout::timestamp}, {"t", &CsvLayout::timestamp},
        {"open", &CsvLayout::open}, {"o", &CsvLayout::open},
        {"high", &CsvLayout::high}, {"h", &CsvLayout::high},
        {"low", &CsvLayout::low}, {"l", &CsvLayout::low},
        {"close", &CsvLayout::close}, {"c", &CsvLayout::close},
        {"volume", &CsvLayout::volume}, {"v", &CsvLayout::volume},
    };
    for (std::size_t i = 0; i < header.size(); ++i) {
        const auto it = fields.find(lowerCopy(header[i]));
        if (it != fields.end()) {
            layout.*(it->second) = i;
        }
    }
    return layout;
}
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    CsvLayout layout;
    bool first_row = true;
    int skipped = 0;
    std::string line;

    while (std::getline(file, line)) {
        const auto row = splitRow(line);
        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;

        if (first_row) {
            first_row = false;
            if (!looksNumeric(row[0])) {
                layout = readHeader(row);
                continue;
            }
        }

        if (row.size() < layout.width() || !looksNumeric(row[layout.timestamp])) {
            ++skipped;
            continue;
        }

        try {
            Candle candle;
            candle.timestamp = std::stoll(row[layout.timestamp]);
            candle.open = std::stod(row[layout.open]);
            candle.high = std::stod(row[layout.high]);
            candle.low = std::stod(row[layout.low]);
            candle.close = std::stod(row[layout.close]);
            candle.volume = static_cast<long long>(std::stod(row[layout.volume]));
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
            ++skipped;
        }
    }

    if (skipped > 0) {
        LOG_WARN("Skipped {} malformed rows in {}", skipped, file_path);
    }

    assignSequence(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    auto pick = [](const nlohmann::json& item, const char* key, const char* short_key) -> double {
        if (item.contains(key)) return item[key].get<double>();
        if (item.contains(short_key)) return item[short_key].get<double>();
        return 0.0;
    };

    try {
        nlohmann::json j;
        file >> j;
        for (const auto& item : j) {
            Candle candle;
            candle.timestamp = static_cast<long long>(pick(item, "timestamp", "t"));
            candle.open = pick(item, "open", "o");
            candle.high = pick(item, "high", "h");
            candle.low = pick(item, "low", "l");
            candle.close = pick(item, "close", "c");
            candle.volume = static_cast<long long>(pick(item, "volume", "v"));
            candles.push_back(candle);
        }
        // Ensure sorted by timestamp ascending
        std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
            return a.timestamp < b.timestamp;
        });

    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    assignSequence(candles);
    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    if (lowerCopy(std::filesystem::path(file_path).extension().string()) == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

} // namespace engine
} // namespace corolla
