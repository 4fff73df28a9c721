#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace corolla {
namespace engine {

class DataHistory {
public:
    // Load candles from a CSV file
    // Default column order: timestamp,open,high,low,close,volume.
    // A header row (long or short names) may reorder the columns.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array of {timestamp, open, high, low, close, volume}
    // (short keys t/o/h/l/c/v accepted)
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // .json -> loadJSON, anything else -> loadCSV
    static std::vector<Candle> load(const std::string& file_path);
};

} // namespace engine
} // namespace corolla
