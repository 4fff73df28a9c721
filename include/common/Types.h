#pragma once

#include <chrono>
#include <string>

namespace corolla {

// Single OHLCV bar as delivered by the broker gateway.
// The strategy core reads high/low/close/volume; open and timestamp are
// carried for replay feeds and logging.
struct Candle {
    double open;
    double high;
    double low;
    double close;
    long long volume;
    long long sequence_index;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), sequence_index(0), timestamp(0) {}

    Candle(double h, double l, double c, long long v, long long seq)
        : open(c), high(h), low(l), close(c), volume(v), sequence_index(seq), timestamp(0) {}
};

// epoch milliseconds
inline long long nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace corolla
