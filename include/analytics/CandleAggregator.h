#pragma once

#include "common/Types.h"
#include <optional>

namespace corolla {
namespace analytics {

// Rolls N consecutive lower-timeframe candles into one higher-timeframe
// candle (e.g. 15 x 1m -> 15m). The bucket is emitted on the candle that
// completes it.
class CandleAggregator {
public:
    explicit CandleAggregator(int bars_per_candle);

    std::optional<Candle> add(const Candle& candle);

    int pendingBars() const { return count_; }
    int barsPerCandle() const { return bars_per_candle_; }
    void reset();

private:
    int bars_per_candle_;
    int count_ = 0;
    long long emitted_ = 0;
    Candle current_;
};

} // namespace analytics
} // namespace corolla
