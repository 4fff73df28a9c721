#include "analytics/CandleAggregator.h"

#include <algorithm>

namespace corolla {
namespace analytics {

CandleAggregator::CandleAggregator(int bars_per_candle)
    : bars_per_candle_(std::max(1, bars_per_candle)) {
}

std::optional<Candle> CandleAggregator::add(const Candle& candle) {
    if (count_ == 0) {
        current_ = candle;
    } else {
        current_.high = std::max(current_.high, candle.high);
        current_.low = std::min(current_.low, candle.low);
        current_.close = candle.close;
        current_.volume += candle.volume;
    }
    ++count_;

    if (count_ < bars_per_candle_) {
        return std::nullopt;
    }

    Candle completed = current_;
    completed.sequence_index = emitted_++;
    count_ = 0;
    return completed;
}

void CandleAggregator::reset() {
    count_ = 0;
    current_ = Candle();
}

} // namespace analytics
} // namespace corolla
