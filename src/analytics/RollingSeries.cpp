#include "analytics/RollingSeries.h"

namespace corolla {
namespace analytics {

RollingSeries::RollingSeries(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void RollingSeries::append(double high, double low, double close, long long volume) {
    highs_.push_back(high);
    lows_.push_back(low);
    closes_.push_back(close);
    volumes_.push_back(volume);

    if (closes_.size() > capacity_) {
        highs_.pop_front();
        lows_.pop_front();
        closes_.pop_front();
        volumes_.pop_front();
    }
}

SeriesArrays RollingSeries::asArrays() const {
    SeriesArrays out;
    out.highs.assign(highs_.begin(), highs_.end());
    out.lows.assign(lows_.begin(), lows_.end());
    out.closes.assign(closes_.begin(), closes_.end());
    out.volumes.assign(volumes_.begin(), volumes_.end());
    return out;
}

double RollingSeries::lastClose() const {
    return closes_.empty() ? 0.0 : closes_.back();
}

void RollingSeries::clear() {
    highs_.clear();
    lows_.clear();
    closes_.clear();
    volumes_.clear();
}

} // namespace analytics
} // namespace corolla
