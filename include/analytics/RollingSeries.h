#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace corolla {
namespace analytics {

// Point-in-time copy of a RollingSeries, oldest first / newest last.
struct SeriesArrays {
    std::vector<double> highs;
    std::vector<double> lows;
    std::vector<double> closes;
    std::vector<long long> volumes;

    std::size_t size() const { return closes.size(); }
};

// Fixed-capacity OHLC(V) buffer for one timeframe.
// All four columns always have the same length; once the capacity is
// exceeded the oldest sample is dropped from every column together.
// Input is not validated here.
class RollingSeries {
public:
    static constexpr std::size_t kDefaultCapacity = 200;

    explicit RollingSeries(std::size_t capacity = kDefaultCapacity);

    void append(double high, double low, double close, long long volume);

    SeriesArrays asArrays() const;

    std::size_t size() const { return closes_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return closes_.empty(); }

    // 0.0 when empty
    double lastClose() const;

    void clear();

private:
    std::size_t capacity_;
    std::deque<double> highs_;
    std::deque<double> lows_;
    std::deque<double> closes_;
    std::deque<long long> volumes_;
};

} // namespace analytics
} // namespace corolla
