#include "engine/DemoBrokerGateway.h"
#include "common/Logger.h"

namespace corolla {
namespace engine {

DemoBrokerGateway::DemoBrokerGateway(double base_price, unsigned int seed)
    : base_price_(base_price)
    , last_price_(base_price)
    , rng_(seed) {
}

bool DemoBrokerGateway::connect() {
    connected_ = true;
    LOG_INFO("Running in DEMO MODE - no broker connection needed");
    return true;
}

void DemoBrokerGateway::disconnect() {
    connected_ = false;
}

std::optional<Candle> DemoBrokerGateway::fetchLatestCandle() {
    std::uniform_int_distribution<int> price_offset(-100, 100);
    std::uniform_int_distribution<int> wick(0, 10);
    std::uniform_int_distribution<long long> volume(800, 1200);

    const double close = base_price_ + price_offset(rng_);

    Candle candle;
    candle.open = last_price_;
    candle.close = close;
    candle.high = close + wick(rng_);
    candle.low = close - wick(rng_);
    candle.volume = volume(rng_);
    candle.sequence_index = sequence_++;
    candle.timestamp = nowMillis();

    last_price_ = close;
    return candle;
}

} // namespace engine
} // namespace corolla
