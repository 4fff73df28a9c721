#pragma once

#include "engine/IBrokerGateway.h"
#include <random>

namespace corolla {
namespace engine {

// Synthetic feed for running without a broker: close wanders within
// base_price +- 100, high/low sit up to 10 points around it.
class DemoBrokerGateway : public IBrokerGateway {
public:
    explicit DemoBrokerGateway(double base_price = 18500.0, unsigned int seed = 42);

    bool connect() override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    std::optional<Candle> fetchLatestCandle() override;
    double currentPrice() override { return last_price_; }
    int currentPosition() override { return 0; }

    std::string name() const override { return "demo"; }

private:
    double base_price_;
    double last_price_;
    long long sequence_ = 0;
    bool connected_ = false;
    std::mt19937 rng_;
};

} // namespace engine
} // namespace corolla
