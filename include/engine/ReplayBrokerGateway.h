#pragma once

#include "engine/IBrokerGateway.h"
#include <cstddef>
#include <string>
#include <vector>

namespace corolla {
namespace engine {

// Feeds pre-recorded candles one per fetch, then reports exhaustion.
class ReplayBrokerGateway : public IBrokerGateway {
public:
    explicit ReplayBrokerGateway(std::vector<Candle> candles);

    // throws std::runtime_error when the file yields no candles
    static ReplayBrokerGateway fromFile(const std::string& file_path);

    bool connect() override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    std::optional<Candle> fetchLatestCandle() override;
    double currentPrice() override;
    int currentPosition() override { return position_; }
    bool isExhausted() const override { return cursor_ >= candles_.size(); }

    std::string name() const override { return "replay"; }

    // scripted position for exit-path runs
    void setPosition(int position) { position_ = position; }
    std::size_t remaining() const { return candles_.size() - cursor_; }

private:
    std::vector<Candle> candles_;
    std::size_t cursor_ = 0;
    int position_ = 0;
    bool connected_ = false;
};

} // namespace engine
} // namespace corolla
