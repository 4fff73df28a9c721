#include "engine/ReplayBrokerGateway.h"
#include "engine/DataHistory.h"
#include "common/Logger.h"

#include <stdexcept>
#include <utility>

namespace corolla {
namespace engine {

ReplayBrokerGateway::ReplayBrokerGateway(std::vector<Candle> candles)
    : candles_(std::move(candles)) {
}

ReplayBrokerGateway ReplayBrokerGateway::fromFile(const std::string& file_path) {
    auto candles = DataHistory::load(file_path);
    if (candles.empty()) {
        throw std::runtime_error("No candles in replay file: " + file_path);
    }
    return ReplayBrokerGateway(std::move(candles));
}

bool ReplayBrokerGateway::connect() {
    connected_ = true;
    LOG_INFO("Replay feed ready: {} candles", candles_.size());
    return true;
}

void ReplayBrokerGateway::disconnect() {
    connected_ = false;
}

std::optional<Candle> ReplayBrokerGateway::fetchLatestCandle() {
    if (cursor_ >= candles_.size()) {
        return std::nullopt;
    }
    return candles_[cursor_++];
}

double ReplayBrokerGateway::currentPrice() {
    if (cursor_ == 0) {
        return 0.0;
    }
    return candles_[cursor_ - 1].close;
}

} // namespace engine
} // namespace corolla
