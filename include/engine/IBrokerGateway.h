#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace corolla {
namespace engine {

// Broker-side capabilities the driving loop needs. Implementations may
// throw std::runtime_error on I/O failure; the loop backs off and retries.
class IBrokerGateway {
public:
    virtual ~IBrokerGateway() = default;

    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // 최신 봉, 아직 없거나 피드가 끝났으면 nullopt
    virtual std::optional<Candle> fetchLatestCandle() = 0;

    virtual double currentPrice() = 0;

    // signed contracts, >0 long, <0 short
    virtual int currentPosition() = 0;

    // no more candles will ever arrive (replay finished)
    virtual bool isExhausted() const { return false; }

    virtual std::string name() const = 0;
};

} // namespace engine
} // namespace corolla
