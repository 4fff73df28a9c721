#include "strategy/StrategyTypes.h"
#include "common/Types.h"

#include <utility>

namespace corolla {
namespace strategy {

Signal makeSignal(SignalKind kind, double strength, double price, std::vector<std::string> reasons) {
    Signal signal;
    signal.kind = kind;
    signal.strength = strength;
    signal.price = price;
    signal.reasons = std::move(reasons);
    signal.timestamp = nowMillis();
    return signal;
}

Signal makeNoSignal(double price, const std::string& reason) {
    return makeSignal(SignalKind::NO_SIGNAL, 0.0, price, {reason});
}

std::string toString(Direction direction) {
    switch (direction) {
        case Direction::NONE: return "NONE";
        case Direction::LONG: return "LONG";
        case Direction::SHORT: return "SHORT";
    }
    return "NONE";
}

std::string toString(SignalKind kind) {
    switch (kind) {
        case SignalKind::NO_SIGNAL: return "NO_SIGNAL";
        case SignalKind::LONG: return "LONG";
        case SignalKind::SHORT: return "SHORT";
        case SignalKind::EXIT: return "EXIT";
    }
    return "NO_SIGNAL";
}

SignalKind toSignalKind(Direction direction) {
    switch (direction) {
        case Direction::LONG: return SignalKind::LONG;
        case Direction::SHORT: return SignalKind::SHORT;
        case Direction::NONE: break;
    }
    return SignalKind::NO_SIGNAL;
}

} // namespace strategy
} // namespace corolla
