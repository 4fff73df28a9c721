#pragma once

#include <string>
#include <vector>

namespace corolla {
namespace strategy {

// 돌파 방향
enum class Direction {
    NONE,
    LONG,
    SHORT
};

// 매매 신호 종류
enum class SignalKind {
    NO_SIGNAL,
    LONG,
    SHORT,
    EXIT
};

// 지지/저항 돌파 이벤트
struct BreakEvent {
    double level;
    Direction direction;

    BreakEvent() : level(0), direction(Direction::NONE) {}
    BreakEvent(double l, Direction d) : level(l), direction(d) {}
};

// 평가 주기마다 하나씩 생성되는 결과 (불변)
struct Signal {
    SignalKind kind;
    double strength;                    // 0.0 ~ 1.0
    double price;
    std::vector<std::string> reasons;   // 순서 유지
    long long timestamp;                // epoch ms

    Signal()
        : kind(SignalKind::NO_SIGNAL)
        , strength(0.0)
        , price(0.0)
        , timestamp(0)
    {}

    bool isActionable() const { return kind != SignalKind::NO_SIGNAL; }
};

Signal makeSignal(SignalKind kind, double strength, double price, std::vector<std::string> reasons);
Signal makeNoSignal(double price, const std::string& reason);

std::string toString(Direction direction);
std::string toString(SignalKind kind);
SignalKind toSignalKind(Direction direction);

} // namespace strategy
} // namespace corolla
