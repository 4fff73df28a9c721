#include "strategy/MomentumWindowStateMachine.h"
#include "common/Logger.h"

#include <algorithm>
#include <sstream>

namespace corolla {
namespace strategy {

MomentumWindowStateMachine::MomentumWindowStateMachine(const StrategyConfig& config)
    : momentum_window_(std::max(1, config.momentum_window))
    , min_confluence_(config.min_confluence)
    , detector_(config.break_tolerance)
    , evaluator_(config.break_tolerance) {
}

Signal MomentumWindowStateMachine::step(const analytics::IndicatorSnapshot& snapshot) {
    if (state_.state == WindowState::IDLE) {
        return onIdle(snapshot);
    }
    return onArmed(snapshot);
}

Signal MomentumWindowStateMachine::onIdle(const analytics::IndicatorSnapshot& snapshot) {
    const double price = snapshot.last_close;
    const auto event = detector_.check(price, snapshot.resistance_levels, snapshot.support_levels);
    if (!event) {
        return makeNoSignal(price, "waiting for setup");
    }

    arm(*event);

    std::ostringstream reason;
    reason << (event->direction == Direction::LONG ? "resistance break at " : "support break at ")
           << event->level;
    return makeNoSignal(price, reason.str());
}

Signal MomentumWindowStateMachine::onArmed(const analytics::IndicatorSnapshot& snapshot) {
    const double price = snapshot.last_close;
    const ConfluenceScore score = evaluator_.evaluate(state_.break_direction, state_.break_level, snapshot);
    const int confluence = score.count();

    if (confluence >= min_confluence_) {
        const SignalKind kind = toSignalKind(state_.break_direction);
        const double strength = static_cast<double>(confluence) / ConfluenceScore::kFactorCount;

        LOG_INFO("SIGNAL GENERATED: {} at {} (strength: {:.2f}, confluence {}/{})",
                 toString(kind), price, strength, confluence, ConfluenceScore::kFactorCount);

        disarm();
        return makeSignal(kind, strength, price, score.trueFactorNames());
    }

    state_.window_remaining -= 1;
    LOG_DEBUG("Momentum window: {} candles remaining, confluence: {}/{}",
              state_.window_remaining, confluence, ConfluenceScore::kFactorCount);

    if (state_.window_remaining <= 0) {
        LOG_INFO("Momentum window expired without signal");
        disarm();
        return makeNoSignal(price, "momentum window expired");
    }

    std::ostringstream reason;
    reason << "momentum window active: " << state_.window_remaining
           << " candles remaining, confluence " << confluence << "/" << ConfluenceScore::kFactorCount;
    return makeNoSignal(price, reason.str());
}

void MomentumWindowStateMachine::arm(const BreakEvent& event) {
    state_.state = WindowState::ARMED;
    state_.window_remaining = momentum_window_;
    state_.break_level = event.level;
    state_.break_direction = event.direction;
    LOG_INFO("Momentum window started ({} at {}): {} candles remaining",
             toString(event.direction), event.level, state_.window_remaining);
}

void MomentumWindowStateMachine::disarm() {
    state_ = StrategyState();
}

void MomentumWindowStateMachine::reset() {
    disarm();
}

} // namespace strategy
} // namespace corolla
