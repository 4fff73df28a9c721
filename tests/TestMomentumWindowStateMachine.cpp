#include "strategy/MomentumWindowStateMachine.h"

#include <cassert>
#include <iostream>
#include <string>

using corolla::analytics::IndicatorSnapshot;
using corolla::strategy::Direction;
using corolla::strategy::MomentumWindowStateMachine;
using corolla::strategy::SignalKind;
using corolla::strategy::StrategyConfig;
using corolla::strategy::WindowState;

namespace {
IndicatorSnapshot idleSnapshot(double close) {
    IndicatorSnapshot snapshot;
    snapshot.last_close = close;
    return snapshot;
}

// resistance 100 cleared by the close
IndicatorSnapshot resistanceBreak(double close) {
    IndicatorSnapshot snapshot = idleSnapshot(close);
    snapshot.resistance_levels = {100.0};
    return snapshot;
}

IndicatorSnapshot supportBreak(double close) {
    IndicatorSnapshot snapshot = idleSnapshot(close);
    snapshot.support_levels = {100.0};
    return snapshot;
}

IndicatorSnapshot factors(bool in_squeeze, double momentum, int fast, int slow, double close) {
    IndicatorSnapshot snapshot = idleSnapshot(close);
    snapshot.squeeze.in_squeeze = in_squeeze;
    snapshot.squeeze.momentum = momentum;
    snapshot.trend_signal_short = fast;
    snapshot.trend_signal_long = slow;
    return snapshot;
}
}

int main() {
    // idle without levels
    {
        MomentumWindowStateMachine machine;
        const auto signal = machine.step(idleSnapshot(100.0));
        assert(signal.kind == SignalKind::NO_SIGNAL);
        assert(signal.reasons.size() == 1);
        assert(signal.reasons.front() == "waiting for setup");
        assert(machine.getState().state == WindowState::IDLE);
        assert(!machine.getState().windowActive());
    }

    // arm -> 4/5 -> LONG 0.8
    {
        MomentumWindowStateMachine machine;

        const auto armed = machine.step(resistanceBreak(100.5));
        assert(armed.kind == SignalKind::NO_SIGNAL);
        assert(armed.reasons.front().find("resistance break at 100") == 0);

        const auto& state = machine.getState();
        assert(state.state == WindowState::ARMED);
        assert(state.window_remaining == 6);
        assert(state.break_level == 100.0);
        assert(state.break_direction == Direction::LONG);

        // break_strength false (0.05%), other four true
        const auto signal = machine.step(factors(false, 1.0, 1, 1, 100.05));
        assert(signal.kind == SignalKind::LONG);
        assert(signal.strength > 0.79 && signal.strength < 0.81);
        assert(signal.price == 100.05);
        assert(signal.reasons.size() == 4);
        assert(signal.reasons.front() == "squeeze_exit");
        assert(signal.reasons.back() == "slow_trend_aligned");

        assert(state.state == WindowState::IDLE);
        assert(state.window_remaining == 0);
        assert(state.break_level == 0.0);
        assert(state.break_direction == Direction::NONE);
    }

    // 3/5 for the whole window -> silent expiry
    {
        MomentumWindowStateMachine machine;
        machine.step(resistanceBreak(101.0));
        assert(machine.getState().state == WindowState::ARMED);

        for (int i = 1; i <= 6; ++i) {
            // squeeze on, momentum against -> fast, slow, break only
            const auto signal = machine.step(factors(true, -1.0, 1, 1, 101.0));
            assert(signal.kind == SignalKind::NO_SIGNAL);
            if (i < 6) {
                assert(machine.getState().state == WindowState::ARMED);
                assert(machine.getState().window_remaining == 6 - i);
                assert(signal.reasons.front().find("momentum window active") == 0);
            } else {
                assert(signal.reasons.front() == "momentum window expired");
            }
        }

        assert(machine.getState().state == WindowState::IDLE);
        assert(machine.getState().window_remaining == 0);
        assert(machine.getState().break_direction == Direction::NONE);
    }

    // SHORT side
    {
        MomentumWindowStateMachine machine;
        const auto armed = machine.step(supportBreak(99.5));
        assert(armed.kind == SignalKind::NO_SIGNAL);
        assert(armed.reasons.front().find("support break at 100") == 0);
        assert(machine.getState().break_direction == Direction::SHORT);

        const auto signal = machine.step(factors(false, -2.0, -1, 0, 98.0));
        assert(signal.kind == SignalKind::SHORT);
        assert(signal.strength == 1.0);
        assert(signal.reasons.size() == 5);
        assert(machine.getState().state == WindowState::IDLE);
    }

    // arming candle is never scored, even with every factor true
    {
        MomentumWindowStateMachine machine;
        IndicatorSnapshot snapshot = factors(false, 1.0, 1, 1, 101.0);
        snapshot.resistance_levels = {100.0};
        assert(machine.step(snapshot).kind == SignalKind::NO_SIGNAL);
        assert(machine.getState().state == WindowState::ARMED);
        assert(machine.step(snapshot).kind == SignalKind::LONG);
    }

    // levels are ignored while armed
    {
        MomentumWindowStateMachine machine;
        machine.step(resistanceBreak(101.0));

        IndicatorSnapshot snapshot = factors(true, -1.0, -1, -1, 95.0);
        snapshot.support_levels = {100.0};
        machine.step(snapshot);
        assert(machine.getState().break_direction == Direction::LONG);
        assert(machine.getState().break_level == 100.0);
        assert(machine.getState().window_remaining == 5);

        machine.reset();
        assert(machine.getState().state == WindowState::IDLE);
    }

    // configured window / threshold
    {
        StrategyConfig config;
        config.momentum_window = 2;
        config.min_confluence = 5;
        MomentumWindowStateMachine machine(config);

        machine.step(resistanceBreak(101.0));
        assert(machine.getState().window_remaining == 2);
        assert(machine.step(factors(false, 1.0, 1, 1, 100.05)).kind == SignalKind::NO_SIGNAL);
        assert(machine.getState().window_remaining == 1);
        assert(machine.step(factors(false, 1.0, 1, 1, 100.05)).kind == SignalKind::NO_SIGNAL);
        assert(machine.getState().state == WindowState::IDLE);
    }

    std::cout << "[TEST] MomentumWindowStateMachine PASSED\n";
    return 0;
}
