#pragma once

#include "analytics/IndicatorEngine.h"
#include "strategy/ConfluenceEvaluator.h"
#include "strategy/LevelBreakDetector.h"
#include "strategy/StrategyConfig.h"
#include "strategy/StrategyTypes.h"

namespace corolla {
namespace strategy {

enum class WindowState {
    IDLE,   // no break tracked
    ARMED   // break recorded, countdown running
};

// break_level / break_direction are only meaningful while ARMED;
// they are reset to 0 / NONE on every transition back to IDLE.
struct StrategyState {
    WindowState state = WindowState::IDLE;
    int window_remaining = 0;
    double break_level = 0.0;
    Direction break_direction = Direction::NONE;

    bool windowActive() const { return state == WindowState::ARMED; }
};

// Idle -> Armed on a level break, Armed -> Idle on a confluent signal or
// when the countdown runs out. Stepped exactly once per primary candle.
class MomentumWindowStateMachine {
public:
    explicit MomentumWindowStateMachine(const StrategyConfig& config = StrategyConfig());

    Signal step(const analytics::IndicatorSnapshot& snapshot);

    const StrategyState& getState() const { return state_; }
    void reset();

private:
    Signal onIdle(const analytics::IndicatorSnapshot& snapshot);
    Signal onArmed(const analytics::IndicatorSnapshot& snapshot);

    void arm(const BreakEvent& event);
    void disarm();

    int momentum_window_;
    int min_confluence_;
    LevelBreakDetector detector_;
    ConfluenceEvaluator evaluator_;
    StrategyState state_;
};

} // namespace strategy
} // namespace corolla
