#pragma once

#include "analytics/IndicatorEngine.h"
#include "analytics/RollingSeries.h"
#include "common/Types.h"
#include "strategy/MomentumWindowStateMachine.h"
#include "strategy/StrategyConfig.h"
#include "strategy/StrategyTypes.h"

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace corolla {
namespace strategy {

enum class Timeframe {
    PRIMARY,        // 1m, drives evaluation
    CONFIRMATION    // 15m, feeds the slow trend factor
};

std::string toString(Timeframe timeframe);

// One evaluation cycle. `entry` is always present (NO_SIGNAL included);
// `exit` only when the trend flow flipped against an open position.
struct EvaluationResult {
    Signal entry;
    std::optional<Signal> exit;
};

// Read-only view for the dashboard (polled).
struct StrategyStatus {
    bool window_active = false;
    int window_remaining = 0;
    double break_level = 0.0;
    std::string break_direction = "NONE";
    std::map<std::string, std::size_t> buffered_bars;
    std::string last_signal = "None";

    nlohmann::json toJson() const;

    // shown before an engine exists
    static nlohmann::json placeholderJson();
};

// Corolla strategy: 5-factor confluence after a support/resistance break.
class StrategyEngine {
public:
    explicit StrategyEngine(const StrategyConfig& config = StrategyConfig());

    // custom indicator computation (null -> IndicatorEngine(config.indicators))
    StrategyEngine(const StrategyConfig& config,
                   std::unique_ptr<analytics::IndicatorEngine> indicator_engine);

    void onCandle(const Candle& candle, Timeframe timeframe = Timeframe::PRIMARY);

    // Runs the state machine and the exit check once. Never throws.
    EvaluationResult evaluate(int current_position);

    StrategyStatus getStatus() const;
    std::size_t bufferedBars(Timeframe timeframe) const;
    const StrategyConfig& getConfig() const { return config_; }

    // position > 0 with bearish trend, or position < 0 with bullish trend
    static std::optional<Signal> checkExit(int current_position,
                                           int fast_trend,
                                           double current_price,
                                           double strength);

private:
    analytics::RollingSeries& seriesFor(Timeframe timeframe);
    const analytics::RollingSeries& seriesFor(Timeframe timeframe) const;
    void rememberSignal(const Signal& signal);

    StrategyConfig config_;
    analytics::RollingSeries primary_series_;
    analytics::RollingSeries confirmation_series_;
    std::unique_ptr<analytics::IndicatorEngine> indicator_engine_;
    MomentumWindowStateMachine state_machine_;
    std::optional<SignalKind> last_signal_kind_;
    mutable std::mutex mutex_;
};

} // namespace strategy
} // namespace corolla
