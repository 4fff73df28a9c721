#include "strategy/StrategyEngine.h"
#include "common/Logger.h"

#include <exception>
#include <utility>

namespace corolla {
namespace strategy {

std::string toString(Timeframe timeframe) {
    return timeframe == Timeframe::PRIMARY ? "1m" : "15m";
}

nlohmann::json StrategyStatus::toJson() const {
    nlohmann::json j;
    j["window_active"] = window_active;
    j["window_remaining"] = window_remaining;
    j["break_level"] = break_level;
    j["break_direction"] = break_direction;
    j["buffered_bars"] = buffered_bars;
    j["last_signal"] = last_signal;
    return j;
}

nlohmann::json StrategyStatus::placeholderJson() {
    nlohmann::json j = StrategyStatus().toJson();
    j["status"] = "Not Started";
    return j;
}

StrategyEngine::StrategyEngine(const StrategyConfig& config)
    : StrategyEngine(config, nullptr) {
}

StrategyEngine::StrategyEngine(
    const StrategyConfig& config,
    std::unique_ptr<analytics::IndicatorEngine> indicator_engine
)
    : config_(config)
    , primary_series_(config.series_capacity)
    , confirmation_series_(config.series_capacity)
    , indicator_engine_(std::move(indicator_engine))
    , state_machine_(config) {
    if (!indicator_engine_) {
        indicator_engine_ = std::make_unique<analytics::IndicatorEngine>(config.indicators);
    }
    LOG_INFO("Corolla strategy initialized (window={}, min_confluence={}, min_bars={})",
             config_.momentum_window, config_.min_confluence, config_.min_bars);
}

analytics::RollingSeries& StrategyEngine::seriesFor(Timeframe timeframe) {
    return timeframe == Timeframe::PRIMARY ? primary_series_ : confirmation_series_;
}

const analytics::RollingSeries& StrategyEngine::seriesFor(Timeframe timeframe) const {
    return timeframe == Timeframe::PRIMARY ? primary_series_ : confirmation_series_;
}

void StrategyEngine::onCandle(const Candle& candle, Timeframe timeframe) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = seriesFor(timeframe);
    series.append(candle.high, candle.low, candle.close, candle.volume);
    LOG_DEBUG("Updated {} data: {} candles", toString(timeframe), series.size());
}

EvaluationResult StrategyEngine::evaluate(int current_position) {
    std::lock_guard<std::mutex> lock(mutex_);
    EvaluationResult result;
    const double last_close = primary_series_.lastClose();

    if (primary_series_.size() < config_.min_bars) {
        LOG_DEBUG("Insufficient data for signal generation ({}/{})",
                  primary_series_.size(), config_.min_bars);
        result.entry = makeNoSignal(last_close, "insufficient data");
        return result;
    }

    try {
        const auto indicators = indicator_engine_->compute(primary_series_, &confirmation_series_);
        if (!indicators.isOk()) {
            if (indicators.isFault()) {
                LOG_ERROR("Indicator calculation failed: {}", indicators.message);
                result.entry = makeNoSignal(last_close, "indicator calculation failed: " + indicators.message);
            } else {
                result.entry = makeNoSignal(last_close, "insufficient data");
            }
            return result;
        }

        const analytics::IndicatorSnapshot& snapshot = indicators.value;
        result.entry = state_machine_.step(snapshot);
        result.exit = checkExit(current_position, snapshot.trend_signal_short,
                                snapshot.last_close, config_.exit_strength);
    } catch (const std::exception& e) {
        LOG_ERROR("Error generating signal: {}", e.what());
        result.entry = makeNoSignal(last_close, std::string("error: ") + e.what());
        result.exit.reset();
        return result;
    }

    rememberSignal(result.entry);
    if (result.exit) {
        LOG_INFO("EXIT: {} at {}", result.exit->reasons.front(), result.exit->price);
        rememberSignal(*result.exit);
    }
    return result;
}

std::optional<Signal> StrategyEngine::checkExit(
    int current_position,
    int fast_trend,
    double current_price,
    double strength
) {
    if (current_position > 0 && fast_trend < 0) {
        return makeSignal(SignalKind::EXIT, strength, current_price, {"trend flow flipped bearish"});
    }
    if (current_position < 0 && fast_trend > 0) {
        return makeSignal(SignalKind::EXIT, strength, current_price, {"trend flow flipped bullish"});
    }
    return std::nullopt;
}

void StrategyEngine::rememberSignal(const Signal& signal) {
    if (signal.isActionable()) {
        last_signal_kind_ = signal.kind;
    }
}

StrategyStatus StrategyEngine::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const StrategyState& state = state_machine_.getState();

    StrategyStatus status;
    status.window_active = state.windowActive();
    status.window_remaining = state.window_remaining;
    status.break_level = state.break_level;
    status.break_direction = toString(state.break_direction);
    status.buffered_bars[toString(Timeframe::PRIMARY)] = primary_series_.size();
    status.buffered_bars[toString(Timeframe::CONFIRMATION)] = confirmation_series_.size();
    if (last_signal_kind_) {
        status.last_signal = toString(*last_signal_kind_);
    }
    return status;
}

std::size_t StrategyEngine::bufferedBars(Timeframe timeframe) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seriesFor(timeframe).size();
}

} // namespace strategy
} // namespace corolla
