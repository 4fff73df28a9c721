#include "analytics/IndicatorEngine.h"
#include "common/Logger.h"

#include <algorithm>
#include <exception>
#include <string>

namespace corolla {
namespace analytics {

IndicatorEngine::IndicatorEngine(const IndicatorConfig& config)
    : config_(config) {
}

IndicatorResult IndicatorEngine::compute(
    const RollingSeries& primary,
    const RollingSeries* confirmation
) const {
    if (primary.size() < static_cast<size_t>(std::max(1, config_.min_snapshot_bars))) {
        return IndicatorResult::insufficientData(
            "need " + std::to_string(config_.min_snapshot_bars) + " bars, have " +
            std::to_string(primary.size()));
    }

    try {
        const SeriesArrays primary_arrays = primary.asArrays();
        if (confirmation != nullptr && !confirmation->empty()) {
            const SeriesArrays confirmation_arrays = confirmation->asArrays();
            return IndicatorResult::ok(buildSnapshot(primary_arrays, &confirmation_arrays));
        }
        return IndicatorResult::ok(buildSnapshot(primary_arrays, nullptr));
    } catch (const std::exception& e) {
        LOG_ERROR("Indicator computation failed: {}", e.what());
        return IndicatorResult::fault(e.what());
    }
}

IndicatorSnapshot IndicatorEngine::buildSnapshot(
    const SeriesArrays& primary,
    const SeriesArrays* confirmation
) const {
    IndicatorSnapshot snapshot;
    const auto& highs = primary.highs;
    const auto& lows = primary.lows;
    const auto& closes = primary.closes;

    snapshot.last_close = closes.empty() ? 0.0 : closes.back();

    snapshot.trend_signal_short = TechnicalIndicators::calculateTrendFlow(
        closes,
        config_.trend_fast.main_length,
        config_.trend_fast.smooth_length,
        config_.trend_fast.sensitivity);

    const size_t slow_required = static_cast<size_t>(
        std::max(config_.trend_slow.main_length, config_.trend_slow.smooth_length));
    if (confirmation != nullptr && confirmation->size() >= slow_required) {
        snapshot.trend_signal_long = TechnicalIndicators::calculateTrendFlow(
            confirmation->closes,
            config_.trend_slow.main_length,
            config_.trend_slow.smooth_length,
            config_.trend_slow.sensitivity);
        snapshot.slow_trend_from_confirmation = true;
    } else {
        // 15m 데이터가 아직 부족하면 1m 종가에 15m 파라미터 적용
        snapshot.trend_signal_long = TechnicalIndicators::calculateTrendFlow(
            closes,
            config_.trend_slow.main_length,
            config_.trend_slow.smooth_length,
            config_.trend_slow.sensitivity);
    }

    snapshot.squeeze = TechnicalIndicators::calculateSqueezeMomentum(
        highs, lows, closes,
        config_.bb_length, config_.bb_mult,
        config_.kc_length, config_.kc_mult,
        config_.momentum_length);

    const size_t max_levels = static_cast<size_t>(std::max(0, config_.max_levels));
    snapshot.support_levels = TechnicalIndicators::findSupportLevels(
        lows, config_.pivot_left_bars, config_.pivot_right_bars, max_levels);
    snapshot.resistance_levels = TechnicalIndicators::findResistanceLevels(
        highs, config_.pivot_left_bars, config_.pivot_right_bars, max_levels);

    snapshot.sma_200 = TechnicalIndicators::calculateSMA(closes, config_.sma_long_period);

    LOG_DEBUG("Indicators: ATF fast={} slow={}, squeeze={}, momentum={:.4f}, S={} R={}",
              snapshot.trend_signal_short, snapshot.trend_signal_long,
              snapshot.squeeze.in_squeeze, snapshot.squeeze.momentum,
              snapshot.support_levels.size(), snapshot.resistance_levels.size());

    return snapshot;
}

} // namespace analytics
} // namespace corolla
