#pragma once

#include "analytics/RollingSeries.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Result.h"
#include <vector>

namespace corolla {
namespace analytics {

struct TrendFlowParams {
    int main_length = 6;
    int smooth_length = 14;
    double sensitivity = 2.0;
};

struct IndicatorConfig {
    TrendFlowParams trend_fast;                 // 1m ATF
    TrendFlowParams trend_slow{10, 14, 2.0};    // 15m ATF

    int pivot_left_bars = 10;
    int pivot_right_bars = 5;
    int max_levels = 5;

    int bb_length = 20;
    double bb_mult = 2.0;
    int kc_length = 20;
    double kc_mult = 1.5;
    int momentum_length = 20;

    int sma_long_period = 200;
    int min_snapshot_bars = 20;
};

// Indicator values computed from one series at one instant.
struct IndicatorSnapshot {
    int trend_signal_short = 0;     // fast trend flow, -1/0/+1
    int trend_signal_long = 0;      // slow trend flow, -1/0/+1
    bool slow_trend_from_confirmation = false;

    TechnicalIndicators::SqueezeResult squeeze;

    std::vector<double> support_levels;     // oldest -> newest
    std::vector<double> resistance_levels;  // oldest -> newest

    double last_close = 0.0;
    double sma_200 = 0.0;   // 0 until sma_long_period closes exist
};

using IndicatorResult = Result<IndicatorSnapshot>;

// Pure function of a RollingSeries snapshot.
class IndicatorEngine {
public:
    explicit IndicatorEngine(const IndicatorConfig& config = IndicatorConfig());
    virtual ~IndicatorEngine() = default;

    // The slow trend value is taken from `confirmation` when it holds enough
    // bars for the slow parameters, otherwise from the primary series.
    virtual IndicatorResult compute(const RollingSeries& primary,
                                    const RollingSeries* confirmation = nullptr) const;

    const IndicatorConfig& getConfig() const { return config_; }

private:
    IndicatorSnapshot buildSnapshot(const SeriesArrays& primary,
                                    const SeriesArrays* confirmation) const;

    IndicatorConfig config_;
};

} // namespace analytics
} // namespace corolla
