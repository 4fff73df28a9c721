#pragma once

#include "analytics/IndicatorEngine.h"
#include <cstddef>

namespace corolla {
namespace strategy {

struct StrategyConfig {
    // Momentum window
    int momentum_window = 6;            // candles to wait for confluence after a break
    int min_confluence = 4;             // of 5 factors

    // Data guard
    std::size_t min_bars = 50;          // primary closes required before evaluating
    std::size_t series_capacity = 200;

    // Break / exit
    double break_tolerance = 0.001;     // 0.1%
    double exit_strength = 0.8;

    // 1m candles per 15m confirmation candle
    int confirmation_bars_per_candle = 15;

    analytics::IndicatorConfig indicators;
};

} // namespace strategy
} // namespace corolla
