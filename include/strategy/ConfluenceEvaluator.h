#pragma once

#include "analytics/IndicatorEngine.h"
#include "strategy/StrategyTypes.h"
#include <map>
#include <string>
#include <vector>

namespace corolla {
namespace strategy {

// 5-factor confluence for one candidate direction.
struct ConfluenceScore {
    static constexpr int kFactorCount = 5;

    bool squeeze_exit = false;          // squeeze released
    bool momentum_aligned = false;      // SQZMOM color matches direction
    bool fast_trend_aligned = false;    // 1m ATF confirms (neutral counts)
    bool slow_trend_aligned = false;    // 15m ATF confirms (neutral counts)
    bool break_strength = false;        // price at least tolerance away from the level

    int count() const;

    // factor names in fixed order, only the true ones
    std::vector<std::string> trueFactorNames() const;

    std::map<std::string, bool> toMap() const;
};

class ConfluenceEvaluator {
public:
    explicit ConfluenceEvaluator(double min_break_pct = 0.001);

    ConfluenceScore evaluate(
        Direction direction,
        double break_level,
        const analytics::IndicatorSnapshot& snapshot
    ) const;

private:
    static bool trendAligned(Direction direction, int trend);

    double min_break_pct_;
};

} // namespace strategy
} // namespace corolla
