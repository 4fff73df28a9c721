#include "strategy/ConfluenceEvaluator.h"
#include "common/Logger.h"

#include <cmath>

namespace corolla {
namespace strategy {

namespace {
const char* const kSqueezeExit = "squeeze_exit";
const char* const kMomentumAligned = "momentum_aligned";
const char* const kFastTrendAligned = "fast_trend_aligned";
const char* const kSlowTrendAligned = "slow_trend_aligned";
const char* const kBreakStrength = "break_strength";
}

int ConfluenceScore::count() const {
    return static_cast<int>(squeeze_exit) + static_cast<int>(momentum_aligned) +
           static_cast<int>(fast_trend_aligned) + static_cast<int>(slow_trend_aligned) +
           static_cast<int>(break_strength);
}

std::vector<std::string> ConfluenceScore::trueFactorNames() const {
    std::vector<std::string> names;
    if (squeeze_exit) names.emplace_back(kSqueezeExit);
    if (momentum_aligned) names.emplace_back(kMomentumAligned);
    if (fast_trend_aligned) names.emplace_back(kFastTrendAligned);
    if (slow_trend_aligned) names.emplace_back(kSlowTrendAligned);
    if (break_strength) names.emplace_back(kBreakStrength);
    return names;
}

std::map<std::string, bool> ConfluenceScore::toMap() const {
    return {
        {kSqueezeExit, squeeze_exit},
        {kMomentumAligned, momentum_aligned},
        {kFastTrendAligned, fast_trend_aligned},
        {kSlowTrendAligned, slow_trend_aligned},
        {kBreakStrength, break_strength},
    };
}

ConfluenceEvaluator::ConfluenceEvaluator(double min_break_pct)
    : min_break_pct_(min_break_pct) {
}

bool ConfluenceEvaluator::trendAligned(Direction direction, int trend) {
    if (direction == Direction::LONG) return trend >= 0;
    if (direction == Direction::SHORT) return trend <= 0;
    return false;
}

ConfluenceScore ConfluenceEvaluator::evaluate(
    Direction direction,
    double break_level,
    const analytics::IndicatorSnapshot& snapshot
) const {
    ConfluenceScore score;

    // 1. Squeeze 해제 (white dot)
    score.squeeze_exit = !snapshot.squeeze.in_squeeze;

    // 2. 모멘텀 방향
    const double momentum = snapshot.squeeze.momentum;
    if (direction == Direction::LONG) {
        score.momentum_aligned = momentum > 0.0;
    } else if (direction == Direction::SHORT) {
        score.momentum_aligned = momentum < 0.0;
    }

    // 3, 4. ATF 확인
    score.fast_trend_aligned = trendAligned(direction, snapshot.trend_signal_short);
    score.slow_trend_aligned = trendAligned(direction, snapshot.trend_signal_long);

    // 5. 돌파 강도
    const double price = snapshot.last_close;
    if (break_level > 0.0 && price > 0.0) {
        const double break_pct = std::abs(price - break_level) / break_level;
        score.break_strength = break_pct >= min_break_pct_;
    }

    LOG_DEBUG("Confluence {}: {}/{} (squeeze_exit={}, momentum={}, fast={}, slow={}, break={})",
              toString(direction), score.count(), ConfluenceScore::kFactorCount,
              score.squeeze_exit, score.momentum_aligned, score.fast_trend_aligned,
              score.slow_trend_aligned, score.break_strength);

    return score;
}

} // namespace strategy
} // namespace corolla
