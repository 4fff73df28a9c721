#pragma once

#include "strategy/StrategyTypes.h"
#include <optional>
#include <vector>

namespace corolla {
namespace strategy {

// Flags a close that clears a known support/resistance level by more than
// the tolerance. Resistances are scanned first, in list order, and the first
// hit wins; supports are only scanned when no resistance broke.
class LevelBreakDetector {
public:
    explicit LevelBreakDetector(double tolerance = 0.001);

    std::optional<BreakEvent> check(
        double current_price,
        const std::vector<double>& resistance_levels,
        const std::vector<double>& support_levels
    ) const;

    double getTolerance() const { return tolerance_; }

private:
    double tolerance_;
};

} // namespace strategy
} // namespace corolla
