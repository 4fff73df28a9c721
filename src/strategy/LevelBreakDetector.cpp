#include "strategy/LevelBreakDetector.h"
#include "common/Logger.h"

namespace corolla {
namespace strategy {

LevelBreakDetector::LevelBreakDetector(double tolerance)
    : tolerance_(tolerance) {
}

std::optional<BreakEvent> LevelBreakDetector::check(
    double current_price,
    const std::vector<double>& resistance_levels,
    const std::vector<double>& support_levels
) const {
    // 저항 돌파 (LONG) 우선
    for (double resistance : resistance_levels) {
        if (current_price > resistance * (1.0 + tolerance_)) {
            LOG_INFO("Resistance break detected: {} > {}", current_price, resistance);
            return BreakEvent(resistance, Direction::LONG);
        }
    }

    // 지지 이탈 (SHORT)
    for (double support : support_levels) {
        if (current_price < support * (1.0 - tolerance_)) {
            LOG_INFO("Support break detected: {} < {}", current_price, support);
            return BreakEvent(support, Direction::SHORT);
        }
    }

    return std::nullopt;
}

} // namespace strategy
} // namespace corolla
