#include "analytics/TechnicalIndicators.h"

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <vector>

using corolla::analytics::TechnicalIndicators;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

std::vector<double> constant(std::size_t n, double value) {
    return std::vector<double>(n, value);
}
}

int main() {
    // ===== SMA =====
    {
        assert(TechnicalIndicators::calculateSMA({1.0, 2.0}, 3) == 0.0);
        assert(TechnicalIndicators::calculateSMA({}, 1) == 0.0);
        assert(near(TechnicalIndicators::calculateSMA({1.0, 2.0, 3.0, 4.0}, 2), 3.5));
    }

    // ===== EMA =====
    {
        assert(TechnicalIndicators::calculateEMA({}, 14) == 0.0);

        // 데이터 부족 -> 최신 종가
        assert(TechnicalIndicators::calculateEMA({5.0, 6.0, 7.0}, 10) == 7.0);

        const std::vector<double> prices = {3.0, 8.0, 1.0, 9.0, 4.0};
        assert(TechnicalIndicators::calculateEMA(prices, 1) == 4.0);

        // seeded with the oldest close
        assert(near(TechnicalIndicators::calculateEMA({10.0, 20.0}, 2), 50.0 / 3.0));

        assert(near(TechnicalIndicators::calculateEMA(constant(100, 42.0), 14), 42.0));
    }

    // ===== ATR =====
    {
        assert(TechnicalIndicators::calculateATR({10.0}, {8.0}, {9.0}, 14) == 0.0);

        const std::vector<double> highs = {10.0, 12.0, 11.0};
        const std::vector<double> lows = {8.0, 9.0, 9.0};
        const std::vector<double> closes = {9.0, 11.0, 10.0};

        // TR = {3, 2}; fewer than period -> mean of all
        assert(near(TechnicalIndicators::calculateATR(highs, lows, closes, 14), 2.5));
        assert(near(TechnicalIndicators::calculateATR(highs, lows, closes, 1), 2.0));
    }

    // ===== Bollinger / Keltner =====
    {
        const auto short_bb = TechnicalIndicators::calculateBollingerBands({1.0, 2.0}, 20, 2.0);
        assert(short_bb.upper == 0.0 && short_bb.middle == 0.0 && short_bb.lower == 0.0);

        const auto flat = TechnicalIndicators::calculateBollingerBands(constant(30, 100.0), 20, 2.0);
        assert(flat.upper == flat.middle);
        assert(flat.middle == flat.lower);
        assert(flat.middle == 100.0);

        // population stdev of {1,2,3,4} = sqrt(1.25)
        const auto bb = TechnicalIndicators::calculateBollingerBands({1.0, 2.0, 3.0, 4.0}, 4, 1.0);
        assert(near(bb.middle, 2.5));
        assert(near(bb.upper, 2.5 + std::sqrt(1.25)));
        assert(near(bb.lower, 2.5 - std::sqrt(1.25)));

        const auto short_kc = TechnicalIndicators::calculateKeltnerChannels(
            {2.0}, {1.0}, {1.5}, 20, 1.5);
        assert(short_kc.upper == 0.0 && short_kc.middle == 0.0 && short_kc.lower == 0.0);
    }

    // ===== Squeeze =====
    {
        TechnicalIndicators::BollingerBands bb;
        TechnicalIndicators::KeltnerChannels kc;

        bb.upper = 101.0; bb.lower = 99.0;
        kc.upper = 102.0; kc.lower = 98.0;
        assert(TechnicalIndicators::isSqueezeActive(bb, kc));

        bb.upper = 103.0; bb.lower = 97.0;
        assert(!TechnicalIndicators::isSqueezeActive(bb, kc));

        // one side outside is enough to release
        bb.upper = 101.0; bb.lower = 97.0;
        assert(!TechnicalIndicators::isSqueezeActive(bb, kc));

        const auto flat = TechnicalIndicators::calculateSqueezeMomentum(
            constant(30, 100.0), constant(30, 100.0), constant(30, 100.0),
            20, 2.0, 20, 1.5, 20);
        assert(!flat.in_squeeze);
        assert(flat.momentum == 0.0);

        // rising closes -> positive momentum
        std::vector<double> highs, lows, closes;
        for (int i = 0; i < 30; ++i) {
            closes.push_back(100.0 + i);
            highs.push_back(101.0 + i);
            lows.push_back(99.0 + i);
        }
        const auto rising = TechnicalIndicators::calculateSqueezeMomentum(
            highs, lows, closes, 20, 2.0, 20, 1.5, 20);
        assert(rising.momentum > 0.0);

        const auto few = TechnicalIndicators::calculateSqueezeMomentum(
            constant(5, 1.0), constant(5, 1.0), constant(5, 1.0), 20, 2.0, 20, 1.5, 20);
        assert(!few.in_squeeze);
        assert(few.momentum == 0.0);
    }

    // ===== Trend Flow =====
    {
        std::vector<double> up;
        for (int i = 1; i <= 30; ++i) up.push_back(static_cast<double>(i));
        const std::vector<double> down(up.rbegin(), up.rend());

        assert(TechnicalIndicators::calculateTrendFlow(up, 6, 14, 2.0) == 1);
        assert(TechnicalIndicators::calculateTrendFlow(down, 6, 14, 2.0) == -1);
        assert(TechnicalIndicators::calculateTrendFlow(constant(30, 100.0), 6, 14, 2.0) == 0);

        // fewer than max(main, smooth)
        const std::vector<double> short_up(up.begin(), up.begin() + 13);
        assert(TechnicalIndicators::calculateTrendFlow(short_up, 6, 14, 2.0) == 0);
        assert(TechnicalIndicators::calculateTrendFlow({}, 6, 14, 2.0) == 0);
    }

    // ===== Pivots =====
    {
        std::vector<double> lows, highs;
        for (int i = 0; i < 30; ++i) {
            lows.push_back(100.0 + std::abs(i - 15));
            highs.push_back(102.0 + std::abs(i - 15));
        }

        const auto supports = TechnicalIndicators::findSupportLevels(lows, 10, 5, 5);
        assert(supports.size() == 1);
        assert(supports.front() == 100.0);

        // V 모양 고가에는 저항 피벗 없음
        assert(TechnicalIndicators::findResistanceLevels(highs, 10, 5, 5).empty());

        // inverted V -> exactly one resistance
        std::vector<double> peak;
        for (int i = 0; i < 30; ++i) peak.push_back(100.0 - std::abs(i - 15));
        const auto resistances = TechnicalIndicators::findResistanceLevels(peak, 10, 5, 5);
        assert(resistances.size() == 1);
        assert(resistances.front() == 100.0);

        // ties never qualify
        assert(TechnicalIndicators::findSupportLevels(constant(40, 50.0), 10, 5, 5).empty());
        assert(TechnicalIndicators::findResistanceLevels(constant(40, 50.0), 10, 5, 5).empty());

        // too short for left + right + 1
        assert(TechnicalIndicators::findSupportLevels(constant(15, 50.0), 10, 5, 5).empty());

        // most recent 5 kept, oldest first
        const std::vector<double> zigzag = {9, 1, 9, 2, 9, 3, 9, 4, 9, 5, 9, 6, 9};
        const auto recent = TechnicalIndicators::findSupportLevels(zigzag, 1, 1, 5);
        assert(recent.size() == 5);
        assert(recent.front() == 2.0);
        assert(recent.back() == 6.0);
    }

    std::cout << "[TEST] TechnicalIndicators PASSED\n";
    return 0;
}
