#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <cstddef>

namespace corolla {
namespace analytics {

// SMA 계산 (Simple Moving Average)
double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    // 마지막(최신) period 개수의 평균
    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

// EMA 계산 (Exponential Moving Average)
double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty()) return 0.0;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return prices.back();

    const double multiplier = 2.0 / (period + 1.0);

    // 가장 오래된 종가로 시작
    double ema = prices.front();
    for (size_t i = 1; i < prices.size(); ++i) {
        ema = (prices[i] * multiplier) + (ema * (1.0 - multiplier));
    }

    return ema; // 최신 EMA
}

// ATR 계산 (Average True Range)
double TechnicalIndicators::calculateATR(
    const std::vector<double>& highs,
    const std::vector<double>& lows,
    const std::vector<double>& closes,
    int period
) {
    const size_t n = std::min({highs.size(), lows.size(), closes.size()});
    if (n < 2) {
        return 0.0;
    }

    std::vector<double> tr_values;
    tr_values.reserve(n - 1);

    // 첫 TR은 0번째와 1번째 사이에서 발생
    for (size_t i = 1; i < n; ++i) {
        double tr1 = highs[i] - lows[i];
        double tr2 = std::abs(highs[i] - closes[i - 1]);
        double tr3 = std::abs(lows[i] - closes[i - 1]);

        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }

    if (period <= 0 || tr_values.size() < static_cast<size_t>(period)) {
        double sum = 0.0;
        for (double tr : tr_values) sum += tr;
        return sum / static_cast<double>(tr_values.size());
    }

    double sum = 0.0;
    for (size_t i = tr_values.size() - period; i < tr_values.size(); ++i) {
        sum += tr_values[i];
    }
    return sum / period;
}

// Bollinger Bands 계산
TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerBands result;

    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    // 마지막(최신) period 개수만 추출
    std::vector<double> recent_prices(prices.end() - period, prices.end());

    // Middle Band (SMA)
    result.middle = calculateSMA(recent_prices, period);

    // Standard Deviation (population)
    double std_dev = calculateStandardDeviation(recent_prices, result.middle);

    result.upper = result.middle + (std_dev * std_dev_mult);
    result.lower = result.middle - (std_dev * std_dev_mult);

    return result;
}

// Keltner Channels 계산
TechnicalIndicators::KeltnerChannels TechnicalIndicators::calculateKeltnerChannels(
    const std::vector<double>& highs,
    const std::vector<double>& lows,
    const std::vector<double>& closes,
    int period,
    double atr_mult
) {
    KeltnerChannels result;

    if (period <= 0 || closes.size() < static_cast<size_t>(period)) {
        return result;
    }

    result.middle = calculateEMA(closes, period);
    const double atr = calculateATR(highs, lows, closes, period);

    result.upper = result.middle + (atr * atr_mult);
    result.lower = result.middle - (atr * atr_mult);

    return result;
}

bool TechnicalIndicators::isSqueezeActive(const BollingerBands& bb, const KeltnerChannels& kc) {
    return (bb.upper < kc.upper) && (bb.lower > kc.lower);
}

// Squeeze Momentum 계산
TechnicalIndicators::SqueezeResult TechnicalIndicators::calculateSqueezeMomentum(
    const std::vector<double>& highs,
    const std::vector<double>& lows,
    const std::vector<double>& closes,
    int bb_length,
    double bb_mult,
    int kc_length,
    double kc_mult,
    int momentum_length
) {
    SqueezeResult result;

    const BollingerBands bb = calculateBollingerBands(closes, bb_length, bb_mult);
    const KeltnerChannels kc = calculateKeltnerChannels(highs, lows, closes, kc_length, kc_mult);

    result.bb_upper = bb.upper;
    result.bb_lower = bb.lower;
    result.kc_upper = kc.upper;
    result.kc_lower = kc.lower;
    result.in_squeeze = isSqueezeActive(bb, kc);

    const size_t n = std::min({highs.size(), lows.size(), closes.size()});
    if (momentum_length <= 0 || n < static_cast<size_t>(momentum_length)) {
        return result;
    }

    const auto high_begin = highs.begin() + (highs.size() - momentum_length);
    const auto low_begin = lows.begin() + (lows.size() - momentum_length);
    const double highest = *std::max_element(high_begin, highs.end());
    const double lowest = *std::min_element(low_begin, lows.end());

    // 고저 범위가 없으면 모멘텀 0
    if (highest == lowest) {
        return result;
    }

    const double close = closes.back();
    const double range_mid = (highest + lowest) / 2.0;
    const double sma = calculateSMA(closes, momentum_length);
    result.momentum = ((close - range_mid) + (close - sma)) / 2.0;

    return result;
}

// Adaptive Trend Flow (simplified)
int TechnicalIndicators::calculateTrendFlow(
    const std::vector<double>& closes,
    int main_length,
    int smooth_length,
    double sensitivity
) {
    const int required = std::max(main_length, smooth_length);
    if (closes.empty() || required <= 0 || closes.size() < static_cast<size_t>(required)) {
        return 0;
    }

    const double smoothed = calculateEMA(closes, smooth_length);
    const double current_price = closes.back();

    if (current_price > smoothed + sensitivity) return 1;
    if (current_price < smoothed - sensitivity) return -1;
    return 0;
}

// Support Levels 찾기 (지지선)
std::vector<double> TechnicalIndicators::findSupportLevels(
    const std::vector<double>& lows,
    int left_bars,
    int right_bars,
    size_t max_levels
) {
    std::vector<double> supports;
    if (left_bars < 0 || right_bars < 0) return supports;
    if (lows.size() < static_cast<size_t>(left_bars + right_bars + 1)) return supports;

    for (size_t i = left_bars; i < lows.size() - right_bars; ++i) {
        if (isPivotLow(lows, i, left_bars, right_bars)) {
            supports.push_back(lows[i]);
        }
    }

    keepMostRecent(supports, max_levels);
    return supports;
}

// Resistance Levels 찾기 (저항선)
std::vector<double> TechnicalIndicators::findResistanceLevels(
    const std::vector<double>& highs,
    int left_bars,
    int right_bars,
    size_t max_levels
) {
    std::vector<double> resistances;
    if (left_bars < 0 || right_bars < 0) return resistances;
    if (highs.size() < static_cast<size_t>(left_bars + right_bars + 1)) return resistances;

    for (size_t i = left_bars; i < highs.size() - right_bars; ++i) {
        if (isPivotHigh(highs, i, left_bars, right_bars)) {
            resistances.push_back(highs[i]);
        }
    }

    keepMostRecent(resistances, max_levels);
    return resistances;
}

// ========== Private 헬퍼 함수들 ==========

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

bool TechnicalIndicators::isPivotLow(
    const std::vector<double>& lows,
    size_t index,
    int left_bars,
    int right_bars
) {
    const double value = lows[index];

    for (size_t j = index - left_bars; j < index; ++j) {
        if (lows[j] <= value) return false;
    }
    for (size_t j = index + 1; j <= index + right_bars; ++j) {
        if (lows[j] <= value) return false;
    }

    return true;
}

bool TechnicalIndicators::isPivotHigh(
    const std::vector<double>& highs,
    size_t index,
    int left_bars,
    int right_bars
) {
    const double value = highs[index];

    for (size_t j = index - left_bars; j < index; ++j) {
        if (highs[j] >= value) return false;
    }
    for (size_t j = index + 1; j <= index + right_bars; ++j) {
        if (highs[j] >= value) return false;
    }

    return true;
}

void TechnicalIndicators::keepMostRecent(std::vector<double>& levels, size_t max_levels) {
    if (levels.size() > max_levels) {
        levels.erase(levels.begin(), levels.end() - static_cast<std::ptrdiff_t>(max_levels));
    }
}

} // namespace analytics
} // namespace corolla
