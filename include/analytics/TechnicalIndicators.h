#pragma once

#include <vector>
#include <cstddef>

namespace corolla {
namespace analytics {

// Technical Indicators
// 모든 입력 배열은 [oldest ... newest] 순서.
// 데이터가 부족하면 예외 대신 중립값(0, 빈 목록, false)을 반환한다.
class TechnicalIndicators {
public:
    // SMA (Simple Moving Average) - 마지막 period 개의 산술 평균, 부족하면 0
    static double calculateSMA(const std::vector<double>& prices, int period);

    // EMA (Exponential Moving Average)
    // 가장 오래된 값으로 시작해 multiplier 2/(period+1) 로 최신까지 누적.
    // 데이터가 period 보다 적으면 최신 종가, 비어 있으면 0.
    static double calculateEMA(const std::vector<double>& prices, int period);

    // ATR (Average True Range)
    // 최근 period 개 TR 의 평균, TR 이 period 보다 적으면 전체 TR 평균. 2개 미만이면 0.
    static double calculateATR(const std::vector<double>& highs,
                               const std::vector<double>& lows,
                               const std::vector<double>& closes,
                               int period = 14);

    // Bollinger Bands - middle = SMA, width = mult * 모집단 표준편차
    struct BollingerBands {
        double upper;
        double middle;
        double lower;

        BollingerBands() : upper(0), middle(0), lower(0) {}
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    // Keltner Channels - middle = EMA, width = mult * ATR
    struct KeltnerChannels {
        double upper;
        double middle;
        double lower;

        KeltnerChannels() : upper(0), middle(0), lower(0) {}
    };
    static KeltnerChannels calculateKeltnerChannels(const std::vector<double>& highs,
                                                    const std::vector<double>& lows,
                                                    const std::vector<double>& closes,
                                                    int period = 20,
                                                    double atr_mult = 1.5);

    // Squeeze Momentum
    struct SqueezeResult {
        bool in_squeeze;    // BB 가 KC 안에 완전히 들어간 상태
        double momentum;
        double bb_upper;
        double bb_lower;
        double kc_upper;
        double kc_lower;

        SqueezeResult()
            : in_squeeze(false), momentum(0)
            , bb_upper(0), bb_lower(0), kc_upper(0), kc_lower(0)
        {}
    };
    static SqueezeResult calculateSqueezeMomentum(const std::vector<double>& highs,
                                                  const std::vector<double>& lows,
                                                  const std::vector<double>& closes,
                                                  int bb_length = 20,
                                                  double bb_mult = 2.0,
                                                  int kc_length = 20,
                                                  double kc_mult = 1.5,
                                                  int momentum_length = 20);

    static bool isSqueezeActive(const BollingerBands& bb, const KeltnerChannels& kc);

    // Adaptive Trend Flow: +1 bullish, -1 bearish, 0 neutral
    static int calculateTrendFlow(const std::vector<double>& closes,
                                  int main_length,
                                  int smooth_length,
                                  double sensitivity);

    // Pivot based Support/Resistance
    // 좌측 left_bars, 우측 right_bars 모든 봉보다 엄격하게 낮은(높은) 봉만 pivot (동일값은 제외).
    // 가장 최근 max_levels 개만 [oldest ... newest] 순서로 유지.
    static std::vector<double> findSupportLevels(const std::vector<double>& lows,
                                                 int left_bars = 10,
                                                 int right_bars = 5,
                                                 std::size_t max_levels = 5);
    static std::vector<double> findResistanceLevels(const std::vector<double>& highs,
                                                    int left_bars = 10,
                                                    int right_bars = 5,
                                                    std::size_t max_levels = 5);

private:
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
    static bool isPivotLow(const std::vector<double>& lows, std::size_t index, int left_bars, int right_bars);
    static bool isPivotHigh(const std::vector<double>& highs, std::size_t index, int left_bars, int right_bars);
    static void keepMostRecent(std::vector<double>& levels, std::size_t max_levels);
};

} // namespace analytics
} // namespace corolla
