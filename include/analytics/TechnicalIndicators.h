#pragma once

#include <vector>
#include "common/Types.h"

namespace scalpengine {
namespace analytics {

// Technical Indicators - 검증된 공식으로 구현
class TechnicalIndicators {
public:
    // RSI 시계열 - EMA(com = period - 1, adjust) 방식, 워밍업 구간은 NaN
    // 상승/하락이 모두 0 인 구간은 50 (중립)
    static std::vector<double> calculateRSISeries(const std::vector<double>& prices, int period = 14);

    // Stochastic RSI - RSI 의 롤링 고저 내 위치 (%K), 그 이동평균 (%D)
    struct StochRSIResult {
        std::vector<double> rsi;
        std::vector<double> k;
        std::vector<double> d;
    };
    static StochRSIResult calculateStochRSI(const std::vector<double>& prices,
                                            int rsi_period = 14,
                                            int stoch_period = 14,
                                            int k_smoothing = 3,
                                            int d_smoothing = 3);

    // 로그수익률 표준편차 * sqrt(annualization_periods)
    // 가격이 window 개 미만이면 0
    static double calculateLogReturnVolatility(const std::vector<double>& prices,
                                               int window = 20,
                                               double annualization_periods = 1440.0);

    // RSI 형 모멘텀 비율 (0~1, 0.5 = 중립)
    static double calculateMomentumRatio(const std::vector<double>& prices, int period = 14);

    // 마지막 값 > multiplier * 직전 window 개 평균
    static bool detectVolumeSurge(const std::vector<double>& volumes,
                                  int window = 10,
                                  double multiplier = 1.5);

    static double calculateMean(const std::vector<double>& values);
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);

    // Helper: 종가 배열 추출
    static std::vector<double> extractClosePrices(const std::vector<Bar>& bars);

private:
    // NaN 을 건너뛰는 롤링 평균 (min_periods = 1)
    static std::vector<double> rollingMeanSkipNaN(const std::vector<double>& values, int window);
};

} // namespace analytics
} // namespace scalpengine
