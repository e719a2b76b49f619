#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace scalpengine {
namespace analytics {

struct StochRsiConfig {
    int rsi_period = 14;
    int stoch_period = 14;
    int k_smoothing = 3;
    int d_smoothing = 3;
    double oversold = 20.0;
    double overbought = 80.0;
};

// 타임프레임 하나의 StochRSI 교차 신호
class TimeframeSignalCalculator {
public:
    explicit TimeframeSignalCalculator(StochRsiConfig config = {});

    // 종가 배열에서 마지막 시점의 신호 계산. 데이터 부족 시 signal 0, strength 0
    TimeframeSignal calculate(const std::string& timeframe, const std::vector<double>& closes) const;
    TimeframeSignal calculate(const std::string& timeframe, const std::vector<Bar>& bars) const;

    // 신호 계산에 필요한 최소 종가 수
    std::size_t requiredHistory() const;

    const StochRsiConfig& config() const { return config_; }

private:
    StochRsiConfig config_;
};

} // namespace analytics
} // namespace scalpengine
