#include "analytics/TimeframeSignalCalculator.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace scalpengine {
namespace analytics {

TimeframeSignalCalculator::TimeframeSignalCalculator(StochRsiConfig config)
    : config_(config) {
}

std::size_t TimeframeSignalCalculator::requiredHistory() const {
    // RSI 워밍업 + 스토캐스틱 윈도우 + 직전 값 1개 (교차 판정용)
    const int first_k = config_.rsi_period + config_.stoch_period - 1;
    return static_cast<std::size_t>(std::max({config_.rsi_period, config_.stoch_period, first_k + 1}));
}

TimeframeSignal TimeframeSignalCalculator::calculate(
    const std::string& timeframe,
    const std::vector<Bar>& bars
) const {
    TimeframeSignal out = calculate(timeframe, TechnicalIndicators::extractClosePrices(bars));
    if (!bars.empty()) {
        out.timestamp = Timestamp(std::chrono::milliseconds(bars.back().timestamp));
    }
    return out;
}

TimeframeSignal TimeframeSignalCalculator::calculate(
    const std::string& timeframe,
    const std::vector<double>& closes
) const {
    TimeframeSignal out;
    out.timeframe = timeframe;
    out.timestamp = std::chrono::system_clock::now();

    if (closes.size() < requiredHistory()) {
        return out;
    }

    const auto stoch = TechnicalIndicators::calculateStochRSI(
        closes, config_.rsi_period, config_.stoch_period, config_.k_smoothing, config_.d_smoothing);

    const std::size_t last = closes.size() - 1;
    const double k = stoch.k[last];
    const double d = stoch.d[last];
    const double prev_k = stoch.k[last - 1];
    const double prev_d = stoch.d[last - 1];

    if (std::isnan(k) || std::isnan(d)) {
        return out;
    }
    out.oscillator_k = k;
    out.oscillator_d = d;

    if (std::isnan(prev_k) || std::isnan(prev_d)) {
        return out;
    }

    if (prev_k <= prev_d && k > d && k < config_.oversold) {
        out.signal = 1;
        out.strength = std::min((config_.oversold - k) / config_.oversold, 1.0);
    } else if (prev_k >= prev_d && k < d && k > config_.overbought) {
        out.signal = -1;
        out.strength = std::min((k - config_.overbought) / (100.0 - config_.overbought), 1.0);
    }

    return out;
}

} // namespace analytics
} // namespace scalpengine
