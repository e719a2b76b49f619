#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace scalpengine {
namespace analytics {

namespace {
const double kNaN = std::numeric_limits<double>::quiet_NaN();
}

std::vector<double> TechnicalIndicators::calculateRSISeries(const std::vector<double>& prices, int period) {
    std::vector<double> rsi(prices.size(), kNaN);
    if (period <= 0 || prices.empty()) {
        return rsi;
    }

    // adjust 가중 EMA: num_t = x_t + (1-a) num_{t-1}, den_t = 1 + (1-a) den_{t-1}
    const double alpha = 1.0 / static_cast<double>(period);
    const double decay = 1.0 - alpha;
    double gain_num = 0.0;
    double loss_num = 0.0;
    double den = 0.0;

    for (size_t i = 0; i < prices.size(); ++i) {
        // 첫 값은 변화량이 없으므로 0 으로 취급
        const double change = (i == 0) ? 0.0 : prices[i] - prices[i - 1];
        const double gain = change > 0.0 ? change : 0.0;
        const double loss = change < 0.0 ? -change : 0.0;

        gain_num = gain + decay * gain_num;
        loss_num = loss + decay * loss_num;
        den = 1.0 + decay * den;

        if (i + 1 < static_cast<size_t>(period)) {
            continue;
        }

        const double avg_gain = gain_num / den;
        const double avg_loss = loss_num / den;
        if (avg_loss <= 0.0) {
            rsi[i] = (avg_gain <= 0.0) ? 50.0 : 100.0;
        } else {
            const double rs = avg_gain / avg_loss;
            rsi[i] = 100.0 - (100.0 / (1.0 + rs));
        }
    }
    return rsi;
}

TechnicalIndicators::StochRSIResult TechnicalIndicators::calculateStochRSI(
    const std::vector<double>& prices,
    int rsi_period,
    int stoch_period,
    int k_smoothing,
    int d_smoothing
) {
    if (rsi_period <= 0 || stoch_period <= 0 || k_smoothing <= 0 || d_smoothing <= 0) {
        throw std::invalid_argument("StochRSI periods must be positive");
    }

    StochRSIResult result;
    result.rsi = calculateRSISeries(prices, rsi_period);

    std::vector<double> k_raw(prices.size(), kNaN);
    for (size_t i = 0; i < prices.size(); ++i) {
        if (i + 1 < static_cast<size_t>(stoch_period)) {
            continue;
        }
        double low = std::numeric_limits<double>::max();
        double high = std::numeric_limits<double>::lowest();
        bool complete = true;
        for (size_t j = i + 1 - stoch_period; j <= i; ++j) {
            if (std::isnan(result.rsi[j])) {
                complete = false;
                break;
            }
            low = std::min(low, result.rsi[j]);
            high = std::max(high, result.rsi[j]);
        }
        if (!complete) {
            continue;
        }
        const double range = high - low;
        k_raw[i] = (range != 0.0) ? (result.rsi[i] - low) / range * 100.0 : 50.0;
    }

    result.k = rollingMeanSkipNaN(k_raw, k_smoothing);
    result.d = rollingMeanSkipNaN(result.k, d_smoothing);
    return result;
}

double TechnicalIndicators::calculateLogReturnVolatility(
    const std::vector<double>& prices,
    int window,
    double annualization_periods
) {
    if (window < 2 || prices.size() < static_cast<size_t>(window)) {
        return 0.0;
    }

    std::vector<double> returns;
    returns.reserve(window - 1);
    for (size_t i = prices.size() - window + 1; i < prices.size(); ++i) {
        if (prices[i] <= 0.0 || prices[i - 1] <= 0.0) {
            throw std::domain_error("non-positive price in volatility window");
        }
        returns.push_back(std::log(prices[i]) - std::log(prices[i - 1]));
    }

    const double mean = calculateMean(returns);
    return calculateStandardDeviation(returns, mean) * std::sqrt(annualization_periods);
}

double TechnicalIndicators::calculateMomentumRatio(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 0.5;
    }

    double gain_sum = 0.0;
    double loss_sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) gain_sum += change;
        else loss_sum -= change;
    }

    const double avg_gain = gain_sum / period;
    const double avg_loss = loss_sum / period;
    if (avg_loss == 0.0) {
        return 1.0;
    }

    const double rs = avg_gain / avg_loss;
    return rs / (1.0 + rs);
}

bool TechnicalIndicators::detectVolumeSurge(const std::vector<double>& volumes, int window, double multiplier) {
    if (window <= 0 || volumes.size() < static_cast<size_t>(window + 1)) {
        return false;
    }

    const double recent_sum = std::accumulate(volumes.end() - 1 - window, volumes.end() - 1, 0.0);
    const double recent_avg = recent_sum / window;
    return volumes.back() > recent_avg * multiplier;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    
    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }
    
    return prices;
}

// ========== 헬퍼 함수들 ==========

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

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

std::vector<double> TechnicalIndicators::rollingMeanSkipNaN(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), kNaN);
    for (size_t i = 0; i < values.size(); ++i) {
        const size_t start = (i + 1 >= static_cast<size_t>(window)) ? i + 1 - window : 0;
        double sum = 0.0;
        int count = 0;
        for (size_t j = start; j <= i; ++j) {
            if (!std::isnan(values[j])) {
                sum += values[j];
                ++count;
            }
        }
        if (count > 0) {
            out[i] = sum / count;
        }
    }
    return out;
}

} // namespace analytics
} // namespace scalpengine
