#include "analytics/VolumeConfirmationFilter.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace scalpengine {
namespace analytics {

namespace {
std::string formatRatio(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

std::string formatPercent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << value * 100.0 << "%";
    return oss.str();
}

double meanOf(std::vector<double>::const_iterator begin, std::vector<double>::const_iterator end) {
    const auto count = std::distance(begin, end);
    if (count <= 0) return 0.0;
    return std::accumulate(begin, end, 0.0) / static_cast<double>(count);
}
} // namespace

VolumeConfirmationFilter::VolumeConfirmationFilter(VolumeFilterConfig config)
    : config_(config) {
    if (config_.volume_period < 1) {
        config_.volume_period = 1;
    }
}

VolumeMetrics VolumeConfirmationFilter::analyze(const std::vector<double>& volumes) const {
    VolumeMetrics metrics;
    const std::size_t period = static_cast<std::size_t>(config_.volume_period);

    if (volumes.empty()) {
        return metrics;
    }

    metrics.current_volume = volumes.back();
    if (volumes.size() < period + 1) {
        metrics.avg_volume = TechnicalIndicators::calculateMean(volumes);
        return metrics;
    }

    metrics.avg_volume = meanOf(volumes.end() - 1 - period, volumes.end() - 1);
    metrics.volume_ratio = metrics.avg_volume > 0.0 ? metrics.current_volume / metrics.avg_volume : 1.0;

    const std::size_t lookback = std::min(volumes.size(), period * 2);
    const auto recent_begin = volumes.end() - static_cast<std::ptrdiff_t>(lookback);
    const auto below = std::count_if(recent_begin, volumes.end(),
        [&](double v) { return v < metrics.current_volume; });
    metrics.volume_percentile = static_cast<double>(below) / static_cast<double>(lookback);

    metrics.is_volume_spike = metrics.volume_ratio >= config_.volume_spike_threshold;

    if (volumes.size() >= period * 2) {
        const double recent_avg = meanOf(volumes.end() - period, volumes.end());
        const double older_avg = meanOf(volumes.end() - 2 * period, volumes.end() - period);
        const double trend_ratio = older_avg > 0.0 ? recent_avg / older_avg : 1.0;
        if (trend_ratio > config_.trend_increasing_ratio) {
            metrics.trend = VolumeTrend::INCREASING;
        } else if (trend_ratio < config_.trend_decreasing_ratio) {
            metrics.trend = VolumeTrend::DECREASING;
        }
    }

    return metrics;
}

VolumeConfirmation VolumeConfirmationFilter::confirm(
    const std::vector<Sample>& samples,
    const Signal& candidate
) const {
    std::vector<double> volumes;
    volumes.reserve(samples.size());
    for (const auto& s : samples) {
        volumes.push_back(s.volume);
    }
    return confirm(volumes, candidate);
}

VolumeConfirmation VolumeConfirmationFilter::confirm(
    const std::vector<double>& volumes,
    const Signal& candidate
) const {
    (void)candidate;  // 방향과 무관하게 거래량만 평가

    VolumeConfirmation result;
    result.metrics = analyze(volumes);
    const auto& m = result.metrics;

    result.confirmed = m.volume_ratio >= config_.volume_threshold_multiplier;

    double score = 0.0;
    if (m.volume_ratio >= config_.volume_threshold_multiplier) {
        score += 0.3;
        result.reasons.push_back("Volume " + formatRatio(m.volume_ratio) + "x above average");
    } else {
        result.reasons.push_back("Volume only " + formatRatio(m.volume_ratio) + "x average (below " +
                                 formatRatio(config_.volume_threshold_multiplier) + "x threshold)");
    }

    if (config_.require_volume_spike) {
        if (m.is_volume_spike) {
            score += 0.3;
            result.reasons.push_back("Volume spike detected");
        } else {
            result.reasons.push_back("No volume spike detected");
        }
    }

    if (m.volume_percentile >= config_.min_volume_percentile) {
        score += 0.2;
        result.reasons.push_back("Volume in " + formatPercent(m.volume_percentile) + " percentile");
    } else {
        result.reasons.push_back("Volume below " + formatPercent(config_.min_volume_percentile) + " percentile");
    }

    switch (m.trend) {
        case VolumeTrend::INCREASING:
            score += 0.2;
            result.reasons.push_back("Volume trend increasing");
            break;
        case VolumeTrend::STABLE:
            score += 0.1;
            result.reasons.push_back("Volume trend stable");
            break;
        case VolumeTrend::DECREASING:
            result.reasons.push_back("Volume trend decreasing");
            break;
    }

    result.score = std::min(1.0, score);
    return result;
}

double VolumeConfirmationFilter::qualityScore(const VolumeMetrics& metrics) const {
    double score = 0.0;
    score += std::max(0.0, std::min(0.4, (metrics.volume_ratio - 1.0) * 0.2));
    score += metrics.volume_percentile * 0.3;

    switch (metrics.trend) {
        case VolumeTrend::INCREASING: score += 0.3; break;
        case VolumeTrend::STABLE: score += 0.2; break;
        case VolumeTrend::DECREASING: score += 0.1; break;
    }
    return std::min(1.0, score);
}

} // namespace analytics
} // namespace scalpengine
