#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace scalpengine {
namespace analytics {

struct VolumeFilterConfig {
    double volume_threshold_multiplier = 1.5;
    int volume_period = 20;
    bool require_volume_spike = true;
    double volume_spike_threshold = 2.0;
    double min_volume_percentile = 0.3;
    double trend_increasing_ratio = 1.2;
    double trend_decreasing_ratio = 0.8;
};

enum class VolumeTrend { INCREASING, STABLE, DECREASING };

inline const char* toString(VolumeTrend trend) {
    switch (trend) {
        case VolumeTrend::INCREASING: return "increasing";
        case VolumeTrend::STABLE: return "stable";
        case VolumeTrend::DECREASING: return "decreasing";
    }
    return "stable";
}

struct VolumeMetrics {
    double current_volume = 0.0;
    double avg_volume = 0.0;       // 현재 샘플을 제외한 직전 volume_period 개 평균
    double volume_ratio = 1.0;
    double volume_percentile = 0.5;
    bool is_volume_spike = false;
    VolumeTrend trend = VolumeTrend::STABLE;
};

struct VolumeConfirmation {
    bool confirmed = false;
    double score = 0.0;            // 0..1, 참고용
    std::vector<std::string> reasons;
    VolumeMetrics metrics;
};

// 상대 거래량 기반 신호 확인 필터
class VolumeConfirmationFilter {
public:
    explicit VolumeConfirmationFilter(VolumeFilterConfig config = {});

    VolumeMetrics analyze(const std::vector<double>& volumes) const;

    VolumeConfirmation confirm(const std::vector<double>& volumes, const Signal& candidate) const;
    VolumeConfirmation confirm(const std::vector<Sample>& samples, const Signal& candidate) const;

    // 0..1 거래량 품질 점수
    double qualityScore(const VolumeMetrics& metrics) const;

    // analyze 에 필요한 최대 샘플 수
    std::size_t lookback() const { return static_cast<std::size_t>(config_.volume_period) * 2 + 1; }

    const VolumeFilterConfig& config() const { return config_; }

private:
    VolumeFilterConfig config_;
};

} // namespace analytics
} // namespace scalpengine
