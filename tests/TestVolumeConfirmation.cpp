#include "analytics/VolumeConfirmationFilter.h"

#include <cmath>
#include <iostream>
#include <vector>

using namespace scalpengine;

namespace {
bool nearly(double a, double b, double eps = 1e-9) { return std::abs(a - b) < eps; }
}

int main() {
    analytics::VolumeConfirmationFilter filter;

    Signal candidate;
    candidate.symbol = "AAPL";
    candidate.action = SignalAction::BUY;

    // 평탄한 거래량 뒤 2.5배 급증
    std::vector<double> volumes(50, 10000.0);
    volumes.push_back(25000.0);

    const auto metrics = filter.analyze(volumes);
    if (!nearly(metrics.avg_volume, 10000.0) || !nearly(metrics.volume_ratio, 2.5)) {
        std::cerr << "[TEST] ratio should be 2.5 against prior average, got " << metrics.volume_ratio << "\n";
        return 1;
    }
    if (!metrics.is_volume_spike) {
        std::cerr << "[TEST] 2.5x should be a spike under 2.0 threshold\n";
        return 1;
    }
    if (!nearly(metrics.volume_percentile, 39.0 / 40.0)) {
        std::cerr << "[TEST] percentile should be 39/40, got " << metrics.volume_percentile << "\n";
        return 1;
    }
    if (metrics.trend != analytics::VolumeTrend::STABLE) {
        std::cerr << "[TEST] single spike should leave the trend stable\n";
        return 1;
    }

    const auto confirmed = filter.confirm(volumes, candidate);
    if (!confirmed.confirmed || !nearly(confirmed.score, 0.9)) {
        std::cerr << "[TEST] spike should confirm with score 0.9, got " << confirmed.score << "\n";
        return 1;
    }
    if (confirmed.reasons.size() != 4) {
        std::cerr << "[TEST] expected one reason per check\n";
        return 1;
    }

    const double quality = filter.qualityScore(metrics);
    if (!nearly(quality, 0.3 + 0.975 * 0.3 + 0.2)) {
        std::cerr << "[TEST] unexpected quality score " << quality << "\n";
        return 1;
    }

    // 1.2배는 임계값 1.5 미달
    std::vector<double> mild(50, 10000.0);
    mild.push_back(12000.0);
    const auto rejected = filter.confirm(mild, candidate);
    if (rejected.confirmed || rejected.metrics.is_volume_spike) {
        std::cerr << "[TEST] 1.2x volume should not confirm\n";
        return 1;
    }

    // 샘플 부족: 비율 1.0, 미확인
    const auto sparse = filter.analyze({100.0, 200.0});
    if (!nearly(sparse.volume_ratio, 1.0) || !nearly(sparse.avg_volume, 150.0) || sparse.is_volume_spike) {
        std::cerr << "[TEST] short history should be neutral\n";
        return 1;
    }

    // 거래량 증가 추세
    std::vector<double> rising(20, 1000.0);
    for (int i = 0; i < 20; ++i) {
        rising.push_back(2000.0);
    }
    rising.push_back(2100.0);
    if (filter.analyze(rising).trend != analytics::VolumeTrend::INCREASING) {
        std::cerr << "[TEST] doubled recent volume should be an increasing trend\n";
        return 1;
    }

    // 샘플 입력도 동일하게 평가
    std::vector<Sample> samples;
    for (double v : volumes) {
        Sample s;
        s.symbol = "AAPL";
        s.price = 100.0;
        s.volume = v;
        samples.push_back(s);
    }
    if (!filter.confirm(samples, candidate).confirmed) {
        std::cerr << "[TEST] sample input should confirm like raw volumes\n";
        return 1;
    }

    std::cout << "[TEST] VolumeConfirmation PASSED\n";
    return 0;
}
