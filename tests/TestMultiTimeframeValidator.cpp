#include "analytics/MultiTimeframeValidator.h"

#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace scalpengine;
using analytics::MultiTimeframeConfig;
using analytics::MultiTimeframeValidator;

namespace {
bool nearly(double a, double b, double eps = 1e-9) { return std::abs(a - b) < eps; }

TimeframeSignal tf(const std::string& timeframe, int signal, double strength) {
    TimeframeSignal s;
    s.timeframe = timeframe;
    s.signal = signal;
    s.strength = strength;
    return s;
}

std::vector<Bar> oversoldBounceBars() {
    const double pattern[] = {-1.0, 0.4, -0.8, 0.2, -1.2, 0.5};
    std::vector<double> closes{100.0};
    for (int i = 0; i < 36; ++i) {
        closes.push_back(closes.back() + pattern[i % 6]);
    }
    for (int j = 0; j < 5; ++j) {
        closes.push_back(closes.back() - 1.5 * (j + 1));
    }
    closes.push_back(closes.back() + 1.0);

    std::vector<Bar> bars;
    for (std::size_t i = 0; i < closes.size(); ++i) {
        bars.emplace_back(closes[i], closes[i], closes[i], closes[i], 1000.0,
                          1700000000000LL + static_cast<long long>(i) * 60000LL);
    }
    return bars;
}
}

int main() {
    MultiTimeframeConfig relaxed;
    relaxed.require_alignment = false;
    MultiTimeframeValidator validator(relaxed);

    // 5Min 매수 + 15Min 매수 + 1Hour 매도: 정렬 실패, primary 우선 해소
    {
        auto result = validator.validate(std::vector<TimeframeSignal>{
            tf("5Min", 1, 0.8), tf("15Min", 1, 0.7), tf("1Hour", -1, 0.6)});
        if (result.aligned || !nearly(result.alignment_score, 0.5)) {
            std::cerr << "[TEST] 1/2 confirmations should not align\n";
            return 1;
        }
        if (!result.has_conflict || result.resolution_method != "primary_override") {
            std::cerr << "[TEST] expected primary_override, got " << result.resolution_method << "\n";
            return 1;
        }
        if (result.final_signal != 1 || !nearly(result.confidence, 0.7)) {
            std::cerr << "[TEST] primary override should give buy at 0.7\n";
            return 1;
        }
        if (result.conflicts.size() != 2) {
            std::cerr << "[TEST] two buy timeframes against one sell should list 2 conflicts\n";
            return 1;
        }
        const double expected_severity = 0.15 / (0.24 + 0.245 + 0.15);
        if (!nearly(result.conflict_severity, expected_severity)) {
            std::cerr << "[TEST] unexpected conflict severity " << result.conflict_severity << "\n";
            return 1;
        }
    }

    // 정렬 필수 설정에서는 같은 입력이 거부됨
    {
        MultiTimeframeValidator strict;
        auto result = strict.validate(std::vector<TimeframeSignal>{
            tf("5Min", 1, 0.8), tf("15Min", 1, 0.7), tf("1Hour", -1, 0.6)});
        if (result.final_signal != 0 || result.confidence != 0.0) {
            std::cerr << "[TEST] strict alignment should gate the signal\n";
            return 1;
        }
    }

    // 전 타임프레임 매수, 감쇠 적용 가중 합의
    {
        MultiTimeframeValidator strict;
        std::map<std::string, TimeframeSignal> all_buy{
            {"1Min", tf("1Min", 1, 1.0)}, {"5Min", tf("5Min", 1, 1.0)},
            {"15Min", tf("15Min", 1, 1.0)}, {"1Hour", tf("1Hour", 1, 1.0)}};
        auto consensus = strict.computeConsensus(all_buy);
        const double expected = 0.1 * 0.95 + 0.3 * 0.85 + 0.35 * 0.75 + 0.25 * 0.65;
        if (consensus.consensus_signal != 1 || !nearly(consensus.weighted_score, expected) ||
            consensus.consensus_strength <= 0.6) {
            std::cerr << "[TEST] all-buy consensus should be buy with strength > 0.6\n";
            return 1;
        }

        auto result = strict.validate(all_buy);
        if (!result.aligned || result.has_conflict || result.final_signal != 1) {
            std::cerr << "[TEST] aligned all-buy should pass validation\n";
            return 1;
        }
        if (!nearly(result.confidence, (1.0 + expected + 0.8) / 3.0)) {
            std::cerr << "[TEST] unexpected overall confidence " << result.confidence << "\n";
            return 1;
        }
    }

    // primary 없음, 가중 합의가 0.2 초과
    {
        auto result = validator.validate(std::vector<TimeframeSignal>{
            tf("5Min", 0, 0.0), tf("15Min", 1, 0.9), tf("1Min", -1, 0.2)});
        if (result.resolution_method != "weighted_consensus" || result.final_signal != 1) {
            std::cerr << "[TEST] expected weighted_consensus buy, got " << result.resolution_method << "\n";
            return 1;
        }
        const double score = 0.9 * 0.75 * 0.35 - 0.2 * 0.95 * 0.1;
        if (!nearly(result.confidence, score / (0.3 + 0.35 + 0.1))) {
            std::cerr << "[TEST] weighted consensus confidence should be its strength\n";
            return 1;
        }
    }

    // 합의가 약하면 상위 타임프레임 우선
    {
        auto result = validator.validate(std::vector<TimeframeSignal>{
            tf("1Hour", -1, 0.5), tf("1Min", 1, 0.9)});
        if (result.resolution_method != "higher_timeframe_priority" || result.final_signal != -1 ||
            !nearly(result.confidence, 0.6)) {
            std::cerr << "[TEST] expected higher_timeframe_priority sell, got " << result.resolution_method << "\n";
            return 1;
        }
    }

    // 모든 단계 실패
    {
        auto result = validator.validate(std::vector<TimeframeSignal>{
            tf("1Hour", -1, 0.2), tf("1Min", 1, 0.2)});
        if (result.resolution_method != "unresolved" || result.final_signal != 0 || result.confidence != 0.0) {
            std::cerr << "[TEST] weak opposing signals should be unresolved\n";
            return 1;
        }
    }

    // primary 누락
    {
        MultiTimeframeValidator strict;
        auto alignment = strict.checkAlignment({{"15Min", tf("15Min", 1, 0.5)}});
        if (alignment.aligned || alignment.primary_signal != 0) {
            std::cerr << "[TEST] missing primary should not align\n";
            return 1;
        }
    }

    // 바 입력: 모든 타임프레임이 같은 과매도 반등이면 매수
    {
        MultiTimeframeValidator strict;
        const auto frames = strict.timeframes();
        if (frames.size() != 3 || frames[0] != "5Min" || frames[1] != "15Min" || frames[2] != "1Hour") {
            std::cerr << "[TEST] timeframes should be primary then confirmations\n";
            return 1;
        }
        std::map<std::string, std::vector<Bar>> bars;
        for (const auto& frame : frames) {
            bars[frame] = oversoldBounceBars();
        }
        auto result = strict.validateBars(bars);
        if (result.final_signal != 1 || !result.aligned || result.timeframe_signals.size() != 3) {
            std::cerr << "[TEST] validateBars should produce an aligned buy\n";
            return 1;
        }
    }

    std::cout << "[TEST] MultiTimeframeValidator PASSED\n";
    return 0;
}
