#pragma once

#include "analytics/TimeframeSignalCalculator.h"
#include "common/Types.h"
#include <map>
#include <string>
#include <vector>

namespace scalpengine {
namespace analytics {

struct MultiTimeframeConfig {
    std::string primary_timeframe = "5Min";
    std::vector<std::string> confirmation_timeframes = {"15Min", "1Hour"};
    bool require_alignment = true;
    double min_confirmation_percentage = 60.0;

    std::map<std::string, double> weights = {
        {"1Min", 0.1}, {"5Min", 0.3}, {"15Min", 0.35}, {"1Hour", 0.25}
    };
    std::map<std::string, double> decay_factors = {
        {"1Min", 0.95}, {"5Min", 0.85}, {"15Min", 0.75}, {"1Hour", 0.65}
    };
    double default_decay = 0.8;
    double default_conflict_weight = 0.1;

    double consensus_threshold = 0.1;
    double resolution_consensus_threshold = 0.2;
    double primary_override_confidence = 0.7;
    double consensus_confidence_cap = 0.9;
    std::vector<std::string> timeframe_priority = {"1Hour", "15Min", "5Min", "1Min"};
    double priority_min_strength = 0.3;
    double priority_confidence = 0.6;

    double misaligned_confidence_factor = 0.3;
    double no_conflict_confidence_factor = 0.8;
    double min_conflict_confidence_factor = 0.2;
};

struct AlignmentResult {
    bool aligned = false;
    int primary_signal = 0;
    double alignment_score = 0.0;
    int aligned_confirmations = 0;
    int total_confirmations = 0;
    std::string reason;
};

struct WeightedConsensus {
    double weighted_score = 0.0;
    int consensus_signal = 0;
    double consensus_strength = 0.0;
    double total_weight = 0.0;
};

struct ConflictInfo {
    bool has_conflict = false;
    double severity = 0.0;
    std::vector<std::string> buy_timeframes;
    std::vector<std::string> sell_timeframes;
    std::vector<std::string> conflicts;   // "5Min:buy vs 1Hour:sell"
};

struct ConflictResolution {
    std::string method = "no_conflict";
    int resolved_signal = 0;
    double confidence = 1.0;
    std::string reason;
};

struct ConsensusResult {
    int final_signal = 0;
    double confidence = 0.0;            // 충돌 시 해소 신뢰도, 아니면 overall_confidence
    double overall_confidence = 0.0;    // 정렬/합의/충돌 요인 평균
    std::string resolution_method;
    std::string reason;
    double alignment_score = 0.0;
    bool aligned = false;
    double weighted_score = 0.0;
    int consensus_signal = 0;
    double consensus_strength = 0.0;
    bool has_conflict = false;
    double conflict_severity = 0.0;
    std::vector<std::string> conflicts;
    std::map<std::string, TimeframeSignal> timeframe_signals;
};

// 여러 타임프레임 신호의 정렬/가중 합의/충돌 해소
class MultiTimeframeValidator {
public:
    explicit MultiTimeframeValidator(MultiTimeframeConfig config = {}, StochRsiConfig stoch_config = {});

    AlignmentResult checkAlignment(const std::map<std::string, TimeframeSignal>& signals) const;
    WeightedConsensus computeConsensus(const std::map<std::string, TimeframeSignal>& signals) const;
    ConflictInfo detectConflicts(const std::map<std::string, TimeframeSignal>& signals) const;
    ConflictResolution resolveConflicts(const std::map<std::string, TimeframeSignal>& signals,
                                        const ConflictInfo& conflicts) const;

    ConsensusResult validate(const std::map<std::string, TimeframeSignal>& signals) const;
    ConsensusResult validate(const std::vector<TimeframeSignal>& signals) const;

    // 타임프레임별 바에서 신호를 계산한 뒤 검증
    ConsensusResult validateBars(const std::map<std::string, std::vector<Bar>>& bars_by_timeframe) const;

    // primary + confirmations
    std::vector<std::string> timeframes() const;
    const MultiTimeframeConfig& config() const { return config_; }

private:
    MultiTimeframeConfig config_;
    TimeframeSignalCalculator calculator_;

    double weightOf(const std::string& timeframe, double fallback) const;
    double decayOf(const std::string& timeframe) const;
};

} // namespace analytics
} // namespace scalpengine
