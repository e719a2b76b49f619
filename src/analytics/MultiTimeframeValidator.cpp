#include "analytics/MultiTimeframeValidator.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace scalpengine {
namespace analytics {

namespace {
const char* directionName(int signal) {
    return signal > 0 ? "buy" : (signal < 0 ? "sell" : "none");
}
} // namespace

MultiTimeframeValidator::MultiTimeframeValidator(MultiTimeframeConfig config, StochRsiConfig stoch_config)
    : config_(std::move(config))
    , calculator_(stoch_config) {
}

std::vector<std::string> MultiTimeframeValidator::timeframes() const {
    std::vector<std::string> out;
    out.push_back(config_.primary_timeframe);
    for (const auto& tf : config_.confirmation_timeframes) {
        if (std::find(out.begin(), out.end(), tf) == out.end()) {
            out.push_back(tf);
        }
    }
    return out;
}

double MultiTimeframeValidator::weightOf(const std::string& timeframe, double fallback) const {
    auto it = config_.weights.find(timeframe);
    return it == config_.weights.end() ? fallback : it->second;
}

double MultiTimeframeValidator::decayOf(const std::string& timeframe) const {
    auto it = config_.decay_factors.find(timeframe);
    return it == config_.decay_factors.end() ? config_.default_decay : it->second;
}

AlignmentResult MultiTimeframeValidator::checkAlignment(
    const std::map<std::string, TimeframeSignal>& signals
) const {
    AlignmentResult result;

    auto primary_it = signals.find(config_.primary_timeframe);
    if (primary_it == signals.end()) {
        result.reason = "Primary timeframe " + config_.primary_timeframe + " not available";
        return result;
    }

    result.primary_signal = primary_it->second.signal;
    if (result.primary_signal == 0) {
        result.reason = "No primary signal detected";
        return result;
    }

    for (const auto& tf : config_.confirmation_timeframes) {
        auto it = signals.find(tf);
        if (it == signals.end()) {
            continue;
        }
        ++result.total_confirmations;
        const int confirmation = it->second.signal;
        if ((result.primary_signal > 0 && confirmation > 0) ||
            (result.primary_signal < 0 && confirmation < 0)) {
            ++result.aligned_confirmations;
        }
    }

    if (result.total_confirmations == 0) {
        result.alignment_score = 0.5;
        result.aligned = false;
        result.reason = "No confirmation timeframes available";
        return result;
    }

    result.alignment_score = static_cast<double>(result.aligned_confirmations) /
                             static_cast<double>(result.total_confirmations);
    result.aligned = result.alignment_score >= (config_.min_confirmation_percentage / 100.0);
    result.reason = std::to_string(result.aligned_confirmations) + "/" +
                    std::to_string(result.total_confirmations) + " timeframes aligned";
    return result;
}

WeightedConsensus MultiTimeframeValidator::computeConsensus(
    const std::map<std::string, TimeframeSignal>& signals
) const {
    WeightedConsensus result;

    for (const auto& [tf, signal] : signals) {
        auto weight_it = config_.weights.find(tf);
        if (weight_it == config_.weights.end()) {
            continue;
        }
        const double weight = weight_it->second;
        const double adjusted_strength = signal.strength * decayOf(tf);
        result.weighted_score += static_cast<double>(signal.signal) * adjusted_strength * weight;
        result.total_weight += weight;
    }

    if (result.total_weight <= 0.0) {
        return result;
    }

    if (result.weighted_score > config_.consensus_threshold) {
        result.consensus_signal = 1;
    } else if (result.weighted_score < -config_.consensus_threshold) {
        result.consensus_signal = -1;
    }
    result.consensus_strength = std::abs(result.weighted_score) / result.total_weight;
    return result;
}

ConflictInfo MultiTimeframeValidator::detectConflicts(
    const std::map<std::string, TimeframeSignal>& signals
) const {
    ConflictInfo info;

    for (const auto& [tf, signal] : signals) {
        if (signal.signal > 0) {
            info.buy_timeframes.push_back(tf);
        } else if (signal.signal < 0) {
            info.sell_timeframes.push_back(tf);
        }
    }

    info.has_conflict = !info.buy_timeframes.empty() && !info.sell_timeframes.empty();
    if (!info.has_conflict) {
        return info;
    }

    double buy_weight = 0.0;
    double sell_weight = 0.0;
    for (const auto& tf : info.buy_timeframes) {
        buy_weight += weightOf(tf, config_.default_conflict_weight) * signals.at(tf).strength;
    }
    for (const auto& tf : info.sell_timeframes) {
        sell_weight += weightOf(tf, config_.default_conflict_weight) * signals.at(tf).strength;
    }

    const double total = buy_weight + sell_weight;
    info.severity = total > 0.0 ? std::min(buy_weight, sell_weight) / total : 0.0;

    for (const auto& buy_tf : info.buy_timeframes) {
        for (const auto& sell_tf : info.sell_timeframes) {
            info.conflicts.push_back(buy_tf + ":buy vs " + sell_tf + ":sell");
        }
    }
    return info;
}

ConflictResolution MultiTimeframeValidator::resolveConflicts(
    const std::map<std::string, TimeframeSignal>& signals,
    const ConflictInfo& conflicts
) const {
    ConflictResolution resolution;
    if (!conflicts.has_conflict) {
        resolution.method = "no_conflict";
        resolution.confidence = 1.0;
        resolution.reason = "No conflicts detected";
        return resolution;
    }

    // 1. primary 우선
    auto primary_it = signals.find(config_.primary_timeframe);
    if (primary_it != signals.end() && primary_it->second.signal != 0) {
        resolution.method = "primary_override";
        resolution.resolved_signal = primary_it->second.signal;
        resolution.confidence = config_.primary_override_confidence;
        resolution.reason = "Primary timeframe " + config_.primary_timeframe + " takes precedence";
        return resolution;
    }

    // 2. 충분히 강한 가중 합의
    const auto consensus = computeConsensus(signals);
    if (std::abs(consensus.weighted_score) > config_.resolution_consensus_threshold) {
        std::ostringstream oss;
        oss << "Weighted consensus: " << std::fixed << std::setprecision(3) << consensus.weighted_score;
        resolution.method = "weighted_consensus";
        resolution.resolved_signal = consensus.consensus_signal;
        resolution.confidence = std::min(config_.consensus_confidence_cap, consensus.consensus_strength);
        resolution.reason = oss.str();
        return resolution;
    }

    // 3. 상위 타임프레임 우선
    for (const auto& tf : config_.timeframe_priority) {
        auto it = signals.find(tf);
        if (it == signals.end() || it->second.signal == 0) {
            continue;
        }
        if (it->second.strength > config_.priority_min_strength) {
            resolution.method = "higher_timeframe_priority";
            resolution.resolved_signal = it->second.signal;
            resolution.confidence = config_.priority_confidence;
            resolution.reason = "Higher timeframe " + tf + " priority";
            return resolution;
        }
    }

    resolution.method = "unresolved";
    resolution.resolved_signal = 0;
    resolution.confidence = 0.0;
    resolution.reason = "Conflicting signals cannot be resolved";
    return resolution;
}

ConsensusResult MultiTimeframeValidator::validate(
    const std::map<std::string, TimeframeSignal>& signals
) const {
    const auto alignment = checkAlignment(signals);
    const auto consensus = computeConsensus(signals);
    const auto conflicts = detectConflicts(signals);
    const auto resolution = resolveConflicts(signals, conflicts);

    ConsensusResult result;
    result.timeframe_signals = signals;
    result.aligned = alignment.aligned;
    result.alignment_score = alignment.alignment_score;
    result.weighted_score = consensus.weighted_score;
    result.consensus_signal = consensus.consensus_signal;
    result.consensus_strength = consensus.consensus_strength;
    result.has_conflict = conflicts.has_conflict;
    result.conflict_severity = conflicts.severity;
    result.conflicts = conflicts.conflicts;
    result.resolution_method = resolution.method;

    std::vector<double> factors;
    factors.push_back(alignment.aligned ? alignment.alignment_score : config_.misaligned_confidence_factor);
    if (consensus.consensus_strength > 0.0) {
        factors.push_back(consensus.consensus_strength);
    }
    if (!conflicts.has_conflict) {
        factors.push_back(config_.no_conflict_confidence_factor);
    } else {
        factors.push_back(std::max(config_.min_conflict_confidence_factor, 1.0 - conflicts.severity));
    }
    result.overall_confidence = std::accumulate(factors.begin(), factors.end(), 0.0) /
                                static_cast<double>(factors.size());

    if (config_.require_alignment && !alignment.aligned) {
        result.final_signal = 0;
        result.confidence = 0.0;
        result.reason = "Signal alignment required but not achieved (" + alignment.reason + ")";
        return result;
    }

    if (conflicts.has_conflict) {
        result.final_signal = resolution.resolved_signal;
        result.confidence = resolution.confidence;
        result.reason = resolution.reason;
        return result;
    }

    result.final_signal = alignment.primary_signal != 0 ? alignment.primary_signal : consensus.consensus_signal;
    result.confidence = result.final_signal != 0 ? result.overall_confidence : 0.0;
    result.reason = result.final_signal != 0
        ? std::string("Multi-timeframe validation passed: ") + directionName(result.final_signal)
        : std::string("No directional signal");
    return result;
}

ConsensusResult MultiTimeframeValidator::validate(const std::vector<TimeframeSignal>& signals) const {
    std::map<std::string, TimeframeSignal> by_timeframe;
    for (const auto& s : signals) {
        by_timeframe[s.timeframe] = s;
    }
    return validate(by_timeframe);
}

ConsensusResult MultiTimeframeValidator::validateBars(
    const std::map<std::string, std::vector<Bar>>& bars_by_timeframe
) const {
    std::map<std::string, TimeframeSignal> signals;
    for (const auto& tf : timeframes()) {
        auto it = bars_by_timeframe.find(tf);
        if (it == bars_by_timeframe.end()) {
            continue;
        }
        signals[tf] = calculator_.calculate(tf, it->second);
    }
    return validate(signals);
}

} // namespace analytics
} // namespace scalpengine
