#include "analytics/VolatilityScanner.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace scalpengine {
namespace analytics {

VolatilityScanner::VolatilityScanner(std::shared_ptr<const market::SeriesStore> store,
                                     ScannerConfig config,
                                     std::vector<std::string> universe)
    : store_(std::move(store))
    , config_(config)
    , universe_(std::move(universe))
{
    LOG_INFO("VolatilityScanner 초기화 (universe={}, min_vol={:.3f}, high_vol={:.3f})",
             universe_.size(), config_.min_volatility, config_.high_volatility_threshold);
}

std::vector<Signal> VolatilityScanner::scan() const {
    const auto symbols = universe_.empty() ? store_->symbols() : universe_;
    const auto now = std::chrono::system_clock::now();

    std::vector<Signal> signals;
    int skipped = 0;

    for (const auto& symbol : symbols) {
        try {
            auto metrics = analyze(symbol);
            if (!metrics) {
                ++skipped;
                continue;
            }

            // 변동성 미달 종목은 제외
            if (metrics->volatility < config_.min_volatility) {
                continue;
            }

            auto signal = evaluate(*metrics, now);
            if (signal) {
                signals.push_back(*signal);
            }
        } catch (const std::exception& e) {
            LOG_WARN("{} 스캔 실패: {}", symbol, e.what());
        }
    }

    std::stable_sort(signals.begin(), signals.end(),
        [](const Signal& a, const Signal& b) { return a.confidence > b.confidence; });

    if (config_.max_signals >= 0 && signals.size() > static_cast<size_t>(config_.max_signals)) {
        signals.resize(config_.max_signals);
    }

    LOG_DEBUG("스캔 완료: {} 종목, 신호 {}개, 데이터 부족 {}개", symbols.size(), signals.size(), skipped);
    return signals;
}

std::optional<SymbolMetrics> VolatilityScanner::analyze(const std::string& symbol) const {
    const std::size_t lookback = static_cast<std::size_t>(std::max({
        config_.min_samples,
        config_.volatility_window,
        config_.momentum_period + 1,
        config_.volume_window + 1
    }));

    const auto samples = store_->window(symbol, lookback);
    if (samples.size() < static_cast<size_t>(config_.min_samples)) {
        return std::nullopt;
    }

    std::vector<double> prices;
    std::vector<double> volumes;
    prices.reserve(samples.size());
    volumes.reserve(samples.size());
    for (const auto& s : samples) {
        prices.push_back(s.price);
        volumes.push_back(s.volume);
    }

    SymbolMetrics metrics;
    metrics.symbol = symbol;
    metrics.price = prices.back();
    metrics.samples = samples.size();
    metrics.volatility = TechnicalIndicators::calculateLogReturnVolatility(
        prices, config_.volatility_window, config_.annualization_periods);
    metrics.momentum = TechnicalIndicators::calculateMomentumRatio(prices, config_.momentum_period);
    metrics.volume_surge = TechnicalIndicators::detectVolumeSurge(
        volumes, config_.volume_window, config_.volume_surge_multiplier);
    return metrics;
}

std::optional<Signal> VolatilityScanner::evaluate(const SymbolMetrics& metrics, Timestamp now) const {
    SignalAction action = SignalAction::HOLD;
    double confidence = 0.0;
    double target_profit = config_.default_target_profit;
    double stop_loss = config_.default_stop_loss;

    if (metrics.volatility > config_.high_volatility_threshold) {
        target_profit = config_.high_target_profit;
        stop_loss = config_.high_stop_loss;

        const double scaled = std::min(
            config_.max_confidence,
            metrics.volatility * config_.volatility_confidence_scale +
                (metrics.volume_surge ? config_.surge_confidence_bonus : 0.0));

        if (metrics.momentum > config_.high_momentum_upper) {
            action = SignalAction::BUY;
            confidence = scaled;
        } else if (metrics.momentum < config_.high_momentum_lower) {
            action = SignalAction::SELL;
            confidence = scaled;
        }
    } else if (metrics.volatility > config_.min_volatility) {
        if (metrics.volume_surge) {
            if (metrics.momentum > config_.medium_momentum_upper) {
                action = SignalAction::BUY;
                confidence = config_.medium_confidence;
            } else if (metrics.momentum < config_.medium_momentum_lower) {
                action = SignalAction::SELL;
                confidence = config_.medium_confidence;
            }
        }
    }

    // 상위 구간에서 방향이 없을 때 거래량 급증 모멘텀 플레이
    if (config_.enable_surge_tier && metrics.volume_surge && action == SignalAction::HOLD) {
        if (metrics.momentum > config_.surge_momentum_upper) {
            action = SignalAction::BUY;
        } else if (metrics.momentum < config_.surge_momentum_lower) {
            action = SignalAction::SELL;
        }
        if (action != SignalAction::HOLD) {
            confidence = config_.surge_confidence;
            target_profit = config_.surge_target_profit;
            stop_loss = config_.surge_stop_loss;
        }
    }

    if (action == SignalAction::HOLD || confidence < config_.min_confidence) {
        return std::nullopt;
    }

    Signal signal;
    signal.symbol = metrics.symbol;
    signal.action = action;
    signal.confidence = confidence;
    signal.price = metrics.price;
    signal.volatility = metrics.volatility;
    signal.momentum = metrics.momentum;
    signal.volume_surge = metrics.volume_surge;
    signal.target_profit = target_profit;
    signal.stop_loss = stop_loss;
    signal.timestamp = now;
    return signal;
}

} // namespace analytics
} // namespace scalpengine
