#pragma once

#include "common/Types.h"
#include "market/SeriesStore.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scalpengine {
namespace analytics {

struct ScannerConfig {
    int min_samples = 20;
    int volatility_window = 20;
    double annualization_periods = 1440.0;   // 1분 데이터 기준
    int momentum_period = 14;
    int volume_window = 10;
    double volume_surge_multiplier = 1.5;

    double min_volatility = 0.02;
    double high_volatility_threshold = 0.05;

    // 고변동성 구간 모멘텀 경계
    double high_momentum_upper = 0.7;
    double high_momentum_lower = 0.3;
    double high_target_profit = 0.008;
    double high_stop_loss = 0.005;
    double volatility_confidence_scale = 10.0;
    double surge_confidence_bonus = 0.3;
    double max_confidence = 0.9;

    // 중간 변동성 구간 (모멘텀 + 거래량 급증 필요)
    double medium_momentum_upper = 0.8;
    double medium_momentum_lower = 0.2;
    double medium_confidence = 0.7;
    double default_target_profit = 0.005;
    double default_stop_loss = 0.003;

    // 거래량 급증만 있는 경우
    bool enable_surge_tier = true;
    double surge_momentum_upper = 0.6;
    double surge_momentum_lower = 0.4;
    double surge_confidence = 0.6;
    double surge_target_profit = 0.004;
    double surge_stop_loss = 0.002;

    double min_confidence = 0.4;
    int max_signals = 10;
};

// 종목별 스캔 지표
struct SymbolMetrics {
    std::string symbol;
    double price = 0.0;
    double volatility = 0.0;
    double momentum = 0.5;
    bool volume_surge = false;
    std::size_t samples = 0;
};

// Volatility Scanner - 롤링 윈도우 변동성/모멘텀/거래량 급증 스캔
class VolatilityScanner {
public:
    VolatilityScanner(std::shared_ptr<const market::SeriesStore> store,
                      ScannerConfig config,
                      std::vector<std::string> universe = {});

    // 신뢰도 내림차순, 최대 max_signals 개
    std::vector<Signal> scan() const;

    // 샘플 부족 시 nullopt
    std::optional<SymbolMetrics> analyze(const std::string& symbol) const;

    // 지표로부터 신호 생성 (방향이 없거나 신뢰도 미달이면 nullopt)
    std::optional<Signal> evaluate(const SymbolMetrics& metrics, Timestamp now) const;

    const ScannerConfig& config() const { return config_; }

private:
    std::shared_ptr<const market::SeriesStore> store_;
    ScannerConfig config_;
    std::vector<std::string> universe_;
};

} // namespace analytics
} // namespace scalpengine
