#pragma once

#include <string>
#include <vector>

#include "analytics/MultiTimeframeValidator.h"
#include "analytics/TimeframeSignalCalculator.h"
#include "analytics/VolatilityScanner.h"
#include "analytics/VolumeConfirmationFilter.h"
#include "broker/AlpacaBroker.h"
#include "broker/PaperBroker.h"
#include "engine/PositionManager.h"
#include "execution/OrderExecutor.h"
#include "execution/RateLimiter.h"
#include "risk/RiskManager.h"

namespace scalpengine {
namespace engine {

// 거래 모드
enum class TradingMode {
    LIVE,           // 실전 (Alpaca 주문)
    PAPER           // 모의 (PaperBroker 체결)
};

// 엔진 설정 - 시작 시 한 번 로드되고 이후 읽기 전용
struct EngineConfig {
    TradingMode mode = TradingMode::PAPER;
    bool paper_uses_live_data = false;      // PAPER 에서 Alpaca 시세 사용 (키 필요)

    std::vector<std::string> universe = {
        "AAPL", "MSFT", "NVDA", "TSLA", "AMD", "META", "AMZN", "GOOGL", "SPY", "QQQ"
    };
    std::string scan_timeframe = "1Min";
    int bootstrap_bars = 100;
    std::size_t series_capacity = 1000;

    // 루프 주기
    long long ingest_interval_ms = 5000;
    long long entry_interval_ms = 1000;
    long long exit_interval_ms = 1000;
    long long maintenance_interval_ms = 60000;

    // 오류 예산 / 재연결
    int max_errors = 10;
    int max_reconnect_attempts = 5;
    long long reconnect_delay_ms = 1000;
    long long max_reconnect_delay_ms = 60000;

    bool use_multi_timeframe = true;
    int timeframe_bars = 100;
    bool use_volume_filter = true;
    bool flatten_on_shutdown = true;
    bool sync_capital_from_account = true;
    std::size_t signal_channel_capacity = 64;

    std::string log_dir = "logs";
    std::string log_level = "info";
    std::string journal_path = "logs/journal.jsonl";

    analytics::ScannerConfig scanner;
    analytics::VolumeFilterConfig volume;
    analytics::MultiTimeframeConfig timeframes;
    analytics::StochRsiConfig stoch_rsi;
    risk::RiskConfig risk;
    LifecycleConfig lifecycle;
    execution::ExecutionConfig execution;
    execution::RateLimitConfig rate_limit;
    broker::AlpacaConfig alpaca;
    broker::PaperConfig paper;
    long http_timeout_seconds = 30;
};

inline const char* toString(TradingMode mode) {
    return mode == TradingMode::LIVE ? "LIVE" : "PAPER";
}

} // namespace engine
} // namespace scalpengine
