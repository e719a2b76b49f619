#include "engine/TradingEngine.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <map>
#include <stdexcept>

namespace scalpengine {
namespace engine {

using core::JournalEventType;

namespace {
constexpr const char* kIngestLoop = "ingest";
constexpr const char* kEntryLoop = "entry";
constexpr const char* kExitLoop = "exit";
constexpr const char* kMaintenanceLoop = "maintenance";

// 스캔 후 이보다 오래된 신호는 진입하지 않음
constexpr auto kSignalMaxAge = std::chrono::seconds(60);
}

TradingEngine::TradingEngine(
    const EngineConfig& config,
    std::shared_ptr<core::IBroker> broker,
    std::shared_ptr<core::IEventJournal> journal
)
    : config_(config)
    , rate_limiter_(std::make_shared<execution::RateLimiter>(config.rate_limit))
    , journal_(std::move(journal))
    , store_(std::make_shared<market::SeriesStore>(config.series_capacity))
    , volume_filter_(config.volume)
    , mtf_validator_(config.timeframes, config.stoch_rsi)
    , signal_channel_(config.signal_channel_capacity)
    , running_(false)
    , stop_requested_(false)
    , error_count_(0)
{
    if (!broker) {
        throw std::invalid_argument("TradingEngine requires a broker");
    }
    
    broker_ = std::make_shared<broker::RateLimitedBroker>(std::move(broker), rate_limiter_);
    scanner_ = std::make_shared<analytics::VolatilityScanner>(store_, config_.scanner, config_.universe);
    risk_manager_ = std::make_shared<risk::RiskManager>(config_.risk);
    executor_ = std::make_shared<execution::OrderExecutor>(broker_, config_.execution);
    session_metrics_ = std::make_shared<SessionMetrics>();
    position_manager_ = std::make_shared<PositionManager>(
        executor_, risk_manager_, store_, scanner_, session_metrics_, journal_, config_.lifecycle);
    
    LOG_INFO("TradingEngine 생성 - 모드: {}, 종목 {}개, 다중 타임프레임: {}",
             toString(config_.mode), config_.universe.size(), config_.use_multi_timeframe ? "on" : "off");
}

TradingEngine::~TradingEngine() {
    stop();
}

// ===== 엔진 제어 =====

bool TradingEngine::start() {
    if (running_) {
        LOG_WARN("엔진이 이미 실행 중입니다");
        return false;
    }
    
    LOG_INFO("========================================");
    LOG_INFO("거래 엔진 시작");
    LOG_INFO("========================================");
    
    stop_requested_ = false;
    running_ = true;
    
    bootstrap();
    
    workers_.emplace_back(&TradingEngine::ingestLoop, this);
    workers_.emplace_back(&TradingEngine::entryLoop, this);
    workers_.emplace_back(&TradingEngine::exitLoop, this);
    workers_.emplace_back(&TradingEngine::maintenanceLoop, this);
    
    return true;
}

void TradingEngine::requestStop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    signal_channel_.close();
    executor_->stop();
}

void TradingEngine::stop() {
    if (!running_) {
        return;
    }
    
    LOG_INFO("========================================");
    LOG_INFO("거래 엔진 중지");
    LOG_INFO("========================================");
    
    requestStop();
    
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    
    if (config_.flatten_on_shutdown) {
        auto outcomes = position_manager_->closeAll(ExitReason::SHUTDOWN);
        for (const auto& outcome : outcomes) {
            if (!outcome.closed) {
                LOG_ERROR("종료 청산 실패: {} - {} ({})",
                          outcome.symbol, outcome.message, scalpengine::toString(outcome.kind));
            }
        }
    }
    
    rate_limiter_->stop();
    running_ = false;
    
    // 최종 성과 출력
    auto stats = session_metrics_->snapshot();
    auto limiter_stats = rate_limiter_->getStats();
    LOG_INFO("세션 요약 - 거래 {}회, 승률 {:.1f}%, 실현 손익 {:.2f}, 최장 연승 {}, 최장 연패 {}",
             stats.total_trades, stats.winRate() * 100.0, stats.total_realized_pnl,
             stats.longest_win_streak, stats.longest_loss_streak);
    LOG_INFO("API 호출 {}회, 강제 대기 {}회 ({}ms), 폐기된 신호 {}개",
             limiter_stats.total_requests, limiter_stats.forced_waits,
             limiter_stats.total_wait_time.count(), signal_channel_.droppedCount());
}

bool TradingEngine::waitForStop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return stop_cv_.wait_for(lock, timeout, [this] { return stop_requested_.load(); });
}

bool TradingEngine::sleepFor(std::chrono::milliseconds duration) {
    return !waitForStop(duration);
}

void TradingEngine::bootstrap() {
    LOG_INFO("과거 바 적재 ({} x {}개)", config_.scan_timeframe, config_.bootstrap_bars);
    for (const auto& symbol : config_.universe) {
        if (stop_requested_) {
            return;
        }
        auto bars = broker_->getRecentBars(symbol, config_.scan_timeframe, config_.bootstrap_bars);
        if (!bars.success) {
            LOG_WARN("{} 초기 바 적재 실패: {} ({})", symbol, bars.message, scalpengine::toString(bars.kind));
            continue;
        }
        const auto added = store_->recordBars(symbol, bars.value);
        LOG_DEBUG("{} 초기 바 {}개 적재", symbol, added);
    }
    
    if (config_.sync_capital_from_account) {
        auto account = broker_->getAccount();
        if (account.success && account.value.equity > 0.0) {
            risk_manager_->resetCapital(account.value.equity);
        } else if (!account.success) {
            LOG_WARN("계좌 조회 실패: {} ({})", account.message, scalpengine::toString(account.kind));
        }
    }
}

// ===== 한 주기 단위 실행 =====

bool TradingEngine::ingestOnce() {
    bool connection_ok = true;
    // 마지막 바가 갱신 중일 수 있으므로 최근 몇 개만 받아서 새 바만 추가
    const int refresh_limit = 5;
    
    for (const auto& symbol : config_.universe) {
        if (stop_requested_) {
            break;
        }
        auto bars = broker_->getRecentBars(symbol, config_.scan_timeframe, refresh_limit);
        if (bars.success) {
            store_->recordBars(symbol, bars.value);
            continue;
        }
        
        switch (bars.kind) {
            case ErrorKind::InsufficientData:
            case ErrorKind::RateLimited:
                LOG_DEBUG("{} 시세 갱신 건너뜀: {}", symbol, scalpengine::toString(bars.kind));
                break;
            case ErrorKind::ConnectionError:
                connection_ok = false;
                LOG_WARN("{} 시세 갱신 연결 오류: {}", symbol, bars.message);
                break;
            case ErrorKind::Unknown:
                recordError(kIngestLoop, symbol + ": " + bars.message);
                break;
            default:
                LOG_WARN("{} 시세 갱신 실패: {} ({})", symbol, bars.message, scalpengine::toString(bars.kind));
                break;
        }
    }
    return connection_ok;
}

std::vector<Signal> TradingEngine::scanOnce() {
    std::vector<Signal> accepted;
    auto candidates = scanner_->scan();
    
    for (const auto& candidate : candidates) {
        nlohmann::json payload = {
            {"action", toString(candidate.action)}, {"confidence", candidate.confidence},
            {"price", candidate.price}, {"volatility", candidate.volatility},
            {"momentum", candidate.momentum}, {"volume_surge", candidate.volume_surge}
        };
        
        if (config_.use_volume_filter) {
            auto samples = store_->window(candidate.symbol, volume_filter_.lookback());
            auto confirmation = volume_filter_.confirm(samples, candidate);
            if (!confirmation.confirmed) {
                LOG_DEBUG("{} 거래량 미확인 (ratio {:.2f}, score {:.2f})",
                          candidate.symbol, confirmation.metrics.volume_ratio, confirmation.score);
                continue;
            }
            payload["volume_ratio"] = confirmation.metrics.volume_ratio;
            payload["volume_score"] = confirmation.score;
            payload["volume_quality"] = volume_filter_.qualityScore(confirmation.metrics);
        }
        
        journal(JournalEventType::SIGNAL_EMITTED, candidate.symbol, payload);
        
        if (!signal_channel_.push(candidate)) {
            break;
        }
        accepted.push_back(candidate);
    }
    
    if (!accepted.empty()) {
        LOG_INFO("스캔 완료: 후보 {}개, 전달 {}개", candidates.size(), accepted.size());
    }
    return accepted;
}

EntryOutcome TradingEngine::processSignal(const Signal& signal) {
    EntryOutcome outcome;
    
    if (position_manager_->hasPosition(signal.symbol)) {
        outcome.reason = "position already open";
        return outcome;
    }
    
    if (config_.use_multi_timeframe) {
        std::map<std::string, std::vector<Bar>> bars_by_timeframe;
        for (const auto& timeframe : mtf_validator_.timeframes()) {
            auto bars = broker_->getRecentBars(signal.symbol, timeframe, config_.timeframe_bars);
            if (bars.success) {
                bars_by_timeframe[timeframe] = std::move(bars.value);
            } else if (bars.kind == ErrorKind::ConnectionError || bars.kind == ErrorKind::Unknown) {
                outcome.reason = "timeframe data unavailable";
                outcome.kind = bars.kind;
                return outcome;
            }
        }
        
        auto consensus = mtf_validator_.validateBars(bars_by_timeframe);
        journal(JournalEventType::CONSENSUS_COMPUTED, signal.symbol,
                {{"final_signal", consensus.final_signal}, {"confidence", consensus.confidence},
                 {"method", consensus.resolution_method}, {"alignment_score", consensus.alignment_score},
                 {"aligned", consensus.aligned}, {"weighted_score", consensus.weighted_score},
                 {"conflicts", consensus.conflicts}});
        
        if (actionFor(consensus.final_signal) != signal.action) {
            outcome.reason = "timeframe consensus disagrees (" + consensus.resolution_method + ")";
            LOG_DEBUG("{} 다중 타임프레임 불일치: 신호 {}, 합의 {} ({})",
                      signal.symbol, toString(signal.action), consensus.final_signal, consensus.reason);
            return outcome;
        }
    }
    
    return position_manager_->openPosition(signal);
}

std::vector<ExitOutcome> TradingEngine::exitCheckOnce() {
    auto outcomes = position_manager_->evaluateExits(std::chrono::system_clock::now());
    
    for (const auto& orphan : position_manager_->takeOrphans()) {
        journal(JournalEventType::RECONCILIATION, orphan.symbol,
                {{"orphan", true}, {"quantity", orphan.signedQuantity()}, {"order_id", orphan.order_id},
                 {"exit_failures", orphan.exit_failures}});
    }
    return outcomes;
}

void TradingEngine::maintenanceOnce() {
    if (risk_manager_->rollDailyBoundaryIfNeeded(std::chrono::system_clock::now())) {
        session_metrics_->resetDaily();
        journal(JournalEventType::DAILY_RESET, "", nlohmann::json::object());
    }
    
    if (config_.sync_capital_from_account) {
        auto account = broker_->getAccount();
        if (account.success && account.value.equity > 0.0) {
            risk_manager_->resetCapital(account.value.equity);
        } else if (!account.success && account.kind == ErrorKind::Unknown) {
            recordError(kMaintenanceLoop, account.message);
        }
    }
    
    auto positions = broker_->listPositions();
    if (positions.success) {
        position_manager_->reconcile(positions.value);
    } else if (positions.kind == ErrorKind::Unknown) {
        recordError(kMaintenanceLoop, positions.message);
    }
    
    auto risk = risk_manager_->getRiskState();
    auto stats = session_metrics_->snapshot();
    LOG_INFO("[상태] 포지션 {}/{} | 일일 손실 {:.2f}/{:.2f} | 거래 {} (승률 {:.1f}%) | API 잔여 {}",
             risk.open_positions, risk.max_concurrent_positions,
             risk.current_daily_loss, risk.daily_loss_limit,
             stats.total_trades, stats.winRate() * 100.0, rate_limiter_->remaining());
}

// ===== 루프 =====

void TradingEngine::ingestLoop() {
    LOG_INFO("수집/스캔 루프 시작");
    int connection_failures = 0;
    
    while (!stop_requested_) {
        if (ingestOnce()) {
            connection_failures = 0;
            scanOnce();
            if (!sleepFor(std::chrono::milliseconds(config_.ingest_interval_ms))) break;
            continue;
        }
        
        if (!handleLoopError(kIngestLoop, ErrorKind::ConnectionError, "market data refresh failed",
                             connection_failures)) {
            break;
        }
        // 부분 실패여도 저장된 데이터로 스캔은 계속
        scanOnce();
        if (!sleepFor(reconnectDelay(connection_failures))) break;
    }
    LOG_INFO("수집/스캔 루프 종료");
}

void TradingEngine::entryLoop() {
    LOG_INFO("진입 루프 시작");
    int connection_failures = 0;
    
    while (!stop_requested_) {
        auto signal = signal_channel_.popFor(std::chrono::milliseconds(config_.entry_interval_ms));
        if (!signal) {
            continue;
        }
        
        if (std::chrono::system_clock::now() - signal->timestamp > kSignalMaxAge) {
            LOG_DEBUG("{} 오래된 신호 폐기", signal->symbol);
            continue;
        }
        
        auto outcome = processSignal(*signal);
        if (outcome.opened || outcome.kind == ErrorKind::None) {
            connection_failures = 0;
            continue;
        }
        if (!handleLoopError(kEntryLoop, outcome.kind, signal->symbol + ": " + outcome.reason,
                             connection_failures)) {
            break;
        }
        if (outcome.kind == ErrorKind::ConnectionError) {
            if (!sleepFor(reconnectDelay(connection_failures))) break;
        }
    }
    LOG_INFO("진입 루프 종료");
}

void TradingEngine::exitLoop() {
    LOG_INFO("청산 점검 루프 시작");
    int connection_failures = 0;
    
    while (!stop_requested_) {
        bool keep_running = true;
        bool connection_error = false;
        for (const auto& outcome : exitCheckOnce()) {
            if (outcome.closed || outcome.kind == ErrorKind::None) {
                continue;
            }
            if (outcome.kind == ErrorKind::ConnectionError) {
                connection_error = true;
                continue;
            }
            keep_running = handleLoopError(kExitLoop, outcome.kind, outcome.symbol + ": " + outcome.message,
                                           connection_failures) && keep_running;
        }
        if (connection_error) {
            keep_running = handleLoopError(kExitLoop, ErrorKind::ConnectionError, "exit order connection failure",
                                           connection_failures) && keep_running;
        } else {
            connection_failures = 0;
        }
        if (!keep_running) {
            break;
        }
        auto delay = std::chrono::milliseconds(config_.exit_interval_ms);
        if (connection_error) {
            delay = std::max(delay, reconnectDelay(connection_failures));
        }
        if (!sleepFor(delay)) break;
    }
    LOG_INFO("청산 점검 루프 종료");
}

void TradingEngine::maintenanceLoop() {
    LOG_INFO("유지보수 루프 시작");
    while (!stop_requested_) {
        if (!sleepFor(std::chrono::milliseconds(config_.maintenance_interval_ms))) break;
        maintenanceOnce();
    }
    LOG_INFO("유지보수 루프 종료");
}

// ===== 오류 처리 =====

bool TradingEngine::handleLoopError(const std::string& loop_name, ErrorKind kind, const std::string& message,
                                    int& consecutive_connection_failures) {
    switch (kind) {
        case ErrorKind::ConnectionError:
            consecutive_connection_failures++;
            if (consecutive_connection_failures >= config_.max_reconnect_attempts) {
                haltLoop(loop_name, "connection error retries exhausted: " + message);
                return false;
            }
            LOG_WARN("[{}] 연결 오류 ({}/{}): {}", loop_name,
                     consecutive_connection_failures, config_.max_reconnect_attempts, message);
            return true;
        case ErrorKind::Unknown:
            recordError(loop_name, message);
            return !stop_requested_;
        case ErrorKind::InsufficientFunds:
        case ErrorKind::InvalidRequest:
        case ErrorKind::OrderTimeout:
        case ErrorKind::RateLimited:
        case ErrorKind::InsufficientData:
            LOG_WARN("[{}] {} ({})", loop_name, message, scalpengine::toString(kind));
            return true;
        case ErrorKind::None:
            return true;
    }
    return true;
}

void TradingEngine::recordError(const std::string& loop_name, const std::string& message) {
    const int count = ++error_count_;
    LOG_ERROR("[{}] 오류 {}/{}: {}", loop_name, count, config_.max_errors, message);
    if (count >= config_.max_errors) {
        haltLoop("engine", "error budget exhausted");
        requestStop();
    }
}

void TradingEngine::haltLoop(const std::string& loop_name, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(halted_mutex_);
        if (!halted_loops_.insert(loop_name).second) {
            return;
        }
    }
    LOG_ERROR("[{}] 루프 중단: {}", loop_name, reason);
    journal(JournalEventType::LOOP_HALTED, "", {{"loop", loop_name}, {"reason", reason}});
}

bool TradingEngine::isLoopHalted(const std::string& loop_name) const {
    std::lock_guard<std::mutex> lock(halted_mutex_);
    return halted_loops_.count(loop_name) > 0;
}

std::chrono::milliseconds TradingEngine::reconnectDelay(int attempt) const {
    const int exponent = std::max(0, std::min(attempt - 1, 16));
    const long long delay = config_.reconnect_delay_ms * (1LL << exponent);
    return std::chrono::milliseconds(std::min(delay, config_.max_reconnect_delay_ms));
}

// ===== 상태 조회 =====

std::vector<Position> TradingEngine::getPositions() const {
    return position_manager_->positions();
}

SessionStats TradingEngine::getSessionStats() const {
    return session_metrics_->snapshot();
}

risk::RiskManager::RiskState TradingEngine::getRiskState() const {
    return risk_manager_->getRiskState();
}

void TradingEngine::journal(JournalEventType type, const std::string& symbol, nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = toEpochMs(std::chrono::system_clock::now());
    event.type = type;
    event.symbol = symbol;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("저널 기록 실패: {}", core::toString(type));
    }
}

SignalAction TradingEngine::actionFor(int signal) {
    if (signal > 0) return SignalAction::BUY;
    if (signal < 0) return SignalAction::SELL;
    return SignalAction::HOLD;
}

} // namespace engine
} // namespace scalpengine
