#pragma once

#include "analytics/MultiTimeframeValidator.h"
#include "analytics/VolatilityScanner.h"
#include "analytics/VolumeConfirmationFilter.h"
#include "broker/RateLimitedBroker.h"
#include "common/Channel.h"
#include "common/Types.h"
#include "core/contracts/IBroker.h"
#include "core/contracts/IEventJournal.h"
#include "engine/EngineConfig.h"
#include "engine/PositionManager.h"
#include "engine/SessionMetrics.h"
#include "execution/OrderExecutor.h"
#include "execution/RateLimiter.h"
#include "market/SeriesStore.h"
#include "risk/RiskManager.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace scalpengine {
namespace engine {

// Trading Engine - 4개 주기 루프 (수집/스캔, 진입, 청산 점검, 유지보수)
class TradingEngine {
public:
    TradingEngine(
        const EngineConfig& config,
        std::shared_ptr<core::IBroker> broker,
        std::shared_ptr<core::IEventJournal> journal = nullptr
    );
    
    ~TradingEngine();
    
    TradingEngine(const TradingEngine&) = delete;
    TradingEngine& operator=(const TradingEngine&) = delete;
    
    // ===== 엔진 제어 =====
    
    bool start();
    void stop();                 // 루프 종료 대기 + (설정 시) 전체 청산
    void requestStop();          // 비동기 종료 요청 (루프 스레드에서도 호출 가능)
    bool isRunning() const { return running_ && !stop_requested_; }
    
    // 종료 요청이 들어오면 true
    bool waitForStop(std::chrono::milliseconds timeout);
    
    // ===== 한 주기 단위 실행 (루프 및 테스트에서 사용) =====
    
    // 모든 종목 시세 갱신. 연결 오류가 한 종목이라도 없으면 true
    bool ingestOnce();
    // 스캔 + 거래량 확인, 통과 신호는 채널로 전달
    std::vector<Signal> scanOnce();
    // 다중 타임프레임 검증 후 진입
    EntryOutcome processSignal(const Signal& signal);
    std::vector<ExitOutcome> exitCheckOnce();
    void maintenanceOnce();
    
    // 시작 시 과거 바 적재
    void bootstrap();
    
    // ===== 상태 조회 =====
    
    std::vector<Position> getPositions() const;
    SessionStats getSessionStats() const;
    risk::RiskManager::RiskState getRiskState() const;
    int getErrorCount() const { return error_count_.load(); }
    bool isLoopHalted(const std::string& loop_name) const;
    
    std::shared_ptr<market::SeriesStore> seriesStore() const { return store_; }
    
private:
    EngineConfig config_;
    
    std::shared_ptr<execution::RateLimiter> rate_limiter_;
    std::shared_ptr<broker::RateLimitedBroker> broker_;
    std::shared_ptr<core::IEventJournal> journal_;
    
    std::shared_ptr<market::SeriesStore> store_;
    std::shared_ptr<analytics::VolatilityScanner> scanner_;
    analytics::VolumeConfirmationFilter volume_filter_;
    analytics::MultiTimeframeValidator mtf_validator_;
    
    std::shared_ptr<risk::RiskManager> risk_manager_;
    std::shared_ptr<execution::OrderExecutor> executor_;
    std::shared_ptr<SessionMetrics> session_metrics_;
    std::shared_ptr<PositionManager> position_manager_;
    
    Channel<Signal> signal_channel_;
    
    // 스레드 제어
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::vector<std::thread> workers_;
    
    // 오류 예산 / 루프 상태
    std::atomic<int> error_count_;
    mutable std::mutex halted_mutex_;
    std::set<std::string> halted_loops_;
    
    // ===== 루프 =====
    
    void ingestLoop();
    void entryLoop();
    void exitLoop();
    void maintenanceLoop();
    
    // stop 요청 시 false
    bool sleepFor(std::chrono::milliseconds duration);
    
    // ===== 오류 처리 =====
    
    // 오류 분류별 처리. 루프를 멈춰야 하면 false
    bool handleLoopError(const std::string& loop_name, ErrorKind kind, const std::string& message,
                         int& consecutive_connection_failures);
    void recordError(const std::string& loop_name, const std::string& message);
    void haltLoop(const std::string& loop_name, const std::string& reason);
    std::chrono::milliseconds reconnectDelay(int attempt) const;
    
    void journal(core::JournalEventType type, const std::string& symbol, nlohmann::json payload);
    static SignalAction actionFor(int signal);
};

} // namespace engine
} // namespace scalpengine
