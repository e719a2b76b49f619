#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "analytics/VolatilityScanner.h"
#include "common/BrokerResult.h"
#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "core/execution/PositionStateMachine.h"
#include "core/state/PositionReconciler.h"
#include "engine/SessionMetrics.h"
#include "execution/OrderExecutor.h"
#include "market/SeriesStore.h"
#include "risk/RiskManager.h"

namespace scalpengine {
namespace engine {

struct LifecycleConfig {
    int max_hold_seconds = 900;
    double volatility_floor = 0.01;         // 손실 중 변동성이 이 값 미만이면 조기 청산
    double trailing_trigger_pct = 0.01;
    double trailing_distance_pct = 0.005;
    int max_exit_failures = 3;
    bool allow_fractional = true;           // false 면 수량을 정수 주로 내림
};

enum class ExitReason {
    NONE,
    PROFIT_TARGET,
    STOP_LOSS,
    TIME_LIMIT,
    VOLATILITY_COLLAPSE,
    MANUAL,
    SHUTDOWN
};

const char* toString(ExitReason reason);

struct Position {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double entry_price = 0.0;
    Timestamp entry_time{};
    double target_price = 0.0;
    double stop_price = 0.0;
    std::string order_id;
    core::execution::PositionState state = core::execution::PositionState::NEW;

    double target_profit_pct = 0.0;
    double stop_loss_pct = 0.0;
    double entry_confidence = 0.0;
    double entry_volatility = 0.0;
    ExitReason exit_reason = ExitReason::NONE;
    std::string exit_order_id;
    int exit_failures = 0;

    // 방향 반영 미실현 손익률
    double unrealizedPnlPct(double price) const;
    double signedQuantity() const { return side == OrderSide::BUY ? quantity : -quantity; }
};

struct EntryOutcome {
    bool opened = false;
    std::string reason;
    ErrorKind kind = ErrorKind::None;
    std::optional<Position> position;
};

struct ExitOutcome {
    std::string symbol;
    ExitReason reason = ExitReason::NONE;
    bool closed = false;
    bool abandoned = false;      // FAILED 로 제거되어 고아 포지션으로 보고됨
    double realized_pnl = 0.0;
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

// Position Lifecycle Manager - 포지션 상태머신 소유, 진입/청산 실행
class PositionManager {
public:
    PositionManager(std::shared_ptr<execution::OrderExecutor> executor,
                    std::shared_ptr<risk::RiskManager> risk,
                    std::shared_ptr<const market::SeriesStore> store,
                    std::shared_ptr<const analytics::VolatilityScanner> scanner,
                    std::shared_ptr<SessionMetrics> metrics,
                    std::shared_ptr<core::IEventJournal> journal,
                    LifecycleConfig config = LifecycleConfig());

    // ===== 진입 =====
    EntryOutcome openPosition(const Signal& signal);

    // ===== 청산 =====

    // OPEN 포지션의 청산 조건 점검 및 실행 (트레일링 스탑 갱신 포함)
    std::vector<ExitOutcome> evaluateExits(Timestamp now);

    // 수동/종료 청산
    ExitOutcome closePosition(const std::string& symbol, ExitReason reason = ExitReason::MANUAL);
    std::vector<ExitOutcome> closeAll(ExitReason reason);

    // 순수 판정 (우선순위: 목표가 > 손절 > 보유시간 > 변동성 붕괴)
    ExitReason checkExit(const Position& position, double price, std::optional<double> volatility,
                         Timestamp now) const;
    // 조건 충족 시 stop_price 를 조이기만 함. 변경 여부 반환
    bool applyTrailingStop(Position& position, double price) const;

    // 방향별 목표가/손절가
    static double targetPriceFor(OrderSide side, double entry, double target_pct);
    static double stopPriceFor(OrderSide side, double entry, double stop_pct);

    // ===== 조회 =====
    std::vector<Position> positions() const;
    std::optional<Position> position(const std::string& symbol) const;
    bool hasPosition(const std::string& symbol) const;
    size_t openCount() const;
    SessionStats metrics() const;

    // FAILED 로 제거된 포지션 (가져가면 비워짐)
    std::vector<Position> takeOrphans();

    // ===== 대사 =====
    // 체결 여부 미확인 진입은 여기서 먼저 정리: 브로커에 있으면 OPEN 으로 인수, 없으면 슬롯 해제
    core::ReconciliationReport reconcile(const std::vector<BrokerPosition>& broker_positions);

    const LifecycleConfig& config() const { return config_; }

private:
    std::shared_ptr<execution::OrderExecutor> executor_;
    std::shared_ptr<risk::RiskManager> risk_;
    std::shared_ptr<const market::SeriesStore> store_;
    std::shared_ptr<const analytics::VolatilityScanner> scanner_;
    std::shared_ptr<SessionMetrics> metrics_;
    std::shared_ptr<core::IEventJournal> journal_;
    LifecycleConfig config_;
    core::PositionReconciler reconciler_;

    mutable std::mutex mutex_;
    std::map<std::string, Position> positions_;
    std::set<std::string> in_flight_;          // 종목별 진행 중 진입/청산
    std::vector<Position> orphans_;
    std::map<std::string, Position> unresolved_entries_;   // 리스크 슬롯 예약 유지 중

    // 상태 전이 + 저널 (mutex_ 보유 상태에서 호출)
    bool transitionLocked(Position& position, core::execution::PositionEvent event, const std::string& note);
    void releaseInFlight(const std::string& symbol);
    void resolveUnresolvedEntries(const std::vector<BrokerPosition>& broker_positions);
    std::optional<double> currentVolatility(const std::string& symbol) const;
    double sizeFor(const Signal& signal) const;

    void journal(core::JournalEventType type, const std::string& symbol, const std::string& entity_id,
                 nlohmann::json payload) const;
};

} // namespace engine
} // namespace scalpengine
