#include "engine/PositionManager.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace scalpengine {
namespace engine {

using core::JournalEventType;
using core::execution::PositionEvent;
using core::execution::PositionState;
using core::execution::PositionStateMachine;

namespace {
// 목표가/손절가 비교 허용 오차 (부동소수 곱셈 오차 흡수)
constexpr double kPriceEpsilon = 1e-9;

bool reachedOrAbove(double price, double level) {
    return price >= level - std::abs(level) * kPriceEpsilon;
}

bool reachedOrBelow(double price, double level) {
    return price <= level + std::abs(level) * kPriceEpsilon;
}

OrderSide opposite(OrderSide side) {
    return side == OrderSide::BUY ? OrderSide::SELL : OrderSide::BUY;
}

double realizedPnl(OrderSide side, double entry, double exit, double quantity) {
    return side == OrderSide::BUY ? (exit - entry) * quantity : (entry - exit) * quantity;
}
} // namespace

const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::NONE: return "NONE";
        case ExitReason::PROFIT_TARGET: return "PROFIT_TARGET";
        case ExitReason::STOP_LOSS: return "STOP_LOSS";
        case ExitReason::TIME_LIMIT: return "TIME_LIMIT";
        case ExitReason::VOLATILITY_COLLAPSE: return "VOLATILITY_COLLAPSE";
        case ExitReason::MANUAL: return "MANUAL";
        case ExitReason::SHUTDOWN: return "SHUTDOWN";
    }
    return "NONE";
}

double Position::unrealizedPnlPct(double price) const {
    if (entry_price <= 0.0) {
        return 0.0;
    }
    return side == OrderSide::BUY ? (price - entry_price) / entry_price
                                  : (entry_price - price) / entry_price;
}

PositionManager::PositionManager(std::shared_ptr<execution::OrderExecutor> executor,
                                 std::shared_ptr<risk::RiskManager> risk,
                                 std::shared_ptr<const market::SeriesStore> store,
                                 std::shared_ptr<const analytics::VolatilityScanner> scanner,
                                 std::shared_ptr<SessionMetrics> metrics,
                                 std::shared_ptr<core::IEventJournal> journal,
                                 LifecycleConfig config)
    : executor_(std::move(executor))
    , risk_(std::move(risk))
    , store_(std::move(store))
    , scanner_(std::move(scanner))
    , metrics_(std::move(metrics))
    , journal_(std::move(journal))
    , config_(config)
{
    if (!executor_ || !risk_ || !store_) {
        throw std::invalid_argument("PositionManager requires executor, risk manager and series store");
    }
    if (!metrics_) {
        metrics_ = std::make_shared<SessionMetrics>();
    }
    config_.max_exit_failures = std::max(1, config_.max_exit_failures);
}

// ===== 진입 =====

EntryOutcome PositionManager::openPosition(const Signal& signal) {
    EntryOutcome outcome;

    if (signal.action == SignalAction::HOLD || signal.price <= 0.0 || signal.symbol.empty()) {
        outcome.reason = "signal not actionable";
        outcome.kind = ErrorKind::InvalidRequest;
        return outcome;
    }

    // 1. 종목별 진행 중 작업 확인
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_.count(signal.symbol) > 0 || positions_.count(signal.symbol) > 0 ||
            unresolved_entries_.count(signal.symbol) > 0) {
            outcome.reason = "symbol busy";
            LOG_DEBUG("{} 진입 건너뜀: 진행 중 주문 또는 보유 포지션", signal.symbol);
            return outcome;
        }
        in_flight_.insert(signal.symbol);
    }

    // 2. 리스크 승인 + 슬롯 예약
    auto admission = risk_->tryAdmitAndReserve(signal.symbol);
    if (!admission.admitted) {
        releaseInFlight(signal.symbol);
        outcome.reason = admission.reason;
        journal(JournalEventType::ENTRY_REJECTED, signal.symbol, "",
                {{"reason", admission.reason}, {"confidence", signal.confidence}});
        return outcome;
    }

    // 3. 수량 계산
    const double quantity = sizeFor(signal);
    if (quantity <= 0.0) {
        risk_->releaseReservation(signal.symbol);
        releaseInFlight(signal.symbol);
        outcome.reason = "position size is zero";
        journal(JournalEventType::ENTRY_REJECTED, signal.symbol, "", {{"reason", outcome.reason}});
        return outcome;
    }

    const OrderSide side = signal.action == SignalAction::BUY ? OrderSide::BUY : OrderSide::SELL;

    Position pending;
    pending.symbol = signal.symbol;
    pending.side = side;
    pending.quantity = quantity;
    pending.entry_price = signal.price;
    pending.target_profit_pct = signal.target_profit;
    pending.stop_loss_pct = signal.stop_loss;
    pending.entry_confidence = signal.confidence;
    pending.entry_volatility = signal.volatility;
    pending.state = PositionState::NEW;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        positions_[signal.symbol] = pending;
    }
    journal(JournalEventType::POSITION_STATE_CHANGED, signal.symbol, "",
            {{"state", "NEW"}, {"side", toString(side)}, {"quantity", quantity}, {"price", signal.price}});

    // 4. 주문 실행 (lock 없이)
    auto result = executor_->execute(signal.symbol, side, quantity, OrderType::MARKET);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(signal.symbol);
    if (it == positions_.end()) {
        // 다른 경로에서 제거되는 일은 없어야 함
        in_flight_.erase(signal.symbol);
        risk_->releaseReservation(signal.symbol);
        outcome.reason = "position vanished during entry";
        outcome.kind = ErrorKind::Unknown;
        LOG_ERROR("{} 진입 중 포지션 소실", signal.symbol);
        return outcome;
    }
    Position& position = it->second;

    if (!result.success) {
        const bool unresolved = result.value.unresolved;
        position.order_id = result.value.handle.order_id;
        transitionLocked(position, PositionEvent::ENTRY_FAILED, result.message);
        if (unresolved) {
            // 브로커에서 늦게 체결될 수 있음: 고아로 보고하고 대사까지 슬롯 유지
            orphans_.push_back(position);
            unresolved_entries_[signal.symbol] = position;
            LOG_ERROR("{} 진입 결과 미확인 ({}): {} - 대사 전까지 슬롯 유지",
                      signal.symbol, scalpengine::toString(result.kind), result.message);
        } else {
            risk_->releaseReservation(signal.symbol);
            LOG_ERROR("{} 진입 실패 ({}): {}", signal.symbol, scalpengine::toString(result.kind), result.message);
        }
        positions_.erase(it);
        in_flight_.erase(signal.symbol);

        outcome.reason = result.message;
        outcome.kind = result.kind;
        journal(JournalEventType::ORDER_FAILED, signal.symbol, result.value.handle.order_id,
                {{"phase", "entry"}, {"kind", scalpengine::toString(result.kind)}, {"message", result.message},
                 {"unresolved", unresolved}});
        return outcome;
    }

    const auto& fill = result.value;
    const double fill_price = fill.report.filled_avg_price > 0.0 ? fill.report.filled_avg_price : signal.price;
    const double fill_qty = fill.report.filled_quantity > 0.0 ? fill.report.filled_quantity : quantity;

    position.order_id = fill.handle.order_id;
    position.quantity = fill_qty;
    position.entry_price = fill_price;
    position.entry_time = std::chrono::system_clock::now();
    position.target_price = targetPriceFor(side, fill_price, signal.target_profit);
    position.stop_price = stopPriceFor(side, fill_price, signal.stop_loss);
    transitionLocked(position, PositionEvent::ENTRY_FILLED, fill.partial ? "partial fill" : "filled");

    risk_->commitReservation(signal.symbol);
    in_flight_.erase(signal.symbol);

    LOG_INFO("포지션 진입: {} {} {:.4f} @ {:.4f} (목표 {:.4f}, 손절 {:.4f}, 신뢰도 {:.2f})",
             signal.symbol, toString(side), fill_qty, fill_price,
             position.target_price, position.stop_price, signal.confidence);

    outcome.opened = true;
    outcome.reason = "opened";
    outcome.position = position;
    return outcome;
}

// ===== 청산 =====

std::vector<ExitOutcome> PositionManager::evaluateExits(Timestamp now) {
    std::vector<std::pair<std::string, ExitReason>> to_close;

    std::vector<Position> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [symbol, position] : positions_) {
            if (position.state == PositionState::OPEN && in_flight_.count(symbol) == 0) {
                snapshot.push_back(position);
            }
        }
    }

    for (auto& position : snapshot) {
        auto latest = store_->latest(position.symbol);
        if (!latest || latest->price <= 0.0) {
            continue;
        }
        const double price = latest->price;

        std::optional<double> volatility;
        if (position.unrealizedPnlPct(price) < 0.0) {
            volatility = currentVolatility(position.symbol);
        }

        const ExitReason reason = checkExit(position, price, volatility, now);
        if (reason != ExitReason::NONE) {
            LOG_INFO("{} 청산 조건 충족: {} (가격 {:.4f}, 손익 {:.2f}%)",
                     position.symbol, toString(reason), price, position.unrealizedPnlPct(price) * 100.0);
            to_close.emplace_back(position.symbol, reason);
            continue;
        }

        // 청산 대상이 아니면 트레일링 스탑만 갱신
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(position.symbol);
        if (it != positions_.end() && it->second.state == PositionState::OPEN) {
            const double before = it->second.stop_price;
            if (applyTrailingStop(it->second, price)) {
                LOG_INFO("{} 트레일링 스탑 갱신: {:.4f} -> {:.4f}", position.symbol, before, it->second.stop_price);
            }
        }
    }

    std::vector<ExitOutcome> outcomes;
    for (const auto& [symbol, reason] : to_close) {
        outcomes.push_back(closePosition(symbol, reason));
    }
    return outcomes;
}

ExitOutcome PositionManager::closePosition(const std::string& symbol, ExitReason reason) {
    ExitOutcome outcome;
    outcome.symbol = symbol;
    outcome.reason = reason;

    Position snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(symbol);
        if (it == positions_.end()) {
            outcome.kind = ErrorKind::InvalidRequest;
            outcome.message = "no position";
            return outcome;
        }
        if (in_flight_.count(symbol) > 0 || it->second.state != PositionState::OPEN) {
            outcome.message = "exit already in progress";
            return outcome;
        }
        it->second.exit_reason = reason;
        if (!transitionLocked(it->second, PositionEvent::EXIT_TRIGGERED, toString(reason))) {
            outcome.kind = ErrorKind::Unknown;
            outcome.message = "invalid state for exit";
            return outcome;
        }
        in_flight_.insert(symbol);
        snapshot = it->second;
    }

    auto result = executor_->execute(symbol, opposite(snapshot.side), snapshot.quantity, OrderType::MARKET);

    double fallback_price = snapshot.entry_price;
    if (auto latest = store_->latest(symbol)) {
        fallback_price = latest->price;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(symbol);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        outcome.kind = ErrorKind::Unknown;
        outcome.message = "position vanished during exit";
        LOG_ERROR("{} 청산 중 포지션 소실", symbol);
        return outcome;
    }
    Position& position = it->second;

    if (!result.success) {
        position.exit_failures++;
        outcome.kind = result.kind;
        outcome.message = result.message;

        journal(JournalEventType::ORDER_FAILED, symbol, "",
                {{"phase", "exit"}, {"reason", toString(reason)}, {"kind", scalpengine::toString(result.kind)},
                 {"message", result.message}, {"failures", position.exit_failures}});

        if (position.exit_failures >= config_.max_exit_failures) {
            transitionLocked(position, PositionEvent::EXIT_ABANDONED, "exit failures exhausted");
            LOG_ERROR("{} 청산 {}회 연속 실패 - 포지션 FAILED 처리, 대사 필요 (고아 포지션)",
                      symbol, position.exit_failures);
            orphans_.push_back(position);
            positions_.erase(it);
            risk_->onPositionClosed(symbol);
            outcome.abandoned = true;
        } else {
            transitionLocked(position, PositionEvent::EXIT_FAILED, result.message);
            LOG_WARN("{} 청산 실패 ({}/{}): {} ({}) - 다음 주기에 재시도",
                     symbol, position.exit_failures, config_.max_exit_failures,
                     result.message, scalpengine::toString(result.kind));
        }
        return outcome;
    }

    const auto& fill = result.value;
    const double exit_price = fill.report.filled_avg_price > 0.0 ? fill.report.filled_avg_price : fallback_price;
    const double filled_qty = fill.report.filled_quantity > 0.0
        ? std::min(fill.report.filled_quantity, position.quantity) : position.quantity;
    const double pnl = realizedPnl(position.side, position.entry_price, exit_price, filled_qty);

    position.exit_order_id = fill.handle.order_id;

    TradeRecord trade;
    trade.symbol = symbol;
    trade.side = position.side;
    trade.entry_price = position.entry_price;
    trade.exit_price = exit_price;
    trade.quantity = filled_qty;
    trade.pnl = pnl;
    trade.exit_reason = toString(reason);
    trade.entry_time = position.entry_time;
    trade.exit_time = std::chrono::system_clock::now();

    risk_->recordRealizedPnl(pnl);
    metrics_->recordTrade(trade);
    Logger::getInstance().logTrade(symbol, toString(position.side), position.entry_price, exit_price, filled_qty, pnl);

    outcome.realized_pnl = pnl;

    const double remaining = position.quantity - filled_qty;
    if (fill.partial && remaining > 1e-9) {
        // 부분 청산: 남은 수량으로 OPEN 복귀
        position.quantity = remaining;
        transitionLocked(position, PositionEvent::EXIT_FAILED, "partial exit");
        outcome.kind = ErrorKind::OrderTimeout;
        outcome.message = "partial exit";
        LOG_WARN("{} 부분 청산 {:.4f}, 잔량 {:.4f}", symbol, filled_qty, remaining);
        journal(JournalEventType::TRADE_CLOSED, symbol, fill.handle.order_id,
                {{"reason", toString(reason)}, {"pnl", pnl}, {"quantity", filled_qty}, {"partial", true}});
        return outcome;
    }

    transitionLocked(position, PositionEvent::EXIT_FILLED, toString(reason));
    LOG_INFO("포지션 청산: {} {} | 사유: {} | {:.4f} -> {:.4f} | 손익 {:.2f}",
             symbol, toString(position.side), toString(reason), position.entry_price, exit_price, pnl);
    journal(JournalEventType::TRADE_CLOSED, symbol, fill.handle.order_id,
            {{"reason", toString(reason)}, {"side", toString(position.side)},
             {"entry_price", position.entry_price}, {"exit_price", exit_price},
             {"quantity", filled_qty}, {"pnl", pnl}});

    positions_.erase(it);
    risk_->onPositionClosed(symbol);
    outcome.closed = true;
    return outcome;
}

std::vector<ExitOutcome> PositionManager::closeAll(ExitReason reason) {
    std::vector<std::string> symbols;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [symbol, position] : positions_) {
            if (position.state == PositionState::OPEN) {
                symbols.push_back(symbol);
            }
        }
    }

    std::vector<ExitOutcome> outcomes;
    for (const auto& symbol : symbols) {
        outcomes.push_back(closePosition(symbol, reason));
    }
    return outcomes;
}

ExitReason PositionManager::checkExit(const Position& position, double price,
                                      std::optional<double> volatility, Timestamp now) const {
    const bool is_buy = position.side == OrderSide::BUY;

    if (is_buy ? reachedOrAbove(price, position.target_price) : reachedOrBelow(price, position.target_price)) {
        return ExitReason::PROFIT_TARGET;
    }

    if (is_buy ? reachedOrBelow(price, position.stop_price) : reachedOrAbove(price, position.stop_price)) {
        return ExitReason::STOP_LOSS;
    }

    const auto held = std::chrono::duration_cast<std::chrono::seconds>(now - position.entry_time).count();
    if (held > config_.max_hold_seconds) {
        return ExitReason::TIME_LIMIT;
    }

    if (volatility && *volatility < config_.volatility_floor && position.unrealizedPnlPct(price) < 0.0) {
        return ExitReason::VOLATILITY_COLLAPSE;
    }

    return ExitReason::NONE;
}

bool PositionManager::applyTrailingStop(Position& position, double price) const {
    if (position.unrealizedPnlPct(price) <= config_.trailing_trigger_pct) {
        return false;
    }

    if (position.side == OrderSide::BUY) {
        const double new_stop = price * (1.0 - config_.trailing_distance_pct);
        if (new_stop > position.stop_price) {
            position.stop_price = new_stop;
            return true;
        }
    } else {
        const double new_stop = price * (1.0 + config_.trailing_distance_pct);
        if (new_stop < position.stop_price) {
            position.stop_price = new_stop;
            return true;
        }
    }
    return false;
}

double PositionManager::targetPriceFor(OrderSide side, double entry, double target_pct) {
    return side == OrderSide::BUY ? entry * (1.0 + target_pct) : entry * (1.0 - target_pct);
}

double PositionManager::stopPriceFor(OrderSide side, double entry, double stop_pct) {
    return side == OrderSide::BUY ? entry * (1.0 - stop_pct) : entry * (1.0 + stop_pct);
}

// ===== 조회 =====

std::vector<Position> PositionManager::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [symbol, position] : positions_) {
        out.push_back(position);
    }
    return out;
}

std::optional<Position> PositionManager::position(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PositionManager::hasPosition(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.count(symbol) > 0;
}

size_t PositionManager::openCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(positions_.begin(), positions_.end(), [](const auto& entry) {
        return entry.second.state == PositionState::OPEN || entry.second.state == PositionState::EXIT_REQUESTED;
    }));
}

SessionStats PositionManager::metrics() const {
    return metrics_->snapshot();
}

std::vector<Position> PositionManager::takeOrphans() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    out.swap(orphans_);
    return out;
}

// ===== 대사 =====

core::ReconciliationReport PositionManager::reconcile(const std::vector<BrokerPosition>& broker_positions) {
    resolveUnresolvedEntries(broker_positions);

    std::map<std::string, double> local;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [symbol, position] : positions_) {
            // 진입 체결 전(NEW)은 브로커에 아직 없을 수 있음
            if (position.state == PositionState::NEW) {
                continue;
            }
            local[symbol] = position.signedQuantity();
        }
    }

    auto report = reconciler_.reconcile(local, broker_positions);

    nlohmann::json drifts = nlohmann::json::array();
    for (const auto& entry : report.entries) {
        if (entry.status == core::ReconciliationStatus::SYNCED) {
            continue;
        }
        LOG_WARN("포지션 대사 불일치: {} {} (로컬 {:.4f}, 브로커 {:.4f})",
                 entry.symbol, core::toString(entry.status), entry.local_qty, entry.remote_qty);
        drifts.push_back({{"symbol", entry.symbol}, {"status", core::toString(entry.status)},
                          {"local_qty", entry.local_qty}, {"remote_qty", entry.remote_qty}});
    }

    journal(JournalEventType::RECONCILIATION, "", "",
            {{"checked", report.positions_checked}, {"drifts", drifts}});
    return report;
}

// ===== private =====

bool PositionManager::transitionLocked(Position& position, PositionEvent event, const std::string& note) {
    const PositionState from = position.state;
    auto result = PositionStateMachine::transition(from, event);
    if (!result.accepted) {
        LOG_ERROR("{} 상태 전이 거부: {}", position.symbol, result.reason);
        return false;
    }
    position.state = result.state;
    journal(JournalEventType::POSITION_STATE_CHANGED, position.symbol, position.order_id,
            {{"from", core::execution::toString(from)}, {"to", core::execution::toString(result.state)},
             {"event", core::execution::toString(event)}, {"note", note}});
    return true;
}

void PositionManager::releaseInFlight(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(symbol);
}

void PositionManager::resolveUnresolvedEntries(const std::vector<BrokerPosition>& broker_positions) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = unresolved_entries_.begin(); it != unresolved_entries_.end(); it = unresolved_entries_.erase(it)) {
        const std::string& symbol = it->first;
        auto remote = std::find_if(broker_positions.begin(), broker_positions.end(),
                                   [&symbol](const BrokerPosition& p) {
                                       return p.symbol == symbol && std::abs(p.quantity) > 1e-9;
                                   });
        if (remote == broker_positions.end()) {
            risk_->releaseReservation(symbol);
            LOG_INFO("{} 미확인 진입 정리: 브로커 포지션 없음, 슬롯 해제", symbol);
            journal(JournalEventType::RECONCILIATION, symbol, it->second.order_id,
                    {{"unresolved_entry", true}, {"resolution", "released"}});
            continue;
        }

        // 늦게 체결된 진입: 브로커 수량/평단으로 인수
        Position adopted = it->second;
        adopted.state = PositionState::NEW;
        adopted.side = remote->quantity > 0.0 ? OrderSide::BUY : OrderSide::SELL;
        adopted.quantity = std::abs(remote->quantity);
        if (remote->avg_entry_price > 0.0) {
            adopted.entry_price = remote->avg_entry_price;
        }
        adopted.entry_time = std::chrono::system_clock::now();
        adopted.target_price = targetPriceFor(adopted.side, adopted.entry_price, adopted.target_profit_pct);
        adopted.stop_price = stopPriceFor(adopted.side, adopted.entry_price, adopted.stop_loss_pct);
        transitionLocked(adopted, PositionEvent::ENTRY_FILLED, "adopted from broker");
        risk_->commitReservation(symbol);
        positions_[symbol] = adopted;

        LOG_WARN("{} 미확인 진입 인수: {} {:.4f} @ {:.4f}",
                 symbol, toString(adopted.side), adopted.quantity, adopted.entry_price);
        journal(JournalEventType::RECONCILIATION, symbol, adopted.order_id,
                {{"unresolved_entry", true}, {"resolution", "adopted"}, {"quantity", adopted.signedQuantity()}});
    }
}

std::optional<double> PositionManager::currentVolatility(const std::string& symbol) const {
    if (!scanner_) {
        return std::nullopt;
    }
    try {
        auto metrics = scanner_->analyze(symbol);
        if (!metrics) {
            return std::nullopt;
        }
        return metrics->volatility;
    } catch (const std::exception& e) {
        LOG_WARN("{} 변동성 계산 실패: {}", symbol, e.what());
        return std::nullopt;
    }
}

double PositionManager::sizeFor(const Signal& signal) const {
    const double notional = risk_->positionNotional(signal.confidence);
    if (notional <= 0.0 || signal.price <= 0.0) {
        return 0.0;
    }
    double quantity = notional / signal.price;
    if (config_.allow_fractional) {
        quantity = std::floor(quantity * 1e6) / 1e6;
    } else {
        quantity = std::floor(quantity);
    }
    return quantity;
}

void PositionManager::journal(JournalEventType type, const std::string& symbol, const std::string& entity_id,
                              nlohmann::json payload) const {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = toEpochMs(std::chrono::system_clock::now());
    event.type = type;
    event.symbol = symbol;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("저널 기록 실패: {} {}", core::toString(type), symbol);
    }
}

} // namespace engine
} // namespace scalpengine
