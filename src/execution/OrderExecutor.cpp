#include "execution/OrderExecutor.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace scalpengine {
namespace execution {

OrderExecutor::OrderExecutor(std::shared_ptr<core::IBroker> broker, ExecutionConfig config)
    : broker_(std::move(broker))
    , config_(config)
    , rng_(std::random_device{}())
{
    if (!broker_) {
        throw std::invalid_argument("OrderExecutor requires a broker");
    }
    config_.max_attempts = std::max(1, config_.max_attempts);
    config_.fill_poll_interval_ms = std::max<long long>(1, config_.fill_poll_interval_ms);
}

BrokerResult<FillResult> OrderExecutor::execute(const std::string& symbol, OrderSide side, double quantity,
                                                OrderType type) {
    const std::string client_order_id = nextClientOrderId(symbol);
    int attempts = 0;
    bool unresolved = false;
    auto submitted = submitWithRetry(symbol, side, quantity, type, client_order_id, &attempts, &unresolved);
    if (!submitted.success) {
        auto failed = BrokerResult<FillResult>::failFrom(submitted);
        failed.value.attempts = attempts;
        failed.value.unresolved = unresolved;
        failed.value.handle.client_order_id = client_order_id;
        failed.value.handle.symbol = symbol;
        failed.value.handle.side = side;
        failed.value.handle.quantity = quantity;
        return failed;
    }

    auto filled = awaitFill(submitted.value);
    filled.value.attempts = attempts;
    return filled;
}

BrokerResult<OrderHandle> OrderExecutor::submitWithRetry(const std::string& symbol, OrderSide side,
                                                         double quantity, OrderType type,
                                                         const std::string& client_order_id,
                                                         int* attempts_out, bool* unresolved_out) {
    BrokerResult<OrderHandle> last = BrokerResult<OrderHandle>::fail(ErrorKind::Unknown, "not attempted");
    // 직전 제출이 ConnectionError: 브로커가 접수했는지 모름
    bool unresolved = false;

    // 접수 여부 조회. 찾으면 true, 없다고 확인되면 unresolved 해제
    auto lookup = [&](BrokerResult<OrderHandle>& found) {
        found = broker_->findOrderByClientId(client_order_id);
        if (found.success) {
            unresolved = false;
            LOG_WARN("응답 유실 주문 확인: {} {} (id={}, client={})",
                     symbol, toString(side), found.value.order_id, client_order_id);
            return true;
        }
        if (found.kind == ErrorKind::InvalidRequest) {
            unresolved = false;
        } else {
            LOG_WARN("주문 접수 여부 조회 실패: {} - {} ({})", client_order_id, found.message, toString(found.kind));
        }
        return false;
    };

    for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        if (attempts_out) {
            *attempts_out = attempt;
        }

        bool may_submit = true;
        if (unresolved) {
            BrokerResult<OrderHandle> found;
            if (lookup(found)) {
                if (unresolved_out) *unresolved_out = false;
                return found;
            }
            if (unresolved) {
                // 조회도 실패하면 재제출하지 않고 다음 시도에서 다시 조회
                may_submit = false;
                last = BrokerResult<OrderHandle>::fail(ErrorKind::ConnectionError,
                    "order " + client_order_id + " state unknown: " + found.message);
            }
        }

        if (may_submit) {
            last = broker_->submitOrder(symbol, side, quantity, type, client_order_id);
            if (last.success) {
                LOG_INFO("주문 제출: {} {} {:.4f} (id={}, 시도 {})",
                         symbol, toString(side), quantity, last.value.order_id, attempt);
                if (unresolved_out) *unresolved_out = false;
                return last;
            }

            if (!isRetryable(last.kind)) {
                LOG_ERROR("주문 실패 (재시도 불가): {} {} - {} ({})",
                          symbol, toString(side), last.message, toString(last.kind));
                if (unresolved_out) *unresolved_out = false;
                return last;
            }
            unresolved = last.kind == ErrorKind::ConnectionError;
        }

        if (attempt == config_.max_attempts) {
            break;
        }

        auto delay = backoffDelay(attempt);
        if (last.kind == ErrorKind::RateLimited && last.retry_after_seconds > 0) {
            delay = std::max(delay, std::chrono::milliseconds(last.retry_after_seconds * 1000LL));
        }
        LOG_WARN("주문 재시도 대기 {}ms: {} {} - {} ({}, 시도 {}/{})",
                 delay.count(), symbol, toString(side), last.message, toString(last.kind),
                 attempt, config_.max_attempts);

        if (!interruptibleSleep(delay)) {
            LOG_WARN("종료 요청으로 주문 재시도 중단: {}", symbol);
            break;
        }
    }

    // 마지막 제출 결과도 확인
    if (unresolved) {
        BrokerResult<OrderHandle> found;
        if (lookup(found)) {
            if (unresolved_out) *unresolved_out = false;
            return found;
        }
    }
    if (unresolved_out) {
        *unresolved_out = unresolved;
    }

    if (unresolved) {
        LOG_ERROR("주문 접수 여부 미확인: {} {} (client={}) - 대사 필요", symbol, toString(side), client_order_id);
    } else {
        LOG_ERROR("주문 재시도 한도 초과: {} {} - {} ({})",
                  symbol, toString(side), last.message, toString(last.kind));
    }
    return last;
}

BrokerResult<FillResult> OrderExecutor::awaitFill(const OrderHandle& handle) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(config_.fill_timeout_ms);
    const auto poll = std::chrono::milliseconds(config_.fill_poll_interval_ms);

    FillResult fill;
    fill.handle = handle;
    fill.report.order_id = handle.order_id;

    while (true) {
        auto status = broker_->getOrderStatus(handle.order_id);
        if (status.success) {
            fill.report = status.value;
            switch (status.value.status) {
                case OrderStatus::FILLED:
                    return BrokerResult<FillResult>::ok(fill);
                case OrderStatus::REJECTED:
                    return BrokerResult<FillResult>::fail(ErrorKind::InvalidRequest,
                                                          "order " + handle.order_id + " rejected");
                case OrderStatus::CANCELLED:
                case OrderStatus::EXPIRED:
                    if (status.value.filled_quantity > 0.0) {
                        fill.partial = true;
                        return BrokerResult<FillResult>::ok(fill);
                    }
                    return BrokerResult<FillResult>::fail(ErrorKind::Unknown,
                        "order " + handle.order_id + " " + toString(status.value.status));
                default:
                    break;
            }
        } else if (!isRetryable(status.kind)) {
            LOG_WARN("체결 조회 실패: {} - {} ({})", handle.order_id, status.message, toString(status.kind));
        }

        if (std::chrono::steady_clock::now() + poll > deadline) {
            break;
        }
        // 체결 대기는 종료 요청과 무관하게 타임아웃까지 진행
        std::this_thread::sleep_for(poll);
    }

    LOG_WARN("체결 대기 타임아웃 ({}ms): {} - 주문 취소", config_.fill_timeout_ms, handle.order_id);
    auto cancelled = broker_->cancelOrder(handle.order_id);
    if (!cancelled.success) {
        LOG_WARN("주문 취소 실패: {} - {} ({})", handle.order_id, cancelled.message, toString(cancelled.kind));
    }

    // 취소 직전 체결분 확인
    auto final_status = broker_->getOrderStatus(handle.order_id);
    if (final_status.success) {
        fill.report = final_status.value;
        if (final_status.value.status == OrderStatus::FILLED) {
            return BrokerResult<FillResult>::ok(fill);
        }
        if (final_status.value.filled_quantity > 0.0) {
            fill.partial = true;
            LOG_WARN("타임아웃 주문 부분 체결: {} ({:.4f}/{:.4f})",
                     handle.order_id, final_status.value.filled_quantity, handle.quantity);
            return BrokerResult<FillResult>::ok(fill);
        }
    }

    auto timed_out = BrokerResult<FillResult>::fail(ErrorKind::OrderTimeout,
                                                    "fill timeout for order " + handle.order_id);
    // 종료 상태를 확인하지 못한 주문은 늦게 체결될 수 있음
    if (!final_status.success || !isTerminalStatus(final_status.value.status)) {
        fill.unresolved = true;
        timed_out.message += " (cancel unconfirmed)";
        LOG_ERROR("타임아웃 주문 취소 미확인: {} - 대사 필요", handle.order_id);
    }
    timed_out.value = fill;
    return timed_out;
}

std::string OrderExecutor::nextClientOrderId(const std::string& symbol) {
    const long long now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "se-" + symbol + "-" + std::to_string(now_ms) + "-" + std::to_string(++client_seq_);
}

std::chrono::milliseconds OrderExecutor::backoffDelay(int attempt) {
    const int exponent = std::max(0, std::min(attempt - 1, 30));
    const double raw = static_cast<double>(config_.base_backoff_ms) * static_cast<double>(1LL << exponent);
    const double capped = std::min(raw, static_cast<double>(config_.max_backoff_ms));

    double jitter = 1.0;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_real_distribution<double> dist(config_.jitter_min, config_.jitter_max);
        jitter = dist(rng_);
    }
    return std::chrono::milliseconds(static_cast<long long>(capped * jitter));
}

void OrderExecutor::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopped_ = true;
    }
    stop_cv_.notify_all();
}

bool OrderExecutor::isStopped() const {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    return stopped_;
}

bool OrderExecutor::interruptibleSleep(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, duration, [this] { return stopped_; });
}

} // namespace execution
} // namespace scalpengine
