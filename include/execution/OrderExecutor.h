#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include "common/BrokerResult.h"
#include "common/Types.h"
#include "core/contracts/IBroker.h"

namespace scalpengine {
namespace execution {

struct ExecutionConfig {
    int max_attempts = 3;                 // 제출 시도 횟수 (재시도 가능한 오류에만 적용)
    long long base_backoff_ms = 1000;
    long long max_backoff_ms = 60000;
    double jitter_min = 0.75;
    double jitter_max = 1.25;
    long long fill_timeout_ms = 10000;
    long long fill_poll_interval_ms = 500;
};

struct FillResult {
    OrderHandle handle;
    OrderStatusReport report;
    int attempts = 0;
    bool partial = false;   // 타임아웃 취소 후 일부만 체결
    // 실패 결과에서만 의미 있음: 브로커 측 주문 존재/체결 여부를 확인하지 못함
    bool unresolved = false;
};

// 주문 제출 -> 체결 대기 -> (타임아웃 시) 취소
// 재시도: RateLimited / ConnectionError 만, 지수 백오프 + 지터
// execute() 1회당 client_order_id 하나. ConnectionError 뒤에는 재제출 전에 그 키로 조회
class OrderExecutor {
public:
    OrderExecutor(std::shared_ptr<core::IBroker> broker, ExecutionConfig config = ExecutionConfig());

    BrokerResult<FillResult> execute(const std::string& symbol, OrderSide side, double quantity,
                                     OrderType type = OrderType::MARKET);

    // 제출만 재시도 (체결 대기 없음). unresolved_out: 실패했지만 주문이 접수됐을 수 있음
    BrokerResult<OrderHandle> submitWithRetry(const std::string& symbol, OrderSide side, double quantity,
                                              OrderType type, const std::string& client_order_id,
                                              int* attempts_out = nullptr, bool* unresolved_out = nullptr);

    // 체결 확인 폴링. 타임아웃이면 취소 후 OrderTimeout
    // 취소를 확인하지 못하면 실패 결과의 value.unresolved = true
    BrokerResult<FillResult> awaitFill(const OrderHandle& handle);

    std::string nextClientOrderId(const std::string& symbol);

    // attempt 는 1 부터. 지터 포함
    std::chrono::milliseconds backoffDelay(int attempt);

    // 백오프 대기를 즉시 깨우고 이후 재시도 중단
    void stop();
    bool isStopped() const;

    const ExecutionConfig& config() const { return config_; }

private:
    std::shared_ptr<core::IBroker> broker_;
    ExecutionConfig config_;

    std::mt19937 rng_;
    std::mutex rng_mutex_;
    std::atomic<long long> client_seq_{0};

    mutable std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stopped_ = false;

    // stop() 으로 깨어나면 false
    bool interruptibleSleep(std::chrono::milliseconds duration);
};

} // namespace execution
} // namespace scalpengine
