#pragma once

#include <memory>

#include "core/contracts/IBroker.h"
#include "execution/RateLimiter.h"

namespace scalpengine {
namespace broker {

// 모든 브로커 호출 앞에서 공용 RateLimiter 슬롯을 획득하는 데코레이터
class RateLimitedBroker : public core::IBroker {
public:
    RateLimitedBroker(std::shared_ptr<core::IBroker> inner,
                      std::shared_ptr<execution::RateLimiter> limiter);

    BrokerResult<OrderHandle> submitOrder(
        const std::string& symbol, OrderSide side, double quantity, OrderType type,
        const std::string& client_order_id) override;
    BrokerResult<OrderHandle> findOrderByClientId(const std::string& client_order_id) override;
    BrokerResult<OrderStatusReport> getOrderStatus(const std::string& order_id) override;
    BrokerResult<bool> cancelOrder(const std::string& order_id) override;
    BrokerResult<std::vector<Bar>> getRecentBars(
        const std::string& symbol, const std::string& timeframe, int limit) override;
    BrokerResult<Quote> getLatestQuote(const std::string& symbol) override;
    BrokerResult<AccountInfo> getAccount() override;
    BrokerResult<std::vector<BrokerPosition>> listPositions() override;

    execution::RateLimiter& limiter() { return *limiter_; }

private:
    std::shared_ptr<core::IBroker> inner_;
    std::shared_ptr<execution::RateLimiter> limiter_;

    template <typename T, typename Fn>
    BrokerResult<T> guarded(Fn&& call);
};

} // namespace broker
} // namespace scalpengine
