#include "broker/RateLimitedBroker.h"
#include "common/Logger.h"

#include <stdexcept>

namespace scalpengine {
namespace broker {

RateLimitedBroker::RateLimitedBroker(std::shared_ptr<core::IBroker> inner,
                                     std::shared_ptr<execution::RateLimiter> limiter)
    : inner_(std::move(inner))
    , limiter_(std::move(limiter))
{
    if (!inner_ || !limiter_) {
        throw std::invalid_argument("RateLimitedBroker requires broker and limiter");
    }
}

template <typename T, typename Fn>
BrokerResult<T> RateLimitedBroker::guarded(Fn&& call) {
    if (!limiter_->acquire()) {
        return BrokerResult<T>::fail(ErrorKind::ConnectionError, "rate limiter stopped");
    }
    BrokerResult<T> result = call();
    if (!result.success && result.kind == ErrorKind::RateLimited) {
        limiter_->handleRateLimitError(result.retry_after_seconds);
    }
    return result;
}

BrokerResult<OrderHandle> RateLimitedBroker::submitOrder(
    const std::string& symbol, OrderSide side, double quantity, OrderType type,
    const std::string& client_order_id) {
    return guarded<OrderHandle>([&] {
        return inner_->submitOrder(symbol, side, quantity, type, client_order_id);
    });
}

BrokerResult<OrderHandle> RateLimitedBroker::findOrderByClientId(const std::string& client_order_id) {
    return guarded<OrderHandle>([&] { return inner_->findOrderByClientId(client_order_id); });
}

BrokerResult<OrderStatusReport> RateLimitedBroker::getOrderStatus(const std::string& order_id) {
    return guarded<OrderStatusReport>([&] { return inner_->getOrderStatus(order_id); });
}

BrokerResult<bool> RateLimitedBroker::cancelOrder(const std::string& order_id) {
    return guarded<bool>([&] { return inner_->cancelOrder(order_id); });
}

BrokerResult<std::vector<Bar>> RateLimitedBroker::getRecentBars(
    const std::string& symbol, const std::string& timeframe, int limit) {
    return guarded<std::vector<Bar>>([&] { return inner_->getRecentBars(symbol, timeframe, limit); });
}

BrokerResult<Quote> RateLimitedBroker::getLatestQuote(const std::string& symbol) {
    return guarded<Quote>([&] { return inner_->getLatestQuote(symbol); });
}

BrokerResult<AccountInfo> RateLimitedBroker::getAccount() {
    return guarded<AccountInfo>([&] { return inner_->getAccount(); });
}

BrokerResult<std::vector<BrokerPosition>> RateLimitedBroker::listPositions() {
    return guarded<std::vector<BrokerPosition>>([&] { return inner_->listPositions(); });
}

} // namespace broker
} // namespace scalpengine
