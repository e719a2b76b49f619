#pragma once

#include <string>
#include <vector>

#include "common/BrokerResult.h"
#include "common/Types.h"

namespace scalpengine {
namespace core {

// 브로커 기능 - 모든 호출은 예외 대신 BrokerResult 로 실패를 알림
class IBroker {
public:
    virtual ~IBroker() = default;

    // client_order_id 는 재시도 간 동일하게 유지 (응답 유실 시 조회 키)
    virtual BrokerResult<OrderHandle> submitOrder(
        const std::string& symbol, OrderSide side, double quantity, OrderType type,
        const std::string& client_order_id) = 0;
    // 제출 측 키로 주문 조회. 브로커에 없으면 InvalidRequest
    virtual BrokerResult<OrderHandle> findOrderByClientId(const std::string& client_order_id) = 0;
    virtual BrokerResult<OrderStatusReport> getOrderStatus(const std::string& order_id) = 0;
    virtual BrokerResult<bool> cancelOrder(const std::string& order_id) = 0;
    virtual BrokerResult<std::vector<Bar>> getRecentBars(
        const std::string& symbol, const std::string& timeframe, int limit) = 0;
    virtual BrokerResult<Quote> getLatestQuote(const std::string& symbol) = 0;
    virtual BrokerResult<AccountInfo> getAccount() = 0;
    virtual BrokerResult<std::vector<BrokerPosition>> listPositions() = 0;
};

} // namespace core
} // namespace scalpengine
