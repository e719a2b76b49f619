#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "core/contracts/IBroker.h"
#include "network/IHttpClient.h"

namespace scalpengine {
namespace broker {

struct AlpacaConfig {
    std::string trading_base_url = "https://paper-api.alpaca.markets";
    std::string data_base_url = "https://data.alpaca.markets";
    std::string data_feed = "iex";
    std::string time_in_force = "day";
};

// Alpaca REST 브로커 - HTTP 상태/전송 오류를 ErrorKind 로 분류
class AlpacaBroker : public core::IBroker {
public:
    AlpacaBroker(std::shared_ptr<network::IHttpClient> http, AlpacaConfig config = AlpacaConfig());

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

    // 응답 코드 -> ErrorKind (2xx 는 None)
    static ErrorKind classifyStatus(int status_code);
    static OrderStatus parseOrderStatus(const std::string& status);
    // RFC3339 ("2024-01-02T15:04:00Z") -> epoch ms, 실패 시 0
    static long long parseTimestampMs(const std::string& text);

private:
    std::shared_ptr<network::IHttpClient> http_;
    AlpacaConfig config_;

    template <typename T>
    BrokerResult<T> failFromResponse(const network::HttpResponse& response, const std::string& context) const;
};

} // namespace broker
} // namespace scalpengine
