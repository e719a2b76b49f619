#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include "core/contracts/IBroker.h"

namespace scalpengine {
namespace broker {

struct PaperConfig {
    double initial_cash = 100000.0;
    double slippage_bps = 1.0;          // 체결가 불리 방향 슬리피지
    double synthetic_start_price = 100.0;
    double synthetic_step_pct = 0.004;  // 합성 시세 1 스텝 최대 변동률
    unsigned int seed = 42;
};

// 모의 브로커 - 주문은 즉시 체결, 시세는 위임 브로커 또는 합성 랜덤워크
class PaperBroker : public core::IBroker {
public:
    explicit PaperBroker(PaperConfig config = PaperConfig(),
                         std::shared_ptr<core::IBroker> market_data = nullptr);

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

    // 체결 기준가 지정 (테스트/외부 시세 주입)
    void setPrice(const std::string& symbol, double price);

private:
    struct PaperOrder {
        OrderStatusReport report;
        std::string symbol;
        std::string client_order_id;
        OrderSide side = OrderSide::BUY;
        double quantity = 0.0;
    };

    struct Holding {
        double quantity = 0.0;   // signed
        double avg_price = 0.0;
    };

    PaperConfig config_;
    std::shared_ptr<core::IBroker> market_data_;

    std::map<std::string, double> last_prices_;
    std::map<std::string, PaperOrder> orders_;
    std::map<std::string, std::string> client_ids_;   // client_order_id -> order_id
    std::map<std::string, Holding> holdings_;
    double cash_;
    long long next_order_id_;
    std::mt19937 rng_;
    mutable std::mutex mutex_;

    double lastPriceLocked(const std::string& symbol);
    double nextSyntheticPriceLocked(const std::string& symbol);
    void applyFillLocked(const std::string& symbol, OrderSide side, double quantity, double price);
    static long long timeframeMillis(const std::string& timeframe);
};

} // namespace broker
} // namespace scalpengine
