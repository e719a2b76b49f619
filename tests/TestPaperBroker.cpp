#include "broker/PaperBroker.h"

#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "FakeBroker.h"

using namespace scalpengine;

namespace {
bool nearly(double a, double b) { return std::abs(a - b) < 1e-6; }
}

int main() {
    broker::PaperConfig config;
    config.initial_cash = 10000.0;
    config.slippage_bps = 10.0;

    // 즉시 체결 + 슬리피지, 현금/포지션 반영
    {
        broker::PaperBroker paper(config);
        paper.setPrice("AAPL", 100.0);

        auto order = paper.submitOrder("AAPL", OrderSide::BUY, 10.0, OrderType::MARKET, "cid-aapl-1");
        if (!order.success) {
            std::cerr << "[TEST] paper buy should succeed: " << order.message << "\n";
            return 1;
        }
        auto by_client = paper.findOrderByClientId("cid-aapl-1");
        if (!by_client.success || by_client.value.order_id != order.value.order_id ||
            paper.findOrderByClientId("cid-none").kind != ErrorKind::InvalidRequest) {
            std::cerr << "[TEST] paper order should be found by client order id\n";
            return 1;
        }
        auto status = paper.getOrderStatus(order.value.order_id);
        if (!status.success || status.value.status != OrderStatus::FILLED ||
            !nearly(status.value.filled_quantity, 10.0) || !nearly(status.value.filled_avg_price, 100.1)) {
            std::cerr << "[TEST] paper order should fill immediately with adverse slippage\n";
            return 1;
        }

        auto account = paper.getAccount();
        if (!nearly(account.value.cash, 10000.0 - 1001.0) || !nearly(account.value.equity, 8999.0 + 1000.0)) {
            std::cerr << "[TEST] cash should drop by the fill notional\n";
            return 1;
        }
        auto positions = paper.listPositions();
        if (positions.value.size() != 1 || !nearly(positions.value[0].quantity, 10.0) ||
            !nearly(positions.value[0].avg_entry_price, 100.1)) {
            std::cerr << "[TEST] holding should be recorded at the fill price\n";
            return 1;
        }

        // 청산 후 보유 없음
        paper.setPrice("AAPL", 102.0);
        auto exit = paper.submitOrder("AAPL", OrderSide::SELL, 10.0, OrderType::MARKET, "");
        if (!exit.success || !paper.listPositions().value.empty()) {
            std::cerr << "[TEST] closing sell should flatten the holding\n";
            return 1;
        }
        if (!nearly(paper.getAccount().value.cash, 8999.0 + 10.0 * 102.0 * 0.999)) {
            std::cerr << "[TEST] sell proceeds should include slippage\n";
            return 1;
        }

        // 체결 완료 주문 취소는 거부
        auto cancel = paper.cancelOrder(exit.value.order_id);
        if (cancel.success || cancel.kind != ErrorKind::InvalidRequest) {
            std::cerr << "[TEST] cancelling a filled order should be InvalidRequest\n";
            return 1;
        }
        if (paper.getOrderStatus("paper-999").kind != ErrorKind::InvalidRequest) {
            std::cerr << "[TEST] unknown order should be InvalidRequest\n";
            return 1;
        }
    }

    // 매수 여력 초과 / short 진입
    {
        broker::PaperBroker paper(config);
        paper.setPrice("NVDA", 500.0);
        auto rejected = paper.submitOrder("NVDA", OrderSide::BUY, 100.0, OrderType::MARKET, "");
        if (rejected.success || rejected.kind != ErrorKind::InsufficientFunds) {
            std::cerr << "[TEST] order above cash should be InsufficientFunds\n";
            return 1;
        }
        auto short_entry = paper.submitOrder("NVDA", OrderSide::SELL, 4.0, OrderType::MARKET, "");
        auto positions = paper.listPositions();
        if (!short_entry.success || positions.value.size() != 1 || !nearly(positions.value[0].quantity, -4.0)) {
            std::cerr << "[TEST] opening sell should create a negative holding\n";
            return 1;
        }
    }

    // 합성 시세: 요청 개수, 시간순, 양수 가격
    {
        broker::PaperBroker paper(config);
        auto bars = paper.getRecentBars("SPY", "5Min", 30);
        if (!bars.success || bars.value.size() != 30) {
            std::cerr << "[TEST] synthetic bars should honor the limit\n";
            return 1;
        }
        for (size_t i = 1; i < bars.value.size(); ++i) {
            if (bars.value[i].timestamp - bars.value[i - 1].timestamp != 5LL * 60 * 1000 ||
                bars.value[i].close <= 0.0 || bars.value[i].high < bars.value[i].low) {
                std::cerr << "[TEST] synthetic bars should be ascending 5 minute bars\n";
                return 1;
            }
        }
        auto quote = paper.getLatestQuote("SPY");
        if (!quote.success || quote.value.ask <= quote.value.bid) {
            std::cerr << "[TEST] synthetic quote should have a positive spread\n";
            return 1;
        }
        if (paper.getRecentBars("SPY", "1Min", 0).kind != ErrorKind::InvalidRequest) {
            std::cerr << "[TEST] zero limit should be rejected\n";
            return 1;
        }
    }

    // 위임 시세: 시세는 위임 브로커에서, 체결은 로컬
    {
        auto market = std::make_shared<testing::FakeBroker>();
        market->default_fill_price = 0.0;  // 호가 없음
        std::vector<Bar> feed;
        for (int i = 0; i < 5; ++i) {
            feed.emplace_back(50.0 + i, 51.0 + i, 49.0 + i, 50.5 + i, 1000.0, 60000LL * (i + 1));
        }
        market->bars[testing::FakeBroker::barKey("QQQ", "1Min")] = feed;

        broker::PaperBroker paper(config, market);
        if (paper.submitOrder("QQQ", OrderSide::BUY, 1.0, OrderType::MARKET, "").kind != ErrorKind::InsufficientData) {
            std::cerr << "[TEST] delegate mode without a price should be InsufficientData\n";
            return 1;
        }
        auto bars = paper.getRecentBars("QQQ", "1Min", 5);
        if (!bars.success || bars.value.size() != 5) {
            std::cerr << "[TEST] delegate bars should pass through\n";
            return 1;
        }
        auto order = paper.submitOrder("QQQ", OrderSide::BUY, 1.0, OrderType::MARKET, "");
        if (!order.success || market->submit_calls != 0) {
            std::cerr << "[TEST] paper fills must never reach the delegate broker\n";
            return 1;
        }
        auto status = paper.getOrderStatus(order.value.order_id);
        if (!nearly(status.value.filled_avg_price, 54.5 * 1.001)) {
            std::cerr << "[TEST] fill should use the last delegate close\n";
            return 1;
        }
    }

    std::cout << "[TEST] PaperBroker PASSED\n";
    return 0;
}
