#include "broker/PaperBroker.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace scalpengine {
namespace broker {

PaperBroker::PaperBroker(PaperConfig config, std::shared_ptr<core::IBroker> market_data)
    : config_(config)
    , market_data_(std::move(market_data))
    , cash_(config.initial_cash)
    , next_order_id_(1)
    , rng_(config.seed)
{
    LOG_INFO("PaperBroker 초기화 - 현금 {:.2f}, 시세 소스: {}",
             cash_, market_data_ ? "delegate" : "synthetic");
}

void PaperBroker::setPrice(const std::string& symbol, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (price > 0.0) {
        last_prices_[symbol] = price;
    }
}

BrokerResult<OrderHandle> PaperBroker::submitOrder(
    const std::string& symbol, OrderSide side, double quantity, OrderType type,
    const std::string& client_order_id) {
    (void)type;
    if (symbol.empty() || quantity <= 0.0) {
        return BrokerResult<OrderHandle>::fail(ErrorKind::InvalidRequest, "symbol and positive quantity required");
    }

    // 위임 시세가 있으면 최신 호가로 기준가 갱신
    if (market_data_) {
        auto quote = market_data_->getLatestQuote(symbol);
        if (quote.success && quote.value.mid() > 0.0) {
            setPrice(symbol, quote.value.mid());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const double base = lastPriceLocked(symbol);
    if (base <= 0.0) {
        return BrokerResult<OrderHandle>::fail(ErrorKind::InsufficientData, "no price for " + symbol);
    }
    const double slip = config_.slippage_bps / 10000.0;
    const double fill_price = side == OrderSide::BUY ? base * (1.0 + slip) : base * (1.0 - slip);

    const auto holding_it = holdings_.find(symbol);
    const double held = holding_it != holdings_.end() ? holding_it->second.quantity : 0.0;
    const bool opening = (side == OrderSide::BUY && held >= 0.0) || (side == OrderSide::SELL && held <= 0.0);
    if (opening && fill_price * quantity > cash_) {
        return BrokerResult<OrderHandle>::fail(ErrorKind::InsufficientFunds, "insufficient buying power");
    }

    PaperOrder order;
    order.report.order_id = "paper-" + std::to_string(next_order_id_++);
    order.report.status = OrderStatus::FILLED;
    order.report.filled_quantity = quantity;
    order.report.filled_avg_price = fill_price;
    order.symbol = symbol;
    order.side = side;
    order.quantity = quantity;
    order.client_order_id = client_order_id;
    orders_[order.report.order_id] = order;
    if (!client_order_id.empty()) {
        client_ids_[client_order_id] = order.report.order_id;
    }

    applyFillLocked(symbol, side, quantity, fill_price);

    OrderHandle handle;
    handle.order_id = order.report.order_id;
    handle.client_order_id = client_order_id;
    handle.symbol = symbol;
    handle.side = side;
    handle.quantity = quantity;

    LOG_DEBUG("[Paper] {} {} {:.4f} @ {:.4f}", symbol, toString(side), quantity, fill_price);
    return BrokerResult<OrderHandle>::ok(handle);
}

BrokerResult<OrderStatusReport> PaperBroker::getOrderStatus(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return BrokerResult<OrderStatusReport>::fail(ErrorKind::InvalidRequest, "unknown order " + order_id);
    }
    return BrokerResult<OrderStatusReport>::ok(it->second.report);
}

BrokerResult<OrderHandle> PaperBroker::findOrderByClientId(const std::string& client_order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = client_ids_.find(client_order_id);
    if (id == client_ids_.end()) {
        return BrokerResult<OrderHandle>::fail(ErrorKind::InvalidRequest, "unknown client order " + client_order_id);
    }
    const auto& order = orders_.at(id->second);
    OrderHandle handle;
    handle.order_id = order.report.order_id;
    handle.client_order_id = client_order_id;
    handle.symbol = order.symbol;
    handle.side = order.side;
    handle.quantity = order.quantity;
    return BrokerResult<OrderHandle>::ok(handle);
}

BrokerResult<bool> PaperBroker::cancelOrder(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return BrokerResult<bool>::fail(ErrorKind::InvalidRequest, "unknown order " + order_id);
    }
    if (isTerminalStatus(it->second.report.status)) {
        return BrokerResult<bool>::fail(ErrorKind::InvalidRequest, "order already " +
                                        std::string(toString(it->second.report.status)));
    }
    it->second.report.status = OrderStatus::CANCELLED;
    return BrokerResult<bool>::ok(true);
}

BrokerResult<std::vector<Bar>> PaperBroker::getRecentBars(
    const std::string& symbol, const std::string& timeframe, int limit) {
    if (market_data_) {
        auto bars = market_data_->getRecentBars(symbol, timeframe, limit);
        if (bars.success && !bars.value.empty()) {
            setPrice(symbol, bars.value.back().close);
        }
        return bars;
    }
    if (limit <= 0) {
        return BrokerResult<std::vector<Bar>>::fail(ErrorKind::InvalidRequest, "positive limit required");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // 합성 랜덤워크: 호출마다 최신 구간을 새로 생성
    const long long step_ms = timeframeMillis(timeframe);
    const long long now_ms = toEpochMs(std::chrono::system_clock::now());
    const long long last_ts = now_ms - (now_ms % step_ms);

    std::vector<Bar> bars;
    bars.reserve(static_cast<size_t>(limit));
    double price = lastPriceLocked(symbol);
    std::uniform_real_distribution<double> volume_dist(5000.0, 15000.0);
    for (int i = limit - 1; i >= 0; --i) {
        const double open = price;
        const double close = nextSyntheticPriceLocked(symbol);
        const double high = std::max(open, close);
        const double low = std::min(open, close);
        bars.emplace_back(open, high, low, close, volume_dist(rng_), last_ts - i * step_ms);
        price = close;
    }
    return BrokerResult<std::vector<Bar>>::ok(std::move(bars));
}

BrokerResult<Quote> PaperBroker::getLatestQuote(const std::string& symbol) {
    if (market_data_) {
        auto quote = market_data_->getLatestQuote(symbol);
        if (quote.success && quote.value.mid() > 0.0) {
            setPrice(symbol, quote.value.mid());
        }
        return quote;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const double price = nextSyntheticPriceLocked(symbol);
    const double half_spread = price * config_.slippage_bps / 20000.0;

    Quote quote;
    quote.symbol = symbol;
    quote.bid = price - half_spread;
    quote.ask = price + half_spread;
    quote.timestamp = std::chrono::system_clock::now();
    return BrokerResult<Quote>::ok(quote);
}

BrokerResult<AccountInfo> PaperBroker::getAccount() {
    std::lock_guard<std::mutex> lock(mutex_);
    AccountInfo info;
    info.cash = cash_;
    info.buying_power = cash_;
    double equity = cash_;
    for (const auto& [symbol, holding] : holdings_) {
        equity += holding.quantity * lastPriceLocked(symbol);
    }
    info.equity = equity;
    return BrokerResult<AccountInfo>::ok(info);
}

BrokerResult<std::vector<BrokerPosition>> PaperBroker::listPositions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BrokerPosition> positions;
    for (const auto& [symbol, holding] : holdings_) {
        BrokerPosition pos;
        pos.symbol = symbol;
        pos.quantity = holding.quantity;
        pos.avg_entry_price = holding.avg_price;
        positions.push_back(pos);
    }
    return BrokerResult<std::vector<BrokerPosition>>::ok(std::move(positions));
}

double PaperBroker::lastPriceLocked(const std::string& symbol) {
    auto it = last_prices_.find(symbol);
    if (it != last_prices_.end()) {
        return it->second;
    }
    if (market_data_) {
        return 0.0;
    }
    last_prices_[symbol] = config_.synthetic_start_price;
    return config_.synthetic_start_price;
}

double PaperBroker::nextSyntheticPriceLocked(const std::string& symbol) {
    std::uniform_real_distribution<double> step(-config_.synthetic_step_pct, config_.synthetic_step_pct);
    const double next = std::max(0.01, lastPriceLocked(symbol) * (1.0 + step(rng_)));
    last_prices_[symbol] = next;
    return next;
}

void PaperBroker::applyFillLocked(const std::string& symbol, OrderSide side, double quantity, double price) {
    const double signed_qty = side == OrderSide::BUY ? quantity : -quantity;
    Holding& holding = holdings_[symbol];

    cash_ -= signed_qty * price;

    const double new_qty = holding.quantity + signed_qty;
    const bool same_direction = holding.quantity == 0.0 || (holding.quantity > 0.0) == (signed_qty > 0.0);
    if (same_direction) {
        const double total_cost = std::abs(holding.quantity) * holding.avg_price + quantity * price;
        holding.avg_price = std::abs(new_qty) > 0.0 ? total_cost / std::abs(new_qty) : 0.0;
    } else if ((new_qty > 0.0) != (holding.quantity > 0.0) && std::abs(new_qty) > 1e-12) {
        // 방향 전환: 남은 수량은 이번 체결가로 새로 시작
        holding.avg_price = price;
    }
    holding.quantity = new_qty;

    if (std::abs(holding.quantity) < 1e-12) {
        holdings_.erase(symbol);
    }
}

long long PaperBroker::timeframeMillis(const std::string& timeframe) {
    if (timeframe == "1Min") return 60LL * 1000;
    if (timeframe == "5Min") return 5LL * 60 * 1000;
    if (timeframe == "15Min") return 15LL * 60 * 1000;
    if (timeframe == "1Hour") return 60LL * 60 * 1000;
    if (timeframe == "1Day") return 24LL * 60 * 60 * 1000;
    return 60LL * 1000;
}

} // namespace broker
} // namespace scalpengine
