#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace scalpengine {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, LIMIT };
enum class OrderStatus { PENDING, SUBMITTED, PARTIALLY_FILLED, FILLED, CANCELLED, REJECTED, EXPIRED };

// 스캐너가 내는 방향 (HOLD 객체는 실제로 반환하지 않음)
enum class SignalAction { BUY, SELL, HOLD };

struct Sample {
    std::string symbol;
    Price price = 0.0;
    Volume volume = 0.0;
    Timestamp timestamp{};
};

struct Bar {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;  // epoch ms

    Bar() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Bar(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// 스캐너 후보 신호 - 생성 후 변경하지 않음
struct Signal {
    std::string symbol;
    SignalAction action = SignalAction::HOLD;
    double confidence = 0.0;
    Price price = 0.0;
    double volatility = 0.0;
    double momentum = 0.5;
    bool volume_surge = false;
    double target_profit = 0.0;   // 비율 (0.005 = 0.5%)
    double stop_loss = 0.0;       // 비율
    Timestamp timestamp{};
};

struct TimeframeSignal {
    std::string timeframe;
    int signal = 0;           // -1, 0, 1
    double strength = 0.0;    // 0..1
    double oscillator_k = 50.0;
    double oscillator_d = 50.0;
    Timestamp timestamp{};
};

struct Quote {
    std::string symbol;
    Price bid = 0.0;
    Price ask = 0.0;
    Timestamp timestamp{};

    Price mid() const { return (bid > 0.0 && ask > 0.0) ? (bid + ask) / 2.0 : (bid > 0.0 ? bid : ask); }
};

struct AccountInfo {
    Amount cash = 0.0;
    Amount buying_power = 0.0;
    Amount equity = 0.0;
};

// 브로커가 보고하는 보유 포지션 (signed quantity: short < 0)
struct BrokerPosition {
    std::string symbol;
    double quantity = 0.0;
    Price avg_entry_price = 0.0;
};

struct OrderHandle {
    std::string order_id;
    std::string client_order_id;    // 제출 측에서 정한 멱등 키
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
};

struct OrderStatusReport {
    std::string order_id;
    OrderStatus status = OrderStatus::PENDING;
    double filled_quantity = 0.0;
    Price filled_avg_price = 0.0;
};

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "buy" : "sell";
}

inline const char* toString(SignalAction action) {
    switch (action) {
        case SignalAction::BUY: return "buy";
        case SignalAction::SELL: return "sell";
        case SignalAction::HOLD: return "hold";
    }
    return "hold";
}

inline const char* toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "pending";
        case OrderStatus::SUBMITTED: return "submitted";
        case OrderStatus::PARTIALLY_FILLED: return "partially_filled";
        case OrderStatus::FILLED: return "filled";
        case OrderStatus::CANCELLED: return "cancelled";
        case OrderStatus::REJECTED: return "rejected";
        case OrderStatus::EXPIRED: return "expired";
    }
    return "pending";
}

inline bool isTerminalStatus(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED ||
           status == OrderStatus::EXPIRED;
}

inline long long toEpochMs(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

} // namespace scalpengine
