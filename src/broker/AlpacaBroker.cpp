#include "broker/AlpacaBroker.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace scalpengine {
namespace broker {
namespace {

// Alpaca 는 숫자를 문자열로 내려주는 필드가 많음
double asDouble(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || node[key].is_null()) {
        return 0.0;
    }
    const auto& value = node[key];
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        try {
            return std::stod(value.get<std::string>());
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

std::string formatQuantity(double quantity) {
    std::ostringstream oss;
    oss << std::setprecision(10) << quantity;
    return oss.str();
}

std::string extractMessage(const network::HttpResponse& response) {
    try {
        auto body = response.json();
        if (body.is_object() && body.contains("message") && body["message"].is_string()) {
            return body["message"].get<std::string>();
        }
    } catch (const nlohmann::json::exception&) {
        // JSON 이 아닌 본문은 그대로 사용
        return response.body.substr(0, 200);
    }
    return response.body.substr(0, 200);
}

} // namespace

AlpacaBroker::AlpacaBroker(std::shared_ptr<network::IHttpClient> http, AlpacaConfig config)
    : http_(std::move(http))
    , config_(std::move(config))
{
    if (!http_) {
        throw std::invalid_argument("AlpacaBroker requires an HTTP client");
    }
}

ErrorKind AlpacaBroker::classifyStatus(int status_code) {
    if (status_code >= 200 && status_code < 300) return ErrorKind::None;
    if (status_code == 429) return ErrorKind::RateLimited;
    if (status_code == 403) return ErrorKind::InsufficientFunds;
    if (status_code == 400 || status_code == 404 || status_code == 422) return ErrorKind::InvalidRequest;
    if (status_code >= 500 || status_code == 0) return ErrorKind::ConnectionError;
    return ErrorKind::Unknown;
}

OrderStatus AlpacaBroker::parseOrderStatus(const std::string& status) {
    if (status == "filled") return OrderStatus::FILLED;
    if (status == "partially_filled") return OrderStatus::PARTIALLY_FILLED;
    if (status == "canceled" || status == "cancelled") return OrderStatus::CANCELLED;
    if (status == "rejected") return OrderStatus::REJECTED;
    if (status == "expired" || status == "done_for_day") return OrderStatus::EXPIRED;
    if (status == "new" || status == "accepted" || status == "pending_new" ||
        status == "accepted_for_bidding" || status == "pending_cancel" ||
        status == "pending_replace" || status == "replaced") {
        return OrderStatus::SUBMITTED;
    }
    return OrderStatus::PENDING;
}

long long AlpacaBroker::parseTimestampMs(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text.substr(0, 19));
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return 0;
    }
    long long millis = 0;
    if (text.size() > 20 && text[19] == '.') {
        std::string frac;
        for (size_t i = 20; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); ++i) {
            frac.push_back(text[i]);
        }
        frac = (frac + "000").substr(0, 3);
        millis = std::stoll(frac);
    }
    return static_cast<long long>(timegm(&tm)) * 1000 + millis;
}

template <typename T>
BrokerResult<T> AlpacaBroker::failFromResponse(const network::HttpResponse& response,
                                               const std::string& context) const {
    const ErrorKind kind = classifyStatus(response.status_code);
    int retry_after = 0;
    if (kind == ErrorKind::RateLimited) {
        const std::string header = response.header("Retry-After");
        if (!header.empty()) {
            try {
                retry_after = std::stoi(header);
            } catch (const std::exception&) {
                retry_after = 0;
            }
        }
    }
    const std::string message = context + ": HTTP " + std::to_string(response.status_code) +
                                " " + extractMessage(response);
    LOG_WARN("[Alpaca] {} ({})", message, toString(kind));
    return BrokerResult<T>::fail(kind, message, retry_after);
}

BrokerResult<OrderHandle> AlpacaBroker::submitOrder(
    const std::string& symbol, OrderSide side, double quantity, OrderType type,
    const std::string& client_order_id) {
    if (symbol.empty() || quantity <= 0.0) {
        return BrokerResult<OrderHandle>::fail(ErrorKind::InvalidRequest, "symbol and positive quantity required");
    }
    
    nlohmann::json body;
    body["symbol"] = symbol;
    body["qty"] = formatQuantity(quantity);
    body["side"] = toString(side);
    body["type"] = (type == OrderType::MARKET) ? "market" : "limit";
    body["time_in_force"] = config_.time_in_force;
    if (!client_order_id.empty()) {
        body["client_order_id"] = client_order_id;
    }
    
    try {
        auto response = http_->post(config_.trading_base_url + "/v2/orders", body);
        if (!response.isSuccess()) {
            return failFromResponse<OrderHandle>(response, "submit " + symbol);
        }
        auto j = response.json();
        OrderHandle handle;
        handle.order_id = j.value("id", "");
        handle.client_order_id = j.value("client_order_id", client_order_id);
        handle.symbol = j.value("symbol", symbol);
        handle.side = side;
        handle.quantity = quantity;
        if (handle.order_id.empty()) {
            return BrokerResult<OrderHandle>::fail(ErrorKind::Unknown, "order response missing id");
        }
        return BrokerResult<OrderHandle>::ok(handle);
    } catch (const nlohmann::json::exception& e) {
        return BrokerResult<OrderHandle>::fail(ErrorKind::Unknown, std::string("order parse error: ") + e.what());
    } catch (const std::exception& e) {
        return BrokerResult<OrderHandle>::fail(ErrorKind::ConnectionError, e.what());
    }
}

BrokerResult<OrderHandle> AlpacaBroker::findOrderByClientId(const std::string& client_order_id) {
    if (client_order_id.empty()) {
        return BrokerResult<OrderHandle>::fail(ErrorKind::InvalidRequest, "client_order_id required");
    }
    try {
        auto response = http_->get(config_.trading_base_url + "/v2/orders:by_client_order_id",
                                   {{"client_order_id", client_order_id}});
        if (!response.isSuccess()) {
            // 404 -> InvalidRequest (브로커에 없음)
            return failFromResponse<OrderHandle>(response, "order lookup " + client_order_id);
        }
        auto j = response.json();
        OrderHandle handle;
        handle.order_id = j.value("id", "");
        handle.client_order_id = j.value("client_order_id", client_order_id);
        handle.symbol = j.value("symbol", "");
        handle.side = j.value("side", "buy") == "sell" ? OrderSide::SELL : OrderSide::BUY;
        handle.quantity = asDouble(j, "qty");
        if (handle.order_id.empty()) {
            return BrokerResult<OrderHandle>::fail(ErrorKind::Unknown, "order lookup response missing id");
        }
        return BrokerResult<OrderHandle>::ok(handle);
    } catch (const nlohmann::json::exception& e) {
        return BrokerResult<OrderHandle>::fail(ErrorKind::Unknown, std::string("order lookup parse error: ") + e.what());
    } catch (const std::exception& e) {
        return BrokerResult<OrderHandle>::fail(ErrorKind::ConnectionError, e.what());
    }
}

BrokerResult<OrderStatusReport> AlpacaBroker::getOrderStatus(const std::string& order_id) {
    try {
        auto response = http_->get(config_.trading_base_url + "/v2/orders/" + order_id);
        if (!response.isSuccess()) {
            return failFromResponse<OrderStatusReport>(response, "order status " + order_id);
        }
        auto j = response.json();
        OrderStatusReport report;
        report.order_id = j.value("id", order_id);
        report.status = parseOrderStatus(j.value("status", ""));
        report.filled_quantity = asDouble(j, "filled_qty");
        report.filled_avg_price = asDouble(j, "filled_avg_price");
        return BrokerResult<OrderStatusReport>::ok(report);
    } catch (const nlohmann::json::exception& e) {
        return BrokerResult<OrderStatusReport>::fail(ErrorKind::Unknown, std::string("status parse error: ") + e.what());
    } catch (const std::exception& e) {
        return BrokerResult<OrderStatusReport>::fail(ErrorKind::ConnectionError, e.what());
    }
}

BrokerResult<bool> AlpacaBroker::cancelOrder(const std::string& order_id) {
    try {
        auto response = http_->del(config_.trading_base_url + "/v2/orders/" + order_id);
        if (!response.isSuccess()) {
            return failFromResponse<bool>(response, "cancel " + order_id);
        }
        return BrokerResult<bool>::ok(true);
    } catch (const std::exception& e) {
        return BrokerResult<bool>::fail(ErrorKind::ConnectionError, e.what());
    }
}

BrokerResult<std::vector<Bar>> AlpacaBroker::getRecentBars(
    const std::string& symbol, const std::string& timeframe, int limit) {
    if (symbol.empty() || limit <= 0) {
        return BrokerResult<std::vector<Bar>>::fail(ErrorKind::InvalidRequest, "symbol and positive limit required");
    }
    
    std::map<std::string, std::string> params;
    params["timeframe"] = timeframe;
    params["limit"] = std::to_string(limit);
    params["feed"] = config_.data_feed;
    params["sort"] = "desc";
    
    try {
        auto response = http_->get(config_.data_base_url + "/v2/stocks/" + symbol + "/bars", params);
        if (!response.isSuccess()) {
            return failFromResponse<std::vector<Bar>>(response, "bars " + symbol);
        }
        auto j = response.json();
        std::vector<Bar> bars;
        if (j.contains("bars") && j["bars"].is_array()) {
            for (const auto& item : j["bars"]) {
                if (!item.contains("c") || !item.contains("t")) {
                    continue;
                }
                bars.emplace_back(asDouble(item, "o"), asDouble(item, "h"), asDouble(item, "l"),
                                  asDouble(item, "c"), asDouble(item, "v"),
                                  parseTimestampMs(item["t"].get<std::string>()));
            }
        }
        // sort=desc 로 최신 N 개를 받은 뒤 시간순으로 정렬
        std::sort(bars.begin(), bars.end(),
                  [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });
        if (bars.empty()) {
            return BrokerResult<std::vector<Bar>>::fail(ErrorKind::InsufficientData, "no bars for " + symbol);
        }
        return BrokerResult<std::vector<Bar>>::ok(std::move(bars));
    } catch (const nlohmann::json::exception& e) {
        return BrokerResult<std::vector<Bar>>::fail(ErrorKind::Unknown, std::string("bars parse error: ") + e.what());
    } catch (const std::exception& e) {
        return BrokerResult<std::vector<Bar>>::fail(ErrorKind::ConnectionError, e.what());
    }
}

BrokerResult<Quote> AlpacaBroker::getLatestQuote(const std::string& symbol) {
    try {
        auto response = http_->get(config_.data_base_url + "/v2/stocks/" + symbol + "/quotes/latest",
                                   {{"feed", config_.data_feed}});
        if (!response.isSuccess()) {
            return failFromResponse<Quote>(response, "quote " + symbol);
        }
        auto j = response.json();
        if (!j.contains("quote") || !j["quote"].is_object()) {
            return BrokerResult<Quote>::fail(ErrorKind::InsufficientData, "no quote for " + symbol);
        }
        const auto& q = j["quote"];
        Quote quote;
        quote.symbol = symbol;
        quote.ask = asDouble(q, "ap");
        quote.bid = asDouble(q, "bp");
        const long long ts = q.contains("t") && q["t"].is_string()
            ? parseTimestampMs(q["t"].get<std::string>()) : 0;
        quote.timestamp = ts > 0 ? Timestamp(std::chrono::milliseconds(ts)) : std::chrono::system_clock::now();
        return BrokerResult<Quote>::ok(quote);
    } catch (const nlohmann::json::exception& e) {
        return BrokerResult<Quote>::fail(ErrorKind::Unknown, std::string("quote parse error: ") + e.what());
    } catch (const std::exception& e) {
        return BrokerResult<Quote>::fail(ErrorKind::ConnectionError, e.what());
    }
}

BrokerResult<AccountInfo> AlpacaBroker::getAccount() {
    try {
        auto response = http_->get(config_.trading_base_url + "/v2/account");
        if (!response.isSuccess()) {
            return failFromResponse<AccountInfo>(response, "account");
        }
        auto j = response.json();
        AccountInfo info;
        info.cash = asDouble(j, "cash");
        info.buying_power = asDouble(j, "buying_power");
        info.equity = asDouble(j, "equity");
        return BrokerResult<AccountInfo>::ok(info);
    } catch (const nlohmann::json::exception& e) {
        return BrokerResult<AccountInfo>::fail(ErrorKind::Unknown, std::string("account parse error: ") + e.what());
    } catch (const std::exception& e) {
        return BrokerResult<AccountInfo>::fail(ErrorKind::ConnectionError, e.what());
    }
}

BrokerResult<std::vector<BrokerPosition>> AlpacaBroker::listPositions() {
    try {
        auto response = http_->get(config_.trading_base_url + "/v2/positions");
        if (!response.isSuccess()) {
            return failFromResponse<std::vector<BrokerPosition>>(response, "positions");
        }
        auto j = response.json();
        std::vector<BrokerPosition> positions;
        if (j.is_array()) {
            for (const auto& item : j) {
                BrokerPosition pos;
                pos.symbol = item.value("symbol", "");
                const double qty = std::abs(asDouble(item, "qty"));
                pos.quantity = item.value("side", "long") == "short" ? -qty : qty;
                pos.avg_entry_price = asDouble(item, "avg_entry_price");
                if (!pos.symbol.empty()) {
                    positions.push_back(pos);
                }
            }
        }
        return BrokerResult<std::vector<BrokerPosition>>::ok(std::move(positions));
    } catch (const nlohmann::json::exception& e) {
        return BrokerResult<std::vector<BrokerPosition>>::fail(ErrorKind::Unknown, std::string("positions parse error: ") + e.what());
    } catch (const std::exception& e) {
        return BrokerResult<std::vector<BrokerPosition>>::fail(ErrorKind::ConnectionError, e.what());
    }
}

} // namespace broker
} // namespace scalpengine
