#pragma once

#include <string>
#include <utility>

namespace scalpengine {

// 브로커 호출 실패 분류
enum class ErrorKind {
    None,
    InsufficientData,
    RateLimited,
    InsufficientFunds,
    InvalidRequest,
    ConnectionError,
    OrderTimeout,
    Unknown
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InsufficientData: return "InsufficientData";
        case ErrorKind::RateLimited: return "RateLimited";
        case ErrorKind::InsufficientFunds: return "InsufficientFunds";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::ConnectionError: return "ConnectionError";
        case ErrorKind::OrderTimeout: return "OrderTimeout";
        case ErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

inline bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::RateLimited || kind == ErrorKind::ConnectionError;
}

template <typename T>
struct BrokerResult {
    bool success = false;
    T value{};
    ErrorKind kind = ErrorKind::None;
    std::string message;
    int retry_after_seconds = 0;  // RateLimited 일 때 서버가 알려준 대기 시간

    static BrokerResult ok(T v) {
        BrokerResult r;
        r.success = true;
        r.value = std::move(v);
        return r;
    }

    static BrokerResult fail(ErrorKind k, std::string msg, int retry_after = 0) {
        BrokerResult r;
        r.success = false;
        r.kind = k;
        r.message = std::move(msg);
        r.retry_after_seconds = retry_after;
        return r;
    }

    template <typename U>
    static BrokerResult failFrom(const BrokerResult<U>& other) {
        return fail(other.kind, other.message, other.retry_after_seconds);
    }
};

} // namespace scalpengine
