#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace scalpengine {
namespace execution {

struct RateLimitConfig {
    int max_calls = 195;                                  // 윈도우당 최대 호출 수
    std::chrono::milliseconds window{std::chrono::seconds(60)};
};

// Rate Limiter - 슬라이딩 윈도우 (Thread-Safe, 호출을 버리지 않음)
class RateLimiter {
public:
    explicit RateLimiter(RateLimitConfig config = RateLimitConfig());
    
    // 슬롯이 있으면 즉시 획득 (Non-blocking)
    bool tryAcquire();
    
    // 가장 오래된 호출이 윈도우를 벗어날 때까지 대기 후 획득 (Blocking)
    // stop() 이후에는 false
    bool acquire();
    
    // 현재 윈도우에서 남은 호출 수
    int remaining();
    
    // 서버가 429 를 돌려줬을 때 전체 호출 일시정지
    void handleRateLimitError(int retry_after_seconds);
    
    // 대기 중인 스레드를 모두 깨우고 이후 acquire 를 거부
    void stop();
    bool isStopped() const;
    
    struct Stats {
        int total_requests;
        int rejected_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;
    
    const RateLimitConfig& config() const { return config_; }
    
private:
    using Clock = std::chrono::steady_clock;
    
    RateLimitConfig config_;
    std::deque<Clock::time_point> calls_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    
    bool stopped_;
    bool is_blocked_;
    Clock::time_point block_end_time_;
    
    // 통계
    int total_requests_;
    int rejected_requests_;
    int forced_waits_;
    std::chrono::milliseconds total_wait_time_;
    
    // 윈도우 밖의 기록 제거 (lock 보유 상태에서 호출)
    void pruneExpired(Clock::time_point now);
};

} // namespace execution
} // namespace scalpengine
