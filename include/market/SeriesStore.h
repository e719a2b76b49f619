#pragma once

#include "common/Types.h"
#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace scalpengine {
namespace market {

// 종목별 (가격, 거래량) 롤링 버퍼 - 용량 초과 시 가장 오래된 샘플부터 제거
class SeriesStore {
public:
    explicit SeriesStore(std::size_t capacity_per_symbol = 1000);

    void record(const std::string& symbol, double price, double volume);
    void record(const std::string& symbol, double price, double volume, Timestamp ts);

    // 브로커 바로 초기 적재 - 마지막 저장 시각 이후의 바만 추가, 추가된 개수 반환
    std::size_t recordBars(const std::string& symbol, const std::vector<Bar>& bars);

    // 마지막 n개 (시간순). 데이터가 모자라면 있는 만큼
    std::vector<Sample> window(const std::string& symbol, std::size_t n) const;

    std::optional<Sample> latest(const std::string& symbol) const;
    std::size_t size(const std::string& symbol) const;
    std::vector<std::string> symbols() const;
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::deque<Sample>> buffers_;

    void appendLocked(std::deque<Sample>& buffer, Sample sample);
};

} // namespace market
} // namespace scalpengine
