#include "market/SeriesStore.h"

#include <algorithm>
#include <mutex>

namespace scalpengine {
namespace market {

SeriesStore::SeriesStore(std::size_t capacity_per_symbol)
    : capacity_(capacity_per_symbol == 0 ? 1 : capacity_per_symbol) {
}

void SeriesStore::record(const std::string& symbol, double price, double volume) {
    record(symbol, price, volume, std::chrono::system_clock::now());
}

void SeriesStore::record(const std::string& symbol, double price, double volume, Timestamp ts) {
    Sample sample;
    sample.symbol = symbol;
    sample.price = price;
    sample.volume = volume;
    sample.timestamp = ts;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    appendLocked(buffers_[symbol], std::move(sample));
}

std::size_t SeriesStore::recordBars(const std::string& symbol, const std::vector<Bar>& bars) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& buffer = buffers_[symbol];

    long long last_ms = buffer.empty() ? -1 : toEpochMs(buffer.back().timestamp);
    std::size_t added = 0;
    for (const auto& bar : bars) {
        if (bar.timestamp <= last_ms) {
            continue;
        }
        Sample sample;
        sample.symbol = symbol;
        sample.price = bar.close;
        sample.volume = bar.volume;
        sample.timestamp = Timestamp(std::chrono::milliseconds(bar.timestamp));
        appendLocked(buffer, std::move(sample));
        last_ms = bar.timestamp;
        ++added;
    }
    return added;
}

std::vector<Sample> SeriesStore::window(const std::string& symbol, std::size_t n) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Sample> out;
    auto it = buffers_.find(symbol);
    if (it == buffers_.end() || n == 0) {
        return out;
    }
    const auto& buffer = it->second;
    const std::size_t count = std::min(n, buffer.size());
    out.assign(buffer.end() - static_cast<std::ptrdiff_t>(count), buffer.end());
    return out;
}

std::optional<Sample> SeriesStore::latest(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = buffers_.find(symbol);
    if (it == buffers_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::size_t SeriesStore::size(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = buffers_.find(symbol);
    return it == buffers_.end() ? 0 : it->second.size();
}

std::vector<std::string> SeriesStore::symbols() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(buffers_.size());
    for (const auto& [symbol, buffer] : buffers_) {
        out.push_back(symbol);
    }
    return out;
}

void SeriesStore::appendLocked(std::deque<Sample>& buffer, Sample sample) {
    buffer.push_back(std::move(sample));
    while (buffer.size() > capacity_) {
        buffer.pop_front();
    }
}

} // namespace market
} // namespace scalpengine
