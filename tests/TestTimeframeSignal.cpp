#include "analytics/TimeframeSignalCalculator.h"

#include <cmath>
#include <iostream>
#include <vector>

using namespace scalpengine;

namespace {
// 등락을 섞은 하락 뒤 가속 하락, 마지막 바 반등
std::vector<double> capitulationThenBounce() {
    const double pattern[] = {-1.0, 0.4, -0.8, 0.2, -1.2, 0.5};
    std::vector<double> closes{100.0};
    for (int i = 0; i < 36; ++i) {
        closes.push_back(closes.back() + pattern[i % 6]);
    }
    for (int j = 0; j < 5; ++j) {
        closes.push_back(closes.back() - 1.5 * (j + 1));
    }
    closes.push_back(closes.back() + 1.0);
    return closes;
}
}

int main() {
    analytics::TimeframeSignalCalculator calculator;

    if (calculator.requiredHistory() != 28) {
        std::cerr << "[TEST] requiredHistory should be 28, got " << calculator.requiredHistory() << "\n";
        return 1;
    }

    // 데이터 부족
    std::vector<double> short_series(20, 100.0);
    auto none = calculator.calculate("5Min", short_series);
    if (none.signal != 0 || none.strength != 0.0 || none.timeframe != "5Min") {
        std::cerr << "[TEST] insufficient history should give a neutral signal\n";
        return 1;
    }

    // 가격 변화가 없으면 RSI 50, 오실레이터 중립
    std::vector<double> flat(60, 42.0);
    auto neutral = calculator.calculate("15Min", flat);
    if (neutral.signal != 0 || std::abs(neutral.oscillator_k - 50.0) > 1e-9) {
        std::cerr << "[TEST] flat series should be neutral, k=" << neutral.oscillator_k << "\n";
        return 1;
    }

    // 과매도 구간 상향 교차 -> 매수
    const auto closes = capitulationThenBounce();
    auto buy = calculator.calculate("5Min", closes);
    if (buy.signal != 1) {
        std::cerr << "[TEST] oversold cross-up should be buy, got " << buy.signal
                  << " (k=" << buy.oscillator_k << ", d=" << buy.oscillator_d << ")\n";
        return 1;
    }
    if (buy.oscillator_k >= 20.0 || buy.oscillator_k <= buy.oscillator_d) {
        std::cerr << "[TEST] buy requires k < oversold and k > d\n";
        return 1;
    }
    const double expected_strength = (20.0 - buy.oscillator_k) / 20.0;
    if (std::abs(buy.strength - expected_strength) > 1e-9 || buy.strength <= 0.5) {
        std::cerr << "[TEST] buy strength should be (oversold - k) / oversold, got " << buy.strength << "\n";
        return 1;
    }

    // 거울상 -> 과매수 구간 하향 교차 -> 매도
    std::vector<double> mirrored;
    for (double c : closes) {
        mirrored.push_back(200.0 - c);
    }
    auto sell = calculator.calculate("1Hour", mirrored);
    if (sell.signal != -1 || sell.oscillator_k <= 80.0) {
        std::cerr << "[TEST] overbought cross-down should be sell, got " << sell.signal << "\n";
        return 1;
    }
    if (std::abs(sell.strength - buy.strength) > 1e-6) {
        std::cerr << "[TEST] mirrored series should give the same strength\n";
        return 1;
    }

    // 바 입력은 마지막 바 시각을 사용
    std::vector<Bar> bars;
    for (std::size_t i = 0; i < closes.size(); ++i) {
        Bar bar;
        bar.timestamp = 1700000000000LL + static_cast<long long>(i) * 300000LL;
        bar.close = closes[i];
        bars.push_back(bar);
    }
    auto from_bars = calculator.calculate("5Min", bars);
    if (from_bars.signal != 1 || toEpochMs(from_bars.timestamp) != bars.back().timestamp) {
        std::cerr << "[TEST] bar input should match close input and carry the bar time\n";
        return 1;
    }

    std::cout << "[TEST] TimeframeSignal PASSED\n";
    return 0;
}
