#include "analytics/VolatilityScanner.h"
#include "market/SeriesStore.h"

#include <cmath>
#include <iostream>
#include <memory>

using namespace scalpengine;

namespace {
bool nearly(double a, double b) { return std::abs(a - b) < 1e-9; }

analytics::SymbolMetrics metrics(double volatility, double momentum, bool surge) {
    analytics::SymbolMetrics m;
    m.symbol = "TEST";
    m.price = 100.0;
    m.volatility = volatility;
    m.momentum = momentum;
    m.volume_surge = surge;
    m.samples = 30;
    return m;
}
}

int main() {
    auto store = std::make_shared<market::SeriesStore>(1000);
    analytics::ScannerConfig config;
    analytics::VolatilityScanner scanner(store, config, {"TREND", "FLAT", "SHORT"});
    const auto now = std::chrono::system_clock::now();

    // 고변동성 + 강한 모멘텀 -> 매수, 고변동 목표/손절
    auto high_buy = scanner.evaluate(metrics(0.06, 0.8, false), now);
    if (!high_buy || high_buy->action != SignalAction::BUY || !nearly(high_buy->confidence, 0.6)) {
        std::cerr << "[TEST] high-volatility momentum should buy with confidence 0.6\n";
        return 1;
    }
    if (!nearly(high_buy->target_profit, 0.008) || !nearly(high_buy->stop_loss, 0.005)) {
        std::cerr << "[TEST] high-volatility tier should use 0.8% / 0.5%\n";
        return 1;
    }

    // 거래량 급증 보너스는 상한 0.9
    auto capped = scanner.evaluate(metrics(0.08, 0.1, true), now);
    if (!capped || capped->action != SignalAction::SELL || !nearly(capped->confidence, 0.9)) {
        std::cerr << "[TEST] confidence should be capped at 0.9\n";
        return 1;
    }

    // 중간 변동성은 거래량 급증이 있어야 함
    auto medium = scanner.evaluate(metrics(0.03, 0.85, true), now);
    if (!medium || medium->action != SignalAction::BUY || !nearly(medium->confidence, 0.7) ||
        !nearly(medium->target_profit, 0.005)) {
        std::cerr << "[TEST] medium tier should buy at confidence 0.7\n";
        return 1;
    }
    if (scanner.evaluate(metrics(0.03, 0.85, false), now)) {
        std::cerr << "[TEST] medium tier without volume surge should not signal\n";
        return 1;
    }

    // 상위 구간 방향 없음 + 급증 -> 급증 모멘텀 구간
    auto surge = scanner.evaluate(metrics(0.03, 0.35, true), now);
    if (!surge || surge->action != SignalAction::SELL || !nearly(surge->confidence, 0.6) ||
        !nearly(surge->stop_loss, 0.002)) {
        std::cerr << "[TEST] surge tier should sell at confidence 0.6\n";
        return 1;
    }

    // 중립 모멘텀은 신호 없음
    if (scanner.evaluate(metrics(0.06, 0.5, true), now)) {
        std::cerr << "[TEST] neutral momentum should not signal\n";
        return 1;
    }

    // scan(): 상승 추세 종목만 신호, 평탄/샘플 부족 종목은 제외
    double price = 100.0;
    for (int i = 0; i < 40; ++i) {
        price *= (i % 2 == 0) ? 1.02 : 1.005;
        store->record("TREND", price, 1000.0);
        store->record("FLAT", 50.0, 1000.0);
    }
    for (int i = 0; i < 10; ++i) {
        store->record("SHORT", 10.0 + i, 1000.0);
    }

    if (scanner.analyze("SHORT").has_value()) {
        std::cerr << "[TEST] symbol below min_samples should not be analyzed\n";
        return 1;
    }
    auto trend_metrics = scanner.analyze("TREND");
    if (!trend_metrics || trend_metrics->volatility <= config.high_volatility_threshold ||
        !nearly(trend_metrics->momentum, 1.0)) {
        std::cerr << "[TEST] trending series should be high volatility with full momentum\n";
        return 1;
    }

    const auto signals = scanner.scan();
    if (signals.size() != 1 || signals.front().symbol != "TREND" ||
        signals.front().action != SignalAction::BUY) {
        std::cerr << "[TEST] scan should emit exactly one BUY for TREND, got " << signals.size() << "\n";
        return 1;
    }
    if (!nearly(signals.front().price, price)) {
        std::cerr << "[TEST] signal price should be the latest sample\n";
        return 1;
    }

    // 0 이하 가격은 해당 종목만 건너뜀
    auto bad_store = std::make_shared<market::SeriesStore>(1000);
    for (int i = 0; i < 30; ++i) {
        bad_store->record("BAD", (i == 25) ? 0.0 : 10.0 + i, 1.0);
    }
    analytics::VolatilityScanner bad_scanner(bad_store, config, {"BAD"});
    if (!bad_scanner.scan().empty()) {
        std::cerr << "[TEST] symbol with invalid prices should be skipped\n";
        return 1;
    }

    std::cout << "[TEST] VolatilityScanner PASSED\n";
    return 0;
}
