#include "common/Logger.h"
#include "common/Config.h"
#include "broker/AlpacaBroker.h"
#include "broker/PaperBroker.h"
#include "core/state/EventJournalJsonl.h"
#include "engine/TradingEngine.h"
#include "network/AlpacaHttpClient.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace scalpengine;

namespace {

// 시그널 핸들러에서는 플래그만 설정
std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

// 작업 디렉토리 기준 경로가 있으면 우선, 없으면 실행 파일 기준 config/config.json
std::string resolveConfigPath(int argc, char* argv[]) {
    const std::string requested = (argc > 1) ? argv[1] : "config/config.json";
    if (std::filesystem::exists(requested)) {
        return std::filesystem::absolute(requested).string();
    }
    return requested;
}

std::shared_ptr<core::IBroker> createBroker(const engine::EngineConfig& engine_config, const Config& config) {
    std::shared_ptr<core::IBroker> live;
    if (config.hasCredentials()) {
        auto http = std::make_shared<network::AlpacaHttpClient>(
            config.getApiKeyId(), config.getApiSecretKey(), engine_config.http_timeout_seconds);
        live = std::make_shared<broker::AlpacaBroker>(http, engine_config.alpaca);
    }
    
    if (engine_config.mode == engine::TradingMode::LIVE) {
        if (!live) {
            throw std::runtime_error("LIVE mode requires ALPACA_API_KEY_ID and ALPACA_API_SECRET_KEY");
        }
        LOG_INFO("Alpaca 브로커 사용: {}", engine_config.alpaca.trading_base_url);
        return live;
    }
    
    if (engine_config.paper_uses_live_data && !live) {
        LOG_WARN("API 키가 없어 합성 시세로 모의 거래합니다");
    }
    std::shared_ptr<core::IBroker> market_data;
    if (engine_config.paper_uses_live_data) {
        market_data = live;
    }
    LOG_INFO("모의 브로커 사용 (시세: {})", market_data ? "Alpaca" : "synthetic");
    return std::make_shared<broker::PaperBroker>(engine_config.paper, market_data);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto& config = Config::getInstance();
        config.load(resolveConfigPath(argc, argv));
        
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
        
        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "       ScalpEngine v1.0\n";
        std::cout << "       변동성 스캘핑 신호/포지션 엔진\n";
        std::cout << "=============================================\n\n";
        
        auto engine_config = config.getEngineConfig();
        auto broker = createBroker(engine_config, config);
        
        std::shared_ptr<core::IEventJournal> journal;
        if (!engine_config.journal_path.empty()) {
            journal = std::make_shared<core::EventJournalJsonl>(engine_config.journal_path);
        }
        
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        
        engine::TradingEngine trading_engine(engine_config, broker, journal);
        if (!trading_engine.start()) {
            LOG_ERROR("엔진 시작 실패");
            return 1;
        }
        
        // 엔진 스스로 멈추거나 (오류 예산 소진) 종료 신호가 올 때까지 대기
        while (!g_shutdown_requested) {
            if (trading_engine.waitForStop(std::chrono::milliseconds(200))) {
                break;
            }
        }
        if (g_shutdown_requested) {
            LOG_INFO("종료 신호 수신");
        }
        
        trading_engine.stop();
        const int errors = trading_engine.getErrorCount();
        LOG_INFO("정상 종료 (누적 오류 {}회)", errors);
        return errors >= engine_config.max_errors ? 2 : 0;
    } catch (const std::exception& e) {
        std::cerr << "치명적 오류: " << e.what() << std::endl;
        LOG_ERROR("치명적 오류: {}", e.what());
        return 1;
    }
}
