#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace scalpengine {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string upperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(s);
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

template <typename T>
void readInto(const nlohmann::json& j, const char* key, T& target) {
    target = j.value(key, target);
}

void readMap(const nlohmann::json& j, const char* key, std::map<std::string, double>& target) {
    if (!j.contains(key) || !j[key].is_object()) {
        return;
    }
    for (auto& [name, value] : j[key].items()) {
        if (value.is_number()) {
            target[name] = value.get<double>();
        }
    }
}

void readStrings(const nlohmann::json& j, const char* key, std::vector<std::string>& target) {
    if (!j.contains(key) || !j[key].is_array()) {
        return;
    }
    std::vector<std::string> out;
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            const std::string value = trimCopy(item.get<std::string>());
            if (!value.empty()) {
                out.push_back(value);
            }
        }
    }
    target = out;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    api_key_id_.clear();
    api_secret_key_.clear();
    engine_config_ = engine::EngineConfig();
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "설정 파일 경로: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
        std::cout << "기본값을 사용합니다." << std::endl;
        readCredentials(nlohmann::json::object());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("설정 파일을 열 수 없습니다: " + config_path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromString(buffer.str());
}

void Config::loadFromString(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("설정 파싱 오류: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("설정 파싱 오류: 최상위 값이 객체가 아닙니다");
    }

    try {
        engine_config_ = engine::EngineConfig();
        readCredentials(j);
        apply(j);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(std::string("설정 값 타입 오류: ") + e.what());
    }
}

void Config::readCredentials(const nlohmann::json& j) {
    if (j.contains("api") && j["api"].is_object()) {
        const std::string file_key = trimCopy(j["api"].value("key_id", ""));
        const std::string file_secret = trimCopy(j["api"].value("secret_key", ""));
        if (!file_key.empty() || !file_secret.empty()) {
            std::cout << "경고: config api 키 값은 무시됩니다. 환경 변수(ALPACA_API_KEY_ID/ALPACA_API_SECRET_KEY)를 사용하세요."
                      << std::endl;
        }
    }

    api_key_id_ = readEnvVar("ALPACA_API_KEY_ID");
    api_secret_key_ = readEnvVar("ALPACA_API_SECRET_KEY");
}

void Config::apply(const nlohmann::json& j) {
    auto& e = engine_config_;

    if (j.contains("trading")) {
        const auto& t = j["trading"];
        const std::string mode = upperCopy(t.value("mode", std::string("PAPER")));
        e.mode = (mode == "LIVE") ? engine::TradingMode::LIVE : engine::TradingMode::PAPER;
        readInto(t, "paper_uses_live_data", e.paper_uses_live_data);
        readStrings(t, "universe", e.universe);
        readInto(t, "scan_timeframe", e.scan_timeframe);
        readInto(t, "bootstrap_bars", e.bootstrap_bars);
        readInto(t, "series_capacity", e.series_capacity);
        readInto(t, "use_multi_timeframe", e.use_multi_timeframe);
        readInto(t, "timeframe_bars", e.timeframe_bars);
        readInto(t, "use_volume_filter", e.use_volume_filter);
        readInto(t, "flatten_on_shutdown", e.flatten_on_shutdown);
        readInto(t, "sync_capital_from_account", e.sync_capital_from_account);
        readInto(t, "signal_channel_capacity", e.signal_channel_capacity);
        readInto(t, "max_errors", e.max_errors);
        readInto(t, "max_reconnect_attempts", e.max_reconnect_attempts);
        readInto(t, "reconnect_delay_ms", e.reconnect_delay_ms);
        readInto(t, "max_reconnect_delay_ms", e.max_reconnect_delay_ms);
    }

    if (j.contains("intervals")) {
        const auto& i = j["intervals"];
        readInto(i, "ingest_ms", e.ingest_interval_ms);
        readInto(i, "entry_ms", e.entry_interval_ms);
        readInto(i, "exit_ms", e.exit_interval_ms);
        readInto(i, "maintenance_ms", e.maintenance_interval_ms);
    }

    if (j.contains("scanner")) {
        const auto& s = j["scanner"];
        auto& c = e.scanner;
        readInto(s, "min_samples", c.min_samples);
        readInto(s, "volatility_window", c.volatility_window);
        readInto(s, "annualization_periods", c.annualization_periods);
        readInto(s, "momentum_period", c.momentum_period);
        readInto(s, "volume_window", c.volume_window);
        readInto(s, "volume_surge_multiplier", c.volume_surge_multiplier);
        readInto(s, "min_volatility", c.min_volatility);
        readInto(s, "high_volatility_threshold", c.high_volatility_threshold);
        readInto(s, "high_momentum_upper", c.high_momentum_upper);
        readInto(s, "high_momentum_lower", c.high_momentum_lower);
        readInto(s, "medium_momentum_upper", c.medium_momentum_upper);
        readInto(s, "medium_momentum_lower", c.medium_momentum_lower);
        readInto(s, "medium_confidence", c.medium_confidence);
        readInto(s, "enable_surge_tier", c.enable_surge_tier);
        readInto(s, "min_confidence", c.min_confidence);
        readInto(s, "max_signals", c.max_signals);
    }

    if (j.contains("volume")) {
        const auto& v = j["volume"];
        auto& c = e.volume;
        readInto(v, "volume_threshold_multiplier", c.volume_threshold_multiplier);
        readInto(v, "volume_period", c.volume_period);
        readInto(v, "require_volume_spike", c.require_volume_spike);
        readInto(v, "volume_spike_threshold", c.volume_spike_threshold);
        readInto(v, "min_volume_percentile", c.min_volume_percentile);
    }

    if (j.contains("timeframes")) {
        const auto& tf = j["timeframes"];
        auto& c = e.timeframes;
        readInto(tf, "primary", c.primary_timeframe);
        readStrings(tf, "confirmations", c.confirmation_timeframes);
        readInto(tf, "require_alignment", c.require_alignment);
        readInto(tf, "min_confirmation_percentage", c.min_confirmation_percentage);
        readMap(tf, "weights", c.weights);
        readMap(tf, "decay_factors", c.decay_factors);
        readStrings(tf, "priority", c.timeframe_priority);
        readInto(tf, "consensus_threshold", c.consensus_threshold);
        readInto(tf, "resolution_consensus_threshold", c.resolution_consensus_threshold);
        readInto(tf, "primary_override_confidence", c.primary_override_confidence);
        readInto(tf, "priority_min_strength", c.priority_min_strength);
        readInto(tf, "priority_confidence", c.priority_confidence);
    }

    if (j.contains("stoch_rsi")) {
        const auto& s = j["stoch_rsi"];
        auto& c = e.stoch_rsi;
        readInto(s, "rsi_period", c.rsi_period);
        readInto(s, "stoch_period", c.stoch_period);
        readInto(s, "k_smoothing", c.k_smoothing);
        readInto(s, "d_smoothing", c.d_smoothing);
        readInto(s, "oversold", c.oversold);
        readInto(s, "overbought", c.overbought);
    }

    if (j.contains("risk")) {
        const auto& r = j["risk"];
        auto& c = e.risk;
        readInto(r, "initial_capital", c.initial_capital);
        readInto(r, "max_concurrent_positions", c.max_concurrent_positions);
        readInto(r, "daily_loss_limit", c.daily_loss_limit);
        readInto(r, "daily_loss_limit_pct", c.daily_loss_limit_pct);
        readInto(r, "max_position_pct", c.max_position_pct);
        readInto(r, "confidence_size_factor", c.confidence_size_factor);
    }

    if (j.contains("lifecycle")) {
        const auto& l = j["lifecycle"];
        auto& c = e.lifecycle;
        readInto(l, "max_hold_seconds", c.max_hold_seconds);
        readInto(l, "volatility_floor", c.volatility_floor);
        readInto(l, "trailing_trigger_pct", c.trailing_trigger_pct);
        readInto(l, "trailing_distance_pct", c.trailing_distance_pct);
        readInto(l, "max_exit_failures", c.max_exit_failures);
        readInto(l, "allow_fractional", c.allow_fractional);
    }

    if (j.contains("execution")) {
        const auto& x = j["execution"];
        auto& c = e.execution;
        readInto(x, "max_attempts", c.max_attempts);
        readInto(x, "base_backoff_ms", c.base_backoff_ms);
        readInto(x, "max_backoff_ms", c.max_backoff_ms);
        readInto(x, "jitter_min", c.jitter_min);
        readInto(x, "jitter_max", c.jitter_max);
        readInto(x, "fill_timeout_ms", c.fill_timeout_ms);
        readInto(x, "fill_poll_interval_ms", c.fill_poll_interval_ms);
    }

    if (j.contains("rate_limit")) {
        const auto& r = j["rate_limit"];
        readInto(r, "max_calls", e.rate_limit.max_calls);
        const long long window_seconds = r.value("window_seconds", 60LL);
        e.rate_limit.window = std::chrono::seconds(window_seconds);
    }

    if (j.contains("broker")) {
        const auto& b = j["broker"];
        readInto(b, "trading_base_url", e.alpaca.trading_base_url);
        readInto(b, "data_base_url", e.alpaca.data_base_url);
        readInto(b, "data_feed", e.alpaca.data_feed);
        readInto(b, "time_in_force", e.alpaca.time_in_force);
        readInto(b, "timeout_seconds", e.http_timeout_seconds);
    }

    if (j.contains("paper")) {
        const auto& p = j["paper"];
        readInto(p, "initial_cash", e.paper.initial_cash);
        readInto(p, "slippage_bps", e.paper.slippage_bps);
        readInto(p, "synthetic_start_price", e.paper.synthetic_start_price);
        readInto(p, "synthetic_step_pct", e.paper.synthetic_step_pct);
        readInto(p, "seed", e.paper.seed);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        readInto(l, "level", e.log_level);
        readInto(l, "dir", e.log_dir);
        readInto(l, "journal_path", e.journal_path);
    }
}

} // namespace scalpengine
