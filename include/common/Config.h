#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace scalpengine {

class Config {
public:
    static Config& getInstance();

    // 파일이 없으면 기본값, JSON 파싱 실패 시 std::runtime_error
    void load(const std::string& config_path);
    void loadFromString(const std::string& json_text);

    std::string getApiKeyId() const { return api_key_id_; }
    std::string getApiSecretKey() const { return api_secret_key_; }
    bool hasCredentials() const { return !api_key_id_.empty() && !api_secret_key_.empty(); }
    std::string getLogLevel() const { return engine_config_.log_level; }
    std::string getLogDir() const { return engine_config_.log_dir; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }

    // 기본값으로 되돌림 (테스트용)
    void reset();

private:
    Config() = default;

    void apply(const nlohmann::json& j);
    void readCredentials(const nlohmann::json& j);

    std::string api_key_id_;
    std::string api_secret_key_;
    engine::EngineConfig engine_config_;
};

} // namespace scalpengine
