#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>
#include <string>

namespace scalpengine {
namespace network {

// libcurl 기반 HTTP 클라이언트 - Alpaca 키 헤더 인증
// 하나의 easy handle 을 재사용하므로 요청은 직렬화됨
class AlpacaHttpClient : public IHttpClient {
public:
    AlpacaHttpClient(const std::string& api_key_id, const std::string& api_secret_key,
                     long timeout_seconds = 30);
    ~AlpacaHttpClient();
    
    AlpacaHttpClient(const AlpacaHttpClient&) = delete;
    AlpacaHttpClient& operator=(const AlpacaHttpClient&) = delete;
    
    HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {}
    ) override;
    
    HttpResponse post(
        const std::string& url,
        const nlohmann::json& body
    ) override;
    
    HttpResponse del(
        const std::string& url
    ) override;
    
    // "a=1&b=x%20y" (값만 URL 인코딩)
    static std::string encodeQuery(CURL* curl, const std::map<std::string, std::string>& params);
    
private:
    enum class Method { GET, POST, DELETE_ };
    
    std::string key_header_;
    std::string secret_header_;
    long timeout_seconds_;
    CURL* curl_;
    std::mutex mutex_;
    
    HttpResponse send(Method method, const std::string& url, const std::string& payload);
    
    static const char* methodName(Method method);
    static size_t onBody(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t onHeader(char* buffer, size_t size, size_t nitems, void* userdata);
};

} // namespace network
} // namespace scalpengine
