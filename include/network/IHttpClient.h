#pragma once

#include <cctype>
#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace scalpengine {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    
    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    
    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
    
    // 헤더 이름은 대소문자 구분 없이 조회
    std::string header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (key.size() != name.size()) continue;
            bool same = true;
            for (size_t i = 0; i < key.size() && same; ++i) {
                same = std::tolower(static_cast<unsigned char>(key[i])) ==
                       std::tolower(static_cast<unsigned char>(name[i]));
            }
            if (same) return value;
        }
        return "";
    }
};

// 전송 계층 - 실패 시 std::runtime_error (어댑터 경계에서 ConnectionError 로 변환)
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    
    // GET 요청
    virtual HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {}
    ) = 0;
    
    // POST 요청
    virtual HttpResponse post(
        const std::string& url,
        const nlohmann::json& body
    ) = 0;
    
    // DELETE 요청
    virtual HttpResponse del(
        const std::string& url
    ) = 0;
};

} // namespace network
} // namespace scalpengine
