#include "network/AlpacaHttpClient.h"
#include "common/Logger.h"

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace scalpengine {
namespace network {
namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

void appendHeader(HeaderList& list, const std::string& line) {
    curl_slist* next = curl_slist_append(list.get(), line.c_str());
    if (!next) {
        throw std::runtime_error("curl_slist_append failed");
    }
    list.release();
    list.reset(next);
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

AlpacaHttpClient::AlpacaHttpClient(const std::string& api_key_id, const std::string& api_secret_key,
                                   long timeout_seconds)
    : key_header_("APCA-API-KEY-ID: " + api_key_id)
    , secret_header_("APCA-API-SECRET-KEY: " + api_secret_key)
    , timeout_seconds_(timeout_seconds > 0 ? timeout_seconds : 30)
    , curl_(nullptr)
{
    if (api_key_id.empty() || api_secret_key.empty()) {
        throw std::invalid_argument("Alpaca API key id and secret are required");
    }
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();
    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

AlpacaHttpClient::~AlpacaHttpClient() {
    curl_easy_cleanup(curl_);
    curl_global_cleanup();
}

HttpResponse AlpacaHttpClient::get(
    const std::string& url,
    const std::map<std::string, std::string>& query_params
) {
    if (query_params.empty()) {
        return send(Method::GET, url, "");
    }
    std::string query;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        query = encodeQuery(curl_, query_params);
    }
    return send(Method::GET, url + "?" + query, "");
}

HttpResponse AlpacaHttpClient::post(
    const std::string& url,
    const nlohmann::json& body
) {
    return send(Method::POST, url, body.dump());
}

HttpResponse AlpacaHttpClient::del(const std::string& url) {
    return send(Method::DELETE_, url, "");
}

HttpResponse AlpacaHttpClient::send(Method method, const std::string& url, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    HttpResponse response;
    
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, std::min(timeout_seconds_, 10L));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, onBody);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response.headers);
    
    switch (method) {
        case Method::GET:
            curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
            break;
        case Method::POST:
            curl_easy_setopt(curl_, CURLOPT_POST, 1L);
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
            break;
        case Method::DELETE_:
            curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }
    
    HeaderList headers;
    appendHeader(headers, key_header_);
    appendHeader(headers, secret_header_);
    appendHeader(headers, "Accept: application/json");
    if (method == Method::POST) {
        appendHeader(headers, "Content-Type: application/json");
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers.get());
    
    const CURLcode rc = curl_easy_perform(curl_);
    if (rc != CURLE_OK) {
        throw std::runtime_error(std::string(methodName(method)) + " " + url + " failed: " +
                                 curl_easy_strerror(rc));
    }
    
    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);
    
    if (!response.isSuccess()) {
        LOG_DEBUG("{} {} -> HTTP {}", methodName(method), url, response.status_code);
    }
    return response;
}

const char* AlpacaHttpClient::methodName(Method method) {
    switch (method) {
        case Method::GET: return "GET";
        case Method::POST: return "POST";
        case Method::DELETE_: return "DELETE";
    }
    return "GET";
}

size_t AlpacaHttpClient::onBody(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t bytes = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), bytes);
    return bytes;
}

size_t AlpacaHttpClient::onHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t bytes = size * nitems;
    const std::string line(buffer, bytes);
    const auto colon = line.find(':');
    // 상태 줄과 빈 줄은 건너뜀
    if (colon != std::string::npos && colon > 0) {
        auto& headers = *static_cast<std::map<std::string, std::string>*>(userdata);
        headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return bytes;
}

std::string AlpacaHttpClient::encodeQuery(CURL* curl, const std::map<std::string, std::string>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        std::unique_ptr<char, decltype(&curl_free)> escaped(
            curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size())), &curl_free);
        query += key;
        query += '=';
        query += escaped ? escaped.get() : value;
    }
    return query;
}

} // namespace network
} // namespace scalpengine
