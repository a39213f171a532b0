#pragma once

#include "check.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

struct GatewayStatus {
    std::string cluster_name;
    std::string name;
    std::string namespace_;
    bool alive = false;
    int paired_services = 0;
    int64_t latency_ms_p50 = 0;
};

class PublicApiError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Control-plane public API. Both calls throw PublicApiError when the request
// itself fails.
class PublicApiClient {
public:
    virtual ~PublicApiClient() = default;

    virtual std::vector<SelfCheckResult> self_check() = 0;
    virtual std::vector<GatewayStatus> gateways(const std::string& time_window) = 0;

    // Later calls give up at the deadline; nullopt lifts the bound
    void set_deadline(std::optional<std::chrono::steady_clock::time_point> deadline) { deadline_ = deadline; }
    const std::optional<std::chrono::steady_clock::time_point>& deadline() const { return deadline_; }

private:
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

class HttpPublicApiClient : public PublicApiClient {
public:
    explicit HttpPublicApiClient(const std::string& base_url, int timeout_ms = 30000);
    ~HttpPublicApiClient() override;

    HttpPublicApiClient(const HttpPublicApiClient&) = delete;
    HttpPublicApiClient& operator=(const HttpPublicApiClient&) = delete;

    std::vector<SelfCheckResult> self_check() override;
    std::vector<GatewayStatus> gateways(const std::string& time_window) override;

private:
    std::string base_url_;
    int timeout_ms_;
    CURL* curl_;

    nlohmann::json make_request(const std::string& endpoint, const nlohmann::json& body);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
