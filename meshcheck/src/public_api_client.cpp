#include "public_api_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
    const std::string kApiPrefix = "/api/v1/";
    const std::string kStatusOK = "OK";
}

HttpPublicApiClient::HttpPublicApiClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for public API");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
}

HttpPublicApiClient::~HttpPublicApiClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t HttpPublicApiClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

nlohmann::json HttpPublicApiClient::make_request(const std::string& endpoint, const nlohmann::json& body) {
    long timeout = util::bounded_timeout_ms(std::chrono::milliseconds(timeout_ms_), deadline());
    if (timeout <= 0) {
        throw PublicApiError(fmt::format("{} request not sent: deadline exceeded", endpoint));
    }

    std::string response_string;
    std::string url = base_url_ + kApiPrefix + endpoint;
    std::string payload = body.dump();

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        throw PublicApiError(fmt::format("{} request failed: {}", endpoint, curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        throw PublicApiError(fmt::format("{} returned HTTP {}: {}", endpoint, http_code, response_string));
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        throw PublicApiError(fmt::format("failed to parse {} response: {}", endpoint, e.what()));
    }
}

std::vector<SelfCheckResult> HttpPublicApiClient::self_check() {
    auto response = make_request("SelfCheck", nlohmann::json::object());

    std::vector<SelfCheckResult> results;
    for (const auto& item : response.value("results", nlohmann::json::array())) {
        SelfCheckResult result;
        result.subsystem = item.value("subsystem", "");
        result.description = item.value("checkDescription", "");
        result.ok = item.value("status", "") == kStatusOK;
        result.friendly_message = item.value("friendlyMessageToUser", "");
        results.push_back(result);
    }
    return results;
}

std::vector<GatewayStatus> HttpPublicApiClient::gateways(const std::string& time_window) {
    auto response = make_request("Gateways", {{"timeWindow", time_window}});

    if (response.contains("error")) {
        throw PublicApiError(response["error"].value("error", "unknown gateways error"));
    }

    const auto rows = response.value("ok", nlohmann::json::object())
                              .value("gatewaysTable", nlohmann::json::object())
                              .value("rows", nlohmann::json::array());

    std::vector<GatewayStatus> gateways;
    for (const auto& row : rows) {
        GatewayStatus gw;
        gw.cluster_name = row.value("clusterName", "");
        gw.name = row.value("name", "");
        gw.namespace_ = row.value("namespace", "");
        gw.alive = row.value("alive", false);
        gw.paired_services = row.value("pairedServices", 0);
        if (row.contains("latencies")) {
            gw.latency_ms_p50 = row["latencies"].value("latencyMsP50", int64_t{0});
        }
        gateways.push_back(gw);
    }

    spdlog::debug("Public API reported {} gateway(s)", gateways.size());
    return gateways;
}
