#include <catch2/catch_test_macros.hpp>
#include "../src/public_api_client.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>

namespace {

// Serves canned public API responses on a loopback port for the lifetime of the object.
class StubPublicApi {
public:
    StubPublicApi() {
        server_.Post("/api/v1/SelfCheck", [this](const httplib::Request& req, httplib::Response& res) {
            last_body = req.body;
            res.status = status;
            res.set_content(self_check_body, "application/json");
        });
        server_.Post("/api/v1/Gateways", [this](const httplib::Request& req, httplib::Response& res) {
            last_body = req.body;
            res.status = status;
            res.set_content(gateways_body, "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~StubPublicApi() {
        server_.stop();
        thread_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    int status = 200;
    std::string self_check_body = "{}";
    std::string gateways_body = "{}";
    std::string last_body;

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

}

TEST_CASE("Public API self-check", "[public_api]") {
    StubPublicApi api;
    HttpPublicApiClient client(api.url(), 5000);

    SECTION("Results are parsed") {
        api.self_check_body = nlohmann::json{
            {"results", {
                {{"subsystem", "kubernetes-api"}, {"checkDescription", "can query the Kubernetes API"},
                 {"status", "OK"}},
                {{"subsystem", "prometheus-api"}, {"checkDescription", "can query Prometheus"},
                 {"status", "ERROR"}, {"friendlyMessageToUser", "connection refused"}},
            }},
        }.dump();

        auto results = client.self_check();
        REQUIRE(results.size() == 2);
        REQUIRE(results[0].subsystem == "kubernetes-api");
        REQUIRE(results[0].description == "can query the Kubernetes API");
        REQUIRE(results[0].ok);
        REQUIRE_FALSE(results[1].ok);
        REQUIRE(results[1].friendly_message == "connection refused");
    }

    SECTION("Empty response yields no results") {
        REQUIRE(client.self_check().empty());
    }

    SECTION("Server errors surface as PublicApiError") {
        api.status = 500;
        api.self_check_body = "boom";
        REQUIRE_THROWS_AS(client.self_check(), PublicApiError);
    }

    SECTION("Malformed JSON") {
        api.self_check_body = "{not json";
        REQUIRE_THROWS_AS(client.self_check(), PublicApiError);
    }
}

TEST_CASE("Public API gateways", "[public_api]") {
    StubPublicApi api;
    HttpPublicApiClient client(api.url(), 5000);

    SECTION("Rows are parsed") {
        api.gateways_body = nlohmann::json{
            {"ok", {{"gatewaysTable", {{"rows", {
                {{"clusterName", "east"}, {"name", "linkerd-gateway"}, {"namespace", "linkerd-multicluster"},
                 {"alive", true}, {"pairedServices", 3}, {"latencies", {{"latencyMsP50", 12}}}},
                {{"clusterName", "west"}, {"name", "linkerd-gateway"}, {"namespace", "linkerd-multicluster"},
                 {"alive", false}},
            }}}}}},
        }.dump();

        auto gateways = client.gateways("1m");
        REQUIRE(nlohmann::json::parse(api.last_body) == nlohmann::json{{"timeWindow", "1m"}});
        REQUIRE(gateways.size() == 2);
        REQUIRE(gateways[0].cluster_name == "east");
        REQUIRE(gateways[0].alive);
        REQUIRE(gateways[0].paired_services == 3);
        REQUIRE(gateways[0].latency_ms_p50 == 12);
        REQUIRE_FALSE(gateways[1].alive);
        REQUIRE(gateways[1].latency_ms_p50 == 0);
    }

    SECTION("Error payload") {
        api.gateways_body = R"({"error":{"error":"prometheus unavailable"}})";
        try {
            client.gateways("1m");
            FAIL("error payload accepted");
        } catch (const PublicApiError& e) {
            REQUIRE(std::string(e.what()) == "prometheus unavailable");
        }
    }

    SECTION("Expired deadline fails before the request is sent") {
        client.set_deadline(std::chrono::steady_clock::now() - std::chrono::seconds(1));
        try {
            client.gateways("1m");
            FAIL("request sent after its deadline");
        } catch (const PublicApiError& e) {
            REQUIRE(std::string(e.what()) == "Gateways request not sent: deadline exceeded");
        }
        REQUIRE(api.last_body.empty());
    }

    SECTION("Unreachable server") {
        HttpPublicApiClient offline("http://127.0.0.1:1", 1000);
        REQUIRE_THROWS_AS(offline.gateways("1m"), PublicApiError);
    }
}
