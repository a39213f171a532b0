#include <catch2/catch_test_macros.hpp>
#include "../src/report.hpp"

namespace {

CheckResult result(const std::string& category, const std::string& description,
                   std::optional<std::string> error = std::nullopt, bool warning = false, bool retry = false) {
    CheckResult r;
    r.category = category;
    r.description = description;
    r.hint_url = "https://linkerd.io/2/checks/#" + description;
    r.warning = warning;
    r.retry = retry;
    if (error) {
        r.err = CheckError{category, *error};
    }
    return r;
}

} // namespace

TEST_CASE("JSON report", "[report]") {
    JsonReport report;

    SECTION("Results are grouped by category and retries are dropped") {
        report.add(result("kubernetes-api", "can query"));
        report.add(result("linkerd-existence", "pods ready", std::string("waiting for check to complete"), false, true));
        report.add(result("linkerd-existence", "pods ready"));
        report.add(result("linkerd-ha-checks", "replicas", std::string("not enough replicas"), true));

        auto doc = report.finish(true, std::nullopt);
        REQUIRE(doc["success"] == true);
        REQUIRE(doc["categories"].size() == 3);
        REQUIRE(doc["categories"][1]["categoryName"] == "linkerd-existence");
        REQUIRE(doc["categories"][1]["checks"].size() == 1);
        REQUIRE(doc["categories"][1]["checks"][0]["result"] == "success");
        REQUIRE(doc["categories"][2]["checks"][0]["result"] == "warning");
        REQUIRE(doc["categories"][2]["checks"][0]["error"] == "not enough replicas");
        REQUIRE_FALSE(doc.contains("stoppedBy"));
    }

    SECTION("The fatal check that stopped the run is recorded") {
        report.add(result("kubernetes-api", "can query", std::string("connection refused")));

        auto doc = report.finish(false, std::string("can query"));
        REQUIRE(doc["success"] == false);
        REQUIRE(doc["stoppedBy"] == "can query");
        REQUIRE(doc["categories"][0]["checks"][0]["result"] == "error");
    }
}
