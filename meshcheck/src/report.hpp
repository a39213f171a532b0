#pragma once

#include "check.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Collects final results into the OUTPUT=json document, grouped by category
// in the order they arrive. Retry results are dropped.
class JsonReport {
public:
    void add(const CheckResult& result);

    nlohmann::json finish(bool success, const std::optional<std::string>& stopped_by) const;

private:
    nlohmann::json categories_ = nlohmann::json::array();
};
