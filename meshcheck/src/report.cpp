#include "report.hpp"

namespace {
    nlohmann::json result_to_json(const CheckResult& result) {
        nlohmann::json j = {
            {"description", result.description},
            {"hint", result.hint_url},
            {"result", result.ok() ? "success" : (result.warning ? "warning" : "error")},
        };
        if (result.err) {
            j["error"] = result.err->message;
        }
        return j;
    }
}

void JsonReport::add(const CheckResult& result) {
    if (result.retry) {
        return;
    }
    if (categories_.empty() || categories_.back()["categoryName"] != result.category) {
        categories_.push_back({{"categoryName", result.category}, {"checks", nlohmann::json::array()}});
    }
    categories_.back()["checks"].push_back(result_to_json(result));
}

nlohmann::json JsonReport::finish(bool success, const std::optional<std::string>& stopped_by) const {
    nlohmann::json report = {{"success", success}, {"categories", categories_}};
    if (stopped_by) {
        report["stoppedBy"] = *stopped_by;
    }
    return report;
}
