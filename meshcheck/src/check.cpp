#include "check.hpp"

bool is_category_error(const std::optional<CheckError>& err, const CategoryID& category) {
    return err.has_value() && err->category == category;
}

Checker::Checker(const std::string& description)
    : description_(description) {}

Checker& Checker::with_hint_anchor(const std::string& anchor) {
    hint_anchor_ = anchor;
    return *this;
}

Checker& Checker::fatal() {
    fatal_ = true;
    return *this;
}

Checker& Checker::warning() {
    warning_ = true;
    return *this;
}

Checker& Checker::with_retry_deadline(std::optional<std::chrono::system_clock::time_point> deadline) {
    retry_deadline_ = deadline;
    return *this;
}

Checker& Checker::surface_error_on_retry() {
    surface_error_on_retry_ = true;
    return *this;
}

Checker& Checker::with_check(CheckFunc check) {
    check_ = std::move(check);
    rpc_check_ = nullptr;
    return *this;
}

Checker& Checker::with_rpc_check(RpcCheckFunc check) {
    rpc_check_ = std::move(check);
    check_ = nullptr;
    return *this;
}

bool Checker::can_retry() const {
    return retry_deadline_.has_value() && std::chrono::system_clock::now() < *retry_deadline_;
}
