#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <functional>
#include <utility>

struct DiscoveryContext;

using CategoryID = std::string;

enum class OutcomeKind {
    Ok,
    OkVerbose,
    Skip,
    Fail
};

// What a check body reports for a single attempt. The orchestrator turns it
// into retry/fatal/warning-annotated results; bodies never retry themselves.
struct CheckOutcome {
    OutcomeKind kind = OutcomeKind::Ok;
    std::string message;

    static CheckOutcome ok() { return {OutcomeKind::Ok, ""}; }
    static CheckOutcome verbose(const std::string& message) { return {OutcomeKind::OkVerbose, message}; }
    static CheckOutcome skip(const std::string& reason) { return {OutcomeKind::Skip, reason}; }
    static CheckOutcome fail(const std::string& message) { return {OutcomeKind::Fail, message}; }

    bool is_ok() const { return kind == OutcomeKind::Ok || kind == OutcomeKind::OkVerbose; }
    bool is_skip() const { return kind == OutcomeKind::Skip; }
    bool is_fail() const { return kind == OutcomeKind::Fail; }
};

// Error attached to a CheckResult, tagged with the category that produced it
struct CheckError {
    CategoryID category;
    std::string message;
};

bool is_category_error(const std::optional<CheckError>& err, const CategoryID& category);

struct CheckResult {
    CategoryID category;
    std::string description;
    std::string hint_url;
    bool retry = false;
    bool warning = false;
    std::optional<CheckError> err;

    bool ok() const { return !err.has_value(); }
};

using CheckObserver = std::function<void(const CheckResult&)>;

// One entry of a remote self-check response
struct SelfCheckResult {
    std::string subsystem;
    std::string description;
    bool ok = true;
    std::string friendly_message;
};

// Handed to every check body for the duration of one attempt
struct CheckContext {
    DiscoveryContext& state;
    std::chrono::steady_clock::time_point deadline;

    bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
};

// What a remote self-check body reports for one call: the sub-results, or a
// skip reason when the check does not apply
struct SelfCheckBatch {
    std::vector<SelfCheckResult> results;
    std::optional<std::string> skip_reason;

    SelfCheckBatch() = default;
    SelfCheckBatch(std::vector<SelfCheckResult> results) : results(std::move(results)) {}

    static SelfCheckBatch skip(const std::string& reason) {
        SelfCheckBatch batch;
        batch.skip_reason = reason;
        return batch;
    }

    bool is_skip() const { return skip_reason.has_value(); }
};

using CheckFunc = std::function<CheckOutcome(CheckContext&)>;
using RpcCheckFunc = std::function<SelfCheckBatch(CheckContext&)>;

class Checker {
public:
    explicit Checker(const std::string& description);

    Checker& with_hint_anchor(const std::string& anchor);
    Checker& fatal();
    Checker& warning();
    Checker& with_retry_deadline(std::optional<std::chrono::system_clock::time_point> deadline);
    Checker& surface_error_on_retry();
    Checker& with_check(CheckFunc check);
    Checker& with_rpc_check(RpcCheckFunc check);

    const std::string& description() const { return description_; }
    const std::string& hint_anchor() const { return hint_anchor_; }
    bool is_fatal() const { return fatal_; }
    bool is_warning() const { return warning_; }
    bool surfaces_error_on_retry() const { return surface_error_on_retry_; }
    const std::optional<std::chrono::system_clock::time_point>& retry_deadline() const { return retry_deadline_; }

    bool has_body() const { return static_cast<bool>(check_) || static_cast<bool>(rpc_check_); }
    bool is_rpc() const { return static_cast<bool>(rpc_check_); }

    // True while the retry deadline lies in the future
    bool can_retry() const;

    const CheckFunc& check() const { return check_; }
    const RpcCheckFunc& rpc_check() const { return rpc_check_; }

private:
    std::string description_;
    std::string hint_anchor_;
    bool fatal_ = false;
    bool warning_ = false;
    bool surface_error_on_retry_ = false;
    std::optional<std::chrono::system_clock::time_point> retry_deadline_;
    CheckFunc check_;
    RpcCheckFunc rpc_check_;
};
