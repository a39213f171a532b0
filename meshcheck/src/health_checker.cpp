#include "health_checker.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <thread>
#include <utility>

HealthChecker::HealthChecker(HealthCheckOptions options,
                             std::shared_ptr<ClusterClientFactory> clients,
                             std::shared_ptr<PublicApiClient> public_api)
    : options_(std::move(options))
    , clients_(std::move(clients))
    , public_api_(std::move(public_api))
{
    categories_.push_back(kubernetes_api_category());
    categories_.push_back(kubernetes_version_category());
    categories_.push_back(pre_install_category());
    categories_.push_back(control_plane_existence_category());
    categories_.push_back(config_category());
    categories_.push_back(cni_plugin_category());
    categories_.push_back(identity_category());
    categories_.push_back(webhooks_category());
    categories_.push_back(control_plane_api_category());
    categories_.push_back(ha_category());
    categories_.push_back(multicluster_category());

    for (auto& category : categories_) {
        bool requested = std::find(options_.categories.begin(), options_.categories.end(), category.id())
            != options_.categories.end();
        category.set_enabled(requested);
        category.with_hint_base_url(options_.hint_base_url);
    }
}

std::vector<CategoryID> HealthChecker::standard_categories() {
    return {
        categories::kKubernetesAPI,
        categories::kKubernetesVersion,
        categories::kControlPlaneExistence,
        categories::kConfig,
        categories::kCNIPlugin,
        categories::kIdentity,
        categories::kWebhooksAndAPISvcTLS,
        categories::kControlPlaneAPI,
        categories::kHA,
        categories::kMulticluster,
    };
}

std::vector<CategoryID> HealthChecker::pre_install_categories() {
    return {
        categories::kKubernetesAPI,
        categories::kKubernetesVersion,
        categories::kPreInstall,
    };
}

bool HealthChecker::run_checks(const CheckObserver& observer) {
    bool success = true;
    had_warnings_ = false;
    stopped_by_.reset();

    for (const auto& category : categories_) {
        if (!category.enabled()) {
            continue;
        }
        spdlog::debug("Running category {}", category.id());

        for (const auto& checker : category.checkers()) {
            if (!checker.has_body()) {
                continue;
            }

            bool ok = checker.is_rpc()
                ? run_check_rpc(category, checker, observer)
                : run_check(category, checker, observer);
            if (ok) {
                continue;
            }

            if (checker.is_warning()) {
                had_warnings_ = true;
            } else {
                success = false;
            }
            if (checker.is_fatal()) {
                spdlog::info("Fatal check failed: {}; remaining checks skipped", checker.description());
                stopped_by_ = checker.description();
                return success;
            }
        }
    }
    return success;
}

void HealthChecker::add_check(const CategoryID& category,
                              const std::string& description,
                              const std::string& hint_anchor,
                              CheckFunc body) {
    Checker checker(description);
    checker.with_hint_anchor(hint_anchor).with_check(std::move(body));

    for (auto& existing : categories_) {
        if (existing.id() == category) {
            existing.add_checker(std::move(checker));
            existing.set_enabled(true);
            return;
        }
    }

    Category created(category, {std::move(checker)}, true);
    created.with_hint_base_url(options_.hint_base_url);
    categories_.push_back(std::move(created));
}

void HealthChecker::append_categories(std::vector<Category> categories) {
    for (auto& category : categories) {
        categories_.push_back(std::move(category));
    }
}

CheckContext HealthChecker::new_context() {
    CheckContext ctx{discovery_, std::chrono::steady_clock::now() + options_.request_timeout};
    bind_deadline(ctx.deadline);
    return ctx;
}

void HealthChecker::bind_deadline(std::optional<std::chrono::steady_clock::time_point> deadline) {
    if (discovery_.cluster.client) {
        discovery_.cluster.client->set_deadline(deadline);
    }
    if (public_api_) {
        public_api_->set_deadline(deadline);
    }
}

std::shared_ptr<ClusterClient> HealthChecker::connect_remote(const RemoteClusterDescriptor& descriptor,
                                                             const CheckContext& ctx) {
    auto remote = clients_->create_remote(descriptor);
    remote->set_deadline(ctx.deadline);
    return remote;
}

std::string HealthChecker::timeout_message() const {
    double seconds = std::chrono::duration<double>(options_.request_timeout).count();
    return fmt::format("check timed out after {:g}s", seconds);
}

CheckOutcome HealthChecker::attempt(const Checker& checker) {
    CheckContext ctx = new_context();
    CheckOutcome outcome;
    try {
        outcome = checker.check()(ctx);
    } catch (const std::exception& e) {
        outcome = CheckOutcome::fail(e.what());
    }
    bind_deadline(std::nullopt);

    if (!outcome.is_skip() && ctx.expired()) {
        return CheckOutcome::fail(timeout_message());
    }
    return outcome;
}

CheckResult HealthChecker::new_result(const Category& category, const Checker& checker) const {
    CheckResult result;
    result.category = category.id();
    result.description = checker.description();
    result.hint_url = category.hint_base_url() + checker.hint_anchor();
    result.warning = checker.is_warning();
    return result;
}

bool HealthChecker::run_check(const Category& category, const Checker& checker, const CheckObserver& observer) {
    for (;;) {
        CheckOutcome outcome = attempt(checker);
        if (outcome.is_skip()) {
            spdlog::debug("Skipping check: {}. Reason: {}", checker.description(), outcome.message);
            return true;
        }

        CheckResult result = new_result(category, checker);
        if (outcome.kind == OutcomeKind::OkVerbose) {
            result.description += "\n" + outcome.message;
        } else if (outcome.is_fail()) {
            result.err = CheckError{category.id(), outcome.message};
        }

        if (result.err && checker.can_retry()) {
            result.retry = true;
            if (!checker.surfaces_error_on_retry()) {
                result.err->message = kWaitingForCheck;
            }
            spdlog::debug("Retrying on error: {}", outcome.message);

            if (observer) observer(result);
            std::this_thread::sleep_for(options_.retry_window);
            continue;
        }

        if (observer) observer(result);
        return result.ok();
    }
}

bool HealthChecker::run_check_rpc(const Category& category, const Checker& checker, const CheckObserver& observer) {
    // (description, error message) -> whether the emission was a retry
    std::map<std::pair<std::string, std::string>, bool> emitted;
    bool parent_reported = false;

    for (;;) {
        CheckContext ctx = new_context();
        SelfCheckBatch batch;
        std::optional<std::string> call_error;
        try {
            batch = checker.rpc_check()(ctx);
        } catch (const std::exception& e) {
            call_error = e.what();
        }
        bind_deadline(std::nullopt);
        if (!call_error && batch.is_skip()) {
            spdlog::debug("Skipping check: {}. Reason: {}", checker.description(), *batch.skip_reason);
            return true;
        }
        if (!call_error && ctx.expired()) {
            call_error = timeout_message();
        }
        const auto& results = batch.results;
        if (!call_error && results.empty()) {
            call_error = kNoResultsReturned;
        }

        if (call_error) {
            // Transport failures are final
            CheckResult result = new_result(category, checker);
            result.err = CheckError{category.id(), *call_error};
            if (observer) observer(result);
            return false;
        }

        if (!parent_reported) {
            if (observer) observer(new_result(category, checker));
            parent_reported = true;
        }

        bool can_retry = checker.can_retry();
        bool any_failed = false;

        for (const auto& sub : results) {
            std::string description = fmt::format("[{}] {}", sub.subsystem, sub.description);
            std::string message = sub.ok ? "" : sub.friendly_message;
            if (!sub.ok && message.empty()) {
                message = "check failed";
            }
            bool retrying = !sub.ok && can_retry;
            any_failed = any_failed || !sub.ok;

            auto key = std::make_pair(description, message);
            auto seen = emitted.find(key);
            if (seen != emitted.end()) {
                // Already shown; only a final outcome replaces a retry emission
                if (retrying || !seen->second) {
                    continue;
                }
                seen->second = false;
            } else {
                emitted.emplace(key, retrying);
            }

            CheckResult result = new_result(category, checker);
            result.description = description;
            result.retry = retrying;
            if (!sub.ok) {
                result.err = CheckError{category.id(),
                    retrying && !checker.surfaces_error_on_retry() ? kWaitingForCheck : message};
            }
            if (observer) observer(result);
        }

        if (!any_failed) {
            return true;
        }
        if (!can_retry) {
            return false;
        }

        spdlog::debug("Retrying self-check: {}", checker.description());
        std::this_thread::sleep_for(options_.retry_window);
    }
}

ClusterClient& HealthChecker::client(DiscoveryContext& state) const {
    if (!state.cluster.client) {
        throw std::runtime_error("Kubernetes client is not initialized");
    }
    return *state.cluster.client;
}

const ControlPlaneConfig& HealthChecker::control_plane_config(DiscoveryContext& state) const {
    if (!state.cluster.config) {
        state.cluster.config = fetch_control_plane_config(client(state), options_.control_plane_namespace);
    }
    return *state.cluster.config;
}
