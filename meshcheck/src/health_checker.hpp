#pragma once

#include "category.hpp"
#include "check.hpp"
#include "cluster_client.hpp"
#include "discovery_context.hpp"
#include "public_api_client.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

inline const std::string kWaitingForCheck = "waiting for check to complete";
inline const std::string kNoResultsReturned = "No results returned";
inline const std::string kNoPublicApi = "public API address not configured";

struct HealthCheckOptions {
    std::string control_plane_namespace = "linkerd";
    std::string cni_namespace = "linkerd-cni";
    std::string viz_namespace = "linkerd-viz";
    std::vector<CategoryID> categories;
    bool multicluster = false;
    // Absent: failing checks are never retried
    std::optional<std::chrono::system_clock::time_point> retry_deadline;
    std::chrono::milliseconds retry_window{5000};
    std::chrono::milliseconds request_timeout{30000};
    std::string hint_base_url = "https://linkerd.io/2/checks/#";
};

// Runs categories of checks in a fixed order and streams one result per
// finished check (plus intermediate retry results) to an observer.
class HealthChecker {
public:
    HealthChecker(HealthCheckOptions options,
                  std::shared_ptr<ClusterClientFactory> clients,
                  std::shared_ptr<PublicApiClient> public_api);

    // Check bodies capture this instance
    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    // Returns false if any non-warning check failed. A failed fatal check
    // stops the run.
    bool run_checks(const CheckObserver& observer);

    // True if a warning check failed during the last run
    bool had_warnings() const { return had_warnings_; }

    // Description of the fatal check that stopped the last run, if any
    const std::optional<std::string>& stopped_by() const { return stopped_by_; }

    // Appends a check to the named category, creating it enabled after the
    // existing categories on first use
    void add_check(const CategoryID& category,
                   const std::string& description,
                   const std::string& hint_anchor,
                   CheckFunc body);

    void append_categories(std::vector<Category> categories);

    const std::vector<Category>& categories() const { return categories_; }
    const HealthCheckOptions& options() const { return options_; }
    const DiscoveryContext& discovery() const { return discovery_; }

    std::shared_ptr<ClusterClient> kube_client() const { return discovery_.cluster.client; }
    const std::optional<ControlPlaneConfig>& control_plane_config() const { return discovery_.cluster.config; }

    // Categories for an installed control plane, in run order
    static std::vector<CategoryID> standard_categories();
    // Categories that vet a cluster before the control plane is installed
    static std::vector<CategoryID> pre_install_categories();

private:
    HealthCheckOptions options_;
    std::shared_ptr<ClusterClientFactory> clients_;
    std::shared_ptr<PublicApiClient> public_api_;
    std::vector<Category> categories_;
    DiscoveryContext discovery_;
    bool had_warnings_ = false;
    std::optional<std::string> stopped_by_;

    bool run_check(const Category& category, const Checker& checker, const CheckObserver& observer);
    bool run_check_rpc(const Category& category, const Checker& checker, const CheckObserver& observer);

    CheckContext new_context();
    // Bounds requests of the local and public API clients; nullopt lifts the bound
    void bind_deadline(std::optional<std::chrono::steady_clock::time_point> deadline);
    std::shared_ptr<ClusterClient> connect_remote(const RemoteClusterDescriptor& descriptor,
                                                  const CheckContext& ctx);
    CheckOutcome attempt(const Checker& checker);
    CheckResult new_result(const Category& category, const Checker& checker) const;
    std::string timeout_message() const;

    // Lookups shared by check bodies; both throw when the data is unavailable
    ClusterClient& client(DiscoveryContext& state) const;
    const ControlPlaneConfig& control_plane_config(DiscoveryContext& state) const;

    // checks_core.cpp
    Category kubernetes_api_category();
    Category kubernetes_version_category();
    Category pre_install_category();
    Category control_plane_existence_category();
    Category config_category();
    Category cni_plugin_category();
    Category control_plane_api_category();
    Category ha_category();

    // checks_identity.cpp
    Category identity_category();
    Category webhooks_category();
    Checker webhook_cert_check(const std::string& component,
                               WebhookKind kind,
                               const std::string& webhook_name,
                               const std::string& secret_name,
                               const std::optional<std::string>& legacy_secret_name,
                               bool skip_when_missing);
    Checker webhook_expiry_check(const std::string& component,
                                 const std::string& secret_name,
                                 const std::optional<std::string>& legacy_secret_name,
                                 bool skip_when_missing);
    Checker tap_cert_check();
    Checker tap_expiry_check();
    Checker tap_api_service_check();

    // checks_multicluster.cpp
    Category multicluster_category();
    std::optional<CheckOutcome> require_service_mirror(const DiscoveryContext& state) const;
    CheckOutcome check_service_mirror_controller(DiscoveryContext& state);
    CheckOutcome check_service_mirror_rbac(DiscoveryContext& state);
    CheckOutcome check_remote_cluster_connectivity(CheckContext& ctx);
    CheckOutcome check_remote_cluster_anchors(CheckContext& ctx);
    CheckOutcome check_remote_gateways();
    CheckOutcome check_daisy_chains(DiscoveryContext& state);
};

// The destination, identity and proxy-injector components each need a running
// pod whose containers are all ready
std::optional<std::string> validate_control_plane_pods(const std::vector<Pod>& pods);
