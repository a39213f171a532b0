#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <stdexcept>

struct RemoteClusterDescriptor;

using Labels = std::map<std::string, std::string>;

struct ServerVersion {
    int major = 0;
    int minor = 0;
    std::string git_version;
};

struct ContainerStatus {
    std::string name;
    bool ready = false;
    std::string state;   // running, waiting, terminated
    std::string reason;
};

struct Pod {
    std::string name;
    std::string namespace_;
    std::string phase;
    Labels labels;
    std::vector<ContainerStatus> container_statuses;
};

struct Deployment {
    std::string name;
    std::string namespace_;
    Labels labels;
    int replicas = 0;
    int available_replicas = 0;
};

struct DaemonSet {
    std::string name;
    std::string namespace_;
    int desired_number_scheduled = 0;
    int number_ready = 0;
};

struct Secret {
    std::string name;
    std::string namespace_;
    std::string type;
    Labels labels;
    Labels annotations;
    std::map<std::string, std::string> data;  // decoded payloads
};

struct ConfigMap {
    std::string name;
    std::string namespace_;
    std::string uid;
    std::map<std::string, std::string> data;
};

struct Service {
    std::string name;
    std::string namespace_;
    Labels labels;
    Labels annotations;
};

struct TrafficSplitBackend {
    std::string service;
    std::string weight;
};

struct TrafficSplit {
    std::string name;
    std::string namespace_;
    std::string service;  // apex
    std::vector<TrafficSplitBackend> backends;
};

struct PolicyRule {
    std::vector<std::string> api_groups;
    std::vector<std::string> resources;
    std::vector<std::string> verbs;
};

struct RbacRole {
    std::string name;
    std::string namespace_;
    std::vector<PolicyRule> rules;
};

// Authorization dry-run request
struct ResourceAccess {
    std::string verb;
    std::string namespace_;
    std::string group;
    std::string version;
    std::string resource;
};

enum class WebhookKind {
    Mutating,
    Validating
};

struct ApiServiceCondition {
    std::string status;   // True, False, Unknown
    std::string reason;
    std::string message;
};

struct ApiService {
    std::string name;
    std::string ca_bundle;  // PEM
    std::optional<ApiServiceCondition> available;
};

class ClusterApiError : public std::runtime_error {
public:
    ClusterApiError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }
    bool not_found() const { return status_ == 404; }

private:
    int status_;
};

// Operations the health checker consumes from a cluster API. Namespace ""
// means all namespaces for list calls. Failures are thrown as ClusterApiError.
class ClusterClient {
public:
    virtual ~ClusterClient() = default;

    virtual ServerVersion server_version() = 0;
    virtual bool namespace_exists(const std::string& ns) = 0;

    virtual std::vector<Pod> list_pods(const std::string& ns, const std::string& selector) = 0;
    virtual std::vector<Deployment> list_deployments(const std::string& ns, const std::string& selector) = 0;
    virtual Deployment get_deployment(const std::string& ns, const std::string& name) = 0;
    virtual DaemonSet get_daemon_set(const std::string& ns, const std::string& name) = 0;

    virtual Secret get_secret(const std::string& ns, const std::string& name) = 0;
    virtual std::vector<Secret> list_secrets(const std::string& ns) = 0;
    virtual ConfigMap get_config_map(const std::string& ns, const std::string& name) = 0;

    virtual std::vector<Service> list_services(const std::string& ns, const std::string& selector) = 0;
    virtual std::vector<TrafficSplit> list_traffic_splits(const std::string& ns) = 0;

    virtual RbacRole get_cluster_role(const std::string& name) = 0;
    virtual RbacRole get_role(const std::string& ns, const std::string& name) = 0;

    virtual bool can_perform(const ResourceAccess& access) = 0;

    // PEM bundle of the named webhook configuration's single webhook
    virtual std::string webhook_ca_bundle(WebhookKind kind, const std::string& name) = 0;

    // Aggregated API registration, with its decoded caBundle
    virtual ApiService get_api_service(const std::string& name) = 0;

    // No later request waits past the deadline, and none starts once it has
    // passed. nullopt lifts the bound.
    void set_deadline(std::optional<std::chrono::steady_clock::time_point> deadline) { deadline_ = deadline; }
    const std::optional<std::chrono::steady_clock::time_point>& deadline() const { return deadline_; }

private:
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

class ClusterClientFactory {
public:
    virtual ~ClusterClientFactory() = default;

    virtual std::shared_ptr<ClusterClient> create_local() = 0;
    virtual std::shared_ptr<ClusterClient> create_remote(const RemoteClusterDescriptor& descriptor) = 0;
};
