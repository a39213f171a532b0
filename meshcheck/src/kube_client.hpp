#pragma once

#include "cluster_client.hpp"
#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Where and how to reach an API server
struct KubeApiConnection {
    std::string server;
    std::string token;
    std::string ca_file;
    std::string ca_data;            // PEM, takes precedence over ca_file
    bool insecure_skip_verify = false;
};

// Resolves the current context of a JSON kubeconfig document. Throws
// std::runtime_error when the context, cluster or server cannot be found.
KubeApiConnection parse_kubeconfig(const std::string& document);

// Converts API objects into the types the checks consume
class KubeDecoder {
public:
    static ServerVersion server_version(const nlohmann::json& obj);
    static Pod pod(const nlohmann::json& obj);
    static Deployment deployment(const nlohmann::json& obj);
    static DaemonSet daemon_set(const nlohmann::json& obj);
    static Secret secret(const nlohmann::json& obj);
    static ConfigMap config_map(const nlohmann::json& obj);
    static Service service(const nlohmann::json& obj);
    static TrafficSplit traffic_split(const nlohmann::json& obj);
    static RbacRole role(const nlohmann::json& obj);
    static ApiService api_service(const nlohmann::json& obj);

    static std::string base64_decode(const std::string& encoded);
};

class KubeClient : public ClusterClient {
public:
    KubeClient(const KubeApiConnection& connection, int timeout_ms = 30000);
    ~KubeClient() override;

    KubeClient(const KubeClient&) = delete;
    KubeClient& operator=(const KubeClient&) = delete;

    ServerVersion server_version() override;
    bool namespace_exists(const std::string& ns) override;

    std::vector<Pod> list_pods(const std::string& ns, const std::string& selector) override;
    std::vector<Deployment> list_deployments(const std::string& ns, const std::string& selector) override;
    Deployment get_deployment(const std::string& ns, const std::string& name) override;
    DaemonSet get_daemon_set(const std::string& ns, const std::string& name) override;

    Secret get_secret(const std::string& ns, const std::string& name) override;
    std::vector<Secret> list_secrets(const std::string& ns) override;
    ConfigMap get_config_map(const std::string& ns, const std::string& name) override;

    std::vector<Service> list_services(const std::string& ns, const std::string& selector) override;
    std::vector<TrafficSplit> list_traffic_splits(const std::string& ns) override;

    RbacRole get_cluster_role(const std::string& name) override;
    RbacRole get_role(const std::string& ns, const std::string& name) override;

    bool can_perform(const ResourceAccess& access) override;

    std::string webhook_ca_bundle(WebhookKind kind, const std::string& name) override;
    ApiService get_api_service(const std::string& name) override;

private:
    KubeApiConnection connection_;
    int timeout_ms_;
    CURL* curl_;

    nlohmann::json make_request(const std::string& path, const nlohmann::json* body = nullptr);
    std::string collection_path(const std::string& prefix,
                                const std::string& ns,
                                const std::string& resource,
                                const std::string& selector = "");

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

class KubeClientFactory : public ClusterClientFactory {
public:
    KubeClientFactory(const KubeApiConnection& local, int timeout_ms);

    std::shared_ptr<ClusterClient> create_local() override;
    std::shared_ptr<ClusterClient> create_remote(const RemoteClusterDescriptor& descriptor) override;

private:
    KubeApiConnection local_;
    int timeout_ms_;
};
