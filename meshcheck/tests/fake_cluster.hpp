#pragma once

#include "../src/cluster_client.hpp"
#include "../src/public_api_client.hpp"
#include "../src/remote_cluster.hpp"
#include "../src/util.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

// In-memory cluster API. Missing objects raise a 404 ClusterApiError; list
// calls honour "key=value" and bare "key" selector terms.
class FakeClusterClient : public ClusterClient {
public:
    ServerVersion version{1, 29, "v1.29.2"};
    std::set<std::string> namespaces;
    std::vector<Pod> pods;
    std::vector<Deployment> deployments;
    std::vector<DaemonSet> daemon_sets;
    std::vector<Secret> secrets;
    std::vector<ConfigMap> config_maps;
    std::vector<Service> services;
    std::vector<TrafficSplit> traffic_splits;
    std::map<std::string, RbacRole> cluster_roles;
    std::map<std::pair<std::string, std::string>, RbacRole> roles;
    std::set<std::string> allowed_verbs{"get", "list", "watch"};
    std::map<std::pair<WebhookKind, std::string>, std::string> webhook_bundles;
    std::map<std::string, ApiService> api_services;

    // Thrown from every call when set
    std::optional<ClusterApiError> unreachable;

    // Deadline in force during the most recent call
    std::optional<std::chrono::steady_clock::time_point> last_deadline;

    ServerVersion server_version() override {
        fail_if_unreachable();
        return version;
    }

    bool namespace_exists(const std::string& ns) override {
        fail_if_unreachable();
        return namespaces.count(ns) > 0;
    }

    std::vector<Pod> list_pods(const std::string& ns, const std::string& selector) override {
        fail_if_unreachable();
        std::vector<Pod> out;
        for (const auto& p : pods) {
            if (in_namespace(p.namespace_, ns) && matches(p.labels, selector)) out.push_back(p);
        }
        return out;
    }

    std::vector<Deployment> list_deployments(const std::string& ns, const std::string& selector) override {
        fail_if_unreachable();
        std::vector<Deployment> out;
        for (const auto& d : deployments) {
            if (in_namespace(d.namespace_, ns) && matches(d.labels, selector)) out.push_back(d);
        }
        return out;
    }

    Deployment get_deployment(const std::string& ns, const std::string& name) override {
        return find(deployments, ns, name, "deployments");
    }

    DaemonSet get_daemon_set(const std::string& ns, const std::string& name) override {
        return find(daemon_sets, ns, name, "daemonsets");
    }

    Secret get_secret(const std::string& ns, const std::string& name) override {
        return find(secrets, ns, name, "secrets");
    }

    std::vector<Secret> list_secrets(const std::string& ns) override {
        fail_if_unreachable();
        std::vector<Secret> out;
        for (const auto& s : secrets) {
            if (in_namespace(s.namespace_, ns)) out.push_back(s);
        }
        return out;
    }

    ConfigMap get_config_map(const std::string& ns, const std::string& name) override {
        return find(config_maps, ns, name, "configmaps");
    }

    std::vector<Service> list_services(const std::string& ns, const std::string& selector) override {
        fail_if_unreachable();
        std::vector<Service> out;
        for (const auto& s : services) {
            if (in_namespace(s.namespace_, ns) && matches(s.labels, selector)) out.push_back(s);
        }
        return out;
    }

    std::vector<TrafficSplit> list_traffic_splits(const std::string& ns) override {
        fail_if_unreachable();
        std::vector<TrafficSplit> out;
        for (const auto& ts : traffic_splits) {
            if (in_namespace(ts.namespace_, ns)) out.push_back(ts);
        }
        return out;
    }

    RbacRole get_cluster_role(const std::string& name) override {
        fail_if_unreachable();
        auto it = cluster_roles.find(name);
        if (it == cluster_roles.end()) {
            throw ClusterApiError("clusterroles \"" + name + "\" not found", 404);
        }
        return it->second;
    }

    RbacRole get_role(const std::string& ns, const std::string& name) override {
        fail_if_unreachable();
        auto it = roles.find({ns, name});
        if (it == roles.end()) {
            throw ClusterApiError("roles \"" + name + "\" not found", 404);
        }
        return it->second;
    }

    bool can_perform(const ResourceAccess& access) override {
        fail_if_unreachable();
        return allowed_verbs.count(access.verb) > 0;
    }

    std::string webhook_ca_bundle(WebhookKind kind, const std::string& name) override {
        fail_if_unreachable();
        auto it = webhook_bundles.find({kind, name});
        if (it == webhook_bundles.end()) {
            throw ClusterApiError("webhook configuration \"" + name + "\" not found", 404);
        }
        return it->second;
    }

    ApiService get_api_service(const std::string& name) override {
        fail_if_unreachable();
        auto it = api_services.find(name);
        if (it == api_services.end()) {
            throw ClusterApiError("apiservices.apiregistration.k8s.io \"" + name + "\" not found", 404);
        }
        return it->second;
    }

    static bool matches(const Labels& labels, const std::string& selector) {
        for (const auto& term : util::split(selector, ',')) {
            auto eq = term.find('=');
            if (eq == std::string::npos) {
                if (labels.count(term) == 0) return false;
                continue;
            }
            auto it = labels.find(term.substr(0, eq));
            if (it == labels.end() || it->second != term.substr(eq + 1)) return false;
        }
        return true;
    }

private:
    void fail_if_unreachable() {
        last_deadline = deadline();
        if (unreachable) throw *unreachable;
    }

    static bool in_namespace(const std::string& actual, const std::string& wanted) {
        return wanted.empty() || actual == wanted;
    }

    template <typename T>
    T find(const std::vector<T>& items, const std::string& ns, const std::string& name, const std::string& kind) {
        fail_if_unreachable();
        for (const auto& item : items) {
            if (item.namespace_ == ns && item.name == name) return item;
        }
        throw ClusterApiError(kind + " \"" + name + "\" not found", 404);
    }
};

// Hands out the local fake and one fake per remote cluster name
class FakeClusterClientFactory : public ClusterClientFactory {
public:
    std::shared_ptr<FakeClusterClient> local = std::make_shared<FakeClusterClient>();
    std::map<std::string, std::shared_ptr<FakeClusterClient>> remotes;
    int local_creations = 0;

    std::shared_ptr<ClusterClient> create_local() override {
        ++local_creations;
        return local;
    }

    std::shared_ptr<ClusterClient> create_remote(const RemoteClusterDescriptor& descriptor) override {
        auto it = remotes.find(descriptor.cluster_name);
        if (it == remotes.end()) {
            throw std::runtime_error("no API config for cluster " + descriptor.cluster_name);
        }
        return it->second;
    }
};

// Replays one self-check batch per call; the last batch repeats
class FakePublicApiClient : public PublicApiClient {
public:
    std::vector<std::vector<SelfCheckResult>> batches;
    std::vector<GatewayStatus> gateway_rows;
    std::optional<std::string> transport_error;
    int self_check_calls = 0;
    std::optional<std::chrono::steady_clock::time_point> last_deadline;

    std::vector<SelfCheckResult> self_check() override {
        ++self_check_calls;
        last_deadline = deadline();
        if (transport_error) {
            throw PublicApiError(*transport_error);
        }
        if (batches.empty()) {
            return {};
        }
        size_t idx = std::min(static_cast<size_t>(self_check_calls - 1), batches.size() - 1);
        return batches[idx];
    }

    std::vector<GatewayStatus> gateways(const std::string&) override {
        last_deadline = deadline();
        if (transport_error) {
            throw PublicApiError(*transport_error);
        }
        return gateway_rows;
    }
};
