#include "kube_client.hpp"
#include "remote_cluster.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>

namespace {

const nlohmann::json& empty_object() {
    static const nlohmann::json empty = nlohmann::json::object();
    return empty;
}

const nlohmann::json& field(const nlohmann::json& obj, const char* key) {
    if (obj.is_object()) {
        auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) {
            return *it;
        }
    }
    return empty_object();
}

std::string str(const nlohmann::json& obj, const char* key) {
    const auto& v = field(obj, key);
    return v.is_string() ? v.get<std::string>() : "";
}

int integer(const nlohmann::json& obj, const char* key) {
    const auto& v = field(obj, key);
    return v.is_number_integer() ? v.get<int>() : 0;
}

std::map<std::string, std::string> string_map(const nlohmann::json& obj, const char* key) {
    std::map<std::string, std::string> out;
    for (const auto& [k, v] : field(obj, key).items()) {
        if (v.is_string()) {
            out[k] = v.get<std::string>();
        }
    }
    return out;
}

std::vector<std::string> string_list(const nlohmann::json& obj, const char* key) {
    std::vector<std::string> out;
    const auto& list = field(obj, key);
    if (list.is_array()) {
        for (const auto& v : list) {
            if (v.is_string()) {
                out.push_back(v.get<std::string>());
            }
        }
    }
    return out;
}

const nlohmann::json& find_named(const nlohmann::json& list, const std::string& name, const char* what) {
    if (list.is_array()) {
        for (const auto& entry : list) {
            if (str(entry, "name") == name) {
                return entry;
            }
        }
    }
    throw std::runtime_error(fmt::format("kubeconfig has no {} named \"{}\"", what, name));
}

int leading_int(const std::string& s) {
    std::string digits;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) break;
        digits += c;
    }
    return digits.empty() ? 0 : std::stoi(digits);
}

template <typename T>
std::vector<T> decode_items(const nlohmann::json& list, T (*decode)(const nlohmann::json&)) {
    std::vector<T> out;
    const auto& items = field(list, "items");
    if (items.is_array()) {
        for (const auto& item : items) {
            out.push_back(decode(item));
        }
    }
    return out;
}

} // namespace

KubeApiConnection parse_kubeconfig(const std::string& document) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(document);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("unable to parse api config: {}", e.what()));
    }

    std::string current = str(doc, "current-context");
    const auto& contexts = field(doc, "contexts");
    if (current.empty() && contexts.is_array() && !contexts.empty()) {
        current = str(contexts.front(), "name");
    }
    if (current.empty()) {
        throw std::runtime_error("kubeconfig has no current context");
    }

    const auto& context = field(find_named(contexts, current, "context"), "context");
    const auto& cluster = field(find_named(field(doc, "clusters"), str(context, "cluster"), "cluster"), "cluster");

    KubeApiConnection conn;
    conn.server = str(cluster, "server");
    if (conn.server.empty()) {
        throw std::runtime_error(fmt::format("cluster \"{}\" has no server", str(context, "cluster")));
    }
    conn.ca_file = str(cluster, "certificate-authority");
    std::string ca_data = str(cluster, "certificate-authority-data");
    if (!ca_data.empty()) {
        conn.ca_data = KubeDecoder::base64_decode(ca_data);
    }
    const auto& insecure = field(cluster, "insecure-skip-tls-verify");
    conn.insecure_skip_verify = insecure.is_boolean() && insecure.get<bool>();

    std::string user_name = str(context, "user");
    if (!user_name.empty()) {
        conn.token = str(field(find_named(field(doc, "users"), user_name, "user"), "user"), "token");
    }
    return conn;
}

std::string KubeDecoder::base64_decode(const std::string& encoded) {
    std::string input;
    input.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            input += c;
        }
    }
    if (input.empty()) {
        return "";
    }
    if (input.size() % 4 != 0) {
        throw std::runtime_error("invalid base64 payload length");
    }

    std::string out(input.size() / 4 * 3, '\0');
    int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              reinterpret_cast<const unsigned char*>(input.data()),
                              static_cast<int>(input.size()));
    if (len < 0) {
        throw std::runtime_error("invalid base64 payload");
    }

    // EVP_DecodeBlock keeps the zero bytes that padding stands for
    size_t padding = 0;
    if (input[input.size() - 1] == '=') padding++;
    if (input[input.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

ServerVersion KubeDecoder::server_version(const nlohmann::json& obj) {
    ServerVersion v;
    v.major = leading_int(str(obj, "major"));
    v.minor = leading_int(str(obj, "minor"));
    v.git_version = str(obj, "gitVersion");
    return v;
}

Pod KubeDecoder::pod(const nlohmann::json& obj) {
    const auto& meta = field(obj, "metadata");
    const auto& status = field(obj, "status");

    Pod p;
    p.name = str(meta, "name");
    p.namespace_ = str(meta, "namespace");
    p.labels = string_map(meta, "labels");
    p.phase = str(status, "phase");

    const auto& statuses = field(status, "containerStatuses");
    if (statuses.is_array()) {
        for (const auto& cs : statuses) {
            ContainerStatus c;
            c.name = str(cs, "name");
            const auto& ready = field(cs, "ready");
            c.ready = ready.is_boolean() && ready.get<bool>();
            for (const auto& [state, detail] : field(cs, "state").items()) {
                c.state = state;
                c.reason = str(detail, "reason");
            }
            p.container_statuses.push_back(c);
        }
    }
    return p;
}

Deployment KubeDecoder::deployment(const nlohmann::json& obj) {
    const auto& meta = field(obj, "metadata");
    Deployment d;
    d.name = str(meta, "name");
    d.namespace_ = str(meta, "namespace");
    d.labels = string_map(meta, "labels");
    d.replicas = integer(field(obj, "spec"), "replicas");
    d.available_replicas = integer(field(obj, "status"), "availableReplicas");
    return d;
}

DaemonSet KubeDecoder::daemon_set(const nlohmann::json& obj) {
    const auto& meta = field(obj, "metadata");
    const auto& status = field(obj, "status");
    DaemonSet ds;
    ds.name = str(meta, "name");
    ds.namespace_ = str(meta, "namespace");
    ds.desired_number_scheduled = integer(status, "desiredNumberScheduled");
    ds.number_ready = integer(status, "numberReady");
    return ds;
}

Secret KubeDecoder::secret(const nlohmann::json& obj) {
    const auto& meta = field(obj, "metadata");
    Secret s;
    s.name = str(meta, "name");
    s.namespace_ = str(meta, "namespace");
    s.type = str(obj, "type");
    s.labels = string_map(meta, "labels");
    s.annotations = string_map(meta, "annotations");
    for (const auto& [key, value] : string_map(obj, "data")) {
        s.data[key] = base64_decode(value);
    }
    return s;
}

ConfigMap KubeDecoder::config_map(const nlohmann::json& obj) {
    const auto& meta = field(obj, "metadata");
    ConfigMap cm;
    cm.name = str(meta, "name");
    cm.namespace_ = str(meta, "namespace");
    cm.uid = str(meta, "uid");
    cm.data = string_map(obj, "data");
    return cm;
}

Service KubeDecoder::service(const nlohmann::json& obj) {
    const auto& meta = field(obj, "metadata");
    Service svc;
    svc.name = str(meta, "name");
    svc.namespace_ = str(meta, "namespace");
    svc.labels = string_map(meta, "labels");
    svc.annotations = string_map(meta, "annotations");
    return svc;
}

TrafficSplit KubeDecoder::traffic_split(const nlohmann::json& obj) {
    const auto& meta = field(obj, "metadata");
    const auto& spec = field(obj, "spec");
    TrafficSplit ts;
    ts.name = str(meta, "name");
    ts.namespace_ = str(meta, "namespace");
    ts.service = str(spec, "service");

    const auto& backends = field(spec, "backends");
    if (backends.is_array()) {
        for (const auto& b : backends) {
            TrafficSplitBackend backend;
            backend.service = str(b, "service");
            const auto& weight = field(b, "weight");
            if (weight.is_number_integer()) {
                backend.weight = std::to_string(weight.get<int64_t>());
            } else if (weight.is_string()) {
                backend.weight = weight.get<std::string>();
            }
            ts.backends.push_back(backend);
        }
    }
    return ts;
}

RbacRole KubeDecoder::role(const nlohmann::json& obj) {
    const auto& meta = field(obj, "metadata");
    RbacRole r;
    r.name = str(meta, "name");
    r.namespace_ = str(meta, "namespace");

    const auto& rules = field(obj, "rules");
    if (rules.is_array()) {
        for (const auto& rule : rules) {
            r.rules.push_back(PolicyRule{
                string_list(rule, "apiGroups"),
                string_list(rule, "resources"),
                string_list(rule, "verbs")
            });
        }
    }
    return r;
}

ApiService KubeDecoder::api_service(const nlohmann::json& obj) {
    ApiService svc;
    svc.name = str(field(obj, "metadata"), "name");
    svc.ca_bundle = base64_decode(str(field(obj, "spec"), "caBundle"));

    const auto& conditions = field(field(obj, "status"), "conditions");
    if (conditions.is_array()) {
        for (const auto& c : conditions) {
            if (str(c, "type") == "Available") {
                svc.available = ApiServiceCondition{str(c, "status"), str(c, "reason"), str(c, "message")};
                break;
            }
        }
    }
    return svc;
}

KubeClient::KubeClient(const KubeApiConnection& connection, int timeout_ms)
    : connection_(connection)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for Kubernetes API");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));

    if (connection_.insecure_skip_verify) {
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 0L);
    } else if (!connection_.ca_data.empty()) {
        struct curl_blob blob;
        blob.data = const_cast<char*>(connection_.ca_data.data());
        blob.len = connection_.ca_data.size();
        blob.flags = CURL_BLOB_COPY;
        curl_easy_setopt(curl_, CURLOPT_CAINFO_BLOB, &blob);
    } else if (!connection_.ca_file.empty()) {
        curl_easy_setopt(curl_, CURLOPT_CAINFO, connection_.ca_file.c_str());
    }
}

KubeClient::~KubeClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t KubeClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

nlohmann::json KubeClient::make_request(const std::string& path, const nlohmann::json* body) {
    long timeout = util::bounded_timeout_ms(std::chrono::milliseconds(timeout_ms_), deadline());
    if (timeout <= 0) {
        throw ClusterApiError(fmt::format("request to {} not sent: deadline exceeded", path));
    }

    std::string response_string;
    std::string url = connection_.server + path;
    std::string payload;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!connection_.token.empty()) {
        std::string auth = "Authorization: Bearer " + connection_.token;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout);

    if (body) {
        payload = body->dump();
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    } else {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        spdlog::warn("Kubernetes API request {} failed: {}", path, curl_easy_strerror(res));
        throw ClusterApiError(fmt::format("request to {} failed: {}", url, curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json response;
    try {
        response = nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        if (http_code >= 200 && http_code < 300) {
            throw ClusterApiError(fmt::format("failed to parse response from {}: {}", path, e.what()),
                                  static_cast<int>(http_code));
        }
    }

    if (http_code < 200 || http_code >= 300) {
        std::string message = str(response, "message");
        if (message.empty()) {
            message = fmt::format("{} returned HTTP {}", path, http_code);
        }
        throw ClusterApiError(message, static_cast<int>(http_code));
    }
    return response;
}

std::string KubeClient::collection_path(const std::string& prefix,
                                        const std::string& ns,
                                        const std::string& resource,
                                        const std::string& selector) {
    std::string path = prefix;
    if (!ns.empty()) {
        path += "/namespaces/" + ns;
    }
    path += "/" + resource;

    if (!selector.empty()) {
        char* escaped = curl_easy_escape(curl_, selector.c_str(), static_cast<int>(selector.size()));
        if (escaped) {
            path += "?labelSelector=" + std::string(escaped);
            curl_free(escaped);
        }
    }
    return path;
}

ServerVersion KubeClient::server_version() {
    return KubeDecoder::server_version(make_request("/version"));
}

bool KubeClient::namespace_exists(const std::string& ns) {
    try {
        make_request("/api/v1/namespaces/" + ns);
        return true;
    } catch (const ClusterApiError& e) {
        if (e.not_found()) {
            return false;
        }
        throw;
    }
}

std::vector<Pod> KubeClient::list_pods(const std::string& ns, const std::string& selector) {
    return decode_items(make_request(collection_path("/api/v1", ns, "pods", selector)), &KubeDecoder::pod);
}

std::vector<Deployment> KubeClient::list_deployments(const std::string& ns, const std::string& selector) {
    return decode_items(make_request(collection_path("/apis/apps/v1", ns, "deployments", selector)),
                        &KubeDecoder::deployment);
}

Deployment KubeClient::get_deployment(const std::string& ns, const std::string& name) {
    return KubeDecoder::deployment(make_request(collection_path("/apis/apps/v1", ns, "deployments") + "/" + name));
}

DaemonSet KubeClient::get_daemon_set(const std::string& ns, const std::string& name) {
    return KubeDecoder::daemon_set(make_request(collection_path("/apis/apps/v1", ns, "daemonsets") + "/" + name));
}

Secret KubeClient::get_secret(const std::string& ns, const std::string& name) {
    return KubeDecoder::secret(make_request(collection_path("/api/v1", ns, "secrets") + "/" + name));
}

std::vector<Secret> KubeClient::list_secrets(const std::string& ns) {
    return decode_items(make_request(collection_path("/api/v1", ns, "secrets")), &KubeDecoder::secret);
}

ConfigMap KubeClient::get_config_map(const std::string& ns, const std::string& name) {
    return KubeDecoder::config_map(make_request(collection_path("/api/v1", ns, "configmaps") + "/" + name));
}

std::vector<Service> KubeClient::list_services(const std::string& ns, const std::string& selector) {
    return decode_items(make_request(collection_path("/api/v1", ns, "services", selector)), &KubeDecoder::service);
}

std::vector<TrafficSplit> KubeClient::list_traffic_splits(const std::string& ns) {
    try {
        return decode_items(make_request(collection_path("/apis/split.smi-spec.io/v1alpha1", ns, "trafficsplits")),
                            &KubeDecoder::traffic_split);
    } catch (const ClusterApiError& e) {
        // The TrafficSplit CRD is optional
        if (e.not_found()) {
            return {};
        }
        throw;
    }
}

RbacRole KubeClient::get_cluster_role(const std::string& name) {
    return KubeDecoder::role(make_request("/apis/rbac.authorization.k8s.io/v1/clusterroles/" + name));
}

RbacRole KubeClient::get_role(const std::string& ns, const std::string& name) {
    return KubeDecoder::role(make_request(
        collection_path("/apis/rbac.authorization.k8s.io/v1", ns, "roles") + "/" + name));
}

bool KubeClient::can_perform(const ResourceAccess& access) {
    nlohmann::json review = {
        {"apiVersion", "authorization.k8s.io/v1"},
        {"kind", "SelfSubjectAccessReview"},
        {"spec", {
            {"resourceAttributes", {
                {"namespace", access.namespace_},
                {"verb", access.verb},
                {"group", access.group},
                {"version", access.version},
                {"resource", access.resource}
            }}
        }}
    };

    auto response = make_request("/apis/authorization.k8s.io/v1/selfsubjectaccessreviews", &review);
    const auto& allowed = field(field(response, "status"), "allowed");
    return allowed.is_boolean() && allowed.get<bool>();
}

std::string KubeClient::webhook_ca_bundle(WebhookKind kind, const std::string& name) {
    std::string resource = kind == WebhookKind::Mutating
        ? "mutatingwebhookconfigurations"
        : "validatingwebhookconfigurations";
    auto config = make_request("/apis/admissionregistration.k8s.io/v1/" + resource + "/" + name);

    const auto& webhooks = field(config, "webhooks");
    size_t count = webhooks.is_array() ? webhooks.size() : 0;
    if (count != 1) {
        throw std::runtime_error(fmt::format("expected 1 webhooks, found {}", count));
    }
    return KubeDecoder::base64_decode(str(field(webhooks[0], "clientConfig"), "caBundle"));
}

ApiService KubeClient::get_api_service(const std::string& name) {
    return KubeDecoder::api_service(make_request("/apis/apiregistration.k8s.io/v1/apiservices/" + name));
}

KubeClientFactory::KubeClientFactory(const KubeApiConnection& local, int timeout_ms)
    : local_(local)
    , timeout_ms_(timeout_ms) {}

std::shared_ptr<ClusterClient> KubeClientFactory::create_local() {
    if (local_.server.empty()) {
        throw std::runtime_error("no Kubernetes API server configured (set KUBE_API_SERVER)");
    }
    return std::make_shared<KubeClient>(local_, timeout_ms_);
}

std::shared_ptr<ClusterClient> KubeClientFactory::create_remote(const RemoteClusterDescriptor& descriptor) {
    spdlog::debug("Creating client for remote cluster {}", descriptor.cluster_name);
    return std::make_shared<KubeClient>(parse_kubeconfig(descriptor.api_config), timeout_ms_);
}
