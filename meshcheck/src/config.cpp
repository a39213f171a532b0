#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {
    const char* kServiceAccountDir = "/var/run/secrets/kubernetes.io/serviceaccount";

    std::string read_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return "";
        std::stringstream ss;
        ss << in.rdbuf();
        std::string content = ss.str();
        content.erase(content.find_last_not_of(" \t\n\r") + 1);
        return content;
    }
}

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    std::string val = get_env(name);
    if (val.empty()) return default_val;
    return val == "1" || val == "true" || val == "yes";
}

Config Config::from_env() {
    Config cfg;

    cfg.kube_api_server = get_env("KUBE_API_SERVER");
    cfg.kube_token = get_env("KUBE_TOKEN");
    cfg.kube_ca_file = get_env("KUBE_CA_FILE");

    // Fall back to the in-cluster service account
    std::string host = get_env("KUBERNETES_SERVICE_HOST");
    if (cfg.kube_api_server.empty() && !host.empty()) {
        cfg.kube_api_server = "https://" + host + ":" + get_env("KUBERNETES_SERVICE_PORT", "443");
        if (cfg.kube_token.empty()) {
            cfg.kube_token = read_file(std::string(kServiceAccountDir) + "/token");
        }
        if (cfg.kube_ca_file.empty()) {
            cfg.kube_ca_file = std::string(kServiceAccountDir) + "/ca.crt";
        }
    }

    cfg.control_plane_namespace = get_env("CONTROL_PLANE_NAMESPACE", "linkerd");
    cfg.cni_namespace = get_env("CNI_NAMESPACE", "linkerd-cni");
    cfg.viz_namespace = get_env("VIZ_NAMESPACE", "linkerd-viz");
    cfg.public_api_addr = get_env("PUBLIC_API_ADDR");

    cfg.check_categories = util::split(get_env("CHECK_CATEGORIES"), ',');
    cfg.pre_install = get_env_bool("PRE_INSTALL", false);
    cfg.multicluster = get_env_bool("MULTICLUSTER", false);
    cfg.wait_seconds = get_env_int("WAIT_SECONDS", 300);
    cfg.retry_window_ms = get_env_int("RETRY_WINDOW_MS", 5000);
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 30000);
    cfg.hint_base_url = get_env("HINT_BASE_URL", "https://linkerd.io/2/checks/#");

    cfg.output = get_env("OUTPUT", "table");

    cfg.service_name = get_env("SERVICE_NAME", "meshcheck");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (output != "table" && output != "json") {
        throw std::runtime_error("OUTPUT must be 'table' or 'json'");
    }
    if (wait_seconds < 0) {
        throw std::runtime_error("WAIT_SECONDS must not be negative");
    }
    if (retry_window_ms <= 0 || request_timeout_ms <= 0) {
        throw std::runtime_error("RETRY_WINDOW_MS and REQUEST_TIMEOUT_MS must be positive");
    }

    spdlog::debug("Configuration validated successfully");
    spdlog::debug("  Control plane namespace: {}", control_plane_namespace);
    spdlog::debug("  Categories: {}", !check_categories.empty() ? util::join(check_categories, ",")
                                      : (pre_install ? "pre-install" : "standard"));
    spdlog::debug("  Retry: deadline={}s, window={}ms, timeout={}ms",
                  wait_seconds, retry_window_ms, request_timeout_ms);
}
