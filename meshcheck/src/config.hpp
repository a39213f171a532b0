#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Kubernetes API
    std::string kube_api_server;
    std::string kube_token;
    std::string kube_ca_file;

    // Control plane
    std::string control_plane_namespace;
    std::string cni_namespace;
    std::string viz_namespace;
    std::string public_api_addr;

    // Checks
    std::vector<std::string> check_categories;  // empty: the standard or pre-install set
    bool pre_install;
    bool multicluster;
    int wait_seconds;
    int retry_window_ms;
    int request_timeout_ms;
    std::string hint_base_url;

    // Output
    std::string output;  // "table" or "json"

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
