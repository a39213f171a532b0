#pragma once

#include "check.hpp"
#include <string>
#include <vector>

// Category ids, in the order the standard categories run
namespace categories {
    inline const CategoryID kKubernetesAPI = "kubernetes-api";
    inline const CategoryID kKubernetesVersion = "kubernetes-version";
    inline const CategoryID kPreInstall = "pre-kubernetes-setup";
    inline const CategoryID kControlPlaneExistence = "linkerd-existence";
    inline const CategoryID kConfig = "linkerd-config";
    inline const CategoryID kCNIPlugin = "linkerd-cni-plugin";
    inline const CategoryID kIdentity = "linkerd-identity";
    inline const CategoryID kWebhooksAndAPISvcTLS = "linkerd-webhooks-and-apisvc-tls";
    inline const CategoryID kControlPlaneAPI = "linkerd-api";
    inline const CategoryID kHA = "linkerd-ha-checks";
    inline const CategoryID kMulticluster = "linkerd-multicluster";

    // Synthetic category that receives checks added through add_check()
    inline const CategoryID kAdHoc = "ad-hoc";
}

class Category {
public:
    Category(const CategoryID& id, std::vector<Checker> checkers, bool enabled = false)
        : id_(id), checkers_(std::move(checkers)), enabled_(enabled) {}

    Category& with_hint_base_url(const std::string& url) {
        hint_base_url_ = url;
        return *this;
    }

    const CategoryID& id() const { return id_; }
    const std::vector<Checker>& checkers() const { return checkers_; }
    bool enabled() const { return enabled_; }
    const std::string& hint_base_url() const { return hint_base_url_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }
    void add_checker(Checker checker) { checkers_.push_back(std::move(checker)); }

private:
    CategoryID id_;
    std::vector<Checker> checkers_;
    bool enabled_;
    std::string hint_base_url_;
};
