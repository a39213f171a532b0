#include "config.hpp"
#include "health_checker.hpp"
#include "kube_client.hpp"
#include "public_api_client.hpp"
#include "report.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <sstream>
#include <chrono>
#include <memory>

namespace {
    const char* kOkStatus = "√";
    const char* kWarnStatus = "‼";
    const char* kFailStatus = "×";
    const char* kRetryStatus = "…";

    void print_table_result(const CheckResult& result, CategoryID& last_category) {
        if (result.category != last_category) {
            if (!last_category.empty()) {
                std::cout << "\n";
            }
            std::cout << result.category << "\n"
                      << std::string(result.category.size(), '-') << "\n";
            last_category = result.category;
        }

        if (result.retry) {
            std::cout << kRetryStatus << " " << result.description << " -- " << result.err->message << "\n";
            return;
        }
        if (result.ok()) {
            std::cout << kOkStatus << " " << result.description << "\n";
            return;
        }

        std::cout << (result.warning ? kWarnStatus : kFailStatus) << " " << result.description << "\n";
        std::istringstream lines(result.err->message);
        std::string line;
        while (std::getline(lines, line)) {
            std::cout << "    " << line << "\n";
        }
        std::cout << "    see " << result.hint_url << " for hints\n";
    }
}

// JSON reports own stdout, so their logs go to stderr
void setup_logging(const std::string& log_level, bool to_stderr) {
    spdlog::sink_ptr console_sink;
    if (to_stderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    auto logger = std::make_shared<spdlog::logger>("meshcheck", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::debug("Logging initialized at level: {}", log_level);
}

int main() {
    try {
        // Load configuration
        Config config = Config::from_env();
        setup_logging(config.log_level, config.output == "json");
        config.validate();

        spdlog::info("Starting {} against namespace {}", config.service_name, config.control_plane_namespace);

        KubeApiConnection local;
        local.server = config.kube_api_server;
        local.token = config.kube_token;
        local.ca_file = config.kube_ca_file;
        auto clients = std::make_shared<KubeClientFactory>(local, config.request_timeout_ms);

        std::shared_ptr<PublicApiClient> public_api;
        if (!config.public_api_addr.empty()) {
            public_api = std::make_shared<HttpPublicApiClient>(config.public_api_addr, config.request_timeout_ms);
        }

        HealthCheckOptions options;
        options.control_plane_namespace = config.control_plane_namespace;
        options.cni_namespace = config.cni_namespace;
        options.viz_namespace = config.viz_namespace;
        if (!config.check_categories.empty()) {
            options.categories = config.check_categories;
        } else if (config.pre_install) {
            options.categories = HealthChecker::pre_install_categories();
        } else {
            options.categories = HealthChecker::standard_categories();
        }
        options.multicluster = config.multicluster;
        if (config.wait_seconds > 0) {
            options.retry_deadline = std::chrono::system_clock::now() + std::chrono::seconds(config.wait_seconds);
        }
        options.retry_window = std::chrono::milliseconds(config.retry_window_ms);
        options.request_timeout = std::chrono::milliseconds(config.request_timeout_ms);
        options.hint_base_url = config.hint_base_url;

        HealthChecker checker(options, clients, public_api);

        bool as_json = config.output == "json";
        CategoryID last_category;
        JsonReport report;

        bool success = checker.run_checks([&](const CheckResult& result) {
            if (as_json) {
                report.add(result);
            } else {
                print_table_result(result, last_category);
            }
        });

        if (as_json) {
            std::cout << report.finish(success, checker.stopped_by()).dump(2) << std::endl;
        } else {
            if (checker.stopped_by()) {
                std::cout << "\n" << kFailStatus << " fatal check \"" << *checker.stopped_by()
                          << "\" failed; subsequent checks were skipped\n";
            }
            std::cout << "\nStatus check results are "
                      << (success ? kOkStatus : kFailStatus)
                      << (success && checker.had_warnings() ? " (with warnings)" : "") << std::endl;
        }

        spdlog::info("{} finished: success={}, warnings={}", config.service_name, success, checker.had_warnings());
        return success ? 0 : 1;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
