#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace d8::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static std::string level_name(const spdlog::level::level_enum lvl) {
    return to_std_string(spdlog::level::to_string_view(lvl));
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["d8"]       = level_name(rhs.d8);
        node["http"]     = level_name(rhs.http);
        node["transfer"] = level_name(rhs.transfer);
        node["publish"]  = level_name(rhs.publish);
        node["kube"]     = level_name(rhs.kube);
        node["shell"]    = level_name(rhs.shell);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.d8 = spdlog::level::from_str(node["d8"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        rhs.publish = spdlog::level::from_str(node["publish"].as<std::string>("info"));
        rhs.kube = spdlog::level::from_str(node["kube"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["console_log_level"] = level_name(rhs.levels.console_log_level);
        node["file_log_level"]    = level_name(rhs.levels.file_log_level);
        node["log_file"]          = rhs.log_file.string();
        node["subsystem_levels"]  = rhs.levels.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.levels.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.levels.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        rhs.log_file = node["log_file"].as<std::string>("");
        if (node["subsystem_levels"]) rhs.levels.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["download_concurrency"] = rhs.download_concurrency;
        node["upload_chunks"] = rhs.upload_chunks;
        node["error_body_limit"] = rhs.error_body_limit;
        node["connect_timeout_ms"] = rhs.connect_timeout.count();
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.download_concurrency = node["download_concurrency"].as<unsigned int>(DEFAULT_DOWNLOAD_CONCURRENCY);
        rhs.upload_chunks = node["upload_chunks"].as<unsigned int>(DEFAULT_UPLOAD_CHUNKS);
        rhs.error_body_limit = node["error_body_limit"].as<std::size_t>(DEFAULT_ERROR_BODY_LIMIT);
        rhs.connect_timeout = std::chrono::milliseconds(node["connect_timeout_ms"].as<long>(10000));
        if (rhs.download_concurrency == 0) rhs.download_concurrency = 1;
        return true;
    }
};

template<>
struct convert<PublishConfig> {
    static Node encode(const PublishConfig& rhs) {
        Node node;
        node["probe_timeout_ms"] = rhs.probe_timeout.count();
        node["service_namespace"] = rhs.service_namespace;
        node["service_name"] = rhs.service_name;
        node["server_name"] = rhs.server_name;
        return node;
    }

    static bool decode(const Node& node, PublishConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.probe_timeout = std::chrono::milliseconds(node["probe_timeout_ms"].as<long>(3000));
        rhs.service_namespace = node["service_namespace"].as<std::string>("default");
        rhs.service_name = node["service_name"].as<std::string>("kubernetes");
        rhs.server_name = node["server_name"].as<std::string>("kubernetes.default.svc");
        return true;
    }
};

template<>
struct convert<KubernetesConfig> {
    static Node encode(const KubernetesConfig& rhs) {
        Node node;
        node["kubeconfig"] = rhs.kubeconfig.string();
        node["context"] = rhs.context;
        node["ready_attempts"] = rhs.ready_attempts;
        node["ready_interval_ms"] = rhs.ready_interval.count();
        return node;
    }

    static bool decode(const Node& node, KubernetesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.kubeconfig = node["kubeconfig"].as<std::string>("");
        rhs.context = node["context"].as<std::string>("");
        rhs.ready_attempts = node["ready_attempts"].as<unsigned int>(60);
        rhs.ready_interval = std::chrono::milliseconds(node["ready_interval_ms"].as<long>(3000));
        return true;
    }
};

template<>
struct convert<DefaultsConfig> {
    static Node encode(const DefaultsConfig& rhs) {
        Node node;
        node["namespace"] = rhs.namespace_;
        node["ttl"] = rhs.ttl;
        node["delete_prompt_timeout_s"] = rhs.delete_prompt_timeout.count();
        return node;
    }

    static bool decode(const Node& node, DefaultsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.namespace_ = node["namespace"].as<std::string>("d8-data-exporter");
        rhs.ttl = node["ttl"].as<std::string>("2m");
        rhs.delete_prompt_timeout = std::chrono::seconds(node["delete_prompt_timeout_s"].as<long>(30));
        return true;
    }
};

}
