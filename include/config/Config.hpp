#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace d8::config {

constexpr static unsigned int DEFAULT_DOWNLOAD_CONCURRENCY = 10;
constexpr static unsigned int DEFAULT_UPLOAD_CHUNKS = 10;
constexpr static std::size_t DEFAULT_ERROR_BODY_LIMIT = 1000;

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum d8        = spdlog::level::info;   // Command start/finish, prompts
    spdlog::level::level_enum http      = spdlog::level::warn;   // Transport failures only
    spdlog::level::level_enum transfer  = spdlog::level::info;   // Per-file progress and totals
    spdlog::level::level_enum publish   = spdlog::level::info;   // Auto-detect branch taken
    spdlog::level::level_enum kube      = spdlog::level::info;   // Resource create/delete/readiness
    spdlog::level::level_enum shell     = spdlog::level::warn;   // Argument parsing edge cases
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    std::filesystem::path log_file; // empty = console only
};

struct TransferConfig {
    unsigned int download_concurrency = DEFAULT_DOWNLOAD_CONCURRENCY;
    unsigned int upload_chunks = DEFAULT_UPLOAD_CHUNKS;
    std::size_t error_body_limit = DEFAULT_ERROR_BODY_LIMIT;
    std::chrono::milliseconds connect_timeout{10000};
};

struct PublishConfig {
    std::chrono::milliseconds probe_timeout{3000};
    std::string service_namespace = "default";
    std::string service_name = "kubernetes";
    std::string server_name = "kubernetes.default.svc";
};

struct KubernetesConfig {
    std::filesystem::path kubeconfig; // empty = $KUBECONFIG, then ~/.kube/config
    std::string context;
    unsigned int ready_attempts = 60;
    std::chrono::milliseconds ready_interval{3000};
};

struct DefaultsConfig {
    std::string namespace_ = "d8-data-exporter";
    std::string ttl = "2m";
    std::chrono::seconds delete_prompt_timeout{30};
};

struct Config {
    LoggingConfig logging;
    TransferConfig transfer;
    PublishConfig publish;
    KubernetesConfig kube;
    DefaultsConfig defaults;
};

// Missing file yields defaults; a file that exists but does not parse throws.
Config loadConfig(const std::filesystem::path& path);

} // namespace d8::config
