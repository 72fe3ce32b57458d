#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace d8::logging {

void LogRegistry::init() {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cnf.log_file.empty()) {
        namespace fs = std::filesystem;
        if (const auto dir = cnf.log_file.parent_path(); !dir.empty() && !fs::exists(dir))
            fs::create_directories(dir);

        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cnf.log_file.string(), max_bytes_, max_files_);
        file_sink_->set_level(cnf.levels.file_log_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("d8",       sub_levels.d8);
    makeLogger("http",     sub_levels.http);
    makeLogger("transfer", sub_levels.transfer);
    makeLogger("publish",  sub_levels.publish);
    makeLogger("kube",     sub_levels.kube);
    makeLogger("shell",    sub_levels.shell);

    initialized_ = true;
    d8()->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

void LogRegistry::setVerbose(const bool verbose) {
    if (!initialized_ || !verbose) return;
    console_sink_->set_level(spdlog::level::debug);
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) {
        lg->set_level(spdlog::level::debug);
    });
}

bool LogRegistry::isInitialized() { return initialized_; }

}
