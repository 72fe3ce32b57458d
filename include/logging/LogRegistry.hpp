#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace d8::logging {

class LogRegistry {
public:
    // Builds every subsystem logger from ConfigRegistry. Console output goes to stderr
    // so that `export download` can stream file bodies to stdout.
    static void init();

    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> d8()        { return get("d8"); }
    static std::shared_ptr<spdlog::logger> http()      { return get("http"); }
    static std::shared_ptr<spdlog::logger> transfer()  { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> publish()   { return get("publish"); }
    static std::shared_ptr<spdlog::logger> kube()      { return get("kube"); }
    static std::shared_ptr<spdlog::logger> shell()     { return get("shell"); }

    // -v lowers the console sink and every logger to debug
    static void setVerbose(bool verbose);

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

    static inline size_t max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t max_files_ = 3;
};

}
