#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

#include "../support/TempDir.hpp"

using namespace d8::config;
using d8::test::TempDir;

TEST(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig("/nonexistent/d8-data/config.yaml");
    EXPECT_EQ(cfg.transfer.download_concurrency, DEFAULT_DOWNLOAD_CONCURRENCY);
    EXPECT_EQ(cfg.transfer.upload_chunks, DEFAULT_UPLOAD_CHUNKS);
    EXPECT_EQ(cfg.transfer.error_body_limit, DEFAULT_ERROR_BODY_LIMIT);
    EXPECT_EQ(cfg.defaults.namespace_, "d8-data-exporter");
    EXPECT_EQ(cfg.defaults.ttl, "2m");
    EXPECT_EQ(cfg.kube.ready_attempts, 60u);
}

TEST(ConfigTest, OverridesOnlyWhatIsPresent) {
    TempDir tmp;
    const auto path = tmp.write("config.yaml", R"(
logging:
  log_file: /tmp/d8-data.log
  console_log_level: debug
  subsystem_levels:
    http: debug
transfer:
  download_concurrency: 4
  connect_timeout_ms: 2500
publish:
  probe_timeout_ms: 500
kube:
  context: staging
defaults:
  namespace: backups
  ttl: 15m
)");
    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.logging.log_file, "/tmp/d8-data.log");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.http, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.transfer, spdlog::level::info);
    EXPECT_EQ(cfg.transfer.download_concurrency, 4u);
    EXPECT_EQ(cfg.transfer.upload_chunks, DEFAULT_UPLOAD_CHUNKS);
    EXPECT_EQ(cfg.transfer.connect_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(cfg.publish.probe_timeout, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.publish.service_name, "kubernetes");
    EXPECT_EQ(cfg.kube.context, "staging");
    EXPECT_EQ(cfg.defaults.namespace_, "backups");
    EXPECT_EQ(cfg.defaults.ttl, "15m");
}

TEST(ConfigTest, ZeroConcurrencyIsClampedToOne) {
    TempDir tmp;
    const auto cfg = loadConfig(tmp.write("config.yaml", "transfer:\n  download_concurrency: 0\n"));
    EXPECT_EQ(cfg.transfer.download_concurrency, 1u);
}

TEST(ConfigTest, UnparsableFileThrows) {
    TempDir tmp;
    EXPECT_THROW(loadConfig(tmp.write("config.yaml", "transfer: [oops\n")), std::runtime_error);
}

TEST(ConfigRegistryTest, IsInitializedForTests) {
    EXPECT_TRUE(ConfigRegistry::isInitialized());
    EXPECT_EQ(ConfigRegistry::get().defaults.namespace_, "d8-data-exporter");
}
