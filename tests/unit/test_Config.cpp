#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/util.hpp"
#include "fakes.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using namespace tf::config;

TEST(ConfigTest, DefaultsDeriveFromHardware) {
    const Config cfg;
    EXPECT_GE(cfg.thumbnails.worker_threads, 4u);
    EXPECT_LE(cfg.thumbnails.worker_threads, 16u);
    EXPECT_EQ(cfg.scheduler.visible_heavy, (LaneQuota{8, 1, 1}));
    EXPECT_EQ(cfg.scheduler.balanced, (LaneQuota{6, 2, 1}));
    EXPECT_EQ(cfg.scheduler.side_heavy, (LaneQuota{4, 3, 3}));
    EXPECT_EQ(cfg.http.port, 33380);
}

TEST(ConfigTest, LoadsYamlOverrides) {
    tf::test::TempDir dir;
    const auto file = dir.touch("thumbforge.yaml", R"YAML(
thumbnails:
  worker_threads: 3
  thumbnail_size: 128
  memory_cache_budget: 1GB
scheduler:
  balanced_quota: [5, 3, 2]
database:
  path: /tmp/x.db
  read_batch_max: 32
logging:
  log_levels:
    console_log_level: debug
    subsystem_levels:
      db: trace
)YAML");

    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.thumbnails.worker_threads, 3u);
    EXPECT_EQ(cfg.thumbnails.thumbnail_size, 128u);
    EXPECT_EQ(cfg.thumbnails.memory_cache_byte_budget, 1024ull * 1024 * 1024);
    EXPECT_EQ(cfg.thumbnails.jpeg_quality, 85);
    EXPECT_EQ(cfg.scheduler.balanced, (LaneQuota{5, 3, 2}));
    EXPECT_EQ(cfg.scheduler.visible_heavy, (LaneQuota{8, 1, 1}));
    EXPECT_EQ(cfg.database.path.string(), "/tmp/x.db");
    EXPECT_EQ(cfg.database.read_batch_max, 32u);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.db, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.thumb, spdlog::level::warn);
}

TEST(ConfigTest, RejectsInvalidValues) {
    tf::test::TempDir dir;
    EXPECT_THROW(loadConfig(dir.touch("a.yaml", "thumbnails:\n  worker_threads: 0\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(dir.touch("b.yaml", "database:\n  read_batch_min: 64\n  read_batch_max: 8\n")),
                 std::runtime_error);
    EXPECT_THROW(loadConfig(dir.touch("c.yaml", "scheduler:\n  balanced_quota: [1, 2]\n")), YAML::Exception);
}

TEST(ConfigTest, EngineSubsetCarriesSections) {
    Config cfg;
    cfg.thumbnails.worker_threads = 6;
    cfg.stages.encode_max_active = 2;
    const auto engine = cfg.engine();
    EXPECT_EQ(engine.thumbnails.worker_threads, 6u);
    EXPECT_EQ(engine.encodeMaxActive(), 2u);
    EXPECT_EQ(engine.decodeMaxActive(), 3u);
    EXPECT_EQ(engine.scaleMaxActive(), 4u);
}

TEST(ConfigTest, JsonRoundTrip) {
    Config cfg;
    cfg.thumbnails.worker_threads = 5;
    cfg.scheduler.side_heavy = {2, 2, 2};
    cfg.http.port = 9000;
    cfg.logging.levels.subsystem_levels.cache = spdlog::level::debug;

    const nlohmann::json j = cfg;
    EXPECT_EQ(j["thumbnails"]["worker_threads"], 5);
    EXPECT_EQ(j["scheduler"]["side_heavy_quota"], nlohmann::json::array({2, 2, 2}));

    const auto back = j.get<Config>();
    EXPECT_EQ(back.thumbnails.worker_threads, 5u);
    EXPECT_EQ(back.scheduler.side_heavy, (LaneQuota{2, 2, 2}));
    EXPECT_EQ(back.http.port, 9000);
    EXPECT_EQ(back.logging.levels.subsystem_levels.cache, spdlog::level::debug);
}

TEST(ConfigUtilTest, ParsesSizeStrings) {
    EXPECT_EQ(parseByteSize("256MB"), 256ull * 1024 * 1024);
    EXPECT_EQ(parseByteSize("2G"), 2ull * 1024 * 1024 * 1024);
    EXPECT_EQ(parseByteSize("64"), 64ull * 1024 * 1024);
    EXPECT_EQ(parseByteSize(" 512kb "), 512ull * 1024);
    EXPECT_THROW(parseByteSize(""), std::invalid_argument);
    EXPECT_THROW(parseByteSize("12XB"), std::invalid_argument);
    EXPECT_THROW(parseByteSize("GB"), std::invalid_argument);
    EXPECT_EQ(formatByteSize(512ull * 1024 * 1024), "512MB");
    EXPECT_EQ(formatByteSize(1024ull * 1024 * 1024), "1GB");
    EXPECT_EQ(formatByteSize(1536ull * 1024), "1536KB");
}
