#include "server_options.h"
#include "test_utils.h"
#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>

TEST(ServerOptionsTest, Defaults) {
    ServerOptions opts = ServerOptions::parse({});
    EXPECT_EQ(opts.host, "0.0.0.0");
    EXPECT_EQ(opts.port, 5000);
    EXPECT_FALSE(opts.sync);
}

TEST(ServerOptionsTest, ParsesFlags) {
    ServerOptions opts = ServerOptions::parse(
        {"--root", "/tmp/blobs", "--capacity", "64", "--mode", "bytes",
         "--keys", "structured", "--port", "8080", "--sync", "--quiet"});
    EXPECT_EQ(opts.port, 8080);

    CacheConfig config = opts.to_config();
    EXPECT_EQ(config.root_directory.string(), "/tmp/blobs");
    EXPECT_EQ(config.capacity, 64u);
    EXPECT_EQ(config.capacity_mode, CapacityMode::Bytes);
    EXPECT_EQ(config.key_strategy, KeyStrategy::Structured);
    EXPECT_TRUE(config.sync_writes);
    EXPECT_FALSE(config.log_events);
}

TEST(ServerOptionsTest, BadPortIsReportedNotFatal) {
    EXPECT_THROW(ServerOptions::parse({"--port", "http"}), std::invalid_argument);
    EXPECT_THROW(ServerOptions::parse({"--port", "-1"}), std::invalid_argument);
    EXPECT_THROW(ServerOptions::parse({"--port", "70000"}), std::invalid_argument);
    EXPECT_THROW(ServerOptions::parse({"--port", "99999999999999999999999"}), std::invalid_argument);
    EXPECT_THROW(ServerOptions::parse({"--port"}), std::invalid_argument);
}

TEST(ServerOptionsTest, RejectsUnknownFlagsAndBadCapacity) {
    EXPECT_THROW(ServerOptions::parse({"--verbose"}), std::invalid_argument);

    ServerOptions opts = ServerOptions::parse({"--root", "/tmp/blobs", "--capacity", "-5"});
    EXPECT_THROW(opts.to_config(), std::invalid_argument);
}

TEST(ServerOptionsTest, FlagsOverrideConfigFile) {
    TempDir dir;
    auto path = dir.path() / "cache.json";
    std::ofstream(path) << R"({"root_directory": "/var/cache/blobs", "capacity": 10})";

    ServerOptions opts = ServerOptions::parse({"--config", path.string(), "--capacity", "20"});
    CacheConfig config = opts.to_config();
    EXPECT_EQ(config.root_directory.string(), "/var/cache/blobs");
    EXPECT_EQ(config.capacity, 20u);
}
