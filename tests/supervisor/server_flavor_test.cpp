// Orexa - Game Server Supervisor
// Tests for per-flavor server rules

#include <gtest/gtest.h>
#include "orexa/supervisor/server_flavor.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace orexa {
namespace supervisor {
namespace test {

namespace fs = std::filesystem;

class ServerFlavorTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() /
                   ("orexa_flavor_test_" + std::to_string(getpid()));
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    void touch(const fs::path& path) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << "jar";
    }

    static bool containsFlag(const std::vector<std::string>& flags, const std::string& flag) {
        return std::find(flags.begin(), flags.end(), flag) != flags.end();
    }

    fs::path testDir_;
};

// =============================================================================
// Classification and Commands
// =============================================================================

TEST_F(ServerFlavorTest, ClassifiesTypes) {
    EXPECT_TRUE(isBukkitType("paper"));
    EXPECT_TRUE(isBukkitType("Purpur"));
    EXPECT_FALSE(isBukkitType("vanilla"));
    EXPECT_TRUE(isModdedType("neoforge"));
    EXPECT_FALSE(isModdedType("paper"));
    EXPECT_TRUE(isProxyType("velocity"));
}

TEST_F(ServerFlavorTest, ListCommandIsNamespacedOnBukkit) {
    EXPECT_EQ(listCommandForType("paper"), "minecraft:list");
    EXPECT_EQ(listCommandForType("vanilla"), "list");
    EXPECT_EQ(listCommandForType("forge"), "list");
}

TEST_F(ServerFlavorTest, TpsCommandPerFlavor) {
    EXPECT_EQ(tpsCommandForType("spigot", false), std::optional<std::string>("tps"));
    EXPECT_EQ(tpsCommandForType("forge", false), std::optional<std::string>("forge tps"));
    EXPECT_EQ(tpsCommandForType("neoforge", false), std::optional<std::string>("neoforge tps"));
    EXPECT_FALSE(tpsCommandForType("fabric", false).has_value());
    EXPECT_EQ(tpsCommandForType("fabric", true), std::optional<std::string>("fabric tps"));
    EXPECT_FALSE(tpsCommandForType("vanilla", true).has_value());
    EXPECT_FALSE(tpsCommandForType("velocity", true).has_value());
}

// =============================================================================
// JVM Flags
// =============================================================================

TEST_F(ServerFlavorTest, AikarsPresetUsesG1) {
    auto flags = buildJvmFlags("aikars", false);

    EXPECT_TRUE(containsFlag(flags, "-XX:+UseG1GC"));
    EXPECT_TRUE(containsFlag(flags, "-Daikars.new.flags=true"));
    EXPECT_FALSE(containsFlag(flags, "-XX:+AlwaysPreTouch"));
}

TEST_F(ServerFlavorTest, UnknownPresetFallsBackToBaseline) {
    auto flags = buildJvmFlags("turbo", true);

    ASSERT_EQ(flags.size(), 2u);
    EXPECT_EQ(flags[0], "--add-modules=jdk.incubator.vector");
    EXPECT_EQ(flags[1], "-XX:+AlwaysPreTouch");
}

TEST_F(ServerFlavorTest, LaunchCommandLayout) {
    InstanceConfig config;
    config.maxRam = "4G";
    config.minRam = "2G";
    config.flags = "none";
    config.jarFile = "paper-1.21.1.jar";

    auto argv = buildLaunchCommand(config, "/usr/bin/java");

    std::vector<std::string> expected = {
        "/usr/bin/java", "-Xmx4G", "-Xms2G", "--add-modules=jdk.incubator.vector",
        "-jar", "paper-1.21.1.jar", "nogui"};
    EXPECT_EQ(argv, expected);
}

TEST_F(ServerFlavorTest, ManagedJvmArgsFileIsWrittenOnce) {
    std::string path = (testDir_ / JVM_ARGS_FILE).string();
    std::vector<std::string> flags = buildJvmFlags("modded", false);

    ASSERT_TRUE(writeManagedJvmArgs(path, flags).isSuccess());
    auto firstWrite = fs::last_write_time(path);

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str().rfind(MANAGED_JVM_ARGS_HEADER, 0), 0u);
    EXPECT_NE(content.str().find("-XX:G1HeapRegionSize=16M\n"), std::string::npos);

    ASSERT_TRUE(writeManagedJvmArgs(path, flags).isSuccess());
    EXPECT_EQ(fs::last_write_time(path), firstWrite);
}

TEST_F(ServerFlavorTest, ManagedJvmArgsReportsUnwritablePath) {
    auto result = writeManagedJvmArgs((testDir_ / "missing" / JVM_ARGS_FILE).string(), {"-Xss1M"});

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::FileWriteError);
}

// =============================================================================
// Installed Mods and Plugins
// =============================================================================

TEST_F(ServerFlavorTest, FabricTpsDetection) {
    std::string mods = (testDir_ / "mods").string();
    EXPECT_FALSE(hasFabricTps(mods));

    touch(testDir_ / "mods" / "Fabric-TPS-1.2.0.jar");
    EXPECT_TRUE(hasFabricTps(mods));
}

TEST_F(ServerFlavorTest, LatencySupportForPlugins) {
    auto missing = detectLatencySupport("paper", testDir_.string());
    EXPECT_FALSE(missing.supported);
    EXPECT_EQ(missing.reason, "missing_pingplayer");

    touch(testDir_ / "plugins" / "PingPlayer-1.0.jar");
    auto present = detectLatencySupport("paper", testDir_.string());
    EXPECT_TRUE(present.supported);
    EXPECT_TRUE(present.reason.empty());
}

TEST_F(ServerFlavorTest, LatencySupportForMods) {
    auto missing = detectLatencySupport("fabric", testDir_.string());
    EXPECT_FALSE(missing.supported);
    EXPECT_EQ(missing.reason, "missing_pingplayer_mod");

    touch(testDir_ / "mods" / "player-ping-2.0.jar");
    EXPECT_TRUE(detectLatencySupport("fabric", testDir_.string()).supported);
}

TEST_F(ServerFlavorTest, VanillaHasNoLatencySupport) {
    touch(testDir_ / "plugins" / "PingPlayer.jar");

    auto support = detectLatencySupport("vanilla", testDir_.string());
    EXPECT_FALSE(support.supported);
    EXPECT_EQ(support.reason, "unsupported_server_type");
}

} // namespace test
} // namespace supervisor
} // namespace orexa
