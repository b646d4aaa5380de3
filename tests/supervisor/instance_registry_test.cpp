// Orexa - Game Server Supervisor
// Tests for instance registry persistence

#include <gtest/gtest.h>
#include "orexa/core/json.hpp"
#include "orexa/supervisor/instance_registry.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace orexa {
namespace supervisor {
namespace test {

namespace fs = std::filesystem;

class InstanceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() /
                   ("orexa_registry_test_" + std::to_string(getpid()));
        fs::create_directories(testDir_);
        registryPath_ = (testDir_ / "data" / "servers.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    void writeRegistry(const std::string& content) {
        fs::create_directories(fs::path(registryPath_).parent_path());
        std::ofstream out(registryPath_);
        out << content;
    }

    static InstanceConfig makeConfig(const std::string& id, const std::string& name, uint16_t port) {
        InstanceConfig config;
        config.id = id;
        config.name = name;
        config.type = "paper";
        config.version = "1.21.1";
        config.port = port;
        config.maxRam = "4G";
        config.minRam = "1G";
        config.dir = "/srv/Servers/" + name;
        return config;
    }

    fs::path testDir_;
    std::string registryPath_;
};

TEST_F(InstanceRegistryTest, MissingFileIsEmptyRegistry) {
    InstanceRegistry registry(registryPath_);

    auto loaded = registry.load();
    ASSERT_TRUE(loaded.isSuccess());
    EXPECT_TRUE(loaded.value().empty());
}

TEST_F(InstanceRegistryTest, BlankAndNullFilesAreEmpty) {
    InstanceRegistry registry(registryPath_);

    writeRegistry("  \n");
    ASSERT_TRUE(registry.load().isSuccess());
    EXPECT_TRUE(registry.load().value().empty());

    writeRegistry("null");
    ASSERT_TRUE(registry.load().isSuccess());
    EXPECT_TRUE(registry.load().value().empty());
}

TEST_F(InstanceRegistryTest, SaveKeepsOrderAndAllFields) {
    InstanceRegistry registry(registryPath_);

    InstanceConfig survival = makeConfig("a1b2c3d4", "Survival", 25565);
    survival.autoStart = true;
    survival.flags = "aikars";
    survival.alwaysPreTouch = true;
    survival.backupDir = "Survival_a1b2c3d4";
    survival.backupSchedule = "daily";
    survival.lastScheduledBackup = "2026-10-16T03:00:00Z";
    InstanceConfig creative = makeConfig("e5f6a7b8", "Creative", 25566);
    creative.startCommand = {"sh", "run.sh"};

    ASSERT_TRUE(registry.save({survival, creative}).isSuccess());
    EXPECT_FALSE(fs::exists(registryPath_ + ".tmp"));

    auto loaded = registry.load();
    ASSERT_TRUE(loaded.isSuccess()) << loaded.error().toString();
    ASSERT_EQ(loaded.value().size(), 2u);

    const InstanceConfig& first = loaded.value()[0];
    EXPECT_EQ(first.id, "a1b2c3d4");
    EXPECT_EQ(first.port, 25565);
    EXPECT_EQ(first.jarFile, "server.jar");
    EXPECT_TRUE(first.autoStart);
    EXPECT_EQ(first.flags, "aikars");
    EXPECT_TRUE(first.alwaysPreTouch);
    EXPECT_EQ(first.backupDir, "Survival_a1b2c3d4");
    EXPECT_EQ(first.backupSchedule, "daily");
    EXPECT_EQ(first.lastScheduledBackup, "2026-10-16T03:00:00Z");

    const InstanceConfig& second = loaded.value()[1];
    EXPECT_EQ(second.name, "Creative");
    ASSERT_EQ(second.startCommand.size(), 2u);
    EXPECT_EQ(second.startCommand[1], "run.sh");
}

TEST_F(InstanceRegistryTest, EmptyOptionalFieldsAreOmitted) {
    InstanceRegistry registry(registryPath_);
    ASSERT_TRUE(registry.save({makeConfig("a1b2c3d4", "Survival", 25565)}).isSuccess());

    std::ifstream in(registryPath_);
    std::stringstream content;
    content << in.rdbuf();

    auto parsed = core::parseJson(content.str());
    ASSERT_TRUE(parsed.isSuccess());
    ASSERT_TRUE(parsed.value().isArray());
    const core::JsonValue& entry = parsed.value().arrayValue.at(0);
    EXPECT_FALSE(entry.contains("startCommand"));
    EXPECT_FALSE(entry.contains("backupDir"));
    EXPECT_FALSE(entry.contains("backupSchedule"));
    EXPECT_FALSE(entry.contains("lastScheduledBackup"));
    EXPECT_TRUE(entry.contains("autoStart"));
}

TEST_F(InstanceRegistryTest, MissingJarFileDefaults) {
    writeRegistry(R"([{"id": "a1b2c3d4", "name": "Old", "type": "vanilla", "port": 25565}])");
    InstanceRegistry registry(registryPath_);

    auto loaded = registry.load();
    ASSERT_TRUE(loaded.isSuccess());
    EXPECT_EQ(loaded.value()[0].jarFile, "server.jar");
    EXPECT_EQ(loaded.value()[0].maxPlayers, 20);
}

TEST_F(InstanceRegistryTest, MalformedFileIsCorrupt) {
    writeRegistry("[{\"id\": \"a1b2c3d4\",");
    InstanceRegistry registry(registryPath_);

    auto loaded = registry.load();
    ASSERT_TRUE(loaded.isError());
    EXPECT_EQ(loaded.error().code, core::ErrorCode::RegistryCorrupt);
}

TEST_F(InstanceRegistryTest, NonArrayRootIsCorrupt) {
    writeRegistry(R"({"servers": []})");
    InstanceRegistry registry(registryPath_);

    auto loaded = registry.load();
    ASSERT_TRUE(loaded.isError());
    EXPECT_EQ(loaded.error().code, core::ErrorCode::RegistryCorrupt);
}

TEST_F(InstanceRegistryTest, EntryWithoutIdIsCorrupt) {
    writeRegistry(R"([{"name": "Nameless"}])");
    InstanceRegistry registry(registryPath_);

    auto loaded = registry.load();
    ASSERT_TRUE(loaded.isError());
    EXPECT_EQ(loaded.error().code, core::ErrorCode::RegistryCorrupt);
    EXPECT_EQ(loaded.error().context, registryPath_);
}

TEST_F(InstanceRegistryTest, DuplicateIdsAreCorrupt) {
    writeRegistry(R"([{"id": "a1b2c3d4", "port": 25565}, {"id": "a1b2c3d4", "port": 25566}])");
    InstanceRegistry registry(registryPath_);

    auto loaded = registry.load();
    ASSERT_TRUE(loaded.isError());
    EXPECT_NE(loaded.error().message.find("duplicate"), std::string::npos);
}

TEST_F(InstanceRegistryTest, OutOfRangePortIsCorrupt) {
    writeRegistry(R"([{"id": "a1b2c3d4", "port": 70000}])");
    InstanceRegistry registry(registryPath_);

    EXPECT_TRUE(registry.load().isError());
}

TEST_F(InstanceRegistryTest, SaveOverwritesPreviousContent) {
    InstanceRegistry registry(registryPath_);
    ASSERT_TRUE(registry.save({makeConfig("a1b2c3d4", "One", 25565),
                               makeConfig("e5f6a7b8", "Two", 25566)}).isSuccess());
    ASSERT_TRUE(registry.save({makeConfig("e5f6a7b8", "Two", 25566)}).isSuccess());

    auto loaded = registry.load();
    ASSERT_TRUE(loaded.isSuccess());
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(loaded.value()[0].id, "e5f6a7b8");
}

} // namespace test
} // namespace supervisor
} // namespace orexa
