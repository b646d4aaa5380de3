// Orexa - Game Server Supervisor
// Tests for artifact providers and the local mirror

#include <gtest/gtest.h>
#include "orexa/supervisor/artifact_provider.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace orexa {
namespace supervisor {
namespace test {

namespace fs = std::filesystem;

namespace {

const char* SHA256_ABC = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

} // anonymous namespace

class ArtifactProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() /
                   ("orexa_artifact_test_" + std::to_string(getpid()));
        mirror_ = testDir_ / "mirror";
        fs::create_directories(mirror_);
        destDir_ = (testDir_ / "Servers" / "Survival").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    void writeFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path testDir_;
    fs::path mirror_;
    std::string destDir_;
};

// =============================================================================
// Version Ordering
// =============================================================================

TEST(VersionOrderTest, NumericRunsCompareNumerically) {
    EXPECT_TRUE(versionLess("1.9", "1.20.4"));
    EXPECT_FALSE(versionLess("1.20.4", "1.9"));
    EXPECT_TRUE(versionLess("1.20", "1.20.1"));
    EXPECT_TRUE(versionLess("1.20.1", "1.20.10"));
    EXPECT_FALSE(versionLess("1.21", "1.21"));
    EXPECT_TRUE(versionLess("1.21-pre1", "1.21-pre2"));
}

TEST(VersionOrderTest, LeadingZerosAreIgnored) {
    EXPECT_FALSE(versionLess("1.010", "1.10"));
    EXPECT_FALSE(versionLess("1.10", "1.010"));
}

// =============================================================================
// Registry
// =============================================================================

TEST_F(ArtifactProviderTest, RegistryMatchesCaseInsensitively) {
    ArtifactProviderRegistry registry;
    auto provider = std::make_shared<LocalArtifactProvider>(mirror_.string(), "paper");
    registry.registerProvider("Paper", provider);

    auto found = registry.find("PAPER");
    ASSERT_TRUE(found.isSuccess());
    EXPECT_EQ(found.value(), provider);

    auto missing = registry.find("bukkit");
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.error().code, core::ErrorCode::ProviderNotFound);
}

TEST_F(ArtifactProviderTest, RegistryListsSortedTypes) {
    ArtifactProviderRegistry registry;
    registry.registerProvider("vanilla", std::make_shared<LocalArtifactProvider>(mirror_.string(), "vanilla"));
    registry.registerProvider("fabric", std::make_shared<LocalArtifactProvider>(mirror_.string(), "fabric"));

    std::vector<std::string> expected = {"fabric", "vanilla"};
    EXPECT_EQ(registry.types(), expected);
}

// =============================================================================
// Local Mirror
// =============================================================================

TEST_F(ArtifactProviderTest, VersionsNewestFirstWithLatestMarked) {
    for (const char* version : {"1.9.4", "1.20.4", "1.21.1"}) {
        writeFile(mirror_ / "paper" / version / "server.jar", "jar");
    }
    fs::create_directories(mirror_ / "paper" / "1.22-empty");

    LocalArtifactProvider provider(mirror_.string(), "Paper");
    auto versions = provider.fetchVersions();

    ASSERT_TRUE(versions.isSuccess());
    ASSERT_EQ(versions.value().size(), 3u);
    EXPECT_EQ(versions.value()[0].version, "1.21.1");
    EXPECT_TRUE(versions.value()[0].latest);
    EXPECT_EQ(versions.value()[1].version, "1.20.4");
    EXPECT_FALSE(versions.value()[1].latest);
    EXPECT_EQ(versions.value()[2].version, "1.9.4");
}

TEST_F(ArtifactProviderTest, MissingFlavorHasNoVersions) {
    LocalArtifactProvider provider(mirror_.string(), "folia");

    auto versions = provider.fetchVersions();
    ASSERT_TRUE(versions.isSuccess());
    EXPECT_TRUE(versions.value().empty());
}

TEST_F(ArtifactProviderTest, DownloadCopiesJarAndLauncher) {
    writeFile(mirror_ / "forge" / "1.20.1" / "server.jar", "forge jar");
    writeFile(mirror_ / "forge" / "1.20.1" / "run.sh", "#!/bin/sh\njava @user_jvm_args.txt\n");

    LocalArtifactProvider provider(mirror_.string(), "forge");
    std::vector<std::string> progress;
    auto result = provider.downloadArtifact("1.20.1", destDir_,
        [&progress](const std::string& message) { progress.push_back(message); });

    ASSERT_TRUE(result.isSuccess()) << result.error().toString();
    EXPECT_EQ(readFile(fs::path(destDir_) / "server.jar"), "forge jar");
    EXPECT_TRUE(fs::exists(fs::path(destDir_) / "run.sh"));
    EXPECT_FALSE(fs::exists(fs::path(destDir_) / ".server.jar.tmp"));
    ASSERT_FALSE(progress.empty());
    EXPECT_NE(progress.back().find("Copying forge 1.20.1"), std::string::npos);
}

TEST_F(ArtifactProviderTest, UnknownVersionFails) {
    LocalArtifactProvider provider(mirror_.string(), "paper");

    auto result = provider.downloadArtifact("9.9.9", destDir_, nullptr);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::DownloadFailed);
    EXPECT_FALSE(fs::exists(destDir_));
}

TEST_F(ArtifactProviderTest, VersionCannotEscapeMirror) {
    writeFile(mirror_ / "server.jar", "outside");
    LocalArtifactProvider provider(mirror_.string(), "paper");

    for (const char* bad : {"", "..", "../paper", "1.21/../../"}) {
        auto result = provider.downloadArtifact(bad, destDir_, nullptr);
        ASSERT_TRUE(result.isError()) << bad;
        EXPECT_EQ(result.error().code, core::ErrorCode::InvalidArgument) << bad;
    }
}

TEST_F(ArtifactProviderTest, MatchingChecksumIsAccepted) {
    writeFile(mirror_ / "vanilla" / "1.21.1" / "server.jar", "abc");
    writeFile(mirror_ / "vanilla" / "1.21.1" / "server.jar.sha256",
              std::string(SHA256_ABC) + "  server.jar\n");

    LocalArtifactProvider provider(mirror_.string(), "vanilla");
    auto result = provider.downloadArtifact("1.21.1", destDir_, nullptr);

    ASSERT_TRUE(result.isSuccess()) << result.error().toString();
    EXPECT_EQ(readFile(fs::path(destDir_) / "server.jar"), "abc");
}

TEST_F(ArtifactProviderTest, ChecksumMismatchLeavesDestinationUntouched) {
    writeFile(mirror_ / "vanilla" / "1.21.1" / "server.jar", "tampered");
    writeFile(mirror_ / "vanilla" / "1.21.1" / "server.jar.sha256", SHA256_ABC);

    LocalArtifactProvider provider(mirror_.string(), "vanilla");
    auto result = provider.downloadArtifact("1.21.1", destDir_, nullptr);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::ChecksumMismatch);
    EXPECT_NE(result.error().message.find(SHA256_ABC), std::string::npos);
    EXPECT_FALSE(fs::exists(fs::path(destDir_) / "server.jar"));
}

// =============================================================================
// SHA-256
// =============================================================================

TEST_F(ArtifactProviderTest, Sha256OfKnownContent) {
    writeFile(testDir_ / "abc.bin", "abc");
    writeFile(testDir_ / "empty.bin", "");

    auto abc = sha256File((testDir_ / "abc.bin").string());
    ASSERT_TRUE(abc.isSuccess());
    EXPECT_EQ(abc.value(), SHA256_ABC);

    auto empty = sha256File((testDir_ / "empty.bin").string());
    ASSERT_TRUE(empty.isSuccess());
    EXPECT_EQ(empty.value(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ArtifactProviderTest, Sha256OfLargeFileSpansChunks) {
    std::string content(200 * 1024, 'x');
    writeFile(testDir_ / "a.bin", content);
    writeFile(testDir_ / "b.bin", content + "y");

    auto a = sha256File((testDir_ / "a.bin").string());
    auto b = sha256File((testDir_ / "b.bin").string());
    ASSERT_TRUE(a.isSuccess());
    ASSERT_TRUE(b.isSuccess());
    EXPECT_EQ(a.value().size(), 64u);
    EXPECT_NE(a.value(), b.value());
}

TEST_F(ArtifactProviderTest, Sha256OfMissingFile) {
    auto result = sha256File((testDir_ / "absent.jar").string());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::FileReadError);
}

} // namespace test
} // namespace supervisor
} // namespace orexa
