// Orexa - Game Server Supervisor
// Tests for common type helpers

#include <gtest/gtest.h>
#include "orexa/core/types.hpp"

namespace orexa {
namespace core {
namespace test {

// =============================================================================
// Instance Status
// =============================================================================

TEST(InstanceStatusTest, NamesRoundTrip) {
    for (InstanceStatus status : {InstanceStatus::Installing, InstanceStatus::Stopped,
                                  InstanceStatus::Booting, InstanceStatus::Running,
                                  InstanceStatus::Crashed, InstanceStatus::Error}) {
        auto parsed = parseInstanceStatus(instanceStatusToString(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(parseInstanceStatus("running").has_value());
}

TEST(InstanceStatusTest, LiveAndTerminalPartition) {
    EXPECT_TRUE(isLiveStatus(InstanceStatus::Booting));
    EXPECT_TRUE(isLiveStatus(InstanceStatus::Running));
    EXPECT_FALSE(isLiveStatus(InstanceStatus::Installing));

    EXPECT_TRUE(isTerminalStatus(InstanceStatus::Stopped));
    EXPECT_TRUE(isTerminalStatus(InstanceStatus::Crashed));
    EXPECT_TRUE(isTerminalStatus(InstanceStatus::Error));
    EXPECT_FALSE(isTerminalStatus(InstanceStatus::Installing));
    EXPECT_FALSE(isTerminalStatus(InstanceStatus::Running));
}

// =============================================================================
// String Helpers
// =============================================================================

TEST(TypesHelperTest, FormatFileSize) {
    EXPECT_EQ(formatFileSize(0), "0 B");
    EXPECT_EQ(formatFileSize(13), "13 B");
    EXPECT_EQ(formatFileSize(1023), "1023 B");
    EXPECT_EQ(formatFileSize(1024), "1.0 KB");
    EXPECT_EQ(formatFileSize(1536), "1.5 KB");
    EXPECT_EQ(formatFileSize(5ull * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(formatFileSize(3ull * 1024 * 1024 * 1024), "3.0 GB");
}

TEST(TypesHelperTest, SanitizeName) {
    EXPECT_EQ(sanitizeName("My Server"), "My_Server");
    EXPECT_EQ(sanitizeName("../../etc"), "....etc");
    EXPECT_EQ(sanitizeName("Survival-1.21_test"), "Survival-1.21_test");
    EXPECT_EQ(sanitizeName("§a★"), "a");
    EXPECT_EQ(sanitizeName("///"), "server");
    EXPECT_EQ(sanitizeName(""), "server");
}

TEST(TypesHelperTest, TrimLowerSplit) {
    EXPECT_EQ(trim("  say hi \r\n"), "say hi");
    EXPECT_EQ(trim(" \t "), "");
    EXPECT_EQ(toLower("NeoForge"), "neoforge");

    std::vector<std::string> parts = {"Steve", "", "Alex"};
    EXPECT_EQ(split("Steve,,Alex", ','), parts);
    EXPECT_EQ(split("", ',').size(), 1u);
}

} // namespace test
} // namespace core
} // namespace orexa
