// Orexa - Game Server Supervisor
// Tests for Result type and error codes

#include <gtest/gtest.h>
#include "orexa/core/result.hpp"
#include "orexa/core/error_codes.hpp"

#include <string>

namespace orexa {
namespace core {
namespace test {

TEST(ResultTest, SuccessValueConstruction) {
    Result<int, std::string> result = Result<int, std::string>::success(42);

    EXPECT_TRUE(result.isSuccess());
    EXPECT_FALSE(result.isError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValueConstruction) {
    Result<int, std::string> result = Result<int, std::string>::error("Something went wrong");

    EXPECT_FALSE(result.isSuccess());
    EXPECT_TRUE(result.isError());
    EXPECT_EQ(result.error(), "Something went wrong");
}

TEST(ResultTest, VoidSuccessAndError) {
    auto ok = Result<void, Error>::success();
    auto failed = Result<void, Error>::error(Error(ErrorCode::NotRunning, "server a is not running"));

    EXPECT_TRUE(ok.isSuccess());
    EXPECT_TRUE(failed.isError());
    EXPECT_EQ(failed.error().code, ErrorCode::NotRunning);
}

TEST(ResultTest, AccessingWrongSideThrows) {
    auto ok = Result<int, Error>::success(1);
    auto failed = Result<int, Error>::error(Error(ErrorCode::NotFound));

    EXPECT_THROW((void)ok.error(), std::logic_error);
    EXPECT_THROW((void)failed.value(), std::logic_error);
}

TEST(ResultTest, MoveOnlyValue) {
    auto result = Result<std::unique_ptr<int>, Error>::success(std::make_unique<int>(7));
    ASSERT_TRUE(result.isSuccess());

    std::unique_ptr<int> owned = std::move(result).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, ValueOr) {
    Result<int, std::string> ok = Result<int, std::string>::success(42);
    Result<int, std::string> failed = Result<int, std::string>::error("error");

    EXPECT_EQ(ok.valueOr(0), 42);
    EXPECT_EQ(failed.valueOr(0), 0);
}

// =============================================================================
// Error codes
// =============================================================================

TEST(ErrorCodeTest, RangesClassifyPreconditions) {
    EXPECT_TRUE(isPreconditionError(ErrorCode::NotRunning));
    EXPECT_TRUE(isPreconditionError(ErrorCode::StillInstalling));
    EXPECT_TRUE(isPreconditionError(ErrorCode::NoRestartScheduled));
    EXPECT_TRUE(isPreconditionError(ErrorCode::InvalidState));

    EXPECT_FALSE(isPreconditionError(ErrorCode::PortInUse));
    EXPECT_FALSE(isPreconditionError(ErrorCode::InstallFailed));
    EXPECT_FALSE(isPreconditionError(ErrorCode::SpawnFailed));
}

TEST(ErrorCodeTest, EveryCodeHasText) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::PortInUse), "Port in use");
    EXPECT_STREQ(errorCodeToString(ErrorCode::PathEscape), "Path escapes base directory");
    EXPECT_STREQ(errorCodeToString(static_cast<ErrorCode>(9999)), "Unknown error code");
}

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::InvalidArgument, "port must be between 1024 and 65535", "port"};

    EXPECT_EQ(err.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(err.message, "port must be between 1024 and 65535");
    EXPECT_EQ(err.context, "port");
    EXPECT_FALSE(err.isSuccess());
}

TEST(ErrorTest, ToStringIncludesMessageAndContext) {
    Error err{ErrorCode::NotFound, "server abc not found", "abc"};
    EXPECT_EQ(err.toString(), "Not found: server abc not found [abc]");

    Error bare{ErrorCode::Timeout};
    EXPECT_EQ(bare.toString(), "Timeout");
}

} // namespace test
} // namespace core
} // namespace orexa
