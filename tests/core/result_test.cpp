// StreamProv - Dedicated stream provisioning service
// Tests for Result type and common types

#include <gtest/gtest.h>
#include "streamprov/core/result.hpp"
#include "streamprov/core/error_codes.hpp"
#include "streamprov/core/types.hpp"

#include <memory>

namespace streamprov {
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
    auto ok = Result<void, std::string>::success();
    auto failed = Result<void, std::string>::error("Error occurred");

    EXPECT_TRUE(ok.isSuccess());
    EXPECT_TRUE(failed.isError());
    EXPECT_EQ(failed.error(), "Error occurred");
}

// Same type on both sides must still tell success from error
TEST(ResultTest, SameValueAndErrorType) {
    auto ok = Result<std::string, std::string>::success("value");
    auto failed = Result<std::string, std::string>::error("value");

    EXPECT_TRUE(ok.isSuccess());
    EXPECT_TRUE(failed.isError());
}

TEST(ResultTest, MoveOnlyValue) {
    auto result = Result<std::unique_ptr<int>, std::string>::success(std::make_unique<int>(7));
    ASSERT_TRUE(result.isSuccess());

    std::unique_ptr<int> owned = std::move(result).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, ValueOr) {
    EXPECT_EQ((Result<int, std::string>::success(42).valueOr(0)), 42);
    EXPECT_EQ((Result<int, std::string>::error("error").valueOr(0)), 0);
}

TEST(ErrorCodeTest, RangesAreGroupedByComponent) {
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::NoPortsAvailable) / 100, 1u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::InvalidTransition) / 100, 2u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::Unreachable) / 100, 3u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::StorageConstraintViolation) / 100, 4u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::ConfigInvalid) / 100, 5u);
    EXPECT_STREQ(errorCodeToString(ErrorCode::NoCapacity), "No capacity");
}

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::InvalidArgument, "Invalid port number", "port"};

    EXPECT_EQ(err.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(err.message, "Invalid port number");
    EXPECT_EQ(err.context, "port");
    EXPECT_FALSE(err.isSuccess());
}

TEST(TypesTest, UnixMillisRoundTripKeepsMilliseconds) {
    const TimePoint original = fromUnixMillis(1700000000123);
    EXPECT_EQ(toUnixMillis(original), 1700000000123);
}

TEST(TypesTest, Iso8601FormatIsUtcWithMilliseconds) {
    EXPECT_EQ(formatIso8601(fromUnixMillis(0)), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(formatIso8601(fromUnixMillis(1700000000123)), "2023-11-14T22:13:20.123Z");
}

} // namespace test
} // namespace core
} // namespace streamprov
