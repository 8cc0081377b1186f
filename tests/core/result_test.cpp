// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Tests for Result and Error

#include <gtest/gtest.h>
#include "faultline/core/result.hpp"
#include "faultline/core/error_codes.hpp"

#include <stdexcept>
#include <string>

namespace faultline {
namespace core {
namespace test {

// Test Result<T, E> holding a value
TEST(ResultTest, SuccessHoldsValue) {
    auto result = Result<uint16_t, Error>::success(3000);

    EXPECT_TRUE(result.isSuccess());
    EXPECT_FALSE(result.isError());
    EXPECT_EQ(result.value(), 3000);
}

// Test Result<T, E> holding an Error
TEST(ResultTest, ErrorHoldsError) {
    auto result = Result<uint16_t, Error>::error(Error(ErrorCode::BindFailed, "address in use", "0.0.0.0:3000"));

    EXPECT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::BindFailed);
    EXPECT_EQ(result.error().context, "0.0.0.0:3000");
}

TEST(ResultTest, VoidSuccessAndError) {
    auto ok = Result<void, Error>::success();
    auto failed = Result<void, Error>::error(Error(ErrorCode::RulePushRejected, "HTTP 400"));

    EXPECT_TRUE(ok.isSuccess());
    EXPECT_TRUE(failed.isError());
    EXPECT_EQ(failed.error().code, ErrorCode::RulePushRejected);
}

// Test wrong-side access
TEST(ResultTest, AccessingWrongSideThrows) {
    auto ok = Result<int, Error>::success(1);
    auto failed = Result<int, Error>::error(Error(ErrorCode::Unknown));

    EXPECT_THROW((void)ok.error(), std::logic_error);
    EXPECT_THROW((void)failed.value(), std::logic_error);
}

TEST(ResultTest, MoveOutValue) {
    auto result = Result<std::string, Error>::success("container-hs1.log");
    std::string moved = std::move(result).value();

    EXPECT_EQ(moved, "container-hs1.log");
}

TEST(ResultTest, ValueOr) {
    EXPECT_EQ((Result<int, Error>::success(504).valueOr(0)), 504);
    EXPECT_EQ((Result<int, Error>::error(Error()).valueOr(0)), 0);
}

// Test ErrorCode groups
TEST(ErrorCodeTest, GroupsDoNotOverlap) {
    EXPECT_LT(static_cast<int>(ErrorCode::NotFound), static_cast<int>(ErrorCode::Timeout));
    EXPECT_LT(static_cast<int>(ErrorCode::BindFailed), static_cast<int>(ErrorCode::HttpError));
    EXPECT_LT(static_cast<int>(ErrorCode::RulePushRejected), static_cast<int>(ErrorCode::ProvisioningFailed));
    EXPECT_NE(ErrorCode::RulePushFailed, ErrorCode::RulePushRejected);
}

TEST(ErrorTest, ToStringIncludesMessageAndContext) {
    Error err(ErrorCode::ReadinessTimeout, "postgres not ready", "Deployment");

    std::string text = err.toString();
    EXPECT_NE(text.find("postgres not ready"), std::string::npos);
    EXPECT_NE(text.find("[Deployment]"), std::string::npos);
}

TEST(ErrorTest, EmptyContext) {
    Error err(ErrorCode::Unknown, "Unknown error");

    EXPECT_EQ(err.code, ErrorCode::Unknown);
    EXPECT_TRUE(err.context.empty());
    EXPECT_EQ(err.toString().find('['), std::string::npos);
}

} // namespace test
} // namespace core
} // namespace faultline
