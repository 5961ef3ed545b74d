#include "filest/core/error.hpp"
#include "filest/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using filest::Err;
using filest::Error;
using filest::ErrorCode;
using filest::Ok;
using filest::Result;

TEST(ResultTest, HoldsValueOrError) {
    Result<int> ok = Ok(42);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 42);

    Result<int> failed = Err<int>(Error::invalid("bad"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(failed.value_or(7), 7);
}

TEST(ResultTest, VoidSpecialization) {
    Result<void> ok = Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> failed = Err<void>(Error::io("disk full"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().message, "disk full");
}

TEST(ErrorTest, AccessDeniedNeverExplainsCause) {
    const auto error = Error::access_denied();
    EXPECT_EQ(error.code, ErrorCode::AccessDenied);
    EXPECT_EQ(error.message, "Access denied: Invalid path");
}

TEST(ErrorTest, MissingCarriesIndices) {
    const auto error = Error::missing({1, 3});
    EXPECT_EQ(error.code, ErrorCode::MissingChunks);
    EXPECT_EQ(error.missing_chunks, (std::vector<std::uint32_t>{1, 3}));
}

TEST(ErrorTest, HttpStatusMapping) {
    EXPECT_EQ(filest::http_status_for(ErrorCode::AccessDenied), 403);
    EXPECT_EQ(filest::http_status_for(ErrorCode::SessionNotFound), 404);
    EXPECT_EQ(filest::http_status_for(ErrorCode::MissingChunks), 409);
    EXPECT_EQ(filest::http_status_for(ErrorCode::InvalidIndex), 400);
    EXPECT_EQ(filest::http_status_for(ErrorCode::AuthFailed), 401);
    EXPECT_EQ(filest::http_status_for(ErrorCode::IoFailure), 500);
}

TEST(ErrorTest, CodeNamesAreStable) {
    EXPECT_STREQ(filest::error_code_name(ErrorCode::MissingChunks), "MISSING_CHUNKS");
    EXPECT_STREQ(filest::error_code_name(ErrorCode::SessionNotFound), "SESSION_NOT_FOUND");
    EXPECT_STREQ(filest::error_code_name(ErrorCode::AccessDenied), "ACCESS_DENIED");
}
