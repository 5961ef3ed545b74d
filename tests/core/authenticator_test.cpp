#include "filest/core/authenticator.hpp"
#include "filest/core/base64.hpp"

#include <gtest/gtest.h>

using filest::Authenticator;

TEST(AuthenticatorTest, VerifiesExactCredentials) {
    Authenticator auth("admin", "admin123");
    EXPECT_TRUE(auth.verify("admin", "admin123"));
    EXPECT_FALSE(auth.verify("admin", "admin1234"));
    EXPECT_FALSE(auth.verify("Admin", "admin123"));
    EXPECT_FALSE(auth.verify("", ""));
}

TEST(AuthenticatorTest, VerifiesBasicHeader) {
    Authenticator auth("admin", "admin123");
    EXPECT_TRUE(auth.verify_header("Basic " + filest::base64_encode("admin:admin123")));
    EXPECT_FALSE(auth.verify_header("Basic " + filest::base64_encode("admin:wrong")));
    EXPECT_FALSE(auth.verify_header("Bearer " + filest::base64_encode("admin:admin123")));
    EXPECT_FALSE(auth.verify_header("Basic !!!"));
}

TEST(AuthenticatorTest, PasswordMayContainColons) {
    Authenticator auth("user", "a:b:c");
    EXPECT_TRUE(auth.verify_token(filest::base64_encode("user:a:b:c")));

    auto parts = Authenticator::decode_token(filest::base64_encode("user:a:b:c"));
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "user");
    EXPECT_EQ(parts->second, "a:b:c");
}

TEST(AuthenticatorTest, TokenWithoutColonIsMalformed) {
    EXPECT_FALSE(Authenticator::decode_token(filest::base64_encode("nocolon")).has_value());
}
