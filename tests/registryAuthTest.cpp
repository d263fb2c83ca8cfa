#include <gtest/gtest.h>

#include "lib/errors.hpp"
#include "lib/registryAuth.hpp"

using namespace Docker;

TEST(RegistryAuthTest, TokenForm) {
    auto auth = RegistryAuth::token("abc");
    EXPECT_TRUE(auth.isToken());
    EXPECT_EQ(auth.json(), R"({"identitytoken":"abc"})");
    EXPECT_EQ(auth.serialize(), "eyJpZGVudGl0eXRva2VuIjoiYWJjIn0=");
}

TEST(RegistryAuthTest, PasswordFormOmitsUnsetFields) {
    auto auth = RegistryAuth::builder().username("user_abc").password("password_abc").build();
    EXPECT_FALSE(auth.isToken());
    EXPECT_EQ(auth.json(), R"({"username":"user_abc","password":"password_abc"})");
    EXPECT_EQ(auth.serialize(), "eyJ1c2VybmFtZSI6InVzZXJfYWJjIiwicGFzc3dvcmQiOiJwYXNzd29yZF9hYmMifQ==");
}

TEST(RegistryAuthTest, PasswordFormWithAllFields) {
    auto auth = RegistryAuth::builder()
        .username("user_abc")
        .password("password_abc")
        .email("email_abc")
        .serverAddress("https://example.org")
        .build();
    EXPECT_EQ(auth.serialize(),
              "eyJ1c2VybmFtZSI6InVzZXJfYWJjIiwicGFzc3dvcmQiOiJwYXNzd29yZF9hYmMiLCJlbWFpbCI6ImVtYWlsX2FiYyIsInNlcnZlcmFkZHJlc3MiOiJodHRwczovL2V4YW1wbGUub3JnIn0=");
}

TEST(RegistryAuthTest, ParseRestoresBothForms) {
    auto password = RegistryAuth::builder().username("u").password("p").serverAddress("reg.local").build();
    auto parsed = RegistryAuth::parse(password.serialize());
    EXPECT_FALSE(parsed.isToken());
    EXPECT_EQ(parsed.json(), password.json());

    auto token = RegistryAuth::parse("eyJpZGVudGl0eXRva2VuIjoiYWJjIn0=");
    EXPECT_TRUE(token.isToken());
    EXPECT_EQ(token.json(), R"({"identitytoken":"abc"})");
}

TEST(RegistryAuthTest, ParseAcceptsMissingPadding) {
    auto parsed = RegistryAuth::parse("eyJ1c2VybmFtZSI6InVzZXJfYWJjIiwicGFzc3dvcmQiOiJwYXNzd29yZF9hYmMifQ");
    EXPECT_EQ(parsed.json(), R"({"username":"user_abc","password":"password_abc"})");
}

TEST(RegistryAuthTest, ParseRejectsGarbage) {
    EXPECT_THROW(RegistryAuth::parse("not base64!"), RequestBuildError);
    // "[1]" is valid JSON but not an object
    EXPECT_THROW(RegistryAuth::parse("WzFd"), RequestBuildError);
    // {"username":1}
    EXPECT_THROW(RegistryAuth::parse("eyJ1c2VybmFtZSI6MX0="), RequestBuildError);
}

TEST(RegistryAuthTest, UrlSafeAlphabet) {
    EXPECT_EQ(base64UrlEncode("\xfb\xff"), "-_8=");
    EXPECT_EQ(base64UrlDecode("-_8="), "\xfb\xff");
}
