/**
 * @file c_api_test.cpp
 * @brief Tests for the termwidth C API wrapper.
 */

#include "termwidth.h"

#include <gtest/gtest.h>
#include <cstring>
#include <string>

extern "C" {
#include "termwidth_c.h"
}

class CAPITest : public ::testing::Test {};

// Version Tests
TEST_F(CAPITest, VersionString) {
    const char* version = termwidth_version();
    ASSERT_NE(version, nullptr);
    EXPECT_STREQ(version, TERMWIDTH_VERSION_STRING);

    std::string expected = std::to_string(TERMWIDTH_VERSION_MAJOR) + "." +
                           std::to_string(TERMWIDTH_VERSION_MINOR) + "." +
                           std::to_string(TERMWIDTH_VERSION_PATCH);
    EXPECT_EQ(std::string(version), expected);
}

// Error String Tests
TEST_F(CAPITest, ErrorStrings) {
    EXPECT_STREQ(termwidth_error_string(TERMWIDTH_OK), "No error");
    EXPECT_STREQ(termwidth_error_string(TERMWIDTH_ERROR_MALFORMED_VERSION), "Malformed Unicode version");
    EXPECT_STREQ(termwidth_error_string(TERMWIDTH_ERROR_NULL_POINTER), "Null pointer");
    EXPECT_STREQ(termwidth_error_string(static_cast<termwidth_error_t>(999)), "Unknown error");
}

// Code Point Tests
TEST_F(CAPITest, CodePointWidth) {
    int width = 42;
    EXPECT_EQ(termwidth_width(0x4E00, "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 2);

    EXPECT_EQ(termwidth_width('a', "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 1);

    EXPECT_EQ(termwidth_width(0x0301, "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 0);

    EXPECT_EQ(termwidth_width(0x1B, "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, -1);
}

TEST_F(CAPITest, CodePointWidthByVersion) {
    int width = 0;
    EXPECT_EQ(termwidth_width(0x1F600, "8.0.0", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 1);
    EXPECT_EQ(termwidth_width(0x1F600, "9.0.0", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 2);
}

TEST_F(CAPITest, NullVersionMeansAuto) {
    int width = 0;
    EXPECT_EQ(termwidth_width(0x4E00, nullptr, &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 2);
}

TEST_F(CAPITest, MalformedVersion) {
    int width = 7;
    EXPECT_EQ(termwidth_width('a', "nope", &width), TERMWIDTH_ERROR_MALFORMED_VERSION);
    EXPECT_EQ(width, 7);
}

TEST_F(CAPITest, NullWidthPointer) {
    EXPECT_EQ(termwidth_width('a', "latest", nullptr), TERMWIDTH_ERROR_NULL_POINTER);
}

// String Tests
TEST_F(CAPITest, Utf8Width) {
    const char* text = "\xE3\x82\xB3\xE3\x83\xB3\xE3\x83\x8B\xE3\x83\x81\xE3\x83\x8F";
    int width = 0;
    EXPECT_EQ(termwidth_utf8_width(text, std::strlen(text), TERMWIDTH_NO_LIMIT, "latest", &width),
              TERMWIDTH_OK);
    EXPECT_EQ(width, 10);

    EXPECT_EQ(termwidth_utf8_width(text, std::strlen(text), 2, "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 4);
}

TEST_F(CAPITest, Utf8WidthEmojiKeysAndInvalidBytes) {
    int width = 0;
    EXPECT_EQ(termwidth_width('#', "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 2);

    const char* surrogate = "\xED\xA0\x80";
    EXPECT_EQ(termwidth_utf8_width(surrogate, 3, TERMWIDTH_NO_LIMIT, "latest", &width),
              TERMWIDTH_OK);
    EXPECT_EQ(width, 3);

    const char* truncated = "\xE4\xB8";
    EXPECT_EQ(termwidth_utf8_width(truncated, 2, TERMWIDTH_NO_LIMIT, "latest", &width),
              TERMWIDTH_OK);
    EXPECT_EQ(width, 1);
}

TEST_F(CAPITest, Utf8WidthControl) {
    const char* text = "abc\x1b[0m";
    int width = 0;
    EXPECT_EQ(termwidth_utf8_width(text, std::strlen(text), TERMWIDTH_NO_LIMIT, "latest", &width),
              TERMWIDTH_OK);
    EXPECT_EQ(width, -1);
}

TEST_F(CAPITest, Utf8WidthEmpty) {
    int width = 5;
    EXPECT_EQ(termwidth_utf8_width(nullptr, 0, TERMWIDTH_NO_LIMIT, "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 0);
    EXPECT_EQ(termwidth_utf8_width(nullptr, 3, TERMWIDTH_NO_LIMIT, "latest", &width),
              TERMWIDTH_ERROR_NULL_POINTER);
}

TEST_F(CAPITest, U32Width) {
    const uint32_t text[] = {'a', 0x4E00, '#', 0xFE0F};
    int width = 0;
    EXPECT_EQ(termwidth_u32_width(text, 4, TERMWIDTH_NO_LIMIT, "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 5);

    EXPECT_EQ(termwidth_u32_width(text, 4, 3, "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 5);

    EXPECT_EQ(termwidth_u32_width(text, 4, 2, "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 3);

    EXPECT_EQ(termwidth_u32_width(text, 4, 0, "latest", &width), TERMWIDTH_OK);
    EXPECT_EQ(width, 0);
}

// Resolution Tests
TEST_F(CAPITest, Resolve) {
    char buffer[32];
    EXPECT_EQ(termwidth_resolve("8.0", buffer, sizeof(buffer)), TERMWIDTH_OK);
    EXPECT_STREQ(buffer, "8.0.0");

    EXPECT_EQ(termwidth_resolve("4.1.0", buffer, sizeof(buffer)), TERMWIDTH_OK);
    EXPECT_STREQ(buffer, "4.1.0");
}

TEST_F(CAPITest, ResolveLatestMatchesLastSupported) {
    char buffer[32];
    EXPECT_EQ(termwidth_resolve("latest", buffer, sizeof(buffer)), TERMWIDTH_OK);
    size_t count = termwidth_supported_version_count();
    ASSERT_GT(count, 0u);
    EXPECT_STREQ(buffer, termwidth_supported_version(count - 1));
}

TEST_F(CAPITest, ResolveBufferErrors) {
    char buffer[4];
    EXPECT_EQ(termwidth_resolve("8.0.0", buffer, sizeof(buffer)), TERMWIDTH_ERROR_BUFFER_TOO_SMALL);
    EXPECT_EQ(termwidth_resolve("8.0.0", buffer, 0), TERMWIDTH_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(termwidth_resolve("8.0.0", nullptr, 4), TERMWIDTH_ERROR_NULL_POINTER);
    EXPECT_EQ(termwidth_resolve("x", buffer, sizeof(buffer)), TERMWIDTH_ERROR_MALFORMED_VERSION);
}

// Supported Version Tests
TEST_F(CAPITest, SupportedVersions) {
    size_t count = termwidth_supported_version_count();
    ASSERT_GT(count, 0u);
    EXPECT_STREQ(termwidth_supported_version(0), "4.1.0");
    EXPECT_EQ(termwidth_supported_version(count), nullptr);
}
