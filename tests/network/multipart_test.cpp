#include "filest/network/multipart.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using filest::network::extract_boundary;
using filest::network::parse_multipart;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST(MultipartTest, ExtractsBoundary) {
    EXPECT_EQ(extract_boundary("multipart/form-data; boundary=abc123").value(), "abc123");
    EXPECT_EQ(extract_boundary("Multipart/Form-Data; charset=utf-8; boundary=\"quoted b\"").value(), "quoted b");
    EXPECT_FALSE(extract_boundary("application/json").has_value());
    EXPECT_FALSE(extract_boundary("multipart/form-data").has_value());
}

TEST(MultipartTest, ParsesFieldsAndFiles) {
    const auto body = bytes(
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"path\"\r\n"
        "\r\n"
        "/docs\r\n"
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"files\"; filename=\"a.txt\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "line one\r\nline two\r\n"
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"files\"; filename=\"\"\r\n"
        "\r\n"
        "\r\n"
        "--XyZ--\r\n");

    auto parts = parse_multipart(body, "XyZ");
    ASSERT_TRUE(parts.is_ok());
    ASSERT_EQ(parts.value().size(), 3u);

    const auto& path = parts.value()[0];
    EXPECT_EQ(path.name, "path");
    EXPECT_FALSE(path.is_file());
    EXPECT_EQ(path.text(), "/docs");

    const auto& file = parts.value()[1];
    EXPECT_TRUE(file.is_file());
    EXPECT_EQ(*file.filename, "a.txt");
    EXPECT_EQ(file.content_type, "text/plain");
    EXPECT_EQ(file.text(), "line one\r\nline two");

    const auto& empty = parts.value()[2];
    EXPECT_TRUE(empty.is_file());
    EXPECT_EQ(*empty.filename, "");
    EXPECT_EQ(empty.size, 0u);
}

TEST(MultipartTest, IgnoresPreamble) {
    const auto body = bytes("preamble\r\n--b\r\nContent-Disposition: form-data; name=\"x\"\r\n\r\nv\r\n--b--");
    auto parts = parse_multipart(body, "b");
    ASSERT_TRUE(parts.is_ok());
    ASSERT_EQ(parts.value().size(), 1u);
    EXPECT_EQ(parts.value()[0].text(), "v");
}

TEST(MultipartTest, FilenameWithSemicolon) {
    const auto body = bytes("--b\r\nContent-Disposition: form-data; name=\"files\"; filename=\"a;b.txt\"\r\n\r\nx\r\n--b--\r\n");
    auto parts = parse_multipart(body, "b");
    ASSERT_TRUE(parts.is_ok());
    EXPECT_EQ(*parts.value()[0].filename, "a;b.txt");
}

TEST(MultipartTest, TruncatedBodyIsAnError) {
    const auto body = bytes("--b\r\nContent-Disposition: form-data; name=\"files\"; filename=\"a\"\r\n\r\npartial data");
    EXPECT_TRUE(parse_multipart(body, "b").is_error());
    EXPECT_TRUE(parse_multipart(bytes("no delimiter here"), "b").is_error());
}
