/**
 * @file test_multipart_body.cpp
 * @brief Unit tests for the multipart/form-data encoder
 */

#include <gtest/gtest.h>

#include <cavesync/remote_project/http/multipart_body.h>

#include <cctype>
#include <set>
#include <string>
#include <vector>

namespace cavesync::remote_project::test {

class MultipartEncoderTest : public ::testing::Test {
protected:
    static auto as_string(const byte_buffer& bytes) -> std::string {
        return std::string(bytes.begin(), bytes.end());
    }

    static auto scripted(std::vector<std::string> boundaries)
        -> multipart_encoder::boundary_generator {
        auto queue = std::make_shared<std::vector<std::string>>(std::move(boundaries));
        auto index = std::make_shared<std::size_t>(0);
        return [queue, index]() -> std::string {
            if (*index >= queue->size()) {
                return {};
            }
            return (*queue)[(*index)++];
        };
    }
};

TEST_F(MultipartEncoderTest, SingleTextPartStructure) {
    multipart_encoder encoder;
    auto body = encoder.build({multipart_part::text("field1", "value1")});
    ASSERT_TRUE(body);

    auto text = as_string(body.value().bytes);
    const auto& boundary = body.value().boundary;

    EXPECT_NE(text.find("Content-Disposition: form-data; name=\"field1\""), std::string::npos);
    EXPECT_NE(text.find("value1"), std::string::npos);
    EXPECT_NE(text.find("Content-Type: text/plain"), std::string::npos);
    EXPECT_EQ(text.rfind("--" + boundary + "--\r\n"), text.size() - boundary.size() - 6);
    EXPECT_EQ(body.value().content_type, "multipart/form-data; boundary=" + boundary);
}

TEST_F(MultipartEncoderTest, ExactWireFormat) {
    byte_buffer archive = {0x00, 0xff, 0x0d, 0x0a};
    auto bytes = multipart_encoder::encode(
        {multipart_part::text("message", "fix survey"),
         multipart_part::file("artifact", archive, "application/octet-stream", "p1.tml")},
        "b0undary");
    ASSERT_TRUE(bytes);

    std::string expected =
        "--b0undary\r\n"
        "Content-Disposition: form-data; name=\"message\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "fix survey\r\n"
        "--b0undary\r\n"
        "Content-Disposition: form-data; name=\"artifact\"; filename=\"p1.tml\"\r\n"
        "Content-Type: application/octet-stream\r\n"
        "\r\n";
    expected += std::string(archive.begin(), archive.end());
    expected += "\r\n--b0undary--\r\n";

    EXPECT_EQ(as_string(bytes.value()), expected);
}

TEST_F(MultipartEncoderTest, PartOrderIsPreserved) {
    multipart_encoder encoder;
    auto body = encoder.build({multipart_part::text("zeta", "1"),
                               multipart_part::text("alpha", "2"),
                               multipart_part::text("mid", "3")});
    ASSERT_TRUE(body);

    auto text = as_string(body.value().bytes);
    auto zeta = text.find("name=\"zeta\"");
    auto alpha = text.find("name=\"alpha\"");
    auto mid = text.find("name=\"mid\"");
    EXPECT_LT(zeta, alpha);
    EXPECT_LT(alpha, mid);
}

TEST_F(MultipartEncoderTest, BoundaryIsLowercaseHex) {
    auto boundary = multipart_encoder::generate_boundary();
    EXPECT_EQ(boundary.size(), multipart_encoder::boundary_length);
    for (char c : boundary) {
        EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST_F(MultipartEncoderTest, BoundariesDifferBetweenBuilds) {
    multipart_encoder encoder;
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto body = encoder.build({multipart_part::text("field1", "value1")});
        ASSERT_TRUE(body);
        EXPECT_TRUE(seen.insert(body.value().boundary).second);
    }
}

TEST_F(MultipartEncoderTest, RepeatedBoundaryIsRedrawn) {
    multipart_encoder encoder(scripted({"aaaaaaaaaaaaaaaa", "aaaaaaaaaaaaaaaa", "bbbbbbbbbbbbbbbb"}));

    auto first = encoder.build({multipart_part::text("f", "v")});
    auto second = encoder.build({multipart_part::text("f", "v")});
    ASSERT_TRUE(first && second);

    EXPECT_EQ(first.value().boundary, "aaaaaaaaaaaaaaaa");
    EXPECT_EQ(second.value().boundary, "bbbbbbbbbbbbbbbb");
}

TEST_F(MultipartEncoderTest, BoundaryFoundInContentIsRedrawn) {
    multipart_encoder encoder(scripted({"cafebabecafebabe", "0123456789abcdef"}));

    auto body = encoder.build({multipart_part::text("f", "prefix cafebabecafebabe suffix")});
    ASSERT_TRUE(body);
    EXPECT_EQ(body.value().boundary, "0123456789abcdef");
}

TEST_F(MultipartEncoderTest, ExhaustedGeneratorFails) {
    multipart_encoder encoder(scripted({}));
    auto body = encoder.build({multipart_part::text("f", "v")});
    ASSERT_FALSE(body);
    EXPECT_EQ(body.error().code, error_code::internal_error);
}

TEST_F(MultipartEncoderTest, RejectsMalformedParts) {
    multipart_encoder encoder;

    EXPECT_FALSE(encoder.build({}));
    EXPECT_FALSE(encoder.build({multipart_part::text("", "v")}));
    EXPECT_FALSE(encoder.build({multipart_part::text("bad\"name", "v")}));
    EXPECT_FALSE(encoder.build({multipart_part::text("f", "v", "")}));
    EXPECT_FALSE(encoder.build({multipart_part::text("f", "v", "text/plain\r\nX-Evil: 1")}));
    EXPECT_FALSE(encoder.build({multipart_part::file("f", {1}, "application/octet-stream", "")}));

    auto r = encoder.build({multipart_part::file("f", {1}, "application/octet-stream",
                                                 "evil\r\n.tml")});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_argument);
}

TEST_F(MultipartEncoderTest, RejectsInvalidBoundary) {
    std::vector<multipart_part> parts{multipart_part::text("f", "v")};
    EXPECT_FALSE(multipart_encoder::encode(parts, ""));
    EXPECT_FALSE(multipart_encoder::encode(parts, "has space"));
    EXPECT_FALSE(multipart_encoder::encode(parts, std::string(71, 'a')));
    EXPECT_TRUE(multipart_encoder::encode(parts, std::string(70, 'a')));
}

}  // namespace cavesync::remote_project::test
