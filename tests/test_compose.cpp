#include "docker/compose.hpp"

#include <gtest/gtest.h>
#include <string>

namespace updock {

TEST(ComposeParserTest, ParsesServicesInOrder) {
    const std::string input = R"(
services:
    ubuntu:
        # updock --pattern "<!>.<>"
        image: ubuntu:18.04

    alpine:
        build: ./alpine

    db:
        image: postgres
)";
    auto services = ComposeParser::Parse(input);
    ASSERT_TRUE(services.has_value()) << services.error().msg;
    ASSERT_EQ(services->size(), 3U);

    const auto& ubuntu = (*services)[0];
    EXPECT_EQ(ubuntu.name, "ubuntu");
    ASSERT_TRUE(ubuntu.context.has_value());
    const auto& ref = std::get<ImageReference>(*ubuntu.context);
    EXPECT_EQ(ref.ToString(), "ubuntu:18.04");
    EXPECT_EQ(ref.pattern, std::optional<std::string>("<!>.<>"));
    EXPECT_EQ(ref.line, 5U);

    const auto& alpine = (*services)[1];
    EXPECT_EQ(alpine.name, "alpine");
    ASSERT_TRUE(alpine.context.has_value());
    EXPECT_EQ(std::get<std::filesystem::path>(*alpine.context).string(), "./alpine");

    const auto& db = (*services)[2];
    ASSERT_TRUE(db.context.has_value());
    const auto& db_ref = std::get<ImageReference>(*db.context);
    EXPECT_EQ(db_ref.tag, "latest");
    EXPECT_FALSE(db_ref.pattern.has_value());
}

TEST(ComposeParserTest, FailsWhenServicesIsMissing) {
    auto services = ComposeParser::Parse("no: services\n");
    ASSERT_FALSE(services.has_value());
    EXPECT_EQ(services.error().kind, ErrorKind::Manifest);
    EXPECT_NE(services.error().msg.find("failed to find 'services'"), std::string::npos);
}

TEST(ComposeParserTest, FailsOnInvalidComposeFile) {
    const std::string input = R"(
services:
    - ubuntu
    - alpine:
)";
    auto services = ComposeParser::Parse(input);
    ASSERT_FALSE(services.has_value());
    EXPECT_NE(services.error().msg.find("seems to be invalid"), std::string::npos);
}

TEST(ComposeParserTest, FailsOnUnparsableYaml) {
    auto services = ComposeParser::Parse("services: [unclosed\n");
    ASSERT_FALSE(services.has_value());
    EXPECT_NE(services.error().msg.find("failed to parse compose file"), std::string::npos);
}

TEST(ComposeParserTest, KeepsServiceErrorsOnTheService) {
    const std::string input = R"(
services:
    ubuntu:
        image: "invalid/image/definition"
    alpine:
        build:
            context: unsupported
    web:
        image: nginx:1.19
)";
    auto services = ComposeParser::Parse(input);
    ASSERT_TRUE(services.has_value());
    ASSERT_EQ(services->size(), 3U);

    ASSERT_FALSE((*services)[0].context.has_value());
    EXPECT_NE((*services)[0].context.error().msg.find("'invalid/image/definition' is invalid"),
              std::string::npos);

    ASSERT_FALSE((*services)[1].context.has_value());
    EXPECT_NE((*services)[1].context.error().msg.find("no build context was found for service 'alpine'"),
              std::string::npos);

    EXPECT_TRUE((*services)[2].context.has_value());

    EXPECT_EQ((*services)[0].image, "invalid/image/definition");
    EXPECT_FALSE((*services)[0].has_directive);
    EXPECT_TRUE((*services)[1].image.empty());
}

TEST(ComposeParserTest, RecordsDirectiveAboveInvalidImage) {
    const std::string input = R"(
services:
    internal:
        # updock --pattern "<>.<>"
        image: ghcr.io/acme/internal:2.0
    other:
        image: ghcr.io/acme/other:1.0
)";
    auto services = ComposeParser::Parse(input);
    ASSERT_TRUE(services.has_value());
    ASSERT_EQ(services->size(), 2U);

    EXPECT_FALSE((*services)[0].context.has_value());
    EXPECT_TRUE((*services)[0].has_directive);
    EXPECT_FALSE((*services)[1].context.has_value());
    EXPECT_FALSE((*services)[1].has_directive);
}

} // namespace updock
