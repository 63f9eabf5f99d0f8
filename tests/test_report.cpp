#include "report/report.hpp"

#include <gtest/gtest.h>
#include <string>

namespace updock {
namespace {

ImageReport Updated(const std::string& label,
                    const std::string& image,
                    std::vector<std::string> breaking,
                    std::vector<std::string> compatible) {
    auto ref = ImageReference::Parse(image);
    EXPECT_TRUE(ref.has_value());
    UpdateSet set;
    set.breaking = std::move(breaking);
    set.compatible = std::move(compatible);
    return {.label = label, .image = *ref, .result = std::move(set)};
}

ImageReport Failed(const std::string& label, ErrorKind kind, const std::string& msg) {
    return {.label = label, .image = std::nullopt, .result = std::unexpected(Error::Make(kind, msg))};
}

std::vector<ImageReport> SampleReports() {
    return {
        Updated("line 2", "node:14.5.0-alpine", {"16.1.0-alpine", "15.0.0-alpine"}, {"14.6.0-alpine"}),
        Updated("line 5", "nginx:1.19", {}, {}),
        Updated("line 8", "redis:6.0", {}, {"6.2"}),
        Failed("line 11", ErrorKind::Registry, "request failed: timeout"),
    };
}

TEST(ReportTest, LevelsFollowTheWorstImage) {
    const auto reports = SampleReports();
    EXPECT_EQ(LevelOf(reports[0]), UpdateLevel::BreakingUpdate);
    EXPECT_EQ(LevelOf(reports[1]), UpdateLevel::NoUpdates);
    EXPECT_EQ(LevelOf(reports[2]), UpdateLevel::CompatibleUpdate);
    EXPECT_EQ(LevelOf(reports[3]), UpdateLevel::Failure);

    EXPECT_EQ(RunLevel(reports), UpdateLevel::Failure);
    EXPECT_EQ(RunLevel({reports[1], reports[2]}), UpdateLevel::CompatibleUpdate);
    EXPECT_EQ(RunLevel({reports[1]}), UpdateLevel::NoUpdates);
    EXPECT_EQ(RunLevel({}), UpdateLevel::NoUpdates);
}

TEST(ReportTest, ExitCodes) {
    EXPECT_EQ(ExitCodeFor(UpdateLevel::NoUpdates), 0);
    EXPECT_EQ(ExitCodeFor(UpdateLevel::CompatibleUpdate), 1);
    EXPECT_EQ(ExitCodeFor(UpdateLevel::BreakingUpdate), 2);
    EXPECT_EQ(ExitCodeFor(UpdateLevel::Failure), 10);
}

TEST(ReportTest, RendersOneBlockPerImage) {
    ReportBuilder builder("Dockerfile", "/srv/app/Dockerfile");
    const std::string text = builder.RenderText(SampleReports());

    const std::string expected =
        "Report for Dockerfile at '/srv/app/Dockerfile':\n"
        "\n"
        "node:14.5.0-alpine (line 2)\n"
        "  breaking:   16.1.0-alpine, 15.0.0-alpine\n"
        "  compatible: 14.6.0-alpine\n"
        "nginx:1.19 (line 5)\n"
        "  no updates\n"
        "redis:6.0 (line 8)\n"
        "  compatible: 6.2\n";
    EXPECT_EQ(text, expected);
}

TEST(ReportTest, RendersFailuresSeparately) {
    ReportBuilder builder("Dockerfile", "/srv/app/Dockerfile");
    const std::string expected =
        "Failures in Dockerfile at '/srv/app/Dockerfile':\n"
        "\n"
        "line 11\n"
        "  error (registry error): request failed: timeout\n"
        "\n";
    EXPECT_EQ(builder.RenderFailures(SampleReports()), expected);

    const auto reports = SampleReports();
    EXPECT_TRUE(builder.RenderFailures({reports[0], reports[1]}).empty());
    EXPECT_EQ(builder.RenderText({reports[3]}), "Report for Dockerfile at '/srv/app/Dockerfile':\n\n");
}

TEST(ReportTest, RendersEmptyRun) {
    ReportBuilder builder("Docker Compose file", "/srv/docker-compose.yml");
    EXPECT_NE(builder.RenderText({}).find("No images with a version pattern"), std::string::npos);
}

TEST(ReportTest, RendersJsonInInputOrder) {
    ReportBuilder builder("Dockerfile", "/srv/app/Dockerfile");
    const auto j = builder.RenderJson(SampleReports());

    const std::string expected = R"({"path":"/srv/app/Dockerfile",)"
                                 R"("failures":{"line 11":"request failed: timeout"},)"
                                 R"x("no_updates":["nginx:1.19 (line 5)"],)x"
                                 R"x("compatible_updates":{"node:14.5.0-alpine (line 2)":["14.6.0-alpine"],"redis:6.0 (line 8)":["6.2"]},)x"
                                 R"x("breaking_updates":{"node:14.5.0-alpine (line 2)":["16.1.0-alpine","15.0.0-alpine"]}})x";
    EXPECT_EQ(j.dump(), expected);
}

} // namespace
} // namespace updock
