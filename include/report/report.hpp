#pragma once

#include "check/checker.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace updock {

// Ordered by severity; a run is as severe as its worst image.
enum class UpdateLevel : int {
    NoUpdates = 0,
    CompatibleUpdate = 1,
    BreakingUpdate = 2,
    Failure = 3,
};

inline constexpr int kExitNoUpdate = 0;
inline constexpr int kExitCompatibleUpdate = 1;
inline constexpr int kExitBreakingUpdate = 2;
inline constexpr int kExitError = 10;

UpdateLevel LevelOf(const ImageReport& report);
UpdateLevel RunLevel(const std::vector<ImageReport>& reports);
int ExitCodeFor(UpdateLevel level);

class ReportBuilder {
public:
    // kind is "Dockerfile" or "Docker Compose file".
    ReportBuilder(std::string kind, std::string path);

    // "image:tag (label)", or just the label when the reference is unknown.
    static std::string Subject(const ImageReport& report);

    // One block per image: its update lists, or its error.
    static std::string RenderImage(const ImageReport& report);

    // Images that were checked; failed images are left to RenderFailures.
    std::string RenderText(const std::vector<ImageReport>& reports) const;
    // Empty when no image failed.
    std::string RenderFailures(const std::vector<ImageReport>& reports) const;
    nlohmann::ordered_json RenderJson(const std::vector<ImageReport>& reports) const;

private:
    std::string kind_;
    std::string path_;
};

} // namespace updock
