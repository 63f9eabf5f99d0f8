#include "report/report.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace updock {

namespace {

std::string Join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

UpdateLevel LevelOf(const ImageReport& report) {
    if (!report.result) return UpdateLevel::Failure;
    if (!report.result->breaking.empty()) return UpdateLevel::BreakingUpdate;
    if (!report.result->compatible.empty()) return UpdateLevel::CompatibleUpdate;
    return UpdateLevel::NoUpdates;
}

UpdateLevel RunLevel(const std::vector<ImageReport>& reports) {
    UpdateLevel level = UpdateLevel::NoUpdates;
    for (const auto& r : reports) level = std::max(level, LevelOf(r));
    return level;
}

int ExitCodeFor(UpdateLevel level) {
    switch (level) {
        case UpdateLevel::NoUpdates:        return kExitNoUpdate;
        case UpdateLevel::CompatibleUpdate: return kExitCompatibleUpdate;
        case UpdateLevel::BreakingUpdate:   return kExitBreakingUpdate;
        case UpdateLevel::Failure:          return kExitError;
    }
    return kExitError;
}

ReportBuilder::ReportBuilder(std::string kind, std::string path)
    : kind_(std::move(kind)), path_(std::move(path)) {}

std::string ReportBuilder::Subject(const ImageReport& report) {
    if (!report.image) return report.label;
    return report.image->ToString() + " (" + report.label + ")";
}

std::string ReportBuilder::RenderImage(const ImageReport& report) {
    std::ostringstream os;
    os << Subject(report) << "\n";
    if (!report.result) {
        const Error& err = report.result.error();
        os << "  error (" << ToString(err.kind) << "): " << err.msg << "\n";
        return os.str();
    }

    const UpdateSet& set = *report.result;
    if (!set.HasUpdates()) {
        os << "  no updates\n";
        return os.str();
    }
    if (!set.breaking.empty()) os << "  breaking:   " << Join(set.breaking, ", ") << "\n";
    if (!set.compatible.empty()) os << "  compatible: " << Join(set.compatible, ", ") << "\n";
    return os.str();
}

std::string ReportBuilder::RenderText(const std::vector<ImageReport>& reports) const {
    std::ostringstream os;
    os << "Report for " << kind_ << " at '" << path_ << "':\n\n";
    if (reports.empty()) {
        os << "No images with a version pattern were found.\n";
        return os.str();
    }
    for (const auto& r : reports) {
        if (r.result) os << RenderImage(r);
    }
    return os.str();
}

std::string ReportBuilder::RenderFailures(const std::vector<ImageReport>& reports) const {
    std::ostringstream os;
    for (const auto& r : reports) {
        if (!r.result) os << RenderImage(r);
    }
    if (os.str().empty()) return {};
    return "Failures in " + kind_ + " at '" + path_ + "':\n\n" + os.str() + "\n";
}

nlohmann::ordered_json ReportBuilder::RenderJson(const std::vector<ImageReport>& reports) const {
    nlohmann::ordered_json failures = nlohmann::ordered_json::object();
    nlohmann::ordered_json no_updates = nlohmann::ordered_json::array();
    nlohmann::ordered_json compatible = nlohmann::ordered_json::object();
    nlohmann::ordered_json breaking = nlohmann::ordered_json::object();

    for (const auto& r : reports) {
        const std::string subject = Subject(r);
        if (!r.result) {
            failures[subject] = r.result.error().msg;
            continue;
        }
        if (!r.result->HasUpdates()) no_updates.push_back(subject);
        if (!r.result->compatible.empty()) compatible[subject] = r.result->compatible;
        if (!r.result->breaking.empty()) breaking[subject] = r.result->breaking;
    }

    nlohmann::ordered_json out;
    out["path"] = path_;
    out["failures"] = std::move(failures);
    out["no_updates"] = std::move(no_updates);
    out["compatible_updates"] = std::move(compatible);
    out["breaking_updates"] = std::move(breaking);
    return out;
}

} // namespace updock
