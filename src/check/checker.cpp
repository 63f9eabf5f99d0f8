#include "check/checker.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/worker_pool.hpp"
#include "version/pattern.hpp"

#include <exception>
#include <utility>

namespace updock {

Checker::Checker(const ITagFetcher& fetcher, Options opt) : fetcher_(fetcher), opt_(opt) {}

ImageReport Checker::CheckOne(const CheckTarget& target) const {
    ImageReport report{.label = target.label, .image = std::nullopt, .result = UpdateSet{}};

    if (!target.image) {
        report.result = std::unexpected(target.image.error());
        return report;
    }
    const ImageReference& ref = *target.image;
    report.image = ref;

    if (!ref.pattern) {
        report.result = std::unexpected(Error::Make(
            ErrorKind::PatternSyntax, "no pattern given for " + ref.ToString()));
        return report;
    }

    auto pattern = PatternCompiler::Compile(*ref.pattern);
    if (!pattern) {
        report.result = std::unexpected(pattern.error());
        return report;
    }

    LogInfo("checking %s (%s) with pattern '%s'",
            ref.ToString().c_str(), target.label.c_str(), pattern->Source().c_str());

    auto tags = fetcher_.Fetch(ref.name, opt_.max_tags);
    if (!tags) {
        LogWarn("%s: %s", ref.ToString().c_str(), tags.error().msg.c_str());
        report.result = std::unexpected(tags.error());
        return report;
    }

    report.result = UpdateClassifier::Classify(*pattern, ref.tag, *tags);
    return report;
}

std::vector<ImageReport> Checker::CheckAll(const std::vector<CheckTarget>& targets) const {
    std::vector<ImageReport> reports(targets.size(),
                                     ImageReport{.label = {}, .image = std::nullopt, .result = UpdateSet{}});

    WorkerPool pool(opt_.jobs);
    LogDebug("checking %zu images on %zu workers", targets.size(), pool.Workers());

    pool.Run(targets.size(), [&](std::size_t i) {
        if (g_cancel.load(std::memory_order_relaxed)) {
            reports[i].label = targets[i].label;
            if (targets[i].image) reports[i].image = *targets[i].image;
            reports[i].result = std::unexpected(Error::Make(ErrorKind::Cancelled, "check was interrupted"));
            return;
        }
        try {
            reports[i] = CheckOne(targets[i]);
        } catch (const std::exception& e) {
            LogError("%s: %s", targets[i].label.c_str(), e.what());
            reports[i].label = targets[i].label;
            reports[i].result = std::unexpected(Error::Make(ErrorKind::Registry, e.what()));
        }
    });

    return reports;
}

} // namespace updock
