#include "check/checker.hpp"
#include "registry/http_client.hpp"
#include "registry/tag_fetcher.hpp"
#include "report/report.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "version/pattern.hpp"
#include "version/tag_matcher.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <getopt.h>
#include <optional>
#include <string>

namespace {

constexpr std::size_t kDefaultFetchAmount = 25;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s fetch <image> [-p <pattern>] [-a <amount>]\n"
        "   %s check <Dockerfile> [-p <pattern>] [--json]\n"
        "   %s check-compose <compose.yml> [-p <pattern>] [--json]\n"
        "\n"
        "Patterns: '<>' is a compatible version number, '<!>' a breaking one,\n"
        "anything else must match literally, e.g. \"<!>.<>.<>-alpine\".\n"
        "Directives in files: # updock --pattern \"<pattern>\"\n"
        "\n"
        "Options:\n"
        "  -p, --pattern   Pattern for images without a directive (fetch: filter)\n"
        "  -a, --amount    Number of tags to fetch (fetch only, default 25)\n"
        "  -j, --json      Print the report as JSON\n"
        "  -c, --config    Config file (default %s)\n"
        "  -v, --verbose   More logging (repeat for debug)\n"
        "  -q, --quiet     Only log errors\n"
        "  -h, --help      Show this help\n"
        "\n"
        "Exit status: 0 no updates, 1 compatible update, 2 breaking update, 10 error\n",
        argv, argv, argv, updock::config::kDefaultConfigPath);
}

struct CliOptions {
    std::string command;
    std::string target;
    std::optional<std::string> pattern;
    std::size_t amount = kDefaultFetchAmount;
    bool json = false;
    std::optional<std::string> config_path;
    int verbosity = 0;
    bool quiet = false;
};

// Config file, then UPDOCK_LOG, then -v/-q.
void ApplyLogLevel(const updock::config::UpdockConfigFromFile &cfg, const CliOptions &cli) {
    auto &logger = updock::Logger::Instance();
    if (cfg.log_level) {
        if (auto lvl = updock::ParseLogLevel(*cfg.log_level)) logger.SetLevel(*lvl);
    }
    if (const char *env = std::getenv("UPDOCK_LOG")) {
        if (auto lvl = updock::ParseLogLevel(env)) {
            logger.SetLevel(*lvl);
        } else {
            LogWarn("ignoring UPDOCK_LOG=%s", env);
        }
    }
    if (cli.quiet) {
        logger.SetLevel(updock::LogLevel::Error);
    } else if (cli.verbosity == 1) {
        logger.SetLevel(updock::LogLevel::Info);
    } else if (cli.verbosity > 1) {
        logger.SetLevel(updock::LogLevel::Debug);
    }
}

int Fetch(const CliOptions &cli, const updock::ITagFetcher &fetcher) {
    auto image = updock::ImageName::Parse(cli.target);
    if (!image) {
        std::fprintf(stderr, "ERROR: %s\n", image.error().msg.c_str());
        return updock::kExitError;
    }

    std::optional<updock::Pattern> pattern;
    if (cli.pattern) {
        auto compiled = updock::PatternCompiler::Compile(*cli.pattern);
        if (!compiled) {
            std::fprintf(stderr, "ERROR: %s\n", compiled.error().msg.c_str());
            return updock::kExitError;
        }
        pattern = std::move(*compiled);
    }

    auto tags = fetcher.Fetch(*image, cli.amount);
    if (!tags) {
        std::fprintf(stderr, "ERROR: Failed to fetch tags: %s\n", tags.error().msg.c_str());
        return updock::kExitError;
    }

    std::vector<std::string> shown = *tags;
    if (pattern) {
        shown = updock::TagMatcher::Filter(*pattern, *tags);
        std::printf("Fetched %zu tags. Found %zu matching '%s':\n",
                    tags->size(), shown.size(), pattern->Source().c_str());
    } else {
        std::printf("Fetched %zu tags:\n", tags->size());
    }
    for (const auto &t : shown) std::printf("%s\n", t.c_str());
    return updock::kExitNoUpdate;
}

int Check(const CliOptions &cli,
          const updock::config::UpdockConfigFromFile &cfg,
          const updock::ITagFetcher &fetcher) {
    namespace fs = std::filesystem;
    const bool compose = cli.command == "check-compose";

    std::error_code ec;
    const fs::path path = fs::canonical(cli.target, ec);
    if (ec) {
        std::fprintf(stderr, "ERROR: Failed to find file '%s'\n", cli.target.c_str());
        return updock::kExitError;
    }

    auto targets = compose ? updock::CollectComposeTargets(path, cli.pattern)
                           : updock::CollectDockerfileTargets(path, cli.pattern);
    if (!targets) {
        std::fprintf(stderr, "ERROR: %s: %s\n",
                     updock::ToString(targets.error().kind), targets.error().msg.c_str());
        return updock::kExitError;
    }

    updock::Checker checker(fetcher, {.jobs = cfg.jobs, .max_tags = cfg.max_tags});
    const auto reports = checker.CheckAll(*targets);

    updock::ReportBuilder builder(compose ? "Docker Compose file" : "Dockerfile", path.string());
    if (cli.json) {
        std::printf("%s\n", builder.RenderJson(reports).dump(2).c_str());
    } else {
        std::fprintf(stderr, "%s", builder.RenderFailures(reports).c_str());
        std::printf("%s", builder.RenderText(reports).c_str());
    }

    return updock::ExitCodeFor(updock::RunLevel(reports));
}

} // namespace

int main(int argc, char **argv) {
    updock::InstallSignalHandlers();

    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        PrintUsage(argv[0]);
        return argc < 2 ? updock::kExitError : 0;
    }

    CliOptions cli;
    cli.command = argv[1];
    if (cli.command != "fetch" && cli.command != "check" && cli.command != "check-compose") {
        std::fprintf(stderr, "Unknown command: %s\n", argv[1]);
        PrintUsage(argv[0]);
        return updock::kExitError;
    }

    static option long_opts[] = {
        {"pattern", required_argument, nullptr, 'p'},
        {"amount", required_argument, nullptr, 'a'},
        {"json", no_argument, nullptr, 'j'},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // Options follow the subcommand.
    int sub_argc = argc - 1;
    char **sub_argv = argv + 1;
    int idx = 0;
    int c;
    while ((c = getopt_long(sub_argc, sub_argv, "hp:a:jc:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'p':
                cli.pattern = optarg;
                break;

            case 'a': {
                char *end = nullptr;
                unsigned long long v = std::strtoull(optarg, &end, 10);
                if (!end || *end != '\0' || v == 0) {
                    std::fprintf(stderr, "Invalid --amount: %s\n", optarg);
                    return updock::kExitError;
                }
                cli.amount = static_cast<std::size_t>(v);
                break;
            }

            case 'j':
                cli.json = true;
                break;

            case 'c':
                cli.config_path = optarg;
                break;

            case 'v':
                ++cli.verbosity;
                break;

            case 'q':
                cli.quiet = true;
                break;

            default:
                PrintUsage(argv[0]);
                return updock::kExitError;
        }
    }

    if (optind != sub_argc - 1) {
        PrintUsage(argv[0]);
        return updock::kExitError;
    }
    cli.target = sub_argv[optind];

    updock::config::UpdockConfigFromFile cfg;
    const std::string config_path = cli.config_path.value_or(updock::config::kDefaultConfigPath);
    std::error_code ec;
    if (cli.config_path || std::filesystem::exists(config_path, ec)) {
        if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: Config: %s\n", r.message().c_str());
            return updock::kExitError;
        }
    }
    ApplyLogLevel(cfg, cli);
    LogDebug("registry=%s timeout=%llus jobs=%llu max_tags=%llu",
             cfg.registry_url.c_str(),
             (unsigned long long)cfg.timeout_seconds,
             (unsigned long long)cfg.jobs,
             (unsigned long long)cfg.max_tags);

    updock::CurlHttpClient http(std::chrono::seconds(cfg.timeout_seconds));
    updock::DockerHubTagFetcher fetcher(http, cfg.registry_url, cfg.page_size);

    if (cli.command == "fetch") {
        return Fetch(cli, fetcher);
    }
    return Check(cli, cfg, fetcher);
}
