#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>

namespace updock::config::detail {

namespace {

enum class Lookup { Absent, Ok, WrongType };

Lookup GetString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Lookup::Absent;
    if (!it->is_string())
        return Lookup::WrongType;
    out = it->get<std::string>();
    return Lookup::Ok;
}

Lookup GetU64(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Lookup::Absent;
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return Lookup::WrongType;
    auto v = it->get<long long>();
    if (v < 0)
        return Lookup::WrongType;
    out = static_cast<std::uint64_t>(v);
    return Lookup::Ok;
}

bool GetBoundedU64(const nlohmann::json& j,
                   const char* key,
                   std::uint64_t lo,
                   std::uint64_t hi,
                   std::uint64_t& out,
                   std::string& err) {
    std::uint64_t v{};
    switch (GetU64(j, key, v)) {
        case Lookup::Absent:
            return true;
        case Lookup::WrongType:
            err = std::string(key) + " must be a non-negative integer";
            return false;
        case Lookup::Ok:
            break;
    }
    if (v < lo || v > hi) {
        err = std::string(key) + " out of range [" + std::to_string(lo) + ", " +
              std::to_string(hi) + "]";
        return false;
    }
    out = v;
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UpdockConfigFromFile& cfg, std::string& err) {
    if (GetString(j, "RegistryUrl", cfg.registry_url) == Lookup::WrongType) {
        err = "RegistryUrl must be a string";
        return false;
    }
    while (!cfg.registry_url.empty() && cfg.registry_url.back() == '/') {
        cfg.registry_url.pop_back();
    }
    if (cfg.registry_url.empty()) {
        err = "RegistryUrl must not be empty";
        return false;
    }

    if (!GetBoundedU64(j, "TimeoutSeconds", 1, 3600, cfg.timeout_seconds, err))
        return false;
    if (!GetBoundedU64(j, "Jobs", 1, 256, cfg.jobs, err))
        return false;
    if (!GetBoundedU64(j, "MaxTags", 1, 100000, cfg.max_tags, err))
        return false;
    if (!GetBoundedU64(j, "PageSize", 1, 100, cfg.page_size, err))
        return false;

    {
        std::string lvl;
        switch (GetString(j, "LogLevel", lvl)) {
            case Lookup::WrongType:
                err = "LogLevel must be a string";
                return false;
            case Lookup::Ok:
                if (!ParseLogLevel(lvl)) {
                    err = "unknown LogLevel '" + lvl + "'";
                    return false;
                }
                cfg.log_level = lvl;
                break;
            case Lookup::Absent:
                break;
        }
    }

    return true;
}

} // namespace updock::config::detail
