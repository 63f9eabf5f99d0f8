#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace updock::config {

inline constexpr const char* kDefaultConfigPath = "/etc/updock/updock.conf";
inline constexpr const char* kDefaultRegistryUrl = "https://hub.docker.com";

class UpdockConfigFromFile {
public:
    std::string registry_url = kDefaultRegistryUrl;
    std::uint64_t timeout_seconds = 30;
    std::uint64_t jobs = 4;
    std::uint64_t max_tags = 1000;
    std::uint64_t page_size = 100;

    std::optional<std::string> log_level;

    Result LoadFile(const std::string& path);

    void Reset();
};

} // namespace updock::config
