#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace updock::config {

void UpdockConfigFromFile::Reset() {
    *this = UpdockConfigFromFile{};
}

Result UpdockConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Config, err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::Config, err + " in " + path);
    }

    return Result::Ok();
}

} // namespace updock::config
