#include "registry/tag_fetcher.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>
#include <utility>

namespace updock {

using json = nlohmann::json;

namespace {

Error RegistryError(std::string msg) {
    return Error::Make(ErrorKind::Registry, std::move(msg));
}

} // namespace

std::expected<TagPage, Error> ParseTagPage(const std::string& body) {
    try {
        const auto j = json::parse(body);
        if (!j.is_object())
            return std::unexpected(RegistryError("tag list must be a JSON object"));

        auto results = j.find("results");
        if (results == j.end() || !results->is_array())
            return std::unexpected(RegistryError("tag list is missing 'results'"));

        TagPage page;
        page.tags.reserve(results->size());
        for (const auto& item : *results) {
            if (!item.is_object() || !item.contains("name") || !item["name"].is_string())
                return std::unexpected(RegistryError("tag entry without a string 'name'"));
            page.tags.push_back(item["name"].get<std::string>());
        }

        auto next = j.find("next");
        if (next != j.end() && next->is_string() && !next->get<std::string>().empty())
            page.next = next->get<std::string>();

        return page;
    } catch (const json::exception& e) {
        return std::unexpected(RegistryError(std::string("invalid tag list: ") + e.what()));
    }
}

DockerHubTagFetcher::DockerHubTagFetcher(const IHttpClient& http,
                                         std::string base_url,
                                         std::size_t page_size)
    : http_(http), base_url_(std::move(base_url)), page_size_(page_size) {}

std::string DockerHubTagFetcher::FirstPageUrl(const ImageName& image) const {
    return base_url_ + "/v2/repositories/" + image.RepositoryPath() +
           "/tags?page_size=" + std::to_string(page_size_);
}

std::expected<std::vector<std::string>, Error> DockerHubTagFetcher::Fetch(
    const ImageName& image,
    std::size_t max_tags) const {
    std::vector<std::string> tags;
    std::optional<std::string> url = FirstPageUrl(image);

    while (url && tags.size() < max_tags) {
        auto resp = http_.Get(*url);
        if (!resp)
            return std::unexpected(resp.error());
        if (resp->status == 404)
            return std::unexpected(RegistryError("image '" + image.ToString() + "' not found"));
        if (resp->status != 200) {
            return std::unexpected(RegistryError("unexpected HTTP status " +
                                                 std::to_string(resp->status) + " for " + *url));
        }

        auto page = ParseTagPage(resp->body);
        if (!page)
            return std::unexpected(page.error());

        for (auto& t : page->tags) {
            if (tags.size() >= max_tags) break;
            tags.push_back(std::move(t));
        }
        url = std::move(page->next);
    }

    LogInfo("fetched %zu tags for %s", tags.size(), image.ToString().c_str());
    return tags;
}

} // namespace updock
