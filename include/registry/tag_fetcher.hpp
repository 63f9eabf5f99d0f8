#pragma once

#include "docker/image.hpp"
#include "registry/http_client.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace updock {

class ITagFetcher {
public:
    virtual ~ITagFetcher() = default;
    // At most max_tags tags, in registry order.
    virtual std::expected<std::vector<std::string>, Error> Fetch(const ImageName& image,
                                                                 std::size_t max_tags) const = 0;
};

struct TagPage {
    std::vector<std::string> tags;
    std::optional<std::string> next;
};

// Body of GET /v2/repositories/<repo>/tags.
std::expected<TagPage, Error> ParseTagPage(const std::string& body);

class DockerHubTagFetcher final : public ITagFetcher {
public:
    DockerHubTagFetcher(const IHttpClient& http, std::string base_url, std::size_t page_size = 100);

    std::string FirstPageUrl(const ImageName& image) const;

    std::expected<std::vector<std::string>, Error> Fetch(const ImageName& image,
                                                         std::size_t max_tags) const override;

private:
    const IHttpClient& http_;
    std::string base_url_;
    std::size_t page_size_;
};

} // namespace updock
