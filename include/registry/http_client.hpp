#pragma once

#include "util/result.hpp"

#include <chrono>
#include <expected>
#include <string>

namespace updock {

struct HttpResponse {
    long status = 0;
    std::string body;
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual std::expected<HttpResponse, Error> Get(const std::string& url) const = 0;
};

// libcurl easy interface, one handle per request so it can be shared by
// worker threads.
class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(std::chrono::seconds timeout = std::chrono::seconds(30));

    std::expected<HttpResponse, Error> Get(const std::string& url) const override;

private:
    std::chrono::seconds timeout_;
};

} // namespace updock
