#include "registry/http_client.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace updock {

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

std::once_flag g_curl_init;

size_t AppendBody(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

Error RegistryError(std::string msg) {
    return Error::Make(ErrorKind::Registry, std::move(msg));
}

} // namespace

CurlHttpClient::CurlHttpClient(std::chrono::seconds timeout) : timeout_(timeout) {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

std::expected<HttpResponse, Error> CurlHttpClient::Get(const std::string& url) const {
    CurlHandle curl(curl_easy_init());
    if (!curl)
        return std::unexpected(RegistryError("failed to initialize libcurl"));

    HttpResponse resp;
    char errbuf[CURL_ERROR_SIZE]{};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "updock");
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);

    LogDebug("GET %s", url.c_str());
    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        const std::string detail = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
        return std::unexpected(RegistryError("request to " + url + " failed: " + detail));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    LogDebug("GET %s -> %ld (%zu bytes)", url.c_str(), resp.status, resp.body.size());
    return resp;
}

} // namespace updock
