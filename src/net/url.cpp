#include "include/url.hpp"

#include <format>
#include <memory>
#include <vector>

#include <curl/curl.h>

namespace Url {

namespace {

struct CurlFreeDeleter {
    void operator()(char* p) const noexcept {
        if (p) curl_free(p);
    }
};

using CurlString = std::unique_ptr<char, CurlFreeDeleter>;
using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

std::expected<UrlHandle, std::string> parse(std::string_view url) {
    std::string text(url);
    if (text.starts_with("//")) {
        text.insert(0, "https:");
    }

    UrlHandle handle(curl_url(), curl_url_cleanup);
    if (!handle) {
        return std::unexpected("Out of memory while parsing URL");
    }

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, text.c_str(), 0);
    if (rc != CURLUE_OK) {
        return std::unexpected(std::format("Invalid URL '{}': {}", url, curl_url_strerror(rc)));
    }
    return handle;
}

std::expected<std::string, std::string> get_part(CURLU* handle, CURLUPart part) {
    char* raw = nullptr;
    CURLUcode rc = curl_url_get(handle, part, &raw, 0);
    CurlString owned(raw);
    if (rc != CURLUE_OK) {
        return std::unexpected(std::string(curl_url_strerror(rc)));
    }
    return std::string(owned.get());
}

}

std::expected<std::string, std::string> normalize(std::string_view url) {
    auto handle = parse(url);
    if (!handle) return std::unexpected(handle.error());

    auto hostname = get_part(handle->get(), CURLUPART_HOST);
    if (!hostname || hostname->empty()) {
        return std::unexpected(std::format("Invalid URL '{}': missing host", url));
    }
    return get_part(handle->get(), CURLUPART_URL);
}

std::expected<std::string, std::string> host(std::string_view url) {
    auto handle = parse(url);
    if (!handle) return std::unexpected(handle.error());
    return get_part(handle->get(), CURLUPART_HOST);
}

std::expected<std::string, std::string> join_path(std::string_view base, std::string_view suffix) {
    auto handle = parse(base);
    if (!handle) return std::unexpected(handle.error());

    auto path = get_part(handle->get(), CURLUPART_PATH);
    if (!path) return std::unexpected(path.error());

    while (suffix.starts_with('/')) suffix.remove_prefix(1);
    if (suffix.empty()) {
        return get_part(handle->get(), CURLUPART_URL);
    }

    std::string joined = *path;
    while (joined.ends_with('/')) joined.pop_back();
    joined += '/';
    joined += suffix;

    CURLUcode rc = curl_url_set(handle->get(), CURLUPART_PATH, joined.c_str(), 0);
    if (rc != CURLUE_OK) {
        return std::unexpected(std::format("Cannot set URL path '{}': {}", joined, curl_url_strerror(rc)));
    }
    return get_part(handle->get(), CURLUPART_URL);
}

std::expected<std::string, std::string> set_query_param(std::string_view url,
                                                        std::string_view key,
                                                        std::string_view value) {
    auto handle = parse(url);
    if (!handle) return std::unexpected(handle.error());

    std::string kept;
    if (auto query = get_part(handle->get(), CURLUPART_QUERY)) {
        std::string_view rest = *query;
        while (!rest.empty()) {
            auto amp = rest.find('&');
            std::string_view param = rest.substr(0, amp);
            rest = (amp == std::string_view::npos) ? std::string_view{} : rest.substr(amp + 1);

            std::string_view name = param.substr(0, param.find('='));
            if (param.empty() || name == key) continue;

            if (!kept.empty()) kept += '&';
            kept += param;
        }
    }

    CURLUcode rc = curl_url_set(handle->get(), CURLUPART_QUERY, kept.empty() ? nullptr : kept.c_str(), 0);
    if (rc != CURLUE_OK) {
        return std::unexpected(std::format("Cannot rewrite URL query: {}", curl_url_strerror(rc)));
    }

    std::string param = std::format("{}={}", key, value);
    rc = curl_url_set(handle->get(), CURLUPART_QUERY, param.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE);
    if (rc != CURLUE_OK) {
        return std::unexpected(std::format("Cannot set query parameter '{}': {}", key, curl_url_strerror(rc)));
    }
    return get_part(handle->get(), CURLUPART_URL);
}

}  // namespace Url
