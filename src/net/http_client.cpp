#include "include/http_client.hpp"
#include "include/interrupts.hpp"
#include "include/config.hpp"

#include <format>
#include <curl/curl.h>
#include <span>
#include <stdexcept>
#include <utility>

namespace {

struct CurlSlistDeleter {
    void operator()(struct curl_slist* list) const noexcept {
        if (list) curl_slist_free_all(list);
    }
};

class CurlHeaders {
    std::unique_ptr<struct curl_slist, CurlSlistDeleter> list_;

public:
    void add(const std::string& header) {
        auto new_head = curl_slist_append(list_.get(), header.c_str());
        if (new_head && !list_) {
            list_.reset(new_head);
        }
    }

    struct curl_slist* get() const { return list_.get(); }
};

struct CurlMimeDeleter {
    void operator()(curl_mime* mime) const noexcept {
        if (mime) curl_mime_free(mime);
    }
};

struct TransferState {
    std::chrono::steady_clock::time_point deadline;
    std::atomic<std::uint64_t>* counter = nullptr;
    curl_off_t last_uploaded = 0;
    bool count_uploads = false;
    bool deadline_hit = false;
};

int abort_on_interrupt(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return g_interrupted ? 1 : 0;
}

int transfer_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t ulnow) {
    auto* state = static_cast<TransferState*>(clientp);
    if (state->count_uploads && ulnow > state->last_uploaded) {
        state->counter->fetch_add(static_cast<std::uint64_t>(ulnow - state->last_uploaded),
                                  std::memory_order_relaxed);
        state->last_uploaded = ulnow;
    }
    if (g_interrupted) return 1;
    if (std::chrono::steady_clock::now() >= state->deadline) {
        state->deadline_hit = true;
        return 1;
    }
    return 0;
}

size_t discard_body(void*, size_t size, size_t nmemb, void*) noexcept {
    return size * nmemb;
}

std::expected<void, std::string> finish_transfer(CURL* handle, CURLcode res, const TransferState& state) {
    if (res == CURLE_ABORTED_BY_CALLBACK && state.deadline_hit && !g_interrupted) {
        return {};
    }
    if (g_interrupted) {
        return std::unexpected("Operation interrupted by user");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Network error: {}", curl_easy_strerror(res)));
    }

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return std::unexpected(std::format("Unexpected HTTP status {}", status));
    }
    return {};
}

}

HttpClient::HttpClient(HttpOptions options)
    : handle_(curl_easy_init(), curl_easy_cleanup), options_(std::move(options)) {
    if (!handle_) throw std::runtime_error("Failed to create curl handle");
}

size_t HttpClient::write_string(void* ptr, size_t size, size_t nmemb, std::string* s) noexcept {
    try {
        size_t total_size = size * nmemb;
        std::span<const char> data_view(static_cast<const char*>(ptr), total_size);

        s->append(data_view.begin(), data_view.end());

        return total_size;
    } catch (const std::exception&) {
        return 0;
    }
}

size_t HttpClient::write_counter(void*, size_t size, size_t nmemb, void* userdata) noexcept {
    size_t total_size = size * nmemb;
    auto* state = static_cast<TransferState*>(userdata);
    state->counter->fetch_add(total_size, std::memory_order_relaxed);
    return total_size;
}

void HttpClient::apply_common_options() {
    CURL* h = handle_.get();
    curl_easy_setopt(h, CURLOPT_USERAGENT, Config::USER_AGENT.data());
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, Config::HTTP_CONNECT_TIMEOUT_SEC);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    if (!options_.source_ip.empty()) {
        curl_easy_setopt(h, CURLOPT_INTERFACE, options_.source_ip.c_str());
    }

    switch (options_.family) {
        case NetworkFamily::IPv4:
            curl_easy_setopt(h, CURLOPT_IPRESOLVE, CURL_IPRESOLVE_V4);
            break;
        case NetworkFamily::IPv6:
            curl_easy_setopt(h, CURLOPT_IPRESOLVE, CURL_IPRESOLVE_V6);
            break;
        case NetworkFamily::Any:
            curl_easy_setopt(h, CURLOPT_IPRESOLVE, CURL_IPRESOLVE_WHATEVER);
            break;
    }
}

std::expected<HttpResponse, std::string> HttpClient::get(const std::string& url, long timeout_sec) {
    curl_easy_reset(handle_.get());
    apply_common_options();

    HttpResponse response;
    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle_.get(), CURLOPT_TIMEOUT, timeout_sec);

    curl_easy_setopt(handle_.get(), CURLOPT_XFERINFOFUNCTION, abort_on_interrupt);
    curl_easy_setopt(handle_.get(), CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(handle_.get());
    if (g_interrupted) {
        return std::unexpected("Operation interrupted by user");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Network error: {}", curl_easy_strerror(res)));
    }

    curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::expected<std::string, std::string> HttpClient::post_form(const std::string& url,
                                                              const std::vector<FormField>& fields,
                                                              std::string_view user_agent) {
    curl_easy_reset(handle_.get());
    apply_common_options();

    std::unique_ptr<curl_mime, CurlMimeDeleter> mime(curl_mime_init(handle_.get()));
    if (!mime) {
        return std::unexpected("Cannot create multipart form");
    }

    for (const auto& field : fields) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        if (!part) {
            return std::unexpected(std::format("Cannot create form field '{}'", field.name));
        }
        if (CURLcode rc = curl_mime_name(part, field.name.c_str()); rc != CURLE_OK) {
            return std::unexpected(
                std::format("Cannot create form field '{}': {}", field.name, curl_easy_strerror(rc)));
        }
        if (CURLcode rc = curl_mime_data(part, field.value.data(), field.value.size()); rc != CURLE_OK) {
            return std::unexpected(
                std::format("Cannot write form field '{}': {}", field.name, curl_easy_strerror(rc)));
        }
    }

    std::string agent(user_agent);
    std::string response;
    CurlHeaders headers;
    headers.add("Expect:");

    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle_.get(), CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(handle_.get(), CURLOPT_TIMEOUT, Config::HTTP_TIMEOUT_SEC);

    curl_easy_setopt(handle_.get(), CURLOPT_XFERINFOFUNCTION, abort_on_interrupt);
    curl_easy_setopt(handle_.get(), CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(handle_.get());
    if (g_interrupted) {
        return std::unexpected("Operation interrupted by user");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Network error: {}", curl_easy_strerror(res)));
    }

    long status = 0;
    curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        return std::unexpected(std::format("HTTP {} from {}", status, url));
    }
    return response;
}

std::expected<double, std::string> HttpClient::timed_get(const std::string& url) {
    // No reset: consecutive probes reuse the kept-alive connection.
    apply_common_options();

    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, static_cast<void*>(nullptr));
    curl_easy_setopt(handle_.get(), CURLOPT_TIMEOUT, Config::HTTP_TIMEOUT_SEC);
    curl_easy_setopt(handle_.get(), CURLOPT_XFERINFOFUNCTION, abort_on_interrupt);
    curl_easy_setopt(handle_.get(), CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(handle_.get());
    if (g_interrupted) {
        return std::unexpected("Operation interrupted by user");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Network error: {}", curl_easy_strerror(res)));
    }

    long status = 0;
    curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        return std::unexpected(std::format("Unexpected HTTP status {}", status));
    }

    curl_off_t pretransfer = 0;
    curl_off_t starttransfer = 0;
    curl_easy_getinfo(handle_.get(), CURLINFO_PRETRANSFER_TIME_T, &pretransfer);
    curl_easy_getinfo(handle_.get(), CURLINFO_STARTTRANSFER_TIME_T, &starttransfer);

    return static_cast<double>(starttransfer - pretransfer) / 1000.0;
}

std::expected<void, std::string> HttpClient::stream_get(const std::string& url,
                                                        std::chrono::steady_clock::time_point deadline,
                                                        std::atomic<std::uint64_t>& counter) {
    curl_easy_reset(handle_.get());
    apply_common_options();

    TransferState state;
    state.deadline = deadline;
    state.counter = &counter;

    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, write_counter);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(handle_.get(), CURLOPT_XFERINFOFUNCTION, transfer_progress);
    curl_easy_setopt(handle_.get(), CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(handle_.get(), CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(handle_.get());
    return finish_transfer(handle_.get(), res, state);
}

std::expected<void, std::string> HttpClient::stream_post(const std::string& url,
                                                         std::span<const char> payload,
                                                         std::chrono::steady_clock::time_point deadline,
                                                         std::atomic<std::uint64_t>& counter) {
    curl_easy_reset(handle_.get());
    apply_common_options();

    TransferState state;
    state.deadline = deadline;
    state.counter = &counter;
    state.count_uploads = true;

    CurlHeaders headers;
    headers.add("Content-Type: application/octet-stream");
    headers.add("Expect:");

    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle_.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_POSTFIELDS, payload.data());
    curl_easy_setopt(handle_.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, static_cast<void*>(nullptr));
    curl_easy_setopt(handle_.get(), CURLOPT_XFERINFOFUNCTION, transfer_progress);
    curl_easy_setopt(handle_.get(), CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(handle_.get(), CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(handle_.get());
    return finish_transfer(handle_.get(), res, state);
}
