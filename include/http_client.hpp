#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "test_options.hpp"

typedef void CURL;

struct HttpOptions {
    std::string source_ip;
    NetworkFamily family = NetworkFamily::Any;
};

struct FormField {
    std::string name;
    std::string value;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

class HttpClient {
public:
    explicit HttpClient(HttpOptions options = {});
    ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<HttpResponse, std::string> get(const std::string& url, long timeout_sec);

    // multipart/form-data POST; returns the response body.
    std::expected<std::string, std::string> post_form(const std::string& url,
                                                      const std::vector<FormField>& fields,
                                                      std::string_view user_agent);

    // Server turnaround of one GET in milliseconds (start-transfer minus pre-transfer).
    std::expected<double, std::string> timed_get(const std::string& url);

    // Transfers run until completion or `deadline`; bytes are added to `counter` as they move.
    // Reaching the deadline is not an error.
    std::expected<void, std::string> stream_get(const std::string& url,
                                                std::chrono::steady_clock::time_point deadline,
                                                std::atomic<std::uint64_t>& counter);
    std::expected<void, std::string> stream_post(const std::string& url,
                                                 std::span<const char> payload,
                                                 std::chrono::steady_clock::time_point deadline,
                                                 std::atomic<std::uint64_t>& counter);

private:
    std::unique_ptr<CURL, void(*)(CURL*)> handle_;
    HttpOptions options_;

    void apply_common_options();

    static size_t write_string(void* ptr, size_t size, size_t nmemb, std::string* s) noexcept;
    static size_t write_counter(void* ptr, size_t size, size_t nmemb, void* userdata) noexcept;
};
