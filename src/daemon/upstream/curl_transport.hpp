#pragma once

#include "http_transport.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <curl/curl.h>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

// Apply one raw response header line to `resp`. Only the delta-seconds form
// of Retry-After is understood; HTTP dates are ignored. A status line starts a
// new header block (redirect or 100-continue) and clears earlier values.
void apply_header_line(std::string_view line, HttpResponse& resp);

// Fixed pool of libcurl easy handles. Each handle keeps its own keep-alive
// connection, so a request checks one out and no two requests ever share a
// physical connection at the same time.
class CurlTransport : public HttpTransport {
public:
    struct Options {
        std::string base_url;
        std::string token;
        uint32_t pool_size = 4;
        uint32_t timeout_seconds = 30;
        uint32_t connect_timeout_seconds = 10;
        std::string user_agent = "fgp-vercel";
    };

    explicit CurlTransport(Options opts);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::expected<HttpResponse, std::string>
        get(const std::string& target, bool fresh_connection) override;

    void cancel_inflight() override;

private:
    CURL* checkout();
    void checkin(CURL* handle);
    CURL* make_handle();

    static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

    Options opts_;
    curl_slist* headers_ = nullptr;

    std::mutex pool_mu_;
    std::condition_variable pool_cv_;
    std::vector<CURL*> all_;
    std::vector<CURL*> idle_;

    std::atomic<bool> cancelled_{false};
};
