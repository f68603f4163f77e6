#include "curl_transport.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    apply_header_line(std::string_view(buffer, total), *static_cast<HttpResponse*>(userdata));
    return total;
}

} // namespace

void apply_header_line(std::string_view line, HttpResponse& resp) {
    if (line.starts_with("HTTP/")) {
        resp.retry_after.reset();
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return;

    if (iequals(trim(line.substr(0, colon)), "retry-after")) {
        auto val = trim(line.substr(colon + 1));
        long seconds = 0;
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), seconds);
        if (ec == std::errc() && ptr == val.data() + val.size() && seconds >= 0) {
            resp.retry_after = seconds;
        }
    }
}

CurlTransport::CurlTransport(Options opts) : opts_(std::move(opts)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);

    std::string auth = "Authorization: Bearer " + opts_.token;
    headers_ = curl_slist_append(headers_, auth.c_str());
    headers_ = curl_slist_append(headers_, "Accept: application/json");

    for (uint32_t i = 0; i < std::max<uint32_t>(opts_.pool_size, 1); ++i) {
        if (CURL* h = make_handle()) {
            all_.push_back(h);
            idle_.push_back(h);
        }
    }
}

CurlTransport::~CurlTransport() {
    for (CURL* h : all_) curl_easy_cleanup(h);
    curl_slist_free_all(headers_);
    curl_global_cleanup();
}

CURL* CurlTransport::make_handle() {
    CURL* h = curl_easy_init();
    if (!h) return nullptr;

    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(h, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(opts_.timeout_seconds));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(opts_.connect_timeout_seconds));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, this);
    return h;
}

CURL* CurlTransport::checkout() {
    std::unique_lock lock(pool_mu_);
    pool_cv_.wait(lock, [this] { return !idle_.empty() || all_.empty(); });
    if (idle_.empty()) return nullptr;
    CURL* h = idle_.back();
    idle_.pop_back();
    return h;
}

void CurlTransport::checkin(CURL* handle) {
    {
        std::lock_guard lock(pool_mu_);
        idle_.push_back(handle);
    }
    pool_cv_.notify_one();
}

std::expected<HttpResponse, std::string>
CurlTransport::get(const std::string& target, bool fresh_connection) {
    if (cancelled_.load(std::memory_order_acquire)) {
        return std::unexpected("transfer cancelled");
    }

    CURL* h = checkout();
    if (!h) return std::unexpected("curl_easy_init failed");

    HttpResponse resp;
    std::string url = opts_.base_url + target;

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_FRESH_CONNECT, fresh_connection ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp);

    CURLcode res = curl_easy_perform(h);
    if (res == CURLE_OK) {
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    }

    // The response lives on this stack frame; do not leave dangling pointers in the handle.
    curl_easy_setopt(h, CURLOPT_WRITEDATA, nullptr);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, nullptr);
    checkin(h);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return resp;
}

void CurlTransport::cancel_inflight() {
    cancelled_.store(true, std::memory_order_release);
}

int CurlTransport::progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t,
                                     curl_off_t) {
    auto* self = static_cast<CurlTransport*>(userdata);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    return self->cancelled_.load(std::memory_order_acquire) ? 1 : 0;
}
