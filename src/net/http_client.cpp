#include "net/http_client.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace warden::net {

namespace {

std::once_flag curl_init_once;

void ensure_curl() {
    std::call_once(curl_init_once, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

curl_slist* build_headers(const std::map<std::string, std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers) {
        list = curl_slist_append(list, (name + ": " + value).c_str());
    }
    // No 100-continue round trip for request bodies
    return curl_slist_append(list, "Expect:");
}

void configure(CURL* easy, const std::string& method, const std::string& url,
               const std::string& body, curl_slist* headers, long timeout_ms,
               std::string* received) {
    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, received);
    curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_FORBID_REUSE, 1L);

    if (method == "GET") {
        curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
        return;
    }
    if (method == "POST") {
        curl_easy_setopt(easy, CURLOPT_POST, 1L);
    } else {
        curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (method == "POST" || !body.empty()) {
        curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(easy, CURLOPT_COPYPOSTFIELDS, body.c_str());
    }
}

HttpResponse to_response(CURL* easy, CURLcode code, std::string received) {
    HttpResponse response;
    double total = 0.0;
    curl_easy_getinfo(easy, CURLINFO_TOTAL_TIME, &total);
    response.elapsed_ms = total * 1000.0;

    if (code == CURLE_OK) {
        long status = 0;
        curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
        response.ok = true;
        response.status = static_cast<int>(status);
        response.body = std::move(received);
    } else if (code == CURLE_OPERATION_TIMEDOUT) {
        response.timed_out = true;
        response.error = "request timed out";
    } else {
        response.error = curl_easy_strerror(code);
    }
    return response;
}

long to_timeout_ms(double seconds) {
    return std::max(1L, static_cast<long>(seconds * 1000.0));
}

} // namespace

bool is_http_url(const std::string& url) {
    for (const char* scheme : {"http://", "https://"}) {
        size_t len = std::char_traits<char>::length(scheme);
        if (url.size() > len && url.compare(0, len, scheme) == 0) {
            return url[len] != '/' && url[len] != ':';
        }
    }
    return false;
}

// ============================================================================
// Blocking request
// ============================================================================

HttpResponse http_request(const std::string& method, const std::string& url,
                          const std::string& body,
                          const std::map<std::string, std::string>& headers,
                          int timeout_ms) {
    HttpResponse response;
    if (!is_http_url(url)) {
        response.error = "unsupported URL: " + url;
        return response;
    }

    ensure_curl();
    CURL* easy = curl_easy_init();
    if (!easy) {
        response.error = "curl_easy_init failed";
        return response;
    }

    std::string received;
    curl_slist* list = build_headers(headers);
    configure(easy, method, url, body, list, std::max(1, timeout_ms), &received);

    CURLcode code = curl_easy_perform(easy);
    response = to_response(easy, code, std::move(received));

    curl_slist_free_all(list);
    curl_easy_cleanup(easy);
    return response;
}

// ============================================================================
// Reactor-driven client
// ============================================================================

HttpClient::HttpClient(kernel::Reactor& reactor)
    : reactor_(reactor)
    , alive_(std::make_shared<bool>(true)) {
    ensure_curl();
    multi_ = curl_multi_init();
    if (!multi_) {
        throw std::runtime_error("curl_multi_init failed");
    }
    curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION, &HttpClient::on_socket);
    curl_multi_setopt(multi_, CURLMOPT_SOCKETDATA, this);
    curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION, &HttpClient::on_timer);
    curl_multi_setopt(multi_, CURLMOPT_TIMERDATA, this);
}

HttpClient::~HttpClient() {
    alive_.reset();
    for (int fd : watched_) {
        reactor_.remove(fd);
    }
    watched_.clear();
    if (timer_ != 0) {
        reactor_.cancel(timer_);
        timer_ = 0;
    }

    curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION, nullptr);
    curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION, nullptr);
    for (auto& [easy, request] : requests_) {
        curl_multi_remove_handle(multi_, easy);
        release(*request);
    }
    requests_.clear();
    curl_multi_cleanup(multi_);
}

void HttpClient::get(const std::string& url, double timeout_seconds, HttpCallback callback) {
    request("GET", url, "", {}, timeout_seconds, std::move(callback));
}

void HttpClient::request(const std::string& method, const std::string& url,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers,
                         double timeout_seconds, HttpCallback callback) {
    std::weak_ptr<bool> alive = alive_;
    auto fail_later = [this, alive](HttpCallback cb, std::string error) {
        reactor_.post([alive, cb = std::move(cb), error = std::move(error)]() {
            if (alive.expired()) return;
            HttpResponse response;
            response.error = error;
            cb(std::move(response));
        });
    };

    if (!is_http_url(url)) {
        fail_later(std::move(callback), "unsupported URL: " + url);
        return;
    }

    auto request = std::make_unique<Request>();
    request->easy = curl_easy_init();
    if (!request->easy) {
        fail_later(std::move(callback), "curl_easy_init failed");
        return;
    }
    request->headers = build_headers(headers);
    request->callback = std::move(callback);
    request->started = reactor_.now();
    configure(request->easy, method, url, body, request->headers,
              to_timeout_ms(timeout_seconds), &request->body);

    CURL* easy = request->easy;
    requests_.emplace(easy, std::move(request));

    CURLMcode rc = curl_multi_add_handle(multi_, easy);
    if (rc != CURLM_OK) {
        auto node = requests_.extract(easy);
        HttpCallback cb = std::move(node.mapped()->callback);
        release(*node.mapped());
        fail_later(std::move(cb), curl_multi_strerror(rc));
    }
}

int HttpClient::on_socket(CURL*, curl_socket_t fd, int what, void* userp, void*) {
    static_cast<HttpClient*>(userp)->watch(fd, what);
    return 0;
}

int HttpClient::on_timer(CURLM*, long timeout_ms, void* userp) {
    auto* self = static_cast<HttpClient*>(userp);
    if (self->timer_ != 0) {
        self->reactor_.cancel(self->timer_);
        self->timer_ = 0;
    }
    if (timeout_ms < 0) {
        return 0;
    }
    // socket_action must not be called from inside a curl callback
    self->timer_ = self->reactor_.call_later(timeout_ms / 1000.0, [self]() {
        self->timer_ = 0;
        self->drive(CURL_SOCKET_TIMEOUT, 0);
    });
    return 0;
}

void HttpClient::watch(int fd, int what) {
    if (what == CURL_POLL_REMOVE) {
        if (watched_.erase(fd) > 0) {
            reactor_.remove(fd);
        }
        return;
    }

    uint32_t events = 0;
    if (what & CURL_POLL_IN) events |= EPOLLIN;
    if (what & CURL_POLL_OUT) events |= EPOLLOUT;

    if (watched_.count(fd) > 0) {
        reactor_.modify(fd, events);
        return;
    }
    bool added = reactor_.add(fd, events, [this](int ready, uint32_t ready_events) {
        int flags = 0;
        if (ready_events & EPOLLIN) flags |= CURL_CSELECT_IN;
        if (ready_events & EPOLLOUT) flags |= CURL_CSELECT_OUT;
        if (ready_events & (EPOLLERR | EPOLLHUP)) flags |= CURL_CSELECT_ERR;
        drive(ready, flags);
    });
    if (added) {
        watched_.insert(fd);
    } else {
        spdlog::warn("Failed to watch HTTP socket {}", fd);
    }
}

void HttpClient::drive(curl_socket_t fd, int flags) {
    int running = 0;
    CURLMcode rc = curl_multi_socket_action(multi_, fd, flags, &running);
    if (rc != CURLM_OK) {
        spdlog::warn("curl_multi_socket_action failed: {}", curl_multi_strerror(rc));
    }
    collect();
}

void HttpClient::collect() {
    std::vector<std::pair<HttpCallback, HttpResponse>> finished;
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
        if (msg->msg != CURLMSG_DONE) continue;
        CURL* easy = msg->easy_handle;
        CURLcode code = msg->data.result;

        auto it = requests_.find(easy);
        if (it == requests_.end()) continue;
        std::unique_ptr<Request> request = std::move(it->second);
        requests_.erase(it);

        HttpResponse response = to_response(easy, code, std::move(request->body));
        if (response.timed_out) {
            response.elapsed_ms = (reactor_.now() - request->started) * 1000.0;
        }
        curl_multi_remove_handle(multi_, easy);
        finished.emplace_back(std::move(request->callback), std::move(response));
        release(*request);
    }

    std::weak_ptr<bool> alive = alive_;
    for (auto& [callback, response] : finished) {
        if (alive.expired()) return;
        callback(std::move(response));
    }
}

void HttpClient::release(Request& request) {
    curl_slist_free_all(request.headers);
    request.headers = nullptr;
    if (request.easy) {
        curl_easy_cleanup(request.easy);
        request.easy = nullptr;
    }
}

} // namespace warden::net
