/**
 * HTTP client on libcurl
 *
 * HttpClient drives a curl multi handle from the reactor: curl's sockets
 * are registered as reactor fds and its timeout as a reactor timer.
 * http_request() is the blocking easy-handle form for callers on worker
 * threads. Connections are never reused.
 */
#pragma once
#include <curl/curl.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include "kernel/reactor.hpp"

namespace warden::net {

struct HttpResponse {
    bool ok = false;            // a complete response was received
    bool timed_out = false;
    int status = 0;
    std::string body;
    std::string error;
    double elapsed_ms = 0.0;
};

// http:// or https:// with a host part
bool is_http_url(const std::string& url);

// Blocking request with an overall deadline
HttpResponse http_request(const std::string& method, const std::string& url,
                          const std::string& body,
                          const std::map<std::string, std::string>& headers,
                          int timeout_ms);

using HttpCallback = std::function<void(HttpResponse)>;

class HttpClient {
public:
    explicit HttpClient(kernel::Reactor& reactor);
    // In-flight requests are abandoned without invoking their callbacks
    ~HttpClient();

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // The callback runs exactly once, on the reactor thread
    void request(const std::string& method, const std::string& url,
                 const std::string& body,
                 const std::map<std::string, std::string>& headers,
                 double timeout_seconds, HttpCallback callback);

    void get(const std::string& url, double timeout_seconds, HttpCallback callback);

    size_t in_flight() const { return requests_.size(); }

private:
    struct Request {
        CURL* easy = nullptr;
        curl_slist* headers = nullptr;
        std::string body;
        double started = 0.0;
        HttpCallback callback;
    };

    kernel::Reactor& reactor_;
    CURLM* multi_ = nullptr;
    std::unordered_map<CURL*, std::unique_ptr<Request>> requests_;
    std::set<int> watched_;
    kernel::TimerId timer_ = 0;
    std::shared_ptr<bool> alive_;

    static int on_socket(CURL* easy, curl_socket_t fd, int what, void* userp, void* socketp);
    static int on_timer(CURLM* multi, long timeout_ms, void* userp);

    void watch(int fd, int what);
    void drive(curl_socket_t fd, int flags);
    void collect();
    void release(Request& request);
};

} // namespace warden::net
