#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sdc {

struct HttpRequest {
    std::string method;
    std::string path;   // without the query string
    std::string query;
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string body;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::map<std::string, std::string> headers;
};

// Parses a complete request (headers plus Content-Length body).
// nullopt when the text is malformed or still incomplete.
std::optional<HttpRequest> parse_http_request(const std::string& raw);

const char* http_status_text(int status);

// Minimal HTTP/1.1 server: one short-lived thread per connection, Connection: close
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    HttpServer(uint16_t port, Handler handler);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    // Blocks until every in-flight request has been answered
    void stop();
    bool is_running() const { return running_.load(); }
    uint16_t bound_port() const;
    int active_clients() const;

    static constexpr size_t kMaxRequestBytes = 1024 * 1024;

private:
    void server_thread();
    void handle_client(int client_fd);
    void send_response(int fd, const HttpResponse& response, bool include_body);

    uint16_t port_;
    Handler handler_;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    mutable std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
    int active_clients_ = 0;
    std::thread thread_;
};

} // namespace sdc
