#include "http_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace sdc {

const char* http_status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        default: return "Unknown";
    }
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::optional<HttpRequest> parse_http_request(const std::string& raw) {
    auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        return std::nullopt;
    }

    // Parse first line: "GET /path HTTP/1.1"
    auto first_line_end = raw.find("\r\n");
    std::string first_line = raw.substr(0, first_line_end);
    auto method_end = first_line.find(' ');
    if (method_end == std::string::npos) return std::nullopt;
    auto uri_end = first_line.find(' ', method_end + 1);
    if (uri_end == std::string::npos) return std::nullopt;

    HttpRequest req;
    req.method = first_line.substr(0, method_end);
    std::string uri = first_line.substr(method_end + 1, uri_end - method_end - 1);
    if (req.method.empty() || uri.empty() || uri[0] != '/') {
        return std::nullopt;
    }

    auto query = uri.find('?');
    if (query != std::string::npos) {
        req.query = uri.substr(query + 1);
        uri = uri.substr(0, query);
    }
    req.path = uri;

    size_t pos = first_line_end + 2;
    while (pos < header_end) {
        auto line_end = raw.find("\r\n", pos);
        std::string line = raw.substr(pos, line_end - pos);
        pos = line_end + 2;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    size_t content_length = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        try {
            content_length = std::stoul(it->second);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    size_t body_start = header_end + 4;
    if (raw.size() < body_start + content_length) {
        return std::nullopt;
    }
    req.body = raw.substr(body_start, content_length);
    return req;
}

HttpServer::HttpServer(uint16_t port, Handler handler)
    : port_(port)
    , handler_(std::move(handler))
{
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket");
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to port {}", port_);
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 64) < 0) {
        spdlog::error("HTTP: Failed to listen");
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::server_thread, this);
    spdlog::info("HTTP server listening on http://0.0.0.0:{}", port_);
    return true;
}

void HttpServer::stop() {
    running_.store(false);
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    // Client threads are detached; handler_ and what it refers to must outlive them
    std::unique_lock<std::mutex> lock(clients_mutex_);
    clients_cv_.wait(lock, [this] { return active_clients_ == 0; });
}

uint16_t HttpServer::bound_port() const {
    if (server_fd_ < 0) {
        return 0;
    }
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(server_fd_, (sockaddr*)&addr, &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

int HttpServer::active_clients() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return active_clients_;
}

void HttpServer::server_thread() {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, (sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_.load()) {
                spdlog::debug("HTTP: Accept failed");
            }
            continue;
        }

        // Bound how long a slow client can hold its thread
        timeval tv{};
        tv.tv_sec = 5;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            active_clients_++;
        }
        std::thread([this, client_fd]() {
            handle_client(client_fd);
            close(client_fd);
            std::lock_guard<std::mutex> lock(clients_mutex_);
            if (--active_clients_ == 0) {
                clients_cv_.notify_all();
            }
        }).detach();
    }
}

void HttpServer::handle_client(int client_fd) {
    std::string raw;
    char buf[4096];
    std::optional<HttpRequest> req;

    while (!(req = parse_http_request(raw))) {
        if (raw.size() > kMaxRequestBytes) {
            HttpResponse too_large;
            too_large.status = 413;
            too_large.body = R"({"error":"request too large"})";
            send_response(client_fd, too_large, true);
            return;
        }
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            if (!raw.empty()) {
                spdlog::debug("HTTP: Incomplete request dropped ({} bytes)", raw.size());
            }
            return;
        }
        raw.append(buf, static_cast<size_t>(n));
    }

    HttpResponse response;
    try {
        response = handler_(*req);
    } catch (const std::exception& e) {
        spdlog::error("HTTP: {} {} failed: {}", req->method, req->path, e.what());
        response = HttpResponse{};
        response.status = 500;
        response.body = R"({"error":"internal server error"})";
    }

    spdlog::debug("HTTP: {} {} -> {}", req->method, req->path, response.status);
    send_response(client_fd, response, req->method != "HEAD");
}

void HttpServer::send_response(int fd, const HttpResponse& response, bool include_body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << http_status_text(response.status) << "\r\n"
        << "Content-Type: " << response.content_type << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Access-Control-Allow-Origin: *\r\n"
        << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
        << "Access-Control-Allow-Headers: Content-Type\r\n";
    for (const auto& [name, value] : response.headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "Connection: close\r\n"
        << "\r\n";

    // HEAD keeps the GET headers, Content-Length included, without the body
    std::string out = oss.str();
    if (include_body) {
        out += response.body;
    }

    size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = send(fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            spdlog::debug("HTTP: Client closed before response completed");
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

} // namespace sdc
