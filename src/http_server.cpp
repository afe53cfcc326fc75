#include "http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <system_error>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace hookgate {

static constexpr size_t kMaxHeaderBytes = 16384;
static constexpr time_t kRecvTimeoutSec = 10;

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

std::string HttpRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    try {
        size_t used = 0;
        std::string port_str = addr.substr(pos + 1);
        int p = std::stoi(port_str, &used);
        if (used != port_str.size()) return false;
        if (p <= 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// ── Request parsing ───────────────────────────────────────────────────────────

bool parse_request_head(const std::string& head, HttpRequest& req) {
    auto rl_end = head.find("\r\n");
    if (rl_end == std::string::npos) rl_end = head.size();

    {
        std::istringstream ss(head.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) return false;
        if (ver.compare(0, 5, "HTTP/") != 0) return false;
        auto q = pq.find('?');
        if (q != std::string::npos) {
            req.path         = pq.substr(0, q);
            req.query_params = parse_query_string(pq.substr(q + 1));
        } else {
            req.path = pq;
        }
    }

    size_t pos = rl_end + 2;
    while (pos < head.size()) {
        auto ne = head.find("\r\n", pos);
        if (ne == std::string::npos) ne = head.size();
        std::string hline = head.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }
    return true;
}

// ── Response formatting ───────────────────────────────────────────────────────

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string format_http_response(const HttpResponse& resp) {
    return "HTTP/1.1 " + std::to_string(resp.status) + " " + reason_phrase(resp.status) + "\r\n"
           "Content-Type: " + resp.content_type + "\r\n"
           "Content-Length: " + std::to_string(resp.body.size()) + "\r\n"
           "Connection: close\r\n\r\n" + resp.body;
}

static void send_http_response(int fd, const HttpResponse& resp) {
    std::string wire = format_http_response(resp);
    size_t sent = 0;
    while (sent < wire.size()) {
        ssize_t n = ::send(fd, wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return;
        sent += static_cast<size_t>(n);
    }
}

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body, uint32_t max_connections,
                       Handler handler, Rejector rejector, Logger& logger)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , max_connections_(max_connections == 0 ? 1 : max_connections)
    , handler_(std::move(handler))
    , rejector_(std::move(rejector))
    , logger_(logger)
{}

HttpServer::~HttpServer() {
    stop();
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void HttpServer::close_listener() {
    close_fd(server_fd_);
    close_fd(shutdown_pipe_[0]);
    close_fd(shutdown_pipe_[1]);
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port = 0;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = std::string("socket failed: ") + std::strerror(errno);
        close_listener();
        return false;
    }

    int on = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#ifdef SO_NOSIGPIPE
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &on, sizeof(on));
#endif

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0 ||
        ::listen(server_fd_, SOMAXCONN) != 0) {
        error = "Cannot listen on " + listen_addr_ + ": " + std::strerror(errno);
        close_listener();
        return false;
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::accept_loop, this);
    logger_.debug("http", "Listening on " + listen_addr_);
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;

    char wake = 0;
    if (::write(shutdown_pipe_[1], &wake, 1) < 0) {
        logger_.warn("http", std::string("Failed to wake accept loop: ") + std::strerror(errno));
    }
    if (thread_.joinable()) thread_.join();

    // Detached connection threads still reference this object
    std::unique_lock<std::mutex> lock(conn_mutex_);
    conn_cv_.wait(lock, [this]() { return active_ == 0; });
    lock.unlock();

    close_listener();
}

bool HttpServer::try_acquire_slot() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (active_ >= max_connections_) return false;
    ++active_;
    return true;
}

void HttpServer::release_slot() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    --active_;
    conn_cv_.notify_all();
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2] = {
            {server_fd_, POLLIN, 0},
            {shutdown_pipe_[0], POLLIN, 0},
        };
        if (::poll(fds, 2, 1000) <= 0) continue;
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);
        int client = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len);
        if (client < 0) continue;

        struct timeval timeout{kRecvTimeoutSec, 0};
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        char ip[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
        std::string remote = ip;

        if (!try_acquire_slot()) {
            logger_.warn("http", "Connection limit reached, rejecting " + remote);
            send_rejection(client, 503);
            ::close(client);
            continue;
        }

        try {
            std::thread([this, client, remote]() {
                handle_connection(client, remote);
                ::close(client);
                release_slot();
            }).detach();
        } catch (const std::system_error& e) {
            logger_.error("http", std::string("Cannot start connection thread: ") + e.what());
            release_slot();
            send_rejection(client, 503);
            ::close(client);
        }
    }
}

void HttpServer::send_rejection(int fd, int status) const {
    HttpResponse resp{status, "text/plain", reason_phrase(status)};
    if (rejector_) {
        try {
            resp = rejector_(status);
        } catch (const std::exception& e) {
            logger_.error("http", std::string("Rejection handler failed: ") + e.what());
        }
    }
    send_http_response(fd, resp);
}

void HttpServer::handle_connection(int fd, const std::string& remote_addr) const {
    // Read until end-of-headers (CRLFCRLF), capped at kMaxHeaderBytes.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > kMaxHeaderBytes) {
            send_rejection(fd, 400);
            return;
        }
    }

    auto hdr_end = buf.find("\r\n\r\n");
    HttpRequest req;
    req.remote_addr = remote_addr;
    if (!parse_request_head(buf.substr(0, hdr_end), req)) {
        send_rejection(fd, 400);
        return;
    }

    size_t content_len = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        const std::string& value = it->second;
        uint64_t n = 0;
        if (!parse_unsigned(value, max_body_, n)) {
            // All digits but over the limit is too large; anything else is malformed
            bool numeric = !value.empty() &&
                           value.find_first_not_of("0123456789") == std::string::npos;
            send_rejection(fd, numeric ? 413 : 400);
            return;
        }
        content_len = static_cast<size_t>(n);
    }

    req.body = buf.substr(hdr_end + 4);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) break;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    HttpResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        logger_.error("http", std::string("Request handler failed: ") + e.what());
        resp = {500, "text/plain", reason_phrase(500)};
    }
    send_http_response(fd, resp);
}

} // namespace hookgate
