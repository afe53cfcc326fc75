#pragma once
#include "log.hpp"
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <cstdint>

namespace hookgate {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // e.g. "/webhook/github"
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;       // header names lowercased, last wins
    std::string body;
    std::string remote_addr;

    // Return a header value (name is matched case-insensitively), or "" if absent.
    std::string header(const std::string& name) const;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;
};

struct HttpResponse {
    int         status       = 200;
    std::string content_type = "text/plain";
    std::string body;
};

// Minimal HTTP/1.1 server. The accept loop runs on a background thread and
// each accepted connection is handled on its own thread, up to
// max_connections at a time; beyond that the connection gets a 503.
// One request per connection ("Connection: close").
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    // Builds the response for a request rejected by the transport itself
    // (400 oversized headers, 413 oversized body, 503 overloaded).
    using Rejector = std::function<HttpResponse(int status)>;

    // listen_addr: "host:port", e.g. "0.0.0.0:5000"
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, uint32_t max_connections,
               Handler handler, Rejector rejector, Logger& logger);
    ~HttpServer();

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, join the accept thread and wait for in-flight handlers.
    void stop();

private:
    void accept_loop();
    void close_listener();
    bool try_acquire_slot();
    void release_slot();
    void handle_connection(int client_fd, const std::string& remote_addr) const;
    void send_rejection(int fd, int status) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    uint32_t    max_connections_;
    Handler     handler_;
    Rejector    rejector_;
    Logger&     logger_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    uint32_t active_ = 0;
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Parse the request line and header block (everything before CRLFCRLF).
// Returns false on a malformed request line.
bool parse_request_head(const std::string& head, HttpRequest& req);

// Standard reason phrase for the status codes this server emits
const char* reason_phrase(int status);

// Serialize a complete HTTP/1.1 response with Connection: close
std::string format_http_response(const HttpResponse& resp);

} // namespace hookgate
