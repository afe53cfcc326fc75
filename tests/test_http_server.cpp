#include <catch2/catch_test_macros.hpp>
#include "http_server.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

using namespace hookgate;

// ── parse_listen_addr ────────────────────────────────────────────

TEST_CASE("parse_listen_addr: host and port", "[http_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE(parse_listen_addr("0.0.0.0:5000", host, port));
    REQUIRE(host == "0.0.0.0");
    REQUIRE(port == 5000);

    REQUIRE(parse_listen_addr("127.0.0.1:65535", host, port));
    REQUIRE(port == 65535);
}

TEST_CASE("parse_listen_addr: rejects malformed addresses", "[http_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("localhost", host, port));
    REQUIRE_FALSE(parse_listen_addr(":5000", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:abc", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:50x", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:0", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:70000", host, port));
}

// ── parse_request_head ───────────────────────────────────────────

TEST_CASE("parse_request_head: request line, query and headers", "[http_server]") {
    std::string head =
        "POST /webhook/github?source=test&x=a%20b HTTP/1.1\r\n"
        "Host: localhost:5000\r\n"
        "Content-Type: application/json\r\n"
        "X-GitHub-Event:  push  \r\n"
        "Content-Length: 2";
    HttpRequest req;
    REQUIRE(parse_request_head(head, req));
    REQUIRE(req.method == "POST");
    REQUIRE(req.path == "/webhook/github");
    REQUIRE(req.query_param("source") == "test");
    REQUIRE(req.query_param("x") == "a b");
    REQUIRE(req.query_param("missing").empty());
    REQUIRE(req.headers.at("content-type") == "application/json");
    REQUIRE(req.headers.at("x-github-event") == "push");
    REQUIRE(req.headers.at("content-length") == "2");
}

TEST_CASE("parse_request_head: repeated header keeps last value", "[http_server]") {
    HttpRequest req;
    REQUIRE(parse_request_head("POST /webhook HTTP/1.1\r\nX-Tag: one\r\nx-tag: two", req));
    REQUIRE(req.headers.at("x-tag") == "two");
}

TEST_CASE("parse_request_head: lines without a colon are skipped", "[http_server]") {
    HttpRequest req;
    REQUIRE(parse_request_head("GET / HTTP/1.1\r\ngarbage\r\nAccept: */*", req));
    REQUIRE(req.headers.size() == 1);
    REQUIRE(req.headers.at("accept") == "*/*");
}

TEST_CASE("parse_request_head: malformed request line", "[http_server]") {
    HttpRequest req;
    REQUIRE_FALSE(parse_request_head("", req));
    REQUIRE_FALSE(parse_request_head("GET /", req));
    REQUIRE_FALSE(parse_request_head("GET / FTP/1.0", req));
}

// ── HttpRequest::header ──────────────────────────────────────────

TEST_CASE("HttpRequest::header: case-insensitive lookup", "[http_server]") {
    HttpRequest req;
    req.headers["content-type"] = "text/plain";
    REQUIRE(req.header("Content-Type") == "text/plain");
    REQUIRE(req.header("CONTENT-TYPE") == "text/plain");
    REQUIRE(req.header("x-missing").empty());
}

// ── Response formatting ──────────────────────────────────────────

TEST_CASE("reason_phrase: emitted status codes", "[http_server]") {
    REQUIRE(std::string(reason_phrase(200)) == "OK");
    REQUIRE(std::string(reason_phrase(401)) == "Unauthorized");
    REQUIRE(std::string(reason_phrase(405)) == "Method Not Allowed");
    REQUIRE(std::string(reason_phrase(413)) == "Payload Too Large");
    REQUIRE(std::string(reason_phrase(503)) == "Service Unavailable");
    REQUIRE(std::string(reason_phrase(299)) == "Unknown");
}

TEST_CASE("format_http_response: status line, headers and body", "[http_server]") {
    HttpResponse resp{404, "application/json", R"({"status":"error"})"};
    std::string wire = format_http_response(resp);

    REQUIRE(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
    REQUIRE(wire.find("Content-Type: application/json\r\n") != std::string::npos);
    REQUIRE(wire.find("Content-Length: 18\r\n") != std::string::npos);
    REQUIRE(wire.find("Connection: close\r\n\r\n") != std::string::npos);
    REQUIRE(wire.substr(wire.size() - 18) == R"({"status":"error"})");
}

// ── HttpServer ───────────────────────────────────────────────────

TEST_CASE("HttpServer::start: invalid listen address reports an error", "[http_server]") {
    std::ostringstream out;
    Logger logger(out);
    HttpServer server("not-an-address", 1024, 4,
                      [](const HttpRequest&) { return HttpResponse{}; },
                      [](int status) { return HttpResponse{status, "text/plain", ""}; },
                      logger);
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE(error.find("not-an-address") != std::string::npos);
}

// ── Loopback round trip ──────────────────────────────────────────

static std::string roundtrip(uint16_t port, const std::string& request) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);
    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &sa.sin_addr);
    REQUIRE(::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0);
    REQUIRE(::send(fd, request.data(), request.size(), 0) == static_cast<ssize_t>(request.size()));

    std::string reply;
    char buf[4096];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) reply.append(buf, static_cast<size_t>(n));
    ::close(fd);
    return reply;
}

// Try a few ports in case one is taken
static std::unique_ptr<HttpServer> start_on_free_port(uint32_t max_body, uint32_t max_connections,
                                                      HttpServer::Handler handler,
                                                      HttpServer::Rejector rejector,
                                                      Logger& logger, uint16_t& port) {
    for (int attempt = 0; attempt < 20; ++attempt) {
        port = static_cast<uint16_t>(20000 + (getpid() * 7 + attempt * 131) % 30000);
        auto server = std::make_unique<HttpServer>("127.0.0.1:" + std::to_string(port),
                                                   max_body, max_connections,
                                                   handler, rejector, logger);
        std::string error;
        if (server->start(error)) return server;
    }
    return nullptr;
}

TEST_CASE("HttpServer: serves requests and rejects oversized bodies", "[http_server]") {
    std::ostringstream out;
    Logger logger(out);
    HttpServer::Handler echo = [](const HttpRequest& req) {
        return HttpResponse{200, "text/plain", req.method + " " + req.path + " " + req.body};
    };
    HttpServer::Rejector reject = [](int status) {
        return HttpResponse{status, "text/plain", "rejected"};
    };

    uint16_t port = 0;
    auto server = start_on_free_port(16, 4, echo, reject, logger, port);
    REQUIRE(server);

    std::string ok = roundtrip(port,
        "POST /webhook HTTP/1.1\r\nHost: x\r\nContent-Length: 5\r\n\r\nhello");
    REQUIRE(ok.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(ok.find("\r\n\r\nPOST /webhook hello") != std::string::npos);

    std::string big = roundtrip(port,
        "POST /webhook HTTP/1.1\r\nHost: x\r\nContent-Length: 17\r\n\r\n");
    REQUIRE(big.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0) == 0);
    REQUIRE(big.find("rejected") != std::string::npos);

    std::string huge = roundtrip(port,
        "POST /webhook HTTP/1.1\r\nHost: x\r\nContent-Length: 99999999999999999999999\r\n\r\n");
    REQUIRE(huge.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0) == 0);

    std::string junk = roundtrip(port,
        "POST /webhook HTTP/1.1\r\nHost: x\r\nContent-Length: 5abc\r\n\r\n");
    REQUIRE(junk.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);

    std::string bad = roundtrip(port, "NONSENSE\r\n\r\n");
    REQUIRE(bad.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);

    server->stop();
}

TEST_CASE("HttpServer: connection cap answers 503 and stop waits for handlers", "[http_server]") {
    std::ostringstream out;
    Logger logger(out);

    std::mutex mu;
    std::condition_variable cv;
    bool entered = false;
    bool release = false;
    std::atomic<bool> handler_done{false};

    HttpServer::Handler blocking = [&](const HttpRequest& req) {
        std::unique_lock<std::mutex> lock(mu);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [&]() { return release; });
        handler_done.store(true);
        return HttpResponse{200, "text/plain", "done " + req.path};
    };
    HttpServer::Rejector reject = [](int status) {
        return HttpResponse{status, "application/json", R"({"status":"error","message":"Server busy"})"};
    };

    uint16_t port = 0;
    auto server = start_on_free_port(1024, 1, blocking, reject, logger, port);
    REQUIRE(server);

    std::string first;
    std::thread client([&]() {
        first = roundtrip(port, "POST /first HTTP/1.1\r\nHost: x\r\nContent-Length: 0\r\n\r\n");
    });
    {
        std::unique_lock<std::mutex> lock(mu);
        REQUIRE(cv.wait_for(lock, std::chrono::seconds(5), [&]() { return entered; }));
    }

    // The only slot is taken; the rejection is sent without reading a request
    std::string second = roundtrip(port, "");
    REQUIRE(second.rfind("HTTP/1.1 503 Service Unavailable\r\n", 0) == 0);
    REQUIRE(second.find(R"("message":"Server busy")") != std::string::npos);

    std::atomic<bool> stopped{false};
    bool done_when_stopped = false;
    std::thread stopper([&]() {
        server->stop();
        done_when_stopped = handler_done.load();
        stopped.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    REQUIRE_FALSE(stopped.load());

    {
        std::lock_guard<std::mutex> lock(mu);
        release = true;
    }
    cv.notify_all();

    stopper.join();
    client.join();
    REQUIRE(stopped.load());
    REQUIRE(done_when_stopped);
    REQUIRE(first.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(first.find("done /first") != std::string::npos);
}

TEST_CASE("HttpServer: slot is released after each connection", "[http_server]") {
    std::ostringstream out;
    Logger logger(out);
    HttpServer::Handler ok = [](const HttpRequest&) { return HttpResponse{200, "text/plain", "ok"}; };
    HttpServer::Rejector reject = [](int status) { return HttpResponse{status, "text/plain", ""}; };

    uint16_t port = 0;
    auto server = start_on_free_port(1024, 1, ok, reject, logger, port);
    REQUIRE(server);

    // Sequential requests through a single slot must all be served
    for (int i = 0; i < 5; ++i) {
        std::string reply;
        for (int tries = 0; tries < 50; ++tries) {
            reply = roundtrip(port, "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
            if (reply.rfind("HTTP/1.1 200", 0) == 0) break;
            // The previous connection thread may not have released its slot yet
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE(reply.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    }
    server->stop();
}
