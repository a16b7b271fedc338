#include <catch2/catch.hpp>
#include "server/http_server.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <mutex>
#include <string>

using namespace graphmem;

// ── parse_listen_addr ───────────────────────────────────────────

TEST_CASE("parse_listen_addr: host and port", "[http_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE(parse_listen_addr("127.0.0.1:8000", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 8000);

    REQUIRE(parse_listen_addr("0.0.0.0:0", host, port));
    REQUIRE(port == 0);

    REQUIRE(parse_listen_addr("0.0.0.0:65535", host, port));
    REQUIRE(port == 65535);
}

TEST_CASE("parse_listen_addr: rejects malformed addresses", "[http_server]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE_FALSE(parse_listen_addr("8000", host, port));
    REQUIRE_FALSE(parse_listen_addr(":8000", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost:", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost:http", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost:-1", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost:65536", host, port));
    REQUIRE_FALSE(parse_listen_addr("localhost:123456", host, port));
}

// ── url_decode ──────────────────────────────────────────────────

TEST_CASE("url_decode: escapes and plus", "[http_server]") {
    REQUIRE(url_decode("team%20a") == "team a");
    REQUIRE(url_decode("a+b") == "a b");
    REQUIRE(url_decode("%2Fapi%2f") == "/api/");
    REQUIRE(url_decode("plain") == "plain");
}

TEST_CASE("url_decode: leaves invalid escapes alone", "[http_server]") {
    REQUIRE(url_decode("100%") == "100%");
    REQUIRE(url_decode("%zz") == "%zz");
}

// ── ApiRequest ──────────────────────────────────────────────────

TEST_CASE("ApiRequest: query_param defaults to empty", "[http_server]") {
    ApiRequest req;
    req.query_params["confirm"] = "true";
    REQUIRE(req.query_param("confirm") == "true");
    REQUIRE(req.query_param("missing").empty());
}

// ── Live server ─────────────────────────────────────────────────

// Send a raw request to 127.0.0.1:port and read until the server closes.
static std::string raw_request(uint16_t port, const std::string& request) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "";

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &sa.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        ::close(fd);
        return "";
    }

    size_t sent = 0;
    while (sent < request.size()) {
        ssize_t n = ::send(fd, request.data() + sent, request.size() - sent, 0);
        if (n <= 0) break;
        sent += static_cast<size_t>(n);
    }

    std::string out;
    char buf[4096];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return out;
}

static std::string body_of(const std::string& response) {
    auto pos = response.find("\r\n\r\n");
    return pos == std::string::npos ? "" : response.substr(pos + 4);
}

// Echoes the parsed request back so tests can inspect it.
struct ServerFixture {
    std::mutex mutex;
    ApiRequest last;
    HttpServer server;

    explicit ServerFixture(uint32_t max_body = 1024)
        : server("127.0.0.1:0", max_body, 4, [this](const ApiRequest& req) {
              {
                  std::lock_guard<std::mutex> lock(mutex);
                  last = req;
              }
              ApiResponse resp;
              if (req.path == "/boom") throw std::runtime_error("handler exploded");
              if (req.path == "/missing") {
                  resp.status = 404;
                  resp.body = R"({"error":"Not found"})";
                  return resp;
              }
              resp.body = req.body.empty() ? "{}" : req.body;
              return resp;
          }) {
        std::string error;
        REQUIRE(server.start(error));
        REQUIRE(server.port() != 0);
    }

    ~ServerFixture() { server.stop(); }

    ApiRequest last_request() {
        std::lock_guard<std::mutex> lock(mutex);
        return last;
    }
};

TEST_CASE("HttpServer: start fails on bad address", "[http_server]") {
    HttpServer server("nowhere", 1024, 4, [](const ApiRequest&) { return ApiResponse{}; });
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE(error.find("Invalid listen address") != std::string::npos);

    HttpServer bad_host("not-an-ip:0", 1024, 4, [](const ApiRequest&) { return ApiResponse{}; });
    REQUIRE_FALSE(bad_host.start(error));
    REQUIRE(error.find("Invalid bind address") != std::string::npos);
}

TEST_CASE("HttpServer: serves a GET with query parameters", "[http_server]") {
    ServerFixture f;

    auto resp = raw_request(f.server.port(),
        "GET /api/graph?session=team%20a&include_expired=1 HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "X-Trace: abc\r\n\r\n");

    REQUIRE(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(resp.find("Content-Type: application/json") != std::string::npos);
    REQUIRE(resp.find("Connection: close") != std::string::npos);
    REQUIRE(body_of(resp) == "{}");

    auto req = f.last_request();
    REQUIRE(req.method == "GET");
    REQUIRE(req.path == "/api/graph");
    REQUIRE(req.query_param("session") == "team a");
    REQUIRE(req.query_param("include_expired") == "1");
    REQUIRE(req.headers["x-trace"] == "abc");
}

TEST_CASE("HttpServer: reads POST body by Content-Length", "[http_server]") {
    ServerFixture f;
    std::string body = R"({"session_id":"s1","message":"hello"})";

    auto resp = raw_request(f.server.port(),
        "POST /api/chat HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);

    REQUIRE(resp.rfind("HTTP/1.1 200", 0) == 0);
    REQUIRE(body_of(resp) == body);
    REQUIRE(f.last_request().body == body);
}

TEST_CASE("HttpServer: handler status is passed through", "[http_server]") {
    ServerFixture f;
    auto resp = raw_request(f.server.port(), "GET /missing HTTP/1.1\r\n\r\n");
    REQUIRE(resp.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
    REQUIRE(body_of(resp) == R"({"error":"Not found"})");
}

TEST_CASE("HttpServer: oversized body is 413", "[http_server]") {
    ServerFixture f(16);
    auto resp = raw_request(f.server.port(),
        "POST /api/chat HTTP/1.1\r\nContent-Length: 17\r\n\r\n");
    REQUIRE(resp.rfind("HTTP/1.1 413", 0) == 0);
}

TEST_CASE("HttpServer: bad Content-Length is 400", "[http_server]") {
    ServerFixture f;
    auto resp = raw_request(f.server.port(),
        "POST /api/chat HTTP/1.1\r\nContent-Length: ten\r\n\r\n");
    REQUIRE(resp.rfind("HTTP/1.1 400", 0) == 0);
}

TEST_CASE("HttpServer: malformed request line is 400", "[http_server]") {
    ServerFixture f;
    auto resp = raw_request(f.server.port(), "GARBAGE\r\n\r\n");
    REQUIRE(resp.rfind("HTTP/1.1 400", 0) == 0);
}

TEST_CASE("HttpServer: handler exception is 500", "[http_server]") {
    ServerFixture f;
    auto resp = raw_request(f.server.port(), "GET /boom HTTP/1.1\r\n\r\n");
    REQUIRE(resp.rfind("HTTP/1.1 500", 0) == 0);
    REQUIRE(body_of(resp) == R"({"error":"Internal error"})");
}

TEST_CASE("HttpServer: stop is idempotent", "[http_server]") {
    ServerFixture f;
    f.server.stop();
    f.server.stop();
    REQUIRE(raw_request(f.server.port(), "GET / HTTP/1.1\r\n\r\n").empty());
}
