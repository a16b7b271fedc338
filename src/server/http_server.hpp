#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace graphmem {

// A parsed inbound HTTP request.
struct ApiRequest {
    std::string method;   // "GET", "POST", "DELETE"
    std::string path;     // e.g. "/api/health", without the query string
    std::map<std::string, std::string> query_params;  // URL-decoded
    std::map<std::string, std::string> headers;       // names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;
};

struct ApiResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Small HTTP/1.1 server for the JSON API. Each accepted connection is served
// on its own thread; at most max_connections are in flight and further
// clients get 503. One request per connection (Connection: close).
class HttpServer {
public:
    using Handler = std::function<ApiResponse(const ApiRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8000". Port 0 binds an
    // ephemeral port, see port().
    HttpServer(std::string listen_addr, uint32_t max_body, uint32_t max_connections,
               Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and start the accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, wait for in-flight connections, join.
    void stop();

    // Port actually bound (valid after start()).
    uint16_t port() const { return bound_port_; }

private:
    void accept_loop();
    void serve(int client_fd);
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    uint32_t    max_connections_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex active_mutex_;
    std::condition_variable active_cv_;
    uint32_t active_ = 0;
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range. Port 0 is accepted.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Decode %XX escapes and '+' in a query component.
std::string url_decode(const std::string& s);

} // namespace graphmem
