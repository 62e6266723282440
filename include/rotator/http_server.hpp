#pragma once
// HTTP Server: minimal non-blocking HTTP/1.1 listener
//
// Uses poll() for multiplexed I/O on one thread. Several servers may bind
// the same port (SO_REUSEPORT) so each worker thread owns one and the
// kernel spreads connections across them.
//
// One request per connection: every response is sent with
// "Connection: close" and the socket is closed once it is flushed.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rotator {

// A parsed request head waiting for a response
struct HttpRequest {
    int client_fd = -1;
    std::string method;
    std::string target;
    std::string version;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "text/plain";
    std::string body;

    static HttpResponse html(std::string body);
    static HttpResponse json(std::string body);
    static HttpResponse empty(int status);
};

const char* status_reason(int status);

// Serialize status line, headers and body
std::string format_response(const HttpResponse& response);

// Parse "METHOD TARGET HTTP/x.y" from the head. False when malformed.
bool parse_request_line(const std::string& head, HttpRequest& out);

// Connection state for a single client
struct HttpConnection {
    int fd = -1;
    std::string read_buffer;
    std::string write_buffer;
    bool request_taken = false;
    bool close_after_write = false;
    bool wants_close = false;
    std::chrono::steady_clock::time_point last_activity = std::chrono::steady_clock::now();

    bool has_complete_head() const;
    std::string extract_head();
};

class HttpServer {
public:
    static constexpr int MAX_CONNECTIONS = 1024;
    static constexpr size_t MAX_HEAD_SIZE = 64 * 1024;
    static constexpr int IDLE_TIMEOUT_MS = 10000;

    HttpServer(std::string bind_address, uint16_t port);
    ~HttpServer();

    // Non-copyable, non-movable (owns file descriptor)
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    // Lifecycle
    bool start();
    void stop();
    bool running() const { return server_fd_ >= 0; }

    // One poll round; returns requests ready for a response.
    // Malformed requests are answered with 400 internally.
    // timeout_ms: -1 = block forever, 0 = non-blocking, >0 = wait up to N ms
    std::vector<HttpRequest> poll(int timeout_ms = 100);

    // Queue response; the connection closes after it is written
    void respond(int client_fd, const HttpResponse& response);

    // Connections without I/O for this long are closed on the next poll
    void set_idle_timeout(int ms) { idle_timeout_ms_ = ms; }
    int idle_timeout() const { return idle_timeout_ms_; }

    // Statistics
    size_t connection_count() const { return connections_.size(); }
    size_t pending_writes() const;

    // Actual port (useful when constructed with port 0)
    uint16_t port() const { return port_; }
    const std::string& bind_address() const { return bind_address_; }

private:
    std::string bind_address_;
    uint16_t port_;
    int server_fd_ = -1;
    int idle_timeout_ms_ = IDLE_TIMEOUT_MS;
    std::vector<HttpConnection> connections_;

    // Internal operations
    bool create_socket();
    void accept_new_connections();
    void close_idle_connections();
    void cleanup_closed_connections();
    HttpConnection* find(int client_fd);
};

} // namespace rotator
