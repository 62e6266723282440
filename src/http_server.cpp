#include <rotator/http_server.hpp>
#include <rotator/log.hpp>
#include <rotator/version.hpp>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace rotator {

static const char HEAD_TERMINATOR[] = "\r\n\r\n";

HttpResponse HttpResponse::html(std::string body) {
    HttpResponse r;
    r.content_type = "text/html; charset=utf-8";
    r.body = std::move(body);
    return r;
}

HttpResponse HttpResponse::json(std::string body) {
    HttpResponse r;
    r.content_type = "application/json";
    r.body = std::move(body);
    return r;
}

HttpResponse HttpResponse::empty(int status) {
    HttpResponse r;
    r.status = status;
    if (status != 204) {
        r.body = std::string(status_reason(status)) + "\n";
    }
    return r;
}

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

std::string format_response(const HttpResponse& response) {
    std::string out;
    out.reserve(128 + response.body.size());
    out += "HTTP/1.1 ";
    out += std::to_string(response.status);
    out += ' ';
    out += status_reason(response.status);
    out += "\r\nServer: rotator/" ROTATOR_VERSION "\r\n";
    if (response.status == 405) {
        out += "Allow: GET\r\n";
    }
    if (response.status != 204) {
        out += "Content-Type: " + response.content_type + "\r\n";
        out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    if (response.status != 204) {
        out += response.body;
    }
    return out;
}

bool parse_request_line(const std::string& head, HttpRequest& out) {
    size_t eol = head.find("\r\n");
    std::string line = head.substr(0, eol);

    size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0) return false;
    size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) return false;
    if (line.find(' ', sp2 + 1) != std::string::npos) return false;

    out.method = line.substr(0, sp1);
    out.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    out.version = line.substr(sp2 + 1);

    return out.version.compare(0, 5, "HTTP/") == 0 && out.target[0] == '/';
}

// Message framing: a request head ends with an empty line. Bodies are
// not read; the endpoints are GET only.
bool HttpConnection::has_complete_head() const {
    return read_buffer.find(HEAD_TERMINATOR) != std::string::npos;
}

std::string HttpConnection::extract_head() {
    size_t pos = read_buffer.find(HEAD_TERMINATOR);
    if (pos == std::string::npos) return "";

    std::string head = read_buffer.substr(0, pos);
    read_buffer.clear();
    return head;
}

HttpServer::HttpServer(std::string bind_address, uint16_t port)
    : bind_address_(std::move(bind_address))
    , port_(port) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (server_fd_ >= 0) return true;  // Already running

    if (!create_socket()) {
        return false;
    }

    log_debug("http", "listening on %s:%u (fd=%d)", bind_address_.c_str(),
              static_cast<unsigned>(port_), server_fd_);
    return true;
}

void HttpServer::stop() {
    // Close all client connections
    for (auto& conn : connections_) {
        if (conn.fd >= 0) {
            close(conn.fd);
        }
    }
    connections_.clear();

    // Close server socket
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
}

static bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool HttpServer::create_socket() {
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1) {
        log_info("http", "invalid bind address: %s", bind_address_.c_str());
        return false;
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        log_info("http", "socket() failed: %s", strerror(errno));
        return false;
    }

    // Workers share the port
    int one = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one)) < 0) {
        log_info("http", "SO_REUSEPORT unavailable: %s", strerror(errno));
    }

    if (!set_nonblocking(server_fd_)) {
        log_info("http", "fcntl() failed: %s", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_info("http", "bind() failed: %s", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, SOMAXCONN) < 0) {
        log_info("http", "listen() failed: %s", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Resolve ephemeral port
    socklen_t len = sizeof(addr);
    if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    return true;
}

std::vector<HttpRequest> HttpServer::poll(int timeout_ms) {
    std::vector<HttpRequest> requests;

    if (server_fd_ < 0) return requests;

    // Build poll fd array
    std::vector<pollfd> fds;
    fds.reserve(1 + connections_.size());

    // Server socket - watch for new connections
    fds.push_back({server_fd_, POLLIN, 0});

    // Client sockets
    for (const auto& conn : connections_) {
        short events = conn.request_taken ? 0 : POLLIN;
        if (!conn.write_buffer.empty()) {
            events |= POLLOUT;
        }
        fds.push_back({conn.fd, events, 0});
    }

    int ret = ::poll(fds.data(), fds.size(), timeout_ms);
    if (ret < 0) {
        if (errno != EINTR) {
            log_info("http", "poll() error: %s", strerror(errno));
        }
        return requests;
    }

    if (ret == 0) {
        close_idle_connections();
        cleanup_closed_connections();
        return requests;
    }

    auto now = std::chrono::steady_clock::now();

    // Check client sockets
    for (size_t i = 1; i < fds.size() && i - 1 < connections_.size(); ++i) {
        auto& conn = connections_[i - 1];

        if (fds[i].revents & POLLIN) {
            char buf[4096];
            ssize_t n = read(conn.fd, buf, sizeof(buf));

            if (n > 0) {
                conn.read_buffer.append(buf, static_cast<size_t>(n));
                conn.last_activity = now;

                if (conn.read_buffer.size() > MAX_HEAD_SIZE && !conn.has_complete_head()) {
                    log_debug("http", "request head too large, closing fd=%d", conn.fd);
                    conn.wants_close = true;
                }
            } else if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) {
                conn.wants_close = true;
            }
        }

        if (fds[i].revents & POLLOUT) {
            if (!conn.write_buffer.empty()) {
                ssize_t n = write(conn.fd, conn.write_buffer.data(), conn.write_buffer.size());
                if (n > 0) {
                    conn.write_buffer.erase(0, static_cast<size_t>(n));
                    conn.last_activity = now;
                } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                    conn.wants_close = true;
                }
            }
            if (conn.write_buffer.empty() && conn.close_after_write) {
                conn.wants_close = true;
            }
        }

        if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            conn.wants_close = true;
        }
    }

    // Extract complete request heads
    for (auto& conn : connections_) {
        if (conn.wants_close || conn.request_taken || !conn.has_complete_head()) continue;

        HttpRequest request;
        request.client_fd = conn.fd;
        conn.request_taken = true;
        if (!parse_request_line(conn.extract_head(), request)) {
            conn.write_buffer = format_response(HttpResponse::empty(400));
            conn.close_after_write = true;
            continue;
        }
        requests.push_back(std::move(request));
    }

    close_idle_connections();
    cleanup_closed_connections();

    // Accept after the client loop so fds and connections_ stay aligned
    if (fds[0].revents & POLLIN) {
        accept_new_connections();
    }

    return requests;
}

HttpConnection* HttpServer::find(int client_fd) {
    for (auto& conn : connections_) {
        if (conn.fd == client_fd) return &conn;
    }
    return nullptr;
}

void HttpServer::respond(int client_fd, const HttpResponse& response) {
    HttpConnection* conn = find(client_fd);
    if (!conn) return;

    conn->write_buffer += format_response(response);
    conn->close_after_write = true;

    // Most responses fit in one write; skip a poll round when they do
    ssize_t n = write(conn->fd, conn->write_buffer.data(), conn->write_buffer.size());
    if (n > 0) {
        conn->write_buffer.erase(0, static_cast<size_t>(n));
        conn->last_activity = std::chrono::steady_clock::now();
    } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        conn->wants_close = true;
    }
    if (conn->write_buffer.empty()) {
        conn->wants_close = true;
    }
    cleanup_closed_connections();
}

void HttpServer::accept_new_connections() {
    while (true) {
        int client_fd = accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;  // No more pending connections
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            log_info("http", "accept() error: %s", strerror(errno));
            break;
        }

        if (connections_.size() >= static_cast<size_t>(MAX_CONNECTIONS)) {
            log_info("http", "max connections reached, rejecting");
            close(client_fd);
            continue;
        }

        if (!set_nonblocking(client_fd)) {
            close(client_fd);
            continue;
        }

        HttpConnection conn;
        conn.fd = client_fd;
        connections_.push_back(std::move(conn));
        log_debug("http", "client connected (fd=%d, total=%zu)", client_fd, connections_.size());
    }
}

void HttpServer::close_idle_connections() {
    auto now = std::chrono::steady_clock::now();
    auto limit = std::chrono::milliseconds(idle_timeout_ms_);
    for (auto& conn : connections_) {
        if (!conn.wants_close && now - conn.last_activity > limit) {
            log_debug("http", "idle timeout, closing fd=%d", conn.fd);
            conn.wants_close = true;
        }
    }
}

void HttpServer::cleanup_closed_connections() {
    auto it = std::remove_if(connections_.begin(), connections_.end(),
        [](const HttpConnection& conn) {
            if (conn.wants_close) {
                close(conn.fd);
                return true;
            }
            return false;
        });
    connections_.erase(it, connections_.end());
}

size_t HttpServer::pending_writes() const {
    size_t total = 0;
    for (const auto& conn : connections_) {
        total += conn.write_buffer.size();
    }
    return total;
}

} // namespace rotator
