/*
 * HTTP Server Module
 *
 * Simple HTTP/1.1 server implementation
 */

#include "http_server.h"
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <errno.h>

namespace http {

static const size_t MAX_REQUEST_SIZE = 64 * 1024;

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string Request::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

std::string Request::query_param(const std::string& name) const {
    auto it = query.find(name);
    return it == query.end() ? std::string() : it->second;
}

// Response implementation
Response::Response()
    : status_code_(200)
    , status_message_("OK")
    , content_type_("text/plain")
{}

void Response::set_status(int code, const std::string& message) {
    status_code_ = code;
    if (!message.empty()) {
        status_message_ = message;
    } else {
        // Default status messages
        switch (code) {
            case 200: status_message_ = "OK"; break;
            case 400: status_message_ = "Bad Request"; break;
            case 401: status_message_ = "Unauthorized"; break;
            case 404: status_message_ = "Not Found"; break;
            case 405: status_message_ = "Method Not Allowed"; break;
            case 500: status_message_ = "Internal Server Error"; break;
            default: status_message_ = "Unknown"; break;
        }
    }
}

void Response::set_content_type(const std::string& content_type) {
    content_type_ = content_type;
}

void Response::set_body(const std::string& body) {
    body_ = body;
}

void Response::add_header(const std::string& name, const std::string& value) {
    extra_headers_ += name + ": " + value + "\r\n";
}

std::string Response::build() const {
    std::string response = "HTTP/1.1 " + std::to_string(status_code_) + " " + status_message_ + "\r\n";
    response += "Content-Type: " + content_type_ + "\r\n";
    response += "Content-Length: " + std::to_string(body_.size()) + "\r\n";
    response += "Connection: close\r\n";
    if (!extra_headers_.empty()) {
        response += extra_headers_;
    }
    response += "\r\n";
    response += body_;
    return response;
}

Response Response::json(const std::string& json_body, int code) {
    Response resp;
    resp.set_status(code);
    resp.set_content_type("application/json");
    resp.set_body(json_body);
    return resp;
}

Response Response::not_found() {
    Response resp;
    resp.set_status(404);
    resp.set_content_type("text/plain");
    resp.set_body("Not Found");
    return resp;
}

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out += static_cast<char>(strtol(s.substr(i + 1, 2).c_str(), nullptr, 16));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

static void parse_query(const std::string& qs, std::map<std::string, std::string>& out) {
    size_t pos = 0;
    while (pos <= qs.size()) {
        size_t amp = qs.find('&', pos);
        if (amp == std::string::npos) amp = qs.size();
        std::string pair = qs.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                out[url_decode(pair)] = "";
            } else {
                out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        pos = amp + 1;
    }
}

bool parse_request(const std::string& request, Request& req) {
    // Parse request line: METHOD PATH HTTP/1.1
    size_t method_end = request.find(' ');
    if (method_end == std::string::npos) return false;

    req.method = request.substr(0, method_end);

    size_t path_start = method_end + 1;
    size_t path_end = request.find(' ', path_start);
    if (path_end == std::string::npos) return false;

    req.path = request.substr(path_start, path_end - path_start);

    // Split off query string
    size_t query_pos = req.path.find('?');
    if (query_pos != std::string::npos) {
        parse_query(req.path.substr(query_pos + 1), req.query);
        req.path = req.path.substr(0, query_pos);
    }

    size_t line_end = request.find("\r\n", path_end);
    size_t body_start = request.find("\r\n\r\n");

    // Headers
    if (line_end != std::string::npos) {
        size_t pos = line_end + 2;
        size_t headers_end = (body_start == std::string::npos) ? request.size() : body_start;
        while (pos < headers_end) {
            size_t eol = request.find("\r\n", pos);
            if (eol == std::string::npos || eol > headers_end) eol = headers_end;
            std::string line = request.substr(pos, eol - pos);
            size_t colon = line.find(':');
            if (colon != std::string::npos) {
                req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
            }
            pos = eol + 2;
        }
    }

    // Extract body (after \r\n\r\n)
    if (body_start != std::string::npos) {
        req.body = request.substr(body_start + 4);
    }

    return true;
}

// Server implementation
Server::Server()
    : port_(0)
    , server_fd_(-1)
    , running_(false)
{}

Server::~Server() {
    stop();
}

bool Server::start(int port, RequestHandler handler) {
    if (running_) {
        fprintf(stderr, "HTTP: Server already running\n");
        return false;
    }

    port_ = port;
    handler_ = handler;

    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        fprintf(stderr, "HTTP: Failed to create socket\n");
        return false;
    }

    // Set SO_REUSEADDR
    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        fprintf(stderr, "HTTP: Warning: Failed to set SO_REUSEADDR: %s\n", strerror(errno));
    }

    // Set non-blocking
    int flags = fcntl(server_fd_, F_GETFL, 0);
    if (flags < 0 || fcntl(server_fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        fprintf(stderr, "HTTP: Failed to set non-blocking mode: %s\n", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Bind
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        fprintf(stderr, "HTTP: Failed to bind port %d: %s\n", port, strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Listen
    if (listen(server_fd_, 10) < 0) {
        fprintf(stderr, "HTTP: Failed to listen: %s\n", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Start thread
    running_ = true;
    thread_ = std::thread(&Server::run, this);

    fprintf(stderr, "HTTP: Admin API on port %d\n", port);
    return true;
}

void Server::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
}

void Server::run() {
    while (running_) {
        struct pollfd pfd;
        pfd.fd = server_fd_;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, 100);
        if (ret <= 0) continue;

        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) continue;

        char ip[INET_ADDRSTRLEN] = "unknown";
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));

        handle_client(client_fd, ip);
        close(client_fd);
    }
}

void Server::handle_client(int client_fd, const std::string& remote_ip) {
    std::string raw;
    char buffer[8192];

    // Read until the headers and the declared body have arrived
    while (raw.size() < MAX_REQUEST_SIZE) {
        struct pollfd pfd;
        pfd.fd = client_fd;
        pfd.events = POLLIN;
        if (poll(&pfd, 1, 1000) <= 0) break;

        ssize_t n = recv(client_fd, buffer, sizeof(buffer), 0);
        if (n <= 0) break;
        raw.append(buffer, static_cast<size_t>(n));

        size_t headers_end = raw.find("\r\n\r\n");
        if (headers_end == std::string::npos) continue;

        Request probe;
        parse_request(raw.substr(0, headers_end + 4), probe);
        size_t content_length = static_cast<size_t>(atol(probe.header("content-length").c_str()));
        if (raw.size() >= headers_end + 4 + content_length) break;
    }
    if (raw.empty()) return;

    Request req;
    Response resp;
    if (!parse_request(raw, req)) {
        resp.set_status(400);
        resp.set_body("Bad Request");
    } else {
        req.remote_ip = remote_ip;
        resp = handler_(req);
    }

    std::string response_str = resp.build();
    if (send(client_fd, response_str.c_str(), response_str.size(), MSG_NOSIGNAL) < 0) {
        fprintf(stderr, "HTTP: Failed to send response: %s\n", strerror(errno));
    }
}

} // namespace http
