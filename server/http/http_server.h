/*
 * HTTP Server Module
 *
 * Minimal HTTP/1.1 server for the administrative JSON API.
 * Non-blocking listen socket with polling, one request per connection.
 */

#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <thread>

namespace http {

/**
 * HTTP Request Information
 */
struct Request {
    std::string method;      // GET, POST, DELETE
    std::string path;        // URL path without query string
    std::string body;        // Request body content
    std::string remote_ip;
    std::map<std::string, std::string> headers;   // Names lower-cased
    std::map<std::string, std::string> query;     // Decoded query parameters

    // Empty string if absent
    std::string header(const std::string& name) const;
    std::string query_param(const std::string& name) const;
};

/**
 * HTTP Response Builder
 */
class Response {
public:
    Response();

    void set_status(int code, const std::string& message = "");
    void set_content_type(const std::string& content_type);
    void set_body(const std::string& body);
    void add_header(const std::string& name, const std::string& value);

    int status() const { return status_code_; }
    const std::string& body() const { return body_; }

    std::string build() const;

    // Convenience methods
    static Response json(const std::string& json_body, int code = 200);
    static Response not_found();

private:
    int status_code_;
    std::string status_message_;
    std::string content_type_;
    std::string body_;
    std::string extra_headers_;
};

/**
 * Parse a raw HTTP request (request line, headers, body)
 * @return false if the request line is malformed
 */
bool parse_request(const std::string& raw, Request& req);

// Decode %XX escapes and '+' in a query component
std::string url_decode(const std::string& s);

/**
 * HTTP Server
 *
 * Listens on a port and handles HTTP requests.
 * Uses a callback for request routing/handling.
 */
class Server {
public:
    // Request handler callback: receives request, returns response
    using RequestHandler = std::function<Response(const Request&)>;

    Server();
    ~Server();

    // Start server on specified port
    bool start(int port, RequestHandler handler);

    // Stop server and wait for thread to join
    void stop();

    // Check if server is running
    bool is_running() const { return running_; }

private:
    void run();
    void handle_client(int client_fd, const std::string& remote_ip);

    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    std::thread thread_;
    RequestHandler handler_;
};

} // namespace http

#endif // HTTP_SERVER_H
