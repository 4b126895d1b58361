#include "http_server.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; other platforms fall back to 0.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace awd {

namespace {
std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return value;
}

std::string trim_copy(const std::string &value) {
  const char *ws = " \t";
  auto start = value.find_first_not_of(ws);
  if (start == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(ws);
  return value.substr(start, end - start + 1);
}

std::string describe_error(int code) {
  return std::system_category().message(code);
}

bool send_all(int fd, const std::string &data) {
  const char *ptr = data.data();
  std::size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      return false;
    }
    ptr += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

bool write_response(int fd, const HttpResponse &response) {
  std::string out = "HTTP/1.1 " + std::to_string(response.status) + " " +
                    reason_phrase(response.status) + "\r\n";
  out += "Content-Type: " + response.content_type + "\r\n";
  out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
  out += "Connection: close\r\n\r\n";
  out += response.body;
  return send_all(fd, out);
}

HttpResponse error_response(int status, const char *tag) {
  return make_json_response(status, nlohmann::json{{"error", tag}});
}

/**
 * Result of reading one request off a connection. When @ref error is set the
 * request could not be read and that response should be sent instead.
 */
enum class RecvStatus { Data, Closed, TimedOut };

using Deadline = std::chrono::steady_clock::time_point;

/// Receive into @p chunk, waiting no later than @p deadline for data.
RecvStatus recv_before(int fd, std::array<char, 4096> &chunk,
                       Deadline deadline, std::size_t &received) {
  for (;;) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return RecvStatus::TimedOut;
    }
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return RecvStatus::Closed;
    }
    if (ready == 0) {
      continue;
    }
    ssize_t n = ::recv(fd, chunk.data(), chunk.size(), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return RecvStatus::Closed;
    }
    received = static_cast<std::size_t>(n);
    return RecvStatus::Data;
  }
}

struct ReadResult {
  std::optional<HttpRequest> request;
  std::optional<HttpResponse> error;
};

ReadResult read_request(int fd, const HttpServerOptions &options,
                        Deadline deadline) {
  ReadResult result;
  std::string buffer;
  buffer.reserve(4096);
  std::array<char, 4096> chunk{};
  std::size_t received = 0;
  std::size_t header_end = std::string::npos;
  while ((header_end = buffer.find("\r\n\r\n")) == std::string::npos) {
    RecvStatus status = recv_before(fd, chunk, deadline, received);
    if (status == RecvStatus::TimedOut) {
      result.error = error_response(408, "request_timeout");
      return result;
    }
    if (status == RecvStatus::Closed) {
      return result;
    }
    buffer.append(chunk.data(), received);
    if (buffer.size() > options.max_header_bytes) {
      result.error = error_response(400, "headers_too_large");
      return result;
    }
  }

  HttpRequest request;
  const std::string head = buffer.substr(0, header_end);
  auto line_end = head.find("\r\n");
  const std::string request_line = head.substr(0, line_end);
  {
    auto first = request_line.find(' ');
    auto second = first == std::string::npos
                      ? std::string::npos
                      : request_line.find(' ', first + 1);
    if (first == std::string::npos || second == std::string::npos) {
      result.error = error_response(400, "bad_request");
      return result;
    }
    request.method = request_line.substr(0, first);
    std::string target = request_line.substr(first + 1, second - first - 1);
    auto q = target.find('?');
    request.path = target.substr(0, q);
    if (q != std::string::npos) {
      request.query = target.substr(q + 1);
    }
  }

  std::size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
  while (pos < head.size()) {
    auto next = head.find("\r\n", pos);
    if (next == std::string::npos) {
      next = head.size();
    }
    const std::string line = head.substr(pos, next - pos);
    pos = next + 2;
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    request.headers[to_lower_copy(trim_copy(line.substr(0, colon)))] =
        trim_copy(line.substr(colon + 1));
  }

  std::size_t content_length = 0;
  if (auto it = request.headers.find("content-length");
      it != request.headers.end()) {
    try {
      std::size_t idx = 0;
      unsigned long long parsed = std::stoull(it->second, &idx);
      if (idx != it->second.size()) {
        throw std::invalid_argument("trailing characters");
      }
      content_length = static_cast<std::size_t>(parsed);
    } catch (const std::exception &) {
      result.error = error_response(400, "invalid_content_length");
      return result;
    }
  }
  if (content_length > options.max_body_bytes) {
    result.error = error_response(413, "payload_too_large");
    return result;
  }

  request.body = buffer.substr(header_end + 4);
  while (request.body.size() < content_length) {
    RecvStatus status = recv_before(fd, chunk, deadline, received);
    if (status == RecvStatus::TimedOut) {
      result.error = error_response(408, "request_timeout");
      return result;
    }
    if (status == RecvStatus::Closed) {
      result.error = error_response(400, "incomplete_body");
      return result;
    }
    request.body.append(chunk.data(), received);
  }
  request.body.resize(content_length);
  result.request = std::move(request);
  return result;
}
} // namespace

std::optional<std::string> HttpRequest::header(const std::string &name) const {
  auto it = headers.find(to_lower_copy(name));
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

HttpResponse make_json_response(int status, const nlohmann::json &body) {
  HttpResponse response;
  response.status = status;
  response.body =
      body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return response;
}

const char *reason_phrase(int status) noexcept {
  switch (status) {
  case 200:
    return "OK";
  case 202:
    return "Accepted";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 408:
    return "Request Timeout";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

HttpServer::HttpServer(HttpServerOptions options)
    : options_(std::move(options)) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::route(const std::string &method, const std::string &path,
                       Handler handler) {
  routes_.push_back(Route{method, path, std::move(handler)});
}

HttpResponse HttpServer::dispatch(const HttpRequest &request) const {
  bool path_known = false;
  for (const auto &route : routes_) {
    if (route.path != request.path) {
      continue;
    }
    path_known = true;
    if (route.method == request.method) {
      return route.handler(request);
    }
  }
  if (path_known) {
    return error_response(405, "method_not_allowed");
  }
  return error_response(404, "not_found");
}

void HttpServer::start() {
  if (running_) {
    return;
  }
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw std::runtime_error("Failed to create listener socket: " +
                             describe_error(errno));
  }
  int enable = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(options_.port));
  if (options_.bind_address.empty() || options_.bind_address == "*") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, options_.bind_address.c_str(),
                       &addr.sin_addr) != 1) {
    ::close(fd);
    throw std::runtime_error("Invalid bind address '" + options_.bind_address +
                             "'");
  }
  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(fd);
    throw std::runtime_error("Failed to bind " + options_.bind_address + ":" +
                             std::to_string(options_.port) + ": " +
                             describe_error(err));
  }
  if (::listen(fd, options_.backlog) < 0) {
    int err = errno;
    ::close(fd);
    throw std::runtime_error("Failed to listen: " + describe_error(err));
  }
  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &bound_len) ==
      0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = options_.port;
  }

  listener_ = fd;
  stop_requested_ = false;
  running_ = true;
  http_log()->info("Listening on {}:{}",
                   options_.bind_address.empty() ? "0.0.0.0"
                                                 : options_.bind_address,
                   bound_port_);
  thread_ = std::thread([this] { run(); });
}

void HttpServer::stop() {
  stop_requested_ = true;
  close_listener();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

void HttpServer::close_listener() {
  int fd = listener_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
}

void HttpServer::run() {
  while (!stop_requested_) {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int fd = listener_.load();
    if (fd < 0) {
      break;
    }
    int client =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client < 0) {
      if (stop_requested_) {
        break;
      }
      if (errno != EINTR) {
        http_log()->warn("accept failed: {}", describe_error(errno));
      }
      continue;
    }
    std::array<char, INET_ADDRSTRLEN> addr_buf{};
    const char *remote = inet_ntop(AF_INET, &client_addr.sin_addr,
                                   addr_buf.data(), addr_buf.size());
    serve_client(client, remote != nullptr ? remote : "unknown");
    ::close(client);
  }
  running_ = false;
  http_log()->info("HTTP listener stopped");
}

void HttpServer::serve_client(int client, const std::string &remote) {
  // The whole request must arrive within receive_timeout of the accept.
  const Deadline deadline =
      std::chrono::steady_clock::now() + options_.receive_timeout;
  ReadResult read = read_request(client, options_, deadline);
  if (!read.request && !read.error) {
    http_log()->debug("{} closed the connection before sending a request",
                      remote);
    return;
  }
  HttpResponse response;
  std::string method = "-";
  std::string path = "-";
  std::size_t body_size = 0;
  if (read.error) {
    response = std::move(*read.error);
  } else {
    const HttpRequest &request = *read.request;
    method = request.method;
    path = request.path;
    body_size = request.body.size();
    try {
      response = dispatch(request);
    } catch (const std::exception &e) {
      http_log()->error("Handler for {} {} failed: {}", method, path,
                        e.what());
      response = error_response(500, "internal_error");
    }
  }
  if (!write_response(client, response)) {
    http_log()->warn("Failed to send response to {}", remote);
  }
  ::shutdown(client, SHUT_WR);
  http_log()->info("{} \"{} {}\" {} {} bytes", remote, method, path,
                   response.status, body_size);

  if (response.after_response) {
    auto action = std::move(response.after_response);
    response.after_response = nullptr;
    try {
      action();
    } catch (const std::exception &e) {
      http_log()->error("Post-response action for {} {} failed: {}", method,
                        path, e.what());
    }
  }
}

} // namespace awd
