/**
 * @file http_server.hpp
 * @brief Minimal HTTP/1.1 listener used to receive webhook deliveries.
 *
 * Declares the request/response types shared with the webhook handler, the
 * listener options and the HttpServer runner.
 */

#ifndef AUTOWEBHOOKDEPLOY_HTTP_SERVER_HPP
#define AUTOWEBHOOKDEPLOY_HTTP_SERVER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace awd {

/** \brief Parsed inbound HTTP request. */
struct HttpRequest {
  std::string method;                         ///< e.g. "POST"
  std::string path;                           ///< Path without query string
  std::string query;                          ///< Raw query string, if any
  std::map<std::string, std::string> headers; ///< Header names lowercased
  std::string body;                           ///< Exact body bytes

  /// Header value by case-insensitive name, if present.
  std::optional<std::string> header(const std::string &name) const;
};

/** \brief Response produced by a route handler. */
struct HttpResponse {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
  /// Runs once on the listener thread after the response has been written.
  std::function<void()> after_response;
};

/**
 * Build a JSON response.
 *
 * Invalid UTF-8 in string values is replaced with U+FFFD.
 */
HttpResponse make_json_response(int status, const nlohmann::json &body);

/// Standard reason phrase for @p status ("Unknown" for unlisted codes).
const char *reason_phrase(int status) noexcept;

/// Listener configuration.
struct HttpServerOptions {
  std::string bind_address{"0.0.0.0"};
  int port{3040}; ///< 0 selects an ephemeral port
  int backlog{16};
  std::size_t max_body_bytes{1024 * 1024};
  std::size_t max_header_bytes{16 * 1024};
  std::chrono::seconds receive_timeout{10}; ///< whole request, from accept
};

/**
 * HTTP listener serving connections sequentially on a background thread.
 *
 * Requests are routed by exact method and path. Each request is served on a
 * fresh connection (`Connection: close`).
 */
class HttpServer {
public:
  using Handler = std::function<HttpResponse(const HttpRequest &)>;

  explicit HttpServer(HttpServerOptions options);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  /// Register @p handler for @p method requests to @p path.
  void route(const std::string &method, const std::string &path,
             Handler handler);

  /**
   * Bind, listen and start serving in a background thread.
   *
   * @throws std::runtime_error When the socket cannot be created, bound or
   *         put into listening state.
   */
  void start();

  /// Stop accepting connections and join the background thread.
  void stop();

  /// Check whether the listener is currently running.
  bool running() const { return running_; }

  /// Port actually bound (useful when the configured port was 0).
  int port() const { return bound_port_; }

  /**
   * Route a parsed request to its handler.
   *
   * Unknown paths yield 404 and known paths with another method yield 405.
   */
  HttpResponse dispatch(const HttpRequest &request) const;

private:
  struct Route {
    std::string method;
    std::string path;
    Handler handler;
  };

  void run();
  void serve_client(int client, const std::string &remote);
  void close_listener();

  HttpServerOptions options_;
  std::vector<Route> routes_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<int> listener_{-1};
  int bound_port_{0};
};

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_HTTP_SERVER_HPP
