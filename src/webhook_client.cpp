/**
 * @file webhook_client.cpp
 * @brief libcurl implementation of the test delivery sender.
 */

#include "webhook_client.hpp"
#include "log.hpp"
#include "signature.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <stdexcept>

namespace awd {

namespace {

std::shared_ptr<spdlog::logger> client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("client");
  }();
  return logger;
}

/// Owns one CURL easy handle, running global setup once per process.
class CurlHandle {
public:
  CurlHandle() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    handle_ = curl_easy_init();
    if (!handle_) {
      throw std::runtime_error("Failed to init curl");
    }
  }
  ~CurlHandle() { curl_easy_cleanup(handle_); }
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  CURL *get() const { return handle_; }

private:
  CURL *handle_{nullptr};
};

/// RAII wrapper managing a CURL linked list of headers.
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  auto *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

} // namespace

WebhookReply send_test_webhook(const std::string &url,
                               const std::string &secret,
                               const std::string &event,
                               const std::string &payload, long timeout_ms) {
  CurlHandle handle;
  CURL *curl = handle.get();
  WebhookReply reply;

  CurlSlist headers;
  headers.append("Content-Type: application/json");
  headers.append("X-Hub-Signature-256: " + compute_signature(secret, payload));
  headers.append("X-GitHub-Event: " + event);
  headers.append(std::string("User-Agent: ") + kClientUserAgent);

  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.data());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(payload.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  client_log()->debug("POST {} event={} ({} bytes)", url, event,
                      payload.size());
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(res);
    client_log()->error("Test delivery to {} failed: {}", url, msg);
    throw std::runtime_error("curl POST failed: " + msg);
  }
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);
  client_log()->info("Test delivery to {} answered {}", url, reply.status);
  return reply;
}

} // namespace awd
