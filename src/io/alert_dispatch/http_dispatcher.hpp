#ifndef HTTP_DISPATCHER_HPP
#define HTTP_DISPATCHER_HPP

#include "io/alert_dispatch/base_dispatcher.hpp"

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

// Delivers power alerts to a webhook as a JSON event. Connection errors and
// 5xx responses are retried with a linearly growing delay; a 4xx response
// fails the delivery at once. https URLs need cpp-httplib built with OpenSSL
// support.
class HttpDispatcher : public IAlertDispatcher {
public:
  explicit HttpDispatcher(const std::string &webhook_url, int max_attempts = 3,
                          int retry_delay_ms = 500);
  bool dispatch(const Alert &alert) override;
  const char *get_name() const override { return "HttpDispatcher"; }
  std::string get_dispatcher_type() const override { return "http"; }

  bool is_valid() const { return !host_.empty(); }
  const std::string &get_host() const { return host_; }
  const std::string &get_path() const { return path_; }
  bool is_https() const { return is_https_; }
  int get_max_attempts() const { return max_attempts_; }

  uint64_t get_delivered_count() const { return delivered_.load(); }
  uint64_t get_failed_deliveries() const { return failed_.load(); }
  uint64_t get_attempt_count() const { return attempts_.load(); }

  // Webhook body: event header, headline summary and the alert itself
  static nlohmann::json build_payload(const Alert &alert);

private:
  enum class PostOutcome { DELIVERED, RETRYABLE, REJECTED };

  PostOutcome post_once(const std::string &body);
  template <typename ClientT>
  PostOutcome post_with(ClientT &client, const std::string &body);

  std::string host_;
  std::string path_;
  bool is_https_ = false;
  int max_attempts_;
  int retry_delay_ms_;

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> attempts_{0};
};

#endif // HTTP_DISPATCHER_HPP
