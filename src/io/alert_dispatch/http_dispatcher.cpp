#include "io/alert_dispatch/http_dispatcher.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <chrono>
#include <httplib.h>
#include <sstream>
#include <thread>

namespace {
constexpr int CONNECT_TIMEOUT_SECONDS = 5;
constexpr int READ_TIMEOUT_SECONDS = 5;
constexpr const char *SCHEME_SEPARATOR = "://";
} // namespace

HttpDispatcher::HttpDispatcher(const std::string &webhook_url,
                               int max_attempts, int retry_delay_ms)
    : max_attempts_(std::max(1, max_attempts)),
      retry_delay_ms_(std::max(0, retry_delay_ms)) {
  auto scheme_end = webhook_url.find(SCHEME_SEPARATOR);
  std::string scheme = scheme_end == std::string::npos
                           ? std::string()
                           : webhook_url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https") {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Webhook URL must start with http:// or https://: " << webhook_url);
    return;
  }

  std::string rest = webhook_url.substr(scheme_end + 3);
  auto slash = rest.find('/');
  std::string host = rest.substr(0, slash);
  if (host.empty()) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Webhook URL has no host: " << webhook_url);
    return;
  }

  host_ = host;
  path_ = slash == std::string::npos ? "/" : rest.substr(slash);
  is_https_ = scheme == "https";
  LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
      "HttpDispatcher posting to " << scheme << "://" << host_ << path_
                                   << " with up to " << max_attempts_
                                   << " attempts");
}

nlohmann::json HttpDispatcher::build_payload(const Alert &alert) {
  const Finding &finding = alert.finding;
  std::ostringstream summary;
  summary << anomaly_kind_to_string(finding.kind) << " ("
          << severity_to_string(finding.severity) << ") on "
          << alert.device_id << ": " << finding.message;

  nlohmann::json j;
  j["event"] = "power_anomaly";
  j["device_id"] = alert.device_id;
  j["severity"] = severity_to_string(finding.severity);
  j["occurred_at"] = Utils::format_ms_as_iso8601(alert.event_timestamp_ms);
  j["summary"] = summary.str();
  j["alert"] = JsonFormatter::alert_to_json_object(alert);
  return j;
}

template <typename ClientT>
HttpDispatcher::PostOutcome HttpDispatcher::post_with(ClientT &client,
                                                      const std::string &body) {
  client.set_connection_timeout(CONNECT_TIMEOUT_SECONDS);
  client.set_read_timeout(READ_TIMEOUT_SECONDS);

  auto res = client.Post(path_.c_str(), body, "application/json");
  if (!res) {
    LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
        "Webhook " << host_ << path_ << " unreachable: "
                   << httplib::to_string(res.error()));
    return PostOutcome::RETRYABLE;
  }
  if (res->status < 400)
    return PostOutcome::DELIVERED;

  LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
      "Webhook " << host_ << path_ << " answered " << res->status);
  return res->status >= 500 ? PostOutcome::RETRYABLE : PostOutcome::REJECTED;
}

HttpDispatcher::PostOutcome HttpDispatcher::post_once(const std::string &body) {
  if (is_https_) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    httplib::SSLClient cli(host_);
    return post_with(cli, body);
#else
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "HTTPS webhook configured but TLS support is not compiled in.");
    return PostOutcome::REJECTED;
#endif
  }
  httplib::Client cli(host_);
  return post_with(cli, body);
}

bool HttpDispatcher::dispatch(const Alert &alert) {
  if (!is_valid()) {
    failed_++;
    return false;
  }

  const std::string body = build_payload(alert).dump();
  for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
    attempts_++;
    PostOutcome outcome = post_once(body);
    if (outcome == PostOutcome::DELIVERED) {
      delivered_++;
      LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
          "Alert for " << alert.device_id << " delivered to " << host_
                       << path_ << " on attempt " << attempt);
      return true;
    }
    if (outcome == PostOutcome::REJECTED)
      break;
    if (attempt < max_attempts_ && retry_delay_ms_ > 0)
      std::this_thread::sleep_for(
          std::chrono::milliseconds(retry_delay_ms_ * attempt));
  }

  failed_++;
  LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
      "Giving up on alert for " << alert.device_id << " to " << host_ << path_
                                << " (" << failed_.load()
                                << " failed deliveries so far)");
  return false;
}
