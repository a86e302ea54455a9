#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/call_context.hpp"

namespace rx_host::net {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
  long status{0};
  std::string body{};
};

// Transport failure: the request never produced a response.
class HttpError : public std::runtime_error {
 public:
  HttpError(const std::string& message, bool cancelled = false)
      : std::runtime_error(message), cancelled_(cancelled) {}

  bool cancelled() const { return cancelled_; }

 private:
  bool cancelled_;
};

class HttpClient {
 public:
  virtual ~HttpClient() = default;

  // Issues one GET. Non-2xx statuses are returned, not thrown.
  virtual HttpResponse get(const std::string& url, const core::CallContext& context) = 0;
};

struct CurlOptions {
  std::string user_agent{"rx-toolhost/0.1.0"};
  // Zero keeps libcurl's default connect timeout.
  std::chrono::milliseconds connect_timeout{0};
};

class CurlHttpClient final : public HttpClient {
 public:
  explicit CurlHttpClient(CurlOptions options = {});
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse get(const std::string& url, const core::CallContext& context) override;

 private:
  CurlOptions options_;
};

// Appends URL-encoded query parameters to base_url, in the order given.
std::string build_url(const std::string& base_url, const QueryParams& params);

}  // namespace rx_host::net
