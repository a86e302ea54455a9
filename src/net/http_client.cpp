#include "net/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <sstream>
#include <string>

namespace rx_host::net {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

struct CurlUrlDeleter {
  void operator()(CURLU* url) const {
    if (url != nullptr) {
      curl_url_cleanup(url);
    }
  }
};

struct CurlStringDeleter {
  void operator()(char* value) const {
    if (value != nullptr) {
      curl_free(value);
    }
  }
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  const size_t total = size * nmemb;
  auto* buffer = static_cast<std::string*>(userdata);
  buffer->append(ptr, total);
  return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* context = static_cast<const core::CallContext*>(userdata);
  return context->expired() ? 1 : 0;
}

}  // namespace

CurlHttpClient::CurlHttpClient(CurlOptions options) : options_(std::move(options)) {
  const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (code != CURLE_OK) {
    throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
  }
}

CurlHttpClient::~CurlHttpClient() {
  curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(const std::string& url, const core::CallContext& context) {
  std::unique_ptr<CURL, CurlEasyDeleter> handle(curl_easy_init());
  if (!handle) {
    throw HttpError("curl_easy_init failed");
  }

  HttpResponse response;
  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(handle.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(handle.get(), CURLOPT_XFERINFODATA, const_cast<void*>(static_cast<const void*>(&context)));

  if (options_.connect_timeout.count() > 0) {
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
  }
  if (const auto remaining = context.remaining(); remaining.has_value()) {
    // A zero CURLOPT_TIMEOUT_MS would disable the limit.
    const long timeout_ms = remaining->count() > 0 ? static_cast<long>(remaining->count()) : 1L;
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  }

  const CURLcode code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    const bool cancelled = code == CURLE_ABORTED_BY_CALLBACK || code == CURLE_OPERATION_TIMEDOUT;
    std::ostringstream oss;
    oss << "GET " << url << " failed: " << curl_easy_strerror(code);
    throw HttpError(oss.str(), cancelled);
  }

  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

std::string build_url(const std::string& base_url, const QueryParams& params) {
  std::unique_ptr<CURLU, CurlUrlDeleter> url(curl_url());
  if (!url) {
    throw std::runtime_error("curl_url failed");
  }

  if (const CURLUcode rc = curl_url_set(url.get(), CURLUPART_URL, base_url.c_str(), 0); rc != CURLUE_OK) {
    throw std::invalid_argument("invalid base url: " + base_url);
  }

  for (const auto& [key, value] : params) {
    const std::string pair = key + "=" + value;
    if (const CURLUcode rc = curl_url_set(url.get(), CURLUPART_QUERY, pair.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE);
        rc != CURLUE_OK) {
      throw std::invalid_argument("invalid query parameter: " + key);
    }
  }

  char* raw = nullptr;
  if (const CURLUcode rc = curl_url_get(url.get(), CURLUPART_URL, &raw, 0); rc != CURLUE_OK) {
    throw std::runtime_error("unable to render url for " + base_url);
  }
  std::unique_ptr<char, CurlStringDeleter> rendered(raw);
  return std::string(rendered.get());
}

}  // namespace rx_host::net
