#include "collectors/HttpTransport.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>

namespace modeminfo::collectors {

static size_t write_body(void* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

static void global_init_once() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpTransport::HttpTransport(const model::IpAddress& address, std::string scheme,
                             std::chrono::milliseconds timeout)
    : timeout_(timeout) {
  if (scheme != "http" && scheme != "https")
    throw std::invalid_argument("'" + scheme + "' is not a valid scheme");
  std::string host = address.str();
  if (address.family == model::IpAddress::Family::V6) host = "[" + host + "]";
  base_url_ = scheme + "://" + host;
  global_init_once();
}

std::string HttpTransport::url_for(const std::string& path, long long epoch_ms) const {
  std::string url = base_url_;
  if (path.empty() || path.front() != '/') url.push_back('/');
  url += path;
  url += path.contains('?') ? "&_=" : "?_=";
  url += std::to_string(epoch_ms);
  return url;
}

std::string HttpTransport::fetch(const std::string& path) {
  auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  const std::string url = url_for(path, static_cast<long long>(now_ms));

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) throw TransportError(path, "failed to initialize CURL");

  std::string body;
  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    std::string msg = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(res));
    throw TransportError(path, "GET " + url + " failed: " + msg);
  }
  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300)
    throw TransportError(path, "GET " + url + " returned HTTP " + std::to_string(status));
  return body;
}

} // namespace modeminfo::collectors
