/**
 * @file HttpClient.cpp
 * @brief libcurl GET and download.
 */

#include "src/net/inc/HttpClient.hpp"

#include <cstdio> // fopen, fwrite, fclose, remove

#include <curl/curl.h>

namespace kindling {

namespace net {

namespace {

/// Process-wide curl_global_init/curl_global_cleanup pairing.
class CurlGlobal {
public:
  static void ensure() { static CurlGlobal instance; }

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;

private:
  CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobal() { curl_global_cleanup(); }
};

/// Owning CURL easy handle.
class EasyHandle {
public:
  EasyHandle() : curl_(curl_easy_init()) {}
  ~EasyHandle() {
    if (curl_ != nullptr) {
      curl_easy_cleanup(curl_);
    }
  }
  EasyHandle(const EasyHandle&) = delete;
  EasyHandle& operator=(const EasyHandle&) = delete;

  [[nodiscard]] CURL* get() const noexcept { return curl_; }

private:
  CURL* curl_;
};

std::size_t discardBody(char* /*ptr*/, std::size_t size, std::size_t nmemb, void* /*userdata*/) {
  return size * nmemb;
}

std::size_t writeToFile(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  return std::fwrite(ptr, size, nmemb, static_cast<std::FILE*>(userdata));
}

} // namespace

/* ----------------------------- CurlHttpClient ----------------------------- */

CurlHttpClient::CurlHttpClient() { CurlGlobal::ensure(); }

HttpResponse CurlHttpClient::get(const std::string& url, std::chrono::milliseconds timeout) {
  HttpResponse response;
  EasyHandle handle;
  if (handle.get() == nullptr) {
    response.error = "curl_easy_init failed";
    return response;
  }

  CURL* curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardBody);

  const CURLcode RES = curl_easy_perform(curl);
  if (RES != CURLE_OK) {
    response.error = curl_easy_strerror(RES);
    return response;
  }

  response.transportOk = true;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

bool CurlHttpClient::download(const std::string& url, const std::string& destination,
                              std::string& error) {
  EasyHandle handle;
  if (handle.get() == nullptr) {
    error = "curl_easy_init failed";
    return false;
  }

  std::FILE* out = std::fopen(destination.c_str(), "wb");
  if (out == nullptr) {
    error = "cannot open " + destination + " for writing";
    return false;
  }

  CURL* curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, 300L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeToFile);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);

  const CURLcode RES = curl_easy_perform(curl);
  const bool CLOSED = (std::fclose(out) == 0);

  if (RES != CURLE_OK || !CLOSED) {
    error = (RES != CURLE_OK) ? curl_easy_strerror(RES) : "failed to flush " + destination;
    std::remove(destination.c_str());
    return false;
  }
  return true;
}

} // namespace net

} // namespace kindling
