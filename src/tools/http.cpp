#include "tutorplane/tools/http.hpp"

#include <curl/curl.h>

namespace tutorplane::tools {

namespace {

struct BodySink {
  std::string *body = nullptr;
  std::size_t limit = 0;
  bool truncated = false;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *sink = static_cast<BodySink *>(userdata);
  const auto total = size * nmemb;
  if (sink->limit == 0) {
    sink->body->append(ptr, total);
    return total;
  }
  const std::size_t room = sink->body->size() < sink->limit ? sink->limit - sink->body->size() : 0;
  if (total > room) {
    sink->body->append(ptr, room);
    sink->truncated = true;
    // Short count aborts the transfer with CURLE_WRITE_ERROR.
    return room;
  }
  sink->body->append(ptr, total);
  return total;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

common::Result<HttpResponse> CurlHttpClient::get(const std::string &url,
                                                 const HttpRequestOptions &options) {
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    return common::Result<HttpResponse>::failure("curl init failed");
  }

  HttpResponse response;
  BodySink sink{.body = &response.body, .limit = options.max_body_bytes, .truncated = false};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
  if (!options.user_agent.empty()) {
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
  }

  const CURLcode code = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  char *content_type = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK &&
      content_type != nullptr) {
    response.content_type = content_type;
  }
  char *effective_url = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK &&
      effective_url != nullptr) {
    response.effective_url = effective_url;
  }
  curl_easy_cleanup(curl);

  response.truncated = sink.truncated;
  if (code != CURLE_OK && !(code == CURLE_WRITE_ERROR && sink.truncated)) {
    return common::Result<HttpResponse>::failure("HTTP request failed: " +
                                                 std::string(curl_easy_strerror(code)));
  }
  return common::Result<HttpResponse>::success(std::move(response));
}

std::string url_encode(const std::string &value) {
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    return value;
  }
  char *escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
  std::string out = escaped == nullptr ? value : std::string(escaped);
  if (escaped != nullptr) {
    curl_free(escaped);
  }
  curl_easy_cleanup(curl);
  return out;
}

} // namespace tutorplane::tools
