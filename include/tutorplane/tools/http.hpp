#pragma once

#include "tutorplane/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace tutorplane::tools {

struct HttpRequestOptions {
  std::chrono::milliseconds timeout{10'000};
  std::string user_agent;
  /// 0 keeps the whole body.
  std::size_t max_body_bytes = 0;
  bool follow_redirects = true;
};

struct HttpResponse {
  long status = 0;
  std::string body;
  std::string content_type;
  std::string effective_url;
  bool truncated = false;
};

class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  /// Transport failures are errors; any HTTP status is a response.
  [[nodiscard]] virtual common::Result<HttpResponse> get(const std::string &url,
                                                         const HttpRequestOptions &options) = 0;
};

class CurlHttpClient final : public IHttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] common::Result<HttpResponse> get(const std::string &url,
                                                 const HttpRequestOptions &options) override;
};

/// Percent-encodes a query component.
[[nodiscard]] std::string url_encode(const std::string &value);

} // namespace tutorplane::tools
