#include "tutorplane/tools/builtin/web.hpp"

#include "tutorplane/common/fs.hpp"

#include <cctype>

namespace tutorplane::tools {

namespace {

constexpr const char *DUCKDUCKGO_HTML = "https://html.duckduckgo.com/html/?q=";
constexpr const char *RESULT_ANCHOR = "class=\"result__a\"";

HttpRequestOptions request_options(const config::WebConfig &config, const std::size_t cap) {
  return HttpRequestOptions{.timeout = std::chrono::seconds(config.timeout_seconds),
                            .user_agent = config.user_agent,
                            .max_body_bytes = cap,
                            .follow_redirects = true};
}

std::string decode_entities(const std::string &text) {
  static const std::pair<const char *, char> entities[] = {
      {"&amp;", '&'}, {"&quot;", '"'}, {"&#x27;", '\''}, {"&#39;", '\''}, {"&lt;", '<'}, {"&gt;", '>'},
  };
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size();) {
    bool replaced = false;
    if (text[i] == '&') {
      for (const auto &[entity, ch] : entities) {
        const std::string_view name(entity);
        if (text.compare(i, name.size(), name) == 0) {
          out.push_back(ch);
          i += name.size();
          replaced = true;
          break;
        }
      }
    }
    if (!replaced) {
      out.push_back(text[i++]);
    }
  }
  return out;
}

std::string strip_tags(const std::string &html) {
  std::string out;
  bool in_tag = false;
  for (const char ch : html) {
    if (ch == '<') {
      in_tag = true;
    } else if (ch == '>') {
      in_tag = false;
    } else if (!in_tag) {
      out.push_back(ch);
    }
  }
  return out;
}

std::string percent_decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size() &&
        std::isxdigit(static_cast<unsigned char>(value[i + 1])) != 0 &&
        std::isxdigit(static_cast<unsigned char>(value[i + 2])) != 0) {
      out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else if (value[i] == '+') {
      out.push_back(' ');
    } else {
      out.push_back(value[i]);
    }
  }
  return out;
}

// DuckDuckGo wraps targets as //duckduckgo.com/l/?uddg=<encoded>&rut=...
std::string unwrap_redirect(const std::string &href) {
  const auto marker = href.find("uddg=");
  if (marker == std::string::npos) {
    return href;
  }
  const auto start = marker + 5;
  const auto end = href.find('&', start);
  return percent_decode(href.substr(start, end == std::string::npos ? std::string::npos
                                                                    : end - start));
}

std::string attribute(const std::string &tag, const std::string &name) {
  const std::string needle = name + "=\"";
  const auto start = tag.find(needle);
  if (start == std::string::npos) {
    return "";
  }
  const auto value_start = start + needle.size();
  const auto end = tag.find('"', value_start);
  if (end == std::string::npos) {
    return "";
  }
  return tag.substr(value_start, end - value_start);
}

bool is_http_url(const std::string &url) {
  const std::string lowered = common::to_lower(url);
  return common::starts_with(lowered, "http://") || common::starts_with(lowered, "https://");
}

} // namespace

std::vector<SearchHit> parse_duckduckgo_results(const std::string &html,
                                                const std::size_t max_results) {
  std::vector<SearchHit> hits;
  std::size_t pos = 0;
  while (hits.size() < max_results) {
    const auto marker = html.find(RESULT_ANCHOR, pos);
    if (marker == std::string::npos) {
      break;
    }
    pos = marker + 1;

    const auto tag_start = html.rfind("<a ", marker);
    const auto tag_end = html.find('>', marker);
    if (tag_start == std::string::npos || tag_end == std::string::npos) {
      continue;
    }
    const auto close = html.find("</a>", tag_end);
    if (close == std::string::npos) {
      continue;
    }

    const std::string tag = html.substr(tag_start, tag_end - tag_start);
    const std::string href = attribute(tag, "href");
    if (href.empty()) {
      continue;
    }
    hits.push_back(SearchHit{
        .title = common::trim(decode_entities(strip_tags(html.substr(tag_end + 1, close - tag_end - 1)))),
        .url = unwrap_redirect(decode_entities(href)),
    });
    pos = close;
  }
  return hits;
}

WebSearchTool::WebSearchTool(std::shared_ptr<IHttpClient> http, config::WebConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

std::string_view WebSearchTool::description() const {
  return "Search the web and return result titles and URLs";
}

std::string WebSearchTool::parameters_schema() const {
  return R"({"type":"object","required":["query"],"properties":{"query":{"type":"string"}}})";
}

common::Result<ToolResult> WebSearchTool::execute(const ToolArgs &args, const ToolContext &) {
  if (!http_) {
    return common::Result<ToolResult>::failure("http client unavailable");
  }
  auto query = required_arg(args, "query");
  if (!query.ok()) {
    return common::Result<ToolResult>::failure(query.error_info());
  }

  auto response = http_->get(DUCKDUCKGO_HTML + url_encode(query.value()),
                             request_options(config_, 0));
  if (!response.ok()) {
    return common::Result<ToolResult>::failure("web search failed: " + response.error());
  }
  if (response.value().status != 200) {
    return common::Result<ToolResult>::failure("search failed with status " +
                                               std::to_string(response.value().status));
  }

  std::string results = "[";
  const auto hits = parse_duckduckgo_results(response.value().body, config_.max_search_results);
  for (std::size_t i = 0; i < hits.size(); ++i) {
    if (i > 0) {
      results += ",";
    }
    results += common::json_object({{"title", common::json_quote(hits[i].title)},
                                    {"url", common::json_quote(hits[i].url)}});
  }
  results += "]";

  ToolResult result = make_result();
  result.set_string("query", query.value());
  result.set_raw("results", std::move(results));
  return common::Result<ToolResult>::success(std::move(result));
}

FetchUrlTool::FetchUrlTool(std::shared_ptr<IHttpClient> http, config::WebConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

std::string_view FetchUrlTool::description() const {
  return "Fetch the body of an http or https URL";
}

std::string FetchUrlTool::parameters_schema() const {
  return R"({"type":"object","required":["url"],"properties":{"url":{"type":"string"}}})";
}

common::Result<ToolResult> FetchUrlTool::execute(const ToolArgs &args, const ToolContext &) {
  if (!http_) {
    return common::Result<ToolResult>::failure("http client unavailable");
  }
  auto url = required_arg(args, "url");
  if (!url.ok()) {
    return common::Result<ToolResult>::failure(url.error_info());
  }
  const std::string target = common::trim(url.value());
  if (!is_http_url(target)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::InvalidArguments,
                                               "only http and https URLs are supported: " +
                                                   target);
  }

  auto response = http_->get(target, request_options(config_, config_.max_content_bytes));
  if (!response.ok()) {
    return common::Result<ToolResult>::failure("failed to fetch URL: " + response.error());
  }
  const HttpResponse &page = response.value();
  if (page.status < 200 || page.status >= 300) {
    return common::Result<ToolResult>::failure("fetch failed with status " +
                                               std::to_string(page.status));
  }

  std::string content = page.body;
  bool truncated = page.truncated;
  if (config_.max_content_bytes > 0 && content.size() > config_.max_content_bytes) {
    content.resize(config_.max_content_bytes);
    truncated = true;
  }
  if (truncated) {
    common::utf8_trim_partial_tail(content);
  }

  ToolResult result = make_result();
  result.set_string("url", target);
  result.set_string("content", content);
  result.set_string("content_type", page.content_type.empty() ? "unknown" : page.content_type);
  result.set_bool("truncated", truncated);
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace tutorplane::tools
