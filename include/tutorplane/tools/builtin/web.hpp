#pragma once

#include "tutorplane/config/schema.hpp"
#include "tutorplane/tools/http.hpp"
#include "tutorplane/tools/tool.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tutorplane::tools {

struct SearchHit {
  std::string title;
  std::string url;
};

/// Pulls result links out of a DuckDuckGo HTML results page.
[[nodiscard]] std::vector<SearchHit> parse_duckduckgo_results(const std::string &html,
                                                              std::size_t max_results);

class WebSearchTool final : public ITool {
public:
  WebSearchTool(std::shared_ptr<IHttpClient> http, config::WebConfig config = {});

  [[nodiscard]] Action action() const override { return Action::WebSearch; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "web"; }

private:
  std::shared_ptr<IHttpClient> http_;
  config::WebConfig config_;
};

class FetchUrlTool final : public ITool {
public:
  FetchUrlTool(std::shared_ptr<IHttpClient> http, config::WebConfig config = {});

  [[nodiscard]] Action action() const override { return Action::FetchUrl; }
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return true; }
  [[nodiscard]] std::string_view group() const override { return "web"; }

private:
  std::shared_ptr<IHttpClient> http_;
  config::WebConfig config_;
};

} // namespace tutorplane::tools
