#include "tutorplane/tools/builtin/knowledge.hpp"

#include "tutorplane/common/fs.hpp"
#include "tutorplane/common/hash.hpp"

#include <set>

namespace tutorplane::tools {

namespace {

const std::set<std::string> &text_formats() {
  static const std::set<std::string> formats = {
      "txt", "md",  "markdown", "rst", "csv", "json", "html", "htm", "xml",  "toml",
      "yaml", "yml", "py",      "js",  "c",   "h",    "cpp",  "hpp", "cc",   "go",
      "rs",  "java", "sql",     "tex", "log"};
  return formats;
}

std::string hit_json(const store::KnowledgeHit &hit) {
  return common::json_object({
      {"doc_id", common::json_quote(hit.document.doc_id)},
      {"content", common::json_quote(hit.document.content)},
      {"metadata", common::json_string_object(hit.document.metadata)},
      {"score", std::to_string(hit.score)},
  });
}

std::string session_for(const ToolArgs &args, const ToolContext &ctx) {
  return optional_arg(args, "session_id", ctx.session_id);
}

} // namespace

SearchKnowledgeTool::SearchKnowledgeTool(std::shared_ptr<store::ITutorStore> store,
                                         const std::size_t top_k)
    : store_(std::move(store)), top_k_(top_k) {}

std::string_view SearchKnowledgeTool::description() const {
  return "Keyword search over ingested knowledge documents";
}

std::string SearchKnowledgeTool::parameters_schema() const {
  return R"({"type":"object","required":["query"],"properties":{"query":{"type":"string"},"filters":{"type":"object"},"session_id":{"type":"string"}}})";
}

common::Result<ToolResult> SearchKnowledgeTool::execute(const ToolArgs &args,
                                                        const ToolContext &ctx) {
  if (!store_) {
    return common::Result<ToolResult>::failure("tutor store unavailable");
  }
  auto query = required_arg(args, "query");
  if (!query.ok()) {
    return common::Result<ToolResult>::failure(query.error_info());
  }

  store::DocumentMetadata filters;
  const std::string filters_json = optional_arg(args, "filters");
  if (!filters_json.empty()) {
    auto parsed = common::json_parse_flat(filters_json);
    if (!parsed.ok()) {
      return common::Result<ToolResult>::failure(common::ErrorKind::InvalidArguments,
                                                 "filters must be a JSON object: " +
                                                     parsed.error());
    }
    filters = std::move(parsed.value());
  }
  if (const std::string session = session_for(args, ctx); !session.empty()) {
    filters["session_id"] = session;
  }

  auto hits = store_->search(query.value(), filters, top_k_);
  if (!hits.ok()) {
    return common::Result<ToolResult>::failure(hits.error_info());
  }

  std::string results = "[";
  for (std::size_t i = 0; i < hits.value().size(); ++i) {
    if (i > 0) {
      results += ",";
    }
    results += hit_json(hits.value()[i]);
  }
  results += "]";

  ToolResult result = make_result();
  result.set_string("query", query.value());
  result.set_raw("results", std::move(results));
  result.set_int("count", static_cast<std::int64_t>(hits.value().size()));
  return common::Result<ToolResult>::success(std::move(result));
}

IngestDocumentTool::IngestDocumentTool(std::shared_ptr<store::ITutorStore> store)
    : store_(std::move(store)) {}

std::string_view IngestDocumentTool::description() const {
  return "Add a plain-text document to the knowledge base";
}

std::string IngestDocumentTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"},"session_id":{"type":"string"}}})";
}

common::Result<ToolResult> IngestDocumentTool::execute(const ToolArgs &args,
                                                       const ToolContext &ctx) {
  if (!store_) {
    return common::Result<ToolResult>::failure("tutor store unavailable");
  }
  auto path_arg = required_arg(args, "path");
  if (!path_arg.ok()) {
    return common::Result<ToolResult>::failure(path_arg.error_info());
  }
  const std::filesystem::path path = path_arg.value();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::NotFound,
                                               "file not found: " + path.string());
  }

  std::string format = common::to_lower(path.extension().string());
  if (!format.empty()) {
    format.erase(0, 1);
  }
  if (!text_formats().contains(format)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::InvalidArguments,
                                               "unsupported file format: " +
                                                   (format.empty() ? std::string("(none)") : format));
  }
  if (common::looks_binary(path)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::InvalidArguments,
                                               "binary content is not supported: " +
                                                   path.string());
  }

  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<ToolResult>::failure(content.error_info());
  }

  const std::string filename = path.filename().string();
  store::KnowledgeDocument document;
  document.doc_id = "doc_" + common::sha256_hex(filename + '\n' + content.value()).substr(0, 16);
  document.content = content.value();
  document.metadata = {{"source", filename}, {"type", format}, {"proficiency", "intermediate"}};
  if (const std::string session = session_for(args, ctx); !session.empty()) {
    document.metadata["session_id"] = session;
  }

  if (const auto added = store_->add_document(document); !added.ok()) {
    return common::Result<ToolResult>::failure(*added.error_info());
  }

  ToolResult result = make_result();
  result.set_string("filename", filename);
  result.set_string("doc_id", document.doc_id);
  result.set_int("chars_extracted", static_cast<std::int64_t>(document.content.size()));
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace tutorplane::tools
