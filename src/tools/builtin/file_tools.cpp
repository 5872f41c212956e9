#include "crucible/tools/builtin/file_tools.hpp"

#include "crucible/common/digest.hpp"
#include "crucible/common/fs.hpp"
#include "crucible/common/json_util.hpp"

namespace crucible::tools {

namespace {

std::string json_quoted(const std::string &value) {
  return "\"" + common::json_escape(value) + "\"";
}

common::Result<workspace::FileStructure> parse_structure(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '{') {
    return common::Result<workspace::FileStructure>::failure(
        common::ErrorKind::Configuration, "structure must be a JSON object");
  }

  workspace::FileStructure structure;
  const std::string files_json = common::json_get_array(trimmed, "files");
  if (!files_json.empty()) {
    for (const auto &object : common::json_split_top_level_objects(files_json)) {
      workspace::FileSpec spec;
      spec.path = common::json_get_string(object, "path");
      spec.content = common::json_get_string(object, "content");
      if (spec.path.empty()) {
        return common::Result<workspace::FileStructure>::failure(
            common::ErrorKind::Configuration, "file entry without a path");
      }
      const std::string description = common::json_get_string(object, "description");
      if (!description.empty()) {
        spec.description = description;
      }
      structure.files.push_back(std::move(spec));
    }
  }
  structure.dirs = common::json_get_string_array(trimmed, "dirs");
  structure.dependencies = common::json_get_string_array(trimmed, "dependencies");
  return common::Result<workspace::FileStructure>::success(std::move(structure));
}

std::string structure_result_json(const workspace::FileStructureResult &result) {
  std::string files = "[";
  for (std::size_t i = 0; i < result.files.size(); ++i) {
    if (i > 0) {
      files += ",";
    }
    files += "{\"path\":" + json_quoted(result.files[i].path);
    if (result.files[i].description.has_value()) {
      files += ",\"description\":" + json_quoted(*result.files[i].description);
    }
    files += "}";
  }
  files += "]";

  return "{\"files\":" + files + ",\"dirs\":" + common::json_string_array(result.dirs) +
         ",\"summary\":" + json_quoted(result.summary) +
         ",\"dependencies\":" + common::json_string_array(result.dependencies) + "}";
}

} // namespace

FileToolBase::FileToolBase(std::shared_ptr<workspace::FileTools> files)
    : files_(std::move(files)) {}

common::Result<workspace::FileTools> FileToolBase::scoped(const ToolContext &ctx) const {
  if (!ctx.workspace_path.empty()) {
    const workspace::PathMappings mappings =
        files_ ? files_->mappings() : workspace::PathMappings{};
    return common::Result<workspace::FileTools>::success(
        workspace::FileTools(ctx.workspace_path, mappings));
  }
  if (!files_) {
    return common::Result<workspace::FileTools>::failure(common::ErrorKind::Configuration,
                                                         "file tools have no sandbox root");
  }
  return common::Result<workspace::FileTools>::success(*files_);
}

std::string_view WriteFileTool::name() const { return "write_file"; }

std::string_view WriteFileTool::description() const {
  return "Write a file inside the sandbox, replacing it atomically";
}

std::string WriteFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path","content"],"properties":{"path":{"type":"string"},"content":{"type":"string"},"encoding":{"type":"string","enum":["utf8","base64"]}}})";
}

common::Result<ToolResult> WriteFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  auto path_arg = required_arg(args, "path");
  if (!path_arg.ok()) {
    return common::Result<ToolResult>::failure(path_arg.status());
  }
  auto content_arg = required_arg(args, "content");
  if (!content_arg.ok()) {
    return common::Result<ToolResult>::failure(content_arg.status());
  }

  std::string content = content_arg.value();
  const std::string encoding = common::to_lower(optional_arg(args, "encoding", "utf8"));
  if (encoding == "base64") {
    auto decoded = common::base64_decode(content);
    if (!decoded.ok()) {
      return common::Result<ToolResult>::success(error_result(decoded.status()));
    }
    content = std::move(decoded.value());
  } else if (encoding != "utf8") {
    return common::Result<ToolResult>::failure(common::ErrorKind::Configuration,
                                               "unsupported encoding: " + encoding);
  }

  auto files = scoped(ctx);
  if (!files.ok()) {
    return common::Result<ToolResult>::failure(files.status());
  }
  auto written = files.value().write_file(path_arg.value(), content);
  if (!written.ok()) {
    return common::Result<ToolResult>::success(error_result(written.status()));
  }

  ToolResult result;
  result.output = "{\"path\":" + json_quoted(written.value()) +
                  ",\"bytes\":" + std::to_string(content.size()) + "}";
  return common::Result<ToolResult>::success(std::move(result));
}

std::string_view ReadFileTool::name() const { return "read_file"; }

std::string_view ReadFileTool::description() const {
  return "Read a file inside the sandbox as base64";
}

std::string ReadFileTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"}}})";
}

common::Result<ToolResult> ReadFileTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  auto path_arg = required_arg(args, "path");
  if (!path_arg.ok()) {
    return common::Result<ToolResult>::failure(path_arg.status());
  }
  auto files = scoped(ctx);
  if (!files.ok()) {
    return common::Result<ToolResult>::failure(files.status());
  }
  auto content = files.value().read_file(path_arg.value());
  if (!content.ok()) {
    return common::Result<ToolResult>::success(error_result(content.status()));
  }

  ToolResult result;
  result.output = "{\"path\":" + json_quoted(path_arg.value()) +
                  ",\"content_base64\":" + json_quoted(content.value()) + "}";
  return common::Result<ToolResult>::success(std::move(result));
}

std::string_view ListFilesTool::name() const { return "list_files"; }

std::string_view ListFilesTool::description() const {
  return "List files under a sandbox directory recursively";
}

std::string ListFilesTool::parameters_schema() const {
  return R"({"type":"object","properties":{"path":{"type":"string"}}})";
}

common::Result<ToolResult> ListFilesTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  auto files = scoped(ctx);
  if (!files.ok()) {
    return common::Result<ToolResult>::failure(files.status());
  }
  auto listing = files.value().list_files(optional_arg(args, "path", "."));
  if (!listing.ok()) {
    return common::Result<ToolResult>::success(error_result(listing.status()));
  }

  ToolResult result;
  result.output = "{\"files\":" + common::json_string_array(listing.value()) + "}";
  result.metadata["count"] = std::to_string(listing.value().size());
  return common::Result<ToolResult>::success(std::move(result));
}

std::string_view CreateFileStructureTool::name() const { return "create_file_structure"; }

std::string_view CreateFileStructureTool::description() const {
  return "Create a set of files and directories inside the sandbox";
}

std::string CreateFileStructureTool::parameters_schema() const {
  return R"({"type":"object","required":["structure"],"properties":{"structure":{"type":"object","properties":{"files":{"type":"array"},"dirs":{"type":"array"},"dependencies":{"type":"array"}}}}})";
}

common::Result<ToolResult> CreateFileStructureTool::execute(const ToolArgs &args,
                                                            const ToolContext &ctx) {
  auto structure_arg = required_arg(args, "structure");
  if (!structure_arg.ok()) {
    return common::Result<ToolResult>::failure(structure_arg.status());
  }
  auto structure = parse_structure(structure_arg.value());
  if (!structure.ok()) {
    return common::Result<ToolResult>::failure(structure.status());
  }
  auto files = scoped(ctx);
  if (!files.ok()) {
    return common::Result<ToolResult>::failure(files.status());
  }
  auto created = files.value().create_file_structure(structure.value());
  if (!created.ok()) {
    return common::Result<ToolResult>::success(error_result(created.status()));
  }

  ToolResult result;
  result.output = structure_result_json(created.value());
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace crucible::tools
