#include "crucible/tools/tool.hpp"

#include "crucible/common/json_util.hpp"

namespace crucible::tools {

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters_json = parameters_schema(),
                  .safe = is_safe(),
                  .group = std::string(group())};
}

common::Result<std::string> required_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end()) {
    return common::Result<std::string>::failure(common::ErrorKind::Configuration,
                                                "Missing argument: " + name);
  }
  return common::Result<std::string>::success(it->second);
}

std::string optional_arg(const ToolArgs &args, const std::string &name,
                         const std::string &fallback) {
  const auto it = args.find(name);
  return it == args.end() ? fallback : it->second;
}

ToolResult error_result(const common::Status &status) {
  ToolResult result;
  result.success = false;
  result.output = "{\"error\":\"" + common::json_escape(status.error()) + "\",\"kind\":\"" +
                  std::string(common::error_kind_to_string(status.kind())) + "\"}";
  result.metadata["error_kind"] = std::string(common::error_kind_to_string(status.kind()));
  return result;
}

} // namespace crucible::tools
