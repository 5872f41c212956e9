#pragma once

#include "crucible/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

namespace crucible::tools {

using ToolArgs = std::unordered_map<std::string, std::string>;

struct ToolResult {
  std::string output;
  bool success = true;
  std::unordered_map<std::string, std::string> metadata;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
  bool safe = false;
  std::string group;
};

struct ToolContext {
  /// Overrides the sandbox root of file tools when set.
  std::filesystem::path workspace_path;
  std::string session_id;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  [[nodiscard]] virtual bool is_safe() const = 0;
  [[nodiscard]] virtual std::string_view group() const = 0;

  [[nodiscard]] ToolSpec spec() const;
};

[[nodiscard]] common::Result<std::string> required_arg(const ToolArgs &args,
                                                       const std::string &name);
[[nodiscard]] std::string optional_arg(const ToolArgs &args, const std::string &name,
                                       const std::string &fallback = "");

/// `{"error":...,"kind":...}` with success=false.
[[nodiscard]] ToolResult error_result(const common::Status &status);

} // namespace crucible::tools
