#pragma once

#include "crucible/execution/engine.hpp"
#include "crucible/tools/tool.hpp"
#include "crucible/workspace/file_tools.hpp"

#include <memory>
#include <unordered_map>
#include <vector>

namespace crucible::tools {

class ToolRegistry {
public:
  ToolRegistry() = default;

  void register_tool(std::unique_ptr<ITool> tool);
  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;
  [[nodiscard]] std::vector<ITool *> all_tools() const;

  /// File tools over `files`.
  [[nodiscard]] static ToolRegistry create_default(std::shared_ptr<workspace::FileTools> files);
  /// File tools plus `execute_code` backed by `engine`.
  [[nodiscard]] static ToolRegistry create_full(std::shared_ptr<workspace::FileTools> files,
                                                std::shared_ptr<execution::ExecutionEngine> engine);

private:
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, ITool *> by_name_;
};

} // namespace crucible::tools
