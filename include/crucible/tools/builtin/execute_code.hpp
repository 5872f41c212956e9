#pragma once

#include "crucible/execution/engine.hpp"
#include "crucible/tools/tool.hpp"

#include <memory>

namespace crucible::tools {

/// Runs inline code or an app entry file through the execution engine. The
/// session comes from the `session_id` argument, falling back to the context.
class ExecuteCodeTool final : public ITool {
public:
  explicit ExecuteCodeTool(std::shared_ptr<execution::ExecutionEngine> engine);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] bool is_safe() const override { return false; }
  [[nodiscard]] std::string_view group() const override { return "runtime"; }

private:
  std::shared_ptr<execution::ExecutionEngine> engine_;
};

/// JSON rendering of an execution result.
[[nodiscard]] std::string execution_result_json(const execution::ExecutionResult &result);

} // namespace crucible::tools
