#include "crucible/tools/tool_registry.hpp"

#include "crucible/common/fs.hpp"
#include "crucible/tools/builtin/execute_code.hpp"
#include "crucible/tools/builtin/file_tools.hpp"

namespace crucible::tools {

void ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
  ITool *raw = tool.get();
  by_name_[common::to_lower(std::string(raw->name()))] = raw;
  tools_.push_back(std::move(tool));
}

ITool *ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

std::vector<ITool *> ToolRegistry::all_tools() const {
  std::vector<ITool *> out;
  out.reserve(tools_.size());
  for (const auto &tool : tools_) {
    out.push_back(tool.get());
  }
  return out;
}

ToolRegistry ToolRegistry::create_default(std::shared_ptr<workspace::FileTools> files) {
  ToolRegistry registry;
  registry.register_tool(std::make_unique<WriteFileTool>(files));
  registry.register_tool(std::make_unique<ReadFileTool>(files));
  registry.register_tool(std::make_unique<ListFilesTool>(files));
  registry.register_tool(std::make_unique<CreateFileStructureTool>(files));
  return registry;
}

ToolRegistry ToolRegistry::create_full(std::shared_ptr<workspace::FileTools> files,
                                       std::shared_ptr<execution::ExecutionEngine> engine) {
  ToolRegistry registry = create_default(std::move(files));
  registry.register_tool(std::make_unique<ExecuteCodeTool>(std::move(engine)));
  return registry;
}

} // namespace crucible::tools
