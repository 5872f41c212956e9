#pragma once

#include "crucible/tools/tool.hpp"
#include "crucible/workspace/file_tools.hpp"

#include <memory>

namespace crucible::tools {

/// Shared base: resolves the FileTools instance for a call, scoped to
/// `ToolContext::workspace_path` when one is given.
class FileToolBase : public ITool {
public:
  explicit FileToolBase(std::shared_ptr<workspace::FileTools> files);

  [[nodiscard]] std::string_view group() const override { return "fs"; }

protected:
  [[nodiscard]] common::Result<workspace::FileTools> scoped(const ToolContext &ctx) const;

  std::shared_ptr<workspace::FileTools> files_;
};

class WriteFileTool final : public FileToolBase {
public:
  using FileToolBase::FileToolBase;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
  [[nodiscard]] bool is_safe() const override { return false; }
};

class ReadFileTool final : public FileToolBase {
public:
  using FileToolBase::FileToolBase;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
  [[nodiscard]] bool is_safe() const override { return true; }
};

class ListFilesTool final : public FileToolBase {
public:
  using FileToolBase::FileToolBase;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
  [[nodiscard]] bool is_safe() const override { return true; }
};

/// Takes the structure as JSON in the `structure` argument:
/// `{"files":[{"path","content","description"}],"dirs":[...],"dependencies":[...]}`.
class CreateFileStructureTool final : public FileToolBase {
public:
  using FileToolBase::FileToolBase;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
  [[nodiscard]] bool is_safe() const override { return false; }
};

} // namespace crucible::tools
