#include "crucible/tools/builtin/execute_code.hpp"

#include "crucible/common/fs.hpp"
#include "crucible/common/json_util.hpp"

#include <charconv>
#include <cstdint>
#include <optional>

namespace crucible::tools {

namespace {

std::string json_quoted(const std::string &value) {
  return "\"" + common::json_escape(value) + "\"";
}

common::Result<std::optional<std::int64_t>> parse_timeout(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return common::Result<std::optional<std::int64_t>>::success(std::nullopt);
  }
  std::int64_t parsed = 0;
  const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || end != value.data() + value.size() || parsed <= 0) {
    return common::Result<std::optional<std::int64_t>>::failure(
        common::ErrorKind::Configuration, "invalid timeout_ms: " + raw);
  }
  return common::Result<std::optional<std::int64_t>>::success(parsed);
}

} // namespace

ExecuteCodeTool::ExecuteCodeTool(std::shared_ptr<execution::ExecutionEngine> engine)
    : engine_(std::move(engine)) {}

std::string_view ExecuteCodeTool::name() const { return "execute_code"; }

std::string_view ExecuteCodeTool::description() const {
  return "Run code in an isolated container and report output and generated files";
}

std::string ExecuteCodeTool::parameters_schema() const {
  return R"({"type":"object","required":["language"],"properties":{"language":{"type":"string"},"code":{"type":"string"},"cwd":{"type":"string"},"entry_file":{"type":"string"},"dependencies":{"type":"array","items":{"type":"string"}},"timeout_ms":{"type":"integer"},"session_id":{"type":"string"}}})";
}

common::Result<ToolResult> ExecuteCodeTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  if (!engine_) {
    return common::Result<ToolResult>::failure(common::ErrorKind::Configuration,
                                               "execution engine unavailable");
  }
  auto language = required_arg(args, "language");
  if (!language.ok()) {
    return common::Result<ToolResult>::failure(language.status());
  }

  execution::ExecutionRequest request;
  request.language = language.value();

  const std::string entry_file = optional_arg(args, "entry_file");
  if (!entry_file.empty()) {
    request.source = execution::RunApp{.cwd = optional_arg(args, "cwd", "."),
                                       .entry_file = entry_file};
  } else {
    auto code = required_arg(args, "code");
    if (!code.ok()) {
      return common::Result<ToolResult>::failure(code.status());
    }
    request.source = execution::InlineCode{.code = code.value()};
  }

  const std::string dependencies = optional_arg(args, "dependencies");
  if (!dependencies.empty()) {
    request.dependencies =
        common::json_get_string_array("{\"d\":" + dependencies + "}", "d");
  }

  auto timeout = parse_timeout(optional_arg(args, "timeout_ms"));
  if (!timeout.ok()) {
    return common::Result<ToolResult>::failure(timeout.status());
  }
  if (timeout.value().has_value()) {
    request.timeout = std::chrono::milliseconds(*timeout.value());
  }

  const std::string session_id = optional_arg(args, "session_id", ctx.session_id);
  if (session_id.empty()) {
    return common::Result<ToolResult>::failure(common::ErrorKind::Configuration,
                                               "Missing argument: session_id");
  }

  auto executed = engine_->execute_code(session_id, request);
  if (!executed.ok()) {
    return common::Result<ToolResult>::success(error_result(executed.status()));
  }

  ToolResult result;
  result.output = execution_result_json(executed.value());
  result.success = executed.value().status == execution::ExecutionStatus::Completed;
  result.metadata["exit_code"] = std::to_string(executed.value().exit_code);
  result.metadata["status"] = execution::execution_status_to_string(executed.value().status);
  return common::Result<ToolResult>::success(std::move(result));
}

std::string execution_result_json(const execution::ExecutionResult &result) {
  return "{\"status\":" + json_quoted(execution::execution_status_to_string(result.status)) +
         ",\"exit_code\":" + std::to_string(result.exit_code) +
         ",\"stdout\":" + json_quoted(result.stdout_text) +
         ",\"stderr\":" + json_quoted(result.stderr_text) +
         ",\"dependency_stdout\":" + json_quoted(result.dependency_stdout) +
         ",\"dependency_stderr\":" + json_quoted(result.dependency_stderr) +
         ",\"execution_time_ms\":" + std::to_string(result.execution_time.count()) +
         ",\"workspace_dir\":" + json_quoted(result.workspace_dir.string()) +
         ",\"container_id\":" + json_quoted(result.container_id) +
         ",\"generated_files\":" + common::json_string_array(result.generated_files) +
         ",\"session_generated_files\":" +
         common::json_string_array(result.session_generated_files) + "}";
}

} // namespace crucible::tools
