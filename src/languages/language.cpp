#include "crucible/languages/language.hpp"

#include "crucible/common/fs.hpp"
#include "crucible/workspace/path_resolver.hpp"

namespace crucible::languages {

namespace {

constexpr std::string_view ENTRY_PLACEHOLDER = "{entry}";

std::string substitute_entry(std::string arg, const std::string &entry) {
  std::size_t pos = 0;
  while ((pos = arg.find(ENTRY_PLACEHOLDER, pos)) != std::string::npos) {
    arg.replace(pos, ENTRY_PLACEHOLDER.size(), entry);
    pos += entry.size();
  }
  return arg;
}

common::Status copy_app_tree(const std::filesystem::path &cwd,
                             const std::filesystem::path &workspace_dir) {
  std::error_code ec;
  const auto source = std::filesystem::weakly_canonical(cwd, ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::Io, "failed to resolve app directory: " +
                                                            ec.message());
  }
  const auto target = std::filesystem::weakly_canonical(workspace_dir, ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::Io, "failed to resolve workspace: " +
                                                            ec.message());
  }
  if (source == target) {
    return common::Status::success();
  }
  if (common::is_subpath(target, source)) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "workspace lies inside the app directory " + source.string());
  }

  auto copied = common::copy_tree_no_follow(source, target);
  if (!copied.ok()) {
    return common::Status::error(copied.kind(),
                                 "failed to copy app into workspace: " + copied.error());
  }
  return common::Status::success();
}

} // namespace

CommandLanguage::CommandLanguage(LanguageSpec spec) : spec_(std::move(spec)) {}

common::Status CommandLanguage::prepare_files(const execution::ExecutionRequest &request,
                                              const std::filesystem::path &workspace_dir) const {
  auto ensured = common::ensure_dir(workspace_dir);
  if (!ensured.ok()) {
    return ensured.status();
  }

  if (const auto *app = std::get_if<execution::RunApp>(&request.source)) {
    auto entry = resolve_run_app_entry(*app);
    if (!entry.ok()) {
      return entry.status();
    }
    return copy_app_tree(app->cwd, workspace_dir);
  }

  const auto &code = std::get<execution::InlineCode>(request.source);
  auto target = workspace::resolve_within_root(workspace_dir, spec_.code_filename);
  if (!target.ok()) {
    return target.status();
  }
  return common::write_file_atomic(target.value(), code.code);
}

std::vector<std::string> CommandLanguage::build_inline_command() const {
  return spec_.inline_command;
}

std::vector<std::string> CommandLanguage::build_run_app_command(const std::string &entry_path) const {
  std::vector<std::string> command;
  command.reserve(spec_.run_app_command.size());
  for (const auto &arg : spec_.run_app_command) {
    command.push_back(substitute_entry(arg, entry_path));
  }
  return command;
}

std::optional<std::vector<std::string>>
CommandLanguage::build_install_command(const std::vector<std::string> &dependencies) const {
  if (spec_.install_command.empty()) {
    return std::nullopt;
  }
  std::vector<std::string> command = spec_.install_command;
  command.insert(command.end(), dependencies.begin(), dependencies.end());
  return command;
}

common::Result<std::string> resolve_run_app_entry(const execution::RunApp &app) {
  using EntryResult = common::Result<std::string>;
  if (app.cwd.empty()) {
    return EntryResult::failure(common::ErrorKind::Configuration, "run-app cwd is empty");
  }
  if (common::trim(app.entry_file).empty()) {
    return EntryResult::failure(common::ErrorKind::Configuration, "run-app entry file is empty");
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(app.cwd, ec)) {
    return EntryResult::failure(common::ErrorKind::NotFound,
                                "run-app directory not found: " + app.cwd.string());
  }

  auto resolved = workspace::resolve_within_root(app.cwd, app.entry_file);
  if (!resolved.ok()) {
    return EntryResult::failure(resolved.status());
  }
  if (!std::filesystem::is_regular_file(resolved.value(), ec)) {
    return EntryResult::failure(common::ErrorKind::NotFound,
                                "run-app entry not found: " + app.entry_file);
  }
  return EntryResult::success(workspace::relative_to_root(app.cwd, resolved.value()));
}

common::Status validate_language_spec(const LanguageSpec &spec) {
  if (common::trim(spec.id).empty()) {
    return common::Status::error(common::ErrorKind::Configuration, "language id is empty");
  }
  if (common::trim(spec.image).empty()) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "language " + spec.id + " has no image");
  }
  if (common::trim(spec.code_filename).empty() ||
      spec.code_filename.find('/') != std::string::npos) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "language " + spec.id + " needs a plain code filename");
  }
  if (spec.inline_command.empty()) {
    return common::Status::error(common::ErrorKind::Configuration,
                                 "language " + spec.id + " has no inline command");
  }
  return common::Status::success();
}

std::vector<LanguageSpec> builtin_language_specs() {
  return {
      LanguageSpec{.id = "python",
                   .image = "python:3.12-slim",
                   .code_filename = "code.py",
                   .inline_command = {"python", "code.py"},
                   .run_app_command = {"python", "{entry}"},
                   .install_command = {"pip", "install", "--no-cache-dir",
                                       "--disable-pip-version-check"}},
      LanguageSpec{.id = "javascript",
                   .image = "node:20-alpine",
                   .code_filename = "code.js",
                   .inline_command = {"node", "code.js"},
                   .run_app_command = {"node", "{entry}"},
                   .install_command = {"npm", "install", "--no-save", "--no-audit", "--no-fund"}},
      LanguageSpec{.id = "typescript",
                   .image = "node:20-alpine",
                   .code_filename = "code.ts",
                   .inline_command = {"npx", "--yes", "tsx", "code.ts"},
                   .run_app_command = {"npx", "--yes", "tsx", "{entry}"},
                   .install_command = {"npm", "install", "--no-save", "--no-audit", "--no-fund"}},
      LanguageSpec{.id = "shell",
                   .image = "alpine:3.20",
                   .code_filename = "script.sh",
                   .inline_command = {"sh", "script.sh"},
                   .run_app_command = {"sh", "{entry}"},
                   .install_command = {"apk", "add", "--no-cache"}},
  };
}

} // namespace crucible::languages
