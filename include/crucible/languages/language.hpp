#pragma once

#include "crucible/common/result.hpp"
#include "crucible/execution/request.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crucible::languages {

/// Capability descriptor of one language: where its code goes and which argv runs
/// it inside a container whose working directory is the workspace.
class ILanguage {
public:
  virtual ~ILanguage() = default;

  [[nodiscard]] virtual std::string_view id() const = 0;
  [[nodiscard]] virtual std::string_view default_image() const = 0;
  [[nodiscard]] virtual std::string_view code_filename() const = 0;

  /// Materializes the request into `workspace_dir`: inline code is written to
  /// `code_filename()`, a RunApp tree is copied in after its entry is validated.
  [[nodiscard]] virtual common::Status
  prepare_files(const execution::ExecutionRequest &request,
                const std::filesystem::path &workspace_dir) const = 0;

  [[nodiscard]] virtual std::vector<std::string> build_inline_command() const = 0;
  [[nodiscard]] virtual std::vector<std::string>
  build_run_app_command(const std::string &entry_path) const = 0;

  /// Installer argv for `dependencies`, or nullopt when the language has none.
  [[nodiscard]] virtual std::optional<std::vector<std::string>>
  build_install_command(const std::vector<std::string> &dependencies) const = 0;
};

struct LanguageSpec {
  std::string id;
  std::string image;
  std::string code_filename;
  std::vector<std::string> inline_command;
  /// `{entry}` in any argument is replaced by the entry path.
  std::vector<std::string> run_app_command;
  /// Dependencies are appended to this prefix. Empty means no installer.
  std::vector<std::string> install_command;
};

class CommandLanguage final : public ILanguage {
public:
  explicit CommandLanguage(LanguageSpec spec);

  [[nodiscard]] std::string_view id() const override { return spec_.id; }
  [[nodiscard]] std::string_view default_image() const override { return spec_.image; }
  [[nodiscard]] std::string_view code_filename() const override { return spec_.code_filename; }

  [[nodiscard]] common::Status prepare_files(const execution::ExecutionRequest &request,
                                             const std::filesystem::path &workspace_dir) const override;
  [[nodiscard]] std::vector<std::string> build_inline_command() const override;
  [[nodiscard]] std::vector<std::string>
  build_run_app_command(const std::string &entry_path) const override;
  [[nodiscard]] std::optional<std::vector<std::string>>
  build_install_command(const std::vector<std::string> &dependencies) const override;

  [[nodiscard]] const LanguageSpec &spec() const { return spec_; }

private:
  LanguageSpec spec_;
};

/// Validates the entry of `app` and returns it relative to `app.cwd`.
[[nodiscard]] common::Result<std::string> resolve_run_app_entry(const execution::RunApp &app);

[[nodiscard]] common::Status validate_language_spec(const LanguageSpec &spec);

[[nodiscard]] std::vector<LanguageSpec> builtin_language_specs();

} // namespace crucible::languages
