#pragma once

#include "crucible/common/result.hpp"
#include "crucible/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace crucible::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Status save_config(const Config &config);

/// Returns warnings on success; hard problems fail with ErrorKind::Configuration.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] std::filesystem::path workspace_root(const Config &config);

} // namespace crucible::config
