#include "crucible/config/config.hpp"

#include "crucible/common/fs.hpp"
#include "crucible/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace crucible::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".crucible";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CRUCIBLE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

bool is_known_strategy(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  return normalized == "per_execution" || normalized == "pool" || normalized == "per_session";
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += common::quote_toml_string(values[i]);
  }
  out += "]";
  return out;
}

const char *bool_to_toml(const bool value) { return value ? "true" : "false"; }

void load_languages(Config &config, const common::TomlDocument &doc) {
  for (const auto &id : doc.table_names("languages")) {
    const std::string base = "languages." + id + ".";
    LanguageEntry entry;
    entry.id = id;
    entry.image = doc.get_string(base + "image");
    entry.code_filename = doc.get_string(base + "code_filename");
    entry.inline_command = doc.get_string_array(base + "inline_command");
    entry.run_app_command = doc.get_string_array(base + "run_app_command");
    entry.install_command = doc.get_string_array(base + "install_command");
    config.languages.push_back(std::move(entry));
  }
}

void load_document(Config &config, const common::TomlDocument &doc) {
  auto &execution = config.execution;
  execution.default_strategy =
      common::to_lower(doc.get_string("execution.default_strategy", execution.default_strategy));
  execution.workspace_root = doc.get_string("execution.workspace_root", execution.workspace_root);
  execution.default_timeout_ms =
      doc.get_u64("execution.default_timeout_ms", execution.default_timeout_ms);
  if (doc.has("execution.default_cpu_limit")) {
    execution.default_cpu_limit = doc.get_double("execution.default_cpu_limit", 0.0);
  }
  if (doc.has("execution.default_memory_limit")) {
    execution.default_memory_limit = doc.get_string("execution.default_memory_limit");
  }
  execution.remove_workspaces_on_cleanup = doc.get_bool(
      "execution.remove_workspaces_on_cleanup", execution.remove_workspaces_on_cleanup);

  auto &pool = config.pool;
  pool.min_size = static_cast<std::uint32_t>(doc.get_u64("pool.min_size", pool.min_size));
  pool.max_size = static_cast<std::uint32_t>(doc.get_u64("pool.max_size", pool.max_size));
  pool.idle_timeout_ms = doc.get_u64("pool.idle_timeout_ms", pool.idle_timeout_ms);
  pool.acquire_timeout_ms = doc.get_u64("pool.acquire_timeout_ms", pool.acquire_timeout_ms);
  pool.maintenance_interval_ms =
      doc.get_u64("pool.maintenance_interval_ms", pool.maintenance_interval_ms);

  config.provisioning.retries = static_cast<std::uint32_t>(
      doc.get_u64("provisioning.retries", config.provisioning.retries));
  config.provisioning.backoff_ms =
      doc.get_u64("provisioning.backoff_ms", config.provisioning.backoff_ms);

  auto &docker = config.docker;
  docker.binary = doc.get_string("docker.binary", docker.binary);
  docker.container_prefix = doc.get_string("docker.container_prefix", docker.container_prefix);
  docker.workdir = doc.get_string("docker.workdir", docker.workdir);
  docker.network_mode = doc.get_string("docker.network_mode", docker.network_mode);
  docker.cap_drop = doc.get_string_array("docker.cap_drop", docker.cap_drop);
  docker.no_new_privileges = doc.get_bool("docker.no_new_privileges", docker.no_new_privileges);
  if (doc.has("docker.pids_limit")) {
    docker.pids_limit = static_cast<std::uint32_t>(doc.get_u64("docker.pids_limit", 0));
  }
  docker.command_timeout_ms = doc.get_u64("docker.command_timeout_ms", docker.command_timeout_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  load_languages(config, doc);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  Config config;
  load_document(config, parsed.value());
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.status());
  }

  const auto &path = path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorKind::Configuration,
                                           "Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return path_result.status();
  }

  const std::filesystem::path path = path_result.value();
  if (!path.parent_path().empty()) {
    if (auto ensured = common::ensure_dir(path.parent_path()); !ensured.ok()) {
      return ensured.status();
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorKind::Io, "Unable to write temporary config file");
  }

  const auto &execution = config.execution;
  file << "[execution]\n";
  file << "default_strategy = " << common::quote_toml_string(execution.default_strategy) << "\n";
  file << "workspace_root = " << common::quote_toml_string(execution.workspace_root) << "\n";
  file << "default_timeout_ms = " << execution.default_timeout_ms << "\n";
  if (execution.default_cpu_limit.has_value()) {
    file << "default_cpu_limit = " << *execution.default_cpu_limit << "\n";
  }
  if (execution.default_memory_limit.has_value()) {
    file << "default_memory_limit = " << common::quote_toml_string(*execution.default_memory_limit)
         << "\n";
  }
  file << "remove_workspaces_on_cleanup = " << bool_to_toml(execution.remove_workspaces_on_cleanup)
       << "\n";

  file << "\n[pool]\n";
  file << "min_size = " << config.pool.min_size << "\n";
  file << "max_size = " << config.pool.max_size << "\n";
  file << "idle_timeout_ms = " << config.pool.idle_timeout_ms << "\n";
  file << "acquire_timeout_ms = " << config.pool.acquire_timeout_ms << "\n";
  file << "maintenance_interval_ms = " << config.pool.maintenance_interval_ms << "\n";

  file << "\n[provisioning]\n";
  file << "retries = " << config.provisioning.retries << "\n";
  file << "backoff_ms = " << config.provisioning.backoff_ms << "\n";

  const auto &docker = config.docker;
  file << "\n[docker]\n";
  file << "binary = " << common::quote_toml_string(docker.binary) << "\n";
  file << "container_prefix = " << common::quote_toml_string(docker.container_prefix) << "\n";
  file << "workdir = " << common::quote_toml_string(docker.workdir) << "\n";
  file << "network_mode = " << common::quote_toml_string(docker.network_mode) << "\n";
  file << "cap_drop = " << string_array_to_toml(docker.cap_drop) << "\n";
  file << "no_new_privileges = " << bool_to_toml(docker.no_new_privileges) << "\n";
  if (docker.pids_limit.has_value()) {
    file << "pids_limit = " << *docker.pids_limit << "\n";
  }
  file << "command_timeout_ms = " << docker.command_timeout_ms << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  for (const auto &language : config.languages) {
    file << "\n[languages." << language.id << "]\n";
    file << "image = " << common::quote_toml_string(language.image) << "\n";
    file << "code_filename = " << common::quote_toml_string(language.code_filename) << "\n";
    file << "inline_command = " << string_array_to_toml(language.inline_command) << "\n";
    file << "run_app_command = " << string_array_to_toml(language.run_app_command) << "\n";
    if (!language.install_command.empty()) {
      file << "install_command = " << string_array_to_toml(language.install_command) << "\n";
    }
  }

  file.close();
  if (!file) {
    return common::Status::error(common::ErrorKind::Io, "Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::Io,
                                 "Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (!is_known_strategy(config.execution.default_strategy)) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "Invalid execution.default_strategy: " +
                                         config.execution.default_strategy);
  }
  if (config.execution.default_timeout_ms == 0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "execution.default_timeout_ms must be > 0");
  }
  if (common::trim(config.execution.workspace_root).empty()) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "execution.workspace_root must not be empty");
  }
  if (config.execution.default_cpu_limit.has_value() && *config.execution.default_cpu_limit <= 0.0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "execution.default_cpu_limit must be > 0");
  }

  if (config.pool.max_size == 0) {
    return ValidationResult::failure(common::ErrorKind::Configuration, "pool.max_size must be > 0");
  }
  if (config.pool.min_size > config.pool.max_size) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "pool.min_size must not exceed pool.max_size");
  }
  if (config.pool.idle_timeout_ms == 0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "pool.idle_timeout_ms must be > 0");
  }
  if (config.pool.maintenance_interval_ms == 0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "pool.maintenance_interval_ms must be > 0");
  }
  if (config.pool.maintenance_interval_ms > config.pool.idle_timeout_ms) {
    warnings.push_back("pool.maintenance_interval_ms exceeds pool.idle_timeout_ms; "
                       "idle containers will outlive their timeout");
  }

  if (common::trim(config.docker.binary).empty()) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "docker.binary must not be empty");
  }
  if (config.docker.workdir.empty() || config.docker.workdir.front() != '/') {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "docker.workdir must be an absolute container path");
  }
  if (config.docker.network_mode == "none") {
    warnings.push_back("docker.network_mode is none; dependency installation will fail");
  }

  for (const auto &language : config.languages) {
    if (language.image.empty() || language.code_filename.empty() ||
        language.inline_command.empty() || language.run_app_command.empty()) {
      return ValidationResult::failure(
          common::ErrorKind::Configuration,
          "languages." + language.id +
              " requires image, code_filename, inline_command and run_app_command");
    }
  }

  return ValidationResult::success(std::move(warnings));
}

void apply_env_overrides(Config &config) {
  if (const char *value = std::getenv("CRUCIBLE_WORKSPACE_ROOT"); value != nullptr && *value != '\0') {
    config.execution.workspace_root = value;
  }
  if (const char *value = std::getenv("CRUCIBLE_DOCKER_BINARY"); value != nullptr && *value != '\0') {
    config.docker.binary = value;
  }
  if (const char *value = std::getenv("CRUCIBLE_DEFAULT_STRATEGY");
      value != nullptr && *value != '\0') {
    config.execution.default_strategy = common::to_lower(value);
  }
  if (const char *value = std::getenv("CRUCIBLE_OBSERVABILITY"); value != nullptr && *value != '\0') {
    config.observability.backend = value;
  }
}

std::filesystem::path workspace_root(const Config &config) {
  return std::filesystem::path(common::expand_path(config.execution.workspace_root));
}

} // namespace crucible::config
