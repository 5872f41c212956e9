#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace crucible::config {

struct ExecutionConfig {
  std::string default_strategy = "per_execution";
  std::string workspace_root = "~/.crucible/workspaces";
  std::uint64_t default_timeout_ms = 30'000;
  std::optional<double> default_cpu_limit;
  std::optional<std::string> default_memory_limit;
  bool remove_workspaces_on_cleanup = true;
};

struct PoolConfig {
  std::uint32_t min_size = 0;
  std::uint32_t max_size = 5;
  std::uint64_t idle_timeout_ms = 300'000;
  std::uint64_t acquire_timeout_ms = 60'000;
  std::uint64_t maintenance_interval_ms = 10'000;
};

struct ProvisioningConfig {
  std::uint32_t retries = 2;
  std::uint64_t backoff_ms = 250;
};

struct DockerConfig {
  std::string binary = "docker";
  std::string container_prefix = "crucible-";
  std::string workdir = "/workspace";
  std::string network_mode = "bridge";
  std::vector<std::string> cap_drop;
  bool no_new_privileges = true;
  std::optional<std::uint32_t> pids_limit;
  std::uint64_t command_timeout_ms = 120'000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

/// `[languages.<id>]` table. Commands are argv arrays; `run_app_command` may use
/// the `{entry}` placeholder.
struct LanguageEntry {
  std::string id;
  std::string image;
  std::string code_filename;
  std::vector<std::string> inline_command;
  std::vector<std::string> run_app_command;
  std::vector<std::string> install_command;
};

struct Config {
  ExecutionConfig execution;
  PoolConfig pool;
  ProvisioningConfig provisioning;
  DockerConfig docker;
  ObservabilityConfig observability;
  std::vector<LanguageEntry> languages;
};

} // namespace crucible::config
