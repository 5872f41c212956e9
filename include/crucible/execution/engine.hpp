#pragma once

#include "crucible/common/cancellation.hpp"
#include "crucible/common/result.hpp"
#include "crucible/config/schema.hpp"
#include "crucible/container/pool.hpp"
#include "crucible/container/provisioner.hpp"
#include "crucible/execution/request.hpp"
#include "crucible/execution/session.hpp"
#include "crucible/execution/session_manager.hpp"
#include "crucible/languages/registry.hpp"
#include "crucible/runtime/container_runtime.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace crucible::execution {

/// Runs requests end to end: language lookup, container acquisition per session
/// strategy, dependency install, main run, workspace diff and release.
class ExecutionEngine {
public:
  ExecutionEngine(config::Config config, std::shared_ptr<runtime::IContainerRuntime> runtime,
                  std::shared_ptr<languages::LanguageRegistry> languages);
  ~ExecutionEngine();

  ExecutionEngine(const ExecutionEngine &) = delete;
  ExecutionEngine &operator=(const ExecutionEngine &) = delete;

  /// Docker-backed engine with the built-in languages plus those declared in
  /// `config`. Starts pool maintenance.
  [[nodiscard]] static common::Result<std::unique_ptr<ExecutionEngine>>
  create(config::Config config);

  /// Returns the existing active session with the same id unless
  /// `enforce_new_session` is set. PerSession sessions with an explicit image get
  /// their container here.
  [[nodiscard]] common::Result<SessionInfo> create_session(SessionConfig config);
  [[nodiscard]] common::Result<SessionInfo> get_session_info(const std::string &session_id) const;
  [[nodiscard]] std::vector<SessionInfo> list_sessions() const;

  /// Unknown session ids get a session with the default strategy. Dependency
  /// failures, timeouts and cancellation come back as results with a matching
  /// status; configuration, path and provisioning problems fail.
  [[nodiscard]] common::Result<ExecutionResult>
  execute_code(const std::string &session_id, const ExecutionRequest &request,
               const common::CancellationToken &cancel = {});

  /// Destroys the bound container and marks the session inactive. Idempotent.
  [[nodiscard]] common::Status cleanup_session(const std::string &session_id);

  void shutdown();

  [[nodiscard]] languages::LanguageRegistry &languages() { return *languages_; }
  [[nodiscard]] container::ContainerPool &pool() { return *pool_; }
  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const std::filesystem::path &workspace_root() const { return workspace_root_; }

private:
  struct Acquired {
    std::shared_ptr<container::ContainerHandle> handle;
  };

  [[nodiscard]] common::Result<Acquired>
  acquire(Session &session, const container::ContainerConfig &container_config,
          const ExecutionRequest &request, const runtime::ResourceLimits &limits,
          const common::CancellationToken &cancel);
  void release(Session &session, const Acquired &acquired, bool healthy);
  [[nodiscard]] common::Result<std::shared_ptr<container::ContainerHandle>>
  provision_session_container(Session &session,
                              const container::ContainerConfig &container_config,
                              const runtime::ResourceLimits &limits);
  void teardown_session(Session &session);

  [[nodiscard]] runtime::ResourceLimits limits_for(const ExecutionRequest &request) const;
  [[nodiscard]] std::filesystem::path session_workspace(const Session &session) const;

  config::Config config_;
  std::filesystem::path workspace_root_;
  std::shared_ptr<runtime::IContainerRuntime> runtime_;
  std::shared_ptr<languages::LanguageRegistry> languages_;
  std::shared_ptr<container::ContainerProvisioner> provisioner_;
  std::unique_ptr<container::ContainerPool> pool_;
  SessionManager sessions_;
};

} // namespace crucible::execution
