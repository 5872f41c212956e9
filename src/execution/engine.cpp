#include "crucible/execution/engine.hpp"

#include "crucible/common/fs.hpp"
#include "crucible/config/config.hpp"
#include "crucible/observability/global.hpp"
#include "crucible/runtime/docker_runtime.hpp"
#include "crucible/workspace/snapshot.hpp"

namespace crucible::execution {

namespace {

std::string sanitize_id(const std::string &id) {
  std::string out;
  out.reserve(id.size());
  for (const char ch : id) {
    const bool keep = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                      (ch >= '0' && ch <= '9') || ch == '.' || ch == '_' || ch == '-';
    out.push_back(keep ? ch : '-');
  }
  if (out.empty() || out == "." || out == "..") {
    out = "session";
  }
  return out;
}

runtime::OutputCallback sink_callback(const std::shared_ptr<IOutputSink> &sink) {
  if (!sink) {
    return {};
  }
  return [sink](std::string_view chunk) { sink->write(chunk); };
}

class ProtocolTrace {
public:
  ProtocolTrace(std::string session_id, const bool verbose)
      : session_id_(std::move(session_id)), verbose_(verbose) {}

  void step(const std::string &name, const std::string &detail = "") const {
    if (verbose_) {
      observability::record_protocol_step(session_id_, name, detail);
    }
  }

private:
  std::string session_id_;
  bool verbose_;
};

common::Status closed_session_error(const std::string &session_id) {
  return common::Status::error(common::ErrorKind::NotFound,
                               "session was cleaned up during the request: " + session_id);
}

ExecutionResult cancelled_result() {
  ExecutionResult result;
  result.status = ExecutionStatus::Cancelled;
  result.exit_code = CANCELLED_EXIT_CODE;
  return result;
}

} // namespace

ExecutionEngine::ExecutionEngine(config::Config config,
                                 std::shared_ptr<runtime::IContainerRuntime> runtime,
                                 std::shared_ptr<languages::LanguageRegistry> languages)
    : config_(std::move(config)), workspace_root_(config::workspace_root(config_)),
      runtime_(std::move(runtime)), languages_(std::move(languages)) {
  if (!languages_) {
    languages_ = languages::LanguageRegistry::with_builtins();
  }
  provisioner_ = std::make_shared<container::ContainerProvisioner>(
      runtime_, config_.provisioning, config_.docker.container_prefix);
  pool_ = std::make_unique<container::ContainerPool>(provisioner_, config_.pool, workspace_root_);
}

ExecutionEngine::~ExecutionEngine() { shutdown(); }

common::Result<std::unique_ptr<ExecutionEngine>> ExecutionEngine::create(config::Config config) {
  using EngineResult = common::Result<std::unique_ptr<ExecutionEngine>>;
  auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return EngineResult::failure(validated.status());
  }
  for (const auto &warning : validated.value()) {
    observability::record_error("config", "warning: " + warning);
  }

  auto registry = languages::LanguageRegistry::with_builtins();
  auto registered = registry->register_config_languages(config.languages);
  if (!registered.ok()) {
    return EngineResult::failure(registered);
  }

  auto docker = std::make_shared<runtime::DockerContainerRuntime>(config.docker);
  auto engine = std::make_unique<ExecutionEngine>(std::move(config), std::move(docker),
                                                  std::move(registry));
  engine->pool().start();
  return EngineResult::success(std::move(engine));
}

runtime::ResourceLimits ExecutionEngine::limits_for(const ExecutionRequest &request) const {
  runtime::ResourceLimits limits;
  limits.cpus = request.cpu_limit.has_value() ? request.cpu_limit
                                              : config_.execution.default_cpu_limit;
  limits.memory = request.memory_limit.has_value() ? request.memory_limit
                                                   : config_.execution.default_memory_limit;
  return limits;
}

std::filesystem::path ExecutionEngine::session_workspace(const Session &session) const {
  return workspace_root_ / ("session-" + sanitize_id(session.id()));
}

common::Result<SessionInfo> ExecutionEngine::create_session(SessionConfig config) {
  using InfoResult = common::Result<SessionInfo>;
  if (config.pool_config.has_value()) {
    const auto &pool = *config.pool_config;
    if (pool.max_size == 0 || pool.min_size > pool.max_size || pool.idle_timeout_ms == 0) {
      return InfoResult::failure(common::ErrorKind::Configuration,
                                 "invalid pool bounds: min_size=" + std::to_string(pool.min_size) +
                                     " max_size=" + std::to_string(pool.max_size));
    }
    pool_->configure(pool);
  }

  if (config.enforce_new_session && config.session_id.has_value()) {
    if (auto previous = sessions_.take(common::trim(*config.session_id)); previous) {
      teardown_session(*previous);
    }
  }

  auto [session, created] = sessions_.get_or_create(std::move(config));
  if (created && session->strategy() == ContainerStrategy::PerSession &&
      !session->config().container.image.empty()) {
    runtime::ResourceLimits limits{.cpus = config_.execution.default_cpu_limit,
                                   .memory = config_.execution.default_memory_limit};
    auto handle = provision_session_container(*session, session->config().container, limits);
    if (!handle.ok()) {
      (void)sessions_.take(session->id());
      (void)session->close();
      return InfoResult::failure(handle.status());
    }
  }
  return InfoResult::success(session->info());
}

common::Result<SessionInfo> ExecutionEngine::get_session_info(const std::string &session_id) const {
  auto session = sessions_.find(session_id);
  if (!session) {
    return common::Result<SessionInfo>::failure(common::ErrorKind::NotFound,
                                                "unknown session: " + session_id);
  }
  return common::Result<SessionInfo>::success(session->info());
}

std::vector<SessionInfo> ExecutionEngine::list_sessions() const {
  std::vector<SessionInfo> out;
  for (const auto &session : sessions_.all()) {
    out.push_back(session->info());
  }
  return out;
}

common::Result<std::shared_ptr<container::ContainerHandle>>
ExecutionEngine::provision_session_container(Session &session,
                                             const container::ContainerConfig &container_config,
                                             const runtime::ResourceLimits &limits) {
  using HandleResult = common::Result<std::shared_ptr<container::ContainerHandle>>;
  const auto dir = session_workspace(session);
  auto handle = provisioner_->provision(container_config, dir, limits);
  if (!handle.ok()) {
    return handle;
  }
  session.add_workspace(dir);

  if (auto existing = session.current_container(); existing) {
    // Lost a race with another request on the same session.
    provisioner_->destroy(handle.value(), container::ContainerState::Released);
    return HandleResult::success(existing);
  }
  if (!session.bind(handle.value())) {
    provisioner_->destroy(handle.value(), container::ContainerState::Destroyed);
    return HandleResult::failure(closed_session_error(session.id()));
  }
  return handle;
}

common::Result<ExecutionEngine::Acquired>
ExecutionEngine::acquire(Session &session, const container::ContainerConfig &container_config,
                         const ExecutionRequest &request, const runtime::ResourceLimits &limits,
                         const common::CancellationToken &cancel) {
  using AcquireResult = common::Result<Acquired>;
  switch (session.strategy()) {
  case ContainerStrategy::PerExecution: {
    const auto dir =
        workspace_root_ / ("exec-" + sanitize_id(session.id()) + "-" + common::random_hex(8));
    auto handle = provisioner_->provision(container_config, dir, limits);
    if (!handle.ok()) {
      return AcquireResult::failure(handle.status());
    }
    session.add_workspace(dir);
    if (!session.bind(handle.value())) {
      provisioner_->destroy(handle.value(), container::ContainerState::Destroyed);
      return AcquireResult::failure(closed_session_error(session.id()));
    }
    return AcquireResult::success(Acquired{.handle = handle.value()});
  }
  case ContainerStrategy::Pool: {
    const bool shared = request.workspace_sharing == WorkspaceSharing::Shared;
    auto handle = pool_->acquire(container_config, shared, limits, &cancel);
    if (!handle.ok()) {
      return AcquireResult::failure(handle.status());
    }
    if (!shared) {
      auto cleared = common::clear_directory(handle.value()->workspace_dir());
      if (!cleared.ok()) {
        pool_->release(handle.value(), false);
        return AcquireResult::failure(cleared);
      }
    }
    if (!session.bind(handle.value())) {
      pool_->release(handle.value(), true);
      return AcquireResult::failure(closed_session_error(session.id()));
    }
    return AcquireResult::success(Acquired{.handle = handle.value()});
  }
  case ContainerStrategy::PerSession: {
    if (auto bound = session.current_container(); bound) {
      return AcquireResult::success(Acquired{.handle = bound});
    }
    auto handle = provision_session_container(session, container_config, limits);
    if (!handle.ok()) {
      return AcquireResult::failure(handle.status());
    }
    return AcquireResult::success(Acquired{.handle = handle.value()});
  }
  }
  return AcquireResult::failure(common::ErrorKind::Configuration, "unknown container strategy");
}

void ExecutionEngine::release(Session &session, const Acquired &acquired, const bool healthy) {
  const auto final_state =
      healthy ? container::ContainerState::Released : container::ContainerState::Destroyed;
  switch (session.strategy()) {
  case ContainerStrategy::PerExecution:
    provisioner_->destroy(acquired.handle, final_state);
    session.retire_current();
    break;
  case ContainerStrategy::Pool:
    session.retire_current();
    pool_->release(acquired.handle, healthy);
    break;
  case ContainerStrategy::PerSession:
    if (!healthy) {
      provisioner_->destroy(acquired.handle, container::ContainerState::Destroyed);
      session.retire_current();
    }
    break;
  }
}

common::Result<ExecutionResult> ExecutionEngine::execute_code(const std::string &session_id,
                                                              const ExecutionRequest &request,
                                                              const common::CancellationToken &cancel) {
  using ExecResult = common::Result<ExecutionResult>;

  // Everything that can be rejected is checked before any container action.
  auto language_result = languages_->resolve(request.language);
  if (!language_result.ok()) {
    return ExecResult::failure(language_result.status());
  }
  const auto language = language_result.value();
  const std::string language_id(language->id());

  if (request.timeout.has_value() && request.timeout->count() <= 0) {
    return ExecResult::failure(common::ErrorKind::Configuration, "timeout must be positive");
  }

  std::optional<std::vector<std::string>> install_command;
  if (!request.dependencies.empty()) {
    install_command = language->build_install_command(request.dependencies);
    if (!install_command.has_value()) {
      return ExecResult::failure(common::ErrorKind::Configuration,
                                 "language " + language_id + " has no dependency installer");
    }
  }

  std::vector<std::string> command;
  if (const auto *app = std::get_if<RunApp>(&request.source)) {
    auto entry = languages::resolve_run_app_entry(*app);
    if (!entry.ok()) {
      return ExecResult::failure(entry.status());
    }
    command = language->build_run_app_command(entry.value());
  } else {
    command = language->build_inline_command();
  }
  if (command.empty()) {
    return ExecResult::failure(common::ErrorKind::Configuration,
                               "language " + language_id + " cannot run this request");
  }

  auto session = sessions_.find(session_id);
  if (!session || !session->is_active()) {
    auto strategy = strategy_from_string(config_.execution.default_strategy);
    SessionConfig defaults;
    defaults.strategy = strategy.ok() ? strategy.value() : ContainerStrategy::PerExecution;
    defaults.session_id = session_id;
    defaults.container.image = std::string(language->default_image());
    auto created = create_session(std::move(defaults));
    if (!created.ok()) {
      return ExecResult::failure(created.status());
    }
    session = sessions_.find(created.value().session_id);
    if (!session) {
      return ExecResult::failure(common::ErrorKind::NotFound, "session vanished: " + session_id);
    }
  }

  const std::string strategy_name = strategy_to_string(session->strategy());
  observability::record_execution_start(session->id(), language_id, strategy_name);
  const ProtocolTrace trace(session->id(), request.verbose);
  const auto finish = [&](const ExecutionResult &result) {
    observability::record_execution_end(session->id(), language_id,
                                        execution_status_to_string(result.status),
                                        result.exit_code, result.execution_time);
  };

  trace.step("queue", "depth=" + std::to_string(session->queue_depth()));
  auto entered = session->enter(cancel);
  if (!entered.ok()) {
    if (entered.kind() == common::ErrorKind::Cancelled) {
      auto result = cancelled_result();
      finish(result);
      return ExecResult::success(std::move(result));
    }
    return ExecResult::failure(entered);
  }
  LaneTurn turn(*session);

  if (cancel.is_cancelled()) {
    auto result = cancelled_result();
    finish(result);
    return ExecResult::success(std::move(result));
  }

  container::ContainerConfig container_config = session->config().container;
  if (common::trim(container_config.image).empty()) {
    container_config.image = std::string(language->default_image());
  }
  const auto limits = limits_for(request);

  trace.step("acquire", strategy_name + " image=" + container_config.image);
  auto acquired_result = acquire(*session, container_config, request, limits, cancel);
  if (!acquired_result.ok()) {
    if (acquired_result.kind() == common::ErrorKind::Cancelled) {
      auto result = cancelled_result();
      finish(result);
      return ExecResult::success(std::move(result));
    }
    observability::record_error("engine", acquired_result.error());
    return ExecResult::failure(acquired_result.status());
  }
  const Acquired acquired = acquired_result.value();
  const auto &handle = acquired.handle;
  const auto workspace_dir = handle->workspace_dir();

  auto begun = handle->begin_execution();
  if (!begun.ok()) {
    release(*session, acquired, false);
    return ExecResult::failure(begun);
  }

  const auto abort_with = [&](const common::Status &status, const bool healthy) {
    if (healthy) {
      (void)handle->finish_execution();
    }
    release(*session, acquired, healthy);
    observability::record_error("engine", status.error());
    return ExecResult::failure(status);
  };

  trace.step("prepare", workspace_dir.string());
  auto prepared = language->prepare_files(request, workspace_dir);
  if (!prepared.ok()) {
    return abort_with(prepared, true);
  }

  ExecutionResult result;
  result.workspace_dir = workspace_dir;
  result.container_id = handle->id();
  bool healthy = true;
  bool run_main = true;

  const runtime::ExecSpec base_spec{
      .env = request.env,
      .limits = limits,
      .timeout = request.timeout.value_or(
          std::chrono::milliseconds(config_.execution.default_timeout_ms)),
      .cancel_requested = cancel.flag(),
  };

  if (install_command.has_value()) {
    trace.step("install", common::join(request.dependencies, " "));
    runtime::ExecSpec spec = base_spec;
    spec.command = *install_command;
    spec.on_stdout = sink_callback(request.streams.dependency_stdout_sink);
    spec.on_stderr = sink_callback(request.streams.dependency_stderr_sink);
    auto installed = runtime_->exec(handle->id(), spec);
    if (!installed.ok()) {
      return abort_with(installed.status(), false);
    }

    auto &outcome = installed.value();
    result.dependency_stdout = std::move(outcome.stdout_text);
    result.dependency_stderr = std::move(outcome.stderr_text);
    if (outcome.cancelled) {
      result.status = ExecutionStatus::Cancelled;
      result.exit_code = CANCELLED_EXIT_CODE;
      healthy = false;
      run_main = false;
    } else if (outcome.timed_out || outcome.exit_code != 0) {
      result.status = ExecutionStatus::DependencyInstallFailed;
      result.exit_code = outcome.timed_out ? TIMEOUT_EXIT_CODE : outcome.exit_code;
      healthy = false;
      run_main = false;
      trace.step("install_failed", "exit_code=" + std::to_string(result.exit_code));
    }
  }

  if (run_main) {
    auto baseline = workspace::capture_snapshot(workspace_dir);
    if (!baseline.ok()) {
      return abort_with(baseline.status(), true);
    }

    trace.step("run", common::join(command, " "));
    runtime::ExecSpec spec = base_spec;
    spec.command = command;
    spec.on_stdout = sink_callback(request.streams.stdout_sink);
    spec.on_stderr = sink_callback(request.streams.stderr_sink);
    const auto started = std::chrono::steady_clock::now();
    auto ran = runtime_->exec(handle->id(), spec);
    result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (!ran.ok()) {
      return abort_with(ran.status(), false);
    }

    auto &outcome = ran.value();
    result.stdout_text = std::move(outcome.stdout_text);
    result.stderr_text = std::move(outcome.stderr_text);
    if (outcome.timed_out) {
      result.status = ExecutionStatus::TimedOut;
      result.exit_code = TIMEOUT_EXIT_CODE;
      healthy = false;
    } else if (outcome.cancelled) {
      result.status = ExecutionStatus::Cancelled;
      result.exit_code = CANCELLED_EXIT_CODE;
      healthy = false;
    } else {
      result.exit_code = outcome.exit_code;
    }

    auto after = workspace::capture_snapshot(workspace_dir);
    if (after.ok()) {
      result.generated_files = workspace::diff_snapshots(baseline.value(), after.value());
    } else {
      observability::record_error("engine", "workspace diff failed: " + after.error());
    }
    trace.step("diff", std::to_string(result.generated_files.size()) + " generated");
  }

  result.session_generated_files = handle->merge_generated_files(result.generated_files);
  if (healthy) {
    auto done = handle->finish_execution();
    if (!done.ok()) {
      observability::record_error("engine", done.error());
      healthy = false;
    }
  }

  trace.step("release", healthy ? "healthy" : "unhealthy");
  release(*session, acquired, healthy);
  session->mark_executed();
  finish(result);
  return ExecResult::success(std::move(result));
}

void ExecutionEngine::teardown_session(Session &session) {
  // The bound container may still be executing; Destroyed is reachable from
  // every live state, so an in-flight run cannot keep it alive.
  auto bound = session.close();
  if (bound && session.strategy() != ContainerStrategy::Pool) {
    provisioner_->destroy(bound, container::ContainerState::Destroyed);
    session.retire_current();
  }

  if (!config_.execution.remove_workspaces_on_cleanup) {
    return;
  }
  for (const auto &dir : session.workspaces()) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
      observability::record_error("engine", std::string(common::error_kind_to_string(
                                                common::ErrorKind::Cleanup)) +
                                                " " + dir.string() + ": " + ec.message());
    }
  }
}

common::Status ExecutionEngine::cleanup_session(const std::string &session_id) {
  auto session = sessions_.find(session_id);
  if (!session) {
    return common::Status::success();
  }
  teardown_session(*session);
  observability::record_metric(
      observability::ActiveSessionsMetric{.count = sessions_.active_count()});
  return common::Status::success();
}

void ExecutionEngine::shutdown() {
  for (const auto &session : sessions_.all()) {
    teardown_session(*session);
  }
  if (pool_) {
    pool_->shutdown();
  }
}

} // namespace crucible::execution
