#include "crucible/runtime/docker_runtime.hpp"

#include "crucible/common/fs.hpp"

#include <iomanip>
#include <sstream>

namespace crucible::runtime {

namespace {

std::string format_cpus(const double cpus) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << cpus;
  return out.str();
}

std::string mount_arg(const Mount &mount) {
  std::string arg = mount.source.string() + ":" + mount.target;
  if (mount.read_only) {
    arg += ":ro";
  }
  return arg;
}

void append_limit_flags(std::vector<std::string> &args, const ResourceLimits &limits) {
  if (limits.cpus.has_value() && *limits.cpus > 0) {
    args.push_back("--cpus");
    args.push_back(format_cpus(*limits.cpus));
  }
  if (limits.memory.has_value() && !common::trim(*limits.memory).empty()) {
    args.push_back("--memory");
    args.push_back(*limits.memory);
    args.push_back("--memory-swap");
    args.push_back(*limits.memory);
  }
}

} // namespace

std::string mount_type_to_string(const MountType type) {
  switch (type) {
  case MountType::File:
    return "file";
  case MountType::Directory:
    return "directory";
  case MountType::Zip:
    return "zip";
  }
  return "directory";
}

std::vector<std::string> build_docker_create_args(const config::DockerConfig &config,
                                                   const ContainerSpec &spec) {
  std::vector<std::string> args = {"create"};
  if (!spec.name.empty()) {
    args.push_back("--name");
    args.push_back(spec.name);
  }
  args.push_back("--label");
  args.push_back("crucible.managed=1");
  for (const auto &[key, value] : spec.labels) {
    args.push_back("--label");
    args.push_back(key + "=" + value);
  }

  if (!common::trim(config.network_mode).empty()) {
    args.push_back("--network");
    args.push_back(config.network_mode);
  }

  for (const auto &cap : config.cap_drop) {
    if (common::trim(cap).empty()) {
      continue;
    }
    args.push_back("--cap-drop");
    args.push_back(cap);
  }
  if (config.no_new_privileges) {
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");
  }

  if (config.pids_limit.has_value() && *config.pids_limit > 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(*config.pids_limit));
  }
  append_limit_flags(args, spec.limits);

  if (!spec.workspace_dir.empty()) {
    args.push_back("-v");
    args.push_back(spec.workspace_dir.string() + ":" + config.workdir);
  }

  // Zip archives are copied in and extracted once the container is running.
  for (const auto &mount : spec.mounts) {
    if (mount.type == MountType::Zip) {
      continue;
    }
    args.push_back("-v");
    args.push_back(mount_arg(mount));
  }

  for (const auto port : spec.ports) {
    args.push_back("-p");
    args.push_back(std::to_string(port) + ":" + std::to_string(port));
  }

  for (const auto &[key, value] : spec.env) {
    if (common::trim(key).empty()) {
      continue;
    }
    args.push_back("--env");
    args.push_back(key + "=" + value);
  }

  args.push_back("--workdir");
  args.push_back(config.workdir);
  args.push_back(spec.image);
  args.push_back("sleep");
  args.push_back("infinity");
  return args;
}

std::vector<std::string> build_docker_exec_args(const config::DockerConfig &config,
                                                 const std::string &container_id,
                                                 const ExecSpec &spec) {
  std::vector<std::string> args = {"exec", "-w", spec.workdir.empty() ? config.workdir : spec.workdir};
  for (const auto &[key, value] : spec.env) {
    if (common::trim(key).empty()) {
      continue;
    }
    args.push_back("-e");
    args.push_back(key + "=" + value);
  }
  args.push_back(container_id);
  args.insert(args.end(), spec.command.begin(), spec.command.end());
  return args;
}

std::vector<std::string> build_docker_update_args(const std::string &container_id,
                                                   const ResourceLimits &limits) {
  std::vector<std::string> args = {"update"};
  append_limit_flags(args, limits);
  args.push_back(container_id);
  return args;
}

DockerContainerRuntime::DockerContainerRuntime(config::DockerConfig config,
                                               std::shared_ptr<IDockerRunner> docker_runner)
    : config_(std::move(config)), docker_runner_(std::move(docker_runner)) {
  if (!docker_runner_) {
    docker_runner_ = std::make_shared<DockerCliRunner>(config_.binary);
  }
}

DockerCommandOptions DockerContainerRuntime::control_options(const bool allow_failure) const {
  return DockerCommandOptions{.allow_failure = allow_failure,
                              .timeout = std::chrono::milliseconds(config_.command_timeout_ms)};
}

common::Result<std::string> DockerContainerRuntime::create(const ContainerSpec &spec) {
  if (common::trim(spec.image).empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::Provisioning,
                                                "container image is empty");
  }

  auto created = docker_runner_->run(build_docker_create_args(config_, spec), control_options());
  if (!created.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::Provisioning, created.error());
  }

  const std::string id = common::trim(created.value().stdout_text);
  if (id.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::Provisioning,
                                                "docker create returned no container id");
  }

  std::lock_guard<std::mutex> lock(limits_mutex_);
  applied_limits_[id] = spec.limits;
  return common::Result<std::string>::success(id);
}

common::Status DockerContainerRuntime::start(const std::string &container_id) {
  auto started = docker_runner_->run({"start", container_id}, control_options());
  if (!started.ok()) {
    return common::Status::error(common::ErrorKind::Provisioning, started.error());
  }
  return common::Status::success();
}

common::Status DockerContainerRuntime::apply_limits(const std::string &container_id,
                                                    const ResourceLimits &limits) {
  {
    std::lock_guard<std::mutex> lock(limits_mutex_);
    const auto it = applied_limits_.find(container_id);
    if (limits.empty() || (it != applied_limits_.end() && it->second == limits)) {
      return common::Status::success();
    }
  }

  auto updated =
      docker_runner_->run(build_docker_update_args(container_id, limits), control_options());
  if (!updated.ok()) {
    return common::Status::error(common::ErrorKind::Runtime,
                                 "failed to apply resource limits: " + updated.error());
  }

  std::lock_guard<std::mutex> lock(limits_mutex_);
  applied_limits_[container_id] = limits;
  return common::Status::success();
}

common::Result<ExecOutcome> DockerContainerRuntime::exec(const std::string &container_id,
                                                         const ExecSpec &spec) {
  if (spec.command.empty()) {
    return common::Result<ExecOutcome>::failure(common::ErrorKind::Runtime, "exec command is empty");
  }

  auto limited = apply_limits(container_id, spec.limits);
  if (!limited.ok()) {
    return common::Result<ExecOutcome>::failure(limited);
  }

  DockerCommandOptions options{.allow_failure = true,
                               .timeout = spec.timeout,
                               .on_stdout = spec.on_stdout,
                               .on_stderr = spec.on_stderr,
                               .cancel_requested = spec.cancel_requested};
  auto ran = docker_runner_->run(build_docker_exec_args(config_, container_id, spec), options);
  if (!ran.ok()) {
    return common::Result<ExecOutcome>::failure(ran.status());
  }

  auto &process = ran.value();
  return common::Result<ExecOutcome>::success(ExecOutcome{
      .exit_code = process.exit_code,
      .stdout_text = std::move(process.stdout_text),
      .stderr_text = std::move(process.stderr_text),
      .timed_out = process.timed_out,
      .cancelled = process.cancelled,
  });
}

common::Status DockerContainerRuntime::stop(const std::string &container_id) {
  auto stopped = docker_runner_->run({"stop", "-t", "2", container_id}, control_options(true));
  if (!stopped.ok()) {
    return common::Status::error(common::ErrorKind::Cleanup, stopped.error());
  }
  return common::Status::success();
}

common::Status DockerContainerRuntime::remove(const std::string &container_id) {
  auto removed = docker_runner_->run({"rm", "-f", container_id}, control_options(true));
  {
    std::lock_guard<std::mutex> lock(limits_mutex_);
    applied_limits_.erase(container_id);
  }
  if (!removed.ok()) {
    return common::Status::error(common::ErrorKind::Cleanup, removed.error());
  }
  if (removed.value().exit_code != 0) {
    const std::string stderr_text = common::to_lower(removed.value().stderr_text);
    if (stderr_text.find("no such container") == std::string::npos) {
      return common::Status::error(common::ErrorKind::Cleanup,
                                   "docker rm failed: " + common::trim(removed.value().stderr_text));
    }
  }
  return common::Status::success();
}

common::Result<ContainerInspection> DockerContainerRuntime::inspect(const std::string &container_id) {
  auto inspected = docker_runner_->run(
      {"inspect", "-f", "{{.State.Running}} {{.Config.Image}}", container_id}, control_options(true));
  if (!inspected.ok()) {
    return common::Result<ContainerInspection>::failure(inspected.error());
  }
  if (inspected.value().exit_code != 0) {
    return common::Result<ContainerInspection>::success(ContainerInspection{});
  }

  const std::string line = common::trim(inspected.value().stdout_text);
  const auto space = line.find(' ');
  const std::string running = common::to_lower(line.substr(0, space));
  return common::Result<ContainerInspection>::success(ContainerInspection{
      .exists = true,
      .running = running == "true",
      .image = space == std::string::npos ? std::string() : common::trim(line.substr(space + 1)),
  });
}

common::Status DockerContainerRuntime::copy_in(const std::string &container_id,
                                               const std::filesystem::path &host_path,
                                               const std::string &container_path) {
  auto copied = docker_runner_->run({"cp", host_path.string(), container_id + ":" + container_path},
                                    control_options());
  if (!copied.ok()) {
    return common::Status::error(common::ErrorKind::Io, copied.error());
  }
  return common::Status::success();
}

common::Status DockerContainerRuntime::copy_out(const std::string &container_id,
                                                const std::string &container_path,
                                                const std::filesystem::path &host_path) {
  auto copied = docker_runner_->run({"cp", container_id + ":" + container_path, host_path.string()},
                                    control_options());
  if (!copied.ok()) {
    return common::Status::error(common::ErrorKind::Io, copied.error());
  }
  return common::Status::success();
}

} // namespace crucible::runtime
