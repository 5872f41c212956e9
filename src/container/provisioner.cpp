#include "crucible/container/provisioner.hpp"

#include "crucible/common/fs.hpp"
#include "crucible/observability/global.hpp"

#include <thread>

namespace crucible::container {

namespace {

constexpr std::chrono::milliseconds UNPACK_TIMEOUT{120'000};

void report_cleanup_failure(const std::string &label, const common::Status &status) {
  observability::record_error(
      "container", std::string(common::error_kind_to_string(common::ErrorKind::Cleanup)) + " " +
                       label + ": " + status.error());
}

} // namespace

ContainerProvisioner::ContainerProvisioner(std::shared_ptr<runtime::IContainerRuntime> runtime,
                                           config::ProvisioningConfig retry,
                                           std::string name_prefix)
    : runtime_(std::move(runtime)), retry_(retry), name_prefix_(std::move(name_prefix)) {}

common::Result<std::shared_ptr<ContainerHandle>>
ContainerProvisioner::provision(const ContainerConfig &config,
                                const std::filesystem::path &workspace_dir,
                                const runtime::ResourceLimits &limits) {
  using HandleResult = common::Result<std::shared_ptr<ContainerHandle>>;
  if (!runtime_) {
    return HandleResult::failure(common::ErrorKind::Provisioning, "container runtime unavailable");
  }
  if (common::trim(config.image).empty()) {
    return HandleResult::failure(common::ErrorKind::Configuration, "container image is empty");
  }

  auto workspace = common::ensure_dir(workspace_dir);
  if (!workspace.ok()) {
    return HandleResult::failure(workspace.status());
  }

  std::string last_error;
  for (std::uint32_t attempt = 0; attempt <= retry_.retries; ++attempt) {
    auto handle = provision_once(config, workspace_dir, limits);
    if (handle.ok()) {
      return handle;
    }

    last_error = handle.error();
    observability::record_error("provisioner", "attempt " + std::to_string(attempt + 1) +
                                                   " for " + config.image + " failed: " +
                                                   last_error);
    if (attempt < retry_.retries) {
      const std::uint64_t delay = retry_.backoff_ms * (1ULL << attempt);
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
  }

  return HandleResult::failure(common::ErrorKind::Provisioning,
                               "failed to provision container for " + config.image + " after " +
                                   std::to_string(retry_.retries + 1) +
                                   " attempts: " + last_error);
}

common::Result<std::shared_ptr<ContainerHandle>>
ContainerProvisioner::provision_once(const ContainerConfig &config,
                                     const std::filesystem::path &workspace_dir,
                                     const runtime::ResourceLimits &limits) {
  using HandleResult = common::Result<std::shared_ptr<ContainerHandle>>;
  const std::string name =
      config.name.has_value() && !config.name->empty() ? *config.name
                                                        : name_prefix_ + common::random_hex(12);

  runtime::ContainerSpec spec{
      .name = name,
      .image = config.image,
      .mounts = config.mounts,
      .env = config.env,
      .ports = config.ports,
      .workspace_dir = workspace_dir,
      .limits = limits,
      .labels = {{"crucible.workspace", workspace_dir.string()}},
  };

  auto created = runtime_->create(spec);
  if (!created.ok()) {
    return HandleResult::failure(created.status());
  }
  const std::string id = created.value();

  auto started = runtime_->start(id);
  if (!started.ok()) {
    teardown(id, name);
    return HandleResult::failure(started);
  }

  auto unpacked = unpack_zip_mounts(id, config);
  if (!unpacked.ok()) {
    teardown(id, name);
    return HandleResult::failure(unpacked);
  }

  auto handle = std::make_shared<ContainerHandle>(id, name, config.image, workspace_dir);
  auto ready = handle->transition(ContainerState::Ready);
  if (!ready.ok()) {
    teardown(id, name);
    return HandleResult::failure(ready);
  }
  return HandleResult::success(std::move(handle));
}

common::Status ContainerProvisioner::unpack_zip_mounts(const std::string &container_id,
                                                       const ContainerConfig &config) {
  for (const auto &mount : config.mounts) {
    if (mount.type != runtime::MountType::Zip) {
      continue;
    }

    const std::string staged = "/tmp/crucible-" + common::random_hex(8) + ".zip";
    auto copied = runtime_->copy_in(container_id, mount.source, staged);
    if (!copied.ok()) {
      return common::Status::error(common::ErrorKind::Provisioning,
                                   "failed to copy archive " + mount.source.string() + ": " +
                                       copied.error());
    }

    runtime::ExecSpec unzip{.command = {"unzip", "-o", "-q", staged, "-d", mount.target},
                            .timeout = UNPACK_TIMEOUT};
    auto extracted = runtime_->exec(container_id, unzip);
    if (!extracted.ok()) {
      return common::Status::error(common::ErrorKind::Provisioning, extracted.error());
    }
    if (extracted.value().exit_code != 0) {
      return common::Status::error(common::ErrorKind::Provisioning,
                                   "failed to extract " + mount.source.string() + " to " +
                                       mount.target + ": " +
                                       common::trim(extracted.value().stderr_text));
    }

    auto cleaned = runtime_->exec(container_id,
                                  runtime::ExecSpec{.command = {"rm", "-f", staged},
                                                    .timeout = UNPACK_TIMEOUT});
    if (!cleaned.ok()) {
      report_cleanup_failure(staged, cleaned.status());
    }
  }
  return common::Status::success();
}

void ContainerProvisioner::destroy(const std::shared_ptr<ContainerHandle> &handle,
                                   const ContainerState final_state) {
  if (!handle) {
    return;
  }
  auto moved = handle->transition(final_state);
  if (!moved.ok()) {
    if (is_terminal_state(handle->state())) {
      // Already torn down.
      return;
    }
    // `final_state` is not reachable from here (e.g. Released while Executing).
    if (!handle->transition(ContainerState::Destroyed).ok()) {
      return;
    }
  }
  teardown(handle->id(), handle->name());
}

void ContainerProvisioner::teardown(const std::string &container_id, const std::string &label) {
  auto stopped = runtime_->stop(container_id);
  if (!stopped.ok()) {
    report_cleanup_failure(label, stopped);
  }
  auto removed = runtime_->remove(container_id);
  if (!removed.ok()) {
    report_cleanup_failure(label, removed);
  }
}

} // namespace crucible::container
