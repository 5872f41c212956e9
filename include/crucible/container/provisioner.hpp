#pragma once

#include "crucible/common/result.hpp"
#include "crucible/config/schema.hpp"
#include "crucible/container/container.hpp"
#include "crucible/runtime/container_runtime.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace crucible::container {

/// Creates and starts containers with bounded retry, and tears them down.
class ContainerProvisioner {
public:
  ContainerProvisioner(std::shared_ptr<runtime::IContainerRuntime> runtime,
                       config::ProvisioningConfig retry, std::string name_prefix = "crucible-");

  /// Runtime create + start, then zip mounts are unpacked. Each failed attempt is
  /// cleaned up and retried after `backoff_ms * 2^attempt`. Exhaustion fails with
  /// ErrorKind::Provisioning.
  [[nodiscard]] common::Result<std::shared_ptr<ContainerHandle>>
  provision(const ContainerConfig &config, const std::filesystem::path &workspace_dir,
            const runtime::ResourceLimits &limits = {});

  /// Stop then remove, best effort. Failures are reported to the observer and
  /// otherwise ignored. `final_state` is recorded on the handle, or Destroyed when
  /// `final_state` cannot be reached from the current state. Handles already in a
  /// terminal state are left alone.
  void destroy(const std::shared_ptr<ContainerHandle> &handle, ContainerState final_state);

  [[nodiscard]] runtime::IContainerRuntime &runtime() { return *runtime_; }
  [[nodiscard]] const std::shared_ptr<runtime::IContainerRuntime> &runtime_ptr() const {
    return runtime_;
  }

private:
  [[nodiscard]] common::Result<std::shared_ptr<ContainerHandle>>
  provision_once(const ContainerConfig &config, const std::filesystem::path &workspace_dir,
                 const runtime::ResourceLimits &limits);
  [[nodiscard]] common::Status unpack_zip_mounts(const std::string &container_id,
                                                 const ContainerConfig &config);
  void teardown(const std::string &container_id, const std::string &label);

  std::shared_ptr<runtime::IContainerRuntime> runtime_;
  config::ProvisioningConfig retry_;
  std::string name_prefix_;
};

} // namespace crucible::container
