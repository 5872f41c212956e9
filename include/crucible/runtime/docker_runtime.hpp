#pragma once

#include "crucible/config/schema.hpp"
#include "crucible/runtime/container_runtime.hpp"
#include "crucible/runtime/docker.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>

namespace crucible::runtime {

[[nodiscard]] std::vector<std::string> build_docker_create_args(const config::DockerConfig &config,
                                                                const ContainerSpec &spec);
[[nodiscard]] std::vector<std::string> build_docker_exec_args(const config::DockerConfig &config,
                                                              const std::string &container_id,
                                                              const ExecSpec &spec);
[[nodiscard]] std::vector<std::string> build_docker_update_args(const std::string &container_id,
                                                                const ResourceLimits &limits);

class DockerContainerRuntime final : public IContainerRuntime {
public:
  explicit DockerContainerRuntime(
      config::DockerConfig config,
      std::shared_ptr<IDockerRunner> docker_runner = nullptr);

  [[nodiscard]] common::Result<std::string> create(const ContainerSpec &spec) override;
  [[nodiscard]] common::Status start(const std::string &container_id) override;
  [[nodiscard]] common::Result<ExecOutcome> exec(const std::string &container_id,
                                                 const ExecSpec &spec) override;
  [[nodiscard]] common::Status stop(const std::string &container_id) override;
  [[nodiscard]] common::Status remove(const std::string &container_id) override;
  [[nodiscard]] common::Result<ContainerInspection>
  inspect(const std::string &container_id) override;
  [[nodiscard]] common::Status copy_in(const std::string &container_id,
                                       const std::filesystem::path &host_path,
                                       const std::string &container_path) override;
  [[nodiscard]] common::Status copy_out(const std::string &container_id,
                                        const std::string &container_path,
                                        const std::filesystem::path &host_path) override;
  [[nodiscard]] std::string workspace_mount_point() const override { return config_.workdir; }

private:
  [[nodiscard]] common::Status apply_limits(const std::string &container_id,
                                            const ResourceLimits &limits);
  [[nodiscard]] DockerCommandOptions control_options(bool allow_failure = false) const;

  config::DockerConfig config_;
  std::shared_ptr<IDockerRunner> docker_runner_;
  std::mutex limits_mutex_;
  std::unordered_map<std::string, ResourceLimits> applied_limits_;
};

} // namespace crucible::runtime
