#pragma once

#include "crucible/common/cancellation.hpp"
#include "crucible/common/result.hpp"
#include "crucible/config/schema.hpp"
#include "crucible/container/container.hpp"
#include "crucible/container/provisioner.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace crucible::container {

/// Truncated SHA-256 over image, mounts, environment, ports and sharing mode.
[[nodiscard]] std::string pool_fingerprint(const ContainerConfig &config, bool shared_workspace);

struct PoolBucketStats {
  std::string key;
  std::string image;
  std::size_t idle = 0;
  std::size_t live = 0;
};

/// Bounded pool of warm containers, bucketed by fingerprint. `live` counts idle,
/// borrowed and in-flight provisioning handles of a bucket and never exceeds
/// `max_size`.
class ContainerPool {
public:
  ContainerPool(std::shared_ptr<ContainerProvisioner> provisioner, config::PoolConfig config,
                std::filesystem::path workspace_root);
  ~ContainerPool();

  ContainerPool(const ContainerPool &) = delete;
  ContainerPool &operator=(const ContainerPool &) = delete;

  /// Pops an idle handle, provisions one while under `max_size`, or waits up to
  /// `acquire_timeout_ms` for a release. Fails with ErrorKind::PoolExhausted when
  /// the wait runs out and ErrorKind::Cancelled when `cancel` fires first.
  [[nodiscard]] common::Result<std::shared_ptr<ContainerHandle>>
  acquire(const ContainerConfig &config, bool shared_workspace,
          const runtime::ResourceLimits &limits = {}, const common::CancellationToken *cancel = nullptr);

  /// Returns a healthy Ready handle to the idle set while there is room;
  /// everything else is destroyed.
  void release(const std::shared_ptr<ContainerHandle> &handle, bool healthy);

  /// Evicts idle handles past `idle_timeout_ms`, then provisions replacements so
  /// each known bucket holds at least `min_size` idle handles.
  void run_maintenance();

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  /// Stops maintenance, destroys idle handles and rejects further acquires.
  void shutdown();

  void configure(const config::PoolConfig &config);
  [[nodiscard]] config::PoolConfig config() const;
  [[nodiscard]] std::vector<PoolBucketStats> stats() const;

private:
  struct Bucket {
    ContainerConfig config;
    bool shared_workspace = false;
    std::deque<std::shared_ptr<ContainerHandle>> idle;
    std::size_t live = 0;
  };

  [[nodiscard]] std::filesystem::path workspace_for(const std::string &key,
                                                    bool shared_workspace) const;
  [[nodiscard]] common::Result<std::shared_ptr<ContainerHandle>>
  provision_for(const std::string &key, const ContainerConfig &config, bool shared_workspace,
                const runtime::ResourceLimits &limits);
  void retire(const std::string &key, const std::shared_ptr<ContainerHandle> &handle,
              ContainerState final_state);
  void report_occupancy(const std::string &key);
  void run_loop();

  std::shared_ptr<ContainerProvisioner> provisioner_;
  std::filesystem::path workspace_root_;

  mutable std::mutex mutex_;
  std::condition_variable released_cv_;
  std::condition_variable maintenance_cv_;
  config::PoolConfig config_;
  std::unordered_map<std::string, Bucket> buckets_;
  std::unordered_map<std::string, std::string> key_by_container_;
  bool shutting_down_ = false;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace crucible::container
