#include "crucible/container/pool.hpp"

#include "crucible/common/digest.hpp"
#include "crucible/common/fs.hpp"
#include "crucible/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace crucible::container {

namespace {

constexpr std::size_t FINGERPRINT_LENGTH = 16;
constexpr std::chrono::milliseconds ACQUIRE_POLL{50};

} // namespace

std::string pool_fingerprint(const ContainerConfig &config, const bool shared_workspace) {
  std::ostringstream canonical;
  canonical << "image=" << config.image << "\n";
  for (const auto &mount : config.mounts) {
    canonical << "mount=" << runtime::mount_type_to_string(mount.type) << "|"
              << mount.source.string() << "|" << mount.target << "|"
              << (mount.read_only ? "ro" : "rw") << "\n";
  }
  auto env = config.env;
  std::sort(env.begin(), env.end());
  for (const auto &[key, value] : env) {
    canonical << "env=" << key << "=" << value << "\n";
  }
  auto ports = config.ports;
  std::sort(ports.begin(), ports.end());
  for (const auto port : ports) {
    canonical << "port=" << port << "\n";
  }
  canonical << "sharing=" << (shared_workspace ? "shared" : "isolated") << "\n";
  return common::sha256_hex(canonical.str()).substr(0, FINGERPRINT_LENGTH);
}

ContainerPool::ContainerPool(std::shared_ptr<ContainerProvisioner> provisioner,
                             config::PoolConfig config, std::filesystem::path workspace_root)
    : provisioner_(std::move(provisioner)), workspace_root_(std::move(workspace_root)),
      config_(config) {}

ContainerPool::~ContainerPool() { shutdown(); }

std::filesystem::path ContainerPool::workspace_for(const std::string &key,
                                                   const bool shared_workspace) const {
  if (shared_workspace) {
    return workspace_root_ / ("pool-" + key);
  }
  return workspace_root_ / ("pool-" + key + "-" + common::random_hex(8));
}

common::Result<std::shared_ptr<ContainerHandle>>
ContainerPool::provision_for(const std::string &key, const ContainerConfig &config,
                             const bool shared_workspace, const runtime::ResourceLimits &limits) {
  // Every pooled container shares the bucket's config, so a fixed name would
  // collide on the second container.
  ContainerConfig named = config;
  if (named.name.has_value() && !named.name->empty()) {
    *named.name += "-" + common::random_hex(8);
  }
  auto handle = provisioner_->provision(named, workspace_for(key, shared_workspace), limits);
  std::lock_guard<std::mutex> lock(mutex_);
  if (handle.ok()) {
    key_by_container_[handle.value()->id()] = key;
  } else {
    auto it = buckets_.find(key);
    if (it != buckets_.end() && it->second.live > 0) {
      --it->second.live;
    }
    released_cv_.notify_all();
  }
  return handle;
}

common::Result<std::shared_ptr<ContainerHandle>>
ContainerPool::acquire(const ContainerConfig &config, const bool shared_workspace,
                       const runtime::ResourceLimits &limits,
                       const common::CancellationToken *cancel) {
  using HandleResult = common::Result<std::shared_ptr<ContainerHandle>>;
  const std::string key = pool_fingerprint(config, shared_workspace);

  std::unique_lock<std::mutex> lock(mutex_);
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.acquire_timeout_ms);
  auto [it, inserted] = buckets_.try_emplace(key);
  if (inserted) {
    it->second.config = config;
    it->second.shared_workspace = shared_workspace;
  }

  while (true) {
    if (shutting_down_) {
      return HandleResult::failure(common::ErrorKind::PoolExhausted, "container pool is shut down");
    }

    auto &bucket = buckets_[key];
    if (!bucket.idle.empty()) {
      auto handle = bucket.idle.back();
      bucket.idle.pop_back();
      lock.unlock();
      report_occupancy(key);
      return HandleResult::success(std::move(handle));
    }

    if (bucket.live < config_.max_size) {
      ++bucket.live;
      lock.unlock();
      auto handle = provision_for(key, config, shared_workspace, limits);
      report_occupancy(key);
      return handle;
    }

    if (cancel != nullptr && cancel->is_cancelled()) {
      return HandleResult::failure(common::ErrorKind::Cancelled,
                                   "cancelled while waiting for a pooled container");
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return HandleResult::failure(common::ErrorKind::PoolExhausted,
                                   "no container available for " + config.image + " within " +
                                       std::to_string(config_.acquire_timeout_ms) + "ms");
    }
    released_cv_.wait_until(lock, std::min(deadline, now + ACQUIRE_POLL));
  }
}

void ContainerPool::retire(const std::string &key, const std::shared_ptr<ContainerHandle> &handle,
                           const ContainerState final_state) {
  provisioner_->destroy(handle, final_state);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    key_by_container_.erase(handle->id());
    auto it = buckets_.find(key);
    if (it != buckets_.end() && it->second.live > 0) {
      --it->second.live;
    }
  }
  released_cv_.notify_all();
}

void ContainerPool::release(const std::shared_ptr<ContainerHandle> &handle, const bool healthy) {
  if (!handle) {
    return;
  }

  std::string key;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto owner = key_by_container_.find(handle->id());
    if (owner == key_by_container_.end()) {
      key.clear();
    } else {
      key = owner->second;
      auto &bucket = buckets_[key];
      if (healthy && !shutting_down_ && handle->state() == ContainerState::Ready &&
          bucket.idle.size() < config_.max_size) {
        bucket.idle.push_back(handle);
        released_cv_.notify_all();
        return;
      }
    }
  }

  const auto final_state = healthy ? ContainerState::Released : ContainerState::Destroyed;
  if (key.empty()) {
    provisioner_->destroy(handle, final_state);
    return;
  }
  retire(key, handle, final_state);
  report_occupancy(key);
}

void ContainerPool::run_maintenance() {
  const auto now = std::chrono::steady_clock::now();
  std::vector<std::pair<std::string, std::shared_ptr<ContainerHandle>>> expired;
  config::PoolConfig settings;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    settings = config_;
    const auto idle_timeout = std::chrono::milliseconds(config_.idle_timeout_ms);
    for (auto &[key, bucket] : buckets_) {
      auto &idle = bucket.idle;
      for (auto it = idle.begin(); it != idle.end();) {
        if (now - (*it)->idle_since() > idle_timeout) {
          expired.emplace_back(key, *it);
          it = idle.erase(it);
        } else {
          ++it;
        }
      }
    }
  }

  for (const auto &[key, handle] : expired) {
    observability::record_pool_eviction(
        key, handle->name(),
        std::chrono::duration_cast<std::chrono::milliseconds>(now - handle->idle_since()));
    retire(key, handle, ContainerState::Evicted);
  }

  struct Deficit {
    std::string key;
    ContainerConfig config;
    bool shared_workspace = false;
    std::size_t count = 0;
  };
  std::vector<Deficit> deficits;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
      return;
    }
    for (auto &[key, bucket] : buckets_) {
      const std::size_t floor = std::min<std::size_t>(settings.min_size, settings.max_size);
      if (bucket.idle.size() >= floor || bucket.live >= settings.max_size) {
        continue;
      }
      const std::size_t wanted =
          std::min(floor - bucket.idle.size(), settings.max_size - bucket.live);
      bucket.live += wanted;
      deficits.push_back(Deficit{.key = key,
                                 .config = bucket.config,
                                 .shared_workspace = bucket.shared_workspace,
                                 .count = wanted});
    }
  }

  for (const auto &deficit : deficits) {
    for (std::size_t i = 0; i < deficit.count; ++i) {
      auto handle = provision_for(deficit.key, deficit.config, deficit.shared_workspace, {});
      if (!handle.ok()) {
        observability::record_error("pool", "replenish " + deficit.key + ": " + handle.error());
        continue;
      }
      {
        std::lock_guard<std::mutex> lock(mutex_);
        buckets_[deficit.key].idle.push_back(handle.value());
      }
      released_cv_.notify_all();
    }
  }

  for (const auto &entry : stats()) {
    report_occupancy(entry.key);
  }
}

void ContainerPool::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void ContainerPool::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  maintenance_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ContainerPool::is_running() const { return running_; }

void ContainerPool::run_loop() {
  while (running_) {
    run_maintenance();
    std::unique_lock<std::mutex> lock(mutex_);
    const auto interval = std::chrono::milliseconds(
        std::max<long long>(1, static_cast<long long>(config_.maintenance_interval_ms)));
    maintenance_cv_.wait_for(lock, interval, [this]() { return !running_; });
  }
}

void ContainerPool::shutdown() {
  stop();

  std::vector<std::pair<std::string, std::shared_ptr<ContainerHandle>>> idle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
    for (auto &[key, bucket] : buckets_) {
      for (auto &handle : bucket.idle) {
        idle.emplace_back(key, handle);
      }
      bucket.idle.clear();
    }
  }
  released_cv_.notify_all();

  for (const auto &[key, handle] : idle) {
    retire(key, handle, ContainerState::Released);
  }
}

void ContainerPool::configure(const config::PoolConfig &config) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
  }
  released_cv_.notify_all();
}

config::PoolConfig ContainerPool::config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

std::vector<PoolBucketStats> ContainerPool::stats() const {
  std::vector<PoolBucketStats> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(buckets_.size());
  for (const auto &[key, bucket] : buckets_) {
    out.push_back(PoolBucketStats{
        .key = key, .image = bucket.config.image, .idle = bucket.idle.size(), .live = bucket.live});
  }
  std::sort(out.begin(), out.end(),
            [](const PoolBucketStats &a, const PoolBucketStats &b) { return a.key < b.key; });
  return out;
}

void ContainerPool::report_occupancy(const std::string &key) {
  PoolBucketStats entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = buckets_.find(key);
    if (it == buckets_.end()) {
      return;
    }
    entry = PoolBucketStats{.key = key,
                            .image = it->second.config.image,
                            .idle = it->second.idle.size(),
                            .live = it->second.live};
  }
  observability::record_metric(
      observability::PoolOccupancyMetric{.pool_key = key, .idle = entry.idle, .live = entry.live});
}

} // namespace crucible::container
