#include "test_framework.hpp"

#include "crucible/container/pool.hpp"
#include "crucible/container/provisioner.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace {

namespace ct = crucible::container;

struct PoolFixture {
  crucible::testing::TempWorkspace workspace;
  std::shared_ptr<crucible::testing::FakeContainerRuntime> runtime =
      std::make_shared<crucible::testing::FakeContainerRuntime>();
  std::shared_ptr<ct::ContainerProvisioner> provisioner =
      std::make_shared<ct::ContainerProvisioner>(runtime, crucible::config::ProvisioningConfig{
                                                              .retries = 0, .backoff_ms = 0});

  std::unique_ptr<ct::ContainerPool> make_pool(const crucible::config::PoolConfig &config) {
    return std::make_unique<ct::ContainerPool>(provisioner, config, workspace.path());
  }
};

crucible::config::PoolConfig small_pool(const std::uint32_t min_size, const std::uint32_t max_size) {
  crucible::config::PoolConfig config;
  config.min_size = min_size;
  config.max_size = max_size;
  config.idle_timeout_ms = 60'000;
  config.acquire_timeout_ms = 2'000;
  config.maintenance_interval_ms = 50;
  return config;
}

} // namespace

void register_pool_tests(std::vector<crucible::tests::TestCase> &tests) {
  using crucible::tests::require;
  using crucible::common::ErrorKind;

  tests.push_back({"fingerprint_ignores_env_and_port_order", [] {
                     ct::ContainerConfig a;
                     a.image = "python:3.12-slim";
                     a.env = {{"A", "1"}, {"B", "2"}};
                     a.ports = {80, 443};
                     ct::ContainerConfig b = a;
                     b.env = {{"B", "2"}, {"A", "1"}};
                     b.ports = {443, 80};
                     require(ct::pool_fingerprint(a, false) == ct::pool_fingerprint(b, false),
                             "order must not matter");
                     require(ct::pool_fingerprint(a, false) != ct::pool_fingerprint(a, true),
                             "sharing mode is part of the key");
                     b.image = "node:20-alpine";
                     require(ct::pool_fingerprint(a, false) != ct::pool_fingerprint(b, false),
                             "image is part of the key");
                   }});

  tests.push_back({"released_handle_is_reused", [] {
                     PoolFixture fixture;
                     auto pool = fixture.make_pool(small_pool(0, 2));
                     const ct::ContainerConfig config{.image = "alpine"};
                     const auto first = pool->acquire(config, false);
                     require(first.ok(), first.error());
                     const std::string id = first.value()->id();
                     pool->release(first.value(), true);

                     const auto second = pool->acquire(config, false);
                     require(second.ok(), second.error());
                     require(second.value()->id() == id, "idle container should be reused");
                     require(fixture.runtime->created_count() == 1, "no second container created");
                   }});

  tests.push_back({"unhealthy_handle_is_destroyed_not_pooled", [] {
                     PoolFixture fixture;
                     auto pool = fixture.make_pool(small_pool(0, 2));
                     const ct::ContainerConfig config{.image = "alpine"};
                     const auto first = pool->acquire(config, false);
                     require(first.ok(), first.error());
                     pool->release(first.value(), false);
                     require(first.value()->state() == ct::ContainerState::Destroyed,
                             "unhealthy handle destroyed");
                     require(!fixture.runtime->exists(first.value()->id()), "container removed");

                     const auto second = pool->acquire(config, false);
                     require(second.ok() && second.value()->id() != first.value()->id(),
                             "a fresh container replaces it");
                     const auto stats = pool->stats();
                     require(stats.size() == 1 && stats[0].live == 1, "live count stays accurate");
                   }});

  tests.push_back({"live_containers_never_exceed_max_size", [] {
                     PoolFixture fixture;
                     auto pool = fixture.make_pool(small_pool(0, 3));
                     const ct::ContainerConfig config{.image = "alpine"};
                     std::atomic<int> failures{0};
                     std::vector<std::thread> workers;
                     for (int i = 0; i < 5; ++i) {
                       workers.emplace_back([&]() {
                         auto handle = pool->acquire(config, false);
                         if (!handle.ok()) {
                           ++failures;
                           return;
                         }
                         std::this_thread::sleep_for(std::chrono::milliseconds(60));
                         pool->release(handle.value(), true);
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(failures.load() == 0, "waiters should be served after releases");
                     require(fixture.runtime->max_live() <= 3, "pool exceeded max_size");
                     require(fixture.runtime->created_count() <= 3, "at most max_size containers created");
                   }});

  tests.push_back({"acquire_times_out_when_exhausted", [] {
                     PoolFixture fixture;
                     auto config = small_pool(0, 1);
                     config.acquire_timeout_ms = 100;
                     auto pool = fixture.make_pool(config);
                     const ct::ContainerConfig container{.image = "alpine"};
                     const auto held = pool->acquire(container, false);
                     require(held.ok(), held.error());
                     const auto started = std::chrono::steady_clock::now();
                     const auto waited = pool->acquire(container, false);
                     require(!waited.ok() && waited.kind() == ErrorKind::PoolExhausted,
                             "second acquire should exhaust");
                     require(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(90),
                             "acquire should wait for the timeout");
                   }});

  tests.push_back({"acquire_wait_honours_cancellation", [] {
                     PoolFixture fixture;
                     auto pool = fixture.make_pool(small_pool(0, 1));
                     const ct::ContainerConfig container{.image = "alpine"};
                     const auto held = pool->acquire(container, false);
                     require(held.ok(), held.error());
                     crucible::common::CancellationToken cancel;
                     std::thread canceller([cancel]() mutable {
                       std::this_thread::sleep_for(std::chrono::milliseconds(50));
                       cancel.cancel();
                     });
                     const auto waited = pool->acquire(container, false, {}, &cancel);
                     canceller.join();
                     require(!waited.ok() && waited.kind() == ErrorKind::Cancelled,
                             "cancelled wait should report cancellation");
                   }});

  tests.push_back({"maintenance_evicts_idle_and_restores_min_size", [] {
                     crucible::testing::ObserverScope scope;
                     PoolFixture fixture;
                     auto config = small_pool(1, 2);
                     config.idle_timeout_ms = 20;
                     auto pool = fixture.make_pool(config);
                     const ct::ContainerConfig container{.image = "alpine"};
                     const auto handle = pool->acquire(container, false);
                     require(handle.ok(), handle.error());
                     const std::string evicted_id = handle.value()->id();
                     pool->release(handle.value(), true);

                     std::this_thread::sleep_for(std::chrono::milliseconds(60));
                     pool->run_maintenance();

                     require(handle.value()->state() == ct::ContainerState::Evicted,
                             "idle container should be evicted");
                     require(!fixture.runtime->exists(evicted_id), "evicted container removed");
                     const auto stats = pool->stats();
                     require(stats.size() == 1 && stats[0].idle == 1 && stats[0].live == 1,
                             "a replacement keeps min_size idle");
                     require(fixture.runtime->live_count() == 1, "exactly one live container");
                     const auto evictions =
                         scope.observer().events_of<crucible::observability::PoolEvictionEvent>();
                     require(evictions.size() == 1, "eviction reported to the observer");
                   }});

  tests.push_back({"background_maintenance_runs_until_stopped", [] {
                     PoolFixture fixture;
                     auto pool = fixture.make_pool(small_pool(2, 3));
                     const ct::ContainerConfig container{.image = "alpine"};
                     const auto handle = pool->acquire(container, false);
                     require(handle.ok(), handle.error());
                     pool->release(handle.value(), true);

                     pool->start();
                     require(pool->is_running(), "maintenance thread should run");
                     const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
                     while (pool->stats()[0].idle < 2 && std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(20));
                     }
                     pool->stop();
                     require(!pool->is_running(), "maintenance thread should stop");
                     require(pool->stats()[0].idle == 2, "pool warmed up to min_size");
                   }});

  tests.push_back({"short_maintenance_interval_is_honoured", [] {
                     PoolFixture fixture;
                     auto config = small_pool(0, 2);
                     config.idle_timeout_ms = 5;
                     config.maintenance_interval_ms = 10;
                     auto pool = fixture.make_pool(config);
                     const ct::ContainerConfig container{.image = "alpine"};
                     const auto handle = pool->acquire(container, false);
                     require(handle.ok(), handle.error());
                     pool->release(handle.value(), true);

                     const auto started = std::chrono::steady_clock::now();
                     pool->start();
                     while (fixture.runtime->removed_count() == 0 &&
                            std::chrono::steady_clock::now() - started < std::chrono::milliseconds(90)) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(2));
                     }
                     pool->stop();
                     require(fixture.runtime->removed_count() == 1, "idle handle evicted within a few ticks");
                     require(handle.value()->state() == ct::ContainerState::Evicted, "evicted state");
                   }});

  tests.push_back({"stop_wakes_maintenance_thread", [] {
                     PoolFixture fixture;
                     auto config = small_pool(0, 2);
                     config.maintenance_interval_ms = 60'000;
                     auto pool = fixture.make_pool(config);
                     pool->start();
                     std::this_thread::sleep_for(std::chrono::milliseconds(20));
                     const auto before = std::chrono::steady_clock::now();
                     pool->stop();
                     require(std::chrono::steady_clock::now() - before < std::chrono::milliseconds(50),
                             "stop does not wait out the interval");
                     require(!pool->is_running(), "stopped");
                   }});

  tests.push_back({"named_config_gets_unique_container_names", [] {
                     PoolFixture fixture;
                     auto pool = fixture.make_pool(small_pool(0, 2));
                     ct::ContainerConfig container{.image = "alpine"};
                     container.name = "worker";
                     const auto first = pool->acquire(container, false);
                     const auto second = pool->acquire(container, false);
                     require(first.ok(), first.error());
                     require(second.ok(), second.error());
                     require(first.value()->name() != second.value()->name(), "names differ");
                     require(first.value()->name().rfind("worker-", 0) == 0,
                             "requested name kept as prefix: " + first.value()->name());
                     require(second.value()->name().rfind("worker-", 0) == 0,
                             "requested name kept as prefix: " + second.value()->name());
                     require(fixture.runtime->live_count() == 2, "both containers live");
                     require(pool->stats().size() == 1, "one bucket for the shared config");
                   }});

  tests.push_back({"shutdown_releases_idle_and_rejects_acquire", [] {
                     PoolFixture fixture;
                     auto pool = fixture.make_pool(small_pool(0, 2));
                     const ct::ContainerConfig container{.image = "alpine"};
                     const auto handle = pool->acquire(container, false);
                     require(handle.ok(), handle.error());
                     pool->release(handle.value(), true);
                     pool->shutdown();
                     require(fixture.runtime->live_count() == 0, "idle containers torn down");
                     require(pool->acquire(container, false).kind() == ErrorKind::PoolExhausted,
                             "shut down pool rejects acquires");
                   }});

  tests.push_back({"shared_workspace_is_stable_per_key", [] {
                     PoolFixture fixture;
                     auto pool = fixture.make_pool(small_pool(0, 2));
                     const ct::ContainerConfig container{.image = "alpine"};
                     const auto a = pool->acquire(container, true);
                     const auto b = pool->acquire(container, true);
                     require(a.ok() && b.ok(), "two shared containers");
                     require(a.value()->workspace_dir() == b.value()->workspace_dir(),
                             "shared containers share one workspace");
                     const auto c = pool->acquire(container, false);
                     require(c.ok(), c.error());
                     require(c.value()->workspace_dir() != a.value()->workspace_dir(),
                             "isolated container gets its own workspace");
                   }});
}
