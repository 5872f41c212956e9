#include "test_framework.hpp"

#include "crucible/container/container.hpp"
#include "crucible/container/provisioner.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

void register_container_tests(std::vector<crucible::tests::TestCase> &tests) {
  using crucible::tests::require;
  namespace ct = crucible::container;
  using crucible::common::ErrorKind;
  using crucible::testing::FakeContainerRuntime;
  using crucible::testing::TempWorkspace;

  tests.push_back({"handle_follows_lifecycle_transitions", [] {
                     ct::ContainerHandle handle("id-1", "crucible-x", "alpine:3.20", "/tmp/ws");
                     require(handle.state() == ct::ContainerState::Provisioning, "starts provisioning");
                     require(!handle.begin_execution().ok(), "cannot execute before ready");
                     require(handle.transition(ct::ContainerState::Ready).ok(), "provisioning → ready");
                     require(handle.begin_execution().ok(), "ready → executing");
                     require(!handle.begin_execution().ok(), "second execution must wait");
                     require(!handle.transition(ct::ContainerState::Evicted).ok(),
                             "executing handle cannot be evicted");
                     require(handle.finish_execution().ok(), "executing → ready");
                     require(handle.meta().execution_count == 1, "execution counted");
                     require(handle.meta().last_executed_at.has_value(), "execution time stamped");
                     require(handle.transition(ct::ContainerState::Released).ok(), "ready → released");
                     require(!handle.transition(ct::ContainerState::Ready).ok(),
                             "terminal state is final");
                     require(!handle.transition(ct::ContainerState::Destroyed).ok(),
                             "terminal state cannot be destroyed again");
                   }});

  tests.push_back({"handle_accumulates_generated_files", [] {
                     ct::ContainerHandle handle("id-1", "n", "alpine", "/tmp/ws");
                     (void)handle.merge_generated_files({"b.txt"});
                     const auto merged = handle.merge_generated_files({"a.txt", "b.txt"});
                     require(merged == std::vector<std::string>{"a.txt", "b.txt"},
                             "union, sorted and without duplicates");
                     require(handle.meta().session_generated_files == merged, "meta mirrors the set");
                   }});

  tests.push_back({"state_names_are_stable", [] {
                     require(ct::container_state_to_string(ct::ContainerState::Executing) == "executing",
                             "executing name");
                     require(ct::is_terminal_state(ct::ContainerState::Evicted), "evicted is terminal");
                     require(!ct::is_terminal_state(ct::ContainerState::Ready), "ready is not terminal");
                   }});

  tests.push_back({"provisioner_creates_started_ready_container", [] {
                     TempWorkspace workspace;
                     auto runtime = std::make_shared<FakeContainerRuntime>();
                     ct::ContainerProvisioner provisioner(runtime, {.retries = 0, .backoff_ms = 0});
                     const auto handle =
                         provisioner.provision({.image = "alpine:3.20"}, workspace.path() / "ws");
                     require(handle.ok(), handle.error());
                     require(handle.value()->state() == ct::ContainerState::Ready, "handle ready");
                     require(handle.value()->name().rfind("crucible-", 0) == 0, "generated name prefix");
                     require(std::filesystem::is_directory(workspace.path() / "ws"),
                             "workspace created");
                     const auto inspected = runtime->inspect(handle.value()->id());
                     require(inspected.ok() && inspected.value().running, "container running");

                     provisioner.destroy(handle.value(), ct::ContainerState::Released);
                     require(!runtime->exists(handle.value()->id()), "container removed");
                     require(handle.value()->state() == ct::ContainerState::Released, "final state");
                     provisioner.destroy(handle.value(), ct::ContainerState::Destroyed);
                     require(runtime->removed_count() == 1, "second destroy is a no-op");
                   }});

  tests.push_back({"provisioner_retries_transient_failures", [] {
                     TempWorkspace workspace;
                     auto runtime = std::make_shared<FakeContainerRuntime>();
                     runtime->fail_next_creates(2);
                     ct::ContainerProvisioner provisioner(runtime, {.retries = 2, .backoff_ms = 1});
                     const auto handle = provisioner.provision({.image = "alpine"}, workspace.path());
                     require(handle.ok(), handle.error());
                     require(runtime->created_count() == 1, "third attempt succeeds");
                   }});

  tests.push_back({"provisioner_gives_up_after_retries", [] {
                     TempWorkspace workspace;
                     auto runtime = std::make_shared<FakeContainerRuntime>();
                     runtime->fail_next_creates(5);
                     ct::ContainerProvisioner provisioner(runtime, {.retries = 1, .backoff_ms = 0});
                     const auto handle = provisioner.provision({.image = "alpine"}, workspace.path());
                     require(!handle.ok() && handle.kind() == ErrorKind::Provisioning,
                             "exhausted retries are a provisioning error");
                     require(handle.error().find("2 attempts") != std::string::npos,
                             "message names the attempt count: " + handle.error());
                     require(runtime->live_count() == 0, "nothing left behind");
                   }});

  tests.push_back({"provisioner_rejects_empty_image", [] {
                     TempWorkspace workspace;
                     ct::ContainerProvisioner provisioner(std::make_shared<FakeContainerRuntime>(),
                                                          {.retries = 0, .backoff_ms = 0});
                     require(provisioner.provision({}, workspace.path()).kind() ==
                                 ErrorKind::Configuration,
                             "empty image is a configuration error");
                   }});

  tests.push_back({"zip_mounts_are_copied_and_extracted", [] {
                     TempWorkspace workspace;
                     workspace.create_file("bundle.zip", "PK");
                     auto runtime = std::make_shared<FakeContainerRuntime>();
                     ct::ContainerProvisioner provisioner(runtime, {.retries = 0, .backoff_ms = 0});
                     ct::ContainerConfig config;
                     config.image = "alpine";
                     config.mounts = {{.type = crucible::runtime::MountType::Zip,
                                       .source = workspace.path() / "bundle.zip",
                                       .target = "/opt/app",
                                       .read_only = false}};
                     const auto handle = provisioner.provision(config, workspace.path() / "ws");
                     require(handle.ok(), handle.error());
                     require(runtime->copy_in_log().size() == 1, "archive copied in once");

                     bool extracted = false;
                     for (const auto &command : runtime->exec_log()) {
                       if (!command.empty() && command[0] == "unzip" && command.back() == "/opt/app") {
                         extracted = true;
                       }
                     }
                     require(extracted, "archive extracted to the mount target");
                   }});
}
