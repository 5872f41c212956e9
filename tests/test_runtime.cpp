#include "test_framework.hpp"

#include "crucible/runtime/docker_runtime.hpp"

#include <algorithm>
#include <deque>
#include <memory>

namespace {

namespace rt = crucible::runtime;

/// Records docker invocations and answers from a queue of scripted results.
class ScriptedDockerRunner final : public rt::IDockerRunner {
public:
  [[nodiscard]] crucible::common::Result<rt::DockerProcessResult>
  run(const std::vector<std::string> &args, const rt::DockerCommandOptions &options) override {
    calls.push_back(args);
    last_options_timeout = options.timeout;
    if (!responses.empty()) {
      auto next = responses.front();
      responses.pop_front();
      return crucible::common::Result<rt::DockerProcessResult>::success(next);
    }
    rt::DockerProcessResult ok;
    if (!args.empty() && args[0] == "create") {
      ok.stdout_text = "abc123\n";
    }
    return crucible::common::Result<rt::DockerProcessResult>::success(ok);
  }

  std::vector<std::vector<std::string>> calls;
  std::deque<rt::DockerProcessResult> responses;
  std::chrono::milliseconds last_options_timeout{0};
};

bool contains_sequence(const std::vector<std::string> &args,
                       const std::vector<std::string> &sequence) {
  return std::search(args.begin(), args.end(), sequence.begin(), sequence.end()) != args.end();
}

} // namespace

void register_runtime_tests(std::vector<crucible::tests::TestCase> &tests) {
  using crucible::tests::require;
  using crucible::common::ErrorKind;

  tests.push_back({"create_args_carry_isolation_limits_and_mounts", [] {
                     crucible::config::DockerConfig config;
                     config.cap_drop = {"ALL"};
                     config.pids_limit = 128;
                     rt::ContainerSpec spec;
                     spec.name = "crucible-abc";
                     spec.image = "python:3.12-slim";
                     spec.workspace_dir = "/host/ws";
                     spec.mounts = {
                         {.type = rt::MountType::Directory, .source = "/host/data", .target = "/data",
                          .read_only = true},
                         {.type = rt::MountType::Zip, .source = "/host/app.zip", .target = "/app",
                          .read_only = false},
                     };
                     spec.env = {{"MODE", "test"}};
                     spec.ports = {8080};
                     spec.limits = {.cpus = 1.5, .memory = "256m"};
                     spec.labels = {{"crucible.workspace", "/host/ws"}};

                     const auto args = rt::build_docker_create_args(config, spec);
                     require(args.front() == "create", "create subcommand first");
                     require(contains_sequence(args, {"--name", "crucible-abc"}), "name flag");
                     require(contains_sequence(args, {"--label", "crucible.managed=1"}), "managed label");
                     require(contains_sequence(args, {"--cap-drop", "ALL"}), "cap drop");
                     require(contains_sequence(args, {"--security-opt", "no-new-privileges"}),
                             "no new privileges");
                     require(contains_sequence(args, {"--pids-limit", "128"}), "pids limit");
                     require(contains_sequence(args, {"--cpus", "1.50"}), "cpu limit formatted");
                     require(contains_sequence(args, {"--memory", "256m", "--memory-swap", "256m"}),
                             "memory limit without extra swap");
                     require(contains_sequence(args, {"-v", "/host/ws:/workspace"}), "workspace mount");
                     require(contains_sequence(args, {"-v", "/host/data:/data:ro"}), "read-only mount");
                     require(std::find(args.begin(), args.end(), "/host/app.zip:/app") == args.end(),
                             "zip archives are not bind mounted");
                     require(contains_sequence(args, {"-p", "8080:8080"}), "port mapping");
                     require(contains_sequence(args, {"--env", "MODE=test"}), "env");
                     require(contains_sequence(args, {"python:3.12-slim", "sleep", "infinity"}),
                             "image followed by keep-alive command");
                   }});

  tests.push_back({"exec_args_put_env_before_container", [] {
                     crucible::config::DockerConfig config;
                     rt::ExecSpec spec;
                     spec.command = {"python", "code.py"};
                     spec.env = {{"A", "1"}};
                     const auto args = rt::build_docker_exec_args(config, "cid", spec);
                     const std::vector<std::string> expected = {"exec", "-w", "/workspace", "-e",
                                                                "A=1",  "cid", "python",    "code.py"};
                     require(args == expected, "exec args mismatch");
                   }});

  tests.push_back({"exec_updates_limits_only_when_they_change", [] {
                     auto runner = std::make_shared<ScriptedDockerRunner>();
                     rt::DockerContainerRuntime runtime(crucible::config::DockerConfig{}, runner);
                     rt::ContainerSpec spec;
                     spec.image = "alpine:3.20";
                     spec.limits = {.cpus = 1.0, .memory = std::nullopt};
                     const auto id = runtime.create(spec);
                     require(id.ok() && id.value() == "abc123", "container id from stdout");

                     rt::ExecSpec same;
                     same.command = {"sh", "script.sh"};
                     same.limits = spec.limits;
                     require(runtime.exec(id.value(), same).ok(), "exec with same limits");
                     require(runner->calls.back()[0] == "exec", "no update for unchanged limits");

                     rt::ExecSpec changed = same;
                     changed.limits = {.cpus = 2.0, .memory = "1g"};
                     require(runtime.exec(id.value(), changed).ok(), "exec with new limits");
                     const auto &update = runner->calls[runner->calls.size() - 2];
                     require(update[0] == "update" && update.back() == "abc123",
                             "docker update precedes exec");
                     require(contains_sequence(update, {"--cpus", "2.00"}), "updated cpu limit");
                   }});

  tests.push_back({"exec_reports_exit_code_and_timeout", [] {
                     auto runner = std::make_shared<ScriptedDockerRunner>();
                     rt::DockerContainerRuntime runtime(crucible::config::DockerConfig{}, runner);
                     runner->responses.push_back(
                         {.exit_code = 3, .stdout_text = "out", .stderr_text = "err",
                          .timed_out = false, .cancelled = false});
                     runner->responses.push_back(
                         {.exit_code = -1, .stdout_text = "", .stderr_text = "",
                          .timed_out = true, .cancelled = false});

                     rt::ExecSpec spec;
                     spec.command = {"sh", "script.sh"};
                     spec.timeout = std::chrono::milliseconds(250);
                     const auto failed = runtime.exec("cid", spec);
                     require(failed.ok(), failed.error());
                     require(failed.value().exit_code == 3 && failed.value().stderr_text == "err",
                             "non-zero exit is a normal outcome");
                     require(runner->last_options_timeout.count() == 250, "timeout forwarded");

                     const auto timed_out = runtime.exec("cid", spec);
                     require(timed_out.ok() && timed_out.value().timed_out, "timeout flagged");
                   }});

  tests.push_back({"remove_tolerates_missing_container", [] {
                     auto runner = std::make_shared<ScriptedDockerRunner>();
                     rt::DockerContainerRuntime runtime(crucible::config::DockerConfig{}, runner);
                     runner->responses.push_back({.exit_code = 1,
                                                  .stdout_text = "",
                                                  .stderr_text = "Error: No such container: gone",
                                                  .timed_out = false,
                                                  .cancelled = false});
                     require(runtime.remove("gone").ok(), "missing container is already removed");

                     runner->responses.push_back({.exit_code = 1,
                                                  .stdout_text = "",
                                                  .stderr_text = "permission denied",
                                                  .timed_out = false,
                                                  .cancelled = false});
                     const auto failed = runtime.remove("cid");
                     require(!failed.ok() && failed.kind() == ErrorKind::Cleanup,
                             "other failures are cleanup errors");
                   }});

  tests.push_back({"inspect_parses_state_and_image", [] {
                     auto runner = std::make_shared<ScriptedDockerRunner>();
                     rt::DockerContainerRuntime runtime(crucible::config::DockerConfig{}, runner);
                     runner->responses.push_back({.exit_code = 0,
                                                  .stdout_text = "true node:20-alpine\n",
                                                  .stderr_text = "",
                                                  .timed_out = false,
                                                  .cancelled = false});
                     const auto inspected = runtime.inspect("cid");
                     require(inspected.ok(), inspected.error());
                     require(inspected.value().exists && inspected.value().running,
                             "running container");
                     require(inspected.value().image == "node:20-alpine", "image parsed");

                     runner->responses.push_back({.exit_code = 1,
                                                  .stdout_text = "",
                                                  .stderr_text = "No such object",
                                                  .timed_out = false,
                                                  .cancelled = false});
                     const auto missing = runtime.inspect("gone");
                     require(missing.ok() && !missing.value().exists, "missing container");
                   }});

  tests.push_back({"create_with_empty_image_fails_before_docker", [] {
                     auto runner = std::make_shared<ScriptedDockerRunner>();
                     rt::DockerContainerRuntime runtime(crucible::config::DockerConfig{}, runner);
                     const auto created = runtime.create(rt::ContainerSpec{});
                     require(!created.ok() && created.kind() == ErrorKind::Provisioning,
                             "empty image is a provisioning error");
                     require(runner->calls.empty(), "docker must not be invoked");
                   }});
}
