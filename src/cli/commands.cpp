#include "crucible/cli/commands.hpp"

#include "crucible/common/fs.hpp"
#include "crucible/config/config.hpp"
#include "crucible/execution/engine.hpp"
#include "crucible/observability/factory.hpp"
#include "crucible/observability/global.hpp"
#include "crucible/tools/builtin/execute_code.hpp"
#include "crucible/tools/tool_registry.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace crucible::cli {

namespace {

std::string version_string() {
#ifdef CRUCIBLE_VERSION
  return std::string("crucible ") + CRUCIBLE_VERSION;
#else
  return "crucible 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated(std::vector<std::string> &args,
                                       const std::string &long_name,
                                       const std::string &short_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, short_name, value)) {
    values.push_back(value);
  }
  return values;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

common::Result<std::string> read_source(const std::string &path) {
  if (path == "-") {
    return common::Result<std::string>::success(read_stdin_all());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Result<std::string>::failure(common::ErrorKind::NotFound,
                                                "cannot read " + path);
  }
  std::ostringstream out;
  out << in.rdbuf();
  return common::Result<std::string>::success(out.str());
}

bool parse_positive(const std::string &raw, std::int64_t &out) {
  const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), out);
  return ec == std::errc() && end == raw.data() + raw.size() && out > 0;
}

common::Result<std::unique_ptr<execution::ExecutionEngine>> boot_engine() {
  using EngineResult = common::Result<std::unique_ptr<execution::ExecutionEngine>>;
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return EngineResult::failure(cfg.status());
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  return execution::ExecutionEngine::create(std::move(cfg.value()));
}

void print_help() {
  std::cout << version_string() << "\n\n"
            << "Usage: crucible [--config <path>] <command> [options]\n\n"
            << "Commands:\n"
            << "  run <language> [file|-]   Execute code in a container\n"
            << "      --dep <package>       Install a dependency first (repeatable)\n"
            << "      --timeout <ms>        Main run timeout\n"
            << "      --strategy <name>     per_execution, pool or per_session\n"
            << "      --session <id>        Session to run in\n"
            << "      --cwd <dir> --entry <file>  Run an existing app instead of inline code\n"
            << "      --cpus <n> --memory <size>  Resource limits\n"
            << "      --json                Print the result as JSON\n"
            << "      --verbose             Log each protocol step\n"
            << "  languages                 List registered languages\n"
            << "  tools                     List agent tools\n"
            << "  tool <name> [key=value]   Invoke an agent tool\n"
            << "  config-path               Print the config file location\n"
            << "  config validate           Check the configuration\n"
            << "  version                   Print the version\n";
}

int run_code(std::vector<std::string> args) {
  const auto dependencies = take_repeated(args, "--dep", "-d");
  std::string timeout_raw;
  std::string strategy_raw;
  std::string session_id;
  std::string cwd;
  std::string entry;
  std::string cpus_raw;
  std::string memory;
  (void)take_option(args, "--timeout", "-t", timeout_raw);
  (void)take_option(args, "--strategy", "-s", strategy_raw);
  (void)take_option(args, "--session", "", session_id);
  (void)take_option(args, "--cwd", "", cwd);
  (void)take_option(args, "--entry", "", entry);
  (void)take_option(args, "--cpus", "", cpus_raw);
  (void)take_option(args, "--memory", "", memory);
  const bool json = take_flag(args, "--json");
  const bool verbose = take_flag(args, "--verbose");

  if (args.empty()) {
    std::cerr << "usage: crucible run <language> [file|-]\n";
    return 2;
  }

  execution::ExecutionRequest request;
  request.language = args[0];
  request.dependencies = dependencies;
  request.verbose = verbose;

  if (!entry.empty()) {
    request.source = execution::RunApp{.cwd = cwd.empty() ? "." : cwd, .entry_file = entry};
  } else {
    auto code = read_source(args.size() > 1 ? args[1] : "-");
    if (!code.ok()) {
      std::cerr << code.error() << "\n";
      return 2;
    }
    request.source = execution::InlineCode{.code = code.value()};
  }

  if (!timeout_raw.empty()) {
    std::int64_t timeout_ms = 0;
    if (!parse_positive(timeout_raw, timeout_ms)) {
      std::cerr << "invalid --timeout: " << timeout_raw << "\n";
      return 2;
    }
    request.timeout = std::chrono::milliseconds(timeout_ms);
  }
  if (!cpus_raw.empty()) {
    try {
      request.cpu_limit = std::stod(cpus_raw);
    } catch (const std::exception &) {
      std::cerr << "invalid --cpus: " << cpus_raw << "\n";
      return 2;
    }
  }
  if (!memory.empty()) {
    request.memory_limit = memory;
  }

  if (!json) {
    request.streams.stdout_sink = std::make_shared<execution::CallbackSink>(
        [](std::string_view chunk) { std::cout << chunk << std::flush; });
    request.streams.stderr_sink = std::make_shared<execution::CallbackSink>(
        [](std::string_view chunk) { std::cerr << chunk << std::flush; });
    if (verbose) {
      request.streams.dependency_stderr_sink = std::make_shared<execution::CallbackSink>(
          [](std::string_view chunk) { std::cerr << chunk << std::flush; });
    }
  }

  auto engine = boot_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }

  execution::SessionConfig session_config;
  if (!strategy_raw.empty()) {
    auto strategy = execution::strategy_from_string(strategy_raw);
    if (!strategy.ok()) {
      std::cerr << strategy.error() << "\n";
      return 2;
    }
    session_config.strategy = strategy.value();
  } else {
    auto strategy = execution::strategy_from_string(
        engine.value()->config().execution.default_strategy);
    if (strategy.ok()) {
      session_config.strategy = strategy.value();
    }
  }
  if (!session_id.empty()) {
    session_config.session_id = session_id;
  }
  auto language = engine.value()->languages().resolve(request.language);
  if (language.ok()) {
    session_config.container.image = language.value()->default_image();
  }

  auto session = engine.value()->create_session(session_config);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    engine.value()->shutdown();
    return 1;
  }

  auto result = engine.value()->execute_code(session.value().session_id, request);
  const common::Status cleaned = engine.value()->cleanup_session(session.value().session_id);
  if (!cleaned.ok()) {
    std::cerr << cleaned.error() << "\n";
  }
  engine.value()->shutdown();

  if (!result.ok()) {
    std::cerr << common::error_kind_to_string(result.kind()) << ": " << result.error() << "\n";
    return 1;
  }
  const auto &outcome = result.value();
  if (json) {
    std::cout << tools::execution_result_json(outcome) << "\n";
  } else {
    if (outcome.status == execution::ExecutionStatus::DependencyInstallFailed) {
      std::cerr << outcome.dependency_stderr;
      std::cerr << "dependency installation failed\n";
    }
    for (const auto &file : outcome.generated_files) {
      std::cerr << "generated: " << file << "\n";
    }
  }
  return outcome.exit_code;
}

int run_languages() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto registry = languages::LanguageRegistry::with_builtins();
  auto registered = registry->register_config_languages(cfg.value().languages);
  if (!registered.ok()) {
    std::cerr << registered.error() << "\n";
    return 1;
  }
  for (const auto &id : registry->ids()) {
    auto language = registry->resolve(id);
    if (language.ok()) {
      std::cout << id << "\t" << language.value()->default_image() << "\n";
    }
  }
  return 0;
}

int run_tools(std::vector<std::string> args, const bool invoke) {
  auto engine = boot_engine();
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return 1;
  }
  std::shared_ptr<execution::ExecutionEngine> shared = std::move(engine.value());
  auto files = std::make_shared<workspace::FileTools>(shared->workspace_root());
  auto registry = tools::ToolRegistry::create_full(files, shared);

  if (!invoke) {
    for (const auto &spec : registry.all_specs()) {
      std::cout << spec.name << "\t" << spec.group << "\t" << spec.description << "\n";
    }
    shared->shutdown();
    return 0;
  }

  if (args.empty()) {
    std::cerr << "usage: crucible tool <name> [key=value]...\n";
    shared->shutdown();
    return 2;
  }
  tools::ITool *tool = registry.get_tool(args[0]);
  if (tool == nullptr) {
    std::cerr << "Unknown tool: " << args[0] << "\n";
    shared->shutdown();
    return 2;
  }

  tools::ToolArgs tool_args;
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto eq = args[i].find('=');
    if (eq == std::string::npos) {
      std::cerr << "expected key=value, got: " << args[i] << "\n";
      shared->shutdown();
      return 2;
    }
    tool_args[args[i].substr(0, eq)] = args[i].substr(eq + 1);
  }

  tools::ToolContext ctx;
  ctx.session_id = "cli";
  auto outcome = tool->execute(tool_args, ctx);
  const common::Status cleaned = shared->cleanup_session(ctx.session_id);
  if (!cleaned.ok()) {
    std::cerr << cleaned.error() << "\n";
  }
  shared->shutdown();
  if (!outcome.ok()) {
    std::cerr << outcome.error() << "\n";
    return 1;
  }
  std::cout << outcome.value().output << "\n";
  return outcome.value().success ? 0 : 1;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] != "validate") {
    std::cerr << "usage: crucible config validate\n";
    return 2;
  }
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "[FAIL] " << cfg.error() << "\n";
    return 1;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    std::cerr << "[FAIL] " << validated.error() << "\n";
    return 1;
  }
  for (const auto &warning : validated.value()) {
    std::cout << "[WARN] " << warning << "\n";
  }
  std::cout << "[OK] configuration is valid\n";
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  auto args = collect_args(argc, argv);
  if (!args.empty()) {
    args.erase(args.begin());
  }

  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 2;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_code(std::move(args));
  }
  if (subcommand == "languages") {
    return run_languages();
  }
  if (subcommand == "tools") {
    return run_tools(std::move(args), false);
  }
  if (subcommand == "tool") {
    return run_tools(std::move(args), true);
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace crucible::cli
