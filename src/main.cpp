#include <cmath>
#include <mutex>
#include <thread>
#include <memory>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <isobox/utils.h>
#include <isobox/config.h>
#include <isobox/logger.h>
#include <isobox/manager.h>
#include <isobox/isolate.h>
#include <isobox/local_sandbox.h>

namespace fs = std::filesystem;

namespace {

struct Options {
  Config config;
  ExecutionRequest request;
  int repeat = 1;
};

inline int64_t SecondsToUs(double sec) {
  return std::llround(sec * 1e6);
}

void ParseArgs(int argc, char** argv, Options* opts) {
  // everything after "--" is the command to run
  std::vector<std::string> command;
  int nargs = argc;
  for (int i = 1; i < argc; i++) {
    if (std::string(argv[i]) == "--") {
      nargs = i;
      command.assign(argv + i + 1, argv + argc);
      break;
    }
  }

  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "isobox-exec");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--sandbox")
    .help("Isolation primitive: isolate or local");
  parser.add_argument("--boxes")
    .scan<'d', int>()
    .help("Number of boxes in the pool");
  parser.add_argument("--time")
    .scan<'g', double>()
    .help("CPU time limit in seconds");
  parser.add_argument("--wall-time")
    .scan<'g', double>()
    .help("Wall clock limit in seconds");
  parser.add_argument("--mem")
    .scan<'d', long>()
    .help("Memory limit in KiB");
  parser.add_argument("--output")
    .scan<'d', long>()
    .help("Output limit per stream in KiB");
  parser.add_argument("--processes")
    .scan<'d', int>()
    .help("Maximum number of processes and threads");
  parser.add_argument("--stack")
    .scan<'d', long>()
    .help("Stack size limit in KiB");
  parser.add_argument("--stdin")
    .help("File fed to the program's standard input");
  parser.add_argument("--repeat")
    .scan<'d', int>()
    .default_value(1)
    .help("Number of concurrent executions of the command");

  try {
    parser.parse_args(std::vector<std::string>(argv, argv + nargs));
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }
  if (command.empty()) {
    std::cerr << "No command given; usage: isobox-exec [OPTIONS] -- EXECUTABLE [ARGS...]" << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }

  Config& config = opts->config;
  if (auto path = parser.present("--config")) {
    if (!ParseConfig(path.value(), &config)) {
      spdlog::error("Failed to parse configuration file {}", path.value());
      exit(1);
    }
  }
  if (auto val = parser.present("--sandbox")) {
    if (!GetSandboxType(val.value(), &config.sandbox)) {
      spdlog::error("Unknown sandbox type {}", val.value());
      exit(1);
    }
  }
  if (auto val = parser.present<int>("--boxes")) {
    if (val.value() <= 0) {
      spdlog::error("--boxes must be positive");
      exit(1);
    }
    config.manager.boxes = val.value();
  }

  ExecutionRequest& req = opts->request;
  req.executable = command[0];
  req.args.assign(command.begin() + 1, command.end());
  if (auto val = parser.present<double>("--time")) req.limits.cpu_time = SecondsToUs(val.value());
  if (auto val = parser.present<double>("--wall-time")) req.limits.wall_time = SecondsToUs(val.value());
  if (auto val = parser.present<long>("--mem")) req.limits.memory = val.value() * 1024;
  if (auto val = parser.present<long>("--output")) req.limits.output = val.value() * 1024;
  if (auto val = parser.present<int>("--processes")) req.limits.processes = val.value();
  if (auto val = parser.present<long>("--stack")) req.limits.stack = val.value() * 1024;
  if (auto val = parser.present("--stdin")) req.stdin_file = val.value();
  opts->repeat = parser.get<int>("--repeat");
  if (opts->repeat <= 0) {
    spdlog::error("--repeat must be positive");
    exit(1);
  }
}

std::unique_ptr<Sandbox> MakeSandbox(const Config& config) {
  switch (config.sandbox) {
    case SandboxType::ISOLATE: return std::make_unique<IsolateSandbox>(config.isolate);
    case SandboxType::LOCAL: return std::make_unique<LocalSandbox>(config.box_root);
  }
  __builtin_unreachable();
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  Options opts;
  ParseArgs(argc, argv, &opts);
  if (opts.config.sandbox == SandboxType::LOCAL) {
    spdlog::warn("Using the local sandbox; programs are not isolated from the host");
  }

  spdlog::info("Using the {} sandbox with {} boxes from id {}", SandboxTypeName(opts.config.sandbox),
               opts.config.manager.boxes, opts.config.manager.first_box_id);
  auto sandbox = MakeSandbox(opts.config);
  BoxPool pool(opts.config.manager.boxes, opts.config.manager.first_box_id);
  ExecutionManager manager(pool, *sandbox, opts.config.manager);

  std::mutex out_mtx;
  bool all_ok = true;
  std::vector<std::thread> threads;
  for (int i = 0; i < opts.repeat; i++) {
    threads.emplace_back([&]() {
      ExecutionResult result;
      ExecuteStatus status = manager.Execute(opts.request, &result);
      nlohmann::json out = result.box_id >= 0 ? result.ToJson() : nlohmann::json::object();
      out["status"] = ExecuteStatusName(status);
      std::lock_guard lck(out_mtx);
      std::cout << out.dump() << std::endl;
      if (status != ExecuteStatus::OK) all_ok = false;
    });
  }
  for (auto& i : threads) i.join();
  spdlog::info("Finished {} executions, at most {} boxes in use", opts.repeat, pool.HighWaterMark());
  return all_ok ? 0 : 1;
}
