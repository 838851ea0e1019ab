#include <unistd.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <dsbox/config.h>
#include <dsbox/logger.h>
#include <dsbox/executor.h>
#include <dsbox/data_source.h>
#include <dsbox/result_codec.h>

namespace fs = std::filesystem;

namespace {

const char kDefaultConfig[] = "/etc/dsbox.conf";

struct Options {
  ExecutorConfig config;
  fs::path data;
  std::string script;
  bool json = false;
  std::string figure;
};

Options ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "dsbox-exec");
  parser.add_argument("script")
    .help("Script to run, or - for standard input");
  parser.add_argument("-d", "--data")
    .required()
    .help("CSV file staged as the dataset");
  parser.add_argument("-c", "--config")
    .default_value(std::string(kDefaultConfig))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--image")
    .help("Docker image containing dsbox-runtime");
  parser.add_argument("--jail-root")
    .help("Root filesystem of the cjail sandbox");
  parser.add_argument("--data-dir")
    .help("Directory served by a shared dsbox-runtime worker");
  parser.add_argument("--memory-limit")
    .help("Memory ceiling of the sandbox, e.g. 512m");
  parser.add_argument("--cpu-shares")
    .scan<'d', int>()
    .help("Relative CPU weight of the sandbox");
  parser.add_argument("-t", "--timeout")
    .scan<'g', double>()
    .help("Seconds to wait for the result");
  parser.add_argument("--pinned-cpus")
    .help("Comma-separated list of CPUs for the jail, or simply \"all\"");
  parser.add_argument("--json")
    .default_value(false)
    .implicit_value(true)
    .help("Print the raw response envelope");
  parser.add_argument("--figure")
    .help("Write the rendered chart (if any) to this PNG file");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  Options opt;
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file, opt.config)) {
    // only an explicitly given file has to exist
    if (parser.is_used("--config")) {
      spdlog::error("Failed to parse configuration file {}", config_file.string());
      exit(1);
    }
    spdlog::info("No configuration file at {}; using defaults", config_file.string());
  }
  ApplyEnvironment(opt.config);
  if (auto val = parser.present("--image")) opt.config.image = *val;
  if (auto val = parser.present("--jail-root")) opt.config.jail_root = *val;
  if (auto val = parser.present("--data-dir")) opt.config.data_dir = *val;
  if (auto val = parser.present("--memory-limit")) opt.config.memory_limit = *val;
  if (auto val = parser.present<int>("--cpu-shares")) opt.config.cpu_shares = *val;
  if (auto val = parser.present<double>("--timeout")) {
    opt.config.timeout = std::chrono::milliseconds(long(*val * 1000));
  }
  if (auto val = parser.present("--pinned-cpus")) opt.config.pinned_cpus = *val;
  opt.data = parser.get<std::string>("--data");
  opt.script = parser.get<std::string>("script");
  opt.json = parser["--json"] == true;
  if (auto val = parser.present("--figure")) opt.figure = *val;
  return opt;
}

bool ReadScript(const std::string& name, std::string& code) {
  if (name == "-") {
    code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream fin(name, std::ios::binary);
  if (!fin) return false;
  code.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  Options opt = ParseArgs(argc, argv);
  std::string code;
  if (!ReadScript(opt.script, code)) {
    spdlog::error("Cannot read script {}", opt.script);
    return 1;
  }

  ExecuteResult res;
  try {
    auto source = std::make_shared<CsvDataSource>(opt.data);
    // a script rejected by the syntax check never provisions a sandbox
    ScopedExecutor executor(CreateExecutor(opt.config, source), StartPolicy::LAZY);
    res = executor->Execute(code);
  } catch (const ConfigError& err) {
    spdlog::error("Configuration error: {}", err.what());
    return 1;
  } catch (const LaunchError& err) {
    spdlog::error("Cannot start sandbox: {}", err.what());
    return 1;
  }

  if (opt.json) {
    std::cout << DumpResult(res) << std::endl;
  } else {
    std::cout << FormatResult(res) << std::endl;
  }
  if (opt.figure.size() && res.figure) {
    std::ofstream fout(opt.figure, std::ios::binary);
    if (!fout.write(res.figure->data(), res.figure->size())) {
      spdlog::error("Failed writing figure to {}", opt.figure);
      return 1;
    }
  }
  return res.success ? 0 : 2;
}
