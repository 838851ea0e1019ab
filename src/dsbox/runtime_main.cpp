#include <iostream>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <dsbox/paths.h>
#include "runtime.h"

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "dsbox-runtime");
  parser.add_argument("workspace")
    .help("Directory holding data.csv and the request/response files");
  parser.add_argument("--shared")
    .default_value(false)
    .implicit_value(true)
    .help("Serve every request directory under the given directory");
  parser.add_argument("--poll-interval-ms")
    .scan<'d', int>()
    .default_value(500)
    .help("How often to look for a new request");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }

  fs::path workspace = parser.get<std::string>("workspace");
  std::chrono::milliseconds interval(parser.get<int>("--poll-interval-ms"));
  try {
    if (parser["--shared"] == true) {
      ServeShared(workspace, interval);
    } else {
      ServeWorkspace(workspace, interval);
    }
  } catch (const RuntimeSetupError& err) {
    spdlog::error("{}", err.what());
    return 1;
  }
}
