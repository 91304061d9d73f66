#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "input.hpp"
#include "print.hpp"

namespace fs = std::filesystem;

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("servantc", "0.1.0");
  program.add_description("Turn stateless function declarations into services");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log at debug level");

  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Parse and lower a declaration, reporting errors");
  check_cmd.add_argument("file").help("Declaration file (.svc)");

  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Print the declaration and implementation forms");
  dump_cmd.add_argument("--stage")
      .default_value(std::string("all"))
      .help("What to print: decl, impl or all");
  dump_cmd.add_argument("file").help("Declaration file (.svc)");

  argparse::ArgumentParser emit_cmd("emit");
  emit_cmd.add_description("Generate the C++ header for a declaration");
  emit_cmd.add_argument("-o").help("Output file (stdout if omitted)");
  emit_cmd.add_argument("file").help("Declaration file (.svc)");

  argparse::ArgumentParser call_cmd("call");
  call_cmd.add_description("Start the service and run calls in order");
  call_cmd.add_argument("file").help("Declaration file (.svc)");
  call_cmd.add_argument("calls").remaining().help(
      "Calls such as 'put(\"a\", 1)'");

  program.add_subparser(check_cmd);
  program.add_subparser(dump_cmd);
  program.add_subparser(emit_cmd);
  program.add_subparser(call_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    servant::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      servant::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  auto config = servant::driver::LoadRuntimeConfig();
  if (!config) {
    return 1;
  }
  spdlog::set_level(
      program.get<bool>("--verbose") ? spdlog::level::debug
                                     : config->log_level);
  if (!config->root_dir.empty()) {
    spdlog::debug(
        "using {}",
        (config->root_dir / servant::config::kConfigFileName).string());
  }

  try {
    if (program.is_subcommand_used("check")) {
      return servant::driver::CheckCommand(check_cmd);
    }
    if (program.is_subcommand_used("dump")) {
      return servant::driver::DumpCommand(dump_cmd);
    }
    if (program.is_subcommand_used("emit")) {
      return servant::driver::EmitCommand(emit_cmd);
    }
    if (program.is_subcommand_used("call")) {
      if (!call_cmd.is_used("calls")) {
        servant::driver::PrintError("no calls given");
        return 1;
      }
      return servant::driver::CallCommand(call_cmd, *config);
    }
  } catch (const std::exception& e) {
    servant::driver::PrintError(e.what());
    return 1;
  }

  std::cout << program;
  return 0;
}
