#pragma once

#include <argparse/argparse.hpp>

#include "servant/config/runtime_config.hpp"

namespace servant::driver {

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int;
auto DumpCommand(const argparse::ArgumentParser& cmd) -> int;
auto EmitCommand(const argparse::ArgumentParser& cmd) -> int;
auto CallCommand(
    const argparse::ArgumentParser& cmd, const config::RuntimeConfig& config)
    -> int;

}  // namespace servant::driver
