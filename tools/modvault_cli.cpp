#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "config/manager_config.hpp"
#include "nlohmann/json.hpp"
#include "tools/cli_commands.hpp"

namespace {

void PrintUsage() {
  std::cout
      << "Usage: modvault-cli [options] <command> [args]\n"
      << "Commands:\n"
      << "  init                                  Create an empty snapshot owned by --catalog-owner\n"
      << "  add-storage <address>                 Register a storage module\n"
      << "  add-version --features a,b [--init a] [--route sig=addr]...\n"
      << "                                        Append a feature set\n"
      << "  list-versions                         Summarize every feature set\n"
      << "  show-version <n>                      Print one feature set\n"
      << "  show-account <address>                Print an account record\n"
      << "  sign-hash --wallet w --to d [--value v] [--data hex] [--nonce n]\n"
      << "                                        Compute a multisig sign hash\n"
      << "Options:\n"
      << "  --data-dir <path>           Directory holding manager.snapshot (default: .)\n"
      << "  --snapshot <path>           Snapshot file (overrides --data-dir)\n"
      << "  --catalog-owner <address>   Catalog owner; also the caller for catalog changes\n"
      << "  --debug-log <path>          Append log lines to <path>\n"
      << "  --log-level <lvl>           debug, info, warn, error (default: info)\n"
      << "  --log-max-size-mb <mb>      Rotate the log after roughly <mb> megabytes\n"
      << "  --log-max-files <n>         Rotated log files to keep\n"
      << "  --log-to-stderr             Mirror log lines to stderr\n"
      << "  --conf <path>               Load options from modvault.conf (default: ./modvault.conf)\n"
      << "  --no-conf                   Disable config file loading\n";
}

}  // namespace

int main(int argc, char** argv) {
  try {
    std::vector<std::string> raw_args(argv + 1, argv + argc);
    for (const auto& arg : raw_args) {
      if (arg == "--help" || arg == "-h") {
        PrintUsage();
        return 0;
      }
    }
    std::vector<std::string> rest;
    const auto cfg = modvault::config::ParseManagerConfig(raw_args, &rest);
    modvault::config::ConfigureLogging(cfg);
    if (rest.empty()) {
      PrintUsage();
      return 1;
    }
    const std::string command = rest.front();
    rest.erase(rest.begin());
    const nlohmann::json response =
        modvault::cli::RunCommand(cfg, command, modvault::cli::SplitCommandArgs(rest));
    std::cout << response.dump(2) << "\n";
    return response.contains("reason") ? 2 : 0;
  } catch (const std::exception& ex) {
    std::cerr << "modvault-cli: " << ex.what() << "\n";
    return 1;
  }
}
