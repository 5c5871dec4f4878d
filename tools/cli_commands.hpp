#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config/manager_config.hpp"
#include "nlohmann/json.hpp"

namespace modvault::cli {

struct CommandArgs {
  std::vector<std::string> positional;
  std::vector<std::pair<std::string, std::string>> flags;

  std::optional<std::string> Flag(std::string_view name) const;
};

// "--name value" pairs become flags, everything else is positional. Throws
// when a flag has no value.
CommandArgs SplitCommandArgs(const std::vector<std::string>& rest);

// Decimal or 0x-prefixed hex, digits only. Throws std::runtime_error.
std::uint64_t ParseUint64(const std::string& text, std::string_view label);

// Runs one command against the snapshot named by `cfg`. Catalog refusals
// come back as a JSON object with a "reason" key; anything else that goes
// wrong throws.
nlohmann::json RunCommand(const config::ManagerConfig& cfg, const std::string& command,
                          const CommandArgs& args);

}  // namespace modvault::cli
