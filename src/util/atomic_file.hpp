#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace modvault::util {

// Replace `path` with `data` by writing a sibling temp file, syncing it and
// renaming it into place. Readers observe either the old or the new file.
bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error = nullptr);

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   std::string* error = nullptr);

}  // namespace modvault::util
