#include "util/atomic_file.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace modvault::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

void SetError(std::string* error, std::string message) {
  if (error) {
    *error = std::move(message);
  }
}

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::string tmp_name =
      target.filename().string() + ".tmp." + std::to_string(now) + "." + std::to_string(nonce);
  return target.parent_path() / tmp_name;
}

bool WriteAndSync(const std::filesystem::path& path, std::span<const std::uint8_t> data,
                  std::string* error) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    SetError(error, "failed to open temp file for write: " + std::string(std::strerror(errno)));
    return false;
  }
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t rc = ::write(fd, data.data() + written, data.size() - written);
    if (rc < 0) {
      if (errno == EINTR) continue;
      SetError(error, "write failed: " + std::string(std::strerror(errno)));
      ::close(fd);
      return false;
    }
    written += static_cast<std::size_t>(rc);
  }
  if (::fsync(fd) != 0) {
    SetError(error, "fsync failed: " + std::string(std::strerror(errno)));
    ::close(fd);
    return false;
  }
  if (::close(fd) != 0) {
    SetError(error, "close failed: " + std::string(std::strerror(errno)));
    return false;
  }
  return true;
}

}  // namespace

bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      SetError(error, "create_directories failed: " + ec.message());
      return false;
    }
  }

  const auto tmp_path = MakeTempPath(path);
  if (!WriteAndSync(tmp_path, data, error)) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    SetError(error, "rename failed: " + ec.message());
    std::error_code remove_ec;
    std::filesystem::remove(tmp_path, remove_ec);
    return false;
  }
  return true;
}

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    SetError(error, "failed to open " + path.string());
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    SetError(error, "failed to read " + path.string());
    return false;
  }
  return true;
}

}  // namespace modvault::util
