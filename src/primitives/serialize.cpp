#include "primitives/serialize.hpp"

#include <algorithm>
#include <limits>

namespace modvault::primitives::serialize {

namespace {

bool Require(std::span<const std::uint8_t> data, std::size_t offset, std::size_t needed) {
  return offset <= data.size() && needed <= data.size() - offset;
}

std::uint64_t ReadLittleEndian(std::span<const std::uint8_t> data, std::size_t offset,
                               std::size_t width) {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    value |= static_cast<std::uint64_t>(data[offset + i]) << (8 * i);
  }
  return value;
}

}  // namespace

void WriteUint8(std::vector<std::uint8_t>* out, std::uint8_t value) { out->push_back(value); }

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  out->push_back(static_cast<std::uint8_t>(value & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value) {
  if (value < 0xFD) {
    out->push_back(static_cast<std::uint8_t>(value));
  } else if (value <= 0xFFFF) {
    out->push_back(0xFD);
    out->push_back(static_cast<std::uint8_t>(value & 0xFFu));
    out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
  } else if (value <= 0xFFFFFFFF) {
    out->push_back(0xFE);
    WriteUint32(out, static_cast<std::uint32_t>(value));
  } else {
    out->push_back(0xFF);
    WriteUint64(out, value);
  }
}

void WriteAddress(std::vector<std::uint8_t>* out, const Address& address) {
  out->insert(out->end(), address.begin(), address.end());
}

void WriteBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> data) {
  WriteVarInt(out, data.size());
  out->insert(out->end(), data.begin(), data.end());
}

bool ReadUint8(std::span<const std::uint8_t> data, std::size_t* offset, std::uint8_t* value) {
  if (!Require(data, *offset, 1)) return false;
  *value = data[*offset];
  *offset += 1;
  return true;
}

bool ReadUint32(std::span<const std::uint8_t> data, std::size_t* offset, std::uint32_t* value) {
  if (!Require(data, *offset, 4)) return false;
  *value = static_cast<std::uint32_t>(ReadLittleEndian(data, *offset, 4));
  *offset += 4;
  return true;
}

bool ReadUint64(std::span<const std::uint8_t> data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 8)) return false;
  *value = ReadLittleEndian(data, *offset, 8);
  *offset += 8;
  return true;
}

bool ReadVarInt(std::span<const std::uint8_t> data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 1)) return false;
  const std::uint8_t prefix = data[*offset];
  *offset += 1;
  if (prefix < 0xFD) {
    *value = prefix;
    return true;
  }
  const std::size_t width = prefix == 0xFD ? 2 : (prefix == 0xFE ? 4 : 8);
  if (!Require(data, *offset, width)) return false;
  const std::uint64_t decoded = ReadLittleEndian(data, *offset, width);
  *offset += width;
  const std::uint64_t minimum = prefix == 0xFD ? 0xFD : (prefix == 0xFE ? 0x10000 : 0x100000000ULL);
  if (decoded < minimum) {
    return false;
  }
  *value = decoded;
  return true;
}

bool ReadAddress(std::span<const std::uint8_t> data, std::size_t* offset, Address* address) {
  if (!Require(data, *offset, address->size())) return false;
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(*offset), address->size(),
              address->begin());
  *offset += address->size();
  return true;
}

bool ReadBytes(std::span<const std::uint8_t> data, std::size_t* offset,
               std::vector<std::uint8_t>* bytes) {
  std::uint64_t size = 0;
  if (!ReadVarInt(data, offset, &size)) return false;
  if (size > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max()) ||
      !Require(data, *offset, static_cast<std::size_t>(size))) {
    return false;
  }
  const auto begin = data.begin() + static_cast<std::ptrdiff_t>(*offset);
  bytes->assign(begin, begin + static_cast<std::ptrdiff_t>(size));
  *offset += static_cast<std::size_t>(size);
  return true;
}

}  // namespace modvault::primitives::serialize
