#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "primitives/address.hpp"

namespace modvault::primitives::serialize {

// Little-endian fixed-width integers and Bitcoin-style compact sizes, the
// encoding used by every on-disk record in this repository.
void WriteUint8(std::vector<std::uint8_t>* out, std::uint8_t value);
void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteAddress(std::vector<std::uint8_t>* out, const Address& address);
void WriteBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> data);

bool ReadUint8(std::span<const std::uint8_t> data, std::size_t* offset, std::uint8_t* value);
bool ReadUint32(std::span<const std::uint8_t> data, std::size_t* offset, std::uint32_t* value);
bool ReadUint64(std::span<const std::uint8_t> data, std::size_t* offset, std::uint64_t* value);
// Rejects non-canonical encodings.
bool ReadVarInt(std::span<const std::uint8_t> data, std::size_t* offset, std::uint64_t* value);
bool ReadAddress(std::span<const std::uint8_t> data, std::size_t* offset, Address* address);
bool ReadBytes(std::span<const std::uint8_t> data, std::size_t* offset,
               std::vector<std::uint8_t>* bytes);

}  // namespace modvault::primitives::serialize
