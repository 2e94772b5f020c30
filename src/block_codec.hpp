#pragma once

#include "uf2.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

using Payload = std::array<uint8_t, uf2::PAYLOAD_SIZE>;

// How much a decoder trusts its input.
// Lenient mode skips every check, matching the historical tooling that never
// looked at the magics.
enum class MagicCheck {
    Strict,
    Lenient
};

struct DecodedBlock {
    uf2::UF2_Block_Header header;
    Payload payload;
};

/**
 * Encode one 512-byte block.
 * @param data Payload bytes, at most 256. Shorter data is zero padded.
 * @throws ContainerError(InvalidBlockSize) if the block would not be 512 bytes
 */
std::vector<uint8_t> encodeBlock(uint32_t flags, uint32_t familyId, uint32_t targetAddr,
                                 uint32_t blockNo, uint32_t numBlocks,
                                 std::span<const uint8_t> data);

/**
 * Decode one block.
 * @param block Exactly 512 bytes.
 * @throws ContainerError(MalformedBlock) on wrong length, and in strict mode
 *         on bad magics, payload_size != 256 or block_no >= num_blocks
 */
DecodedBlock decodeBlock(std::span<const uint8_t> block, MagicCheck check = MagicCheck::Strict);

// Little-endian word access shared by the codec and the binary info reader.
inline uint32_t readLong(std::span<const uint8_t> bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

inline void writeLong(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0x000000FF));
    out.push_back(static_cast<uint8_t>((value & 0x0000FF00) >> 8));
    out.push_back(static_cast<uint8_t>((value & 0x00FF0000) >> 16));
    out.push_back(static_cast<uint8_t>((value & 0xFF000000) >> 24));
}
