#include "block_codec.hpp"
#include "errors.hpp"
#include <algorithm>

std::vector<uint8_t> encodeBlock(uint32_t flags, uint32_t familyId, uint32_t targetAddr,
                                 uint32_t blockNo, uint32_t numBlocks,
                                 std::span<const uint8_t> data)
{
    std::vector<uint8_t> block;
    block.reserve(uf2::BLOCK_SIZE);

    writeLong(block, uf2::MAGIC_START0);
    writeLong(block, uf2::MAGIC_START1);
    writeLong(block, flags);
    writeLong(block, targetAddr);
    writeLong(block, uf2::DATA_SIZE);
    writeLong(block, blockNo);
    writeLong(block, numBlocks);
    writeLong(block, familyId);

    block.insert(block.end(), data.begin(), data.end());
    if (data.size() < uf2::PAYLOAD_SIZE) {
        block.resize(uf2::HEADER_SIZE + uf2::PAYLOAD_SIZE, 0x00);
    }
    block.resize(block.size() + uf2::PADDING_SIZE, 0x00);

    writeLong(block, uf2::MAGIC_END);

    if (block.size() != uf2::BLOCK_SIZE) {
        throw ContainerError(ErrorKind::InvalidBlockSize,
            "block for address " + toHex(targetAddr) + " encoded to " +
            std::to_string(block.size()) + " bytes, expected " + std::to_string(uf2::BLOCK_SIZE));
    }

    return block;
}

DecodedBlock decodeBlock(std::span<const uint8_t> block, MagicCheck check)
{
    if (block.size() != uf2::BLOCK_SIZE) {
        throw ContainerError(ErrorKind::MalformedBlock,
            "block is " + std::to_string(block.size()) + " bytes, expected " + std::to_string(uf2::BLOCK_SIZE));
    }

    DecodedBlock decoded;
    auto& header = decoded.header;
    header.magic_start0 = readLong(block, 0);
    header.magic_start1 = readLong(block, 4);
    header.flags        = readLong(block, 8);
    header.target_addr  = readLong(block, 12);
    header.payload_size = readLong(block, 16);
    header.block_no     = readLong(block, 20);
    header.num_blocks   = readLong(block, 24);
    header.family_id    = readLong(block, 28);

    auto payload = block.subspan(uf2::HEADER_SIZE, uf2::PAYLOAD_SIZE);
    std::copy(payload.begin(), payload.end(), decoded.payload.begin());

    if (check == MagicCheck::Lenient) {
        return decoded;
    }

    if (!header.has_valid_magic()) {
        throw ContainerError(ErrorKind::MalformedBlock,
            "bad start magic " + toHex(header.magic_start0) + " " + toHex(header.magic_start1) +
            " in block for address " + toHex(header.target_addr));
    }
    uint32_t endMagic = readLong(block, uf2::MAGIC_END_OFFSET);
    if (endMagic != uf2::MAGIC_END) {
        throw ContainerError(ErrorKind::MalformedBlock,
            "bad end magic " + toHex(endMagic) + " in block for address " + toHex(header.target_addr));
    }
    if (header.payload_size != uf2::DATA_SIZE) {
        throw ContainerError(ErrorKind::MalformedBlock,
            "unsupported payload size " + std::to_string(header.payload_size) +
            " in block for address " + toHex(header.target_addr));
    }
    if (header.block_no >= header.num_blocks) {
        throw ContainerError(ErrorKind::MalformedBlock,
            "block number " + std::to_string(header.block_no) + " out of range (num_blocks " +
            std::to_string(header.num_blocks) + ") at address " + toHex(header.target_addr));
    }

    return decoded;
}
