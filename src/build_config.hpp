#pragma once

#include "block_codec.hpp"
#include "uf2.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Everything one invocation needs to know. Built once by the front end and
// passed down by const reference.
struct BuildConfig {
    uint32_t fsStart = uf2::DEFAULT_FS_START;
    std::optional<uint32_t> fsSize;  // pad the image with erased bytes up to this
    uint32_t blockSize = uf2::FLASH_ERASE_BLOCK_SIZE;  // filesystem size granularity
    uint32_t familyId = static_cast<uint32_t>(uf2::FamilyID::RP2040);  // standalone images only
    bool sparse = false;
    bool overwrite = false;
    MagicCheck magicCheck = MagicCheck::Strict;
    bool verbose = false;
};

// Throws ContainerError(SizeMismatch) unless fsSize is a non-zero multiple of
// blockSize.
void validateFilesystemSize(uint64_t fsSize, uint32_t blockSize);

// Pad fsData with erased bytes up to config.fsSize, then validate its size.
// Throws ContainerError(SizeMismatch) if the image is larger than fsSize.
std::vector<uint8_t> prepareFilesystem(std::vector<uint8_t> fsData, const BuildConfig& config);

// Decimal, 0x-hex or 0-octal 32-bit value from the command line.
// Throws std::invalid_argument for anything else.
uint32_t parseNumber(const std::string& value);
