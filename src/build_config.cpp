#include "build_config.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <string>

void validateFilesystemSize(uint64_t fsSize, uint32_t blockSize)
{
    if (blockSize == 0) {
        throw ContainerError(ErrorKind::SizeMismatch, "block size must not be zero");
    }
    if (fsSize == 0) {
        throw ContainerError(ErrorKind::SizeMismatch, "filesystem image is empty");
    }
    if (fsSize % blockSize != 0) {
        throw ContainerError(ErrorKind::SizeMismatch,
            "filesystem size " + std::to_string(fsSize) + " is not a multiple of block size " +
            std::to_string(blockSize));
    }
}

std::vector<uint8_t> prepareFilesystem(std::vector<uint8_t> fsData, const BuildConfig& config)
{
    if (config.fsSize) {
        if (fsData.size() > *config.fsSize) {
            throw ContainerError(ErrorKind::SizeMismatch,
                "filesystem image is " + std::to_string(fsData.size()) +
                " bytes, larger than the declared size " + std::to_string(*config.fsSize));
        }
        fsData.resize(*config.fsSize, uf2::ERASED_BYTE);
    }

    validateFilesystemSize(fsData.size(), config.blockSize);
    return fsData;
}

uint32_t parseNumber(const std::string& value)
{
    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed, 0);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("not a number: " + value);
    }

    if (value.empty() || value[0] == '-' || consumed != value.size() || parsed > 0xFFFFFFFFull) {
        throw std::invalid_argument("not a 32-bit number: " + value);
    }
    return static_cast<uint32_t>(parsed);
}
