#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

enum class ErrorKind {
    SizeMismatch,        // filesystem size is not a multiple of the block size
    MissingInputFile,    // append target does not exist
    FilesystemCollision, // target range already occupied and overwrite not allowed
    InvalidBlockSize,    // encoder produced something other than 512 bytes
    MalformedBlock,      // bad magics, bad geometry or truncated stream
    AddressOutOfRange    // filesystem cannot be placed inside the section
};

constexpr const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SizeMismatch:        return "SizeMismatch";
        case ErrorKind::MissingInputFile:    return "MissingInputFile";
        case ErrorKind::FilesystemCollision: return "FilesystemCollision";
        case ErrorKind::InvalidBlockSize:    return "InvalidBlockSize";
        case ErrorKind::MalformedBlock:      return "MalformedBlock";
        case ErrorKind::AddressOutOfRange:   return "AddressOutOfRange";
    }
    return "Unknown";
}

class ContainerError : public std::runtime_error {
    ErrorKind errorKind;

public:
    ContainerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(errorKindName(kind)) + ": " + message), errorKind(kind) {}

    ErrorKind kind() const noexcept { return errorKind; }
};

// "0x1012c000"
inline std::string toHex(uint32_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(8) << value;
    return oss.str();
}
