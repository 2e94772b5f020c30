#pragma once

#include "section.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
// Pico SDK binary info
//
// Firmware built with the Pico SDK embeds a small table of program metadata.
// A header, word aligned near the start of the image, points at an array of
// entry pointers:
//
//   .word BI_MAGIC
//   .word entries_start    ; first entry pointer
//   .word entries_end      ; one past the last entry pointer
//   .word mapping_table    ; {source, dest, dest_end} triples, 0 terminated
//   .word BI_END
//
// Every entry starts with a 16-bit type and a two character tag.
// =============================================================================

namespace uf2::binary_info {

constexpr uint32_t BI_MAGIC = 0x7188ebf2;
constexpr uint32_t BI_END   = 0xe71aa390;

constexpr uint16_t TYPE_ID_AND_INT    = 5;
constexpr uint16_t TYPE_ID_AND_STRING = 6;
constexpr uint16_t TYPE_BLOCK_DEVICE  = 7;
constexpr uint16_t TYPE_PINS_WITH_FUNC = 8;
constexpr uint16_t TYPE_PINS_WITH_NAME = 9;
constexpr uint16_t TYPE_NAMED_GROUP    = 10;

// Low three bits of a pins-with-function word
constexpr uint32_t PIN_ENCODING_MULTI = 1;  // up to five 5-bit pin numbers
constexpr uint32_t PIN_ENCODING_RANGE = 2;  // low pin, then high pin

constexpr const char* gpio_function_name(uint8_t function) {
    switch (function) {
        case 0:   return "XIP";
        case 1:   return "SPI";
        case 2:   return "UART";
        case 3:   return "I2C";
        case 4:   return "PWM";
        case 5:   return "SIO";
        case 6:   return "PIO0";
        case 7:   return "PIO1";
        case 8:   return "GPCK";
        case 9:   return "USB";
        case 0xF: return "NULL";
    }
    return "unknown";
}

constexpr uint16_t make_tag(char c1, char c2) {
    return static_cast<uint16_t>((static_cast<uint8_t>(c2) << 8) | static_cast<uint8_t>(c1));
}

constexpr uint16_t TAG_RASPBERRY_PI = make_tag('R', 'P');
constexpr uint16_t TAG_MICROPYTHON  = make_tag('M', 'P');

constexpr uint32_t ID_PROGRAM_NAME              = 0x02031c86;
constexpr uint32_t ID_PROGRAM_VERSION_STRING    = 0x11a9bc3a;
constexpr uint32_t ID_PROGRAM_BUILD_DATE_STRING = 0x9da22254;
constexpr uint32_t ID_BINARY_END                = 0x68f465de;
constexpr uint32_t ID_PROGRAM_URL               = 0x1856239a;
constexpr uint32_t ID_PROGRAM_DESCRIPTION       = 0xb6a07c19;
constexpr uint32_t ID_PROGRAM_FEATURE           = 0xa1f4b453;
constexpr uint32_t ID_PROGRAM_BUILD_ATTRIBUTE   = 0x4275f0d3;
constexpr uint32_t ID_SDK_VERSION               = 0x5360b3ab;
constexpr uint32_t ID_PICO_BOARD                = 0xb63cffbb;
constexpr uint32_t ID_BOOT2_NAME                = 0x7f8882e1;

// Longest string the reader will follow before giving up on a terminator.
constexpr size_t MAX_STRING_LENGTH = 512;

} // namespace uf2::binary_info

// Read-only, address indexed view of section payloads.
class FlashView
{
    std::map<uint32_t, std::vector<uint8_t>> regions;

    const std::vector<uint8_t>* regionFor(uint32_t address, size_t length, uint32_t& base) const;

public:
    static FlashView fromSections(const std::vector<Section>& sections);

    void map(uint32_t address, std::vector<uint8_t> bytes);

    bool contains(uint32_t address, size_t length) const;
    std::optional<uint16_t> read16(uint32_t address) const;
    std::optional<uint32_t> read32(uint32_t address) const;

    const std::map<uint32_t, std::vector<uint8_t>>& mappedRegions() const { return regions; }
};

struct BlockDeviceInfo {
    std::string name;
    uint32_t address;
    uint32_t size;
    uint16_t flags;
};

struct PinInfo {
    std::optional<std::string> function;
    std::optional<std::string> name;
};

struct NamedGroupInfo {
    std::string label;
    uint32_t parentId;
    uint16_t flags;
    uint16_t tag;
    uint32_t groupId;
};

struct BinaryInfo {
    std::optional<std::string> programName;
    std::optional<std::string> programVersion;
    std::optional<std::string> buildDate;
    std::optional<std::string> programUrl;
    std::optional<std::string> programDescription;
    std::optional<std::string> picoBoard;
    std::optional<std::string> sdkVersion;
    std::optional<std::string> boot2Name;
    std::optional<uint32_t> binaryEnd;
    std::vector<std::string> features;
    std::vector<std::string> buildAttributes;
    std::vector<BlockDeviceInfo> blockDevices;
    std::map<uint32_t, PinInfo> pins;  // by GPIO number
    std::vector<NamedGroupInfo> namedGroups;
};

class BinaryInfoReader
{
    struct Mapping {
        uint32_t source;
        uint32_t dest;
        uint32_t destEnd;
    };

    const FlashView& flash;
    std::vector<Mapping> mappings;

public:
    explicit BinaryInfoReader(const FlashView& flash) : flash(flash) {}

    // nullopt when the image carries no readable binary info. Entries that
    // cannot be read are skipped.
    std::optional<BinaryInfo> read();

private:
    std::optional<uint32_t> findHeader() const;
    void loadMappings(uint32_t tableAddress);

    // Resolve an address that may point into RAM back to its flash copy.
    std::optional<uint32_t> translate(uint32_t address, size_t length) const;
    std::optional<uint32_t> readWord(uint32_t address) const;
    std::optional<std::string> readString(uint32_t address) const;

    void parseEntry(uint32_t entryAddress, BinaryInfo& info) const;
    void applyString(uint32_t id, std::string value, BinaryInfo& info) const;
};

std::optional<BinaryInfo> readBinaryInfo(const std::vector<Section>& sections);

// Layout problems worth refusing to flash: block devices or the filesystem
// starting before the end of the firmware binary.
std::vector<std::string> verifyLayout(const BinaryInfo& info, std::optional<uint32_t> fsStart);
