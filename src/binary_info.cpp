#include "binary_info.hpp"
#include "block_codec.hpp"
#include "errors.hpp"
#include "uf2.hpp"

using namespace uf2::binary_info;

namespace {

// A corrupt table must not send the reader round in circles.
constexpr size_t MAX_MAPPINGS = 64;
constexpr uint32_t MAX_ENTRIES = 4096;

// Index of the lowest set bit; mask must not be zero.
uint32_t lowestPin(uint32_t mask) {
    uint32_t pin = 0;
    while ((mask & 1u) == 0) {
        mask >>= 1;
        ++pin;
    }
    return pin;
}

} // namespace

FlashView FlashView::fromSections(const std::vector<Section>& sections)
{
    FlashView view;
    for (const auto& section : sections) {
        for (const AddressRange* range : section.ranges()) {
            view.map(range->address, range->data);
        }
    }
    return view;
}

void FlashView::map(uint32_t address, std::vector<uint8_t> bytes)
{
    if (bytes.empty()) return;
    regions[address] = std::move(bytes);
}

const std::vector<uint8_t>* FlashView::regionFor(uint32_t address, size_t length, uint32_t& base) const
{
    auto it = regions.upper_bound(address);
    if (it == regions.begin()) return nullptr;
    --it;

    uint64_t regionEnd = static_cast<uint64_t>(it->first) + it->second.size();
    if (static_cast<uint64_t>(address) + length > regionEnd) return nullptr;

    base = it->first;
    return &it->second;
}

bool FlashView::contains(uint32_t address, size_t length) const
{
    uint32_t base = 0;
    return regionFor(address, length, base) != nullptr;
}

std::optional<uint16_t> FlashView::read16(uint32_t address) const
{
    uint32_t base = 0;
    auto region = regionFor(address, 2, base);
    if (!region) return std::nullopt;

    size_t offset = address - base;
    return static_cast<uint16_t>((*region)[offset] | ((*region)[offset + 1] << 8));
}

std::optional<uint32_t> FlashView::read32(uint32_t address) const
{
    uint32_t base = 0;
    auto region = regionFor(address, 4, base);
    if (!region) return std::nullopt;

    return readLong(*region, address - base);
}

std::optional<BinaryInfo> BinaryInfoReader::read()
{
    auto header = findHeader();
    if (!header) return std::nullopt;

    auto entriesStart = flash.read32(*header + 4);
    auto entriesEnd = flash.read32(*header + 8);
    auto mappingTable = flash.read32(*header + 12);
    if (!entriesStart || !entriesEnd || !mappingTable || *entriesEnd < *entriesStart) {
        return std::nullopt;
    }

    const uint32_t entryCount = (*entriesEnd - *entriesStart) / 4;
    if (entryCount > MAX_ENTRIES) {
        return std::nullopt;
    }

    loadMappings(*mappingTable);

    BinaryInfo info;
    for (uint32_t i = 0; i < entryCount; ++i) {
        auto entry = readWord(*entriesStart + i * 4);
        if (!entry) continue;
        parseEntry(*entry, info);
    }

    return info;
}

std::optional<uint32_t> BinaryInfoReader::findHeader() const
{
    const auto& regions = flash.mappedRegions();
    if (regions.empty()) return std::nullopt;

    // Prefer the region holding the start of flash, otherwise the lowest one
    auto region = regions.begin();
    for (auto it = regions.begin(); it != regions.end(); ++it) {
        if (it->first <= uf2::FLASH_START_ADDR &&
            static_cast<uint64_t>(it->first) + it->second.size() > uf2::FLASH_START_ADDR) {
            region = it;
            break;
        }
    }

    const uint32_t base = region->first;
    const size_t size = region->second.size();
    for (size_t offset = 0; offset + 20 <= size; offset += 4) {
        if (readLong(region->second, offset) == BI_MAGIC &&
            readLong(region->second, offset + 16) == BI_END) {
            return base + static_cast<uint32_t>(offset);
        }
    }

    return std::nullopt;
}

void BinaryInfoReader::loadMappings(uint32_t tableAddress)
{
    mappings.clear();
    if (tableAddress == 0) return;

    for (uint32_t address = tableAddress; mappings.size() < MAX_MAPPINGS; address += 12) {
        auto source = flash.read32(address);
        if (!source || *source == 0) break;

        auto dest = flash.read32(address + 4);
        auto destEnd = flash.read32(address + 8);
        if (!dest || !destEnd) break;

        mappings.push_back(Mapping{*source, *dest, *destEnd});
    }
}

std::optional<uint32_t> BinaryInfoReader::translate(uint32_t address, size_t length) const
{
    if (flash.contains(address, length)) return address;

    for (const auto& mapping : mappings) {
        if (address >= mapping.dest &&
            static_cast<uint64_t>(address) + length <= mapping.destEnd) {
            uint32_t source = mapping.source + (address - mapping.dest);
            if (flash.contains(source, length)) return source;
        }
    }

    return std::nullopt;
}

std::optional<uint32_t> BinaryInfoReader::readWord(uint32_t address) const
{
    auto location = translate(address, 4);
    if (!location) return std::nullopt;
    return flash.read32(*location);
}

std::optional<std::string> BinaryInfoReader::readString(uint32_t address) const
{
    auto location = translate(address, 1);
    if (!location) return std::nullopt;

    uint32_t base = 0;
    const auto& regions = flash.mappedRegions();
    auto it = regions.upper_bound(*location);
    if (it == regions.begin()) return std::nullopt;
    --it;
    base = it->first;

    const auto& bytes = it->second;
    std::string result;
    for (size_t offset = *location - base; offset < bytes.size(); ++offset) {
        if (bytes[offset] == 0) return result;
        if (result.size() >= MAX_STRING_LENGTH) break;
        result.push_back(static_cast<char>(bytes[offset]));
    }

    // No terminator inside the mapped data
    return std::nullopt;
}

void BinaryInfoReader::parseEntry(uint32_t entryAddress, BinaryInfo& info) const
{
    auto location = translate(entryAddress, 4);
    if (!location) return;

    auto type = flash.read16(*location);
    auto tag = flash.read16(*location + 2);
    if (!type || !tag) return;
    if (*tag != TAG_RASPBERRY_PI && *tag != TAG_MICROPYTHON) return;

    switch (*type) {
        case TYPE_ID_AND_INT: {
            auto id = readWord(entryAddress + 4);
            auto value = readWord(entryAddress + 8);
            if (id && value && *id == ID_BINARY_END) {
                info.binaryEnd = *value;
            }
            break;
        }
        case TYPE_ID_AND_STRING: {
            auto id = readWord(entryAddress + 4);
            auto pointer = readWord(entryAddress + 8);
            if (!id || !pointer) break;
            if (auto value = readString(*pointer)) {
                applyString(*id, std::move(*value), info);
            }
            break;
        }
        case TYPE_BLOCK_DEVICE: {
            auto namePointer = readWord(entryAddress + 4);
            auto address = readWord(entryAddress + 8);
            auto size = readWord(entryAddress + 12);
            auto flagsLocation = translate(entryAddress + 20, 2);
            if (!address || !size) break;

            BlockDeviceInfo device;
            device.name = namePointer ? readString(*namePointer).value_or("") : "";
            device.address = *address;
            device.size = *size;
            device.flags = flagsLocation ? flash.read16(*flagsLocation).value_or(0) : 0;
            info.blockDevices.push_back(std::move(device));
            break;
        }
        case TYPE_PINS_WITH_FUNC: {
            auto encoding = readWord(entryAddress + 4);
            if (!encoding) break;

            const uint32_t pinType = *encoding & 0x7;
            const uint8_t function = static_cast<uint8_t>((*encoding >> 3) & 0xF);
            const uint32_t pinBits = *encoding >> 7;

            std::vector<uint32_t> pinList;
            if (pinType == PIN_ENCODING_MULTI) {
                for (uint32_t i = 0; i < 5; ++i) {
                    pinList.push_back((pinBits >> (i * 5)) & 0x1F);
                }
            } else if (pinType == PIN_ENCODING_RANGE) {
                const uint32_t low = pinBits & 0x1F;
                const uint32_t high = (pinBits >> 5) & 0x1F;
                for (uint32_t pin = low; pin <= high; ++pin) {
                    pinList.push_back(pin);
                }
            }

            for (uint32_t pin : pinList) {
                info.pins[pin].function = gpio_function_name(function);
            }
            break;
        }
        case TYPE_PINS_WITH_NAME: {
            auto mask = readWord(entryAddress + 4);
            auto namePointer = readWord(entryAddress + 8);
            if (!mask || *mask == 0 || !namePointer) break;

            if (auto name = readString(*namePointer)) {
                info.pins[lowestPin(*mask)].name = std::move(*name);
            }
            break;
        }
        case TYPE_NAMED_GROUP: {
            auto parentId = readWord(entryAddress + 4);
            auto flagsAndTag = readWord(entryAddress + 8);
            auto groupId = readWord(entryAddress + 12);
            auto labelPointer = readWord(entryAddress + 16);
            if (!parentId || !flagsAndTag || !groupId || !labelPointer) break;

            NamedGroupInfo group;
            group.label = readString(*labelPointer).value_or("");
            group.parentId = *parentId;
            group.flags = static_cast<uint16_t>(*flagsAndTag & 0xFFFF);
            group.tag = static_cast<uint16_t>(*flagsAndTag >> 16);
            group.groupId = *groupId;
            info.namedGroups.push_back(std::move(group));
            break;
        }
        default:
            // Raw, sized, list and BSON data carry nothing to show
            break;
    }
}

void BinaryInfoReader::applyString(uint32_t id, std::string value, BinaryInfo& info) const
{
    switch (id) {
        case ID_PROGRAM_NAME:              info.programName = std::move(value); break;
        case ID_PROGRAM_VERSION_STRING:    info.programVersion = std::move(value); break;
        case ID_PROGRAM_BUILD_DATE_STRING: info.buildDate = std::move(value); break;
        case ID_PROGRAM_URL:               info.programUrl = std::move(value); break;
        case ID_PROGRAM_DESCRIPTION:       info.programDescription = std::move(value); break;
        case ID_PICO_BOARD:                info.picoBoard = std::move(value); break;
        case ID_SDK_VERSION:               info.sdkVersion = std::move(value); break;
        case ID_BOOT2_NAME:                info.boot2Name = std::move(value); break;
        case ID_PROGRAM_FEATURE:           info.features.push_back(std::move(value)); break;
        case ID_PROGRAM_BUILD_ATTRIBUTE:   info.buildAttributes.push_back(std::move(value)); break;
        default: break;
    }
}

std::optional<BinaryInfo> readBinaryInfo(const std::vector<Section>& sections)
{
    FlashView flash = FlashView::fromSections(sections);
    BinaryInfoReader reader(flash);
    return reader.read();
}

std::vector<std::string> verifyLayout(const BinaryInfo& info, std::optional<uint32_t> fsStart)
{
    std::vector<std::string> problems;
    if (!info.binaryEnd) return problems;

    for (const auto& device : info.blockDevices) {
        if (device.address < *info.binaryEnd) {
            problems.push_back("block device \"" + device.name + "\" at " + toHex(device.address) +
                               " starts before the binary end " + toHex(*info.binaryEnd));
        }
    }

    if (fsStart && *fsStart < *info.binaryEnd) {
        problems.push_back("filesystem start " + toHex(*fsStart) +
                           " lies before the binary end " + toHex(*info.binaryEnd));
    }

    return problems;
}
