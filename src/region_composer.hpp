#pragma once

#include "build_config.hpp"
#include "section.hpp"
#include "section_scanner.hpp"
#include <cstdint>
#include <span>
#include <vector>

// Places a filesystem image inside the firmware section of a container.
//
// The filesystem always ends up inside the address space of the firmware
// section it belongs to. Some bootloaders accept only one flashable range per
// family and drop a second, disjoint one.
class RegionComposer
{
    const BuildConfig& config;

public:
    explicit RegionComposer(const BuildConfig& config) : config(config) {}

    /**
     * Merge fsData into an existing container.
     *
     * Flashable sections keep their bytes below fsStart; anything at or above
     * it (an older filesystem) is dropped and replaced. Other sections pass
     * through untouched.
     *
     * @throws ContainerError(SizeMismatch) fsData is not a multiple of the block size
     * @throws ContainerError(FilesystemCollision) a flashable block already sits
     *         at fsStart and overwriting is not allowed, or two sections of the
     *         same family would both receive the filesystem
     * @throws ContainerError(AddressOutOfRange) fsStart lies below a flashable section
     */
    std::vector<Section> append(std::span<const uint8_t> container,
                                const std::vector<uint8_t>& fsData) const;

    /**
     * Container holding only the filesystem, at fsStart, for config.familyId.
     */
    std::vector<Section> standalone(const std::vector<uint8_t>& fsData) const;

private:
    // firmware already trimmed to at most fsStart - base bytes
    Section attachPadded(const ScannedSection& section, std::vector<uint8_t> firmware,
                         const std::vector<uint8_t>& fsData) const;
    Section attachSparse(const ScannedSection& section, std::vector<uint8_t> firmware,
                         const std::vector<uint8_t>& fsData) const;
};

constexpr uint32_t alignUp(uint32_t value, uint32_t alignment) {
    return (value + alignment - 1) / alignment * alignment;
}
