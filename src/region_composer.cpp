#include "region_composer.hpp"
#include "errors.hpp"
#include <set>
#include <string>
#include <utility>

namespace {

std::string describe(const ScannedSection& section) {
    return "section " + std::to_string(section.index) + " (" +
           uf2::family_name(section.family_id) + " " + toHex(section.family_id) +
           ", base " + toHex(section.base_address) + ")";
}

} // namespace

std::vector<Section> RegionComposer::append(std::span<const uint8_t> container,
                                            const std::vector<uint8_t>& fsData) const
{
    validateFilesystemSize(fsData.size(), config.blockSize);

    std::vector<Section> sections;
    std::set<uint32_t> familiesPlaced;
    SectionScanner scanner(container, config.magicCheck);

    while (auto scanned = scanner.nextSection()) {
        const bool flashable = uf2::is_flashable_family(scanned->family_id);
        std::vector<uint8_t> kept;

        while (auto block = scanner.nextBlock()) {
            // A flashable block already sitting at fsStart is an earlier filesystem
            if (flashable && block->address == config.fsStart && !config.overwrite) {
                throw ContainerError(ErrorKind::FilesystemCollision,
                    "block at " + toHex(block->address) + " in " + describe(*scanned) +
                    " is already occupied; allow overwriting to replace it");
            }

            // Flashable sections lose everything from the filesystem start on
            if (!flashable || block->address < config.fsStart) {
                kept.insert(kept.end(), block->payload.begin(), block->payload.end());
            }
        }

        if (!flashable) {
            sections.push_back(makeSection(scanned->base_address, std::move(kept),
                                           scanned->family_id, scanned->flags));
            continue;
        }

        if (config.fsStart < scanned->base_address) {
            throw ContainerError(ErrorKind::AddressOutOfRange,
                "filesystem start " + toHex(config.fsStart) + " lies below " + describe(*scanned));
        }
        // Two sections of one family would flash the filesystem twice
        if (!familiesPlaced.insert(scanned->family_id).second) {
            throw ContainerError(ErrorKind::FilesystemCollision,
                "filesystem already placed for this family, refusing to place it again in " +
                describe(*scanned));
        }

        // A block straddling fsStart must not reach into the filesystem
        const uint32_t fsOffset = config.fsStart - scanned->base_address;
        if (kept.size() > fsOffset) {
            kept.resize(fsOffset);
        }

        sections.push_back(config.sparse
            ? attachSparse(*scanned, std::move(kept), fsData)
            : attachPadded(*scanned, std::move(kept), fsData));
    }

    if (familiesPlaced.empty()) {
        throw ContainerError(ErrorKind::AddressOutOfRange,
            "container has no rp2040 or rp2350-arm-s firmware section to hold the filesystem");
    }

    return sections;
}

std::vector<Section> RegionComposer::standalone(const std::vector<uint8_t>& fsData) const
{
    validateFilesystemSize(fsData.size(), config.blockSize);

    std::vector<Section> sections;
    sections.push_back(makeSection(config.fsStart, fsData, config.familyId,
                                   uf2::make_flags(uf2::BlockFlag::FAMILY_ID_PRESENT)));
    return sections;
}

Section RegionComposer::attachPadded(const ScannedSection& section, std::vector<uint8_t> firmware,
                                     const std::vector<uint8_t>& fsData) const
{
    const uint32_t fsOffset = config.fsStart - section.base_address;

    firmware.resize(fsOffset, uf2::ERASED_BYTE);
    firmware.insert(firmware.end(), fsData.begin(), fsData.end());

    return makeSection(section.base_address, std::move(firmware), section.family_id, section.flags);
}

Section RegionComposer::attachSparse(const ScannedSection& section, std::vector<uint8_t> firmware,
                                     const std::vector<uint8_t>& fsData) const
{
    const uint32_t fsOffset = config.fsStart - section.base_address;
    const uint32_t alignedOffset = alignUp(fsOffset, uf2::FLASH_ERASE_BLOCK_SIZE);

    firmware.resize(alignUp(static_cast<uint32_t>(firmware.size()), uf2::FLASH_ERASE_BLOCK_SIZE),
                    uf2::ERASED_BYTE);

    std::vector<uint8_t> filesystem(alignedOffset - fsOffset, uf2::ERASED_BYTE);
    filesystem.insert(filesystem.end(), fsData.begin(), fsData.end());

    std::vector<AddressRange> parts;
    parts.push_back(AddressRange{section.base_address, std::move(firmware)});
    parts.push_back(AddressRange{section.base_address + alignedOffset, std::move(filesystem)});

    return makeSection(std::move(parts), section.family_id, section.flags);
}
