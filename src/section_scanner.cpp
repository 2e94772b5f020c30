#include "section_scanner.hpp"
#include "errors.hpp"

SectionScanner::SectionScanner(std::span<const uint8_t> image, MagicCheck check)
    : image(image), check(check)
{
    if (image.size() % uf2::BLOCK_SIZE != 0) {
        throw ContainerError(ErrorKind::MalformedBlock,
            "container is " + std::to_string(image.size()) + " bytes, not a multiple of " +
            std::to_string(uf2::BLOCK_SIZE));
    }
    if (is_eof()) state = ScanState::Exhausted;
}

DecodedBlock SectionScanner::peek() const
{
    return decodeBlock(image.subspan(cursor, uf2::BLOCK_SIZE), check);
}

std::optional<ScannedSection> SectionScanner::nextSection()
{
    if (state == ScanState::ScanningSection) {
        // Drain the remainder of the current section
        while (nextBlock()) {}
    }

    if (state == ScanState::Exhausted || is_eof()) {
        state = ScanState::Exhausted;
        return std::nullopt;
    }

    auto block = peek();
    if (!block.header.is_section_start()) {
        throw ContainerError(ErrorKind::MalformedBlock,
            "block " + std::to_string(cursor / uf2::BLOCK_SIZE) + " at address " +
            toHex(block.header.target_addr) + " has block number " +
            std::to_string(block.header.block_no) + " but no section was opened");
    }

    sectionStart = cursor;
    state = ScanState::ScanningSection;

    return ScannedSection{
        sectionCount++,
        block.header.target_addr,
        block.header.family_id,
        block.header.flags,
        block.header.num_blocks
    };
}

std::optional<BlockData> SectionScanner::nextBlock()
{
    if (state != ScanState::ScanningSection) {
        return std::nullopt;
    }

    if (is_eof()) {
        state = ScanState::Exhausted;
        return std::nullopt;
    }

    auto block = peek();
    if (block.header.is_section_start() && cursor != sectionStart) {
        state = ScanState::AtBoundary;
        return std::nullopt;
    }

    advance();
    return BlockData{block.header.target_addr, block.payload};
}

void SectionScanner::reset()
{
    cursor = 0;
    sectionStart = 0;
    sectionCount = 0;
    state = is_eof() ? ScanState::Exhausted : ScanState::AtBoundary;
}

std::vector<Section> readSections(std::span<const uint8_t> image, MagicCheck check)
{
    std::vector<Section> sections;
    SectionScanner scanner(image, check);

    while (auto scanned = scanner.nextSection()) {
        std::vector<uint8_t> data;
        while (auto block = scanner.nextBlock()) {
            data.insert(data.end(), block->payload.begin(), block->payload.end());
        }
        sections.push_back(makeSection(scanned->base_address, std::move(data),
                                       scanned->family_id, scanned->flags));
    }

    return sections;
}
