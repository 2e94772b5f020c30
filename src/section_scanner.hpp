#pragma once

#include "block_codec.hpp"
#include "section.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

enum class ScanState {
    AtBoundary,       // next block opens a section
    ScanningSection,  // inside a section, handing out its blocks
    Exhausted         // no input left
};

struct ScannedSection {
    size_t index;
    uint32_t base_address;
    uint32_t family_id;
    uint32_t flags;
    uint32_t num_blocks;  // as declared by the first block, not trusted
};

struct BlockData {
    uint32_t address;
    Payload payload;
};

// Splits a buffered block stream into sections.
//
// A section starts at every block with block_no == 0 and runs until the next
// one. The boundary is positional: num_blocks of the opening block is reported
// but never used to decide where the section ends.
//
//   SectionScanner scanner(image);
//   while (auto section = scanner.nextSection()) {
//       while (auto block = scanner.nextBlock()) { ... }
//   }
class SectionScanner
{
    std::span<const uint8_t> image;
    MagicCheck check;
    size_t cursor = 0;         // byte offset of the next undecoded block
    size_t sectionStart = 0;   // byte offset of the current section's first block
    size_t sectionCount = 0;
    ScanState state = ScanState::AtBoundary;

public:
    // Throws ContainerError(MalformedBlock) if the image is not a whole
    // number of blocks.
    explicit SectionScanner(std::span<const uint8_t> image, MagicCheck check = MagicCheck::Strict);

    // Advance to the next section, skipping whatever is left of the current one.
    std::optional<ScannedSection> nextSection();

    // Next block of the current section, or nullopt at the section boundary.
    std::optional<BlockData> nextBlock();

    // Rewind to the first block.
    void reset();

    ScanState currentState() const { return state; }
    size_t blockCount() const { return image.size() / uf2::BLOCK_SIZE; }

private:
    constexpr bool is_eof() const { return cursor >= image.size(); }
    DecodedBlock peek() const;
    constexpr void advance() { cursor += uf2::BLOCK_SIZE; }
};

// Eagerly scan a whole image. Each section becomes a SingleRange at its base
// address holding the concatenated payloads.
std::vector<Section> readSections(std::span<const uint8_t> image, MagicCheck check = MagicCheck::Strict);
