#pragma once

#include "section.hpp"
#include <cstdint>
#include <vector>

class SectionWriter
{
private:
    std::vector<uint8_t> output;
    size_t blocksWritten = 0;

    void emit(const std::vector<uint8_t>& block);

public:
    // Number of blocks written into the section's num_blocks field.
    // Placeholder-family sections declare one block more than they carry;
    // some bootloaders refuse them otherwise.
    static uint32_t declaredBlockCount(const Section& section);

    // Append every block of one section. Ranges are emitted in order and
    // share a single block numbering.
    void writeSection(const Section& section);

    void writeSections(const std::vector<Section>& sections);

    size_t blockCount() const { return blocksWritten; }
    const std::vector<uint8_t>& bytes() const { return output; }

    // Hand the finished stream to the caller and start over.
    std::vector<uint8_t> finish();
};

// Convenience: serialize a whole section list.
std::vector<uint8_t> writeContainer(const std::vector<Section>& sections);
