#include "section_writer.hpp"
#include "block_codec.hpp"
#include <algorithm>
#include <span>
#include <utility>

void SectionWriter::emit(const std::vector<uint8_t>& block)
{
    output.insert(output.end(), block.begin(), block.end());
    ++blocksWritten;
}

uint32_t SectionWriter::declaredBlockCount(const Section& section)
{
    uint32_t count = section.blockCount();
    if (uf2::is_placeholder_family(section.family_id)) {
        count += 1;
    }
    return count;
}

void SectionWriter::writeSection(const Section& section)
{
    const uint32_t numBlocks = declaredBlockCount(section);
    uint32_t blockNo = 0;

    for (const AddressRange* range : section.ranges()) {
        std::span<const uint8_t> data(range->data);

        for (size_t offset = 0; offset < data.size(); offset += uf2::PAYLOAD_SIZE) {
            size_t chunk = std::min(uf2::PAYLOAD_SIZE, data.size() - offset);
            uint32_t address = range->address + static_cast<uint32_t>(offset);

            emit(encodeBlock(section.flags, section.family_id, address,
                             blockNo, numBlocks, data.subspan(offset, chunk)));
            ++blockNo;
        }
    }
}

void SectionWriter::writeSections(const std::vector<Section>& sections)
{
    for (const auto& section : sections) {
        writeSection(section);
    }
}

std::vector<uint8_t> SectionWriter::finish()
{
    std::vector<uint8_t> result = std::move(output);
    output.clear();
    blocksWritten = 0;
    return result;
}

std::vector<uint8_t> writeContainer(const std::vector<Section>& sections)
{
    SectionWriter writer;
    writer.writeSections(sections);
    return writer.finish();
}
