#pragma once

#include "uf2.hpp"
#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

// A run of bytes destined for one absolute address.
struct AddressRange {
    uint32_t address;
    std::vector<uint8_t> data;

    // Blocks needed to carry this range; the last one may be short.
    uint32_t blockCount() const {
        return static_cast<uint32_t>((data.size() + uf2::PAYLOAD_SIZE - 1) / uf2::PAYLOAD_SIZE);
    }
};

// Section data held as one contiguous range.
struct SingleRange {
    AddressRange range;

    uint32_t baseAddress() const { return range.address; }
    size_t totalLength() const { return range.data.size(); }
    uint32_t blockCount() const { return range.blockCount(); }
    std::vector<const AddressRange*> ranges() const { return {&range}; }
};

// Section data held as ordered, disjoint ranges that share one block numbering.
struct MultiRange {
    std::vector<AddressRange> parts;

    uint32_t baseAddress() const { return parts.empty() ? 0 : parts.front().address; }

    size_t totalLength() const {
        size_t total = 0;
        for (const auto& part : parts) total += part.data.size();
        return total;
    }

    // Each part starts on a fresh block, so counts are summed per part.
    uint32_t blockCount() const {
        uint32_t total = 0;
        for (const auto& part : parts) total += part.blockCount();
        return total;
    }

    std::vector<const AddressRange*> ranges() const {
        std::vector<const AddressRange*> result;
        result.reserve(parts.size());
        for (const auto& part : parts) result.push_back(&part);
        return result;
    }
};

using SectionLayout = std::variant<SingleRange, MultiRange>;

// A logical region of a container: a maximal run of blocks sharing base
// address, family and flags.
struct Section {
    SectionLayout layout;
    uint32_t family_id = 0;
    uint32_t flags = 0;

    uint32_t baseAddress() const {
        return std::visit([](const auto& l) { return l.baseAddress(); }, layout);
    }

    size_t totalLength() const {
        return std::visit([](const auto& l) { return l.totalLength(); }, layout);
    }

    uint32_t blockCount() const {
        return std::visit([](const auto& l) { return l.blockCount(); }, layout);
    }

    std::vector<const AddressRange*> ranges() const {
        return std::visit([](const auto& l) { return l.ranges(); }, layout);
    }

    bool isMultiRange() const { return std::holds_alternative<MultiRange>(layout); }
};

inline Section makeSection(uint32_t address, std::vector<uint8_t> data, uint32_t familyId, uint32_t flags) {
    return Section{SingleRange{AddressRange{address, std::move(data)}}, familyId, flags};
}

inline Section makeSection(std::vector<AddressRange> parts, uint32_t familyId, uint32_t flags) {
    return Section{MultiRange{std::move(parts)}, familyId, flags};
}
