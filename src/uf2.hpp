/**
 * @file uf2.hpp
 * @brief Wire-level constants and structures of the UF2 block container
 *
 * UF2 is a flashing format made of fixed 512-byte, self-describing blocks.
 * Each block carries its own target address, so a bootloader can program
 * blocks in any order and ignore the ones it does not understand.
 *
 * This header only describes the format. Encoding and decoding live in
 * block_codec.hpp, segmentation into sections in section_scanner.hpp.
 */

#ifndef UF2_FORMAT_HPP
#define UF2_FORMAT_HPP

#include <cstdint>
#include <cstddef>

// =============================================================================
// BYTE ORDERING
// =============================================================================

/**
 * @brief ALL MULTI-BYTE FIELDS ARE LITTLE-ENDIAN
 *
 * Example: target address 0x10000100 is stored as [0x00, 0x01, 0x00, 0x10]
 *
 * Blocks are always serialized field by field. Never memcpy a header struct
 * to or from the wire.
 */

namespace uf2 {

// =============================================================================
// MAGIC NUMBERS
// =============================================================================

/** @brief First start magic, "UF2\n" */
constexpr uint32_t MAGIC_START0 = 0x0A324655;

/** @brief Second start magic */
constexpr uint32_t MAGIC_START1 = 0x9E5D5157;

/** @brief End magic, last word of every block */
constexpr uint32_t MAGIC_END = 0x0AB16F30;

// =============================================================================
// BLOCK GEOMETRY
// =============================================================================

/**
 * @brief Block layout
 *
 *   offset  size  field
 *   0       4     magic_start0
 *   4       4     magic_start1
 *   8       4     flags
 *   12      4     target_addr
 *   16      4     payload_size
 *   20      4     block_no
 *   24      4     num_blocks
 *   28      4     family_id
 *   32      256   payload
 *   288     220   zero padding
 *   508     4     magic_end
 */
constexpr size_t BLOCK_SIZE = 512;
constexpr size_t HEADER_SIZE = 32;
constexpr size_t PAYLOAD_SIZE = 256;
constexpr size_t FOOTER_SIZE = 4;
constexpr size_t PADDING_SIZE = BLOCK_SIZE - HEADER_SIZE - PAYLOAD_SIZE - FOOTER_SIZE;
constexpr size_t MAGIC_END_OFFSET = BLOCK_SIZE - FOOTER_SIZE;

/** @brief Value of the payload_size field written by this tool */
constexpr uint32_t DATA_SIZE = static_cast<uint32_t>(PAYLOAD_SIZE);

// =============================================================================
// FLASH GEOMETRY
// =============================================================================

/** @brief XIP flash base on RP2040 and RP2350 */
constexpr uint32_t FLASH_START_ADDR = 0x10000000;

/**
 * @brief Flash erase-block (sector) size
 *
 * Sparse filesystem placement aligns both the end of firmware and the start
 * of the filesystem to this size. Unaligned sparse ranges mis-flash on RP2350.
 */
constexpr uint32_t FLASH_ERASE_BLOCK_SIZE = 4096;

/** @brief Default filesystem offset (Pico W MicroPython littlefs v2) */
constexpr uint32_t DEFAULT_FS_START = 0x1012c000;

/** @brief Value of erased flash, used for all fill bytes */
constexpr uint8_t ERASED_BYTE = 0xFF;

// =============================================================================
// FLAGS
// =============================================================================

/**
 * @brief Block flag bits
 *
 * Only FAMILY_ID_PRESENT is set by this tool. All bits are carried through
 * unchanged when an existing section is rewritten.
 */
enum class BlockFlag : uint32_t {
    NOT_MAIN_FLASH    = 0x00000001,  ///< Block must not be written to main flash
    FILE_CONTAINER    = 0x00001000,  ///< Block belongs to a file container
    FAMILY_ID_PRESENT = 0x00002000,  ///< family_id field is valid
    MD5_PRESENT       = 0x00004000,  ///< Payload tail carries an MD5 checksum
    EXTENSION_TAGS    = 0x00008000   ///< Extension tags follow the payload
};

constexpr inline bool has_flag(uint32_t flags, BlockFlag flag) noexcept {
    return (flags & static_cast<uint32_t>(flag)) != 0;
}

constexpr inline uint32_t make_flags(BlockFlag flag) noexcept {
    return static_cast<uint32_t>(flag);
}

// =============================================================================
// FAMILY IDS
// =============================================================================

/**
 * @brief Known device family identifiers
 *
 * RP2040 and RP2350_ARM_S are flashable firmware regions and may receive a
 * filesystem. ABSOLUTE is the placeholder family picotool uses for the
 * informational block at the very top of an RP2350 image. It never receives
 * a filesystem and its sections are written with one extra declared block.
 */
enum class FamilyID : uint32_t {
    RP2040        = 0xe48bff56,
    ABSOLUTE      = 0xe48bff57,  ///< Placeholder / non-firmware
    DATA          = 0xe48bff58,
    RP2350_ARM_S  = 0xe48bff59,
    RP2350_RISCV  = 0xe48bff5a
};

constexpr uint32_t PLACEHOLDER_FAMILY_ID = static_cast<uint32_t>(FamilyID::ABSOLUTE);

/**
 * @brief Families eligible for filesystem placement
 */
constexpr uint32_t FLASHABLE_FAMILY_IDS[] = {
    static_cast<uint32_t>(FamilyID::RP2040),
    static_cast<uint32_t>(FamilyID::RP2350_ARM_S)
};

constexpr inline bool is_flashable_family(uint32_t family_id) noexcept {
    for (uint32_t id : FLASHABLE_FAMILY_IDS) {
        if (id == family_id) return true;
    }
    return false;
}

constexpr inline bool is_placeholder_family(uint32_t family_id) noexcept {
    return family_id == PLACEHOLDER_FAMILY_ID;
}

/**
 * @brief Human readable family name, "unknown" for anything else
 */
constexpr inline const char* family_name(uint32_t family_id) noexcept {
    switch (static_cast<FamilyID>(family_id)) {
        case FamilyID::RP2040:       return "rp2040";
        case FamilyID::ABSOLUTE:     return "absolute";
        case FamilyID::DATA:         return "data";
        case FamilyID::RP2350_ARM_S: return "rp2350-arm-s";
        case FamilyID::RP2350_RISCV: return "rp2350-riscv";
    }
    return "unknown";
}

// =============================================================================
// BLOCK HEADER
// =============================================================================

/**
 * @brief Decoded 32-byte block header (LOGICAL STRUCTURE)
 *
 * Field order matches the wire layout. The codec still fills it field by
 * field and never reinterprets raw bytes as this struct.
 */
struct UF2_Block_Header {
    uint32_t magic_start0;
    uint32_t magic_start1;
    uint32_t flags;
    uint32_t target_addr;
    uint32_t payload_size;
    uint32_t block_no;
    uint32_t num_blocks;
    uint32_t family_id;

    /**
     * @brief Check both start magics
     */
    bool has_valid_magic() const noexcept {
        return magic_start0 == MAGIC_START0 && magic_start1 == MAGIC_START1;
    }

    bool has_family_id() const noexcept {
        return has_flag(flags, BlockFlag::FAMILY_ID_PRESENT);
    }

    /**
     * @brief True for the first block of a section
     */
    bool is_section_start() const noexcept {
        return block_no == 0;
    }
};

} // namespace uf2

// =============================================================================
// STATIC ASSERTIONS
// =============================================================================

static_assert(sizeof(uf2::UF2_Block_Header) == uf2::HEADER_SIZE,
    "UF2_Block_Header must be exactly 32 bytes");

static_assert(uf2::PADDING_SIZE == 220,
    "header + payload + padding + end magic must fill 512 bytes");

#endif // UF2_FORMAT_HPP
