/**
 * @file region_composer_tests.cpp
 * @brief Filesystem placement inside firmware sections
 *
 * Covers padded and sparse placement, collision handling, pass-through of
 * non-flashable sections, and size validation.
 */

#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace {
std::vector<uint8_t> filesystem(size_t length, uint8_t fill = 0x42) {
    return std::vector<uint8_t>(length, fill);
}
} // namespace

// ============================================================================
// Size Validation
// ============================================================================

TEST_F(RegionComposerTest, Size_MultipleOfBlockSizeAccepted) {
    EXPECT_NO_THROW(validateFilesystemSize(848 * 1024, 4096));
    EXPECT_NO_THROW(validateFilesystemSize(4096, 4096));
    EXPECT_NO_THROW(validateFilesystemSize(1536, 512));
}

TEST_F(RegionComposerTest, Size_NotMultipleIsRejected) {
    expectErrorKind([] { validateFilesystemSize(1000, 4096); }, ErrorKind::SizeMismatch);
    expectErrorKind([] { validateFilesystemSize(4097, 4096); }, ErrorKind::SizeMismatch);
}

TEST_F(RegionComposerTest, Size_EmptyOrZeroBlockSizeIsRejected) {
    expectErrorKind([] { validateFilesystemSize(0, 4096); }, ErrorKind::SizeMismatch);
    expectErrorKind([] { validateFilesystemSize(4096, 0); }, ErrorKind::SizeMismatch);
}

TEST_F(RegionComposerTest, Size_DeclaredSizePadsWithErasedBytes) {
    config.fsSize = 8192;

    auto prepared = prepareFilesystem(filesystem(1000), config);

    ASSERT_EQ(prepared.size(), 8192u);
    EXPECT_TRUE(allBytesEqual(prepared, 0, 1000, 0x42));
    EXPECT_TRUE(allBytesEqual(prepared, 1000, 8192 - 1000, 0xFF));
}

TEST_F(RegionComposerTest, Size_ImageLargerThanDeclaredSizeRejected) {
    config.fsSize = 4096;

    expectErrorKind([&] { prepareFilesystem(filesystem(8192), config); }, ErrorKind::SizeMismatch);
}

TEST_F(RegionComposerTest, Size_DeclaredSizeMustBeMultipleOfBlockSize) {
    config.fsSize = 5000;

    expectErrorKind([&] { prepareFilesystem(filesystem(100), config); }, ErrorKind::SizeMismatch);
}

TEST_F(RegionComposerTest, Size_WithoutDeclaredSizeImageIsUnchanged) {
    auto prepared = prepareFilesystem(filesystem(4096, 0x13), config);

    EXPECT_EQ(prepared.size(), 4096u);
    EXPECT_TRUE(allBytesEqual(prepared, 0, 4096, 0x13));
}

TEST_F(RegionComposerTest, Size_CheckedBeforeContainerIsRead) {
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 4096);

    expectErrorKind([&] { compose(image, filesystem(1000)); }, ErrorKind::SizeMismatch);
}

// ============================================================================
// Padded Placement
// ============================================================================

TEST_F(RegionComposerTest, Padded_GapFilledWithErasedBytes) {
    config.fsStart = 0x10010000;
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 0x1000);
    auto original = patternBytes(0x1000, 1);

    auto sections = compose(image, filesystem(8192));

    ASSERT_EQ(sections.size(), 1u);
    ASSERT_FALSE(sections[0].isMultiRange());
    const auto& data = singleRangeData(sections[0]);
    ASSERT_EQ(data.size(), 0x10000u + 8192);
    expectBytes(extractBytes(data, 0, 0x1000), original, "firmware");
    EXPECT_TRUE(allBytesEqual(data, 0x1000, 0xF000, 0xFF)) << "Gap must be erased flash";
    EXPECT_TRUE(allBytesEqual(data, 0x10000, 8192, 0x42));
    EXPECT_EQ(sections[0].baseAddress(), TestConstants::FLASH_BASE);
}

TEST_F(RegionComposerTest, Padded_PreservesFamilyAndFlags) {
    config.fsStart = 0x10010000;
    auto image = makeContainer({makeSection(TestConstants::FLASH_BASE, patternBytes(512),
                                            TestConstants::RP2350_ARM_S, 0x2001)});

    auto sections = compose(image, filesystem(4096));

    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].family_id, TestConstants::RP2350_ARM_S);
    EXPECT_EQ(sections[0].flags, 0x2001u);
}

TEST_F(RegionComposerTest, Padded_FirmwareEndingAtFilesystemHasNoGap) {
    config.fsStart = 0x10002000;
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 0x2000);

    auto sections = compose(image, filesystem(4096));

    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].totalLength(), 0x3000u);
    EXPECT_TRUE(allBytesEqual(singleRangeData(sections[0]), 0x2000, 4096, 0x42));
}

// ============================================================================
// Collisions
// ============================================================================

TEST_F(RegionComposerTest, Collision_OccupiedRangeRejectedByDefault) {
    config.fsStart = 0x10010000;
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 0x20000);

    expectErrorKind([&] { compose(image, filesystem(4096)); }, ErrorKind::FilesystemCollision);
}

TEST_F(RegionComposerTest, Collision_OnlyBlockAtFilesystemStartCounts) {
    // Flashable data above fsStart but not at it is dropped, not an error
    config.fsStart = 0x10010080;
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 0x20000);

    auto sections = compose(image, filesystem(4096));

    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].totalLength(), 0x10080u + 4096);
}

TEST_F(RegionComposerTest, Collision_NonFlashableSectionNeverCollides) {
    config.fsStart = 0x10010000;
    auto image = makeContainer({
        makeFirmwareSection(TestConstants::FLASH_BASE, 0x1000),
        makeSection(0x10010000, patternBytes(256), 0xe48bff58, TestConstants::FAMILY_FLAG),
    });

    auto sections = compose(image, filesystem(8192));

    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[1].baseAddress(), 0x10010000u);
    EXPECT_EQ(sections[1].totalLength(), 256u);
}

TEST_F(RegionComposerTest, Collision_PlaceholderInsideFilesystemIsKept) {
    // 16 MB board: the filesystem runs to the end of flash, over the placeholder
    config.fsStart = 0x10fff000;
    auto image = makeRp2350Image(TestConstants::FLASH_BASE, 0x2000);

    auto sections = compose(image, filesystem(4096));

    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].family_id, TestConstants::ABSOLUTE);
    EXPECT_EQ(sections[0].baseAddress(), TestConstants::PLACEHOLDER_ADDRESS);
    EXPECT_EQ(sections[1].totalLength(), 0xfff000u + 4096);
}

TEST_F(RegionComposerTest, Collision_OverwriteReplacesOldFilesystem) {
    config.fsStart = 0x10010000;
    config.overwrite = true;
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 0x20000);
    auto original = patternBytes(0x20000, 1);

    auto sections = compose(image, filesystem(4096, 0x77));

    ASSERT_EQ(sections.size(), 1u);
    const auto& data = singleRangeData(sections[0]);
    ASSERT_EQ(data.size(), 0x10000u + 4096) << "Everything from fsStart on is dropped";
    expectBytes(extractBytes(data, 0, 0x10000), extractBytes(original, 0, 0x10000), "firmware");
    EXPECT_TRUE(allBytesEqual(data, 0x10000, 4096, 0x77));
}

TEST_F(RegionComposerTest, Collision_StraddlingBlockIsTruncated) {
    config.fsStart = 0x10000080;
    config.overwrite = true;
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 256);
    auto original = patternBytes(256, 1);

    auto sections = compose(image, filesystem(4096));

    const auto& data = singleRangeData(sections[0]);
    ASSERT_EQ(data.size(), 0x80u + 4096);
    expectBytes(extractBytes(data, 0, 0x80), extractBytes(original, 0, 0x80), "firmware head");
    EXPECT_TRUE(allBytesEqual(data, 0x80, 4096, 0x42));
}

TEST_F(RegionComposerTest, Collision_StraddlingBlockTruncatedWithoutOverwrite) {
    config.fsStart = 0x10000080;
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 256);

    auto sections = compose(image, filesystem(4096));

    const auto& data = singleRangeData(sections[0]);
    ASSERT_EQ(data.size(), 0x80u + 4096);
    EXPECT_TRUE(allBytesEqual(data, 0x80, 4096, 0x42));
}

TEST_F(RegionComposerTest, Collision_EachFamilyReceivesTheFilesystem) {
    auto image = makeContainer({
        makeFirmwareSection(TestConstants::FLASH_BASE, 0x2000, TestConstants::RP2040, 1),
        makeFirmwareSection(TestConstants::FLASH_BASE, 0x2000, TestConstants::RP2350_ARM_S, 2),
    });

    auto sections = compose(image, filesystem(4096));

    ASSERT_EQ(sections.size(), 2u);
    const size_t expected = TestConstants::FS_START - TestConstants::FLASH_BASE + 4096;
    for (const auto& section : sections) {
        const auto& data = singleRangeData(section);
        ASSERT_EQ(data.size(), expected) << uf2::family_name(section.family_id);
        EXPECT_TRUE(allBytesEqual(data, expected - 4096, 4096, 0x42));
    }
    EXPECT_EQ(sections[0].family_id, TestConstants::RP2040);
    EXPECT_EQ(sections[1].family_id, TestConstants::RP2350_ARM_S);
}

TEST_F(RegionComposerTest, Collision_SameFamilyTwiceRejected) {
    auto image = makeContainer({
        makeFirmwareSection(0x10000000, 0x1000),
        makeFirmwareSection(0x10100000, 0x1000, TestConstants::RP2040, 2),
    });

    expectErrorKind([&] { compose(image, filesystem(4096)); }, ErrorKind::FilesystemCollision);
}

// ============================================================================
// Address Range
// ============================================================================

TEST_F(RegionComposerTest, Range_FilesystemBelowSectionBaseRejected) {
    config.fsStart = 0x10000000;
    auto image = makeFirmwareImage(0x10100000, 0x1000);

    expectErrorKind([&] { compose(image, filesystem(4096)); }, ErrorKind::AddressOutOfRange);
}

TEST_F(RegionComposerTest, Range_NoFlashableSectionRejected) {
    auto image = makeContainer({makeSection(TestConstants::PLACEHOLDER_ADDRESS,
                                            std::vector<uint8_t>(256, 0xEF),
                                            TestConstants::ABSOLUTE, TestConstants::FAMILY_FLAG)});

    expectErrorKind([&] { compose(image, filesystem(4096)); }, ErrorKind::AddressOutOfRange);
}

TEST_F(RegionComposerTest, Range_EmptyContainerRejected) {
    std::vector<uint8_t> image;

    expectErrorKind([&] { compose(image, filesystem(4096)); }, ErrorKind::AddressOutOfRange);
}

// ============================================================================
// Pass-through
// ============================================================================

TEST_F(RegionComposerTest, PassThrough_PlaceholderKeptIntact) {
    auto image = makeRp2350Image(TestConstants::FLASH_BASE, 0x1000);

    auto sections = compose(image, filesystem(4096));

    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].family_id, TestConstants::ABSOLUTE);
    EXPECT_EQ(sections[0].baseAddress(), TestConstants::PLACEHOLDER_ADDRESS);
    EXPECT_EQ(sections[0].flags, TestConstants::FAMILY_FLAG);
    expectBytes(singleRangeData(sections[0]), std::vector<uint8_t>(256, 0xEF), "placeholder");

    EXPECT_EQ(sections[1].family_id, TestConstants::RP2350_ARM_S);
    EXPECT_EQ(sections[1].totalLength(), TestConstants::FS_START - TestConstants::FLASH_BASE + 4096);
}

TEST_F(RegionComposerTest, PassThrough_NonFlashableKeepsBytesAboveFilesystem) {
    // A data section past the filesystem end is not trimmed
    config.fsStart = 0x10010000;
    auto image = makeContainer({
        makeFirmwareSection(TestConstants::FLASH_BASE, 0x1000),
        makeSection(0x10020000, patternBytes(600, 3), 0xe48bff58, 0),
    });

    auto sections = compose(image, filesystem(4096));

    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[1].baseAddress(), 0x10020000u);
    EXPECT_EQ(sections[1].totalLength(), 768u);
    EXPECT_EQ(sections[1].flags, 0u);
}

// ============================================================================
// Sparse Placement
// ============================================================================

TEST_F(RegionComposerTest, Sparse_TwoRangesSharingOneSection) {
    config.fsStart = 0x10010000;
    config.sparse = true;
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 5000);

    auto sections = compose(image, filesystem(8192));

    ASSERT_EQ(sections.size(), 1u);
    ASSERT_TRUE(sections[0].isMultiRange());
    const auto& parts = multiRangeParts(sections[0]);
    ASSERT_EQ(parts.size(), 2u);

    EXPECT_EQ(parts[0].address, TestConstants::FLASH_BASE);
    ASSERT_EQ(parts[0].data.size(), 8192u) << "Firmware length rounds up to the erase block";
    EXPECT_TRUE(allBytesEqual(parts[0].data, 5120, 8192 - 5120, 0xFF));

    EXPECT_EQ(parts[1].address, 0x10010000u);
    EXPECT_EQ(parts[1].data.size(), 8192u);
    EXPECT_TRUE(allBytesEqual(parts[1].data, 0, 8192, 0x42));

    EXPECT_EQ(sections[0].blockCount(), 64u);
}

TEST_F(RegionComposerTest, Sparse_UnalignedStartRoundsUpWithLeftPadding) {
    config.fsStart = 0x10010800;
    config.sparse = true;
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 256);

    auto sections = compose(image, filesystem(4096));

    const auto& parts = multiRangeParts(sections[0]);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].data.size(), 4096u);
    EXPECT_EQ(parts[1].address, 0x10011000u);
    ASSERT_EQ(parts[1].data.size(), 0x800u + 4096);
    EXPECT_TRUE(allBytesEqual(parts[1].data, 0, 0x800, 0xFF));
    EXPECT_TRUE(allBytesEqual(parts[1].data, 0x800, 4096, 0x42));
}

TEST_F(RegionComposerTest, Sparse_WrittenBlocksSkipTheGap) {
    config.fsStart = 0x10010000;
    config.sparse = true;
    auto image = makeFirmwareImage(TestConstants::FLASH_BASE, 4096);

    auto output = makeContainer(compose(image, filesystem(4096)));

    auto all = headers(output);
    ASSERT_EQ(all.size(), 32u);
    EXPECT_EQ(all[15].target_addr, 0x10000f00u);
    EXPECT_EQ(all[16].target_addr, 0x10010000u);
    verifyBlockNumbering(output);
    EXPECT_EQ(all[31].num_blocks, 32u);
}

// ============================================================================
// Standalone
// ============================================================================

TEST_F(RegionComposerTest, Standalone_SingleSectionAtFilesystemStart) {
    config.familyId = TestConstants::RP2350_ARM_S;
    RegionComposer composer(config);

    auto sections = composer.standalone(filesystem(8192));

    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].baseAddress(), TestConstants::FS_START);
    EXPECT_EQ(sections[0].family_id, TestConstants::RP2350_ARM_S);
    EXPECT_EQ(sections[0].flags, TestConstants::FAMILY_FLAG);
    EXPECT_EQ(sections[0].blockCount(), 32u);
}

TEST_F(RegionComposerTest, Standalone_ValidatesSize) {
    RegionComposer composer(config);

    expectErrorKind([&] { composer.standalone(filesystem(100)); }, ErrorKind::SizeMismatch);
}

TEST_F(RegionComposerTest, AlignUp) {
    EXPECT_EQ(alignUp(0, 4096), 0u);
    EXPECT_EQ(alignUp(1, 4096), 4096u);
    EXPECT_EQ(alignUp(4096, 4096), 4096u);
    EXPECT_EQ(alignUp(5000, 4096), 8192u);
}
