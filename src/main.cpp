#include "binary_info.hpp"
#include "build_config.hpp"
#include "container_file.hpp"
#include "errors.hpp"
#include "info_json.hpp"
#include "region_composer.hpp"
#include "section_scanner.hpp"
#include "section_writer.hpp"
#include "uf2.hpp"
#include <argparse/argparse.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

uint32_t family_from_name(const std::string& name) {
    if (name == "rp2040") return static_cast<uint32_t>(uf2::FamilyID::RP2040);
    if (name == "rp2350" || name == "rp2350-arm-s") return static_cast<uint32_t>(uf2::FamilyID::RP2350_ARM_S);
    throw std::runtime_error("Unknown family: " + name + " (expected rp2040 or rp2350)");
}

void print_sections(const std::vector<Section>& sections) {
    size_t index = 0;
    for (const auto& section : sections) {
        const auto ranges = section.ranges();
        if (ranges.empty()) continue;
        const AddressRange* last = ranges.back();
        std::cout << "Section " << index++
                  << ": family " << uf2::family_name(section.family_id) << " (" << toHex(section.family_id) << ")"
                  << ", flags " << toHex(section.flags)
                  << ", " << toHex(section.baseAddress())
                  << " - " << toHex(last->address + static_cast<uint32_t>(last->data.size()))
                  << ", " << section.totalLength() << " bytes in " << ranges.size() << " range(s)\n";
    }
}

void print_binary_info(const BinaryInfo& info) {
    auto field = [](const char* name, const std::optional<std::string>& value) {
        if (value) std::cout << "  " << name << ": " << *value << "\n";
    };

    std::cout << "Binary info:\n";
    field("Program Name", info.programName);
    field("Program Version", info.programVersion);
    field("Build Date", info.buildDate);
    field("Program URL", info.programUrl);
    field("Program Description", info.programDescription);
    field("Pico Board", info.picoBoard);
    field("SDK Version", info.sdkVersion);
    field("Boot Stage 2 Name", info.boot2Name);
    if (info.binaryEnd) {
        std::cout << "  Binary End Address: " << toHex(*info.binaryEnd) << "\n";
    }
    for (const auto& feature : info.features) {
        std::cout << "  Program Feature: " << feature << "\n";
    }
    for (const auto& attribute : info.buildAttributes) {
        std::cout << "  Program Build Attribute: " << attribute << "\n";
    }
    for (const auto& device : info.blockDevices) {
        std::cout << "  Block Device: " << device.name << " " << toHex(device.address)
                  << " " << (device.size / 1024) << "k\n";
    }
    for (const auto& [pin, detail] : info.pins) {
        std::cout << "  Pin " << pin << ":";
        if (detail.function) std::cout << " " << *detail.function;
        if (detail.name) std::cout << " " << *detail.name;
        std::cout << "\n";
    }
    for (const auto& group : info.namedGroups) {
        std::cout << "  Named Group: " << group.label << " (id " << toHex(group.groupId)
                  << ", parent " << toHex(group.parentId) << ")\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("uf2pack", "0.1.0", argparse::default_arguments::all);

    program.add_argument("fs_image")
        .help("Raw filesystem image to place into the container")
        .required();

    program.add_argument("-o", "--output")
        .help("The output filename (default: filesystem image with .uf2 extension)")
        .default_value(std::string(""));

    program.add_argument("-a", "--append-to")
        .help("Existing UF2 firmware to append the filesystem to")
        .default_value(std::string(""));

    program.add_argument("--fs-start")
        .help("Filesystem start address (default: firmware block device, else 0x1012c000)")
        .action([](const std::string& value) { return parseNumber(value); });

    program.add_argument("--fs-size")
        .help("Filesystem size in bytes; the image is padded with 0xFF up to it")
        .action([](const std::string& value) { return parseNumber(value); });

    program.add_argument("--block-size")
        .help("Filesystem block size the image size must be a multiple of")
        .default_value(uf2::FLASH_ERASE_BLOCK_SIZE)
        .action([](const std::string& value) { return parseNumber(value); });

    program.add_argument("--family")
        .help("Family of a standalone filesystem image: rp2040 or rp2350")
        .default_value(std::string("rp2040"));

    program.add_argument("--sparse")
        .help("Align firmware end and filesystem start to 4k instead of padding the gap")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--overwrite")
        .help("Replace a filesystem already present in the firmware")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--lenient")
        .help("Accept blocks with bad magics, like older tools did")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--verify")
        .help("Refuse to build when the filesystem overlaps the firmware binary")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--info")
        .help("Print the sections and binary info of the firmware, then exit")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--to-json")
        .help("With --info, print the binary info as JSON")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-v", "--verbose")
        .help("Print every section written")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    try {
        const std::string fsImagePath = program.get<std::string>("fs_image");
        const std::string appendTo = program.get<std::string>("--append-to");
        const MagicCheck magicCheck = program.get<bool>("--lenient") ? MagicCheck::Lenient : MagicCheck::Strict;

        if (program.get<bool>("--info")) {
            if (appendTo.empty()) {
                throw std::runtime_error("--info needs a firmware given with --append-to");
            }
            auto sections = loadFirmwareSections(appendTo, magicCheck);
            auto info = readBinaryInfo(sections);
            if (program.get<bool>("--to-json")) {
                std::cout << binaryInfoToJson(info.value_or(BinaryInfo{})) << "\n";
                return 0;
            }
            print_sections(sections);
            if (info) print_binary_info(*info);
            else std::cout << "No binary info found\n";
            return 0;
        }

        // 1. Read the firmware, if any
        std::vector<uint8_t> firmware;
        std::optional<BinaryInfo> binaryInfo;
        if (!appendTo.empty()) {
            firmware = loadContainer(appendTo);
            binaryInfo = readBinaryInfo(readSections(firmware, magicCheck));
        }

        // 2. Settle the configuration
        BuildConfig config;
        config.blockSize = program.get<uint32_t>("--block-size");
        config.familyId = family_from_name(program.get<std::string>("--family"));
        config.sparse = program.get<bool>("--sparse");
        config.overwrite = program.get<bool>("--overwrite");
        config.magicCheck = magicCheck;
        config.verbose = program.get<bool>("--verbose");

        config.fsSize = program.present<uint32_t>("--fs-size");
        if (auto fsStart = program.present<uint32_t>("--fs-start")) {
            config.fsStart = *fsStart;
        } else if (binaryInfo && !binaryInfo->blockDevices.empty()) {
            config.fsStart = binaryInfo->blockDevices.front().address;
            std::cout << "Using block device \"" << binaryInfo->blockDevices.front().name
                      << "\" at " << toHex(config.fsStart) << "\n";
        }

        // 3. Read and size the filesystem image
        const std::vector<uint8_t> fsData = prepareFilesystem(readFileBytes(fsImagePath), config);

        if (binaryInfo) {
            auto problems = verifyLayout(*binaryInfo, config.fsStart);
            for (const auto& problem : problems) {
                std::cerr << (program.get<bool>("--verify") ? "Error: " : "Warning: ") << problem << "\n";
            }
            if (!problems.empty() && program.get<bool>("--verify")) {
                return 1;
            }
        }

        // 4. Compose
        std::cout << "Placing " << fsData.size() << " byte filesystem at " << toHex(config.fsStart)
                  << (config.sparse ? " (sparse)" : "") << "...\n";
        RegionComposer composer(config);
        auto sections = appendTo.empty()
            ? composer.standalone(fsData)
            : composer.append(firmware, fsData);

        // 5. Output container
        SectionWriter writer;
        for (const auto& section : sections) {
            writer.writeSection(section);
            if (config.verbose) {
                std::cout << "  " << uf2::family_name(section.family_id)
                          << " section at " << toHex(section.baseAddress())
                          << ": " << section.totalLength() << " bytes in "
                          << section.ranges().size() << " range(s), "
                          << SectionWriter::declaredBlockCount(section) << " blocks\n";
            }
        }

        auto outFilename = program.get<std::string>("--output");
        if (outFilename.empty()) {
            outFilename = std::filesystem::path(fsImagePath).replace_extension(".uf2").string();
        }
        writeContainerFile(outFilename, writer.bytes());
        std::cout << "Wrote " << writer.blockCount() << " blocks to " << outFilename << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
