#include "container_file.hpp"
#include "errors.hpp"
#include "section_scanner.hpp"
#include "uf2.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace {

bool is_raw_image(const std::string& path) {
    std::string extension = std::filesystem::path(path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".bin";
}

} // namespace

std::vector<uint8_t> readFileBytes(const std::string& path)
{
    if (!std::filesystem::exists(path)) {
        throw ContainerError(ErrorKind::MissingInputFile, "file not found: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }

    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::vector<uint8_t> loadContainer(const std::string& path)
{
    if (!std::filesystem::exists(path)) {
        throw ContainerError(ErrorKind::MissingInputFile, "append target not found: " + path);
    }
    return readFileBytes(path);
}

std::vector<Section> loadFirmwareSections(const std::string& path, MagicCheck check)
{
    std::vector<uint8_t> bytes = readFileBytes(path);

    if (is_raw_image(path)) {
        std::vector<Section> sections;
        sections.push_back(makeSection(uf2::FLASH_START_ADDR, std::move(bytes), 0, 0));
        return sections;
    }

    return readSections(bytes, check);
}

void writeContainerFile(const std::string& path, const std::vector<uint8_t>& bytes)
{
    const std::string temporary = path + ".tmp";
    {
        std::ofstream outfile(temporary, std::ios::binary | std::ios::trunc);
        if (!outfile.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + temporary);
        }
        outfile.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        outfile.close();
        if (!outfile) {
            std::filesystem::remove(temporary);
            throw std::runtime_error("Could not write file: " + temporary);
        }
    }
    std::filesystem::rename(temporary, path);
}
