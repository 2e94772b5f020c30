#pragma once

#include "block_codec.hpp"
#include "section.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Whole file as bytes.
// Throws ContainerError(MissingInputFile) if the file does not exist.
std::vector<uint8_t> readFileBytes(const std::string& path);

// An existing UF2 container to append to.
// Throws ContainerError(MissingInputFile) if the file does not exist.
std::vector<uint8_t> loadContainer(const std::string& path);

// Firmware sections for inspection. A ".bin" file is a raw flash image and
// becomes one section at the start of flash; anything else is scanned as a
// UF2 container.
std::vector<Section> loadFirmwareSections(const std::string& path, MagicCheck check);

// Write bytes next to path and rename them into place. On failure the
// previous contents of path, if any, are left untouched.
void writeContainerFile(const std::string& path, const std::vector<uint8_t>& bytes);
