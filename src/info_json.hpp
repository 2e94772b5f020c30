#pragma once

#include "binary_info.hpp"
#include <string>

// Pretty printed JSON object describing the binary info of one image.
//
//   {"ProgramName": "...", "BinaryEndAddress": 268959744,
//    "BlockDevice": [{"name": ..., "address": ..., "size": ..., "flags": ...}],
//    "Pins": {"0": {"function": "UART"}}, ...}
std::string binaryInfoToJson(const BinaryInfo& info);
