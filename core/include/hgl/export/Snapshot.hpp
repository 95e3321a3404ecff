#pragma once
#include <string>

namespace hgl {

class OsMesaBuffer;

// Write a buffer's RGBA contents to a binary PPM file (RGB, no alpha),
// rows in storage order.
bool writePPM(const std::string& path, const OsMesaBuffer& buffer);

// Same, but last storage row first. OSMesa stores the bottom row first,
// PPM expects the top row first.
bool writePPMFlipped(const std::string& path, const OsMesaBuffer& buffer);

} // namespace hgl
