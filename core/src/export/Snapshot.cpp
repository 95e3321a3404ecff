#include "hgl/export/Snapshot.hpp"
#include "hgl/gl/OsMesaBuffer.hpp"

#include <cstdint>
#include <cstdio>
#include <vector>

namespace hgl {

static bool writeRows(const std::string& path, const OsMesaBuffer& buffer, bool flip) {
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "Snapshot: cannot open %s\n", path.c_str());
    return false;
  }

  const std::uint32_t w = buffer.width();
  const std::uint32_t h = buffer.height();
  const std::uint8_t* pixels = buffer.data();

  std::fprintf(f, "P6\n%u %u\n255\n", w, h);

  std::vector<std::uint8_t> row(static_cast<std::size_t>(w) * 3);
  bool ok = true;
  for (std::uint32_t i = 0; i < h && ok; i++) {
    std::uint32_t y = flip ? (h - 1 - i) : i;
    const std::uint8_t* src = pixels + static_cast<std::size_t>(y) * w * 4;
    for (std::uint32_t x = 0; x < w; x++) {
      row[x * 3 + 0] = src[x * 4 + 0]; // R
      row[x * 3 + 1] = src[x * 4 + 1]; // G
      row[x * 3 + 2] = src[x * 4 + 2]; // B
    }
    ok = std::fwrite(row.data(), 1, row.size(), f) == row.size();
  }

  if (std::fclose(f) != 0) ok = false;
  if (!ok) std::fprintf(stderr, "Snapshot: write failed for %s\n", path.c_str());
  return ok;
}

bool writePPM(const std::string& path, const OsMesaBuffer& buffer) {
  return writeRows(path, buffer, false);
}

bool writePPMFlipped(const std::string& path, const OsMesaBuffer& buffer) {
  return writeRows(path, buffer, true);
}

} // namespace hgl
