#pragma once
#include "hgl/gl/ContextTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace hgl {

// CPU-resident RGBA8 colour buffer an OsMesaContext renders into.
// Contents are uninitialised until the first frame is rendered.
class OsMesaBuffer {
public:
  explicit OsMesaBuffer(PhysicalSize size);

  OsMesaBuffer(const OsMesaBuffer&) = delete;
  OsMesaBuffer& operator=(const OsMesaBuffer&) = delete;
  OsMesaBuffer(OsMesaBuffer&&) = default;
  OsMesaBuffer& operator=(OsMesaBuffer&&) = default;

  std::uint32_t width() const { return width_; }
  std::uint32_t height() const { return height_; }

  // Always width * height * 4.
  std::size_t byteLength() const { return byteLength_; }

  std::uint8_t* data() { return storage_.get(); }
  const std::uint8_t* data() const { return storage_.get(); }

private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  std::size_t byteLength_{0};
  std::unique_ptr<std::uint8_t[]> storage_;
};

} // namespace hgl
