#include "hgl/gl/OsMesaBuffer.hpp"

namespace hgl {

OsMesaBuffer::OsMesaBuffer(PhysicalSize size)
  : width_(size.width),
    height_(size.height),
    byteLength_(static_cast<std::size_t>(size.width) * size.height * 4),
    // new[] without () leaves the bytes uninitialised.
    storage_(new std::uint8_t[byteLength_]) {}

} // namespace hgl
