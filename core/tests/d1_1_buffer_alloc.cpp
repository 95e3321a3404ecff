// D1.1 — OsMesaBuffer allocation: dimensions and storage length

#include "hgl/gl/OsMesaBuffer.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <utility>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: 64x64 is 16384 bytes ----
  {
    hgl::OsMesaBuffer buf(hgl::PhysicalSize{64, 64});
    requireTrue(buf.width() == 64, "width 64");
    requireTrue(buf.height() == 64, "height 64");
    requireTrue(buf.byteLength() == 16384, "byteLength 64*64*4");
    requireTrue(buf.data() != nullptr, "storage allocated");
    std::printf("  Test 1 (64x64): PASS\n");
  }

  // ---- Test 2: storage length is width*height*4 for assorted sizes ----
  {
    const hgl::PhysicalSize sizes[] = {
      {1, 1}, {3, 7}, {640, 480}, {1, 1024}, {1023, 1}, {257, 129}
    };
    for (const auto& s : sizes) {
      hgl::OsMesaBuffer buf(s);
      std::size_t expected = static_cast<std::size_t>(s.width) * s.height * 4;
      requireTrue(buf.byteLength() == expected, "byteLength == w*h*4");
      requireTrue(buf.width() == s.width && buf.height() == s.height, "dims kept");
    }
    std::printf("  Test 2 (assorted sizes): PASS\n");
  }

  // ---- Test 3: whole range is writable ----
  {
    hgl::OsMesaBuffer buf(hgl::PhysicalSize{17, 9});
    std::memset(buf.data(), 0xAB, buf.byteLength());
    const hgl::OsMesaBuffer& cbuf = buf;
    requireTrue(cbuf.data()[0] == 0xAB, "first byte written");
    requireTrue(cbuf.data()[cbuf.byteLength() - 1] == 0xAB, "last byte written");
    std::printf("  Test 3 (writable): PASS\n");
  }

  // ---- Test 4: move keeps dimensions and storage ----
  {
    hgl::OsMesaBuffer a(hgl::PhysicalSize{8, 4});
    std::uint8_t* storage = a.data();
    hgl::OsMesaBuffer b(std::move(a));
    requireTrue(b.data() == storage, "storage moved");
    requireTrue(b.width() == 8 && b.height() == 4, "dims moved");
    requireTrue(b.byteLength() == 128, "byteLength moved");
    std::printf("  Test 4 (move): PASS\n");
  }

  std::printf("\nD1.1 buffer_alloc PASS\n");
  return 0;
}
