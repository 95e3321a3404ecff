// Headless probe
// Creates an OSMesa context from an optional JSON config, clears the buffer
// to a known colour and optionally writes it out as PPM.
//
// Usage: headless_probe [config.json] [out.ppm]

#include "hgl/config/ContextConfig.hpp"
#include "hgl/export/Snapshot.hpp"
#include "hgl/gl/GlLoader.hpp"
#include "hgl/gl/OsMesaBuffer.hpp"
#include "hgl/gl/OsMesaContext.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

static const char* glString(GLenum name) {
  const GLubyte* s = glGetString(name);
  return s ? reinterpret_cast<const char*>(s) : "(unavailable)";
}

int main(int argc, char** argv) {
  hgl::ContextConfig cfg;
  if (argc > 1 && !hgl::loadContextConfigFile(argv[1], cfg)) {
    return 1;
  }
  std::string outPath = argc > 2 ? argv[2] : "";

  std::printf("Config: %s\n", hgl::serializeContextConfig(cfg).c_str());

  hgl::OsMesaBuffer buffer(cfg.size);

  hgl::ContextResult cr = hgl::OsMesaContext::create(cfg.attribs(), cfg.version);
  if (!cr.ok) {
    std::fprintf(stderr, "FAIL [create]: %s\n", cr.err.toString().c_str());
    return 1;
  }
  hgl::OsMesaContext& ctx = *cr.context;

  ctx.makeCurrent(buffer);

  if (!hgl::loadGlFunctions(ctx)) {
    hgl::releaseCurrent(ctx);  // exiting with 1 either way; a refusal is logged
    return 1;
  }

  std::printf("GL_VERSION:  %s\n", glString(GL_VERSION));
  std::printf("GL_RENDERER: %s\n", glString(GL_RENDERER));

  glViewport(0, 0, static_cast<GLsizei>(buffer.width()), static_cast<GLsizei>(buffer.height()));
  glClearColor(0.2f, 0.4f, 0.8f, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);
  glFinish();

  const std::uint8_t* px = buffer.data();
  std::printf("Pixel (0,0): R=%u G=%u B=%u A=%u\n", px[0], px[1], px[2], px[3]);

  int rc = 0;
  if (!outPath.empty()) {
    if (hgl::writePPMFlipped(outPath, buffer)) {
      std::printf("Wrote %s (%ux%u)\n", outPath.c_str(), buffer.width(), buffer.height());
    } else {
      rc = 1;
    }
  }

  if (!hgl::releaseCurrent(ctx)) rc = 1;

  return rc;
}
