#include "hgl/gl/GlLoader.hpp"
#include "hgl/gl/OsMesaContext.hpp"

#include <cstdio>

namespace hgl {

static GLADapiproc resolveThroughContext(void* userptr, const char* name) {
  const auto* ctx = static_cast<const OsMesaContext*>(userptr);
  ProcResult r = ctx->getProcAddress(name);
  if (!r.ok) return nullptr;
  return reinterpret_cast<GLADapiproc>(r.address);
}

int loadGlFunctions(const OsMesaContext& ctx) {
  if (!ctx.isCurrent()) {
    std::fprintf(stderr, "GlLoader: context is not current\n");
    return 0;
  }

  int version = gladLoadGLUserPtr(resolveThroughContext,
                                  const_cast<OsMesaContext*>(&ctx));
  if (!version) {
    std::fprintf(stderr, "GlLoader: gladLoadGL failed\n");
  }
  return version;
}

bool releaseCurrent(const OsMesaContext& ctx) {
  try {
    ctx.makeNotCurrent();
  } catch (const UnsupportedOperation& e) {
    std::fprintf(stderr, "GlLoader: release failed: %s\n", e.what());
    return false;
  }
  return true;
}

} // namespace hgl
